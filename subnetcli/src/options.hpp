#pragma once

#include <string>

namespace Subnetter
{
namespace Cli
{

enum class EOperationType
{
    Help,
    Interactive,
    SingleNetwork,
    Allocate
};

struct Operation
{
    EOperationType type = EOperationType::Interactive;
    std::string network;
    std::string host_counts; // space separated, parsed by parseHostCounts
    bool color = true;
};

// Reads the command line and the SUBNETTER_* environment. Throws on bad usage.
Operation readArguments(int argc, const char *const *argv);

} // namespace Cli
} // namespace Subnetter
