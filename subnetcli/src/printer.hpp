#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "subnetcore/allocator.hpp"
#include "subnetcore/network.hpp"

namespace Subnetter
{
namespace Cli
{

enum class EColor
{
    Label,
    Value,
    Prompt,
    Notice,
    Error
};

class Palette
{
  public:
    explicit Palette(bool enabled)
        : m_enabled(enabled)
    {
    }

    std::string paint(std::string_view text, EColor color) const;

  private:
    bool m_enabled;
};

void printNetworkReport(std::ostream &os, const NetworkReport &report, const Palette &palette);

void printAllocations(std::ostream &os, const Network &base, const Allocations &allocations, const Palette &palette);

void printError(std::ostream &os, const std::string &message, const Palette &palette);

} // namespace Cli
} // namespace Subnetter
