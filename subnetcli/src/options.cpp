#include "options.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

#include "logger/logger.hpp"

namespace Subnetter
{
namespace Cli
{

namespace po = boost::program_options;

namespace
{
std::string mapEnvironment(const std::string &name)
{
    if (name == "SUBNETTER_NO_COLOR")
        return "no-color";

    return "";
}
} // namespace

Operation readArguments(int argc, const char *const *argv)
{
    Operation op;

    po::options_description desc("Allowed options");
    // clang-format off
    desc.add_options()
        ("help,h", "Print this message. Without --network an interactive shell is started")
        ("network,n", po::value<std::string>(), "Base network as IP/prefix, e.g. 192.168.1.0/24")
        ("hosts,H", po::value<std::vector<std::string>>()->multitoken(), "Required host counts of the subnets to allocate")
        ("no-color", po::bool_switch(), "Plain output without terminal colors");
    // clang-format on

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::store(po::parse_environment(desc, mapEnvironment), vm);
    po::notify(vm);

    op.color = !vm["no-color"].as<bool>();

    if (vm.count("help"))
    {
        std::cout << desc << "\n";
        op.type = EOperationType::Help;
        return op;
    }

    if (vm.count("network"))
    {
        op.network = vm["network"].as<std::string>();
        op.type = EOperationType::SingleNetwork;
    }

    if (vm.count("hosts"))
    {
        if (op.network.empty())
            throw std::runtime_error("--hosts requires --network");

        op.host_counts = boost::algorithm::join(vm["hosts"].as<std::vector<std::string>>(), " ");
        op.type = EOperationType::Allocate;
    }

    SUBNETTER_DBG_LOG("operation ", int(op.type), " network='", op.network, "' hosts='", op.host_counts, "'");

    return op;
}

} // namespace Cli
} // namespace Subnetter
