#include "shell.hpp"

#include <boost/algorithm/string.hpp>

#include "logger/logger.hpp"
#include "subnetcore/allocator.hpp"
#include "subnetcore/input.hpp"
#include "subnetcore/network.hpp"

namespace Subnetter
{
namespace Cli
{

namespace
{
bool isExitCommand(const std::string &line)
{
    return boost::algorithm::iequals(line, "exit") || boost::algorithm::iequals(line, "quit");
}

bool printPlan(std::ostream &out, const Network &base, const std::vector<uint64_t> &host_counts, const Palette &palette)
{
    AllocationResult result = vlsmAllocate(base.address, base.prefix, host_counts);

    if (const auto *error = std::get_if<AllocationError>(&result))
    {
        printError(out, describe(*error), palette);
        return false;
    }

    printAllocations(out, base, std::get<Allocations>(result), palette);
    return true;
}
} // namespace

void Shell::run()
{
    std::string cidr_line;
    std::string hosts_line;

    while (true)
    {
        m_out << m_palette.paint("Enter IP/CIDR (e.g., 192.168.1.10/24) or 'exit' to quit:", EColor::Prompt) << '\n';
        m_out.flush();

        if (!readLine(cidr_line) || isExitCommand(cidr_line))
            break;

        if (cidr_line.empty())
            continue;

        m_out << m_palette.paint("Enter required host counts (e.g., 50 20 10), or leave empty for a single network:", EColor::Prompt) << '\n';
        m_out.flush();

        if (!readLine(hosts_line))
            hosts_line.clear();

        handle(cidr_line, hosts_line);
    }

    m_out << m_palette.paint("Exiting...", EColor::Notice) << '\n';
}

bool Shell::readLine(std::string &line)
{
    if (!std::getline(m_in, line))
        return false;

    boost::algorithm::trim(line);
    return true;
}

void Shell::handle(const std::string &cidr_line, const std::string &hosts_line)
{
    try
    {
        const Network base = parseCidr(cidr_line);
        const std::vector<uint64_t> host_counts = parseHostCounts(hosts_line);

        if (host_counts.empty())
        {
            SUBNETTER_DBG_LOG("single network report for ", cidr_line);
            printNetworkReport(m_out, singleNetworkReport(base.address, base.prefix), m_palette);
        }
        else
        {
            SUBNETTER_DBG_LOG("vlsm plan for ", cidr_line, " with ", host_counts.size(), " subnets");
            printPlan(m_out, base, host_counts, m_palette);
        }
    }
    catch (const InputError &e)
    {
        printError(m_out, e.what(), m_palette);
    }
}

bool reportNetwork(std::ostream &out, const std::string &cidr, const Palette &palette)
{
    try
    {
        const Network base = parseCidr(cidr);
        printNetworkReport(out, singleNetworkReport(base.address, base.prefix), palette);
        return true;
    }
    catch (const InputError &e)
    {
        printError(out, e.what(), palette);
        return false;
    }
}

bool planNetwork(std::ostream &out, const std::string &cidr, const std::string &host_counts, const Palette &palette)
{
    try
    {
        return printPlan(out, parseCidr(cidr), parseHostCounts(host_counts), palette);
    }
    catch (const InputError &e)
    {
        printError(out, e.what(), palette);
        return false;
    }
}

} // namespace Cli
} // namespace Subnetter
