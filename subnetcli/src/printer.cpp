#include "printer.hpp"

#include <iomanip>
#include <sstream>

#include "subnetcore/summary.hpp"

namespace Subnetter
{
namespace Cli
{

namespace
{
constexpr std::string_view c_reset = "\033[0m";
constexpr std::string_view c_red = "\033[91m";
constexpr std::string_view c_green = "\033[92m";
constexpr std::string_view c_yellow = "\033[93m";
constexpr std::string_view c_blue = "\033[34m";
constexpr std::string_view c_cyan = "\033[96m";

std::string_view escapeFor(EColor color)
{
    switch (color)
    {
    case EColor::Label:
        return c_cyan;
    case EColor::Value:
        return c_green;
    case EColor::Prompt:
        return c_blue;
    case EColor::Notice:
        return c_yellow;
    case EColor::Error:
        return c_red;
    }

    return c_reset;
}

std::string usableRange(const std::optional<Address> &first, const std::optional<Address> &last)
{
    if (!first || !last)
        return "none";

    return first->to_string() + " - " + last->to_string();
}

void printLine(std::ostream &os, const Palette &palette, std::string_view label, const std::string &value)
{
    os << palette.paint(label, EColor::Label) << ' ' << palette.paint(value, EColor::Value) << '\n';
}
} // namespace

std::string Palette::paint(std::string_view text, EColor color) const
{
    if (!m_enabled)
        return std::string(text);

    std::string res;
    res.reserve(text.size() + 16);
    res.append(escapeFor(color)).append(text).append(c_reset);
    return res;
}

void printNetworkReport(std::ostream &os, const NetworkReport &report, const Palette &palette)
{
    os << '\n'
       << palette.paint("Results:", EColor::Label) << '\n';
    printLine(os, palette, "IP Address       :", report.ip.to_string());
    printLine(os, palette, "Subnet Mask      :", report.mask.to_string());
    printLine(os, palette, "Network Address  :", report.network.to_string());
    printLine(os, palette, "Broadcast Address:", report.broadcast.to_string());
    printLine(os, palette, "Usable Range     :", usableRange(report.first_usable, report.last_usable));
    printLine(os, palette, "Usable Hosts     :", std::to_string(report.host_count));
    os << '\n';
}

void printAllocations(std::ostream &os, const Network &base, const Allocations &allocations, const Palette &palette)
{
    os << '\n'
       << palette.paint("VLSM plan for " + toCidrString(base) + ":", EColor::Label) << '\n';

    std::stringstream header;
    header << std::left
           << std::setw(4) << "#"
           << std::setw(10) << "Hosts"
           << std::setw(20) << "Subnet"
           << std::setw(17) << "Mask"
           << std::setw(17) << "Broadcast"
           << std::setw(33) << "Usable Range"
           << "Capacity";
    os << palette.paint(header.str(), EColor::Label) << '\n';

    for (const SubnetAllocation &allocation : allocations)
    {
        std::stringstream row;
        row << std::left
            << std::setw(4) << allocation.index
            << std::setw(10) << allocation.requested_hosts
            << std::setw(20) << toCidrString(Network{allocation.network, allocation.prefix})
            << std::setw(17) << allocation.mask.to_string()
            << std::setw(17) << allocation.broadcast.to_string()
            << std::setw(33) << usableRange(allocation.first_usable, allocation.last_usable)
            << allocation.total_hosts;
        os << palette.paint(row.str(), EColor::Value) << '\n';
    }

    const AllocationSummary summary = summarize(base, allocations);

    os << '\n';
    printLine(os, palette, "Base Addresses   :", std::to_string(summary.base_size));
    printLine(os, palette, "Allocated        :", std::to_string(summary.allocated));
    printLine(os, palette, "Requested Hosts  :", std::to_string(summary.requested_hosts));
    printLine(os, palette, "Usable Hosts     :", std::to_string(summary.usable_hosts));
    printLine(os, palette, "Unallocated      :", std::to_string(summary.unallocated));

    const std::vector<Network> blocks = freeBlocks(base, allocations);

    if (blocks.empty())
    {
        printLine(os, palette, "Free Blocks      :", "none");
    }
    else
    {
        std::string joined;
        for (const Network &block : blocks)
        {
            if (!joined.empty())
                joined += ", ";
            joined += toCidrString(block);
        }
        printLine(os, palette, "Free Blocks      :", joined);
    }

    os << '\n';
}

void printError(std::ostream &os, const std::string &message, const Palette &palette)
{
    os << palette.paint("[ERROR] ", EColor::Error) << message << "\n\n";
}

} // namespace Cli
} // namespace Subnetter
