#include "subnetcore/summary.hpp"

#include <algorithm>

namespace Subnetter
{

namespace
{
struct Range
{
    uint64_t start;
    uint64_t end; // inclusive
};

// Splits [start, end] into CIDR blocks, each as large as its alignment allows
void appendCidrs(uint64_t start, uint64_t end, std::vector<Network> &out)
{
    while (start <= end)
    {
        uint8_t prefix = c_max_prefix;

        while (prefix > 0)
        {
            const uint64_t next_size = blockSize(prefix - 1);

            if (start % next_size != 0 || start + next_size - 1 > end)
                break;

            --prefix;
        }

        out.push_back(Network{toAddress(static_cast<uint32_t>(start)), prefix});
        start += blockSize(prefix);
    }
}
} // namespace

AllocationSummary summarize(const Network &base, const Allocations &allocations)
{
    AllocationSummary summary{};
    summary.base_size = blockSize(base.prefix);

    for (const SubnetAllocation &allocation : allocations)
    {
        summary.allocated += blockSize(allocation.prefix);
        summary.requested_hosts += allocation.requested_hosts;
        summary.usable_hosts += allocation.total_hosts;
    }

    summary.unallocated = summary.base_size - summary.allocated;
    return summary;
}

std::vector<Network> freeBlocks(const Network &base, const Allocations &allocations)
{
    const uint32_t base_mask = maskForPrefix(base.prefix);
    const uint64_t base_network = networkAddress(toInteger(base.address), base_mask);
    const uint64_t base_broadcast = broadcastAddress(static_cast<uint32_t>(base_network), base_mask);

    std::vector<Range> used;
    used.reserve(allocations.size());

    for (const SubnetAllocation &allocation : allocations)
        used.push_back(Range{toInteger(allocation.network), toInteger(allocation.broadcast)});

    std::sort(used.begin(), used.end(),
              [](const Range &lhs, const Range &rhs)
              { return lhs.start < rhs.start; });

    std::vector<Network> blocks;
    uint64_t current = base_network;

    for (const Range &range : used)
    {
        if (range.start > current)
            appendCidrs(current, range.start - 1, blocks);

        current = std::max(current, range.end + 1);
    }

    if (current <= base_broadcast)
        appendCidrs(current, base_broadcast, blocks);

    return blocks;
}

} // namespace Subnetter
