#pragma once

#include <cstdint>
#include <vector>

#include "subnetcore/allocator.hpp"
#include "subnetcore/network.hpp"

namespace Subnetter
{
struct AllocationSummary
{
    uint64_t base_size;       // addresses in the base network
    uint64_t allocated;       // addresses covered by the allocations
    uint64_t requested_hosts; // sum of the demands
    uint64_t usable_hosts;    // sum of the allocation capacities
    uint64_t unallocated;     // base_size - allocated
};

AllocationSummary summarize(const Network &base, const Allocations &allocations);

// Uncovered parts of the base network as the largest aligned CIDR blocks, ascending
std::vector<Network> freeBlocks(const Network &base, const Allocations &allocations);

} // namespace Subnetter
