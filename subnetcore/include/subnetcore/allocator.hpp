#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "subnetcore/address.hpp"
#include "subnetcore/network.hpp"

namespace Subnetter
{
struct Demand
{
    size_t index; // 1-based position in the caller's input
    uint64_t host_count;
};

struct SubnetAllocation
{
    size_t index;
    uint64_t requested_hosts;
    uint8_t prefix;
    Address network;
    Address mask;
    Address broadcast;
    std::optional<Address> first_usable;
    std::optional<Address> last_usable;
    uint64_t total_hosts;
};

// The demand needs a bigger block than the whole base network
struct PrefixTooSmall
{
    size_t demand_index;
    int computed_prefix;
    uint8_t base_prefix;
};

// The demand ran past the base broadcast address
struct DoesNotFit
{
    size_t demand_index;
};

using AllocationError = std::variant<PrefixTooSmall, DoesNotFit>;
using Allocations = std::vector<SubnetAllocation>;
using AllocationResult = std::variant<Allocations, AllocationError>;

std::vector<Demand> makeDemands(const std::vector<uint64_t> &host_counts);

/**
 * Packs the demands into the base network largest first, each block placed
 * right after the previous one and aligned to its own mask. Returns the
 * allocations ordered by network address, or the first failure.
 */
AllocationResult allocate(const Network &base, std::vector<Demand> demands);

AllocationResult vlsmAllocate(const Address &base_ip, uint8_t base_prefix, const std::vector<uint64_t> &host_counts);

std::string describe(const AllocationError &error);

} // namespace Subnetter
