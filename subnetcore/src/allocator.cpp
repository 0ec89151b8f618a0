#include "subnetcore/allocator.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "logger/logger.hpp"
#include "subnetcore/sizing.hpp"

namespace Subnetter
{

namespace
{
template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

std::vector<Demand> makeDemands(const std::vector<uint64_t> &host_counts)
{
    std::vector<Demand> demands;
    demands.reserve(host_counts.size());

    for (size_t i = 0; i < host_counts.size(); ++i)
        demands.push_back(Demand{i + 1, host_counts[i]});

    return demands;
}

AllocationResult allocate(const Network &base, std::vector<Demand> demands)
{
    const uint32_t base_mask = maskForPrefix(base.prefix);
    const uint32_t base_network = networkAddress(toInteger(base.address), base_mask);
    const uint64_t base_broadcast = broadcastAddress(base_network, base_mask);

    std::stable_sort(demands.begin(), demands.end(),
                     [](const Demand &lhs, const Demand &rhs)
                     { return lhs.host_count > rhs.host_count; });

    Allocations allocations;
    allocations.reserve(demands.size());

    // 64 bits wide so that stepping past 255.255.255.255 is detectable
    uint64_t cursor = base_network;

    for (const Demand &demand : demands)
    {
        const int prefix = requiredPrefix(demand.host_count);

        if (prefix < base.prefix)
        {
            SUBNETTER_DBG_LOG("demand #", demand.index, " needs /", prefix, ", base is /", int(base.prefix));
            return AllocationError{PrefixTooSmall{demand.index, prefix, base.prefix}};
        }

        const uint8_t sub_prefix = static_cast<uint8_t>(prefix);
        const uint32_t mask = maskForPrefix(sub_prefix);
        const uint64_t network = cursor & (~uint64_t{0} << (c_max_prefix - sub_prefix));
        const uint64_t broadcast = network + blockSize(sub_prefix) - 1;

        if (broadcast > base_broadcast)
        {
            SUBNETTER_DBG_LOG("demand #", demand.index, " /", prefix, " at ", network, " overruns base broadcast");
            return AllocationError{DoesNotFit{demand.index}};
        }

        const uint32_t net_int = static_cast<uint32_t>(network);
        const uint32_t broadcast_int = static_cast<uint32_t>(broadcast);

        SubnetAllocation allocation;
        allocation.index = demand.index;
        allocation.requested_hosts = demand.host_count;
        allocation.prefix = sub_prefix;
        allocation.network = toAddress(net_int);
        allocation.mask = toAddress(mask);
        allocation.broadcast = toAddress(broadcast_int);
        allocation.total_hosts = usableHostCount(sub_prefix);

        if (auto hosts = usableHosts(net_int, broadcast_int, sub_prefix))
        {
            allocation.first_usable = hosts->first;
            allocation.last_usable = hosts->last;
        }

        SUBNETTER_DBG_LOG("demand #", demand.index, " (", demand.host_count, " hosts) -> ",
                          allocation.network, "/", prefix);

        allocations.push_back(std::move(allocation));
        cursor = broadcast + 1;
    }

    std::sort(allocations.begin(), allocations.end(),
              [](const SubnetAllocation &lhs, const SubnetAllocation &rhs)
              { return lhs.network < rhs.network; });

    return allocations;
}

AllocationResult vlsmAllocate(const Address &base_ip, uint8_t base_prefix, const std::vector<uint64_t> &host_counts)
{
    return allocate(Network{base_ip, base_prefix}, makeDemands(host_counts));
}

std::string describe(const AllocationError &error)
{
    std::stringstream ss;

    std::visit(Overloaded{
                   [&ss](const PrefixTooSmall &e)
                   {
                       ss << "Subnet #" << e.demand_index << " needs a /" << e.computed_prefix
                          << " block, which is larger than the base /" << int(e.base_prefix) << " network";
                   },
                   [&ss](const DoesNotFit &e)
                   {
                       ss << "Subnet #" << e.demand_index << " does not fit into the remaining address space";
                   }},
               error);

    return ss.str();
}

} // namespace Subnetter
