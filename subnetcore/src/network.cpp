#include "subnetcore/network.hpp"

namespace Subnetter
{

uint64_t blockSize(uint8_t prefix)
{
    return uint64_t{1} << (c_max_prefix - prefix);
}

uint64_t usableHostCount(uint8_t prefix)
{
    if (prefix >= c_max_prefix - 1)
        return 0;

    return blockSize(prefix) - 2;
}

std::optional<HostRange> usableHosts(uint32_t network, uint32_t broadcast, uint8_t prefix)
{
    if (prefix >= c_max_prefix - 1)
        return std::nullopt;

    return HostRange{toAddress(network + 1), toAddress(broadcast - 1)};
}

NetworkReport singleNetworkReport(const Address &ip, uint8_t prefix)
{
    const uint32_t mask_int = maskForPrefix(prefix);
    const uint32_t net_int = networkAddress(toInteger(ip), mask_int);
    const uint32_t broadcast_int = broadcastAddress(net_int, mask_int);

    NetworkReport res;
    res.ip = ip;
    res.mask = toAddress(mask_int);
    res.network = toAddress(net_int);
    res.broadcast = toAddress(broadcast_int);
    res.host_count = usableHostCount(prefix);

    if (auto hosts = usableHosts(net_int, broadcast_int, prefix))
    {
        res.first_usable = hosts->first;
        res.last_usable = hosts->last;
    }

    return res;
}

std::string toCidrString(const Network &network)
{
    const uint32_t net_int = networkAddress(toInteger(network.address), maskForPrefix(network.prefix));
    return toAddress(net_int).to_string() + "/" + std::to_string(network.prefix);
}

} // namespace Subnetter
