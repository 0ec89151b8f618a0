#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "subnetcore/address.hpp"

namespace Subnetter
{
struct Network
{
    Address address;
    uint8_t prefix = 0;
};

struct HostRange
{
    Address first;
    Address last;
};

struct NetworkReport
{
    Address ip;
    Address mask;
    Address network;
    Address broadcast;
    std::optional<Address> first_usable;
    std::optional<Address> last_usable;
    uint64_t host_count; // number of usable hosts
};

// Number of addresses covered by a block of the given prefix (1 for /32, 2^32 for /0)
uint64_t blockSize(uint8_t prefix);

// /31 and /32 have no usable hosts
uint64_t usableHostCount(uint8_t prefix);

std::optional<HostRange> usableHosts(uint32_t network, uint32_t broadcast, uint8_t prefix);

NetworkReport singleNetworkReport(const Address &ip, uint8_t prefix);

// "a.b.c.d/p" with the network address re-derived from the mask
std::string toCidrString(const Network &network);

} // namespace Subnetter
