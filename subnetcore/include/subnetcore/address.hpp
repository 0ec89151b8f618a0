#pragma once

#include <cstdint>

#include <boost/asio/ip/address_v4.hpp>

namespace Subnetter
{
using Address = boost::asio::ip::address_v4;

constexpr uint8_t c_max_prefix = 32;

// Most significant octet first: 192.168.1.10 -> 0xC0A8010A
inline uint32_t toInteger(const Address &address)
{
    return address.to_uint();
}

inline Address toAddress(uint32_t value)
{
    return Address(value);
}

inline uint32_t maskForPrefix(uint8_t prefix)
{
    if (prefix == 0)
        return 0;

    if (prefix >= c_max_prefix)
        return 0xFFFFFFFFu;

    return 0xFFFFFFFFu << (c_max_prefix - prefix);
}

inline uint32_t networkAddress(uint32_t address, uint32_t mask)
{
    return address & mask;
}

inline uint32_t broadcastAddress(uint32_t network, uint32_t mask)
{
    return network | ~mask;
}

} // namespace Subnetter
