#include "subnetcore/sizing.hpp"

#include <limits>

#include "subnetcore/address.hpp"

namespace Subnetter
{

int requiredPrefix(uint64_t host_count)
{
    constexpr int c_max_bits = std::numeric_limits<uint64_t>::digits;

    if (host_count > std::numeric_limits<uint64_t>::max() - 2)
        return c_max_prefix - c_max_bits;

    const uint64_t needed = host_count + 2;

    int bits = 0;
    while (bits < c_max_bits - 1 && (uint64_t{1} << bits) < needed)
        ++bits;

    if ((uint64_t{1} << bits) < needed)
        bits = c_max_bits;

    return c_max_prefix - bits;
}

} // namespace Subnetter
