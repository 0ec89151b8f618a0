#pragma once

#include <cstdint>

namespace Subnetter
{

// Smallest prefix whose block holds host_count usable hosts plus the network
// and broadcast addresses. Negative when the block would exceed the IPv4 space.
int requiredPrefix(uint64_t host_count);

} // namespace Subnetter
