#include <subnetcore/sizing.hpp>

#include <cstdint>

#include <gtest/gtest.h>

using namespace Subnetter;

TEST(required_prefix, known_values)
{
    EXPECT_EQ(requiredPrefix(1), 30);
    EXPECT_EQ(requiredPrefix(2), 30);
    EXPECT_EQ(requiredPrefix(3), 29);
    EXPECT_EQ(requiredPrefix(10), 28);
    EXPECT_EQ(requiredPrefix(20), 27);
    EXPECT_EQ(requiredPrefix(50), 26);
    EXPECT_EQ(requiredPrefix(100), 25);
    EXPECT_EQ(requiredPrefix(254), 24);
    EXPECT_EQ(requiredPrefix(255), 23);
}

TEST(required_prefix, smallest_block_that_holds_hosts)
{
    for (uint64_t hosts : {1ull, 5ull, 6ull, 7ull, 62ull, 63ull, 1000ull, 65534ull, 65535ull, 4294967294ull})
    {
        const int p = requiredPrefix(hosts);
        ASSERT_GE(p, 0);
        ASSERT_LE(p, 30);

        EXPECT_GE((uint64_t{1} << (32 - p)) - 2, hosts) << hosts;
        EXPECT_LT((uint64_t{1} << (32 - p - 1)) - 2, hosts) << hosts;
    }
}

TEST(required_prefix, beyond_ipv4_space_is_negative)
{
    EXPECT_EQ(requiredPrefix(4294967294ull), 0);
    EXPECT_LT(requiredPrefix(4294967295ull), 0);
    EXPECT_LT(requiredPrefix(UINT64_MAX), 0);
}
