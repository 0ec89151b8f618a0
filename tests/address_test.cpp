#include <subnetcore/address.hpp>

#include <gtest/gtest.h>

using namespace Subnetter;

namespace
{
Address addr(const char *text)
{
    return boost::asio::ip::make_address_v4(text);
}
} // namespace

TEST(address_conversion, most_significant_octet_first)
{
    EXPECT_EQ(toInteger(addr("192.168.1.10")), 0xC0A8010Au);
    EXPECT_EQ(toAddress(0x0A000001u), addr("10.0.0.1"));
}

TEST(address_conversion, round_trip)
{
    for (const char *text : {"0.0.0.0", "255.255.255.255", "172.16.254.3", "1.2.3.4"})
    {
        const Address a = addr(text);
        EXPECT_EQ(toAddress(toInteger(a)), a) << text;
    }
}

TEST(mask_for_prefix, boundaries)
{
    EXPECT_EQ(maskForPrefix(0), 0u);
    EXPECT_EQ(maskForPrefix(32), 0xFFFFFFFFu);
    EXPECT_EQ(maskForPrefix(1), 0x80000000u);
    EXPECT_EQ(maskForPrefix(24), 0xFFFFFF00u);
    EXPECT_EQ(maskForPrefix(31), 0xFFFFFFFEu);
}

TEST(mask_for_prefix, leading_ones_match_prefix)
{
    for (int p = 0; p <= 32; ++p)
    {
        const uint32_t mask = maskForPrefix(static_cast<uint8_t>(p));
        const uint32_t host_bits = p == 0 ? 0xFFFFFFFFu : (p == 32 ? 0u : (1u << (32 - p)) - 1);

        EXPECT_EQ(mask & host_bits, 0u) << "/" << p;
        EXPECT_EQ(mask | host_bits, 0xFFFFFFFFu) << "/" << p;
    }
}

TEST(network_broadcast, derived_from_mask)
{
    const uint32_t mask = maskForPrefix(24);
    const uint32_t network = networkAddress(toInteger(addr("192.168.1.10")), mask);

    EXPECT_EQ(toAddress(network), addr("192.168.1.0"));
    EXPECT_EQ(toAddress(broadcastAddress(network, mask)), addr("192.168.1.255"));
}

TEST(network_broadcast, broadcast_not_below_network)
{
    const uint32_t ip = toInteger(addr("203.0.113.77"));

    for (int p = 0; p <= 32; ++p)
    {
        const uint32_t mask = maskForPrefix(static_cast<uint8_t>(p));
        const uint32_t network = networkAddress(ip, mask);
        const uint32_t broadcast = broadcastAddress(network, mask);

        EXPECT_GE(broadcast, network);
        EXPECT_EQ(broadcast == network, p == 32) << "/" << p;
    }
}
