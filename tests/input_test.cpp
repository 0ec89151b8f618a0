#include <subnetcore/input.hpp>

#include <gtest/gtest.h>

using namespace Subnetter;

namespace
{
EInputError errorKind(void (*fn)())
{
    try
    {
        fn();
    }
    catch (const InputError &e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "no InputError thrown";
    return EInputError::InvalidFormat;
}
} // namespace

TEST(parse_cidr, valid)
{
    const Network n = parseCidr(" 192.168.1.10/24 ");
    EXPECT_EQ(n.address, boost::asio::ip::make_address_v4("192.168.1.10"));
    EXPECT_EQ(n.prefix, 24);

    EXPECT_EQ(parseCidr("0.0.0.0/0").prefix, 0);
    EXPECT_EQ(parseCidr("10.0.0.1/32").prefix, 32);
}

TEST(parse_cidr, missing_slash)
{
    EXPECT_EQ(errorKind([] { parseCidr("192.168.1.10"); }), EInputError::InvalidFormat);
    EXPECT_EQ(errorKind([] { parseCidr("1.2.3.4/2/3"); }), EInputError::InvalidFormat);
}

TEST(parse_cidr, bad_address)
{
    EXPECT_EQ(errorKind([] { parseCidr("256.1.1.1/24"); }), EInputError::InvalidAddress);
    EXPECT_EQ(errorKind([] { parseCidr("1.2.3/24"); }), EInputError::InvalidAddress);
    EXPECT_EQ(errorKind([] { parseCidr("a.b.c.d/24"); }), EInputError::InvalidAddress);
    EXPECT_EQ(errorKind([] { parseCidr("/24"); }), EInputError::InvalidAddress);
}

TEST(parse_cidr, bad_prefix)
{
    EXPECT_EQ(errorKind([] { parseCidr("10.0.0.0/33"); }), EInputError::InvalidPrefix);
    EXPECT_EQ(errorKind([] { parseCidr("10.0.0.0/-1"); }), EInputError::InvalidPrefix);
    EXPECT_EQ(errorKind([] { parseCidr("10.0.0.0/"); }), EInputError::InvalidPrefix);
    EXPECT_EQ(errorKind([] { parseCidr("10.0.0.0/abc"); }), EInputError::InvalidPrefix);
    EXPECT_EQ(errorKind([] { parseCidr("10.0.0.0/100"); }), EInputError::InvalidPrefix);
}

TEST(parse_host_counts, separators)
{
    const std::vector<uint64_t> expected{50, 20, 10};
    EXPECT_EQ(parseHostCounts("50 20 10"), expected);
    EXPECT_EQ(parseHostCounts("50,20,10"), expected);
    EXPECT_EQ(parseHostCounts(" 50, 20 ,  10 "), expected);
}

TEST(parse_host_counts, empty)
{
    EXPECT_TRUE(parseHostCounts("").empty());
    EXPECT_TRUE(parseHostCounts("   ").empty());
}

TEST(parse_host_counts, rejects_non_positive)
{
    EXPECT_EQ(errorKind([] { parseHostCounts("10 0"); }), EInputError::InvalidHostCount);
    EXPECT_EQ(errorKind([] { parseHostCounts("-5"); }), EInputError::InvalidHostCount);
    EXPECT_EQ(errorKind([] { parseHostCounts("ten"); }), EInputError::InvalidHostCount);
    EXPECT_EQ(errorKind([] { parseHostCounts("99999999999999999999999"); }), EInputError::InvalidHostCount);
}
