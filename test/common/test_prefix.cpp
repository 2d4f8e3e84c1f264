//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/net/prefix.hpp"

#include "cidrid_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <functional>
#include <string>

namespace
{

using namespace cidrid::net;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestPrefix : public testing::Test
{
protected:
    static Prefix parsePrefix(const std::string& str)
    {
        auto maybe_prefix = Prefix::parse(str);
        EXPECT_THAT(maybe_prefix, VariantWith<Prefix::ParseResult::Success>(_)) << str;
        return cetl::get<Prefix::ParseResult::Success>(maybe_prefix);
    }

    static IpAddress parseAddress(const std::string& str)
    {
        auto maybe_address = IpAddress::parse(str);
        EXPECT_THAT(maybe_address, VariantWith<IpAddress::ParseResult::Success>(_)) << str;
        return cetl::get<IpAddress::ParseResult::Success>(maybe_address);
    }
};

// MARK: - Tests:

TEST_F(TestPrefix, parse_address)
{
    using Result = IpAddress::ParseResult;

    const auto v4 = parseAddress("10.1.2.3");
    EXPECT_TRUE(v4.isV4());
    EXPECT_THAT(v4.bitLength(), 32);
    EXPECT_THAT(v4.toString(), "10.1.2.3");

    const auto v6 = parseAddress("FD00:0:0::1");
    EXPECT_FALSE(v6.isV4());
    EXPECT_THAT(v6.bitLength(), 128);
    EXPECT_THAT(v6.toString(), "fd00::1");

    EXPECT_THAT(IpAddress::parse(""), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(IpAddress::parse("10.0.0"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(IpAddress::parse("10.0.0.256"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(IpAddress::parse("10.0.0.0/8"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(IpAddress::parse("fd00:::1"), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestPrefix, parse_masks_host_bits)
{
    const auto prefix = parsePrefix("10.0.0.1/24");
    EXPECT_THAT(prefix.toString(), "10.0.0.0/24");
    EXPECT_THAT(prefix.length(), 24);
    EXPECT_FALSE(prefix.isHost());

    EXPECT_THAT(parsePrefix("10.255.255.255/9").toString(), "10.128.0.0/9");
    EXPECT_THAT(parsePrefix("192.168.1.1/0").toString(), "0.0.0.0/0");
    EXPECT_THAT(parsePrefix("fd00::1:2/112").toString(), "fd00::1:0/112");
    EXPECT_THAT(parsePrefix("fd00::1/128").toString(), "fd00::1/128");

    EXPECT_THAT(parsePrefix("10.0.0.1/24"), parsePrefix("10.0.0.0/24"));
}

TEST_F(TestPrefix, parse_rejects_malformed)
{
    using Result = Prefix::ParseResult;

    EXPECT_THAT(Prefix::parse("10.0.0.1"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("10.0.0.0/"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("10.0.0.0/33"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("10.0.0.0/-1"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("10.0.0.0/ 8"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("10.0.0.0/0x8"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("fd00::/129"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse("garbage/8"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(Prefix::parse(""), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestPrefix, fromAddress)
{
    const auto v4 = Prefix::fromAddress(parseAddress("10.0.0.7"));
    EXPECT_THAT(v4.toString(), "10.0.0.7/32");
    EXPECT_TRUE(v4.isHost());
    EXPECT_TRUE(v4.isV4());

    const auto v6 = Prefix::fromAddress(parseAddress("fd00::7"));
    EXPECT_THAT(v6.toString(), "fd00::7/128");
    EXPECT_TRUE(v6.isHost());
    EXPECT_FALSE(v6.isV4());
}

TEST_F(TestPrefix, withLength)
{
    const auto prefix = parsePrefix("10.1.2.0/24");
    EXPECT_THAT(prefix.withLength(16).toString(), "10.1.0.0/16");
    EXPECT_THAT(prefix.withLength(8).toString(), "10.0.0.0/8");
    EXPECT_THAT(prefix.withLength(0).toString(), "0.0.0.0/0");
    EXPECT_THAT(prefix.withLength(24), prefix);
}

TEST_F(TestPrefix, equality_ordering_and_hashing)
{
    const auto a = parsePrefix("10.0.0.0/24");
    const auto b = parsePrefix("10.0.1.0/24");
    const auto c = parsePrefix("10.0.0.0/16");

    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(c < a);
    EXPECT_FALSE(a < a);

    // Different families never compare equal, even with the same leading bytes.
    EXPECT_NE(parsePrefix("0.0.0.0/0"), parsePrefix("::/0"));

    const std::hash<Prefix> hasher;
    EXPECT_THAT(hasher(a), hasher(parsePrefix("10.0.0.255/24")));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
