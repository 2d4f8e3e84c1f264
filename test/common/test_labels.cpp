//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/labels/labels.hpp"
#include "cidrid/net/prefix.hpp"

#include "cidrid_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace cidrid::labels;  // NOLINT This our main concern here in the unit tests.

using cidrid::net::Prefix;
using testing::Eq;
using testing::Optional;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestLabels : public testing::Test
{
protected:
    static Prefix parsePrefix(const std::string& str)
    {
        return cetl::get<Prefix::ParseResult::Success>(Prefix::parse(str));
    }
};

// MARK: - Tests:

TEST_F(TestLabels, label_parse_and_format)
{
    const auto app = Label::parse("k8s:app=web");
    EXPECT_THAT(app.source, LabelSource::K8s);
    EXPECT_THAT(app.key, "app");
    EXPECT_THAT(app.value, "web");
    EXPECT_THAT(app.toString(), "k8s:app=web");

    const auto world = Label::parse("reserved:world");
    EXPECT_THAT(world, worldLabel());
    EXPECT_THAT(world.toString(), "reserved:world");

    const auto no_source = Label::parse("tier=backend");
    EXPECT_THAT(no_source.source, LabelSource::Unspec);
    EXPECT_THAT(no_source.key, "tier");
    EXPECT_THAT(no_source.value, "backend");

    // A colon inside of the value is not a source separator.
    const auto url = Label::parse("endpoint=http://x");
    EXPECT_THAT(url.source, LabelSource::Unspec);
    EXPECT_THAT(url.key, "endpoint");
    EXPECT_THAT(url.value, "http://x");
}

TEST_F(TestLabels, labels_merge_and_has)
{
    auto label_set = Labels::fromStrings({"k8s:app=web", "k8s:tier=frontend"});
    EXPECT_THAT(label_set.size(), 2);
    EXPECT_TRUE(label_set.has(Label::parse("k8s:app=web")));
    EXPECT_FALSE(label_set.has(Label::parse("k8s:app=db")));

    label_set.merge(Labels::fromStrings({"k8s:app=db", "k8s:zone=a"}));
    EXPECT_THAT(label_set.size(), 3);
    EXPECT_TRUE(label_set.has(Label::parse("k8s:app=db")));
    EXPECT_THAT(label_set.toString(), "k8s:app=db;k8s:tier=frontend;k8s:zone=a");
}

TEST_F(TestLabels, toString_is_insertion_order_independent)
{
    const auto lhs = Labels::fromStrings({"reserved:world", "cidr:10.0.0.0/8", "k8s:app=web"});
    const auto rhs = Labels::fromStrings({"k8s:app=web", "cidr:10.0.0.0/8", "reserved:world"});
    EXPECT_THAT(lhs, rhs);
    EXPECT_THAT(lhs.toString(), rhs.toString());
}

TEST_F(TestLabels, getCidrLabels_v4)
{
    const auto label_set = getCidrLabels(parsePrefix("10.0.0.0/8"));

    // `/8` down to `/0`, plus the world label.
    EXPECT_THAT(label_set.size(), 9 + 1);
    EXPECT_TRUE(label_set.has(worldLabel()));
    EXPECT_TRUE(label_set.has(makeCidrLabel(parsePrefix("10.0.0.0/8"))));
    EXPECT_TRUE(label_set.has(makeCidrLabel(parsePrefix("8.0.0.0/5"))));
    EXPECT_TRUE(label_set.has(makeCidrLabel(parsePrefix("0.0.0.0/0"))));
    EXPECT_TRUE(label_set.has(Label::parse("cidr:10.0.0.0/8")));

    EXPECT_THAT(getCidrLabels(parsePrefix("10.1.2.3/32")).size(), 33 + 1);
}

TEST_F(TestLabels, getCidrLabels_v6)
{
    const auto prefix    = parsePrefix("fd00::/16");
    const auto label_set = getCidrLabels(prefix);

    EXPECT_THAT(label_set.size(), 17 + 1);
    EXPECT_TRUE(label_set.has(Label::parse("cidr:fd00--/16")));
    EXPECT_TRUE(label_set.has(Label::parse("cidr:--/0")));
    EXPECT_THAT(cidrPrefixOf(label_set), Optional(Eq(prefix)));
}

TEST_F(TestLabels, cidrPrefixOf)
{
    const auto prefix = parsePrefix("10.1.2.0/24");

    auto label_set = getCidrLabels(prefix);
    EXPECT_THAT(cidrPrefixOf(label_set), Optional(Eq(prefix)));

    // Additional (non-cidr) labels don't matter.
    label_set.merge(Labels::fromStrings({"k8s:app=web"}));
    EXPECT_THAT(cidrPrefixOf(label_set), Optional(Eq(prefix)));

    // No world label - not a CIDR identity.
    EXPECT_THAT(cidrPrefixOf(Labels::fromStrings({"cidr:10.1.2.0/24"})), Eq(cetl::nullopt));
    EXPECT_THAT(cidrPrefixOf(Labels::fromStrings({"k8s:app=web"})), Eq(cetl::nullopt));
    EXPECT_THAT(cidrPrefixOf(Labels{}), Eq(cetl::nullopt));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
