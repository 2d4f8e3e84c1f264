//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/metrics/counters.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace
{

using namespace cidrid::metrics;  // NOLINT This our main concern here in the unit tests.

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestCounters : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestCounters, ip_cache_errors)
{
    const auto counters = Counters::make();
    EXPECT_THAT(counters->ipCacheErrors(IpCacheError::TypeRecover, IpCacheError::ErrorUnexpected), 0);

    counters->incIpCacheErrors(IpCacheError::TypeRecover, IpCacheError::ErrorUnexpected);
    counters->incIpCacheErrors(IpCacheError::TypeRecover, IpCacheError::ErrorUnexpected);
    counters->incIpCacheErrors(IpCacheError::TypeRecover, "other");

    EXPECT_THAT(counters->ipCacheErrors(IpCacheError::TypeRecover, IpCacheError::ErrorUnexpected), 2);
    EXPECT_THAT(counters->ipCacheErrors(IpCacheError::TypeRecover, "other"), 1);
    EXPECT_THAT(counters->ipCacheErrors("other", IpCacheError::ErrorUnexpected), 0);
}

TEST_F(TestCounters, released_prefixes_from_many_threads)
{
    const auto counters = Counters::make();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&counters] {
            for (int i = 0; i < 100; ++i)
            {
                counters->addReleasedPrefixes("cidr-prefix-release", 2);
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_THAT(counters->releasedPrefixes("cidr-prefix-release"), 800);
    EXPECT_THAT(counters->releasedPrefixes("selector-prefix-release"), 0);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
