//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/metrics/counters.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace cidrid
{
namespace metrics
{
namespace
{

class CountersImpl final : public Counters
{
public:
    CountersImpl() = default;

    // Counters

    void incIpCacheErrors(const std::string& type, const std::string& error) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        ++ip_cache_errors_[std::make_pair(type, error)];
    }

    void addReleasedPrefixes(const std::string& reason, const std::size_t count) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        released_prefixes_[reason] += count;
    }

    std::uint64_t ipCacheErrors(const std::string& type, const std::string& error) const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        const auto it = ip_cache_errors_.find(std::make_pair(type, error));
        return (it != ip_cache_errors_.end()) ? it->second : 0;
    }

    std::uint64_t releasedPrefixes(const std::string& reason) const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        const auto it = released_prefixes_.find(reason);
        return (it != released_prefixes_.end()) ? it->second : 0;
    }

private:
    mutable std::mutex                                           mutex_;
    std::map<std::pair<std::string, std::string>, std::uint64_t> ip_cache_errors_;
    std::map<std::string, std::uint64_t>                         released_prefixes_;

};  // CountersImpl

}  // namespace

Counters::Ptr Counters::make()
{
    return std::make_shared<CountersImpl>();
}

}  // namespace metrics
}  // namespace cidrid
