//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "config.hpp"

#include "cidrid/identity/identity.hpp"
#include "cidrid/identity/local_allocator.hpp"
#include "cidrid/ipcache/cidr_allocator.hpp"
#include "cidrid/ipcache/ip_cache.hpp"
#include "cidrid/labels/labels.hpp"
#include "cidrid/metrics/counters.hpp"
#include "cidrid/net/prefix.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace cidrid
{
namespace daemon
{
namespace engine
{

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

Engine::~Engine()
{
    // The allocator references the rest of the components, so it goes first.
    cidr_allocator_.reset();
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Create the identity allocator (within the configured range if any).
    //
    identity::LocalAllocator::Options allocator_options;
    if (const auto min_id = config_->getIdentityMinId())
    {
        allocator_options.min_id = min_id.value();
    }
    if (const auto max_id = config_->getIdentityMaxId())
    {
        allocator_options.max_id = max_id.value();
    }
    if ((allocator_options.min_id == identity::InvalidIdentity) ||
        (allocator_options.min_id > allocator_options.max_id))
    {
        std::string msg = "Invalid identity range.";
        logger_->error("{} (min_id={}, max_id={})", msg, allocator_options.min_id, allocator_options.max_id);
        return msg;
    }
    identity_allocator_ = identity::LocalAllocator::make(allocator_options);

    // 2. Create the rest of the shared components, and load operator supplied labels.
    //
    counters_ = metrics::Counters::make();
    ip_cache_ = ipcache::IpCache::make();
    loadMetadata();

    // 3. Bring up the CIDR allocator.
    //
    ipcache::CidrAllocator::Options cidr_options;
    if (const auto allocation_timeout = config_->getAllocationTimeout())
    {
        cidr_options.allocation_timeout = allocation_timeout.value();
    }
    if (const auto release_interval = config_->getReleaseInterval())
    {
        cidr_options.release_interval = release_interval.value();
    }
    cidr_allocator_ =
        ipcache::CidrAllocator::make(*identity_allocator_, *ip_cache_, metadata_, *counters_, cidr_options);

    // 4. Restore identities of the previous run, so that their numeric values stay stable.
    //
    restorePrefixes();

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    using std::chrono_literals::operator""ms;

    while (loop_predicate())
    {
        // Awake at least once per 100ms, or right at the restored prefixes release time.
        platform::Duration timeout{100ms};
        if (restored_release_time_)
        {
            const auto now = platform::Clock::now();
            if (now >= restored_release_time_.value())
            {
                releaseRestoredPrefixes();
                continue;
            }
            timeout =
                std::min(timeout,
                         std::chrono::duration_cast<platform::Duration>(restored_release_time_.value() - now));
        }
        std::this_thread::sleep_for(timeout);
    }
    logger_->debug("Run loop predicate is fulfilled (recovered_entries={}).",
                   counters_->ipCacheErrors(metrics::IpCacheError::TypeRecover,
                                            metrics::IpCacheError::ErrorUnexpected));
}

void Engine::shutdown()
{
    if (!cidr_allocator_)
    {
        return;
    }

    Config::RestoredPrefixes restored;
    for (const auto& prefix_and_entry : ip_cache_->dump())
    {
        const auto& entry_identity = prefix_and_entry.second.identity;
        if (entry_identity.source == ipcache::Source::Generated)
        {
            restored.emplace(prefix_and_entry.first, entry_identity.id);
        }
    }
    config_->setRestoredPrefixes(restored);
    logger_->info("Persisted {} generated identities.", restored.size());

    cidr_allocator_.reset();
    logger_->debug("Engine is shut down.");
}

void Engine::loadMetadata()
{
    for (const auto& ip_and_labels : config_->getMetadataLabels())
    {
        using ParseResult = net::IpAddress::ParseResult;

        const auto maybe_ip = net::IpAddress::parse(ip_and_labels.first);
        if (const auto* const failure = cetl::get_if<ParseResult::Failure>(&maybe_ip))
        {
            logger_->warn("Skipping metadata labels of invalid IP '{}' (err={}).", ip_and_labels.first, *failure);
            continue;
        }

        // The canonical address form is the key which allocations look metadata up by.
        const auto ip_str = cetl::get<ParseResult::Success>(maybe_ip).toString();
        metadata_.upsert(ip_str, labels::Labels::fromStrings(ip_and_labels.second));
        logger_->debug("Loaded {} metadata labels of '{}'.", ip_and_labels.second.size(), ip_str);
    }
}

void Engine::restorePrefixes()
{
    const auto restored = config_->getRestoredPrefixes();
    if (restored.empty())
    {
        return;
    }

    std::vector<cetl::optional<net::Prefix>> prefixes;
    std::vector<identity::NumericIdentity>   previous_ids;
    for (const auto& prefix_and_id : restored)
    {
        using ParseResult = net::Prefix::ParseResult;

        const auto maybe_prefix = net::Prefix::parse(prefix_and_id.first);
        if (const auto* const failure = cetl::get_if<ParseResult::Failure>(&maybe_prefix))
        {
            logger_->warn("Skipping invalid restored prefix '{}' (err={}).", prefix_and_id.first, *failure);
            continue;
        }
        prefixes.emplace_back(cetl::get<ParseResult::Success>(maybe_prefix));
        previous_ids.push_back(prefix_and_id.second);
    }

    using AllocateResult = ipcache::CidrAllocator::AllocateResult;

    auto result = cidr_allocator_->allocateCidrs(prefixes, previous_ids, nullptr);
    if (const auto* const failure = cetl::get_if<AllocateResult::Failure>(&result))
    {
        // Not fatal - identities just get new numeric values when they're allocated again.
        logger_->error("Failed to restore {} prefixes (err={}).", prefixes.size(), *failure);
        return;
    }

    // Each restored entry holds its own reference, even when several entries mask to the same network.
    for (const auto& prefix : prefixes)
    {
        restored_prefixes_.push_back(prefix.value());
    }

    std::size_t stable_ids = 0;
    for (const auto& id : cetl::get<AllocateResult::Success>(result))
    {
        const auto prefix = id.cidrPrefix();
        CETL_DEBUG_ASSERT(prefix, "");

        const auto it = restored.find(prefix->toString());
        if ((it != restored.end()) && (it->second == id.id))
        {
            ++stable_ids;
        }
    }

    platform::Duration grace_period{0};
    if (const auto restore_grace_period = config_->getRestoreGracePeriod())
    {
        grace_period = restore_grace_period.value();
    }
    restored_release_time_ = platform::saturatingAdd(platform::Clock::now(), grace_period);

    logger_->info("Restored {} prefixes ({} with the previous identity).", restored_prefixes_.size(), stable_ids);
}

void Engine::releaseRestoredPrefixes()
{
    logger_->debug("Releasing {} restored prefixes.", restored_prefixes_.size());

    cidr_allocator_->releaseCidrIdentitiesByCidr(restored_prefixes_);
    restored_prefixes_.clear();
    restored_release_time_.reset();
}

}  // namespace engine
}  // namespace daemon
}  // namespace cidrid
