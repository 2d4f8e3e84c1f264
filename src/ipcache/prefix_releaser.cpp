//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "prefix_releaser.hpp"

#include "common_helpers.hpp"
#include "logging.hpp"

#include "cidrid/metrics/counters.hpp"
#include "cidrid/net/prefix.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/cetl.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace cidrid
{
namespace ipcache
{

PrefixReleaser::PrefixReleaser(ReleaseCallback          callback,
                               const platform::Duration min_interval,
                               metrics::Counters&       counters)
    : callback_{std::move(callback)}
    , min_interval_{min_interval}
    , counters_{counters}
    , logger_{common::getLogger("ipcache")}
    , running_{false}
    , last_drain_{}
{
    CETL_DEBUG_ASSERT(callback_, "");
}

PrefixReleaser::~PrefixReleaser()
{
    stop();
}

void PrefixReleaser::start()
{
    const std::lock_guard<std::mutex> lock{mutex_};
    if (running_)
    {
        return;
    }
    running_ = true;
    worker_  = std::thread([this] { loop(); });
}

void PrefixReleaser::stop()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        running_ = false;
    }
    cv_.notify_all();

    if (worker_.joinable())
    {
        worker_.join();
    }

    // Nothing is abandoned on shutdown - whatever is still pending gets released right here.
    flush();
}

void PrefixReleaser::enqueue(const Prefixes& prefixes, const std::string& reason)
{
    if (prefixes.empty())
    {
        return;
    }

    {
        const std::lock_guard<std::mutex> lock{mutex_};
        for (const auto& prefix : prefixes)
        {
            if (pending_counts_[prefix]++ == 0)
            {
                pending_order_.push_back(prefix);
            }
        }
        pending_reasons_[reason] += prefixes.size();
    }
    cv_.notify_all();

    logger_->trace("Enqueued {} prefixes for release (reason='{}').", prefixes.size(), reason);
}

void PrefixReleaser::flush()
{
    while (drainOnce())
    {
        // Keep draining - duplicates of the last batch may still be pending.
    }
}

std::size_t PrefixReleaser::pendingSize() const
{
    const std::lock_guard<std::mutex> lock{mutex_};

    std::size_t total = 0;
    for (const auto& prefix_count : pending_counts_)
    {
        total += prefix_count.second;
    }
    return total;
}

bool PrefixReleaser::drainOnce()
{
    // Batches are handed to the callback strictly one after another,
    // no matter whether it's the worker or a `flush` caller.
    const std::lock_guard<std::mutex> drain_lock{drain_mutex_};

    Prefixes                                     batch;
    std::unordered_map<std::string, std::size_t> reasons;
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        last_drain_ = platform::Clock::now();
        if (pending_order_.empty())
        {
            return false;
        }

        Prefixes still_pending;
        for (auto& prefix : pending_order_)
        {
            auto& count = pending_counts_[prefix];
            CETL_DEBUG_ASSERT(count > 0, "");
            if (--count == 0)
            {
                pending_counts_.erase(prefix);
                batch.push_back(std::move(prefix));
            }
            else
            {
                batch.push_back(prefix);
                still_pending.push_back(std::move(prefix));
            }
        }
        pending_order_ = std::move(still_pending);
        reasons.swap(pending_reasons_);
    }

    std::string reasons_str;
    for (const auto& reason_count : reasons)
    {
        counters_.addReleasedPrefixes(reason_count.first, reason_count.second);
        reasons_str += reasons_str.empty() ? reason_count.first : (", " + reason_count.first);
    }
    logger_->debug("Releasing batch of {} prefixes (reasons='{}').", batch.size(), reasons_str);

    if (!common::performWithoutThrowing([this, &batch] {
            //
            callback_(batch);
        }))
    {
        logger_->error("Failed to release batch of {} prefixes. Identities may be leaked.", batch.size());
    }
    return true;
}

void PrefixReleaser::loop()
{
    logger_->debug("Prefix releaser worker is started (min_interval={}us).", min_interval_.count());

    std::unique_lock<std::mutex> lock{mutex_};
    while (running_)
    {
        cv_.wait(lock, [this] { return !running_ || !pending_order_.empty(); });
        if (!running_)
        {
            break;
        }

        // Let a burst of requests accumulate into one batch.
        const auto not_before = platform::saturatingAdd(last_drain_, min_interval_);
        if (cv_.wait_until(lock, not_before, [this] { return !running_; }))
        {
            break;
        }

        lock.unlock();
        (void) drainOnce();
        lock.lock();
    }

    logger_->debug("Prefix releaser worker is stopped.");
}

}  // namespace ipcache
}  // namespace cidrid
