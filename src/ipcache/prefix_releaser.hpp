//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IPCACHE_PREFIX_RELEASER_HPP_INCLUDED
#define CIDRID_IPCACHE_PREFIX_RELEASER_HPP_INCLUDED

#include "logging.hpp"

#include "cidrid/metrics/counters.hpp"
#include "cidrid/net/prefix.hpp"
#include "cidrid/platform/context.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cidrid
{
namespace ipcache
{

/// Batches asynchronous release requests of CIDR prefixes.
///
/// Requests which arrive within the minimal interval are coalesced into one batch,
/// which is handed to the release callback on the worker thread. Each batch has every
/// distinct prefix at most once; if the same prefix was requested several times, the
/// extra requests stay pending for the following batches, so none of them is lost.
///
class PrefixReleaser final
{
public:
    using Prefixes        = std::vector<net::Prefix>;
    using ReleaseCallback = std::function<void(const Prefixes& prefixes)>;

    PrefixReleaser(ReleaseCallback callback, const platform::Duration min_interval, metrics::Counters& counters);

    PrefixReleaser(const PrefixReleaser&)                = delete;
    PrefixReleaser(PrefixReleaser&&) noexcept            = delete;
    PrefixReleaser& operator=(const PrefixReleaser&)     = delete;
    PrefixReleaser& operator=(PrefixReleaser&&) noexcept = delete;

    /// Stops the worker (if running), and releases everything still pending.
    ///
    ~PrefixReleaser();

    /// Spawns the worker thread. Does nothing if already started.
    ///
    void start();

    /// Stops the worker thread, and then synchronously releases all pending prefixes.
    ///
    void stop();

    /// Adds prefixes to the pending batch. Never blocks on the release itself.
    ///
    /// @param reason Human readable reason of the request; in use for logging and counters only.
    ///
    void enqueue(const Prefixes& prefixes, const std::string& reason);

    /// Synchronously releases all pending prefixes (in as many batches as needed).
    ///
    void flush();

    /// Gets total number of pending release requests.
    ///
    std::size_t pendingSize() const;

private:
    bool drainOnce();
    void loop();

    const ReleaseCallback                        callback_;
    const platform::Duration                     min_interval_;
    metrics::Counters&                           counters_;
    common::LoggerPtr                            logger_;
    mutable std::mutex                           mutex_;
    std::condition_variable                      cv_;
    bool                                         running_;
    platform::TimePoint                          last_drain_;
    Prefixes                                     pending_order_;
    std::unordered_map<net::Prefix, std::size_t> pending_counts_;
    std::unordered_map<std::string, std::size_t> pending_reasons_;
    std::mutex                                   drain_mutex_;
    std::thread                                  worker_;

};  // PrefixReleaser

}  // namespace ipcache
}  // namespace cidrid

#endif  // CIDRID_IPCACHE_PREFIX_RELEASER_HPP_INCLUDED
