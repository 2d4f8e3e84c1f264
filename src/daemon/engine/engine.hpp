//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_DAEMON_ENGINE_HPP_INCLUDED
#define CIDRID_DAEMON_ENGINE_HPP_INCLUDED

#include "config.hpp"
#include "logging.hpp"

#include "cidrid/identity/local_allocator.hpp"
#include "cidrid/ipcache/cidr_allocator.hpp"
#include "cidrid/ipcache/ip_cache.hpp"
#include "cidrid/ipcache/metadata.hpp"
#include "cidrid/metrics/counters.hpp"
#include "cidrid/net/prefix.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <string>
#include <vector>

namespace cidrid
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    Engine(const Engine&)                = delete;
    Engine(Engine&&) noexcept            = delete;
    Engine& operator=(const Engine&)     = delete;
    Engine& operator=(Engine&&) noexcept = delete;

    ~Engine();

    /// Brings up all components, loads metadata labels, and restores identities of the previous run.
    ///
    CETL_NODISCARD cetl::optional<std::string> init();

    void runWhile(const std::function<bool()>& loop_predicate);

    /// Persists the current generated identities into the configuration (to be restored on the next start),
    /// and then stops the allocator - pending releases are performed before it's gone.
    ///
    void shutdown();

    ipcache::CidrAllocator& cidrAllocator()
    {
        CETL_DEBUG_ASSERT(cidr_allocator_, "");
        return *cidr_allocator_;
    }

    const ipcache::IpCache& ipCache() const
    {
        CETL_DEBUG_ASSERT(ip_cache_, "");
        return *ip_cache_;
    }

    const identity::LocalAllocator& identityAllocator() const
    {
        CETL_DEBUG_ASSERT(identity_allocator_, "");
        return *identity_allocator_;
    }

    const metrics::Counters& counters() const
    {
        CETL_DEBUG_ASSERT(counters_, "");
        return *counters_;
    }

private:
    void loadMetadata();
    void restorePrefixes();
    void releaseRestoredPrefixes();

    Config::Ptr                           config_;
    common::LoggerPtr                     logger_{common::getLogger("engine")};
    metrics::Counters::Ptr                counters_;
    identity::LocalAllocator::Ptr         identity_allocator_;
    ipcache::IpCache::Ptr                 ip_cache_;
    ipcache::Metadata                     metadata_;
    ipcache::CidrAllocator::Ptr           cidr_allocator_;
    std::vector<net::Prefix>              restored_prefixes_;
    cetl::optional<platform::TimePoint>   restored_release_time_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace cidrid

#endif  // CIDRID_DAEMON_ENGINE_HPP_INCLUDED
