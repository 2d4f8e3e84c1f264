//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IPCACHE_CIDR_ALLOCATOR_HPP_INCLUDED
#define CIDRID_IPCACHE_CIDR_ALLOCATOR_HPP_INCLUDED

#include "ip_cache.hpp"
#include "metadata.hpp"

#include "cidrid/identity/allocator.hpp"
#include "cidrid/identity/identity.hpp"
#include "cidrid/metrics/counters.hpp"
#include "cidrid/net/prefix.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cidrid
{
namespace ipcache
{

/// Allocates reference counted identities of CIDR prefixes, and keeps the IP cache in sync with them.
///
/// Locking contract:
/// - Allocation takes the metadata read lock, and then the allocator's own (main) lock - always in this order -
///   for the duration of label derivation and identity allocation only. IP cache upserts happen after both
///   locks are released.
/// - Release takes the same two locks in the same order, and holds the main lock across both the identity
///   release and the IP cache removal, so that a concurrent allocation never sees an identity released
///   while its cache entry is still there (or vice versa).
///
class CidrAllocator
{
public:
    using Ptr = std::unique_ptr<CidrAllocator>;

    using Identities = std::vector<identity::Identity>;

    /// Prefix (in its canonical string form) to identity map.
    ///
    using IdentityMap = std::unordered_map<std::string, identity::Identity>;

    struct Options
    {
        /// Bounds every single identity allocator call.
        platform::Duration allocation_timeout{std::chrono::minutes{2}};

        /// Minimal interval between two batches of deferred releases.
        platform::Duration release_interval{std::chrono::milliseconds{1}};
    };

    struct AllocateResult
    {
        using Success = Identities;
        using Failure = int;  // aka errno
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Makes a new CIDR allocator, and starts its deferred release worker.
    ///
    /// All collaborators must outlive the allocator.
    ///
    CETL_NODISCARD static Ptr make(identity::IdentityAllocator& identity_allocator,
                                   IpCache&                     ip_cache,
                                   Metadata&                    metadata,
                                   metrics::Counters&           counters,
                                   const Options&               options);

    CidrAllocator(const CidrAllocator&)                = delete;
    CidrAllocator(CidrAllocator&&) noexcept            = delete;
    CidrAllocator& operator=(const CidrAllocator&)     = delete;
    CidrAllocator& operator=(CidrAllocator&&) noexcept = delete;

    /// Stops the deferred release worker; releases which are still pending are performed synchronously.
    ///
    virtual ~CidrAllocator() = default;

    /// Allocates identities for a list of CIDR prefixes.
    ///
    /// If any allocation fails, all identities allocated so far by this call are released,
    /// and the failure is returned; nothing is upserted into the IP cache in such case.
    ///
    /// When an identity is freshly allocated for a prefix, it is upserted into the IP cache
    /// right away if `newly_allocated` is `nullptr`. Otherwise, the new identities are put into
    /// `newly_allocated`, and it's the caller's responsibility to upsert them (by calling
    /// `upsertGeneratedIdentities`) - this allows to merge upserts of several allocations.
    ///
    /// Upon success, the caller must arrange for the identities to be released exactly once
    /// (via `releaseCidrIdentitiesByCidr` or `releaseCidrIdentitiesById`), otherwise they leak.
    ///
    /// @param prefixes Prefixes to allocate for; `cetl::nullopt` entries are skipped.
    /// @param previous_ids Optional numeric identities which were used before for the prefixes at the same
    ///                     indices. Missing entries (including the whole vector) mean `InvalidIdentity`.
    ///                     An unavailable previous identity is not an error - a new one is allocated.
    /// @param newly_allocated Optional output map for the freshly allocated identities.
    /// @return Allocated identities, deduplicated by prefix (in the order of the first occurrence).
    ///
    CETL_NODISCARD virtual AllocateResult::Var allocateCidrs(
        const std::vector<cetl::optional<net::Prefix>>& prefixes,
        const std::vector<identity::NumericIdentity>&   previous_ids,
        IdentityMap*                                    newly_allocated) = 0;

    /// Same as `allocateCidrs`, but for IP addresses (each one as a host-length prefix), and without
    /// previous numeric identities.
    ///
    /// Upon success, the caller must arrange for the identities to be released via `releaseCidrIdentitiesById`.
    ///
    CETL_NODISCARD virtual AllocateResult::Var allocateCidrsForIps(const std::vector<net::IpAddress>& ips,
                                                                   IdentityMap* newly_allocated) = 0;

    /// Upserts identities into the IP cache.
    ///
    /// All `newly_allocated` identities are upserted unconditionally. Then, each of `used` identities
    /// is upserted, but only if its prefix has no IP cache entry; such upserts are counted as recoveries
    /// because they reveal an entry removed while its identity was still referenced.
    /// Never removes anything from the IP cache.
    ///
    virtual void upsertGeneratedIdentities(const IdentityMap& newly_allocated, const Identities& used) = 0;

    /// Asynchronously releases identities of the given prefixes.
    ///
    /// When the last reference of an identity is released, its IP cache entry is removed.
    ///
    virtual void releaseCidrIdentitiesByCidr(const std::vector<net::Prefix>& prefixes) = 0;

    /// Asynchronously releases the given CIDR identities.
    ///
    /// Identities which are not allocated, or which are not CIDR identities, are skipped (with a warning).
    ///
    virtual void releaseCidrIdentitiesById(const platform::Context&                      context,
                                           const std::vector<identity::NumericIdentity>& ids) = 0;

    /// Synchronously performs all pending deferred releases.
    ///
    virtual void flushReleases() = 0;

protected:
    CidrAllocator() = default;

};  // CidrAllocator

}  // namespace ipcache
}  // namespace cidrid

#endif  // CIDRID_IPCACHE_CIDR_ALLOCATOR_HPP_INCLUDED
