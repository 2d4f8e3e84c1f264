//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/ipcache/cidr_allocator.hpp"

#include "logging.hpp"
#include "prefix_releaser.hpp"

#include "cidrid/identity/allocator.hpp"
#include "cidrid/identity/identity.hpp"
#include "cidrid/ipcache/ip_cache.hpp"
#include "cidrid/ipcache/metadata.hpp"
#include "cidrid/labels/labels.hpp"
#include "cidrid/metrics/counters.hpp"
#include "cidrid/net/prefix.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace cidrid
{
namespace ipcache
{
namespace
{

constexpr const char* CidrPrefixReleaseReason     = "cidr-prefix-release";
constexpr const char* SelectorPrefixReleaseReason = "selector-prefix-release";

class CidrAllocatorImpl final : public CidrAllocator
{
public:
    CidrAllocatorImpl(identity::IdentityAllocator& identity_allocator,
                      IpCache&                     ip_cache,
                      Metadata&                    metadata,
                      metrics::Counters&           counters,
                      const Options&               options)
        : identity_allocator_{identity_allocator}
        , ip_cache_{ip_cache}
        , metadata_{metadata}
        , counters_{counters}
        , options_{options}
        , logger_{common::getLogger("ipcache")}
        , releaser_{[this](const PrefixReleaser::Prefixes& prefixes) { releaseCidrIdentities(prefixes); },
                    options.release_interval,
                    counters}
    {
        releaser_.start();
    }

    ~CidrAllocatorImpl() override
    {
        // Pending releases need the rest of the members, so stop explicitly before they go.
        releaser_.stop();
    }

    CidrAllocatorImpl(const CidrAllocatorImpl&)                = delete;
    CidrAllocatorImpl(CidrAllocatorImpl&&) noexcept            = delete;
    CidrAllocatorImpl& operator=(const CidrAllocatorImpl&)     = delete;
    CidrAllocatorImpl& operator=(CidrAllocatorImpl&&) noexcept = delete;

    // CidrAllocator

    AllocateResult::Var allocateCidrs(const std::vector<cetl::optional<net::Prefix>>& prefixes,
                                      const std::vector<identity::NumericIdentity>&   previous_ids,
                                      IdentityMap*                                    newly_allocated) override
    {
        // Upsert right here only if the caller doesn't collect new identities by itself.
        const bool  upsert = newly_allocated == nullptr;
        IdentityMap own_newly_allocated;
        auto&       new_identities = upsert ? own_newly_allocated : *newly_allocated;

        Identities               used_identities;
        std::vector<std::string> inserted_keys;
        std::vector<std::string> allocated_order;
        IdentityMap              allocated_identities;
        used_identities.reserve(prefixes.size());
        {
            const auto                               metadata_lock = metadata_.readLock();
            const std::lock_guard<std::shared_mutex> lock{mutex_};

            for (std::size_t index = 0; index < prefixes.size(); ++index)
            {
                const auto& maybe_prefix = prefixes[index];
                if (!maybe_prefix)
                {
                    continue;
                }
                const auto& prefix = maybe_prefix.value();

                auto label_set = labels::getCidrLabels(prefix);
                label_set.merge(metadata_.getLocked(prefix.address().toString()));

                const auto previous_id = (index < previous_ids.size()) ? previous_ids[index]  //
                                                                       : identity::InvalidIdentity;

                auto result = allocate(prefix, label_set, previous_id);
                if (const auto* const failure = cetl::get_if<IdentityAllocateResult::Failure>(&result))
                {
                    rollback(used_identities);
                    for (const auto& key : inserted_keys)
                    {
                        new_identities.erase(key);
                    }
                    return *failure;
                }
                auto& success = cetl::get<IdentityAllocateResult::Success>(result);

                auto prefix_str = prefix.toString();
                used_identities.push_back(success.identity);
                if (allocated_identities.find(prefix_str) == allocated_identities.end())
                {
                    allocated_order.push_back(prefix_str);
                }
                allocated_identities.insert_or_assign(prefix_str, success.identity);
                if (success.is_new)
                {
                    if (new_identities.insert_or_assign(prefix_str, success.identity).second)
                    {
                        inserted_keys.push_back(prefix_str);
                    }
                }
            }
        }

        if (upsert)
        {
            upsertGeneratedIdentities(new_identities, {});
        }

        Identities identities;
        identities.reserve(allocated_order.size());
        for (const auto& prefix_str : allocated_order)
        {
            identities.push_back(allocated_identities.at(prefix_str));
        }
        return identities;
    }

    AllocateResult::Var allocateCidrsForIps(const std::vector<net::IpAddress>& ips,
                                            IdentityMap*                       newly_allocated) override
    {
        std::vector<cetl::optional<net::Prefix>> prefixes;
        prefixes.reserve(ips.size());
        for (const auto& ip : ips)
        {
            prefixes.emplace_back(net::Prefix::fromAddress(ip));
        }
        return allocateCidrs(prefixes, {}, newly_allocated);
    }

    void upsertGeneratedIdentities(const IdentityMap& newly_allocated, const Identities& used) override
    {
        for (const auto& prefix_and_id : newly_allocated)
        {
            upsertGenerated(prefix_and_id.first, prefix_and_id.second);
        }
        if (used.empty())
        {
            return;
        }

        std::map<std::string, identity::Identity> to_upsert;
        {
            const std::shared_lock<std::shared_mutex> lock{mutex_};

            for (const auto& id : used)
            {
                const auto prefix = id.cidrPrefix();
                if (!prefix)
                {
                    logger_->warn("BUG: Attempting to upsert non-CIDR identity (id={}).", id.id);
                    continue;
                }
                auto prefix_str = prefix->toString();
                if (ip_cache_.lookupByIp(prefix_str))
                {
                    continue;
                }
                to_upsert.insert_or_assign(std::move(prefix_str), id);
            }
        }

        for (const auto& prefix_and_id : to_upsert)
        {
            counters_.incIpCacheErrors(metrics::IpCacheError::TypeRecover, metrics::IpCacheError::ErrorUnexpected);
            logger_->warn("Recovering missing cache entry of a referenced identity (prefix='{}', id={}).",
                          prefix_and_id.first,
                          prefix_and_id.second.id);
            upsertGenerated(prefix_and_id.first, prefix_and_id.second);
        }
    }

    void releaseCidrIdentitiesByCidr(const std::vector<net::Prefix>& prefixes) override
    {
        releaser_.enqueue(prefixes, CidrPrefixReleaseReason);
    }

    void releaseCidrIdentitiesById(const platform::Context&                      context,
                                   const std::vector<identity::NumericIdentity>& ids) override
    {
        PrefixReleaser::Prefixes prefixes;
        prefixes.reserve(ids.size());
        for (const auto nid : ids)
        {
            const auto id = identity_allocator_.lookupIdentityById(context, nid);
            if (!id)
            {
                logger_->warn("Unexpected release of numeric identity that is no longer allocated (id={}).", nid);
                continue;
            }
            const auto prefix = id->cidrPrefix();
            if (!prefix)
            {
                logger_->warn("Unexpected release of non-CIDR identity, will leak this identity (id={}, labels='{}').",
                              nid,
                              id->labels.toString());
                continue;
            }
            prefixes.push_back(prefix.value());
        }
        releaser_.enqueue(prefixes, SelectorPrefixReleaseReason);
    }

    void flushReleases() override
    {
        releaser_.flush();
    }

private:
    using IdentityAllocateResult = identity::IdentityAllocator::AllocateResult;

    IdentityAllocateResult::Var allocate(const net::Prefix&              prefix,
                                         const labels::Labels&           label_set,
                                         const identity::NumericIdentity previous_id)
    {
        const auto context = platform::Context::withTimeout(options_.allocation_timeout);

        auto result = identity_allocator_.allocateIdentity(context, label_set, false, previous_id);
        if (const auto* const failure = cetl::get_if<IdentityAllocateResult::Failure>(&result))
        {
            logger_->error("Failed to allocate identity for cidr {} (err={}).", prefix, *failure);
            return result;
        }

        // The allocator may have classified the identity by a metadata label;
        // the allocated prefix is the authoritative one.
        auto& success = cetl::get<IdentityAllocateResult::Success>(result);
        if (label_set.has(labels::worldLabel()))
        {
            success.identity.kind = identity::CidrDerived{prefix};
        }
        logger_->trace("Allocated identity for cidr {} (id={}, new={}).", prefix, success.identity.id, success.is_new);
        return result;
    }

    void rollback(const Identities& used_identities)
    {
        const auto context = platform::Context::background();
        for (const auto& id : used_identities)
        {
            const auto result = identity_allocator_.release(context, id, false);
            if (const auto* const failure = cetl::get_if<identity::IdentityAllocator::ReleaseResult::Failure>(&result))
            {
                logger_->debug("Ignoring rollback release failure (id={}, err={}).", id.id, *failure);
            }
        }
    }

    void upsertGenerated(const std::string& prefix, const identity::Identity& id)
    {
        const int err = ip_cache_.upsert(prefix, cetl::nullopt, 0, cetl::nullopt, {id.id, Source::Generated});
        if (err != 0)
        {
            logger_->debug("Generated entry is not upserted (prefix='{}', id={}, err={}).", prefix, id.id, err);
        }
    }

    /// Finds identity of a prefix by its CIDR labels.
    ///
    /// If the prefix had metadata labels when it was allocated, its identity is keyed by the merged
    /// label set, so that one is tried as well. Must be called under the metadata read lock.
    ///
    cetl::optional<identity::Identity> lookupCidrIdentity(const platform::Context& context,
                                                          const net::Prefix&       prefix) const
    {
        auto label_set = labels::getCidrLabels(prefix);
        if (auto id = identity_allocator_.lookupIdentity(context, label_set))
        {
            return id;
        }

        const auto metadata_labels = metadata_.getLocked(prefix.address().toString());
        if (metadata_labels.empty())
        {
            return cetl::nullopt;
        }
        label_set.merge(metadata_labels);
        return identity_allocator_.lookupIdentity(context, label_set);
    }

    /// Releases identities of a batch of prefixes, and removes cache entries of the fully released ones.
    ///
    /// Both steps happen under the main lock; otherwise a concurrent allocation could re-reference
    /// an identity between its release and the removal of its (still needed) cache entry.
    ///
    void releaseCidrIdentities(const PrefixReleaser::Prefixes& prefixes)
    {
        const auto context = platform::Context::background();

        const auto                               metadata_lock = metadata_.readLock();
        const std::lock_guard<std::shared_mutex> lock{mutex_};

        std::vector<std::string> to_delete;
        to_delete.reserve(prefixes.size());
        for (const auto& prefix : prefixes)
        {
            const auto id = lookupCidrIdentity(context, prefix);
            if (!id)
            {
                logger_->error("Unable to find identity of previously used CIDR (cidr={}).", prefix);
                continue;
            }

            const auto result = identity_allocator_.release(context, id.value(), false);
            if (const auto* const failure = cetl::get_if<identity::IdentityAllocator::ReleaseResult::Failure>(&result))
            {
                logger_->warn("Unable to release CIDR identity. Ignoring error. Identity may be leaked "
                              "(cidr={}, id={}, err={}).",
                              prefix,
                              id->id,
                              *failure);
                continue;
            }
            if (cetl::get<identity::IdentityAllocator::ReleaseResult::Success>(result))
            {
                to_delete.push_back(prefix.toString());
            }
        }

        for (const auto& prefix_str : to_delete)
        {
            (void) ip_cache_.remove(prefix_str, Source::Generated);
        }
        logger_->debug("Released {} CIDR prefixes ({} fully).", prefixes.size(), to_delete.size());
    }

    identity::IdentityAllocator& identity_allocator_;
    IpCache&                     ip_cache_;
    Metadata&                    metadata_;
    metrics::Counters&           counters_;
    const Options                options_;
    common::LoggerPtr            logger_;
    std::shared_mutex            mutex_;
    PrefixReleaser               releaser_;

};  // CidrAllocatorImpl

}  // namespace

CidrAllocator::Ptr CidrAllocator::make(identity::IdentityAllocator& identity_allocator,
                                       IpCache&                     ip_cache,
                                       Metadata&                    metadata,
                                       metrics::Counters&           counters,
                                       const Options&               options)
{
    return std::make_unique<CidrAllocatorImpl>(identity_allocator, ip_cache, metadata, counters, options);
}

}  // namespace ipcache
}  // namespace cidrid
