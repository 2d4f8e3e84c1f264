//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/ipcache/ip_cache.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstdint>
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

class IpCacheImpl final : public IpCache
{
public:
    IpCacheImpl()
        : logger_{common::getLogger("ipcache")}
    {
    }

    // IpCache

    int upsert(const std::string&                 prefix,
               const cetl::optional<std::string>& host_ip,
               const std::uint8_t                 encrypt_key,
               const cetl::optional<K8sMetadata>& k8s_meta,
               const CacheIdentity&               identity) override
    {
        const std::lock_guard<std::shared_mutex> lock{mutex_};

        const auto it = prefix_to_entry_.find(prefix);
        if (it != prefix_to_entry_.end())
        {
            const auto& existing = it->second.identity;
            if (!allowOverwrite(existing.source, identity.source))
            {
                logger_->debug("Skipping upsert of '{}' - existing source '{}' has precedence over '{}'.",
                               prefix,
                               toString(existing.source),
                               toString(identity.source));
                return EPERM;
            }
        }

        logger_->trace("Upsert '{}' -> {} (source='{}').", prefix, identity.id, toString(identity.source));
        prefix_to_entry_[prefix] = CacheEntry{identity, host_ip, encrypt_key, k8s_meta};
        return 0;
    }

    bool remove(const std::string& prefix, const Source source) override
    {
        const std::lock_guard<std::shared_mutex> lock{mutex_};

        const auto it = prefix_to_entry_.find(prefix);
        if (it == prefix_to_entry_.end())
        {
            logger_->debug("Attempt to remove non-existing entry '{}'.", prefix);
            return false;
        }
        if (it->second.identity.source != source)
        {
            logger_->debug("Skipping removal of '{}' - entry source '{}' != '{}'.",
                           prefix,
                           toString(it->second.identity.source),
                           toString(source));
            return false;
        }

        logger_->trace("Remove '{}' (id={}).", prefix, it->second.identity.id);
        prefix_to_entry_.erase(it);
        return true;
    }

    cetl::optional<CacheIdentity> lookupByIp(const std::string& prefix) const override
    {
        const std::shared_lock<std::shared_mutex> lock{mutex_};

        const auto it = prefix_to_entry_.find(prefix);
        if (it == prefix_to_entry_.end())
        {
            return cetl::nullopt;
        }
        return it->second.identity;
    }

    std::vector<std::pair<std::string, CacheEntry>> dump() const override
    {
        const std::shared_lock<std::shared_mutex> lock{mutex_};
        return {prefix_to_entry_.begin(), prefix_to_entry_.end()};
    }

private:
    common::LoggerPtr                 logger_;
    mutable std::shared_mutex         mutex_;
    std::map<std::string, CacheEntry> prefix_to_entry_;

};  // IpCacheImpl

}  // namespace

const char* toString(const Source source) noexcept
{
    switch (source)
    {
    case Source::Unspec:
        return "unspec";
    case Source::Generated:
        return "generated";
    case Source::Kubernetes:
        return "k8s";
    case Source::CustomResource:
        return "custom-resource";
    case Source::KVStore:
        return "kvstore";
    case Source::Local:
        return "local";
    case Source::KubeApiServer:
        return "kube-apiserver";
    }
    return "?";
}

bool allowOverwrite(const Source existing, const Source next) noexcept
{
    // Sources are declared in the order of increasing precedence.
    return static_cast<std::uint8_t>(next) >= static_cast<std::uint8_t>(existing);
}

IpCache::Ptr IpCache::make()
{
    return std::make_shared<IpCacheImpl>();
}

}  // namespace ipcache
}  // namespace cidrid
