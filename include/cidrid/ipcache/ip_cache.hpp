//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IPCACHE_IP_CACHE_HPP_INCLUDED
#define CIDRID_IPCACHE_IP_CACHE_HPP_INCLUDED

#include "cidrid/identity/identity.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cidrid
{
namespace ipcache
{

/// Provenance of an IP cache entry, in the order of increasing precedence.
///
enum class Source : std::uint8_t
{
    Unspec,
    Generated,  ///< Derived from a CIDR identity allocation.
    Kubernetes,
    CustomResource,
    KVStore,
    Local,
    KubeApiServer,
};

const char* toString(const Source source) noexcept;

/// Whether an entry of the `existing` source may be overwritten by the `next` one.
///
bool allowOverwrite(const Source existing, const Source next) noexcept;

/// The identity part of an IP cache entry.
///
struct CacheIdentity final
{
    identity::NumericIdentity id;
    Source                    source;

    friend bool operator==(const CacheIdentity& lhs, const CacheIdentity& rhs)
    {
        return (lhs.id == rhs.id) && (lhs.source == rhs.source);
    }

};  // CacheIdentity

struct K8sMetadata final
{
    std::string pod_namespace;
    std::string pod_name;

};  // K8sMetadata

struct CacheEntry final
{
    CacheIdentity               identity;
    cetl::optional<std::string> host_ip;
    std::uint8_t                encrypt_key;
    cetl::optional<K8sMetadata> k8s_meta;

};  // CacheEntry

/// Abstract interface of the shared prefix to identity mapping store.
///
/// The store does its own locking: all methods may be called concurrently from any thread,
/// and no caller ever holds a store lock across calls.
///
class IpCache
{
public:
    using Ptr = std::shared_ptr<IpCache>;

    /// Makes in-memory implementation of the store.
    ///
    CETL_NODISCARD static Ptr make();

    IpCache(const IpCache&)                = delete;
    IpCache(IpCache&&) noexcept            = delete;
    IpCache& operator=(const IpCache&)     = delete;
    IpCache& operator=(IpCache&&) noexcept = delete;

    virtual ~IpCache() = default;

    /// Inserts or overwrites entry of the given prefix.
    ///
    /// @return Zero on success; `EPERM` if the existing entry has higher precedence source.
    ///
    CETL_NODISCARD virtual int upsert(const std::string&                 prefix,
                                      const cetl::optional<std::string>& host_ip,
                                      const std::uint8_t                 encrypt_key,
                                      const cetl::optional<K8sMetadata>& k8s_meta,
                                      const CacheIdentity&               identity) = 0;

    /// Removes entry of the given prefix, but only if it was upserted by the given source.
    ///
    /// @return `true` if the entry was removed.
    ///
    virtual bool remove(const std::string& prefix, const Source source) = 0;

    CETL_NODISCARD virtual cetl::optional<CacheIdentity> lookupByIp(const std::string& prefix) const = 0;

    /// Makes snapshot of all the entries.
    ///
    CETL_NODISCARD virtual std::vector<std::pair<std::string, CacheEntry>> dump() const = 0;

protected:
    IpCache() = default;

};  // IpCache

}  // namespace ipcache
}  // namespace cidrid

#endif  // CIDRID_IPCACHE_IP_CACHE_HPP_INCLUDED
