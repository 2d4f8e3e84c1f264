//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IPCACHE_METADATA_HPP_INCLUDED
#define CIDRID_IPCACHE_METADATA_HPP_INCLUDED

#include "cidrid/labels/labels.hpp"

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace cidrid
{
namespace ipcache
{

/// Operator provided labels, per IP address, which are merged into CIDR identities.
///
/// Lock order: whoever needs both this table and the CIDR allocator's lock takes
/// the metadata read lock (`readLock`) first.
///
class Metadata final
{
public:
    Metadata() = default;

    Metadata(const Metadata&)                = delete;
    Metadata(Metadata&&) noexcept            = delete;
    Metadata& operator=(const Metadata&)     = delete;
    Metadata& operator=(Metadata&&) noexcept = delete;

    ~Metadata() = default;

    /// Replaces labels of the given IP address.
    ///
    void upsert(const std::string& ip, labels::Labels labels);

    /// @return `true` if there were labels for the IP.
    ///
    bool remove(const std::string& ip);

    labels::Labels get(const std::string& ip) const;

    /// Same as `get`, but expects that the caller already holds `readLock`.
    ///
    labels::Labels getLocked(const std::string& ip) const;

    std::size_t size() const;

    std::shared_lock<std::shared_mutex> readLock() const
    {
        return std::shared_lock<std::shared_mutex>{mutex_};
    }

private:
    mutable std::shared_mutex                       mutex_;
    std::unordered_map<std::string, labels::Labels> ip_to_labels_;

};  // Metadata

}  // namespace ipcache
}  // namespace cidrid

#endif  // CIDRID_IPCACHE_METADATA_HPP_INCLUDED
