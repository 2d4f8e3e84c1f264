//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/ipcache/metadata.hpp"

#include "cidrid/labels/labels.hpp"

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace cidrid
{
namespace ipcache
{

void Metadata::upsert(const std::string& ip, labels::Labels labels)
{
    const std::lock_guard<std::shared_mutex> lock{mutex_};
    ip_to_labels_[ip] = std::move(labels);
}

bool Metadata::remove(const std::string& ip)
{
    const std::lock_guard<std::shared_mutex> lock{mutex_};
    return ip_to_labels_.erase(ip) > 0;
}

labels::Labels Metadata::get(const std::string& ip) const
{
    const auto lock = readLock();
    return getLocked(ip);
}

labels::Labels Metadata::getLocked(const std::string& ip) const
{
    const auto it = ip_to_labels_.find(ip);
    return (it != ip_to_labels_.end()) ? it->second : labels::Labels{};
}

std::size_t Metadata::size() const
{
    const auto lock = readLock();
    return ip_to_labels_.size();
}

}  // namespace ipcache
}  // namespace cidrid
