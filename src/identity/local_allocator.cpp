//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/identity/local_allocator.hpp"

#include "cidrid/identity/allocator.hpp"
#include "cidrid/identity/identity.hpp"
#include "cidrid/labels/labels.hpp"
#include "cidrid/platform/context.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace cidrid
{
namespace identity
{
namespace
{

class LocalAllocatorImpl final : public LocalAllocator
{
public:
    explicit LocalAllocatorImpl(const Options& options)
        : options_{options}
        , next_id_{options.min_id}
        , logger_{common::getLogger("identity")}
    {
        CETL_DEBUG_ASSERT(options_.min_id != InvalidIdentity, "");
        CETL_DEBUG_ASSERT(options_.min_id <= options_.max_id, "");
    }

    // IdentityAllocator

    AllocateResult::Var allocateIdentity(const platform::Context& context,
                                         const labels::Labels&    labels,
                                         const bool               notify_owner,
                                         const NumericIdentity    previous_id) override
    {
        (void) notify_owner;

        if (context.expired())
        {
            logger_->debug("Allocation deadline is exceeded (labels='{}').", labels.toString());
            return ETIMEDOUT;
        }

        const auto key = labels.toString();

        const std::lock_guard<std::mutex> lock{mutex_};

        const auto key_it = key_to_id_.find(key);
        if (key_it != key_to_id_.end())
        {
            auto& entry = id_to_entry_.at(key_it->second);
            ++entry.ref_count;
            logger_->trace("Identity {} is referenced (refs={}).", entry.identity.id, entry.ref_count);
            return AllocateResult::Success{entry.identity, false};
        }

        const auto maybe_id = pickFreeId(previous_id);
        if (!maybe_id)
        {
            logger_->warn("No free local identities left (range=[{}, {}]).", options_.min_id, options_.max_id);
            return ENOSPC;
        }
        const auto id = maybe_id.value();

        Identity identity{id, labels};
        id_to_entry_.emplace(id, Entry{identity, 1});
        key_to_id_.emplace(key, id);

        logger_->debug("New identity {} is allocated (prev_id={}, labels='{}').", id, previous_id, key);
        return AllocateResult::Success{std::move(identity), true};
    }

    ReleaseResult::Var release(const platform::Context& context,
                               const Identity&          identity,
                               const bool               notify_owner) override
    {
        (void) notify_owner;

        if (context.expired())
        {
            logger_->debug("Release deadline is exceeded (id={}).", identity.id);
            return ETIMEDOUT;
        }

        const std::lock_guard<std::mutex> lock{mutex_};

        const auto entry_it = id_to_entry_.find(identity.id);
        if (entry_it == id_to_entry_.end())
        {
            logger_->debug("Identity {} is not allocated - nothing to release.", identity.id);
            return ENOENT;
        }

        auto& entry = entry_it->second;
        CETL_DEBUG_ASSERT(entry.ref_count > 0, "");
        if (--entry.ref_count > 0)
        {
            logger_->trace("Identity {} is dereferenced (refs={}).", identity.id, entry.ref_count);
            return false;
        }

        key_to_id_.erase(entry.identity.labels.toString());
        id_to_entry_.erase(entry_it);
        logger_->debug("Identity {} is freed.", identity.id);
        return true;
    }

    cetl::optional<Identity> lookupIdentity(const platform::Context& context,
                                            const labels::Labels&    labels) const override
    {
        (void) context;

        const auto key = labels.toString();

        const std::lock_guard<std::mutex> lock{mutex_};

        const auto key_it = key_to_id_.find(key);
        if (key_it == key_to_id_.end())
        {
            return cetl::nullopt;
        }
        return id_to_entry_.at(key_it->second).identity;
    }

    cetl::optional<Identity> lookupIdentityById(const platform::Context& context,
                                                const NumericIdentity    id) const override
    {
        (void) context;

        const std::lock_guard<std::mutex> lock{mutex_};

        const auto entry_it = id_to_entry_.find(id);
        if (entry_it == id_to_entry_.end())
        {
            return cetl::nullopt;
        }
        return entry_it->second.identity;
    }

    // LocalAllocator

    std::size_t referenceCount(const NumericIdentity id) const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        const auto entry_it = id_to_entry_.find(id);
        return (entry_it != id_to_entry_.end()) ? entry_it->second.ref_count : 0;
    }

    std::size_t size() const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return id_to_entry_.size();
    }

private:
    struct Entry
    {
        Identity    identity;
        std::size_t ref_count;
    };

    bool isInRange(const NumericIdentity id) const noexcept
    {
        return (id >= options_.min_id) && (id <= options_.max_id);
    }

    // Must be called under the lock.
    cetl::optional<NumericIdentity> pickFreeId(const NumericIdentity previous_id)
    {
        if ((previous_id != InvalidIdentity) && isInRange(previous_id) && (id_to_entry_.count(previous_id) == 0))
        {
            return previous_id;
        }

        const std::uint64_t range_size = std::uint64_t{options_.max_id} - options_.min_id + 1;
        if (id_to_entry_.size() >= range_size)
        {
            return cetl::nullopt;
        }

        // Round-robin from the last allocated value, so that a just freed id is not reused immediately.
        //
        for (std::uint64_t attempt = 0; attempt < range_size; ++attempt)
        {
            const auto candidate = next_id_;
            next_id_             = (next_id_ == options_.max_id) ? options_.min_id : next_id_ + 1;
            if (id_to_entry_.count(candidate) == 0)
            {
                return candidate;
            }
        }
        return cetl::nullopt;
    }

    const Options                                    options_;
    NumericIdentity                                  next_id_;
    common::LoggerPtr                                logger_;
    mutable std::mutex                               mutex_;
    std::unordered_map<std::string, NumericIdentity> key_to_id_;
    std::unordered_map<NumericIdentity, Entry>       id_to_entry_;

};  // LocalAllocatorImpl

}  // namespace

LocalAllocator::Ptr LocalAllocator::make(const Options& options)
{
    return std::make_shared<LocalAllocatorImpl>(options);
}

}  // namespace identity
}  // namespace cidrid
