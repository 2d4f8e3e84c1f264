//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IDENTITY_ALLOCATOR_HPP_INCLUDED
#define CIDRID_IDENTITY_ALLOCATOR_HPP_INCLUDED

#include "identity.hpp"

#include "cidrid/labels/labels.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>

namespace cidrid
{
namespace identity
{

/// Abstract interface of a reference counted identity allocator.
///
/// Each successful `allocateIdentity` call adds one reference to the identity of the given label set;
/// each `release` call drops one. The identity (and its numeric value) is freed with the last reference.
/// Implementations must be safe to call concurrently from any thread.
///
class IdentityAllocator
{
public:
    using Ptr = std::shared_ptr<IdentityAllocator>;

    struct AllocateResult
    {
        struct Success
        {
            Identity identity;

            /// `true` if the identity did not exist before this allocation.
            bool is_new;
        };
        using Failure = int;  // aka errno
        using Var     = cetl::variant<Success, Failure>;
    };

    struct ReleaseResult
    {
        /// `true` if the released reference was the last one, and the identity is freed.
        using Success = bool;
        using Failure = int;  // aka errno
        using Var     = cetl::variant<Success, Failure>;
    };

    IdentityAllocator(const IdentityAllocator&)                = delete;
    IdentityAllocator(IdentityAllocator&&) noexcept            = delete;
    IdentityAllocator& operator=(const IdentityAllocator&)     = delete;
    IdentityAllocator& operator=(IdentityAllocator&&) noexcept = delete;

    virtual ~IdentityAllocator() = default;

    /// Allocates (or adds reference to) identity of the given label set.
    ///
    /// @param context Bounds the call; an expired context fails the allocation with `ETIMEDOUT`.
    /// @param labels Complete label set of the identity.
    /// @param notify_owner Whether the allocator's owner should be notified about a new identity.
    /// @param previous_id Numeric identity which was used for the same labels before (f.e. before restart);
    ///                    `InvalidIdentity` if none. It is just a hint - if the value is not available,
    ///                    a different one is allocated, and that is not an error.
    ///
    CETL_NODISCARD virtual AllocateResult::Var allocateIdentity(const platform::Context& context,
                                                                const labels::Labels&    labels,
                                                                const bool               notify_owner,
                                                                const NumericIdentity    previous_id) = 0;

    CETL_NODISCARD virtual ReleaseResult::Var release(const platform::Context& context,
                                                      const Identity&          identity,
                                                      const bool               notify_owner) = 0;

    CETL_NODISCARD virtual cetl::optional<Identity> lookupIdentity(const platform::Context& context,
                                                                   const labels::Labels&    labels) const = 0;

    CETL_NODISCARD virtual cetl::optional<Identity> lookupIdentityById(const platform::Context& context,
                                                                       const NumericIdentity    id) const = 0;

protected:
    IdentityAllocator() = default;

};  // IdentityAllocator

}  // namespace identity
}  // namespace cidrid

#endif  // CIDRID_IDENTITY_ALLOCATOR_HPP_INCLUDED
