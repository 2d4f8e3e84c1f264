//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IDENTITY_LOCAL_ALLOCATOR_HPP_INCLUDED
#define CIDRID_IDENTITY_LOCAL_ALLOCATOR_HPP_INCLUDED

#include "allocator.hpp"
#include "identity.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <memory>

namespace cidrid
{
namespace identity
{

/// In-memory identity allocator of node-local identities.
///
class LocalAllocator : public IdentityAllocator
{
public:
    using Ptr = std::shared_ptr<LocalAllocator>;

    struct Options
    {
        /// Inclusive range of numeric identities to allocate from.
        NumericIdentity min_id{LocalIdentityFlag + 1};
        NumericIdentity max_id{LocalIdentityFlag + 0xFFFFFFU};  // NOLINT(*-magic-numbers)
    };

    CETL_NODISCARD static Ptr make(const Options& options);

    /// Gets number of references currently held on the given identity.
    ///
    /// @return Zero if the identity is not allocated.
    ///
    CETL_NODISCARD virtual std::size_t referenceCount(const NumericIdentity id) const = 0;

    /// Gets number of currently allocated identities.
    ///
    CETL_NODISCARD virtual std::size_t size() const = 0;

protected:
    LocalAllocator() = default;

};  // LocalAllocator

}  // namespace identity
}  // namespace cidrid

#endif  // CIDRID_IDENTITY_LOCAL_ALLOCATOR_HPP_INCLUDED
