//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IDENTITY_ALLOCATOR_MOCK_HPP_INCLUDED
#define CIDRID_IDENTITY_ALLOCATOR_MOCK_HPP_INCLUDED

#include "cidrid/identity/allocator.hpp"
#include "cidrid/identity/identity.hpp"
#include "cidrid/labels/labels.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

namespace cidrid
{
namespace identity
{

/// By default, all calls are delegated to the given real allocator,
/// so that tests need to override only the calls they're interested in.
///
class IdentityAllocatorMock : public IdentityAllocator
{
public:
    explicit IdentityAllocatorMock(IdentityAllocator& delegate)
    {
        using testing::_;

        ON_CALL(*this, allocateIdentity(_, _, _, _))
            .WillByDefault([&delegate](const platform::Context& context,
                                       const labels::Labels&    label_set,
                                       const bool               notify_owner,
                                       const NumericIdentity    previous_id) {
                return delegate.allocateIdentity(context, label_set, notify_owner, previous_id);
            });
        ON_CALL(*this, release(_, _, _))
            .WillByDefault(
                [&delegate](const platform::Context& context, const Identity& identity, const bool notify_owner) {
                    return delegate.release(context, identity, notify_owner);
                });
        ON_CALL(*this, lookupIdentity(_, _))
            .WillByDefault([&delegate](const platform::Context& context, const labels::Labels& label_set) {
                return delegate.lookupIdentity(context, label_set);
            });
        ON_CALL(*this, lookupIdentityById(_, _))
            .WillByDefault([&delegate](const platform::Context& context, const NumericIdentity id) {
                return delegate.lookupIdentityById(context, id);
            });
    }

    // IdentityAllocator

    MOCK_METHOD(AllocateResult::Var,
                allocateIdentity,
                (const platform::Context& context,
                 const labels::Labels&    label_set,
                 const bool               notify_owner,
                 const NumericIdentity    previous_id),
                (override));

    MOCK_METHOD(ReleaseResult::Var,
                release,
                (const platform::Context& context, const Identity& identity, const bool notify_owner),
                (override));

    MOCK_METHOD(cetl::optional<Identity>,
                lookupIdentity,
                (const platform::Context& context, const labels::Labels& label_set),
                (const, override));

    MOCK_METHOD(cetl::optional<Identity>,
                lookupIdentityById,
                (const platform::Context& context, const NumericIdentity id),
                (const, override));

};  // IdentityAllocatorMock

}  // namespace identity
}  // namespace cidrid

#endif  // CIDRID_IDENTITY_ALLOCATOR_MOCK_HPP_INCLUDED
