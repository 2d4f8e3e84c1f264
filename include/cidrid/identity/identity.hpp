//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_IDENTITY_IDENTITY_HPP_INCLUDED
#define CIDRID_IDENTITY_IDENTITY_HPP_INCLUDED

#include "cidrid/labels/labels.hpp"
#include "cidrid/net/prefix.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace cidrid
{
namespace identity
{

using NumericIdentity = std::uint32_t;

constexpr NumericIdentity InvalidIdentity = 0;

/// Set in all numeric identities which are allocated locally (never shared across the cluster).
///
constexpr NumericIdentity LocalIdentityFlag = NumericIdentity{1} << 24U;  // NOLINT(*-magic-numbers)

/// An identity which is not related to any specific network (for example, a workload identity).
///
struct Generic final
{};

/// An identity which represents traffic from/to the given network.
///
struct CidrDerived final
{
    net::Prefix prefix;
};

struct Identity final
{
    using Kind = cetl::variant<Generic, CidrDerived>;

    /// Builds an identity, and classifies it by its labels.
    ///
    /// Only label sets with the `reserved:world` label and at least one `cidr` label are CIDR derived.
    ///
    Identity(const NumericIdentity numeric_id, cidrid::labels::Labels label_set);

    /// Gets prefix of a CIDR derived identity.
    ///
    /// @return `cetl::nullopt` for generic identities.
    ///
    cetl::optional<net::Prefix> cidrPrefix() const;

    std::string toString() const;

    NumericIdentity        id;
    cidrid::labels::Labels labels;
    Kind                   kind;

};  // Identity

}  // namespace identity
}  // namespace cidrid

#endif  // CIDRID_IDENTITY_IDENTITY_HPP_INCLUDED
