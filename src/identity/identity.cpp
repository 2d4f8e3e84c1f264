//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/identity/identity.hpp"

#include "cidrid/labels/labels.hpp"
#include "cidrid/net/prefix.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>

namespace cidrid
{
namespace identity
{
namespace
{

Identity::Kind classify(const labels::Labels& label_set)
{
    if (const auto prefix = labels::cidrPrefixOf(label_set))
    {
        return CidrDerived{prefix.value()};
    }
    return Generic{};
}

}  // namespace

Identity::Identity(const NumericIdentity numeric_id, cidrid::labels::Labels label_set)
    : id{numeric_id}
    , labels{std::move(label_set)}
    , kind{classify(labels)}
{
}

cetl::optional<net::Prefix> Identity::cidrPrefix() const
{
    if (const auto* const cidr = cetl::get_if<CidrDerived>(&kind))
    {
        return cidr->prefix;
    }
    return cetl::nullopt;
}

std::string Identity::toString() const
{
    return std::to_string(id) + " (" + labels.toString() + ")";
}

}  // namespace identity
}  // namespace cidrid
