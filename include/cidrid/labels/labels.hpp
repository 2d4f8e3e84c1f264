//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_LABELS_LABELS_HPP_INCLUDED
#define CIDRID_LABELS_LABELS_HPP_INCLUDED

#include "cidrid/net/prefix.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cidrid
{
namespace labels
{

/// Well-known label sources.
///
struct LabelSource
{
    static constexpr const char* Unspec   = "unspec";
    static constexpr const char* Any      = "any";
    static constexpr const char* Cidr     = "cidr";
    static constexpr const char* Reserved = "reserved";
    static constexpr const char* K8s      = "k8s";

};  // LabelSource

struct Label final
{
    std::string key;
    std::string value;
    std::string source;

    /// Parses `source:key=value` text.
    ///
    /// Both `source:` and `=value` parts are optional; missing source is `unspec`.
    ///
    static Label parse(const std::string& str);

    /// Formats as `source:key=value`, or as `source:key` if value is empty.
    ///
    std::string toString() const;

    friend bool operator==(const Label& lhs, const Label& rhs)
    {
        return (lhs.key == rhs.key) && (lhs.value == rhs.value) && (lhs.source == rhs.source);
    }
    friend bool operator!=(const Label& lhs, const Label& rhs)
    {
        return !(lhs == rhs);
    }

};  // Label

/// The `reserved:world` label - carried by every identity which represents traffic outside the cluster.
///
Label worldLabel();

/// A set of labels indexed by label key.
///
/// Iteration order (and so `toString`) depends on the keys only, so identical inputs
/// always give identical string forms regardless of insertion order.
///
class Labels final
{
public:
    using Map = std::map<std::string, Label>;

    Labels() = default;

    static Labels fromStrings(const std::vector<std::string>& strs);

    void add(const Label& label)
    {
        map_[label.key] = label;
    }

    /// Merges all labels of the `other` set into this one; labels with the same key are overwritten.
    ///
    void merge(const Labels& other);

    bool has(const Label& label) const;

    bool empty() const noexcept
    {
        return map_.empty();
    }

    std::size_t size() const noexcept
    {
        return map_.size();
    }

    const Map& map() const noexcept
    {
        return map_;
    }

    /// Sorted, `;` separated list of all labels (e.g. `cidr:10.0.0.0/8;reserved:world`).
    ///
    std::string toString() const;

    friend bool operator==(const Labels& lhs, const Labels& rhs)
    {
        return lhs.map_ == rhs.map_;
    }
    friend bool operator!=(const Labels& lhs, const Labels& rhs)
    {
        return !(lhs == rhs);
    }

private:
    Map map_;

};  // Labels

/// Derives the canonical label set of a CIDR prefix.
///
/// The set contains one `cidr` label for the prefix itself and for each of its parent
/// prefixes (down to `/0`), plus the `reserved:world` label.
///
Labels getCidrLabels(const net::Prefix& prefix);

/// Makes the `cidr` source label of exactly the given prefix.
///
Label makeCidrLabel(const net::Prefix& prefix);

/// Recovers the prefix which the CIDR label set was derived from.
///
/// @return The prefix of the longest `cidr` label, if the set also has the `reserved:world` label;
///         `cetl::nullopt` otherwise (not a CIDR label set).
///
cetl::optional<net::Prefix> cidrPrefixOf(const Labels& labels);

}  // namespace labels
}  // namespace cidrid

#endif  // CIDRID_LABELS_LABELS_HPP_INCLUDED
