//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/labels/labels.hpp"

#include "cidrid/net/prefix.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace cidrid
{
namespace labels
{
namespace
{

constexpr const char* WorldKey = "world";

// IPv6 addresses contain `:`, which is the source separator of the label string form.
//
std::string prefixToLabelKey(const net::Prefix& prefix)
{
    auto key = prefix.toString();
    std::replace(key.begin(), key.end(), ':', '-');
    return key;
}

std::string labelKeyToPrefixString(std::string key)
{
    std::replace(key.begin(), key.end(), '-', ':');
    return key;
}

}  // namespace

// MARK: - Label

Label Label::parse(const std::string& str)
{
    Label label{{}, {}, LabelSource::Unspec};

    std::string rest = str;

    // The source is everything before the first `:`, unless it is a part of the value.
    const auto colon_pos = rest.find(':');
    const auto eq_pos    = rest.find('=');
    if ((colon_pos != std::string::npos) && ((eq_pos == std::string::npos) || (colon_pos < eq_pos)))
    {
        label.source = rest.substr(0, colon_pos);
        rest         = rest.substr(colon_pos + 1);
    }

    const auto value_pos = rest.find('=');
    if (value_pos == std::string::npos)
    {
        label.key = rest;
    }
    else
    {
        label.key   = rest.substr(0, value_pos);
        label.value = rest.substr(value_pos + 1);
    }
    return label;
}

std::string Label::toString() const
{
    std::string result = source + ":" + key;
    if (!value.empty())
    {
        result += "=" + value;
    }
    return result;
}

Label worldLabel()
{
    return Label{WorldKey, {}, LabelSource::Reserved};
}

// MARK: - Labels

Labels Labels::fromStrings(const std::vector<std::string>& strs)
{
    Labels labels;
    for (const auto& str : strs)
    {
        labels.add(Label::parse(str));
    }
    return labels;
}

void Labels::merge(const Labels& other)
{
    for (const auto& key_label : other.map_)
    {
        map_[key_label.first] = key_label.second;
    }
}

bool Labels::has(const Label& label) const
{
    const auto it = map_.find(label.key);
    return (it != map_.end()) && (it->second == label);
}

std::string Labels::toString() const
{
    std::string result;
    for (const auto& key_label : map_)
    {
        if (!result.empty())
        {
            result += ';';
        }
        result += key_label.second.toString();
    }
    return result;
}

// MARK: - CIDR labels

Label makeCidrLabel(const net::Prefix& prefix)
{
    return Label{prefixToLabelKey(prefix), {}, LabelSource::Cidr};
}

Labels getCidrLabels(const net::Prefix& prefix)
{
    Labels labels;

    // Every parent network is included as well, so that a policy selecting `10.0.0.0/8`
    // also matches identity of `10.1.2.0/24`.
    //
    for (int length = prefix.length(); length >= 0; --length)
    {
        labels.add(makeCidrLabel(prefix.withLength(static_cast<std::uint8_t>(length))));
    }
    labels.add(worldLabel());
    return labels;
}

cetl::optional<net::Prefix> cidrPrefixOf(const Labels& labels)
{
    if (!labels.has(worldLabel()))
    {
        return cetl::nullopt;
    }

    cetl::optional<net::Prefix> longest;
    for (const auto& key_label : labels.map())
    {
        const auto& label = key_label.second;
        if (label.source != LabelSource::Cidr)
        {
            continue;
        }

        auto maybe_prefix = net::Prefix::parse(labelKeyToPrefixString(label.key));
        if (const auto* const prefix = cetl::get_if<net::Prefix>(&maybe_prefix))
        {
            if (!longest || (prefix->length() > longest->length()))
            {
                longest = *prefix;
            }
        }
    }
    return longest;
}

}  // namespace labels
}  // namespace cidrid
