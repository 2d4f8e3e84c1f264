//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cidrid/net/prefix.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace cidrid
{
namespace net
{
namespace
{

constexpr std::size_t BitsPerByte = 8;

bool parseLength(const std::string& str, const std::uint8_t max_length, std::uint8_t& out_length)
{
    // Only plain decimal digits; no sign, no spaces, no leading `0x`.
    if (str.empty() || (str.size() > 3) || !std::all_of(str.begin(), str.end(), [](const char ch) {
            return (ch >= '0') && (ch <= '9');
        }))
    {
        return false;
    }

    const auto length = std::strtoul(str.c_str(), nullptr, 10);  // NOLINT(*-magic-numbers)
    if (length > max_length)
    {
        return false;
    }
    out_length = static_cast<std::uint8_t>(length);
    return true;
}

}  // namespace

// MARK: - IpAddress

IpAddress::IpAddress() noexcept
    : family_{Family::V4}
    , bytes_{}
{
}

IpAddress::IpAddress(const Family family, const Bytes& bytes) noexcept
    : family_{family}
    , bytes_{bytes}
{
}

IpAddress::ParseResult::Var IpAddress::parse(const std::string& str)
{
    Bytes bytes{};

    // Try IPv4 first - only then IPv6 (which also covers mapped forms like `::ffff:1.2.3.4`).
    //
    if (::inet_pton(AF_INET, str.c_str(), bytes.data()) == 1)
    {
        return IpAddress{Family::V4, bytes};
    }
    if (::inet_pton(AF_INET6, str.c_str(), bytes.data()) == 1)
    {
        return IpAddress{Family::V6, bytes};
    }
    return EINVAL;
}

IpAddress IpAddress::masked(const std::uint8_t length) const noexcept
{
    CETL_DEBUG_ASSERT(length <= bitLength(), "");

    Bytes             out_bytes{};
    const std::size_t full_bytes = length / BitsPerByte;
    const std::size_t rem_bits   = length % BitsPerByte;
    std::copy_n(bytes_.begin(), full_bytes, out_bytes.begin());
    if (rem_bits > 0)
    {
        const auto mask       = static_cast<std::uint8_t>(0xFFU << (BitsPerByte - rem_bits));  // NOLINT
        out_bytes[full_bytes] = static_cast<std::uint8_t>(bytes_[full_bytes] & mask);
    }
    return IpAddress{family_, out_bytes};
}

std::string IpAddress::toString() const
{
    std::array<char, INET6_ADDRSTRLEN> buffer{};

    const int af = isV4() ? AF_INET : AF_INET6;
    if (::inet_ntop(af, bytes_.data(), buffer.data(), static_cast<socklen_t>(buffer.size())) == nullptr)
    {
        return {};
    }
    return buffer.data();
}

// MARK: - Prefix

Prefix::Prefix(const IpAddress& address, const std::uint8_t length) noexcept
    : address_{address.masked(length)}
    , length_{length}
{
}

Prefix::ParseResult::Var Prefix::parse(const std::string& str)
{
    const auto slash_pos = str.find('/');
    if (slash_pos == std::string::npos)
    {
        return EINVAL;
    }

    const auto maybe_address = IpAddress::parse(str.substr(0, slash_pos));
    const auto* const address = cetl::get_if<IpAddress>(&maybe_address);
    if (address == nullptr)
    {
        return cetl::get<IpAddress::ParseResult::Failure>(maybe_address);
    }

    std::uint8_t length = 0;
    if (!parseLength(str.substr(slash_pos + 1), address->bitLength(), length))
    {
        return EINVAL;
    }

    return Prefix{*address, length};
}

Prefix Prefix::fromAddress(const IpAddress& address) noexcept
{
    return Prefix{address, address.bitLength()};
}

Prefix Prefix::withLength(const std::uint8_t length) const noexcept
{
    CETL_DEBUG_ASSERT(length <= length_, "");

    return Prefix{address_, std::min(length, length_)};
}

std::string Prefix::toString() const
{
    return address_.toString() + "/" + std::to_string(length_);
}

}  // namespace net
}  // namespace cidrid
