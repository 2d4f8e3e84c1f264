//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_NET_PREFIX_HPP_INCLUDED
#define CIDRID_NET_PREFIX_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace cidrid
{
namespace net
{

/// Binary form of an IPv4 or IPv6 address (network byte order).
///
class IpAddress final
{
public:
    using Bytes = std::array<std::uint8_t, 16>;  // NOLINT(*-magic-numbers)

    enum class Family : std::uint8_t
    {
        V4,
        V6,
    };

    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = IpAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const std::string& str);

    IpAddress() noexcept;

    Family family() const noexcept
    {
        return family_;
    }

    bool isV4() const noexcept
    {
        return family_ == Family::V4;
    }

    /// Number of address bits - 32 for IPv4, 128 for IPv6.
    ///
    std::uint8_t bitLength() const noexcept
    {
        return isV4() ? 32 : 128;  // NOLINT(*-magic-numbers)
    }

    /// Raw bytes; only the first 4 are in use for IPv4.
    ///
    const Bytes& bytes() const noexcept
    {
        return bytes_;
    }

    /// Returns copy of this address with all bits beyond the given length cleared.
    ///
    IpAddress masked(const std::uint8_t length) const noexcept;

    std::string toString() const;

    friend bool operator==(const IpAddress& lhs, const IpAddress& rhs) noexcept
    {
        return (lhs.family_ == rhs.family_) && (lhs.bytes_ == rhs.bytes_);
    }
    friend bool operator!=(const IpAddress& lhs, const IpAddress& rhs) noexcept
    {
        return !(lhs == rhs);
    }
    friend bool operator<(const IpAddress& lhs, const IpAddress& rhs) noexcept
    {
        if (lhs.family_ != rhs.family_)
        {
            return lhs.family_ < rhs.family_;
        }
        return lhs.bytes_ < rhs.bytes_;
    }

private:
    IpAddress(const Family family, const Bytes& bytes) noexcept;

    Family family_;
    Bytes  bytes_;

};  // IpAddress

/// An IP network - address with all host bits cleared, plus the prefix length.
///
/// Prefix is immutable value type. Its canonical string form (`Prefix::toString`)
/// is the key of the IP cache, of CIDR labels, and of the pending release queue.
///
class Prefix final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = Prefix;
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Parses `address/length` text; host bits (if any) are cleared.
    ///
    /// Bare addresses (without `/length`) are rejected with `EINVAL`.
    ///
    static ParseResult::Var parse(const std::string& str);

    /// Makes a host-length network (`/32` for IPv4, `/128` for IPv6) of the given address.
    ///
    static Prefix fromAddress(const IpAddress& address) noexcept;

    const IpAddress& address() const noexcept
    {
        return address_;
    }

    std::uint8_t length() const noexcept
    {
        return length_;
    }

    bool isV4() const noexcept
    {
        return address_.isV4();
    }

    bool isHost() const noexcept
    {
        return length_ == address_.bitLength();
    }

    /// Makes the parent network of the given (shorter or equal) length.
    ///
    Prefix withLength(const std::uint8_t length) const noexcept;

    std::string toString() const;

    friend bool operator==(const Prefix& lhs, const Prefix& rhs) noexcept
    {
        return (lhs.length_ == rhs.length_) && (lhs.address_ == rhs.address_);
    }
    friend bool operator!=(const Prefix& lhs, const Prefix& rhs) noexcept
    {
        return !(lhs == rhs);
    }
    friend bool operator<(const Prefix& lhs, const Prefix& rhs) noexcept
    {
        if (lhs.address_ != rhs.address_)
        {
            return lhs.address_ < rhs.address_;
        }
        return lhs.length_ < rhs.length_;
    }

private:
    Prefix(const IpAddress& address, const std::uint8_t length) noexcept;

    IpAddress    address_;
    std::uint8_t length_;

};  // Prefix

}  // namespace net
}  // namespace cidrid

namespace std
{

template <>
struct hash<cidrid::net::Prefix>
{
    std::size_t operator()(const cidrid::net::Prefix& prefix) const noexcept
    {
        std::size_t seed = prefix.length();
        for (const auto byte : prefix.address().bytes())
        {
            seed = (seed * 131U) ^ byte;  // NOLINT(*-magic-numbers)
        }
        return seed;
    }
};

}  // namespace std

#endif  // CIDRID_NET_PREFIX_HPP_INCLUDED
