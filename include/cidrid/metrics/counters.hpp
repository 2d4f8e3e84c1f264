//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_METRICS_COUNTERS_HPP_INCLUDED
#define CIDRID_METRICS_COUNTERS_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace cidrid
{
namespace metrics
{

/// Well-known label values of the IP cache error counter.
///
struct IpCacheError
{
    static constexpr const char* TypeRecover     = "recover";
    static constexpr const char* ErrorUnexpected = "unexpected";

};  // IpCacheError

/// Abstract interface of the operational counters.
///
/// Counters are for visibility only - nothing in the library depends on their values.
///
class Counters
{
public:
    using Ptr = std::shared_ptr<Counters>;

    /// Makes thread-safe in-memory implementation of the counters.
    ///
    CETL_NODISCARD static Ptr make();

    Counters(const Counters&)                = delete;
    Counters(Counters&&) noexcept            = delete;
    Counters& operator=(const Counters&)     = delete;
    Counters& operator=(Counters&&) noexcept = delete;

    virtual ~Counters() = default;

    virtual void incIpCacheErrors(const std::string& type, const std::string& error) = 0;
    virtual void addReleasedPrefixes(const std::string& reason, const std::size_t count) = 0;

    CETL_NODISCARD virtual std::uint64_t ipCacheErrors(const std::string& type, const std::string& error) const = 0;
    CETL_NODISCARD virtual std::uint64_t releasedPrefixes(const std::string& reason) const = 0;

protected:
    Counters() = default;

};  // Counters

}  // namespace metrics
}  // namespace cidrid

#endif  // CIDRID_METRICS_COUNTERS_HPP_INCLUDED
