//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_PLATFORM_CONTEXT_HPP_INCLUDED
#define CIDRID_PLATFORM_CONTEXT_HPP_INCLUDED

#include <chrono>

namespace cidrid
{
namespace platform
{

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::microseconds;

/// Adds the duration to the time point, saturating at `TimePoint::max()` instead of overflowing.
///
inline TimePoint saturatingAdd(const TimePoint time_point, const Duration duration) noexcept
{
    if (duration >= std::chrono::duration_cast<Duration>(TimePoint::max() - time_point))
    {
        return TimePoint::max();
    }
    return time_point + duration;
}

/// Scopes a single call to a shared collaborator (like the identity allocator) by a deadline.
///
/// The context is a plain value; it is checked by the callee, and never cancels anything by itself.
///
class Context final
{
public:
    /// Makes a context without a deadline.
    ///
    static Context background() noexcept
    {
        return Context{TimePoint::max()};
    }

    /// Makes a context which expires after the given timeout (counting from now).
    ///
    static Context withTimeout(const Duration timeout) noexcept
    {
        return Context{saturatingAdd(Clock::now(), timeout)};
    }

    TimePoint deadline() const noexcept
    {
        return deadline_;
    }

    bool expired() const noexcept
    {
        return (deadline_ != TimePoint::max()) && (Clock::now() >= deadline_);
    }

private:
    explicit Context(const TimePoint deadline) noexcept
        : deadline_{deadline}
    {
    }

    TimePoint deadline_;

};  // Context

}  // namespace platform
}  // namespace cidrid

#endif  // CIDRID_PLATFORM_CONTEXT_HPP_INCLUDED
