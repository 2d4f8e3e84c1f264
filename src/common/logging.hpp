//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_COMMON_LOGGING_HPP_INCLUDED
#define CIDRID_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include "cidrid/identity/identity.hpp"
#include "cidrid/net/prefix.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cidrid
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets (or lazily creates) the named subsystem logger.
///
/// A logger which is not registered yet (f.e. by the daemon's logging setup) is cloned
/// from the default one, so it shares the default sinks. Registration applies the levels
/// which were loaded into the registry (like `SPDLOG_LEVEL=ipcache=trace`).
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    performWithoutThrowing([&logger] {
        //
        spdlog::initialize_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace cidrid

template <>
struct fmt::formatter<cidrid::net::Prefix> : formatter<string_view>
{
    auto format(const cidrid::net::Prefix& prefix, format_context& ctx) const
    {
        const auto str = prefix.toString();
        return formatter<string_view>::format(string_view{str.data(), str.size()}, ctx);
    }
};

template <>
struct fmt::formatter<cidrid::identity::Identity> : formatter<string_view>
{
    auto format(const cidrid::identity::Identity& identity, format_context& ctx) const
    {
        const auto str = identity.toString();
        return formatter<string_view>::format(string_view{str.data(), str.size()}, ctx);
    }
};

#endif  // CIDRID_COMMON_LOGGING_HPP_INCLUDED
