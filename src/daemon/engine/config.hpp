//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define CIDRID_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include "cidrid/identity/identity.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cidrid
{
namespace daemon
{
namespace engine
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// IP address to its label strings (like `k8s:app=web`).
    using MetadataLabels = std::map<std::string, std::vector<std::string>>;

    /// Prefix to the numeric identity which it had before the restart.
    using RestoredPrefixes = std::map<std::string, identity::NumericIdentity>;

    /// Loads configuration from the given TOML file.
    ///
    /// Throws if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    virtual void save() = 0;

    CETL_NODISCARD virtual auto getAllocationTimeout() const -> cetl::optional<std::chrono::milliseconds>  = 0;
    CETL_NODISCARD virtual auto getReleaseInterval() const -> cetl::optional<std::chrono::milliseconds>    = 0;
    CETL_NODISCARD virtual auto getRestoreGracePeriod() const -> cetl::optional<std::chrono::milliseconds> = 0;
    CETL_NODISCARD virtual auto getIdentityMinId() const -> cetl::optional<identity::NumericIdentity>      = 0;
    CETL_NODISCARD virtual auto getIdentityMaxId() const -> cetl::optional<identity::NumericIdentity>      = 0;
    CETL_NODISCARD virtual auto getMetadataLabels() const -> MetadataLabels                                = 0;
    CETL_NODISCARD virtual auto getRestoredPrefixes() const -> RestoredPrefixes                            = 0;
    virtual void                setRestoredPrefixes(const RestoredPrefixes& restored_prefixes)             = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>                      = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>                     = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string>                = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace cidrid

#endif  // CIDRID_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
