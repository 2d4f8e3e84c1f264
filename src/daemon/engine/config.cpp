//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "cidrid/identity/identity.hpp"
#include "cidrid/platform/context.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <ios>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cidrid
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
        , is_dirty_{false}
    {
    }

    // Config

    void save() override
    {
        if (is_dirty_)
        {
            try
            {
                root_["__meta__"]["last_modified"] = std::chrono::system_clock::now();

                const auto    cfg_str = format(root_);
                std::ofstream file{file_path_, std::ios_base::out | std::ios_base::binary};
                file << cfg_str;

                is_dirty_ = false;

            } catch (const std::exception& ex)
            {
                spdlog::error("Failed to save config (path='{}'). Error: {}", file_path_, ex.what());
            }
        }
    }

    auto getAllocationTimeout() const -> cetl::optional<std::chrono::milliseconds> override
    {
        return findMillisecondsImpl("ipcache", "allocation_timeout_ms");
    }

    auto getReleaseInterval() const -> cetl::optional<std::chrono::milliseconds> override
    {
        return findMillisecondsImpl("ipcache", "release_interval_ms");
    }

    auto getRestoreGracePeriod() const -> cetl::optional<std::chrono::milliseconds> override
    {
        return findMillisecondsImpl("ipcache", "restore_grace_period_ms");
    }

    auto getIdentityMinId() const -> cetl::optional<identity::NumericIdentity> override
    {
        return findImpl<identity::NumericIdentity>("identity", "min_id");
    }

    auto getIdentityMaxId() const -> cetl::optional<identity::NumericIdentity> override
    {
        return findImpl<identity::NumericIdentity>("identity", "max_id");
    }

    auto getMetadataLabels() const -> MetadataLabels override
    {
        return find_or(root_, "metadata", "labels", MetadataLabels{});
    }

    auto getRestoredPrefixes() const -> RestoredPrefixes override
    {
        return find_or(root_, "ipcache", "restored", RestoredPrefixes{});
    }

    void setRestoredPrefixes(const RestoredPrefixes& restored_prefixes) override
    {
        auto& toml_restored = root_["ipcache"]["restored"];
        toml_restored       = TomlValue::table_type{};
        for (const auto& prefix_and_id : restored_prefixes)
        {
            toml_restored[prefix_and_id.first] = static_cast<std::int64_t>(prefix_and_id.second);
        }
        is_dirty_ = true;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    template <typename... Keys>
    cetl::optional<std::chrono::milliseconds> findMillisecondsImpl(Keys&&... keys) const
    {
        // Durations are used at microsecond resolution.
        constexpr auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(platform::Duration::max());

        if (const auto ms = findImpl<std::int64_t>(std::forward<Keys>(keys)...))
        {
            if ((ms.value() >= 0) && (ms.value() <= max_ms.count()))
            {
                return std::chrono::milliseconds{ms.value()};
            }
            spdlog::warn("Ignoring out of range duration in config (value={}ms).", ms.value());
        }
        return cetl::nullopt;
    }

    std::string file_path_;
    TomlValue   root_;
    bool        is_dirty_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace cidrid
