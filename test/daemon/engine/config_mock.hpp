//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED
#define CIDRID_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED

#include "engine/config.hpp"

#include "cidrid/identity/identity.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <chrono>
#include <string>

namespace cidrid
{
namespace daemon
{
namespace engine
{

class ConfigMock : public Config
{
public:
    // Config

    MOCK_METHOD(void, save, (), (override));
    MOCK_METHOD(cetl::optional<std::chrono::milliseconds>, getAllocationTimeout, (), (const, override));
    MOCK_METHOD(cetl::optional<std::chrono::milliseconds>, getReleaseInterval, (), (const, override));
    MOCK_METHOD(cetl::optional<std::chrono::milliseconds>, getRestoreGracePeriod, (), (const, override));
    MOCK_METHOD(cetl::optional<identity::NumericIdentity>, getIdentityMinId, (), (const, override));
    MOCK_METHOD(cetl::optional<identity::NumericIdentity>, getIdentityMaxId, (), (const, override));
    MOCK_METHOD(MetadataLabels, getMetadataLabels, (), (const, override));
    MOCK_METHOD(RestoredPrefixes, getRestoredPrefixes, (), (const, override));
    MOCK_METHOD(void, setRestoredPrefixes, (const RestoredPrefixes& restored_prefixes), (override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFile, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingLevel, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFlushLevel, (), (const, override));

};  // ConfigMock

}  // namespace engine
}  // namespace daemon
}  // namespace cidrid

#endif  // CIDRID_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED
