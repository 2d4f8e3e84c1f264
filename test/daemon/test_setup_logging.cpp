//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "setup_logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

using detail::applyArgvFlushLevels;
using detail::applyFlushLevels;
using detail::parseLoggerLevels;

using testing::IsEmpty;
using testing::Pair;
using testing::UnorderedElementsAre;

using Level = spdlog::level::level_enum;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSetupLogging : public testing::Test
{
protected:
    void SetUp() override
    {
        const auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        for (const auto* const name : {"flush_test_a", "flush_test_b"})
        {
            auto logger = std::make_shared<spdlog::logger>(name, sink);
            spdlog::register_logger(logger);
            loggers_.push_back(std::move(logger));
        }
        default_flush_level_ = spdlog::default_logger()->flush_level();
    }

    void TearDown() override
    {
        spdlog::default_logger()->flush_on(default_flush_level_);
        for (const auto& logger : loggers_)
        {
            spdlog::drop(logger->name());
        }
    }

    // MARK: Data members:

    // NOLINTBEGIN
    std::vector<std::shared_ptr<spdlog::logger>> loggers_;
    Level                                        default_flush_level_{Level::off};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSetupLogging, parse_logger_levels)
{
    EXPECT_THAT(parseLoggerLevels(""), IsEmpty());
    EXPECT_THAT(parseLoggerLevels("warn"), UnorderedElementsAre(Pair("", Level::warn)));
    EXPECT_THAT(parseLoggerLevels(" Info , ipcache=DEBUG,engine=off"),
                UnorderedElementsAre(Pair("", Level::info), Pair("ipcache", Level::debug), Pair("engine", Level::off)));

    // Unknown level names are skipped.
    EXPECT_THAT(parseLoggerLevels("ipcache=loud,engine=trace"), UnorderedElementsAre(Pair("engine", Level::trace)));

    // Too long spec is ignored as a whole.
    EXPECT_THAT(parseLoggerLevels(std::string(1024, 'x') + ",engine=trace"), IsEmpty());
}

TEST_F(TestSetupLogging, apply_flush_levels)
{
    applyFlushLevels("err,flush_test_a=debug");

    EXPECT_THAT(spdlog::default_logger()->flush_level(), Level::err);
    EXPECT_THAT(loggers_[0]->flush_level(), Level::debug);
    EXPECT_THAT(loggers_[1]->flush_level(), Level::err);
}

TEST_F(TestSetupLogging, apply_argv_flush_levels)
{
    const char* argv[] = {"cidridd", "SPDLOG_FLUSH_LEVEL=flush_test_b=trace", "CONFIG_FILE=x.toml"};
    applyArgvFlushLevels(3, static_cast<const char**>(argv));

    EXPECT_THAT(loggers_[1]->flush_level(), Level::trace);
    EXPECT_THAT(loggers_[0]->flush_level(), spdlog::default_logger()->flush_level());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
