//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_GTEST_PRINTER_HPP_INCLUDED
#define CIDRID_GTEST_PRINTER_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace cidrid
{

class GtestPrinter final : public testing::EmptyTestEventListener
{
public:
    /// Sets up the logging system of a test executable.
    ///
    /// All loggers write into the `<log_prefix>.log` file (with Trace default level), including
    /// the component loggers, which are registered upfront so that `SPDLOG_LEVEL=ipcache=debug`
    /// like arguments apply to them. The sink is thread-safe since the release worker logs too.
    ///
    static void setupLogging(const int argc, char** const argv, const std::string& log_prefix)
    {
        try
        {
            spdlog::drop_all();

            const auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_prefix + ".log", true);
            file_sink->set_pattern("[%H:%M:%S.%e] [%t] [%n] [%l] %v");

            const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
            register_logger(default_logger);
            set_default_logger(default_logger);
            for (const auto* const name : {"ipcache", "identity", "engine"})
            {
                register_logger(std::make_shared<spdlog::logger>(name, file_sink));
            }

            spdlog::set_level(spdlog::level::trace);
            spdlog::cfg::load_argv_levels(argc, argv);

        } catch (const std::exception& ex)
        {
            std::cerr << "Failed to setup logging: " << ex.what() << '\n';
            std::exit(EXIT_FAILURE);
        }
    }

private:
    // Fired before the test suite starts.
    void OnTestSuiteStart(const testing::TestSuite& test_suite) override
    {
        spdlog::info("====================> TEST_SUITE {}", test_suite.name());
    }

    // Called before a test starts.
    void OnTestStart(const testing::TestInfo& test_info) override
    {
        spdlog::info("--------------------------> TEST {}.{} 🔵…", test_info.test_suite_name(), test_info.name());
    }

    // Called after a failed assertion or a SUCCESS().
    void OnTestPartResult(const testing::TestPartResult& test_part_result) override
    {
        if (test_part_result.failed())
        {
            spdlog::error("TEST Failure in {}:{} ❌\n{}",
                          test_part_result.file_name(),
                          test_part_result.line_number(),
                          test_part_result.summary());
        }
        else
        {
            spdlog::debug("TEST Success in {}:{}\n{}",
                          test_part_result.file_name(),
                          test_part_result.line_number(),
                          test_part_result.summary());
        }
    }

    // Called after a test ends.
    void OnTestEnd(const testing::TestInfo& test_info) override
    {
        const auto* const result = test_info.result();
        spdlog::info("<-------------------------- TEST {}.{} {} ({}ms).",
                     test_info.test_suite_name(),
                     test_info.name(),
                     result->Failed() ? "❌" : "🏁",
                     result->elapsed_time());

        // Worker threads of the test may still have buffered records.
        spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
    }

    // Fired after the test suite ends.
    void OnTestSuiteEnd(const testing::TestSuite& test_suite) override
    {
        spdlog::info("<==================== TEST_SUITE {}", test_suite.name());
        spdlog::info("");
    }

    void OnTestProgramEnd(const testing::UnitTest&) override
    {
        spdlog::info("🏁.\n");
    }

};  // GtestPrinter

}  // namespace cidrid

#endif  // CIDRID_GTEST_PRINTER_HPP_INCLUDED
