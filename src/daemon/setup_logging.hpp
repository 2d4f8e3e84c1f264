//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef CIDRID_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define CIDRID_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <sys/syslog.h>
#include <unistd.h>

namespace detail
{

using LoggerLevels = std::unordered_map<std::string, spdlog::level::level_enum>;

/// Parses levels spec in the `SPDLOG_LEVEL` format, f.e. `warn,ipcache=debug,engine=off`.
///
/// An entry without a logger name applies to the default logger (and is stored under the empty name).
/// Entries with unknown level names are skipped.
///
inline LoggerLevels parseLoggerLevels(const std::string& levels_spec)
{
    constexpr std::size_t max_spec_len = 512;

    LoggerLevels result;
    if (levels_spec.size() > max_spec_len)
    {
        return result;
    }

    std::istringstream spec_stream{levels_spec};
    std::string        entry;
    while (std::getline(spec_stream, entry, ','))
    {
        entry.erase(std::remove_if(entry.begin(), entry.end(), [](const unsigned char ch) { return std::isspace(ch); }),
                    entry.end());

        const auto  eq_pos      = entry.find('=');
        std::string logger_name = (eq_pos == std::string::npos) ? std::string{} : entry.substr(0, eq_pos);
        std::string level_name  = (eq_pos == std::string::npos) ? entry : entry.substr(eq_pos + 1);
        std::transform(level_name.begin(), level_name.end(), level_name.begin(), [](const unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });

        const auto level = spdlog::level::from_str(level_name);
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            continue;
        }
        result[logger_name] = level;
    }
    return result;
}

/// Applies flush levels to all registered loggers.
///
/// Loggers not named in the spec flush at the default logger's level.
///
inline void applyFlushLevels(const std::string& flush_levels_spec)
{
    const auto levels = parseLoggerLevels(flush_levels_spec);
    if (levels.empty())
    {
        return;
    }

    const auto default_level = levels.find(std::string{});
    if (default_level != levels.end())
    {
        spdlog::default_logger()->flush_on(default_level->second);
    }

    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&levels, default_flush_level](const std::shared_ptr<spdlog::logger>& logger) {
        //
        if (logger->name().empty())
        {
            return;
        }
        const auto named_level = levels.find(logger->name());
        logger->flush_on((named_level != levels.end()) ? named_level->second : default_flush_level);
    });
}

/// Applies the last `SPDLOG_FLUSH_LEVEL=...` argument, if any.
///
inline void applyArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string arg_prefix = "SPDLOG_FLUSH_LEVEL=";

    cetl::optional<std::string> flush_levels_spec;
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, arg_prefix.size(), arg_prefix))
        {
            flush_levels_spec = arg_str.substr(arg_prefix.size());
        }
    }
    if (flush_levels_spec)
    {
        applyFlushLevels(flush_levels_spec.value());
    }
}

}  // namespace detail

inline bool writeString(const int fd, const char* const str)
{
    const auto str_len = strlen(str);
    return str_len == ::write(fd, str, str_len);
}

/// Sets up the logging system.
///
/// Both syslog and file logging sinks are used.
/// The syslog sink is used for the default logger only (with Info default level),
/// while the file sink is used for all loggers (with Debug default level).
/// Sinks are thread-safe - the deferred release worker logs concurrently with the main thread.
///
inline void setupLogging(const int                                  err_fd,
                         const int                                  argc,
                         const char** const                         argv,
                         const cidrid::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::syslog_sink_mt;
    using spdlog::sinks::rotating_file_sink_mt;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        const std::string log_prefix    = "cidridd";
        auto              log_file_path = "./" + log_prefix + ".log";
        if (const auto logging_file = config->getLoggingFile())
        {
            log_file_path = logging_file.value();
        }

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_mt>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P:%t] [%n] [%l] %v");

        const auto syslog_sink = std::make_shared<syslog_sink_mt>(log_prefix, LOG_PID, LOG_USER, true);
        syslog_sink->set_pattern("[%l] '%n' | %v");

        // The default logger goes to all sinks.
        //
        const std::initializer_list<spdlog::sink_ptr> sinks{syslog_sink, file_sink};
        const auto                                    default_logger = std::make_shared<spdlog::logger>("", sinks);
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers - they go to the file sink only.
        //
        register_logger(std::make_shared<spdlog::logger>("ipcache", file_sink));
        register_logger(std::make_shared<spdlog::logger>("identity", file_sink));
        register_logger(std::make_shared<spdlog::logger>("engine", file_sink));

        // Setup log levels from the configuration file.
        // Also accept `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments if any (like `SPDLOG_LEVEL=debug,ipcache=trace`).
        //
        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::applyFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::applyArgvFlushLevels(argc, argv);

        // Insert "--...--" just to have clearer separation in the log file between two different process runs.
        //
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            // It goes directly to the file sink to avoid logging into syslog.
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        writeString(err_fd, "Failed to setup logging: ");
        writeString(err_fd, ex.what());
        ::exit(EXIT_FAILURE);
    }
}

#endif  // CIDRID_DAEMON_SETUP_LOGGING_HPP_INCLUDED
