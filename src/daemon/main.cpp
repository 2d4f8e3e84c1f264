//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <signal.h>  // NOLINT
#include <sstream>
#include <string>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGTERM:
    case SIGINT:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

cidrid::daemon::engine::Config::Ptr loadConfig(const int err_fd, const int argc, const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    std::string cfg_file_path = "./cidridd.toml";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            cfg_file_path = arg_str.substr(config_file_prefix.size());
        }
    }

    try
    {
        return cidrid::daemon::engine::Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::stringstream ss;
        ss << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what() << "\n";
        writeString(err_fd, ss.str().c_str());
    }
    ::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    // Runs in the foreground - failures are reported to the standard error output.
    constexpr int err_fd = 2;

    setupSignalHandlers();

    const auto config = loadConfig(err_fd, argc, argv);
    setupLogging(err_fd, argc, argv, config);

    spdlog::info("cidridd started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    {
        try
        {
            cidrid::daemon::engine::Engine engine{config};
            if (const auto failure_str = engine.init())
            {
                spdlog::critical("Failed to init engine: {}", failure_str.value());

                writeString(err_fd, "Failed to init engine: ");
                writeString(err_fd, failure_str.value().c_str());
                ::exit(EXIT_FAILURE);
            }

            engine.runWhile([] { return g_running == 1; });

            engine.shutdown();
            config->save();

        } catch (const std::exception& ex)
        {
            spdlog::critical("Unhandled exception: {}", ex.what());
            result = EXIT_FAILURE;
        }

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }
    }
    spdlog::info("cidridd terminated.");

    return result;
}
