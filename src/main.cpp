/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Configuration (environment, then flags).
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (Store, Gateway, Dispatcher).
 * 4. Message Loop Execution on stdin/stdout.
 *
 * Exit status is 0 on a clean shutdown, 1 on a runtime failure and 2 on invalid
 * configuration.
 */

#include "docgate/config/settings.hpp"
#include "docgate/error.hpp"
#include "docgate/gateway/gateway.hpp"
#include "docgate/infra/logger.hpp"
#include "docgate/network/dispatcher.hpp"
#include "docgate/network/stdio_server.hpp"
#include "docgate/store/memory_store.hpp"
#include "docgate/version.hpp"

#include <csignal>
#include <signal.h>
#include <iostream>
#include <string>

/// @brief Active server instance, reached from the signal handler.
static docgate::network::StdioServer* g_server = nullptr;

/**
 * @brief System Signal Handler.
 *
 * Only flips the server's atomic flag. The handler is installed without `SA_RESTART`, so
 * a blocked read returns and the loop observes the flag.
 */
extern "C" void signal_handler(int /*signum*/)
{
    if (g_server) {
        g_server->stop();
    }
}

static void install_signal_handlers()
{
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int main(int argc, char* argv[])
{
    using docgate::infra::Logger;
    using docgate::infra::LogLevel;

    // 1. Configuration
    docgate::config::Settings settings;
    try {
        settings = docgate::config::Settings::load(
            argc, argv, docgate::config::Settings::process_environment());
    } catch (const docgate::ConfigurationError& e) {
        Logger::log(LogLevel::FATAL, "Config: " + std::string(e.what()));
        std::cerr << docgate::config::Settings::usage(argv[0]);
        return 2;
    }

    if (settings.show_help) {
        std::cerr << docgate::config::Settings::usage(argv[0]);
        return 0;
    }

    Logger::set_level(settings.log_level);

    // 2. Signals
    install_signal_handlers();

    try {
        const auto& policy = settings.policy;
        Logger::log(LogLevel::INFO, "System: Booting docgate v" DOCGATE_VERSION "...");
        Logger::log(LogLevel::INFO,
                    std::string("Config: Dangerous mode ") +
                        (policy.dangerous_mode ? "ENABLED" : "disabled"));
        Logger::log(LogLevel::INFO,
                    "Config: Limits documents=" + std::to_string(policy.max_document_count) +
                        " stages=" + std::to_string(policy.max_pipeline_stages) +
                        " string=" + std::to_string(policy.max_string_length) +
                        " depth=" + std::to_string(policy.max_depth) +
                        " default_limit=" + std::to_string(policy.default_limit));

        // 3. Subsystems
        docgate::store::MemoryStore store(policy.timeout);
        docgate::gateway::Gateway gateway(store, policy);
        docgate::network::Dispatcher dispatcher(gateway);
        docgate::network::StdioServer server(dispatcher, std::cin, std::cout);

        g_server = &server;

        // 4. Blocking loop; returns on EOF, `shutdown` or a signal.
        server.run();
        g_server = nullptr;

    } catch (const std::exception& e) {
        g_server = nullptr;
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
