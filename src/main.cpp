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
 * 1. Argument Parsing and configuration loading.
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (Store, Ingest pipeline, Network).
 * 4. Main Event Loop Execution.
 */

#include "hooksync/infra/config.hpp"
#include "hooksync/infra/logger.hpp"
#include "hooksync/network/server.hpp"
#include "hooksync/storage/journal_store.hpp"
#include "hooksync/sync/ingestor.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/// @brief Active server instance, reached from the signal handler.
static hooksync::network::Server* g_server = nullptr;

void signal_handler(int signum)
{
    hooksync::infra::Logger::log(hooksync::infra::LogLevel::WARN,
                                 "System: Interrupt received (Signal " + std::to_string(signum) +
                                     "). Initiating graceful shutdown...");

    if (g_server) {
        g_server->stop();
    }
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--config FILE] [DATA_PATH] [PORT]\n"
              << "Options:\n"
              << "  --config FILE  JSON configuration file (keys: data_dir, port, workers,\n"
              << "                 webhook_path, request_timeout_ms, max_body_bytes,\n"
              << "                 log_level, log_color, unsupported_events,\n"
              << "                 delete_policy, staleness_mode)\n"
              << "  DATA_PATH      Directory for the record journals (Default: ./hooksync_data)\n"
              << "  PORT           TCP port to listen on (Default: 8080)\n"
              << "  --help         Show this help message\n";
}

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return 0;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // 1. Configuration: defaults, then file, then positional overrides
        hooksync::infra::Config config;
        std::vector<std::string> positional;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 >= args.size())
                    throw hooksync::infra::ConfigError("--config requires a file argument");
                config = hooksync::infra::Config::load_file(args[++i]);
            } else {
                positional.push_back(args[i]);
            }
        }
        if (positional.size() > 0)
            config.data_dir = positional[0];
        if (positional.size() > 1) {
            try {
                config.port = std::stoi(positional[1]);
            } catch (const std::exception&) {
                throw hooksync::infra::ConfigError("Invalid PORT '" + positional[1] + "'");
            }
            if (config.port <= 0 || config.port > 65535)
                throw hooksync::infra::ConfigError("PORT out of range: " + positional[1]);
        }
        config.apply_logging();

        hooksync::infra::Logger::log(hooksync::infra::LogLevel::INFO,
                                     "System: Booting HookSync webhook ingestor...");
        hooksync::infra::Logger::log(hooksync::infra::LogLevel::INFO,
                                     "Config: " + config.describe());

        // 2. Store (replays journals)
        hooksync::storage::JournalStore store(config.data_dir);

        // 3. Ingest pipeline and endpoint
        hooksync::sync::Ingestor ingestor(store, config);
        hooksync::network::Server server(ingestor, config);

        g_server = &server;

        // 4. Blocks until stop() is called via the signal handler
        server.run();
        g_server = nullptr;

    } catch (const std::exception& e) {
        g_server = nullptr;
        hooksync::infra::Logger::log(hooksync::infra::LogLevel::FATAL,
                                     "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    hooksync::infra::Logger::log(hooksync::infra::LogLevel::INFO,
                                 "System: Shutdown complete.");
    return 0;
}
