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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for HookSync.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * webhook ingestion service. Every pipeline stage (parser, dispatcher, processors,
 * store, endpoint) reports through it, so that a notification can be traced by its
 * `eventType` and source identifier across stages without interleaved output.
 */

#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace hooksync::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-field merge details and lock acquisition.
    DEBUG, ///< Pipeline stage transitions (parsed, classified, resolved).
    INFO,  ///< Nominal events (startup, accepted notifications, stale no-ops).
    WARN,  ///< Rejected or ignored notifications, configuration fallbacks.
    ERROR, ///< Persistence failures surfaced to the delivering system.
    FATAL  ///< Unrecoverable startup failures.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * All state is process-wide and guarded by one mutex. Messages below the configured
 * threshold are discarded before the lock is taken.
 *
 * **Stream Routing Logic:**
 * - Without a sink: `TRACE`..`INFO` go to `std::cout`, `WARN`..`FATAL` to `std::cerr`.
 * - With a sink installed via `set_sink()`: every level goes to the sink, uncolored.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * hooksync::infra::Logger::log(LogLevel::INFO, "Store: Journal replay complete.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that is emitted. Defaults to `INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently configured threshold.
    static LogLevel level();

    /// @brief Enables or disables ANSI color sequences on console output.
    static void set_color(bool enabled);

    /**
     * @brief Redirects all output to @p sink. Pass `nullptr` to restore console routing.
     *
     * @warning The stream must outlive every subsequent `log()` call, or be reset first.
     */
    static void set_sink(std::ostream* sink);

    /**
     * @brief Resolves a textual level name (`"trace"`, `"debug"`, `"info"`, `"warn"`,
     * `"error"`, `"fatal"`, case-insensitive).
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Serializes stream access and guards the settings below.
    static std::mutex mutex_;

    static LogLevel threshold_;
    static bool color_;
    static std::ostream* sink_;
};

} // namespace hooksync::infra
