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
 * @file config.hpp
 * @brief Runtime configuration for the HookSync service.
 *
 * @details
 * Configuration is resolved in three layers, later layers winning:
 * 1. **Defaults** (member initializers below).
 * 2. **Config file**: a JSON object, keys named exactly like the members.
 * 3. **Command line**: positional `DATA_PATH` and `PORT` (see `main.cpp`).
 *
 * The three policy switches cover the decisions the synchronization rules leave
 * open: what to answer for unknown event types, how deletions are materialized, and
 * whether local edits participate in the staleness comparison.
 */

#pragma once

#include "hooksync/infra/logger.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <thread>

namespace hooksync::infra {

/**
 * @class ConfigError
 * @brief Raised for unreadable files, malformed JSON, wrong value types or
 * out-of-range values.
 */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/// @brief Response policy for event types with no registered processor.
enum class UnsupportedEventPolicy {
    REJECT, ///< 4xx with a reason; the delivering system sees a failure.
    IGNORE  ///< 2xx, logged and dropped.
};

/// @brief How a Deleted event is materialized.
enum class DeletePolicy {
    SOFT, ///< Keep the record, mark it inactive (tombstone guards against late updates).
    HARD  ///< Remove the record from the store.
};

/// @brief Which timestamps form the staleness baseline.
enum class StalenessMode {
    SOURCE_ONLY,        ///< Only the source system's modification time.
    RESPECT_LOCAL_EDITS ///< max(source modification time, local-edit marker).
};

/**
 * @struct Config
 * @brief Fully resolved service settings.
 */
struct Config {
    std::string data_dir = "./hooksync_data";
    int port = 8080;
    size_t workers = std::thread::hardware_concurrency();
    std::string webhook_path = "/webhook";
    int request_timeout_ms = 5000;
    size_t max_body_bytes = 1024 * 1024;
    /// Ingest jobs queued or running at once; further webhooks get 503.
    size_t max_pending_ingests = 64;
    LogLevel log_level = LogLevel::INFO;
    bool log_color = true;
    UnsupportedEventPolicy unsupported_events = UnsupportedEventPolicy::REJECT;
    DeletePolicy delete_policy = DeletePolicy::SOFT;
    StalenessMode staleness_mode = StalenessMode::SOURCE_ONLY;

    /**
     * @brief Overlays the keys of a JSON object onto the defaults.
     *
     * Unknown keys are logged and ignored.
     *
     * @throws ConfigError On malformed JSON, a non-object root, or an invalid value.
     *
     * @code
     * auto cfg = Config::from_json(R"({"port": 9000, "delete_policy": "hard"})");
     * @endcode
     */
    static Config from_json(const std::string& text);

    /**
     * @brief Reads @p path and delegates to `from_json`.
     *
     * @throws ConfigError If the file cannot be opened, or on any `from_json` error.
     */
    static Config load_file(const std::string& path);

    /// @brief Pushes the logging settings into `Logger`.
    void apply_logging() const;

    /// @brief One-line human readable summary for the startup banner.
    std::string describe() const;
};

/// @brief Textual names used in config files and logs.
const char* to_string(UnsupportedEventPolicy policy);
const char* to_string(DeletePolicy policy);
const char* to_string(StalenessMode mode);

} // namespace hooksync::infra
