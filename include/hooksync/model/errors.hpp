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
 * @file errors.hpp
 * @brief Error taxonomy of the ingestion pipeline.
 *
 * @details
 * Each stage throws exactly one family of errors, and the `Ingestor` is the only
 * place that translates them into a response:
 *
 * | Error                  | Raised by   | Retriable | Response |
 * |------------------------|-------------|-----------|----------|
 * | `MalformedPayload`     | Parser      | no        | 400      |
 * | `UnsupportedEventType` | Dispatcher  | no        | policy   |
 * | `ValidationError`      | Processors  | no        | 400      |
 * | `PersistenceConflict`  | Store       | yes       | 503      |
 * | `StorageError`         | Store       | yes       | 500      |
 *
 * A stale event is not an error; it is the `NOOP_STALE` outcome.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hooksync::model {

enum class ErrorKind {
    MALFORMED_PAYLOAD,
    UNSUPPORTED_EVENT_TYPE,
    VALIDATION_ERROR,
    PERSISTENCE_CONFLICT,
    STORAGE_ERROR
};

/// @brief Stable identifier used in logs and response bodies.
const char* to_string(ErrorKind kind);

/**
 * @class SyncError
 * @brief Base of every error the pipeline raises deliberately.
 */
class SyncError : public std::runtime_error {
  public:
    SyncError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /// @brief True if redelivering the same notification may succeed.
    bool retriable() const
    {
        return kind_ == ErrorKind::PERSISTENCE_CONFLICT || kind_ == ErrorKind::STORAGE_ERROR;
    }

  private:
    ErrorKind kind_;
};

class MalformedPayload : public SyncError {
  public:
    explicit MalformedPayload(const std::string& msg)
        : SyncError(ErrorKind::MALFORMED_PAYLOAD, msg)
    {
    }
};

class UnsupportedEventType : public SyncError {
  public:
    explicit UnsupportedEventType(const std::string& event_type)
        : SyncError(ErrorKind::UNSUPPORTED_EVENT_TYPE, "Unsupported event type: " + event_type)
    {
    }
};

class ValidationError : public SyncError {
  public:
    explicit ValidationError(const std::string& msg) : SyncError(ErrorKind::VALIDATION_ERROR, msg)
    {
    }
};

/**
 * @class PersistenceConflict
 * @brief A store-level constraint was violated: duplicate insert, or an update whose
 * revision no longer matches the stored one.
 */
class PersistenceConflict : public SyncError {
  public:
    explicit PersistenceConflict(const std::string& msg)
        : SyncError(ErrorKind::PERSISTENCE_CONFLICT, msg)
    {
    }
};

/**
 * @class StorageError
 * @brief The journal could not be written. In-memory state is unchanged.
 */
class StorageError : public SyncError {
  public:
    explicit StorageError(const std::string& msg) : SyncError(ErrorKind::STORAGE_ERROR, msg) {}
};

} // namespace hooksync::model
