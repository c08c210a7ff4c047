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
 * @file ingestor.hpp
 * @brief The ingest pipeline: parse, classify, process, respond.
 *
 * @details
 * This header declares the `Ingestor`, the application-layer gateway between the
 * HTTP endpoint and the synchronization core. It owns the routing table and the
 * reconciler, and converts every outcome (including failures) into an
 * `IngestResponse` the endpoint can serialize.
 */

#pragma once

#include "hooksync/infra/config.hpp"
#include "hooksync/storage/record_store.hpp"
#include "hooksync/sync/dispatcher.hpp"
#include "hooksync/sync/reconciler.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace hooksync::sync {

enum class IngestStatus {
    ACCEPTED, ///< Applied, or deliberately ignored.
    REJECTED, ///< The notification itself is unacceptable; redelivery will not help.
    FAILED    ///< Internal or persistence failure; the source should retry.
};

const char* to_string(IngestStatus status);

/**
 * @struct IngestResponse
 * @brief Outcome of one inbound call.
 *
 * **Serialized Forms:**
 * - `{"status":"accepted","outcome":"merged","eventType":"...","sourceId":"..."}`
 * - `{"status":"rejected","reason":"...","eventType":"..."}`
 * - `{"status":"failed","reason":"...","retriable":true}`
 */
struct IngestResponse {
    IngestStatus status = IngestStatus::ACCEPTED;
    int http_status = 200;
    std::string reason;
    std::string outcome;
    std::string event_type;
    std::string source_id;

    std::string to_json() const;
};

/**
 * @class Ingestor
 * @brief Runs one notification through the pipeline.
 *
 * @details
 * **Status Mapping:**
 * | Result | status | HTTP |
 * |---|---|---|
 * | Applied / no-op | accepted | 200 |
 * | Unknown type, `ignore` policy | accepted (`ignored`) | 202 |
 * | MalformedPayload, ValidationError | rejected | 400 |
 * | Unknown type, `reject` policy | rejected | 422 |
 * | PersistenceConflict | failed | 503 |
 * | StorageError, anything else | failed | 500 |
 *
 * Safe for concurrent use; no state is shared between calls except the store.
 */
class Ingestor {
  public:
    Ingestor(storage::RecordStore& store, const infra::Config& config);

    /**
     * @brief Processes one request body. Never throws for payload or store errors.
     *
     * @param body Raw request body.
     * @param content_type `Content-Type` header value, empty if absent.
     */
    IngestResponse ingest(const std::string& body, const std::string& content_type = "");

    /// @brief `{"status":"ok","projects":N,"issues":M,"accepted":A,"rejected":R,"failed":F}`.
    std::string health_json() const;

    const Dispatcher& dispatcher() const { return dispatcher_; }

  private:
    storage::RecordStore& store_;
    infra::UnsupportedEventPolicy unsupported_policy_;
    Reconciler reconciler_;
    Dispatcher dispatcher_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> failed_{0};

    IngestResponse finish(IngestResponse response);
};

} // namespace hooksync::sync
