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
 * @file ingestor.cpp
 * @brief Implementation of the ingest pipeline.
 *
 * @details
 * Request lifecycle:
 * 1. **Parse**: raw body to `WebhookEnvelope` (no store access).
 * 2. **Classify**: event tag to processor via the routing table.
 * 3. **Process**: field validation and one reconciliation.
 * 4. **Respond**: outcome or error mapped to an `IngestResponse`.
 */

#include "hooksync/sync/ingestor.hpp"

#include "hooksync/infra/logger.hpp"
#include "hooksync/model/errors.hpp"
#include "hooksync/model/json.hpp"
#include "hooksync/sync/parser.hpp"

#include <cJSON.h>

namespace hooksync::sync {

namespace {

std::string describe(const std::string& event_type, const std::string& source_id)
{
    return "eventType=" + (event_type.empty() ? std::string("?") : event_type) +
           " sourceId=" + (source_id.empty() ? std::string("?") : source_id);
}

int rejection_status(model::ErrorKind kind)
{
    switch (kind) {
    case model::ErrorKind::UNSUPPORTED_EVENT_TYPE:
        return 422;
    case model::ErrorKind::PERSISTENCE_CONFLICT:
        return 503;
    case model::ErrorKind::STORAGE_ERROR:
        return 500;
    case model::ErrorKind::MALFORMED_PAYLOAD:
    case model::ErrorKind::VALIDATION_ERROR:
        break;
    }
    return 400;
}

} // namespace

const char* to_string(IngestStatus status)
{
    switch (status) {
    case IngestStatus::ACCEPTED:
        return "accepted";
    case IngestStatus::REJECTED:
        return "rejected";
    case IngestStatus::FAILED:
        return "failed";
    }
    return "unknown";
}

std::string IngestResponse::to_json() const
{
    model::JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "status", to_string(status));
    if (!outcome.empty())
        cJSON_AddStringToObject(root.get(), "outcome", outcome.c_str());
    if (!reason.empty())
        cJSON_AddStringToObject(root.get(), "reason", reason.c_str());
    if (!event_type.empty())
        cJSON_AddStringToObject(root.get(), "eventType", event_type.c_str());
    if (!source_id.empty())
        cJSON_AddStringToObject(root.get(), "sourceId", source_id.c_str());
    if (status == IngestStatus::FAILED)
        cJSON_AddBoolToObject(root.get(), "retriable", true);
    return model::print_compact(root.get());
}

Ingestor::Ingestor(storage::RecordStore& store, const infra::Config& config)
    : store_(store), unsupported_policy_(config.unsupported_events),
      reconciler_(store, ReconcilePolicy{config.delete_policy, config.staleness_mode}),
      dispatcher_(Dispatcher::default_registry())
{
}

IngestResponse Ingestor::finish(IngestResponse response)
{
    switch (response.status) {
    case IngestStatus::ACCEPTED:
        ++accepted_;
        break;
    case IngestStatus::REJECTED:
        ++rejected_;
        break;
    case IngestStatus::FAILED:
        ++failed_;
        break;
    }
    return response;
}

IngestResponse Ingestor::ingest(const std::string& body, const std::string& content_type)
{
    IngestResponse response;

    try {
        model::WebhookEnvelope envelope = Parser::parse(body, content_type);
        response.event_type = envelope.event_type;
        response.source_id = envelope.source_id;

        const Processor& processor = dispatcher_.classify(envelope.event_type);
        const ProcessResult result = processor.fn(ProcessorContext{reconciler_}, envelope);

        response.status = IngestStatus::ACCEPTED;
        response.http_status = 200;
        response.outcome = to_string(result.resolution.outcome);

        infra::Logger::log(infra::LogLevel::INFO, "Ingest: " +
                                                      describe(response.event_type,
                                                               response.source_id) +
                                                      " -> " + response.outcome);
        return finish(std::move(response));

    } catch (const model::SyncError& e) {
        const std::string context = describe(response.event_type, response.source_id);
        response.reason = e.what();

        if (e.kind() == model::ErrorKind::UNSUPPORTED_EVENT_TYPE &&
            unsupported_policy_ == infra::UnsupportedEventPolicy::IGNORE) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Ingest: Ignoring unsupported event (" + context + ")");
            response.status = IngestStatus::ACCEPTED;
            response.http_status = 202;
            response.outcome = "ignored";
            return finish(std::move(response));
        }

        response.http_status = rejection_status(e.kind());
        if (e.retriable()) {
            infra::Logger::log(infra::LogLevel::ERROR, "Ingest: " +
                                                           std::string(to_string(e.kind())) +
                                                           " (" + context + "): " + e.what());
            response.status = IngestStatus::FAILED;
        } else {
            infra::Logger::log(infra::LogLevel::WARN, "Ingest: Rejected " +
                                                          std::string(to_string(e.kind())) +
                                                          " (" + context + "): " + e.what());
            response.status = IngestStatus::REJECTED;
        }
        return finish(std::move(response));

    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Ingest: Internal failure (" +
                               describe(response.event_type, response.source_id) +
                               "): " + e.what());
        response.status = IngestStatus::FAILED;
        response.http_status = 500;
        response.reason = "Internal error";
        return finish(std::move(response));
    }
}

std::string Ingestor::health_json() const
{
    model::JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "status", "ok");
    cJSON_AddNumberToObject(root.get(), "projects",
                            static_cast<double>(store_.count(model::EntityKind::PROJECT)));
    cJSON_AddNumberToObject(root.get(), "issues",
                            static_cast<double>(store_.count(model::EntityKind::ISSUE)));
    cJSON_AddNumberToObject(root.get(), "accepted", static_cast<double>(accepted_.load()));
    cJSON_AddNumberToObject(root.get(), "rejected", static_cast<double>(rejected_.load()));
    cJSON_AddNumberToObject(root.get(), "failed", static_cast<double>(failed_.load()));
    return model::print_compact(root.get());
}

} // namespace hooksync::sync
