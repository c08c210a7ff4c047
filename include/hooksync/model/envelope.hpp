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
 * @file envelope.hpp
 * @brief Inbound notification and entity identity types.
 */

#pragma once

#include "hooksync/infra/timestamp.hpp"
#include "hooksync/model/json.hpp"

#include <optional>
#include <string>

namespace hooksync::model {

enum class EntityKind { PROJECT, ISSUE };

enum class Operation { CREATED, UPDATED, DELETED };

const char* to_string(EntityKind kind);
const char* to_string(Operation op);

/**
 * @brief Drops the `"<domain>:"` prefix of an event tag, if any.
 *
 * @code
 * event_name("jira:issue_created"); // "issue_created"
 * event_name("project_deleted");    // "project_deleted"
 * @endcode
 */
std::string event_name(const std::string& event_type);

/**
 * @struct ExternalEntityRef
 * @brief Correlation key between a source-system entity and its local mirror.
 *
 * `source_id` is unique per `kind`. It is the only key ever used to find the local
 * record for an incoming event; the local id is never derived from it.
 */
struct ExternalEntityRef {
    std::string source_id;
    EntityKind kind = EntityKind::PROJECT;

    /// @brief `"project:10000"` / `"issue:10001"`. Used as the per-record lock key.
    std::string key() const;

    bool operator==(const ExternalEntityRef& other) const
    {
        return kind == other.kind && source_id == other.source_id;
    }
};

/**
 * @struct WebhookEnvelope
 * @brief One parsed inbound notification.
 *
 * @details
 * Built once per call by the `Parser`, read by exactly one processor, then dropped.
 * `entity_payload` points into `document` and lives as long as the envelope.
 * Move-only.
 */
struct WebhookEnvelope {
    /// @brief Tag as delivered, e.g. `"jira:issue_created"` or `"project_deleted"`.
    std::string event_type;

    /// @brief Source-system event time, if the notification carried one.
    std::optional<infra::EpochMillis> timestamp;

    /// @brief Identifying field of the entity snapshot (for logging and lookups).
    std::string source_id;

    /// @brief The complete parsed request body.
    JsonPtr document;

    /// @brief The entity snapshot object inside `document`.
    const cJSON* entity_payload = nullptr;
};

} // namespace hooksync::model
