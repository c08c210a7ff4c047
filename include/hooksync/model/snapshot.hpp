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
 * @file snapshot.hpp
 * @brief Typed views of an entity payload.
 *
 * @details
 * A snapshot holds only what the payload actually carried: every attribute is
 * optional, and an absent attribute leaves the stored value untouched on merge.
 *
 * Two payload shapes are understood:
 * - **Flat**: `{"id": "10001", "summary": "...", "status": "Open",
 *   "project": {"id": "10000", "key": "PRJ"}, "lastModified": "..."}`
 * - **Jira native**: `{"id": "10001", "key": "PRJ-7", "fields": {"summary": "...",
 *   "status": {"name": "Open"}, "project": {...}, "updated": "..."}}`
 */

#pragma once

#include "hooksync/infra/timestamp.hpp"
#include "hooksync/model/envelope.hpp"

#include <optional>
#include <string>

namespace hooksync::model {

/**
 * @struct ProjectHint
 * @brief The project reference carried inside an issue payload.
 *
 * Enough to create a placeholder project when the issue arrives first.
 */
struct ProjectHint {
    std::string source_id;
    std::optional<std::string> key;
    std::optional<std::string> name;
};

struct ProjectSnapshot {
    std::string source_id;
    std::optional<std::string> key;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> lead;

    /// @brief `lastModified` → `updated` → envelope timestamp.
    std::optional<infra::EpochMillis> modified_at;

    ExternalEntityRef ref() const { return {source_id, EntityKind::PROJECT}; }
};

struct IssueSnapshot {
    std::string source_id;
    std::optional<std::string> key;
    std::optional<std::string> summary;
    std::optional<std::string> status;
    std::optional<std::string> description;
    std::optional<std::string> priority;
    std::optional<std::string> assignee;
    std::optional<std::string> issue_type;
    std::optional<ProjectHint> project;

    /// @brief `lastModified` → `updated` / `fields.updated` → envelope timestamp.
    std::optional<infra::EpochMillis> modified_at;

    ExternalEntityRef ref() const { return {source_id, EntityKind::ISSUE}; }
};

/**
 * @brief Extracts a project snapshot from the envelope's entity payload.
 *
 * @throws ValidationError If a modification-time field is present but unreadable.
 */
ProjectSnapshot project_snapshot(const WebhookEnvelope& envelope);

/**
 * @brief Extracts an issue snapshot from the envelope's entity payload.
 *
 * @throws ValidationError If a modification-time field is present but unreadable,
 * or a project reference is present without an identifier.
 */
IssueSnapshot issue_snapshot(const WebhookEnvelope& envelope);

} // namespace hooksync::model
