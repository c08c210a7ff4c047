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
 * @file records.hpp
 * @brief Local mirrors of source-system entities.
 *
 * @details
 * Records are owned by the `RecordStore` and handed out by value. A caller changes
 * a copy and writes it back; the `revision` it read is the compare-and-set token
 * for that write.
 */

#pragma once

#include "hooksync/infra/timestamp.hpp"
#include "hooksync/model/envelope.hpp"

#include <cstdint>
#include <string>

namespace hooksync::model {

struct ProjectRecord {
    std::string local_id;
    std::string source_id;
    std::string key;
    std::string name;
    std::string description;
    std::string lead;

    /// @brief Created from an issue's project reference, not yet seen as a project event.
    bool placeholder = false;

    /// @brief False once soft-deleted.
    bool active = true;

    /// @brief Source modification time of the last applied snapshot (0 for placeholders).
    infra::EpochMillis external_last_modified = 0;

    /// @brief Local wall-clock time of the last applied write.
    infra::EpochMillis last_synced_at = 0;

    /// @brief Marker left by an outbound sync when it edited the record locally.
    infra::EpochMillis local_touched_at = 0;

    uint64_t revision = 0;

    ExternalEntityRef ref() const { return {source_id, EntityKind::PROJECT}; }
};

struct IssueRecord {
    std::string local_id;
    std::string source_id;
    std::string key;
    std::string summary;
    std::string status;
    std::string description;
    std::string priority;
    std::string assignee;
    std::string issue_type;

    /// @brief Foreign key: `ProjectRecord::local_id` of the owning project.
    std::string project_local_id;

    /// @brief Source id of the owning project, kept for re-link detection.
    std::string project_source_id;

    bool active = true;
    infra::EpochMillis external_last_modified = 0;
    infra::EpochMillis last_synced_at = 0;
    infra::EpochMillis local_touched_at = 0;
    uint64_t revision = 0;

    ExternalEntityRef ref() const { return {source_id, EntityKind::ISSUE}; }
};

} // namespace hooksync::model
