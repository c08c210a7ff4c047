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
 * @file record_store.hpp
 * @brief Persistent store interface consumed by the reconciliation layer.
 *
 * @details
 * Every method is atomic for the single record it addresses. The store does not
 * serialize a caller's read-modify-write sequence; the `Reconciler` does that with
 * per-record locks. What the store guarantees is that a write based on an outdated
 * read is refused (`revision` compare-and-set) rather than silently applied.
 *
 * Errors:
 * - `model::PersistenceConflict`: duplicate insert, revision mismatch, update of an
 *   absent record, or a foreign-key violation.
 * - `model::StorageError`: the durable write failed; nothing was changed.
 */

#pragma once

#include "hooksync/infra/timestamp.hpp"
#include "hooksync/model/envelope.hpp"
#include "hooksync/model/records.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hooksync::storage {

class RecordStore {
  public:
    virtual ~RecordStore() = default;

    /// @brief Lookup by the source system's identifier.
    virtual std::optional<model::ProjectRecord> find_project(const std::string& source_id) const = 0;
    virtual std::optional<model::IssueRecord> find_issue(const std::string& source_id) const = 0;

    /**
     * @brief Stores a new record.
     *
     * Assigns `local_id` when empty and sets `revision` to 1.
     *
     * @return The record as stored.
     * @throws model::PersistenceConflict If a record with the same source id exists,
     * or (issues) the referenced project does not.
     */
    virtual model::ProjectRecord insert_project(model::ProjectRecord record) = 0;
    virtual model::IssueRecord insert_issue(model::IssueRecord record) = 0;

    /**
     * @brief Replaces a stored record if its revision still equals `record.revision`.
     *
     * @return The record as stored, with `revision` incremented.
     * @throws model::PersistenceConflict On revision mismatch or if the record is absent.
     */
    virtual model::ProjectRecord update_project(model::ProjectRecord record) = 0;
    virtual model::IssueRecord update_issue(model::IssueRecord record) = 0;

    /**
     * @brief Hard-deletes the record addressed by @p ref.
     *
     * @return false If no such record exists.
     * @throws model::PersistenceConflict When removing a project that still owns issues.
     */
    virtual bool remove(const model::ExternalEntityRef& ref) = 0;

    /// @brief All issues whose foreign key is @p project_local_id (active or not).
    virtual std::vector<model::IssueRecord>
    issues_for_project(const std::string& project_local_id) const = 0;

    /**
     * @brief Records that the entity was edited locally at @p at (outbound sync marker).
     *
     * @return false If no such record exists.
     */
    virtual bool touch_local(const model::ExternalEntityRef& ref, infra::EpochMillis at) = 0;

    /// @brief Number of stored records of @p kind (active or not).
    virtual size_t count(model::EntityKind kind) const = 0;
};

} // namespace hooksync::storage
