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
 * @file reconciler.hpp
 * @brief Idempotent upsert/delete of local records from source snapshots.
 *
 * @details
 * The reconciler is the only component that writes to the `RecordStore`. It turns
 * an entity snapshot plus an operation into exactly one `UpsertOutcome` for the
 * addressed record, applying the last-write-wins staleness guard so that
 * duplicated or reordered deliveries converge on the newest source state.
 */

#pragma once

#include "hooksync/infra/config.hpp"
#include "hooksync/infra/keyed_mutex.hpp"
#include "hooksync/model/snapshot.hpp"
#include "hooksync/storage/record_store.hpp"

#include <cstddef>

namespace hooksync::sync {

enum class UpsertOutcome {
    INSERTED,   ///< A new local record was created.
    MERGED,     ///< The stored record was overwritten with the snapshot.
    NOOP_STALE, ///< The snapshot is older than the stored state; nothing changed.
    DELETED,    ///< The record was removed or marked inactive.
    NOOP_ABSENT ///< Delete of a record that does not exist (or is already inactive).
};

/// @brief `"inserted"`, `"merged"`, `"noop_stale"`, `"deleted"`, `"noop_absent"`.
const char* to_string(UpsertOutcome outcome);

/**
 * @struct Resolution
 * @brief Result of one reconciliation.
 */
struct Resolution {
    UpsertOutcome outcome = UpsertOutcome::NOOP_ABSENT;
    /// @brief An issue event created a placeholder for its unknown parent project.
    bool placeholder_created = false;
    /// @brief Number of issues deleted along with a project.
    size_t cascaded = 0;
};

struct ReconcilePolicy {
    infra::DeletePolicy delete_policy = infra::DeletePolicy::SOFT;
    infra::StalenessMode staleness_mode = infra::StalenessMode::SOURCE_ONLY;
};

/**
 * @class Reconciler
 * @brief Applies snapshots to the store under per-record locks.
 *
 * @details
 * **Policy:**
 * - Created or Updated on an absent record inserts it.
 * - Created or Updated on a present record merges it when the snapshot's
 *   modification time is not older than the staleness baseline, otherwise it is a
 *   stale no-op. A duplicate Created is therefore never inserted twice.
 * - Deleted on an absent record is a no-op success.
 * - An issue whose parent project is unknown gets a placeholder project, later
 *   enriched by a genuine project event.
 *
 * **Locking:** one `KeyedMutex` key per `ExternalEntityRef`. Whenever both are
 * needed, the project key is taken before the issue key.
 */
class Reconciler {
  public:
    explicit Reconciler(storage::RecordStore& store, ReconcilePolicy policy = {});

    /**
     * @brief Applies a project snapshot.
     *
     * @throws model::ValidationError If an upsert carries no modification time.
     * @throws model::PersistenceConflict If the store refused a write.
     * @throws model::StorageError If the durable write failed.
     */
    Resolution resolve(const model::ProjectSnapshot& snapshot, model::Operation op);

    /**
     * @brief Applies an issue snapshot, creating or linking its parent project.
     *
     * @throws model::ValidationError If an upsert carries no modification time, or
     * an unknown issue carries no project reference.
     * @throws model::PersistenceConflict If the store refused a write.
     * @throws model::StorageError If the durable write failed.
     */
    Resolution resolve(const model::IssueSnapshot& snapshot, model::Operation op);

    const ReconcilePolicy& policy() const { return policy_; }

  private:
    storage::RecordStore& store_;
    ReconcilePolicy policy_;
    infra::KeyedMutex locks_;

    /// @brief Staleness baseline of a stored record under the configured mode.
    infra::EpochMillis baseline(infra::EpochMillis external_last_modified,
                                infra::EpochMillis local_touched_at) const;

    Resolution upsert_project(const model::ProjectSnapshot& snapshot);
    Resolution delete_project(const model::ProjectSnapshot& snapshot);

    Resolution upsert_issue(const model::IssueSnapshot& snapshot);
    Resolution delete_issue(const model::IssueSnapshot& snapshot);

    /**
     * @brief Returns the parent project for @p hint, inserting a placeholder if absent.
     *
     * Caller must hold the project lock.
     */
    model::ProjectRecord ensure_parent(const model::ProjectHint& hint, bool& created);

    /// @brief Marks one issue inactive (soft) or removes it (hard). Caller holds the lock.
    bool retire_issue(const model::IssueRecord& issue, infra::EpochMillis at);
};

} // namespace hooksync::sync
