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
 * @file reconciler.cpp
 * @brief Implementation of the upsert/delete policy.
 */

#include "hooksync/sync/reconciler.hpp"

#include "hooksync/infra/logger.hpp"
#include "hooksync/model/errors.hpp"

#include <algorithm>

namespace hooksync::sync {

namespace {

void assign_if(std::string& target, const std::optional<std::string>& value)
{
    if (value)
        target = *value;
}

/// Field-wise merge: only what the snapshot carries overwrites the record.
void apply(model::ProjectRecord& record, const model::ProjectSnapshot& snap)
{
    assign_if(record.key, snap.key);
    assign_if(record.name, snap.name);
    assign_if(record.description, snap.description);
    assign_if(record.lead, snap.lead);
}

void apply(model::IssueRecord& record, const model::IssueSnapshot& snap)
{
    assign_if(record.key, snap.key);
    assign_if(record.summary, snap.summary);
    assign_if(record.status, snap.status);
    assign_if(record.description, snap.description);
    assign_if(record.priority, snap.priority);
    assign_if(record.assignee, snap.assignee);
    assign_if(record.issue_type, snap.issue_type);
}

void link(model::IssueRecord& issue, const model::ProjectRecord& project)
{
    if (!issue.project_local_id.empty() && issue.project_local_id != project.local_id) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Reconcile: Re-linking issue:" +
                                                       issue.source_id + " to project:" +
                                                       project.source_id);
    }
    issue.project_local_id = project.local_id;
    issue.project_source_id = project.source_id;
}

infra::EpochMillis require_modified(const std::optional<infra::EpochMillis>& modified,
                                    const model::ExternalEntityRef& ref)
{
    if (!modified)
        throw model::ValidationError("No modification time for " + ref.key());
    return *modified;
}

/// Active records accept equal timestamps (idempotent redelivery); inactive ones
/// are revived only by a strictly newer event.
bool accepts(bool active, infra::EpochMillis incoming, infra::EpochMillis base)
{
    return active ? incoming >= base : incoming > base;
}

void log_stale(const model::ExternalEntityRef& ref, infra::EpochMillis incoming,
               infra::EpochMillis base)
{
    infra::Logger::log(infra::LogLevel::INFO,
                       "Reconcile: Stale event for " + ref.key() + " (incoming " +
                           infra::Timestamp::format(incoming) + " < stored " +
                           infra::Timestamp::format(base) + "). Ignored.");
}

} // namespace

const char* to_string(UpsertOutcome outcome)
{
    switch (outcome) {
    case UpsertOutcome::INSERTED:
        return "inserted";
    case UpsertOutcome::MERGED:
        return "merged";
    case UpsertOutcome::NOOP_STALE:
        return "noop_stale";
    case UpsertOutcome::DELETED:
        return "deleted";
    case UpsertOutcome::NOOP_ABSENT:
        return "noop_absent";
    }
    return "unknown";
}

Reconciler::Reconciler(storage::RecordStore& store, ReconcilePolicy policy)
    : store_(store), policy_(policy)
{
}

infra::EpochMillis Reconciler::baseline(infra::EpochMillis external_last_modified,
                                        infra::EpochMillis local_touched_at) const
{
    if (policy_.staleness_mode == infra::StalenessMode::RESPECT_LOCAL_EDITS)
        return std::max(external_last_modified, local_touched_at);
    return external_last_modified;
}

Resolution Reconciler::resolve(const model::ProjectSnapshot& snapshot, model::Operation op)
{
    Resolution res =
        op == model::Operation::DELETED ? delete_project(snapshot) : upsert_project(snapshot);
    infra::Logger::log(infra::LogLevel::DEBUG, "Reconcile: " + snapshot.ref().key() + " " +
                                                   model::to_string(op) + " -> " +
                                                   to_string(res.outcome));
    return res;
}

Resolution Reconciler::resolve(const model::IssueSnapshot& snapshot, model::Operation op)
{
    Resolution res =
        op == model::Operation::DELETED ? delete_issue(snapshot) : upsert_issue(snapshot);
    infra::Logger::log(infra::LogLevel::DEBUG, "Reconcile: " + snapshot.ref().key() + " " +
                                                   model::to_string(op) + " -> " +
                                                   to_string(res.outcome));
    return res;
}

Resolution Reconciler::upsert_project(const model::ProjectSnapshot& snapshot)
{
    const model::ExternalEntityRef ref = snapshot.ref();
    const infra::EpochMillis modified = require_modified(snapshot.modified_at, ref);

    auto guard = locks_.acquire(ref.key());
    Resolution res;

    auto existing = store_.find_project(snapshot.source_id);
    if (!existing) {
        model::ProjectRecord record;
        record.source_id = snapshot.source_id;
        apply(record, snapshot);
        record.external_last_modified = modified;
        record.last_synced_at = infra::Timestamp::now();
        store_.insert_project(std::move(record));
        res.outcome = UpsertOutcome::INSERTED;
        return res;
    }

    const infra::EpochMillis base =
        baseline(existing->external_last_modified, existing->local_touched_at);
    if (!accepts(existing->active, modified, base)) {
        log_stale(ref, modified, base);
        res.outcome = UpsertOutcome::NOOP_STALE;
        return res;
    }

    model::ProjectRecord next = *existing;
    apply(next, snapshot);
    next.placeholder = false;
    next.active = true;
    next.external_last_modified = modified;
    next.last_synced_at = infra::Timestamp::now();
    store_.update_project(std::move(next));
    res.outcome = UpsertOutcome::MERGED;
    return res;
}

/**
 * @brief Deletes a project and, first, every issue that references it.
 *
 * Issues are retired with the same delete policy as the project, each under its
 * own lock (project lock already held, so the lock order is preserved). An issue
 * re-parented between the listing and its lock is left alone.
 */
Resolution Reconciler::delete_project(const model::ProjectSnapshot& snapshot)
{
    const model::ExternalEntityRef ref = snapshot.ref();
    const infra::EpochMillis at = snapshot.modified_at.value_or(0);

    auto guard = locks_.acquire(ref.key());
    Resolution res;

    auto existing = store_.find_project(snapshot.source_id);
    if (!existing || (policy_.delete_policy == infra::DeletePolicy::SOFT && !existing->active)) {
        res.outcome = UpsertOutcome::NOOP_ABSENT;
        return res;
    }

    for (const auto& issue : store_.issues_for_project(existing->local_id)) {
        auto issue_guard = locks_.acquire(issue.ref().key());
        auto current = store_.find_issue(issue.source_id);
        // The listing predates the issue lock; an issue moved away since then is not ours.
        if (!current || current->project_local_id != existing->local_id)
            continue;
        if (retire_issue(*current, at))
            ++res.cascaded;
    }
    if (res.cascaded > 0) {
        infra::Logger::log(infra::LogLevel::INFO, "Reconcile: Cascaded delete of " + ref.key() +
                                                      " to " + std::to_string(res.cascaded) +
                                                      " issues.");
    }

    if (policy_.delete_policy == infra::DeletePolicy::HARD) {
        res.outcome = store_.remove(ref) ? UpsertOutcome::DELETED : UpsertOutcome::NOOP_ABSENT;
        return res;
    }

    model::ProjectRecord next = *existing;
    next.active = false;
    next.external_last_modified = std::max(existing->external_last_modified, at);
    next.last_synced_at = infra::Timestamp::now();
    store_.update_project(std::move(next));
    res.outcome = UpsertOutcome::DELETED;
    return res;
}

/**
 * @brief Upserts an issue.
 *
 * **Sequence:**
 * 1. **Pick the parent** to lock: the snapshot's reference, else the stored link.
 * 2. **Lock** project, then issue; re-read the issue.
 * 3. **Staleness guard** before any write, so stale events create nothing.
 * 4. **Parent**: find or create a placeholder; an inactive parent makes the event stale.
 * 5. **Write**: insert or merge, linking the issue to its parent.
 */
Resolution Reconciler::upsert_issue(const model::IssueSnapshot& snapshot)
{
    const model::ExternalEntityRef ref = snapshot.ref();
    const infra::EpochMillis modified = require_modified(snapshot.modified_at, ref);

    std::string project_id;
    if (snapshot.project) {
        project_id = snapshot.project->source_id;
    } else if (auto known = store_.find_issue(snapshot.source_id)) {
        project_id = known->project_source_id;
    } else {
        throw model::ValidationError("Issue " + snapshot.source_id +
                                     " is unknown locally and carries no project reference");
    }

    const model::ExternalEntityRef project_ref{project_id, model::EntityKind::PROJECT};
    auto project_guard = locks_.acquire(project_ref.key());
    auto issue_guard = locks_.acquire(ref.key());

    auto existing = store_.find_issue(snapshot.source_id);
    if (!snapshot.project && (!existing || existing->project_source_id != project_id))
        throw model::PersistenceConflict("Issue " + snapshot.source_id +
                                         " changed concurrently; retry");

    Resolution res;
    if (existing) {
        const infra::EpochMillis base =
            baseline(existing->external_last_modified, existing->local_touched_at);
        if (!accepts(existing->active, modified, base)) {
            log_stale(ref, modified, base);
            res.outcome = UpsertOutcome::NOOP_STALE;
            return res;
        }
    }

    model::ProjectRecord parent;
    if (snapshot.project) {
        parent = ensure_parent(*snapshot.project, res.placeholder_created);
    } else {
        auto stored = store_.find_project(project_id);
        if (!stored)
            throw model::PersistenceConflict("Parent " + project_ref.key() + " of " + ref.key() +
                                             " is missing");
        parent = *stored;
    }

    if (!parent.active) {
        infra::Logger::log(infra::LogLevel::INFO, "Reconcile: Parent " + project_ref.key() +
                                                      " of " + ref.key() +
                                                      " is deleted. Event ignored.");
        res.outcome = UpsertOutcome::NOOP_STALE;
        return res;
    }

    if (!existing) {
        model::IssueRecord record;
        record.source_id = snapshot.source_id;
        apply(record, snapshot);
        link(record, parent);
        record.external_last_modified = modified;
        record.last_synced_at = infra::Timestamp::now();
        store_.insert_issue(std::move(record));
        res.outcome = UpsertOutcome::INSERTED;
        return res;
    }

    model::IssueRecord next = *existing;
    apply(next, snapshot);
    link(next, parent);
    next.active = true;
    next.external_last_modified = modified;
    next.last_synced_at = infra::Timestamp::now();
    store_.update_issue(std::move(next));
    res.outcome = UpsertOutcome::MERGED;
    return res;
}

Resolution Reconciler::delete_issue(const model::IssueSnapshot& snapshot)
{
    const model::ExternalEntityRef ref = snapshot.ref();

    auto guard = locks_.acquire(ref.key());
    Resolution res;

    auto existing = store_.find_issue(snapshot.source_id);
    if (existing && retire_issue(*existing, snapshot.modified_at.value_or(0))) {
        res.outcome = UpsertOutcome::DELETED;
    } else {
        res.outcome = UpsertOutcome::NOOP_ABSENT;
    }
    return res;
}

model::ProjectRecord Reconciler::ensure_parent(const model::ProjectHint& hint, bool& created)
{
    if (auto found = store_.find_project(hint.source_id)) {
        // Fill gaps of a placeholder from later, richer references.
        if (found->placeholder && ((found->key.empty() && hint.key && !hint.key->empty()) ||
                                   (found->name.empty() && hint.name && !hint.name->empty()))) {
            model::ProjectRecord next = *found;
            if (next.key.empty() && hint.key)
                next.key = *hint.key;
            if (next.name.empty() && hint.name)
                next.name = *hint.name;
            return store_.update_project(std::move(next));
        }
        return *found;
    }

    model::ProjectRecord placeholder;
    placeholder.source_id = hint.source_id;
    placeholder.key = hint.key.value_or("");
    placeholder.name = hint.name.value_or("");
    placeholder.placeholder = true;
    placeholder.external_last_modified = 0;
    placeholder.last_synced_at = infra::Timestamp::now();

    model::ProjectRecord stored = store_.insert_project(std::move(placeholder));
    created = true;
    infra::Logger::log(infra::LogLevel::INFO,
                       "Reconcile: Created placeholder project:" + hint.source_id + " (" +
                           stored.local_id + ") for an orphan issue.");
    return stored;
}

bool Reconciler::retire_issue(const model::IssueRecord& issue, infra::EpochMillis at)
{
    if (policy_.delete_policy == infra::DeletePolicy::HARD)
        return store_.remove(issue.ref());

    if (!issue.active)
        return false;

    model::IssueRecord next = issue;
    next.active = false;
    next.external_last_modified = std::max(issue.external_last_modified, at);
    next.last_synced_at = infra::Timestamp::now();
    store_.update_issue(std::move(next));
    return true;
}

} // namespace hooksync::sync
