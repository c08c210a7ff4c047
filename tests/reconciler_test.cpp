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
 * @file reconciler_test.cpp
 * @brief Convergence tests for the upsert/delete policy.
 *
 * @details
 * Scenarios verified:
 * 1. Idempotent redelivery and out-of-order delivery converge on the newest state.
 * 2. Delete idempotence under both delete policies, including cascade.
 * 3. Orphan issues get a placeholder parent that a project event later enriches.
 * 4. Store refusals propagate unchanged.
 * 5. A cascade never retires an issue that moved to another project mid-delete.
 */

#include "framework.hpp"
#include "hooksync/model/errors.hpp"
#include "hooksync/storage/journal_store.hpp"
#include "hooksync/sync/reconciler.hpp"
#include "test_support.hpp"

#include <functional>
#include <thread>
#include <vector>

using namespace hooksync;
using model::EntityKind;
using model::Operation;
using sync::Reconciler;
using sync::UpsertOutcome;

namespace {

const infra::EpochMillis T1 = 1705312800000LL; // 2024-01-15T10:00:00Z
const infra::EpochMillis T2 = T1 + 3600000;
const infra::EpochMillis T3 = T2 + 3600000;

model::ProjectSnapshot project(const std::string& id, const std::string& name,
                               std::optional<infra::EpochMillis> at)
{
    model::ProjectSnapshot s;
    s.source_id = id;
    s.key = "PRJ";
    s.name = name;
    s.modified_at = at;
    return s;
}

model::IssueSnapshot issue(const std::string& id, const std::string& summary,
                           const std::string& project_id, std::optional<infra::EpochMillis> at)
{
    model::IssueSnapshot s;
    s.source_id = id;
    s.summary = summary;
    s.modified_at = at;
    if (!project_id.empty()) {
        model::ProjectHint hint;
        hint.source_id = project_id;
        hint.key = "P" + project_id;
        s.project = hint;
    }
    return s;
}

sync::ReconcilePolicy policy(infra::DeletePolicy del,
                             infra::StalenessMode mode = infra::StalenessMode::SOURCE_ONLY)
{
    sync::ReconcilePolicy p;
    p.delete_policy = del;
    p.staleness_mode = mode;
    return p;
}

/// Delegating store that refuses selected writes.
class RefusingStore : public storage::RecordStore {
  public:
    RefusingStore(storage::RecordStore& inner, bool conflict_on_update, bool fail_inserts)
        : inner_(inner), conflict_on_update_(conflict_on_update), fail_inserts_(fail_inserts)
    {
    }

    std::optional<model::ProjectRecord> find_project(const std::string& id) const override
    {
        return inner_.find_project(id);
    }
    std::optional<model::IssueRecord> find_issue(const std::string& id) const override
    {
        return inner_.find_issue(id);
    }
    model::ProjectRecord insert_project(model::ProjectRecord r) override
    {
        if (fail_inserts_)
            throw model::StorageError("disk full");
        return inner_.insert_project(std::move(r));
    }
    model::IssueRecord insert_issue(model::IssueRecord r) override
    {
        if (fail_inserts_)
            throw model::StorageError("disk full");
        return inner_.insert_issue(std::move(r));
    }
    model::ProjectRecord update_project(model::ProjectRecord r) override
    {
        if (conflict_on_update_)
            throw model::PersistenceConflict("concurrent writer");
        return inner_.update_project(std::move(r));
    }
    model::IssueRecord update_issue(model::IssueRecord r) override
    {
        if (conflict_on_update_)
            throw model::PersistenceConflict("concurrent writer");
        return inner_.update_issue(std::move(r));
    }
    bool remove(const model::ExternalEntityRef& ref) override { return inner_.remove(ref); }
    std::vector<model::IssueRecord> issues_for_project(const std::string& id) const override
    {
        return inner_.issues_for_project(id);
    }
    bool touch_local(const model::ExternalEntityRef& ref, infra::EpochMillis at) override
    {
        return inner_.touch_local(ref, at);
    }
    size_t count(EntityKind kind) const override { return inner_.count(kind); }

  private:
    storage::RecordStore& inner_;
    bool conflict_on_update_;
    bool fail_inserts_;
};

/// Delegating store that runs a one-shot callback after listing a project's issues.
class ListingHookStore : public storage::RecordStore {
  public:
    explicit ListingHookStore(storage::RecordStore& inner) : inner_(inner) {}

    void on_listing(std::function<void()> hook) { hook_ = std::move(hook); }

    std::optional<model::ProjectRecord> find_project(const std::string& id) const override
    {
        return inner_.find_project(id);
    }
    std::optional<model::IssueRecord> find_issue(const std::string& id) const override
    {
        return inner_.find_issue(id);
    }
    model::ProjectRecord insert_project(model::ProjectRecord r) override
    {
        return inner_.insert_project(std::move(r));
    }
    model::IssueRecord insert_issue(model::IssueRecord r) override
    {
        return inner_.insert_issue(std::move(r));
    }
    model::ProjectRecord update_project(model::ProjectRecord r) override
    {
        return inner_.update_project(std::move(r));
    }
    model::IssueRecord update_issue(model::IssueRecord r) override
    {
        return inner_.update_issue(std::move(r));
    }
    bool remove(const model::ExternalEntityRef& ref) override { return inner_.remove(ref); }
    std::vector<model::IssueRecord> issues_for_project(const std::string& id) const override
    {
        auto listed = inner_.issues_for_project(id);
        std::function<void()> hook;
        hook.swap(hook_);
        if (hook)
            hook();
        return listed;
    }
    bool touch_local(const model::ExternalEntityRef& ref, infra::EpochMillis at) override
    {
        return inner_.touch_local(ref, at);
    }
    size_t count(EntityKind kind) const override { return inner_.count(kind); }

  private:
    storage::RecordStore& inner_;
    mutable std::function<void()> hook_;
};

} // namespace

/**
 * @brief Applying the same event twice leaves the same state as applying it once.
 */
void test_reconcile_idempotent_redelivery()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);

    auto first = rec.resolve(project("10000", "Platform", T1), Operation::CREATED);
    ASSERT_TRUE(first.outcome == UpsertOutcome::INSERTED);
    auto once = *store.find_project("10000");

    auto second = rec.resolve(project("10000", "Platform", T1), Operation::CREATED);
    ASSERT_TRUE(second.outcome == UpsertOutcome::MERGED);
    auto twice = *store.find_project("10000");

    ASSERT_EQ(store.count(EntityKind::PROJECT), static_cast<size_t>(1));
    ASSERT_EQ(twice.local_id, once.local_id);
    ASSERT_EQ(twice.name, once.name);
    ASSERT_EQ(twice.external_last_modified, once.external_last_modified);
    ASSERT_TRUE(twice.active);
}

/**
 * @brief Delivering updates t2 then t1 yields the t2 state, as does t1 then t2.
 */
void test_reconcile_out_of_order_converges()
{
    test::TempDir dir_a;
    test::TempDir dir_b;
    storage::JournalStore in_order(dir_a.path);
    storage::JournalStore reversed(dir_b.path);
    Reconciler a(in_order);
    Reconciler b(reversed);

    a.resolve(project("10000", "Old name", T1), Operation::UPDATED);
    a.resolve(project("10000", "New name", T2), Operation::UPDATED);

    b.resolve(project("10000", "New name", T2), Operation::UPDATED);
    auto late = b.resolve(project("10000", "Old name", T1), Operation::UPDATED);
    ASSERT_TRUE(late.outcome == UpsertOutcome::NOOP_STALE);

    ASSERT_EQ(in_order.find_project("10000")->name, std::string("New name"));
    ASSERT_EQ(reversed.find_project("10000")->name, std::string("New name"));
    ASSERT_EQ(reversed.find_project("10000")->external_last_modified, T2);
}

void test_reconcile_duplicate_create_merges()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);

    rec.resolve(issue("20001", "Original", "10000", T1), Operation::CREATED);
    auto dup = rec.resolve(issue("20001", "Edited", "10000", T2), Operation::CREATED);

    ASSERT_TRUE(dup.outcome == UpsertOutcome::MERGED);
    ASSERT_EQ(store.count(EntityKind::ISSUE), static_cast<size_t>(1));
    ASSERT_EQ(store.find_issue("20001")->summary, std::string("Edited"));
}

/**
 * @brief Absent snapshot fields keep their stored values on merge.
 */
void test_reconcile_partial_merge()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);

    auto full = issue("20001", "Login fails", "10000", T1);
    full.status = "Open";
    full.priority = "High";
    rec.resolve(full, Operation::CREATED);

    model::IssueSnapshot partial;
    partial.source_id = "20001";
    partial.status = "Done";
    partial.modified_at = T2;
    auto res = rec.resolve(partial, Operation::UPDATED);

    ASSERT_TRUE(res.outcome == UpsertOutcome::MERGED);
    auto stored = *store.find_issue("20001");
    ASSERT_EQ(stored.status, std::string("Done"));
    ASSERT_EQ(stored.summary, std::string("Login fails"));
    ASSERT_EQ(stored.priority, std::string("High"));
}

void test_reconcile_delete_idempotent_soft()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store, policy(infra::DeletePolicy::SOFT));

    ASSERT_TRUE(rec.resolve(issue("404", "", "", std::nullopt), Operation::DELETED).outcome ==
                UpsertOutcome::NOOP_ABSENT);

    rec.resolve(issue("20001", "Login fails", "10000", T1), Operation::CREATED);
    auto del = rec.resolve(issue("20001", "", "", T2), Operation::DELETED);
    ASSERT_TRUE(del.outcome == UpsertOutcome::DELETED);
    ASSERT_FALSE(store.find_issue("20001")->active);

    auto again = rec.resolve(issue("20001", "", "", T2), Operation::DELETED);
    ASSERT_TRUE(again.outcome == UpsertOutcome::NOOP_ABSENT);

    // The tombstone guards against a late update carrying the same timestamp.
    auto late = rec.resolve(issue("20001", "Zombie", "10000", T2), Operation::UPDATED);
    ASSERT_TRUE(late.outcome == UpsertOutcome::NOOP_STALE);
    ASSERT_FALSE(store.find_issue("20001")->active);

    // A strictly newer event revives it.
    auto revived = rec.resolve(issue("20001", "Reopened", "10000", T3), Operation::UPDATED);
    ASSERT_TRUE(revived.outcome == UpsertOutcome::MERGED);
    ASSERT_TRUE(store.find_issue("20001")->active);
    ASSERT_EQ(store.find_issue("20001")->summary, std::string("Reopened"));
}

void test_reconcile_delete_idempotent_hard()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store, policy(infra::DeletePolicy::HARD));

    rec.resolve(issue("20001", "Login fails", "10000", T1), Operation::CREATED);
    ASSERT_TRUE(rec.resolve(issue("20001", "", "", T2), Operation::DELETED).outcome ==
                UpsertOutcome::DELETED);
    ASSERT_FALSE(store.find_issue("20001").has_value());
    ASSERT_TRUE(rec.resolve(issue("20001", "", "", T2), Operation::DELETED).outcome ==
                UpsertOutcome::NOOP_ABSENT);
}

/**
 * @brief An issue for an unknown project creates and links a placeholder, which a
 * later project event enriches instead of duplicating.
 */
void test_reconcile_orphan_issue_placeholder()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);

    auto res = rec.resolve(issue("20001", "Orphan", "P-999", T2), Operation::CREATED);
    ASSERT_TRUE(res.outcome == UpsertOutcome::INSERTED);
    ASSERT_TRUE(res.placeholder_created);

    auto placeholder = store.find_project("P-999");
    ASSERT_TRUE(placeholder.has_value());
    ASSERT_TRUE(placeholder->placeholder);
    ASSERT_EQ(placeholder->key, std::string("PP-999"));
    ASSERT_EQ(store.find_issue("20001")->project_local_id, placeholder->local_id);

    // An older genuine project event still enriches the placeholder.
    auto enrich = rec.resolve(project("P-999", "Phoenix", T1), Operation::CREATED);
    ASSERT_TRUE(enrich.outcome == UpsertOutcome::MERGED);

    auto enriched = store.find_project("P-999");
    ASSERT_FALSE(enriched->placeholder);
    ASSERT_EQ(enriched->name, std::string("Phoenix"));
    ASSERT_EQ(enriched->local_id, placeholder->local_id);
    ASSERT_EQ(store.count(EntityKind::PROJECT), static_cast<size_t>(1));

    // A second orphan for the same project reuses the record.
    auto sibling = rec.resolve(issue("20002", "Sibling", "P-999", T2), Operation::CREATED);
    ASSERT_FALSE(sibling.placeholder_created);
    ASSERT_EQ(store.issues_for_project(placeholder->local_id).size(), static_cast<size_t>(2));
}

void test_reconcile_cascade_soft()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store, policy(infra::DeletePolicy::SOFT));

    rec.resolve(project("10000", "Platform", T1), Operation::CREATED);
    rec.resolve(issue("20001", "A", "10000", T1), Operation::CREATED);
    rec.resolve(issue("20002", "B", "10000", T1), Operation::CREATED);

    auto res = rec.resolve(project("10000", "", T2), Operation::DELETED);
    ASSERT_TRUE(res.outcome == UpsertOutcome::DELETED);
    ASSERT_EQ(res.cascaded, static_cast<size_t>(2));
    ASSERT_FALSE(store.find_project("10000")->active);
    ASSERT_FALSE(store.find_issue("20001")->active);
    ASSERT_FALSE(store.find_issue("20002")->active);

    // Issue events under a deleted parent are stale no-ops.
    auto late = rec.resolve(issue("20003", "C", "10000", T3), Operation::CREATED);
    ASSERT_TRUE(late.outcome == UpsertOutcome::NOOP_STALE);
    ASSERT_FALSE(store.find_issue("20003").has_value());
}

void test_reconcile_cascade_hard()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store, policy(infra::DeletePolicy::HARD));

    rec.resolve(project("10000", "Platform", T1), Operation::CREATED);
    rec.resolve(issue("20001", "A", "10000", T1), Operation::CREATED);
    rec.resolve(issue("20002", "B", "10000", T1), Operation::CREATED);

    auto res = rec.resolve(project("10000", "", std::nullopt), Operation::DELETED);
    ASSERT_TRUE(res.outcome == UpsertOutcome::DELETED);
    ASSERT_EQ(res.cascaded, static_cast<size_t>(2));
    ASSERT_EQ(store.count(EntityKind::PROJECT), static_cast<size_t>(0));
    ASSERT_EQ(store.count(EntityKind::ISSUE), static_cast<size_t>(0));
}

void test_reconcile_relinks_moved_issue()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);

    rec.resolve(project("10000", "Platform", T1), Operation::CREATED);
    rec.resolve(project("10001", "Mobile", T1), Operation::CREATED);
    rec.resolve(issue("20001", "A", "10000", T1), Operation::CREATED);

    rec.resolve(issue("20001", "A", "10001", T2), Operation::UPDATED);
    auto moved = *store.find_issue("20001");
    ASSERT_EQ(moved.project_source_id, std::string("10001"));
    ASSERT_EQ(moved.project_local_id, store.find_project("10001")->local_id);
    ASSERT_TRUE(store.issues_for_project(store.find_project("10000")->local_id).empty());
}

void test_reconcile_requires_parent_for_unknown_issue()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);

    ASSERT_THROWS(model::ValidationError,
                  rec.resolve(issue("20001", "A", "", T1), Operation::UPDATED));
    ASSERT_THROWS(model::ValidationError,
                  rec.resolve(project("10000", "Platform", std::nullopt), Operation::UPDATED));

    rec.resolve(issue("20001", "A", "10000", T1), Operation::CREATED);
    auto known = rec.resolve(issue("20001", "B", "", T2), Operation::UPDATED);
    ASSERT_TRUE(known.outcome == UpsertOutcome::MERGED);
}

/**
 * @brief With `respect_local_edits`, a local edit newer than the incoming event wins.
 */
void test_reconcile_respects_local_edits()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler source_only(store, policy(infra::DeletePolicy::SOFT));
    Reconciler local_aware(store, policy(infra::DeletePolicy::SOFT,
                                         infra::StalenessMode::RESPECT_LOCAL_EDITS));

    source_only.resolve(project("10000", "Platform", T1), Operation::CREATED);
    store.touch_local(model::ExternalEntityRef{"10000", EntityKind::PROJECT}, T3);

    auto guarded = local_aware.resolve(project("10000", "Remote", T2), Operation::UPDATED);
    ASSERT_TRUE(guarded.outcome == UpsertOutcome::NOOP_STALE);
    ASSERT_EQ(store.find_project("10000")->name, std::string("Platform"));

    auto plain = source_only.resolve(project("10000", "Remote", T2), Operation::UPDATED);
    ASSERT_TRUE(plain.outcome == UpsertOutcome::MERGED);
    ASSERT_EQ(store.find_project("10000")->name, std::string("Remote"));
}

void test_reconcile_propagates_store_failures()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler seed(store);
    seed.resolve(project("10000", "Platform", T1), Operation::CREATED);

    RefusingStore conflicting(store, true, false);
    Reconciler rec(conflicting);
    ASSERT_THROWS(model::PersistenceConflict,
                  rec.resolve(project("10000", "Renamed", T2), Operation::UPDATED));
    ASSERT_EQ(store.find_project("10000")->name, std::string("Platform"));

    RefusingStore failing(store, false, true);
    Reconciler broken(failing);
    ASSERT_THROWS(model::StorageError,
                  broken.resolve(project("10001", "New", T1), Operation::CREATED));
    ASSERT_FALSE(store.find_project("10001").has_value());
}

/**
 * @brief Concurrent deliveries for one record serialize; the newest wins.
 */
void test_reconcile_concurrent_same_record()
{
    test::TempDir dir;
    storage::JournalStore store(dir.path);
    Reconciler rec(store);
    rec.resolve(project("10000", "Platform", T1), Operation::CREATED);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&rec, t]() {
            for (int i = 0; i < 20; ++i) {
                const infra::EpochMillis at = T1 + t * 100 + i;
                rec.resolve(issue("20001", "v" + std::to_string(at), "10000", at),
                            Operation::UPDATED);
            }
        });
    }
    for (auto& w : workers)
        w.join();

    const infra::EpochMillis newest = T1 + 7 * 100 + 19;
    auto stored = *store.find_issue("20001");
    ASSERT_EQ(store.count(EntityKind::ISSUE), static_cast<size_t>(1));
    ASSERT_EQ(stored.external_last_modified, newest);
    ASSERT_EQ(stored.summary, "v" + std::to_string(newest));
}

/**
 * @brief An issue moved to another project while the old project's delete is
 * cascading keeps its new parent and survives.
 */
void test_reconcile_cascade_skips_issue_moved_away()
{
    test::TempDir dir;
    storage::JournalStore journal(dir.path);
    ListingHookStore store(journal);
    Reconciler rec(store, policy(infra::DeletePolicy::HARD));

    rec.resolve(project("10000", "Platform", T1), Operation::CREATED);
    rec.resolve(project("10001", "Mobile", T1), Operation::CREATED);
    rec.resolve(issue("20001", "A", "10000", T1), Operation::CREATED);
    rec.resolve(issue("20002", "B", "10000", T1), Operation::CREATED);

    // Runs on another thread: the deleting thread holds only the old project's lock.
    store.on_listing([&rec]() {
        std::thread mover([&rec]() {
            rec.resolve(issue("20001", "A", "10001", T2), Operation::UPDATED);
        });
        mover.join();
    });

    auto res = rec.resolve(project("10000", "", T3), Operation::DELETED);
    ASSERT_TRUE(res.outcome == UpsertOutcome::DELETED);
    ASSERT_EQ(res.cascaded, static_cast<size_t>(1));

    auto survivor = journal.find_issue("20001");
    ASSERT_TRUE(survivor.has_value());
    ASSERT_EQ(survivor->project_source_id, std::string("10001"));
    ASSERT_EQ(survivor->project_local_id, journal.find_project("10001")->local_id);
    ASSERT_FALSE(journal.find_issue("20002").has_value());
    ASSERT_FALSE(journal.find_project("10000").has_value());
}
