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
 * @file journal_store.cpp
 * @brief Implementation of the journal-backed record store.
 *
 * @details
 * Frame payloads are JSON objects. A record frame carries the complete record
 * image; a tombstone frame is `{"sourceId": "...", "_deleted": true}`.
 */

#include "hooksync/storage/journal_store.hpp"

#include "hooksync/infra/id_generator.hpp"
#include "hooksync/infra/logger.hpp"
#include "hooksync/model/errors.hpp"
#include "hooksync/model/json.hpp"

#include <cJSON.h>
#include <mutex>

namespace hooksync::storage {

namespace {

const char* const kProjectJournal = "projects";
const char* const kIssueJournal = "issues";

std::string get_string(const cJSON* obj, const char* name)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, name);
    return (cJSON_IsString(item) && item->valuestring) ? item->valuestring : "";
}

int64_t get_number(const cJSON* obj, const char* name)
{
    return model::as_int64(cJSON_GetObjectItemCaseSensitive(obj, name)).value_or(0);
}

bool get_bool(const cJSON* obj, const char* name, bool fallback)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, name);
    return cJSON_IsBool(item) ? cJSON_IsTrue(item) != 0 : fallback;
}

model::JsonPtr new_frame_object()
{
    model::JsonPtr root(cJSON_CreateObject());
    if (!root)
        throw model::StorageError("Store: out of memory building a journal frame");
    return root;
}

std::string encode(const model::ProjectRecord& r)
{
    model::JsonPtr root = new_frame_object();
    cJSON* obj = root.get();
    cJSON_AddStringToObject(obj, "localId", r.local_id.c_str());
    cJSON_AddStringToObject(obj, "sourceId", r.source_id.c_str());
    cJSON_AddStringToObject(obj, "key", r.key.c_str());
    cJSON_AddStringToObject(obj, "name", r.name.c_str());
    cJSON_AddStringToObject(obj, "description", r.description.c_str());
    cJSON_AddStringToObject(obj, "lead", r.lead.c_str());
    cJSON_AddBoolToObject(obj, "placeholder", r.placeholder);
    cJSON_AddBoolToObject(obj, "active", r.active);
    cJSON_AddNumberToObject(obj, "externalLastModified", static_cast<double>(r.external_last_modified));
    cJSON_AddNumberToObject(obj, "lastSyncedAt", static_cast<double>(r.last_synced_at));
    cJSON_AddNumberToObject(obj, "localTouchedAt", static_cast<double>(r.local_touched_at));
    cJSON_AddNumberToObject(obj, "revision", static_cast<double>(r.revision));

    return model::print_compact(obj);
}

std::string encode(const model::IssueRecord& r)
{
    model::JsonPtr root = new_frame_object();
    cJSON* obj = root.get();
    cJSON_AddStringToObject(obj, "localId", r.local_id.c_str());
    cJSON_AddStringToObject(obj, "sourceId", r.source_id.c_str());
    cJSON_AddStringToObject(obj, "key", r.key.c_str());
    cJSON_AddStringToObject(obj, "summary", r.summary.c_str());
    cJSON_AddStringToObject(obj, "status", r.status.c_str());
    cJSON_AddStringToObject(obj, "description", r.description.c_str());
    cJSON_AddStringToObject(obj, "priority", r.priority.c_str());
    cJSON_AddStringToObject(obj, "assignee", r.assignee.c_str());
    cJSON_AddStringToObject(obj, "issueType", r.issue_type.c_str());
    cJSON_AddStringToObject(obj, "projectLocalId", r.project_local_id.c_str());
    cJSON_AddStringToObject(obj, "projectSourceId", r.project_source_id.c_str());
    cJSON_AddBoolToObject(obj, "active", r.active);
    cJSON_AddNumberToObject(obj, "externalLastModified", static_cast<double>(r.external_last_modified));
    cJSON_AddNumberToObject(obj, "lastSyncedAt", static_cast<double>(r.last_synced_at));
    cJSON_AddNumberToObject(obj, "localTouchedAt", static_cast<double>(r.local_touched_at));
    cJSON_AddNumberToObject(obj, "revision", static_cast<double>(r.revision));

    return model::print_compact(obj);
}

std::string encode_tombstone(const std::string& source_id)
{
    model::JsonPtr root = new_frame_object();
    cJSON* obj = root.get();
    cJSON_AddStringToObject(obj, "sourceId", source_id.c_str());
    cJSON_AddBoolToObject(obj, "_deleted", true);
    return model::print_compact(obj);
}

model::ProjectRecord decode_project(const cJSON* obj)
{
    model::ProjectRecord r;
    r.local_id = get_string(obj, "localId");
    r.source_id = get_string(obj, "sourceId");
    r.key = get_string(obj, "key");
    r.name = get_string(obj, "name");
    r.description = get_string(obj, "description");
    r.lead = get_string(obj, "lead");
    r.placeholder = get_bool(obj, "placeholder", false);
    r.active = get_bool(obj, "active", true);
    r.external_last_modified = get_number(obj, "externalLastModified");
    r.last_synced_at = get_number(obj, "lastSyncedAt");
    r.local_touched_at = get_number(obj, "localTouchedAt");
    r.revision = static_cast<uint64_t>(get_number(obj, "revision"));
    return r;
}

model::IssueRecord decode_issue(const cJSON* obj)
{
    model::IssueRecord r;
    r.local_id = get_string(obj, "localId");
    r.source_id = get_string(obj, "sourceId");
    r.key = get_string(obj, "key");
    r.summary = get_string(obj, "summary");
    r.status = get_string(obj, "status");
    r.description = get_string(obj, "description");
    r.priority = get_string(obj, "priority");
    r.assignee = get_string(obj, "assignee");
    r.issue_type = get_string(obj, "issueType");
    r.project_local_id = get_string(obj, "projectLocalId");
    r.project_source_id = get_string(obj, "projectSourceId");
    r.active = get_bool(obj, "active", true);
    r.external_last_modified = get_number(obj, "externalLastModified");
    r.last_synced_at = get_number(obj, "lastSyncedAt");
    r.local_touched_at = get_number(obj, "localTouchedAt");
    r.revision = static_cast<uint64_t>(get_number(obj, "revision"));
    return r;
}

/// Generic replay: last image per source id wins, tombstones erase.
template <typename Record, typename Decode>
size_t replay(const std::vector<std::string>& frames, const std::string& journal,
              std::unordered_map<std::string, Record>& out, Decode decode)
{
    size_t applied = 0;
    for (const auto& frame : frames) {
        model::JsonPtr doc(cJSON_Parse(frame.c_str()));
        if (!doc || !cJSON_IsObject(doc.get())) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Store: Undecodable frame in " + journal + ". Skipping.");
            continue;
        }

        const std::string source_id = get_string(doc.get(), "sourceId");
        if (source_id.empty()) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Store: Frame without sourceId in " + journal + ". Skipping.");
            continue;
        }

        if (get_bool(doc.get(), "_deleted", false)) {
            out.erase(source_id);
        } else {
            out[source_id] = decode(doc.get());
        }
        ++applied;
    }
    return applied;
}

} // namespace

JournalStore::JournalStore(std::string data_dir) : engine_(std::move(data_dir))
{
    infra::Logger::log(infra::LogLevel::INFO, "Store: Opening record journals...");
    engine_.init();
    load_all();
    infra::Logger::log(infra::LogLevel::INFO,
                       "Store: Online with " + std::to_string(projects_.size()) + " projects, " +
                           std::to_string(issues_.size()) + " issues.");
}

JournalStore::~JournalStore()
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Closing record journals.");
}

/**
 * @brief Rebuilds memory from both journals.
 *
 * **Replay Strategy:**
 * 1. **Projects first**, so that issue foreign keys can be checked.
 * 2. **Issues**, dropping any whose project is missing (a torn project journal tail
 *    must not leave orphans in memory).
 * 3. **Indexing** of local ids and project → issue links.
 * 4. **Compaction heuristic** when a journal is mostly superseded frames.
 */
void JournalStore::load_all()
{
    std::unique_lock lock(rw_lock_);

    const auto project_frames = engine_.load(kProjectJournal);
    replay(project_frames, kProjectJournal, projects_, decode_project);
    project_frames_ = project_frames.size();

    const auto issue_frames = engine_.load(kIssueJournal);
    replay(issue_frames, kIssueJournal, issues_, decode_issue);
    issue_frames_ = issue_frames.size();

    for (const auto& [source_id, project] : projects_) {
        project_by_local_[project.local_id] = source_id;
    }

    for (auto it = issues_.begin(); it != issues_.end();) {
        if (!project_by_local_.count(it->second.project_local_id)) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Store: Issue " + it->first +
                                   " references a missing project. Dropped from memory.");
            it = issues_.erase(it);
            continue;
        }
        index_issue(it->second);
        ++it;
    }

    const size_t live = projects_.size() + issues_.size();
    const size_t frames = project_frames_ + issue_frames_;
    if (frames > live * 2 && live > 100) {
        infra::Logger::log(infra::LogLevel::INFO, "Maintenance: Auto-compacting record journals.");
        compact_locked();
    }
}

void JournalStore::persist(const std::string& journal, const std::string& frame)
{
    if (!engine_.append(journal, frame)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Store: Journal append failed for " + journal);
        throw model::StorageError("Journal append failed for " + journal);
    }
    if (journal == kProjectJournal)
        ++project_frames_;
    else
        ++issue_frames_;
}

void JournalStore::index_issue(const model::IssueRecord& issue)
{
    issues_by_project_[issue.project_local_id].insert(issue.source_id);
}

void JournalStore::unindex_issue(const model::IssueRecord& issue)
{
    auto it = issues_by_project_.find(issue.project_local_id);
    if (it == issues_by_project_.end())
        return;
    it->second.erase(issue.source_id);
    if (it->second.empty())
        issues_by_project_.erase(it);
}

std::optional<model::ProjectRecord> JournalStore::find_project(const std::string& source_id) const
{
    std::shared_lock lock(rw_lock_);
    auto it = projects_.find(source_id);
    if (it == projects_.end())
        return std::nullopt;
    return it->second;
}

std::optional<model::IssueRecord> JournalStore::find_issue(const std::string& source_id) const
{
    std::shared_lock lock(rw_lock_);
    auto it = issues_.find(source_id);
    if (it == issues_.end())
        return std::nullopt;
    return it->second;
}

model::ProjectRecord JournalStore::insert_project(model::ProjectRecord record)
{
    std::unique_lock lock(rw_lock_);
    if (projects_.count(record.source_id))
        throw model::PersistenceConflict("Project " + record.source_id + " already exists");

    if (record.local_id.empty())
        record.local_id = infra::IdGenerator::generate("prj-");
    record.revision = 1;

    persist(kProjectJournal, encode(record));

    project_by_local_[record.local_id] = record.source_id;
    projects_[record.source_id] = record;
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Store: Inserted project " + record.source_id + " -> " + record.local_id);
    return record;
}

model::IssueRecord JournalStore::insert_issue(model::IssueRecord record)
{
    std::unique_lock lock(rw_lock_);
    if (issues_.count(record.source_id))
        throw model::PersistenceConflict("Issue " + record.source_id + " already exists");
    if (!project_by_local_.count(record.project_local_id))
        throw model::PersistenceConflict("Issue " + record.source_id +
                                         " references unknown project " + record.project_local_id);

    if (record.local_id.empty())
        record.local_id = infra::IdGenerator::generate("iss-");
    record.revision = 1;

    persist(kIssueJournal, encode(record));

    issues_[record.source_id] = record;
    index_issue(record);
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Store: Inserted issue " + record.source_id + " -> " + record.local_id);
    return record;
}

model::ProjectRecord JournalStore::update_project(model::ProjectRecord record)
{
    std::unique_lock lock(rw_lock_);
    auto it = projects_.find(record.source_id);
    if (it == projects_.end())
        throw model::PersistenceConflict("Project " + record.source_id + " vanished before update");
    if (it->second.revision != record.revision)
        throw model::PersistenceConflict("Project " + record.source_id + " revision " +
                                         std::to_string(record.revision) + " is outdated (stored " +
                                         std::to_string(it->second.revision) + ")");

    // Identity columns are immutable.
    record.local_id = it->second.local_id;
    record.revision = it->second.revision + 1;

    persist(kProjectJournal, encode(record));
    it->second = record;
    return record;
}

model::IssueRecord JournalStore::update_issue(model::IssueRecord record)
{
    std::unique_lock lock(rw_lock_);
    auto it = issues_.find(record.source_id);
    if (it == issues_.end())
        throw model::PersistenceConflict("Issue " + record.source_id + " vanished before update");
    if (it->second.revision != record.revision)
        throw model::PersistenceConflict("Issue " + record.source_id + " revision " +
                                         std::to_string(record.revision) + " is outdated (stored " +
                                         std::to_string(it->second.revision) + ")");
    if (!project_by_local_.count(record.project_local_id))
        throw model::PersistenceConflict("Issue " + record.source_id +
                                         " references unknown project " + record.project_local_id);

    record.local_id = it->second.local_id;
    record.revision = it->second.revision + 1;

    persist(kIssueJournal, encode(record));

    if (it->second.project_local_id != record.project_local_id) {
        unindex_issue(it->second);
        index_issue(record);
    }
    it->second = record;
    return record;
}

bool JournalStore::remove(const model::ExternalEntityRef& ref)
{
    std::unique_lock lock(rw_lock_);

    if (ref.kind == model::EntityKind::PROJECT) {
        auto it = projects_.find(ref.source_id);
        if (it == projects_.end())
            return false;
        if (issues_by_project_.count(it->second.local_id))
            throw model::PersistenceConflict("Project " + ref.source_id +
                                             " still owns issues; remove them first");

        persist(kProjectJournal, encode_tombstone(ref.source_id));
        project_by_local_.erase(it->second.local_id);
        projects_.erase(it);
        return true;
    }

    auto it = issues_.find(ref.source_id);
    if (it == issues_.end())
        return false;

    persist(kIssueJournal, encode_tombstone(ref.source_id));
    unindex_issue(it->second);
    issues_.erase(it);
    return true;
}

std::vector<model::IssueRecord>
JournalStore::issues_for_project(const std::string& project_local_id) const
{
    std::shared_lock lock(rw_lock_);
    std::vector<model::IssueRecord> out;
    auto it = issues_by_project_.find(project_local_id);
    if (it == issues_by_project_.end())
        return out;

    out.reserve(it->second.size());
    for (const auto& source_id : it->second) {
        auto issue = issues_.find(source_id);
        if (issue != issues_.end())
            out.push_back(issue->second);
    }
    return out;
}

bool JournalStore::touch_local(const model::ExternalEntityRef& ref, infra::EpochMillis at)
{
    std::unique_lock lock(rw_lock_);

    if (ref.kind == model::EntityKind::PROJECT) {
        auto it = projects_.find(ref.source_id);
        if (it == projects_.end())
            return false;
        model::ProjectRecord next = it->second;
        next.local_touched_at = at;
        next.revision += 1;
        persist(kProjectJournal, encode(next));
        it->second = next;
        return true;
    }

    auto it = issues_.find(ref.source_id);
    if (it == issues_.end())
        return false;
    model::IssueRecord next = it->second;
    next.local_touched_at = at;
    next.revision += 1;
    persist(kIssueJournal, encode(next));
    it->second = next;
    return true;
}

size_t JournalStore::count(model::EntityKind kind) const
{
    std::shared_lock lock(rw_lock_);
    return kind == model::EntityKind::PROJECT ? projects_.size() : issues_.size();
}

bool JournalStore::compact()
{
    std::unique_lock lock(rw_lock_);
    return compact_locked();
}

bool JournalStore::compact_locked()
{
    std::vector<std::string> project_frames;
    project_frames.reserve(projects_.size());
    for (const auto& [id, project] : projects_)
        project_frames.push_back(encode(project));

    std::vector<std::string> issue_frames;
    issue_frames.reserve(issues_.size());
    for (const auto& [id, issue] : issues_)
        issue_frames.push_back(encode(issue));

    bool ok = engine_.compact(kProjectJournal, project_frames);
    if (ok)
        project_frames_ = project_frames.size();
    const bool issues_ok = engine_.compact(kIssueJournal, issue_frames);
    if (issues_ok)
        issue_frames_ = issue_frames.size();
    ok = ok && issues_ok;

    if (ok)
        infra::Logger::log(infra::LogLevel::DEBUG, "Maintenance: Journal compaction complete.");
    else
        infra::Logger::log(infra::LogLevel::ERROR, "Maintenance: Journal compaction failed.");
    return ok;
}

} // namespace hooksync::storage
