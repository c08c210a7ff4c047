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
 * @file journal_store.hpp
 * @brief In-memory record store made durable by the append-only `Engine`.
 *
 * @details
 * The full record set lives in hash maps keyed by source id. Each mutation is
 * first appended to the journal as a complete record image (or a tombstone), and
 * only then applied to memory, so a failed write leaves no partial state.
 */

#pragma once

#include "hooksync/storage/engine.hpp"
#include "hooksync/storage/record_store.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace hooksync::storage {

/**
 * @class JournalStore
 * @brief The production `RecordStore`.
 *
 * @details
 * **Concurrency Control:** a reader/writer lock guards the maps for the duration
 * of one record operation. Lookups share it; writes hold it exclusively while the
 * frame is appended and memory updated.
 *
 * **Recovery:** the constructor replays both journals. The last frame per source id
 * wins; tombstones remove. Journals with more than twice as many frames as live
 * records (and over 100 live records) are compacted right after replay.
 */
class JournalStore : public RecordStore {
  public:
    /**
     * @brief Opens (creating if needed) the journals in @p data_dir and replays them.
     *
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    explicit JournalStore(std::string data_dir);
    ~JournalStore() override;

    std::optional<model::ProjectRecord> find_project(const std::string& source_id) const override;
    std::optional<model::IssueRecord> find_issue(const std::string& source_id) const override;

    model::ProjectRecord insert_project(model::ProjectRecord record) override;
    model::IssueRecord insert_issue(model::IssueRecord record) override;

    model::ProjectRecord update_project(model::ProjectRecord record) override;
    model::IssueRecord update_issue(model::IssueRecord record) override;

    bool remove(const model::ExternalEntityRef& ref) override;

    std::vector<model::IssueRecord>
    issues_for_project(const std::string& project_local_id) const override;

    bool touch_local(const model::ExternalEntityRef& ref, infra::EpochMillis at) override;

    size_t count(model::EntityKind kind) const override;

    /**
     * @brief Rewrites both journals with only the live records.
     *
     * @return true If both journals were rewritten.
     */
    bool compact();

  private:
    Engine engine_;
    mutable std::shared_mutex rw_lock_;

    /// @brief Source id → record.
    std::unordered_map<std::string, model::ProjectRecord> projects_;
    std::unordered_map<std::string, model::IssueRecord> issues_;

    /// @brief Project local id → project source id.
    std::unordered_map<std::string, std::string> project_by_local_;

    /// @brief Project local id → source ids of the issues referencing it.
    std::unordered_map<std::string, std::unordered_set<std::string>> issues_by_project_;

    /// @brief Frames currently in each journal (live + superseded + tombstones).
    size_t project_frames_ = 0;
    size_t issue_frames_ = 0;

    void load_all();
    void persist(const std::string& journal, const std::string& frame);
    bool compact_locked();

    void index_issue(const model::IssueRecord& issue);
    void unindex_issue(const model::IssueRecord& issue);
};

} // namespace hooksync::storage
