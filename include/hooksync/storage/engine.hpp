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
 * @file engine.hpp
 * @brief Append-only journal files backing the record store.
 *
 * @details
 * Every record write becomes one frame appended to the journal of its entity kind
 * (`projects.hsj`, `issues.hsj`). On startup the store replays the frames in order;
 * the last frame for a source id wins.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hooksync::storage {

/**
 * @class Engine
 * @brief Durable, framed, append-only journal per entity kind.
 *
 * @details
 * **Frame Layout:**
 * `[4-byte LE payload length][4-byte LE FNV-1a checksum][N-byte UTF-8 JSON]`
 *
 * A frame is valid only if it is complete and its checksum matches. Replay stops
 * at the first invalid frame: a crash mid-append leaves at most one torn frame at
 * the tail, and everything before it is intact.
 */
class Engine {
  public:
    /**
     * @param base_path Directory holding the journal files.
     */
    explicit Engine(std::string base_path);

    /**
     * @brief Creates the journal directory if missing.
     *
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void init();

    /**
     * @brief Returns every valid frame of @p journal in write order.
     *
     * A missing file yields an empty list. Bytes after the last valid frame are
     * truncated away so that later appends stay replayable.
     */
    std::vector<std::string> load(const std::string& journal);

    /**
     * @brief Appends one frame and flushes it to the OS.
     *
     * @return false If the file could not be opened or written. The journal
     * then holds no trace of the frame.
     */
    bool append(const std::string& journal, std::string_view payload);

    /**
     * @brief Rewrites @p journal with exactly @p frames via temp file + rename.
     *
     * @return true If the new file replaced the old one.
     */
    bool compact(const std::string& journal, const std::vector<std::string>& frames);

    /// @brief Full path of a journal file, e.g. `<base>/issues.hsj`.
    std::string path_of(const std::string& journal) const;

    /// @brief 32-bit FNV-1a over @p data.
    static uint32_t checksum(std::string_view data);

  private:
    static void truncate_tail(const std::string& path, uintmax_t valid_bytes);

    std::string base_path_;
    std::set<std::string> damaged_; ///< Journals holding a partial frame.
};

} // namespace hooksync::storage
