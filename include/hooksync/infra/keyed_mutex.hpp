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
 * @file keyed_mutex.hpp
 * @brief One mutex per string key, created on demand and released when idle.
 *
 * @details
 * Two webhooks for the same record must not interleave their read-modify-write,
 * while webhooks for different records must not wait on each other. A single
 * global lock gives the first property but not the second; a fixed stripe array
 * gives the second only probabilistically. `KeyedMutex` gives both: the registry
 * lock is held only to find or create the per-key entry, never while the caller's
 * critical section runs.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hooksync::infra {

class KeyedMutex {
  public:
    /**
     * @class Guard
     * @brief RAII ownership of one key. Movable, not copyable.
     */
    class Guard {
      public:
        Guard(KeyedMutex& owner, std::string key);
        ~Guard();

        Guard(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        const std::string& key() const { return key_; }

      private:
        KeyedMutex* owner_;
        std::string key_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    /**
     * @brief Blocks until @p key is exclusively owned by the caller.
     *
     * @code
     * auto guard = locks.acquire("issue:10001");
     * // read, decide, write
     * @endcode
     */
    Guard acquire(const std::string& key);

    /// @brief Number of keys currently held or waited on (diagnostics and tests).
    size_t active_keys() const;

  private:
    struct Entry {
        std::mutex mutex;
        size_t users = 0;
    };

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, Entry> entries_;

    void lock(const std::string& key);
    void unlock(const std::string& key);
};

} // namespace hooksync::infra
