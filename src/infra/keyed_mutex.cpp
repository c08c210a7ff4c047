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
 * @file keyed_mutex.cpp
 * @brief Implementation of the per-key lock registry.
 */

#include "hooksync/infra/keyed_mutex.hpp"

#include <utility>

namespace hooksync::infra {

KeyedMutex::Guard::Guard(KeyedMutex& owner, std::string key)
    : owner_(&owner), key_(std::move(key))
{
    owner_->lock(key_);
}

KeyedMutex::Guard::~Guard()
{
    if (owner_)
        owner_->unlock(key_);
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_))
{
    other.owner_ = nullptr;
}

KeyedMutex::Guard KeyedMutex::acquire(const std::string& key)
{
    return Guard(*this, key);
}

size_t KeyedMutex::active_keys() const
{
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return entries_.size();
}

void KeyedMutex::lock(const std::string& key)
{
    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        // unordered_map nodes are stable, so the pointer survives later rehashes.
        entry = &entries_[key];
        ++entry->users;
    }
    entry->mutex.lock();
}

void KeyedMutex::unlock(const std::string& key)
{
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end())
        return;
    it->second.mutex.unlock();
    if (--it->second.users == 0)
        entries_.erase(it);
}

} // namespace hooksync::infra
