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
 * @file test_support.hpp
 * @brief Shared fixtures: isolated journal directories and payload builders.
 */

#pragma once

#include "hooksync/infra/id_generator.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace hooksync::test {

/**
 * @class TempDir
 * @brief RAII infrastructure for isolated on-disk store environments.
 *
 * @details
 * - **Setup**: a fresh, uniquely named directory under the system temp path.
 * - **Teardown**: the directory and everything in it is removed.
 */
class TempDir {
  public:
    TempDir()
        : path((std::filesystem::temp_directory_path() /
                ("hooksync_test_" + infra::IdGenerator::generate()))
                   .string())
    {
        std::filesystem::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string path;
};

/// @brief Canonical-shape envelope around an entity object literal.
inline std::string envelope(const std::string& event_type, const std::string& entity,
                            const std::string& timestamp = "2024-01-15T10:00:00Z")
{
    return "{\"eventType\":\"" + event_type + "\",\"timestamp\":\"" + timestamp +
           "\",\"entityPayload\":" + entity + "}";
}

inline std::string project_json(const std::string& id, const std::string& key,
                                const std::string& name, const std::string& modified)
{
    return "{\"id\":\"" + id + "\",\"key\":\"" + key + "\",\"name\":\"" + name +
           "\",\"lastModified\":\"" + modified + "\"}";
}

inline std::string issue_json(const std::string& id, const std::string& key,
                              const std::string& summary, const std::string& project_id,
                              const std::string& modified)
{
    return "{\"id\":\"" + id + "\",\"key\":\"" + key + "\",\"summary\":\"" + summary +
           "\",\"project\":{\"id\":\"" + project_id + "\"},\"lastModified\":\"" + modified +
           "\"}";
}

} // namespace hooksync::test
