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
 * @file json.hpp
 * @brief cJSON ownership and lookup helpers.
 *
 * @details
 * Every owned cJSON tree (parsed documents, response and journal objects,
 * config files) lives in a `JsonPtr`, so a throw anywhere in between frees it.
 * Borrowed nodes inside a tree stay plain `const cJSON*`.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>

namespace hooksync::model {

struct JsonDeleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};

/// @brief Owning handle for a cJSON tree.
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/**
 * @brief Walks nested object members, e.g. `{"fields", "status", "name"}`.
 *
 * @return The node, or `nullptr` if any step is missing or not an object.
 */
const cJSON* find_path(const cJSON* node, std::initializer_list<const char*> path);

/**
 * @brief Reads an identifier: a non-empty string, or an integral number rendered
 * without exponent or fraction (`10001` → `"10001"`).
 *
 * Numbers beyond ±2^53 are refused: a double no longer tells neighbouring
 * integers apart there, so two distinct ids could collapse into one.
 */
std::optional<std::string> as_id(const cJSON* node);

/**
 * @brief Reads a number as a 64-bit integer, truncating any fraction.
 *
 * @return `std::nullopt` for non-numbers, NaN, infinities, and values outside
 * the `int64_t` range.
 */
std::optional<std::int64_t> as_int64(const cJSON* node);

/**
 * @brief Reads a display value: a string, or the first of `name`, `displayName`,
 * `value` on an object (`{"name": "In Progress"}` → `"In Progress"`).
 *
 * `null` yields an empty string, so an explicit null clears the stored field.
 */
std::optional<std::string> as_text(const cJSON* node);

/// @brief Serializes without whitespace. Returns `""` for `nullptr`.
std::string print_compact(const cJSON* node);

} // namespace hooksync::model
