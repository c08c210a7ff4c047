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
 * @file json.cpp
 * @brief cJSON lookup helpers.
 */

#include "hooksync/model/json.hpp"

#include "hooksync/model/errors.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace hooksync::model {

const cJSON* find_path(const cJSON* node, std::initializer_list<const char*> path)
{
    const cJSON* current = node;
    for (const char* step : path) {
        if (!cJSON_IsObject(current))
            return nullptr;
        current = cJSON_GetObjectItemCaseSensitive(current, step);
        if (!current)
            return nullptr;
    }
    return current;
}

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53
constexpr double kInt64Bound = 9223372036854775808.0;   // 2^63

} // namespace

std::optional<std::string> as_id(const cJSON* node)
{
    if (cJSON_IsString(node) && node->valuestring && node->valuestring[0] != '\0')
        return std::string(node->valuestring);

    if (cJSON_IsNumber(node)) {
        const double v = node->valuedouble;
        if (!std::isfinite(v) || v != std::floor(v) || std::fabs(v) > kMaxExactInteger)
            return std::nullopt;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
        return std::string(buf);
    }
    return std::nullopt;
}

std::optional<std::int64_t> as_int64(const cJSON* node)
{
    if (!cJSON_IsNumber(node))
        return std::nullopt;
    const double v = node->valuedouble;
    if (!std::isfinite(v) || v >= kInt64Bound || v < -kInt64Bound)
        return std::nullopt;
    return static_cast<std::int64_t>(v);
}

std::optional<std::string> as_text(const cJSON* node)
{
    if (!node)
        return std::nullopt;
    if (cJSON_IsNull(node))
        return std::string();
    if (cJSON_IsString(node) && node->valuestring)
        return std::string(node->valuestring);
    if (cJSON_IsObject(node)) {
        for (const char* member : {"name", "displayName", "value"}) {
            const cJSON* inner = cJSON_GetObjectItemCaseSensitive(node, member);
            if (cJSON_IsString(inner) && inner->valuestring)
                return std::string(inner->valuestring);
        }
    }
    return std::nullopt;
}

std::string print_compact(const cJSON* node)
{
    if (!node)
        return "";
    char* raw = cJSON_PrintUnformatted(node);
    if (!raw)
        throw StorageError("JSON: serialization failed (out of memory)");
    std::string out(raw);
    free(raw);
    return out;
}

} // namespace hooksync::model
