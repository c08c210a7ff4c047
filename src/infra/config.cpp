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
 * @file config.cpp
 * @brief JSON configuration loader.
 */

#include "hooksync/infra/config.hpp"

#include "hooksync/infra/string.hpp"
#include "hooksync/model/json.hpp"

#include <cJSON.h>
#include <fstream>
#include <sstream>

namespace hooksync::infra {

namespace {

std::string require_string(const cJSON* item)
{
    if (!cJSON_IsString(item) || item->valuestring == nullptr)
        throw ConfigError(std::string("Config: '") + item->string + "' must be a string");
    return item->valuestring;
}

long long require_integer(const cJSON* item, long long min, long long max)
{
    if (!cJSON_IsNumber(item))
        throw ConfigError(std::string("Config: '") + item->string + "' must be a number");
    const double v = item->valuedouble;
    if (v < static_cast<double>(min) || v > static_cast<double>(max) ||
        v != static_cast<double>(static_cast<long long>(v)))
        throw ConfigError(std::string("Config: '") + item->string + "' is out of range");
    return static_cast<long long>(v);
}

bool require_bool(const cJSON* item)
{
    if (!cJSON_IsBool(item))
        throw ConfigError(std::string("Config: '") + item->string + "' must be true or false");
    return cJSON_IsTrue(item) != 0;
}

void apply_key(Config& cfg, const cJSON* item)
{
    const std::string key = item->string ? item->string : "";

    if (key == "data_dir") {
        cfg.data_dir = require_string(item);
    } else if (key == "port") {
        cfg.port = static_cast<int>(require_integer(item, 1, 65535));
    } else if (key == "workers") {
        cfg.workers = static_cast<size_t>(require_integer(item, 1, 1024));
    } else if (key == "webhook_path") {
        cfg.webhook_path = require_string(item);
        if (!String::starts_with(cfg.webhook_path, "/"))
            throw ConfigError("Config: 'webhook_path' must start with '/'");
    } else if (key == "request_timeout_ms") {
        cfg.request_timeout_ms = static_cast<int>(require_integer(item, 1, 600000));
    } else if (key == "max_body_bytes") {
        cfg.max_body_bytes = static_cast<size_t>(require_integer(item, 64, 64LL * 1024 * 1024));
    } else if (key == "max_pending_ingests") {
        cfg.max_pending_ingests = static_cast<size_t>(require_integer(item, 1, 100000));
    } else if (key == "log_level") {
        auto level = Logger::parse_level(require_string(item));
        if (!level)
            throw ConfigError("Config: unknown log_level '" + require_string(item) + "'");
        cfg.log_level = *level;
    } else if (key == "log_color") {
        cfg.log_color = require_bool(item);
    } else if (key == "unsupported_events") {
        const std::string v = String::to_lower(require_string(item));
        if (v == "reject")
            cfg.unsupported_events = UnsupportedEventPolicy::REJECT;
        else if (v == "ignore")
            cfg.unsupported_events = UnsupportedEventPolicy::IGNORE;
        else
            throw ConfigError("Config: 'unsupported_events' must be 'reject' or 'ignore'");
    } else if (key == "delete_policy") {
        const std::string v = String::to_lower(require_string(item));
        if (v == "soft")
            cfg.delete_policy = DeletePolicy::SOFT;
        else if (v == "hard")
            cfg.delete_policy = DeletePolicy::HARD;
        else
            throw ConfigError("Config: 'delete_policy' must be 'soft' or 'hard'");
    } else if (key == "staleness_mode") {
        const std::string v = String::to_lower(require_string(item));
        if (v == "source_only")
            cfg.staleness_mode = StalenessMode::SOURCE_ONLY;
        else if (v == "respect_local_edits")
            cfg.staleness_mode = StalenessMode::RESPECT_LOCAL_EDITS;
        else
            throw ConfigError(
                "Config: 'staleness_mode' must be 'source_only' or 'respect_local_edits'");
    } else {
        Logger::log(LogLevel::WARN, "Config: Ignoring unknown key '" + key + "'");
    }
}

} // namespace

Config Config::from_json(const std::string& text)
{
    model::JsonPtr root(cJSON_Parse(text.c_str()));
    if (!root)
        throw ConfigError("Config: invalid JSON syntax");
    if (!cJSON_IsObject(root.get()))
        throw ConfigError("Config: root must be a JSON object");

    Config cfg;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        apply_key(cfg, item);
    }
    return cfg;
}

Config Config::load_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("Config: cannot open '" + path + "'");

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

void Config::apply_logging() const
{
    Logger::set_level(log_level);
    Logger::set_color(log_color);
}

std::string Config::describe() const
{
    std::ostringstream ss;
    ss << "data_dir='" << data_dir << "' port=" << port << " workers=" << workers
       << " path=" << webhook_path << " timeout_ms=" << request_timeout_ms
       << " backlog=" << max_pending_ingests
       << " unsupported=" << to_string(unsupported_events)
       << " delete=" << to_string(delete_policy) << " staleness=" << to_string(staleness_mode);
    return ss.str();
}

const char* to_string(UnsupportedEventPolicy policy)
{
    return policy == UnsupportedEventPolicy::REJECT ? "reject" : "ignore";
}

const char* to_string(DeletePolicy policy)
{
    return policy == DeletePolicy::SOFT ? "soft" : "hard";
}

const char* to_string(StalenessMode mode)
{
    return mode == StalenessMode::SOURCE_ONLY ? "source_only" : "respect_local_edits";
}

} // namespace hooksync::infra
