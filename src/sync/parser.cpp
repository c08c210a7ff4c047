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
 * @file parser.cpp
 * @brief Implementation of the payload parser.
 */

#include "hooksync/sync/parser.hpp"

#include "hooksync/infra/string.hpp"
#include "hooksync/model/errors.hpp"

#include <cJSON.h>

namespace hooksync::sync {

namespace {

std::string read_event_type(const cJSON* root)
{
    for (const char* name : {"eventType", "webhookEvent"}) {
        const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, name);
        if (!item)
            continue;
        if (!cJSON_IsString(item) || !item->valuestring || item->valuestring[0] == '\0')
            throw model::MalformedPayload(std::string("Field '") + name +
                                          "' must be a non-empty string");
        return item->valuestring;
    }
    throw model::MalformedPayload("Missing event type ('eventType' or 'webhookEvent')");
}

std::optional<infra::EpochMillis> read_timestamp(const cJSON* root)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, "timestamp");
    if (!item || cJSON_IsNull(item))
        return std::nullopt;

    if (cJSON_IsNumber(item)) {
        if (auto millis = model::as_int64(item))
            return *millis;
        throw model::MalformedPayload("Field 'timestamp' is not a representable epoch value");
    }
    if (cJSON_IsString(item) && item->valuestring) {
        if (auto parsed = infra::Timestamp::parse(item->valuestring))
            return parsed;
        throw model::MalformedPayload(std::string("Unparseable timestamp '") + item->valuestring +
                                      "'");
    }
    throw model::MalformedPayload("Field 'timestamp' must be a string or a number");
}

/**
 * Entity object lookup order:
 * 1. `entityPayload` (canonical shape).
 * 2. The member named after the tag's entity (`issue_updated` -> `issue`).
 * 3. Whichever of `issue` / `project` is present, so that an unknown tag still
 *    reaches the classifier.
 */
const cJSON* read_entity(cJSON* root, const std::string& event_type)
{
    if (cJSON* canonical = cJSON_GetObjectItemCaseSensitive(root, "entityPayload")) {
        if (!cJSON_IsObject(canonical))
            throw model::MalformedPayload("Field 'entityPayload' must be an object");
        return canonical;
    }

    const std::string name = model::event_name(event_type);
    if (auto parts = infra::String::split_once(name, '_')) {
        const cJSON* by_tag = cJSON_GetObjectItemCaseSensitive(root, parts->first.c_str());
        if (cJSON_IsObject(by_tag))
            return by_tag;
    }

    for (const char* member : {"issue", "project"}) {
        const cJSON* fallback = cJSON_GetObjectItemCaseSensitive(root, member);
        if (cJSON_IsObject(fallback))
            return fallback;
    }
    throw model::MalformedPayload("Missing entity payload object");
}

} // namespace

bool Parser::is_json_media_type(std::string_view content_type)
{
    std::string media = infra::String::to_lower(content_type);
    const auto semicolon = media.find(';');
    if (semicolon != std::string::npos)
        media.erase(semicolon);
    media = infra::String::trim(media);

    return media == "application/json" || infra::String::ends_with(media, "+json");
}

/**
 * @brief Decodes and validates the envelope.
 *
 * 1. **Media type** check (before touching the body).
 * 2. **JSON decode**; root must be an object.
 * 3. **Envelope fields**: event type, optional timestamp.
 * 4. **Entity**: locate the payload object and its identifying `id`.
 */
model::WebhookEnvelope Parser::parse(const std::string& body, const std::string& content_type)
{
    if (!infra::String::trim(content_type).empty() && !is_json_media_type(content_type))
        throw model::MalformedPayload("Unsupported content type '" + content_type + "'");

    if (infra::String::trim(body).empty())
        throw model::MalformedPayload("Empty request body");

    model::JsonPtr document(cJSON_Parse(body.c_str()));
    if (!document)
        throw model::MalformedPayload("Invalid JSON syntax");
    if (!cJSON_IsObject(document.get()))
        throw model::MalformedPayload("Request body must be a JSON object");

    model::WebhookEnvelope envelope;
    envelope.event_type = read_event_type(document.get());
    envelope.timestamp = read_timestamp(document.get());
    envelope.entity_payload = read_entity(document.get(), envelope.event_type);

    auto id = model::as_id(cJSON_GetObjectItemCaseSensitive(envelope.entity_payload, "id"));
    if (!id)
        throw model::MalformedPayload("Entity payload has no usable 'id' (missing, empty or "
                                      "not an exact integer)");
    envelope.source_id = *id;

    envelope.document = std::move(document);
    return envelope;
}

} // namespace hooksync::sync
