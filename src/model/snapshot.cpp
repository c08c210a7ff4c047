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
 * @file snapshot.cpp
 * @brief Field extraction for project and issue payloads.
 */

#include "hooksync/model/snapshot.hpp"

#include "hooksync/model/errors.hpp"


namespace hooksync::model {

namespace {

/// First non-null lookup among flat and `fields.`-nested spellings.
const cJSON* field(const cJSON* payload, const char* name)
{
    if (const cJSON* flat = cJSON_GetObjectItemCaseSensitive(payload, name))
        return flat;
    return find_path(payload, {"fields", name});
}

std::optional<std::string> text_field(const cJSON* payload, const char* name)
{
    return as_text(field(payload, name));
}

/// ISO-8601 string or epoch-millisecond number.
std::optional<infra::EpochMillis> read_time(const cJSON* node, const char* what)
{
    if (!node || cJSON_IsNull(node))
        return std::nullopt;
    if (auto millis = as_int64(node))
        return *millis;
    if (cJSON_IsString(node) && node->valuestring) {
        if (auto parsed = infra::Timestamp::parse(node->valuestring))
            return parsed;
    }
    throw ValidationError(std::string("Unreadable modification time in '") + what + "'");
}

std::optional<infra::EpochMillis> modification_time(const WebhookEnvelope& envelope)
{
    const cJSON* payload = envelope.entity_payload;
    if (auto t = read_time(cJSON_GetObjectItemCaseSensitive(payload, "lastModified"),
                           "lastModified"))
        return t;
    if (auto t = read_time(field(payload, "updated"), "updated"))
        return t;
    return envelope.timestamp;
}

} // namespace

ProjectSnapshot project_snapshot(const WebhookEnvelope& envelope)
{
    const cJSON* payload = envelope.entity_payload;

    ProjectSnapshot snap;
    snap.source_id = envelope.source_id;
    snap.key = text_field(payload, "key");
    snap.name = text_field(payload, "name");
    snap.description = text_field(payload, "description");
    snap.lead = text_field(payload, "lead");
    if (!snap.lead)
        snap.lead = text_field(payload, "projectLead");
    snap.modified_at = modification_time(envelope);
    return snap;
}

IssueSnapshot issue_snapshot(const WebhookEnvelope& envelope)
{
    const cJSON* payload = envelope.entity_payload;

    IssueSnapshot snap;
    snap.source_id = envelope.source_id;
    snap.key = text_field(payload, "key");
    snap.summary = text_field(payload, "summary");
    snap.status = text_field(payload, "status");
    snap.description = text_field(payload, "description");
    snap.priority = text_field(payload, "priority");
    snap.assignee = text_field(payload, "assignee");
    snap.issue_type = text_field(payload, "issuetype");
    if (!snap.issue_type)
        snap.issue_type = text_field(payload, "issueType");

    // Object reference first, then the flat projectId/projectKey pair.
    const cJSON* project = field(payload, "project");
    if (cJSON_IsObject(project)) {
        auto id = as_id(cJSON_GetObjectItemCaseSensitive(project, "id"));
        if (!id)
            throw ValidationError("Issue payload carries a project reference without an id");
        ProjectHint hint;
        hint.source_id = *id;
        hint.key = as_text(cJSON_GetObjectItemCaseSensitive(project, "key"));
        hint.name = as_text(cJSON_GetObjectItemCaseSensitive(project, "name"));
        snap.project = hint;
    } else if (const cJSON* project_id = field(payload, "projectId");
               project_id && !cJSON_IsNull(project_id)) {
        auto id = as_id(project_id);
        if (!id)
            throw ValidationError("Issue payload carries an unusable 'projectId'");
        ProjectHint hint;
        hint.source_id = *id;
        hint.key = text_field(payload, "projectKey");
        snap.project = hint;
    }

    snap.modified_at = modification_time(envelope);
    return snap;
}

} // namespace hooksync::model
