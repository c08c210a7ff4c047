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
 * @file parser.hpp
 * @brief First pipeline stage: raw request body to `WebhookEnvelope`.
 */

#pragma once

#include "hooksync/model/envelope.hpp"

#include <string>
#include <string_view>

namespace hooksync::sync {

/**
 * @class Parser
 * @brief Stateless decoder for inbound notifications.
 *
 * @details
 * Two body shapes are understood:
 * 1. **Canonical:** `{"eventType": "...", "timestamp": "...", "entityPayload": {...}}`.
 * 2. **Native Jira:** `{"webhookEvent": "...", "timestamp": 1525698237764, "issue": {...}}`
 *    (or `"project": {...}`). The entity object is chosen from the event tag.
 *
 * The parser has no side effects and never consults the store.
 */
class Parser {
  public:
    /**
     * @brief Decodes one request body.
     *
     * @param body Raw request bytes.
     * @param content_type Value of the `Content-Type` header; empty if absent.
     *
     * @throws model::MalformedPayload On a non-JSON content type, an empty or invalid
     * body, a missing event type, a missing entity object or identifier, or an
     * unreadable `timestamp`.
     */
    static model::WebhookEnvelope parse(const std::string& body,
                                        const std::string& content_type = "");

    /// @brief `application/json` or any `+json` type. Parameters are ignored.
    static bool is_json_media_type(std::string_view content_type);
};

} // namespace hooksync::sync
