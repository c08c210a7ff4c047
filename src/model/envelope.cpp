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
 * @file envelope.cpp
 * @brief Names and keys for entity identities.
 */

#include "hooksync/model/envelope.hpp"

namespace hooksync::model {

const char* to_string(EntityKind kind)
{
    return kind == EntityKind::PROJECT ? "project" : "issue";
}

const char* to_string(Operation op)
{
    switch (op) {
    case Operation::CREATED:
        return "created";
    case Operation::UPDATED:
        return "updated";
    case Operation::DELETED:
        return "deleted";
    }
    return "unknown";
}

std::string event_name(const std::string& event_type)
{
    const auto colon = event_type.find(':');
    if (colon == std::string::npos)
        return event_type;
    return event_type.substr(colon + 1);
}

std::string ExternalEntityRef::key() const
{
    return std::string(to_string(kind)) + ":" + source_id;
}

} // namespace hooksync::model
