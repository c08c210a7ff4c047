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
 * @file errors.cpp
 * @brief Names for the pipeline error kinds.
 */

#include "hooksync/model/errors.hpp"

namespace hooksync::model {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::MALFORMED_PAYLOAD:
        return "malformed_payload";
    case ErrorKind::UNSUPPORTED_EVENT_TYPE:
        return "unsupported_event_type";
    case ErrorKind::VALIDATION_ERROR:
        return "validation_error";
    case ErrorKind::PERSISTENCE_CONFLICT:
        return "persistence_conflict";
    case ErrorKind::STORAGE_ERROR:
        return "storage_error";
    }
    return "unknown";
}

} // namespace hooksync::model
