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
 * @file id_generator.hpp
 * @brief Generator for local record identifiers.
 *
 * @details
 * Local records carry an internal identifier that is independent of the source
 * system's key. It is what foreign keys point at (issue → project), so a project
 * keeps its local id when the source system renames its key.
 */

#pragma once

#include <string>
#include <string_view>

namespace hooksync::infra {

/**
 * @class IdGenerator
 * @brief A static utility for generating RFC 4122 Version 4 UUIDs.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random Version 4 UUID string, optionally prefixed.
     *
     * Output format: `<prefix>xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`, where `y` is one
     * of `{8, 9, a, b}`.
     *
     * @param prefix Prepended verbatim (e.g. `"prj-"`). Empty by default.
     *
     * @code
     * std::string local_id = hooksync::infra::IdGenerator::generate("iss-");
     * @endcode
     */
    static std::string generate(std::string_view prefix = {});
};

} // namespace hooksync::infra
