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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless text helpers shared by the HTTP codec (header names, media types),
 * the payload parser (event-type tags) and the configuration loader.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace hooksync::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if @p s is blank.
     *
     * @code
     * std::string clean = hooksync::infra::String::trim("  application/json \r"); // "application/json"
     * @endcode
     */
    static std::string trim(std::string_view s);

    /// @brief ASCII lower-casing. Non-ASCII bytes are passed through.
    static std::string to_lower(std::string_view s);

    /// @brief ASCII case-insensitive equality.
    static bool iequals(std::string_view a, std::string_view b);

    /// @brief True if @p s begins with @p prefix.
    static bool starts_with(std::string_view s, std::string_view prefix);

    /// @brief True if @p s ends with @p suffix.
    static bool ends_with(std::string_view s, std::string_view suffix);

    /**
     * @brief Splits @p s at the first occurrence of @p delim.
     *
     * @return The parts before and after the delimiter, or `std::nullopt` if
     * @p delim does not occur.
     *
     * @code
     * auto parts = String::split_once("jira:issue_created", ':'); // {"jira", "issue_created"}
     * @endcode
     */
    static std::optional<std::pair<std::string, std::string>> split_once(std::string_view s,
                                                                         char delim);
};

} // namespace hooksync::infra
