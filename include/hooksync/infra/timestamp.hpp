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
 * @file timestamp.hpp
 * @brief ISO-8601 conversion for source-system modification times.
 *
 * @details
 * All times inside HookSync are `int64_t` milliseconds since the Unix epoch (UTC).
 * The staleness guard compares these values directly, so two spellings of the same
 * instant (`2025-01-01T01:00:00+01:00` and `2025-01-01T00:00:00Z`) must map to the
 * same number.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hooksync::infra {

/// @brief Milliseconds since 1970-01-01T00:00:00Z.
using EpochMillis = int64_t;

/**
 * @class Timestamp
 * @brief Static conversions between ISO-8601 text and `EpochMillis`.
 */
class Timestamp {
  public:
    /**
     * @brief Parses an ISO-8601 date-time.
     *
     * Accepted grammar:
     * `YYYY-MM-DD('T'|' ')hh:mm:ss[.fraction][Z | ±hh:mm | ±hhmm | ±hh]`.
     * A missing zone designator is read as UTC. Fractions beyond milliseconds are
     * truncated.
     *
     * @return The instant, or `std::nullopt` if @p text does not match the grammar
     * or names an impossible date.
     *
     * @code
     * Timestamp::parse("2018-05-07T14:03:57.764+0000"); // 1525701837764
     * @endcode
     */
    static std::optional<EpochMillis> parse(std::string_view text);

    /// @brief Formats as `YYYY-MM-DDThh:mm:ss.mmmZ`.
    static std::string format(EpochMillis millis);

    /// @brief Current wall-clock time.
    static EpochMillis now();
};

} // namespace hooksync::infra
