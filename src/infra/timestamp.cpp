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
 * @file timestamp.cpp
 * @brief Hand-written ISO-8601 scanner.
 *
 * @details
 * `std::get_time` cannot read fractional seconds or numeric zone offsets, both of
 * which the source system emits (`2018-05-07T14:03:57.764+0000`), so the fields are
 * scanned by position and converted with `timegm`.
 */

#include "hooksync/infra/timestamp.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace hooksync::infra {

namespace {

/// Reads exactly @p width digits at @p pos. Advances @p pos on success.
bool read_digits(std::string_view s, size_t& pos, size_t width, int& out)
{
    if (pos + width > s.size())
        return false;
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += width;
    return true;
}

bool expect(std::string_view s, size_t& pos, char c)
{
    if (pos >= s.size() || s[pos] != c)
        return false;
    ++pos;
    return true;
}

bool is_leap(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month)
{
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (month == 2 && is_leap(year)) ? 29 : kDays[month - 1];
}

} // namespace

std::optional<EpochMillis> Timestamp::parse(std::string_view text)
{
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day))
        return std::nullopt;

    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' '))
        return std::nullopt;
    ++pos;

    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second))
        return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
        minute > 59 || second > 60)
        return std::nullopt;

    int millis = 0;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3)
                millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (size_t d = digits; d < 3; ++d)
            millis *= 10;
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!read_digits(text, pos, 2, oh))
                return std::nullopt;
            if (pos < text.size()) {
                if (text[pos] == ':')
                    ++pos;
                if (!read_digits(text, pos, 2, om))
                    return std::nullopt;
            }
            if (oh > 23 || om > 59)
                return std::nullopt;
            offset_minutes = (oh * 60 + om) * (zone == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }

    if (pos != text.size())
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t seconds = timegm(&tm);

    return static_cast<EpochMillis>(seconds) * 1000 + millis -
           static_cast<EpochMillis>(offset_minutes) * 60 * 1000;
}

std::string Timestamp::format(EpochMillis millis)
{
    EpochMillis secs = millis / 1000;
    int frac = static_cast<int>(millis % 1000);
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }

    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return std::string(buf);
}

EpochMillis Timestamp::now()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace hooksync::infra
