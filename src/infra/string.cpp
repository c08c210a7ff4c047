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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 *
 * @note Every `<cctype>` call casts to `unsigned char` first; passing a negative
 * `char` to `std::isspace`/`std::tolower` is undefined behavior.
 */

#include "hooksync/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace hooksync::infra {

std::string String::trim(std::string_view s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    // [start, end] is inclusive.
    return std::string(start, end + 1);
}

std::string String::to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool String::iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool String::starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool String::ends_with(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::pair<std::string, std::string>> String::split_once(std::string_view s,
                                                                      char delim)
{
    const auto pos = s.find(delim);
    if (pos == std::string_view::npos)
        return std::nullopt;
    return std::make_pair(std::string(s.substr(0, pos)), std::string(s.substr(pos + 1)));
}

} // namespace hooksync::infra
