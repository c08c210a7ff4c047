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
 * @file http.hpp
 * @brief Minimal HTTP/1.1 request head parser and response serializer.
 *
 * @details
 * Only what a webhook receiver needs: a request line, headers, and a body
 * delimited by `Content-Length`. Chunked transfer encoding is refused.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hooksync::network {

/// @brief Upper bound for the request line plus headers.
constexpr size_t kMaxHeadBytes = 16 * 1024;

/**
 * @class HttpError
 * @brief A request that must be answered with @ref status and closed.
 */
class HttpError : public std::runtime_error {
  public:
    HttpError(int status, const std::string& msg) : std::runtime_error(msg), status_(status) {}
    int status() const { return status_; }

  private:
    int status_;
};

struct HttpRequest {
    std::string method;
    std::string target;
    std::string version;
    /// @brief Header names are stored lower-cased.
    std::map<std::string, std::string> headers;
    size_t content_length = 0;
    std::string body;

    /// @brief Case-insensitive header lookup.
    std::optional<std::string> header(const std::string& name) const;
    /// @brief Request target without the query string.
    std::string path() const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    /// @brief Full wire form including `Content-Length` and `Connection: close`.
    std::string serialize() const;
};

/// @brief Standard reason phrase, `"Unknown"` for unmapped codes.
const char* reason_phrase(int status);

/**
 * @brief Parses the request head contained in @p buffer.
 *
 * @param buffer Bytes received so far.
 * @param head_length Set to the offset of the first body byte on success.
 * @return The request without body, or `std::nullopt` if the head is incomplete.
 * @throws HttpError 400 on a malformed head, 431 on an oversized head, 501 on
 * chunked transfer encoding.
 */
std::optional<HttpRequest> parse_head(std::string_view buffer, size_t& head_length);

/// @brief JSON error body `{"status":"error","reason":"..."}`.
HttpResponse error_response(int status, const std::string& reason);

} // namespace hooksync::network
