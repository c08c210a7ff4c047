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
 * @file http.cpp
 * @brief HTTP/1.1 codec implementation.
 */

#include "hooksync/network/http.hpp"

#include "hooksync/infra/string.hpp"
#include "hooksync/model/json.hpp"

#include <cJSON.h>
#include <cctype>

namespace hooksync::network {

namespace {

size_t parse_content_length(const std::string& value)
{
    const std::string trimmed = infra::String::trim(value);
    if (trimmed.empty() || trimmed.size() > 18)
        throw HttpError(400, "Invalid Content-Length");
    size_t length = 0;
    for (char c : trimmed) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw HttpError(400, "Invalid Content-Length");
        length = length * 10 + static_cast<size_t>(c - '0');
    }
    return length;
}

} // namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const
{
    auto it = headers.find(infra::String::to_lower(name));
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

std::string HttpRequest::path() const
{
    const auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}

const char* reason_phrase(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 202:
        return "Accepted";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 408:
        return "Request Timeout";
    case 413:
        return "Payload Too Large";
    case 422:
        return "Unprocessable Entity";
    case 431:
        return "Request Header Fields Too Large";
    case 500:
        return "Internal Server Error";
    case 501:
        return "Not Implemented";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}

std::string HttpResponse::serialize() const
{
    std::string out;
    out.reserve(body.size() + 128);
    out += "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
    out += "Content-Type: " + content_type + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

/**
 * @brief Head parsing.
 *
 * 1. **Framing:** wait for the blank line; enforce `kMaxHeadBytes`.
 * 2. **Request line:** exactly three space-separated tokens, `HTTP/1.x` version.
 * 3. **Headers:** `name: value` lines, names lower-cased; obsolete line folding refused.
 * 4. **Body framing:** `Content-Length` only.
 */
std::optional<HttpRequest> parse_head(std::string_view buffer, size_t& head_length)
{
    const auto end = buffer.find("\r\n\r\n");
    if (end == std::string_view::npos) {
        if (buffer.size() > kMaxHeadBytes)
            throw HttpError(431, "Request head too large");
        return std::nullopt;
    }
    if (end > kMaxHeadBytes)
        throw HttpError(431, "Request head too large");

    head_length = end + 4;
    const std::string_view head = buffer.substr(0, end);

    HttpRequest req;
    const auto line_end = head.find("\r\n");
    const std::string_view request_line = head.substr(0, line_end);

    const auto sp1 = request_line.find(' ');
    const auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
        request_line.find(' ', sp2 + 1) != std::string_view::npos)
        throw HttpError(400, "Malformed request line");

    req.method = std::string(request_line.substr(0, sp1));
    req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
    req.version = std::string(request_line.substr(sp2 + 1));
    if (req.method.empty() || req.target.empty() ||
        !infra::String::starts_with(req.version, "HTTP/1."))
        throw HttpError(400, "Malformed request line");

    size_t pos = line_end == std::string_view::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        if (next == std::string_view::npos)
            next = head.size();
        const std::string_view line = head.substr(pos, next - pos);
        pos = next + 2;

        if (line.empty())
            continue;
        if (line.front() == ' ' || line.front() == '\t')
            throw HttpError(400, "Folded header lines are not supported");

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            throw HttpError(400, "Malformed header line");

        const std::string name = infra::String::to_lower(line.substr(0, colon));
        req.headers[name] = infra::String::trim(line.substr(colon + 1));
    }

    if (auto te = req.header("transfer-encoding")) {
        if (!infra::String::iequals(*te, "identity"))
            throw HttpError(501, "Transfer-Encoding '" + *te + "' is not supported");
    }
    if (auto cl = req.header("content-length"))
        req.content_length = parse_content_length(*cl);

    return req;
}

HttpResponse error_response(int status, const std::string& reason)
{
    model::JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "status", "error");
    cJSON_AddStringToObject(root.get(), "reason", reason.c_str());

    HttpResponse resp;
    resp.status = status;
    resp.body = model::print_compact(root.get());
    return resp;
}

} // namespace hooksync::network
