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
 * @file server.cpp
 * @brief Implementation of the webhook HTTP server.
 *
 * @details
 * This file implements the listener loop, client connection management, and the
 * hand-off of ingest work to the pipeline pool. It handles the raw BSD socket API.
 */

#include "hooksync/network/server.hpp"

#include "hooksync/infra/logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace hooksync::network {

Server::Server(sync::Ingestor& ingestor, const infra::Config& config)
    : ingestor_(ingestor), port_(config.port), webhook_path_(config.webhook_path),
      request_timeout_ms_(config.request_timeout_ms), max_body_bytes_(config.max_body_bytes),
      max_pending_ingests_(config.max_pending_ingests), server_fd_(-1), running_(false),
      ingest_backlog_(0), pipeline_(config.workers), connections_(config.workers)
{
}

Server::~Server()
{
    stop();
}

/**
 * @brief Gracefully terminates the server.
 *
 * 1. Clears the running flag to stop new accepts.
 * 2. Closes the listener to unblock `accept()`.
 * 3. Shuts down active client sockets so that blocked reads return.
 */
void Server::stop()
{
    if (!running_)
        return;
    running_ = false;

    infra::Logger::log(infra::LogLevel::INFO,
                       "Network: Shutdown signal received. Stopping server...");

    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    // Shutdown only; the owning worker closes its descriptor in remove_client().
    std::lock_guard<std::mutex> lock(client_mutex_);
    for (int sock : client_sockets_) {
        shutdown(sock, SHUT_RDWR);
    }
}

void Server::run()
{
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to create socket.");
        throw std::runtime_error("socket() failed: " + std::string(std::strerror(errno)));
    }

    // Allow immediate address reuse for quick restarts
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        infra::Logger::log(infra::LogLevel::WARN, "Network: setsockopt(SO_REUSEADDR) failed.");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        const std::string reason = std::strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        infra::Logger::log(infra::LogLevel::FATAL,
                           "Network: Failed to bind to port " + std::to_string(port_));
        throw std::runtime_error("bind() failed on port " + std::to_string(port_) + ": " + reason);
    }

    if (listen(server_fd_, 128) < 0) {
        const std::string reason = std::strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to listen.");
        throw std::runtime_error("listen() failed: " + reason);
    }

    running_ = true;
    infra::Logger::log(infra::LogLevel::INFO, "Network: HookSync listening on port " +
                                                  std::to_string(port_) + ", webhook path " +
                                                  webhook_path_);

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        const int sock = accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &len);

        if (sock >= 0) {
            if (!running_) {
                close(sock);
                break;
            }

            char ip[INET_ADDRSTRLEN] = {0};
            const char* client_ip = inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Connection from " +
                                                           std::string(client_ip ? ip : "unknown"));

            add_client(sock);
            try {
                connections_.enqueue([this, sock]() { this->handle_client(sock); });
            } catch (const std::exception& e) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   std::string("Network: Could not schedule connection: ") +
                                       e.what());
                remove_client(sock);
            }
        } else if (running_) {
            if (errno == EINTR)
                continue;
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Network: Accept failed (" + std::string(std::strerror(errno)) + ")");
        } else {
            break;
        }
    }

    infra::Logger::log(infra::LogLevel::INFO, "Network: Server event loop terminated.");
}

HttpResponse Server::dispatch(const HttpRequest& request)
{
    const std::string path = request.path();

    if (path == webhook_path_) {
        if (request.method != "POST")
            return error_response(405, "Use POST for " + path);
        return ingest(request);
    }

    if (path == "/health") {
        if (request.method != "GET")
            return error_response(405, "Use GET for /health");
        HttpResponse resp;
        resp.body = ingestor_.health_json();
        return resp;
    }

    return error_response(404, "No route for " + path);
}

namespace {

/// Releases one backlog slot when an ingest job ends, however it ends.
struct BacklogSlot {
    std::atomic<size_t>& backlog;
    ~BacklogSlot() { --backlog; }
};

} // namespace

/**
 * @brief Runs the pipeline on the pipeline pool within the request deadline.
 *
 * A late job still completes in the background. Its effect is idempotent, so the
 * source's redelivery after the 503 converges on the same state. Late jobs keep
 * their backlog slot until they finish; once `max_pending_ingests` slots are
 * taken, new webhooks are turned away with 503 instead of queueing.
 */
HttpResponse Server::ingest(const HttpRequest& request)
{
    if (ingest_backlog_.fetch_add(1) >= max_pending_ingests_) {
        --ingest_backlog_;
        infra::Logger::log(infra::LogLevel::WARN,
                           "Network: Ingest backlog full (" +
                               std::to_string(max_pending_ingests_) + " jobs). Answering 503.");
        return error_response(503, "Ingest backlog full; retry later");
    }

    std::future<sync::IngestResponse> future;
    try {
        future = pipeline_.submit([this, body = request.body,
                                   content_type = request.header("content-type").value_or("")]() {
            BacklogSlot slot{ingest_backlog_};
            return ingestor_.ingest(body, content_type);
        });
    } catch (const std::runtime_error&) {
        --ingest_backlog_;
        throw;
    }

    if (future.wait_for(std::chrono::milliseconds(request_timeout_ms_)) !=
        std::future_status::ready) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Network: Ingest exceeded " + std::to_string(request_timeout_ms_) +
                               " ms deadline. Answering 503.");
        return error_response(503, "Processing deadline exceeded; retry later");
    }

    const sync::IngestResponse result = future.get();
    HttpResponse resp;
    resp.status = result.http_status;
    resp.body = result.to_json();
    return resp;
}

void Server::handle_client(int sock)
{
    struct timeval tv;
    tv.tv_sec = request_timeout_ms_ / 1000;
    tv.tv_usec = (request_timeout_ms_ % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    HttpResponse resp;
    try {
        auto request = read_request(sock);
        if (!request) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Client left without a request.");
            remove_client(sock);
            return;
        }
        resp = dispatch(*request);
    } catch (const HttpError& e) {
        infra::Logger::log(infra::LogLevel::WARN, "Network: Bad request (" +
                                                      std::to_string(e.status()) + "): " + e.what());
        resp = error_response(e.status(), e.what());
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           std::string("Network: Request handling failed: ") + e.what());
        resp = error_response(500, "Internal error");
    }

    send_all(sock, resp.serialize());
    remove_client(sock);
}

std::optional<HttpRequest> Server::read_request(int sock)
{
    std::string buffer;
    char chunk[8192];
    size_t head_length = 0;
    std::optional<HttpRequest> request;

    while (!request) {
        const ssize_t n = recv(sock, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            if (buffer.empty())
                return std::nullopt;
            if (n == 0)
                throw HttpError(400, "Connection closed inside the request head");
            throw HttpError(408, "Timed out reading the request head");
        }
        buffer.append(chunk, static_cast<size_t>(n));
        request = parse_head(buffer, head_length);
    }

    if (request->content_length > max_body_bytes_)
        throw HttpError(413, "Body of " + std::to_string(request->content_length) +
                                 " bytes exceeds the limit of " +
                                 std::to_string(max_body_bytes_));

    std::string body = buffer.substr(head_length);
    while (body.size() < request->content_length) {
        const ssize_t n = recv(sock, chunk, sizeof(chunk), 0);
        if (n == 0)
            throw HttpError(400, "Connection closed inside the request body");
        if (n < 0)
            throw HttpError(408, "Timed out reading the request body");
        body.append(chunk, static_cast<size_t>(n));
    }
    body.resize(request->content_length);
    request->body = std::move(body);
    return request;
}

void Server::send_all(int sock, const std::string& data)
{
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Response write failed.");
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
}

void Server::remove_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        close(sock);
        client_sockets_.erase(it);
    }
}

} // namespace hooksync::network
