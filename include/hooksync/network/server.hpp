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
 * @file server.hpp
 * @brief Multi-threaded HTTP listener for inbound webhook notifications.
 *
 * @details
 * This header declares the `Server` class, the network entry point of HookSync.
 * It handles the low-level BSD socket operations (bind, listen, accept) and hands
 * each connection to the connection worker pool (`Scheduler`).
 */

#pragma once

#include "hooksync/infra/config.hpp"
#include "hooksync/infra/scheduler.hpp"
#include "hooksync/network/http.hpp"
#include "hooksync/sync/ingestor.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hooksync::network {

/**
 * @class Server
 * @brief Webhook endpoint adapter.
 *
 * @details
 * **Operational Workflow:**
 * 1. **Accept:** The calling thread blocks on `accept()`.
 * 2. **Dispatch:** Each socket is submitted to the connection pool.
 * 3. **Read:** A worker reads one request (head, then `Content-Length` bytes) with
 *    `SO_RCVTIMEO` bounding every read.
 * 4. **Route:** `dispatch()` maps the request to a response. Ingestion runs on a
 *    separate pipeline pool so that the connection worker can give up after
 *    `request_timeout_ms` and answer 503, inviting redelivery.
 * 5. **Close:** One request per connection.
 */
class Server {
  public:
    Server(sync::Ingestor& ingestor, const infra::Config& config);

    /**
     * @brief Destructor. Calls `stop()` before the worker pools are joined.
     */
    ~Server();

    /**
     * @brief Binds, listens, and runs the accept loop until `stop()`.
     *
     * @throws std::runtime_error If the socket cannot be created, bound or listened on.
     */
    void run();

    /**
     * @brief Signals the server to shut down.
     *
     * **Shutdown Sequence:**
     * 1. Clears the `running_` flag.
     * 2. Closes the listening socket (unblocking `accept`).
     * 3. Shuts down every tracked client socket.
     */
    void stop();

    /**
     * @brief Routes one complete request.
     *
     * - `POST <webhook_path>` → ingest pipeline.
     * - `GET /health` → store counts and ingest counters.
     * - Known path, other method → 405. Unknown path → 404.
     */
    HttpResponse dispatch(const HttpRequest& request);

    /// @brief Ingest jobs submitted to the pipeline and not yet finished.
    size_t ingest_backlog() const { return ingest_backlog_.load(); }

  private:
    sync::Ingestor& ingestor_;
    int port_;
    std::string webhook_path_;
    int request_timeout_ms_;
    size_t max_body_bytes_;
    size_t max_pending_ingests_;

    int server_fd_;
    std::atomic<bool> running_;
    /// @brief Outlives `pipeline_`, whose jobs decrement it.
    std::atomic<size_t> ingest_backlog_;

    /// @brief Registry of connected client sockets, for forced close on shutdown.
    std::vector<int> client_sockets_;
    std::mutex client_mutex_;

    /// @brief Runs ingest jobs. Declared before `connections_` so it is joined last.
    infra::Scheduler pipeline_;
    /// @brief Runs `handle_client`.
    infra::Scheduler connections_;

    HttpResponse ingest(const HttpRequest& request);

    /**
     * @brief Reads one request from @p sock, answers it, and closes the socket.
     */
    void handle_client(int sock);

    /**
     * @brief Reads until the head and the full body are buffered.
     *
     * @return `std::nullopt` if the peer closed or timed out before sending anything.
     * @throws HttpError On a malformed, oversized, truncated or timed-out request.
     */
    std::optional<HttpRequest> read_request(int sock);

    void send_all(int sock, const std::string& data);
    void add_client(int sock);
    void remove_client(int sock);
};

} // namespace hooksync::network
