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
 * @file scheduler.hpp
 * @brief Worker pool on which inbound webhook calls are processed.
 *
 * @details
 * Each accepted connection becomes one task. Tasks share nothing but the record
 * store, so the pool needs no ordering between them: a FIFO queue and a fixed set
 * of workers is enough.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace hooksync::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Shutdown:** The destructor drains the queue before joining, so every accepted
 *   connection receives a response.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns @p threads workers. A value of 0 (undetectable hardware
     * concurrency) falls back to 2.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Stops accepting work, drains the queue, and joins every worker.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task.
     *
     * @throws std::runtime_error If the scheduler is shutting down.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task and returns a future for its result.
     *
     * Exceptions thrown by @p func are captured in the future.
     *
     * @code
     * auto fut = scheduler.submit([&] { return ingestor.ingest(body, type); });
     * if (fut.wait_for(deadline) == std::future_status::ready) { ... }
     * @endcode
     */
    template <typename F> auto submit(F&& func) -> std::future<std::invoke_result_t<F>>
    {
        using Result = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
        std::future<Result> fut = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return fut;
    }

    /// @brief Number of worker threads owned by the pool.
    size_t size() const { return workers_.size(); }

  private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;

    void worker_loop();
};

} // namespace hooksync::infra
