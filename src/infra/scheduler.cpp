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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 */

#include "hooksync/infra/scheduler.hpp"

#include "hooksync/infra/logger.hpp"

#include <exception>
#include <string>

namespace hooksync::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0)
        threads = 2;

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    Logger::log(LogLevel::DEBUG, "Scheduler: " + std::to_string(threads) + " workers online.");
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker event loop.
 *
 * Exits only once the stop flag is set AND the queue is empty. Tasks run outside
 * the queue lock. A task that throws is logged and the worker keeps serving.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (!task)
            continue;

        try {
            task();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR,
                        "Scheduler: Task terminated with exception: " + std::string(e.what()));
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_)
            throw std::runtime_error("Scheduler: enqueue after shutdown");
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

} // namespace hooksync::infra
