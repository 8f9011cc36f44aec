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
 * @brief Implementation of the worker pool used for lock acquisition.
 */

#include "tomldb/infra/scheduler.hpp"

#include "tomldb/infra/logger.hpp"

#include <exception>

namespace tomldb::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    // Exit only once the queue is drained so that a queued lock request
                    // still gets a chance to hand its descriptor back.
                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                if (task) {
                    try {
                        task();
                    } catch (const std::exception& e) {
                        Logger::log(LogLevel::ERROR,
                                    std::string("Scheduler: Task failed: ") + e.what());
                    }
                }
            }
        });
    }
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
 * @brief Dispatches a new task to the worker pool.
 *
 * Appends the callable to the shared queue and wakes up a single worker.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

} // namespace tomldb::infra
