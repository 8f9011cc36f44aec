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
 * @brief Worker pool for blocking operations.
 *
 * @details
 * This header defines the `Scheduler` class, a fixed pool of worker threads fed by a
 * FIFO queue. TomlDB hands every advisory-lock request to it so that the calling
 * thread can keep watching its cancellation token while the OS decides when to
 * grant the lock.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tomldb::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 *
 * A task occupies its worker until it returns, so the pool size bounds the number of
 * lock waits that can be in flight at the same time.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads The number of worker threads to spawn. A value of 0 is raised to 1.
     */
    explicit Scheduler(size_t threads = 2);

    /**
     * @brief Destructor. Drains the queue and joins every worker.
     *
     * @note This is a **blocking** operation: it returns once every queued and running
     * task has finished.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The operation to execute on a worker thread.
     */
    void enqueue(std::function<void()> task);

    /// @brief Number of worker threads owned by the pool.
    size_t size() const { return workers_.size(); }

  private:
    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief A FIFO queue storing pending tasks waiting for a worker.
    std::queue<std::function<void()>> tasks_;

    /// @brief Synchronization primitive protecting access to the `tasks_` queue.
    std::mutex queue_mutex_;

    /// @brief Signaling mechanism used to wake up workers or notify shutdown.
    std::condition_variable condition_;

    /// @brief Atomic flag controlling the lifecycle of the event loops.
    std::atomic<bool> stop_;
};

} // namespace tomldb::infra
