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
 * @file locked_file.hpp
 * @brief Open file descriptor holding a `flock` advisory lock.
 *
 * @details
 * The lock is released and the descriptor closed when the `LockedFile` is destroyed,
 * on every exit path. Acquisition is delegated to a worker pool so that the calling
 * thread can give up on a lock wait when a cancellation token fires.
 */

#pragma once

#include "tomldb/infra/cancellation.hpp"
#include "tomldb/infra/scheduler.hpp"

#include <string>

namespace tomldb::storage {

/// @brief `flock` mode held by a `LockedFile`.
enum class LockMode { Shared, Exclusive };

/**
 * @class LockedFile
 * @brief Move-only owner of a locked file descriptor.
 */
class LockedFile {
  public:
    LockedFile() = default;
    LockedFile(int fd, std::string path, LockMode mode);
    ~LockedFile();

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;

    LockedFile(LockedFile&& other) noexcept;
    LockedFile& operator=(LockedFile&& other) noexcept;

    /**
     * @brief Opens `path` and waits for the lock on a pool worker.
     *
     * The file is opened synchronously (`open(2)` with `flags`, mode 0644). A pool
     * worker then polls a non-blocking `flock` while the caller waits for either the
     * grant or `cancellation`. Once the caller gives up, the worker stops polling and
     * closes the descriptor, so no worker outlives an abandoned wait.
     *
     * @param pool Worker pool that polls for the lock.
     * @param path File to open.
     * @param flags `open(2)` flags.
     * @param mode Shared or exclusive lock.
     * @param cancellation Token that aborts the wait.
     * @return LockedFile The locked handle.
     * @throws infra::IoError If the file cannot be opened or locked.
     * @throws infra::CancelledError If the token fired before the lock was granted.
     */
    static LockedFile acquire(infra::Scheduler& pool, const std::string& path, int flags,
                              LockMode mode, infra::CancellationToken cancellation);

    bool valid() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
    LockMode mode() const { return mode_; }

    /// @brief Reads the whole file from offset 0.
    std::string read_all() const;

    /// @brief Writes `data` at the current offset (the end for `O_APPEND` files).
    void append(const std::string& data);

    /// @brief Truncates the file and writes `data` from offset 0.
    void overwrite(const std::string& data);

    /// @brief Flushes file data to stable storage.
    void sync();

    /// @brief Unlocks and closes early. Idempotent.
    void release();

  private:
    void write_all(const std::string& data, bool positioned);

    int fd_ = -1;
    std::string path_;
    LockMode mode_ = LockMode::Shared;
};

} // namespace tomldb::storage
