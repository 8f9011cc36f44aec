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
 * @file locked_file.cpp
 * @brief Advisory-lock acquisition and raw file I/O.
 */

#include "tomldb/storage/locked_file.hpp"

#include "tomldb/infra/error.hpp"
#include "tomldb/infra/logger.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <sys/file.h>
#include <unistd.h>

namespace tomldb::storage {

namespace {

/// How long a lock worker sleeps between two non-blocking `flock` attempts.
constexpr std::chrono::milliseconds kLockPollInterval{10};

std::string errno_text(int error)
{
    return std::strerror(error);
}

/// Shared between the waiting caller and the worker polling `flock`.
struct LockRace {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    int error = 0;
};

} // namespace

LockedFile::LockedFile(int fd, std::string path, LockMode mode)
    : fd_(fd), path_(std::move(path)), mode_(mode)
{
}

LockedFile::~LockedFile()
{
    release();
}

LockedFile::LockedFile(LockedFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)), mode_(other.mode_)
{
    other.fd_ = -1;
}

LockedFile& LockedFile::operator=(LockedFile&& other) noexcept
{
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        other.fd_ = -1;
    }
    return *this;
}

LockedFile LockedFile::acquire(infra::Scheduler& pool, const std::string& path, int flags,
                               LockMode mode, infra::CancellationToken cancellation)
{
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw infra::IoError("Cannot open '" + path + "': " + errno_text(errno));
    }

    auto race = std::make_shared<LockRace>();
    int operation = mode == LockMode::Shared ? LOCK_SH : LOCK_EX;

    infra::Logger::log(infra::LogLevel::DEBUG,
                       std::string("Lock: Waiting for ") +
                           (mode == LockMode::Shared ? "shared" : "exclusive") + " lock on '" +
                           path + "'");

    pool.enqueue([race, fd, operation]() {
        std::unique_lock<std::mutex> lock(race->mutex);
        while (!race->abandoned) {
            if (::flock(fd, operation | LOCK_NB) == 0) {
                race->done = true;
                race->cv.notify_all();
                return;
            }
            if (errno != EWOULDBLOCK && errno != EINTR) {
                race->done = true;
                race->error = errno;
                race->cv.notify_all();
                return;
            }
            race->cv.wait_for(lock, kLockPollInterval);
        }
        // Abandoned before the lock was granted; the descriptor is ours to close.
        lock.unlock();
        ::close(fd);
    });

    auto subscription = cancellation.subscribe([race]() {
        std::lock_guard<std::mutex> lock(race->mutex);
        race->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(race->mutex);
    race->cv.wait(lock, [&]() { return race->done || cancellation.is_cancelled(); });

    if (!race->done) {
        // The worker owns the descriptor from here on.
        race->abandoned = true;
        race->cv.notify_all();
        lock.unlock();
        cancellation.unsubscribe(subscription);
        infra::Logger::log(infra::LogLevel::DEBUG, "Lock: Wait on '" + path + "' cancelled");
        throw infra::CancelledError("Lock wait on '" + path + "' was cancelled");
    }

    int error = race->error;
    lock.unlock();
    cancellation.unsubscribe(subscription);

    if (error != 0) {
        ::close(fd);
        throw infra::IoError("Cannot lock '" + path + "': " + errno_text(error));
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Lock: Acquired '" + path + "'");
    return LockedFile(fd, path, mode);
}

std::string LockedFile::read_all() const
{
    std::string content;
    char buffer[8192];
    off_t offset = 0;

    while (true) {
        ssize_t n = ::pread(fd_, buffer, sizeof(buffer), offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw infra::IoError("Cannot read '" + path_ + "': " + errno_text(errno));
        }
        if (n == 0) {
            break;
        }
        content.append(buffer, static_cast<size_t>(n));
        offset += n;
    }
    return content;
}

void LockedFile::write_all(const std::string& data, bool positioned)
{
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = positioned ? ::pwrite(fd_, data.data() + written, data.size() - written,
                                          static_cast<off_t>(written))
                               : ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw infra::IoError("Cannot write '" + path_ + "': " + errno_text(errno));
        }
        written += static_cast<size_t>(n);
    }
}

void LockedFile::append(const std::string& data)
{
    write_all(data, false);
}

void LockedFile::overwrite(const std::string& data)
{
    if (::ftruncate(fd_, 0) != 0) {
        throw infra::IoError("Cannot truncate '" + path_ + "': " + errno_text(errno));
    }
    write_all(data, true);
}

void LockedFile::sync()
{
    if (::fsync(fd_) != 0) {
        throw infra::IoError("Cannot sync '" + path_ + "': " + errno_text(errno));
    }
}

void LockedFile::release()
{
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace tomldb::storage
