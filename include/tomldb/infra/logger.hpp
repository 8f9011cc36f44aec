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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for TomlDB.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by
 * the transaction engine. Output to `stdout`/`stderr` is serialized so that lock
 * workers and the caller's thread never interleave their messages.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace tomldb::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries, to filter them against the
 * configured threshold and to pick the output stream.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., per-request resolution steps).
    DEBUG, ///< Diagnostic information (lock waits, view outputs).
    INFO,  ///< Nominal operational events (commits, startup).
    WARN,  ///< Rejected requests and degraded imports.
    ERROR, ///< Dropped requests and failed transactions.
    FATAL  ///< Unrecoverable failures at the process boundary.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Messages below the configured minimum level are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * tomldb::infra::Logger::log(LogLevel::INFO, "Journal: 3 records committed.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive.
     *
     * @param name The textual level.
     * @param out Receives the parsed level on success.
     * @return true if the name was recognized.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum level that passes the filter.
    static std::atomic<LogLevel> threshold_;
};

} // namespace tomldb::infra
