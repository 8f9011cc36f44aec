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
 * @file error.hpp
 * @brief Exception hierarchy for hard failures of the transaction engine.
 *
 * @details
 * Resolution rejections are not errors and never appear here; they are recorded as
 * resolved actions. The classes below cover everything that aborts an operation:
 * - `IoError`: open, lock, read and write failures on the data or journal file.
 * - `CancelledError`: the transaction's cancellation fired while waiting for a lock.
 * - `ParseError`: malformed documents, values, type tokens or requests.
 * - `StateError`: illegal transaction transitions and broken invariants.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tomldb::infra {

/**
 * @class Error
 * @brief Common base of every TomlDB exception.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Filesystem or advisory-lock failure.
class IoError : public Error {
  public:
    explicit IoError(const std::string& message) : Error(message) {}
};

/// @brief A lock wait was abandoned because the cancellation token fired first.
class CancelledError : public Error {
  public:
    explicit CancelledError(const std::string& message) : Error(message) {}
};

/**
 * @class ParseError
 * @brief Malformed textual input.
 *
 * Carries the 1-based line number when the failure comes from a document (0 otherwise).
 */
class ParseError : public Error {
  public:
    explicit ParseError(const std::string& message, size_t line = 0)
        : Error(line == 0 ? message : "line " + std::to_string(line) + ": " + message), line_(line)
    {
    }

    /// @brief Line of the offending input, 0 when not applicable.
    size_t line() const { return line_; }

  private:
    size_t line_;
};

/// @brief Illegal state transition or a violated engine invariant.
class StateError : public Error {
  public:
    explicit StateError(const std::string& message) : Error(message) {}
};

} // namespace tomldb::infra
