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
 * @file handler.hpp
 * @brief JSON front-end for batches of mutation requests.
 *
 * @details
 * The `Handler` decodes a JSON envelope into mutation requests, runs them in one write
 * transaction and encodes the evaluated actions as the response. It is the only layer
 * that knows about JSON; the storage layer below it only sees typed requests.
 */

#pragma once

#include "tomldb/storage/database.hpp"
#include "tomldb/storage/mutation.hpp"

#include <optional>
#include <string>

namespace tomldb::api {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Runs a batch of requests and returns the JSON response.
     *
     * Each entry of `requests` is either an object or a command string in journal form:
     *
     * @code
     * {
     *   "requests": [
     *     { "table": "server", "key": "port", "type": "int", "value": "8080" },
     *     "--modify -t 'server' -X str 'host' -- 'example.org'"
     *   ],
     *   "dry_run": false
     * }
     * @endcode
     *
     * Object fields: `table` (default root), `key` (required), `type` (default `str`),
     * `extended_type`, `value` (raw text, or a path for `import`), `remove`, `modify`.
     * With `dry_run` the requests are evaluated but nothing is written.
     *
     * **Response Formats:**
     * - **Success:** `{"status":"ok","actions":[{"action":..,"table":..,"key":..,"record":..}],
     *   "views":[..],"committed":true}`
     * - **Error:** `{"status":"error","message":"<error_description>"}`
     *
     * @param db The database to run against.
     * @param raw_json The request envelope.
     * @return std::string The serialized JSON response.
     */
    static std::string process(const storage::Database& db, const std::string& raw_json);

    /**
     * @brief Reads one entry under a shared lock.
     *
     * @return The serialized value, or std::nullopt if the key is absent.
     * @throws infra::IoError If the data file is missing or cannot be locked.
     */
    static std::optional<std::string> read(const storage::Database& db, const std::string& table,
                                           const std::string& key);

    /**
     * @brief Decodes a command string in journal form.
     *
     * Grammar: `[--modify] [--remove] [-t <table>] [-X <type>] [-Y <type>] <key> [-- <value>]`.
     *
     * @throws infra::ParseError On unbalanced quotes, unknown flags, or a missing key.
     */
    static storage::MutationRequest parse_command(const std::string& command);
};

} // namespace tomldb::api
