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
 * @file config.hpp
 * @brief Runtime configuration of a TomlDB process.
 *
 * @details
 * Configuration is a flat JSON object. Every field is optional:
 *
 * @code
 * {
 *   "data_path": "./settings.toml",
 *   "journal_path": "./settings.toml.journal",
 *   "log_level": "debug",
 *   "lock_workers": 2
 * }
 * @endcode
 */

#pragma once

#include "tomldb/infra/logger.hpp"

#include <string>

namespace tomldb::infra {

/**
 * @struct Config
 * @brief Paths and tunables consumed by `Database` and the entry point.
 */
struct Config {
    /// @brief The TOML data file rewritten on every commit.
    std::string data_path = "./tomldb.toml";

    /// @brief The append-only journal file.
    std::string journal_path = "./tomldb.toml.journal";

    /// @brief Minimum severity written by the `Logger`.
    LogLevel log_level = LogLevel::INFO;

    /// @brief Worker threads dedicated to advisory-lock acquisition.
    size_t lock_workers = 2;

    /**
     * @brief Builds a configuration from a JSON document.
     *
     * Missing fields keep their defaults. If only `data_path` is given, the journal
     * path defaults to `data_path + ".journal"`.
     *
     * @param raw_json The JSON text.
     * @return Config The parsed configuration.
     * @throws ParseError On invalid JSON or a field of the wrong type.
     */
    static Config from_json(const std::string& raw_json);

    /**
     * @brief Reads and parses a JSON configuration file.
     *
     * @throws IoError If the file cannot be read.
     * @throws ParseError On invalid content.
     */
    static Config from_file(const std::string& path);

    /// @brief Applies `log_level` to the process-wide `Logger`.
    void apply_logging() const;
};

} // namespace tomldb::infra
