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
 * @file database.hpp
 * @brief Immutable handle to a data file and its journal.
 */

#pragma once

#include "tomldb/infra/config.hpp"
#include "tomldb/infra/scheduler.hpp"
#include "tomldb/storage/transaction.hpp"

#include <memory>
#include <string>

namespace tomldb::storage {

/**
 * @class Database
 * @brief Factory of transactions over one `(data_path, journal_path)` pair.
 *
 * Holds the worker pool used for lock waits. Copies share the pool.
 *
 * @note The pool joins its workers on destruction, so every transaction created from
 * a database must be destroyed before the last copy of the database.
 */
class Database {
  public:
    /**
     * @param data_path The TOML data file.
     * @param journal_path The append-only journal file.
     * @param lock_workers Worker threads available for lock waits.
     */
    Database(std::string data_path, std::string journal_path, size_t lock_workers = 2);

    /// @brief Builds a database from the `data_path`, `journal_path` and `lock_workers` settings.
    static Database from_config(const infra::Config& config);

    /// @brief A new transaction in the `Empty` state.
    Transaction start_transaction() const;

    const std::string& data_path() const { return data_path_; }
    const std::string& journal_path() const { return journal_path_; }

    /// @brief Pool that polls for `flock` grants.
    infra::Scheduler& lock_pool() const { return *lock_pool_; }

  private:
    std::string data_path_;
    std::string journal_path_;
    std::shared_ptr<infra::Scheduler> lock_pool_;
};

} // namespace tomldb::storage
