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

#include "tomldb/storage/database.hpp"

namespace tomldb::storage {

Database::Database(std::string data_path, std::string journal_path, size_t lock_workers)
    : data_path_(std::move(data_path)), journal_path_(std::move(journal_path)),
      lock_pool_(std::make_shared<infra::Scheduler>(lock_workers))
{
}

Database Database::from_config(const infra::Config& config)
{
    return Database(config.data_path, config.journal_path, config.lock_workers);
}

Transaction Database::start_transaction() const
{
    return Transaction();
}

} // namespace tomldb::storage
