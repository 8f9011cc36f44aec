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
 * @file transaction.cpp
 * @brief State transitions and lock ownership of transactions.
 */

#include "tomldb/storage/transaction.hpp"

#include "tomldb/infra/error.hpp"
#include "tomldb/infra/logger.hpp"
#include "tomldb/infra/string.hpp"
#include "tomldb/storage/database.hpp"

#include <fcntl.h>
#include <fstream>
#include <sstream>

namespace tomldb::storage {

namespace {

/// Current data file contents; an absent or blank file is an empty document.
document::Document load_document(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return document::Document();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();
    if (infra::String::trim(text).empty()) {
        return document::Document();
    }
    return document::Document::parse(text);
}

} // namespace

Transaction::Transaction() = default;

Transaction::Transaction(Variant state) : state_(std::move(state)) {}

Transaction::~Transaction()
{
    if (consumed_) {
        return;
    }
    if (auto* empty = std::get_if<EmptyState>(&state_)) {
        empty->cancellation.cancel();
    }
}

Transaction::Transaction(Transaction&& other) noexcept
    : state_(std::move(other.state_)), consumed_(other.consumed_)
{
    other.consumed_ = true;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept
{
    if (this != &other) {
        if (!consumed_) {
            if (auto* empty = std::get_if<EmptyState>(&state_)) {
                empty->cancellation.cancel();
            }
        }
        state_ = std::move(other.state_);
        consumed_ = other.consumed_;
        other.consumed_ = true;
    }
    return *this;
}

const infra::CancellationToken& Transaction::empty_token(const char* transition) const
{
    const auto* empty = std::get_if<EmptyState>(&state_);
    if (consumed_ || empty == nullptr) {
        throw infra::StateError(std::string("Cannot ") + transition + " from a " +
                                (consumed_ ? "consumed" : state_name(state())) + " transaction");
    }
    return empty->cancellation;
}

Transaction Transaction::read(const Database& db) &&
{
    infra::CancellationToken token = empty_token("read");

    LockedFile data = LockedFile::acquire(db.lock_pool(), db.data_path(), O_RDONLY,
                                          LockMode::Shared, token);
    consumed_ = true;

    infra::Logger::log(infra::LogLevel::DEBUG, "Transaction: Read '" + db.data_path() + "'");
    return Transaction(ReadState{std::move(data)});
}

std::pair<Transaction, Journal> Transaction::write(const Database& db) &&
{
    infra::CancellationToken token = empty_token("write");

    LockedFile journal = LockedFile::acquire(db.lock_pool(), db.journal_path(),
                                             O_RDWR | O_APPEND | O_CREAT, LockMode::Exclusive, token);
    document::Document doc = load_document(db.data_path());
    consumed_ = true;

    infra::Logger::log(infra::LogLevel::DEBUG, "Transaction: Write '" + db.journal_path() + "'");
    return std::make_pair(Transaction(WriteState{std::move(journal)}), Journal(std::move(doc)));
}

Transaction Transaction::commit(const Database& db) &&
{
    auto* write = std::get_if<WriteState>(&state_);
    if (consumed_ || write == nullptr) {
        throw infra::StateError(std::string("Can only commit from a write transaction, not from a ") +
                                (consumed_ ? "consumed" : state_name(state())) + " transaction");
    }
    if (!write->journal) {
        throw infra::StateError("Cannot commit without a journal file pointer");
    }

    // No truncation here: the file is only cleared when the new document is written.
    LockedFile data = LockedFile::acquire(db.lock_pool(), db.data_path(), O_WRONLY | O_CREAT,
                                          LockMode::Exclusive, infra::CancellationToken());

    CommitState next{std::move(*write->journal), std::move(data)};
    write->journal.reset();
    consumed_ = true;

    infra::Logger::log(infra::LogLevel::DEBUG, "Transaction: Commit '" + db.data_path() + "'");
    return Transaction(std::move(next));
}

Transaction::State Transaction::state() const
{
    return static_cast<State>(state_.index());
}

infra::CancellationToken Transaction::cancellation() const
{
    return empty_token("cancel");
}

document::Document Transaction::read_document() const
{
    const auto* read = std::get_if<ReadState>(&state_);
    if (consumed_ || read == nullptr) {
        throw infra::StateError("Only a read transaction can read the document");
    }
    return document::Document::parse(read->data.read_all());
}

const char* Transaction::state_name(State state)
{
    switch (state) {
    case State::Empty:
        return "empty";
    case State::Read:
        return "read";
    case State::Write:
        return "write";
    case State::Commit:
        return "commit";
    }
    return "unknown";
}

} // namespace tomldb::storage
