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
 * @file transaction.hpp
 * @brief Locked session over the data and journal files.
 *
 * @details
 * A transaction is a tagged union of four states, each owning different locks:
 *
 * | State    | Holds                                            |
 * |----------|--------------------------------------------------|
 * | `Empty`  | a cancellation token                             |
 * | `Read`   | shared lock on the data file                     |
 * | `Write`  | exclusive lock on the journal file               |
 * | `Commit` | exclusive locks on the journal and the data file |
 *
 * Legal transitions are `Empty -> Read`, `Empty -> Write` and `Write -> Commit`.
 * They consume the source transaction:
 *
 * @code
 * auto tx = db.start_transaction();
 * auto [writer, journal] = std::move(tx).write(db);
 * journal.table("app").set_kvp("name", "demo");
 * journal.evaluate();
 * std::move(journal).commit(std::move(writer).commit(db));
 * @endcode
 *
 * Every lock is released when the owning transaction is destroyed.
 */

#pragma once

#include "tomldb/document/document.hpp"
#include "tomldb/infra/cancellation.hpp"
#include "tomldb/storage/journal.hpp"
#include "tomldb/storage/locked_file.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace tomldb::storage {

class Database;

/**
 * @class Transaction
 * @brief Move-only state machine holding advisory locks.
 */
class Transaction {
  public:
    enum class State { Empty, Read, Write, Commit };

    struct EmptyState {
        infra::CancellationToken cancellation;
    };
    struct ReadState {
        LockedFile data;
    };
    struct WriteState {
        std::optional<LockedFile> journal;
    };
    struct CommitState {
        LockedFile journal;
        LockedFile data;
    };

    /// @brief A fresh `Empty` transaction.
    Transaction();

    /// @brief Releases held locks; an unconsumed `Empty` transaction cancels its token.
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    /**
     * @brief `Empty -> Read`: shared lock on the data file.
     *
     * @throws infra::IoError If the data file cannot be opened or locked.
     * @throws infra::CancelledError If the token fired first.
     * @throws infra::StateError If this transaction is not `Empty`.
     */
    Transaction read(const Database& db) &&;

    /**
     * @brief `Empty -> Write`: exclusive lock on the journal file.
     *
     * The returned journal is loaded with the current data file (an empty document if
     * the file is missing or empty).
     *
     * @throws infra::IoError If the journal file cannot be opened or locked.
     * @throws infra::ParseError If the data file is not a valid document.
     * @throws infra::CancelledError If the token fired first.
     * @throws infra::StateError If this transaction is not `Empty`.
     */
    std::pair<Transaction, Journal> write(const Database& db) &&;

    /**
     * @brief `Write -> Commit`: keeps the journal lock, adds the data file lock.
     *
     * @throws infra::StateError If this transaction is not `Write` or has no journal handle.
     * @throws infra::IoError If the data file cannot be opened or locked.
     */
    Transaction commit(const Database& db) &&;

    State state() const;

    /**
     * @brief A copy of the `Empty` state's token.
     *
     * @throws infra::StateError In any other state.
     */
    infra::CancellationToken cancellation() const;

    /**
     * @brief Parses the locked data file of a `Read` transaction.
     *
     * @throws infra::StateError In any other state.
     */
    document::Document read_document() const;

    static const char* state_name(State state);

  private:
    friend class Journal;

    using Variant = std::variant<EmptyState, ReadState, WriteState, CommitState>;

    explicit Transaction(Variant state);

    const infra::CancellationToken& empty_token(const char* transition) const;

    Variant state_;
    bool consumed_ = false;
};

} // namespace tomldb::storage
