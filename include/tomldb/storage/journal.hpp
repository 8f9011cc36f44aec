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
 * @file journal.hpp
 * @brief In-memory buffer of mutation requests and the document they act on.
 *
 * @details
 * Lifecycle inside one write transaction:
 * 1. **Buffer**: `push` / `table` queue requests without validation.
 * 2. **Evaluate**: requests are drained in push order; each is resolved against the
 *    document and applied immediately, so later requests observe earlier ones.
 * 3. **Commit**: every evaluated action is appended to the journal file as one line,
 *    then the data file is overwritten with the serialized document.
 */

#pragma once

#include "tomldb/document/document.hpp"
#include "tomldb/storage/action.hpp"
#include "tomldb/storage/mutation.hpp"

#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tomldb::storage {

class Transaction;

/// @brief A resolved action paired with the request it was resolved from.
using EvaluatedAction = std::pair<ResolvedAction, MutationRequest>;

/**
 * @class Journal
 * @brief Owns the transaction's document plus its pending and evaluated requests.
 */
class Journal {
  public:
    Journal() = default;

    /// @brief Starts from an existing document (the current data file contents).
    explicit Journal(document::Document document);

    /**
     * @brief Queues a fresh request for `path` and returns it for configuration.
     *
     * @code
     * journal.table("server.tls").set_kvp("enabled", true);
     * @endcode
     */
    MutationRequest& table(const std::string& path);

    /// @brief Queues a request. No validation happens here.
    void push(MutationRequest request);

    /**
     * @brief Resolves and applies every pending request, in push order.
     *
     * A missing table is materialized and the request resolved once more. Rejections
     * are recorded like any other action. A request that fails to resolve or apply is
     * logged and dropped; the remaining requests still run.
     *
     * @return The outputs of `View` actions, in evaluation order.
     */
    std::vector<std::string> evaluate();

    /**
     * @brief Executes one resolved action against the document.
     *
     * @return The observed entry for `View`, std::nullopt otherwise.
     * @throws infra::StateError If the action cannot be applied.
     */
    std::optional<std::string> apply(const ResolvedAction& action);

    /**
     * @brief Persists the evaluated actions and the document.
     *
     * A `Commit` transaction receives the journal records (then `fsync`), after which
     * the data file is rewritten (then `fsync`). A `Write` transaction is accepted and
     * nothing is written.
     *
     * @throws infra::StateError For any other transaction state.
     * @throws infra::IoError If a write fails.
     */
    void commit(Transaction tx) &&;

    /**
     * @brief The journal file records of the evaluated actions.
     *
     * Each record starts with the action name and ends with a newline. A multi-line
     * value keeps its own newlines, so a record may span several lines.
     */
    std::string records() const;

    const std::deque<MutationRequest>& pending() const { return pending_; }
    const std::vector<EvaluatedAction>& evaluated() const { return evaluated_; }
    const document::Document& document() const { return document_; }

  private:
    document::Document document_;
    std::deque<MutationRequest> pending_;
    std::vector<EvaluatedAction> evaluated_;
};

} // namespace tomldb::storage
