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
 * @file journal.cpp
 * @brief Evaluation, application and write-ahead commit of buffered requests.
 */

#include "tomldb/storage/journal.hpp"

#include "tomldb/infra/error.hpp"
#include "tomldb/infra/logger.hpp"
#include "tomldb/storage/resolver.hpp"
#include "tomldb/storage/transaction.hpp"

namespace tomldb::storage {

using infra::LogLevel;
using infra::Logger;
using Kind = ResolvedAction::Kind;

Journal::Journal(document::Document document) : document_(std::move(document)) {}

MutationRequest& Journal::table(const std::string& path)
{
    pending_.emplace_back(path);
    return pending_.back();
}

void Journal::push(MutationRequest request)
{
    pending_.push_back(std::move(request));
}

std::vector<std::string> Journal::evaluate()
{
    std::vector<std::string> views;

    while (!pending_.empty()) {
        MutationRequest request = std::move(pending_.front());
        pending_.pop_front();

        try {
            auto action = resolve(document_, request);
            if (action && action->kind() == Kind::MissingTable) {
                request.materialize_table(document_);
                action = resolve(document_, request);
            }

            if (!action) {
                Logger::log(LogLevel::WARN, "Journal: Nothing to do for '" + request.to_string() +
                                                "', key is absent");
                continue;
            }
            if (action->kind() == Kind::MissingTable) {
                throw infra::StateError("Could not evaluate table action from arguments");
            }
            if (action->is_rejection()) {
                Logger::log(LogLevel::WARN, std::string("Journal: ") +
                                                ResolvedAction::kind_name(action->kind()) + " for '" +
                                                request.to_string() + "'");
            }

            auto output = apply(*action);
            if (output) {
                Logger::log(LogLevel::DEBUG, "Journal: View " + request.key() + " = " + *output);
                views.push_back(*output);
            }
            evaluated_.emplace_back(std::move(*action), std::move(request));
        } catch (const infra::Error& e) {
            Logger::log(LogLevel::ERROR,
                        "Journal: Dropped '" + request.to_string() + "': " + e.what());
        }
    }

    return views;
}

std::optional<std::string> Journal::apply(const ResolvedAction& action)
{
    const MutationRequest* request = action.request();

    switch (action.kind()) {
    case Kind::Remove:
        request->remove_item(document_);
        break;
    case Kind::Replace:
    case Kind::Insert:
        request->set_item(document_);
        break;
    case Kind::View:
        return request->view_item(document_);
    default:
        break;
    }
    return std::nullopt;
}

std::string Journal::records() const
{
    std::string out;
    for (const auto& entry : evaluated_) {
        out += entry.first.to_string();
        out += "\n";
    }
    return out;
}

void Journal::commit(Transaction tx) &&
{
    if (auto* commit = std::get_if<Transaction::CommitState>(&tx.state_)) {
        commit->journal.append(records());
        commit->journal.sync();

        commit->data.overwrite(document_.to_string());
        commit->data.sync();

        Logger::log(LogLevel::INFO, "Journal: Committed " + std::to_string(evaluated_.size()) +
                                        " action(s) to '" + commit->data.path() + "'");
        evaluated_.clear();
        return;
    }

    if (std::holds_alternative<Transaction::WriteState>(tx.state_)) {
        Logger::log(LogLevel::DEBUG, "Journal: Commit on a write transaction, nothing written");
        return;
    }

    throw infra::StateError(std::string("Expecting a commit or write transaction, got ") +
                            Transaction::state_name(tx.state()));
}

} // namespace tomldb::storage
