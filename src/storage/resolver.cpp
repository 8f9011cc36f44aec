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
 * @file resolver.cpp
 * @brief Resolution of mutation requests and rendering of resolved actions.
 */

#include "tomldb/storage/resolver.hpp"

namespace tomldb::storage {

using document::Item;
using Kind = ResolvedAction::Kind;

namespace {

bool same_text(const Item& existing, const MutationRequest& request)
{
    return existing.to_string() == request.value()->to_string();
}

} // namespace

std::optional<ResolvedAction> resolve(const document::Document& doc, const MutationRequest& request)
{
    const Item* table = request.find_table(doc);
    if (table == nullptr) {
        return ResolvedAction::signal(Kind::MissingTable);
    }

    const Item* existing = table->get(request.key());
    bool type_matches = existing != nullptr && matches(request.value_type(), *existing);

    if (request.remove() && request.modify()) {
        // Forced overwrite: the stored value does not have to agree.
        if (existing == nullptr) {
            return std::nullopt;
        }
        if (!type_matches) {
            return ResolvedAction::signal(Kind::RejectTypeMismatch);
        }
        return ResolvedAction::replace(request);
    }

    if (request.modify()) {
        if (existing == nullptr) {
            return std::nullopt;
        }
        if (!type_matches) {
            return ResolvedAction::signal(Kind::RejectTypeMismatch);
        }
        if (!request.has_value()) {
            return ResolvedAction::view(request);
        }
        if (same_text(*existing, request)) {
            return ResolvedAction::replace(request);
        }
        return ResolvedAction::signal(Kind::RejectExistingValueMismatch);
    }

    if (request.remove()) {
        if (existing == nullptr) {
            return std::nullopt;
        }
        if (!type_matches) {
            return ResolvedAction::signal(Kind::RejectTypeMismatch);
        }
        return ResolvedAction::signal(Kind::WouldRemove);
    }

    if (existing == nullptr) {
        return ResolvedAction::insert(request);
    }
    if (!type_matches) {
        return ResolvedAction::signal(Kind::RejectTypeMismatch);
    }
    if (!request.has_value()) {
        return ResolvedAction::signal(Kind::NoOp);
    }
    if (same_text(*existing, request)) {
        return ResolvedAction::exists(request);
    }
    return ResolvedAction::signal(Kind::RejectExistingValueMismatch);
}

std::string ResolvedAction::to_string() const
{
    std::string out = kind_name(kind_);
    if (request_) {
        out += " " + request_->to_string();
    }
    return out;
}

const char* ResolvedAction::kind_name(Kind kind)
{
    switch (kind) {
    case Kind::Insert:
        return "insert";
    case Kind::Replace:
        return "replace";
    case Kind::Remove:
        return "remove";
    case Kind::View:
        return "view";
    case Kind::Exists:
        return "exists";
    case Kind::WouldRemove:
        return "would-remove";
    case Kind::WouldReplace:
        return "would-replace";
    case Kind::RejectTypeMismatch:
        return "reject-type-mismatch";
    case Kind::RejectExistingValueMismatch:
        return "reject-existing-value-mismatch";
    case Kind::MissingTable:
        return "missing-table";
    case Kind::NoOp:
        return "noop";
    }
    return "unknown";
}

} // namespace tomldb::storage
