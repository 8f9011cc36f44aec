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
 * @file action.hpp
 * @brief Outcome decided by the resolver for one mutation request.
 */

#pragma once

#include "tomldb/storage/mutation.hpp"

#include <optional>
#include <string>

namespace tomldb::storage {

/**
 * @class ResolvedAction
 * @brief Tagged outcome of resolution; immutable once produced.
 *
 * `Insert`, `Replace`, `Remove`, `View` and `Exists` carry the request they apply.
 * The remaining kinds are signals without payload.
 */
class ResolvedAction {
  public:
    enum class Kind {
        Insert,
        Replace,
        Remove,
        View,
        Exists,
        WouldRemove,
        WouldReplace,
        RejectTypeMismatch,
        RejectExistingValueMismatch,
        MissingTable, ///< Internal: the table must be materialized and resolution re-run.
        NoOp
    };

    static ResolvedAction insert(MutationRequest request) { return {Kind::Insert, std::move(request)}; }
    static ResolvedAction replace(MutationRequest request) { return {Kind::Replace, std::move(request)}; }
    static ResolvedAction remove(MutationRequest request) { return {Kind::Remove, std::move(request)}; }
    static ResolvedAction view(MutationRequest request) { return {Kind::View, std::move(request)}; }
    static ResolvedAction exists(MutationRequest request) { return {Kind::Exists, std::move(request)}; }
    static ResolvedAction signal(Kind kind) { return {kind, std::nullopt}; }

    Kind kind() const { return kind_; }

    /// @brief Request carried by the action, nullptr for signals.
    const MutationRequest* request() const { return request_ ? &*request_ : nullptr; }

    /// @brief True for the two reject kinds.
    bool is_rejection() const
    {
        return kind_ == Kind::RejectTypeMismatch || kind_ == Kind::RejectExistingValueMismatch;
    }

    /// @brief One-line journal record: `<name>[ <request>]`.
    std::string to_string() const;

    static const char* kind_name(Kind kind);

  private:
    ResolvedAction(Kind kind, std::optional<MutationRequest> request)
        : kind_(kind), request_(std::move(request))
    {
    }

    Kind kind_;
    std::optional<MutationRequest> request_;
};

} // namespace tomldb::storage
