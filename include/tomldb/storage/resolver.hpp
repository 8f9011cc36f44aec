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
 * @file resolver.hpp
 * @brief The mutation decision table.
 *
 * @details
 * Resolution is a pure function of the document and the request. The table is looked
 * up read-only first (absent -> `MissingTable`), then the `(remove, modify)` flags
 * select one of four branches:
 *
 * | remove | modify | key absent | type mismatch | same type                                     |
 * |--------|--------|------------|---------------|-----------------------------------------------|
 * | true   | true   | none       | reject        | `Replace`                                     |
 * | false  | true   | none       | reject        | no value: `View`; equal: `Replace`; else reject |
 * | true   | false  | none       | reject        | `WouldRemove`                                 |
 * | false  | false  | `Insert`   | reject        | no value: `NoOp`; equal: `Exists`; else reject  |
 *
 * "Equal" compares the serialized text of the two values, decoration included.
 */

#pragma once

#include "tomldb/document/document.hpp"
#include "tomldb/storage/action.hpp"
#include "tomldb/storage/mutation.hpp"

#include <optional>

namespace tomldb::storage {

/**
 * @brief Decides the action for `request` against `doc`.
 *
 * @return The action, or std::nullopt when no action can be determined (the key is
 * absent in a branch that needs an existing entry).
 */
std::optional<ResolvedAction> resolve(const document::Document& doc, const MutationRequest& request);

} // namespace tomldb::storage
