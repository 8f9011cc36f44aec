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
 * @file mutation.hpp
 * @brief Description of one intended change (or query) against one key.
 *
 * @details
 * A `MutationRequest` names a table by its dotted path, a key inside it, the declared
 * `ValueType` and optionally a value. The `remove` / `modify` flags select the branch
 * of the resolver decision table.
 *
 * The request also knows how to locate its target inside a document, which keeps the
 * table-path rules (read-only lookup vs. creating lookup) in one place.
 */

#pragma once

#include "tomldb/document/document.hpp"
#include "tomldb/storage/value_type.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace tomldb::storage {

/**
 * @class MutationRequest
 * @brief A caller-supplied mutation of one `(table, key)` pair.
 */
class MutationRequest {
  public:
    MutationRequest() = default;

    /// @brief Creates a request targeting the table at dotted `table` path.
    explicit MutationRequest(std::string table);

    // --- Fields ------------------------------------------------------------

    const std::string& table() const { return table_; }
    MutationRequest& set_table(std::string table);

    const std::string& key() const { return key_; }
    MutationRequest& set_key(std::string key);

    ValueType value_type() const { return value_type_; }
    MutationRequest& set_value_type(ValueType type);

    /// @brief Secondary type token, carried into the journal record only.
    const std::optional<ValueType>& extended_value_type() const { return extended_value_type_; }
    MutationRequest& set_extended_value_type(std::optional<ValueType> type);

    const std::optional<document::Item>& value() const { return value_; }
    MutationRequest& set_value(document::Item value);
    MutationRequest& clear_value();

    /// @brief True if a usable value was supplied (a failed import is not one).
    bool has_value() const { return value_.has_value() && !value_->is_none(); }

    /// @brief Source file of an `Import` value.
    const std::optional<std::string>& import_path() const { return import_path_; }

    bool remove() const { return remove_; }
    MutationRequest& set_remove(bool remove);

    bool modify() const { return modify_; }
    MutationRequest& set_modify(bool modify);

    // --- Typed builders ----------------------------------------------------
    // Each sets the key, the value and the matching value type together.

    MutationRequest& set_kvp(const std::string& key, const std::string& value);
    MutationRequest& set_kvp(const std::string& key, const char* value);
    MutationRequest& set_kvp(const std::string& key, double value);
    MutationRequest& set_kvp(const std::string& key, bool value);

    /// @brief Stores an existing document value; the type is inferred from its shape.
    MutationRequest& set_kvp(const std::string& key, document::Item value);

    /// @brief Imports the document at `path` as a table value.
    MutationRequest& set_kvp(const std::string& key, const std::filesystem::path& path);

    template <typename T, typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
    MutationRequest& set_kvp(const std::string& key, T value)
    {
        return assign(key, document::Item::integer(static_cast<int64_t>(value)), ValueType::Integer);
    }

    // --- Document access ---------------------------------------------------

    /// @brief Segments of the dotted table path; the empty path is the root.
    std::vector<std::string> table_path() const;

    /// @brief The target table, or nullptr if any segment is absent or not a table.
    const document::Item* find_table(const document::Document& doc) const;

    /**
     * @brief The target table, creating every missing segment.
     *
     * @throws infra::StateError If a segment already holds a non-table value.
     */
    document::Item& materialize_table(document::Document& doc) const;

    /// @brief The value currently stored under the key, or nullptr.
    const document::Item* get_entry(const document::Document& doc) const;

    /**
     * @brief Writes the request's value under the key.
     *
     * The table path is materialized. If the key is occupied, the occupant must still
     * match the declared type.
     *
     * @return The replaced value, if there was one.
     * @throws infra::StateError Without a value, or on an occupant of another type.
     */
    std::optional<document::Item> set_item(document::Document& doc) const;

    /**
     * @brief Deletes the key.
     *
     * With a value supplied, the occupant is only removed if its type and serialized
     * form both match.
     *
     * @return The removed value, if any.
     * @throws infra::StateError If a supplied value does not match the occupant.
     */
    std::optional<document::Item> remove_item(document::Document& doc) const;

    /// @brief Serialized form of the entry for output, or nullopt when absent.
    std::optional<std::string> view_item(const document::Document& doc) const;

    /**
     * @brief The canonical journal form.
     *
     * `[--modify ][--remove ]-t '<table>' -X <type> [-Y <type> ]'<key>'[ -- <value>]`
     */
    std::string to_string() const;

  private:
    MutationRequest& assign(const std::string& key, document::Item value, ValueType type);

    std::string table_;
    std::string key_;
    ValueType value_type_ = ValueType::String;
    std::optional<ValueType> extended_value_type_;
    std::optional<document::Item> value_;
    std::optional<std::string> import_path_;
    bool remove_ = false;
    bool modify_ = false;
};

} // namespace tomldb::storage
