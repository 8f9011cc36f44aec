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
 * @file document.hpp
 * @brief TOML document: parsing entry points and canonical serialization.
 *
 * @details
 * A `Document` owns the root table of the tree. `Document::parse` accepts TOML 1.0
 * text; `Document::to_string` writes it back in a canonical layout that is stable
 * under a parse/serialize round trip:
 *
 * @code
 * top = 1
 *
 * [server]
 * host = "localhost"
 *
 * [server.tls]
 * enabled = true
 * @endcode
 *
 * Whole-line comments are not retained; comments trailing a value are.
 */

#pragma once

#include "tomldb/document/item.hpp"

#include <string>
#include <vector>

namespace tomldb::document {

/**
 * @class Document
 * @brief The root of a TOML tree.
 */
class Document {
  public:
    /// @brief Creates an empty document.
    Document();

    /**
     * @brief Parses TOML text.
     *
     * @param text The document source.
     * @return Document The parsed tree.
     * @throws infra::ParseError On malformed input, with the offending line.
     */
    static Document parse(const std::string& text);

    /// @brief The root table.
    Item& root() { return root_; }
    const Item& root() const { return root_; }

    /// @brief Serializes the whole document.
    std::string to_string() const;

  private:
    Item root_;
};

/**
 * @brief Parses a single TOML value (`5`, `"text"`, `[1, 2]`, `{ a = 1 }`, ...).
 *
 * Surrounding whitespace is accepted and not recorded as decoration.
 *
 * @throws infra::ParseError If the text is not exactly one value.
 */
Item parse_value(const std::string& text);

/**
 * @brief Writes the body of a table (its key/values, then its sub-sections).
 *
 * @param table A `Table` item.
 * @param path Dotted path of `table` relative to the document root, used for headers.
 */
std::string serialize_table(const Item& table, const std::vector<std::string>& path);

/// @brief Renders a value with the given default decoration.
std::string serialize_value(const Item& value, const std::string& default_prefix,
                            const std::string& default_suffix);

/// @brief Returns `key` bare if it only uses `A-Za-z0-9_-`, otherwise as a quoted string.
std::string format_key(const std::string& key);

/// @brief Renders a string as a TOML basic string literal with escapes.
std::string quote_basic_string(const std::string& value);

/// @brief Renders a double the way TOML expects it (`1.0`, `inf`, `-nan`, `2.5e-07`).
std::string format_float(double value);

} // namespace tomldb::document
