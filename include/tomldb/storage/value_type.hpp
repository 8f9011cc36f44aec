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
 * @file value_type.hpp
 * @brief The closed set of declared value types and their classification rules.
 *
 * @details
 * Every mutation request declares the logical type of the value it targets. This
 * header maps those types to document node kinds (`matches`), converts raw textual
 * input into document values (`construct`) and translates the boundary tokens
 * (`str`, `bool`, `float`, `int`, `obj`, `append`, `import`).
 */

#pragma once

#include "tomldb/document/item.hpp"

#include <string>

namespace tomldb::storage {

/**
 * @enum ValueType
 * @brief Declared logical type of a mutation target.
 */
enum class ValueType {
    String,  ///< `str` - text scalar.
    Bool,    ///< `bool` - boolean scalar.
    Float,   ///< `float` - floating point scalar.
    Integer, ///< `int` - integer scalar.
    Object,  ///< `obj` - inline table.
    Append,  ///< `append` - array.
    Import   ///< `import` - standard table read from another document.
};

/**
 * @brief Returns true iff `value` has the shape declared by `type`.
 *
 * String, Bool, Float and Integer match the respective scalars, Object matches an
 * inline table, Append an array and Import a standard table. Datetimes match nothing.
 */
bool matches(ValueType type, const document::Item& value);

/**
 * @brief Converts raw input into a document value of the declared type.
 *
 * - `String`: a TOML string literal (`"a"`, `'a'`) is parsed; any other text is
 *   taken verbatim.
 * - `Bool`, `Integer`, `Object`, `Append`: the text must parse as that TOML value.
 * - `Float`: a TOML float; integer literals are promoted.
 * - `Import`: `raw` is a path. The file is parsed as a document whose root table
 *   becomes the value. Read or parse failure yields a `None` item instead of an error.
 *
 * @throws infra::ParseError When the text does not form a value of the declared type.
 */
document::Item construct(ValueType type, const std::string& raw);

/**
 * @brief The type a request would declare for an existing document value.
 *
 * Tables map to `Object`, arrays to `Append`; `None` and datetimes map to `String`.
 */
ValueType infer(const document::Item& value);

/// @brief Boundary token of a type (`str`, `bool`, ...).
const char* to_token(ValueType type);

/**
 * @brief Parses a boundary token.
 *
 * @throws infra::ParseError On an unknown token.
 */
ValueType parse_value_type(const std::string& token);

} // namespace tomldb::storage
