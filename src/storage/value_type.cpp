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
 * @file value_type.cpp
 * @brief Classification and construction of typed document values.
 */

#include "tomldb/storage/value_type.hpp"

#include "tomldb/document/document.hpp"
#include "tomldb/infra/error.hpp"
#include "tomldb/infra/logger.hpp"

#include <fstream>
#include <sstream>

namespace tomldb::storage {

using document::Item;

bool matches(ValueType type, const Item& value)
{
    switch (type) {
    case ValueType::String:
        return value.is_str();
    case ValueType::Bool:
        return value.is_bool();
    case ValueType::Float:
        return value.is_float();
    case ValueType::Integer:
        return value.is_integer();
    case ValueType::Object:
        return value.is_inline_table();
    case ValueType::Append:
        return value.is_array();
    case ValueType::Import:
        return value.is_table();
    }
    return false;
}

namespace {

Item import_document(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Import: Cannot read '" + path + "', value left empty.");
        return Item();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        document::Document doc = document::Document::parse(buffer.str());
        return doc.root();
    } catch (const infra::ParseError& e) {
        infra::Logger::log(infra::LogLevel::WARN, "Import: '" + path + "' is not a valid document (" +
                                                      e.what() + "), value left empty.");
        return Item();
    }
}

Item parse_typed(ValueType type, const std::string& raw)
{
    Item value = document::parse_value(raw);
    if (!matches(type, value)) {
        throw infra::ParseError(std::string("Value '") + raw + "' is not a valid " + to_token(type));
    }
    return value;
}

} // namespace

Item construct(ValueType type, const std::string& raw)
{
    switch (type) {
    case ValueType::String:
        try {
            Item value = document::parse_value(raw);
            if (value.is_str()) {
                return value;
            }
        } catch (const infra::ParseError&) {
            // Not a TOML literal: fall through to the verbatim text.
        }
        return Item::string(raw);
    case ValueType::Float: {
        Item value = document::parse_value(raw);
        if (value.is_float()) {
            return value;
        }
        if (value.is_integer()) {
            return Item::floating(static_cast<double>(value.as_integer()));
        }
        throw infra::ParseError("Value '" + raw + "' is not a valid float");
    }
    case ValueType::Bool:
    case ValueType::Integer:
    case ValueType::Object:
    case ValueType::Append:
        return parse_typed(type, raw);
    case ValueType::Import:
        return import_document(raw);
    }
    throw infra::ParseError("Unknown value type");
}

ValueType infer(const Item& value)
{
    switch (value.kind()) {
    case Item::Kind::Integer:
        return ValueType::Integer;
    case Item::Kind::Float:
        return ValueType::Float;
    case Item::Kind::Boolean:
        return ValueType::Bool;
    case Item::Kind::Array:
        return ValueType::Append;
    case Item::Kind::InlineTable:
    case Item::Kind::Table:
    case Item::Kind::ArrayOfTables:
        return ValueType::Object;
    default:
        return ValueType::String;
    }
}

const char* to_token(ValueType type)
{
    switch (type) {
    case ValueType::String:
        return "str";
    case ValueType::Bool:
        return "bool";
    case ValueType::Float:
        return "float";
    case ValueType::Integer:
        return "int";
    case ValueType::Object:
        return "obj";
    case ValueType::Append:
        return "append";
    case ValueType::Import:
        return "import";
    }
    return "str";
}

ValueType parse_value_type(const std::string& token)
{
    if (token == "str") {
        return ValueType::String;
    }
    if (token == "bool") {
        return ValueType::Bool;
    }
    if (token == "float") {
        return ValueType::Float;
    }
    if (token == "int") {
        return ValueType::Integer;
    }
    if (token == "obj") {
        return ValueType::Object;
    }
    if (token == "append") {
        return ValueType::Append;
    }
    if (token == "import") {
        return ValueType::Import;
    }
    throw infra::ParseError("Unknown value type '" + token + "'");
}

} // namespace tomldb::storage
