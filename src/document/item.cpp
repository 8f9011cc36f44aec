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
 * @file item.cpp
 * @brief Construction, table bookkeeping and rendering of document nodes.
 */

#include "tomldb/document/item.hpp"

#include "tomldb/document/document.hpp"
#include "tomldb/infra/error.hpp"

namespace tomldb::document {

Item Item::string(const std::string& value)
{
    return scalar(Kind::String, value, quote_basic_string(value));
}

Item Item::integer(int64_t value)
{
    return scalar(Kind::Integer, value, std::to_string(value));
}

Item Item::floating(double value)
{
    return scalar(Kind::Float, value, format_float(value));
}

Item Item::boolean(bool value)
{
    return scalar(Kind::Boolean, value, std::string(value ? "true" : "false"));
}

Item Item::datetime(const std::string& literal)
{
    return scalar(Kind::Datetime, literal, literal);
}

Item Item::array()
{
    return Item(Kind::Array);
}

Item Item::inline_table()
{
    return Item(Kind::InlineTable);
}

Item Item::table()
{
    return Item(Kind::Table);
}

Item Item::array_of_tables()
{
    return Item(Kind::ArrayOfTables);
}

const std::string& Item::as_str() const
{
    if (!is_str()) {
        throw infra::StateError(std::string("Item: Expected string, found ") + kind_name(kind_));
    }
    return std::get<std::string>(scalar_);
}

int64_t Item::as_integer() const
{
    if (!is_integer()) {
        throw infra::StateError(std::string("Item: Expected integer, found ") + kind_name(kind_));
    }
    return std::get<int64_t>(scalar_);
}

double Item::as_float() const
{
    if (!is_float()) {
        throw infra::StateError(std::string("Item: Expected float, found ") + kind_name(kind_));
    }
    return std::get<double>(scalar_);
}

bool Item::as_bool() const
{
    if (!is_bool()) {
        throw infra::StateError(std::string("Item: Expected boolean, found ") + kind_name(kind_));
    }
    return std::get<bool>(scalar_);
}

void Item::push(Item item)
{
    if (is_array_of_tables() && !item.is_table()) {
        throw infra::StateError("Item: An array of tables only holds tables");
    }
    if (!is_array() && !is_array_of_tables()) {
        throw infra::StateError(std::string("Item: Cannot push into ") + kind_name(kind_));
    }
    elements_.push_back(std::move(item));
}

void Item::set_trailing(std::string text, bool comma)
{
    trailing_ = std::move(text);
    trailing_comma_ = comma;
}

size_t Item::size() const
{
    if (is_array() || is_array_of_tables()) {
        return elements_.size();
    }
    return keys_.size();
}

size_t Item::find(const std::string& key) const
{
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return i;
        }
    }
    return keys_.size();
}

bool Item::contains_key(const std::string& key) const
{
    return find(key) < keys_.size();
}

bool Item::contains_table(const std::string& key) const
{
    const Item* item = get(key);
    return item && item->is_table();
}

Item* Item::get(const std::string& key)
{
    size_t index = find(key);
    return index < keys_.size() ? &values_[index] : nullptr;
}

const Item* Item::get(const std::string& key) const
{
    size_t index = find(key);
    return index < keys_.size() ? &values_[index] : nullptr;
}

Item& Item::insert(const std::string& key, Item value)
{
    if (!is_table_like()) {
        throw infra::StateError(std::string("Item: Cannot insert a key into ") + kind_name(kind_));
    }

    size_t index = find(key);
    if (index < keys_.size()) {
        values_[index] = std::move(value);
        return values_[index];
    }

    keys_.push_back(key);
    values_.push_back(std::move(value));
    key_decor_.emplace_back();
    return values_.back();
}

Item& Item::insert_decorated(const std::string& key, Item value, Decor key_decor)
{
    Item& stored = insert(key, std::move(value));
    key_decor_[find(key)] = std::move(key_decor);
    return stored;
}

std::optional<Item> Item::remove(const std::string& key)
{
    size_t index = find(key);
    if (index >= keys_.size()) {
        return std::nullopt;
    }

    Item removed = std::move(values_[index]);
    keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(index));
    values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(index));
    key_decor_.erase(key_decor_.begin() + static_cast<std::ptrdiff_t>(index));
    return removed;
}

std::string Item::to_string() const
{
    switch (kind_) {
    case Kind::None:
        return "";
    case Kind::Table:
        return serialize_table(*this, {});
    case Kind::ArrayOfTables: {
        std::string out;
        for (const Item& table : elements_) {
            if (!out.empty()) {
                out += "\n";
            }
            out += serialize_table(table, {});
        }
        return out;
    }
    default:
        return serialize_value(*this, "", "");
    }
}

const char* Item::kind_name(Kind kind)
{
    switch (kind) {
    case Kind::None:
        return "none";
    case Kind::String:
        return "string";
    case Kind::Integer:
        return "integer";
    case Kind::Float:
        return "float";
    case Kind::Boolean:
        return "boolean";
    case Kind::Datetime:
        return "datetime";
    case Kind::Array:
        return "array";
    case Kind::InlineTable:
        return "inline table";
    case Kind::Table:
        return "table";
    case Kind::ArrayOfTables:
        return "array of tables";
    }
    return "unknown";
}

} // namespace tomldb::document
