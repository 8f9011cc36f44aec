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
 * @file mutation.cpp
 * @brief Mutation request fields, builders and table-path navigation.
 */

#include "tomldb/storage/mutation.hpp"

#include "tomldb/infra/error.hpp"
#include "tomldb/infra/string.hpp"

#include <sstream>

namespace tomldb::storage {

using document::Document;
using document::Item;

MutationRequest::MutationRequest(std::string table) : table_(std::move(table)) {}

MutationRequest& MutationRequest::set_table(std::string table)
{
    table_ = std::move(table);
    return *this;
}

MutationRequest& MutationRequest::set_key(std::string key)
{
    key_ = std::move(key);
    return *this;
}

MutationRequest& MutationRequest::set_value_type(ValueType type)
{
    value_type_ = type;
    return *this;
}

MutationRequest& MutationRequest::set_extended_value_type(std::optional<ValueType> type)
{
    extended_value_type_ = type;
    return *this;
}

MutationRequest& MutationRequest::set_value(Item value)
{
    value_ = std::move(value);
    import_path_.reset();
    return *this;
}

MutationRequest& MutationRequest::clear_value()
{
    value_.reset();
    import_path_.reset();
    return *this;
}

MutationRequest& MutationRequest::set_remove(bool remove)
{
    remove_ = remove;
    return *this;
}

MutationRequest& MutationRequest::set_modify(bool modify)
{
    modify_ = modify;
    return *this;
}

MutationRequest& MutationRequest::assign(const std::string& key, Item value, ValueType type)
{
    key_ = key;
    value_type_ = type;
    value_ = std::move(value);
    import_path_.reset();
    return *this;
}

MutationRequest& MutationRequest::set_kvp(const std::string& key, const std::string& value)
{
    return assign(key, Item::string(value), ValueType::String);
}

MutationRequest& MutationRequest::set_kvp(const std::string& key, const char* value)
{
    return assign(key, Item::string(value), ValueType::String);
}

MutationRequest& MutationRequest::set_kvp(const std::string& key, double value)
{
    return assign(key, Item::floating(value), ValueType::Float);
}

MutationRequest& MutationRequest::set_kvp(const std::string& key, bool value)
{
    return assign(key, Item::boolean(value), ValueType::Bool);
}

MutationRequest& MutationRequest::set_kvp(const std::string& key, Item value)
{
    ValueType type = infer(value);
    return assign(key, std::move(value), type);
}

MutationRequest& MutationRequest::set_kvp(const std::string& key, const std::filesystem::path& path)
{
    assign(key, construct(ValueType::Import, path.string()), ValueType::Import);
    import_path_ = path.string();
    return *this;
}

std::vector<std::string> MutationRequest::table_path() const
{
    std::vector<std::string> segments;
    if (table_.empty()) {
        return segments;
    }

    std::stringstream stream(table_);
    std::string segment;
    while (std::getline(stream, segment, '.')) {
        segments.push_back(segment);
    }
    if (table_.back() == '.') {
        segments.emplace_back();
    }
    return segments;
}

const Item* MutationRequest::find_table(const Document& doc) const
{
    const Item* current = &doc.root();
    for (const auto& segment : table_path()) {
        const Item* next = current->get(segment);
        if (next == nullptr || !next->is_table()) {
            return nullptr;
        }
        current = next;
    }
    return current;
}

Item& MutationRequest::materialize_table(Document& doc) const
{
    Item* current = &doc.root();
    for (const auto& segment : table_path()) {
        Item* next = current->get(segment);
        if (next == nullptr) {
            next = &current->insert(segment, Item::table());
        } else if (!next->is_table()) {
            throw infra::StateError("Could not create table '" + table_ + "': '" + segment +
                                    "' holds a " + Item::kind_name(next->kind()));
        }
        current = next;
    }
    return *current;
}

const Item* MutationRequest::get_entry(const Document& doc) const
{
    const Item* table = find_table(doc);
    return table == nullptr ? nullptr : table->get(key_);
}

std::optional<Item> MutationRequest::set_item(Document& doc) const
{
    if (!has_value()) {
        throw infra::StateError("Could not set item '" + key_ + "': no value supplied");
    }

    Item& table = materialize_table(doc);
    std::optional<Item> previous;
    if (const Item* occupant = table.get(key_)) {
        if (!matches(value_type_, *occupant)) {
            throw infra::StateError("Could not set item '" + key_ + "': existing " +
                                    Item::kind_name(occupant->kind()) + " is not a " +
                                    to_token(value_type_));
        }
        previous = *occupant;
    }

    table.insert(key_, *value_);
    return previous;
}

std::optional<Item> MutationRequest::remove_item(Document& doc) const
{
    Item& table = materialize_table(doc);

    if (has_value()) {
        const Item* occupant = table.get(key_);
        if (occupant == nullptr || !matches(value_type_, *occupant) ||
            occupant->to_string() != value_->to_string()) {
            throw infra::StateError("Cannot remove item '" + key_ + "': value does not match");
        }
    }

    return table.remove(key_);
}

std::optional<std::string> MutationRequest::view_item(const Document& doc) const
{
    const Item* entry = get_entry(doc);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return infra::String::trim(entry->to_string());
}

std::string MutationRequest::to_string() const
{
    std::string out;
    if (modify_) {
        out += "--modify ";
    }
    if (remove_) {
        out += "--remove ";
    }

    out += "-t '" + table_ + "' ";
    out += std::string("-X ") + to_token(value_type_) + " ";
    if (extended_value_type_) {
        out += std::string("-Y ") + to_token(*extended_value_type_) + " ";
    }
    out += "'" + key_ + "'";

    if (import_path_ && value_type_ == ValueType::Import) {
        out += " -- '" + *import_path_ + "'";
    } else if (has_value()) {
        out += " -- " + value_->to_string();
    }
    return out;
}

} // namespace tomldb::storage
