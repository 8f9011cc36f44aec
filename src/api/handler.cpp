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
 * @file handler.cpp
 * @brief Implementation of the request processing pipeline.
 *
 * @details
 * 1. **Ingest**: Parsing the JSON envelope.
 * 2. **Decode**: Turning every entry into a typed `MutationRequest`.
 * 3. **Execute**: One write transaction; evaluate, then commit (or not, for a dry run).
 * 4. **Respond**: Formatting the evaluated actions into a JSON response.
 */

#include "tomldb/api/handler.hpp"

#include "tomldb/infra/error.hpp"
#include "tomldb/infra/logger.hpp"
#include "tomldb/infra/string.hpp"
#include "tomldb/storage/value_type.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <vector>

namespace tomldb::api {

using storage::MutationRequest;
using storage::ValueType;

namespace {

using JsonPtr = std::unique_ptr<cJSON, void (*)(cJSON*)>;

std::string print_json(const cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    std::string out = raw_output ? raw_output : "";
    free(raw_output);
    return out;
}

std::string error_response(const std::string& message)
{
    JsonPtr root(cJSON_CreateObject(), cJSON_Delete);
    cJSON_AddStringToObject(root.get(), "status", "error");
    cJSON_AddStringToObject(root.get(), "message", message.c_str());
    return print_json(root.get());
}

std::optional<std::string> string_field(const cJSON* obj, const char* name)
{
    const cJSON* field = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (field == nullptr || cJSON_IsNull(field)) {
        return std::nullopt;
    }
    if (!cJSON_IsString(field)) {
        throw infra::ParseError(std::string("Field '") + name + "' must be a string");
    }
    return std::string(field->valuestring);
}

bool bool_field(const cJSON* obj, const char* name)
{
    const cJSON* field = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (field == nullptr || cJSON_IsNull(field)) {
        return false;
    }
    if (!cJSON_IsBool(field)) {
        throw infra::ParseError(std::string("Field '") + name + "' must be a boolean");
    }
    return cJSON_IsTrue(field);
}

/// Stores `raw` as the request's value, reading a file for imports.
void assign_value(MutationRequest& request, const std::string& raw)
{
    if (request.value_type() == ValueType::Import) {
        request.set_kvp(request.key(), std::filesystem::path(raw));
    } else {
        request.set_value(storage::construct(request.value_type(), raw));
    }
}

MutationRequest decode_object(const cJSON* item)
{
    auto key = string_field(item, "key");
    if (!key || key->empty()) {
        throw infra::ParseError("Request key must not be empty");
    }

    MutationRequest request(string_field(item, "table").value_or(""));
    request.set_key(*key);
    request.set_value_type(storage::parse_value_type(string_field(item, "type").value_or("str")));
    if (auto extended = string_field(item, "extended_type")) {
        request.set_extended_value_type(storage::parse_value_type(*extended));
    }
    request.set_remove(bool_field(item, "remove"));
    request.set_modify(bool_field(item, "modify"));

    if (auto raw = string_field(item, "value")) {
        assign_value(request, *raw);
    }
    return request;
}

} // namespace

MutationRequest Handler::parse_command(const std::string& command)
{
    auto args = infra::String::split_command(command);
    if (!args) {
        throw infra::ParseError("Unbalanced quotes in command: " + command);
    }

    MutationRequest request;
    std::optional<std::string> raw_value;

    auto take_arg = [&](size_t& i, const std::string& flag) -> const std::string& {
        if (i + 1 >= args->size()) {
            throw infra::ParseError("Missing argument after '" + flag + "'");
        }
        return (*args)[++i];
    };

    for (size_t i = 0; i < args->size(); ++i) {
        const std::string& arg = (*args)[i];
        if (arg == "--modify") {
            request.set_modify(true);
        } else if (arg == "--remove") {
            request.set_remove(true);
        } else if (arg == "-t") {
            request.set_table(take_arg(i, arg));
        } else if (arg == "-X") {
            request.set_value_type(storage::parse_value_type(take_arg(i, arg)));
        } else if (arg == "-Y") {
            request.set_extended_value_type(storage::parse_value_type(take_arg(i, arg)));
        } else if (arg == "--") {
            raw_value = take_arg(i, arg);
            break;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw infra::ParseError("Unknown flag '" + arg + "'");
        } else if (request.key().empty()) {
            request.set_key(arg);
        } else {
            throw infra::ParseError("Unexpected argument '" + arg + "'");
        }
    }

    if (request.key().empty()) {
        throw infra::ParseError("Request key must not be empty");
    }

    if (raw_value) {
        std::string raw = *raw_value;
        if (request.value_type() == ValueType::Import) {
            // Import paths are written quoted in journal records.
            auto unquoted = infra::String::shell_split(raw);
            if (unquoted && unquoted->size() == 1) {
                raw = unquoted->front();
            }
        }
        assign_value(request, raw);
    }
    return request;
}

std::string Handler::process(const storage::Database& db, const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response("Empty request payload");
    }

    JsonPtr req(cJSON_Parse(raw_json.c_str()), cJSON_Delete);
    if (!req) {
        return error_response("Invalid JSON syntax");
    }

    try {
        const cJSON* requests = cJSON_GetObjectItemCaseSensitive(req.get(), "requests");
        if (!cJSON_IsArray(requests)) {
            throw infra::ParseError("Missing array: 'requests'");
        }
        bool dry_run = bool_field(req.get(), "dry_run");

        std::vector<MutationRequest> decoded;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, requests)
        {
            if (cJSON_IsString(item)) {
                decoded.push_back(parse_command(item->valuestring));
            } else if (cJSON_IsObject(item)) {
                decoded.push_back(decode_object(item));
            } else {
                throw infra::ParseError("Each request must be an object or a command string");
            }
        }

        auto tx = db.start_transaction();
        auto [writer, journal] = std::move(tx).write(db);
        for (auto& request : decoded) {
            journal.push(std::move(request));
        }
        std::vector<std::string> views = journal.evaluate();

        JsonPtr resp_root(cJSON_CreateObject(), cJSON_Delete);
        cJSON_AddStringToObject(resp_root.get(), "status", "ok");

        cJSON* actions = cJSON_AddArrayToObject(resp_root.get(), "actions");
        for (const auto& [action, request] : journal.evaluated()) {
            cJSON* entry = cJSON_CreateObject();
            cJSON_AddStringToObject(entry, "action",
                                    storage::ResolvedAction::kind_name(action.kind()));
            cJSON_AddStringToObject(entry, "table", request.table().c_str());
            cJSON_AddStringToObject(entry, "key", request.key().c_str());
            cJSON_AddStringToObject(entry, "record", action.to_string().c_str());
            cJSON_AddItemToArray(actions, entry);
        }

        cJSON* view_array = cJSON_AddArrayToObject(resp_root.get(), "views");
        for (const auto& view : views) {
            cJSON_AddItemToArray(view_array, cJSON_CreateString(view.c_str()));
        }

        if (dry_run) {
            std::move(journal).commit(std::move(writer));
        } else {
            std::move(journal).commit(std::move(writer).commit(db));
        }
        cJSON_AddBoolToObject(resp_root.get(), "committed", !dry_run);

        return print_json(resp_root.get());
    } catch (const infra::Error& e) {
        infra::Logger::log(infra::LogLevel::ERROR, std::string("Handler: ") + e.what());
        return error_response(e.what());
    }
}

std::optional<std::string> Handler::read(const storage::Database& db, const std::string& table,
                                         const std::string& key)
{
    storage::Transaction reader = db.start_transaction().read(db);
    document::Document doc = reader.read_document();

    MutationRequest request(table);
    request.set_key(key);
    return request.view_item(doc);
}

} // namespace tomldb::api
