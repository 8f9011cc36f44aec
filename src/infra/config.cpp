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
 * @file config.cpp
 * @brief JSON configuration loading backed by cJSON.
 */

#include "tomldb/infra/config.hpp"

#include "tomldb/infra/error.hpp"

#include <cJSON.h>
#include <fstream>
#include <sstream>

namespace tomldb::infra {

Config Config::from_json(const std::string& raw_json)
{
    cJSON* root = cJSON_Parse(raw_json.c_str());
    if (!root) {
        throw ParseError("Config: Invalid JSON syntax");
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw ParseError("Config: Expected a JSON object");
    }

    Config config;
    std::string error;

    cJSON* data = cJSON_GetObjectItem(root, "data_path");
    cJSON* journal = cJSON_GetObjectItem(root, "journal_path");
    cJSON* level = cJSON_GetObjectItem(root, "log_level");
    cJSON* workers = cJSON_GetObjectItem(root, "lock_workers");

    if (data) {
        if (cJSON_IsString(data) && data->valuestring) {
            config.data_path = data->valuestring;
            config.journal_path = config.data_path + ".journal";
        } else {
            error = "'data_path' must be a string";
        }
    }

    if (journal && error.empty()) {
        if (cJSON_IsString(journal) && journal->valuestring) {
            config.journal_path = journal->valuestring;
        } else {
            error = "'journal_path' must be a string";
        }
    }

    if (level && error.empty()) {
        if (!cJSON_IsString(level) || !level->valuestring ||
            !Logger::parse_level(level->valuestring, config.log_level)) {
            error = "'log_level' must be one of trace, debug, info, warn, error, fatal";
        }
    }

    if (workers && error.empty()) {
        if (cJSON_IsNumber(workers) && workers->valueint > 0) {
            config.lock_workers = static_cast<size_t>(workers->valueint);
        } else {
            error = "'lock_workers' must be a positive number";
        }
    }

    cJSON_Delete(root);

    if (!error.empty()) {
        throw ParseError("Config: " + error);
    }
    return config;
}

Config Config::from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IoError("Config: Cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

void Config::apply_logging() const
{
    Logger::set_level(log_level);
}

} // namespace tomldb::infra
