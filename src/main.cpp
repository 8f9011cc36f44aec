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
 * @file main.cpp
 * @brief Application Entry Point.
 *
 * @details
 * 1. Argument Parsing.
 * 2. Configuration Loading (JSON file, optional).
 * 3. Request Execution: a JSON batch from a file or stdin, or a single `--get` lookup.
 * 4. Response Output on stdout.
 */

#include "tomldb/api/handler.hpp"
#include "tomldb/infra/config.hpp"
#include "tomldb/infra/logger.hpp"
#include "tomldb/storage/database.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--config FILE] [--get TABLE KEY] [REQUEST_FILE]\n"
              << "Options:\n"
              << "  --config FILE   JSON configuration (data_path, journal_path, log_level, lock_workers)\n"
              << "  --get TABLE KEY Print one entry under a shared lock\n"
              << "  REQUEST_FILE    JSON request batch (Default: read from stdin)\n"
              << "  --help          Show this help message\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    std::string config_path;
    std::string request_path;
    std::string get_table;
    std::string get_key;
    bool get_mode = false;

    try {
        // 1. Parse Command Line Arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                print_help(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--get" && i + 2 < argc) {
                get_mode = true;
                get_table = argv[++i];
                get_key = argv[++i];
            } else if (request_path.empty() && arg[0] != '-') {
                request_path = arg;
            } else {
                print_help(argv[0]);
                return 2;
            }
        }

        // 2. Configuration
        tomldb::infra::Config config;
        if (!config_path.empty()) {
            config = tomldb::infra::Config::from_file(config_path);
        }
        config.apply_logging();

        tomldb::infra::Logger::log(tomldb::infra::LogLevel::DEBUG,
                                   "Config: Data file '" + config.data_path + "', journal '" +
                                       config.journal_path + "'");

        tomldb::storage::Database db = tomldb::storage::Database::from_config(config);

        // 3a. Single lookup
        if (get_mode) {
            auto value = tomldb::api::Handler::read(db, get_table, get_key);
            if (!value) {
                tomldb::infra::Logger::log(tomldb::infra::LogLevel::WARN,
                                           "Query: '" + get_key + "' not found in '" + get_table +
                                               "'");
                return 1;
            }
            std::cout << *value << std::endl;
            return 0;
        }

        // 3b. Request batch
        std::string payload;
        if (request_path.empty()) {
            payload.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        } else {
            std::ifstream file(request_path);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open request file '" + request_path + "'");
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            payload = buffer.str();
        }

        // 4. Output
        std::string response = tomldb::api::Handler::process(db, payload);
        std::cout << response << std::endl;
        return response.find("\"status\":\"ok\"") != std::string::npos ? 0 : 1;

    } catch (const std::exception& e) {
        tomldb::infra::Logger::log(tomldb::infra::LogLevel::FATAL,
                                   "System: Critical Failure: " + std::string(e.what()));
        return 1;
    } catch (...) {
        tomldb::infra::Logger::log(tomldb::infra::LogLevel::FATAL,
                                   "System: Unknown unhandled exception occurred.");
        return 1;
    }
}
