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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "tomldb/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace tomldb::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::optional<std::vector<std::string>> String::shell_split(const std::string& s)
{
    std::vector<std::string> args;
    std::string current;
    bool in_word = false;
    size_t i = 0;

    while (i < s.size()) {
        char c = s[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                args.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            ++i;
            continue;
        }

        in_word = true;

        if (c == '\'') {
            size_t close = s.find('\'', i + 1);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            current.append(s, i + 1, close - i - 1);
            i = close + 1;
        } else if (c == '"') {
            ++i;
            bool closed = false;
            while (i < s.size()) {
                char d = s[i];
                if (d == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (d == '\\' && i + 1 < s.size()) {
                    char next = s[i + 1];
                    if (next == '"' || next == '\\' || next == '`' || next == '$') {
                        current.push_back(next);
                        i += 2;
                        continue;
                    }
                    if (next == '\n') {
                        i += 2;
                        continue;
                    }
                }
                current.push_back(d);
                ++i;
            }
            if (!closed) {
                return std::nullopt;
            }
        } else if (c == '\\') {
            if (i + 1 >= s.size()) {
                return std::nullopt;
            }
            if (s[i + 1] != '\n') {
                current.push_back(s[i + 1]);
            }
            i += 2;
        } else {
            current.push_back(c);
            ++i;
        }
    }

    if (in_word) {
        args.push_back(std::move(current));
    }

    return args;
}

std::optional<std::vector<std::string>> String::split_command(const std::string& cmd)
{
    const std::string separator = " -- ";
    size_t pos = cmd.find(separator);
    if (pos == std::string::npos) {
        return shell_split(cmd);
    }

    auto head = shell_split(cmd.substr(0, pos));
    if (!head) {
        return std::nullopt;
    }

    head->push_back("--");
    head->push_back(trim(cmd.substr(pos + separator.size())));
    return head;
}

} // namespace tomldb::infra
