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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class: whitespace trimming and the
 * shell-style command splitter used by front-ends that accept mutation requests
 * as a single command string.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tomldb::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string instance containing the trimmed content.
     * Returns an empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = tomldb::infra::String::trim("   -t 'a.b'  \n"); // "-t 'a.b'"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Splits a command line into arguments using POSIX shell quoting rules.
     *
     * Supports single quotes (literal), double quotes (backslash escapes `\"`, `\\`,
     * `` \` `` and `\$`) and backslash escapes outside quotes.
     *
     * @param s The command line.
     * @return The arguments, or `std::nullopt` on an unterminated quote or a trailing
     * backslash.
     */
    static std::optional<std::vector<std::string>> shell_split(const std::string& s);

    /**
     * @brief Splits a mutation command, honoring the raw value separator.
     *
     * If `cmd` contains the sequence `" -- "`, the part before the first occurrence is
     * shell-split, followed by a literal `--` argument and by the remainder as one
     * trimmed argument. The remainder is neither unquoted nor re-tokenized, so a TOML
     * value such as `'quoted text'` or `[1, 2]` reaches the value parser intact.
     *
     * @code
     * split_command("insert -t 'db' key -- 'value'");
     * // -> {"insert", "-t", "db", "key", "--", "'value'"}
     * @endcode
     *
     * @param cmd The full command string.
     * @return The arguments, or `std::nullopt` if the head cannot be shell-split.
     */
    static std::optional<std::vector<std::string>> split_command(const std::string& cmd);
};

} // namespace tomldb::infra
