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
 * @file serializer.cpp
 * @brief Canonical TOML writer.
 *
 * @details
 * Layout rules:
 * 1. The key/values of a table come first, one per line.
 * 2. Each standard sub-table follows as a `[dotted.path]` section, depth first, in
 *    insertion order. Implicit tables without values of their own get no header.
 * 3. Arrays of tables are written as one `[[dotted.path]]` section per element.
 * 4. Every header except the first line of output is preceded by a blank line.
 *
 * Recorded decoration wins over these defaults, which is what keeps a parsed
 * document's values byte-identical on the way out.
 */

#include "tomldb/document/document.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace tomldb::document {

namespace {

std::string join_path(const std::vector<std::string>& path)
{
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out += ".";
        }
        out += format_key(path[i]);
    }
    return out;
}

bool has_own_values(const Item& table)
{
    for (size_t i = 0; i < table.size(); ++i) {
        const Item& value = table.value_at(i);
        if (value.is_value() || (value.is_table() && value.dotted())) {
            return true;
        }
    }
    return false;
}

void collect_inline_entries(const Item& table, const std::string& prefix,
                            std::vector<std::string>& out)
{
    for (size_t i = 0; i < table.size(); ++i) {
        const std::string& key = table.keys()[i];
        const Item& value = table.value_at(i);

        if (value.is_table_like() && value.dotted()) {
            collect_inline_entries(value, prefix + format_key(key) + ".", out);
            continue;
        }

        const Decor& kd = table.key_decor_at(i);
        out.push_back(kd.prefix_or(" ") + prefix + format_key(key) + kd.suffix_or(" ") + "=" +
                      serialize_value(value, " ", ""));
    }
}

void write_key_values(std::string& out, const Item& table, const std::string& prefix)
{
    for (size_t i = 0; i < table.size(); ++i) {
        const std::string& key = table.keys()[i];
        const Item& value = table.value_at(i);

        if (value.is_table() && value.dotted()) {
            write_key_values(out, value, prefix + format_key(key) + ".");
            continue;
        }
        if (!value.is_value()) {
            continue;
        }

        const Decor& kd = table.key_decor_at(i);
        out += kd.prefix_or("") + prefix + format_key(key) + kd.suffix_or(" ") + "=" +
               serialize_value(value, " ", "") + "\n";
    }
}

void write_sections(std::string& out, const Item& table, const std::vector<std::string>& path)
{
    for (size_t i = 0; i < table.size(); ++i) {
        const Item& value = table.value_at(i);
        std::vector<std::string> child_path = path;
        child_path.push_back(table.keys()[i]);

        if (value.is_table()) {
            if (value.dotted()) {
                write_sections(out, value, child_path);
                continue;
            }
            if (!value.implicit() || has_own_values(value)) {
                if (!out.empty()) {
                    out += "\n";
                }
                out += "[" + join_path(child_path) + "]\n";
                write_key_values(out, value, "");
            }
            write_sections(out, value, child_path);
        } else if (value.is_array_of_tables()) {
            for (const Item& element : value.elements()) {
                if (!out.empty()) {
                    out += "\n";
                }
                out += "[[" + join_path(child_path) + "]]\n";
                write_key_values(out, element, "");
                write_sections(out, element, child_path);
            }
        }
    }
}

} // namespace

Document::Document() : root_(Item::table()) {}

std::string Document::to_string() const
{
    return serialize_table(root_, {});
}

std::string serialize_table(const Item& table, const std::vector<std::string>& path)
{
    std::string out;
    write_key_values(out, table, "");
    write_sections(out, table, path);
    return out;
}

std::string serialize_value(const Item& value, const std::string& default_prefix,
                            const std::string& default_suffix)
{
    std::string body;

    switch (value.kind()) {
    case Item::Kind::None:
        return "";
    case Item::Kind::Table:
    case Item::Kind::ArrayOfTables:
        return value.to_string();
    case Item::Kind::Array: {
        const auto& elements = value.elements();
        body = "[";
        for (size_t i = 0; i < elements.size(); ++i) {
            body += serialize_value(elements[i], i == 0 ? "" : " ", "");
            if (i + 1 < elements.size() || value.trailing_comma()) {
                body += ",";
            }
        }
        body += value.trailing().value_or("");
        body += "]";
        break;
    }
    case Item::Kind::InlineTable: {
        std::vector<std::string> entries;
        collect_inline_entries(value, "", entries);
        body = "{";
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) {
                body += ",";
            }
            body += entries[i];
        }
        body += value.trailing().value_or(entries.empty() ? "" : " ");
        body += "}";
        break;
    }
    default:
        body = value.repr();
        break;
    }

    return value.decor().prefix_or(default_prefix) + body + value.decor().suffix_or(default_suffix);
}

std::string format_key(const std::string& key)
{
    bool bare = !key.empty();
    for (char c : key) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-';
        if (!ok) {
            bare = false;
            break;
        }
    }
    return bare ? key : quote_basic_string(key);
}

std::string quote_basic_string(const std::string& value)
{
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            if ((static_cast<unsigned char>(c) < 0x20) || c == 0x7f) {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04X",
                              static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += escaped;
            } else {
                out += c;
            }
        }
    }
    out += "\"";
    return out;
}

std::string format_float(double value)
{
    if (std::isnan(value)) {
        return std::signbit(value) ? "-nan" : "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string out(buffer, result.ptr);

    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

} // namespace tomldb::document
