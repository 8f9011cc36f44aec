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
 * @file parser.cpp
 * @brief Recursive-descent TOML reader.
 *
 * @details
 * The parser walks the input once, line by line at the top level and recursively
 * inside arrays and inline tables. Scalars are stored together with the exact slice
 * of input they came from, and the whitespace around keys and values is recorded as
 * decoration so that the serializer can reproduce it.
 */

#include "tomldb/document/document.hpp"

#include "tomldb/infra/error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tomldb::document {

namespace {

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool is_bare_key_char(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || is_digit(c) || c == '_' || c == '-';
}

bool is_value_char(char c)
{
    return is_bare_key_char(c) || c == '+' || c == '.' || c == ':';
}

bool digits_at(const std::string& s, size_t from, size_t count)
{
    if (from + count > s.size()) {
        return false;
    }
    for (size_t i = from; i < from + count; ++i) {
        if (!is_digit(s[i])) {
            return false;
        }
    }
    return true;
}

bool looks_like_date(const std::string& s)
{
    return digits_at(s, 0, 4) && s.size() >= 10 && s[4] == '-' && digits_at(s, 5, 2) &&
           s[7] == '-' && digits_at(s, 8, 2);
}

bool looks_like_time(const std::string& s)
{
    return digits_at(s, 0, 2) && s.size() >= 8 && s[2] == ':' && digits_at(s, 3, 2) &&
           s[5] == ':' && digits_at(s, 6, 2);
}

/// Consumes `[0-9](_?[0-9])*` (or the hex/octal/binary digit class) starting at `i`.
bool scan_digits(const std::string& s, size_t& i, int base)
{
    auto valid = [base](char c) {
        if (base == 16) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        }
        if (base == 8) {
            return c >= '0' && c <= '7';
        }
        if (base == 2) {
            return c == '0' || c == '1';
        }
        return is_digit(c);
    };

    if (i >= s.size() || !valid(s[i])) {
        return false;
    }
    ++i;
    while (i < s.size()) {
        if (valid(s[i])) {
            ++i;
        } else if (s[i] == '_' && i + 1 < s.size() && valid(s[i + 1])) {
            i += 2;
        } else {
            break;
        }
    }
    return true;
}

/// Validates a decimal integer or float literal; sets `is_float` when a fraction or exponent is present.
bool valid_decimal(const std::string& s, bool& is_float)
{
    size_t i = 0;
    is_float = false;

    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        ++i;
    }
    if (i < s.size() && s[i] == '0' && i + 1 < s.size() && (is_digit(s[i + 1]) || s[i + 1] == '_')) {
        return false;
    }
    if (!scan_digits(s, i, 10)) {
        return false;
    }
    if (i < s.size() && s[i] == '.') {
        is_float = true;
        ++i;
        if (!scan_digits(s, i, 10)) {
            return false;
        }
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        is_float = true;
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            ++i;
        }
        if (!scan_digits(s, i, 10)) {
            return false;
        }
    }
    return i == s.size();
}

std::string strip_underscores(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '_') {
            out += c;
        }
    }
    return out;
}

void append_utf8(std::string& out, unsigned long cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class Parser {
  public:
    explicit Parser(const std::string& text) : text_(text) {}

    Document parse_document()
    {
        Document doc;
        Item* current = &doc.root();

        while (!eof()) {
            std::string indent = take_ws();
            if (eof()) {
                break;
            }

            char c = peek();
            if (c == '#') {
                take_comment();
                expect_newline();
                continue;
            }
            if (at_newline()) {
                expect_newline();
                continue;
            }

            if (c == '[') {
                bool array = peek(1) == '[';
                pos_ += array ? 2 : 1;
                take_ws();
                std::vector<std::string> path = parse_key();
                take_ws();
                expect(']');
                if (array) {
                    expect(']');
                }
                take_ws();
                if (peek() == '#') {
                    take_comment();
                }
                expect_newline();
                current = open_table(doc.root(), path, array);
                continue;
            }

            Decor key_decor;
            key_decor.prefix = indent;
            std::vector<std::string> key = parse_key();
            key_decor.suffix = take_ws();
            expect('=');

            std::string value_prefix = take_ws();
            Item value = parse_value();
            std::string value_suffix = take_ws();
            if (peek() == '#') {
                value_suffix += take_comment();
            }
            value.decor().prefix = value_prefix;
            value.decor().suffix = value_suffix;
            expect_newline();

            insert_dotted(*current, key, std::move(value), std::move(key_decor), false);
        }

        return doc;
    }

    Item parse_single_value()
    {
        skip_blank();
        if (eof()) {
            fail("Expected a value");
        }
        Item value = parse_value();
        skip_blank();
        if (!eof()) {
            fail("Unexpected characters after value");
        }
        return value;
    }

  private:
    const std::string& text_;
    size_t pos_ = 0;

    bool eof() const { return pos_ >= text_.size(); }

    char peek(size_t offset = 0) const
    {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }

    bool at_newline() const { return peek() == '\n' || (peek() == '\r' && peek(1) == '\n'); }

    bool starts_with(const char* literal) const
    {
        return text_.compare(pos_, std::char_traits<char>::length(literal), literal) == 0;
    }

    [[noreturn]] void fail(const std::string& message) const
    {
        size_t end = std::min(pos_, text_.size());
        size_t line = 1 + static_cast<size_t>(std::count(text_.begin(),
                                                         text_.begin() + static_cast<std::ptrdiff_t>(end),
                                                         '\n'));
        throw infra::ParseError(message, line);
    }

    void expect(char c)
    {
        if (peek() != c || eof()) {
            fail(std::string("Expected '") + c + "'");
        }
        ++pos_;
    }

    void expect_newline()
    {
        if (eof()) {
            return;
        }
        if (peek() == '\n') {
            ++pos_;
        } else if (peek() == '\r' && peek(1) == '\n') {
            pos_ += 2;
        } else {
            fail("Expected end of line");
        }
    }

    std::string take_ws()
    {
        size_t start = pos_;
        while (!eof() && (peek() == ' ' || peek() == '\t')) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::string take_comment()
    {
        size_t start = pos_;
        while (!eof() && !at_newline()) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    /// Whitespace, newlines and comments between array elements.
    std::string take_blank_and_comments()
    {
        size_t start = pos_;
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\n') {
                ++pos_;
            } else if (c == '\r' && peek(1) == '\n') {
                pos_ += 2;
            } else if (c == '#') {
                take_comment();
            } else {
                break;
            }
        }
        return text_.substr(start, pos_ - start);
    }

    void skip_blank()
    {
        while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
    }

    // --- Keys ----------------------------------------------------------------

    std::string parse_simple_key()
    {
        if (peek() == '"' && !starts_with("\"\"\"")) {
            return parse_basic_string();
        }
        if (peek() == '\'' && !starts_with("'''")) {
            return parse_literal_string();
        }

        size_t start = pos_;
        while (!eof() && is_bare_key_char(peek())) {
            ++pos_;
        }
        if (start == pos_) {
            fail("Expected a key");
        }
        return text_.substr(start, pos_ - start);
    }

    std::vector<std::string> parse_key()
    {
        std::vector<std::string> segments;
        segments.push_back(parse_simple_key());

        while (true) {
            size_t saved = pos_;
            take_ws();
            if (peek() != '.') {
                pos_ = saved;
                break;
            }
            ++pos_;
            take_ws();
            segments.push_back(parse_simple_key());
        }
        return segments;
    }

    // --- Tables --------------------------------------------------------------

    Item* open_table(Item& root, const std::vector<std::string>& path, bool array)
    {
        Item* table = &root;

        for (size_t i = 0; i + 1 < path.size(); ++i) {
            Item* next = table->get(path[i]);
            if (!next) {
                next = &table->insert(path[i], Item::table());
                next->set_implicit(true);
            } else if (next->is_array_of_tables()) {
                if (next->elements().empty()) {
                    fail("Array of tables '" + path[i] + "' is empty");
                }
                next = &next->elements().back();
            } else if (!next->is_table()) {
                fail("Key '" + path[i] + "' is not a table");
            }
            table = next;
        }

        const std::string& last = path.back();
        Item* existing = table->get(last);

        if (array) {
            if (!existing) {
                existing = &table->insert(last, Item::array_of_tables());
            } else if (!existing->is_array_of_tables()) {
                fail("Key '" + last + "' is not an array of tables");
            }
            existing->push(Item::table());
            return &existing->elements().back();
        }

        if (!existing) {
            return &table->insert(last, Item::table());
        }
        if (existing->is_table() && existing->implicit()) {
            existing->set_implicit(false);
            return existing;
        }
        fail("Duplicate table '" + last + "'");
    }

    void insert_dotted(Item& table, const std::vector<std::string>& key, Item value,
                       Decor key_decor, bool inline_context)
    {
        Item* target = &table;

        for (size_t i = 0; i + 1 < key.size(); ++i) {
            Item* next = target->get(key[i]);
            if (!next) {
                next = &target->insert(key[i],
                                       inline_context ? Item::inline_table() : Item::table());
                next->set_dotted(true);
            } else if (!next->is_table_like()) {
                fail("Key '" + key[i] + "' already holds a non-table value");
            }
            target = next;
        }

        if (target->contains_key(key.back())) {
            fail("Duplicate key '" + key.back() + "'");
        }
        target->insert_decorated(key.back(), std::move(value), std::move(key_decor));
    }

    // --- Values --------------------------------------------------------------

    Item parse_value()
    {
        char c = peek();
        size_t start = pos_;

        if (c == '"') {
            std::string value = starts_with("\"\"\"") ? parse_multiline_basic_string()
                                                      : parse_basic_string();
            return Item::scalar(Item::Kind::String, value, text_.substr(start, pos_ - start));
        }
        if (c == '\'') {
            std::string value = starts_with("'''") ? parse_multiline_literal_string()
                                                   : parse_literal_string();
            return Item::scalar(Item::Kind::String, value, text_.substr(start, pos_ - start));
        }
        if (c == '[') {
            return parse_array();
        }
        if (c == '{') {
            return parse_inline_table();
        }
        return parse_bare_value();
    }

    Item parse_bare_value()
    {
        size_t start = pos_;
        while (!eof() && is_value_char(peek())) {
            ++pos_;
        }
        std::string token = text_.substr(start, pos_ - start);

        // Date and time separated by a space: `1979-05-27 07:32:00Z`.
        if (token.size() == 10 && looks_like_date(token) && peek() == ' ' && is_digit(peek(1)) &&
            is_digit(peek(2)) && peek(3) == ':') {
            ++pos_;
            while (!eof() && is_value_char(peek())) {
                ++pos_;
            }
            token = text_.substr(start, pos_ - start);
        }

        if (token.empty()) {
            fail("Expected a value");
        }
        if (token == "true") {
            return Item::scalar(Item::Kind::Boolean, true, token);
        }
        if (token == "false") {
            return Item::scalar(Item::Kind::Boolean, false, token);
        }
        if (looks_like_date(token) || looks_like_time(token)) {
            return Item::datetime(token);
        }

        std::string unsigned_part = token;
        bool negative = false;
        if (!unsigned_part.empty() && (unsigned_part[0] == '+' || unsigned_part[0] == '-')) {
            negative = unsigned_part[0] == '-';
            unsigned_part = unsigned_part.substr(1);
        }
        if (unsigned_part == "inf") {
            double inf = std::numeric_limits<double>::infinity();
            return Item::scalar(Item::Kind::Float, negative ? -inf : inf, token);
        }
        if (unsigned_part == "nan") {
            double nan = std::numeric_limits<double>::quiet_NaN();
            return Item::scalar(Item::Kind::Float, negative ? -nan : nan, token);
        }

        if (token.size() > 2 && token[0] == '0' &&
            (token[1] == 'x' || token[1] == 'o' || token[1] == 'b')) {
            int base = token[1] == 'x' ? 16 : (token[1] == 'o' ? 8 : 2);
            size_t i = 2;
            if (!scan_digits(token, i, base) || i != token.size()) {
                fail("Invalid integer '" + token + "'");
            }
            std::string digits = strip_underscores(token.substr(2));
            errno = 0;
            long long value = std::strtoll(digits.c_str(), nullptr, base);
            if (errno == ERANGE) {
                fail("Integer out of range '" + token + "'");
            }
            return Item::scalar(Item::Kind::Integer, static_cast<int64_t>(value), token);
        }

        bool is_float = false;
        if (!valid_decimal(token, is_float)) {
            fail("Invalid value '" + token + "'");
        }

        std::string clean = strip_underscores(token);
        errno = 0;
        if (is_float) {
            double value = std::strtod(clean.c_str(), nullptr);
            if (errno == ERANGE && std::abs(value) > 1.0) {
                fail("Float out of range '" + token + "'");
            }
            return Item::scalar(Item::Kind::Float, value, token);
        }

        long long value = std::strtoll(clean.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            fail("Integer out of range '" + token + "'");
        }
        return Item::scalar(Item::Kind::Integer, static_cast<int64_t>(value), token);
    }

    Item parse_array()
    {
        expect('[');
        Item array = Item::array();
        bool after_comma = false;

        while (true) {
            std::string prefix = take_blank_and_comments();
            if (peek() == ']') {
                ++pos_;
                array.set_trailing(prefix, after_comma);
                return array;
            }
            if (eof()) {
                fail("Unterminated array");
            }

            Item element = parse_value();
            element.decor().prefix = prefix;
            element.decor().suffix = take_blank_and_comments();
            array.push(std::move(element));

            if (peek() == ',') {
                ++pos_;
                after_comma = true;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                array.set_trailing("", false);
                return array;
            }
            fail("Expected ',' or ']' in array");
        }
    }

    Item parse_inline_table()
    {
        expect('{');
        Item table = Item::inline_table();

        std::string prefix = take_ws();
        if (peek() == '}') {
            ++pos_;
            table.set_trailing(prefix, false);
            return table;
        }

        while (true) {
            Decor key_decor;
            key_decor.prefix = prefix;
            std::vector<std::string> key = parse_key();
            key_decor.suffix = take_ws();
            expect('=');

            std::string value_prefix = take_ws();
            Item value = parse_value();
            value.decor().prefix = value_prefix;
            value.decor().suffix = take_ws();

            insert_dotted(table, key, std::move(value), std::move(key_decor), true);

            if (peek() == ',') {
                ++pos_;
                prefix = take_ws();
                if (peek() == '}') {
                    fail("Trailing comma in inline table");
                }
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                table.set_trailing("", false);
                return table;
            }
            fail("Expected ',' or '}' in inline table");
        }
    }

    // --- Strings -------------------------------------------------------------

    void parse_escape(std::string& out)
    {
        ++pos_; // backslash
        char e = peek();
        ++pos_;
        switch (e) {
        case 'b':
            out += '\b';
            break;
        case 't':
            out += '\t';
            break;
        case 'n':
            out += '\n';
            break;
        case 'f':
            out += '\f';
            break;
        case 'r':
            out += '\r';
            break;
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case 'u':
        case 'U': {
            size_t len = e == 'u' ? 4 : 8;
            if (pos_ + len > text_.size()) {
                fail("Truncated unicode escape");
            }
            std::string hex = text_.substr(pos_, len);
            for (char h : hex) {
                if (!std::isxdigit(static_cast<unsigned char>(h))) {
                    fail("Invalid unicode escape");
                }
            }
            unsigned long cp = std::strtoul(hex.c_str(), nullptr, 16);
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                fail("Invalid unicode scalar value");
            }
            append_utf8(out, cp);
            pos_ += len;
            break;
        }
        default:
            fail(std::string("Invalid escape '\\") + e + "'");
        }
    }

    std::string parse_basic_string()
    {
        expect('"');
        std::string out;
        while (true) {
            if (eof() || at_newline()) {
                fail("Unterminated string");
            }
            char c = peek();
            if (c == '"') {
                ++pos_;
                return out;
            }
            if (c == '\\') {
                parse_escape(out);
                continue;
            }
            out += c;
            ++pos_;
        }
    }

    std::string parse_literal_string()
    {
        expect('\'');
        std::string out;
        while (true) {
            if (eof() || at_newline()) {
                fail("Unterminated literal string");
            }
            char c = peek();
            ++pos_;
            if (c == '\'') {
                return out;
            }
            out += c;
        }
    }

    /// Skips the newline that may directly follow an opening `"""` or `'''`.
    void skip_leading_newline()
    {
        if (peek() == '\n') {
            ++pos_;
        } else if (peek() == '\r' && peek(1) == '\n') {
            pos_ += 2;
        }
    }

    /// Handles `"""`/`'''` closers, including up to two quotes that belong to the content.
    bool close_multiline(std::string& out, char quote)
    {
        if (!(peek() == quote && peek(1) == quote && peek(2) == quote)) {
            return false;
        }
        pos_ += 3;
        for (int extra = 0; extra < 2 && peek() == quote; ++extra) {
            out += quote;
            ++pos_;
        }
        return true;
    }

    std::string parse_multiline_basic_string()
    {
        pos_ += 3;
        skip_leading_newline();
        std::string out;

        while (true) {
            if (eof()) {
                fail("Unterminated multi-line string");
            }
            if (close_multiline(out, '"')) {
                return out;
            }

            char c = peek();
            if (c == '\\') {
                // Line-ending backslash: trim the newline and following whitespace.
                size_t probe = pos_ + 1;
                while (probe < text_.size() && (text_[probe] == ' ' || text_[probe] == '\t')) {
                    ++probe;
                }
                if (probe < text_.size() && (text_[probe] == '\n' || text_[probe] == '\r')) {
                    pos_ = probe;
                    while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) {
                        ++pos_;
                    }
                    continue;
                }
                parse_escape(out);
                continue;
            }
            out += c;
            ++pos_;
        }
    }

    std::string parse_multiline_literal_string()
    {
        pos_ += 3;
        skip_leading_newline();
        std::string out;

        while (true) {
            if (eof()) {
                fail("Unterminated multi-line literal string");
            }
            if (close_multiline(out, '\'')) {
                return out;
            }
            out += peek();
            ++pos_;
        }
    }
};

} // namespace

Document Document::parse(const std::string& text)
{
    Parser parser(text);
    return parser.parse_document();
}

Item parse_value(const std::string& text)
{
    Parser parser(text);
    return parser.parse_single_value();
}

} // namespace tomldb::document
