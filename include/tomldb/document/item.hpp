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
 * @file item.hpp
 * @brief Format-aware node of the TOML document tree.
 *
 * @details
 * An `Item` is one node of a TOML document: a scalar, an array, an inline table, a
 * standard table or an array of tables. Besides its semantic value every node keeps
 * enough of its textual form to be written back the way it was read:
 *
 * - **Representation**: scalars keep their source text (`'single'` vs `"double"`
 *   quoting, `0x1F`, `1_000`, datetime literals).
 * - **Decoration**: the whitespace (and trailing comment) around a value, and around
 *   each key of a table-like node.
 *
 * Freshly constructed nodes carry no decoration; the default spacing is chosen at
 * serialization time from the context. `to_string()` is the textual form used to
 * compare two values, so decoration is part of that comparison.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tomldb::document {

/**
 * @struct Decor
 * @brief Whitespace/comment text surrounding a key or a value.
 *
 * An empty optional means "not recorded", which selects the context default.
 */
struct Decor {
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;

    /// @brief Prefix text, or `fallback` when none was recorded.
    std::string prefix_or(const std::string& fallback) const
    {
        return prefix ? *prefix : fallback;
    }

    /// @brief Suffix text, or `fallback` when none was recorded.
    std::string suffix_or(const std::string& fallback) const
    {
        return suffix ? *suffix : fallback;
    }
};

/**
 * @class Item
 * @brief A node of the document tree with value semantics.
 */
class Item {
  public:
    /// @brief Concrete shape of a node.
    enum class Kind {
        None,          ///< Absent value (e.g. a failed import).
        String,        ///< Basic or literal string, single- or multi-line.
        Integer,       ///< 64-bit signed integer.
        Float,         ///< IEEE-754 double.
        Boolean,       ///< `true` / `false`.
        Datetime,      ///< RFC 3339 date/time literal, kept verbatim.
        Array,         ///< `[ ... ]` value.
        InlineTable,   ///< `{ ... }` value.
        Table,         ///< `[header]` section (or a dotted-key table).
        ArrayOfTables  ///< `[[header]]` sections.
    };

    /// @brief Creates a `None` item.
    Item() = default;

    // --- Factories ---------------------------------------------------------

    static Item string(const std::string& value);
    static Item integer(int64_t value);
    static Item floating(double value);
    static Item boolean(bool value);
    static Item datetime(const std::string& literal);
    static Item array();
    static Item inline_table();
    static Item table();
    static Item array_of_tables();

    /**
     * @brief Creates a scalar with an explicit source representation.
     *
     * Used by the parser so that `repr()` reproduces the input text exactly.
     */
    template <typename T> static Item scalar(Kind kind, T value, std::string repr)
    {
        Item item(kind);
        item.scalar_.template emplace<T>(std::move(value));
        item.repr_ = std::move(repr);
        return item;
    }

    // --- Classification ----------------------------------------------------

    Kind kind() const { return kind_; }

    bool is_none() const { return kind_ == Kind::None; }
    bool is_str() const { return kind_ == Kind::String; }
    bool is_integer() const { return kind_ == Kind::Integer; }
    bool is_float() const { return kind_ == Kind::Float; }
    bool is_bool() const { return kind_ == Kind::Boolean; }
    bool is_datetime() const { return kind_ == Kind::Datetime; }
    bool is_array() const { return kind_ == Kind::Array; }
    bool is_inline_table() const { return kind_ == Kind::InlineTable; }
    bool is_table() const { return kind_ == Kind::Table; }
    bool is_array_of_tables() const { return kind_ == Kind::ArrayOfTables; }

    /// @brief True for standard and inline tables.
    bool is_table_like() const { return is_table() || is_inline_table(); }

    /// @brief True for anything that may appear on the right of `=`.
    bool is_value() const { return !is_none() && !is_table() && !is_array_of_tables(); }

    // --- Scalar access (preconditions: matching kind) -----------------------

    const std::string& as_str() const;
    int64_t as_integer() const;
    double as_float() const;
    bool as_bool() const;

    /// @brief Source text of a scalar (empty for containers).
    const std::string& repr() const { return repr_; }

    // --- Decoration --------------------------------------------------------

    const Decor& decor() const { return decor_; }
    Decor& decor() { return decor_; }

    /// @brief Drops recorded decoration of this node (children are untouched).
    void clear_decor() { decor_ = Decor{}; }

    // --- Array / array-of-tables access ------------------------------------

    /// @brief Elements of an array or the tables of an array of tables.
    const std::vector<Item>& elements() const { return elements_; }
    std::vector<Item>& elements() { return elements_; }

    /// @brief Appends an element to an array or a table to an array of tables.
    void push(Item item);

    /// @brief Whitespace recorded before the closing `]` / `}`.
    const std::optional<std::string>& trailing() const { return trailing_; }
    void set_trailing(std::string text, bool comma);
    bool trailing_comma() const { return trailing_comma_; }

    // --- Table access ------------------------------------------------------

    /// @brief Keys of a table-like node, in insertion order.
    const std::vector<std::string>& keys() const { return keys_; }

    /// @brief Value stored under the i-th key.
    const Item& value_at(size_t index) const { return values_[index]; }
    Item& value_at(size_t index) { return values_[index]; }

    /// @brief Decoration of the i-th key.
    const Decor& key_decor_at(size_t index) const { return key_decor_[index]; }

    /// @brief Number of entries (tables) or elements (arrays).
    size_t size() const;

    bool contains_key(const std::string& key) const;

    /// @brief True if `key` holds a standard (non-inline) table.
    bool contains_table(const std::string& key) const;

    Item* get(const std::string& key);
    const Item* get(const std::string& key) const;

    /**
     * @brief Stores `value` under `key`.
     *
     * An existing entry is replaced in place, keeping its position and key decoration;
     * otherwise the entry is appended.
     *
     * @return Item& The stored value.
     */
    Item& insert(const std::string& key, Item value);

    /// @brief Appends an entry with recorded key decoration (parser use).
    Item& insert_decorated(const std::string& key, Item value, Decor key_decor);

    /// @brief Removes and returns the entry under `key`, if any.
    std::optional<Item> remove(const std::string& key);

    /// @brief Tables created only as a parent of a `[a.b]` header are implicit.
    bool implicit() const { return implicit_; }
    void set_implicit(bool implicit) { implicit_ = implicit; }

    /// @brief Tables created by a dotted key (`a.b = 1`) are written back as dotted keys.
    bool dotted() const { return dotted_; }
    void set_dotted(bool dotted) { dotted_ = dotted; }

    /**
     * @brief Serialized textual form of this node.
     *
     * Values render with their own decoration (or none); tables render as the body
     * of a standalone document.
     */
    std::string to_string() const;

    /// @brief Name of a kind, for diagnostics.
    static const char* kind_name(Kind kind);

  private:
    explicit Item(Kind kind) : kind_(kind) {}

    size_t find(const std::string& key) const;

    Kind kind_ = Kind::None;
    std::variant<std::monostate, std::string, int64_t, double, bool> scalar_;
    std::string repr_;
    Decor decor_;

    std::vector<Item> elements_;
    std::optional<std::string> trailing_;
    bool trailing_comma_ = false;

    std::vector<std::string> keys_;
    std::vector<Item> values_;
    std::vector<Decor> key_decor_;
    bool implicit_ = false;
    bool dotted_ = false;
};

} // namespace tomldb::document
