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
 * @file document_test.cpp
 * @brief Unit tests for the TOML document engine.
 *
 * @details
 * Validates parsing of the supported syntax, the canonical layout of the writer and
 * the round-trip law `to_string(parse(to_string(d))) == to_string(d)`.
 */

#include "framework.hpp"
#include "tomldb/document/document.hpp"
#include "tomldb/infra/error.hpp"

#include <string>

using tomldb::document::Document;
using tomldb::document::Item;

namespace {

const char* kRichDocument = R"(# leading comment is dropped
name = 'literal'   # kept with its value
hex = 0x1F
big = 1_000_000
ratio = 2.5e-3
when = 1979-05-27T07:32:00Z
nums = [ 1, 2,
  3, ]
point = { x = 1, y = "two" }
a.b = "dotted"

[server]
host = "localhost"

[server.tls]
enabled = true

[[products]]
name = "Hammer"

[[products]]
name = "Nail"
)";

} // namespace

void test_parse_scalars_and_tables()
{
    Document doc = Document::parse(kRichDocument);
    const Item& root = doc.root();

    ASSERT_EQ(root.get("name")->as_str(), "literal");
    ASSERT_EQ(root.get("hex")->as_integer(), static_cast<int64_t>(31));
    ASSERT_EQ(root.get("big")->as_integer(), static_cast<int64_t>(1000000));
    ASSERT_TRUE(root.get("ratio")->is_float());
    ASSERT_TRUE(root.get("when")->is_datetime());
    ASSERT_EQ(root.get("nums")->elements().size(), static_cast<size_t>(3));
    ASSERT_TRUE(root.get("point")->is_inline_table());
    ASSERT_EQ(root.get("point")->get("y")->as_str(), "two");
    ASSERT_EQ(root.get("a")->get("b")->as_str(), "dotted");

    const Item* server = root.get("server");
    ASSERT_TRUE(server != nullptr && server->is_table());
    ASSERT_EQ(server->get("host")->as_str(), "localhost");
    ASSERT_TRUE(server->get("tls")->get("enabled")->as_bool());

    const Item* products = root.get("products");
    ASSERT_TRUE(products->is_array_of_tables());
    ASSERT_EQ(products->elements()[1].get("name")->as_str(), "Nail");
}

/**
 * @brief Built documents are laid out as key/values first, then sections.
 */
void test_serialize_canonical_layout()
{
    Document doc;
    doc.root().insert("title", Item::string("demo"));
    doc.root().insert("version", Item::integer(2));

    Item& server = doc.root().insert("server", Item::table());
    server.insert("port", Item::integer(8080));
    Item& tls = server.insert("tls", Item::table());
    tls.insert("enabled", Item::boolean(true));

    ASSERT_EQ(doc.to_string(), "title = \"demo\"\n"
                               "version = 2\n"
                               "\n"
                               "[server]\n"
                               "port = 8080\n"
                               "\n"
                               "[server.tls]\n"
                               "enabled = true\n");
}

void test_serialize_quotes_keys_and_floats()
{
    Document doc;
    doc.root().insert("needs quoting", Item::string("tab\there"));
    doc.root().insert("whole", Item::floating(3.0));
    doc.root().insert("empty", Item::inline_table());
    doc.root().insert("list", Item::array());

    ASSERT_EQ(doc.to_string(), "\"needs quoting\" = \"tab\\there\"\n"
                               "whole = 3.0\n"
                               "empty = {}\n"
                               "list = []\n");
}

/**
 * @brief Values keep their source text and their surrounding whitespace.
 */
void test_parsed_values_keep_formatting()
{
    std::string out = Document::parse(kRichDocument).to_string();

    ASSERT_TRUE(out.find("name = 'literal'   # kept with its value\n") != std::string::npos);
    ASSERT_TRUE(out.find("hex = 0x1F\n") != std::string::npos);
    ASSERT_TRUE(out.find("nums = [ 1, 2,\n  3, ]\n") != std::string::npos);
    ASSERT_TRUE(out.find("point = { x = 1, y = \"two\" }\n") != std::string::npos);
    ASSERT_TRUE(out.find("a.b = \"dotted\"\n") != std::string::npos);
    ASSERT_TRUE(out.find("[[products]]\nname = \"Nail\"\n") != std::string::npos);
    ASSERT_TRUE(out.find("leading comment") == std::string::npos);
}

/**
 * @brief Serialize, re-parse, re-serialize: byte-identical output.
 */
void test_round_trip_is_stable()
{
    std::string first = Document::parse(kRichDocument).to_string();
    std::string second = Document::parse(first).to_string();
    ASSERT_EQ(first, second);

    Document built;
    Item& table = built.root().insert("a", Item::table());
    Item& nested = table.insert("b", Item::table());
    nested.insert("c", Item::table());
    std::string built_text = built.to_string();
    ASSERT_EQ(Document::parse(built_text).to_string(), built_text);
}

/**
 * @brief Explicit empty tables survive a round trip as headers.
 */
void test_empty_tables_are_written()
{
    Document doc = Document::parse("[a.b.c]\n");
    ASSERT_EQ(doc.to_string(), "[a.b.c]\n");

    Document created;
    created.root().insert("empty", Item::table());
    ASSERT_EQ(created.to_string(), "[empty]\n");
}

void test_item_to_string_includes_decoration()
{
    Document doc = Document::parse("k = 5\n");
    ASSERT_EQ(doc.root().get("k")->to_string(), " 5");
    ASSERT_EQ(Item::integer(5).to_string(), "5");
    ASSERT_EQ(tomldb::document::parse_value("  'v'  ").to_string(), "'v'");
}

void test_parse_errors_report_line()
{
    using tomldb::infra::ParseError;

    ASSERT_THROWS(Document::parse("[a]\n[a]\n"), ParseError);
    ASSERT_THROWS(Document::parse("k = 1\nk = 2\n"), ParseError);
    ASSERT_THROWS(Document::parse("k = \"unterminated\n"), ParseError);
    ASSERT_THROWS(tomldb::document::parse_value("1 2"), ParseError);

    size_t line = 0;
    try {
        Document::parse("a = 1\nb = \n");
    } catch (const ParseError& e) {
        line = e.line();
    }
    ASSERT_EQ(line, static_cast<size_t>(2));
}

void test_item_table_operations()
{
    Item table = Item::table();
    table.insert("first", Item::integer(1));
    table.insert("second", Item::integer(2));
    table.insert("first", Item::integer(10));

    ASSERT_EQ(table.keys()[0], "first");
    ASSERT_EQ(table.get("first")->as_integer(), static_cast<int64_t>(10));

    auto removed = table.remove("second");
    ASSERT_TRUE(removed.has_value());
    ASSERT_EQ(removed->as_integer(), static_cast<int64_t>(2));
    ASSERT_FALSE(table.remove("missing").has_value());
    ASSERT_EQ(table.size(), static_cast<size_t>(1));

    ASSERT_THROWS(Item::integer(1).as_str(), tomldb::infra::StateError);
}
