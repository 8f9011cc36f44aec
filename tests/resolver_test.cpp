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
 * @file resolver_test.cpp
 * @brief Unit tests for value types, mutation requests and the decision table.
 *
 * @details
 * These tests run purely in memory: every case builds a document, resolves a request
 * against it and inspects the resulting action kind.
 */

#include "framework.hpp"
#include "tomldb/infra/error.hpp"
#include "tomldb/storage/journal.hpp"
#include "tomldb/storage/resolver.hpp"
#include "tomldb/storage/value_type.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using tomldb::document::Document;
using tomldb::document::Item;
using tomldb::storage::Journal;
using tomldb::storage::MutationRequest;
using tomldb::storage::ResolvedAction;
using tomldb::storage::ValueType;
using Kind = tomldb::storage::ResolvedAction::Kind;

namespace {

/// Document with table `t` holding `k = value`, built without source decoration.
Document document_with(Item value)
{
    Document doc;
    Item& table = doc.root().insert("t", Item::table());
    table.insert("k", std::move(value));
    return doc;
}

MutationRequest request(ValueType type, bool remove, bool modify)
{
    MutationRequest req("t");
    req.set_key("k");
    req.set_value_type(type);
    req.set_remove(remove);
    req.set_modify(modify);
    return req;
}

bool resolves_to(const Document& doc, const MutationRequest& req, Kind kind)
{
    auto action = tomldb::storage::resolve(doc, req);
    return action.has_value() && action->kind() == kind;
}

} // namespace

// ============================================================================
// Value Type Classifier
// ============================================================================

void test_value_type_matches()
{
    using tomldb::storage::matches;

    ASSERT_TRUE(matches(ValueType::String, Item::string("x")));
    ASSERT_TRUE(matches(ValueType::Integer, Item::integer(1)));
    ASSERT_TRUE(matches(ValueType::Float, Item::floating(1.5)));
    ASSERT_TRUE(matches(ValueType::Bool, Item::boolean(false)));
    ASSERT_TRUE(matches(ValueType::Object, Item::inline_table()));
    ASSERT_TRUE(matches(ValueType::Append, Item::array()));
    ASSERT_TRUE(matches(ValueType::Import, Item::table()));

    ASSERT_FALSE(matches(ValueType::Float, Item::integer(1)));
    ASSERT_FALSE(matches(ValueType::Object, Item::table()));
    ASSERT_FALSE(matches(ValueType::Import, Item::inline_table()));
    ASSERT_FALSE(matches(ValueType::String, Item()));
}

void test_value_type_construct()
{
    using tomldb::storage::construct;

    ASSERT_EQ(construct(ValueType::String, "'quoted'").to_string(), "'quoted'");
    ASSERT_EQ(construct(ValueType::String, "plain text").as_str(), "plain text");
    ASSERT_EQ(construct(ValueType::Integer, "0x10").as_integer(), static_cast<int64_t>(16));
    ASSERT_EQ(construct(ValueType::Float, "3").to_string(), "3.0");
    ASSERT_TRUE(construct(ValueType::Bool, "true").as_bool());
    ASSERT_TRUE(construct(ValueType::Object, "{ a = 1 }").is_inline_table());
    ASSERT_EQ(construct(ValueType::Append, "[1, 2]").elements().size(), static_cast<size_t>(2));

    ASSERT_THROWS(construct(ValueType::Integer, "five"), tomldb::infra::ParseError);
    ASSERT_THROWS(construct(ValueType::Bool, "1"), tomldb::infra::ParseError);
    ASSERT_THROWS(construct(ValueType::Object, "[1]"), tomldb::infra::ParseError);
}

/**
 * @brief A failed import degrades to an empty value instead of an error.
 */
void test_value_type_import()
{
    using tomldb::storage::construct;

    ASSERT_TRUE(construct(ValueType::Import, "/nonexistent/import.toml").is_none());

    std::filesystem::path path = std::filesystem::temp_directory_path() / "tomldb_import_test.toml";
    {
        std::ofstream out(path);
        out << "answer = 42\n\n[nested]\nok = true\n";
    }
    Item imported = construct(ValueType::Import, path.string());
    ASSERT_TRUE(imported.is_table());
    ASSERT_EQ(imported.get("answer")->as_integer(), static_cast<int64_t>(42));

    {
        std::ofstream out(path);
        out << "broken = [\n";
    }
    ASSERT_TRUE(construct(ValueType::Import, path.string()).is_none());
    std::filesystem::remove(path);
}

void test_value_type_tokens()
{
    using tomldb::storage::parse_value_type;
    using tomldb::storage::to_token;

    const char* tokens[] = {"str", "bool", "float", "int", "obj", "append", "import"};
    for (const char* token : tokens) {
        ASSERT_EQ(std::string(to_token(parse_value_type(token))), token);
    }
    ASSERT_THROWS(parse_value_type("text"), tomldb::infra::ParseError);
    ASSERT_TRUE(tomldb::storage::infer(Item::array()) == ValueType::Append);
    ASSERT_TRUE(tomldb::storage::infer(Item::table()) == ValueType::Object);
}

// ============================================================================
// Mutation Request
// ============================================================================

void test_request_journal_form()
{
    MutationRequest insert("t");
    insert.set_kvp("k", "v");
    ASSERT_EQ(insert.to_string(), "-t 't' -X str 'k' -- \"v\"");

    MutationRequest modify("a.b");
    modify.set_kvp("n", 5).set_modify(true).set_remove(true);
    modify.set_extended_value_type(ValueType::Append);
    ASSERT_EQ(modify.to_string(), "--modify --remove -t 'a.b' -X int -Y append 'n' -- 5");

    MutationRequest view("t");
    view.set_key("flag").set_value_type(ValueType::Bool).set_modify(true);
    ASSERT_EQ(view.to_string(), "--modify -t 't' -X bool 'flag'");

    MutationRequest imported("t");
    imported.set_kvp("cfg", std::filesystem::path("/nonexistent/x.toml"));
    ASSERT_EQ(imported.to_string(), "-t 't' -X import 'cfg' -- '/nonexistent/x.toml'");
    ASSERT_FALSE(imported.has_value());
}

void test_request_typed_builders()
{
    MutationRequest req("t");

    req.set_kvp("f", 1.5);
    ASSERT_TRUE(req.value_type() == ValueType::Float);
    req.set_kvp("i", 7);
    ASSERT_TRUE(req.value_type() == ValueType::Integer);
    req.set_kvp("b", true);
    ASSERT_TRUE(req.value_type() == ValueType::Bool);
    req.set_kvp("s", std::string("text"));
    ASSERT_TRUE(req.value_type() == ValueType::String);
    req.set_kvp("o", tomldb::document::parse_value("{ x = 1 }"));
    ASSERT_TRUE(req.value_type() == ValueType::Object);
    ASSERT_EQ(req.key(), "o");
}

void test_request_materialize_rejects_scalar_segment()
{
    Document doc = document_with(Item::integer(5));

    MutationRequest req("t.k.deeper");
    req.set_kvp("x", 1);
    ASSERT_TRUE(req.find_table(doc) == nullptr);
    ASSERT_THROWS(req.materialize_table(doc), tomldb::infra::StateError);
}

/**
 * @brief Inline objects and arrays of tables are values, not path segments.
 */
void test_request_table_path_requires_tables()
{
    Document doc = Document::parse("a = {x = 1}\n\n[[list]]\nname = \"first\"\n");

    MutationRequest inline_req("a");
    inline_req.set_kvp("y", 2);
    ASSERT_TRUE(inline_req.find_table(doc) == nullptr);
    ASSERT_THROWS(inline_req.materialize_table(doc), tomldb::infra::StateError);
    ASSERT_TRUE(resolves_to(doc, inline_req, Kind::MissingTable));

    MutationRequest nested_req("a.deeper");
    nested_req.set_kvp("y", 2);
    ASSERT_THROWS(nested_req.materialize_table(doc), tomldb::infra::StateError);

    MutationRequest array_req("list");
    array_req.set_kvp("name", "second");
    ASSERT_TRUE(array_req.find_table(doc) == nullptr);
    ASSERT_THROWS(array_req.materialize_table(doc), tomldb::infra::StateError);
}

/**
 * @brief Requests aimed inside an inline object are dropped and leave it intact.
 */
void test_evaluate_drops_requests_into_inline_objects()
{
    const std::string source = "a = {x = 1}\n";

    std::filesystem::path path = std::filesystem::temp_directory_path() / "tomldb_inline_import.toml";
    {
        std::ofstream out(path);
        out << "q = 1\n";
    }

    Journal journal(Document::parse(source));
    journal.table("a").set_kvp("y", 2);
    journal.table("a").set_kvp("imp", path);
    journal.table("a.b").set_kvp("z", true);

    auto views = journal.evaluate();
    std::filesystem::remove(path);

    ASSERT_TRUE(views.empty());
    ASSERT_TRUE(journal.evaluated().empty());
    ASSERT_TRUE(journal.pending().empty());
    ASSERT_EQ(journal.document().to_string(), source);
    ASSERT_EQ(Document::parse(journal.document().to_string()).to_string(), source);
}

void test_request_set_and_remove_item()
{
    Document doc = document_with(Item::integer(5));

    MutationRequest wrong_type = request(ValueType::String, false, false);
    wrong_type.set_value(Item::string("x"));
    ASSERT_THROWS(wrong_type.set_item(doc), tomldb::infra::StateError);

    MutationRequest no_value = request(ValueType::Integer, false, false);
    ASSERT_THROWS(no_value.set_item(doc), tomldb::infra::StateError);

    MutationRequest replace = request(ValueType::Integer, false, false);
    replace.set_value(Item::integer(9));
    auto previous = replace.set_item(doc);
    ASSERT_TRUE(previous.has_value());
    ASSERT_EQ(previous->as_integer(), static_cast<int64_t>(5));
    ASSERT_EQ(replace.view_item(doc).value_or(""), "9");

    MutationRequest remove_mismatch = request(ValueType::Integer, true, false);
    remove_mismatch.set_value(Item::integer(1));
    ASSERT_THROWS(remove_mismatch.remove_item(doc), tomldb::infra::StateError);

    MutationRequest remove_any = request(ValueType::Integer, true, false);
    ASSERT_TRUE(remove_any.remove_item(doc).has_value());
    ASSERT_TRUE(remove_any.get_entry(doc) == nullptr);
}

// ============================================================================
// Decision table
// ============================================================================

/**
 * @brief Inserting the same request twice yields Insert, then Exists.
 */
void test_insert_then_exists()
{
    Journal journal;
    MutationRequest req("t");
    req.set_kvp("k", "v");

    journal.push(req);
    journal.evaluate();
    journal.push(req);
    journal.evaluate();

    ASSERT_EQ(journal.evaluated().size(), static_cast<size_t>(2));
    ASSERT_TRUE(journal.evaluated()[0].first.kind() == Kind::Insert);
    ASSERT_TRUE(journal.evaluated()[1].first.kind() == Kind::Exists);
}

/**
 * @brief A Float key rejects every String request, whatever the flags.
 */
void test_type_mismatch_is_stable()
{
    Document doc = document_with(Item::floating(1.5));

    for (int flags = 0; flags < 4; ++flags) {
        MutationRequest without_value = request(ValueType::String, flags & 1, flags & 2);
        ASSERT_TRUE(resolves_to(doc, without_value, Kind::RejectTypeMismatch));

        MutationRequest with_value = without_value;
        with_value.set_value(Item::string("1.5"));
        ASSERT_TRUE(resolves_to(doc, with_value, Kind::RejectTypeMismatch));
    }
}

/**
 * @brief modify alone: equal value replaces, different value rejects, none views.
 */
void test_modify_requires_value_agreement()
{
    Document doc = document_with(Item::integer(5));

    MutationRequest different = request(ValueType::Integer, false, true);
    different.set_value(Item::integer(6));
    ASSERT_TRUE(resolves_to(doc, different, Kind::RejectExistingValueMismatch));

    MutationRequest same = request(ValueType::Integer, false, true);
    same.set_value(Item::integer(5));
    ASSERT_TRUE(resolves_to(doc, same, Kind::Replace));

    MutationRequest none = request(ValueType::Integer, false, true);
    ASSERT_TRUE(resolves_to(doc, none, Kind::View));
}

/**
 * @brief remove + modify overwrites a same-typed value unconditionally.
 */
void test_force_replace()
{
    Document doc = document_with(Item::integer(5));

    MutationRequest force = request(ValueType::Integer, true, true);
    force.set_value(Item::integer(7));
    ASSERT_TRUE(resolves_to(doc, force, Kind::Replace));

    Journal journal(doc);
    journal.push(force);
    journal.evaluate();
    ASSERT_EQ(journal.document().root().get("t")->get("k")->as_integer(), static_cast<int64_t>(7));
}

void test_remove_and_plain_branches()
{
    Document doc = document_with(Item::integer(5));

    ASSERT_TRUE(resolves_to(doc, request(ValueType::Integer, true, false), Kind::WouldRemove));
    ASSERT_TRUE(resolves_to(doc, request(ValueType::Integer, false, false), Kind::NoOp));

    MutationRequest exists = request(ValueType::Integer, false, false);
    exists.set_value(Item::integer(5));
    ASSERT_TRUE(resolves_to(doc, exists, Kind::Exists));

    MutationRequest mismatch = request(ValueType::Integer, false, false);
    mismatch.set_value(Item::integer(4));
    ASSERT_TRUE(resolves_to(doc, mismatch, Kind::RejectExistingValueMismatch));

    MutationRequest absent = request(ValueType::Integer, false, true);
    absent.set_key("missing");
    ASSERT_FALSE(tomldb::storage::resolve(doc, absent).has_value());
    absent.set_modify(false).set_remove(true);
    ASSERT_FALSE(tomldb::storage::resolve(doc, absent).has_value());
}

/**
 * @brief Serialized text decides equality, so source formatting matters.
 */
void test_equality_uses_serialized_text()
{
    Document parsed = Document::parse("[t]\nk = 5\n");

    MutationRequest same_number = request(ValueType::Integer, false, false);
    same_number.set_value(Item::integer(5));
    ASSERT_TRUE(resolves_to(parsed, same_number, Kind::RejectExistingValueMismatch));

    MutationRequest decorated = same_number;
    Item value = Item::integer(5);
    value.decor().prefix = " ";
    value.decor().suffix = "";
    decorated.set_value(value);
    ASSERT_TRUE(resolves_to(parsed, decorated, Kind::Exists));
}

/**
 * @brief Missing tables are signalled, then materialized with every parent.
 */
void test_missing_table_materialization()
{
    Document doc;
    MutationRequest req("a.b.c");
    req.set_kvp("k", 1);

    ASSERT_TRUE(resolves_to(doc, req, Kind::MissingTable));

    req.materialize_table(doc);
    const Item* a = doc.root().get("a");
    ASSERT_TRUE(a != nullptr && a->is_table());
    ASSERT_TRUE(a->get("b") != nullptr && a->get("b")->is_table());
    const Item* c = a->get("b")->get("c");
    ASSERT_TRUE(c != nullptr && c->is_table());
    ASSERT_EQ(c->size(), static_cast<size_t>(0));

    ASSERT_TRUE(resolves_to(doc, req, Kind::Insert));
}

/**
 * @brief Non-mutating requests still leave their (empty) table behind.
 */
void test_view_materializes_table()
{
    Journal journal;
    MutationRequest view("ghost");
    view.set_key("k").set_modify(true);

    journal.push(view);
    journal.evaluate();

    ASSERT_EQ(journal.evaluated().size(), static_cast<size_t>(0));
    ASSERT_TRUE(journal.document().root().contains_table("ghost"));
    ASSERT_EQ(journal.document().to_string(), "[ghost]\n");
}

void test_action_records()
{
    MutationRequest req("t");
    req.set_kvp("k", "v");

    ASSERT_EQ(ResolvedAction::insert(req).to_string(), "insert -t 't' -X str 'k' -- \"v\"");
    ASSERT_EQ(ResolvedAction::signal(Kind::RejectTypeMismatch).to_string(), "reject-type-mismatch");
    ASSERT_EQ(ResolvedAction::signal(Kind::NoOp).to_string(), "noop");
    ASSERT_TRUE(ResolvedAction::signal(Kind::RejectExistingValueMismatch).is_rejection());
    ASSERT_FALSE(ResolvedAction::exists(req).is_rejection());
}

/**
 * @brief An empty table path addresses top-level keys; no `[""]` table appears.
 */
void test_empty_table_path_is_root()
{
    Journal journal;
    journal.table("").set_kvp("top", 1);
    journal.evaluate();

    ASSERT_EQ(journal.evaluated().size(), static_cast<size_t>(1));
    ASSERT_TRUE(journal.evaluated()[0].first.kind() == Kind::Insert);
    ASSERT_FALSE(journal.document().root().contains_key(""));
    ASSERT_EQ(journal.document().to_string(), "top = 1\n");
    ASSERT_EQ(journal.records(), "insert -t '' -X int 'top' -- 1\n");
}

/**
 * @brief A multi-line value keeps its newlines inside a single journal record.
 */
void test_multiline_value_record()
{
    Journal journal;
    MutationRequest& req = journal.table("t");
    req.set_key("list").set_value_type(ValueType::Append);
    req.set_value(tomldb::storage::construct(ValueType::Append, "[1,\n  2]"));
    journal.evaluate();

    std::string records = journal.records();
    ASSERT_EQ(records, "insert -t 't' -X append 'list' -- [1,\n  2]\n");
    ASSERT_EQ(records.rfind("insert ", 0), static_cast<size_t>(0));
}
