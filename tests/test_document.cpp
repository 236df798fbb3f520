/**
 * @file test_document.cpp
 * @brief Tests for document parsing, serialization and equality (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace jpatch;

// ============================================================================
// Parsing
// ============================================================================

TEST(ParseDocument, Scalars) {
    EXPECT_EQ(parse_document("1"), 1);
    EXPECT_EQ(parse_document("\"x\""), "x");
    EXPECT_TRUE(parse_document("null").is_null());
    EXPECT_EQ(parse_document("true"), true);
}

TEST(ParseDocument, KeepsKeyOrder) {
    const Value v = parse_document(R"({"b": 1, "a": 2, "c": 3})");
    std::vector<std::string> keys;
    for (auto it = v.begin(); it != v.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"b", "a", "c"}));
}

TEST(ParseDocument, ErrorCarriesSourceAndLocation) {
    try {
        parse_document("{\n  \"a\": 1,\n  \"b\": }", "input.json");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.source(), "input.json");
        EXPECT_EQ(e.line(), 3u);
        EXPECT_GT(e.column(), 1u);
        EXPECT_NE(std::string(e.what()).find("input.json"), std::string::npos);
    }
}

TEST(ParseDocument, TruncatedInput) {
    EXPECT_THROW(parse_document("[1, 2"), ParseError);
    EXPECT_THROW(parse_document(""), ParseError);
}

TEST(ParseDocument, ParseErrorIsPatchError) {
    EXPECT_THROW(parse_document("{"), PatchError);
}

// ============================================================================
// Files
// ============================================================================

TEST(LoadDocument, MissingFileIsIoError) {
    EXPECT_THROW(load_document("/nonexistent/jpatch/doc.json"), IoError);
}

TEST(LoadDocument, ReadsFile) {
    const fs::path path = fs::temp_directory_path() / "jpatch_test_load_document.json";
    {
        std::ofstream out(path);
        out << R"({"name": "demo", "items": [1, 2]})";
    }
    const Value v = load_document(path.string());
    EXPECT_EQ(v["name"], "demo");
    EXPECT_EQ(v["items"].size(), 2u);
    fs::remove(path);
}

// ============================================================================
// Serialization
// ============================================================================

TEST(Serialize, Indented) {
    const Value v = {{"a", 1}};
    EXPECT_EQ(serialize(v), "{\n  \"a\": 1\n}");
    EXPECT_EQ(serialize(v, 4), "{\n    \"a\": 1\n}");
}

TEST(Serialize, RoundTrips) {
    const std::string text = R"({"z":[1,{"y":null}],"a":"s"})";
    const Value v = parse_document(text);
    EXPECT_TRUE(deep_equal(parse_document(serialize(v)), v));
}

// ============================================================================
// Equality
// ============================================================================

TEST(DeepEqual, IgnoresKeyOrder) {
    const Value a = parse_document(R"({"a": 1, "b": {"x": 1, "y": 2}})");
    const Value b = parse_document(R"({"b": {"y": 2, "x": 1}, "a": 1})");
    EXPECT_TRUE(deep_equal(a, b));
}

TEST(DeepEqual, ArrayOrderMatters) {
    EXPECT_FALSE(deep_equal(Value::array({1, 2}), Value::array({2, 1})));
}

TEST(DeepEqual, NumbersByValue) {
    EXPECT_TRUE(deep_equal(parse_document("1"), parse_document("1.0")));
    EXPECT_FALSE(deep_equal(parse_document("1"), parse_document("2")));
}

TEST(DeepEqual, TypeMismatch) {
    EXPECT_FALSE(deep_equal(Value("1"), Value(1)));
    EXPECT_FALSE(deep_equal(Value(nullptr), Value::object()));
    EXPECT_FALSE(deep_equal(Value::array(), Value::object()));
}

TEST(DeepEqual, ExtraKey) {
    EXPECT_FALSE(deep_equal(Value{{"a", 1}}, Value{{"a", 1}, {"b", 2}}));
    EXPECT_FALSE(deep_equal(Value{{"a", 1}}, Value{{"b", 1}}));
}
