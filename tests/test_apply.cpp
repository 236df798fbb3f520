/**
 * @file test_apply.cpp
 * @brief Tests for applying patches (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Apply.hpp"
#include "jpatch/Document.hpp"

using namespace jpatch;

namespace {

Value doc(const std::string& text) {
    return parse_document(text);
}

Value apply(const std::string& document, const std::string& patch) {
    return apply_patch(doc(document), parse_patch(patch));
}

} // anonymous namespace

#define EXPECT_JSON_EQ(actual, expected) \
    EXPECT_TRUE(deep_equal((actual), doc(expected))) << (actual).dump()

// ============================================================================
// add
// ============================================================================

TEST(ApplyAdd, ObjectMember) {
    EXPECT_JSON_EQ(apply(R"({"a":1})", R"([{"op":"add","path":"/b","value":2}])"),
                   R"({"a":1,"b":2})");
}

TEST(ApplyAdd, ReplacesExistingMember) {
    EXPECT_JSON_EQ(apply(R"({"a":1})", R"([{"op":"add","path":"/a","value":[1]}])"),
                   R"({"a":[1]})");
}

TEST(ApplyAdd, ArrayInsertShifts) {
    EXPECT_JSON_EQ(apply(R"(["a","b"])", R"([{"op":"add","path":"/1","value":"x"}])"),
                   R"(["a","x","b"])");
}

TEST(ApplyAdd, ArrayAtSizeAndAppend) {
    EXPECT_JSON_EQ(apply(R"([1])", R"([{"op":"add","path":"/1","value":2}])"), "[1,2]");
    EXPECT_JSON_EQ(apply(R"([1])", R"([{"op":"add","path":"/-","value":2}])"), "[1,2]");
}

TEST(ApplyAdd, IndexPastEnd) {
    try {
        apply(R"({"a":[1,2]})", R"([{"op":"add","path":"/a/3","value":0}])");
        FAIL() << "expected IndexOutOfBounds";
    } catch (const IndexOutOfBounds& e) {
        EXPECT_EQ(e.index(), 3u);
        EXPECT_EQ(e.size(), 2u);
        EXPECT_EQ(e.path(), "/a/3");
    }
}

TEST(ApplyAdd, MissingParent) {
    EXPECT_THROW(apply(R"({})", R"([{"op":"add","path":"/a/b","value":1}])"), PathNotFound);
}

TEST(ApplyAdd, ScalarParent) {
    EXPECT_THROW(apply(R"({"a":1})", R"([{"op":"add","path":"/a/b","value":1}])"),
                 PathNotFound);
}

TEST(ApplyAdd, NonIndexTokenOnArray) {
    EXPECT_THROW(apply(R"([1])", R"([{"op":"add","path":"/x","value":1}])"), PathNotFound);
}

TEST(ApplyAdd, Root) {
    EXPECT_JSON_EQ(apply(R"({"a":1})", R"([{"op":"add","path":"","value":[true]}])"),
                   "[true]");
}

// ============================================================================
// remove / replace
// ============================================================================

TEST(ApplyRemove, ObjectMember) {
    EXPECT_JSON_EQ(apply(R"({"a":1,"b":2})", R"([{"op":"remove","path":"/a"}])"),
                   R"({"b":2})");
}

TEST(ApplyRemove, ArrayElementShifts) {
    EXPECT_JSON_EQ(apply(R"([1,2,3])", R"([{"op":"remove","path":"/0"}])"), "[2,3]");
}

TEST(ApplyRemove, Missing) {
    EXPECT_THROW(apply(R"({"a":1})", R"([{"op":"remove","path":"/b"}])"), PathNotFound);
    EXPECT_THROW(apply(R"([1])", R"([{"op":"remove","path":"/1"}])"), PathNotFound);
    EXPECT_THROW(apply(R"([1])", R"([{"op":"remove","path":"/-"}])"), PathNotFound);
}

TEST(ApplyRemove, Root) {
    EXPECT_THROW(apply(R"({"a":1})", R"([{"op":"remove","path":""}])"), InvalidPointer);
}

TEST(ApplyReplace, ArrayElement) {
    EXPECT_JSON_EQ(apply(R"(["a","b"])", R"([{"op":"replace","path":"/0","value":"z"}])"),
                   R"(["z","b"])");
}

TEST(ApplyReplace, Root) {
    EXPECT_JSON_EQ(apply(R"({"a":1})", R"([{"op":"replace","path":"","value":3}])"), "3");
}

TEST(ApplyReplace, Missing) {
    EXPECT_THROW(apply(R"({})", R"([{"op":"replace","path":"/a","value":1}])"),
                 PathNotFound);
}

// ============================================================================
// move / copy
// ============================================================================

TEST(ApplyMove, BetweenMembers) {
    EXPECT_JSON_EQ(apply(R"({"a":{"x":1},"b":{}})",
                         R"([{"op":"move","from":"/a/x","path":"/b/y"}])"),
                   R"({"a":{},"b":{"y":1}})");
}

TEST(ApplyMove, WithinArray) {
    EXPECT_JSON_EQ(apply(R"([1,2,3,4])", R"([{"op":"move","from":"/0","path":"/3"}])"),
                   "[2,3,4,1]");
}

TEST(ApplyMove, IntoDescendant) {
    try {
        apply(R"({"a":{"b":{}}})", R"([{"op":"move","from":"/a","path":"/a/b/c"}])");
        FAIL() << "expected InvalidMove";
    } catch (const InvalidMove& e) {
        EXPECT_EQ(e.from(), "/a");
        EXPECT_EQ(e.path(), "/a/b/c");
    }
}

TEST(ApplyMove, IntoOwnChild) {
    EXPECT_THROW(apply(R"({"a":{"b":1}})", R"([{"op":"move","from":"/a","path":"/a/b"}])"),
                 InvalidMove);
}

TEST(ApplyMove, SamePathIsNoOp) {
    EXPECT_JSON_EQ(apply(R"({"a":1})", R"([{"op":"move","from":"/a","path":"/a"}])"),
                   R"({"a":1})");
}

TEST(ApplyMove, MissingSource) {
    EXPECT_THROW(apply(R"({})", R"([{"op":"move","from":"/a","path":"/b"}])"),
                 PathNotFound);
}

TEST(ApplyCopy, DeepCopy) {
    const Value result = apply(R"({"a":{"x":[1]}})",
                               R"([{"op":"copy","from":"/a","path":"/b"},
                                   {"op":"add","path":"/b/x/-","value":2}])");
    EXPECT_JSON_EQ(result, R"({"a":{"x":[1]},"b":{"x":[1,2]}})");
}

TEST(ApplyCopy, MissingSource) {
    EXPECT_THROW(apply(R"({})", R"([{"op":"copy","from":"/a","path":"/b"}])"),
                 PathNotFound);
}

// ============================================================================
// test
// ============================================================================

TEST(ApplyTest, GatePasses) {
    EXPECT_JSON_EQ(apply(R"({"x":1})", R"([{"op":"test","path":"/x","value":1},
                                          {"op":"replace","path":"/x","value":2}])"),
                   R"({"x":2})");
}

TEST(ApplyTest, GateFails) {
    const Value input = doc(R"({"x":9})");
    const Patch patch = parse_patch(R"([{"op":"test","path":"/x","value":1},
                                        {"op":"replace","path":"/x","value":2}])");
    try {
        apply_patch(input, patch);
        FAIL() << "expected TestFailed";
    } catch (const TestFailed& e) {
        EXPECT_EQ(e.expected(), 1);
        EXPECT_EQ(e.actual(), 9);
        EXPECT_EQ(e.operation_index(), std::optional<std::size_t>(0));
        EXPECT_EQ(e.operation(), "test");
    }
    EXPECT_JSON_EQ(input, R"({"x":9})");
}

TEST(ApplyTest, ComparesStructurally) {
    EXPECT_NO_THROW(apply(R"({"o":{"a":1,"b":2}})",
                          R"([{"op":"test","path":"/o","value":{"b":2,"a":1}}])"));
    EXPECT_THROW(apply(R"({"o":[1,2]})", R"([{"op":"test","path":"/o","value":[2,1]}])"),
                 TestFailed);
}

TEST(ApplyTest, MissingPath) {
    EXPECT_THROW(apply(R"({})", R"([{"op":"test","path":"/a","value":null}])"),
                 PathNotFound);
}

// ============================================================================
// Whole patches
// ============================================================================

TEST(ApplyPatch, EmptyPatchIsIdentity) {
    const Value input = doc(R"({"a":[1,{"b":null}]})");
    EXPECT_JSON_EQ(apply_patch(input, {}), R"({"a":[1,{"b":null}]})");
}

TEST(ApplyPatch, SequentialSemantics) {
    EXPECT_JSON_EQ(apply(R"([])", R"([{"op":"add","path":"/0","value":"b"},
                                     {"op":"add","path":"/0","value":"a"},
                                     {"op":"add","path":"/-","value":"c"}])"),
                   R"(["a","b","c"])");
}

TEST(ApplyPatch, RemoveThenAddAtFront) {
    EXPECT_JSON_EQ(apply(R"(["a","b"])", R"([{"op":"remove","path":"/0"},
                                            {"op":"add","path":"/0","value":"z"}])"),
                   R"(["z","b"])");
}

TEST(ApplyPatch, AddThenRemoveRestores) {
    const Value input = doc(R"({"list":[1,2],"k":"v"})");
    const Patch patch = parse_patch(R"([{"op":"add","path":"/list/1","value":9},
                                        {"op":"add","path":"/n","value":{}},
                                        {"op":"remove","path":"/n"},
                                        {"op":"remove","path":"/list/1"}])");
    EXPECT_JSON_EQ(apply_patch(input, patch), R"({"list":[1,2],"k":"v"})");
}

TEST(ApplyPatch, FailureLeavesInputUntouched) {
    const Value input = doc(R"({"a":1})");
    const Patch patch = parse_patch(R"([{"op":"add","path":"/b","value":2},
                                        {"op":"remove","path":"/missing"}])");
    try {
        apply_patch(input, patch);
        FAIL() << "expected PathNotFound";
    } catch (const PathNotFound& e) {
        EXPECT_EQ(e.operation_index(), std::optional<std::size_t>(1));
        EXPECT_EQ(e.operation(), "remove");
        EXPECT_EQ(std::string(e.what()).rfind("operation #1 (remove): ", 0), 0u);
    }
    EXPECT_JSON_EQ(input, R"({"a":1})");
}

TEST(ApplyPatch, SingleOperationInPlace) {
    Value target = doc(R"({"a":1})");
    apply_operation(target, Operation::replace(Pointer::parse("/a"), 5));
    EXPECT_EQ(target["a"], 5);
}
