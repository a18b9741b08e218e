// test_editor.cpp - Tests for add, remove, replace, move, copy and transform

#include <catch2/catch_all.hpp>
#include <treepath/access.h>
#include <treepath/editor.h>
#include <treepath/traverse.h>

#include "test_support.h"

using namespace treepath;
using treepath::test::thrown_code;

// ============================================================
// Editing walkthrough
// ============================================================

TEST_CASE("Editing a document step by step", "[editor][walkthrough]") {
    Value doc = add(Value::map(), {"a"}, Value::map({{"b", Value::map({{"c", "here"}})}}));
    REQUIRE(doc == Value::map({{"a", Value::map({{"b", Value::map({{"c", "here"}})}})}}));

    add(doc, {"a", "b", "d"}, Value::vector(), in_place);
    add(doc, {"a", "b", "d", 0}, "diamond", in_place);
    REQUIRE(doc == Value::map({{"a", Value::map({{"b", Value::map({
                                                         {"c", "here"},
                                                         {"d", Value::vector({"diamond"})},
                                                     })}})}}));

    replace(doc, {"a", "b", "d", last()}, "dangerous", in_place);
    REQUIRE(get(doc, {"a", "b", "d"}) == Value::vector({"dangerous"}));

    remove(doc, {"a", "b", "c"}, in_place);
    move(doc, {"a", "b", "d"}, {"d"}, in_place);
    REQUIRE(doc == Value::map({
                       {"a", Value::map({{"b", Value::map()}})},
                       {"d", Value::vector({"dangerous"})},
                   }));
}

// ============================================================
// add
// ============================================================

TEST_CASE("add", "[editor][add]") {
    Value doc = Value::map({{"m", Value::map({{"k", 1}})}, {"l", Value::vector({"a", "b"})}});

    SECTION("inserts into a vector and shifts") {
        add(doc, {"l", 1}, "x", in_place);
        REQUIRE(get(doc, {"l"}) == Value::vector({"a", "x", "b"}));
    }

    SECTION("index equal to size appends") {
        add(doc, {"l", 2}, "c", in_place);
        REQUIRE(get(doc, {"l"}) == Value::vector({"a", "b", "c"}));
    }

    SECTION("last appends, last(n) inserts before the n-th from the end") {
        add(doc, {"l", last()}, "end", in_place);
        add(doc, {"l", last(1)}, "mid", in_place);
        REQUIRE(get(doc, {"l"}) == Value::vector({"a", "b", "mid", "end"}));
    }

    SECTION("overwrites an existing key") {
        add(doc, {"m", "k"}, 2, in_place);
        REQUIRE(get(doc, {"m", "k"}) == 2);
        REQUIRE(get(doc, {"m"}).size() == 1);
    }

    SECTION("index step on a map adds the decimal key") {
        add(doc, {"m", 9}, "nine", in_place);
        REQUIRE(get(doc, {"m"}) == Value::map({{"k", 1}, {"9", "nine"}}));
    }

    SECTION("root replaces the whole value") {
        REQUIRE(add(doc, {}, 5) == 5);
    }

    SECTION("failures") {
        REQUIRE(thrown_code([&] { (void)add(doc, {"nope", "k"}, 1); }) == ErrorCode::ParentNotFound);
        REQUIRE(thrown_code([&] { (void)add(doc, {"l", 9}, 1); }) == ErrorCode::IndexOutOfBounds);
        REQUIRE(thrown_code([&] { (void)add(doc, {"l", "k"}, 1); }) == ErrorCode::TypeMismatch);
        REQUIRE(thrown_code([&] { (void)add(doc, {"m", "k", "z"}, 1); }) == ErrorCode::NotAContainer);
    }
}

TEST_CASE("add then remove restores the original", "[editor][add][property]") {
    const Value doc = Value::map({{"m", Value::map({{"k", 1}})}, {"l", Value::vector({"a", "b"})}});
    for (const Path& p : {Path{"m", "new"}, Path{"l", 0}, Path{"l", 2}, Path{"fresh"}}) {
        REQUIRE(remove(add(doc, p, Value::vector({true})), p) == doc);
    }
}

// ============================================================
// remove / replace
// ============================================================

TEST_CASE("remove", "[editor][remove]") {
    Value doc = Value::map({{"x", 1}, {"y", 2}, {"l", Value::vector({1, 2, 3})}});

    SECTION("copy form leaves the original untouched") {
        Value next = remove(doc, {"x"});
        REQUIRE_FALSE(exists(next, {"x"}));
        REQUIRE(exists(doc, {"x"}));
    }

    SECTION("from-end step") {
        remove(doc, {"l", last()}, in_place);
        REQUIRE(get(doc, {"l"}) == Value::vector({1, 2}));
    }

    SECTION("root") {
        REQUIRE(remove(doc, {}).is_null());
        remove(doc, {}, in_place);
        REQUIRE(doc.is_null());
    }

    SECTION("missing target") {
        REQUIRE(thrown_code([&] { (void)remove(doc, {"z"}); }) == ErrorCode::PathNotFound);
        REQUIRE(thrown_code([&] { (void)remove(doc, {"l", 3}); }) == ErrorCode::PathNotFound);
    }
}

TEST_CASE("replace", "[editor][replace]") {
    Value doc = Value::map({{"x", 1}, {"l", Value::vector({1, 2})}});

    REQUIRE(get(replace(doc, {"l", 0}, "one"), {"l", 0}) == "one");
    REQUIRE(thrown_code([&] { (void)replace(doc, {"y"}, 2); }) == ErrorCode::PathNotFound);
    REQUIRE(thrown_code([&] { (void)replace(doc, {"l", 2}, 2); }) == ErrorCode::PathNotFound);

    SECTION("replace at the root yields the value whatever the prior shape") {
        for (const Value& prior : {Value{}, Value{1}, doc.clone(), Value::vector({1})}) {
            REQUIRE(replace(prior, {}, Value::map({{"v", 1}})) == Value::map({{"v", 1}}));
        }
    }
}

// ============================================================
// move
// ============================================================

TEST_CASE("move", "[editor][move]") {
    Value doc = Value::map({
        {"a", Value::map({{"x", 1}, {"y", 2}, {"z", 3}})},
        {"l", Value::vector({"a", "b", "c"})},
    });

    SECTION("target index is resolved after removal") {
        move(doc, {"l", 0}, {"l", 2}, in_place);
        REQUIRE(get(doc, {"l"}) == Value::vector({"b", "c", "a"}));
    }

    SECTION("backwards within a vector") {
        move(doc, {"l", 2}, {"l", 0}, in_place);
        REQUIRE(get(doc, {"l"}) == Value::vector({"c", "a", "b"}));
    }

    SECTION("to the same place is a no-op") {
        Value before = doc.clone();
        move(doc, {"a", "y"}, {"a", "y"}, in_place);
        REQUIRE(doc == before);
    }

    SECTION("into a descendant of itself") {
        REQUIRE(thrown_code([&] { (void)move(doc, {"a"}, {"a", "inner"}); }) == ErrorCode::InvalidMoveTarget);
    }

    SECTION("missing source") {
        REQUIRE(thrown_code([&] { (void)move(doc, {"q"}, {"r"}); }) == ErrorCode::PathNotFound);
    }

    SECTION("failed add puts the value back in place") {
        REQUIRE(thrown_code([&] { (void)move(doc, {"a", "y"}, {"missing", "k"}, in_place); }) ==
                ErrorCode::ParentNotFound);
        const auto& map = *get(doc, {"a"}).get_map_data();
        REQUIRE(map.nth(1)->first == "y");
        REQUIRE(get(doc, {"a", "y"}) == 2);

        REQUIRE(thrown_code([&] { (void)move(doc, {"l", 1}, {"l", 5}, in_place); }) ==
                ErrorCode::IndexOutOfBounds);
        REQUIRE(get(doc, {"l"}) == Value::vector({"a", "b", "c"}));
    }

    SECTION("leaves are relocated, not altered") {
        Value moved = move(doc, {"a"}, {"l", last()});
        FlatMap before = flatten(doc);
        FlatMap after = flatten(moved);
        REQUIRE(after.size() == before.size());
        REQUIRE(after.at(Path{"l", 3, "x"}) == 1);
        REQUIRE(after.at(Path{"l", 3, "z"}) == 3);
        REQUIRE(after.count(Path{"a", "x"}) == 0);
    }
}

// ============================================================
// copy
// ============================================================

TEST_CASE("copy", "[editor][copy]") {
    Value doc = Value::map({{"src", Value::map({{"v", Value::vector({1})}})}, {"dst", Value::map()}});

    Value copied = copy(doc, {"src"}, {"dst", "clone"});
    REQUIRE(get(copied, {"dst", "clone"}) == get(doc, {"src"}));
    REQUIRE(exists(copied, {"src"}));
    REQUIRE(get(copied, {"src"}) == get(doc, {"src"}));

    SECTION("copies are independent") {
        copy(doc, {"src"}, {"dst", "clone"}, in_place);
        add(doc, {"dst", "clone", "v", last()}, 2, in_place);
        REQUIRE(get(doc, {"src", "v"}).size() == 1);
    }

    SECTION("failures") {
        REQUIRE(thrown_code([&] { (void)copy(doc, {"none"}, {"x"}); }) == ErrorCode::PathNotFound);
        REQUIRE(thrown_code([&] { (void)copy(doc, {"src"}, {"src", "v", 0}); }) ==
                ErrorCode::InvalidMoveTarget);
    }
}

// ============================================================
// transform
// ============================================================

TEST_CASE("transform", "[editor][transform]") {
    Value doc = Value::map({{"n", 2}, {"l", Value::vector({"a"})}});

    Value doubled = transform(doc, {"n"}, [](const Value& v) { return v.as_int() * 2; });
    REQUIRE(get(doubled, {"n"}) == 4);
    REQUIRE(get(doc, {"n"}) == 2);

    transform(doc, {"l", last()}, [](const Value& v) { return v.as_string() + "!"; }, in_place);
    REQUIRE(get(doc, {"l", 0}) == "a!");

    REQUIRE(thrown_code([&] {
                (void)transform(doc, {"missing"}, [](const Value&) { return Value{}; });
            }) == ErrorCode::PathNotFound);
}
