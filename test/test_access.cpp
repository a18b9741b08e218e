// test_access.cpp - Tests for exists, get, get_key, get_pair and set

#include <catch2/catch_all.hpp>
#include <treepath/access.h>

#include "test_support.h"

using namespace treepath;
using treepath::test::thrown_code;

namespace {

Value sample()
{
    return Value::map({
        {"a", Value::map({{"b", 1}, {"n", Value{}}})},
        {"list", Value::vector({"x", "y", "z"})},
        {"s", "text"},
    });
}

} // namespace

// ============================================================
// exists
// ============================================================

TEST_CASE("exists", "[access][exists]") {
    Value doc = sample();

    REQUIRE(exists(doc, {"a", "b"}));
    REQUIRE(exists(doc, {"list", last()}));
    REQUIRE_FALSE(exists(doc, {"a", "zzz"}));
    REQUIRE_FALSE(exists(doc, {"list", 3}));
    REQUIRE_FALSE(exists(doc, {"s", "deeper"}));

    SECTION("present null counts only without check_value") {
        REQUIRE(exists(doc, {"a", "n"}));
        REQUIRE_FALSE(exists(doc, {"a", "n"}, ExistsOptions{.check_key = true, .check_value = true}));
    }

    SECTION("malformed step propagates") {
        REQUIRE(thrown_code([&] { (void)exists(doc, {"list", "x"}); }) == ErrorCode::TypeMismatch);
    }

    SECTION("root") {
        REQUIRE(exists(doc, {}, ExistsOptions{.check_key = false, .check_value = true}));
        REQUIRE_FALSE(exists(Value{}, {}, ExistsOptions{.check_key = false, .check_value = true}));
        REQUIRE(thrown_code([&] { (void)exists(doc, {}); }) == ErrorCode::RootKeyOperation);
    }
}

// ============================================================
// get / get_key / get_pair
// ============================================================

TEST_CASE("get", "[access][get]") {
    Value doc = sample();

    REQUIRE(&get(doc, {}) == &doc);
    REQUIRE(get(doc, {"list", 1}) == "y");
    REQUIRE(get(doc, {"a", "b"}) == 1);

    REQUIRE(thrown_code([&] { (void)get(doc, {"a", "zzz"}); }) == ErrorCode::PathNotFound);
    REQUIRE(thrown_code([&] { (void)get(doc, {"list", 9}); }) == ErrorCode::PathNotFound);
    REQUIRE(thrown_code([&] { (void)get(doc, {"a", last()}); }) == ErrorCode::TypeMismatch);
}

TEST_CASE("get_key resolves from-end steps", "[access][get]") {
    Value doc = sample();

    REQUIRE(get_key(doc, {"a", "b"}) == PathElement{std::string{"b"}});
    REQUIRE(get_key(doc, {"list", last()}) == PathElement{std::size_t{2}});
    REQUIRE(get_key(doc, {"list", last(2)}) == PathElement{std::size_t{0}});

    REQUIRE(thrown_code([&] { (void)get_key(doc, {}); }) == ErrorCode::RootKeyOperation);
    REQUIRE(thrown_code([&] { (void)get_key(doc, {"missing"}); }) == ErrorCode::PathNotFound);
}

TEST_CASE("get_pair", "[access][get]") {
    Value doc = sample();

    auto [key, value] = get_pair(doc, {"list", last(1)});
    REQUIRE(key == PathElement{std::size_t{1}});
    REQUIRE(value == "y");

    REQUIRE(thrown_code([&] { (void)get_pair(doc, {}); }) == ErrorCode::RootKeyOperation);
}

// ============================================================
// set
// ============================================================

TEST_CASE("set copy form leaves the original untouched", "[access][set]") {
    Value doc = sample();
    Value original = doc.clone();

    Value next = set(doc, {"a", "c", 0}, "new");
    REQUIRE(doc == original);
    REQUIRE(get(next, {"a", "c", 0}) == "new");
    REQUIRE(get(next, {"a", "b"}) == 1);
}

TEST_CASE("set in-place form", "[access][set]") {
    Value doc = sample();

    Value& same = set(doc, {"list", 0}, "X", in_place);
    REQUIRE(&same == &doc);
    REQUIRE(get(doc, {"list", 0}) == "X");

    SECTION("overwrite through from-end step") {
        set(doc, {"list", last()}, "Z", in_place);
        REQUIRE(get(doc, {"list", 2}) == "Z");
    }

    SECTION("root path replaces the whole value") {
        set(doc, {}, 7, in_place);
        REQUIRE(doc == 7);
        REQUIRE(set(sample(), {}, Value::vector()) == Value::vector());
    }
}

TEST_CASE("get after set returns the written value", "[access][set][property]") {
    Value doc = sample();
    for (const Path& p : {Path{"a", "b"}, Path{"list", 1}, Path{"s"}, Path{"a", "n"}}) {
        Value written = set(doc, p, Value::map({{"w", true}}));
        REQUIRE(get(written, p) == Value::map({{"w", true}}));
    }
}

TEST_CASE("set with an index step on a map writes the decimal key", "[access][set]") {
    Value doc = Value::map({{"by_id", Value::map({{"7", "seven"}})}});

    set(doc, {"by_id", 8}, "eight", in_place);
    REQUIRE(get(doc, {"by_id"}) == Value::map({{"7", "seven"}, {"8", "eight"}}));
    REQUIRE_FALSE(get(doc, {"by_id", "8"}).is_vector());
}

TEST_CASE("set failures", "[access][set][error]") {
    Value doc = sample();
    REQUIRE(thrown_code([&] { (void)set(doc, {"s", "x"}, 1); }) == ErrorCode::NotAContainer);
    REQUIRE(thrown_code([&] { (void)set(doc, {"list", "x"}, 1); }) == ErrorCode::TypeMismatch);
    REQUIRE(thrown_code([&] { (void)set(doc, {"list", last(5)}, 1); }) == ErrorCode::IndexOutOfBounds);
}
