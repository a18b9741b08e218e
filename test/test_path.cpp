// test_path.cpp - Tests for Path construction, pointer text and prefix checks

#include <catch2/catch_all.hpp>
#include <treepath/error.h>
#include <treepath/path.h>

#include "test_support.h"

using namespace treepath;
using namespace treepath::literals;
using treepath::test::thrown_code;

// ============================================================
// Construction
// ============================================================

TEST_CASE("Path literal construction", "[path][construction]") {
    Path p{"users", 0, "name", last(), -2};

    REQUIRE(p.size() == 5);
    REQUIRE(std::get<std::string>(p[0]) == "users");
    REQUIRE(std::get<std::size_t>(p[1]) == 0);
    REQUIRE(std::get<FromEnd>(p[3]) == FromEnd{0});
    REQUIRE(std::get<FromEnd>(p[4]) == FromEnd{1});

    SECTION("empty path is the root") {
        Path root;
        REQUIRE(root.empty());
        REQUIRE(root == Path{});
    }
}

TEST_CASE("Path parent, prefix, child, concat", "[path][construction]") {
    Path p{"a", "b", 2};

    REQUIRE(p.parent() == Path{"a", "b"});
    REQUIRE(Path{}.parent() == Path{});
    REQUIRE(p.prefix(1) == Path{"a"});
    REQUIRE(p.prefix(10) == p);
    REQUIRE(p.child("c") == Path{"a", "b", 2, "c"});
    REQUIRE(Path{"x"}.concat(p) == Path{"x", "a", "b", 2});
}

TEST_CASE("is_proper_prefix", "[path][prefix]") {
    REQUIRE(is_proper_prefix(Path{}, Path{"a"}));
    REQUIRE(is_proper_prefix(Path{"a"}, Path{"a", "b"}));
    REQUIRE_FALSE(is_proper_prefix(Path{"a"}, Path{"a"}));
    REQUIRE_FALSE(is_proper_prefix(Path{"a", "b"}, Path{"a"}));
    REQUIRE_FALSE(is_proper_prefix(Path{"a"}, Path{"b", "a"}));
    REQUIRE_FALSE(is_proper_prefix(Path{}, Path{}));
}

// ============================================================
// Pointer text
// ============================================================

TEST_CASE("parse_path", "[path][pointer]") {
    SECTION("root") {
        REQUIRE(parse_path("").empty());
    }

    SECTION("keys and indices") {
        REQUIRE(parse_path("/users/0/name") == Path{"users", 0, "name"});
    }

    SECTION("empty key") {
        REQUIRE(parse_path("/") == Path{""});
    }

    SECTION("escapes") {
        REQUIRE(parse_path("/a~1b/c~0d") == Path{"a/b", "c~d"});
    }

    SECTION("from-end markers") {
        REQUIRE(parse_path("/list/-") == Path{"list", last()});
        REQUIRE(parse_path("/list/last") == Path{"list", last()});
        REQUIRE(parse_path("/list/last-2") == Path{"list", last(2)});
    }

    SECTION("leading zeros stay keys") {
        REQUIRE(parse_path("/007") == Path{"007"});
        REQUIRE(parse_path("/0") == Path{0});
    }

    SECTION("lookalikes stay keys") {
        REQUIRE(parse_path("/last-") == Path{"last-"});
        REQUIRE(parse_path("/last-x") == Path{"last-x"});
        REQUIRE(parse_path("/12a") == Path{"12a"});
    }

    SECTION("literal operator") {
        REQUIRE("/a/1"_path == Path{"a", 1});
    }
}

TEST_CASE("parse_path rejects malformed text", "[path][pointer][error]") {
    REQUIRE(thrown_code([] { (void)parse_path("users/0"); }) == ErrorCode::InvalidPath);
    REQUIRE(thrown_code([] { (void)parse_path("/a~2"); }) == ErrorCode::InvalidPath);
    REQUIRE(thrown_code([] { (void)parse_path("/a~"); }) == ErrorCode::InvalidPath);
}

TEST_CASE("path_to_pointer and path_to_string", "[path][pointer]") {
    Path p{"users", 0, "a/b~c", last(1)};

    REQUIRE(path_to_pointer(p) == "/users/0/a~1b~0c/last-1");
    REQUIRE(parse_path(path_to_pointer(p)) == p);
    REQUIRE(path_to_pointer(Path{}) == "");

    REQUIRE(path_to_string(Path{"users", 0, "name"}) == ".users[0].name");
    REQUIRE(path_to_string(Path{"log", last()}) == ".log[last]");
    REQUIRE(path_to_string(Path{}) == "(root)");
}

TEST_CASE("PathHash distinguishes step kinds", "[path][hash]") {
    PathHash hash;
    REQUIRE(hash(Path{"a", 0}) == hash(Path{"a", 0}));
    REQUIRE(Path{"0"} != Path{0});
    REQUIRE(Path{0} != Path{last()});
}
