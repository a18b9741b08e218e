// test_diff.cpp - Tests for diff and DiffCollector

#include <catch2/catch_all.hpp>
#include <treepath/diff.h>
#include <treepath/patch.h>

#include <string>

using namespace treepath;

// ============================================================
// Helper Functions
// ============================================================

Value create_state_v1() {
    return Value::map({
        {"name", "Alice"},
        {"age", 30},
        {"items", Value::vector({1, 2, 3})},
    });
}

Value create_state_v2() {
    return Value::map({
        {"name", "Bob"},                    // Changed
        {"age", 30},                        // Same
        {"items", Value::vector({1, 2, 4})}, // Changed
        {"email", "bob@test.com"},          // Added
    });
}

// ============================================================
// DiffCollector
// ============================================================

TEST_CASE("DiffCollector basic diff", "[diff][collector]") {
    DiffCollector collector;
    collector.diff(create_state_v1(), create_state_v2());

    REQUIRE(collector.has_changes());
    const auto& ops = collector.get_operations();
    REQUIRE(ops.size() == 3);
    REQUIRE(ops[0] == Operation::replace({"name"}, "Bob"));
    REQUIRE(ops[1] == Operation::replace({"items", 2}, 4));
    REQUIRE(ops[2] == Operation::add({"email"}, "bob@test.com"));
}

TEST_CASE("DiffCollector no changes", "[diff][collector]") {
    DiffCollector collector;
    auto state = create_state_v1();
    collector.diff(state, state);
    REQUIRE_FALSE(collector.has_changes());

    collector.diff(state, create_state_v1());
    REQUIRE_FALSE(collector.has_changes());
}

TEST_CASE("DiffCollector clear and take", "[diff][collector]") {
    DiffCollector collector;
    collector.diff(create_state_v1(), create_state_v2());
    REQUIRE(collector.has_changes());

    auto taken = collector.take_operations();
    REQUIRE(taken.size() == 3);
    REQUIRE_FALSE(collector.has_changes());
    REQUIRE(collector.get_operations().empty());

    collector.diff(create_state_v1(), create_state_v2());
    collector.clear();
    REQUIRE_FALSE(collector.has_changes());
}

TEST_CASE("DiffCollector detects removals", "[diff][collector][remove]") {
    auto old_state = create_state_v1();
    auto new_state = Value::map({{"name", "Alice"}, {"items", Value::vector({1, 2, 3})}});

    auto ops = diff(old_state, new_state);
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0] == Operation::remove({"age"}));
}

// ============================================================
// Vectors and nesting
// ============================================================

TEST_CASE("Diff vector changes", "[diff][vector]") {
    SECTION("shrink removes from the end first") {
        auto ops = diff(Value::vector({1, 2, 3, 4}), Value::vector({1, 2}));
        REQUIRE(ops.size() == 2);
        REQUIRE(ops[0] == Operation::remove({3}));
        REQUIRE(ops[1] == Operation::remove({2}));
    }

    SECTION("grow appends") {
        auto ops = diff(Value::vector({1}), Value::vector({1, "x"}));
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0] == Operation::add({1}, "x"));
    }

    SECTION("numerically equal elements are unchanged") {
        REQUIRE(diff(Value::vector({1}), Value::vector({1.0})).empty());
    }
}

TEST_CASE("Diff kind change replaces the whole slot", "[diff][edge]") {
    auto ops = diff(Value::map({{"v", Value::map({{"k", 1}})}}), Value::map({{"v", Value::vector({1})}}));
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0] == Operation::replace({"v"}, Value::vector({1})));

    auto root_ops = diff(Value{1}, Value{"one"});
    REQUIRE(root_ops.size() == 1);
    REQUIRE(root_ops[0].path.empty());
}

TEST_CASE("Applying a diff reproduces the new value", "[diff][apply]") {
    std::vector<std::pair<Value, Value>> cases;
    cases.emplace_back(create_state_v1(), create_state_v2());
    cases.emplace_back(create_state_v2(), create_state_v1());
    cases.emplace_back(Value::map({{"deep", Value::vector({Value::map({{"a", 1}}), 2, 3})}}),
                       Value::map({{"deep", Value::vector({Value::map({{"a", 2}, {"b", Value{}}})})}}));
    cases.emplace_back(Value::vector(), Value::vector({Value::vector({1}), Value::map()}));
    cases.emplace_back(Value{}, Value::map({{"x", 1}}));

    for (const auto& [old_val, new_val] : cases) {
        REQUIRE(patch(old_val, diff(old_val, new_val)) == new_val);
    }
}
