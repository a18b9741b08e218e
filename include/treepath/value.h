// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Mutable JSON-like container graph navigated and edited by treepath.
///
/// Value holds one of:
/// - null (std::monostate), bool, int64_t, double, std::string
/// - ValueMap: insertion-ordered string-keyed map (tsl::ordered_map)
/// - ValueVector: 0-indexed sequence (std::vector)
///
/// Only ValueMap and ValueVector are containers; every other alternative is a
/// scalar leaf.
///
/// ## Ownership
/// - Children are stored directly inside their container, containers are
///   boxed (unique_ptr) at variant level to break the recursive type.
/// - A Value exclusively owns its subtree, so a graph built from Values is
///   always a finite tree.
/// - Value is move-only. Deep copies are explicit through clone().
///
/// ## Usage Example
/// ```cpp
/// Value doc = Value::map({
///     {"name", "pinto beans"},
///     {"tags", Value::vector({"dry", "bulk"})},
/// });
/// doc.set("instock", 4);
/// std::cout << doc << "\n";  // {"name":"pinto beans","tags":["dry","bulk"],"instock":4}
/// ```

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <tsl/ordered_map.h>
#include <utility>
#include <variant>
#include <vector>

namespace treepath {

// ============================================================
// Transparent Hash/Equal for ordered_map heterogeneous lookup
// ============================================================

/// Transparent hash functor for string types
/// Supports: std::string, std::string_view, const char*
struct ValueStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] std::size_t operator()(const char* s) const noexcept { return std::hash<std::string_view>{}(s); }
};

/// Transparent equality comparator for string types
struct ValueStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

struct Value;

/// Raw map type - stores Value directly, keeps insertion order
using ValueMap = tsl::ordered_map<std::string, Value, ValueStringHash, ValueStringEqual>;

/// Raw vector type - stores Value directly
using ValueVector = std::vector<Value>;

/// Boxed map type for use in variant (breaks recursive type dependency)
using ValueMapPtr = std::unique_ptr<ValueMap>;

/// Boxed vector type for use in variant
using ValueVectorPtr = std::unique_ptr<ValueVector>;

/// Discriminant of a Value, in variant order
enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Double,
    String,
    Map,
    Vector,
};

/// Lower-case name of a kind ("null", "map", ...), used in error messages
[[nodiscard]] TREEPATH_API std::string_view to_string(ValueKind kind) noexcept;

/// @brief Mutable dynamic value supporting JSON-like structures
struct TREEPATH_API Value {
    using DataVariant = std::variant<std::monostate, // null
                                     bool,
                                     int64_t,
                                     double,
                                     std::string,
                                     ValueMapPtr,
                                     ValueVectorPtr>;

    DataVariant data;

    // ============================================================
    // Constructors
    // ============================================================
    // Not explicit, so scalars convert where a Value is expected:
    //   doc.set("name", "John");
    //   doc.set("age", 30);

    Value() noexcept : data(std::monostate{}) {}

    Value(bool v) noexcept : data(v) {}

    Value(int32_t v) noexcept : data(static_cast<int64_t>(v)) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(uint32_t v) noexcept : data(static_cast<int64_t>(v)) {}
    /// Values above INT64_MAX are stored as double
    Value(uint64_t v) noexcept
    {
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            data = static_cast<double>(v);
        } else {
            data = static_cast<int64_t>(v);
        }
    }

    Value(float v) noexcept : data(static_cast<double>(v)) {}
    Value(double v) noexcept : data(v) {}

    Value(std::string v) : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string_view v) : data(std::string(v)) {}

    /// Construct from map data (takes ownership, boxes it)
    Value(ValueMap v) : data(std::make_unique<ValueMap>(std::move(v))) {}

    /// Construct from vector data (takes ownership, boxes it)
    Value(ValueVector v) : data(std::make_unique<ValueVector>(std::move(v))) {}

    Value(Value&&) noexcept = default;
    Value& operator=(Value&&) noexcept = default;

    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;

    ~Value() = default;

    // ============================================================
    // Factory Methods
    // ============================================================

    /// Create an empty map
    [[nodiscard]] static Value map() { return Value{ValueMap{}}; }

    /// Create a map from literal entries (each value is deep-copied)
    [[nodiscard]] static Value map(std::initializer_list<std::pair<std::string, Value>> init);

    /// Create an empty vector
    [[nodiscard]] static Value vector() { return Value{ValueVector{}}; }

    /// Create a vector from literal elements (each element is deep-copied)
    [[nodiscard]] static Value vector(std::initializer_list<Value> init);

    // ============================================================
    // Type Checking
    // ============================================================

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<int64_t>(); }
    [[nodiscard]] bool is_double() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMapPtr>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVectorPtr>(); }

    /// Maps and vectors are the only recursible kinds
    [[nodiscard]] bool is_container() const noexcept { return is_map() || is_vector(); }

    // ============================================================
    // Value Access
    // ============================================================

    /// Get value as specific type (throws std::bad_variant_access if wrong type)
    template <typename T>
    [[nodiscard]] T& as() {
        return std::get<T>(data);
    }

    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(data);
    }

    /// Get value as specific type (returns nullptr if wrong type)
    template <typename T>
    [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const noexcept {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    /// Any numeric kind as double
    [[nodiscard]] double as_number(double default_val = 0.0) const noexcept {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    /// Zero-copy string access, empty if not a string
    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    /// Raw map pointer, nullptr if not a map
    [[nodiscard]] ValueMap* get_map_data() noexcept {
        if (auto* p = get_if<ValueMapPtr>()) return p->get();
        return nullptr;
    }
    [[nodiscard]] const ValueMap* get_map_data() const noexcept {
        if (auto* p = get_if<ValueMapPtr>()) return p->get();
        return nullptr;
    }

    /// Raw vector pointer, nullptr if not a vector
    [[nodiscard]] ValueVector* get_vector_data() noexcept {
        if (auto* p = get_if<ValueVectorPtr>()) return p->get();
        return nullptr;
    }
    [[nodiscard]] const ValueVector* get_vector_data() const noexcept {
        if (auto* p = get_if<ValueVectorPtr>()) return p->get();
        return nullptr;
    }

    // ============================================================
    // Map Operations
    // ============================================================

    /// Get map child by key (nullptr if not found or not a map)
    [[nodiscard]] Value* get(std::string_view key);
    [[nodiscard]] const Value* get(std::string_view key) const;

    /// Set map child by key (turns this value into a map if needed).
    /// An existing key keeps its position; a new key is appended.
    /// Returns *this for chaining: v.set("a", 1).set("b", 2);
    Value& set(std::string_view key, Value value);
    Value& set(const char* key, Value value) { return set(std::string_view{key}, std::move(value)); }
    Value& set(const std::string& key, Value value) { return set(std::string_view{key}, std::move(value)); }

    [[nodiscard]] bool contains(std::string_view key) const;

    /// Erase map key, keeping the order of the remaining keys
    /// (returns true if key existed)
    bool erase(std::string_view key);

    // ============================================================
    // Vector Operations
    // ============================================================

    /// Get vector element by index (nullptr if out of bounds or not a vector)
    [[nodiscard]] Value* get(std::size_t index);
    [[nodiscard]] const Value* get(std::size_t index) const;

    /// Push value to end of vector (turns this value into a vector if needed)
    Value& push_back(Value value);

    /// Element count of a map or vector (0 for scalars)
    [[nodiscard]] std::size_t size() const noexcept;

    // ============================================================
    // Comparison
    // ============================================================

    /// Deep structural equality.
    /// Maps compare by key set regardless of insertion order; int and double
    /// compare numerically (1 == 1.0).
    [[nodiscard]] bool operator==(const Value& other) const;
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    // ============================================================
    // Utility
    // ============================================================

    /// Create a deep copy
    [[nodiscard]] Value clone() const;

    /// Compact JSON-like rendering, e.g. {"a":[1,2.5,"x",null]}
    [[nodiscard]] std::string to_string() const;
};

TREEPATH_API std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace treepath
