// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file access.h
/// @brief Read accessors (exists, get, get_key, get_pair) and set().
///
/// ## Usage Example
/// ```cpp
/// Value doc = Value::map({{"a", Value::map({{"b", 1}})}});
///
/// exists(doc, {"a", "b"});          // true
/// exists(doc, {"a", "x"});          // false
/// get(doc, {"a", "b"});             // 1
///
/// Value copy = set(doc, {"a", "c"}, "new");   // doc untouched
/// set(doc, {"a", "c"}, "new", in_place);      // doc mutated
/// ```

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/path.h>
#include <treepath/value.h>

#include <utility>

namespace treepath {

/// Tag selecting the mutate-in-place form of an edit
struct in_place_t {
    explicit in_place_t() = default;
};
inline constexpr in_place_t in_place{};

/// Options for exists()
struct ExistsOptions {
    bool check_key = true;     ///< Key presence query (rejected at the root)
    bool check_value = false;  ///< Treat a present null value as absent
};

/// true if path addresses a present slot.
/// Missing keys, out-of-range indices and scalars in the way yield false;
/// a step that cannot address its container (TypeMismatch) still throws.
/// At the root, check_value answers whether the root is non-null and a plain
/// key query throws RootKeyOperation.
[[nodiscard]] TREEPATH_API bool exists(const Value& root, const Path& path, ExistsOptions options = {});

/// Value at path (root -> the root itself)
/// @throws PathError PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API const Value& get(const Value& root, const Path& path);

/// Terminal step of path with a from-end step resolved to its absolute index
/// @throws PathError RootKeyOperation, PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API PathElement get_key(const Value& root, const Path& path);

/// (terminal step, value) pair
/// @throws PathError RootKeyOperation, PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API std::pair<PathElement, const Value&> get_pair(const Value& root, const Path& path);

/// Copy of root with the slot at path overwritten, creating missing
/// structure as in(). An empty path yields value itself.
[[nodiscard]] TREEPATH_API Value set(const Value& root, const Path& path, Value value);

/// In-place form of set(), returns root
TREEPATH_API Value& set(Value& root, const Path& path, Value value, in_place_t);

} // namespace treepath
