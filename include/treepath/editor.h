// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file editor.h
/// @brief Structural edits: add, remove, replace, move, copy, transform.
///
/// Every edit has two forms sharing one implementation (detail::*_into):
/// - op(const Value& root, ...) -> Value
///     edits a deep clone, root is left untouched
/// - op(Value& root, ..., in_place) -> Value&
///     edits root itself and returns it
///
/// ## Usage Example
/// ```cpp
/// Value doc = Value::map({{"list", Value::vector({1, 2, 3})}});
///
/// Value a = add(doc, {"list", 0}, 0);           // [0, 1, 2, 3]
/// Value b = remove(doc, {"list", last()});      // [1, 2]
/// move(doc, {"list", 0}, {"first"}, in_place);  // {"list":[2,3],"first":1}
/// ```

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/access.h>
#include <treepath/path.h>
#include <treepath/value.h>

#include <concepts>
#include <functional>
#include <utility>

namespace treepath {

namespace detail {

/// Insert value into the existing parent of path.
/// Vector parent: insert before the index (index == size appends,
/// last() appends, last(n) inserts before size-1-n). Map parent: insert or
/// overwrite the key. Empty path replaces root.
/// value is only moved from once the insertion is certain to succeed.
TREEPATH_API void add_into(Value& root, const Path& path, Value&& value);

/// Detach and return the value at path (root -> root becomes null)
TREEPATH_API Value remove_from(Value& root, const Path& path);

/// Overwrite the existing value at path
TREEPATH_API void replace_into(Value& root, const Path& path, Value value);

/// Relocate the value at from to path, restoring it on failure
TREEPATH_API void move_into(Value& root, const Path& from, const Path& path);

/// Add a deep copy of the value at from at path
TREEPATH_API void copy_into(Value& root, const Path& from, const Path& path);

/// Run edit against a deep clone of root and return the clone
template <typename Edit>
[[nodiscard]] Value edit_copy(const Value& root, Edit&& edit)
{
    Value work = root.clone();
    std::forward<Edit>(edit)(work);
    return work;
}

} // namespace detail

// ============================================================
// add
// ============================================================

/// @throws PathError ParentNotFound, IndexOutOfBounds, TypeMismatch, NotAContainer
[[nodiscard]] TREEPATH_API Value add(const Value& root, const Path& path, Value value);
TREEPATH_API Value& add(Value& root, const Path& path, Value value, in_place_t);

// ============================================================
// remove
// ============================================================

/// @throws PathError PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API Value remove(const Value& root, const Path& path);
TREEPATH_API Value& remove(Value& root, const Path& path, in_place_t);

// ============================================================
// replace
// ============================================================

/// @throws PathError PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API Value replace(const Value& root, const Path& path, Value value);
TREEPATH_API Value& replace(Value& root, const Path& path, Value value, in_place_t);

// ============================================================
// move / copy
// ============================================================

/// The value at from is removed first, then added at path. A failed add puts
/// it back where it was, leaving root unchanged.
/// @throws PathError PathNotFound (from), InvalidMoveTarget (from is a proper
///         prefix of path), and any error of add()
[[nodiscard]] TREEPATH_API Value move(const Value& root, const Path& from, const Path& path);
TREEPATH_API Value& move(Value& root, const Path& from, const Path& path, in_place_t);

/// @throws PathError PathNotFound (from), InvalidMoveTarget, and any error of add()
[[nodiscard]] TREEPATH_API Value copy(const Value& root, const Path& from, const Path& path);
TREEPATH_API Value& copy(Value& root, const Path& from, const Path& path, in_place_t);

// ============================================================
// transform
// ============================================================

/// Replace the value at path with fn(current value)
template <typename Fn>
    requires std::invocable<Fn, const Value&> &&
             std::convertible_to<std::invoke_result_t<Fn, const Value&>, Value>
Value& transform(Value& root, const Path& path, Fn&& fn, in_place_t)
{
    Value next = std::invoke(std::forward<Fn>(fn), get(std::as_const(root), path));
    detail::replace_into(root, path, std::move(next));
    return root;
}

template <typename Fn>
    requires std::invocable<Fn, const Value&> &&
             std::convertible_to<std::invoke_result_t<Fn, const Value&>, Value>
[[nodiscard]] Value transform(const Value& root, const Path& path, Fn&& fn)
{
    return detail::edit_copy(root, [&](Value& work) {
        transform(work, path, std::forward<Fn>(fn), in_place);
    });
}

} // namespace treepath
