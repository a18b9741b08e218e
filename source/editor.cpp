// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/editor.h>
#include <treepath/error.h>
#include <treepath/resolver.h>

#include <cstddef>
#include <utility>

namespace treepath {

namespace {

/// Existing container that receives the terminal step of path
Value& resolve_parent(Value& root, const Path& path)
{
    const Path parent_path = path.parent();
    auto result = try_at(root, parent_path);
    if (!result) {
        throw PathError(ErrorCode::ParentNotFound,
                        "parent of " + path_to_string(path) + " not found: " +
                            detail::resolution_message(result.error, parent_path, result.failed_at_index),
                        path, result.failed_at_index);
    }
    return *result.value;
}

/// Insertion position in a vector of the given size for the terminal step
std::size_t insert_position(const Path& path, std::size_t size)
{
    const auto& elem = path.back();

    if (const auto* from_end = std::get_if<FromEnd>(&elem)) {
        // last() is the append position, last(n) inserts before size-1-n
        if (from_end->offset == 0) {
            return size;
        }
        if (from_end->offset >= size) {
            detail::throw_resolution_error(ErrorCode::IndexOutOfBounds, path, path.size() - 1);
        }
        return size - 1 - from_end->offset;
    }

    auto index = std::get<std::size_t>(elem);
    if (index > size) {
        detail::throw_resolution_error(ErrorCode::IndexOutOfBounds, path, path.size() - 1);
    }
    return index;
}

/// A value taken out of its container, with what is needed to put it back
struct Detached {
    Value value;
    std::size_t position = 0;
};

Detached detach(Value& root, const Path& path)
{
    Value& parent = at(root, path.parent());
    const auto& elem = path.back();

    if (auto* map = parent.get_map_data()) {
        auto it = map->find(detail::map_key(elem));
        Detached detached{std::move(it.value()), static_cast<std::size_t>(it - map->begin())};
        map->erase(it);
        return detached;
    }

    auto* vec = parent.get_vector_data();
    auto pos = *resolve_position(elem, vec->size());
    Detached detached{std::move((*vec)[pos]), pos};
    vec->erase(vec->begin() + static_cast<std::ptrdiff_t>(pos));
    return detached;
}

/// Inverse of detach(): same key position or same index
void reattach(Value& root, const Path& path, Detached detached)
{
    Value& parent = at(root, path.parent());

    if (auto* map = parent.get_map_data()) {
        map->emplace_at_position(map->nth(detached.position), detail::map_key(path.back()),
                                 std::move(detached.value));
        return;
    }

    auto* vec = parent.get_vector_data();
    vec->insert(vec->begin() + static_cast<std::ptrdiff_t>(detached.position), std::move(detached.value));
}

void check_move_target(const char* op, const Path& from, const Path& path)
{
    if (is_proper_prefix(from, path)) {
        throw PathError(ErrorCode::InvalidMoveTarget,
                        std::string{op} + ": cannot place " + path_to_string(from) + " inside itself at " +
                            path_to_string(path),
                        path, from.size());
    }
}

} // anonymous namespace

// ============================================================
// Edit core
// ============================================================

namespace detail {

void add_into(Value& root, const Path& path, Value&& value)
{
    if (path.empty()) {
        root = std::move(value);
        return;
    }

    Value& parent = resolve_parent(root, path);
    const auto& elem = path.back();
    const std::size_t step = path.size() - 1;

    if (auto* map = parent.get_map_data()) {
        if (is_from_end(elem)) {
            throw_resolution_error(ErrorCode::TypeMismatch, path, step);
        }
        std::string key = map_key(elem);
        auto it = map->find(key);
        if (it != map->end()) {
            it.value() = std::move(value);
        } else {
            map->emplace(std::move(key), std::move(value));
        }
        return;
    }

    if (auto* vec = parent.get_vector_data()) {
        if (is_key(elem)) {
            throw_resolution_error(ErrorCode::TypeMismatch, path, step);
        }
        auto pos = insert_position(path, vec->size());
        vec->insert(vec->begin() + static_cast<std::ptrdiff_t>(pos), std::move(value));
        return;
    }

    throw_resolution_error(ErrorCode::NotAContainer, path, step);
}

Value remove_from(Value& root, const Path& path)
{
    if (path.empty()) {
        Value removed = std::move(root);
        root = Value{};
        return removed;
    }

    (void)require(root, path);
    return detach(root, path).value;
}

void replace_into(Value& root, const Path& path, Value value)
{
    if (path.empty()) {
        root = std::move(value);
        return;
    }
    require(root, path) = std::move(value);
}

void move_into(Value& root, const Path& from, const Path& path)
{
    (void)require(std::as_const(root), from);
    check_move_target("move", from, path);

    if (from == path) {
        return;
    }

    Detached detached = detach(root, from);
    try {
        add_into(root, path, std::move(detached.value));
    } catch (const PathError& e) {
        // add_into leaves value untouched when it throws
        log_path_error("move", e);
        log_access_error("move", "restoring " + path_to_string(from));
        reattach(root, from, std::move(detached));
        throw;
    }
}

void copy_into(Value& root, const Path& from, const Path& path)
{
    Value copied = require(std::as_const(root), from).clone();
    check_move_target("copy", from, path);
    add_into(root, path, std::move(copied));
}

} // namespace detail

// ============================================================
// Public forms
// ============================================================

Value add(const Value& root, const Path& path, Value value)
{
    return detail::edit_copy(root, [&](Value& work) { detail::add_into(work, path, std::move(value)); });
}

Value& add(Value& root, const Path& path, Value value, in_place_t)
{
    detail::add_into(root, path, std::move(value));
    return root;
}

Value remove(const Value& root, const Path& path)
{
    if (path.empty()) {
        return Value{};
    }
    return detail::edit_copy(root, [&](Value& work) { (void)detail::remove_from(work, path); });
}

Value& remove(Value& root, const Path& path, in_place_t)
{
    (void)detail::remove_from(root, path);
    return root;
}

Value replace(const Value& root, const Path& path, Value value)
{
    if (path.empty()) {
        return value;
    }
    return detail::edit_copy(root, [&](Value& work) { detail::replace_into(work, path, std::move(value)); });
}

Value& replace(Value& root, const Path& path, Value value, in_place_t)
{
    detail::replace_into(root, path, std::move(value));
    return root;
}

Value move(const Value& root, const Path& from, const Path& path)
{
    return detail::edit_copy(root, [&](Value& work) { detail::move_into(work, from, path); });
}

Value& move(Value& root, const Path& from, const Path& path, in_place_t)
{
    detail::move_into(root, from, path);
    return root;
}

Value copy(const Value& root, const Path& from, const Path& path)
{
    return detail::edit_copy(root, [&](Value& work) { detail::copy_into(work, from, path); });
}

Value& copy(Value& root, const Path& from, const Path& path, in_place_t)
{
    detail::copy_into(root, from, path);
    return root;
}

} // namespace treepath
