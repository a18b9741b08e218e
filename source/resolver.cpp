// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/resolver.h>

#include <utility>

namespace treepath {

namespace {

template <typename V>
BasicResolution<V> resolve(V& root, const Path& path)
{
    V* current = &root;

    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& elem = path[i];

        if (auto* map = current->get_map_data()) {
            if (is_from_end(elem)) {
                return {nullptr, ErrorCode::TypeMismatch, i};
            }
            // An existing map wins over step-kind inference: index 0 is key "0"
            auto it = is_key(elem) ? map->find(std::get<std::string>(elem)) : map->find(detail::map_key(elem));
            if (it == map->end()) {
                return {nullptr, ErrorCode::KeyNotFound, i};
            }
            current = &it.value();
        } else if (auto* vec = current->get_vector_data()) {
            if (is_key(elem)) {
                return {nullptr, ErrorCode::TypeMismatch, i};
            }
            auto pos = resolve_position(elem, vec->size());
            if (!pos) {
                return {nullptr, ErrorCode::IndexOutOfBounds, i};
            }
            current = &(*vec)[*pos];
        } else {
            return {nullptr, ErrorCode::NotAContainer, i};
        }
    }

    return {current, ErrorCode::PathNotFound, path.size()};
}

/// Fresh container for the slot at path[next - 1], shaped for path[next]
Value make_container_for(const Path& path, std::size_t next)
{
    if (next < path.size() && !is_key(path[next])) {
        return Value::vector();
    }
    return Value::map();
}

} // anonymous namespace

std::optional<std::size_t> resolve_position(const PathElement& elem, std::size_t size) noexcept
{
    if (const auto* index = std::get_if<std::size_t>(&elem)) {
        if (*index < size) return *index;
        return std::nullopt;
    }
    if (const auto* from_end = std::get_if<FromEnd>(&elem)) {
        if (from_end->offset < size) return size - 1 - from_end->offset;
        return std::nullopt;
    }
    return std::nullopt;
}

Resolution try_at(Value& root, const Path& path)
{
    return resolve(root, path);
}

ConstResolution try_at(const Value& root, const Path& path)
{
    return resolve(root, path);
}

Value& at(Value& root, const Path& path)
{
    auto result = resolve(root, path);
    if (!result) {
        detail::throw_resolution_error(result.error, path, result.failed_at_index);
    }
    return *result.value;
}

const Value& at(const Value& root, const Path& path)
{
    auto result = resolve(root, path);
    if (!result) {
        detail::throw_resolution_error(result.error, path, result.failed_at_index);
    }
    return *result.value;
}

Value& in(Value& root, const Path& path)
{
    Value* current = &root;

    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& elem = path[i];

        if (auto* map = current->get_map_data()) {
            if (is_from_end(elem)) {
                detail::throw_resolution_error(ErrorCode::TypeMismatch, path, i);
            }
            std::string key = detail::map_key(elem);
            auto it = map->find(key);
            if (it == map->end()) {
                it = map->emplace(std::move(key), make_container_for(path, i + 1)).first;
            }
            current = &it.value();
        } else if (auto* vec = current->get_vector_data()) {
            if (is_key(elem)) {
                detail::throw_resolution_error(ErrorCode::TypeMismatch, path, i);
            }
            if (is_from_end(elem)) {
                auto pos = resolve_position(elem, vec->size());
                if (!pos) {
                    detail::throw_resolution_error(ErrorCode::IndexOutOfBounds, path, i);
                }
                current = &(*vec)[*pos];
                continue;
            }

            auto index = std::get<std::size_t>(elem);
            if (index >= vec->size()) {
#if TREEPATH_PAD_ON_VIVIFY
                if (index - vec->size() > static_cast<std::size_t>(TREEPATH_MAX_VIVIFY_PAD)) {
                    detail::throw_resolution_error(ErrorCode::IndexOutOfBounds, path, i);
                }
#else
                if (index > vec->size()) {
                    detail::throw_resolution_error(ErrorCode::IndexOutOfBounds, path, i);
                }
#endif
                // Pad with nulls up to index, then place the new container
                vec->resize(index);
                vec->push_back(make_container_for(path, i + 1));
            }
            current = &(*vec)[index];
        } else {
            detail::throw_resolution_error(ErrorCode::NotAContainer, path, i);
        }
    }

    return *current;
}

// ============================================================
// Error reporting
// ============================================================

namespace detail {

std::string map_key(const PathElement& elem)
{
    if (const auto* key = std::get_if<std::string>(&elem)) {
        return *key;
    }
    return element_to_string(elem);
}

std::string resolution_message(ErrorCode code, const Path& path, std::size_t failed_at_index)
{
    const std::string where = path_to_string(path.prefix(failed_at_index));
    const std::string step = failed_at_index < path.size() ? element_to_string(path[failed_at_index]) : "";

    switch (code) {
    case ErrorCode::KeyNotFound:
        return "key '" + step + "' not found in map at " + where;
    case ErrorCode::IndexOutOfBounds:
        return "index " + step + " out of bounds in vector at " + where;
    case ErrorCode::TypeMismatch:
        if (failed_at_index < path.size() && is_key(path[failed_at_index])) {
            return "key step '" + step + "' cannot address the vector at " + where;
        }
        return "from-end step '" + step + "' cannot address the map at " + where;
    case ErrorCode::NotAContainer:
        return "value at " + where + " is not a container (next step '" + step + "')";
    default:
        return std::string{to_string(code)} + " at " + path_to_string(path);
    }
}

bool is_absence(ErrorCode code) noexcept
{
    return code == ErrorCode::KeyNotFound || code == ErrorCode::IndexOutOfBounds ||
           code == ErrorCode::NotAContainer;
}

Value& require(Value& root, const Path& path)
{
    return const_cast<Value&>(require(std::as_const(root), path));
}

const Value& require(const Value& root, const Path& path)
{
    auto result = resolve(root, path);
    if (result) {
        return *result.value;
    }
    if (is_absence(result.error)) {
        throw PathError(ErrorCode::PathNotFound,
                        "path " + path_to_string(path) + " not found: " +
                            resolution_message(result.error, path, result.failed_at_index),
                        path, result.failed_at_index);
    }
    throw_resolution_error(result.error, path, result.failed_at_index);
}

void throw_resolution_error(ErrorCode code, const Path& path, std::size_t failed_at_index)
{
    throw PathError(code, resolution_message(code, path, failed_at_index), path, failed_at_index);
}

} // namespace detail

} // namespace treepath
