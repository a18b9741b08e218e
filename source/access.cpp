// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/access.h>
#include <treepath/resolver.h>

namespace treepath {

namespace {

[[noreturn]] void throw_root_key_operation(const char* func)
{
    throw PathError(ErrorCode::RootKeyOperation, std::string{func} + ": the root has no key", Path{}, 0);
}

} // anonymous namespace

bool exists(const Value& root, const Path& path, ExistsOptions options)
{
    if (path.empty()) {
        if (options.check_value) {
            return !root.is_null();
        }
        throw_root_key_operation("exists");
    }

    auto result = try_at(root, path);
    if (!result) {
        if (detail::is_absence(result.error)) {
            detail::log_access_error("exists", detail::resolution_message(result.error, path, result.failed_at_index));
            return false;
        }
        detail::throw_resolution_error(result.error, path, result.failed_at_index);
    }

    if (options.check_value) {
        return !result.value->is_null();
    }
    return true;
}

const Value& get(const Value& root, const Path& path)
{
    if (path.empty()) {
        return root;
    }
    return detail::require(root, path);
}

PathElement get_key(const Value& root, const Path& path)
{
    return get_pair(root, path).first;
}

std::pair<PathElement, const Value&> get_pair(const Value& root, const Path& path)
{
    if (path.empty()) {
        throw_root_key_operation("get_pair");
    }

    const Value& value = detail::require(root, path);

    // The parent exists since the full path resolved
    const auto& last_elem = path.back();
    if (is_from_end(last_elem)) {
        const Value& parent = at(root, path.parent());
        auto pos = resolve_position(last_elem, parent.size());
        return {PathElement{*pos}, value};
    }
    return {last_elem, value};
}

Value set(const Value& root, const Path& path, Value value)
{
    if (path.empty()) {
        return value;
    }
    Value result = root.clone();
    in(result, path) = std::move(value);
    return result;
}

Value& set(Value& root, const Path& path, Value value, in_place_t)
{
    in(root, path) = std::move(value);
    return root;
}

} // namespace treepath
