// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file resolver.h
/// @brief Path resolution: strict at() and auto-vivifying in().
///
/// Both walk the path step by step, dispatching on the container kind:
///
/// | Step     | on map                      | on vector                    |
/// |----------|-----------------------------|------------------------------|
/// | Key      | lookup                      | TypeMismatch                 |
/// | Index    | lookup by decimal spelling  | [0, size) or IndexOutOfBounds|
/// | FromEnd  | TypeMismatch                | size-1-n or IndexOutOfBounds |
///
/// A scalar (or null) reached with steps remaining is NotAContainer.
///
/// at() never creates anything. in() creates what is missing, choosing the
/// kind of each new container from the step that follows it (key -> map,
/// index/from-end -> vector, nothing -> map). in() never overwrites a value
/// that is already present.

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/error.h>
#include <treepath/path.h>
#include <treepath/value.h>

#include <optional>
#include <string>

namespace treepath {

/// Outcome of a non-throwing resolution
template <typename V>
struct BasicResolution {
    V* value = nullptr;                           ///< Located slot, nullptr on failure
    ErrorCode error = ErrorCode::PathNotFound;    ///< Failure reason (meaningless on success)
    std::size_t failed_at_index = 0;              ///< Step position of the failure

    [[nodiscard]] bool ok() const noexcept { return value != nullptr; }
    explicit operator bool() const noexcept { return ok(); }
};

using Resolution = BasicResolution<Value>;
using ConstResolution = BasicResolution<const Value>;

/// Resolve existing structure only, reporting failure instead of throwing
[[nodiscard]] TREEPATH_API Resolution try_at(Value& root, const Path& path);
[[nodiscard]] TREEPATH_API ConstResolution try_at(const Value& root, const Path& path);

/// Resolve existing structure only.
/// @throws PathError KeyNotFound, IndexOutOfBounds, TypeMismatch, NotAContainer
[[nodiscard]] TREEPATH_API Value& at(Value& root, const Path& path);
[[nodiscard]] TREEPATH_API const Value& at(const Value& root, const Path& path);

/// Resolve, creating missing maps/vectors along the way.
/// A missing terminal slot is created as an empty map for the caller to
/// overwrite. Vectors are padded with nulls when an index lies beyond the end
/// (TREEPATH_PAD_ON_VIVIFY). From-end steps never create.
/// @throws PathError IndexOutOfBounds, TypeMismatch, NotAContainer
[[nodiscard]] TREEPATH_API Value& in(Value& root, const Path& path);

/// Absolute vector position of an Index or FromEnd step, nullopt if it lies
/// outside [0, size) or the step is a key
[[nodiscard]] TREEPATH_API std::optional<std::size_t> resolve_position(const PathElement& elem,
                                                                       std::size_t size) noexcept;

namespace detail {

/// Map key addressed by a Key or Index step (index uses its decimal spelling)
[[nodiscard]] TREEPATH_API std::string map_key(const PathElement& elem);

/// Human-readable message for a resolution failure at path[failed_at_index]
[[nodiscard]] TREEPATH_API std::string resolution_message(ErrorCode code, const Path& path,
                                                          std::size_t failed_at_index);

/// true for failures meaning "nothing there" (missing key, index out of
/// range, scalar in the way) as opposed to a malformed step (TypeMismatch)
[[nodiscard]] TREEPATH_API bool is_absence(ErrorCode code) noexcept;

/// Resolve an existing slot, absence reported as PathNotFound
/// @throws PathError PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API Value& require(Value& root, const Path& path);
[[nodiscard]] TREEPATH_API const Value& require(const Value& root, const Path& path);

/// Throw the PathError describing a failed resolution
[[noreturn]] TREEPATH_API void throw_resolution_error(ErrorCode code, const Path& path,
                                                      std::size_t failed_at_index);

} // namespace detail

} // namespace treepath
