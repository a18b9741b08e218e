// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Error codes, PathError exception and diagnostic logging helpers.
///
/// Every treepath failure is thrown as PathError (or a subclass), which is a
/// std::runtime_error carrying:
/// - code():            the ErrorCode
/// - path():            the path the operation was addressed with
/// - failed_at_index(): step position where resolution stopped
///                      (path().size() for whole-path failures)

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/path.h>

#include <cstdint>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace treepath {

/// Error codes for path and patch operations
enum class ErrorCode : std::uint8_t {
    PathNotFound,          ///< Target slot does not exist
    ParentNotFound,        ///< Container that should receive a new value does not exist
    KeyNotFound,           ///< Map has no such key
    IndexOutOfBounds,      ///< Vector index (or from-end position) outside the vector
    TypeMismatch,          ///< Step kind does not fit the container (key on vector, from-end on map)
    NotAContainer,         ///< A scalar or null sits where more steps must be applied
    RootKeyOperation,      ///< Key or presence query addressed at the root
    InvalidMoveTarget,     ///< Move/copy source is a proper prefix of the target
    PatchOperationFailed,  ///< A patch operation failed, see PatchError
    TestFailed,            ///< A patch test operation found a different value
    InvalidPath,           ///< Malformed pointer text
    InvalidPatch,          ///< Malformed patch document
};

/// Stable name of an error code (e.g. "KeyNotFound")
[[nodiscard]] TREEPATH_API std::string_view to_string(ErrorCode code) noexcept;

/// @brief Exception thrown by resolution, access and edit operations
class TREEPATH_API PathError : public std::runtime_error {
public:
    PathError(ErrorCode code, const std::string& message, Path path = {}, std::size_t failed_at_index = 0);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const Path& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t failed_at_index() const noexcept { return failed_at_index_; }

    /// Steps resolved before the failing one
    [[nodiscard]] Path resolved_path() const { return path_.prefix(failed_at_index_); }

private:
    ErrorCode code_;
    Path path_;
    std::size_t failed_at_index_;
};

// ============================================================
// Diagnostic logging
//
// Compiled in when TREEPATH_VERBOSE_LOG is 1 (see config.h).
// Format: [function] message (called from file:line)
// ============================================================

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_path_error(
    std::string_view func,
    const PathError& error,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << to_string(error.code()) << ": " << error.what()
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)error;
    (void)loc;
#endif
}

inline void log_patch_error(
    std::string_view func,
    std::size_t op_index,
    std::string_view op_name,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATH_VERBOSE_LOG
    std::cerr << "[" << func << "] operation " << op_index << " (" << op_name << ") " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)op_index;
    (void)op_name;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace treepath
