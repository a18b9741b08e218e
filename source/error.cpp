// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/error.h>

#include <utility>

namespace treepath {

std::string_view to_string(ErrorCode code) noexcept
{
    switch (code) {
    case ErrorCode::PathNotFound:         return "PathNotFound";
    case ErrorCode::ParentNotFound:       return "ParentNotFound";
    case ErrorCode::KeyNotFound:          return "KeyNotFound";
    case ErrorCode::IndexOutOfBounds:     return "IndexOutOfBounds";
    case ErrorCode::TypeMismatch:         return "TypeMismatch";
    case ErrorCode::NotAContainer:        return "NotAContainer";
    case ErrorCode::RootKeyOperation:     return "RootKeyOperation";
    case ErrorCode::InvalidMoveTarget:    return "InvalidMoveTarget";
    case ErrorCode::PatchOperationFailed: return "PatchOperationFailed";
    case ErrorCode::TestFailed:           return "TestFailed";
    case ErrorCode::InvalidPath:          return "InvalidPath";
    case ErrorCode::InvalidPatch:         return "InvalidPatch";
    }
    return "Unknown";
}

PathError::PathError(ErrorCode code, const std::string& message, Path path, std::size_t failed_at_index)
    : std::runtime_error(message)
    , code_(code)
    , path_(std::move(path))
    , failed_at_index_(failed_at_index)
{}

} // namespace treepath
