// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Multi-operation patch transactions (JSON Patch, RFC 6902 shaped).
///
/// A patch is an ordered list of Operations applied to one working container.
/// The first failing operation aborts the patch with PatchError:
/// - copy form:     the caller's value is never touched
/// - in-place form: operations before the failing one stay applied
///
/// ## Usage Example
/// ```cpp
/// std::vector<Operation> ops{
///     Operation::test({"version"}, 3),
///     Operation::replace({"version"}, 4),
///     Operation::move({"draft"}, {"published"}),
/// };
/// Value next = patch(doc, ops);
///
/// // Same thing from a patch document
/// Value document = Value::vector({
///     Value::map({{"op", "replace"}, {"path", "/version"}, {"value", 4}}),
/// });
/// Value next2 = patch(doc, document);
/// ```

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/access.h>
#include <treepath/error.h>
#include <treepath/path.h>
#include <treepath/value.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace treepath {

/// Kind of a patch operation
enum class OpKind : std::uint8_t {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test,
};

/// Lower-case operation name as used in patch documents ("add", "move", ...)
[[nodiscard]] TREEPATH_API std::string_view to_string(OpKind kind) noexcept;

/// Inverse of to_string(OpKind)
[[nodiscard]] TREEPATH_API std::optional<OpKind> parse_op_kind(std::string_view name) noexcept;

/// @brief One step of a patch
///
/// value is used by add/replace/test, from by move/copy.
/// Copying an Operation deep-copies its value.
struct TREEPATH_API Operation {
    OpKind op = OpKind::Test;
    Path path;
    Path from;
    Value value;

    Operation() = default;
    Operation(OpKind op_, Path path_, Path from_, Value value_);

    Operation(const Operation& other);
    Operation& operator=(const Operation& other);
    Operation(Operation&&) noexcept = default;
    Operation& operator=(Operation&&) noexcept = default;
    ~Operation() = default;

    [[nodiscard]] static Operation add(Path path, Value value);
    [[nodiscard]] static Operation remove(Path path);
    [[nodiscard]] static Operation replace(Path path, Value value);
    [[nodiscard]] static Operation move(Path from, Path path);
    [[nodiscard]] static Operation copy(Path from, Path path);
    [[nodiscard]] static Operation test(Path path, Value value);

    [[nodiscard]] bool operator==(const Operation& other) const;
    [[nodiscard]] bool operator!=(const Operation& other) const { return !(*this == other); }
};

/// @brief A patch operation failed
///
/// code() is PatchOperationFailed; cause() is the code of the underlying
/// failure (PathNotFound, TestFailed, ...). path() is the failing
/// operation's target path.
class TREEPATH_API PatchError : public PathError {
public:
    PatchError(std::size_t operation_index, OpKind operation_kind, ErrorCode cause,
               const std::string& cause_message, Path path, std::size_t failed_at_index = 0);

    [[nodiscard]] std::size_t operation_index() const noexcept { return operation_index_; }
    [[nodiscard]] OpKind operation_kind() const noexcept { return operation_kind_; }
    [[nodiscard]] ErrorCode cause() const noexcept { return cause_; }

private:
    std::size_t operation_index_;
    OpKind operation_kind_;
    ErrorCode cause_;
};

// ============================================================
// Applying patches
// ============================================================

/// Apply operations in order to a deep clone of root
/// @throws PatchError on the first failing operation
[[nodiscard]] TREEPATH_API Value patch(const Value& root, const std::vector<Operation>& operations);

/// Apply operations in order to root itself
/// @throws PatchError on the first failing operation (earlier ones stay applied)
TREEPATH_API Value& patch(Value& root, const std::vector<Operation>& operations, in_place_t);

/// Parse then apply a patch document
/// @throws PathError InvalidPatch, PatchError
[[nodiscard]] TREEPATH_API Value patch(const Value& root, const Value& document);
TREEPATH_API Value& patch(Value& root, const Value& document, in_place_t);

// ============================================================
// Patch document codec
// ============================================================

/// Parse a vector of {op, path, value?, from?} maps.
/// path/from may be pointer strings or vectors of steps (string -> key,
/// non-negative integer -> index, negative integer -> from-end, -1 = last).
/// @throws PathError InvalidPatch naming the offending record
[[nodiscard]] TREEPATH_API std::vector<Operation> parse_patch(const Value& document);

/// Inverse of parse_patch(). Paths are written as pointer strings, or as
/// step vectors when the pointer text would not read back as the same path.
[[nodiscard]] TREEPATH_API Value patch_to_value(const std::vector<Operation>& operations);

} // namespace treepath
