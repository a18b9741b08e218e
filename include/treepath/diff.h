// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Structural diff of two Values, expressed as a patch.
///
/// patch(old_val, diff(old_val, new_val)) == new_val for any two values.
///
/// - differing kinds or scalars: replace
/// - maps: keys only in old -> remove, keys only in new -> add,
///   shared keys recurse
/// - vectors: common prefix recurses, surplus old elements are removed from
///   the highest index down, surplus new elements are appended

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/patch.h>
#include <treepath/path.h>
#include <treepath/value.h>

#include <utility>
#include <vector>

namespace treepath {

/// Collects the operations turning one Value into another
class TREEPATH_API DiffCollector {
public:
    /// Replace the collected operations with the diff of old_val -> new_val
    void diff(const Value& old_val, const Value& new_val);

    [[nodiscard]] const std::vector<Operation>& get_operations() const noexcept { return operations_; }

    /// Hand the collected operations over, leaving the collector empty
    [[nodiscard]] std::vector<Operation> take_operations() noexcept { return std::exchange(operations_, {}); }

    [[nodiscard]] bool has_changes() const noexcept { return !operations_.empty(); }

    void clear() noexcept { operations_.clear(); }

private:
    void diff_value(const Value& old_val, const Value& new_val, Path& current_path);
    void diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path);
    void diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path);

    std::vector<Operation> operations_;
};

/// Patch turning old_val into new_val (empty if they are equal)
[[nodiscard]] TREEPATH_API std::vector<Operation> diff(const Value& old_val, const Value& new_val);

} // namespace treepath
