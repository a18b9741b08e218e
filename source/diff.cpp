// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/diff.h>

#include <algorithm>

namespace treepath {

void DiffCollector::diff(const Value& old_val, const Value& new_val)
{
    operations_.clear();

    // Fast path: same object, no changes
    if (&old_val == &new_val) {
        return;
    }

    Path root_path;
    diff_value(old_val, new_val, root_path);
}

void DiffCollector::diff_value(const Value& old_val, const Value& new_val, Path& current_path)
{
    const auto* old_map = old_val.get_map_data();
    const auto* new_map = new_val.get_map_data();
    if (old_map && new_map) {
        diff_map(*old_map, *new_map, current_path);
        return;
    }

    const auto* old_vec = old_val.get_vector_data();
    const auto* new_vec = new_val.get_vector_data();
    if (old_vec && new_vec) {
        diff_vector(*old_vec, *new_vec, current_path);
        return;
    }

    // Different kinds or scalars (int/double compare numerically)
    if (old_val != new_val) {
        operations_.push_back(Operation::replace(current_path, new_val.clone()));
    }
}

void DiffCollector::diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path)
{
    // Push/pop on current_path instead of copying it per key
    for (const auto& [key, old_child] : old_map) {
        current_path.push_back(key);

        auto it = new_map.find(key);
        if (it == new_map.end()) {
            operations_.push_back(Operation::remove(current_path));
        } else {
            diff_value(old_child, it->second, current_path);
        }

        current_path.pop_back();
    }

    for (const auto& [key, new_child] : new_map) {
        if (old_map.find(key) == old_map.end()) {
            current_path.push_back(key);
            operations_.push_back(Operation::add(current_path, new_child.clone()));
            current_path.pop_back();
        }
    }
}

void DiffCollector::diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path)
{
    const std::size_t old_size = old_vec.size();
    const std::size_t new_size = new_vec.size();
    const std::size_t common_size = std::min(old_size, new_size);

    for (std::size_t i = 0; i < common_size; ++i) {
        current_path.push_back(i);
        diff_value(old_vec[i], new_vec[i], current_path);
        current_path.pop_back();
    }

    // Highest index first so earlier removals do not shift later ones
    for (std::size_t i = old_size; i > common_size; --i) {
        current_path.push_back(i - 1);
        operations_.push_back(Operation::remove(current_path));
        current_path.pop_back();
    }

    for (std::size_t i = common_size; i < new_size; ++i) {
        current_path.push_back(i);
        operations_.push_back(Operation::add(current_path, new_vec[i].clone()));
        current_path.pop_back();
    }
}

std::vector<Operation> diff(const Value& old_val, const Value& new_val)
{
    DiffCollector collector;
    collector.diff(old_val, new_val);
    return collector.take_operations();
}

} // namespace treepath
