// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/traverse.h>
#include <treepath/access.h>

namespace treepath {

// ============================================================
// LeafRange::iterator
// ============================================================

LeafRange::iterator::iterator(const Value& start, const Path& base)
    : path_(base)
{
    if (!start.is_container()) {
        leaf_path_ = base;
        leaf_ = &start;
        return;
    }
    stack_.push_back(Frame{&start, 0});
    advance();
}

LeafRange::iterator& LeafRange::iterator::operator++()
{
    advance();
    return *this;
}

void LeafRange::iterator::advance()
{
    leaf_ = nullptr;

    while (!stack_.empty()) {
        Frame& top = stack_.back();

        if (top.next >= top.container->size()) {
            stack_.pop_back();
            // Leaving a nested container drops the step that led into it
            if (!stack_.empty()) {
                path_.pop_back();
            }
            continue;
        }

        const std::size_t position = top.next++;
        const Value* child = nullptr;
        PathElement step;

        if (const auto* map = top.container->get_map_data()) {
            auto it = map->nth(position);
            step = it->first;
            child = &it->second;
        } else {
            child = &(*top.container->get_vector_data())[position];
            step = position;
        }

        if (child->is_container()) {
            path_.push_back(std::move(step));
            stack_.push_back(Frame{child, 0});
            continue;
        }

        leaf_path_ = path_.child(std::move(step));
        leaf_ = child;
        return;
    }
}

// ============================================================
// LeafRange
// ============================================================

std::size_t LeafRange::count() const
{
    std::size_t n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

LeafRange list(const Value& root, const Path& path)
{
    return LeafRange{get(root, path), path};
}

FlatMap flatten(const Value& root, const Path& path)
{
    FlatMap result;
    for (auto [leaf_path, value] : list(root, path)) {
        result.emplace(leaf_path, value.clone());
    }
    return result;
}

} // namespace treepath
