// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traverse.h
/// @brief Leaf enumeration: lazy list() and materialized flatten().
///
/// Leaves are every non-container value below a path, visited depth-first:
/// map keys in insertion order, vector elements in index order. Empty
/// containers contribute nothing; a scalar at the start path is itself the
/// single leaf.
///
/// ## Usage Example
/// ```cpp
/// for (auto [path, value] : list(doc, {"legumes"})) {
///     std::cout << path_to_pointer(path) << " = " << value << "\n";
/// }
///
/// FlatMap flat = flatten(doc);
/// flat.at(Path{"legumes", 0, "name"});  // "pinto beans"
/// ```
///
/// A LeafRange refers into the value it was created from. Mutating that
/// value while iterating invalidates the range and its iterators.

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/path.h>
#include <treepath/value.h>

#include <cstddef>
#include <iterator>
#include <tsl/ordered_map.h>
#include <utility>
#include <vector>

namespace treepath {

/// Insertion-ordered map from leaf path to (deep-copied) leaf value
using FlatMap = tsl::ordered_map<Path, Value, PathHash>;

/// @brief Lazy, restartable range over the leaves below a path
class TREEPATH_API LeafRange {
public:
    /// Input iterator yielding (path, value) pairs
    class TREEPATH_API iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = std::pair<Path, const Value&>;
        using reference = std::pair<const Path&, const Value&>;

        /// End iterator
        iterator() = default;

        [[nodiscard]] reference operator*() const { return {leaf_path_, *leaf_}; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        [[nodiscard]] bool operator==(const iterator& other) const noexcept { return leaf_ == other.leaf_; }
        [[nodiscard]] bool operator!=(const iterator& other) const noexcept { return leaf_ != other.leaf_; }

    private:
        friend class LeafRange;

        /// A container being walked and the next child position in it
        struct Frame {
            const Value* container = nullptr;
            std::size_t next = 0;
        };

        iterator(const Value& start, const Path& base);

        void advance();

        std::vector<Frame> stack_;
        Path path_;                    // path of the container on top of the stack
        Path leaf_path_;
        const Value* leaf_ = nullptr;  // nullptr at end
    };

    LeafRange(const Value& start, Path base) : start_(&start), base_(std::move(base)) {}

    [[nodiscard]] iterator begin() const { return iterator{*start_, base_}; }
    [[nodiscard]] iterator end() const { return iterator{}; }

    /// Walks the whole range
    [[nodiscard]] std::size_t count() const;

private:
    const Value* start_;
    Path base_;
};

/// Leaves below path, paths reported from the root of root
/// @throws PathError PathNotFound, TypeMismatch (path does not resolve)
[[nodiscard]] TREEPATH_API LeafRange list(const Value& root, const Path& path = {});

/// The range refers into root, so a temporary would dangle
LeafRange list(const Value&& root, const Path& path = {}) = delete;

/// list() materialized with deep-copied values
/// @throws PathError PathNotFound, TypeMismatch
[[nodiscard]] TREEPATH_API FlatMap flatten(const Value& root, const Path& path = {});

} // namespace treepath
