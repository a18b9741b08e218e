// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Fluent builders for constructing Value containers.
///
/// Usage:
/// @code
///   #include <treepath/builders.h>
///
///   Value config = MapBuilder()
///       .set("width", 1920)
///       .set("height", 1080)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = VectorBuilder()
///       .push_back("item1")
///       .push_back(MapBuilder().set("id", 2))
///       .finish();
/// @endcode
///
/// Nested builders may be passed directly, they are finished (emptied) on insertion.

#pragma once

#include <treepath/value.h>

namespace treepath {

class VectorBuilder;

/// Builder for constructing a ValueMap, keys kept in insertion order
class TREEPATH_API MapBuilder {
public:
    MapBuilder() = default;

    /// Start from a deep copy of an existing map value (empty if not a map)
    explicit MapBuilder(const Value& existing);

    MapBuilder& set(std::string_view key, Value val);
    MapBuilder& set(std::string_view key, MapBuilder& nested);
    MapBuilder& set(std::string_view key, MapBuilder&& nested) { return set(key, nested); }
    MapBuilder& set(std::string_view key, VectorBuilder& nested);
    MapBuilder& set(std::string_view key, VectorBuilder&& nested) { return set(key, nested); }

    /// Set value at a nested path of keys, creating intermediate maps
    /// Example: builder.set_in({"window", "size", "width"}, 800)
    MapBuilder& set_in(std::initializer_list<std::string_view> keys, Value val);

    [[nodiscard]] bool contains(std::string_view key) const { return map_.find(key) != map_.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    /// Finish building and return the map Value
    /// Note: After calling finish(), the builder is empty
    [[nodiscard]] Value finish();

private:
    ValueMap map_;
};

/// Builder for constructing a ValueVector
class TREEPATH_API VectorBuilder {
public:
    VectorBuilder() = default;

    /// Start from a deep copy of an existing vector value (empty if not a vector)
    explicit VectorBuilder(const Value& existing);

    VectorBuilder& push_back(Value val);
    VectorBuilder& push_back(MapBuilder& nested);
    VectorBuilder& push_back(MapBuilder&& nested) { return push_back(nested); }
    VectorBuilder& push_back(VectorBuilder& nested);
    VectorBuilder& push_back(VectorBuilder&& nested) { return push_back(nested); }

    /// Overwrite an element, padding with nulls up to index
    VectorBuilder& set(std::size_t index, Value val);

    [[nodiscard]] std::size_t size() const noexcept { return vec_.size(); }

    /// Finish building and return the vector Value
    /// Note: After calling finish(), the builder is empty
    [[nodiscard]] Value finish();

private:
    ValueVector vec_;
};

} // namespace treepath
