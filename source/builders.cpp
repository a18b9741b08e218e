// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/builders.h>

#include <iterator>

namespace treepath {

// ============================================================
// MapBuilder
// ============================================================

MapBuilder::MapBuilder(const Value& existing)
{
    if (const auto* map = existing.get_map_data()) {
        for (const auto& [k, v] : *map) {
            map_.emplace(k, v.clone());
        }
    }
}

MapBuilder& MapBuilder::set(std::string_view key, Value val)
{
    auto it = map_.find(key);
    if (it != map_.end()) {
        it.value() = std::move(val);
    } else {
        map_.emplace(std::string{key}, std::move(val));
    }
    return *this;
}

MapBuilder& MapBuilder::set(std::string_view key, MapBuilder& nested)
{
    return set(key, nested.finish());
}

MapBuilder& MapBuilder::set(std::string_view key, VectorBuilder& nested)
{
    return set(key, nested.finish());
}

MapBuilder& MapBuilder::set_in(std::initializer_list<std::string_view> keys, Value val)
{
    if (keys.size() == 0) {
        return *this;
    }

    auto first_key = keys.begin();
    if (keys.size() == 1) {
        return set(*first_key, std::move(val));
    }

    // Build the nested path from root: descend, creating maps where absent
    // or where a non-map value sits in the way
    auto it = map_.find(*first_key);
    if (it == map_.end() || !it->second.is_map()) {
        set(*first_key, Value::map());
        it = map_.find(*first_key);
    }

    Value* current = &it.value();
    for (auto key = std::next(first_key); key != keys.end(); ++key) {
        if (std::next(key) == keys.end()) {
            current->set(*key, std::move(val));
            break;
        }
        Value* child = current->get(*key);
        if (!child || !child->is_map()) {
            current->set(*key, Value::map());
            child = current->get(*key);
        }
        current = child;
    }
    return *this;
}

Value MapBuilder::finish()
{
    Value result{std::move(map_)};
    map_ = ValueMap{};
    return result;
}

// ============================================================
// VectorBuilder
// ============================================================

VectorBuilder::VectorBuilder(const Value& existing)
{
    if (const auto* vec = existing.get_vector_data()) {
        vec_.reserve(vec->size());
        for (const auto& v : *vec) {
            vec_.push_back(v.clone());
        }
    }
}

VectorBuilder& VectorBuilder::push_back(Value val)
{
    vec_.push_back(std::move(val));
    return *this;
}

VectorBuilder& VectorBuilder::push_back(MapBuilder& nested)
{
    return push_back(nested.finish());
}

VectorBuilder& VectorBuilder::push_back(VectorBuilder& nested)
{
    return push_back(nested.finish());
}

VectorBuilder& VectorBuilder::set(std::size_t index, Value val)
{
    while (vec_.size() <= index) {
        vec_.emplace_back();
    }
    vec_[index] = std::move(val);
    return *this;
}

Value VectorBuilder::finish()
{
    Value result{std::move(vec_)};
    vec_ = ValueVector{};
    return result;
}

} // namespace treepath
