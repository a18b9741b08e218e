// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/value.h>

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace treepath {

std::string_view to_string(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:   return "null";
    case ValueKind::Bool:   return "bool";
    case ValueKind::Int:    return "int";
    case ValueKind::Double: return "double";
    case ValueKind::String: return "string";
    case ValueKind::Map:    return "map";
    case ValueKind::Vector: return "vector";
    }
    return "unknown";
}

// ============================================================
// Factory Methods
// ============================================================

Value Value::map(std::initializer_list<std::pair<std::string, Value>> init)
{
    ValueMap result;
    result.reserve(init.size());
    for (const auto& [key, value] : init) {
        // Duplicate literal keys: last one wins, first position kept
        result.insert_or_assign(key, value.clone());
    }
    return Value{std::move(result)};
}

Value Value::vector(std::initializer_list<Value> init)
{
    ValueVector result;
    result.reserve(init.size());
    for (const auto& value : init) {
        result.push_back(value.clone());
    }
    return Value{std::move(result)};
}

// ============================================================
// Map Operations
// ============================================================

Value* Value::get(std::string_view key)
{
    auto* map = get_map_data();
    if (!map) return nullptr;

    // Heterogeneous lookup via transparent hash - no allocation
    auto it = map->find(key);
    if (it == map->end()) return nullptr;

    return &it.value();
}

const Value* Value::get(std::string_view key) const
{
    const auto* map = get_map_data();
    if (!map) return nullptr;

    auto it = map->find(key);
    if (it == map->end()) return nullptr;

    return &it->second;
}

Value& Value::set(std::string_view key, Value value)
{
    // Ensure we're a map
    if (!is_map()) {
        data = std::make_unique<ValueMap>();
    }

    auto& map = *as<ValueMapPtr>();
    auto it = map.find(key);
    if (it != map.end()) {
        // Key exists: overwrite in place, position unchanged
        it.value() = std::move(value);
    } else {
        map.emplace(std::string{key}, std::move(value));
    }
    return *this;
}

bool Value::contains(std::string_view key) const
{
    const auto* map = get_map_data();
    if (!map) return false;

    return map->find(key) != map->end();
}

bool Value::erase(std::string_view key)
{
    auto* map = get_map_data();
    if (!map) return false;

    auto it = map->find(key);
    if (it == map->end()) return false;

    // ordered_map::erase shifts the tail, keeping insertion order
    map->erase(it);
    return true;
}

// ============================================================
// Vector Operations
// ============================================================

Value* Value::get(std::size_t index)
{
    auto* vec = get_vector_data();
    if (!vec || index >= vec->size()) return nullptr;

    return &(*vec)[index];
}

const Value* Value::get(std::size_t index) const
{
    const auto* vec = get_vector_data();
    if (!vec || index >= vec->size()) return nullptr;

    return &(*vec)[index];
}

Value& Value::push_back(Value value)
{
    // Ensure we're a vector
    if (!is_vector()) {
        data = std::make_unique<ValueVector>();
    }

    as<ValueVectorPtr>()->push_back(std::move(value));
    return *this;
}

std::size_t Value::size() const noexcept
{
    if (const auto* vec = get_vector_data()) {
        return vec->size();
    }
    if (const auto* map = get_map_data()) {
        return map->size();
    }
    return 0;
}

// ============================================================
// Comparison
// ============================================================

bool Value::operator==(const Value& other) const
{
    // JSON numbers: int and double compare by numeric value
    if (is_number() && other.is_number()) {
        if (is_int() && other.is_int()) {
            return as<int64_t>() == other.as<int64_t>();
        }
        return as_number() == other.as_number();
    }

    if (data.index() != other.data.index()) return false;

    return std::visit([&other](const auto& val) -> bool {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, ValueMapPtr>) {
            const auto& other_map = *std::get<ValueMapPtr>(other.data);
            if (val->size() != other_map.size()) return false;

            // Key order is not part of structural equality
            for (const auto& [k, v] : *val) {
                auto it = other_map.find(k);
                if (it == other_map.end()) return false;
                if (v != it->second) return false;
            }
            return true;
        }
        else if constexpr (std::is_same_v<T, ValueVectorPtr>) {
            const auto& other_vec = *std::get<ValueVectorPtr>(other.data);
            if (val->size() != other_vec.size()) return false;

            for (std::size_t i = 0; i < val->size(); ++i) {
                if ((*val)[i] != other_vec[i]) return false;
            }
            return true;
        }
        else {
            return val == std::get<T>(other.data);
        }
    }, data);
}

// ============================================================
// Utility
// ============================================================

Value Value::clone() const
{
    return std::visit([](const auto& val) -> Value {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, ValueMapPtr>) {
            ValueMap new_map;
            new_map.reserve(val->size());
            for (const auto& [k, v] : *val) {
                new_map.emplace(k, v.clone());
            }
            return Value{std::move(new_map)};
        }
        else if constexpr (std::is_same_v<T, ValueVectorPtr>) {
            ValueVector new_vec;
            new_vec.reserve(val->size());
            for (const auto& v : *val) {
                new_vec.push_back(v.clone());
            }
            return Value{std::move(new_vec)};
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return Value{};
        }
        else {
            return Value{val};
        }
    }, data);
}

namespace {

void write_escaped(std::ostream& os, std::string_view s)
{
    os << '"';
    for (char c : s) {
        switch (c) {
        case '"':  os << "\\\""; break;
        case '\\': os << "\\\\"; break;
        case '\n': os << "\\n"; break;
        case '\r': os << "\\r"; break;
        case '\t': os << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                   << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                os << c;
            }
        }
    }
    os << '"';
}

void write_value(std::ostream& os, const Value& value)
{
    std::visit([&os](const auto& val) {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            os << "null";
        }
        else if constexpr (std::is_same_v<T, bool>) {
            os << (val ? "true" : "false");
        }
        else if constexpr (std::is_same_v<T, int64_t>) {
            os << val;
        }
        else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(val)) {
                os << "null";
            } else {
                std::ostringstream num;
                num << std::setprecision(15) << val;
                os << num.str();
            }
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            write_escaped(os, val);
        }
        else if constexpr (std::is_same_v<T, ValueMapPtr>) {
            os << '{';
            bool first = true;
            for (const auto& [k, v] : *val) {
                if (!first) os << ',';
                first = false;
                write_escaped(os, k);
                os << ':';
                write_value(os, v);
            }
            os << '}';
        }
        else if constexpr (std::is_same_v<T, ValueVectorPtr>) {
            os << '[';
            bool first = true;
            for (const auto& v : *val) {
                if (!first) os << ',';
                first = false;
                write_value(os, v);
            }
            os << ']';
        }
    }, value.data);
}

} // anonymous namespace

std::string Value::to_string() const
{
    std::ostringstream oss;
    write_value(oss, *this);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& value)
{
    write_value(os, value);
    return os;
}

} // namespace treepath
