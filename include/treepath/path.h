// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path steps and owning Path type addressing a slot in a Value tree.
///
/// A Path is a sequence of steps, applied from the root:
/// - Key:     std::string, looks up a map entry
/// - Index:   std::size_t, 0-based position in a vector
/// - FromEnd: position counted back from the end of a vector,
///            FromEnd{0} is the last element, FromEnd{1} the one before it
///
/// ## Usage Examples
/// ```cpp
/// Path p{"users", 0, "name"};          // /users/0/name
/// Path q{"log", last()};               // /log/last
/// Path r = parse_path("/a/b~1c/last-1");  // ["a", "b/c", FromEnd{1}]
///
/// using namespace treepath::literals;
/// auto s = "/legumes/0/name"_path;
/// ```
///
/// ## Text form (JSON Pointer, RFC 6901, extended)
/// - ""      root
/// - "/a/0"  key "a" then index 0 (all-digit tokens are indices)
/// - "-", "last"  FromEnd{0};  "last-N"  FromEnd{N}
/// - "~1" decodes to '/', "~0" to '~'

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace treepath {

// ============================================================
// PathElement
// ============================================================

/// Position counted back from the end of a vector
struct FromEnd {
    std::size_t offset = 0;

    friend bool operator==(const FromEnd&, const FromEnd&) = default;
};

/// FromEnd{offset}: last() is the last element, last(1) the second-to-last
[[nodiscard]] constexpr FromEnd last(std::size_t offset = 0) noexcept
{
    return FromEnd{offset};
}

/// A single step: map key, vector index, or from-end vector position
using PathElement = std::variant<std::string, std::size_t, FromEnd>;

[[nodiscard]] inline bool is_key(const PathElement& elem) noexcept
{
    return std::holds_alternative<std::string>(elem);
}

[[nodiscard]] inline bool is_index(const PathElement& elem) noexcept
{
    return std::holds_alternative<std::size_t>(elem);
}

[[nodiscard]] inline bool is_from_end(const PathElement& elem) noexcept
{
    return std::holds_alternative<FromEnd>(elem);
}

/// Literal step for Path construction.
/// Strings become keys, non-negative integers indices, and negative
/// integers count from the end (-1 is the last element).
struct PathStep {
    PathElement element;

    PathStep(const char* key) : element(std::string{key}) {}
    PathStep(std::string key) : element(std::move(key)) {}
    PathStep(std::string_view key) : element(std::string{key}) {}
    PathStep(FromEnd from_end) noexcept : element(from_end) {}
    PathStep(PathElement elem) : element(std::move(elem)) {}

    template <std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    PathStep(T index) noexcept
        : element(to_element(index))
    {}

private:
    template <std::integral T>
    static PathElement to_element(T index) noexcept
    {
        if constexpr (std::is_signed_v<T>) {
            if (index < 0) {
                return FromEnd{static_cast<std::size_t>(-(index + 1))};
            }
        }
        return static_cast<std::size_t>(index);
    }
};

// ============================================================
// Path - owning sequence of steps
// ============================================================

class TREEPATH_API Path {
public:
    using value_type = PathElement;
    using container_type = std::vector<PathElement>;
    using iterator = container_type::const_iterator;
    using const_iterator = container_type::const_iterator;
    using size_type = std::size_t;

    /// Empty path (the root)
    Path() = default;

    Path(std::initializer_list<PathStep> steps);

    explicit Path(container_type elements) : elements_(std::move(elements)) {}

    // Iterators
    [[nodiscard]] const_iterator begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elements_.end(); }

    // Capacity
    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    // Element access
    [[nodiscard]] const PathElement& operator[](std::size_t i) const { return elements_[i]; }
    [[nodiscard]] const PathElement& front() const { return elements_.front(); }
    [[nodiscard]] const PathElement& back() const { return elements_.back(); }
    [[nodiscard]] const container_type& elements() const noexcept { return elements_; }

    // Modification
    Path& push_back(PathElement elem)
    {
        elements_.push_back(std::move(elem));
        return *this;
    }
    void pop_back() { elements_.pop_back(); }
    void clear() noexcept { elements_.clear(); }

    /// Path with every step but the last (root stays root)
    [[nodiscard]] Path parent() const;

    /// First count steps
    [[nodiscard]] Path prefix(std::size_t count) const;

    /// This path extended by one step
    [[nodiscard]] Path child(PathElement elem) const;

    /// This path extended by another path
    [[nodiscard]] Path concat(const Path& tail) const;

    friend bool operator==(const Path& a, const Path& b) = default;

private:
    container_type elements_;
};

/// Hash functor so Path can key unordered/ordered hash maps
struct TREEPATH_API PathHash {
    [[nodiscard]] std::size_t operator()(const Path& path) const noexcept;
};

// ============================================================
// Path utilities
// ============================================================

/// true if prefix is a strict (shorter) prefix of path.
/// The root is a proper prefix of every non-empty path.
[[nodiscard]] TREEPATH_API bool is_proper_prefix(const Path& prefix, const Path& path) noexcept;

/// Parse pointer text (see file header), throws PathError(InvalidPath)
[[nodiscard]] TREEPATH_API Path parse_path(std::string_view pointer);

/// Pointer text for a path, inverse of parse_path()
/// Examples: ["users", 0, "name"] -> "/users/0/name", [] -> ""
[[nodiscard]] TREEPATH_API std::string path_to_pointer(const Path& path);

/// Dot notation for diagnostics
/// Examples: ["users", 0, "name"] -> ".users[0].name", [] -> "(root)"
[[nodiscard]] TREEPATH_API std::string path_to_string(const Path& path);

/// Single step rendered for messages: key as-is, index as decimal,
/// FromEnd as "last" / "last-N"
[[nodiscard]] TREEPATH_API std::string element_to_string(const PathElement& elem);

namespace literals {

/// "/a/0/last"_path
[[nodiscard]] inline Path operator""_path(const char* str, std::size_t len)
{
    return parse_path(std::string_view{str, len});
}

} // namespace literals

} // namespace treepath
