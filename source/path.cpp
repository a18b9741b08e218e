// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/path.h>
#include <treepath/error.h>

#include <algorithm>
#include <charconv>
#include <functional>

namespace treepath {

// ============================================================
// Path
// ============================================================

Path::Path(std::initializer_list<PathStep> steps)
{
    elements_.reserve(steps.size());
    for (const auto& step : steps) {
        elements_.push_back(step.element);
    }
}

Path Path::parent() const
{
    if (elements_.empty()) {
        return {};
    }
    return prefix(elements_.size() - 1);
}

Path Path::prefix(std::size_t count) const
{
    count = std::min(count, elements_.size());
    return Path(container_type(elements_.begin(), elements_.begin() + static_cast<std::ptrdiff_t>(count)));
}

Path Path::child(PathElement elem) const
{
    Path result(*this);
    result.elements_.push_back(std::move(elem));
    return result;
}

Path Path::concat(const Path& tail) const
{
    Path result(*this);
    result.elements_.insert(result.elements_.end(), tail.elements_.begin(), tail.elements_.end());
    return result;
}

std::size_t PathHash::operator()(const Path& path) const noexcept
{
    // boost::hash_combine style mixing
    std::size_t seed = path.size();
    for (const auto& elem : path) {
        std::size_t h = std::visit([](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return std::hash<std::string_view>{}(v);
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                return std::hash<std::size_t>{}(v);
            } else {
                return ~std::hash<std::size_t>{}(v.offset);
            }
        }, elem);
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

bool is_proper_prefix(const Path& prefix, const Path& path) noexcept
{
    if (prefix.size() >= path.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

// ============================================================
// Pointer parsing
// ============================================================

namespace {

/// Unescape a pointer token according to RFC 6901
/// ~1 -> /, ~0 -> ~
std::string unescape_token(std::string_view token, std::size_t position)
{
    std::string result;
    result.reserve(token.size());

    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~') {
            if (i + 1 < token.size() && token[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            }
            if (i + 1 < token.size() && token[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
            throw PathError(ErrorCode::InvalidPath,
                            "invalid escape in pointer token " + std::to_string(position) + ": '" +
                                std::string{token} + "'",
                            Path{}, position);
        }
        result += token[i];
    }

    return result;
}

bool is_all_digits(std::string_view s) noexcept
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

/// Decimal index, rejecting leading zeros ("01") and overflow
bool parse_index(std::string_view s, std::size_t& out) noexcept
{
    if (!is_all_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;

    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

PathElement decode_token(std::string token)
{
    std::size_t index = 0;
    if (parse_index(token, index)) {
        return index;
    }
    if (token == "-" || token == "last") {
        return FromEnd{0};
    }
    constexpr std::string_view last_prefix = "last-";
    if (token.size() > last_prefix.size() && std::string_view{token}.substr(0, last_prefix.size()) == last_prefix) {
        std::size_t offset = 0;
        if (parse_index(std::string_view{token}.substr(last_prefix.size()), offset)) {
            return FromEnd{offset};
        }
    }
    return token;
}

void append_escaped(std::string& out, std::string_view key)
{
    for (char c : key) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
}

} // anonymous namespace

Path parse_path(std::string_view pointer)
{
    // Empty pointer refers to root
    if (pointer.empty()) {
        return Path{};
    }

    if (pointer[0] != '/') {
        throw PathError(ErrorCode::InvalidPath,
                        "pointer must be empty or start with '/': '" + std::string{pointer} + "'");
    }

    Path path;
    pointer.remove_prefix(1);

    for (std::size_t position = 0;; ++position) {
        auto pos = pointer.find('/');
        std::string_view token = (pos == std::string_view::npos) ? pointer : pointer.substr(0, pos);

        path.push_back(decode_token(unescape_token(token, position)));

        if (pos == std::string_view::npos) {
            break;
        }
        pointer.remove_prefix(pos + 1);
    }

    return path;
}

std::string element_to_string(const PathElement& elem)
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::size_t>) {
            return std::to_string(v);
        } else {
            return v.offset == 0 ? std::string{"last"} : "last-" + std::to_string(v.offset);
        }
    }, elem);
}

std::string path_to_pointer(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        result += '/';
        if (const auto* key = std::get_if<std::string>(&elem)) {
            append_escaped(result, *key);
        } else {
            result += element_to_string(elem);
        }
    }
    return result;
}

std::string path_to_string(const Path& path)
{
    if (path.empty()) {
        return "(root)";
    }

    std::string result;
    for (const auto& elem : path) {
        if (const auto* key = std::get_if<std::string>(&elem)) {
            result += '.';
            result += *key;
        } else {
            result += '[';
            result += element_to_string(elem);
            result += ']';
        }
    }
    return result;
}

} // namespace treepath
