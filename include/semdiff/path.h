// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path type addressing a location inside a Value tree.
///
/// A Path is an ordered sequence of segments, each either an object key or
/// an array index. Paths own their keys and hold no reference to any Value.
///
/// ## Usage Examples
///
/// ```cpp
/// Path path{"users", 0, "name"};
/// path.to_string();        // "users[0].name"
/// path.to_json_pointer();  // "/users/0/name"
///
/// Path dynamic;
/// dynamic.push_back(key_from_input);
/// dynamic.push_back(3);
/// dynamic.pop_back();
/// ```
///
/// A key "0" and an index 0 are different segments.

#pragma once

#include <semdiff/api.h>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace semdiff {

/// A single path element: either a string key or a numeric index
using PathElement = std::variant<std::string, std::size_t>;

// ============================================================
// PathArg - implicit conversion helper
//
// Lets Path{"users", 0, "name"} and push_back(0) work without the
// narrowing and null-pointer ambiguities of converting straight to
// PathElement.
// ============================================================

struct PathArg {
    PathElement element;

    PathArg(const char* key) : element(std::string{key}) {}
    PathArg(std::string key) : element(std::move(key)) {}
    PathArg(std::string_view key) : element(std::string{key}) {}
    PathArg(PathElement elem) : element(std::move(elem)) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    PathArg(T index) : element(static_cast<std::size_t>(index)) {}
};

// ============================================================
// Path
// ============================================================

class SEMDIFF_API Path {
public:
    using value_type     = PathElement;
    using const_iterator = std::vector<PathElement>::const_iterator;
    using iterator       = const_iterator;
    using size_type      = std::size_t;

    Path() = default;

    /// Construct from literal segments
    Path(std::initializer_list<PathArg> init);

    // ============================================================
    // Modifiers
    // ============================================================

    /// Append a key or index
    Path& push_back(PathArg segment);

    /// Remove the last segment (no-op on an empty path)
    void pop_back();

    void clear() noexcept { elements_.clear(); }
    void reserve(std::size_t n) { elements_.reserve(n); }

    /// New path with @p segment appended
    [[nodiscard]] Path child(PathArg segment) const;

    // ============================================================
    // Access
    // ============================================================

    [[nodiscard]] const_iterator begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elements_.end(); }

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    [[nodiscard]] const PathElement& operator[](std::size_t i) const noexcept {
        return elements_[i];
    }

    [[nodiscard]] const PathElement& front() const noexcept { return elements_.front(); }
    [[nodiscard]] const PathElement& back() const noexcept { return elements_.back(); }

    [[nodiscard]] bool is_key(std::size_t i) const noexcept {
        return std::holds_alternative<std::string>(elements_[i]);
    }

    /// Segment text used for pattern matching: the key, or the index in decimal
    [[nodiscard]] std::string segment_string(std::size_t i) const;

    // ============================================================
    // Conversion
    // ============================================================

    /// Display form, e.g. "users[0].name"; "(root)" for the empty path
    [[nodiscard]] std::string to_string() const;

    /// RFC 6901 pointer, e.g. "/users/0/name"; "" for the empty path
    [[nodiscard]] std::string to_json_pointer() const;

    // ============================================================
    // Comparison
    // ============================================================

    [[nodiscard]] bool operator==(const Path& other) const = default;

private:
    std::vector<PathElement> elements_;
};

/// Parse an RFC 6901 pointer ("/users/0/name"). All-digit segments become
/// indices; "~1" and "~0" are unescaped.
/// @throws std::invalid_argument if a non-empty pointer lacks the leading '/'
[[nodiscard]] SEMDIFF_API Path parse_json_pointer(std::string_view pointer);

} // namespace semdiff
