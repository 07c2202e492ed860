// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_filter.h
/// @brief Glob path patterns and include/exclude filtering of a ChangeSet.
///
/// Pattern syntax (segments separated by '.'):
/// - `name`  matches the key "name", or an index written in decimal ("0")
/// - `*`     matches exactly one segment
/// - `**`    matches zero or more segments
///
/// Matching is anchored at both ends:
/// @code
///   auto p = PathPattern::parse("**.timestamp");
///   p.matches(Path{"metadata", "timestamp"});     // true
///   p.matches(Path{"a", "b", "c", "timestamp"});  // true
///   p.matches(Path{"timestamptag"});              // false
///
///   PathPattern::parse("spec.**").matches(Path{"spec"});  // true
/// @endcode

#pragma once

#include <semdiff/api.h>
#include <semdiff/path.h>
#include <semdiff/value_diff.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff {

/// Malformed filter pattern
class SEMDIFF_API PatternError : public std::invalid_argument {
public:
    PatternError(std::string pattern, const std::string& reason)
        : std::invalid_argument("invalid path pattern '" + pattern + "': " + reason)
        , pattern_(std::move(pattern))
    {}

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    std::string pattern_;
};

class SEMDIFF_API PathPattern {
public:
    struct Segment {
        enum class Kind { Literal, AnyOne, AnyMany };
        Kind kind = Kind::Literal;
        std::string text;   // Literal only

        bool operator==(const Segment&) const = default;
    };

    /// @throws PatternError on an empty pattern, an empty segment, a '*'
    ///         mixed with other characters, or three or more '*'
    [[nodiscard]] static PathPattern parse(std::string_view text);

    [[nodiscard]] bool matches(const Path& path) const;

    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    PathPattern() = default;

    std::string text_;
    std::vector<Segment> segments_;
};

// ============================================================
// FilterConfig
// ============================================================

class SEMDIFF_API FilterConfig {
public:
    /// Exclude changes whose path matches @p pattern
    /// @throws PatternError
    FilterConfig& ignore(std::string_view pattern);

    /// Restrict output to changes matching @p pattern (any of the only-patterns)
    /// @throws PatternError
    FilterConfig& only(std::string_view pattern);

    [[nodiscard]] bool has_filters() const noexcept { return !ignore_.empty() || !only_.empty(); }

    /// (no only-pattern OR some only-pattern matches) AND no ignore-pattern matches
    [[nodiscard]] bool should_include(const Path& path) const;

    [[nodiscard]] const std::vector<PathPattern>& ignore_patterns() const noexcept { return ignore_; }
    [[nodiscard]] const std::vector<PathPattern>& only_patterns() const noexcept { return only_; }

private:
    std::vector<PathPattern> ignore_;
    std::vector<PathPattern> only_;
};

/// Keep the changes @p filter includes, preserving order; counts are recomputed
[[nodiscard]] SEMDIFF_API ChangeSet filter_changes(const ChangeSet& changes, const FilterConfig& filter);

} // namespace semdiff
