// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render.h
/// @brief Text, colored terminal and JSON rendering of a ChangeSet.
///
/// Plain output:
/// @code
///   + users[1].name: "Bob"
///   - users[0].age: 30
///   ~ version: 1 -> 2
///
///   Summary: 1 added, 1 removed, 1 modified
/// @endcode
///
/// The terminal format has the same layout with ANSI colors. The JSON
/// format lists every change with its path segments, JSON Pointer, type and
/// both values, followed by the counts.

#pragma once

#include <semdiff/api.h>
#include <semdiff/value.h>
#include <semdiff/value_diff.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace semdiff {

enum class OutputFormat {
    Terminal,
    Plain,
    Json,
};

/// Parse "terminal", "plain" or "json"
/// @throws std::invalid_argument on any other text
[[nodiscard]] SEMDIFF_API OutputFormat parse_output_format(std::string_view text);

[[nodiscard]] SEMDIFF_API std::string_view to_string(OutputFormat format);

struct OutputOptions {
    /// Longest value preview in bytes, 0 for unlimited
    std::size_t max_value_length = 80;
    /// Print values as compact JSON instead of "{ N keys }" summaries
    bool show_values = false;
    /// Omit the summary line
    bool quiet = false;
};

/// Short single-line form of a value for the text formats
[[nodiscard]] SEMDIFF_API std::string value_preview(const Value& val, const OutputOptions& options = {});

/// Cut @p text to at most @p max_length bytes ending in "...", without
/// splitting a UTF-8 sequence. A @p max_length of 0 leaves the text alone;
/// below 3 only the "..." remains.
[[nodiscard]] SEMDIFF_API std::string truncate_preview(std::string text, std::size_t max_length);

/// "Summary: 1 added, 2 modified" or "Summary: No changes"
[[nodiscard]] SEMDIFF_API std::string summary_line(const DiffStats& stats);

[[nodiscard]] SEMDIFF_API std::string render(const ChangeSet& changes, OutputFormat format,
                                             const OutputOptions& options = {});

} // namespace semdiff
