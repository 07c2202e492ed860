// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document_io.h
/// @brief Loading documents from files or standard input.
///
/// The reader is chosen from the hint, then from the file extension
/// (.json, .yaml, .yml, case-insensitive). Without either, JSON is tried
/// first and YAML second.

#pragma once

#include <semdiff/api.h>
#include <semdiff/document.h>

#include <iosfwd>
#include <string>
#include <string_view>

namespace semdiff {

enum class FormatHint {
    Auto,
    Json,
    Yaml,
};

/// Parse "auto", "json" or "yaml"
/// @throws std::invalid_argument on any other text
[[nodiscard]] SEMDIFF_API FormatHint parse_format_hint(std::string_view text);

[[nodiscard]] SEMDIFF_API std::string_view to_string(FormatHint hint);

/// Format implied by a file name, Auto when the extension is not known
[[nodiscard]] SEMDIFF_API FormatHint format_from_extension(std::string_view source);

/// Parse already loaded text
/// @param origin Name used in error messages
/// @throws ParseError
[[nodiscard]] SEMDIFF_API Document parse_document(std::string_view text, FormatHint hint,
                                                  std::string_view origin = "<input>");

/// Load a document from a file, or from standard input when @p source is "-"
/// @throws ParseError on a missing or unreadable file and on malformed content
[[nodiscard]] SEMDIFF_API Document load_document(const std::string& source,
                                                 FormatHint hint = FormatHint::Auto);

/// Same as load_document, reading "-" from @p input instead of std::cin
[[nodiscard]] SEMDIFF_API Document load_document(const std::string& source, FormatHint hint,
                                                 std::istream& input);

/// load_document + build_tree
/// @throws ParseError, CyclicReferenceError
[[nodiscard]] SEMDIFF_API Value load_value(const std::string& source,
                                           FormatHint hint = FormatHint::Auto,
                                           const TreeBuildOptions& options = {});

/// load_value reading "-" from @p input
[[nodiscard]] SEMDIFF_API Value load_value(const std::string& source, FormatHint hint,
                                           const TreeBuildOptions& options, std::istream& input);

} // namespace semdiff
