// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON reading into a Document and JSON writing of a Value.
///
/// Usage:
/// @code
///   #include <semdiff/serialization.h>
///
///   Document doc = read_json(R"({"name": "Alice", "tags": ["a", "b"]})");
///   Value tree = build_tree(doc);
///
///   std::string compact = to_json(tree, true);   // {"name":"Alice","tags":["a","b"]}
///   std::string pretty  = to_json(tree);         // indented with two spaces
/// @endcode
///
/// The reader follows RFC 8259: all escapes including surrogate pairs,
/// no trailing commas, no content after the top-level value. Every number
/// is stored as a double.
///
/// Note: This header must be included separately from value.h if you need serialization.

#pragma once

#include <semdiff/api.h>
#include <semdiff/document.h>
#include <semdiff/value.h>

#include <string>
#include <string_view>

namespace semdiff {

// ============================================================
// JSON Reading
// ============================================================

/// Parse JSON text into a document graph
/// @throws ParseError with line and column on malformed input
[[nodiscard]] SEMDIFF_API Document read_json(std::string_view text);

/// Parse JSON text straight into a Value tree (read_json + build_tree)
/// @throws ParseError on malformed input
[[nodiscard]] SEMDIFF_API Value from_json(std::string_view text);

// ============================================================
// JSON Writing
// ============================================================

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
///
/// Object keys are written in insertion order. Integral numbers are written
/// without a fraction; NaN and infinities have no JSON form and are written
/// as null.
[[nodiscard]] SEMDIFF_API std::string to_json(const Value& val, bool compact = false);

/// Append the JSON form of a string, quotes included
SEMDIFF_API void write_json_string(std::string& out, std::string_view text);

/// Append the JSON form of a number (null when not finite)
SEMDIFF_API void write_json_number(std::string& out, double number);

} // namespace semdiff
