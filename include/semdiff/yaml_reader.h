// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file yaml_reader.h
/// @brief YAML reading into a Document (yaml-cpp event parser).
///
/// Only the first document of a stream is read. Plain scalars are resolved
/// with the YAML 1.2 core schema:
///   - null:  ~, null, Null, NULL, empty
///   - bool:  true/True/TRUE, false/False/FALSE
///   - int:   [-+]?[0-9]+, 0o[0-7]+, 0x[0-9a-fA-F]+
///   - float: [-+]?(.[0-9]+|[0-9]+(.[0-9]*)?)([eE][-+]?[0-9]+)?, .inf, .nan
///   - anything else is a string
/// Quoted scalars are always strings. Explicit !!str, !!int, !!float,
/// !!bool and !!null tags override the resolution.
///
/// Anchors and aliases become shared Document nodes, so `*ref` resolves to
/// the same sub-tree as `&ref`. An alias nested inside its own anchor is a
/// cycle, which build_tree() reports as CyclicReferenceError.
///
/// Non-string mapping keys are converted to their text form.

#pragma once

#include <semdiff/api.h>
#include <semdiff/document.h>

#include <string_view>

namespace semdiff {

/// Parse the first YAML document of @p text
/// @throws ParseError with line and column on malformed input
[[nodiscard]] SEMDIFF_API Document read_yaml(std::string_view text);

/// Parse YAML straight into a Value tree (read_yaml + build_tree)
/// @throws ParseError, CyclicReferenceError
[[nodiscard]] SEMDIFF_API Value from_yaml(std::string_view text);

} // namespace semdiff
