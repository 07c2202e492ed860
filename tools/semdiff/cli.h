// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file cli.h
/// @brief semdiff command line driver.
///
/// Exit status:
///   0  no differences (after filtering)
///   1  differences found
///   2  usage error, unreadable or malformed input, bad pattern, cyclic document

#pragma once

#include <iosfwd>

namespace semdiff::cli {

inline constexpr int kExitSame = 0;
inline constexpr int kExitDifferent = 1;
inline constexpr int kExitError = 2;

/// Parse @p argv, compare the two inputs and print the result.
/// "-" reads from @p in, the report goes to @p out and diagnostics to @p err.
/// @return the exit status
int run(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err);

} // namespace semdiff::cli
