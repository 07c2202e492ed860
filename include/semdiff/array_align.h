// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_align.h
/// @brief Alignment of two arrays into matched, removed and added positions.
///
/// Two strategies are available:
///
/// - **Positional**: index i of the old array is paired with index i of the
///   new one; the longer side's tail is removed or added. O(n).
/// - **Lcs**: longest common subsequence under value equivalence. Equal
///   elements are matched even when they moved; every other position is
///   reported as removed or added. O(n*m) time and space.
///
/// Lcs matches by equivalence, not by similarity, so a modified complex
/// element shows up as a removal plus an addition.

#pragma once

#include <semdiff/api.h>
#include <semdiff/value.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace semdiff {

enum class ArrayStrategy : std::uint8_t {
    Positional,
    Lcs
};

/// "positional" or "lcs"
/// @throws std::invalid_argument for any other text
[[nodiscard]] SEMDIFF_API ArrayStrategy parse_array_strategy(std::string_view text);

[[nodiscard]] SEMDIFF_API std::string_view to_string(ArrayStrategy strategy) noexcept;

/// One step of an alignment. Both indices set: matched pair; only
/// old_index: removed; only new_index: added.
struct AlignedPair {
    std::optional<std::size_t> old_index;
    std::optional<std::size_t> new_index;

    [[nodiscard]] bool is_match() const noexcept { return old_index && new_index; }
    [[nodiscard]] bool is_removal() const noexcept { return old_index && !new_index; }
    [[nodiscard]] bool is_addition() const noexcept { return !old_index && new_index; }

    bool operator==(const AlignedPair&) const = default;
};

/// Ordered alignment covering every old and every new index exactly once
using Alignment = std::vector<AlignedPair>;

/// Align @p old_items against @p new_items.
/// @param eq Equivalence used by Lcs to decide which elements match
[[nodiscard]] SEMDIFF_API Alignment align_arrays(const ValueVector& old_items,
                                                 const ValueVector& new_items,
                                                 ArrayStrategy strategy,
                                                 const Equivalence& eq = {});

} // namespace semdiff
