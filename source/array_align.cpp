// array_align.cpp - Positional and LCS array alignment

#include <semdiff/array_align.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace semdiff {

ArrayStrategy parse_array_strategy(std::string_view text)
{
    if (text == "positional") return ArrayStrategy::Positional;
    if (text == "lcs") return ArrayStrategy::Lcs;
    throw std::invalid_argument("unknown array strategy '" + std::string{text}
                                + "' (expected 'positional' or 'lcs')");
}

std::string_view to_string(ArrayStrategy strategy) noexcept
{
    switch (strategy) {
        case ArrayStrategy::Positional: return "positional";
        case ArrayStrategy::Lcs:        return "lcs";
    }
    return "positional";
}

namespace {

Alignment align_positional(std::size_t old_size, std::size_t new_size)
{
    Alignment result;
    result.reserve(std::max(old_size, new_size));

    const std::size_t common_size = std::min(old_size, new_size);
    for (std::size_t i = 0; i < common_size; ++i) {
        result.push_back(AlignedPair{i, i});
    }

    // Removed tail elements
    for (std::size_t i = common_size; i < old_size; ++i) {
        result.push_back(AlignedPair{i, std::nullopt});
    }

    // Added tail elements
    for (std::size_t i = common_size; i < new_size; ++i) {
        result.push_back(AlignedPair{std::nullopt, i});
    }

    return result;
}

Alignment align_lcs(const ValueVector& old_items, const ValueVector& new_items, const Equivalence& eq)
{
    const std::size_t n = old_items.size();
    const std::size_t m = new_items.size();
    const std::size_t width = m + 1;

    // table[i * width + j] = LCS length of old[0..i) and new[0..j)
    std::vector<std::size_t> table((n + 1) * width, 0);
    auto at = [&](std::size_t i, std::size_t j) -> std::size_t& { return table[i * width + j]; };

    auto equal = [&](std::size_t i, std::size_t j) {
        return detail::boxes_equivalent<value_memory_policy>(old_items[i], new_items[j], eq);
    };

    for (std::size_t i = 1; i <= n; ++i) {
        for (std::size_t j = 1; j <= m; ++j) {
            if (equal(i - 1, j - 1)) {
                at(i, j) = at(i - 1, j - 1) + 1;
            } else {
                at(i, j) = std::max(at(i - 1, j), at(i, j - 1));
            }
        }
    }

    // Backtrack from the end; collected in reverse order
    Alignment result;
    result.reserve(n + m - at(n, m));

    std::size_t i = n;
    std::size_t j = m;
    while (i > 0 || j > 0) {
        if (i > 0 && j > 0 && equal(i - 1, j - 1)) {
            result.push_back(AlignedPair{i - 1, j - 1});
            --i;
            --j;
        } else if (j > 0 && (i == 0 || at(i, j - 1) >= at(i - 1, j))) {
            // Ties step left so that, once reversed, removals precede additions
            result.push_back(AlignedPair{std::nullopt, j - 1});
            --j;
        } else {
            result.push_back(AlignedPair{i - 1, std::nullopt});
            --i;
        }
    }

    std::reverse(result.begin(), result.end());
    return result;
}

} // anonymous namespace

Alignment align_arrays(const ValueVector& old_items,
                       const ValueVector& new_items,
                       ArrayStrategy strategy,
                       const Equivalence& eq)
{
    switch (strategy) {
        case ArrayStrategy::Lcs:
            return align_lcs(old_items, new_items, eq);
        case ArrayStrategy::Positional:
            break;
    }
    return align_positional(old_items.size(), new_items.size());
}

} // namespace semdiff
