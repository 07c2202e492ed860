// value.cpp - Value utilities and explicit template instantiations

#include <semdiff/value.h>
#include <semdiff/builders.h>

namespace semdiff {

std::string normalize_whitespace(std::string_view text)
{
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

// ============================================================
// Explicit Template Instantiations
//
// Matching 'extern template' declarations live in value.h and builders.h.
// ============================================================

template struct BasicValue<value_memory_policy>;
template class BasicValueObject<value_memory_policy>;
template class BasicObjectBuilder<value_memory_policy>;
template class BasicArrayBuilder<value_memory_policy>;

} // namespace semdiff
