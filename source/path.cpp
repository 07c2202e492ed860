// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief Path construction, display and JSON Pointer conversion.

#include <semdiff/path.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace semdiff {

// ============================================================
// Path - construction and modifiers
// ============================================================

Path::Path(std::initializer_list<PathArg> init)
{
    elements_.reserve(init.size());
    for (const auto& arg : init) {
        elements_.push_back(arg.element);
    }
}

Path& Path::push_back(PathArg segment)
{
    elements_.push_back(std::move(segment.element));
    return *this;
}

void Path::pop_back()
{
    if (elements_.empty()) return;
    elements_.pop_back();
}

Path Path::child(PathArg segment) const
{
    Path result;
    result.elements_.reserve(elements_.size() + 1);
    result.elements_ = elements_;
    result.elements_.push_back(std::move(segment.element));
    return result;
}

std::string Path::segment_string(std::size_t i) const
{
    if (auto* key = std::get_if<std::string>(&elements_[i])) {
        return *key;
    }
    return std::to_string(std::get<std::size_t>(elements_[i]));
}

// ============================================================
// Path - conversion
// ============================================================

std::string Path::to_string() const
{
    if (elements_.empty()) {
        return "(root)";
    }

    std::string result;
    for (const auto& elem : elements_) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                if (!result.empty()) result += '.';
                result += v;
            } else {
                result += '[';
                result += std::to_string(v);
                result += ']';
            }
        }, elem);
    }
    return result;
}

std::string Path::to_json_pointer() const
{
    std::string result;
    for (const auto& elem : elements_) {
        result += '/';
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                // Escape: ~ -> ~0, / -> ~1
                for (char c : v) {
                    if (c == '~') {
                        result += "~0";
                    } else if (c == '/') {
                        result += "~1";
                    } else {
                        result += c;
                    }
                }
            } else {
                result += std::to_string(v);
            }
        }, elem);
    }
    return result;
}

// ============================================================
// JSON Pointer parsing
// ============================================================

namespace {

/// Unescape a JSON Pointer segment according to RFC 6901
/// ~1 -> /, ~0 -> ~
std::string unescape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

bool is_array_index(const std::string& s)
{
    if (s.empty()) {
        return false;
    }
    return std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

Path parse_json_pointer(std::string_view pointer)
{
    Path path;
    if (pointer.empty()) {
        return path;
    }

    if (pointer[0] != '/') {
        throw std::invalid_argument("JSON pointer must start with '/': " + std::string{pointer});
    }

    pointer.remove_prefix(1);
    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);

        std::string unescaped = unescape_segment(segment);
        std::size_t index = 0;
        auto [end, ec] = std::from_chars(unescaped.data(), unescaped.data() + unescaped.size(), index);
        if (is_array_index(unescaped) && ec == std::errc{} && end == unescaped.data() + unescaped.size()) {
            path.push_back(index);
        } else {
            path.push_back(std::move(unescaped));
        }

        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }

    return path;
}

} // namespace semdiff
