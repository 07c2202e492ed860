// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Normalized, format-agnostic Value type for structured documents.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool
/// - Number (every integer and float collapses into an IEEE-754 double)
/// - String
/// - Array (immer::vector of boxed values)
/// - Object (insertion-ordered, unique string keys)
///
/// Values are immutable once constructed. Sub-trees live in immer boxes and
/// may be shared between trees; sharing never changes the result of any
/// operation in this library.
///
/// The Value type is templated on a memory policy. The default alias uses
/// immer's thread-safe policy so that trees can be compared from several
/// threads at once.

#pragma once

#include <semdiff/api.h>
#include <semdiff/semdiff_config.h>
#include <semdiff/value_fwd.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <bit>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace semdiff {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if SEMDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if SEMDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

// ============================================================
// ValueKind
// ============================================================

/// The six kinds of Value, in variant index order
enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/// Lower-case kind name used in messages and the JSON change format
[[nodiscard]] constexpr std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

// ============================================================
// Container types
// ============================================================

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                        MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicObjectEntry {
    std::string key;
    BasicValueBox<MemoryPolicy> value;
};

template <typename MemoryPolicy>
class BasicObjectBuilder;

// ============================================================
// BasicValueObject - insertion-ordered object
//
// Entries are kept in an immer::vector in insertion order (display
// order); a persistent key -> position map gives O(log n) lookup.
// Keys are unique: setting an existing key replaces its value in place.
// ============================================================

template <typename MemoryPolicy>
class BasicValueObject {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using entry_type     = BasicObjectEntry<MemoryPolicy>;
    using entry_vector   = immer::vector<entry_type, MemoryPolicy>;
    using index_map      = immer::map<std::string,
                                      std::size_t,
                                      std::hash<std::string>,
                                      std::equal_to<std::string>,
                                      MemoryPolicy>;
    using const_iterator = typename entry_vector::const_iterator;

    BasicValueObject() = default;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.size() == 0; }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    /// Entry at insertion position @p pos (no bounds check)
    [[nodiscard]] const entry_type& entry(std::size_t pos) const { return entries_[pos]; }

    [[nodiscard]] bool contains(const std::string& key) const { return index_.count(key) > 0; }

    /// Box holding the value for @p key, or nullptr
    [[nodiscard]] const value_box* find_box(const std::string& key) const {
        if (auto* pos = index_.find(key)) return &entries_[*pos].value;
        return nullptr;
    }

    /// Value for @p key, or nullptr
    [[nodiscard]] const value_type* find(const std::string& key) const {
        if (auto* box = find_box(key)) return &box->get();
        return nullptr;
    }

    /// Insert or replace. A replaced key keeps its original position.
    [[nodiscard]] BasicValueObject set(std::string key, value_box val) const {
        if (auto* pos = index_.find(key)) {
            return BasicValueObject{entries_.set(*pos, entry_type{std::move(key), std::move(val)}), index_};
        }
        auto index = index_.set(key, entries_.size());
        return BasicValueObject{entries_.push_back(entry_type{std::move(key), std::move(val)}),
                                std::move(index)};
    }

private:
    friend class BasicObjectBuilder<MemoryPolicy>;

    BasicValueObject(entry_vector entries, index_map index)
        : entries_(std::move(entries))
        , index_(std::move(index))
    {}

    entry_vector entries_;
    index_map index_;
};

// ============================================================
// BasicValue
// ============================================================

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;
    using object_entry  = BasicObjectEntry<MemoryPolicy>;

    // Alternative order matches ValueKind
    std::variant<std::monostate,
                 bool,
                 double,
                 std::string,
                 value_vector,
                 value_object>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}

    /// Any non-bool arithmetic type becomes a Number
    template <typename T>
        requires(std::is_arithmetic_v<T> && !std::same_as<T, bool>)
    constexpr BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_object v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        value_object result;
        for (const auto& [key, val] : init) {
            result = result.set(key, value_box{val});
        }
        return BasicValue{std::move(result)};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (auto* found = o->find(key)) return *found;
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* o = get_if<value_object>()) return o->contains(key);
        return false;
    }

    /// Number of elements (arrays) or keys (objects); 0 for scalars
    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<value_object>()) return o->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Default Value Type Aliases
// ============================================================

using ValueBox    = BasicValueBox<value_memory_policy>;
using ValueVector = BasicValueVector<value_memory_policy>;
using ObjectEntry = BasicObjectEntry<value_memory_policy>;

// ============================================================
// Equivalence
// ============================================================

/// Options relaxing value equality
struct Equivalence {
    /// Compare strings after collapsing whitespace runs and trimming
    bool ignore_whitespace = false;
    /// Object keys holding Null count as absent
    bool null_as_missing = false;
};

/// Collapse every run of ASCII whitespace to one space and trim both ends
[[nodiscard]] SEMDIFF_API std::string normalize_whitespace(std::string_view text);

namespace detail {

/// Bit-for-bit number comparison: NaN equals itself, 0.0 and -0.0 differ
[[nodiscard]] inline bool numbers_identical(double a, double b) noexcept
{
    return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

[[nodiscard]] inline bool strings_equivalent(const std::string& a, const std::string& b,
                                             const Equivalence& eq)
{
    if (a == b) return true;
    if (!eq.ignore_whitespace) return false;
    return normalize_whitespace(a) == normalize_whitespace(b);
}

template <typename MemoryPolicy>
[[nodiscard]] bool values_equivalent(const BasicValue<MemoryPolicy>& a,
                                     const BasicValue<MemoryPolicy>& b,
                                     const Equivalence& eq);

template <typename MemoryPolicy>
[[nodiscard]] bool boxes_equivalent(const BasicValueBox<MemoryPolicy>& a,
                                    const BasicValueBox<MemoryPolicy>& b,
                                    const Equivalence& eq)
{
    // Shared sub-tree
    if (&a.get() == &b.get()) [[likely]] return true;
    return values_equivalent(a.get(), b.get(), eq);
}

template <typename MemoryPolicy>
[[nodiscard]] std::size_t present_key_count(const BasicValueObject<MemoryPolicy>& obj,
                                            const Equivalence& eq)
{
    if (!eq.null_as_missing) return obj.size();
    std::size_t count = 0;
    for (const auto& entry : obj) {
        if (!entry.value.get().is_null()) ++count;
    }
    return count;
}

template <typename MemoryPolicy>
[[nodiscard]] bool objects_equivalent(const BasicValueObject<MemoryPolicy>& a,
                                      const BasicValueObject<MemoryPolicy>& b,
                                      const Equivalence& eq)
{
    if (present_key_count(a, eq) != present_key_count(b, eq)) return false;
    for (const auto& entry : a) {
        if (eq.null_as_missing && entry.value.get().is_null()) continue;
        auto* other = b.find_box(entry.key);
        if (!other) return false;
        if (!boxes_equivalent(entry.value, *other, eq)) return false;
    }
    return true;
}

template <typename MemoryPolicy>
bool values_equivalent(const BasicValue<MemoryPolicy>& a,
                       const BasicValue<MemoryPolicy>& b,
                       const Equivalence& eq)
{
    if (a.data.index() != b.data.index()) return false;

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, double>) {
            return numbers_identical(lhs, rhs);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return strings_equivalent(lhs, rhs, eq);
        } else if constexpr (std::is_same_v<T, typename BasicValue<MemoryPolicy>::value_vector>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!boxes_equivalent<MemoryPolicy>(lhs[i], rhs[i], eq)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, typename BasicValue<MemoryPolicy>::value_object>) {
            return objects_equivalent(lhs, rhs, eq);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

} // namespace detail

/// Semantic equality under @p eq
template <typename MemoryPolicy>
[[nodiscard]] bool equivalent(const BasicValue<MemoryPolicy>& a,
                              const BasicValue<MemoryPolicy>& b,
                              const Equivalence& eq = {})
{
    return detail::values_equivalent(a, b, eq);
}

/// Strict semantic equality: kinds match, numbers bit-identical, strings
/// exact, arrays pairwise, objects independent of key order
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return detail::values_equivalent(a, b, Equivalence{});
}

// ============================================================
// Utility functions
// ============================================================

/// Writes the compact JSON form (used by test frameworks for messages)
SEMDIFF_API std::ostream& operator<<(std::ostream& os, const Value& val);

// ============================================================
// Extern Template Declarations
//
// The default instantiation lives in value.cpp.
// ============================================================

extern template struct BasicValue<value_memory_policy>;
extern template class BasicValueObject<value_memory_policy>;

} // namespace semdiff
