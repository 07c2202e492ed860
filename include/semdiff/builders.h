// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Value containers.
///
/// This file provides transient-based builders used by the readers and by
/// build_tree():
/// - ObjectBuilder: Build an insertion-ordered object
/// - ArrayBuilder: Build an array
///
/// Usage:
/// @code
///   #include <semdiff/builders.h>
///
///   Value config = ObjectBuilder()
///       .set("width", 1920)
///       .set("height", 1080)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = ArrayBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include <semdiff/value.h>

namespace semdiff {

// ============================================================
// Builder classes for O(n) construction using immer's transient API
// ============================================================

/// Builder for insertion-ordered objects - O(n) complexity
///
/// Setting a key twice keeps the first position and the last value.
template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type      = BasicValue<MemoryPolicy>;
    using value_box       = BasicValueBox<MemoryPolicy>;
    using value_object    = BasicValueObject<MemoryPolicy>;
    using entry_type      = typename value_object::entry_type;
    using entries_transient = typename value_object::entry_vector::transient_type;
    using index_transient   = typename value_object::index_map::transient_type;

    BasicObjectBuilder()
        : entries_(typename value_object::entry_vector{}.transient())
        , index_(typename value_object::index_map{}.transient())
    {}

    // Move operations (allowed)
    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    /// Set a key-value pair
    /// @param key The key
    /// @param val The value (any type convertible to BasicValue)
    /// @return Reference to this builder for chaining
    template <typename T>
    BasicObjectBuilder& set(const std::string& key, T&& val) {
        return set_box(key, value_box{value_type{std::forward<T>(val)}});
    }

    /// Set a key with an already constructed BasicValue
    BasicObjectBuilder& set(const std::string& key, value_type val) {
        return set_box(key, value_box{std::move(val)});
    }

    /// Set a key to an existing box (shares the sub-tree)
    BasicObjectBuilder& set_box(const std::string& key, value_box box) {
        if (auto* pos = index_.find(key)) {
            entries_.set(*pos, entry_type{key, std::move(box)});
        } else {
            index_.set(key, entries_.size());
            entries_.push_back(entry_type{key, std::move(box)});
        }
        return *this;
    }

    /// Check if the builder contains a key
    [[nodiscard]] bool contains(const std::string& key) const {
        return index_.count(key) > 0;
    }

    /// Get current size
    [[nodiscard]] std::size_t size() const {
        return entries_.size();
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] value_type finish() {
        return value_type{finish_object()};
    }

    /// Finish and return just the object (not wrapped in Value)
    [[nodiscard]] value_object finish_object() {
        return value_object{entries_.persistent(), index_.persistent()};
    }

private:
    entries_transient entries_;
    index_transient index_;
};

/// Builder for constructing arrays efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_vector   = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicArrayBuilder() : transient_(value_vector{}.transient()) {}

    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;

    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    /// Append a value
    template <typename T>
    BasicArrayBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicArrayBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    /// Append an existing box (shares the sub-tree)
    BasicArrayBuilder& push_back_box(value_box box) {
        transient_.push_back(std::move(box));
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

// ============================================================
// Default Builder Type Aliases
// ============================================================

using ObjectBuilder = BasicObjectBuilder<value_memory_policy>;
using ArrayBuilder  = BasicArrayBuilder<value_memory_policy>;

// ============================================================
// Extern Template Declarations for Builders
// ============================================================

extern template class BasicObjectBuilder<value_memory_policy>;
extern template class BasicArrayBuilder<value_memory_policy>;

} // namespace semdiff
