// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value types
///
/// Lets headers declare functions taking or returning a Value without
/// pulling in immer through value.h.
///
/// Usage:
/// @code
///   // In header file:
///   #include <semdiff/value_fwd.h>
///   Value build_tree(const Document& doc);   // declaration only
///
///   // In implementation file:
///   #include <semdiff/value.h>
/// @endcode

#pragma once

#include <semdiff/semdiff_config.h>

#include <immer/memory_policy.hpp>

namespace semdiff {

// ============================================================
// Value Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
class BasicValueObject;

/// Default memory policy: atomic refcount, safe to share across threads
using value_memory_policy = immer::default_memory_policy;

using Value       = BasicValue<value_memory_policy>;
using ValueObject = BasicValueObject<value_memory_policy>;

} // namespace semdiff
