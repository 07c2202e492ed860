// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file semdiff_config.h
/// @brief Centralized configuration for semdiff and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by semdiff:
///   - immer: persistent containers backing the Value tree
///   - boost: command line parsing in the semdiff tool
///
/// It MUST be included before any library headers to ensure consistent settings.
///
/// Unlike a single-threaded editor state, semdiff trees are meant to be diffed
/// from several threads at once (one file pair per thread, trees may share
/// structure), so immer keeps its thread-safe reference counting.
///
/// @warning Do NOT include immer headers directly without including this file first.
///          All semdiff public headers already include this file.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(SEMDIFF_CONFIGURED)
#error "immer headers were included before semdiff/semdiff_config.h. " \
       "Please include semdiff headers before any direct immer includes."
#endif

#define SEMDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting
///
/// Value trees are immutable and may be compared concurrently, so the
/// default (thread-safe) memory policy must stay in effect.
#ifdef IMMER_NO_THREAD_SAFETY
#error "semdiff requires immer thread safety (IMMER_NO_THREAD_SAFETY must not be set)"
#endif

/// @brief Disable tagged node assertions
///
/// When enabled (=1), immer stores type tags in nodes for runtime
/// assertion checks. Disabling this reduces node memory size.
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for all libraries (MSVC)
///
/// program_options is linked explicitly by CMake.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When SEMDIFF_VERBOSE_LOG is 1:
//   - Value::at() misses, duplicate document keys and reader
//     fallbacks are logged to stderr
//
// Enabled by default in debug builds only.
// ============================================================

#ifndef SEMDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define SEMDIFF_VERBOSE_LOG 0
#  else
#    define SEMDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Tree Construction Limits
// ============================================================

/// @brief Default nesting limit used by build_tree()
///
/// Resolving a document deeper than this is reported as a
/// CyclicReferenceError. Overridable per call via TreeBuildOptions.
#ifndef SEMDIFF_DEFAULT_MAX_DEPTH
#define SEMDIFF_DEFAULT_MAX_DEPTH 1000
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef SEMDIFF_CONFIG_VERBOSE
#if SEMDIFF_VERBOSE_LOG
#pragma message("semdiff: verbose logging ENABLED")
#else
#pragma message("semdiff: verbose logging DISABLED")
#endif

#if IMMER_TAGGED_NODE
#pragma message("semdiff: immer tagged nodes ENABLED (debug mode)")
#else
#pragma message("semdiff: immer tagged nodes DISABLED (optimized)")
#endif
#endif // SEMDIFF_CONFIG_VERBOSE
