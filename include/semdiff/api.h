// api.h - DLL export/import macros for semdiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the semdiff library.
///
/// Usage:
/// - When building semdiff as a SHARED library:
///   - CMake automatically defines SEMDIFF_EXPORTS (private) and SEMDIFF_SHARED (public)
///   - Functions/classes marked with SEMDIFF_API will be exported
///
/// - When using semdiff as a SHARED library:
///   - Link against the semdiff target (CMake propagates SEMDIFF_SHARED)
///   - Functions/classes marked with SEMDIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, SEMDIFF_API expands to nothing
///
/// Example:
/// @code
/// class SEMDIFF_API ChangeSet { ... };
/// SEMDIFF_API ChangeSet compute_diff(...);
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef SEMDIFF_SHARED
        #ifdef SEMDIFF_EXPORTS
            #define SEMDIFF_API __declspec(dllexport)
        #else
            #define SEMDIFF_API __declspec(dllimport)
        #endif
    #else
        #define SEMDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(SEMDIFF_SHARED) && defined(SEMDIFF_EXPORTS)
        #define SEMDIFF_API __attribute__((visibility("default")))
    #else
        #define SEMDIFF_API
    #endif
#else
    #define SEMDIFF_API
#endif

