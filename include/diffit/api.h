// api.h - DLL export/import macros for diffit

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the diffit library.
///
/// Usage:
/// - When building diffit as a SHARED library:
///   - CMake defines DIFFIT_EXPORTS (private) and DIFFIT_SHARED (public)
///   - Functions/classes marked with DIFFIT_API will be exported
///
/// - When using diffit as a SHARED library:
///   - Link against the diffit target (CMake propagates DIFFIT_SHARED)
///   - Functions/classes marked with DIFFIT_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, DIFFIT_API expands to nothing
///
/// Example:
/// @code
/// class DIFFIT_API Patch { ... };                 // Export entire class
/// DIFFIT_API DiffResult diff(...);                // Export free function
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DIFFIT_SHARED
        #ifdef DIFFIT_EXPORTS
            #define DIFFIT_API __declspec(dllexport)
        #else
            #define DIFFIT_API __declspec(dllimport)
        #endif
    #else
        #define DIFFIT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DIFFIT_SHARED) && defined(DIFFIT_EXPORTS)
        #define DIFFIT_API __attribute__((visibility("default")))
    #else
        #define DIFFIT_API
    #endif
#else
    #define DIFFIT_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define DIFFIT_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define DIFFIT_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define DIFFIT_DEPRECATED(msg)
#endif
