// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the treepath library.
///
/// Usage:
/// - When building treepath as a SHARED library:
///   - CMake defines TREEPATH_EXPORTS (private) and TREEPATH_SHARED (public)
///   - Functions/classes marked with TREEPATH_API are exported
///
/// - When using treepath as a SHARED library:
///   - Link against the treepath target (CMake propagates TREEPATH_SHARED)
///   - Functions/classes marked with TREEPATH_API are imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, TREEPATH_API expands to nothing

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef TREEPATH_SHARED
        #ifdef TREEPATH_EXPORTS
            #define TREEPATH_API __declspec(dllexport)
        #else
            #define TREEPATH_API __declspec(dllimport)
        #endif
    #else
        #define TREEPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(TREEPATH_SHARED) && defined(TREEPATH_EXPORTS)
        #define TREEPATH_API __attribute__((visibility("default")))
    #else
        #define TREEPATH_API
    #endif
#else
    #define TREEPATH_API
#endif
