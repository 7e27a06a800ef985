// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform export/import macros for the docmodel library.
///
/// - Building docmodel as a SHARED library: CMake defines DOCMODEL_EXPORTS
///   (private) and DOCMODEL_SHARED (public), symbols marked DOCMODEL_API are exported.
/// - Using docmodel as a SHARED library: DOCMODEL_SHARED is propagated, symbols are imported.
/// - STATIC library: DOCMODEL_API expands to nothing.
///
/// @code
/// class DOCMODEL_API FieldBuffer { ... };
/// DOCMODEL_API int compare(const Value& a, const Value& b);
/// @endcode

#pragma once

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DOCMODEL_SHARED
        #ifdef DOCMODEL_EXPORTS
            #define DOCMODEL_API __declspec(dllexport)
        #else
            #define DOCMODEL_API __declspec(dllimport)
        #endif
    #else
        #define DOCMODEL_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DOCMODEL_SHARED) && defined(DOCMODEL_EXPORTS)
        #define DOCMODEL_API __attribute__((visibility("default")))
    #else
        #define DOCMODEL_API
    #endif
#else
    #define DOCMODEL_API
#endif
