// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Compile-time configuration for docmodel and immer.
///
/// Every public docmodel header includes this file before any immer header,
/// so the immer settings below are seen consistently by all translation units.
///
/// Values, documents and arrays are immutable once built and may be read from
/// several threads at once, so immer keeps its atomic reference counting.
///
/// @warning Do NOT include immer headers before this file.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

// immer/config.hpp uses #pragma once and has no include guard macro, so
// detect it by macros it always defines.
#if (defined(IMMER_NODISCARD) || defined(IMMER_TRY)) && !defined(DOCMODEL_CONFIGURED)
#error "immer headers were included before docmodel/config.h. " \
       "Please include docmodel headers before any direct immer includes."
#endif

#define DOCMODEL_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no runtime tag checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

/// @brief Out-of-range flex_vector access throws std::out_of_range instead of asserting.
///
/// docmodel checks bounds itself before indexing, this only affects misuse of
/// the raw containers.
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 1
#endif

// ============================================================
// Verbose Logging
//
// When DOCMODEL_VERBOSE_LOG is 1, failed lookups, decode errors and JSON
// parse errors are reported on stderr together with the calling location.
//
// Enabled in debug builds, disabled when NDEBUG is defined.
// To override: #define DOCMODEL_VERBOSE_LOG 0 (or 1) before any docmodel header.
// ============================================================

#ifndef DOCMODEL_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DOCMODEL_VERBOSE_LOG 0
#  else
#    define DOCMODEL_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DOCMODEL_CONFIG_VERBOSE
#pragma message("docmodel: immer thread safety ENABLED")
#if IMMER_TAGGED_NODE
#pragma message("docmodel: tagged nodes ENABLED (debug mode)")
#else
#pragma message("docmodel: tagged nodes DISABLED")
#endif
#if DOCMODEL_VERBOSE_LOG
#pragma message("docmodel: verbose logging ENABLED")
#else
#pragma message("docmodel: verbose logging DISABLED")
#endif
#endif // DOCMODEL_CONFIG_VERBOSE
