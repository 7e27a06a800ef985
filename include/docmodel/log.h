// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging helpers, active when DOCMODEL_VERBOSE_LOG is 1.
///
/// Logging never changes behaviour: every failure reported here is also
/// raised as an exception by the caller.

#pragma once

#include "config.h"

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace docmodel::detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCMODEL_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCMODEL_VERBOSE_LOG
    std::cerr << "[" << func << "] field '" << key << "' " << reason
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
#if DOCMODEL_VERBOSE_LOG
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

/// Decoder failures, reported with the byte offset where decoding stopped.
inline void log_decode_error(
    std::string_view func,
    std::size_t offset,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCMODEL_VERBOSE_LOG
    std::cerr << "[" << func << "] " << reason << " at byte " << offset
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)offset;
    (void)reason;
    (void)loc;
#endif
}

} // namespace docmodel::detail
