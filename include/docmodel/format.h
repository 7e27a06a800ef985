// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file format.h
/// @brief Text renderings shared by casts, JSON and to_string().
///
/// - Doubles: shortest round-trip form, integral values keep a trailing ".0"
/// - Durations: Go-style "1h2m3.5s" format and parser
/// - Base64: standard alphabet with padding (Blob <-> Text)
/// - UTF-8 validation

#pragma once

#include "value.h"

#include <span>
#include <string>
#include <string_view>

namespace docmodel {

/// "1.0", "-0.5", "1e+21", "NaN", "+Inf", "-Inf"
[[nodiscard]] DOCMODEL_API std::string format_double(double d);

/// "0s", "1.5s", "2m3s", "1h0m0s", "-250ms", "42ns"
[[nodiscard]] DOCMODEL_API std::string format_duration(Duration d);

/// Parses a sequence of decimal numbers with units (ns, us, µs, ms, s, m, h),
/// optionally signed: "1h2m", "-1.5s", "300ms". "0" is accepted alone.
/// @throws ParseError on malformed input, OverflowError when out of range
[[nodiscard]] DOCMODEL_API Duration parse_duration(std::string_view text);

[[nodiscard]] DOCMODEL_API std::string base64_encode(std::span<const std::uint8_t> bytes);

/// @throws ParseError on characters outside the alphabet or bad padding
[[nodiscard]] DOCMODEL_API Blob base64_decode(std::string_view text);

[[nodiscard]] DOCMODEL_API bool is_valid_utf8(std::string_view text) noexcept;

} // namespace docmodel
