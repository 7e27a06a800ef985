// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file cast.h
/// @brief Explicit conversions between value types.
///
/// Every cast leaves Null as Null and a value of the target type unchanged.
///
/// | From \ To | Bool      | Integer           | Double | Duration | Text    | Blob   | Array | Document |
/// |-----------|-----------|-------------------|--------|----------|---------|--------|-------|----------|
/// | Bool      | =         | 0/1               |        |          | JSON    |        |       |          |
/// | Integer   | != 0      | =                 | exact  | ns       | JSON    |        |       |          |
/// | Double    |           | checked           | =      |          | JSON    |        |       |          |
/// | Duration  |           | ns                |        | =        | "1h2m"  |        |       |          |
/// | Text      | parse     | parse + checked   | parse  | parse    | =       | base64 | JSON  | JSON     |
/// | Blob      |           |                   |        |          | base64  | =      |       |          |
/// | Array     |           |                   |        |          | JSON    |        | =     |          |
/// | Document  |           |                   |        |          | JSON    |        |       | =        |
///
/// Empty cells throw TypeMismatchError. "checked" means PrecisionLossError
/// for a fractional part (or NaN) and OverflowError outside the int64 range.
/// Text parse failures throw ParseError.

#pragma once

#include "value.h"

namespace docmodel {

[[nodiscard]] DOCMODEL_API Value cast_as(const Value& v, ValueType target);

[[nodiscard]] DOCMODEL_API Value cast_as_bool(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_integer(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_double(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_duration(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_text(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_blob(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_array(const Value& v);
[[nodiscard]] DOCMODEL_API Value cast_as_document(const Value& v);

/// Accepts 1 t T TRUE true True 0 f F FALSE false False.
/// @throws ParseError
[[nodiscard]] DOCMODEL_API bool parse_bool(std::string_view text);

} // namespace docmodel
