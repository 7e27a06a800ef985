// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file arithmetic.h
/// @brief Binary arithmetic and bitwise operators over values.
///
/// Operands are resolved in this order:
/// 1. either operand Null: result Null
/// 2. either operand Text or Blob: result Null
/// 3. Duration with Duration (add/sub only): Duration, OverflowError on overflow
/// 4. any other Duration, Array or Document operand: TypeMismatchError
/// 5. Bool becomes Integer 0/1
/// 6. Integer with Integer: Integer; a result that overflows int64 becomes Double
/// 7. otherwise both are converted to Double
///
/// Division and modulo by zero yield Null. Integer division truncates.
/// Bitwise operators truncate doubles to int64 and always return Integer.

#pragma once

#include "value.h"

namespace docmodel {

[[nodiscard]] DOCMODEL_API Value add(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value sub(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value mul(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value div(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value mod(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value bitwise_and(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value bitwise_or(const Value& a, const Value& b);
[[nodiscard]] DOCMODEL_API Value bitwise_xor(const Value& a, const Value& b);

} // namespace docmodel
