// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare.h
/// @brief Total order over all values.
///
/// Ordering by family, lowest first:
///
/// | Rank | Family   | Members                | Within the family                     |
/// |------|----------|------------------------|---------------------------------------|
/// | 0    | Null     | Null                   | all equal                             |
/// | 1    | Numeric  | Bool, Integer, Double  | as doubles; NaN lowest, -0.0 == 0.0   |
/// | 2    | Duration | Duration               | by nanoseconds                        |
/// | 3    | Bytes    | Text, Blob             | unsigned lexicographic bytes          |
/// | 4    | Array    | Array                  | element-wise, shorter prefix first    |
/// | 5    | Document | Document               | merged walk over name-sorted fields   |
///
/// Numeric values are compared after conversion to double, so two Integers
/// that differ only beyond 2^53 compare equal. The order stays total and
/// consistent; only its resolution is limited.
///
/// Documents: both sides' fields are stably sorted by name and walked
/// together. At the first differing name, the document whose name sorts
/// lower is the greater one (the other side lacks that field). With equal
/// names the values decide. A document with fields left over is greater.

#pragma once

#include "value.h"

namespace docmodel {

/// -1, 0 or 1.
[[nodiscard]] DOCMODEL_API int compare(const Value& a, const Value& b);

[[nodiscard]] inline bool is_equal(const Value& a, const Value& b) { return compare(a, b) == 0; }
[[nodiscard]] inline bool is_not_equal(const Value& a, const Value& b) { return compare(a, b) != 0; }
[[nodiscard]] inline bool is_greater_than(const Value& a, const Value& b) { return compare(a, b) > 0; }
[[nodiscard]] inline bool is_greater_than_or_equal(const Value& a, const Value& b) { return compare(a, b) >= 0; }
[[nodiscard]] inline bool is_lesser_than(const Value& a, const Value& b) { return compare(a, b) < 0; }
[[nodiscard]] inline bool is_lesser_than_or_equal(const Value& a, const Value& b) { return compare(a, b) <= 0; }

/// Same type at every level and comparator-equal: Integer(1) and Double(1.0)
/// are equal but not identical. Document field order is not significant.
[[nodiscard]] DOCMODEL_API bool is_identical(const Value& a, const Value& b);

/// Strict weak ordering for ordered containers and std::sort.
struct ValueLess {
    [[nodiscard]] bool operator()(const Value& a, const Value& b) const { return compare(a, b) < 0; }
};

/// Stable ascending sort of the elements of @p a, returned as a new array.
[[nodiscard]] DOCMODEL_API Value sort_array(const Array& a);

/// True when some element of @p a compares equal to @p v.
[[nodiscard]] DOCMODEL_API bool array_contains(const Array& a, const Value& v);

} // namespace docmodel
