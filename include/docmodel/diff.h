// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// diff.h - Structural diff between two documents

#pragma once

#include <docmodel/api.h>
#include <docmodel/path.h>
#include <docmodel/value.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace docmodel {

struct DOCMODEL_API Op {
    enum class Kind { Set, Delete };

    Kind kind = Kind::Set;
    Path path;   // Location of the change, relative to the document root
    Value value; // New value for Set, removed value for Delete

    friend DOCMODEL_API bool operator==(const Op& a, const Op& b);
};

/// Compute the operations turning @p from into @p to.
///
/// Field names of both documents are merged in ascending order:
/// - only in @p from: Delete(old value)
/// - only in @p to: Set(new value)
/// - both documents, or both arrays: recurse
/// - different types or unequal values: Set(new value)
///
/// A name repeated on either side is left alone when both sides hold the same
/// identical occurrences. Otherwise the document containing it is replaced by
/// a single Set of the whole new document, since a path only reaches the
/// first occurrence of a name.
///
/// Arrays are walked by index. New trailing elements are Set at their index;
/// removed trailing elements are Deleted at index `to.size()`, once per removed
/// element, so that applying the operations in order is always valid.
///
/// @code
///   diff(*from_json(R"({"a":{"b":[1,2,3]}})").document_ptr(),
///        *from_json(R"({"a":{"b":[1,2,4]}})").document_ptr());
///   // [Set a.b[2] 4]
/// @endcode
[[nodiscard]] DOCMODEL_API std::vector<Op> diff(const Document& from, const Document& to);

/// Apply @p ops in order to @p doc and return the result. @p doc is not modified.
/// @throws the errors of set_at_path / erase_at_path when an operation does not fit
[[nodiscard]] DOCMODEL_API Value apply_ops(const std::vector<Op>& ops, const Value& doc);

/// "set a.b[2] 4", "delete a.c \"old\""
[[nodiscard]] DOCMODEL_API std::string to_string(const Op& op);

DOCMODEL_API std::ostream& operator<<(std::ostream& os, const Op& op);

} // namespace docmodel
