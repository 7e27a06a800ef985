// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path type and the path traversal engine for Value trees.
///
/// A Path is an immutable sequence of fragments, each either a field name
/// (descends into a Document) or an array index (descends into an Array).
/// Extending a path returns a new Path; fragments are held in an
/// immer::flex_vector so sibling paths share their common prefix.
///
/// ## Printing
///
/// Field fragments are joined with '.', index fragments are written as
/// "[n]" without a separator: `a.b[2].c`. parse_path() reads the same form.
///
/// ## Traversal
///
/// ```cpp
/// auto root = from_json(R"({"a": {"b": [1, 2, 3]}})");
///
/// get_at_path(root, parse_path("a.b[2]"));             // 3
/// auto next = set_at_path(root, parse_path("a.b[3]"), 4);   // appends
/// auto trimmed = erase_at_path(next, parse_path("a.b[0]"));
/// ```
///
/// set_at_path / erase_at_path never touch the input: every structural node
/// on the path is rebuilt as a FieldBuffer / ValueBuffer, every node off the
/// path is shared with the original tree.

#pragma once

#include "config.h"
#include "value.h"

#include <immer/flex_vector.hpp>

#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

namespace docmodel {

/// Field name or array index
using PathFragment = std::variant<std::string, std::size_t>;

class DOCMODEL_API Path {
public:
    using container_type = immer::flex_vector<PathFragment>;
    using const_iterator = container_type::const_iterator;

    Path() = default;
    explicit Path(container_type fragments) : fragments_(std::move(fragments)) {}
    Path(std::initializer_list<PathFragment> fragments) : fragments_(fragments) {}

    [[nodiscard]] Path extend_field(std::string field) const;
    [[nodiscard]] Path extend_index(std::size_t index) const;
    [[nodiscard]] Path extend(const Path& suffix) const;

    /// Path without its last fragment (empty path for an empty path).
    [[nodiscard]] Path parent() const;

    [[nodiscard]] const PathFragment& back() const;
    [[nodiscard]] const PathFragment& operator[](std::size_t i) const { return fragments_[i]; }

    [[nodiscard]] std::size_t size() const noexcept { return fragments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fragments_.empty(); }

    [[nodiscard]] const_iterator begin() const { return fragments_.begin(); }
    [[nodiscard]] const_iterator end() const { return fragments_.end(); }

    [[nodiscard]] const container_type& fragments() const noexcept { return fragments_; }

    /// "a.b[2].c"
    [[nodiscard]] std::string to_string() const;

    friend DOCMODEL_API bool operator==(const Path& a, const Path& b);

private:
    container_type fragments_;
};

DOCMODEL_API std::ostream& operator<<(std::ostream& os, const Path& path);

/// Parses "a.b[2].c". Field names are any characters except '.', '[' and ']'.
/// @throws ParseError on empty field names, unterminated or non-numeric indices
[[nodiscard]] DOCMODEL_API Path parse_path(std::string_view text);

// ============================================================
// Traversal engine
// ============================================================

/// Resolve @p path starting at @p root. An empty path returns @p root.
/// @throws FieldNotFoundError for a missing field or a fragment applied to a
///         value of the wrong kind (field on a non-document, index on a non-array)
/// @throws IndexOutOfRangeError for an index past the end of an array
[[nodiscard]] DOCMODEL_API Value get_at_path(const Value& root, const Path& path);

/// Same as the Value overload; an empty path throws FieldNotFoundError
/// because a document is not a field of itself.
[[nodiscard]] DOCMODEL_API Value get_at_path(const Document& root, const Path& path);
[[nodiscard]] DOCMODEL_API Value get_at_path(const Array& root, const Path& path);

/// Non-throwing probe: false where get_at_path would throw a NotFoundError.
[[nodiscard]] DOCMODEL_API bool has_path(const Value& root, const Path& path);

/// Return a new root with the value at @p path replaced by @p value.
///
/// - a missing final field is appended to its document
/// - a final index equal to the array length appends; larger indices throw
/// - intermediate nodes must exist; nothing is created on the way
/// - an empty path returns @p value
[[nodiscard]] DOCMODEL_API Value set_at_path(const Value& root, const Path& path, Value value);

/// Return a new root with the field or element at @p path removed.
/// @throws FieldNotFoundError / IndexOutOfRangeError when the target is missing,
///         FieldNotFoundError for an empty path
[[nodiscard]] DOCMODEL_API Value erase_at_path(const Value& root, const Path& path);

} // namespace docmodel
