// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document.h
/// @brief Owning document and array buffers, plus document views and helpers.
///
/// FieldBuffer and ValueBuffer are the mutable, owning implementations of
/// Document and Array. Their storage is an immer::flex_vector, so copying a
/// buffer (or scanning one buffer into another) is O(1) and the copies share
/// structure until one of them is modified.
///
/// A buffer is mutated in place; once it has been wrapped in a Value and
/// shared it must be treated as read-only (or protected externally).
///
/// @code
/// auto doc = std::make_shared<FieldBuffer>();
/// doc->add("name", "alice").add("age", 30);
/// doc->set(parse_path("tags[0]"), "x");       // throws: no "tags" field
/// Value v = doc;                               // share as a Document value
/// @endcode

#pragma once

#include "config.h"
#include "path.h"
#include "value.h"

#include <immer/flex_vector.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmodel {

struct Field {
    std::string name;
    Value value;
};

/// Transformation applied to every scalar leaf by FieldBuffer::apply / ValueBuffer::apply.
using LeafTransform = std::function<Value(const Path& path, const Value& leaf)>;

// ============================================================
// FieldBuffer
// ============================================================

class DOCMODEL_API FieldBuffer final : public Document {
public:
    using fields_type = immer::flex_vector<Field>;

    FieldBuffer() = default;
    explicit FieldBuffer(fields_type fields) : fields_(std::move(fields)) {}

    void iterate(const FieldCallback& fn) const override;
    [[nodiscard]] Value get_by_field(std::string_view field) const override;

    /// Append a field. Duplicate names are kept; the first one wins on lookup.
    FieldBuffer& add(std::string field, Value value);

    /// Replace the first field named @p field, or append it when absent.
    void set(std::string_view field, Value value);

    /// Set the value at @p path, relative to this document (see set_at_path).
    void set(const Path& path, Value value);

    /// @throws FieldNotFoundError
    void replace(std::string_view field, Value value);

    /// Remove the first field named @p field, preserving the order of the others.
    /// @throws FieldNotFoundError
    void remove(std::string_view field);

    /// Remove the field or element at @p path (see erase_at_path).
    void remove(const Path& path);

    /// Replace the contents with a deep copy of @p source: nested documents
    /// and arrays become FieldBuffers and ValueBuffers owned by this buffer.
    void copy(const Document& source);

    /// Replace the contents with the top-level fields of @p source.
    /// Nested composites are shared with the source.
    void scan(const Document& source);

    /// Replace every scalar leaf with fn(path, leaf). Nested documents and
    /// arrays are converted to buffers along the way.
    void apply(const LeafTransform& fn);

    void reset() noexcept { fields_ = {}; }

    [[nodiscard]] bool has_field(std::string_view field) const;
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] const fields_type& fields() const noexcept { return fields_; }

private:
    [[nodiscard]] std::size_t find(std::string_view field) const noexcept;

    fields_type fields_;
};

// ============================================================
// ValueBuffer
// ============================================================

class DOCMODEL_API ValueBuffer final : public Array {
public:
    using values_type = immer::flex_vector<Value>;

    ValueBuffer() = default;
    explicit ValueBuffer(values_type values) : values_(std::move(values)) {}

    void iterate(const ElementCallback& fn) const override;
    [[nodiscard]] Value get_by_index(std::size_t index) const override;
    [[nodiscard]] std::size_t size() const override { return values_.size(); }

    ValueBuffer& append(Value value);

    /// @throws IndexOutOfRangeError
    void replace(std::size_t index, Value value);

    /// Remove the element at @p index, shifting the following ones down.
    /// @throws IndexOutOfRangeError
    void remove(std::size_t index);

    void copy(const Array& source);
    void scan(const Array& source);
    void apply(const LeafTransform& fn);

    void reset() noexcept { values_ = {}; }

    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] const values_type& values() const noexcept { return values_; }

private:
    values_type values_;
};

// ============================================================
// Helpers
// ============================================================

/// Deep copy: documents and arrays are rebuilt as buffers, scalars are copied.
[[nodiscard]] DOCMODEL_API Value clone_value(const Value& v);

/// Field names of @p doc in ascending byte order (duplicates kept).
[[nodiscard]] DOCMODEL_API std::vector<std::string> fields(const Document& doc);

[[nodiscard]] DOCMODEL_API std::size_t field_count(const Document& doc);

[[nodiscard]] inline std::size_t array_length(const Array& a)
{
    return a.size();
}

// ============================================================
// Views
//
// Each view keeps its source alive and reflects it without copying.
// ============================================================

/// Hide the named fields.
[[nodiscard]] DOCMODEL_API DocumentPtr mask_fields(DocumentPtr source, std::vector<std::string> names);

/// Expose only the named fields, in the order given. Names missing from the
/// source are skipped by iterate() and not found by get_by_field().
[[nodiscard]] DOCMODEL_API DocumentPtr only_fields(DocumentPtr source, std::vector<std::string> names);

/// Iterate the source fields in ascending name order (stable for duplicates).
[[nodiscard]] DOCMODEL_API DocumentPtr with_sorted_fields(DocumentPtr source);

} // namespace docmodel
