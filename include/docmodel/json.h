// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json.h
/// @brief JSON text conversion and lazy JSON-backed documents.
///
/// Writing:
/// - Integer as a JSON integer, Double with at least one fractional digit
///   ("1.0"), non-finite doubles as null
/// - Duration as a string in "1h2m3s" form, Blob as a base64 string
/// - document fields in iteration order
///
/// Reading:
/// - integer tokens become Integer (Double when they overflow int64)
/// - tokens with a fraction or exponent become Double
/// - objects become FieldBuffer (duplicate names kept, first one wins),
///   arrays become ValueBuffer
///
/// Usage:
/// @code
///   std::string json = to_json(doc);          // pretty-printed
///   std::string line = to_json(doc, true);    // compact
///   Value parsed = from_json(line);
///   DocumentPtr lazy = document_from_json(std::move(line));
/// @endcode

#pragma once

#include "value.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmodel {

[[nodiscard]] DOCMODEL_API std::string to_json(const Value& val, bool compact = false);
[[nodiscard]] DOCMODEL_API std::string to_json(const Document& doc, bool compact = false);

/// @throws ParseError with the failing position
[[nodiscard]] DOCMODEL_API Value from_json(std::string_view json);

/// Validate @p json and return a document view that parses field values on access.
/// @throws ParseError on invalid JSON, TypeMismatchError when it is not an object
[[nodiscard]] DOCMODEL_API DocumentPtr document_from_json(std::string json);

/// @throws ParseError on invalid JSON, TypeMismatchError when it is not an array
[[nodiscard]] DOCMODEL_API ArrayPtr array_from_json(std::string json);

// ============================================================
// Lazy views
//
// Both index the positions of their direct children when constructed;
// child values are parsed on every access, nested objects and arrays
// become views over the same text.
// ============================================================

class DOCMODEL_API JsonDocument final : public Document {
public:
    /// @p offset points at the opening '{' of a validated object.
    JsonDocument(std::shared_ptr<const std::string> text, std::size_t offset);

    void iterate(const FieldCallback& fn) const override;
    [[nodiscard]] Value get_by_field(std::string_view field) const override;

private:
    std::shared_ptr<const std::string> text_;
    std::vector<std::pair<std::string, std::size_t>> fields_; // (name, value offset)
};

class DOCMODEL_API JsonArray final : public Array {
public:
    /// @p offset points at the opening '[' of a validated array.
    JsonArray(std::shared_ptr<const std::string> text, std::size_t offset);

    void iterate(const ElementCallback& fn) const override;
    [[nodiscard]] Value get_by_index(std::size_t index) const override;
    [[nodiscard]] std::size_t size() const override { return elements_.size(); }

private:
    std::shared_ptr<const std::string> text_;
    std::vector<std::size_t> elements_;
};

} // namespace docmodel
