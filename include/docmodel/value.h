// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief The closed Value type and the Document / Array capability interfaces.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool, Integer (int64), Double, Duration (signed nanoseconds)
/// - Text (UTF-8 std::string), Blob (raw bytes)
/// - Array / Document (shared, read-only references to a capability object)
///
/// Values are immutable. Casting, arithmetic and path mutation always
/// produce new values; composite children are shared, never copied, unless
/// a buffer is explicitly asked to copy them.
///
/// Documents and arrays are abstract: the same Value can be backed by an
/// owning buffer (FieldBuffer / ValueBuffer), a lazy view over encoded bytes
/// or JSON text, or an adapter over a host container. Every algorithm in the
/// library (comparison, paths, codecs, diff) works through the interfaces
/// declared here.

#pragma once

#include "api.h"
#include "config.h"
#include "errors.h"

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docmodel {

// ============================================================
// ValueType
//
// The numeric codes double as the type tags of the streaming codec.
// ============================================================

enum class ValueType : std::uint8_t {
    Null     = 0x80,
    Bool     = 0x81,
    Integer  = 0x90,
    Double   = 0xA0,
    Duration = 0xB0,
    Text     = 0xC0,
    Blob     = 0xD0,
    Array    = 0xE0,
    Document = 0xF0,
};

/// "null", "bool", "integer", "double", "duration", "text", "blob", "array", "document"
[[nodiscard]] DOCMODEL_API std::string_view type_name(ValueType type) noexcept;

/// True for Bool, Integer and Double (the numeric comparison family)
[[nodiscard]] constexpr bool is_number(ValueType type) noexcept
{
    return type == ValueType::Bool || type == ValueType::Integer || type == ValueType::Double;
}

/// Deepest array/document nesting the decoders (streaming, key, JSON) accept.
/// Deeper input is rejected with MalformedEncodingError or ParseError.
inline constexpr std::size_t kMaxNestingDepth = 512;

using Blob = std::vector<std::uint8_t>;
using ByteBuffer = std::vector<std::uint8_t>;
using Duration = std::chrono::nanoseconds;

class Value;
class Document;
class Array;

using DocumentPtr = std::shared_ptr<const Document>;
using ArrayPtr = std::shared_ptr<const Array>;

// ============================================================
// Document / Array capabilities
// ============================================================

/// Read-only view of an ordered collection of (field, value) pairs.
///
/// Field order is stable for a given instance. Names are not required to be
/// unique; get_by_field returns the first match.
/// Callbacks signal failure by throwing, which stops the iteration and
/// propagates out of iterate() unchanged.
class DOCMODEL_API Document {
public:
    using FieldCallback = std::function<void(const std::string& field, const Value& value)>;

    virtual ~Document() = default;

    virtual void iterate(const FieldCallback& fn) const = 0;

    /// @throws FieldNotFoundError when no field has this name
    [[nodiscard]] virtual Value get_by_field(std::string_view field) const = 0;
};

/// Read-only view of an ordered sequence of values.
class DOCMODEL_API Array {
public:
    using ElementCallback = std::function<void(std::size_t index, const Value& value)>;

    virtual ~Array() = default;

    virtual void iterate(const ElementCallback& fn) const = 0;

    /// @throws IndexOutOfRangeError when index >= size()
    [[nodiscard]] virtual Value get_by_index(std::size_t index) const = 0;

    [[nodiscard]] virtual std::size_t size() const = 0;
};

namespace detail {

template <std::integral T>
[[nodiscard]] std::int64_t checked_int64(T v)
{
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
        if (v > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
            throw OverflowError("unsigned integer " + std::to_string(v) + " does not fit in int64");
        }
    }
    return static_cast<std::int64_t>(v);
}

} // namespace detail

// ============================================================
// Value
// ============================================================

class DOCMODEL_API Value {
public:
    using variant_type = std::variant<std::monostate,
                                      bool,
                                      std::int64_t,
                                      double,
                                      Duration,
                                      std::string,
                                      Blob,
                                      ArrayPtr,
                                      DocumentPtr>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) noexcept : data_(b) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) : data_(detail::checked_int64(v))
    {}

    template <std::floating_point T>
    Value(T v) noexcept : data_(static_cast<double>(v))
    {}

    template <class Rep, class Period>
    Value(std::chrono::duration<Rep, Period> d)
        : data_(std::chrono::duration_cast<Duration>(d))
    {}

    Value(std::string s) noexcept : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Blob b) noexcept : data_(std::move(b)) {}

    /// A null pointer produces a Null value.
    Value(ArrayPtr a) noexcept;
    Value(DocumentPtr d) noexcept;

    template <std::derived_from<Array> T>
    Value(std::shared_ptr<T> a) noexcept : Value(ArrayPtr(std::move(a)))
    {}

    template <std::derived_from<Document> T>
    Value(std::shared_ptr<T> d) noexcept : Value(DocumentPtr(std::move(d)))
    {}

    /// Array backed by a ValueBuffer holding @p items.
    [[nodiscard]] static Value array(std::initializer_list<Value> items);
    [[nodiscard]] static Value array(std::vector<Value> items);

    /// Document backed by a FieldBuffer holding @p fields in the given order.
    [[nodiscard]] static Value document(std::initializer_list<std::pair<std::string, Value>> fields);

    [[nodiscard]] ValueType type() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data_); }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data_); }

    // Typed accessors; each throws TypeMismatchError on a different type.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] Duration as_duration() const;
    [[nodiscard]] const std::string& as_text() const;
    [[nodiscard]] const Blob& as_blob() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] const Document& as_document() const;
    [[nodiscard]] const ArrayPtr& array_ptr() const;
    [[nodiscard]] const DocumentPtr& document_ptr() const;

    [[nodiscard]] const variant_type& data() const noexcept { return data_; }

    /// Comparator equality (see compare.h): Integer(1) == Double(1.0).
    friend DOCMODEL_API bool operator==(const Value& a, const Value& b);

private:
    [[noreturn]] void throw_type_mismatch(ValueType expected) const;

    variant_type data_;
};

// ============================================================
// Value helpers
// ============================================================

/// True when @p v holds the zero of its type: false, 0, 0.0, "", empty blob,
/// zero duration, empty array or document. Null is not a zero value.
[[nodiscard]] DOCMODEL_API bool is_zero_value(const Value& v);

/// True when @p v is neither Null nor the zero of its type.
[[nodiscard]] DOCMODEL_API bool is_truthy(const Value& v);

/// Human readable rendering: NULL, "quoted text", JSON for composites,
/// '\x..' hex for blobs, Go-style durations.
[[nodiscard]] DOCMODEL_API std::string to_string(const Value& v);

DOCMODEL_API std::ostream& operator<<(std::ostream& os, const Value& v);
DOCMODEL_API std::ostream& operator<<(std::ostream& os, ValueType type);

} // namespace docmodel
