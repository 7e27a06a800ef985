// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/value.h>

#include <docmodel/format.h>
#include <docmodel/json.h>

#include <ostream>

namespace docmodel {

std::string_view error_kind_name(ErrorKind kind) noexcept
{
    switch (kind) {
    case ErrorKind::FieldNotFound:     return "field not found";
    case ErrorKind::IndexOutOfRange:   return "index out of range";
    case ErrorKind::TypeMismatch:      return "type mismatch";
    case ErrorKind::MalformedEncoding: return "malformed encoding";
    case ErrorKind::PrecisionLoss:     return "precision loss";
    case ErrorKind::Overflow:          return "overflow";
    case ErrorKind::ParseError:        return "parse error";
    }
    return "unknown error";
}

std::string_view type_name(ValueType type) noexcept
{
    switch (type) {
    case ValueType::Null:     return "null";
    case ValueType::Bool:     return "bool";
    case ValueType::Integer:  return "integer";
    case ValueType::Double:   return "double";
    case ValueType::Duration: return "duration";
    case ValueType::Text:     return "text";
    case ValueType::Blob:     return "blob";
    case ValueType::Array:    return "array";
    case ValueType::Document: return "document";
    }
    return "unknown";
}

// ============================================================
// Value
// ============================================================

Value::Value(ArrayPtr a) noexcept
{
    if (a) {
        data_ = std::move(a);
    }
}

Value::Value(DocumentPtr d) noexcept
{
    if (d) {
        data_ = std::move(d);
    }
}

ValueType Value::type() const noexcept
{
    return std::visit([](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return ValueType::Null;
        } else if constexpr (std::is_same_v<T, bool>) {
            return ValueType::Bool;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return ValueType::Integer;
        } else if constexpr (std::is_same_v<T, double>) {
            return ValueType::Double;
        } else if constexpr (std::is_same_v<T, Duration>) {
            return ValueType::Duration;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return ValueType::Text;
        } else if constexpr (std::is_same_v<T, Blob>) {
            return ValueType::Blob;
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
            return ValueType::Array;
        } else {
            return ValueType::Document;
        }
    }, data_);
}

void Value::throw_type_mismatch(ValueType expected) const
{
    throw TypeMismatchError("expected " + std::string(type_name(expected)) + ", got " +
                            std::string(type_name(type())));
}

bool Value::as_bool() const
{
    if (auto* b = std::get_if<bool>(&data_)) return *b;
    throw_type_mismatch(ValueType::Bool);
}

std::int64_t Value::as_integer() const
{
    if (auto* i = std::get_if<std::int64_t>(&data_)) return *i;
    throw_type_mismatch(ValueType::Integer);
}

double Value::as_double() const
{
    if (auto* d = std::get_if<double>(&data_)) return *d;
    throw_type_mismatch(ValueType::Double);
}

Duration Value::as_duration() const
{
    if (auto* d = std::get_if<Duration>(&data_)) return *d;
    throw_type_mismatch(ValueType::Duration);
}

const std::string& Value::as_text() const
{
    if (auto* s = std::get_if<std::string>(&data_)) return *s;
    throw_type_mismatch(ValueType::Text);
}

const Blob& Value::as_blob() const
{
    if (auto* b = std::get_if<Blob>(&data_)) return *b;
    throw_type_mismatch(ValueType::Blob);
}

const ArrayPtr& Value::array_ptr() const
{
    if (auto* a = std::get_if<ArrayPtr>(&data_)) return *a;
    throw_type_mismatch(ValueType::Array);
}

const DocumentPtr& Value::document_ptr() const
{
    if (auto* d = std::get_if<DocumentPtr>(&data_)) return *d;
    throw_type_mismatch(ValueType::Document);
}

const Array& Value::as_array() const
{
    return *array_ptr();
}

const Document& Value::as_document() const
{
    return *document_ptr();
}

// ============================================================
// Helpers
// ============================================================

bool is_zero_value(const Value& v)
{
    return std::visit([](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return false;
        } else if constexpr (std::is_same_v<T, bool>) {
            return !arg;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return arg == 0;
        } else if constexpr (std::is_same_v<T, double>) {
            return arg == 0.0;
        } else if constexpr (std::is_same_v<T, Duration>) {
            return arg.count() == 0;
        } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Blob>) {
            return arg.empty();
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
            return arg->size() == 0;
        } else {
            bool empty = true;
            arg->iterate([&empty](const std::string&, const Value&) { empty = false; });
            return empty;
        }
    }, v.data());
}

bool is_truthy(const Value& v)
{
    return !v.is_null() && !is_zero_value(v);
}

std::string to_string(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
        return "NULL";
    case ValueType::Text:
        return to_json(v, true);
    case ValueType::Duration:
        return format_duration(v.as_duration());
    case ValueType::Double:
        return format_double(v.as_double());
    case ValueType::Blob: {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out = "'\\x";
        for (std::uint8_t byte : v.as_blob()) {
            out += kHex[byte >> 4];
            out += kHex[byte & 0x0F];
        }
        return out + "'";
    }
    default:
        return to_json(v, true);
    }
}

std::ostream& operator<<(std::ostream& os, const Value& v)
{
    return os << to_string(v);
}

std::ostream& operator<<(std::ostream& os, ValueType type)
{
    return os << type_name(type);
}

} // namespace docmodel
