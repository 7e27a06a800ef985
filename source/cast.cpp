// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/cast.h>

#include <docmodel/format.h>
#include <docmodel/json.h>

#include <charconv>
#include <cmath>

namespace docmodel {

namespace {

[[noreturn]] void throw_unsupported(const Value& v, ValueType target)
{
    throw TypeMismatchError("cannot cast " + std::string(type_name(v.type())) + " as " +
                            std::string(type_name(target)));
}

std::int64_t checked_integer(double d)
{
    if (std::isnan(d) || std::trunc(d) != d) {
        if (std::isinf(d)) {
            throw OverflowError("cannot cast " + format_double(d) + " as integer: out of range");
        }
        throw PrecisionLossError("cannot cast " + format_double(d) + " as integer without loss of precision");
    }
    // [-2^63, 2^63) is exactly representable at both ends
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        throw OverflowError("cannot cast " + format_double(d) + " as integer: out of range");
    }
    return static_cast<std::int64_t>(d);
}

double parse_double(std::string_view text)
{
    std::string_view s = text;
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
    }
    double d = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, d);
    if (first == last || ptr != last) {
        throw ParseError("cannot parse \"" + std::string(text) + "\" as a number");
    }
    if (ec == std::errc::result_out_of_range) {
        throw OverflowError("\"" + std::string(text) + "\" is out of the double range");
    }
    if (ec != std::errc{}) {
        throw ParseError("cannot parse \"" + std::string(text) + "\" as a number");
    }
    return d;
}

} // anonymous namespace

bool parse_bool(std::string_view text)
{
    if (text == "1" || text == "t" || text == "T" || text == "TRUE" || text == "true" || text == "True") {
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "FALSE" || text == "false" || text == "False") {
        return false;
    }
    throw ParseError("cannot parse \"" + std::string(text) + "\" as bool");
}

Value cast_as_bool(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Bool:
        return v;
    case ValueType::Integer:
        return v.as_integer() != 0;
    case ValueType::Text:
        return parse_bool(v.as_text());
    default:
        throw_unsupported(v, ValueType::Bool);
    }
}

Value cast_as_integer(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Integer:
        return v;
    case ValueType::Bool:
        return std::int64_t{v.as_bool() ? 1 : 0};
    case ValueType::Double:
        return checked_integer(v.as_double());
    case ValueType::Duration:
        return static_cast<std::int64_t>(v.as_duration().count());
    case ValueType::Text: {
        const std::string& s = v.as_text();
        std::int64_t i = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), i);
        if (!s.empty() && ec == std::errc{} && ptr == s.data() + s.size()) {
            return i;
        }
        return checked_integer(parse_double(s));
    }
    default:
        throw_unsupported(v, ValueType::Integer);
    }
}

Value cast_as_double(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Double:
        return v;
    case ValueType::Integer:
        return static_cast<double>(v.as_integer());
    case ValueType::Text:
        return parse_double(v.as_text());
    default:
        throw_unsupported(v, ValueType::Double);
    }
}

Value cast_as_duration(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Duration:
        return v;
    case ValueType::Integer:
        return Duration{v.as_integer()};
    case ValueType::Text:
        return parse_duration(v.as_text());
    default:
        throw_unsupported(v, ValueType::Duration);
    }
}

Value cast_as_text(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Text:
        return v;
    case ValueType::Duration:
        return format_duration(v.as_duration());
    case ValueType::Blob:
        return base64_encode(v.as_blob());
    case ValueType::Double:
        return format_double(v.as_double());
    default:
        return to_json(v, true);
    }
}

Value cast_as_blob(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Blob:
        return v;
    case ValueType::Text:
        return base64_decode(v.as_text());
    default:
        throw_unsupported(v, ValueType::Blob);
    }
}

Value cast_as_array(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Array:
        return v;
    case ValueType::Text: {
        Value parsed = from_json(v.as_text());
        if (parsed.type() != ValueType::Array) {
            throw TypeMismatchError("cannot cast text holding a JSON " +
                                    std::string(type_name(parsed.type())) + " as array");
        }
        return parsed;
    }
    default:
        throw_unsupported(v, ValueType::Array);
    }
}

Value cast_as_document(const Value& v)
{
    switch (v.type()) {
    case ValueType::Null:
    case ValueType::Document:
        return v;
    case ValueType::Text: {
        Value parsed = from_json(v.as_text());
        if (parsed.type() != ValueType::Document) {
            throw TypeMismatchError("cannot cast text holding a JSON " +
                                    std::string(type_name(parsed.type())) + " as document");
        }
        return parsed;
    }
    default:
        throw_unsupported(v, ValueType::Document);
    }
}

Value cast_as(const Value& v, ValueType target)
{
    switch (target) {
    case ValueType::Null:
        if (v.is_null()) {
            return v;
        }
        throw_unsupported(v, target);
    case ValueType::Bool:     return cast_as_bool(v);
    case ValueType::Integer:  return cast_as_integer(v);
    case ValueType::Double:   return cast_as_double(v);
    case ValueType::Duration: return cast_as_duration(v);
    case ValueType::Text:     return cast_as_text(v);
    case ValueType::Blob:     return cast_as_blob(v);
    case ValueType::Array:    return cast_as_array(v);
    case ValueType::Document: return cast_as_document(v);
    }
    throw_unsupported(v, target);
}

} // namespace docmodel
