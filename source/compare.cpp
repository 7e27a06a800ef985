// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/compare.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>
#include <vector>

namespace docmodel {

namespace {

using Entry = std::pair<std::string, Value>;

int family_rank(ValueType type) noexcept
{
    switch (type) {
    case ValueType::Null:     return 0;
    case ValueType::Bool:
    case ValueType::Integer:
    case ValueType::Double:   return 1;
    case ValueType::Duration: return 2;
    case ValueType::Text:
    case ValueType::Blob:     return 3;
    case ValueType::Array:    return 4;
    case ValueType::Document: return 5;
    }
    return 0;
}

double numeric_value(const Value& v)
{
    if (auto* b = v.get_if<bool>()) return *b ? 1.0 : 0.0;
    if (auto* i = v.get_if<std::int64_t>()) return static_cast<double>(*i);
    return v.as_double();
}

int compare_doubles(double a, double b) noexcept
{
    const bool a_nan = std::isnan(a);
    const bool b_nan = std::isnan(b);
    if (a_nan || b_nan) {
        return a_nan == b_nan ? 0 : (a_nan ? -1 : 1);
    }
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

std::pair<const std::uint8_t*, std::size_t> byte_view(const Value& v)
{
    if (auto* s = v.get_if<std::string>()) {
        return {reinterpret_cast<const std::uint8_t*>(s->data()), s->size()};
    }
    const Blob& b = v.as_blob();
    return {b.data(), b.size()};
}

int compare_bytes(const Value& a, const Value& b)
{
    const auto [pa, na] = byte_view(a);
    const auto [pb, nb] = byte_view(b);
    const std::size_t n = std::min(na, nb);
    if (n > 0) {
        const int c = std::memcmp(pa, pb, n);
        if (c != 0) {
            return c < 0 ? -1 : 1;
        }
    }
    if (na == nb) return 0;
    return na < nb ? -1 : 1;
}

std::vector<Value> elements(const Array& a)
{
    std::vector<Value> out;
    out.reserve(a.size());
    a.iterate([&out](std::size_t, const Value& v) { out.push_back(v); });
    return out;
}

std::vector<Entry> sorted_entries(const Document& d)
{
    std::vector<Entry> out;
    d.iterate([&out](const std::string& field, const Value& v) { out.emplace_back(field, v); });
    std::stable_sort(out.begin(), out.end(),
                     [](const Entry& x, const Entry& y) { return x.first < y.first; });
    return out;
}

int compare_arrays(const Array& a, const Array& b)
{
    const auto xs = elements(a);
    const auto ys = elements(b);
    const std::size_t n = std::min(xs.size(), ys.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (const int c = compare(xs[i], ys[i]); c != 0) {
            return c;
        }
    }
    if (xs.size() == ys.size()) return 0;
    return xs.size() < ys.size() ? -1 : 1;
}

int compare_documents(const Document& a, const Document& b)
{
    const auto xs = sorted_entries(a);
    const auto ys = sorted_entries(b);
    const std::size_t n = std::min(xs.size(), ys.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (xs[i].first != ys[i].first) {
            // the side holding the lower name has a field the other lacks
            return xs[i].first < ys[i].first ? 1 : -1;
        }
        if (const int c = compare(xs[i].second, ys[i].second); c != 0) {
            return c;
        }
    }
    if (xs.size() == ys.size()) return 0;
    return xs.size() < ys.size() ? -1 : 1;
}

} // anonymous namespace

int compare(const Value& a, const Value& b)
{
    const ValueType ta = a.type();
    const ValueType tb = b.type();
    const int ra = family_rank(ta);
    const int rb = family_rank(tb);
    if (ra != rb) {
        return ra < rb ? -1 : 1;
    }

    switch (ra) {
    case 0:
        return 0;
    case 1:
        // Integer against Integer too, see compare.h
        return compare_doubles(numeric_value(a), numeric_value(b));
    case 2: {
        const auto x = a.as_duration().count();
        const auto y = b.as_duration().count();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    case 3:
        return compare_bytes(a, b);
    case 4:
        return compare_arrays(a.as_array(), b.as_array());
    default:
        return compare_documents(a.as_document(), b.as_document());
    }
}

bool operator==(const Value& a, const Value& b)
{
    return compare(a, b) == 0;
}

bool is_identical(const Value& a, const Value& b)
{
    if (a.type() != b.type()) {
        return false;
    }
    switch (a.type()) {
    case ValueType::Array: {
        const auto xs = elements(a.as_array());
        const auto ys = elements(b.as_array());
        if (xs.size() != ys.size()) return false;
        for (std::size_t i = 0; i < xs.size(); ++i) {
            if (!is_identical(xs[i], ys[i])) return false;
        }
        return true;
    }
    case ValueType::Document: {
        const auto xs = sorted_entries(a.as_document());
        const auto ys = sorted_entries(b.as_document());
        if (xs.size() != ys.size()) return false;
        for (std::size_t i = 0; i < xs.size(); ++i) {
            if (xs[i].first != ys[i].first || !is_identical(xs[i].second, ys[i].second)) {
                return false;
            }
        }
        return true;
    }
    case ValueType::Integer:
        return a.as_integer() == b.as_integer();
    default:
        return compare(a, b) == 0;
    }
}

Value sort_array(const Array& a)
{
    auto xs = elements(a);
    std::stable_sort(xs.begin(), xs.end(), ValueLess{});
    return Value::array(std::move(xs));
}

bool array_contains(const Array& a, const Value& v)
{
    const std::size_t n = a.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (compare(a.get_by_index(i), v) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace docmodel
