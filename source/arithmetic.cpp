// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/arithmetic.h>

#include <cmath>
#include <limits>

namespace docmodel {

namespace {

enum class Operator { Add, Sub, Mul, Div, Mod, BitAnd, BitOr, BitXor };

constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

std::string_view operator_symbol(Operator op) noexcept
{
    switch (op) {
    case Operator::Add:    return "+";
    case Operator::Sub:    return "-";
    case Operator::Mul:    return "*";
    case Operator::Div:    return "/";
    case Operator::Mod:    return "%";
    case Operator::BitAnd: return "&";
    case Operator::BitOr:  return "|";
    case Operator::BitXor: return "^";
    }
    return "?";
}

bool is_bitwise(Operator op) noexcept
{
    return op == Operator::BitAnd || op == Operator::BitOr || op == Operator::BitXor;
}

bool add_overflows(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept
{
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
        return true;
    }
    out = a + b;
    return false;
}

bool sub_overflows(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept
{
    if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) {
        return true;
    }
    out = a - b;
    return false;
}

bool mul_overflows(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept
{
    if (a == 0 || b == 0) {
        out = 0;
        return false;
    }
    if (a == -1 || b == -1) {
        const std::int64_t other = a == -1 ? b : a;
        if (other == kMin) {
            return true;
        }
        out = -other;
        return false;
    }
    const auto r = static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
    if (r / b != a) {
        return true;
    }
    out = r;
    return false;
}

std::int64_t to_integer(const Value& v)
{
    if (auto* b = v.get_if<bool>()) return *b ? 1 : 0;
    if (auto* i = v.get_if<std::int64_t>()) return *i;
    const double d = v.as_double();
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        throw OverflowError("double " + std::to_string(d) + " does not fit in int64");
    }
    return static_cast<std::int64_t>(d);
}

double to_double(const Value& v)
{
    if (auto* d = v.get_if<double>()) return *d;
    return static_cast<double>(to_integer(v));
}

Value integer_op(std::int64_t a, std::int64_t b, Operator op)
{
    std::int64_t r = 0;
    switch (op) {
    case Operator::Add:
        if (add_overflows(a, b, r)) return static_cast<double>(a) + static_cast<double>(b);
        return r;
    case Operator::Sub:
        if (sub_overflows(a, b, r)) return static_cast<double>(a) - static_cast<double>(b);
        return r;
    case Operator::Mul:
        if (mul_overflows(a, b, r)) return static_cast<double>(a) * static_cast<double>(b);
        return r;
    case Operator::Div:
        if (b == 0) return Value{};
        if (a == kMin && b == -1) return -static_cast<double>(a);
        return a / b;
    case Operator::Mod:
        if (b == 0) return Value{};
        if (b == -1) return std::int64_t{0};
        return a % b;
    case Operator::BitAnd: return a & b;
    case Operator::BitOr:  return a | b;
    case Operator::BitXor: return a ^ b;
    }
    return Value{};
}

Value double_op(double a, double b, Operator op)
{
    switch (op) {
    case Operator::Add: return a + b;
    case Operator::Sub: return a - b;
    case Operator::Mul: return a * b;
    case Operator::Div:
        if (b == 0) return Value{};
        return a / b;
    case Operator::Mod:
        if (b == 0) return Value{};
        return std::fmod(a, b);
    default:
        return Value{};
    }
}

Value duration_op(Duration a, Duration b, Operator op)
{
    std::int64_t r = 0;
    if (op == Operator::Add) {
        if (add_overflows(a.count(), b.count(), r)) {
            throw OverflowError("duration addition overflows");
        }
        return Duration{r};
    }
    if (op == Operator::Sub) {
        if (sub_overflows(a.count(), b.count(), r)) {
            throw OverflowError("duration subtraction overflows");
        }
        return Duration{r};
    }
    throw TypeMismatchError("operator " + std::string(operator_symbol(op)) + " is not defined on durations");
}

Value calculate(const Value& a, const Value& b, Operator op)
{
    const ValueType ta = a.type();
    const ValueType tb = b.type();

    if (ta == ValueType::Null || tb == ValueType::Null) {
        return Value{};
    }
    auto is_bytes = [](ValueType t) { return t == ValueType::Text || t == ValueType::Blob; };
    if (is_bytes(ta) || is_bytes(tb)) {
        return Value{};
    }
    if (ta == ValueType::Duration && tb == ValueType::Duration) {
        return duration_op(a.as_duration(), b.as_duration(), op);
    }
    if (!is_number(ta) || !is_number(tb)) {
        throw TypeMismatchError("operator " + std::string(operator_symbol(op)) + " is not defined on " +
                                std::string(type_name(ta)) + " and " + std::string(type_name(tb)));
    }

    if (is_bitwise(op)) {
        return integer_op(to_integer(a), to_integer(b), op);
    }
    if (ta != ValueType::Double && tb != ValueType::Double) {
        return integer_op(to_integer(a), to_integer(b), op);
    }
    return double_op(to_double(a), to_double(b), op);
}

} // anonymous namespace

Value add(const Value& a, const Value& b)         { return calculate(a, b, Operator::Add); }
Value sub(const Value& a, const Value& b)         { return calculate(a, b, Operator::Sub); }
Value mul(const Value& a, const Value& b)         { return calculate(a, b, Operator::Mul); }
Value div(const Value& a, const Value& b)         { return calculate(a, b, Operator::Div); }
Value mod(const Value& a, const Value& b)         { return calculate(a, b, Operator::Mod); }
Value bitwise_and(const Value& a, const Value& b) { return calculate(a, b, Operator::BitAnd); }
Value bitwise_or(const Value& a, const Value& b)  { return calculate(a, b, Operator::BitOr); }
Value bitwise_xor(const Value& a, const Value& b) { return calculate(a, b, Operator::BitXor); }

} // namespace docmodel
