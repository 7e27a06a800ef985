// test_arithmetic.cpp - Tests for arithmetic operators
// Null propagation, promotion rules, overflow and division by zero

#include <catch2/catch_all.hpp>
#include <docmodel/arithmetic.h>
#include <docmodel/json.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

using namespace docmodel;
using namespace std::chrono_literals;

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

} // namespace

// ============================================================
// Null and non-numeric operands
// ============================================================

TEST_CASE("Null operands produce null", "[arithmetic][null]") {
    REQUIRE(add(Value{}, 1).is_null());
    REQUIRE(sub(1, Value{}).is_null());
    REQUIRE(mul(Value{}, from_json("[]")).is_null());
    REQUIRE(bitwise_or(Value{}, Value{}).is_null());
}

TEST_CASE("Text and blob operands produce null", "[arithmetic][bytes]") {
    REQUIRE(add("1", 1).is_null());
    REQUIRE(mul(2, Blob{1}).is_null());
    REQUIRE(bitwise_and("a", "b").is_null());
}

TEST_CASE("Composite operands are type mismatches", "[arithmetic][error]") {
    REQUIRE_THROWS_AS(add(from_json("[1]"), 1), TypeMismatchError);
    REQUIRE_THROWS_AS(sub(1, from_json("{}")), TypeMismatchError);
    REQUIRE_THROWS_AS(add(Value(1s), 1), TypeMismatchError);
}

// ============================================================
// Promotion
// ============================================================

TEST_CASE("Numeric promotion", "[arithmetic][promotion]") {
    SECTION("integer arithmetic stays integer") {
        const Value r = add(2, 3);
        REQUIRE(r.type() == ValueType::Integer);
        REQUIRE(r.as_integer() == 5);
        REQUIRE(sub(2, 5).as_integer() == -3);
        REQUIRE(mul(-4, 6).as_integer() == -24);
    }

    SECTION("bool promotes to integer") {
        const Value r = add(true, true);
        REQUIRE(r.type() == ValueType::Integer);
        REQUIRE(r.as_integer() == 2);
        REQUIRE(mul(false, 7).as_integer() == 0);
    }

    SECTION("mixed integer and double give double") {
        const Value r = add(1, 0.5);
        REQUIRE(r.type() == ValueType::Double);
        REQUIRE(r.as_double() == 1.5);
        REQUIRE(mul(true, 2.5).as_double() == 2.5);
    }
}

// ============================================================
// Overflow
// ============================================================

TEST_CASE("Integer overflow promotes to double", "[arithmetic][overflow]") {
    SECTION("add") {
        const Value r = add(kMax, 1);
        REQUIRE(r.type() == ValueType::Double);
        REQUIRE(r.as_double() == static_cast<double>(kMax) + 1.0);
    }

    SECTION("sub") {
        const Value r = sub(kMin, 1);
        REQUIRE(r.type() == ValueType::Double);
    }

    SECTION("mul") {
        const Value r = mul(kMax, 2);
        REQUIRE(r.type() == ValueType::Double);
        REQUIRE(mul(kMin, -1).type() == ValueType::Double);
        REQUIRE(mul(std::int64_t{1} << 31, std::int64_t{1} << 31).as_integer() == std::int64_t{1} << 62);
    }

    SECTION("div") {
        const Value r = docmodel::div(kMin, -1);
        REQUIRE(r.type() == ValueType::Double);
        REQUIRE(r.as_double() == 9223372036854775808.0);
        REQUIRE(mod(kMin, -1).as_integer() == 0);
    }
}

TEST_CASE("Duration arithmetic", "[arithmetic][duration]") {
    REQUIRE(add(Value(1s), Value(500ms)).as_duration() == 1500ms);
    REQUIRE(sub(Value(1s), Value(2s)).as_duration() == -1s);
    REQUIRE_THROWS_AS(add(Value(Duration{kMax}), Value(1ns)), OverflowError);
    REQUIRE_THROWS_AS(mul(Value(1s), Value(2s)), TypeMismatchError);
}

// ============================================================
// Division
// ============================================================

TEST_CASE("Division and modulo", "[arithmetic][division]") {
    SECTION("by zero is null") {
        REQUIRE(docmodel::div(1, 0).is_null());
        REQUIRE(docmodel::div(1.0, 0.0).is_null());
        REQUIRE(mod(5, 0).is_null());
        REQUIRE(mod(5.5, 0).is_null());
    }

    SECTION("integer division truncates") {
        REQUIRE(docmodel::div(7, 2).as_integer() == 3);
        REQUIRE(docmodel::div(-7, 2).as_integer() == -3);
        REQUIRE(mod(-7, 2).as_integer() == -1);
    }

    SECTION("double division") {
        REQUIRE(docmodel::div(7.0, 2).as_double() == 3.5);
        REQUIRE(mod(7.5, 2).as_double() == std::fmod(7.5, 2.0));
    }
}

// ============================================================
// Bitwise
// ============================================================

TEST_CASE("Bitwise operators", "[arithmetic][bitwise]") {
    REQUIRE(bitwise_and(12, 10).as_integer() == 8);
    REQUIRE(bitwise_or(12, 10).as_integer() == 14);
    REQUIRE(bitwise_xor(12, 10).as_integer() == 6);
    REQUIRE(bitwise_or(true, 2).as_integer() == 3);

    SECTION("doubles truncate to integer") {
        const Value r = bitwise_and(7.9, 3);
        REQUIRE(r.type() == ValueType::Integer);
        REQUIRE(r.as_integer() == 3);
    }

    SECTION("doubles outside the integer range overflow") {
        REQUIRE_THROWS_AS(bitwise_or(1e30, 1), OverflowError);
        REQUIRE_THROWS_AS(bitwise_xor(std::nan(""), 1), OverflowError);
    }
}
