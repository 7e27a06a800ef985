// test_json.cpp - Tests for JSON writing, parsing and lazy JSON documents

#include <catch2/catch_all.hpp>
#include <docmodel/compare.h>
#include <docmodel/document.h>
#include <docmodel/json.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace docmodel;
using namespace std::chrono_literals;

// ============================================================
// Writing
// ============================================================

TEST_CASE("to_json scalars", "[json][write]") {
    REQUIRE(to_json(Value{}) == "null");
    REQUIRE(to_json(true) == "true");
    REQUIRE(to_json(-42) == "-42");
    REQUIRE(to_json(1.0) == "1.0");
    REQUIRE(to_json(0.25) == "0.25");
    REQUIRE(to_json(Value(90s)) == "\"1m30s\"");
    REQUIRE(to_json(Blob{'h', 'i'}) == "\"aGk=\"");
    REQUIRE(to_json("plain") == "\"plain\"");

    SECTION("non-finite doubles become null") {
        REQUIRE(to_json(std::nan("")) == "null");
        REQUIRE(to_json(std::numeric_limits<double>::infinity()) == "null");
    }

    SECTION("string escapes") {
        REQUIRE(to_json("a\"b\\c") == R"("a\"b\\c")");
        REQUIRE(to_json("line\nnext\ttab") == R"("line\nnext\ttab")");
        REQUIRE(to_json(std::string("\x01", 1)) == R"("\u0001")");
        REQUIRE(to_json("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
    }
}

TEST_CASE("to_json composites", "[json][write]") {
    FieldBuffer doc;
    doc.add("name", "alice").add("tags", Value::array({1, 2})).add("empty", std::make_shared<FieldBuffer>());

    SECTION("compact") {
        REQUIRE(to_json(doc, true) == R"({"name":"alice","tags":[1,2],"empty":{}})");
    }

    SECTION("pretty") {
        const std::string expected =
            "{\n"
            "  \"name\": \"alice\",\n"
            "  \"tags\": [\n"
            "    1,\n"
            "    2\n"
            "  ],\n"
            "  \"empty\": {}\n"
            "}";
        REQUIRE(to_json(doc) == expected);
    }

    SECTION("field order follows iteration") {
        FieldBuffer other;
        other.add("z", 1).add("a", 2).add("z", 3);
        REQUIRE(to_json(other, true) == R"({"z":1,"a":2,"z":3})");
    }

    SECTION("empty array") {
        REQUIRE(to_json(Value::array({}), true) == "[]");
        REQUIRE(to_json(Value::array({})) == "[]");
    }
}

// ============================================================
// Parsing
// ============================================================

TEST_CASE("from_json numbers", "[json][parse]") {
    SECTION("integer tokens") {
        const Value v = from_json("42");
        REQUIRE(v.type() == ValueType::Integer);
        REQUIRE(v.as_integer() == 42);
        REQUIRE(from_json("-9223372036854775808").as_integer() == std::numeric_limits<std::int64_t>::min());
    }

    SECTION("fraction or exponent gives double") {
        REQUIRE(from_json("1.0").type() == ValueType::Double);
        REQUIRE(from_json("1.5").as_double() == 1.5);
        REQUIRE(from_json("2e3").as_double() == 2000.0);
        REQUIRE(from_json("-1.25E-2").as_double() == -0.0125);
    }

    SECTION("integers beyond int64 become double") {
        const Value v = from_json("9223372036854775808");
        REQUIRE(v.type() == ValueType::Double);
        REQUIRE(v.as_double() == 9223372036854775808.0);
    }

    SECTION("doubles out of range are errors") {
        REQUIRE_THROWS_AS(from_json("1e400"), ParseError);
    }

    SECTION("malformed numbers") {
        REQUIRE_THROWS_AS(from_json("-"), ParseError);
        REQUIRE_THROWS_AS(from_json("-x"), ParseError);
        REQUIRE_THROWS_AS(from_json("1.2.3"), ParseError);
    }
}

TEST_CASE("from_json strings", "[json][parse]") {
    REQUIRE(from_json(R"("a\"b\\c\/d")").as_text() == "a\"b\\c/d");
    REQUIRE(from_json(R"("\n\t\r\b\f")").as_text() == "\n\t\r\b\f");

    SECTION("unicode escapes") {
        REQUIRE(from_json(R"("\u0041")").as_text() == "A");
        REQUIRE(from_json(R"("\u00e9")").as_text() == "\xc3\xa9");
        REQUIRE(from_json(R"("\u20ac")").as_text() == "\xe2\x82\xac");
        REQUIRE(from_json(R"("\u0000")").as_text() == std::string("\0", 1));
    }

    SECTION("surrogate pairs") {
        REQUIRE(from_json(R"("\ud83d\ude00")").as_text() == "\xf0\x9f\x98\x80");
        REQUIRE_THROWS_AS(from_json(R"("\ud83d")"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"("\ud83dx")"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"("\ude00")"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"("\ud83d\u0041")"), ParseError);
    }

    SECTION("malformed strings") {
        REQUIRE_THROWS_AS(from_json(R"("abc)"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"("\x")"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"("\u12")"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"("\u12zz")"), ParseError);
        REQUIRE_THROWS_AS(from_json("\"a\nb\""), ParseError);
    }
}

TEST_CASE("from_json composites", "[json][parse]") {
    const Value v = from_json(R"( { "a" : [1, 2.5, "x", null, true], "b": {}, "a": false } )");

    REQUIRE(v.type() == ValueType::Document);
    REQUIRE(dynamic_cast<const FieldBuffer*>(&v.as_document()) != nullptr);

    SECTION("duplicate names are kept and the first wins") {
        REQUIRE(field_count(v.as_document()) == 3);
        REQUIRE(v.as_document().get_by_field("a").type() == ValueType::Array);
    }

    SECTION("arrays become value buffers") {
        const Value a = v.as_document().get_by_field("a");
        REQUIRE(dynamic_cast<const ValueBuffer*>(&a.as_array()) != nullptr);
        REQUIRE(a.as_array().size() == 5);
        REQUIRE(a.as_array().get_by_index(3).is_null());
    }

    SECTION("round trips through the writer") {
        REQUIRE(is_identical(from_json(to_json(v)), v));
        REQUIRE(is_identical(from_json(to_json(v, true)), v));
    }
}

TEST_CASE("from_json errors carry the position", "[json][parse][error]") {
    SECTION("empty input") {
        REQUIRE_THROWS_AS(from_json(""), ParseError);
        REQUIRE_THROWS_AS(from_json("   "), ParseError);
    }

    SECTION("trailing characters") {
        REQUIRE_THROWS_AS(from_json("1 2"), ParseError);
        REQUIRE_THROWS_AS(from_json("{} x"), ParseError);
    }

    SECTION("structural errors") {
        REQUIRE_THROWS_AS(from_json("[1, 2"), ParseError);
        REQUIRE_THROWS_AS(from_json("[1 2]"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"({"a" 1})"), ParseError);
        REQUIRE_THROWS_AS(from_json(R"({"a": 1,})"), ParseError);
        REQUIRE_THROWS_AS(from_json("{1: 2}"), ParseError);
        REQUIRE_THROWS_AS(from_json("tru"), ParseError);
        REQUIRE_THROWS_AS(from_json("nul"), ParseError);
        REQUIRE_THROWS_AS(from_json("@"), ParseError);
    }

    SECTION("position") {
        try {
            (void)from_json(R"({"a": [1, 2 3]})");
            FAIL("expected a parse error");
        } catch (const ParseError& e) {
            REQUIRE(e.position() == 12);
            REQUIRE(e.kind() == ErrorKind::ParseError);
        }
    }
}

TEST_CASE("Deeply nested JSON fails cleanly", "[json][parse][error][depth]") {
    SECTION("nesting up to the limit parses") {
        const std::string deep = std::string(kMaxNestingDepth, '[') + std::string(kMaxNestingDepth, ']');
        REQUIRE(from_json(deep).type() == ValueType::Array);
        REQUIRE(array_from_json(deep)->size() == 1);
    }

    SECTION("one level past the limit is rejected") {
        const std::string deep = std::string(kMaxNestingDepth + 1, '[') + std::string(kMaxNestingDepth + 1, ']');
        REQUIRE_THROWS_AS(from_json(deep), ParseError);
        REQUIRE_THROWS_AS(array_from_json(deep), ParseError);
    }

    SECTION("a million openers") {
        REQUIRE_THROWS_AS(from_json(std::string(1'000'000, '[')), ParseError);
        REQUIRE_THROWS_AS(array_from_json(std::string(1'000'000, '[')), ParseError);

        std::string objects;
        for (int i = 0; i < 1'000'000; ++i) {
            objects += R"({"a":)";
        }
        REQUIRE_THROWS_AS(from_json(objects), ParseError);
        REQUIRE_THROWS_AS(document_from_json(objects), ParseError);
    }
}

// ============================================================
// Lazy documents
// ============================================================

TEST_CASE("document_from_json", "[json][lazy]") {
    const DocumentPtr doc = document_from_json(R"({"name": "alice", "tags": ["a", "b"], "nested": {"x": 1}})");

    SECTION("fields in text order") {
        std::vector<std::string> names;
        doc->iterate([&](const std::string& name, const Value&) { names.push_back(name); });
        REQUIRE(names == std::vector<std::string>{"name", "tags", "nested"});
    }

    SECTION("values are parsed on access") {
        REQUIRE(doc->get_by_field("name").as_text() == "alice");
        REQUIRE_THROWS_AS(doc->get_by_field("missing"), FieldNotFoundError);
    }

    SECTION("nested composites are lazy views") {
        const Value tags = doc->get_by_field("tags");
        REQUIRE(dynamic_cast<const JsonArray*>(&tags.as_array()) != nullptr);
        REQUIRE(tags.as_array().size() == 2);
        REQUIRE(tags.as_array().get_by_index(1).as_text() == "b");
        REQUIRE_THROWS_AS(tags.as_array().get_by_index(2), IndexOutOfRangeError);

        const Value nested = doc->get_by_field("nested");
        REQUIRE(dynamic_cast<const JsonDocument*>(&nested.as_document()) != nullptr);
        REQUIRE(get_at_path(Value(doc), parse_path("nested.x")).as_integer() == 1);
    }

    SECTION("equal to the eager parse") {
        REQUIRE(is_identical(Value(doc), from_json(to_json(*doc))));
    }

    SECTION("views outlive the source document") {
        Value tags;
        {
            const DocumentPtr scoped = document_from_json(R"({"tags": ["a"]})");
            tags = scoped->get_by_field("tags");
        }
        REQUIRE(tags.as_array().get_by_index(0).as_text() == "a");
    }
}

TEST_CASE("Lazy JSON input is validated up front", "[json][lazy][error]") {
    REQUIRE_THROWS_AS(document_from_json(R"({"a": [1, }")"), ParseError);
    REQUIRE_THROWS_AS(document_from_json(""), ParseError);
    REQUIRE_THROWS_AS(document_from_json("[1]"), TypeMismatchError);
    REQUIRE_THROWS_AS(array_from_json(R"({"a": 1})"), TypeMismatchError);
    REQUIRE_THROWS_AS(array_from_json("[1] [2]"), ParseError);

    const ArrayPtr arr = array_from_json("  [1, [2], {\"k\": null}]  ");
    REQUIRE(arr->size() == 3);
    REQUIRE(arr->get_by_index(2).as_document().get_by_field("k").is_null());
}
