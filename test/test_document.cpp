// test_document.cpp - Tests for FieldBuffer, ValueBuffer and document views

#include <catch2/catch_all.hpp>
#include <docmodel/compare.h>
#include <docmodel/document.h>
#include <docmodel/json.h>

#include <memory>
#include <string>
#include <vector>

using namespace docmodel;

// ============================================================
// Helper Functions
// ============================================================

namespace {

std::vector<std::string> names_of(const Document& doc)
{
    std::vector<std::string> names;
    doc.iterate([&](const std::string& name, const Value&) { names.push_back(name); });
    return names;
}

} // namespace

// ============================================================
// FieldBuffer
// ============================================================

TEST_CASE("FieldBuffer add and lookup", "[document][field_buffer]") {
    FieldBuffer buf;
    buf.add("name", "alice").add("age", 30).add("name", "bob");

    SECTION("insertion order and duplicates are kept") {
        REQUIRE(buf.size() == 3);
        REQUIRE(names_of(buf) == std::vector<std::string>{"name", "age", "name"});
    }

    SECTION("first match wins") {
        REQUIRE(buf.get_by_field("name").as_text() == "alice");
        REQUIRE(buf.has_field("age"));
        REQUIRE_FALSE(buf.has_field("missing"));
    }

    SECTION("missing field is an error") {
        REQUIRE_THROWS_AS(buf.get_by_field("missing"), FieldNotFoundError);
        try {
            (void)buf.get_by_field("missing");
        } catch (const FieldNotFoundError& e) {
            REQUIRE(e.field() == "missing");
            REQUIRE(e.kind() == ErrorKind::FieldNotFound);
        }
    }
}

TEST_CASE("FieldBuffer replace, set and remove", "[document][field_buffer]") {
    FieldBuffer buf;
    buf.add("a", 1).add("b", 2).add("a", 3);

    SECTION("replace changes the first match") {
        buf.replace("a", 10);
        REQUIRE(buf.get_by_field("a").as_integer() == 10);
        REQUIRE(buf.fields()[2].value.as_integer() == 3);
        REQUIRE_THROWS_AS(buf.replace("zz", 1), FieldNotFoundError);
    }

    SECTION("set replaces or appends") {
        buf.set("b", "two");
        buf.set("c", true);
        REQUIRE(names_of(buf) == std::vector<std::string>{"a", "b", "a", "c"});
        REQUIRE(buf.get_by_field("b").as_text() == "two");
    }

    SECTION("remove drops the first match and keeps order") {
        buf.remove("a");
        REQUIRE(names_of(buf) == std::vector<std::string>{"b", "a"});
        REQUIRE(buf.get_by_field("a").as_integer() == 3);
        REQUIRE_THROWS_AS(buf.remove("zz"), FieldNotFoundError);
    }

    SECTION("reset empties the buffer") {
        buf.reset();
        REQUIRE(buf.empty());
    }
}

TEST_CASE("FieldBuffer path mutation", "[document][field_buffer][path]") {
    FieldBuffer buf;
    buf.copy(from_json(R"({"a": {"b": [1, 2, 3]}})").as_document());

    buf.set(parse_path("a.b[1]"), 20);
    buf.set(parse_path("a.c"), "new");
    REQUIRE(get_at_path(buf, parse_path("a.b[1]")).as_integer() == 20);
    REQUIRE(get_at_path(buf, parse_path("a.c")).as_text() == "new");

    buf.remove(parse_path("a.b[0]"));
    REQUIRE(is_equal(get_at_path(buf, parse_path("a.b")), from_json("[20, 3]")));

    REQUIRE_THROWS_AS(buf.set(Path{}, 1), FieldNotFoundError);
    REQUIRE_THROWS_AS(buf.set(parse_path("a.b[9]"), 1), IndexOutOfRangeError);
    REQUIRE_THROWS_AS(buf.remove(parse_path("x")), FieldNotFoundError);
}

TEST_CASE("FieldBuffer copy is deep", "[document][field_buffer][copy]") {
    const Value source = from_json(R"({"a": {"b": [1, {"c": 2}]}, "d": "x"})");

    FieldBuffer copy;
    copy.copy(source.as_document());

    REQUIRE(is_equal(Value(std::make_shared<FieldBuffer>(copy)), source));

    // nested composites are owned buffers, not the source objects
    const Value a = copy.get_by_field("a");
    REQUIRE(dynamic_cast<const FieldBuffer*>(&a.as_document()) != nullptr);
    REQUIRE(a.document_ptr() != source.as_document().get_by_field("a").document_ptr());

    const Value b = a.as_document().get_by_field("b");
    REQUIRE(dynamic_cast<const ValueBuffer*>(&b.as_array()) != nullptr);
}

TEST_CASE("FieldBuffer copy freezes lazy documents", "[document][field_buffer][copy]") {
    DocumentPtr lazy = document_from_json(R"({"a": [1, 2], "b": {"c": null}})");

    FieldBuffer copy;
    copy.copy(*lazy);
    REQUIRE(dynamic_cast<const ValueBuffer*>(&copy.get_by_field("a").as_array()) != nullptr);
    REQUIRE(is_equal(Value(std::make_shared<FieldBuffer>(copy)), Value(lazy)));
}

TEST_CASE("FieldBuffer scan is shallow", "[document][field_buffer][scan]") {
    const Value source = from_json(R"({"a": {"b": 1}})");

    FieldBuffer buf;
    buf.scan(source.as_document());
    REQUIRE(buf.size() == 1);
    REQUIRE(buf.get_by_field("a").document_ptr() == source.as_document().get_by_field("a").document_ptr());
}

TEST_CASE("FieldBuffer apply rewrites leaves", "[document][field_buffer][apply]") {
    FieldBuffer buf;
    buf.copy(from_json(R"({"a": 1, "b": [2, {"c": 3}], "d": "x"})").as_document());

    std::vector<std::string> visited;
    buf.apply([&](const Path& path, const Value& leaf) -> Value {
        visited.push_back(path.to_string());
        if (leaf.type() == ValueType::Integer) {
            return leaf.as_integer() * 10;
        }
        return leaf;
    });

    REQUIRE(visited == std::vector<std::string>{"a", "b[0]", "b[1].c", "d"});
    REQUIRE(is_identical(Value(std::make_shared<FieldBuffer>(buf)),
                         from_json(R"({"a": 10, "b": [20, {"c": 30}], "d": "x"})")));
}

TEST_CASE("Callback errors stop iteration", "[document][iterate]") {
    FieldBuffer buf;
    buf.add("a", 1).add("b", 2).add("c", 3);

    int calls = 0;
    REQUIRE_THROWS_AS(buf.iterate([&](const std::string& name, const Value&) {
        ++calls;
        if (name == "b") {
            throw TypeMismatchError("stop");
        }
    }), TypeMismatchError);
    REQUIRE(calls == 2);
}

// ============================================================
// ValueBuffer
// ============================================================

TEST_CASE("ValueBuffer operations", "[document][value_buffer]") {
    ValueBuffer buf;
    buf.append(1).append("two").append(3.0);

    REQUIRE(buf.size() == 3);
    REQUIRE(buf.get_by_index(1).as_text() == "two");
    REQUIRE_THROWS_AS(buf.get_by_index(3), IndexOutOfRangeError);

    SECTION("replace") {
        buf.replace(0, Value{});
        REQUIRE(buf.get_by_index(0).is_null());
        REQUIRE_THROWS_AS(buf.replace(5, 1), IndexOutOfRangeError);
    }

    SECTION("remove shifts later elements") {
        buf.remove(0);
        REQUIRE(buf.size() == 2);
        REQUIRE(buf.get_by_index(0).as_text() == "two");
        REQUIRE_THROWS_AS(buf.remove(2), IndexOutOfRangeError);
    }

    SECTION("copy and apply") {
        ValueBuffer other;
        other.copy(from_json(R"([[1], {"a": 2}])").as_array());
        other.apply([](const Path&, const Value& leaf) -> Value { return leaf.as_integer() + 1; });
        REQUIRE(is_identical(Value(std::make_shared<ValueBuffer>(other)), from_json(R"([[2], {"a": 3}])")));
    }

    SECTION("array_length") {
        REQUIRE(array_length(buf) == 3);
    }
}

// ============================================================
// Helpers and views
// ============================================================

TEST_CASE("Document helpers", "[document][helpers]") {
    const Value doc = from_json(R"({"c": 1, "a": 2, "b": 3, "a": 4})");

    REQUIRE(fields(doc.as_document()) == std::vector<std::string>{"a", "a", "b", "c"});
    REQUIRE(field_count(doc.as_document()) == 4);
    REQUIRE(doc.as_document().get_by_field("a").as_integer() == 2);
}

TEST_CASE("Document views", "[document][views]") {
    const DocumentPtr doc = from_json(R"({"c": 1, "a": 2, "b": 3})").document_ptr();

    SECTION("mask_fields hides names") {
        const DocumentPtr masked = mask_fields(doc, {"a"});
        REQUIRE(names_of(*masked) == std::vector<std::string>{"c", "b"});
        REQUIRE_THROWS_AS(masked->get_by_field("a"), FieldNotFoundError);
        REQUIRE(masked->get_by_field("b").as_integer() == 3);
    }

    SECTION("only_fields projects in request order") {
        const DocumentPtr only = only_fields(doc, {"b", "missing", "c"});
        REQUIRE(names_of(*only) == std::vector<std::string>{"b", "c"});
        REQUIRE_THROWS_AS(only->get_by_field("a"), FieldNotFoundError);
        REQUIRE_THROWS_AS(only->get_by_field("missing"), FieldNotFoundError);
    }

    SECTION("with_sorted_fields iterates by name") {
        const DocumentPtr sorted = with_sorted_fields(doc);
        REQUIRE(names_of(*sorted) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(is_equal(Value(sorted), Value(doc)));
    }
}
