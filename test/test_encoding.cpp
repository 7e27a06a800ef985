// test_encoding.cpp - Tests for the streaming value codec
// Wire layout, round trips, incremental decoding, lazy views, malformed input

#include <catch2/catch_all.hpp>
#include <docmodel/compare.h>
#include <docmodel/document.h>
#include <docmodel/encoding.h>
#include <docmodel/json.h>
#include <docmodel/sortable.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace docmodel;
using namespace std::chrono_literals;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value round_trip(const Value& v)
{
    const ByteBuffer bytes = encode_value(v);
    return decode_value(bytes);
}

Value nested_arrays(std::size_t depth)
{
    Value v = Value::array({});
    for (std::size_t i = 1; i < depth; ++i) {
        v = Value::array({v});
    }
    return v;
}

Value sample_document()
{
    return from_json(R"({
        "name": "alice",
        "age": 30,
        "score": -1.25,
        "tags": ["a", "", "ccc"],
        "nested": {"empty": {}, "list": [[], [null, true]]}
    })");
}

} // namespace

// ============================================================
// Sortable primitives
// ============================================================

TEST_CASE("Sortable integer and double transforms", "[encoding][sortable]") {
    REQUIRE(sortable_from_int64(-1) < sortable_from_int64(0));
    REQUIRE(sortable_from_int64(std::numeric_limits<std::int64_t>::min()) == 0);
    REQUIRE(int64_from_sortable(sortable_from_int64(-42)) == -42);

    REQUIRE(sortable_from_double(-1.5) < sortable_from_double(-1.0));
    REQUIRE(sortable_from_double(-1.0) < sortable_from_double(0.0));
    REQUIRE(sortable_from_double(0.0) < sortable_from_double(1e-300));
    REQUIRE(sortable_from_double(1.0) < sortable_from_double(std::numeric_limits<double>::infinity()));
    REQUIRE(double_from_sortable(sortable_from_double(3.75)) == 3.75);
}

TEST_CASE("Sortable base64 preserves byte order", "[encoding][sortable]") {
    const Blob a{0x00, 0x01};
    const Blob b{0x00, 0x02};
    const Blob c{0xff};

    REQUIRE(encode_sortable_base64(a) < encode_sortable_base64(b));
    REQUIRE(encode_sortable_base64(b) < encode_sortable_base64(c));
    REQUIRE(decode_sortable_base64(encode_sortable_base64(c)) == c);
    REQUIRE(encode_sortable_base64(Blob{}).empty());

    for (char ch : encode_sortable_base64(Blob{0xfb, 0xef, 0xbe, 0x00})) {
        REQUIRE(is_sortable_base64(static_cast<std::uint8_t>(ch)));
    }
    REQUIRE_FALSE(is_sortable_base64('+'));
    REQUIRE_FALSE(is_sortable_base64(delim::kDocumentValue));
    REQUIRE_THROWS_AS(decode_sortable_base64("A"), MalformedEncodingError);

    SECTION("unused low bits of the last character must be zero") {
        REQUIRE(encode_sortable_base64(c) == "zk");
        REQUIRE_THROWS_AS(decode_sortable_base64("zl"), MalformedEncodingError);
        REQUIRE_THROWS_AS(decode_sortable_base64("zzz"), MalformedEncodingError);
        REQUIRE(decode_sortable_base64("zzw") == Blob{0xff, 0xff});
    }
}

// ============================================================
// Wire layout
// ============================================================

TEST_CASE("Scalar wire layout", "[encoding][layout]") {
    SECTION("null is a single tag") {
        REQUIRE(encode_value(Value{}) == ByteBuffer{0x80});
    }

    SECTION("bool") {
        REQUIRE(encode_value(true) == ByteBuffer{0x81, 0x01});
        REQUIRE(encode_value(false) == ByteBuffer{0x81, 0x00});
    }

    SECTION("integer is 8 bytes big-endian with the sign flipped") {
        REQUIRE(encode_value(1) == ByteBuffer{0x90, 0x80, 0, 0, 0, 0, 0, 0, 0x01});
        REQUIRE(encode_value(-1) == ByteBuffer{0x90, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
    }

    SECTION("double and duration carry 8 bytes") {
        REQUIRE(encode_value(1.0).size() == 9);
        REQUIRE(encode_value(1.0)[0] == 0xA0);
        REQUIRE(encode_value(Value(1s)).size() == 9);
        REQUIRE(encode_value(Value(1s))[0] == 0xB0);
    }

    SECTION("text is sortable base64 after the tag") {
        const ByteBuffer bytes = encode_value("hi");
        REQUIRE(bytes[0] == 0xC0);
        const std::string body(bytes.begin() + 1, bytes.end());
        REQUIRE(body == encode_sortable_base64(Blob{'h', 'i'}));
    }
}

TEST_CASE("Composite wire layout", "[encoding][layout]") {
    SECTION("array delimiters") {
        const ByteBuffer bytes = encode_value(Value::array({Value{}, Value{}}));
        REQUIRE(bytes == ByteBuffer{0xE0, 0x80, delim::kArrayValue, 0x80, delim::kArrayEnd});
        REQUIRE(encode_value(Value::array({})) == ByteBuffer{0xE0, delim::kArrayEnd});
    }

    SECTION("document delimiters") {
        REQUIRE(encode_value(Value::document({})) == ByteBuffer{0xF0, delim::kDocumentEnd});

        const ByteBuffer bytes = encode_value(Value::document({{"a", Value{}}}));
        const std::string name = encode_sortable_base64(Blob{'a'});
        ByteBuffer expected{0xF0};
        expected.insert(expected.end(), name.begin(), name.end());
        expected.push_back(delim::kDocumentValue);
        expected.push_back(0x80);
        expected.push_back(delim::kDocumentEnd);
        REQUIRE(bytes == expected);
    }

    SECTION("encode_document matches encode_value") {
        const Value doc = sample_document();
        REQUIRE(encode_document(doc.as_document()) == encode_value(doc));
    }
}

// ============================================================
// Round trips
// ============================================================

TEST_CASE("Streaming codec round trips", "[encoding][roundtrip]") {
    SECTION("scalars keep their exact type") {
        const Value values[] = {
            Value{}, true, false, 0, -1, std::numeric_limits<std::int64_t>::max(),
            std::numeric_limits<std::int64_t>::min(), 0.5, -0.0, 1e300,
            std::numeric_limits<double>::infinity(), Value(-3ms), "", "h\xc3\xa9llo", "a\nb",
            Blob{}, Blob{0x00, 0xff, 0x1c},
        };
        for (const auto& v : values) {
            REQUIRE(is_identical(round_trip(v), v));
        }
    }

    SECTION("NaN") {
        REQUIRE(std::isnan(round_trip(std::nan("")).as_double()));
    }

    SECTION("nested document") {
        const Value doc = sample_document();
        REQUIRE(is_identical(round_trip(doc), doc));
    }

    SECTION("duplicate fields are written in order") {
        auto buf = std::make_shared<FieldBuffer>();
        buf->add("a", 1).add("a", 2);
        const Value decoded = round_trip(buf);
        REQUIRE(field_count(decoded.as_document()) == 2);
        REQUIRE(decoded.as_document().get_by_field("a").as_integer() == 1);
    }

    SECTION("decode_document") {
        const Value doc = sample_document();
        const DocumentPtr decoded = decode_document(encode_value(doc));
        REQUIRE(is_identical(Value(decoded), doc));
        REQUIRE_THROWS_AS(decode_document(encode_value(1)), MalformedEncodingError);
    }
}

// ============================================================
// Incremental decoding
// ============================================================

TEST_CASE("measure_value", "[encoding][measure]") {
    const ByteBuffer bytes = encode_value(sample_document());

    REQUIRE(measure_value(bytes) == bytes.size());
    REQUIRE_FALSE(measure_value(std::span(bytes).first(bytes.size() - 1)).has_value());
    REQUIRE_FALSE(measure_value(std::span<const std::uint8_t>{}).has_value());

    SECTION("text needs the end of input to be complete") {
        const ByteBuffer text = encode_value("abcd");
        REQUIRE_FALSE(measure_value(text, false).has_value());
        REQUIRE(measure_value(text, true) == text.size());
    }
}

TEST_CASE("StreamDecoder yields values across chunks", "[encoding][stream]") {
    ByteBuffer stream;
    const Value values[] = {1, sample_document(), Value::array({"x", 2.5}), Value{}};
    for (const auto& v : values) {
        const ByteBuffer bytes = encode_value(v);
        stream.insert(stream.end(), bytes.begin(), bytes.end());
    }

    SECTION("byte by byte") {
        StreamDecoder decoder;
        std::vector<Value> out;
        for (std::uint8_t b : stream) {
            decoder.feed(std::span(&b, 1));
            while (auto v = decoder.next()) {
                out.push_back(std::move(*v));
            }
        }
        REQUIRE(out.size() == 4);
        for (std::size_t i = 0; i < out.size(); ++i) {
            REQUIRE(is_identical(out[i], values[i]));
        }
        REQUIRE(decoder.buffered() == 0);
        REQUIRE(decoder.consumed() == stream.size());
    }

    SECTION("trailing text is released by finish") {
        StreamDecoder decoder;
        const ByteBuffer text = encode_value("tail");
        decoder.feed(text);
        REQUIRE_FALSE(decoder.next().has_value());

        const std::vector<Value> rest = decoder.finish();
        REQUIRE(rest.size() == 1);
        REQUIRE(rest[0].as_text() == "tail");
    }

    SECTION("long text in small chunks") {
        const std::string long_text(64 * 1024, 'q');
        ByteBuffer bytes = encode_value(long_text);
        bytes.push_back(static_cast<std::uint8_t>(ValueType::Null));

        StreamDecoder decoder;
        std::vector<Value> out;
        for (std::size_t i = 0; i < bytes.size(); i += 7) {
            decoder.feed(std::span(bytes).subspan(i, std::min<std::size_t>(7, bytes.size() - i)));
            while (auto v = decoder.next()) {
                out.push_back(std::move(*v));
            }
        }
        REQUIRE(out.size() == 2);
        REQUIRE(out[0].as_text() == long_text);
        REQUIRE(out[1].is_null());
        REQUIRE(decoder.buffered() == 0);
    }

    SECTION("truncated input fails at finish") {
        StreamDecoder decoder;
        decoder.feed(std::span(stream).first(5));
        REQUIRE_NOTHROW(decoder.next());
        REQUIRE_THROWS_AS(decoder.finish(), MalformedEncodingError);
    }
}

// ============================================================
// Lazy views
// ============================================================

TEST_CASE("Lazy encoded documents", "[encoding][lazy]") {
    const Value doc = sample_document();
    auto bytes = std::make_shared<const ByteBuffer>(encode_value(doc));

    const Value lazy = decode_value_lazy(bytes);
    REQUIRE(dynamic_cast<const EncodedDocument*>(&lazy.as_document()) != nullptr);

    REQUIRE(lazy.as_document().get_by_field("age").as_integer() == 30);
    REQUIRE_THROWS_AS(lazy.as_document().get_by_field("missing"), FieldNotFoundError);

    const Value tags = lazy.as_document().get_by_field("tags");
    REQUIRE(dynamic_cast<const EncodedArray*>(&tags.as_array()) != nullptr);
    REQUIRE(tags.as_array().size() == 3);
    REQUIRE(tags.as_array().get_by_index(2).as_text() == "ccc");
    REQUIRE_THROWS_AS(tags.as_array().get_by_index(3), IndexOutOfRangeError);

    REQUIRE(is_identical(lazy, doc));

    SECTION("corrupt text is rejected before any access") {
        FieldBuffer corrupt;
        corrupt.add("t", Blob{0xff});
        ByteBuffer encoded = encode_document(corrupt);
        const auto tag = std::find(encoded.begin(), encoded.end(), static_cast<std::uint8_t>(ValueType::Blob));
        REQUIRE(tag != encoded.end());
        *tag = static_cast<std::uint8_t>(ValueType::Text);
        REQUIRE_THROWS_AS(decode_value_lazy(std::make_shared<const ByteBuffer>(encoded)), MalformedEncodingError);
    }

    SECTION("corrupt field names are rejected before any access") {
        FieldBuffer corrupt;
        corrupt.add("ok", 1).add("\xff", 2);
        const ByteBuffer encoded = encode_document(corrupt);
        REQUIRE_THROWS_AS(decode_value_lazy(std::make_shared<const ByteBuffer>(encoded)), MalformedEncodingError);
    }

    SECTION("copy detaches from the bytes") {
        FieldBuffer owned;
        owned.copy(lazy.as_document());
        REQUIRE(dynamic_cast<const ValueBuffer*>(&owned.get_by_field("tags").as_array()) != nullptr);
        REQUIRE(is_identical(Value(std::make_shared<FieldBuffer>(owned)), doc));
    }
}

// ============================================================
// Malformed input
// ============================================================

TEST_CASE("Malformed encodings are rejected", "[encoding][error]") {
    SECTION("empty input") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{}), MalformedEncodingError);
    }

    SECTION("unknown tag") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0x42}), MalformedEncodingError);
    }

    SECTION("short integer") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0x90, 0x80, 0x00}), MalformedEncodingError);
    }

    SECTION("invalid bool payload") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0x81, 0x02}), MalformedEncodingError);
    }

    SECTION("trailing bytes") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0x80, 0x80}), MalformedEncodingError);
    }

    SECTION("impossible base64 length") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0xC0, 'A'}), MalformedEncodingError);
    }

    SECTION("unterminated array") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0xE0, 0x80}), MalformedEncodingError);
    }

    SECTION("bad delimiter") {
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0xE0, 0x80, 0x80, delim::kArrayEnd}), MalformedEncodingError);
    }

    SECTION("non-canonical base64 in a blob") {
        REQUIRE(decode_value(ByteBuffer{0xD0, 'z', 'k'}).as_blob() == Blob{0xff});
        REQUIRE_THROWS_AS(decode_value(ByteBuffer{0xD0, 'z', 'l'}), MalformedEncodingError);
        REQUIRE_THROWS_AS(measure_value(ByteBuffer{0xD0, 'z', 'l'}), MalformedEncodingError);
    }

    SECTION("invalid UTF-8 text") {
        ByteBuffer bytes{0xC0};
        const std::string body = encode_sortable_base64(Blob{0xff, 0xfe});
        bytes.insert(bytes.end(), body.begin(), body.end());
        REQUIRE_THROWS_AS(decode_value(bytes), MalformedEncodingError);
    }

    SECTION("error reports the offset") {
        try {
            (void)decode_value(ByteBuffer{0xE0, 0x80, 0x42});
            FAIL("expected MalformedEncodingError");
        } catch (const MalformedEncodingError& e) {
            REQUIRE(e.offset() == 2);
            REQUIRE(e.kind() == ErrorKind::MalformedEncoding);
        }
    }

    SECTION("every truncation of a document fails cleanly") {
        const ByteBuffer bytes = encode_value(sample_document());
        for (std::size_t n = 0; n + 1 < bytes.size(); ++n) {
            REQUIRE_THROWS_AS(decode_value(std::span(bytes).first(n)), MalformedEncodingError);
        }
    }
}

TEST_CASE("Hostile input fails cleanly", "[encoding][error][depth]") {
    SECTION("nesting up to the limit decodes") {
        const Value deep = nested_arrays(kMaxNestingDepth);
        const ByteBuffer bytes = encode_value(deep);
        REQUIRE(is_identical(decode_value(bytes), deep));
        REQUIRE(measure_value(bytes) == bytes.size());
        REQUIRE(is_identical(decode_value_lazy(std::make_shared<const ByteBuffer>(bytes)), deep));
    }

    SECTION("one level past the limit is rejected") {
        const ByteBuffer bytes = encode_value(nested_arrays(kMaxNestingDepth + 1));
        REQUIRE_THROWS_AS(decode_value(bytes), MalformedEncodingError);
        REQUIRE_THROWS_AS(measure_value(bytes), MalformedEncodingError);
    }

    SECTION("a million array tags") {
        const ByteBuffer bytes(1'000'000, static_cast<std::uint8_t>(ValueType::Array));
        REQUIRE_THROWS_AS(decode_value(bytes), MalformedEncodingError);
        REQUIRE_THROWS_AS(decode_value_lazy(std::make_shared<const ByteBuffer>(bytes)), MalformedEncodingError);
        REQUIRE_THROWS_AS(measure_value(bytes, false), MalformedEncodingError);

        StreamDecoder decoder;
        decoder.feed(bytes);
        REQUIRE_THROWS_AS(decoder.next(), MalformedEncodingError);
    }

    SECTION("corrupted bytes decode or throw MalformedEncodingError") {
        const ByteBuffer bytes = encode_value(sample_document());
        std::mt19937 rng(11);
        for (int round = 0; round < 2000; ++round) {
            ByteBuffer corrupted = bytes;
            for (int n = 0; n < 3; ++n) {
                corrupted[rng() % corrupted.size()] = static_cast<std::uint8_t>(rng());
            }
            try {
                (void)decode_value(corrupted);
            } catch (const MalformedEncodingError&) {
                // expected for most corruptions
            }
            try {
                (void)decode_value_lazy(std::make_shared<const ByteBuffer>(corrupted));
            } catch (const MalformedEncodingError&) {
            }
        }
    }

    SECTION("a million nested documents") {
        ByteBuffer bytes;
        for (int i = 0; i < 1'000'000; ++i) {
            bytes.push_back(static_cast<std::uint8_t>(ValueType::Document));
            bytes.push_back(delim::kDocumentValue);
        }
        REQUIRE_THROWS_AS(decode_value(bytes), MalformedEncodingError);
        REQUIRE_THROWS_AS(measure_value(bytes), MalformedEncodingError);
    }
}
