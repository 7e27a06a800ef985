// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/key_encoding.h>

#include <docmodel/document.h>
#include <docmodel/format.h>
#include <docmodel/log.h>
#include <docmodel/sortable.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace docmodel {

namespace {

enum Family : std::uint8_t {
    kNull = 0x05,
    kNumeric = 0x10,
    kDuration = 0x20,
    kBytes = 0x30,
    kArray = 0x40,
    kDocument = 0x50,
};

enum Subtype : std::uint8_t {
    kBool = 0x01,
    kInteger = 0x02,
    kDouble = 0x03,
    kNegativeZero = 0x04,
    kText = 0x05,
    kBlob = 0x06,
};

constexpr std::uint8_t kEntry = 0x01;
constexpr std::uint8_t kEnd = 0x00;

// ============================================================
// Encoding
// ============================================================

class KeyEncoder {
public:
    void encode(const Value& v)
    {
        switch (v.type()) {
        case ValueType::Null:
            body_.write_u8(kNull);
            break;
        case ValueType::Bool:
            write_number(v.as_bool() ? 1.0 : 0.0);
            trailer_.write_u8(kBool);
            break;
        case ValueType::Integer:
            write_number(static_cast<double>(v.as_integer()));
            trailer_.write_u8(kInteger);
            trailer_.write_u64(sortable_from_int64(v.as_integer()));
            break;
        case ValueType::Double: {
            const double d = v.as_double();
            write_number(d);
            trailer_.write_u8(d == 0.0 && std::signbit(d) ? kNegativeZero : kDouble);
            break;
        }
        case ValueType::Duration:
            body_.write_u8(kDuration);
            body_.write_u64(sortable_from_int64(v.as_duration().count()));
            break;
        case ValueType::Text: {
            const std::string& s = v.as_text();
            body_.write_u8(kBytes);
            write_escaped(std::span(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()), false);
            trailer_.write_u8(kText);
            break;
        }
        case ValueType::Blob:
            body_.write_u8(kBytes);
            write_escaped(v.as_blob(), false);
            trailer_.write_u8(kBlob);
            break;
        case ValueType::Array:
            body_.write_u8(kArray);
            v.as_array().iterate([this](std::size_t, const Value& element) {
                body_.write_u8(kEntry);
                encode(element);
            });
            body_.write_u8(kEnd);
            break;
        case ValueType::Document: {
            std::vector<std::pair<std::string, Value>> entries;
            v.as_document().iterate([&entries](const std::string& field, const Value& value) {
                entries.emplace_back(field, value);
            });
            std::stable_sort(entries.begin(), entries.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            body_.write_u8(kDocument);
            for (const auto& [field, value] : entries) {
                body_.write_u8(kEntry);
                write_escaped(std::span(reinterpret_cast<const std::uint8_t*>(field.data()), field.size()), true);
                encode(value);
            }
            body_.write_u8(kEnd);
            break;
        }
        }
    }

    ByteBuffer finish()
    {
        ByteBuffer out = body_.release();
        const ByteBuffer& trailer = trailer_.buffer();
        out.insert(out.end(), trailer.begin(), trailer.end());
        return out;
    }

private:
    void write_number(double d)
    {
        body_.write_u8(kNumeric);
        if (std::isnan(d)) {
            body_.write_u64(0);
        } else {
            body_.write_u64(sortable_from_double(d == 0.0 ? 0.0 : d));
        }
    }

    void write_escaped(std::span<const std::uint8_t> bytes, bool complement)
    {
        const std::uint8_t mask = complement ? 0xFF : 0x00;
        for (std::uint8_t b : bytes) {
            body_.write_u8(b ^ mask);
            if (b == 0x00) {
                body_.write_u8(0xFF ^ mask);
            }
        }
        body_.write_u8(0x00 ^ mask);
        body_.write_u8(0x01 ^ mask);
    }

    ByteWriter body_;
    ByteWriter trailer_;
};

// ============================================================
// Decoding
//
// The body is parsed into a Node tree first; the trailer is then consumed
// in the same pre-order to give every numeric and bytes leaf its type.
// ============================================================

struct Node {
    std::uint8_t family = kNull;
    double number = 0.0;
    std::int64_t duration = 0;
    std::string bytes;
    std::vector<std::string> names;
    std::vector<Node> children;
};

class KeyDecoder {
public:
    explicit KeyDecoder(std::span<const std::uint8_t> key) : reader_(key) {}

    Value decode()
    {
        const Node root = read_node(0);
        Value v = build(root);
        if (!reader_.at_end()) {
            reader_.fail("trailing bytes after key");
        }
        return v;
    }

private:
    /// @p depth counts the arrays and documents enclosing this node.
    Node read_node(std::size_t depth)
    {
        Node node;
        node.family = reader_.read_u8();
        if ((node.family == kArray || node.family == kDocument) && depth >= kMaxNestingDepth) {
            reader_.fail("key nesting deeper than " + std::to_string(kMaxNestingDepth));
        }
        switch (node.family) {
        case kNull:
            break;
        case kNumeric: {
            const std::uint64_t u = reader_.read_u64();
            node.number = u == 0 ? std::nan("") : double_from_sortable(u);
            break;
        }
        case kDuration:
            node.duration = int64_from_sortable(reader_.read_u64());
            break;
        case kBytes:
            node.bytes = read_escaped(false);
            break;
        case kArray:
            while (next_entry()) {
                node.children.push_back(read_node(depth + 1));
            }
            break;
        case kDocument:
            while (next_entry()) {
                node.names.push_back(read_escaped(true));
                if (!is_valid_utf8(node.names.back())) {
                    reader_.fail("invalid UTF-8 field name");
                }
                node.children.push_back(read_node(depth + 1));
            }
            break;
        default:
            reader_.fail("unknown key family " + std::to_string(node.family));
        }
        return node;
    }

    /// Consume an entry marker: true before another element, false at the end.
    bool next_entry()
    {
        const std::uint8_t b = reader_.read_u8();
        if (b == kEntry) {
            return true;
        }
        if (b != kEnd) {
            reader_.fail("expected entry marker");
        }
        return false;
    }

    std::string read_escaped(bool complement)
    {
        const std::uint8_t mask = complement ? 0xFF : 0x00;
        std::string out;
        while (true) {
            const std::uint8_t b = reader_.read_u8() ^ mask;
            if (b != 0x00) {
                out += static_cast<char>(b);
                continue;
            }
            const std::uint8_t next = reader_.read_u8() ^ mask;
            if (next == 0xFF) {
                out += '\0';
            } else if (next == 0x01) {
                return out;
            } else {
                reader_.fail("invalid escape sequence");
            }
        }
    }

    Value build(const Node& node)
    {
        switch (node.family) {
        case kNull:
            return Value{};
        case kNumeric:
            return build_number(node.number);
        case kDuration:
            return Duration{node.duration};
        case kBytes: {
            const std::uint8_t subtype = reader_.read_u8();
            if (subtype == kText) {
                if (!is_valid_utf8(node.bytes)) {
                    reader_.fail("invalid UTF-8 text");
                }
                return node.bytes;
            }
            if (subtype == kBlob) {
                return Blob(node.bytes.begin(), node.bytes.end());
            }
            reader_.fail("trailer does not match a bytes value");
        }
        case kArray: {
            auto buf = std::make_shared<ValueBuffer>();
            for (const auto& child : node.children) {
                buf->append(build(child));
            }
            return buf;
        }
        default: {
            auto buf = std::make_shared<FieldBuffer>();
            for (std::size_t i = 0; i < node.children.size(); ++i) {
                buf->add(node.names[i], build(node.children[i]));
            }
            return buf;
        }
        }
    }

    Value build_number(double number)
    {
        switch (reader_.read_u8()) {
        case kBool:
            if (number != 0.0 && number != 1.0) {
                reader_.fail("bool key outside 0 and 1");
            }
            return number == 1.0;
        case kInteger: {
            const std::int64_t i = int64_from_sortable(reader_.read_u64());
            if (static_cast<double>(i) != number) {
                reader_.fail("integer trailer does not match the key body");
            }
            return i;
        }
        case kDouble:
            return number;
        case kNegativeZero:
            if (number != 0.0) {
                reader_.fail("negative zero trailer on a non-zero key");
            }
            return -0.0;
        default:
            reader_.fail("trailer does not match a numeric value");
        }
    }

    ByteReader reader_;
};

} // anonymous namespace

ByteBuffer encode_key(const Value& v)
{
    KeyEncoder encoder;
    encoder.encode(v);
    return encoder.finish();
}

Value decode_key(std::span<const std::uint8_t> key)
{
    KeyDecoder decoder(key);
    return decoder.decode();
}

} // namespace docmodel
