// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/json.h>

#include <docmodel/document.h>
#include <docmodel/format.h>
#include <docmodel/log.h>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace docmodel {

// ============================================================
// JSON Writer
// ============================================================

namespace {

std::string json_escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level);

void write_document(const Document& doc, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    oss << "{";
    bool first = true;
    doc.iterate([&](const std::string& field, const Value& value) {
        if (!first) oss << ",";
        oss << newline << child_indent;
        oss << "\"" << json_escape_string(field) << "\":" << space_after_colon;
        to_json_impl(value, oss, compact, indent_level + 1);
        first = false;
    });
    if (!first) oss << newline << indent;
    oss << "}";
}

void write_array(const Array& arr, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";

    oss << "[";
    bool first = true;
    arr.iterate([&](std::size_t, const Value& value) {
        if (!first) oss << ",";
        oss << newline << child_indent;
        to_json_impl(value, oss, compact, indent_level + 1);
        first = false;
    });
    if (!first) oss << newline << indent;
    oss << "]";
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(arg)) {
                oss << format_double(arg);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, Duration>) {
            oss << "\"" << json_escape_string(format_duration(arg)) << "\"";
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, Blob>) {
            oss << "\"" << base64_encode(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
            write_array(*arg, oss, compact, indent_level);
        } else {
            write_document(*arg, oss, compact, indent_level);
        }
    }, val.data());
}

// ============================================================
// JSON Parser
//
// Parses eagerly (parse_value), lazily (parse_lazy_value, with a shared
// text), or only validates and skips (skip_value).
// ============================================================

class JsonParser {
public:
    JsonParser(std::string_view json, std::size_t pos = 0,
               std::shared_ptr<const std::string> owner = {})
        : json_(json), pos_(pos), owner_(std::move(owner)) {}

    std::size_t position() const { return pos_; }

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() &&
               (json_[pos_] == ' ' || json_[pos_] == '\t' || json_[pos_] == '\n' || json_[pos_] == '\r')) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            fail(std::string("expected '") + c + "'", pos_ == 0 ? 0 : pos_ - 1);
        }
    }

    void expect_end() {
        skip_whitespace();
        if (pos_ < json_.size()) {
            fail("unexpected trailing characters", pos_);
        }
    }

    [[noreturn]] void fail(const std::string& message, std::size_t at) const {
        detail::log_access_error("json", message + " at position " + std::to_string(at));
        throw ParseError(message, at);
    }

    Value parse_value() {
        skip_whitespace();
        const char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        return parse_scalar();
    }

    /// Like parse_value, but objects and arrays become views over owner_.
    Value parse_lazy_value() {
        skip_whitespace();
        const char c = peek();
        const std::size_t start = pos_;

        if (c == '{') {
            skip_value();
            return std::make_shared<JsonDocument>(owner_, start);
        }
        if (c == '[') {
            skip_value();
            return std::make_shared<JsonArray>(owner_, start);
        }
        return parse_scalar();
    }

    /// Validate one value and move past it.
    void skip_value() {
        skip_whitespace();
        const char c = peek();

        if (c == '{') {
            enter();
            consume();
            skip_whitespace();
            if (peek() == '}') {
                consume();
                --depth_;
                return;
            }
            while (true) {
                skip_whitespace();
                (void)parse_string_raw();
                expect(':');
                skip_value();
                skip_whitespace();
                const char d = consume();
                if (d == '}') break;
                if (d != ',') fail("expected ',' or '}' in object", pos_ - 1);
            }
            --depth_;
            return;
        }
        if (c == '[') {
            enter();
            consume();
            skip_whitespace();
            if (peek() == ']') {
                consume();
                --depth_;
                return;
            }
            while (true) {
                skip_value();
                skip_whitespace();
                const char d = consume();
                if (d == ']') break;
                if (d != ',') fail("expected ',' or ']' in array", pos_ - 1);
            }
            --depth_;
            return;
        }
        (void)parse_scalar();
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            const char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string", pos_ - 1);
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                break;
            }
            const char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u':  append_utf8(result, parse_unicode_escape()); break;
                default:
                    fail(std::string("invalid escape sequence \\") + escaped, pos_ - 1);
            }
        }

        fail("unterminated string", pos_);
    }

    /// Records (name, value offset) pairs of the object at the cursor and skips it.
    std::vector<std::pair<std::string, std::size_t>> index_object() {
        std::vector<std::pair<std::string, std::size_t>> entries;
        expect('{');
        skip_whitespace();
        if (peek() == '}') {
            consume();
            return entries;
        }
        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            skip_whitespace();
            entries.emplace_back(std::move(key), pos_);
            skip_value();
            skip_whitespace();
            const char d = consume();
            if (d == '}') return entries;
            if (d != ',') fail("expected ',' or '}' in object", pos_ - 1);
        }
    }

    /// Records the offsets of the elements of the array at the cursor and skips it.
    std::vector<std::size_t> index_array() {
        std::vector<std::size_t> offsets;
        expect('[');
        skip_whitespace();
        if (peek() == ']') {
            consume();
            return offsets;
        }
        while (true) {
            skip_whitespace();
            offsets.push_back(pos_);
            skip_value();
            skip_whitespace();
            const char d = consume();
            if (d == ']') return offsets;
            if (d != ',') fail("expected ',' or ']' in array", pos_ - 1);
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;
    std::shared_ptr<const std::string> owner_;
    std::size_t depth_ = 0;

    void enter() {
        if (depth_ >= kMaxNestingDepth) {
            fail("nesting deeper than " + std::to_string(kMaxNestingDepth), pos_);
        }
        ++depth_;
    }

    Value parse_scalar() {
        const char c = peek();
        if (c == '"') return parse_string_raw();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        if (pos_ >= json_.size()) fail("unexpected end of input", pos_);
        fail(std::string("unexpected character '") + c + "'", pos_);
    }

    Value parse_object() {
        skip_whitespace();
        enter();
        expect('{');
        skip_whitespace();

        auto buf = std::make_shared<FieldBuffer>();
        if (peek() == '}') {
            consume();
            --depth_;
            return buf;
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            buf->add(std::move(key), parse_value());

            skip_whitespace();
            const char c = consume();
            if (c == '}') break;
            if (c != ',') fail("expected ',' or '}' in object", pos_ - 1);
        }
        --depth_;
        return buf;
    }

    Value parse_array() {
        skip_whitespace();
        enter();
        expect('[');
        skip_whitespace();

        auto buf = std::make_shared<ValueBuffer>();
        if (peek() == ']') {
            consume();
            --depth_;
            return buf;
        }

        while (true) {
            buf->append(parse_value());

            skip_whitespace();
            const char c = consume();
            if (c == ']') break;
            if (c != ',') fail("expected ',' or ']' in array", pos_ - 1);
        }
        --depth_;
        return buf;
    }

    std::uint32_t parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            fail("truncated unicode escape", pos_);
        }
        std::uint32_t cp = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, cp, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            fail("invalid unicode escape", pos_);
        }
        pos_ += 4;
        return cp;
    }

    std::uint32_t parse_unicode_escape() {
        const std::uint32_t cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (json_.substr(pos_, 2) != "\\u") {
                fail("unpaired surrogate in unicode escape", pos_);
            }
            pos_ += 2;
            const std::uint32_t low = parse_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate in unicode escape", pos_ - 4);
            }
            return 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired surrogate in unicode escape", pos_ - 4);
        }
        return cp;
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    Value parse_number() {
        const std::size_t start = pos_;
        bool has_decimal = false;
        bool has_exponent = false;

        if (peek() == '-') consume();
        if (!(peek() >= '0' && peek() <= '9')) {
            fail("invalid number", start);
        }

        while (pos_ < json_.size()) {
            const char c = peek();
            if (c >= '0' && c <= '9') {
                consume();
            } else if (c == '.' && !has_decimal && !has_exponent) {
                has_decimal = true;
                consume();
            } else if ((c == 'e' || c == 'E') && !has_exponent) {
                has_exponent = true;
                consume();
                if (peek() == '+' || peek() == '-') consume();
            } else {
                break;
            }
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (!has_decimal && !has_exponent) {
            std::int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last) {
                return i;
            }
            // falls through: integer token outside the int64 range
        }

        double d = 0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ptr != last || (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
            fail("invalid number", start);
        }
        if (ec == std::errc::result_out_of_range) {
            fail("number out of range", start);
        }
        return d;
    }

    Value parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return true;
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return false;
        }
        fail("expected 'true' or 'false'", pos_);
    }

    Value parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        fail("expected 'null'", pos_);
    }
};

/// Validate @p text as one JSON value and return the offset of its first character.
std::size_t validate(const std::string& text)
{
    JsonParser parser(text);
    parser.skip_whitespace();
    const std::size_t start = parser.position();
    parser.skip_value();
    parser.expect_end();
    return start;
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

std::string to_json(const Document& doc, bool compact)
{
    std::ostringstream oss;
    write_document(doc, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json)
{
    JsonParser parser(json);
    parser.skip_whitespace();
    if (parser.position() >= json.size()) {
        parser.fail("empty JSON input", parser.position());
    }
    Value v = parser.parse_value();
    parser.expect_end();
    return v;
}

DocumentPtr document_from_json(std::string json)
{
    auto text = std::make_shared<const std::string>(std::move(json));
    const std::size_t start = validate(*text);
    if ((*text)[start] != '{') {
        throw TypeMismatchError("JSON value is not an object");
    }
    return std::make_shared<JsonDocument>(std::move(text), start);
}

ArrayPtr array_from_json(std::string json)
{
    auto text = std::make_shared<const std::string>(std::move(json));
    const std::size_t start = validate(*text);
    if ((*text)[start] != '[') {
        throw TypeMismatchError("JSON value is not an array");
    }
    return std::make_shared<JsonArray>(std::move(text), start);
}

// ============================================================
// JsonDocument / JsonArray
// ============================================================

JsonDocument::JsonDocument(std::shared_ptr<const std::string> text, std::size_t offset)
    : text_(std::move(text))
{
    JsonParser parser(*text_, offset);
    fields_ = parser.index_object();
}

void JsonDocument::iterate(const FieldCallback& fn) const
{
    for (const auto& [name, offset] : fields_) {
        JsonParser parser(*text_, offset, text_);
        fn(name, parser.parse_lazy_value());
    }
}

Value JsonDocument::get_by_field(std::string_view field) const
{
    for (const auto& [name, offset] : fields_) {
        if (name == field) {
            JsonParser parser(*text_, offset, text_);
            return parser.parse_lazy_value();
        }
    }
    throw FieldNotFoundError(field);
}

JsonArray::JsonArray(std::shared_ptr<const std::string> text, std::size_t offset)
    : text_(std::move(text))
{
    JsonParser parser(*text_, offset);
    elements_ = parser.index_array();
}

void JsonArray::iterate(const ElementCallback& fn) const
{
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        JsonParser parser(*text_, elements_[i], text_);
        fn(i, parser.parse_lazy_value());
    }
}

Value JsonArray::get_by_index(std::size_t index) const
{
    if (index >= elements_.size()) {
        throw IndexOutOfRangeError(index, elements_.size());
    }
    JsonParser parser(*text_, elements_[index], text_);
    return parser.parse_lazy_value();
}

} // namespace docmodel
