// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/encoding.h>

#include <docmodel/document.h>
#include <docmodel/format.h>
#include <docmodel/log.h>
#include <docmodel/sortable.h>

#include <algorithm>

namespace docmodel {

namespace {

[[noreturn]] void malformed(const std::string& message, std::size_t offset)
{
    detail::log_decode_error("decode", offset, message);
    throw MalformedEncodingError(message, offset);
}

bool is_known_tag(std::uint8_t tag) noexcept
{
    switch (static_cast<ValueType>(tag)) {
    case ValueType::Null:
    case ValueType::Bool:
    case ValueType::Integer:
    case ValueType::Double:
    case ValueType::Duration:
    case ValueType::Text:
    case ValueType::Blob:
    case ValueType::Array:
    case ValueType::Document:
        return true;
    }
    return false;
}

// ============================================================
// Decoder
//
// Reads values from a span whose first byte sits at absolute offset `base`.
// With an owner buffer, composite values become lazy views into it.
// ============================================================

class Decoder {
public:
    Decoder(std::span<const std::uint8_t> data, std::size_t base, std::shared_ptr<const ByteBuffer> owner = {})
        : data_(data), base_(base), reader_(data, base), owner_(std::move(owner)) {}

    ByteReader& reader() noexcept { return reader_; }

    Value read_value()
    {
        const std::size_t start = reader_.offset();
        const std::uint8_t tag = reader_.peek();
        if (owner_ && (tag == static_cast<std::uint8_t>(ValueType::Array) ||
                       tag == static_cast<std::uint8_t>(ValueType::Document))) {
            const std::size_t length = skip();
            if (tag == static_cast<std::uint8_t>(ValueType::Array)) {
                return std::make_shared<EncodedArray>(owner_, start, length);
            }
            return std::make_shared<EncodedDocument>(owner_, start, length);
        }

        (void)reader_.read_u8();
        switch (static_cast<ValueType>(tag)) {
        case ValueType::Null:
            return Value{};
        case ValueType::Bool: {
            const std::uint8_t b = reader_.read_u8();
            if (b > 1) {
                malformed("invalid bool payload", reader_.offset() - 1);
            }
            return b == 1;
        }
        case ValueType::Integer:
            return int64_from_sortable(reader_.read_u64());
        case ValueType::Double:
            return double_from_sortable(reader_.read_u64());
        case ValueType::Duration:
            return Duration{int64_from_sortable(reader_.read_u64())};
        case ValueType::Text:
            return read_text();
        case ValueType::Blob:
            return read_blob();
        case ValueType::Array: {
            enter(start);
            auto buf = std::make_shared<ValueBuffer>();
            for_each_element([&](Decoder& d) {
                buf->append(d.read_value());
            });
            --depth_;
            return buf;
        }
        case ValueType::Document: {
            enter(start);
            auto buf = std::make_shared<FieldBuffer>();
            for_each_field([&](std::string name, Decoder& d) {
                buf->add(std::move(name), d.read_value());
                return true;
            });
            --depth_;
            return buf;
        }
        }
        malformed("unknown type tag", start);
    }

    /// Skip one value, returning its length.
    std::size_t skip()
    {
        ValueScanner scanner(reader_.offset());
        if (!scanner.scan(data_.subspan(reader_.position()), true)) {
            malformed("truncated value", base_ + data_.size());
        }
        (void)reader_.read_bytes(scanner.length());
        return scanner.length();
    }

    /// Visit the entries of a document whose tag was just consumed.
    /// @p on_field(name, decoder) must read or skip the value and returns
    /// false to stop early.
    template <typename OnField>
    void for_each_field(OnField&& on_field)
    {
        if (reader_.peek() == delim::kDocumentEnd) {
            (void)reader_.read_u8();
            return;
        }
        while (true) {
            std::string name = read_name();
            reader_.expect(delim::kDocumentValue, "field separator");
            if (!on_field(std::move(name), *this)) {
                return;
            }
            const std::uint8_t d = reader_.read_u8();
            if (d == delim::kDocumentEnd) {
                return;
            }
            if (d != delim::kDocumentValue) {
                malformed("expected document delimiter", reader_.offset() - 1);
            }
        }
    }

    /// Visit the elements of an array whose tag was just consumed.
    template <typename OnElement>
    void for_each_element(OnElement&& on_element)
    {
        if (reader_.peek() == delim::kArrayEnd) {
            (void)reader_.read_u8();
            return;
        }
        while (true) {
            on_element(*this);
            const std::uint8_t d = reader_.read_u8();
            if (d == delim::kArrayEnd) {
                return;
            }
            if (d != delim::kArrayValue) {
                malformed("expected array delimiter", reader_.offset() - 1);
            }
        }
    }

private:
    void enter(std::size_t offset)
    {
        if (depth_ >= kMaxNestingDepth) {
            malformed("nesting deeper than " + std::to_string(kMaxNestingDepth), offset);
        }
        ++depth_;
    }

    Blob read_base64()
    {
        const std::size_t start = reader_.offset();
        const std::string_view text = reader_.read_sortable_base64();
        if (text.size() % 4 == 1) {
            malformed("impossible base64 length", reader_.offset());
        }
        return decode_sortable_base64(text, start);
    }

    std::string read_checked_text(std::size_t start)
    {
        const Blob bytes = read_base64();
        std::string s(bytes.begin(), bytes.end());
        if (!is_valid_utf8(s)) {
            malformed("invalid UTF-8 text", start);
        }
        return s;
    }

    Value read_text() { return read_checked_text(reader_.offset()); }
    Value read_blob() { return read_base64(); }
    std::string read_name() { return read_checked_text(reader_.offset()); }

    std::span<const std::uint8_t> data_;
    std::size_t base_;
    ByteReader reader_;
    std::shared_ptr<const ByteBuffer> owner_;
    std::size_t depth_ = 0;
};

} // anonymous namespace

// ============================================================
// ValueScanner
// ============================================================

void ValueScanner::fail(const std::string& message, std::size_t pos) const
{
    malformed(message, base_ + pos);
}

bool ValueScanner::finish_value() noexcept
{
    state_ = open_.empty() ? State::Done : State::Delimiter;
    return open_.empty();
}

void ValueScanner::check_run(std::span<const std::uint8_t> data) const
{
    const std::string_view run(reinterpret_cast<const char*>(data.data()) + run_start_, pos_ - run_start_);
    const Blob bytes = decode_sortable_base64(run, base_ + run_start_);
    if (state_ != State::BlobPayload &&
        !is_valid_utf8(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()))) {
        fail(state_ == State::FieldName ? "invalid UTF-8 field name" : "invalid UTF-8 text", run_start_);
    }
}

bool ValueScanner::scan(std::span<const std::uint8_t> data, bool end_of_input)
{
    while (true) {
        switch (state_) {
        case State::Done:
            return true;

        case State::Value: {
            if (pos_ >= data.size()) {
                return false;
            }
            const std::uint8_t tag = data[pos_];
            if (!is_known_tag(tag)) {
                fail("unknown type tag", pos_);
            }
            ++pos_;
            switch (static_cast<ValueType>(tag)) {
            case ValueType::Null:
                if (finish_value()) {
                    return true;
                }
                break;
            case ValueType::Bool:
                state_ = State::BoolPayload;
                break;
            case ValueType::Integer:
            case ValueType::Double:
            case ValueType::Duration:
                fixed_left_ = 8;
                state_ = State::FixedPayload;
                break;
            case ValueType::Text:
                run_start_ = pos_;
                state_ = State::TextPayload;
                break;
            case ValueType::Blob:
                run_start_ = pos_;
                state_ = State::BlobPayload;
                break;
            case ValueType::Array:
            case ValueType::Document:
                if (open_.size() >= kMaxNestingDepth) {
                    fail("nesting deeper than " + std::to_string(kMaxNestingDepth), pos_ - 1);
                }
                open_.push_back(static_cast<ValueType>(tag));
                state_ = State::Open;
                break;
            }
            break;
        }

        case State::BoolPayload:
            if (pos_ >= data.size()) {
                return false;
            }
            if (data[pos_] > 1) {
                fail("invalid bool payload", pos_);
            }
            ++pos_;
            if (finish_value()) {
                return true;
            }
            break;

        case State::FixedPayload: {
            const std::size_t n = std::min(fixed_left_, data.size() - pos_);
            pos_ += n;
            fixed_left_ -= n;
            if (fixed_left_ > 0) {
                return false;
            }
            if (finish_value()) {
                return true;
            }
            break;
        }

        case State::TextPayload:
        case State::BlobPayload:
        case State::FieldName:
            while (pos_ < data.size() && is_sortable_base64(data[pos_])) {
                ++pos_;
            }
            // a name is always followed by a separator; a payload may end the input
            if (pos_ == data.size() && (state_ == State::FieldName || !end_of_input)) {
                return false;
            }
            check_run(data);
            if (state_ == State::FieldName) {
                state_ = State::FieldSeparator;
            } else if (finish_value()) {
                return true;
            }
            break;

        case State::FieldSeparator:
            if (pos_ >= data.size()) {
                return false;
            }
            if (data[pos_] != delim::kDocumentValue) {
                fail("expected field separator", pos_);
            }
            ++pos_;
            state_ = State::Value;
            break;

        case State::Open: {
            if (pos_ >= data.size()) {
                return false;
            }
            const bool is_array = open_.back() == ValueType::Array;
            if (data[pos_] == (is_array ? delim::kArrayEnd : delim::kDocumentEnd)) {
                ++pos_;
                open_.pop_back();
                if (finish_value()) {
                    return true;
                }
                break;
            }
            run_start_ = pos_;
            state_ = is_array ? State::Value : State::FieldName;
            break;
        }

        case State::Delimiter: {
            if (pos_ >= data.size()) {
                return false;
            }
            const std::uint8_t d = data[pos_++];
            if (open_.back() == ValueType::Array) {
                if (d == delim::kArrayValue) {
                    state_ = State::Value;
                    break;
                }
                if (d != delim::kArrayEnd) {
                    fail("expected array delimiter", pos_ - 1);
                }
            } else {
                if (d == delim::kDocumentValue) {
                    run_start_ = pos_;
                    state_ = State::FieldName;
                    break;
                }
                if (d != delim::kDocumentEnd) {
                    fail("expected document delimiter", pos_ - 1);
                }
            }
            open_.pop_back();
            if (finish_value()) {
                return true;
            }
            break;
        }
        }
    }
}

// ============================================================
// Encoding
// ============================================================

void encode_value(ByteWriter& w, const Value& v)
{
    w.write_u8(static_cast<std::uint8_t>(v.type()));
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // tag only
        } else if constexpr (std::is_same_v<T, bool>) {
            w.write_u8(arg ? 0x01 : 0x00);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            w.write_u64(sortable_from_int64(arg));
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_u64(sortable_from_double(arg));
        } else if constexpr (std::is_same_v<T, Duration>) {
            w.write_u64(sortable_from_int64(arg.count()));
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.write_bytes(encode_sortable_base64(
                std::span(reinterpret_cast<const std::uint8_t*>(arg.data()), arg.size())));
        } else if constexpr (std::is_same_v<T, Blob>) {
            w.write_bytes(encode_sortable_base64(arg));
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
            bool first = true;
            arg->iterate([&](std::size_t, const Value& element) {
                if (!first) {
                    w.write_u8(delim::kArrayValue);
                }
                first = false;
                encode_value(w, element);
            });
            w.write_u8(delim::kArrayEnd);
        } else {
            bool first = true;
            arg->iterate([&](const std::string& field, const Value& value) {
                if (!first) {
                    w.write_u8(delim::kDocumentValue);
                }
                first = false;
                w.write_bytes(encode_sortable_base64(
                    std::span(reinterpret_cast<const std::uint8_t*>(field.data()), field.size())));
                w.write_u8(delim::kDocumentValue);
                encode_value(w, value);
            });
            w.write_u8(delim::kDocumentEnd);
        }
    }, v.data());
}

ByteBuffer encode_value(const Value& v)
{
    ByteWriter w;
    encode_value(w, v);
    return w.release();
}

ByteBuffer encode_document(const Document& doc)
{
    // non-owning alias, doc outlives the call
    return encode_value(Value(DocumentPtr(std::shared_ptr<const Document>{}, &doc)));
}

// ============================================================
// Decoding
// ============================================================

std::optional<std::size_t> measure_value(std::span<const std::uint8_t> data, bool end_of_input)
{
    ValueScanner scanner;
    if (!scanner.scan(data, end_of_input)) {
        return std::nullopt;
    }
    return scanner.length();
}

Value decode_value(std::span<const std::uint8_t> data)
{
    Decoder d(data, 0);
    Value v = d.read_value();
    if (!d.reader().at_end()) {
        malformed("trailing bytes after value", d.reader().offset());
    }
    return v;
}

DocumentPtr decode_document(std::span<const std::uint8_t> data)
{
    if (!data.empty() && data[0] != static_cast<std::uint8_t>(ValueType::Document)) {
        malformed("expected a document tag", 0);
    }
    return decode_value(data).document_ptr();
}

Value decode_value_lazy(std::shared_ptr<const ByteBuffer> bytes)
{
    const std::span<const std::uint8_t> data(*bytes);
    const auto length = measure_value(data, true);
    if (!length) {
        malformed("truncated value", data.size());
    }
    if (*length != data.size()) {
        malformed("trailing bytes after value", *length);
    }
    Decoder d(data, 0, std::move(bytes));
    return d.read_value();
}

// ============================================================
// StreamDecoder
// ============================================================

void StreamDecoder::feed(std::span<const std::uint8_t> chunk)
{
    pending_.insert(pending_.end(), chunk.begin(), chunk.end());
}

std::span<const std::uint8_t> StreamDecoder::unread() const noexcept
{
    return std::span<const std::uint8_t>(pending_).subspan(head_);
}

Value StreamDecoder::take()
{
    const std::size_t length = scanner_.length();
    Decoder d(unread().first(length), consumed_);
    Value v = d.read_value();
    head_ += length;
    consumed_ += length;
    if (head_ * 2 >= pending_.size()) {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
    scanner_ = ValueScanner(consumed_);
    return v;
}

std::optional<Value> StreamDecoder::next()
{
    if (!scanner_.scan(unread(), false)) {
        return std::nullopt;
    }
    return take();
}

std::vector<Value> StreamDecoder::finish()
{
    std::vector<Value> out;
    while (buffered() > 0) {
        if (!scanner_.scan(unread(), true)) {
            malformed("truncated value at end of stream", consumed_ + buffered());
        }
        out.push_back(take());
    }
    return out;
}

// ============================================================
// EncodedDocument
// ============================================================

EncodedDocument::EncodedDocument(std::shared_ptr<const ByteBuffer> bytes, std::size_t offset, std::size_t length)
    : bytes_(std::move(bytes)), offset_(offset), length_(length)
{}

void EncodedDocument::iterate(const FieldCallback& fn) const
{
    Decoder d(std::span<const std::uint8_t>(*bytes_).subspan(offset_, length_), offset_, bytes_);
    (void)d.reader().read_u8();
    d.for_each_field([&fn](std::string name, Decoder& inner) {
        const Value v = inner.read_value();
        fn(name, v);
        return true;
    });
}

Value EncodedDocument::get_by_field(std::string_view field) const
{
    Decoder d(std::span<const std::uint8_t>(*bytes_).subspan(offset_, length_), offset_, bytes_);
    (void)d.reader().read_u8();
    std::optional<Value> found;
    d.for_each_field([&](std::string name, Decoder& inner) {
        if (name != field) {
            (void)inner.skip();
            return true;
        }
        found = inner.read_value();
        return false;
    });
    if (!found) {
        throw FieldNotFoundError(field);
    }
    return std::move(*found);
}

// ============================================================
// EncodedArray
// ============================================================

EncodedArray::EncodedArray(std::shared_ptr<const ByteBuffer> bytes, std::size_t offset, std::size_t length)
    : bytes_(std::move(bytes))
{
    Decoder d(std::span<const std::uint8_t>(*bytes_).subspan(offset, length), offset);
    (void)d.reader().read_u8();
    d.for_each_element([this](Decoder& inner) {
        const std::size_t start = inner.reader().offset();
        const std::size_t n = inner.skip();
        elements_.emplace_back(start, n);
    });
}

void EncodedArray::iterate(const ElementCallback& fn) const
{
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        fn(i, get_by_index(i));
    }
}

Value EncodedArray::get_by_index(std::size_t index) const
{
    if (index >= elements_.size()) {
        throw IndexOutOfRangeError(index, elements_.size());
    }
    const auto [offset, length] = elements_[index];
    Decoder d(std::span<const std::uint8_t>(*bytes_).subspan(offset, length), offset, bytes_);
    return d.read_value();
}

} // namespace docmodel
