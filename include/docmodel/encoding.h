// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file encoding.h
/// @brief Self-describing streaming codec for values and documents.
///
/// ## Format
///
/// Every value starts with its ValueType code as a one-byte tag:
///
/// | Type      | Payload                                                         |
/// |-----------|-----------------------------------------------------------------|
/// | Null      | none                                                            |
/// | Bool      | 1 byte, 0x00 or 0x01                                            |
/// | Integer   | 8 bytes, sortable int64 (see sortable.h)                        |
/// | Double    | 8 bytes, sortable double                                        |
/// | Duration  | 8 bytes, sortable int64 nanoseconds                             |
/// | Text/Blob | sortable base64 of the bytes, ends at the first non-base64 byte |
/// | Array     | elements separated by 0x1F, closed by 0x1E                      |
/// | Document  | `b64(name) 0x1C value` entries separated by 0x1C, closed by 0x1D|
///
/// Tags (>= 0x80) and delimiters (< 0x20) are outside the base64 alphabet, so
/// text and blob payloads need no length prefix and a decoder never backtracks.
///
/// ## Decoding
///
/// - decode_value() / decode_document(): eager, produces FieldBuffer / ValueBuffer
/// - decode_value_lazy(): composite values become EncodedDocument / EncodedArray
///   views that decode fields only when accessed
/// - StreamDecoder: accepts input in arbitrary chunks and yields complete values
///
/// Malformed input (truncation, unknown tag, bad or non-canonical base64,
/// invalid UTF-8 text, nesting deeper than kMaxNestingDepth, trailing bytes)
/// throws MalformedEncodingError with the failing byte offset.

#pragma once

#include "value.h"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace docmodel {

class ByteWriter;

namespace delim {
inline constexpr std::uint8_t kArrayValue = 0x1F;
inline constexpr std::uint8_t kArrayEnd = 0x1E;
inline constexpr std::uint8_t kDocumentValue = 0x1C;
inline constexpr std::uint8_t kDocumentEnd = 0x1D;
} // namespace delim

DOCMODEL_API void encode_value(ByteWriter& w, const Value& v);
[[nodiscard]] DOCMODEL_API ByteBuffer encode_value(const Value& v);
[[nodiscard]] DOCMODEL_API ByteBuffer encode_document(const Document& doc);

/// Decode exactly one value spanning all of @p data.
[[nodiscard]] DOCMODEL_API Value decode_value(std::span<const std::uint8_t> data);

/// Decode exactly one document spanning all of @p data.
[[nodiscard]] DOCMODEL_API DocumentPtr decode_document(std::span<const std::uint8_t> data);

/// Validate all of @p bytes (structure, base64, UTF-8 of text and field
/// names, nesting depth) and return a value whose documents and arrays are
/// views sharing @p bytes. Accessing the views never fails on the bytes.
[[nodiscard]] DOCMODEL_API Value decode_value_lazy(std::shared_ptr<const ByteBuffer> bytes);

/// Length of the first encoded value in @p data, or nullopt when @p data ends
/// before the value does. With @p end_of_input false, a text or blob running
/// to the end of @p data counts as incomplete.
/// @throws MalformedEncodingError when the bytes can never form a valid value
[[nodiscard]] DOCMODEL_API std::optional<std::size_t> measure_value(std::span<const std::uint8_t> data,
                                                                    bool end_of_input = true);

// ============================================================
// ValueScanner
// ============================================================

/// Resumable forward scan over one encoded value.
///
/// The scan keeps an explicit stack of open arrays and documents, so deeply
/// nested input costs heap, not native stack. It checks everything the
/// decoder checks; a value that scans cleanly always decodes.
///
/// scan() may be called again with a longer @p data (the same bytes followed
/// by more input) after it returned false; it resumes where it stopped.
class DOCMODEL_API ValueScanner {
public:
    /// @p base is the absolute offset of data[0], used in error offsets.
    explicit ValueScanner(std::size_t base = 0) : base_(base) {}

    /// True once a whole value has been scanned, false when @p data ends first.
    /// @throws MalformedEncodingError
    [[nodiscard]] bool scan(std::span<const std::uint8_t> data, bool end_of_input);

    /// Bytes scanned so far; the value length once scan() returned true.
    [[nodiscard]] std::size_t length() const noexcept { return pos_; }

private:
    enum class State : std::uint8_t {
        Value,
        BoolPayload,
        FixedPayload,
        TextPayload,
        BlobPayload,
        FieldName,
        FieldSeparator,
        Open,
        Delimiter,
        Done,
    };

    bool finish_value() noexcept;
    void check_run(std::span<const std::uint8_t> data) const;
    [[noreturn]] void fail(const std::string& message, std::size_t pos) const;

    std::size_t base_;
    std::size_t pos_ = 0;
    State state_ = State::Value;
    std::size_t fixed_left_ = 0;
    std::size_t run_start_ = 0;
    std::vector<ValueType> open_;
};

// ============================================================
// StreamDecoder
// ============================================================

/// Incremental decoder for a sequence of concatenated values.
///
/// @code
/// StreamDecoder decoder;
/// while (auto chunk = source.read()) {
///     decoder.feed(*chunk);
///     while (auto v = decoder.next()) {
///         handle(*v);
///     }
/// }
/// for (auto& v : decoder.finish()) {
///     handle(v);
/// }
/// @endcode
class DOCMODEL_API StreamDecoder {
public:
    void feed(std::span<const std::uint8_t> chunk);

    /// Next complete value, or nullopt until more input arrives.
    [[nodiscard]] std::optional<Value> next();

    /// Decode everything still buffered, treating the input as ended.
    /// @throws MalformedEncodingError when the last value is truncated
    [[nodiscard]] std::vector<Value> finish();

    [[nodiscard]] std::size_t buffered() const noexcept { return pending_.size() - head_; }

    /// Bytes consumed by returned values since construction.
    [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

private:
    std::span<const std::uint8_t> unread() const noexcept;
    Value take();

    ByteBuffer pending_;
    std::size_t head_ = 0; // start of the unread bytes in pending_
    std::size_t consumed_ = 0;
    ValueScanner scanner_;
};

// ============================================================
// Lazy views
// ============================================================

/// Document view over an encoded document inside a shared buffer.
class DOCMODEL_API EncodedDocument final : public Document {
public:
    /// @p offset points at the document tag, @p length covers the whole document.
    EncodedDocument(std::shared_ptr<const ByteBuffer> bytes, std::size_t offset, std::size_t length);

    void iterate(const FieldCallback& fn) const override;
    [[nodiscard]] Value get_by_field(std::string_view field) const override;

private:
    std::shared_ptr<const ByteBuffer> bytes_;
    std::size_t offset_;
    std::size_t length_;
};

/// Array view over an encoded array; element offsets are indexed on construction.
class DOCMODEL_API EncodedArray final : public Array {
public:
    EncodedArray(std::shared_ptr<const ByteBuffer> bytes, std::size_t offset, std::size_t length);

    void iterate(const ElementCallback& fn) const override;
    [[nodiscard]] Value get_by_index(std::size_t index) const override;
    [[nodiscard]] std::size_t size() const override { return elements_.size(); }

private:
    std::shared_ptr<const ByteBuffer> bytes_;
    std::vector<std::pair<std::size_t, std::size_t>> elements_; // (offset, length)
};

} // namespace docmodel
