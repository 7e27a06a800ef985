// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sortable.h
/// @brief Order-preserving primitive transforms and the byte cursors used by both codecs.
///
/// Each transform maps a primitive to bytes whose unsigned lexicographic order
/// matches the natural order of the primitive:
///
/// - int64: big-endian of (x XOR 2^63)
/// - double: big-endian IEEE-754 bits, sign bit flipped for x >= 0,
///   all bits flipped for x < 0
/// - bytes: base64 over the alphabet "-0-9A-Z_a-z" (ascending ASCII), unpadded

#pragma once

#include "value.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace docmodel {

[[nodiscard]] constexpr std::uint64_t sortable_from_int64(std::int64_t x) noexcept
{
    return static_cast<std::uint64_t>(x) ^ (std::uint64_t{1} << 63);
}

[[nodiscard]] constexpr std::int64_t int64_from_sortable(std::uint64_t u) noexcept
{
    return static_cast<std::int64_t>(u ^ (std::uint64_t{1} << 63));
}

[[nodiscard]] DOCMODEL_API std::uint64_t sortable_from_double(double x) noexcept;
[[nodiscard]] DOCMODEL_API double double_from_sortable(std::uint64_t u) noexcept;

/// True for the 64 characters of the sortable base64 alphabet.
[[nodiscard]] DOCMODEL_API bool is_sortable_base64(std::uint8_t c) noexcept;

[[nodiscard]] DOCMODEL_API std::string encode_sortable_base64(std::span<const std::uint8_t> bytes);

/// Strict decoding: the unused low bits of the final character must be zero,
/// so every Blob has exactly one encoding.
/// @throws MalformedEncodingError (offset @p base + position in @p text) on a
///         character outside the alphabet, an impossible length or a
///         non-canonical final character
[[nodiscard]] DOCMODEL_API Blob decode_sortable_base64(std::string_view text, std::size_t base = 0);

// ============================================================
// ByteWriter / ByteReader
// ============================================================

class DOCMODEL_API ByteWriter {
public:
    ByteWriter() = default;

    void write_u8(std::uint8_t v) { buffer_.push_back(v); }

    /// Big-endian
    void write_u64(std::uint64_t v);

    void write_bytes(std::span<const std::uint8_t> bytes);
    void write_bytes(std::string_view bytes);

    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] const ByteBuffer& buffer() const noexcept { return buffer_; }
    [[nodiscard]] ByteBuffer release() { return std::move(buffer_); }

private:
    ByteBuffer buffer_;
};

/// Forward-only cursor over a byte range. Reads past the end throw
/// MalformedEncodingError carrying the absolute offset (base + position).
class DOCMODEL_API ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data, std::size_t base = 0)
        : data_(data), base_(base) {}

    [[nodiscard]] std::uint8_t read_u8();
    [[nodiscard]] std::uint64_t read_u64();
    [[nodiscard]] std::span<const std::uint8_t> read_bytes(std::size_t n);

    /// Bytes up to (not including) the first non-alphabet byte or the end.
    [[nodiscard]] std::string_view read_sortable_base64() noexcept;

    /// @throws MalformedEncodingError at end of input
    [[nodiscard]] std::uint8_t peek() const;

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t offset() const noexcept { return base_ + pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

    void expect(std::uint8_t byte, std::string_view what);

    [[noreturn]] void fail(const std::string& message) const;

private:
    std::span<const std::uint8_t> data_;
    std::size_t base_ = 0;
    std::size_t pos_ = 0;
};

} // namespace docmodel
