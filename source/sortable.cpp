// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/sortable.h>

#include <docmodel/log.h>

#include <array>
#include <bit>

namespace docmodel {

namespace {

constexpr std::string_view kSortableAlphabet =
    "-0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz";

constexpr std::uint64_t kSignBit = std::uint64_t{1} << 63;

constexpr std::array<std::int8_t, 256> make_decode_table()
{
    std::array<std::int8_t, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (std::size_t i = 0; i < kSortableAlphabet.size(); ++i) {
        table[static_cast<std::uint8_t>(kSortableAlphabet[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

} // anonymous namespace

std::uint64_t sortable_from_double(double x) noexcept
{
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return (bits & kSignBit) == 0 ? bits | kSignBit : ~bits;
}

double double_from_sortable(std::uint64_t u) noexcept
{
    const std::uint64_t bits = (u & kSignBit) != 0 ? u & ~kSignBit : ~u;
    return std::bit_cast<double>(bits);
}

bool is_sortable_base64(std::uint8_t c) noexcept
{
    return kDecodeTable[c] >= 0;
}

std::string encode_sortable_base64(std::span<const std::uint8_t> bytes)
{
    std::string out;
    out.reserve((bytes.size() * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t n = (std::uint32_t{bytes[i]} << 16) |
                                (std::uint32_t{bytes[i + 1]} << 8) |
                                std::uint32_t{bytes[i + 2]};
        out += kSortableAlphabet[(n >> 18) & 0x3F];
        out += kSortableAlphabet[(n >> 12) & 0x3F];
        out += kSortableAlphabet[(n >> 6) & 0x3F];
        out += kSortableAlphabet[n & 0x3F];
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t n = std::uint32_t{bytes[i]} << 16;
        out += kSortableAlphabet[(n >> 18) & 0x3F];
        out += kSortableAlphabet[(n >> 12) & 0x3F];
    } else if (rest == 2) {
        const std::uint32_t n = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8);
        out += kSortableAlphabet[(n >> 18) & 0x3F];
        out += kSortableAlphabet[(n >> 12) & 0x3F];
        out += kSortableAlphabet[(n >> 6) & 0x3F];
    }
    return out;
}

Blob decode_sortable_base64(std::string_view text, std::size_t base)
{
    if (text.size() % 4 == 1) {
        throw MalformedEncodingError("impossible base64 length " + std::to_string(text.size()), base + text.size());
    }

    Blob out;
    out.reserve(text.size() * 3 / 4);
    std::uint32_t acc = 0;
    int bits = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const std::int8_t idx = kDecodeTable[static_cast<std::uint8_t>(text[i])];
        if (idx < 0) {
            throw MalformedEncodingError("invalid base64 character", base + i);
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(idx);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }

    // the encoder always leaves the unused low bits of the last character zero
    if ((acc & ((std::uint32_t{1} << bits) - 1)) != 0) {
        throw MalformedEncodingError("non-canonical base64 tail", base + text.size() - 1);
    }
    return out;
}

// ============================================================
// ByteWriter
// ============================================================

void ByteWriter::write_u64(std::uint64_t v)
{
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
    }
}

void ByteWriter::write_bytes(std::span<const std::uint8_t> bytes)
{
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::write_bytes(std::string_view bytes)
{
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

// ============================================================
// ByteReader
// ============================================================

void ByteReader::fail(const std::string& message) const
{
    detail::log_decode_error("ByteReader", offset(), message);
    throw MalformedEncodingError(message, offset());
}

std::uint8_t ByteReader::peek() const
{
    if (at_end()) {
        fail("unexpected end of input");
    }
    return data_[pos_];
}

std::uint8_t ByteReader::read_u8()
{
    const std::uint8_t v = peek();
    ++pos_;
    return v;
}

std::uint64_t ByteReader::read_u64()
{
    if (remaining() < 8) {
        fail("truncated 8-byte value");
    }
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | data_[pos_++];
    }
    return v;
}

std::span<const std::uint8_t> ByteReader::read_bytes(std::size_t n)
{
    if (remaining() < n) {
        fail("truncated input, " + std::to_string(n) + " bytes expected");
    }
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
}

std::string_view ByteReader::read_sortable_base64() noexcept
{
    const std::size_t start = pos_;
    while (pos_ < data_.size() && is_sortable_base64(data_[pos_])) {
        ++pos_;
    }
    return {reinterpret_cast<const char*>(data_.data() + start), pos_ - start};
}

void ByteReader::expect(std::uint8_t byte, std::string_view what)
{
    if (read_u8() != byte) {
        --pos_;
        fail("expected " + std::string(what));
    }
}

} // namespace docmodel
