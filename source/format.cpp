// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <limits>

namespace docmodel {

namespace {

constexpr std::int64_t kNanosecond = 1;
constexpr std::int64_t kMicrosecond = 1000 * kNanosecond;
constexpr std::int64_t kMillisecond = 1000 * kMicrosecond;
constexpr std::int64_t kSecond = 1000 * kMillisecond;
constexpr std::int64_t kMinute = 60 * kSecond;
constexpr std::int64_t kHour = 60 * kMinute;

constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// v / 10^digits rendered with a decimal fraction, trailing zeros removed
std::string format_fraction(std::uint64_t v, int digits)
{
    std::uint64_t scale = 1;
    for (int i = 0; i < digits; ++i) {
        scale *= 10;
    }
    std::string result = std::to_string(v / scale);
    std::uint64_t frac = v % scale;
    if (frac == 0) {
        return result;
    }
    std::string frac_digits(static_cast<std::size_t>(digits), '0');
    for (int i = digits - 1; i >= 0; --i) {
        frac_digits[static_cast<std::size_t>(i)] = static_cast<char>('0' + frac % 10);
        frac /= 10;
    }
    while (!frac_digits.empty() && frac_digits.back() == '0') {
        frac_digits.pop_back();
    }
    return result + "." + frac_digits;
}

int base64_index(char c) noexcept
{
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::int64_t duration_unit(std::string_view unit)
{
    if (unit == "ns") return kNanosecond;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return kMicrosecond;
    if (unit == "ms") return kMillisecond;
    if (unit == "s") return kSecond;
    if (unit == "m") return kMinute;
    if (unit == "h") return kHour;
    return 0;
}

} // anonymous namespace

// ============================================================
// Doubles
// ============================================================

std::string format_double(double d)
{
    if (std::isnan(d)) {
        return "NaN";
    }
    if (std::isinf(d)) {
        return d > 0 ? "+Inf" : "-Inf";
    }

    const double abs = std::fabs(d);
    const bool scientific = abs != 0 && (abs < 1e-6 || abs >= 1e21);

    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d,
                                   scientific ? std::chars_format::scientific
                                              : std::chars_format::fixed);
    std::string result(buf.data(), ec == std::errc{} ? end : buf.data());
    if (!scientific && result.find('.') == std::string::npos) {
        result += ".0";
    }
    return result;
}

// ============================================================
// Durations
// ============================================================

std::string format_duration(Duration d)
{
    const std::int64_t ns = d.count();
    if (ns == 0) {
        return "0s";
    }

    const bool negative = ns < 0;
    const std::uint64_t u = negative ? std::uint64_t{0} - static_cast<std::uint64_t>(ns)
                                     : static_cast<std::uint64_t>(ns);
    std::string result;

    if (u < static_cast<std::uint64_t>(kSecond)) {
        if (u < static_cast<std::uint64_t>(kMicrosecond)) {
            result = std::to_string(u) + "ns";
        } else if (u < static_cast<std::uint64_t>(kMillisecond)) {
            result = format_fraction(u, 3) + "\xC2\xB5s";
        } else {
            result = format_fraction(u, 6) + "ms";
        }
    } else {
        const std::uint64_t minutes = u / static_cast<std::uint64_t>(kMinute);
        result = format_fraction(u % static_cast<std::uint64_t>(kMinute), 9) + "s";
        if (minutes > 0) {
            result = std::to_string(minutes % 60) + "m" + result;
            if (minutes >= 60) {
                result = std::to_string(minutes / 60) + "h" + result;
            }
        }
    }

    return negative ? "-" + result : result;
}

Duration parse_duration(std::string_view text)
{
    const std::string original(text);
    std::string_view s = text;
    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s == "0") {
        return Duration{0};
    }
    if (s.empty()) {
        throw ParseError("invalid duration \"" + original + "\"");
    }

    const std::uint64_t limit = negative
        ? static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1
        : static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::uint64_t total = 0;

    while (!s.empty()) {
        // integer part
        std::uint64_t whole = 0;
        std::size_t i = 0;
        bool overflow = false;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
            const std::uint64_t digit = static_cast<std::uint64_t>(s[i] - '0');
            if (whole > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
                overflow = true;
            } else {
                whole = whole * 10 + digit;
            }
            ++i;
        }
        const bool has_whole = i > 0;

        // fraction
        std::uint64_t frac = 0;
        std::uint64_t scale = 1;
        bool has_frac = false;
        if (i < s.size() && s[i] == '.') {
            ++i;
            const std::size_t start = i;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
                // digits beyond nanosecond resolution of an hour are dropped
                if (scale < 1'000'000'000'000'000ULL) {
                    frac = frac * 10 + static_cast<std::uint64_t>(s[i] - '0');
                    scale *= 10;
                }
                ++i;
            }
            has_frac = i > start;
        }
        if (!has_whole && !has_frac) {
            throw ParseError("invalid duration \"" + original + "\"");
        }

        // unit
        const std::size_t unit_start = i;
        while (i < s.size() && s[i] != '.' && (s[i] < '0' || s[i] > '9')) {
            ++i;
        }
        const std::string_view unit_text = s.substr(unit_start, i - unit_start);
        if (unit_text.empty()) {
            throw ParseError("missing unit in duration \"" + original + "\"");
        }
        const std::int64_t unit = duration_unit(unit_text);
        if (unit == 0) {
            throw ParseError("unknown unit \"" + std::string(unit_text) + "\" in duration \"" +
                             original + "\"");
        }

        const auto u = static_cast<std::uint64_t>(unit);
        if (overflow || whole > limit / u) {
            throw OverflowError("duration \"" + original + "\" out of range");
        }
        std::uint64_t part = whole * u;
        if (frac > 0) {
            part += static_cast<std::uint64_t>(static_cast<double>(frac) *
                                               (static_cast<double>(u) / static_cast<double>(scale)));
        }
        if (part > limit || total > limit - part) {
            throw OverflowError("duration \"" + original + "\" out of range");
        }
        total += part;
        s.remove_prefix(i);
    }

    if (negative) {
        return Duration{static_cast<std::int64_t>(std::uint64_t{0} - total)};
    }
    return Duration{static_cast<std::int64_t>(total)};
}

// ============================================================
// Base64 (standard alphabet, padded)
// ============================================================

std::string base64_encode(std::span<const std::uint8_t> bytes)
{
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t n = (std::uint32_t{bytes[i]} << 16) |
                                (std::uint32_t{bytes[i + 1]} << 8) |
                                std::uint32_t{bytes[i + 2]};
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += kBase64Alphabet[n & 0x3F];
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t n = std::uint32_t{bytes[i]} << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t n = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Blob base64_decode(std::string_view text)
{
    if (text.size() % 4 != 0) {
        throw ParseError("invalid base64 length " + std::to_string(text.size()));
    }

    std::size_t padding = 0;
    if (!text.empty() && text.back() == '=') {
        padding = (text.size() >= 2 && text[text.size() - 2] == '=') ? 2 : 1;
    }

    Blob out;
    out.reserve(text.size() / 4 * 3);
    const std::size_t data_chars = text.size() - padding;

    std::uint32_t acc = 0;
    int bits = 0;
    for (std::size_t i = 0; i < data_chars; ++i) {
        const int idx = base64_index(text[i]);
        if (idx < 0) {
            throw ParseError("invalid base64 character", i);
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(idx);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

// ============================================================
// UTF-8
// ============================================================

bool is_valid_utf8(std::string_view text) noexcept
{
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace docmodel
