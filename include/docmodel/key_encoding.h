// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file key_encoding.h
/// @brief Order-preserving binary encoding for index and primary keys.
///
/// For any two values, `compare(a, b) < 0` implies
/// `encode_key(a) < encode_key(b)` under unsigned lexicographic byte order.
/// Keys of comparator-equal values differ only when their exact types differ
/// (Integer(1) and Double(1.0), Text "a" and Blob "a"); such keys are still
/// ordered consistently, and decode_key() restores the exact value and type.
///
/// ## Layout
///
/// A key is a body followed by a trailer.
///
/// The body orders values:
///
/// | Family    | Body                                                                |
/// |-----------|---------------------------------------------------------------------|
/// | Null      | 0x05                                                                |
/// | Numeric   | 0x10, 8-byte sortable double (NaN as 8 zero bytes, -0.0 as +0.0)    |
/// | Duration  | 0x20, 8-byte sortable int64                                         |
/// | Bytes     | 0x30, bytes with 0x00 escaped as 0x00 0xFF, then 0x00 0x01          |
/// | Array     | 0x40, (0x01 element)*, 0x00                                         |
/// | Document  | 0x50, (0x01 ~name value)* in name order, 0x00                       |
///
/// `~name` is the escaped, terminated name with every byte complemented, so
/// a document holding a lower field name sorts higher, as in compare().
///
/// The trailer restores exact types: one byte per numeric or bytes leaf, in
/// body order: 0x01 Bool, 0x02 Integer (followed by its 8-byte sortable
/// int64), 0x03 Double, 0x04 negative-zero Double, 0x05 Text, 0x06 Blob.

#pragma once

#include "value.h"

#include <span>

namespace docmodel {

[[nodiscard]] DOCMODEL_API ByteBuffer encode_key(const Value& v);

/// @throws MalformedEncodingError
[[nodiscard]] DOCMODEL_API Value decode_key(std::span<const std::uint8_t> key);

} // namespace docmodel
