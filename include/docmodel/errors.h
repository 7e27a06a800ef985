// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception hierarchy used by every docmodel operation.
///
/// All errors derive from docmodel::Error (itself a std::runtime_error), so a
/// caller can catch the whole family at once or dispatch on kind().
///
/// | Class                  | Kind              | Raised by                                  |
/// |------------------------|-------------------|--------------------------------------------|
/// | FieldNotFoundError     | FieldNotFound     | get_by_field, path traversal, buffers      |
/// | IndexOutOfRangeError   | IndexOutOfRange   | get_by_index, path traversal, buffers      |
/// | TypeMismatchError      | TypeMismatch      | accessors, cast, arithmetic                |
/// | MalformedEncodingError | MalformedEncoding | streaming and key decoders                 |
/// | PrecisionLossError     | PrecisionLoss     | Double/Text to Integer casts               |
/// | OverflowError          | Overflow          | casts, Duration arithmetic, host adapters  |
/// | ParseError             | ParseError        | Text casts, JSON, path syntax              |

#pragma once

#include "api.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docmodel {

enum class ErrorKind {
    FieldNotFound,
    IndexOutOfRange,
    TypeMismatch,
    MalformedEncoding,
    PrecisionLoss,
    Overflow,
    ParseError,
};

[[nodiscard]] DOCMODEL_API std::string_view error_kind_name(ErrorKind kind) noexcept;

class DOCMODEL_API Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// Common base for "the addressed thing does not exist".
class DOCMODEL_API NotFoundError : public Error {
public:
    using Error::Error;
};

class DOCMODEL_API FieldNotFoundError : public NotFoundError {
public:
    explicit FieldNotFoundError(std::string_view field)
        : NotFoundError(ErrorKind::FieldNotFound, "field not found: " + std::string(field))
        , field_(field) {}

    FieldNotFoundError(std::string_view field, const std::string& message)
        : NotFoundError(ErrorKind::FieldNotFound, message), field_(field) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class DOCMODEL_API IndexOutOfRangeError : public NotFoundError {
public:
    IndexOutOfRangeError(std::size_t index, std::size_t size)
        : NotFoundError(ErrorKind::IndexOutOfRange,
                        "index " + std::to_string(index) + " out of range (size " +
                            std::to_string(size) + ")")
        , index_(index) {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

class DOCMODEL_API TypeMismatchError : public Error {
public:
    explicit TypeMismatchError(const std::string& message)
        : Error(ErrorKind::TypeMismatch, message) {}
};

class DOCMODEL_API MalformedEncodingError : public Error {
public:
    MalformedEncodingError(const std::string& message, std::size_t offset)
        : Error(ErrorKind::MalformedEncoding,
                message + " at byte " + std::to_string(offset))
        , offset_(offset) {}

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

class DOCMODEL_API PrecisionLossError : public Error {
public:
    explicit PrecisionLossError(const std::string& message)
        : Error(ErrorKind::PrecisionLoss, message) {}
};

class DOCMODEL_API OverflowError : public Error {
public:
    explicit OverflowError(const std::string& message)
        : Error(ErrorKind::Overflow, message) {}
};

class DOCMODEL_API ParseError : public Error {
public:
    explicit ParseError(const std::string& message)
        : Error(ErrorKind::ParseError, message) {}

    ParseError(const std::string& message, std::size_t position)
        : Error(ErrorKind::ParseError, message + " at position " + std::to_string(position))
        , position_(position) {}

    /// Offset into the parsed text, or npos when the failure is not positional.
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_ = std::string::npos;
};

} // namespace docmodel
