// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file create.h
/// @brief Build Values from host C++ objects.
///
/// make_value() maps host types onto the Value domain:
///
/// | Host type                                   | Value                      |
/// |---------------------------------------------|----------------------------|
/// | Value                                       | copied                     |
/// | std::nullptr_t, empty std::optional         | Null                       |
/// | bool                                        | Bool                       |
/// | integral types                              | Integer (OverflowError above INT64_MAX) |
/// | floating types                              | Double                     |
/// | std::chrono::duration                       | Duration                   |
/// | std::string, std::string_view, const char*  | Text                       |
/// | Blob                                        | Blob                       |
/// | shared_ptr to a Document / Array            | Document / Array           |
/// | struct with docmodel_fields()               | Document (StructDocument)  |
/// | string-keyed associative container          | Document (MapDocument)     |
/// | other sized ranges                          | Array (SequenceArray)      |
///
/// The adapters hold their own copy of the host object and convert members
/// on access; nothing is converted up front.
///
/// A struct takes part by listing its members:
/// @code
/// struct Point {
///     int x = 0;
///     int y = 0;
///     std::string label;
///
///     static auto docmodel_fields()
///     {
///         return std::make_tuple(docmodel::field("x", &Point::x),
///                                docmodel::field("y", &Point::y),
///                                docmodel::field("label", &Point::label));
///     }
/// };
///
/// Value v = make_value(Point{1, 2, "origin"});   // {"x":1,"y":2,"label":"origin"}
/// @endcode

#pragma once

#include "value.h"

#include <concepts>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace docmodel {

// ============================================================
// Field descriptors
// ============================================================

template <typename T, typename M>
struct FieldDescriptor {
    std::string_view name;
    M T::*member;
};

template <typename T, typename M>
[[nodiscard]] constexpr FieldDescriptor<T, M> field(std::string_view name, M T::*member) noexcept
{
    return {name, member};
}

// ============================================================
// Concepts
// ============================================================

/// Struct listing its members through a static docmodel_fields()
template <typename T>
concept HostStruct = requires {
    { T::docmodel_fields() };
};

/// Associative container keyed by strings
template <typename M>
concept HostMap = requires(const M& m) {
    typename M::key_type;
    typename M::mapped_type;
    requires std::convertible_to<const typename M::key_type&, std::string_view>;
    requires std::constructible_from<typename M::key_type, std::string_view>;
    { m.find(std::declval<const typename M::key_type&>()) } -> std::same_as<typename M::const_iterator>;
    { m.begin() };
    { m.end() };
};

template <typename S>
concept HostSequence = std::ranges::sized_range<const S> &&
                       !std::convertible_to<const S&, std::string_view> &&
                       !std::same_as<S, Blob> &&
                       !HostMap<S> &&
                       !HostStruct<S>;

template <typename T>
[[nodiscard]] Value make_value(const T& x);

// ============================================================
// SequenceArray
// ============================================================

template <HostSequence S>
class SequenceArray final : public Array {
public:
    explicit SequenceArray(S sequence) : sequence_(std::move(sequence)) {}

    void iterate(const ElementCallback& fn) const override
    {
        std::size_t index = 0;
        for (const auto& element : sequence_) {
            fn(index++, make_value(element));
        }
    }

    [[nodiscard]] Value get_by_index(std::size_t index) const override
    {
        const std::size_t n = size();
        if (index >= n) {
            throw IndexOutOfRangeError(index, n);
        }
        auto it = std::ranges::next(std::ranges::begin(sequence_),
                                    static_cast<std::ranges::range_difference_t<const S>>(index));
        return make_value(*it);
    }

    [[nodiscard]] std::size_t size() const override
    {
        return static_cast<std::size_t>(std::ranges::size(sequence_));
    }

    [[nodiscard]] const S& sequence() const noexcept { return sequence_; }

private:
    S sequence_;
};

// ============================================================
// MapDocument
//
// Fields come out in the container's own iteration order.
// ============================================================

template <HostMap M>
class MapDocument final : public Document {
public:
    explicit MapDocument(M map) : map_(std::move(map)) {}

    void iterate(const FieldCallback& fn) const override
    {
        for (const auto& [key, value] : map_) {
            if constexpr (std::same_as<typename M::key_type, std::string>) {
                fn(key, make_value(value));
            } else {
                fn(std::string(std::string_view(key)), make_value(value));
            }
        }
    }

    [[nodiscard]] Value get_by_field(std::string_view field) const override
    {
        auto it = map_.find(typename M::key_type(field));
        if (it == map_.end()) {
            throw FieldNotFoundError(field);
        }
        return make_value(it->second);
    }

    [[nodiscard]] const M& map() const noexcept { return map_; }

private:
    M map_;
};

// ============================================================
// StructDocument
// ============================================================

template <HostStruct T>
class StructDocument final : public Document {
public:
    explicit StructDocument(T object) : object_(std::move(object)) {}

    void iterate(const FieldCallback& fn) const override
    {
        std::apply([&](const auto&... descriptor) {
            (fn(std::string(descriptor.name), make_value(object_.*(descriptor.member))), ...);
        }, T::docmodel_fields());
    }

    [[nodiscard]] Value get_by_field(std::string_view field) const override
    {
        std::optional<Value> found;
        std::apply([&](const auto&... descriptor) {
            (void)(... || (descriptor.name == field &&
                           (found.emplace(make_value(object_.*(descriptor.member))), true)));
        }, T::docmodel_fields());
        if (!found) {
            throw FieldNotFoundError(field);
        }
        return std::move(*found);
    }

    [[nodiscard]] const T& object() const noexcept { return object_; }

private:
    T object_;
};

// ============================================================
// make_value
// ============================================================

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_duration : std::false_type {};

template <typename Rep, typename Period>
struct is_duration<std::chrono::duration<Rep, Period>> : std::true_type {};

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
inline constexpr bool dependent_false = false;

} // namespace detail

template <typename T>
Value make_value(const T& x)
{
    if constexpr (std::same_as<T, Value>) {
        return x;
    } else if constexpr (std::same_as<T, std::nullptr_t>) {
        return Value{};
    } else if constexpr (detail::is_optional<T>::value) {
        return x ? make_value(*x) : Value{};
    } else if constexpr (std::same_as<T, bool>) {
        return Value(x);
    } else if constexpr (std::integral<T> || std::floating_point<T>) {
        return Value(x);
    } else if constexpr (detail::is_duration<T>::value) {
        return Value(x);
    } else if constexpr (std::same_as<T, Blob>) {
        return Value(x);
    } else if constexpr (std::convertible_to<const T&, std::string_view>) {
        return Value(std::string_view(x));
    } else if constexpr (detail::is_shared_ptr<T>::value) {
        return Value(x);
    } else if constexpr (HostStruct<T>) {
        return Value(std::make_shared<StructDocument<T>>(x));
    } else if constexpr (HostMap<T>) {
        return Value(std::make_shared<MapDocument<T>>(x));
    } else if constexpr (HostSequence<T>) {
        return Value(std::make_shared<SequenceArray<T>>(x));
    } else {
        static_assert(detail::dependent_false<T>, "type cannot be converted to a docmodel::Value");
    }
}

/// Document over a host struct or string-keyed map.
template <typename T>
    requires HostStruct<T> || HostMap<T>
[[nodiscard]] DocumentPtr make_document(const T& x)
{
    return make_value(x).document_ptr();
}

/// Array over a host sequence.
template <HostSequence S>
[[nodiscard]] ArrayPtr make_array(const S& x)
{
    return make_value(x).array_ptr();
}

} // namespace docmodel
