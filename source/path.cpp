// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/path.h>

#include <docmodel/document.h>
#include <docmodel/log.h>

#include <charconv>
#include <ostream>

namespace docmodel {

// ============================================================
// Path
// ============================================================

Path Path::extend_field(std::string field) const
{
    return Path(fragments_.push_back(PathFragment{std::move(field)}));
}

Path Path::extend_index(std::size_t index) const
{
    return Path(fragments_.push_back(PathFragment{index}));
}

Path Path::extend(const Path& suffix) const
{
    return Path(fragments_ + suffix.fragments_);
}

Path Path::parent() const
{
    if (fragments_.empty()) {
        return {};
    }
    return Path(fragments_.take(fragments_.size() - 1));
}

const PathFragment& Path::back() const
{
    if (fragments_.empty()) {
        throw IndexOutOfRangeError(0, 0);
    }
    return fragments_.back();
}

std::string Path::to_string() const
{
    std::string out;
    bool first = true;
    for (const auto& frag : fragments_) {
        if (auto* field = std::get_if<std::string>(&frag)) {
            if (!first) {
                out += '.';
            }
            out += *field;
        } else {
            out += '[';
            out += std::to_string(std::get<std::size_t>(frag));
            out += ']';
        }
        first = false;
    }
    return out;
}

bool operator==(const Path& a, const Path& b)
{
    return a.fragments_ == b.fragments_;
}

std::ostream& operator<<(std::ostream& os, const Path& path)
{
    return os << path.to_string();
}

Path parse_path(std::string_view text)
{
    Path::container_type fragments;
    std::size_t pos = 0;

    auto read_field = [&]() {
        const std::size_t start = pos;
        while (pos < text.size() && text[pos] != '.' && text[pos] != '[' && text[pos] != ']') {
            ++pos;
        }
        if (pos == start) {
            throw ParseError("empty field name in path \"" + std::string(text) + "\"", start);
        }
        fragments = std::move(fragments).push_back(PathFragment{std::string(text.substr(start, pos - start))});
    };

    auto read_index = [&]() {
        ++pos; // '['
        const std::size_t start = pos;
        while (pos < text.size() && text[pos] != ']') {
            ++pos;
        }
        if (pos >= text.size()) {
            throw ParseError("unterminated index in path \"" + std::string(text) + "\"", start);
        }
        std::size_t index = 0;
        const char* first = text.data() + start;
        const char* last = text.data() + pos;
        auto [ptr, ec] = std::from_chars(first, last, index);
        if (first == last || ec != std::errc{} || ptr != last) {
            throw ParseError("invalid index in path \"" + std::string(text) + "\"", start);
        }
        fragments = std::move(fragments).push_back(PathFragment{index});
        ++pos; // ']'
    };

    if (text.empty()) {
        return {};
    }

    if (text[pos] == '[') {
        read_index();
    } else {
        read_field();
    }

    while (pos < text.size()) {
        if (text[pos] == '.') {
            ++pos;
            read_field();
        } else if (text[pos] == '[') {
            read_index();
        } else {
            throw ParseError("unexpected character in path \"" + std::string(text) + "\"", pos);
        }
    }
    return Path(std::move(fragments));
}

// ============================================================
// Traversal engine
// ============================================================

namespace {

[[noreturn]] void throw_kind_mismatch(const Path& path, std::size_t depth, const Value& node)
{
    const Path prefix(path.fragments().take(depth + 1));
    detail::log_access_error("path", "cannot resolve '" + prefix.to_string() + "' on a " +
                                         std::string(type_name(node.type())));
    throw FieldNotFoundError(prefix.to_string(),
                             "cannot resolve '" + prefix.to_string() + "' on a " +
                                 std::string(type_name(node.type())));
}

/// One traversal step: child of @p node selected by path[depth].
Value step(const Value& node, const Path& path, std::size_t depth)
{
    const PathFragment& frag = path[depth];
    if (auto* field = std::get_if<std::string>(&frag)) {
        auto* doc = node.get_if<DocumentPtr>();
        if (!doc) {
            throw_kind_mismatch(path, depth, node);
        }
        try {
            return (*doc)->get_by_field(*field);
        } catch (const FieldNotFoundError&) {
            detail::log_key_error("get_at_path", *field, "not found");
            throw;
        }
    }

    const std::size_t index = std::get<std::size_t>(frag);
    auto* arr = node.get_if<ArrayPtr>();
    if (!arr) {
        throw_kind_mismatch(path, depth, node);
    }
    try {
        return (*arr)->get_by_index(index);
    } catch (const IndexOutOfRangeError&) {
        detail::log_index_error("get_at_path", index, "out of range");
        throw;
    }
}

Value get_from(Value node, const Path& path, std::size_t depth)
{
    for (std::size_t i = depth; i < path.size(); ++i) {
        node = step(node, path, i);
    }
    return node;
}

Value set_impl(const Value& node, const Path& path, std::size_t depth, Value value)
{
    if (depth == path.size()) {
        return value;
    }

    const bool last = depth + 1 == path.size();
    const PathFragment& frag = path[depth];

    if (auto* field = std::get_if<std::string>(&frag)) {
        auto* doc = node.get_if<DocumentPtr>();
        if (!doc) {
            throw_kind_mismatch(path, depth, node);
        }
        auto buf = std::make_shared<FieldBuffer>();
        buf->scan(**doc);
        if (last) {
            buf->set(*field, std::move(value));
        } else {
            buf->replace(*field, set_impl(step(node, path, depth), path, depth + 1, std::move(value)));
        }
        return buf;
    }

    const std::size_t index = std::get<std::size_t>(frag);
    auto* arr = node.get_if<ArrayPtr>();
    if (!arr) {
        throw_kind_mismatch(path, depth, node);
    }
    auto buf = std::make_shared<ValueBuffer>();
    buf->scan(**arr);
    if (last) {
        if (index == buf->size()) {
            buf->append(std::move(value));
        } else if (index < buf->size()) {
            buf->replace(index, std::move(value));
        } else {
            detail::log_index_error("set_at_path", index, "past the end of the array");
            throw IndexOutOfRangeError(index, buf->size());
        }
    } else {
        buf->replace(index, set_impl(step(node, path, depth), path, depth + 1, std::move(value)));
    }
    return buf;
}

Value erase_impl(const Value& node, const Path& path, std::size_t depth)
{
    const bool last = depth + 1 == path.size();
    const PathFragment& frag = path[depth];

    if (auto* field = std::get_if<std::string>(&frag)) {
        auto* doc = node.get_if<DocumentPtr>();
        if (!doc) {
            throw_kind_mismatch(path, depth, node);
        }
        auto buf = std::make_shared<FieldBuffer>();
        buf->scan(**doc);
        if (last) {
            if (!buf->has_field(*field)) {
                detail::log_key_error("erase_at_path", *field, "not found");
            }
            buf->remove(*field);
        } else {
            buf->replace(*field, erase_impl(step(node, path, depth), path, depth + 1));
        }
        return buf;
    }

    const std::size_t index = std::get<std::size_t>(frag);
    auto* arr = node.get_if<ArrayPtr>();
    if (!arr) {
        throw_kind_mismatch(path, depth, node);
    }
    auto buf = std::make_shared<ValueBuffer>();
    buf->scan(**arr);
    if (last) {
        if (index >= buf->size()) {
            detail::log_index_error("erase_at_path", index, "out of range");
        }
        buf->remove(index);
    } else {
        buf->replace(index, erase_impl(step(node, path, depth), path, depth + 1));
    }
    return buf;
}

} // anonymous namespace

Value get_at_path(const Value& root, const Path& path)
{
    return get_from(root, path, 0);
}

Value get_at_path(const Document& root, const Path& path)
{
    if (path.empty()) {
        throw FieldNotFoundError("", "empty path does not address a field");
    }
    auto* field = std::get_if<std::string>(&path[0]);
    if (!field) {
        detail::log_access_error("get_at_path", "index fragment applied to a document");
        throw FieldNotFoundError(path.to_string(), "cannot resolve '" + Path(path.fragments().take(1)).to_string() +
                                                       "' on a document");
    }
    return get_from(root.get_by_field(*field), path, 1);
}

Value get_at_path(const Array& root, const Path& path)
{
    if (path.empty()) {
        throw FieldNotFoundError("", "empty path does not address an element");
    }
    auto* index = std::get_if<std::size_t>(&path[0]);
    if (!index) {
        detail::log_access_error("get_at_path", "field fragment applied to an array");
        throw FieldNotFoundError(std::get<std::string>(path[0]),
                                 "cannot resolve '" + std::get<std::string>(path[0]) + "' on an array");
    }
    return get_from(root.get_by_index(*index), path, 1);
}

bool has_path(const Value& root, const Path& path)
{
    try {
        (void)get_at_path(root, path);
        return true;
    } catch (const NotFoundError&) {
        return false;
    }
}

Value set_at_path(const Value& root, const Path& path, Value value)
{
    return set_impl(root, path, 0, std::move(value));
}

Value erase_at_path(const Value& root, const Path& path)
{
    if (path.empty()) {
        throw FieldNotFoundError("", "cannot erase the root value");
    }
    return erase_impl(root, path, 0);
}

} // namespace docmodel
