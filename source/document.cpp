// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <docmodel/document.h>

#include <immer/flex_vector_transient.hpp>

#include <algorithm>
#include <optional>
#include <utility>

namespace docmodel {

namespace {

Value apply_to_value(const Value& v, const Path& path, const LeafTransform& fn)
{
    if (auto* doc = v.get_if<DocumentPtr>()) {
        auto out = std::make_shared<FieldBuffer>();
        (*doc)->iterate([&](const std::string& field, const Value& child) {
            out->add(field, apply_to_value(child, path.extend_field(field), fn));
        });
        return out;
    }
    if (auto* arr = v.get_if<ArrayPtr>()) {
        auto out = std::make_shared<ValueBuffer>();
        (*arr)->iterate([&](std::size_t i, const Value& child) {
            out->append(apply_to_value(child, path.extend_index(i), fn));
        });
        return out;
    }
    return fn(path, v);
}

// ============================================================
// Views
// ============================================================

class MaskedDocument final : public Document {
public:
    MaskedDocument(DocumentPtr source, std::vector<std::string> names)
        : source_(std::move(source)), names_(std::move(names)) {}

    void iterate(const FieldCallback& fn) const override
    {
        source_->iterate([&](const std::string& field, const Value& value) {
            if (!is_masked(field)) {
                fn(field, value);
            }
        });
    }

    Value get_by_field(std::string_view field) const override
    {
        if (is_masked(field)) {
            throw FieldNotFoundError(field);
        }
        return source_->get_by_field(field);
    }

private:
    bool is_masked(std::string_view field) const
    {
        return std::find(names_.begin(), names_.end(), field) != names_.end();
    }

    DocumentPtr source_;
    std::vector<std::string> names_;
};

class OnlyFieldsDocument final : public Document {
public:
    OnlyFieldsDocument(DocumentPtr source, std::vector<std::string> names)
        : source_(std::move(source)), names_(std::move(names)) {}

    void iterate(const FieldCallback& fn) const override
    {
        // first occurrence of each requested name, in request order
        std::vector<std::optional<Value>> found(names_.size());
        source_->iterate([&](const std::string& field, const Value& value) {
            for (std::size_t i = 0; i < names_.size(); ++i) {
                if (names_[i] == field && !found[i]) {
                    found[i] = value;
                }
            }
        });
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (found[i]) {
                fn(names_[i], *found[i]);
            }
        }
    }

    Value get_by_field(std::string_view field) const override
    {
        if (std::find(names_.begin(), names_.end(), field) == names_.end()) {
            throw FieldNotFoundError(field);
        }
        return source_->get_by_field(field);
    }

private:
    DocumentPtr source_;
    std::vector<std::string> names_;
};

class SortedDocument final : public Document {
public:
    explicit SortedDocument(DocumentPtr source) : source_(std::move(source)) {}

    void iterate(const FieldCallback& fn) const override
    {
        std::vector<std::pair<std::string, Value>> entries;
        source_->iterate([&](const std::string& field, const Value& value) {
            entries.emplace_back(field, value);
        });
        std::stable_sort(entries.begin(), entries.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        for (const auto& [field, value] : entries) {
            fn(field, value);
        }
    }

    Value get_by_field(std::string_view field) const override
    {
        return source_->get_by_field(field);
    }

private:
    DocumentPtr source_;
};

} // anonymous namespace

// ============================================================
// FieldBuffer
// ============================================================

std::size_t FieldBuffer::find(std::string_view field) const noexcept
{
    std::size_t i = 0;
    for (const auto& f : fields_) {
        if (f.name == field) {
            return i;
        }
        ++i;
    }
    return static_cast<std::size_t>(-1);
}

void FieldBuffer::iterate(const FieldCallback& fn) const
{
    for (const auto& f : fields_) {
        fn(f.name, f.value);
    }
}

Value FieldBuffer::get_by_field(std::string_view field) const
{
    const std::size_t i = find(field);
    if (i == static_cast<std::size_t>(-1)) {
        throw FieldNotFoundError(field);
    }
    return fields_[i].value;
}

bool FieldBuffer::has_field(std::string_view field) const
{
    return find(field) != static_cast<std::size_t>(-1);
}

FieldBuffer& FieldBuffer::add(std::string field, Value value)
{
    fields_ = std::move(fields_).push_back(Field{std::move(field), std::move(value)});
    return *this;
}

void FieldBuffer::set(std::string_view field, Value value)
{
    const std::size_t i = find(field);
    if (i == static_cast<std::size_t>(-1)) {
        add(std::string(field), std::move(value));
        return;
    }
    fields_ = std::move(fields_).set(i, Field{std::string(field), std::move(value)});
}

void FieldBuffer::replace(std::string_view field, Value value)
{
    const std::size_t i = find(field);
    if (i == static_cast<std::size_t>(-1)) {
        throw FieldNotFoundError(field);
    }
    fields_ = std::move(fields_).set(i, Field{std::string(field), std::move(value)});
}

void FieldBuffer::remove(std::string_view field)
{
    const std::size_t i = find(field);
    if (i == static_cast<std::size_t>(-1)) {
        throw FieldNotFoundError(field);
    }
    fields_ = fields_.erase(i);
}

void FieldBuffer::set(const Path& path, Value value)
{
    if (path.empty()) {
        throw FieldNotFoundError("", "cannot set a document through an empty path");
    }
    const Value root = set_at_path(Value(std::make_shared<FieldBuffer>(fields_)), path, std::move(value));
    // the root of a non-empty set is always rebuilt as a FieldBuffer
    fields_ = static_cast<const FieldBuffer&>(root.as_document()).fields_;
}

void FieldBuffer::remove(const Path& path)
{
    const Value root = erase_at_path(Value(std::make_shared<FieldBuffer>(fields_)), path);
    fields_ = static_cast<const FieldBuffer&>(root.as_document()).fields_;
}

void FieldBuffer::copy(const Document& source)
{
    auto t = fields_type{}.transient();
    source.iterate([&t](const std::string& field, const Value& value) {
        t.push_back(Field{field, clone_value(value)});
    });
    fields_ = t.persistent();
}

void FieldBuffer::scan(const Document& source)
{
    if (auto* other = dynamic_cast<const FieldBuffer*>(&source)) {
        fields_ = other->fields_;
        return;
    }
    auto t = fields_type{}.transient();
    source.iterate([&t](const std::string& field, const Value& value) {
        t.push_back(Field{field, value});
    });
    fields_ = t.persistent();
}

void FieldBuffer::apply(const LeafTransform& fn)
{
    auto t = fields_type{}.transient();
    const Path root;
    for (const auto& f : fields_) {
        t.push_back(Field{f.name, apply_to_value(f.value, root.extend_field(f.name), fn)});
    }
    fields_ = t.persistent();
}

// ============================================================
// ValueBuffer
// ============================================================

void ValueBuffer::iterate(const ElementCallback& fn) const
{
    std::size_t i = 0;
    for (const auto& v : values_) {
        fn(i++, v);
    }
}

Value ValueBuffer::get_by_index(std::size_t index) const
{
    if (index >= values_.size()) {
        throw IndexOutOfRangeError(index, values_.size());
    }
    return values_[index];
}

ValueBuffer& ValueBuffer::append(Value value)
{
    values_ = std::move(values_).push_back(std::move(value));
    return *this;
}

void ValueBuffer::replace(std::size_t index, Value value)
{
    if (index >= values_.size()) {
        throw IndexOutOfRangeError(index, values_.size());
    }
    values_ = std::move(values_).set(index, std::move(value));
}

void ValueBuffer::remove(std::size_t index)
{
    if (index >= values_.size()) {
        throw IndexOutOfRangeError(index, values_.size());
    }
    values_ = values_.erase(index);
}

void ValueBuffer::copy(const Array& source)
{
    auto t = values_type{}.transient();
    source.iterate([&t](std::size_t, const Value& value) {
        t.push_back(clone_value(value));
    });
    values_ = t.persistent();
}

void ValueBuffer::scan(const Array& source)
{
    if (auto* other = dynamic_cast<const ValueBuffer*>(&source)) {
        values_ = other->values_;
        return;
    }
    auto t = values_type{}.transient();
    source.iterate([&t](std::size_t, const Value& value) {
        t.push_back(value);
    });
    values_ = t.persistent();
}

void ValueBuffer::apply(const LeafTransform& fn)
{
    auto t = values_type{}.transient();
    const Path root;
    std::size_t i = 0;
    for (const auto& v : values_) {
        t.push_back(apply_to_value(v, root.extend_index(i++), fn));
    }
    values_ = t.persistent();
}

// ============================================================
// Value factories
// ============================================================

Value Value::array(std::initializer_list<Value> items)
{
    return std::make_shared<ValueBuffer>(ValueBuffer::values_type(items));
}

Value Value::array(std::vector<Value> items)
{
    auto t = ValueBuffer::values_type{}.transient();
    for (auto& item : items) {
        t.push_back(std::move(item));
    }
    return std::make_shared<ValueBuffer>(t.persistent());
}

Value Value::document(std::initializer_list<std::pair<std::string, Value>> fields)
{
    auto buf = std::make_shared<FieldBuffer>();
    for (const auto& [name, value] : fields) {
        buf->add(name, value);
    }
    return buf;
}

// ============================================================
// Helpers
// ============================================================

Value clone_value(const Value& v)
{
    if (auto* doc = v.get_if<DocumentPtr>()) {
        auto out = std::make_shared<FieldBuffer>();
        out->copy(**doc);
        return out;
    }
    if (auto* arr = v.get_if<ArrayPtr>()) {
        auto out = std::make_shared<ValueBuffer>();
        out->copy(**arr);
        return out;
    }
    return v;
}

std::vector<std::string> fields(const Document& doc)
{
    std::vector<std::string> names;
    doc.iterate([&names](const std::string& field, const Value&) {
        names.push_back(field);
    });
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t field_count(const Document& doc)
{
    std::size_t n = 0;
    doc.iterate([&n](const std::string&, const Value&) { ++n; });
    return n;
}

DocumentPtr mask_fields(DocumentPtr source, std::vector<std::string> names)
{
    return std::make_shared<MaskedDocument>(std::move(source), std::move(names));
}

DocumentPtr only_fields(DocumentPtr source, std::vector<std::string> names)
{
    return std::make_shared<OnlyFieldsDocument>(std::move(source), std::move(names));
}

DocumentPtr with_sorted_fields(DocumentPtr source)
{
    return std::make_shared<SortedDocument>(std::move(source));
}

} // namespace docmodel
