// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// diff.cpp - Document diff and replay

#include <docmodel/diff.h>

#include <docmodel/compare.h>
#include <docmodel/document.h>

#include <algorithm>
#include <functional>
#include <map>
#include <ostream>

namespace docmodel {

// ============================================================
// DiffCollector
// ============================================================

namespace {

class DiffCollector {
public:
    std::vector<Op> take() { return std::move(ops_); }

    void diff_document(const Document& from, const Document& to, const Path& current_path)
    {
        // Pointer identity: same instance, no changes
        if (&from == &to) {
            return;
        }

        const FieldGroups from_fields = group_fields(from);
        const FieldGroups to_fields = group_fields(to);

        // A path reaches only the first occurrence of a name, so a duplicated
        // name that differs between the two sides is fixed by replacing the
        // whole document.
        if (has_unmatched_duplicates(from_fields, to_fields)) {
            auto replacement = std::make_shared<FieldBuffer>();
            replacement->scan(to);
            emit(Op::Kind::Set, current_path, std::move(replacement));
            return;
        }

        auto i = from_fields.begin();
        auto j = to_fields.begin();
        while (i != from_fields.end() || j != to_fields.end()) {
            if (j == to_fields.end() || (i != from_fields.end() && i->first < j->first)) {
                emit(Op::Kind::Delete, current_path.extend_field(i->first), i->second.front());
                ++i;
            } else if (i == from_fields.end() || j->first < i->first) {
                emit(Op::Kind::Set, current_path.extend_field(j->first), j->second.front());
                ++j;
            } else {
                // matching duplicates are already identical
                if (i->second.size() == 1) {
                    diff_value(i->second.front(), j->second.front(), current_path.extend_field(i->first));
                }
                ++i;
                ++j;
            }
        }
    }

private:
    void diff_value(const Value& from, const Value& to, const Path& current_path)
    {
        if (from.type() != to.type()) [[unlikely]] {
            emit(Op::Kind::Set, current_path, to);
            return;
        }

        switch (from.type()) {
        case ValueType::Document:
            if (from.document_ptr() != to.document_ptr()) {
                diff_document(from.as_document(), to.as_document(), current_path);
            }
            break;
        case ValueType::Array:
            if (from.array_ptr() != to.array_ptr()) {
                diff_array(from.as_array(), to.as_array(), current_path);
            }
            break;
        default:
            // Same scalar type
            if (compare(from, to) != 0) {
                emit(Op::Kind::Set, current_path, to);
            }
        }
    }

    void diff_array(const Array& from, const Array& to, const Path& current_path)
    {
        const std::size_t from_size = from.size();
        const std::size_t to_size = to.size();
        const std::size_t common_size = std::min(from_size, to_size);

        for (std::size_t i = 0; i < common_size; ++i) {
            diff_value(from.get_by_index(i), to.get_by_index(i), current_path.extend_index(i));
        }

        // Removed tail elements; each delete shifts the next one down to to_size
        for (std::size_t i = common_size; i < from_size; ++i) {
            emit(Op::Kind::Delete, current_path.extend_index(to_size), from.get_by_index(i));
        }

        // Added tail elements
        for (std::size_t i = common_size; i < to_size; ++i) {
            emit(Op::Kind::Set, current_path.extend_index(i), to.get_by_index(i));
        }
    }

    void emit(Op::Kind kind, Path path, Value value)
    {
        ops_.push_back(Op{kind, std::move(path), std::move(value)});
    }

    /// Every value of each name, in name order and iteration order within a name.
    using FieldGroups = std::map<std::string, std::vector<Value>, std::less<>>;

    static FieldGroups group_fields(const Document& doc)
    {
        FieldGroups groups;
        doc.iterate([&groups](const std::string& name, const Value& value) {
            groups[name].push_back(value);
        });
        return groups;
    }

    static bool same_occurrences(const std::vector<Value>& a, const std::vector<Value>& b)
    {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(),
                          [](const Value& x, const Value& y) { return is_identical(x, y); });
    }

    static bool has_unmatched_duplicates(const FieldGroups& from, const FieldGroups& to)
    {
        for (const auto& [name, values] : from) {
            if (values.size() > 1) {
                const auto it = to.find(name);
                if (it == to.end() || !same_occurrences(values, it->second)) {
                    return true;
                }
            }
        }
        for (const auto& [name, values] : to) {
            if (values.size() > 1) {
                const auto it = from.find(name);
                if (it == from.end() || it->second.size() != values.size()) {
                    return true;
                }
            }
        }
        return false;
    }

    std::vector<Op> ops_;
};

} // anonymous namespace

bool operator==(const Op& a, const Op& b)
{
    return a.kind == b.kind && a.path == b.path && is_identical(a.value, b.value);
}

std::vector<Op> diff(const Document& from, const Document& to)
{
    DiffCollector collector;
    collector.diff_document(from, to, Path{});
    return collector.take();
}

Value apply_ops(const std::vector<Op>& ops, const Value& doc)
{
    Value result = doc;
    for (const auto& op : ops) {
        switch (op.kind) {
        case Op::Kind::Set:
            result = set_at_path(result, op.path, op.value);
            break;
        case Op::Kind::Delete:
            result = erase_at_path(result, op.path);
            break;
        }
    }
    return result;
}

std::string to_string(const Op& op)
{
    std::string out = op.kind == Op::Kind::Set ? "set " : "delete ";
    out += op.path.to_string();
    out += ' ';
    out += to_string(op.value);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Op& op)
{
    return os << to_string(op);
}

} // namespace docmodel
