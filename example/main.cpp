// main.cpp
// Document Model Example - a tour of the docmodel value layer
//
// Demos:
//
// 1: Build documents from JSON and from host structs
// 2: Read and write by path
// 3: Compare, sort and cast values
// 4: Stream encoding and order-preserving keys
// 5: Diff two documents and replay the changes

#include <docmodel/arithmetic.h>
#include <docmodel/cast.h>
#include <docmodel/compare.h>
#include <docmodel/create.h>
#include <docmodel/diff.h>
#include <docmodel/document.h>
#include <docmodel/encoding.h>
#include <docmodel/json.h>
#include <docmodel/key_encoding.h>
#include <docmodel/path.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace docmodel;

// ============================================================
// Host Types
// ============================================================

struct Task
{
    std::string title;
    bool done = false;
    std::vector<std::string> labels;

    static auto docmodel_fields()
    {
        return std::make_tuple(field("title", &Task::title),
                               field("done", &Task::done),
                               field("labels", &Task::labels));
    }
};

// ============================================================
// Demos
// ============================================================

void demo_construction()
{
    std::cout << "--- From JSON (lazy) ---\n";
    DocumentPtr doc = document_from_json(R"({"project": "docmodel", "stars": 42, "tags": ["db", "c++"]})");
    std::cout << to_json(*doc) << "\n";

    std::cout << "\n--- From a host struct ---\n";
    Value task = make_value(Task{"write docs", false, {"docs", "todo"}});
    std::cout << to_json(task) << "\n";
}

void demo_paths()
{
    Value root = from_json(R"({"a": {"b": [1, 2, 3]}})");
    std::cout << "root:           " << root << "\n";

    Value updated = set_at_path(root, parse_path("a.b[1]"), "two");
    updated = set_at_path(updated, parse_path("a.c"), true);
    std::cout << "after set:      " << updated << "\n";

    updated = erase_at_path(updated, parse_path("a.b[0]"));
    std::cout << "after erase:    " << updated << "\n";
    std::cout << "root unchanged: " << root << "\n";

    try {
        (void)get_at_path(root, parse_path("a.b[10]"));
    } catch (const NotFoundError& e) {
        std::cout << "lookup failed:  " << e.what() << "\n";
    }
}

void demo_compare_and_cast()
{
    Value mixed = from_json(R"([3, "b", null, 1.5, {"k": 1}, [2], "a", true])");
    std::cout << "unsorted: " << mixed << "\n";
    std::cout << "sorted:   " << sort_array(mixed.as_array()) << "\n";

    std::cout << "\ncompare(1, 1.0)      = " << compare(1, 1.0) << "\n";
    std::cout << "compare(\"a\", \"b\")    = " << compare("a", "b") << "\n";
    std::cout << "cast \"42\" to integer = " << cast_as_integer("42") << "\n";
    std::cout << "cast 2.5 to text     = " << cast_as_text(2.5) << "\n";
    std::cout << "add(1, 0.5)          = " << add(1, 0.5) << "\n";
    std::cout << "div(1, 0)            = " << docmodel::div(1, 0) << "\n";
}

void demo_encoding()
{
    Value doc = from_json(R"({"id": 7, "name": "encoded"})");
    ByteBuffer bytes = encode_value(doc);
    std::cout << "encoded " << bytes.size() << " bytes\n";

    StreamDecoder decoder;
    for (std::size_t i = 0; i < bytes.size(); i += 4) {
        const std::size_t n = std::min<std::size_t>(4, bytes.size() - i);
        decoder.feed(std::span(bytes).subspan(i, n));
        while (auto v = decoder.next()) {
            std::cout << "stream decoded: " << *v << "\n";
        }
    }

    std::cout << "\n--- Keys sort like values ---\n";
    std::vector<Value> values = {Value("b"), Value(10), Value(-1), Value("a"), Value{}};
    std::sort(values.begin(), values.end(), [](const Value& x, const Value& y) {
        return encode_key(x) < encode_key(y);
    });
    for (const auto& v : values) {
        std::cout << "  " << v << "\n";
    }
}

void demo_diff()
{
    Value before = from_json(R"({"name": "alice", "items": [1, 2, 3], "old": true})");
    Value after = from_json(R"({"name": "bob", "items": [1, 2], "email": "bob@test.com"})");

    std::vector<Op> ops = diff(before.as_document(), after.as_document());
    for (const auto& op : ops) {
        std::cout << "  " << op << "\n";
    }

    Value replayed = apply_ops(ops, before);
    std::cout << "replayed equals target: " << (is_identical(replayed, after) ? "yes" : "no") << "\n";
}

// ============================================================
// Main
// ============================================================

int main()
{
    std::cout << "=== Document Model Example ===\n\n";

    while (true) {
        std::cout << "1. Construction (JSON, host structs)\n";
        std::cout << "2. Paths\n";
        std::cout << "3. Compare, sort and cast\n";
        std::cout << "4. Encoding and keys\n";
        std::cout << "5. Diff and replay\n";
        std::cout << "A. Run all\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        std::string choice;
        if (!std::getline(std::cin, choice) || choice == "q" || choice == "Q") {
            std::cout << "Goodbye!\n";
            break;
        }

        try {
            if (choice == "1") {
                demo_construction();
            } else if (choice == "2") {
                demo_paths();
            } else if (choice == "3") {
                demo_compare_and_cast();
            } else if (choice == "4") {
                demo_encoding();
            } else if (choice == "5") {
                demo_diff();
            } else if (choice == "a" || choice == "A") {
                demo_construction();
                demo_paths();
                demo_compare_and_cast();
                demo_encoding();
                demo_diff();
            } else {
                std::cout << "Invalid choice!\n";
            }
        } catch (const Error& e) {
            std::cout << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        }
        std::cout << "\n";
    }

    return 0;
}
