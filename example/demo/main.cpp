// main.cpp - treepath walkthrough
//
// Builds a small document, edits it through paths, applies a patch
// document, and prints the diff and the leaf listing of the result.

#include <treepath/treepath.h>

#include <iostream>
#include <string>

using namespace treepath;
using namespace treepath::literals;

// ============================================================
// Helpers
// ============================================================

void print_leaves(const Value& doc)
{
    for (auto [path, value] : list(doc)) {
        std::cout << "  " << path_to_pointer(path) << " = " << value << "\n";
    }
}

// ============================================================
// Demo sections
// ============================================================

void demo_edit()
{
    std::cout << "\n=== Editing ===\n\n";

    Value doc = add(Value::map(), {"a"}, Value::map({{"b", Value::map({{"c", "here"}})}}));
    add(doc, {"a", "b", "d"}, Value::vector(), in_place);
    add(doc, {"a", "b", "d", 0}, "diamond", in_place);
    std::cout << "after add:     " << doc << "\n";

    replace(doc, {"a", "b", "d", last()}, "dangerous", in_place);
    std::cout << "after replace: " << doc << "\n";

    remove(doc, {"a", "b", "c"}, in_place);
    move(doc, {"a", "b", "d"}, {"d"}, in_place);
    std::cout << "after move:    " << doc << "\n";

    set(doc, {"settings", "theme", "colors", 0}, "#202020", in_place);
    std::cout << "after set:     " << doc << "\n";
    std::cout << "exists /settings/theme: " << std::boolalpha << exists(doc, "/settings/theme"_path) << "\n";
}

void demo_patch()
{
    std::cout << "\n=== Patching ===\n\n";

    const Value doc = Value::map({{"a", Value::map({{"b", Value::map({{"c", "x"}})}})}});
    Value document = Value::vector({
        Value::map({{"op", "replace"}, {"path", "/a/b/c"}, {"value", 42}}),
        Value::map({{"op", "test"}, {"path", "/a/b/c"}, {"value", "C"}}),
    });

    try {
        (void)patch(doc, document);
    } catch (const PatchError& e) {
        std::cout << "patch failed at operation " << e.operation_index() << ": " << e.what() << "\n";
    }
    std::cout << "document unchanged: " << doc << "\n";

    Value target = MapBuilder(doc)
                       .set("tags", VectorBuilder().push_back("new"))
                       .finish();
    auto ops = diff(doc, target);
    std::cout << "diff as patch document: " << patch_to_value(ops) << "\n";
    std::cout << "patched:\n";
    print_leaves(patch(doc, ops));
}

void demo_errors()
{
    std::cout << "\n=== Errors ===\n\n";

    Value doc = Value::map({{"users", Value::vector({Value::map({{"name", "ann"}})})}});
    try {
        (void)get(doc, {"users", 3, "name"});
    } catch (const PathError& e) {
        std::cout << to_string(e.code()) << " at step " << e.failed_at_index() << ": " << e.what() << "\n";
    }

    try {
        (void)move(doc, {"users"}, {"users", 0, "self"});
    } catch (const PathError& e) {
        std::cout << to_string(e.code()) << ": " << e.what() << "\n";
    }
}

int main()
{
    demo_edit();
    demo_patch();
    demo_errors();
    return 0;
}
