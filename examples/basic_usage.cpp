// basic_usage: demonstrates the core docpatch-cpp API
//
// Shows pointer reads and edits, a patch built from JSON text, a
// scratch-copy application, and a unified diff preview.
//
// Build: cmake -B build -DDOCPATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/basic_usage

#include <docpatch-cpp/docpatch.hpp>

#include <cstdio>
#include <string>

namespace dp = docpatch_cpp;

int main() {
    auto doc = dp::parse_document(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs"],
        "config": {"theme": "dark"}
    })");

    // -- Pointer reads --------------------------------------------------------
    const auto& first = dp::get(doc, dp::Pointer::parse("/items/0"));
    std::printf("First item: %s\n", first.get<std::string>().c_str());

    // Pointers can also be built token by token
    auto theme = dp::Pointer{} / std::string{"config"} / std::string{"theme"};
    std::printf("%s = %s\n", theme.to_string().c_str(), dp::get(doc, theme).dump().c_str());

    // -- Pointer edits --------------------------------------------------------
    dp::add(doc, dp::Pointer::parse("/items/-"), "Bread");
    dp::replace(doc, theme, "light");
    auto removed = dp::remove(doc, dp::Pointer::parse("/items/1"));
    std::printf("Removed: %s\n", removed.dump().c_str());

    // -- Errors carry a kind --------------------------------------------------
    try {
        dp::add(doc, dp::Pointer::parse("/title"), "Groceries");
    } catch (const dp::Error& e) {
        std::printf("add failed (%s): %s\n",
                    std::string{dp::to_string_view(e.kind())}.c_str(), e.what());
    }

    // -- Patches --------------------------------------------------------------
    auto patch = dp::parse_patch(dp::parse_document(R"([
        {"op": "test", "path": "/title", "value": "Shopping List"},
        {"op": "copy", "from": "/items", "path": "/backup"},
        {"op": "move", "from": "/config/theme", "path": "/theme"},
        {"op": "remove", "path": "/config"}
    ])"));

    // patched() leaves `doc` as it was, so it can serve as the "before" side
    auto next = dp::patched(doc, patch);
    std::printf("%zu operations applied\n", patch.size());

    std::printf("%s", dp::diff_documents(doc, next, "before", "after").c_str());
    std::printf("\n%s\n", dp::serialize(next).c_str());
    return 0;
}
