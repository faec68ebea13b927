// Fuzz target for Pointer::parse() and pointer lookups.
// Any pointer that parses must render back to the same text, and
// lookups against a fixed document may only fail with a library Error.

#include <docpatch-cpp/docpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace dp = docpatch_cpp;
    static const auto doc = dp::parse_document(
        R"({"a":{"b":[1,{"c~d":null,"e/f":"x"}]},"":{"":0},"list":[]})");

    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto ptr = dp::Pointer::parse(text);
        if (ptr.to_string() != text) std::abort();

        if (dp::contains(doc, ptr)) {
            (void)dp::get(doc, ptr);
        }
        auto scratch = doc;
        dp::add(scratch, ptr, nullptr, dp::PatchOptions{.create_missing_parents = true});
    } catch (const dp::Error&) {
        // Rejected input
    }
    return 0;
}
