// Fuzz target for parse_patch() and the executor.
// Input is parsed as a patch document and applied to a scratch copy of a
// fixed plan; the original must never change.

#include <docpatch-cpp/docpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace dp = docpatch_cpp;
    static const auto plan = dp::parse_document(
        R"({"layers":[{"id":"T001","name":"Base","activities":[]}],"meta":{"version":1}})");
    static const auto plan_text = dp::serialize(plan);

    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto patch = dp::parse_patch(dp::parse_document(text));
        auto result = dp::patched(plan, patch);
        (void)dp::unified_diff(plan_text, dp::serialize(result), "a", "b");
    } catch (const dp::Error&) {
        // Rejected input
    }
    if (dp::serialize(plan) != plan_text) std::abort();
    return 0;
}
