// Helper to generate seed corpus files for the fuzz targets.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <docpatch-cpp/docpatch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::filesystem::path& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << data;
}

int main() {
    namespace dp = docpatch_cpp;
    namespace fs = std::filesystem;
    const auto pointer_dir = fs::path{"fuzz/corpus/pointer"};
    const auto patch_dir = fs::path{"fuzz/corpus/patch"};
    fs::create_directories(pointer_dir);
    fs::create_directories(patch_dir);

    // Pointer seeds: root, escapes, array tokens
    const char* pointers[] = {"", "/", "/a/b/0", "/a/b/1/c~0d", "/a/b/1/e~1f", "/list/-", "//"};
    auto n = 0;
    for (const auto* text : pointers) {
        write_seed(pointer_dir / ("seed_" + std::to_string(n++) + ".txt"), text);
    }

    // Patch seeds: one per operation, built from typed operations
    const auto layer = dp::Pointer::parse("/layers/0");
    const dp::Patch patches[] = {
        {dp::AddOp{layer / std::string{"activities"} / std::string{"-"},
                   dp::parse_document(R"({"type":"review"})")}},
        {dp::RemoveOp{layer / std::string{"name"}}},
        {dp::ReplaceOp{dp::Pointer::parse("/meta/version"), 2}},
        {dp::MoveOp{layer, dp::Pointer::parse("/archived")}},
        {dp::CopyOp{layer, dp::Pointer::parse("/layers/-")}},
        {dp::TestOp{layer / std::string{"id"}, "T001"},
         dp::AddOp{layer / std::string{"owner"}, "ops"}},
    };
    n = 0;
    for (const auto& patch : patches) {
        write_seed(patch_dir / ("seed_" + std::to_string(n++) + ".json"),
                   dp::serialize(dp::Document(patch)));
    }
    return 0;
}
