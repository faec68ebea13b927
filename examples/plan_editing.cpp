// plan_editing: edit a layered plan file on disk
//
// Clones a template layer, applies a guarded patch, previews the change
// as a unified diff, then commits it atomically with a backup of the
// previous revision.
//
// Build: cmake -B build -DDOCPATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/plan_editing [plan.json]

#include <docpatch-cpp/docpatch.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

namespace dp = docpatch_cpp;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
    auto path = (argc > 1) ? fs::path{argv[1]}
                           : fs::temp_directory_path() / "docpatch_plan_editing.json";

    try {
        // -- Seed the plan on first run ---------------------------------------
        if (!fs::exists(path)) {
            auto seed = dp::parse_document(R"({
                "plan": "release-1.4",
                "layers": [
                    {"id": "T001", "name": "Template", "activities": [{"type": "build"}]}
                ]
            })");
            auto result = dp::commit_document(path, seed);
            std::printf("Seeded %s (SHA256 %s)\n", path.c_str(), result.digest.c_str());
        }

        auto loaded = dp::load_document(path);
        auto scratch = loaded.document;

        // -- Clone the template layer -----------------------------------------
        auto layers = dp::Pointer::parse("/layers");
        auto count = dp::get(scratch, layers).size();
        dp::clone(scratch, layers / std::size_t{0}, layers / std::string{"-"},
                  "Layer " + std::to_string(count + 1));

        // -- Guarded patch on the new layer -----------------------------------
        auto last = layers / count;
        auto patch = dp::Patch{
            dp::TestOp{last / std::string{"id"}, "T001"},
            dp::ReplaceOp{last / std::string{"id"}, "T" + std::to_string(1000 + count + 1).substr(1)},
            dp::AddOp{last / std::string{"activities"} / std::string{"-"},
                      dp::parse_document(R"({"type": "review"})")},
        };
        dp::apply_patch(scratch, patch);

        // -- Preview and commit -----------------------------------------------
        auto diff = dp::unified_diff(loaded.bytes, dp::serialize(scratch),
                                     path.string(), path.string() + " (new)");
        std::printf("%s", diff.c_str());

        auto result = dp::commit_document(path, scratch);
        std::printf("Wrote %s (SHA256 %s)\n", result.path.c_str(), result.digest.c_str());
        if (result.backup_path) {
            std::printf("Backup: %s\n", result.backup_path->c_str());
        }
    } catch (const dp::Error& e) {
        std::fprintf(stderr, "ERROR: %s: %s\n",
                     std::string{dp::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }
    return 0;
}
