// docpatch: edit JSON documents by pointer or patch file with atomic commits
//
// Usage:
//   docpatch <json_file> validate [--print-keys]
//   docpatch <json_file> get --pointer P
//   docpatch <json_file> set --pointer P --value JSON [--dry-run]
//   docpatch <json_file> add --pointer P --value JSON [--dry-run]
//   docpatch <json_file> remove --pointer P [--dry-run]
//   docpatch <json_file> apply-patch --patch FILE [--patch FILE ...] [--dry-run]
//   docpatch <json_file> clone-layer --from-pointer P --to-pointer Q [--name N] [--dry-run]
//   docpatch consolidate --patch FILE [--patch FILE ...] --out FILE

#include <docpatch-cpp/docpatch.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dp = docpatch_cpp;
namespace fs = std::filesystem;

namespace {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    fs::path json_file;
    std::string command;
    std::optional<std::string> pointer;
    std::optional<std::string> value;
    std::optional<std::string> from_pointer;
    std::optional<std::string> to_pointer;
    std::optional<std::string> name;
    std::vector<fs::path> patches;
    std::optional<fs::path> out;
    bool dry_run{false};
    bool print_keys{false};
    bool sort_keys{false};
    bool verbose{false};
    bool quiet{false};
    dp::PatchOptions patch{};
    dp::CommitOptions commit{};
};

void print_usage() {
    std::cerr
        << "Usage:\n"
        << "  docpatch <json_file> validate [--print-keys]\n"
        << "  docpatch <json_file> get --pointer P\n"
        << "  docpatch <json_file> set --pointer P --value JSON [--dry-run]\n"
        << "  docpatch <json_file> add --pointer P --value JSON [--dry-run]\n"
        << "  docpatch <json_file> remove --pointer P [--dry-run]\n"
        << "  docpatch <json_file> apply-patch --patch FILE [--patch FILE ...] [--dry-run]\n"
        << "  docpatch <json_file> clone-layer --from-pointer P --to-pointer Q [--name N] [--dry-run]\n"
        << "  docpatch consolidate --patch FILE [--patch FILE ...] --out FILE\n"
        << "Options:\n"
        << "  --upsert          add overwrites existing object keys\n"
        << "  --create-parents  add creates missing intermediate objects\n"
        << "  --no-backup       do not keep a .bak copy of the previous revision\n"
        << "  --sort-keys       compare sorted-key forms in --dry-run diffs\n"
        << "  --out FILE        commit to FILE instead of the input file\n"
        << "  -v, --verbose     debug logging (SPDLOG_LEVEL is also honoured)\n"
        << "  -q, --quiet       warnings and errors only\n";
}

auto parse_args(int argc, char** argv) -> CliOptions {
    auto opts = CliOptions{};
    auto args = std::vector<std::string_view>(argv + 1, argv + argc);
    auto i = std::size_t{0};

    if (!args.empty() && args[0] == "consolidate") {
        opts.command = "consolidate";
        i = 1;
    } else {
        if (args.size() < 2) throw UsageError{"expected <json_file> <command>"};
        opts.json_file = fs::path{args[0]};
        opts.command = std::string{args[1]};
        i = 2;
    }

    auto next_value = [&](std::string_view flag) -> std::string {
        if (i + 1 >= args.size()) {
            throw UsageError{"missing value for " + std::string{flag}};
        }
        return std::string{args[++i]};
    };

    for (; i < args.size(); ++i) {
        auto arg = args[i];
        if (arg == "--pointer") {
            opts.pointer = next_value(arg);
        } else if (arg == "--value") {
            opts.value = next_value(arg);
        } else if (arg == "--from-pointer") {
            opts.from_pointer = next_value(arg);
        } else if (arg == "--to-pointer") {
            opts.to_pointer = next_value(arg);
        } else if (arg == "--name") {
            opts.name = next_value(arg);
        } else if (arg == "--patch") {
            opts.patches.emplace_back(next_value(arg));
        } else if (arg == "--out") {
            opts.out = fs::path{next_value(arg)};
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--print-keys") {
            opts.print_keys = true;
        } else if (arg == "--sort-keys") {
            opts.sort_keys = true;
        } else if (arg == "--upsert") {
            opts.patch.add_mode = dp::AddMode::upsert;
        } else if (arg == "--create-parents") {
            opts.patch.create_missing_parents = true;
        } else if (arg == "--no-backup") {
            opts.commit.make_backup = false;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else {
            throw UsageError{"unknown argument: " + std::string{arg}};
        }
    }
    return opts;
}

auto require(const std::optional<std::string>& field, std::string_view flag) -> const std::string& {
    if (!field) throw UsageError{std::string{flag} + " is required"};
    return *field;
}

auto exit_code(dp::ErrorKind kind) -> int {
    switch (kind) {
        case dp::ErrorKind::parse_error:            return 2;
        case dp::ErrorKind::patch_assertion_failed: return 3;
        default:                                    return 1;
    }
}

// -- Commands -----------------------------------------------------------------

auto run_consolidate(const CliOptions& opts) -> int {
    if (opts.patches.empty()) throw UsageError{"--patch is required"};
    if (!opts.out) throw UsageError{"--out is required"};

    auto parts = std::vector<dp::Patch>{};
    for (const auto& path : opts.patches) {
        parts.push_back(dp::load_patch(path));
    }
    auto patch = dp::concat_patches(parts);
    auto json = dp::Document(patch);
    auto result = dp::commit_bytes(*opts.out, dp::serialize(json), opts.commit);
    std::cout << "Wrote " << result.path.string() << " with " << patch.size() << " ops\n";
    return 0;
}

auto run_validate(const CliOptions& opts, const dp::LoadedDocument& loaded) -> int {
    std::cout << "OK: parsed " << opts.json_file.string() << "\n";
    std::cout << "SHA256: " << dp::sha256_hex(loaded.bytes) << "\n";
    if (opts.print_keys) {
        if (loaded.document.is_object()) {
            auto keys = std::string{};
            for (auto it = loaded.document.begin(); it != loaded.document.end(); ++it) {
                if (!keys.empty()) keys += ", ";
                keys += it.key();
            }
            std::cout << "Top-level keys: " << keys << "\n";
        } else {
            std::cout << "Top-level is not an object\n";
        }
    }
    return 0;
}

/// Build the edited document on a scratch copy; the loaded one is untouched.
auto edit(const CliOptions& opts, const dp::Document& original) -> dp::Document {
    auto scratch = original;
    const auto& cmd = opts.command;

    if (cmd == "set") {
        auto ptr = dp::Pointer::parse(require(opts.pointer, "--pointer"));
        auto value = dp::parse_document(require(opts.value, "--value"), "--value");
        dp::apply_operation(scratch, dp::ReplaceOp{ptr, value}, opts.patch);
    } else if (cmd == "add") {
        auto ptr = dp::Pointer::parse(require(opts.pointer, "--pointer"));
        auto value = dp::parse_document(require(opts.value, "--value"), "--value");
        dp::apply_operation(scratch, dp::AddOp{ptr, value}, opts.patch);
    } else if (cmd == "remove") {
        auto ptr = dp::Pointer::parse(require(opts.pointer, "--pointer"));
        dp::apply_operation(scratch, dp::RemoveOp{ptr}, opts.patch);
    } else if (cmd == "apply-patch") {
        if (opts.patches.empty()) throw UsageError{"--patch is required"};
        auto parts = std::vector<dp::Patch>{};
        for (const auto& path : opts.patches) {
            parts.push_back(dp::load_patch(path));
        }
        dp::apply_patch(scratch, dp::concat_patches(parts), opts.patch);
    } else if (cmd == "clone-layer") {
        auto from = dp::Pointer::parse(require(opts.from_pointer, "--from-pointer"));
        auto to = dp::Pointer::parse(require(opts.to_pointer, "--to-pointer"));
        dp::clone(scratch, from, to, opts.name, opts.patch);
    } else {
        throw UsageError{"unknown command: " + cmd};
    }
    return scratch;
}

auto run_edit(const CliOptions& opts, const dp::LoadedDocument& loaded) -> int {
    auto edited = edit(opts, loaded.document);
    auto target = opts.out.value_or(opts.json_file);

    if (opts.dry_run) {
        auto before_label = opts.json_file.string();
        auto after_label = target.string() + " (new)";
        auto diff = opts.sort_keys
            ? dp::diff_documents(loaded.document, edited, before_label, after_label,
                                 dp::SerializeOptions{.sort_keys = true})
            : dp::unified_diff(loaded.bytes, dp::serialize(edited), before_label, after_label);
        std::cout << (diff.empty() ? std::string{"(no changes)\n"} : diff);
        return 0;
    }

    auto result = dp::commit_document(target, edited, opts.commit);
    std::cout << "Wrote " << result.path.string() << " (SHA256 " << result.digest << ")\n";
    if (result.backup_path) {
        std::cout << "Backup: " << result.backup_path->string() << "\n";
    }
    return 0;
}

auto run(const CliOptions& opts) -> int {
    if (opts.command == "consolidate") return run_consolidate(opts);

    auto loaded = dp::load_document(opts.json_file);
    if (opts.command == "validate") return run_validate(opts, loaded);
    if (opts.command == "get") {
        auto ptr = dp::Pointer::parse(require(opts.pointer, "--pointer"));
        std::cout << dp::serialize(dp::get(loaded.document, ptr)) << "\n";
        return 0;
    }
    return run_edit(opts, loaded);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    auto opts = CliOptions{};
    try {
        opts = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage();
        return 2;
    }

    spdlog::cfg::load_env_levels();
    auto logger = dp::log::get();
    if (opts.verbose) logger->set_level(spdlog::level::debug);
    if (opts.quiet) logger->set_level(spdlog::level::warn);

    try {
        return run(opts);
    } catch (const UsageError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage();
        return 2;
    } catch (const dp::Error& e) {
        std::cerr << "ERROR: " << dp::to_string_view(e.kind()) << ": " << e.what() << "\n";
        return exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
