#include <docpatch-cpp/patch.hpp>

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/log.hpp>
#include <docpatch-cpp/store.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace docpatch_cpp {

namespace {

template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

auto malformed(std::size_t index, const std::string& what) -> Error {
    return Error{ErrorKind::malformed_operation,
                 "Patch[" + std::to_string(index) + "] " + what};
}

auto required_pointer(const Document& record, const char* field, std::size_t index,
                      std::string_view op) -> Pointer {
    auto it = record.find(field);
    if (it == record.end() || !it->is_string()) {
        throw malformed(index, "missing valid '" + std::string{field} + "' for " +
                               std::string{op});
    }
    return Pointer::parse(it->get_ref<const std::string&>());
}

auto required_value(const Document& record, std::size_t index, std::string_view op)
    -> Document {
    auto it = record.find("value");
    if (it == record.end()) {
        throw malformed(index, "missing 'value' for " + std::string{op});
    }
    return *it;
}

}  // anonymous namespace

auto op_name(const Operation& op) -> std::string_view {
    return std::visit(overload{
        [](const AddOp&) { return std::string_view{"add"}; },
        [](const RemoveOp&) { return std::string_view{"remove"}; },
        [](const ReplaceOp&) { return std::string_view{"replace"}; },
        [](const MoveOp&) { return std::string_view{"move"}; },
        [](const CopyOp&) { return std::string_view{"copy"}; },
        [](const TestOp&) { return std::string_view{"test"}; },
    }, op);
}

// =============================================================================
// Patch file format
// =============================================================================

auto parse_patch(const Document& json) -> Patch {
    if (!json.is_array()) {
        throw Error{ErrorKind::malformed_operation,
                    "JSON Patch must be an array of operations"};
    }

    auto patch = Patch{};
    patch.reserve(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
        const auto& record = json[i];
        if (!record.is_object()) {
            throw malformed(i, "is not an object");
        }
        auto op_it = record.find("op");
        if (op_it == record.end() || !op_it->is_string()) {
            throw malformed(i, "missing valid 'op'");
        }
        const auto& op = op_it->get_ref<const std::string&>();
        auto path = required_pointer(record, "path", i, op);

        if (op == "add") {
            patch.push_back(AddOp{std::move(path), required_value(record, i, op)});
        } else if (op == "remove") {
            patch.push_back(RemoveOp{std::move(path)});
        } else if (op == "replace") {
            patch.push_back(ReplaceOp{std::move(path), required_value(record, i, op)});
        } else if (op == "move") {
            patch.push_back(MoveOp{required_pointer(record, "from", i, op), std::move(path)});
        } else if (op == "copy") {
            patch.push_back(CopyOp{required_pointer(record, "from", i, op), std::move(path)});
        } else if (op == "test") {
            patch.push_back(TestOp{std::move(path), required_value(record, i, op)});
        } else {
            throw malformed(i, "unsupported op: " + op);
        }
    }
    return patch;
}

void to_json(Document& j, const Operation& op) {
    j = Document::object();
    j["op"] = op_name(op);
    std::visit(overload{
        [&](const AddOp& o) {
            j["path"] = o.path;
            j["value"] = o.value;
        },
        [&](const RemoveOp& o) {
            j["path"] = o.path;
        },
        [&](const ReplaceOp& o) {
            j["path"] = o.path;
            j["value"] = o.value;
        },
        [&](const MoveOp& o) {
            j["from"] = o.from;
            j["path"] = o.path;
        },
        [&](const CopyOp& o) {
            j["from"] = o.from;
            j["path"] = o.path;
        },
        [&](const TestOp& o) {
            j["path"] = o.path;
            j["value"] = o.value;
        },
    }, op);
}

auto load_patch(const std::filesystem::path& path) -> Patch {
    auto bytes = read_file(path);
    return parse_patch(parse_document(bytes, path.string()));
}

auto concat_patches(const std::vector<Patch>& patches) -> Patch {
    auto result = Patch{};
    for (const auto& patch : patches) {
        result.insert(result.end(), patch.begin(), patch.end());
    }
    return result;
}

// =============================================================================
// Execution
// =============================================================================

void apply_operation(Document& doc, const Operation& op, const PatchOptions& options) {
    std::visit(overload{
        [&](const AddOp& o) {
            add(doc, o.path, o.value, options);
        },
        [&](const RemoveOp& o) {
            remove(doc, o.path);
        },
        [&](const ReplaceOp& o) {
            replace(doc, o.path, o.value);
        },
        [&](const MoveOp& o) {
            // get, remove, add in that order: moving into a descendant of
            // `from` fails once the subtree is gone
            auto value = Document(get(doc, o.from));
            remove(doc, o.from);
            add(doc, o.path, std::move(value), options);
        },
        [&](const CopyOp& o) {
            auto value = Document(get(doc, o.from));
            add(doc, o.path, std::move(value), options);
        },
        [&](const TestOp& o) {
            const auto& actual = get(doc, o.path);
            if (!equivalent(actual, o.value)) {
                throw PatchAssertionError{o.path.to_string(), o.value, actual};
            }
        },
    }, op);
}

void apply_patch(Document& doc, const Patch& patch, const PatchOptions& options) {
    auto logger = log::get();
    logger->debug("applying {} operation(s), add mode {}", patch.size(),
                  to_string_view(options.add_mode));
    for (std::size_t i = 0; i < patch.size(); ++i) {
        const auto& op = patch[i];
        try {
            apply_operation(doc, op, options);
        } catch (const Error& e) {
            logger->debug("operation {} ({}) failed: {}", i, op_name(op), e.what());
            throw;
        }
        logger->debug("operation {} ({}) applied", i, op_name(op));
    }
}

void apply_json_patch(Document& doc, const Document& patch_json, const PatchOptions& options) {
    apply_patch(doc, parse_patch(patch_json), options);
}

auto patched(const Document& doc, const Patch& patch, const PatchOptions& options)
    -> Document {
    auto scratch = doc;
    apply_patch(scratch, patch, options);
    return scratch;
}

}  // namespace docpatch_cpp
