/// @file patch.hpp
/// @brief Patch operations (RFC 6902 op set) and the ordered executor.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/pointer.hpp>

#include <filesystem>
#include <string_view>
#include <variant>
#include <vector>

namespace docpatch_cpp {

/// Insert `value` at `path`.
struct AddOp {
    Pointer path;
    Document value;
    auto operator==(const AddOp&) const -> bool = default;
};

/// Remove the value at `path`.
struct RemoveOp {
    Pointer path;
    auto operator==(const RemoveOp&) const -> bool = default;
};

/// Overwrite the existing value at `path`.
struct ReplaceOp {
    Pointer path;
    Document value;
    auto operator==(const ReplaceOp&) const -> bool = default;
};

/// Remove the value at `from` and add it at `path`.
struct MoveOp {
    Pointer from;
    Pointer path;
    auto operator==(const MoveOp&) const -> bool = default;
};

/// Add a deep copy of the value at `from` at `path`.
struct CopyOp {
    Pointer from;
    Pointer path;
    auto operator==(const CopyOp&) const -> bool = default;
};

/// Assert that the value at `path` equals `value`.
struct TestOp {
    Pointer path;
    Document value;
    auto operator==(const TestOp&) const -> bool = default;
};

/// A single patch operation.
using Operation = std::variant<
    AddOp,
    RemoveOp,
    ReplaceOp,
    MoveOp,
    CopyOp,
    TestOp
>;

/// An ordered list of operations, applied strictly in sequence.
using Patch = std::vector<Operation>;

/// The wire name of an operation ("add", "remove", ...).
auto op_name(const Operation& op) -> std::string_view;

// =============================================================================
// Patch file format
// =============================================================================

/// Validate and convert a JSON patch document into typed operations.
///
/// This is the structural pre-check: every record is checked (op name,
/// string path, value for add/replace/test, string from for move/copy,
/// pointer syntax) before any operation runs.
/// @throws Error malformed_operation or malformed_pointer.
auto parse_patch(const Document& json) -> Patch;

/// Serialize one operation back to its patch-file record.
/// A Patch converts to a patch-file array through this overload.
void to_json(Document& j, const Operation& op);

/// Load and parse a patch file.
/// @throws Error io_error, parse_error, malformed_operation, malformed_pointer.
auto load_patch(const std::filesystem::path& path) -> Patch;

/// Concatenate patches in the given order.
auto concat_patches(const std::vector<Patch>& patches) -> Patch;

// =============================================================================
// Execution
// =============================================================================

/// Apply a single operation to `doc` in place.
void apply_operation(Document& doc, const Operation& op, const PatchOptions& options = {});

/// Apply `patch` to `doc` in place, in order, stopping at the first failure.
///
/// Operations that ran before the failing one stay applied. Use patched()
/// when the caller must observe all-or-nothing results.
void apply_patch(Document& doc, const Patch& patch, const PatchOptions& options = {});

/// Apply a patch given in patch-file form (pre-checked before running).
void apply_json_patch(Document& doc, const Document& patch_json, const PatchOptions& options = {});

/// Apply `patch` to a private copy of `doc` and return the result.
/// `doc` is never modified, even when an operation fails.
auto patched(const Document& doc, const Patch& patch, const PatchOptions& options = {})
    -> Document;

}  // namespace docpatch_cpp
