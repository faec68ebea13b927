/// @file options.hpp
/// @brief Engine configuration: patch, commit, and serialization options.
///
/// Options are plain values passed into each entry point; the library
/// never reads configuration from the environment.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace docpatch_cpp {

/// How `add` treats an object key that is already present.
enum class AddMode : std::uint8_t {
    strict,  ///< Fail with target_exists (default).
    upsert,  ///< Overwrite the existing value (RFC 6902 reading).
};

/// Convert an AddMode to its string representation.
constexpr auto to_string_view(AddMode mode) noexcept -> std::string_view {
    switch (mode) {
        case AddMode::strict: return "strict";
        case AddMode::upsert: return "upsert";
    }
    return "unknown";
}

/// Options for the pointer mutators and the patch executor.
struct PatchOptions {
    AddMode add_mode{AddMode::strict};  ///< Strict-insert or upsert for object keys.
    /// When true, `add` creates missing intermediate object levels.
    /// Array elements are never created implicitly.
    bool create_missing_parents{false};

    auto operator==(const PatchOptions&) const -> bool = default;
};

/// Options for committing a document revision.
struct CommitOptions {
    bool make_backup{true};  ///< Preserve the prior bytes before replacing.
    /// Time used for the backup name. Defaults to the current UTC time.
    std::optional<std::chrono::system_clock::time_point> timestamp{};
};

/// Options for document serialization.
struct SerializeOptions {
    int indent{2};           ///< Spaces per nesting level.
    bool sort_keys{false};   ///< Canonical sorted-key form (diffs only).

    auto operator==(const SerializeOptions&) const -> bool = default;
};

}  // namespace docpatch_cpp
