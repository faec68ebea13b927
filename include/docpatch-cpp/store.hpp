/// @file store.hpp
/// @brief Crash-safe persistence of document revisions.
///
/// A commit never exposes a partially written target: bytes go to a
/// temporary file in the target's directory, are fsync'd, and only then
/// renamed over the target. When a backup is requested, the previous
/// bytes are copied aside before the rename makes them unreachable.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/options.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace docpatch_cpp {

/// A document together with the exact bytes it was parsed from.
struct LoadedDocument {
    Document document;
    std::string bytes;
};

/// The outcome of a successful commit.
struct CommitResult {
    std::filesystem::path path;                        ///< The committed target.
    std::string digest;                                ///< Full SHA-256 hex of the new bytes.
    std::optional<std::filesystem::path> backup_path;  ///< Set when a backup was written.
};

/// Read a file's bytes.
/// @throws Error io_error.
auto read_file(const std::filesystem::path& path) -> std::string;

/// Read and parse a document.
/// @throws Error io_error, or parse_error naming `path`.
auto load_document(const std::filesystem::path& path) -> LoadedDocument;

/// Serialize `doc` and commit it atomically to `path`.
/// @throws Error io_error; `path` is left untouched on failure.
auto commit_document(const std::filesystem::path& path, const Document& doc,
                     const CommitOptions& options = {}) -> CommitResult;

/// Commit pre-serialized bytes atomically to `path`.
auto commit_bytes(const std::filesystem::path& path, std::string_view bytes,
                  const CommitOptions& options = {}) -> CommitResult;

/// Lowercase hex SHA-256 of `bytes`.
auto sha256_hex(std::string_view bytes) -> std::string;

/// The sibling path used to preserve the revision being replaced:
/// `<path>.bak.<YYYYMMDDThhmmssZ>.<first 8 hex chars of digest>`.
auto backup_path_for(const std::filesystem::path& path,
                     std::chrono::system_clock::time_point timestamp,
                     std::string_view digest) -> std::filesystem::path;

}  // namespace docpatch_cpp
