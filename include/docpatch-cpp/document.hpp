/// @file document.hpp
/// @brief The Document type and its deterministic serialization.

#pragma once

#include <docpatch-cpp/options.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace docpatch_cpp {

/// A rooted tree of objects, arrays, and scalars.
///
/// Object keys keep insertion order, so a document loaded from disk and
/// written back unchanged produces the same key order. Copying a Document
/// is a deep copy: two documents never share mutable state.
using Document = nlohmann::ordered_json;

/// Serialize a document to UTF-8 text.
///
/// The default form (2-space indent, insertion key order, non-ASCII left
/// unescaped, no trailing newline) is the persisted revision format.
/// With `sort_keys` the output is the canonical form used for comparison.
auto serialize(const Document& doc, const SerializeOptions& options = {}) -> std::string;

/// Parse UTF-8 JSON text into a document.
/// @param text The bytes to parse.
/// @param source A label for error messages (usually the file path).
/// @throws Error with ErrorKind::parse_error on invalid syntax.
auto parse_document(std::string_view text, std::string_view source = "<input>") -> Document;

/// Structural equality: objects compare as unordered key sets, arrays
/// element by element, numbers by value (1 equals 1.0).
auto equivalent(const Document& a, const Document& b) -> bool;

/// Return a copy of `doc` with every object's keys in sorted order.
auto sorted_keys(const Document& doc) -> Document;

}  // namespace docpatch_cpp
