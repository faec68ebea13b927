/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing and pointer-addressed edits.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/options.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch_cpp {

/// A parsed JSON Pointer: an ordered list of unescaped reference tokens.
///
/// The empty pointer addresses the document root. "/" is a pointer with
/// a single empty-string token (the "" key of the root object).
///
/// @code
/// auto ptr = Pointer::parse("/layers/0/name");
/// ptr.size();       // 3
/// ptr.back();       // "name"
/// ptr.to_string();  // "/layers/0/name"
/// @endcode
class Pointer {
public:
    /// The root pointer.
    Pointer() = default;

    /// Construct from already-unescaped tokens.
    explicit Pointer(std::vector<std::string> tokens) : tokens_{std::move(tokens)} {}

    /// Parse a pointer string.
    /// @throws Error with ErrorKind::malformed_pointer if the string is
    ///   non-empty and does not start with '/', or has a bad '~' escape.
    static auto parse(std::string_view text) -> Pointer;

    /// Escape a single token: '~' -> "~0", '/' -> "~1".
    static auto escape(std::string_view token) -> std::string;

    /// Render back to pointer syntax.
    auto to_string() const -> std::string;

    auto is_root() const noexcept -> bool { return tokens_.empty(); }
    auto size() const noexcept -> std::size_t { return tokens_.size(); }
    auto tokens() const noexcept -> const std::vector<std::string>& { return tokens_; }
    auto back() const -> const std::string& { return tokens_.back(); }

    /// The pointer to the containing value. The root's parent is the root.
    auto parent() const -> Pointer;

    /// Append a token (unescaped).
    void push_back(std::string token) { tokens_.push_back(std::move(token)); }

    /// Append an array index.
    void push_back(std::size_t index) { tokens_.push_back(std::to_string(index)); }

    auto begin() const noexcept { return tokens_.begin(); }
    auto end() const noexcept { return tokens_.end(); }

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

/// Return `ptr` extended by one token.
auto operator/(Pointer ptr, std::string token) -> Pointer;

/// Return `ptr` extended by one array index.
auto operator/(Pointer ptr, std::size_t index) -> Pointer;

/// ADL serialization: a pointer becomes its escaped string form.
void to_json(Document& j, const Pointer& ptr);

/// Interpret a token as an array index.
/// Accepts base-10 digits without leading zeros ("0" itself is fine).
auto parse_array_index(std::string_view token) -> std::optional<std::size_t>;

// =============================================================================
// Pointer-addressed reads and edits
// =============================================================================

/// Get the fragment at `ptr`.
/// @throws Error not_found, index_out_of_range, type_mismatch, invalid_token.
auto get(const Document& doc, const Pointer& ptr) -> const Document&;

/// Check whether `ptr` resolves to a value (never throws for lookups).
auto contains(const Document& doc, const Pointer& ptr) -> bool;

/// Insert `value` at `ptr`.
///
/// An empty pointer replaces the whole document. Under an object the key
/// must be absent unless `options.add_mode` is upsert. Under an array, "-"
/// appends and an index in [0, size] inserts before that position.
/// @throws Error target_exists, index_out_of_range, not_found, type_mismatch.
void add(Document& doc, const Pointer& ptr, Document value,
         const PatchOptions& options = {});

/// Overwrite the existing value at `ptr`.
/// @throws Error not_found, index_out_of_range, invalid_token, type_mismatch.
void replace(Document& doc, const Pointer& ptr, Document value);

/// Remove the value at `ptr` and return it. Later array elements shift left.
/// @throws Error root_removal_forbidden, not_found, index_out_of_range,
///   invalid_token, type_mismatch.
auto remove(Document& doc, const Pointer& ptr) -> Document;

}  // namespace docpatch_cpp
