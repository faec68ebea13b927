/// @file error.hpp
/// @brief Error types for the docpatch-cpp library.

#pragma once

#include <docpatch-cpp/document.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    malformed_pointer,       ///< A pointer string is syntactically invalid.
    invalid_token,           ///< The "-" token was used where no insertion happens.
    not_found,               ///< An object key (or a required parent) is absent.
    index_out_of_range,      ///< An array token is out of bounds or not numeric.
    type_mismatch,           ///< A token was applied to a scalar.
    target_exists,           ///< A strict add hit an existing object key.
    root_removal_forbidden,  ///< A remove targeted the document root.
    malformed_operation,     ///< A patch record is structurally invalid.
    patch_assertion_failed,  ///< A test operation did not match.
    parse_error,             ///< Input bytes are not valid JSON.
    io_error,                ///< A filesystem call failed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_pointer:      return "malformed_pointer";
        case ErrorKind::invalid_token:          return "invalid_token";
        case ErrorKind::not_found:              return "not_found";
        case ErrorKind::index_out_of_range:     return "index_out_of_range";
        case ErrorKind::type_mismatch:          return "type_mismatch";
        case ErrorKind::target_exists:          return "target_exists";
        case ErrorKind::root_removal_forbidden: return "root_removal_forbidden";
        case ErrorKind::malformed_operation:    return "malformed_operation";
        case ErrorKind::patch_assertion_failed: return "patch_assertion_failed";
        case ErrorKind::parse_error:            return "parse_error";
        case ErrorKind::io_error:               return "io_error";
    }
    return "unknown";
}

/// An exception with a category and a human-readable message.
///
/// Every failure raised by the library is an Error (or derived from it),
/// so callers can branch on kind() instead of on exception types.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    /// The category of this error.
    auto kind() const noexcept -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

/// Raised by a failing test operation.
///
/// Kept distinct from structural errors: it signals a guard condition
/// that the patch author asked for, not a malformed request.
class PatchAssertionError : public Error {
public:
    PatchAssertionError(std::string path, Document expected, Document actual);

    /// The pointer (as written) that was tested.
    auto path() const noexcept -> const std::string& { return path_; }
    /// The value the patch expected.
    auto expected() const noexcept -> const Document& { return expected_; }
    /// The value found in the document.
    auto actual() const noexcept -> const Document& { return actual_; }

private:
    std::string path_;
    Document expected_;
    Document actual_;
};

}  // namespace docpatch_cpp
