/// @file diff.hpp
/// @brief Unified diffs of serialized documents for change previews.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/options.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace docpatch_cpp {

/// Number of unchanged lines shown around each hunk.
inline constexpr std::size_t diff_context_lines = 3;

/// Produce a line-oriented unified diff of two texts.
///
/// Returns an empty string when the inputs are byte-identical.
/// @param before Original text.
/// @param after Modified text.
/// @param before_label Name printed on the "---" line.
/// @param after_label Name printed on the "+++" line.
auto unified_diff(std::string_view before, std::string_view after,
                  std::string_view before_label, std::string_view after_label)
    -> std::string;

/// Serialize both documents and diff the results.
auto diff_documents(const Document& before, const Document& after,
                    std::string_view before_label, std::string_view after_label,
                    const SerializeOptions& options = {}) -> std::string;

}  // namespace docpatch_cpp
