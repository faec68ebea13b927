/// @file clone.hpp
/// @brief Duplicate an existing subtree (a "template" layer) elsewhere.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/pointer.hpp>

#include <optional>
#include <string>

namespace docpatch_cpp {

/// Deep-copy the fragment at `source` and add it at `dest`.
///
/// If the copy is an object and `name` is set, its "name" field is
/// overwritten. Insertion follows add(): cloning into an array inserts,
/// cloning onto a populated object key fails with target_exists under
/// strict mode.
///
/// @code
/// clone(doc, Pointer::parse("/layers/0"), Pointer::parse("/layers/-"), "Review");
/// @endcode
void clone(Document& doc, const Pointer& source, const Pointer& dest,
           const std::optional<std::string>& name = std::nullopt,
           const PatchOptions& options = {});

}  // namespace docpatch_cpp
