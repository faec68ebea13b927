/// @file docpatch.hpp
/// @brief Umbrella header for the docpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Pointer, Operation, Patch, the store, diff, and clone helpers.

#pragma once

#include <docpatch-cpp/clone.hpp>
#include <docpatch-cpp/diff.hpp>
#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/log.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/patch.hpp>
#include <docpatch-cpp/pointer.hpp>
#include <docpatch-cpp/store.hpp>
