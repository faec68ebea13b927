/// @file log.hpp
/// @brief Library logger access.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace docpatch_cpp::log {

/// Name of the library logger.
inline constexpr auto logger_name = "docpatch";

/// The library logger. Created on first use with a stderr sink
/// unless one was installed with set().
auto get() -> std::shared_ptr<spdlog::logger>;

/// Install a caller-provided logger (nullptr restores the default).
void set(std::shared_ptr<spdlog::logger> logger);

}  // namespace docpatch_cpp::log
