#include <docpatch-cpp/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

namespace docpatch_cpp::log {

namespace {

auto installed() -> std::shared_ptr<spdlog::logger>& {
    static auto logger = std::shared_ptr<spdlog::logger>{};
    return logger;
}

}  // anonymous namespace

auto get() -> std::shared_ptr<spdlog::logger> {
    auto& logger = installed();
    if (!logger) {
        logger = spdlog::get(logger_name);
        if (!logger) logger = spdlog::stderr_color_mt(logger_name);
    }
    return logger;
}

void set(std::shared_ptr<spdlog::logger> logger) {
    installed() = std::move(logger);
}

}  // namespace docpatch_cpp::log
