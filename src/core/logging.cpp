/// @file src/core/logging.cpp
/// @brief "gridsent" spdlog logger setup.

#include "gridsent/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gridsent::logging {

namespace {

constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S [%l] %n - %v";

/// Created once; function-local static keeps first use thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> create() {
    static const std::shared_ptr<spdlog::logger> logger = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern(kPattern);
        created->set_level(spdlog::level::info);
        return created;
    }();
    return logger;
}

}  // namespace

void init(bool verbose) {
    auto logger = create();
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> get() {
    return create();
}

} // namespace gridsent::logging
