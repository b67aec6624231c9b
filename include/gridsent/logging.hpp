#pragma once

/// @file include/gridsent/logging.hpp
/// @brief Process-wide "gridsent" spdlog logger.

#include <spdlog/spdlog.h>

#include <memory>

namespace gridsent::logging {

/// Logger name registered with spdlog.
inline constexpr const char* LOGGER_NAME = "gridsent";

/// Install (or reconfigure) the stderr logger. Debug level when `verbose`.
void init(bool verbose);

/// The gridsent logger; created at info level on first use if `init` was
/// never called.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

} // namespace gridsent::logging
