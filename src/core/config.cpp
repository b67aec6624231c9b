/// @file src/core/config.cpp
/// @brief CollectorConfig: environment and argv overrides.

#include "gridsent/config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace gridsent::core {

namespace {

[[nodiscard]] int parse_int(const std::string& text, const std::string& what) {
    int value = 0;
    const auto* begin = text.data();
    const auto* end   = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        throw std::invalid_argument(fmt::format("{} must be an integer, got '{}'", what, text));
    }
    return value;
}

[[nodiscard]] bool parse_flag(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

}  // namespace

// ─── from_env ─────────────────────────────────────────────────────────────────

CollectorConfig CollectorConfig::from_env() {
    return from_env([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    });
}

CollectorConfig CollectorConfig::from_env(const EnvLookup& lookup) {
    CollectorConfig config;

    if (auto v = lookup("GRIDSENT_STORE"); v && !v->empty()) {
        config.store_path = *v;
    }
    if (auto v = lookup("GRIDSENT_LOOKBACK_HOURS"); v && !v->empty()) {
        config.lookback_hours = parse_int(*v, "GRIDSENT_LOOKBACK_HOURS");
    }
    if (auto v = lookup("GRIDSENT_VERBOSE"); v) {
        config.verbose = parse_flag(*v);
    }

    return config;
}

// ─── apply_args ───────────────────────────────────────────────────────────────

std::vector<std::string> CollectorConfig::apply_args(const std::vector<std::string>& args) {
    std::vector<std::string> rest;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--store" || arg == "--lookback") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(fmt::format("{} requires a value", arg));
            }
            const std::string& value = args[++i];
            if (arg == "--store") {
                store_path = value;
            } else {
                lookback_hours = parse_int(value, "--lookback");
            }
        } else {
            rest.push_back(arg);
        }
    }

    return rest;
}

// ─── validate ─────────────────────────────────────────────────────────────────

void CollectorConfig::validate() const {
    if (store_path.empty()) {
        throw std::invalid_argument("store path must not be empty");
    }
    if (lookback_hours <= 0) {
        throw std::invalid_argument(
            fmt::format("lookback must be a positive number of hours, got {}", lookback_hours));
    }
}

} // namespace gridsent::core
