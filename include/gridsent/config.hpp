#pragma once

/// @file include/gridsent/config.hpp
/// @brief CollectorConfig: environment and command-line settings.
///
/// Precedence: built-in default < environment < command line.
///
/// | Field            | Env var                   | Flag           |
/// |------------------|---------------------------|----------------|
/// | `store_path`     | `GRIDSENT_STORE`          | `--store PATH` |
/// | `lookback_hours` | `GRIDSENT_LOOKBACK_HOURS` | `--lookback N` |
/// | `verbose`        | `GRIDSENT_VERBOSE`        | `--verbose`    |

#include "gridsent/constants.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gridsent::core {

struct CollectorConfig {
    std::string store_path     = "data/gridsent.db";
    int         lookback_hours = constants::DEFAULT_LOOKBACK_HOURS;
    bool        verbose        = false;

    /// Environment lookup; returns `nullopt` for unset variables.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /// Read overrides from the process environment.
    ///
    /// # Throws
    /// `std::invalid_argument` if a numeric variable does not parse.
    [[nodiscard]] static CollectorConfig from_env();

    /// Same as `from_env` with an injectable lookup (tests).
    [[nodiscard]] static CollectorConfig from_env(const EnvLookup& lookup);

    /// Consume `--store`, `--lookback`, `--verbose` from `args`; every
    /// other argument is returned in order.
    ///
    /// # Throws
    /// `std::invalid_argument` for a flag missing its value or a
    /// non-numeric lookback.
    std::vector<std::string> apply_args(const std::vector<std::string>& args);

    /// # Throws
    /// `std::invalid_argument` if `lookback_hours <= 0` or `store_path` is empty.
    void validate() const;
};

} // namespace gridsent::core
