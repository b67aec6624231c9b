#pragma once

/// @file include/gridsent/baseline.hpp
/// @brief BaselineCalculator: rolling robust baseline (median, scaled MAD).
///
/// # Module: Baseline Calculator
///
/// ## Responsibility
/// Summarize the trailing 7 days of one metric for one zone as a robust
/// centre and spread, against which the current observation is compared.
///
/// ## Formula
/// For the metric values x₁…xₙ in the window:
/// ```
/// center = median(x)
/// mad    = median(|xᵢ − center|)
/// spread = max(MAD_SCALE · mad, spread_floor(metric))
/// ```
///
/// ## Robustness
/// A single spike in the window moves the median and the MAD by at most
/// one rank, however large the spike.
///
/// ## Edge Cases
/// - Fewer than `min_samples` qualifying (finite) values → `nullopt`
/// - Flat window (MAD = 0) → spread equals the floor
/// - Non-finite values in history are not qualifying and are ignored
///
/// ## Guarantees
/// - Deterministic for identical input
/// - Never returns NaN/Inf; never divides by zero downstream

#include "gridsent/constants.hpp"
#include "gridsent/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace gridsent::baseline {

/// Robust summary of a metric over a window.
struct Baseline {
    double      center;        ///< median
    double      spread;        ///< MAD_SCALE · MAD, floored
    std::size_t sample_count;  ///< qualifying values used
};

struct BaselineConfig {
    std::chrono::hours window{constants::BASELINE_WINDOW_HOURS};
    std::size_t min_samples      = constants::MIN_BASELINE_SAMPLES;
    double      mad_scale        = constants::MAD_SCALE;
    double      min_price_spread = constants::MIN_PRICE_SPREAD;
    double      min_load_spread  = constants::MIN_LOAD_SPREAD;

    [[nodiscard]] double spread_floor(Metric m) const noexcept {
        return m == Metric::Price ? min_price_spread : min_load_spread;
    }
};

class BaselineCalculator {
public:
    explicit BaselineCalculator(BaselineConfig config = BaselineConfig{}) noexcept;

    /// Baseline over every record in `history` (caller has already cut
    /// the window).
    ///
    /// # Returns
    /// `nullopt` (Insufficient) if fewer than `min_samples` finite values.
    [[nodiscard]] std::optional<Baseline>
    compute(std::span<const ObservationRecord> history, Metric metric) const;

    /// Baseline for a record at `as_of`: uses only records with timestamp
    /// in `[as_of − window, as_of)`, so the scored record itself is excluded.
    [[nodiscard]] std::optional<Baseline>
    compute_at(std::span<const ObservationRecord> history,
               Metric metric,
               Timestamp as_of) const;

    /// Robust statistics over raw values. Exposed for tests and benches.
    [[nodiscard]] std::optional<Baseline>
    from_values(std::vector<double> values, Metric metric) const;

    [[nodiscard]] const BaselineConfig& config() const noexcept { return config_; }

    /// Median of `values`; reorders the vector. Precondition: non-empty.
    [[nodiscard]] static double median_inplace(std::vector<double>& values) noexcept;

private:
    BaselineConfig config_;
};

} // namespace gridsent::baseline
