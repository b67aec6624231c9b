/// @file src/baseline/baseline_calculator.cpp
/// @brief Rolling median / scaled-MAD baseline.
///
/// Each compute call:
///   1. Collects the finite metric values in the window
///   2. Returns nullopt below the minimum sample count
///   3. center = median, spread = max(scale · median(|x − center|), floor)

#include "gridsent/baseline.hpp"

#include <algorithm>
#include <cmath>

namespace gridsent::baseline {

// ─── Constructor ──────────────────────────────────────────────────────────────

BaselineCalculator::BaselineCalculator(BaselineConfig config) noexcept
    : config_(config) {
    if (config_.min_samples < 1) {
        config_.min_samples = 1;
    }
}

// ─── median_inplace ───────────────────────────────────────────────────────────

double BaselineCalculator::median_inplace(std::vector<double>& values) noexcept {
    // Precondition: values is non-empty.
    const std::size_t n   = values.size();
    const std::size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid),
                     values.end());
    const double upper = values[mid];
    if (n % 2 == 1) {
        return upper;
    }
    // Even count: mean of the two middle order statistics. After
    // nth_element every element left of mid is ≤ upper.
    const double lower = *std::max_element(values.begin(),
                                           values.begin() + static_cast<std::ptrdiff_t>(mid));
    return lower + (upper - lower) / 2.0;
}

// ─── from_values ──────────────────────────────────────────────────────────────

std::optional<Baseline>
BaselineCalculator::from_values(std::vector<double> values, Metric metric) const {
    std::erase_if(values, [](double v) { return !std::isfinite(v); });

    if (values.size() < config_.min_samples) {
        return std::nullopt;
    }

    const std::size_t n      = values.size();
    const double      center = median_inplace(values);

    for (double& v : values) {
        v = std::abs(v - center);
    }
    const double mad = median_inplace(values);

    double spread = config_.mad_scale * mad;
    const double min_spread = config_.spread_floor(metric);
    if (!std::isfinite(spread) || spread < min_spread) {
        spread = min_spread;
    }

    return Baseline{
        .center       = center,
        .spread       = spread,
        .sample_count = n,
    };
}

// ─── compute / compute_at ─────────────────────────────────────────────────────

std::optional<Baseline>
BaselineCalculator::compute(std::span<const ObservationRecord> history,
                            Metric metric) const {
    std::vector<double> values;
    values.reserve(history.size());
    for (const auto& rec : history) {
        values.push_back(rec.value(metric));
    }
    return from_values(std::move(values), metric);
}

std::optional<Baseline>
BaselineCalculator::compute_at(std::span<const ObservationRecord> history,
                               Metric metric,
                               Timestamp as_of) const {
    const Timestamp window_start = as_of - config_.window;

    std::vector<double> values;
    values.reserve(std::min<std::size_t>(history.size(),
                                         static_cast<std::size_t>(config_.window.count())));
    for (const auto& rec : history) {
        // [as_of − window, as_of): the scored record itself is excluded.
        if (rec.timestamp >= window_start && rec.timestamp < as_of) {
            values.push_back(rec.value(metric));
        }
    }
    return from_values(std::move(values), metric);
}

} // namespace gridsent::baseline
