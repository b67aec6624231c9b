#pragma once

/// @file include/gridsent/sentiment.hpp
/// @brief SentimentScorer: composite [0,100] favorability score.
///
/// # Module: Sentiment Scorer
///
/// ## Responsibility
/// Turn one observation plus its price and load baselines into a bounded
/// score and a GREEN/YELLOW/RED category.
///
/// ## Formula
/// ```
/// z_m      = (value_m − center_m) / spread_m              m ∈ {price, load}
/// sub_m    = 100 / (1 + exp(slope · z_m))                  logistic squash
/// score    = w_price · sub_price + w_load · sub_load       w_price + w_load = 1
/// category = GREEN if score ≥ 70, YELLOW if score ≥ 40, else RED
/// ```
///
/// The squash is monotonically decreasing, saturates at 0 and 100, and is
/// symmetric: sub(−z) = 100 − sub(z), sub(0) = 50. Cheap power (z < 0) is
/// favorable for consumers and scores high.
///
/// ## Guarantees
/// - Pure: no state, no I/O
/// - Any finite input yields a score in [0, 100]
/// - Either baseline missing → `nullopt` (Unscorable)

#include "gridsent/baseline.hpp"
#include "gridsent/constants.hpp"
#include "gridsent/types.hpp"

#include <optional>

namespace gridsent::sentiment {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Composite weights. Use `normalize()` to accept arbitrary non-negative
/// weights; the scorer always normalizes before use.
struct SentimentWeights {
    double price = constants::PRICE_WEIGHT;
    double load  = constants::LOAD_WEIGHT;

    /// Rescale to sum 1. Negative or non-finite weights count as 0; if
    /// both end up 0 the defaults are returned.
    [[nodiscard]] SentimentWeights normalize() const noexcept;
};

struct SentimentConfig {
    SentimentWeights weights{};
    double logistic_slope   = constants::LOGISTIC_SLOPE;
    double green_threshold  = constants::GREEN_THRESHOLD;
    double yellow_threshold = constants::YELLOW_THRESHOLD;
};

// ─── Result ───────────────────────────────────────────────────────────────────

struct ScoredResult {
    double            score;        ///< composite, [0, 100]
    SentimentCategory category;
    double            price_score;  ///< per-metric sub-score, [0, 100]
    double            load_score;
    double            price_z;      ///< standardized deviations
    double            load_z;
};

// ─── SentimentScorer ──────────────────────────────────────────────────────────

class SentimentScorer {
public:
    explicit SentimentScorer(SentimentConfig config = SentimentConfig{}) noexcept;

    /// Score `observation` against its baselines.
    ///
    /// # Returns
    /// - `nullopt` if either baseline is missing, the observation values
    ///   are non-finite, or a baseline spread is not positive
    /// - ScoredResult otherwise
    [[nodiscard]] std::optional<ScoredResult>
    score(const ObservationRecord& observation,
          const std::optional<baseline::Baseline>& price_baseline,
          const std::optional<baseline::Baseline>& load_baseline) const noexcept;

    /// Logistic squash of a standardized deviation into [0, 100].
    [[nodiscard]] double squash(double z) const noexcept;

    /// Category for a composite score.
    [[nodiscard]] SentimentCategory categorize(double score) const noexcept;

    [[nodiscard]] const SentimentConfig& config() const noexcept { return config_; }

private:
    SentimentConfig  config_;
    SentimentWeights weights_;  ///< normalized copy of config_.weights
};

} // namespace gridsent::sentiment
