/// @file src/sentiment/sentiment_scorer.cpp
/// @brief SentimentScorer: logistic sub-scores, weighted composite, buckets.

#include "gridsent/sentiment.hpp"

#include <algorithm>
#include <cmath>

namespace gridsent::sentiment {

// ─── SentimentWeights::normalize ──────────────────────────────────────────────

SentimentWeights SentimentWeights::normalize() const noexcept {
    const double p = (std::isfinite(price) && price > 0.0) ? price : 0.0;
    const double l = (std::isfinite(load)  && load  > 0.0) ? load  : 0.0;
    const double total = p + l;
    if (total <= 0.0 || !std::isfinite(total)) {
        return SentimentWeights{};
    }
    return SentimentWeights{.price = p / total, .load = l / total};
}

// ─── Constructor ──────────────────────────────────────────────────────────────

SentimentScorer::SentimentScorer(SentimentConfig config) noexcept
    : config_(config),
      weights_(config.weights.normalize()) {
    if (!std::isfinite(config_.logistic_slope) || config_.logistic_slope <= 0.0) {
        config_.logistic_slope = constants::LOGISTIC_SLOPE;
    }
}

// ─── squash ───────────────────────────────────────────────────────────────────

double SentimentScorer::squash(double z) const noexcept {
    if (std::isnan(z)) {
        return 50.0;
    }
    // 100 / (1 + e^{k·z}); evaluated on |z| so exp never overflows, then
    // mirrored using sub(−z) = 100 − sub(z).
    const double e   = std::exp(-config_.logistic_slope * std::abs(z));  // ∈ (0, 1]
    const double low = constants::SCORE_MAX * e / (1.0 + e);             // sub(|z|) ≤ 50
    const double sub = z >= 0.0 ? low : constants::SCORE_MAX - low;
    return std::clamp(sub, constants::SCORE_MIN, constants::SCORE_MAX);
}

// ─── categorize ───────────────────────────────────────────────────────────────

SentimentCategory SentimentScorer::categorize(double score) const noexcept {
    if (score >= config_.green_threshold)  return SentimentCategory::Green;
    if (score >= config_.yellow_threshold) return SentimentCategory::Yellow;
    return SentimentCategory::Red;
}

// ─── score ────────────────────────────────────────────────────────────────────

std::optional<ScoredResult>
SentimentScorer::score(const ObservationRecord& observation,
                       const std::optional<baseline::Baseline>& price_baseline,
                       const std::optional<baseline::Baseline>& load_baseline) const noexcept {
    if (!price_baseline || !load_baseline) {
        return std::nullopt;
    }
    if (!std::isfinite(observation.price) || !std::isfinite(observation.load)) {
        return std::nullopt;
    }
    if (!(price_baseline->spread > 0.0) || !(load_baseline->spread > 0.0)) {
        return std::nullopt;
    }

    const double price_z = (observation.price - price_baseline->center) / price_baseline->spread;
    const double load_z  = (observation.load  - load_baseline->center)  / load_baseline->spread;

    const double price_sub = squash(price_z);
    const double load_sub  = squash(load_z);

    const double composite = std::clamp(weights_.price * price_sub + weights_.load * load_sub,
                                        constants::SCORE_MIN, constants::SCORE_MAX);

    return ScoredResult{
        .score       = composite,
        .category    = categorize(composite),
        .price_score = price_sub,
        .load_score  = load_sub,
        .price_z     = price_z,
        .load_z      = load_z,
    };
}

} // namespace gridsent::sentiment
