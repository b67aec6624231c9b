#pragma once

#include <cstddef>

/// @file include/gridsent/constants.hpp
/// @brief Scoring, baseline and storage constants for gridsent.
///
/// Every constant here is also a default field of a config struct
/// (BaselineConfig, SentimentConfig, PipelineConfig), so a caller can
/// replace any of them per invocation without touching this file.

namespace gridsent::constants {

// ─── Baseline Window ──────────────────────────────────────────────────────────

/// Trailing window used for the robust baseline: 7 days of hourly data.
static constexpr int BASELINE_WINDOW_HOURS = 168;

/// Minimum qualifying observations in the window before a baseline exists.
/// Fewer samples means the record stays unscored.
static constexpr std::size_t MIN_BASELINE_SAMPLES = 24;

/// Scale factor turning MAD into a standard-deviation estimate under
/// normality: 1 / Φ⁻¹(3/4).
static constexpr double MAD_SCALE = 1.4826;

/// Spread floor for price ($/MWh). A flat window otherwise yields a
/// near-zero spread and an exploding z.
static constexpr double MIN_PRICE_SPREAD = 0.01;

/// Spread floor for system load (MW).
static constexpr double MIN_LOAD_SPREAD = 1.0;

// ─── Sentiment Score ──────────────────────────────────────────────────────────

/// Slope k of the logistic squash  sub(z) = 100 / (1 + e^{k·z}).
static constexpr double LOGISTIC_SLOPE = 1.0;

/// Composite weights. Must sum to 1.
static constexpr double PRICE_WEIGHT = 0.5;
static constexpr double LOAD_WEIGHT  = 0.5;

/// score >= GREEN_THRESHOLD → GREEN.
static constexpr double GREEN_THRESHOLD = 70.0;

/// GREEN_THRESHOLD > score >= YELLOW_THRESHOLD → YELLOW, below → RED.
static constexpr double YELLOW_THRESHOLD = 40.0;

static constexpr double SCORE_MIN = 0.0;
static constexpr double SCORE_MAX = 100.0;

// ─── Store ────────────────────────────────────────────────────────────────────

/// Upper bound on a history query (14 days). Larger requests are clamped.
static constexpr int MAX_HISTORY_HOURS = 24 * 14;

// ─── Collector Defaults ───────────────────────────────────────────────────────

/// Default refresh window applied to collector input.
static constexpr int DEFAULT_LOOKBACK_HOURS = 48;

} // namespace gridsent::constants
