/// @file tests/sentiment/test_sentiment_scorer.cpp
/// @brief Unit tests for SentimentScorer: squash shape, composite weighting,
///        category thresholds and unscorable inputs.

#include <gtest/gtest.h>
#include "gridsent/sentiment.hpp"

#include <cmath>
#include <limits>
#include <optional>

using namespace gridsent;
using namespace gridsent::sentiment;
using gridsent::baseline::Baseline;

namespace {

ObservationRecord obs(double price, double load) {
    return ObservationRecord{.zone = "NORTH", .price = price, .load = load};
}

const Baseline kPrice{.center = 30.0, .spread = 5.0, .sample_count = 168};
const Baseline kLoad{.center = 40000.0, .spread = 2000.0, .sample_count = 168};

}  // namespace

// ─── Test 1: Squash shape ─────────────────────────────────────────────────────

TEST(Squash, ZeroMapsToFifty) {
    SentimentScorer s;
    EXPECT_DOUBLE_EQ(s.squash(0.0), 50.0);
}

TEST(Squash, MatchesLogisticFormula) {
    SentimentScorer s;
    for (double z : {-3.0, -1.0, -0.25, 0.5, 2.0}) {
        EXPECT_NEAR(s.squash(z), 100.0 / (1.0 + std::exp(z)), 1e-9) << "z=" << z;
    }
}

TEST(Squash, SymmetricAroundZero) {
    SentimentScorer s;
    for (double z : {0.1, 1.0, 4.0, 17.5}) {
        EXPECT_NEAR(s.squash(-z), 100.0 - s.squash(z), 1e-9) << "z=" << z;
    }
}

TEST(Squash, MonotonicallyDecreasing) {
    SentimentScorer s;
    double prev = s.squash(-10.0);
    for (double z = -9.5; z <= 10.0; z += 0.5) {
        const double cur = s.squash(z);
        EXPECT_LT(cur, prev) << "z=" << z;
        prev = cur;
    }
}

TEST(Squash, SaturatesWithoutOverflow) {
    SentimentScorer s;
    EXPECT_DOUBLE_EQ(s.squash(1e6), 0.0);
    EXPECT_DOUBLE_EQ(s.squash(-1e6), 100.0);
    EXPECT_DOUBLE_EQ(s.squash(std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_DOUBLE_EQ(s.squash(-std::numeric_limits<double>::infinity()), 100.0);
}

TEST(Squash, NanIsNeutral) {
    SentimentScorer s;
    EXPECT_DOUBLE_EQ(s.squash(std::numeric_limits<double>::quiet_NaN()), 50.0);
}

// ─── Test 2: Categories ───────────────────────────────────────────────────────

TEST(Categorize, ThresholdBoundaries) {
    SentimentScorer s;
    EXPECT_EQ(s.categorize(100.0), SentimentCategory::Green);
    EXPECT_EQ(s.categorize(70.0), SentimentCategory::Green);
    EXPECT_EQ(s.categorize(69.999), SentimentCategory::Yellow);
    EXPECT_EQ(s.categorize(40.0), SentimentCategory::Yellow);
    EXPECT_EQ(s.categorize(39.999), SentimentCategory::Red);
    EXPECT_EQ(s.categorize(0.0), SentimentCategory::Red);
}

// ─── Test 3: Composite ────────────────────────────────────────────────────────

TEST(Score, AtBaselineIsFiftyYellow) {
    SentimentScorer s;
    const auto r = s.score(obs(30.0, 40000.0), kPrice, kLoad);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->score, 50.0);
    EXPECT_EQ(r->category, SentimentCategory::Yellow);
    EXPECT_DOUBLE_EQ(r->price_z, 0.0);
    EXPECT_DOUBLE_EQ(r->load_z, 0.0);
}

TEST(Score, CheapAndSlackIsGreen) {
    SentimentScorer s;
    const auto r = s.score(obs(15.0, 34000.0), kPrice, kLoad);  // z = −3, −3
    ASSERT_TRUE(r.has_value());
    EXPECT_GT(r->score, 90.0);
    EXPECT_EQ(r->category, SentimentCategory::Green);
}

TEST(Score, PriceSpikeWithNormalLoadIsRed) {
    SentimentScorer s;
    const auto r = s.score(obs(500.0, 40000.0), kPrice, kLoad);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->price_score, 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(r->load_score, 50.0);
    EXPECT_NEAR(r->score, 25.0, 1e-9);
    EXPECT_EQ(r->category, SentimentCategory::Red);
}

TEST(Score, CompositeIsWeightedMeanOfSubScores) {
    SentimentScorer s(SentimentConfig{.weights = {.price = 3.0, .load = 1.0}});
    const auto r = s.score(obs(35.0, 38000.0), kPrice, kLoad);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->score, 0.75 * r->price_score + 0.25 * r->load_score, 1e-9);
}

TEST(Score, AlwaysWithinBounds) {
    SentimentScorer s;
    for (double p : {-1e9, -100.0, 0.0, 30.0, 1e9}) {
        for (double l : {0.0, 40000.0, 1e12}) {
            const auto r = s.score(obs(p, l), kPrice, kLoad);
            ASSERT_TRUE(r.has_value());
            EXPECT_GE(r->score, 0.0);
            EXPECT_LE(r->score, 100.0);
        }
    }
}

// ─── Test 4: Unscorable ───────────────────────────────────────────────────────

TEST(Score, MissingBaselineIsUnscorable) {
    SentimentScorer s;
    EXPECT_FALSE(s.score(obs(30.0, 40000.0), std::nullopt, kLoad).has_value());
    EXPECT_FALSE(s.score(obs(30.0, 40000.0), kPrice, std::nullopt).has_value());
}

TEST(Score, NonFiniteObservationIsUnscorable) {
    SentimentScorer s;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(s.score(obs(nan, 40000.0), kPrice, kLoad).has_value());
}

TEST(Score, ZeroSpreadIsUnscorable) {
    SentimentScorer s;
    const Baseline flat{.center = 30.0, .spread = 0.0, .sample_count = 24};
    EXPECT_FALSE(s.score(obs(30.0, 40000.0), flat, kLoad).has_value());
}

// ─── Test 5: Weights ──────────────────────────────────────────────────────────

TEST(Weights, DefaultsAreEqual) {
    const auto w = SentimentWeights{}.normalize();
    EXPECT_DOUBLE_EQ(w.price, 0.5);
    EXPECT_DOUBLE_EQ(w.load, 0.5);
}

TEST(Weights, NormalizeSumsToOne) {
    const auto w = SentimentWeights{.price = 6.0, .load = 4.0}.normalize();
    EXPECT_DOUBLE_EQ(w.price, 0.6);
    EXPECT_DOUBLE_EQ(w.load, 0.4);
}

TEST(Weights, NegativeWeightCountsAsZero) {
    const auto w = SentimentWeights{.price = -1.0, .load = 2.0}.normalize();
    EXPECT_DOUBLE_EQ(w.price, 0.0);
    EXPECT_DOUBLE_EQ(w.load, 1.0);
}

TEST(Weights, AllZeroFallsBackToDefaults) {
    const auto w = SentimentWeights{.price = 0.0, .load = 0.0}.normalize();
    EXPECT_DOUBLE_EQ(w.price, constants::PRICE_WEIGHT);
    EXPECT_DOUBLE_EQ(w.load, constants::LOAD_WEIGHT);
}

TEST(Scorer, InvalidSlopeFallsBackToDefault) {
    SentimentScorer s(SentimentConfig{.logistic_slope = -2.0});
    EXPECT_DOUBLE_EQ(s.config().logistic_slope, constants::LOGISTIC_SLOPE);
}
