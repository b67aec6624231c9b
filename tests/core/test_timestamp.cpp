/// @file tests/core/test_timestamp.cpp
/// @brief Unit tests for ISO-8601 parsing, formatting and hourly flooring.

#include <gtest/gtest.h>
#include "gridsent/timestamp.hpp"

#include <chrono>

using namespace gridsent;
using namespace gridsent::core;
using namespace std::chrono_literals;

// ─── parse_timestamp: accepted forms ──────────────────────────────────────────

TEST(ParseTimestamp, ZuluSuffix) {
    auto ts = parse_timestamp("2024-03-01T14:00:00Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, make_utc(2024, 3, 1, 14));
}

TEST(ParseTimestamp, ZeroOffsetEqualsZulu) {
    EXPECT_EQ(parse_timestamp("2024-03-01T14:00:00+00:00"),
              parse_timestamp("2024-03-01T14:00:00Z"));
}

TEST(ParseTimestamp, NegativeOffsetConvertsToUtc) {
    // 08:30 at UTC−6 is 14:30 UTC.
    auto ts = parse_timestamp("2024-03-01 08:30-06:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, make_utc(2024, 3, 1, 14, 30));
}

TEST(ParseTimestamp, PositiveOffsetCrossesMidnight) {
    auto ts = parse_timestamp("2024-03-02T01:00:00+0200");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, make_utc(2024, 3, 1, 23));
}

TEST(ParseTimestamp, FractionalSecondsDiscarded) {
    auto ts = parse_timestamp("2024-03-01T14:00:05.750Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, make_utc(2024, 3, 1, 14, 0, 5));
}

TEST(ParseTimestamp, SurroundingWhitespaceIgnored) {
    EXPECT_TRUE(parse_timestamp("  2024-03-01T14:00Z \r").has_value());
}

// ─── parse_timestamp: rejected forms ──────────────────────────────────────────

TEST(ParseTimestamp, MissingOffsetRejected) {
    EXPECT_FALSE(parse_timestamp("2024-03-01T14:00:00").has_value());
    EXPECT_FALSE(parse_timestamp("2024-03-01 14:00").has_value());
}

TEST(ParseTimestamp, InvalidCalendarDateRejected) {
    EXPECT_FALSE(parse_timestamp("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp("2024-13-01T00:00:00Z").has_value());
}

TEST(ParseTimestamp, InvalidClockRejected) {
    EXPECT_FALSE(parse_timestamp("2024-03-01T24:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp("2024-03-01T12:60:00Z").has_value());
}

TEST(ParseTimestamp, GarbageRejected) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2024-03-01T14:00:00Zjunk").has_value());
    EXPECT_FALSE(parse_timestamp("2024-03-01T14:00:00+25:00").has_value());
}

// ─── format_timestamp / floor_to_hour ─────────────────────────────────────────

TEST(FormatTimestamp, CanonicalUtcForm) {
    EXPECT_EQ(format_timestamp(make_utc(2024, 3, 1, 9, 5, 7)), "2024-03-01T09:05:07Z");
}

TEST(FormatTimestamp, ParsesBackToSameInstant) {
    const auto ts = make_utc(2023, 12, 31, 23);
    EXPECT_EQ(parse_timestamp(format_timestamp(ts)), ts);
}

TEST(FloorToHour, DropsMinutesAndSeconds) {
    EXPECT_EQ(floor_to_hour(make_utc(2024, 3, 1, 14, 59, 59)), make_utc(2024, 3, 1, 14));
}

TEST(FloorToHour, WholeHourUnchanged) {
    const auto ts = make_utc(2024, 3, 1, 14);
    EXPECT_EQ(floor_to_hour(ts), ts);
}

TEST(FloorToHour, PreEpochFloorsDown) {
    // floor, not truncation toward zero
    const Timestamp ts = Timestamp{} - 30min;
    EXPECT_EQ(floor_to_hour(ts), Timestamp{} - 1h);
}
