/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for the raw-observation CSV loader.

#include <gtest/gtest.h>
#include "gridsent/data_loader.hpp"
#include "gridsent/timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace gridsent;
using namespace gridsent::core;

namespace {

const char* kHeader = "timestamp,zone,price,load\n";

}  // namespace

// ─── parse_row ────────────────────────────────────────────────────────────────

TEST(DataLoader_ParseRow, ValidRow) {
    auto row = DataLoader::parse_row("2024-03-01T14:00:00Z,LZ_NORTH,31.25,48210");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->timestamp, make_utc(2024, 3, 1, 14));
    EXPECT_EQ(row->zone_raw, "LZ_NORTH");
    EXPECT_DOUBLE_EQ(row->price, 31.25);
    EXPECT_DOUBLE_EQ(row->load, 48210.0);
}

TEST(DataLoader_ParseRow, NegativePriceAccepted) {
    auto row = DataLoader::parse_row("2024-03-01T14:00:00Z,HB_WEST,-12.5,30000");
    ASSERT_TRUE(row.has_value());
    EXPECT_DOUBLE_EQ(row->price, -12.5);
}

TEST(DataLoader_ParseRow, ZoneWithSpacesKeptVerbatim) {
    auto row = DataLoader::parse_row("2024-03-01T14:00:00Z, HB North Hub ,20,1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->zone_raw, "HB North Hub");
}

TEST(DataLoader_ParseRow, WrongFieldCountRejected) {
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z,NORTH,20").has_value());
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z,NORTH,20,1,9").has_value());
}

TEST(DataLoader_ParseRow, NaiveTimestampRejected) {
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00,NORTH,20,1").has_value());
}

TEST(DataLoader_ParseRow, NonNumericRejected) {
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z,NORTH,abc,1").has_value());
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z,NORTH,20,1x").has_value());
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z,NORTH,nan,1").has_value());
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z,NORTH,inf,1").has_value());
}

TEST(DataLoader_ParseRow, EmptyZoneRejected) {
    EXPECT_FALSE(DataLoader::parse_row("2024-03-01T14:00:00Z, ,20,1").has_value());
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(DataLoader_ParseCsv, HeaderSkippedRowsParsed) {
    const std::string csv = std::string(kHeader) +
        "2024-03-01T14:00:00Z,NORTH,20,100\n"
        "2024-03-01T15:00:00Z,NORTH,21,101\n";
    auto result = DataLoader::parse_csv_string(csv);
    EXPECT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.skipped, 0u);
}

TEST(DataLoader_ParseCsv, CommentsAndBlankLinesIgnored) {
    const std::string csv = "# exported by fetcher\n\n" + std::string(kHeader) +
        "# mid-file comment\n"
        "2024-03-01T14:00:00Z,NORTH,20,100\n\n";
    auto result = DataLoader::parse_csv_string(csv);
    EXPECT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.skipped, 0u);
}

TEST(DataLoader_ParseCsv, MalformedRowsCountedNotFatal) {
    const std::string csv = std::string(kHeader) +
        "2024-03-01T14:00:00Z,NORTH,20,100\n"
        "garbage\n"
        "2024-03-01T15:00:00,NORTH,21,101\n"
        "2024-03-01T16:00:00Z,NORTH,22,102";
    auto result = DataLoader::parse_csv_string(csv);
    EXPECT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.skipped, 2u);
}

TEST(DataLoader_ParseCsv, CrlfLineEndings) {
    const std::string csv = "timestamp,zone,price,load\r\n"
                            "2024-03-01T14:00:00Z,NORTH,20,100\r\n";
    auto result = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(result.rows[0].load, 100.0);
}

TEST(DataLoader_ParseCsv, EmptyAndHeaderOnly) {
    EXPECT_TRUE(DataLoader::parse_csv_string("").rows.empty());
    EXPECT_TRUE(DataLoader::parse_csv_string(kHeader).rows.empty());
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

TEST(DataLoader_LoadCsv, MissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/gridsent/input.csv").has_value());
}

TEST(DataLoader_LoadCsv, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "gridsent_loader_test.csv";
    {
        std::ofstream out(path);
        out << kHeader << "2024-03-01T14:00:00Z,NORTH,20,100\n";
    }
    auto result = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rows.size(), 1u);
}

// ─── apply_lookback ───────────────────────────────────────────────────────────

TEST(DataLoader_Lookback, KeepsTrailingWindowRelativeToNewestRow) {
    std::vector<RawObservation> rows;
    for (int h = 0; h < 100; ++h) {
        rows.push_back(RawObservation{
            .timestamp = make_utc(2024, 3, 1) + std::chrono::hours{h},
            .zone_raw  = "NORTH",
            .price     = 1.0,
            .load      = 1.0,
        });
    }
    const auto kept = DataLoader::apply_lookback(rows, 48);
    // newest = h99, cutoff = h51 inclusive → h51..h99
    EXPECT_EQ(kept.size(), 49u);
    for (const auto& r : kept) {
        EXPECT_GE(r.timestamp, make_utc(2024, 3, 1) + std::chrono::hours{51});
    }
}

TEST(DataLoader_Lookback, NonPositiveLookbackKeepsAll) {
    std::vector<RawObservation> rows(3);
    EXPECT_EQ(DataLoader::apply_lookback(rows, 0).size(), 3u);
}
