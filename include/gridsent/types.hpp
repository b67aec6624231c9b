#pragma once

/// @file include/gridsent/types.hpp
/// @brief Shared value types for gridsent.
///
/// ObservationRecord is the unit that is stored, queried and scored.
/// RawObservation is what the fetch collaborator hands to the pipeline
/// before zone canonicalization.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gridsent {

// ─── Time ─────────────────────────────────────────────────────────────────────

/// UTC instant at whole-second resolution. Stored rows are floored to the
/// hour; offsets are resolved at the ingestion boundary, so a Timestamp
/// never carries a local zone.
using Timestamp = std::chrono::sys_seconds;

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Which observed quantity a baseline is computed for.
enum class Metric : std::uint8_t {
    Price,
    Load,
};

/// Thresholded sentiment bucket.
enum class SentimentCategory : std::uint8_t {
    Green,
    Yellow,
    Red,
};

/// "GREEN", "YELLOW" or "RED".
[[nodiscard]] std::string_view to_string(SentimentCategory c) noexcept;

// ─── ObservationRecord ────────────────────────────────────────────────────────

/// One hourly observation for one canonical zone.
///
/// `(timestamp, zone)` is the dedup key. `sentiment_score` and
/// `sentiment_category` are either both set or both empty.
struct ObservationRecord {
    Timestamp   timestamp{};
    std::string zone;
    double      price = 0.0;   ///< $/MWh, may be negative
    double      load  = 0.0;   ///< MW, non-negative

    std::optional<double>            sentiment_score;     ///< [0, 100]
    std::optional<SentimentCategory> sentiment_category;

    [[nodiscard]] bool is_scored() const noexcept {
        return sentiment_score.has_value();
    }

    /// Value of the requested metric.
    [[nodiscard]] double value(Metric m) const noexcept {
        return m == Metric::Price ? price : load;
    }

    bool operator==(const ObservationRecord&) const = default;
};

// ─── RawObservation ───────────────────────────────────────────────────────────

/// A fetched row before canonicalization. `zone_raw` may be any alias.
struct RawObservation {
    Timestamp   timestamp{};
    std::string zone_raw;
    double      price = 0.0;
    double      load  = 0.0;
};

} // namespace gridsent
