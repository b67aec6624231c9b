#pragma once

/// @file include/gridsent/pipeline.hpp
/// @brief ScoringPipeline: ingest, deduplicate, score, write back.
///
/// # Module: Scoring Pipeline
///
/// ## Responsibility
/// Orchestrate one batch update:
///   raw rows → zone canonicalization → Store (raw layer) →
///   BaselineCalculator + SentimentScorer → Store (scored layer)
///
/// ## Algorithm
/// 1. Canonicalize each zone; unknown zones are rejected and reported.
///    Rows with non-finite price or invalid load are rejected too.
///    Timestamps are floored to the hour and same-hour rows for a zone
///    are averaged.
/// 2. Append the raw rows. Keys already present with the same values are
///    counted as duplicates.
/// 3. For every zone touched by the batch, score:
///      - every inserted or corrected row,
///      - every stored row whose 168 h window contains one of those rows,
///      - every row still unscored from earlier runs.
///    Scored rows are written back with a single `append`.
/// 4. Return a PipelineReport.
///
/// ## State machine per row
/// RAW → SCORED, or RAW → UNSCORABLE_PENDING (retried next run). Lack of
/// history is never an error.
///
/// ## Errors
/// Per-row problems never abort the batch. `StorageError` from the store
/// propagates and aborts the run.

#include "gridsent/baseline.hpp"
#include "gridsent/sentiment.hpp"
#include "gridsent/store.hpp"
#include "gridsent/types.hpp"
#include "gridsent/zones.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace gridsent::pipeline {

struct PipelineConfig {
    baseline::BaselineConfig   baseline{};
    sentiment::SentimentConfig sentiment{};
};

/// Why a raw row never reached the store.
enum class RejectReason {
    UnknownZone,
    InvalidValue,
};

struct Rejection {
    Timestamp    timestamp;
    std::string  zone_raw;
    RejectReason reason;
};

/// Summary of one `submit` call.
struct PipelineReport {
    std::size_t fetched          = 0;  ///< raw rows received
    std::size_t inserted         = 0;  ///< new keys written
    std::size_t duplicated       = 0;  ///< identical to a stored row
    std::size_t corrected        = 0;  ///< existing key, new price/load
    std::size_t scored           = 0;  ///< rows given a (new) score this run
    std::size_t unscorable       = 0;  ///< rows left pending for lack of history
    std::size_t rejected_zone    = 0;
    std::size_t rejected_invalid = 0;

    std::vector<Rejection> rejections;

    /// One-line summary for logs and the CLI.
    [[nodiscard]] std::string to_string() const;
};

class ScoringPipeline {
public:
    /// The pipeline borrows `store`; the caller owns it for the run.
    ScoringPipeline(store::Store& store,
                    zones::ZoneTable zone_table = zones::ZoneTable{},
                    PipelineConfig config = PipelineConfig{});

    /// Run one batch through the pipeline.
    ///
    /// # Throws
    /// `store::StorageError` if the store cannot be written.
    PipelineReport submit(std::span<const RawObservation> raw_observations);

    /// Score a single stored row against the rows currently in the store.
    /// Returns the scored copy, or `nullopt` if history is insufficient.
    [[nodiscard]] std::optional<ObservationRecord>
    score_record(const ObservationRecord& record) const;

private:
    /// Step 1: canonicalize, validate, floor, average.
    [[nodiscard]] std::vector<ObservationRecord>
    normalize(std::span<const RawObservation> raw, PipelineReport& report) const;

    /// Step 3: rows of `zone` that need (re)scoring after `changed`.
    [[nodiscard]] std::vector<ObservationRecord>
    scoring_targets(const std::string& zone,
                    const std::vector<Timestamp>& changed) const;

    store::Store&                   store_;
    zones::ZoneTable                zones_;
    PipelineConfig                  config_;
    baseline::BaselineCalculator    baseline_;
    sentiment::SentimentScorer      scorer_;
};

} // namespace gridsent::pipeline
