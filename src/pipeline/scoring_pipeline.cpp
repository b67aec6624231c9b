/// @file src/pipeline/scoring_pipeline.cpp
/// @brief ScoringPipeline: one idempotent batch update.

#include "gridsent/pipeline.hpp"
#include "gridsent/logging.hpp"
#include "gridsent/timestamp.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace gridsent::pipeline {

// ─── PipelineReport ───────────────────────────────────────────────────────────

std::string PipelineReport::to_string() const {
    return fmt::format(
        "fetched={} inserted={} duplicated={} corrected={} scored={} "
        "unscorable={} rejected_zone={} rejected_invalid={}",
        fetched, inserted, duplicated, corrected, scored,
        unscorable, rejected_zone, rejected_invalid);
}

// ─── Constructor ──────────────────────────────────────────────────────────────

ScoringPipeline::ScoringPipeline(store::Store& store,
                                 zones::ZoneTable zone_table,
                                 PipelineConfig config)
    : store_(store),
      zones_(std::move(zone_table)),
      config_(config),
      baseline_(config.baseline),
      scorer_(config.sentiment) {}

// ─── Step 1: normalize ────────────────────────────────────────────────────────

std::vector<ObservationRecord>
ScoringPipeline::normalize(std::span<const RawObservation> raw,
                           PipelineReport& report) const {
    auto log = logging::get();

    struct Accumulator {
        double      price_sum = 0.0;
        double      load_sum  = 0.0;
        std::size_t count     = 0;
    };
    // Keyed (zone, hour) so output is grouped by zone, ascending in time.
    std::map<std::pair<std::string, Timestamp>, Accumulator> buckets;

    for (const auto& obs : raw) {
        auto zone = zones_.canonicalize(obs.zone_raw);
        if (!zone) {
            ++report.rejected_zone;
            report.rejections.push_back(Rejection{
                .timestamp = obs.timestamp,
                .zone_raw  = obs.zone_raw,
                .reason    = RejectReason::UnknownZone,
            });
            log->warn("rejected row at {}: unknown zone '{}'",
                      core::format_timestamp(obs.timestamp), obs.zone_raw);
            continue;
        }

        if (!std::isfinite(obs.price) || !std::isfinite(obs.load) || obs.load < 0.0) {
            ++report.rejected_invalid;
            report.rejections.push_back(Rejection{
                .timestamp = obs.timestamp,
                .zone_raw  = obs.zone_raw,
                .reason    = RejectReason::InvalidValue,
            });
            log->warn("rejected row at {} for {}: price={} load={}",
                      core::format_timestamp(obs.timestamp), *zone, obs.price, obs.load);
            continue;
        }

        auto& acc = buckets[{std::move(*zone), core::floor_to_hour(obs.timestamp)}];
        acc.price_sum += obs.price;
        acc.load_sum  += obs.load;
        ++acc.count;
    }

    std::vector<ObservationRecord> out;
    out.reserve(buckets.size());
    for (const auto& [key, acc] : buckets) {
        const auto n = static_cast<double>(acc.count);
        ObservationRecord rec;
        rec.timestamp = key.second;
        rec.zone      = key.first;
        rec.price     = acc.count == 1 ? acc.price_sum : acc.price_sum / n;
        rec.load      = acc.count == 1 ? acc.load_sum  : acc.load_sum / n;
        out.push_back(std::move(rec));
    }
    return out;
}

// ─── Step 3 helpers ───────────────────────────────────────────────────────────

std::vector<ObservationRecord>
ScoringPipeline::scoring_targets(const std::string& zone,
                                 const std::vector<Timestamp>& changed) const {
    std::map<Timestamp, ObservationRecord> targets;

    // Rows whose window [t − window, t) contains a changed row, plus the
    // changed rows themselves: every t in [c, c + window]. Overlapping
    // intervals are merged so each stored row is read once.
    std::vector<Timestamp> sorted = changed;
    std::sort(sorted.begin(), sorted.end());

    std::vector<std::pair<Timestamp, Timestamp>> intervals;
    for (const Timestamp c : sorted) {
        const Timestamp end = c + config_.baseline.window;
        if (!intervals.empty() && c <= intervals.back().second) {
            intervals.back().second = std::max(intervals.back().second, end);
        } else {
            intervals.emplace_back(c, end);
        }
    }

    for (const auto& [from, to] : intervals) {
        for (auto& rec : store_.range(zone, from, to)) {
            const Timestamp ts = rec.timestamp;
            targets.insert_or_assign(ts, std::move(rec));
        }
    }

    // Pending rows from earlier runs.
    for (auto& rec : store_.unscored(zone)) {
        const Timestamp ts = rec.timestamp;
        targets.insert_or_assign(ts, std::move(rec));
    }

    std::vector<ObservationRecord> out;
    out.reserve(targets.size());
    for (auto& [ts, rec] : targets) {
        out.push_back(std::move(rec));
    }
    return out;
}

std::optional<ObservationRecord>
ScoringPipeline::score_record(const ObservationRecord& record) const {
    const auto window = store_.range(record.zone,
                                     record.timestamp - config_.baseline.window,
                                     record.timestamp);

    const auto price_bl = baseline_.compute_at(window, Metric::Price, record.timestamp);
    const auto load_bl  = baseline_.compute_at(window, Metric::Load,  record.timestamp);

    const auto result = scorer_.score(record, price_bl, load_bl);
    if (!result) {
        return std::nullopt;
    }

    ObservationRecord scored = record;
    scored.sentiment_score    = result->score;
    scored.sentiment_category = result->category;
    return scored;
}

// ─── submit ───────────────────────────────────────────────────────────────────

PipelineReport ScoringPipeline::submit(std::span<const RawObservation> raw_observations) {
    auto log = logging::get();
    PipelineReport report;
    report.fetched = raw_observations.size();

    log->info("submitting batch of {} raw rows", report.fetched);

    // Step 1
    const auto normalized = normalize(raw_observations, report);

    // Step 2
    const auto raw_result = store_.append(normalized);
    report.inserted   = raw_result.inserted;
    report.corrected  = raw_result.replaced;
    report.duplicated = raw_result.skipped;
    report.rejected_invalid += raw_result.rejected;

    // Step 3: changed timestamps grouped by zone; touched zones include
    // zones that only saw duplicates, so their pending rows are retried.
    std::map<std::string, std::vector<Timestamp>> changed_by_zone;
    for (const auto& rec : normalized) {
        changed_by_zone.try_emplace(rec.zone);
    }
    for (const auto& [ts, zone] : raw_result.changed) {
        changed_by_zone[zone].push_back(ts);
    }

    std::vector<ObservationRecord> scored_rows;
    for (const auto& [zone, changed] : changed_by_zone) {
        for (const auto& target : scoring_targets(zone, changed)) {
            auto scored = score_record(target);
            if (!scored) {
                ++report.unscorable;
                log->debug("{} {}: insufficient history, left pending",
                           zone, core::format_timestamp(target.timestamp));
                continue;
            }
            if (*scored == target) {
                continue;  // already carries this score
            }
            log->debug("{} {}: score {:.2f} ({})",
                       zone, core::format_timestamp(target.timestamp),
                       *scored->sentiment_score, to_string(*scored->sentiment_category));
            scored_rows.push_back(std::move(*scored));
        }
    }

    // Step 3 write-back in one atomic append.
    const auto scored_result = store_.append(scored_rows);
    report.scored = scored_result.written();

    log->info("batch complete: {}", report.to_string());
    return report;
}

} // namespace gridsent::pipeline
