/**
 * @file  bench/bench_baseline.cpp
 * @brief Google Benchmark suite for baseline, scoring and store hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_Baseline_FromValues     - median + MAD over one window
 *   BM_Scorer_Score            - two squashes and a composite
 *   BM_Pipeline_Submit         - full batch into an empty in-memory store
 *   BM_Store_Append            - one transactional batch into a fresh store
 *   BM_Store_Range             - one week range scan for a zone
 *
 * Build (CMake):
 *   cmake -DGRIDSENT_BENCH=ON ..
 *   cmake --build build --target bench_baseline
 *   ./build/bench_baseline --benchmark_format=json
 *
 * Throughput units: items/second (values or rows processed).
 */

#include "benchmark/benchmark.h"

#include "gridsent/baseline.hpp"
#include "gridsent/logging.hpp"
#include "gridsent/pipeline.hpp"
#include "gridsent/sentiment.hpp"
#include "gridsent/store.hpp"
#include "gridsent/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N deterministic prices around 30 $/MWh with an occasional spike.
static std::vector<double> make_prices(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = 30.0 + 5.0 * std::sin(static_cast<double>(i) * 0.26) + (i % 97 == 0 ? 400.0 : 0.0);
    }
    return v;
}

static std::vector<gridsent::RawObservation> make_raw(std::size_t hours) {
    const auto t0 = gridsent::core::make_utc(2024, 1, 1);
    const auto prices = make_prices(hours);
    std::vector<gridsent::RawObservation> rows;
    rows.reserve(hours);
    for (std::size_t i = 0; i < hours; ++i) {
        rows.push_back(gridsent::RawObservation{
            .timestamp = t0 + std::chrono::hours{static_cast<int>(i)},
            .zone_raw  = "LZ_NORTH",
            .price     = prices[i],
            .load      = 40000.0 + 3000.0 * std::cos(static_cast<double>(i) * 0.26),
        });
    }
    return rows;
}

static std::vector<gridsent::ObservationRecord> make_records(std::size_t hours) {
    const auto t0 = gridsent::core::make_utc(2024, 1, 1);
    const auto prices = make_prices(hours);
    std::vector<gridsent::ObservationRecord> rows;
    rows.reserve(hours);
    for (std::size_t i = 0; i < hours; ++i) {
        gridsent::ObservationRecord rec{
            .timestamp = t0 + std::chrono::hours{static_cast<int>(i)},
            .zone      = i % 2 == 0 ? "NORTH" : "SOUTH",
            .price     = prices[i],
            .load      = 40000.0,
        };
        if (i % 3 != 0) {
            rec.sentiment_score    = 55.0;
            rec.sentiment_category = gridsent::SentimentCategory::Yellow;
        }
        rows.push_back(std::move(rec));
    }
    return rows;
}

// ── Baseline ──────────────────────────────────────────────────────────────────

static void BM_Baseline_FromValues(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto values = make_prices(n);
    const gridsent::baseline::BaselineCalculator calc;
    for (auto _ : state) {
        auto b = calc.from_values(values, gridsent::Metric::Price);
        benchmark::DoNotOptimize(b);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Baseline_FromValues)->Arg(24)->Arg(168)->Arg(336)->Arg(4096);

// ── Scorer ────────────────────────────────────────────────────────────────────

static void BM_Scorer_Score(benchmark::State& state) {
    const gridsent::sentiment::SentimentScorer scorer;
    const gridsent::baseline::Baseline pb{.center = 30.0, .spread = 4.0, .sample_count = 168};
    const gridsent::baseline::Baseline lb{.center = 40000.0, .spread = 1500.0, .sample_count = 168};
    gridsent::ObservationRecord obs{.zone = "NORTH", .price = 42.0, .load = 41000.0};
    for (auto _ : state) {
        auto r = scorer.score(obs, pb, lb);
        benchmark::DoNotOptimize(r);
        obs.price += 0.001;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Scorer_Score);

// ── Pipeline ──────────────────────────────────────────────────────────────────

static void BM_Pipeline_Submit(benchmark::State& state) {
    gridsent::logging::get()->set_level(spdlog::level::warn);
    const auto rows = make_raw(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        gridsent::store::Store store;
        gridsent::pipeline::ScoringPipeline pipeline(store);
        state.ResumeTiming();

        auto report = pipeline.submit(rows);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Pipeline_Submit)->Arg(48)->Arg(336)->Arg(2016)->Unit(benchmark::kMillisecond);

// ── Store ─────────────────────────────────────────────────────────────────────

static void BM_Store_Append(benchmark::State& state) {
    gridsent::logging::get()->set_level(spdlog::level::warn);
    const auto rows = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        gridsent::store::Store store;
        state.ResumeTiming();

        auto result = store.append(rows);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Store_Append)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMillisecond);

static void BM_Store_Range(benchmark::State& state) {
    gridsent::logging::get()->set_level(spdlog::level::warn);
    const auto n = static_cast<std::size_t>(state.range(0));
    gridsent::store::Store store;
    (void)store.append(make_records(n));
    const auto t0 = gridsent::core::make_utc(2024, 1, 1);
    const auto to = t0 + std::chrono::hours{static_cast<int>(n) - 1};
    const auto from = to - std::chrono::hours{gridsent::constants::BASELINE_WINDOW_HOURS};
    for (auto _ : state) {
        auto rows = store.range("NORTH", from, to);
        benchmark::DoNotOptimize(rows.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Store_Range)->Arg(336)->Arg(8760)->Arg(87600);

BENCHMARK_MAIN();
