/// @file src/main.cpp
/// @brief gridsent CLI entry point.
///
/// Usage:
///   gridsent [options] submit <csv_file>       Ingest and score raw observations
///   gridsent [options] latest <zone>           Print the newest record for a zone
///   gridsent [options] history <zone> [hours]  Print trailing history (default 24 h)
///   gridsent [options] zones                   List zones present in the store
///   gridsent --help                            Print usage
///
/// Options (override GRIDSENT_STORE / GRIDSENT_LOOKBACK_HOURS / GRIDSENT_VERBOSE):
///   --store PATH   --lookback HOURS   --verbose
///
/// Exit status: 0 success, 1 error, 2 no data.

#include "gridsent/config.hpp"
#include "gridsent/data_loader.hpp"
#include "gridsent/logging.hpp"
#include "gridsent/pipeline.hpp"
#include "gridsent/query.hpp"
#include "gridsent/store.hpp"
#include "gridsent/timestamp.hpp"

#include <fmt/core.h>

#include <charconv>
#include <exception>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_NO_DATA = 2;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  gridsent [options] submit <csv_file>       Ingest and score raw observations\n"
        "  gridsent [options] latest <zone>           Newest record for a zone\n"
        "  gridsent [options] history <zone> [hours]  Trailing history (default 24, max {})\n"
        "  gridsent [options] zones                   Zones present in the store\n"
        "  gridsent --help                            Show this help\n"
        "\n"
        "Options:\n"
        "  --store PATH       Store file          (env GRIDSENT_STORE)\n"
        "  --lookback HOURS   Refresh window      (env GRIDSENT_LOOKBACK_HOURS)\n"
        "  --verbose          Debug logging       (env GRIDSENT_VERBOSE)\n"
        "\n"
        "CSV format (header required, timestamps need Z or an offset):\n"
        "  timestamp,zone,price,load\n",
        gridsent::constants::MAX_HISTORY_HOURS);
}

void print_record(const gridsent::ObservationRecord& rec) {
    if (rec.sentiment_score) {
        fmt::print("{}  {:<10}  price={:>10.2f}  load={:>10.1f}  score={:>6.2f}  {}\n",
                   gridsent::core::format_timestamp(rec.timestamp), rec.zone,
                   rec.price, rec.load, *rec.sentiment_score,
                   gridsent::to_string(*rec.sentiment_category));
    } else {
        fmt::print("{}  {:<10}  price={:>10.2f}  load={:>10.1f}  score=   n/a  UNSCORED\n",
                   gridsent::core::format_timestamp(rec.timestamp), rec.zone,
                   rec.price, rec.load);
    }
}

/// Returns 0 on success, 1 on error.
int run_submit(const gridsent::core::CollectorConfig& config, const std::string& filepath) {
    using gridsent::core::DataLoader;

    auto loaded = DataLoader::load_csv(filepath);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (loaded->skipped > 0) {
        gridsent::logging::get()->warn("skipped {} malformed rows in '{}'",
                                       loaded->skipped, filepath);
    }

    const auto rows = DataLoader::apply_lookback(std::move(loaded->rows), config.lookback_hours);

    gridsent::store::Store store(config.store_path);
    gridsent::pipeline::ScoringPipeline pipeline(store);
    const auto report = pipeline.submit(rows);

    fmt::print("{}\n", report.to_string());
    for (const auto& rej : report.rejections) {
        fmt::print("  rejected {} '{}': {}\n",
                   gridsent::core::format_timestamp(rej.timestamp), rej.zone_raw,
                   rej.reason == gridsent::pipeline::RejectReason::UnknownZone
                       ? "unknown zone" : "invalid value");
    }
    return 0;
}

int run_latest(const gridsent::core::CollectorConfig& config, const std::string& zone) {
    const gridsent::store::Store store(config.store_path);
    const gridsent::query::QueryService query(store);

    const auto rec = query.latest(zone);
    if (!rec) {
        fmt::print("No data for zone '{}'\n", zone);
        return EXIT_NO_DATA;
    }
    print_record(*rec);
    return 0;
}

int run_history(const gridsent::core::CollectorConfig& config,
                const std::string& zone, int hours) {
    const gridsent::store::Store store(config.store_path);
    const gridsent::query::QueryService query(store);

    const auto rows = query.history(zone, hours);
    if (rows.empty()) {
        fmt::print("No data for zone '{}'\n", zone);
        return EXIT_NO_DATA;
    }
    for (const auto& rec : rows) {
        print_record(rec);
    }
    return 0;
}

int run_zones(const gridsent::core::CollectorConfig& config) {
    const gridsent::store::Store store(config.store_path);
    const auto zones = store.all_zones();
    if (zones.empty()) {
        fmt::print("Store is empty\n");
        return EXIT_NO_DATA;
    }
    for (const auto& z : zones) {
        fmt::print("{}\n", z);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        for (const auto& a : args) {
            if (a == "--help" || a == "-h") {
                print_usage();
                return 0;
            }
        }

        auto config = gridsent::core::CollectorConfig::from_env();
        const auto rest = config.apply_args(args);
        config.validate();

        gridsent::logging::init(config.verbose);

        if (rest.empty()) {
            print_usage();
            return 1;
        }

        const std::string& mode = rest[0];

        if (mode == "submit" && rest.size() == 2) {
            return run_submit(config, rest[1]);
        }
        if (mode == "latest" && rest.size() == 2) {
            return run_latest(config, rest[1]);
        }
        if (mode == "history" && (rest.size() == 2 || rest.size() == 3)) {
            int hours = 24;
            if (rest.size() == 3) {
                const auto& h = rest[2];
                const auto [ptr, ec] = std::from_chars(h.data(), h.data() + h.size(), hours);
                if (ec != std::errc{} || ptr != h.data() + h.size()) {
                    fmt::print(stderr, "Error: hours must be an integer, got '{}'\n", h);
                    return 1;
                }
            }
            return run_history(config, rest[1], hours);
        }
        if (mode == "zones" && rest.size() == 1) {
            return run_zones(config);
        }

        fmt::print(stderr, "Unknown or incomplete command: {}\n", mode);
        print_usage();
        return 1;

    } catch (const std::exception& e) {
        gridsent::logging::get()->critical("{}", e.what());
        return 1;
    }
}
