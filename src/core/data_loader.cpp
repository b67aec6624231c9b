/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for raw hourly observations.

#include "gridsent/data_loader.hpp"
#include "gridsent/timestamp.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>

namespace gridsent::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Whole-token double parse; rejects trailing garbage and non-finite values.
[[nodiscard]] std::optional<double> parse_double(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;
    if (token.front() == '+') token.remove_prefix(1);

    double val = 0.0;
    const auto* begin = token.data();
    const auto* end   = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(begin, end, val);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    if (!std::isfinite(val)) return std::nullopt;
    return val;
}

}  // namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<RawObservation> DataLoader::parse_row(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::vector<std::string_view> fields;
    fields.reserve(4);
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }

    if (fields.size() != 4) {
        return std::nullopt;
    }

    const auto ts = parse_timestamp(fields[0]);
    if (!ts) return std::nullopt;

    const auto zone = trim(fields[1]);
    if (zone.empty()) return std::nullopt;

    const auto price = parse_double(fields[2]);
    const auto load  = parse_double(fields[3]);
    if (!price || !load) return std::nullopt;

    return RawObservation{
        .timestamp = *ts,
        .zone_raw  = std::string(zone),
        .price     = *price,
        .load      = *load,
    };
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

LoadResult DataLoader::parse_csv_string(std::string_view csv_content) {
    LoadResult result;
    bool header_skipped = false;

    std::size_t start = 0;
    while (start <= csv_content.size()) {
        auto nl = csv_content.find('\n', start);
        if (nl == std::string_view::npos) nl = csv_content.size();
        const auto line = trim(csv_content.substr(start, nl - start));
        start = nl + 1;

        if (line.empty() || line.front() == '#') {
            if (nl == csv_content.size()) break;
            continue;
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            header_skipped = true;
        } else if (auto row = parse_row(line)) {
            result.rows.push_back(std::move(*row));
        } else {
            ++result.skipped;
        }

        if (nl == csv_content.size()) break;
    }

    return result;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<LoadResult> DataLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

// ─── DataLoader::apply_lookback ───────────────────────────────────────────────

std::vector<RawObservation>
DataLoader::apply_lookback(std::vector<RawObservation> rows, int lookback_hours) {
    if (rows.empty() || lookback_hours <= 0) {
        return rows;
    }

    const auto newest = std::max_element(
        rows.begin(), rows.end(),
        [](const RawObservation& a, const RawObservation& b) {
            return a.timestamp < b.timestamp;
        })->timestamp;
    const Timestamp cutoff = newest - std::chrono::hours{lookback_hours};

    std::erase_if(rows, [cutoff](const RawObservation& r) {
        return r.timestamp < cutoff;
    });
    return rows;
}

} // namespace gridsent::core
