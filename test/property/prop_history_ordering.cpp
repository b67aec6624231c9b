/**
 * @file  prop_history_ordering.cpp
 * @brief Property: history(zone, h, now) is ascending and inside [now − h', now]
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_history_ordering
 *
 * where h' = min(h, MAX_HISTORY_HOURS). At most h' + 1 hourly rows can
 * fall in a closed window of h' hours.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <chrono>
#include <vector>

#include "gridsent/constants.hpp"
#include "gridsent/store.hpp"
#include "gridsent/timestamp.hpp"

using namespace gridsent;

int main() {
    rc::check(
        "history_ordering: ascending, bounded, within window",
        []() {
            const Timestamp t0 = core::make_utc(2024, 1, 1);
            const auto hours = *rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 1000));

            std::vector<ObservationRecord> rows;
            for (int h : hours) {
                rows.push_back(ObservationRecord{
                    .timestamp = t0 + std::chrono::hours{h},
                    .zone      = "NORTH",
                    .price     = 30.0,
                    .load      = 40000.0,
                });
            }
            store::Store s;
            (void)s.append(rows);

            const int window   = *rc::gen::inRange(0, 2000);
            const Timestamp now = t0 + std::chrono::hours{*rc::gen::inRange(0, 1000)};
            const int capped   = std::min(window, constants::MAX_HISTORY_HOURS);

            const auto hist = s.history("NORTH", window, now);
            RC_ASSERT(hist.size() <= static_cast<std::size_t>(capped) + 1);
            for (std::size_t i = 0; i < hist.size(); ++i) {
                RC_ASSERT(hist[i].timestamp <= now);
                RC_ASSERT(hist[i].timestamp >= now - std::chrono::hours{capped});
                if (i > 0) {
                    RC_ASSERT(hist[i - 1].timestamp < hist[i].timestamp);
                }
            }

            // Every distinct stored hour in the window is returned.
            std::vector<Timestamp> expected;
            for (const auto& r : rows) {
                if (r.timestamp <= now && r.timestamp >= now - std::chrono::hours{capped}) {
                    expected.push_back(r.timestamp);
                }
            }
            std::sort(expected.begin(), expected.end());
            expected.erase(std::unique(expected.begin(), expected.end()), expected.end());
            RC_ASSERT(hist.size() == expected.size());
        }
    );

    return 0;
}
