/**
 * @file  prop_baseline_sufficiency.cpp
 * @brief Property: a baseline exists iff ≥ MIN_BASELINE_SAMPLES finite values
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_baseline_sufficiency
 *
 * Also checks that the spread never drops below the metric floor and that
 * the centre lies within the sample range.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "gridsent/baseline.hpp"

using namespace gridsent;
using namespace gridsent::baseline;

int main() {
    // ── Property 1: sufficiency threshold ──────────────────────────────────
    rc::check(
        "baseline_sufficiency: present iff enough samples",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(0, 80), rc::gen::inRange(-100'000, 100'000));
            std::vector<double> values;
            for (int v : raw) values.push_back(v / 100.0);

            const BaselineCalculator calc;
            const auto b = calc.from_values(values, Metric::Price);
            RC_ASSERT(b.has_value() == (values.size() >= constants::MIN_BASELINE_SAMPLES));
            if (b) {
                RC_ASSERT(b->sample_count == values.size());
            }
        }
    );

    // ── Property 2: spread floor and centre range ──────────────────────────
    rc::check(
        "baseline_sufficiency: spread ≥ floor, centre within [min, max]",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(24, 200), rc::gen::inRange(0, 8'000'000));
            std::vector<double> values;
            for (int v : raw) values.push_back(v / 100.0);

            const BaselineCalculator calc;
            for (Metric m : {Metric::Price, Metric::Load}) {
                const auto b = calc.from_values(values, m);
                RC_ASSERT(b.has_value());
                RC_ASSERT(std::isfinite(b->spread));
                RC_ASSERT(b->spread >= calc.config().spread_floor(m));
                RC_ASSERT(b->center >= *std::min_element(values.begin(), values.end()));
                RC_ASSERT(b->center <= *std::max_element(values.begin(), values.end()));
            }
        }
    );

    // ── Property 3: order of samples does not matter ───────────────────────
    rc::check(
        "baseline_sufficiency: permutation invariant",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(24, 100), rc::gen::inRange(-10'000, 10'000));
            std::vector<double> values;
            for (int v : raw) values.push_back(v / 10.0);
            std::vector<double> reversed(values.rbegin(), values.rend());

            const BaselineCalculator calc;
            const auto a = calc.from_values(values, Metric::Price);
            const auto b = calc.from_values(reversed, Metric::Price);
            RC_ASSERT(a.has_value() && b.has_value());
            RC_ASSERT(a->center == b->center);
            RC_ASSERT(a->spread == b->spread);
        }
    );

    return 0;
}
