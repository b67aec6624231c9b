/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the raw-observation CSV parser
 *
 * Build:
 *   cmake -DGRIDSENT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Every returned row has:
 *      a. finite price and load
 *      b. non-empty zone
 *      c. a timestamp that formats without throwing
 *   3. rows + skipped never exceeds the number of lines.
 *
 * The parser must handle:
 *   • Binary garbage (null bytes, high bytes)
 *   • "nan", "inf", "1e309" numeric tokens
 *   • Timestamps without offsets, impossible dates, stray separators
 *   • CR/LF mixes and missing trailing newline
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "gridsent/data_loader.hpp"
#include "gridsent/timestamp.hpp"

using namespace gridsent;
using namespace gridsent::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto result = DataLoader::parse_csv_string(input);

    for (const auto& row : result.rows) {
        // Invariant 2a
        assert(std::isfinite(row.price));
        assert(std::isfinite(row.load));

        // Invariant 2b
        assert(!row.zone_raw.empty());

        // Invariant 2c
        const auto text = format_timestamp(row.timestamp);
        assert(!text.empty() && text.back() == 'Z');
    }

    // Invariant 3
    const auto lines = static_cast<std::size_t>(std::count(input.begin(), input.end(), '\n')) + 1;
    assert(result.rows.size() + result.skipped <= lines);

    return 0;
}
