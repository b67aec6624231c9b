#pragma once

/// @file include/gridsent/data_loader.hpp
/// @brief CSV loader for raw hourly observations.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the fetch collaborator's CSV drop into RawObservation rows.
/// Malformed rows are skipped and counted; the loader never throws on bad
/// content.
///
/// ## Expected CSV Format
/// ```
/// timestamp,zone,price,load
/// 2024-03-01T14:00:00Z,LZ_NORTH,31.25,48210
/// 2024-03-01T15:00:00-06:00,HB North Hub,-4.10,47120
/// ```
/// The first non-comment line is the header and is skipped. `#` lines are
/// comments. Zone strings are passed through untouched; canonicalization
/// is the pipeline's job. A timestamp without an explicit offset makes the
/// row malformed.

#include "gridsent/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridsent::core {

/// Parsed rows plus the number of data rows that were skipped.
struct LoadResult {
    std::vector<RawObservation> rows;
    std::size_t                 skipped = 0;
};

class DataLoader {
public:
    /// Load raw observations from a CSV file.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened.
    [[nodiscard]] static std::optional<LoadResult>
    load_csv(const std::string& filepath);

    /// Parse CSV content held in memory (same format as `load_csv`).
    [[nodiscard]] static LoadResult parse_csv_string(std::string_view csv_content);

    /// Parse one data row. `nullopt` if the row is malformed.
    [[nodiscard]] static std::optional<RawObservation>
    parse_row(std::string_view line);

    /// Keep only rows with timestamp ≥ newest − `lookback_hours`.
    [[nodiscard]] static std::vector<RawObservation>
    apply_lookback(std::vector<RawObservation> rows, int lookback_hours);
};

} // namespace gridsent::core
