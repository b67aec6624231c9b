#pragma once

/// @file include/gridsent/timestamp.hpp
/// @brief ISO-8601 parsing/formatting and hourly flooring for Timestamp.
///
/// ## Accepted input
/// ```
/// 2024-03-01T14:00:00Z
/// 2024-03-01T14:00:00+00:00
/// 2024-03-01 08:30-06:00
/// 2024-03-01T14:00:00.000Z
/// ```
/// A date, a `T` or space separator, `HH:MM` with optional `:SS` and
/// optional fractional seconds (discarded), then a REQUIRED offset: `Z` or
/// `±HH:MM` / `±HHMM`. Strings without an offset are rejected; naive local
/// times never enter the store.

#include "gridsent/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gridsent::core {

/// Parse an ISO-8601 timestamp with explicit offset into UTC.
///
/// # Returns
/// - UTC instant on success
/// - `nullopt` for malformed input, out-of-range fields or a missing offset
[[nodiscard]] std::optional<Timestamp>
parse_timestamp(std::string_view text) noexcept;

/// Format as `YYYY-MM-DDTHH:MM:SSZ`.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

/// Truncate to the start of the containing UTC hour.
[[nodiscard]] Timestamp floor_to_hour(Timestamp ts) noexcept;

/// Convenience constructor for tests and tools: UTC calendar fields.
[[nodiscard]] Timestamp make_utc(int year, unsigned month, unsigned day,
                                 int hour = 0, int minute = 0,
                                 int second = 0) noexcept;

} // namespace gridsent::core
