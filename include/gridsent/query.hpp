#pragma once

/// @file include/gridsent/query.hpp
/// @brief QueryService: read-side facade for presentation collaborators.
///
/// Accepts any zone spelling, canonicalizes it, and forwards to the Store.
/// Distinguishes the two outcomes callers must render differently:
/// - no data: `nullopt` / empty vector (known zone, nothing stored yet)
/// - error:   `UnknownZone` or `store::InvalidRange` exceptions

#include "gridsent/store.hpp"
#include "gridsent/types.hpp"
#include "gridsent/zones.hpp"

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gridsent::query {

/// Zone string that does not canonicalize.
class UnknownZone : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class QueryService {
public:
    /// Borrows `store`; it must outlive the service.
    explicit QueryService(const store::Store& store,
                          zones::ZoneTable zone_table = zones::ZoneTable{});

    /// Most recent record for the zone.
    ///
    /// # Throws
    /// `UnknownZone` if `zone` does not canonicalize.
    [[nodiscard]] std::optional<ObservationRecord> latest(std::string_view zone) const;

    /// The last `hours` hourly slots ending at the zone's latest record,
    /// `[latest − (hours − 1)h, latest]`, ascending. `hours` is capped at
    /// MAX_HISTORY_HOURS.
    ///
    /// # Throws
    /// `UnknownZone`, or `store::InvalidRange` for negative `hours`.
    [[nodiscard]] std::vector<ObservationRecord>
    history(std::string_view zone, int hours) const;

    /// Records in the closed interval `[now − hours, now]`, ascending.
    [[nodiscard]] std::vector<ObservationRecord>
    history(std::string_view zone, int hours, Timestamp now) const;

    /// Zones with at least one stored record.
    [[nodiscard]] std::set<std::string> all_zones() const;

private:
    [[nodiscard]] std::string canonical(std::string_view zone) const;

    const store::Store& store_;
    zones::ZoneTable    zones_;
};

} // namespace gridsent::query
