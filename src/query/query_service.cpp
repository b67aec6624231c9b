/// @file src/query/query_service.cpp
/// @brief QueryService: canonicalize, then read from the Store.

#include "gridsent/query.hpp"

#include <fmt/format.h>

namespace gridsent::query {

QueryService::QueryService(const store::Store& store, zones::ZoneTable zone_table)
    : store_(store), zones_(std::move(zone_table)) {}

std::string QueryService::canonical(std::string_view zone) const {
    auto key = zones_.canonicalize(zone);
    if (!key) {
        throw UnknownZone(fmt::format("unknown zone '{}'", zone));
    }
    return *key;
}

std::optional<ObservationRecord> QueryService::latest(std::string_view zone) const {
    return store_.latest(canonical(zone));
}

std::vector<ObservationRecord>
QueryService::history(std::string_view zone, int hours) const {
    return store_.history(canonical(zone), hours);
}

std::vector<ObservationRecord>
QueryService::history(std::string_view zone, int hours, Timestamp now) const {
    return store_.history(canonical(zone), hours, now);
}

std::set<std::string> QueryService::all_zones() const {
    return store_.all_zones();
}

} // namespace gridsent::query
