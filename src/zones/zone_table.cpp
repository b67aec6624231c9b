/// @file src/zones/zone_table.cpp
/// @brief ZoneTable: default ERCOT table and lookup.

#include "gridsent/zones.hpp"

#include <algorithm>
#include <cctype>

namespace gridsent::zones {

namespace {

std::set<std::string> default_canonical() {
    return {
        "NORTH", "SOUTH", "HOUSTON", "WEST",
        "HB_NORTH", "HB_SOUTH", "HB_HOUSTON", "HB_WEST",
    };
}

// Keys are already in normalized spelling (upper case, `_` separators).
std::map<std::string, std::string> default_aliases() {
    return {
        {"NORTH_ZONE",     "NORTH"},
        {"SOUTH_ZONE",     "SOUTH"},
        {"HOUSTON_ZONE",   "HOUSTON"},
        {"WEST_ZONE",      "WEST"},
        {"LZ_NORTH",       "NORTH"},
        {"LZ_SOUTH",       "SOUTH"},
        {"LZ_HOUSTON",     "HOUSTON"},
        {"LZ_WEST",        "WEST"},
        {"HB_NORTH_HUB",   "HB_NORTH"},
        {"HB_SOUTH_HUB",   "HB_SOUTH"},
        {"HB_HOUSTON_HUB", "HB_HOUSTON"},
        {"HB_WEST_HUB",    "HB_WEST"},
        {"NORTH_HUB",      "HB_NORTH"},
        {"SOUTH_HUB",      "HB_SOUTH"},
        {"HOUSTON_HUB",    "HB_HOUSTON"},
        {"WEST_HUB",       "HB_WEST"},
    };
}

std::vector<std::string> default_prefixes() {
    return {"LZ_", "HZ_", "HZON_", "LOAD_ZONE_", "HB_"};
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

ZoneTable::ZoneTable()
    : ZoneTable(default_canonical(), default_aliases(), default_prefixes()) {}

ZoneTable::ZoneTable(std::set<std::string> canonical,
                     std::map<std::string, std::string> aliases,
                     std::vector<std::string> prefixes)
    : canonical_(canonical.begin(), canonical.end()),
      prefixes_(std::move(prefixes)) {
    for (auto& [alias, target] : aliases) {
        if (canonical_.contains(target)) {
            aliases_.emplace(normalize_spelling(alias), std::move(target));
        }
    }
}

// ─── normalize_spelling ───────────────────────────────────────────────────────

std::string ZoneTable::normalize_spelling(std::string_view raw) {
    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = raw.find_last_not_of(" \t\r\n");
    raw = raw.substr(first, last - first + 1);

    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c == '-' || c == ' ') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return out;
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

std::optional<std::string> ZoneTable::lookup(const std::string& key) const {
    if (canonical_.contains(key)) {
        return key;
    }
    if (auto it = aliases_.find(key); it != aliases_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<std::string> ZoneTable::canonicalize(std::string_view raw) const {
    const std::string value = normalize_spelling(raw);
    if (value.empty()) {
        return std::nullopt;
    }

    if (auto hit = lookup(value)) {
        return hit;
    }

    for (const auto& prefix : prefixes_) {
        if (value.size() > prefix.size() && value.starts_with(prefix)) {
            if (auto hit = lookup(value.substr(prefix.size()))) {
                return hit;
            }
        }
    }

    return std::nullopt;
}

bool ZoneTable::is_canonical(std::string_view key) const {
    return canonical_.find(key) != canonical_.end();
}

} // namespace gridsent::zones
