#pragma once

/// @file include/gridsent/zones.hpp
/// @brief ZoneTable: canonicalization of zone and hub identifiers.
///
/// # Module: Zone Normalization
///
/// ## Responsibility
/// Map every spelling a market-data provider uses for a load zone or
/// trading hub ("LZ_NORTH", "North Zone", "HB North Hub", …) to exactly
/// one canonical key. The store and the scorer only ever see canonical
/// keys.
///
/// ## Lookup order
/// 1. Trim, upper-case, replace `-` and ` ` with `_`.
/// 2. Exact canonical key.
/// 3. Alias table.
/// 4. Strip one known prefix (`LZ_`, `HZ_`, `HZON_`, `LOAD_ZONE_`, `HB_`)
///    and retry steps 2–3 on the remainder.
///
/// Anything else is unknown and must be rejected by the caller.

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gridsent::zones {

class ZoneTable {
public:
    /// Build the default ERCOT table (four load zones, four hubs).
    ZoneTable();

    /// Build a custom table.
    ///
    /// # Arguments
    /// * `canonical` - canonical keys (already in normalized form)
    /// * `aliases`   - alias → canonical key; aliases whose target is not
    ///                 in `canonical` are ignored
    /// * `prefixes`  - prefixes stripped in step 4, tried in order
    ZoneTable(std::set<std::string> canonical,
              std::map<std::string, std::string> aliases,
              std::vector<std::string> prefixes);

    /// Canonical key for `raw`, or `nullopt` if the zone is unknown.
    [[nodiscard]] std::optional<std::string>
    canonicalize(std::string_view raw) const;

    /// True if `key` is one of the canonical keys (no normalization applied).
    [[nodiscard]] bool is_canonical(std::string_view key) const;

    [[nodiscard]] const std::set<std::string, std::less<>>&
    canonical_keys() const noexcept {
        return canonical_;
    }

    /// Step 1 of the lookup: trim, upper-case, `-`/` ` → `_`.
    [[nodiscard]] static std::string normalize_spelling(std::string_view raw);

private:
    [[nodiscard]] std::optional<std::string>
    lookup(const std::string& key) const;

    std::set<std::string, std::less<>>  canonical_;
    std::map<std::string, std::string>  aliases_;
    std::vector<std::string>            prefixes_;
};

} // namespace gridsent::zones
