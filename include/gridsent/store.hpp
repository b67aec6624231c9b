#pragma once

/// @file include/gridsent/store.hpp
/// @brief Store: append-only, deduplicated table of ObservationRecords.
///
/// # Module: Store
///
/// ## Responsibility
/// Durable, queryable collection of observations keyed by
/// `(zone, timestamp)`, backed by a single SQLite database file.
///
/// ## Schema
/// ```sql
/// CREATE TABLE observations (
///     zone     TEXT    NOT NULL,
///     ts       INTEGER NOT NULL,   -- UTC seconds since epoch
///     price    REAL    NOT NULL,
///     load     REAL    NOT NULL,
///     score    REAL,               -- NULL while unscored
///     category TEXT,               -- GREEN | YELLOW | RED, NULL while unscored
///     PRIMARY KEY (zone, ts)
/// ) WITHOUT ROWID;
/// ```
///
/// ## Merge rule (per incoming record, key already present)
/// | existing | incoming                          | action  |
/// |----------|-----------------------------------|---------|
/// | any      | identical                         | skip    |
/// | scored   | unscored, same price and load     | skip    |
/// | any      | anything else that differs        | replace |
///
/// A record is never removed. Replacing an unscored row with its scored
/// twin is the normal RAW → SCORED transition; replacing with different
/// price/load is a provider correction (last write wins).
///
/// ## Atomicity and durability
/// Each `append` runs in one `BEGIN IMMEDIATE` transaction with
/// `synchronous = FULL`. A failure inside the batch rolls the whole batch
/// back. A crash or power loss leaves the database at the last committed
/// append; SQLite replays its journal on the next open.
///
/// ## Concurrency
/// Single writer. Readers on other threads take a shared lock and see
/// either the table before or after an `append`, never a half-merge.
///
/// ## Errors
/// - Unopenable database, foreign file, or a stored row that fails
///   `is_storable` → `StorageError` from the ctor
/// - Missing backing file → empty store, file created (first run)
/// - Write failure in `append` → `StorageError`, batch rolled back
/// - Negative `hours` in `history` → `InvalidRange`

#include "gridsent/constants.hpp"
#include "gridsent/types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace gridsent::store {

// ─── Errors ───────────────────────────────────────────────────────────────────

/// Backing database unreadable, malformed, or not writable. Fatal for a run.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A query argument outside its domain (negative hours).
class InvalidRange : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ─── Merge ────────────────────────────────────────────────────────────────────

enum class MergeAction {
    Insert,
    Replace,
    Skip,
};

/// Decide what `append` does with `incoming` given the stored row for the
/// same key (`nullptr` when the key is new).
[[nodiscard]] MergeAction merge_action(const ObservationRecord* existing,
                                       const ObservationRecord& incoming) noexcept;

/// A record the store accepts: non-empty zone, finite price, finite
/// non-negative load, score (if any) within [0, 100] with a category,
/// and a category only alongside a score.
///
/// The store does not check that the category matches the score: the
/// thresholds belong to the `sentiment::SentimentScorer` configuration,
/// and the pipeline only writes categories the scorer produced. A row
/// such as (90, RED) is storable.
[[nodiscard]] bool is_storable(const ObservationRecord& record) noexcept;

/// Counts reported by one `append` call.
struct AppendResult {
    std::size_t inserted = 0;
    std::size_t replaced = 0;
    std::size_t skipped  = 0;
    std::size_t rejected = 0;  ///< failed `is_storable`, never written

    /// Keys inserted or replaced by this call, in input order.
    std::vector<std::pair<Timestamp, std::string>> changed;

    [[nodiscard]] std::size_t written() const noexcept { return inserted + replaced; }
};

// ─── Store ────────────────────────────────────────────────────────────────────

class Store {
public:
    /// In-memory store with no backing file (tests, dry runs).
    Store();

    /// Open the store at `path`, creating the file and its parent
    /// directories when missing.
    ///
    /// # Throws
    /// `StorageError` if the database cannot be opened, is not a gridsent
    /// store, or holds a row that fails `is_storable`.
    explicit Store(std::filesystem::path path);

    ~Store();

    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;

    /// Merge `records` into the table per the merge rule, in one transaction.
    ///
    /// Safe to call with overlapping or fully-overlapping batches; an
    /// identical second call reports only skips.
    ///
    /// # Throws
    /// `StorageError` if the transaction fails; nothing from the batch is kept.
    AppendResult append(std::span<const ObservationRecord> records);

    /// Most recent record for `zone`, or `nullopt` when the zone has none.
    [[nodiscard]] std::optional<ObservationRecord>
    latest(std::string_view zone) const;

    /// Records for `zone` with timestamp in `[now − hours, now]`, ascending.
    ///
    /// `hours` above MAX_HISTORY_HOURS is clamped.
    ///
    /// # Throws
    /// `InvalidRange` if `hours < 0`.
    [[nodiscard]] std::vector<ObservationRecord>
    history(std::string_view zone, int hours, Timestamp now) const;

    /// The last `hours` hourly slots of `zone`, ending at its latest record:
    /// timestamps in `[latest − (hours − 1)h, latest]`, ascending.
    ///
    /// `hours` above MAX_HISTORY_HOURS is clamped. Empty when the zone has
    /// no records or `hours == 0`.
    ///
    /// # Throws
    /// `InvalidRange` if `hours < 0`.
    [[nodiscard]] std::vector<ObservationRecord>
    history(std::string_view zone, int hours) const;

    /// Records for `zone` with timestamp in `[from, to]`, ascending, no cap.
    /// Used by the scoring pipeline to pull baseline windows.
    [[nodiscard]] std::vector<ObservationRecord>
    range(std::string_view zone, Timestamp from, Timestamp to) const;

    /// Unscored records for `zone`, ascending.
    [[nodiscard]] std::vector<ObservationRecord>
    unscored(std::string_view zone) const;

    /// Distinct canonical zones present.
    [[nodiscard]] std::set<std::string> all_zones() const;

    /// Total number of stored records.
    [[nodiscard]] std::size_t size() const;

    /// Every record, sorted by (zone, timestamp).
    [[nodiscard]] std::vector<ObservationRecord> snapshot() const;

    /// Backing file path; empty for an in-memory store.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct DbClose {
        void operator()(sqlite3* db) const noexcept;
    };

    void open(const char* target);
    void verify();

    std::filesystem::path              path_;
    std::unique_ptr<sqlite3, DbClose>  db_;
    mutable std::shared_mutex          mutex_;
};

} // namespace gridsent::store
