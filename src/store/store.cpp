/// @file src/store/store.cpp
/// @brief Store: merge rule, SQLite-backed table and queries.

#include "gridsent/store.hpp"
#include "gridsent/logging.hpp"
#include "gridsent/timestamp.hpp"

#include <fmt/format.h>
#include <sqlite3.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <system_error>

namespace gridsent::store {

// ─── Merge rule ───────────────────────────────────────────────────────────────

bool is_storable(const ObservationRecord& record) noexcept {
    if (record.zone.empty())                                   return false;
    if (!std::isfinite(record.price))                          return false;
    if (!std::isfinite(record.load) || record.load < 0.0)      return false;

    if (record.sentiment_score.has_value() != record.sentiment_category.has_value()) {
        return false;
    }
    if (record.sentiment_score) {
        const double s = *record.sentiment_score;
        if (!std::isfinite(s))                                 return false;
        if (s < constants::SCORE_MIN || s > constants::SCORE_MAX) return false;
    }
    return true;
}

MergeAction merge_action(const ObservationRecord* existing,
                         const ObservationRecord& incoming) noexcept {
    if (existing == nullptr) {
        return MergeAction::Insert;
    }
    if (*existing == incoming) {
        return MergeAction::Skip;
    }

    const bool same_values = existing->price == incoming.price &&
                             existing->load  == incoming.load;

    // A raw re-fetch of an already scored row must not strip its score.
    if (same_values && existing->is_scored() && !incoming.is_scored()) {
        return MergeAction::Skip;
    }

    return MergeAction::Replace;
}

// ─── SQLite helpers ───────────────────────────────────────────────────────────

namespace {

constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS observations (
        zone     TEXT    NOT NULL,
        ts       INTEGER NOT NULL,
        price    REAL    NOT NULL,
        load     REAL    NOT NULL,
        score    REAL,
        category TEXT,
        PRIMARY KEY (zone, ts)
    ) WITHOUT ROWID
)";

constexpr const char* kColumns = "SELECT zone, ts, price, load, score, category FROM observations";

constexpr const char* kUpsertSql =
    "INSERT OR REPLACE INTO observations (zone, ts, price, load, score, category) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6)";

[[nodiscard]] std::int64_t to_epoch(Timestamp ts) noexcept {
    return static_cast<std::int64_t>(ts.time_since_epoch().count());
}

[[nodiscard]] Timestamp from_epoch(std::int64_t seconds) noexcept {
    return Timestamp{std::chrono::seconds{seconds}};
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err != nullptr ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StorageError(message);
    }
}

/// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql)
        : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(fmt::format("prepare failed: {}", sqlite3_errmsg(db)));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    // Bound text must outlive the next step().
    void bind_text(int index, std::string_view text) {
        check(sqlite3_bind_text(stmt_, index, text.data(),
                                static_cast<int>(text.size()), SQLITE_STATIC));
    }
    void bind_int64(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }
    void bind_double(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }
    void bind_null(int index) {
        check(sqlite3_bind_null(stmt_, index));
    }

    /// true while rows remain; false once the statement is done.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)  return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(fmt::format("step failed: {}", sqlite3_errmsg(db_)));
    }

    void reset() noexcept {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(fmt::format("bind failed: {}", sqlite3_errmsg(db_)));
        }
    }

    sqlite3*      db_   = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/// BEGIN IMMEDIATE on construction; ROLLBACK on scope exit unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db)
        : db_(db) {
        exec(db_, "BEGIN IMMEDIATE");
    }
    ~Transaction() {
        if (!committed_ && sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            logging::get()->error("rollback failed: {}", sqlite3_errmsg(db_));
        }
    }

    Transaction(const Transaction&)            = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool     committed_ = false;
};

[[nodiscard]] double column_real(sqlite3_stmt* stmt, int col, const char* name) {
    const int type = sqlite3_column_type(stmt, col);
    if (type != SQLITE_FLOAT && type != SQLITE_INTEGER) {
        throw StorageError(fmt::format("column '{}' is not numeric", name));
    }
    return sqlite3_column_double(stmt, col);
}

[[nodiscard]] SentimentCategory parse_category(std::string_view text) {
    for (auto c : {SentimentCategory::Green, SentimentCategory::Yellow, SentimentCategory::Red}) {
        if (to_string(c) == text) {
            return c;
        }
    }
    throw StorageError(fmt::format("unknown category '{}'", text));
}

/// Decode the current row of a statement selecting `kColumns`.
[[nodiscard]] ObservationRecord read_row(sqlite3_stmt* stmt) {
    const auto* zone = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    if (zone == nullptr) {
        throw StorageError("row with NULL zone");
    }
    if (sqlite3_column_type(stmt, 1) != SQLITE_INTEGER) {
        throw StorageError(fmt::format("row for zone '{}' has a non-integer timestamp", zone));
    }

    ObservationRecord rec{
        .timestamp = from_epoch(sqlite3_column_int64(stmt, 1)),
        .zone      = zone,
        .price     = column_real(stmt, 2, "price"),
        .load      = column_real(stmt, 3, "load"),
    };
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        rec.sentiment_score = column_real(stmt, 4, "score");
    }
    if (const auto* cat = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5))) {
        rec.sentiment_category = parse_category(cat);
    }
    return rec;
}

void write_row(Statement& upsert, const ObservationRecord& rec) {
    upsert.reset();
    upsert.bind_text(1, rec.zone);
    upsert.bind_int64(2, to_epoch(rec.timestamp));
    upsert.bind_double(3, rec.price);
    upsert.bind_double(4, rec.load);
    if (rec.sentiment_score) {
        upsert.bind_double(5, *rec.sentiment_score);
        upsert.bind_text(6, to_string(*rec.sentiment_category));
    } else {
        upsert.bind_null(5);
        upsert.bind_null(6);
    }
    (void)upsert.step();
}

[[nodiscard]] std::vector<ObservationRecord> collect(Statement& stmt) {
    std::vector<ObservationRecord> out;
    while (stmt.step()) {
        out.push_back(read_row(stmt.get()));
    }
    return out;
}

}  // namespace

// ─── Construction / open ──────────────────────────────────────────────────────

void Store::DbClose::operator()(sqlite3* db) const noexcept {
    sqlite3_close(db);
}

Store::Store() {
    open(":memory:");
}

Store::Store(std::filesystem::path path)
    : path_(std::move(path)) {
    std::error_code ec;
    const bool existed = std::filesystem::exists(path_, ec);
    if (ec) {
        throw StorageError(fmt::format("cannot stat '{}': {}", path_.string(), ec.message()));
    }
    if (!existed && path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StorageError(fmt::format("cannot create '{}': {}",
                                           path_.parent_path().string(), ec.message()));
        }
    }

    try {
        open(path_.string().c_str());
        verify();
    } catch (const StorageError& e) {
        logging::get()->error("store '{}' is unusable: {}", path_.string(), e.what());
        throw StorageError(fmt::format("cannot open store '{}': {}", path_.string(), e.what()));
    }

    if (!existed) {
        logging::get()->info("store '{}' not found; created empty", path_.string());
    }
}

Store::~Store() = default;

void Store::open(const char* target) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(target, &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                   SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    db_.reset(raw);
    if (rc != SQLITE_OK) {
        throw StorageError(raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
    }

    exec(db_.get(), "PRAGMA synchronous = FULL");
    exec(db_.get(), kSchemaSql);
}

void Store::verify() {
    Statement check(db_.get(), "PRAGMA quick_check");
    if (!check.step()) {
        throw StorageError("integrity check returned nothing");
    }
    const auto* verdict = reinterpret_cast<const char*>(sqlite3_column_text(check.get(), 0));
    if (verdict == nullptr || std::string_view(verdict) != "ok") {
        throw StorageError(fmt::format("integrity check failed: {}",
                                       verdict != nullptr ? verdict : "unknown"));
    }

    Statement scan(db_.get(), std::string(kColumns) + " ORDER BY zone, ts");
    std::size_t rows  = 0;
    std::size_t zones = 0;
    std::string last_zone;
    while (scan.step()) {
        const auto rec = read_row(scan.get());
        if (!is_storable(rec)) {
            throw StorageError(fmt::format("invalid row for zone '{}' at {}",
                                           rec.zone, core::format_timestamp(rec.timestamp)));
        }
        if (rows == 0 || rec.zone != last_zone) {
            ++zones;
            last_zone = rec.zone;
        }
        ++rows;
    }

    logging::get()->info("loaded {} records across {} zones from '{}'",
                         rows, zones, path_.string());
}

// ─── append ───────────────────────────────────────────────────────────────────

AppendResult Store::append(std::span<const ObservationRecord> records) {
    AppendResult result;
    if (records.empty()) {
        return result;
    }

    std::unique_lock lock(mutex_);

    Transaction txn(db_.get());
    Statement   find(db_.get(), std::string(kColumns) + " WHERE zone = ?1 AND ts = ?2");
    Statement   upsert(db_.get(), kUpsertSql);

    for (const auto& rec : records) {
        if (!is_storable(rec)) {
            ++result.rejected;
            continue;
        }

        find.reset();
        find.bind_text(1, rec.zone);
        find.bind_int64(2, to_epoch(rec.timestamp));
        std::optional<ObservationRecord> existing;
        if (find.step()) {
            existing = read_row(find.get());
        }
        find.reset();

        switch (merge_action(existing ? &*existing : nullptr, rec)) {
            case MergeAction::Insert:
                write_row(upsert, rec);
                ++result.inserted;
                result.changed.emplace_back(rec.timestamp, rec.zone);
                break;
            case MergeAction::Replace:
                write_row(upsert, rec);
                ++result.replaced;
                result.changed.emplace_back(rec.timestamp, rec.zone);
                break;
            case MergeAction::Skip:
                ++result.skipped;
                break;
        }
    }

    txn.commit();

    logging::get()->debug("append: {} inserted, {} replaced, {} skipped, {} rejected",
                          result.inserted, result.replaced, result.skipped, result.rejected);
    return result;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

std::optional<ObservationRecord> Store::latest(std::string_view zone) const {
    std::shared_lock lock(mutex_);
    Statement stmt(db_.get(), std::string(kColumns) + " WHERE zone = ?1 ORDER BY ts DESC LIMIT 1");
    stmt.bind_text(1, zone);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_row(stmt.get());
}

std::vector<ObservationRecord>
Store::history(std::string_view zone, int hours, Timestamp now) const {
    if (hours < 0) {
        throw InvalidRange(fmt::format("hours must be non-negative, got {}", hours));
    }
    const int capped = std::min(hours, constants::MAX_HISTORY_HOURS);
    return range(zone, now - std::chrono::hours{capped}, now);
}

std::vector<ObservationRecord>
Store::history(std::string_view zone, int hours) const {
    if (hours < 0) {
        throw InvalidRange(fmt::format("hours must be non-negative, got {}", hours));
    }
    if (hours == 0) {
        return {};
    }
    const auto last = latest(zone);
    if (!last) {
        return {};
    }
    // `hours` slots including the latest one.
    const int capped = std::min(hours, constants::MAX_HISTORY_HOURS);
    return range(zone, last->timestamp - std::chrono::hours{capped - 1}, last->timestamp);
}

std::vector<ObservationRecord>
Store::range(std::string_view zone, Timestamp from, Timestamp to) const {
    if (to < from) {
        return {};
    }

    std::shared_lock lock(mutex_);
    Statement stmt(db_.get(), std::string(kColumns) +
                                  " WHERE zone = ?1 AND ts BETWEEN ?2 AND ?3 ORDER BY ts");
    stmt.bind_text(1, zone);
    stmt.bind_int64(2, to_epoch(from));
    stmt.bind_int64(3, to_epoch(to));
    return collect(stmt);
}

std::vector<ObservationRecord> Store::unscored(std::string_view zone) const {
    std::shared_lock lock(mutex_);
    Statement stmt(db_.get(), std::string(kColumns) +
                                  " WHERE zone = ?1 AND score IS NULL ORDER BY ts");
    stmt.bind_text(1, zone);
    return collect(stmt);
}

std::set<std::string> Store::all_zones() const {
    std::shared_lock lock(mutex_);
    Statement stmt(db_.get(), "SELECT DISTINCT zone FROM observations");
    std::set<std::string> zones;
    while (stmt.step()) {
        if (const auto* z = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0))) {
            zones.insert(z);
        }
    }
    return zones;
}

std::size_t Store::size() const {
    std::shared_lock lock(mutex_);
    Statement stmt(db_.get(), "SELECT COUNT(*) FROM observations");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<ObservationRecord> Store::snapshot() const {
    std::shared_lock lock(mutex_);
    Statement stmt(db_.get(), std::string(kColumns) + " ORDER BY zone, ts");
    return collect(stmt);
}

} // namespace gridsent::store
