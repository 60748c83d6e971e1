#include "interval_store.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "time_utils.hpp"

namespace {

std::optional<std::string> ColumnText(sqlite3_stmt *stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    const unsigned char *txt = sqlite3_column_text(stmt, col);
    if (!txt) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char *>(txt));
}

std::string ColumnTextOrEmpty(sqlite3_stmt *stmt, int col) {
    return ColumnText(stmt, col).value_or("");
}

void BindOptionalText(sqlite3_stmt *stmt, int idx, const std::optional<std::string> &value) {
    if (value) {
        sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

void BindTextOrNull(sqlite3_stmt *stmt, int idx, const std::string &value) {
    sqlite3_bind_text(stmt, idx, value.empty() ? nullptr : value.c_str(), -1, SQLITE_TRANSIENT);
}

// Range queries compare timestamps as text, so only the canonical form is stored
bool CanonicalTimestamp(const std::optional<std::string> &value,
                        std::optional<std::string> &canonical, std::string &error) {
    canonical.reset();
    if (!value) {
        return true;
    }
    const std::optional<double> ms = ParseIsoMs(*value);
    if (!ms) {
        error = "invalid timestamp: " + *value;
        return false;
    }
    canonical = FormatIsoMs(*ms);
    return true;
}

} // namespace

// ─────────────────────────────────────
IntervalStore::IntervalStore(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open database");
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA wal_autocheckpoint=1000");
    ExecIgnoringErrors("PRAGMA journal_size_limit=10485760");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
IntervalStore::~IntervalStore() {
    for (sqlite3_stmt **stmt : {&m_InsertActivityStmt, &m_InsertBehaviorEventStmt,
                                &m_UpsertRollupStmt, &m_InsertPatternStmt}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void IntervalStore::Init() {
    spdlog::debug("Initializing SQLite database tables");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS activities ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "started_at TEXT NOT NULL,"
                       "ended_at TEXT,"
                       "source TEXT NOT NULL DEFAULT 'app',"
                       "app_name TEXT,"
                       "domain TEXT,"
                       "category TEXT,"
                       "seconds_active REAL NOT NULL DEFAULT 0,"
                       "idle_seconds REAL NOT NULL DEFAULT 0,"
                       "url TEXT,"
                       "window_title TEXT"
                       ")");
    // Files created before url / window_title existed
    ExecIgnoringErrors("ALTER TABLE activities ADD COLUMN url TEXT");
    ExecIgnoringErrors("ALTER TABLE activities ADD COLUMN window_title TEXT");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_activities_started ON activities(started_at)");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_activities_domain ON activities(domain)");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS activity_rollups ("
                       "device_id TEXT NOT NULL,"
                       "hour_start TEXT NOT NULL,"
                       "productive INTEGER NOT NULL DEFAULT 0,"
                       "neutral INTEGER NOT NULL DEFAULT 0,"
                       "frivolity INTEGER NOT NULL DEFAULT 0,"
                       "idle INTEGER NOT NULL DEFAULT 0,"
                       "updated_at TEXT NOT NULL,"
                       "PRIMARY KEY (device_id, hour_start)"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS reading_hourly_rollups ("
                       "hour_start TEXT PRIMARY KEY,"
                       "active_seconds INTEGER NOT NULL DEFAULT 0,"
                       "focused_seconds INTEGER NOT NULL DEFAULT 0,"
                       "pages_read INTEGER NOT NULL DEFAULT 0,"
                       "words_read INTEGER NOT NULL DEFAULT 0,"
                       "updated_at TEXT NOT NULL"
                       ")");
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS reading_daily_rollups ("
                       "day TEXT PRIMARY KEY,"
                       "active_seconds INTEGER NOT NULL DEFAULT 0,"
                       "focused_seconds INTEGER NOT NULL DEFAULT 0,"
                       "pages_read INTEGER NOT NULL DEFAULT 0,"
                       "words_read INTEGER NOT NULL DEFAULT 0,"
                       "updated_at TEXT NOT NULL"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS writing_hourly_rollups ("
                       "hour_start TEXT PRIMARY KEY,"
                       "active_seconds INTEGER NOT NULL DEFAULT 0,"
                       "focused_seconds INTEGER NOT NULL DEFAULT 0,"
                       "keystrokes INTEGER NOT NULL DEFAULT 0,"
                       "words_added INTEGER NOT NULL DEFAULT 0,"
                       "words_deleted INTEGER NOT NULL DEFAULT 0,"
                       "net_words INTEGER NOT NULL DEFAULT 0,"
                       "updated_at TEXT NOT NULL"
                       ")");
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS writing_daily_rollups ("
                       "day TEXT PRIMARY KEY,"
                       "active_seconds INTEGER NOT NULL DEFAULT 0,"
                       "focused_seconds INTEGER NOT NULL DEFAULT 0,"
                       "keystrokes INTEGER NOT NULL DEFAULT 0,"
                       "words_added INTEGER NOT NULL DEFAULT 0,"
                       "words_deleted INTEGER NOT NULL DEFAULT 0,"
                       "net_words INTEGER NOT NULL DEFAULT 0,"
                       "updated_at TEXT NOT NULL"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS pomodoro_sessions ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "started_at TEXT NOT NULL,"
                       "ended_at TEXT,"
                       "planned_duration_sec REAL NOT NULL DEFAULT 0"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS behavior_events ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "timestamp TEXT NOT NULL,"
                       "session_id INTEGER,"
                       "domain TEXT NOT NULL,"
                       "event_type TEXT NOT NULL,"
                       "value_int INTEGER,"
                       "value_float REAL,"
                       "metadata TEXT"
                       ")");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_behavior_events_domain_ts "
                       "ON behavior_events(domain, timestamp)");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS consumption_log ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "occurred_at TEXT NOT NULL,"
                       "kind TEXT NOT NULL,"
                       "title TEXT,"
                       "url TEXT,"
                       "domain TEXT,"
                       "meta TEXT"
                       ")");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_consumption_log_occurred "
                       "ON consumption_log(occurred_at)");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS behavioral_patterns ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "computed_at TEXT NOT NULL,"
                       "from_category TEXT,"
                       "from_domain TEXT,"
                       "to_category TEXT,"
                       "to_domain TEXT,"
                       "transition_count INTEGER NOT NULL,"
                       "avg_duration_before REAL NOT NULL,"
                       "correlation_strength REAL NOT NULL,"
                       "time_of_day_bucket INTEGER NOT NULL"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS settings ("
                       "key TEXT PRIMARY KEY,"
                       "value TEXT NOT NULL"
                       ")");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void IntervalStore::PrepareStatements() {
    {
        const char *sql = R"(
            INSERT INTO activities
            (started_at, ended_at, source, app_name, domain, category, seconds_active, idle_seconds,
             url, window_title)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertActivityStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for InsertActivity stmt: {}", sqlite3_errmsg(m_Db));
            m_InsertActivityStmt = nullptr;
        }
    }

    {
        const char *sql = R"(
            INSERT INTO behavior_events
            (timestamp, session_id, domain, event_type, value_int, value_float, metadata)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertBehaviorEventStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for InsertBehaviorEvent stmt: {}",
                          sqlite3_errmsg(m_Db));
            m_InsertBehaviorEventStmt = nullptr;
        }
    }

    {
        // Last writer wins: a rollup is always a full recompute of its hour
        const char *sql = R"(
            INSERT INTO activity_rollups
            (device_id, hour_start, productive, neutral, frivolity, idle, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(device_id, hour_start) DO UPDATE SET
                productive = excluded.productive,
                neutral = excluded.neutral,
                frivolity = excluded.frivolity,
                idle = excluded.idle,
                updated_at = excluded.updated_at
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_UpsertRollupStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for UpsertRollup stmt: {}", sqlite3_errmsg(m_Db));
            m_UpsertRollupStmt = nullptr;
        }
    }

    {
        const char *sql = R"(
            INSERT INTO behavioral_patterns
            (computed_at, from_category, from_domain, to_category, to_domain,
             transition_count, avg_duration_before, correlation_strength, time_of_day_bucket)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertPatternStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for InsertPattern stmt: {}", sqlite3_errmsg(m_Db));
            m_InsertPatternStmt = nullptr;
        }
    }
}

// ╭─────────────────────────────────────╮
// │             Activities              │
// ╰─────────────────────────────────────╯
bool IntervalStore::InsertActivity(const ActivityRow &row, std::string &error) {
    error.clear();
    if (!m_InsertActivityStmt) {
        error = "InsertActivity stmt not prepared";
        spdlog::error("InsertActivity stmt not prepared");
        return false;
    }

    std::optional<std::string> startedAt;
    std::optional<std::string> endedAt;
    if (!CanonicalTimestamp(row.started_at, startedAt, error) ||
        !CanonicalTimestamp(row.ended_at, endedAt, error)) {
        spdlog::warn("InsertActivity rejected: {}", error);
        return false;
    }

    sqlite3_reset(m_InsertActivityStmt);
    sqlite3_clear_bindings(m_InsertActivityStmt);

    BindOptionalText(m_InsertActivityStmt, 1, startedAt);
    BindOptionalText(m_InsertActivityStmt, 2, endedAt);
    sqlite3_bind_text(m_InsertActivityStmt, 3, row.source.c_str(), -1, SQLITE_TRANSIENT);
    BindTextOrNull(m_InsertActivityStmt, 4, row.app_name);
    BindTextOrNull(m_InsertActivityStmt, 5, row.domain);
    BindOptionalText(m_InsertActivityStmt, 6, row.category);
    sqlite3_bind_double(m_InsertActivityStmt, 7, row.seconds_active);
    sqlite3_bind_double(m_InsertActivityStmt, 8, row.idle_seconds);
    BindTextOrNull(m_InsertActivityStmt, 9, row.url);
    BindTextOrNull(m_InsertActivityStmt, 10, row.window_title);

    const int rc = sqlite3_step(m_InsertActivityStmt);
    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("InsertActivity failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    spdlog::debug("Inserted activity: app={}, domain={}, started_at={}, active={}", row.app_name,
                  row.domain, *startedAt, row.seconds_active);
    return true;
}

// ─────────────────────────────────────
// Expects columns: id, started_at, ended_at, domain, app_name, category,
// seconds_active, idle_seconds, url, window_title
std::vector<ActivityInterval> IntervalStore::CollectActivities(sqlite3_stmt *stmt,
                                                               LoadStats &stats) {
    std::vector<ActivityInterval> out;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const int64_t id = sqlite3_column_int64(stmt, 0);
        const std::string startedText = ColumnTextOrEmpty(stmt, 1);
        const std::optional<std::string> endedText = ColumnText(stmt, 2);

        const std::optional<double> startedMs = ParseIsoMs(startedText);
        if (!startedMs) {
            spdlog::debug("skipping activity {}: unparsable started_at '{}'", id, startedText);
            stats.skipped++;
            continue;
        }

        std::optional<double> endedMs;
        if (endedText) {
            endedMs = ParseIsoMs(*endedText);
            if (!endedMs) {
                spdlog::debug("skipping activity {}: unparsable ended_at '{}'", id, *endedText);
                stats.skipped++;
                continue;
            }
        }

        ActivityInterval interval;
        interval.id = id;
        interval.started_at_ms = *startedMs;
        interval.ended_at_ms = endedMs;
        interval.domain = ColumnTextOrEmpty(stmt, 3);
        interval.app_name = ColumnTextOrEmpty(stmt, 4);
        if (const auto category = ColumnText(stmt, 5)) {
            interval.category = ParseCategory(*category);
        }
        interval.seconds_active = sqlite3_column_double(stmt, 6);
        interval.idle_seconds = sqlite3_column_double(stmt, 7);
        interval.url = ColumnTextOrEmpty(stmt, 8);
        interval.window_title = ColumnTextOrEmpty(stmt, 9);

        out.push_back(std::move(interval));
        stats.rows++;
    }

    return out;
}

// ─────────────────────────────────────
std::vector<ActivityInterval> IntervalStore::FetchActivitiesOverlapping(double rangeStartMs,
                                                                        double rangeEndMs,
                                                                        LoadStats &stats) {
    const char *sql = R"(
        SELECT id, started_at, ended_at, domain, app_name, category, seconds_active, idle_seconds,
               url, window_title
        FROM activities
        WHERE started_at <= ? AND (ended_at IS NULL OR ended_at >= ?)
        ORDER BY started_at ASC, id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchActivitiesOverlapping: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string endIso = FormatIsoMs(rangeEndMs);
    const std::string startIso = FormatIsoMs(rangeStartMs);
    sqlite3_bind_text(stmt, 1, endIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, startIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivityInterval> out = CollectActivities(stmt, stats);
    sqlite3_finalize(stmt);

    spdlog::debug("Fetched {} activities overlapping [{}, {}] ({} skipped)", out.size(), startIso,
                  endIso, stats.skipped);
    return out;
}

// ─────────────────────────────────────
std::vector<ActivityInterval> IntervalStore::FetchActivitiesStartedBetween(double startMs,
                                                                           double endMs,
                                                                           LoadStats &stats) {
    const char *sql = R"(
        SELECT id, started_at, ended_at, domain, app_name, category, seconds_active, idle_seconds,
               url, window_title
        FROM activities
        WHERE started_at >= ? AND started_at < ?
        ORDER BY started_at ASC, id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchActivitiesStartedBetween: {}",
                      sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string startIso = FormatIsoMs(startMs);
    const std::string endIso = FormatIsoMs(endMs);
    sqlite3_bind_text(stmt, 1, startIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, endIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivityInterval> out = CollectActivities(stmt, stats);
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
std::vector<ActivityInterval> IntervalStore::FetchActivitiesForDomain(const std::string &domain,
                                                                      double rangeStartMs,
                                                                      double rangeEndMs,
                                                                      LoadStats &stats) {
    const char *sql = R"(
        SELECT id, started_at, ended_at, domain, app_name, category, seconds_active, idle_seconds,
               url, window_title
        FROM activities
        WHERE domain = ? AND started_at <= ? AND (ended_at IS NULL OR ended_at >= ?)
        ORDER BY started_at ASC, id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchActivitiesForDomain: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string endIso = FormatIsoMs(rangeEndMs);
    const std::string startIso = FormatIsoMs(rangeStartMs);
    sqlite3_bind_text(stmt, 1, domain.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, endIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, startIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivityInterval> out = CollectActivities(stmt, stats);
    sqlite3_finalize(stmt);
    return out;
}

// ╭─────────────────────────────────────╮
// │       Reading / writing streams     │
// ╰─────────────────────────────────────╯
std::vector<AuxHourlyRollup> IntervalStore::FetchAuxHourly(const char *table, double rangeStartMs,
                                                           double rangeEndMs) {
    const std::string sql = std::string("SELECT hour_start, active_seconds, focused_seconds FROM ") +
                            table +
                            " WHERE hour_start >= ? AND hour_start <= ? ORDER BY hour_start ASC";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchAuxHourly({}): {}", table, sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string startIso = FormatIsoMs(rangeStartMs);
    const std::string endIso = FormatIsoMs(rangeEndMs);
    sqlite3_bind_text(stmt, 1, startIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, endIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<AuxHourlyRollup> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const std::string hourText = ColumnTextOrEmpty(stmt, 0);
        const std::optional<double> hourMs = ParseIsoMs(hourText);
        if (!hourMs) {
            spdlog::debug("skipping {} row: unparsable hour_start '{}'", table, hourText);
            continue;
        }
        rows.push_back({*hourMs, sqlite3_column_double(stmt, 1), sqlite3_column_double(stmt, 2)});
    }

    sqlite3_finalize(stmt);
    return rows;
}

// ─────────────────────────────────────
std::vector<AuxHourlyRollup> IntervalStore::FetchReadingHourly(double rangeStartMs,
                                                               double rangeEndMs) {
    return FetchAuxHourly("reading_hourly_rollups", rangeStartMs, rangeEndMs);
}

// ─────────────────────────────────────
std::vector<AuxHourlyRollup> IntervalStore::FetchWritingHourly(double rangeStartMs,
                                                               double rangeEndMs) {
    return FetchAuxHourly("writing_hourly_rollups", rangeStartMs, rangeEndMs);
}

// ─────────────────────────────────────
double IntervalStore::SumAuxDailyActive(const char *table, const std::string &fromDay,
                                        const std::string &toDay) {
    const std::string sql = std::string("SELECT COALESCE(SUM(active_seconds), 0) FROM ") + table +
                            " WHERE day >= ? AND day <= ?";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in SumAuxDailyActive({}): {}", table,
                      sqlite3_errmsg(m_Db));
        return 0.0;
    }

    sqlite3_bind_text(stmt, 1, fromDay.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, toDay.c_str(), -1, SQLITE_TRANSIENT);

    double total = 0.0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_double(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return total;
}

// ─────────────────────────────────────
double IntervalStore::SumReadingDailyActive(const std::string &fromDay, const std::string &toDay) {
    return SumAuxDailyActive("reading_daily_rollups", fromDay, toDay);
}

// ─────────────────────────────────────
double IntervalStore::SumWritingDailyActive(const std::string &fromDay, const std::string &toDay) {
    return SumAuxDailyActive("writing_daily_rollups", fromDay, toDay);
}

// ─────────────────────────────────────
bool IntervalStore::AccumulateReadingProgress(const std::string &day, const std::string &hourStart,
                                              const std::string &updatedAt,
                                              const ReadingProgressDelta &delta,
                                              std::string &error) {
    error.clear();

    // Progress events are counters, so both rows add the delta
    static const char *const kSql[] = {
      R"(
        INSERT INTO reading_hourly_rollups
        (hour_start, active_seconds, focused_seconds, pages_read, words_read, updated_at)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(hour_start) DO UPDATE SET
            active_seconds = active_seconds + excluded.active_seconds,
            focused_seconds = focused_seconds + excluded.focused_seconds,
            pages_read = pages_read + excluded.pages_read,
            words_read = words_read + excluded.words_read,
            updated_at = excluded.updated_at
      )",
      R"(
        INSERT INTO reading_daily_rollups
        (day, active_seconds, focused_seconds, pages_read, words_read, updated_at)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(day) DO UPDATE SET
            active_seconds = active_seconds + excluded.active_seconds,
            focused_seconds = focused_seconds + excluded.focused_seconds,
            pages_read = pages_read + excluded.pages_read,
            words_read = words_read + excluded.words_read,
            updated_at = excluded.updated_at
      )"};

    if (!BeginTransaction(error)) {
        return false;
    }

    const std::string keys[] = {hourStart, day};
    for (int i = 0; i < 2; ++i) {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(m_Db, kSql[i], -1, &stmt, nullptr) != SQLITE_OK) {
            error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("db prepare failed in AccumulateReadingProgress: {}",
                          sqlite3_errmsg(m_Db));
            RollbackTransaction();
            return false;
        }

        sqlite3_bind_text(stmt, 1, keys[i].c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, delta.active_seconds);
        sqlite3_bind_int64(stmt, 3, delta.focused_seconds);
        sqlite3_bind_int64(stmt, 4, delta.pages_read);
        sqlite3_bind_int64(stmt, 5, delta.words_read);
        sqlite3_bind_text(stmt, 6, updatedAt.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("AccumulateReadingProgress failed: {}", sqlite3_errmsg(m_Db));
            RollbackTransaction();
            return false;
        }
    }

    return CommitTransaction(error);
}

// ─────────────────────────────────────
bool IntervalStore::AccumulateWritingProgress(const std::string &day, const std::string &hourStart,
                                              const std::string &updatedAt,
                                              const WritingProgressDelta &delta,
                                              std::string &error) {
    error.clear();

    static const char *const kSql[] = {
      R"(
        INSERT INTO writing_hourly_rollups
        (hour_start, active_seconds, focused_seconds, keystrokes, words_added, words_deleted,
         net_words, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(hour_start) DO UPDATE SET
            active_seconds = active_seconds + excluded.active_seconds,
            focused_seconds = focused_seconds + excluded.focused_seconds,
            keystrokes = keystrokes + excluded.keystrokes,
            words_added = words_added + excluded.words_added,
            words_deleted = words_deleted + excluded.words_deleted,
            net_words = net_words + excluded.net_words,
            updated_at = excluded.updated_at
      )",
      R"(
        INSERT INTO writing_daily_rollups
        (day, active_seconds, focused_seconds, keystrokes, words_added, words_deleted,
         net_words, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(day) DO UPDATE SET
            active_seconds = active_seconds + excluded.active_seconds,
            focused_seconds = focused_seconds + excluded.focused_seconds,
            keystrokes = keystrokes + excluded.keystrokes,
            words_added = words_added + excluded.words_added,
            words_deleted = words_deleted + excluded.words_deleted,
            net_words = net_words + excluded.net_words,
            updated_at = excluded.updated_at
      )"};

    if (!BeginTransaction(error)) {
        return false;
    }

    const std::string keys[] = {hourStart, day};
    for (int i = 0; i < 2; ++i) {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(m_Db, kSql[i], -1, &stmt, nullptr) != SQLITE_OK) {
            error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("db prepare failed in AccumulateWritingProgress: {}",
                          sqlite3_errmsg(m_Db));
            RollbackTransaction();
            return false;
        }

        sqlite3_bind_text(stmt, 1, keys[i].c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, delta.active_seconds);
        sqlite3_bind_int64(stmt, 3, delta.focused_seconds);
        sqlite3_bind_int64(stmt, 4, delta.keystrokes);
        sqlite3_bind_int64(stmt, 5, delta.words_added);
        sqlite3_bind_int64(stmt, 6, delta.words_deleted);
        sqlite3_bind_int64(stmt, 7, delta.net_words);
        sqlite3_bind_text(stmt, 8, updatedAt.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("AccumulateWritingProgress failed: {}", sqlite3_errmsg(m_Db));
            RollbackTransaction();
            return false;
        }
    }

    return CommitTransaction(error);
}

// ╭─────────────────────────────────────╮
// │            Focus sessions           │
// ╰─────────────────────────────────────╯
bool IntervalStore::InsertPomodoroSession(const std::string &startedAt,
                                          const std::optional<std::string> &endedAt,
                                          double plannedDurationSec, std::string &error) {
    error.clear();
    std::optional<std::string> started;
    std::optional<std::string> ended;
    if (!CanonicalTimestamp(startedAt, started, error) ||
        !CanonicalTimestamp(endedAt, ended, error)) {
        spdlog::warn("InsertPomodoroSession rejected: {}", error);
        return false;
    }

    const char *sql = "INSERT INTO pomodoro_sessions (started_at, ended_at, planned_duration_sec) "
                      "VALUES (?, ?, ?)";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in InsertPomodoroSession: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    BindOptionalText(stmt, 1, started);
    BindOptionalText(stmt, 2, ended);
    sqlite3_bind_double(stmt, 3, plannedDurationSec);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("InsertPomodoroSession failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::vector<PomodoroSession> IntervalStore::FetchPomodoroSessions(double rangeStartMs,
                                                                  double rangeEndMs) {
    const char *sql = R"(
        SELECT started_at, ended_at, planned_duration_sec
        FROM pomodoro_sessions
        WHERE (ended_at IS NULL OR ended_at >= ?) AND started_at <= ?
        ORDER BY started_at ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchPomodoroSessions: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string startIso = FormatIsoMs(rangeStartMs);
    const std::string endIso = FormatIsoMs(rangeEndMs);
    sqlite3_bind_text(stmt, 1, startIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, endIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<PomodoroSession> sessions;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const std::optional<double> startedMs = ParseIsoMs(ColumnTextOrEmpty(stmt, 0));
        if (!startedMs) {
            continue;
        }
        PomodoroSession session;
        session.started_at_ms = *startedMs;
        if (const auto ended = ColumnText(stmt, 1)) {
            session.ended_at_ms = ParseIsoMs(*ended);
            if (!session.ended_at_ms) {
                continue;
            }
        }
        session.planned_duration_sec = sqlite3_column_double(stmt, 2);
        sessions.push_back(session);
    }

    sqlite3_finalize(stmt);
    return sessions;
}

// ╭─────────────────────────────────────╮
// │           Behavior events           │
// ╰─────────────────────────────────────╯
bool IntervalStore::InsertBehaviorEvents(const std::vector<BehaviorEvent> &events,
                                         std::string &error) {
    error.clear();
    if (!m_InsertBehaviorEventStmt) {
        error = "InsertBehaviorEvent stmt not prepared";
        spdlog::error("InsertBehaviorEvent stmt not prepared");
        return false;
    }
    if (events.empty()) {
        return true;
    }

    if (!BeginTransaction(error)) {
        return false;
    }

    for (const BehaviorEvent &event : events) {
        sqlite3_reset(m_InsertBehaviorEventStmt);
        sqlite3_clear_bindings(m_InsertBehaviorEventStmt);

        sqlite3_bind_text(m_InsertBehaviorEventStmt, 1, event.timestamp.c_str(), -1,
                          SQLITE_TRANSIENT);
        if (event.session_id) {
            sqlite3_bind_int64(m_InsertBehaviorEventStmt, 2, *event.session_id);
        } else {
            sqlite3_bind_null(m_InsertBehaviorEventStmt, 2);
        }
        sqlite3_bind_text(m_InsertBehaviorEventStmt, 3, event.domain.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(m_InsertBehaviorEventStmt, 4, event.event_type.c_str(), -1,
                          SQLITE_TRANSIENT);
        if (event.value_int) {
            sqlite3_bind_int64(m_InsertBehaviorEventStmt, 5, *event.value_int);
        } else {
            sqlite3_bind_null(m_InsertBehaviorEventStmt, 5);
        }
        if (event.value_float) {
            sqlite3_bind_double(m_InsertBehaviorEventStmt, 6, *event.value_float);
        } else {
            sqlite3_bind_null(m_InsertBehaviorEventStmt, 6);
        }
        BindTextOrNull(m_InsertBehaviorEventStmt, 7, event.metadata);

        if (sqlite3_step(m_InsertBehaviorEventStmt) != SQLITE_DONE) {
            error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("InsertBehaviorEvents failed: {}", sqlite3_errmsg(m_Db));
            sqlite3_reset(m_InsertBehaviorEventStmt);
            RollbackTransaction();
            return false;
        }
    }
    sqlite3_reset(m_InsertBehaviorEventStmt);

    return CommitTransaction(error);
}

// ─────────────────────────────────────
std::vector<BehaviorEvent> IntervalStore::FetchBehaviorEvents(const std::string &domain,
                                                              double sinceMs, double untilMs) {
    const char *sql = R"(
        SELECT timestamp, session_id, domain, event_type, value_int, value_float, metadata
        FROM behavior_events
        WHERE domain = ? AND timestamp >= ? AND timestamp <= ?
        ORDER BY timestamp ASC, id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchBehaviorEvents: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string sinceIso = FormatIsoMs(sinceMs);
    const std::string untilIso = FormatIsoMs(untilMs);
    sqlite3_bind_text(stmt, 1, domain.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, sinceIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, untilIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<BehaviorEvent> events = CollectBehaviorEvents(stmt);
    sqlite3_finalize(stmt);
    return events;
}

// ─────────────────────────────────────
std::vector<BehaviorEvent> IntervalStore::FetchBehaviorEventsBetween(double sinceMs,
                                                                     double untilMs) {
    const char *sql = R"(
        SELECT timestamp, session_id, domain, event_type, value_int, value_float, metadata
        FROM behavior_events
        WHERE timestamp >= ? AND timestamp <= ?
        ORDER BY timestamp ASC, id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchBehaviorEventsBetween: {}",
                      sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string sinceIso = FormatIsoMs(sinceMs);
    const std::string untilIso = FormatIsoMs(untilMs);
    sqlite3_bind_text(stmt, 1, sinceIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, untilIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<BehaviorEvent> events = CollectBehaviorEvents(stmt);
    sqlite3_finalize(stmt);
    return events;
}

// ─────────────────────────────────────
// Expects columns: timestamp, session_id, domain, event_type, value_int,
// value_float, metadata
std::vector<BehaviorEvent> IntervalStore::CollectBehaviorEvents(sqlite3_stmt *stmt) {
    std::vector<BehaviorEvent> events;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        BehaviorEvent event;
        event.timestamp = ColumnTextOrEmpty(stmt, 0);
        if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
            event.session_id = sqlite3_column_int64(stmt, 1);
        }
        event.domain = ColumnTextOrEmpty(stmt, 2);
        event.event_type = ColumnTextOrEmpty(stmt, 3);
        if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
            event.value_int = sqlite3_column_int64(stmt, 4);
        }
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            event.value_float = sqlite3_column_double(stmt, 5);
        }
        event.metadata = ColumnTextOrEmpty(stmt, 6);
        events.push_back(std::move(event));
    }
    return events;
}

// ╭─────────────────────────────────────╮
// │           Consumption log           │
// ╰─────────────────────────────────────╯
bool IntervalStore::InsertConsumptionMarker(const ConsumptionMarker &marker,
                                            std::string &error) {
    error.clear();
    std::optional<std::string> occurredAt;
    if (!CanonicalTimestamp(marker.occurred_at, occurredAt, error)) {
        spdlog::warn("InsertConsumptionMarker rejected: {}", error);
        return false;
    }

    const char *sql = "INSERT INTO consumption_log (occurred_at, kind, title, url, domain, meta) "
                      "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in InsertConsumptionMarker: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    BindOptionalText(stmt, 1, occurredAt);
    sqlite3_bind_text(stmt, 2, marker.kind.c_str(), -1, SQLITE_TRANSIENT);
    BindTextOrNull(stmt, 3, marker.title);
    BindTextOrNull(stmt, 4, marker.url);
    BindTextOrNull(stmt, 5, marker.domain);
    BindTextOrNull(stmt, 6, marker.meta);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("InsertConsumptionMarker failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::vector<ConsumptionMarker> IntervalStore::FetchConsumptionMarkers(double rangeStartMs,
                                                                      double rangeEndMs) {
    const char *sql = R"(
        SELECT occurred_at, kind, title, url, domain, meta
        FROM consumption_log
        WHERE occurred_at >= ? AND occurred_at <= ?
        ORDER BY occurred_at ASC, id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchConsumptionMarkers: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    const std::string startIso = FormatIsoMs(rangeStartMs);
    const std::string endIso = FormatIsoMs(rangeEndMs);
    sqlite3_bind_text(stmt, 1, startIso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, endIso.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ConsumptionMarker> markers;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ConsumptionMarker marker;
        marker.occurred_at = ColumnTextOrEmpty(stmt, 0);
        marker.kind = ColumnTextOrEmpty(stmt, 1);
        marker.title = ColumnTextOrEmpty(stmt, 2);
        marker.url = ColumnTextOrEmpty(stmt, 3);
        marker.domain = ColumnTextOrEmpty(stmt, 4);
        marker.meta = ColumnTextOrEmpty(stmt, 5);
        markers.push_back(std::move(marker));
    }

    sqlite3_finalize(stmt);
    return markers;
}

// ╭─────────────────────────────────────╮
// │           Activity rollups          │
// ╰─────────────────────────────────────╯
bool IntervalStore::UpsertActivityRollups(const std::vector<ActivityRollup> &rollups,
                                          std::string &error) {
    error.clear();
    if (!m_UpsertRollupStmt) {
        error = "UpsertRollup stmt not prepared";
        spdlog::error("UpsertRollup stmt not prepared");
        return false;
    }
    if (rollups.empty()) {
        return true;
    }

    if (!BeginTransaction(error)) {
        return false;
    }

    for (const ActivityRollup &rollup : rollups) {
        sqlite3_reset(m_UpsertRollupStmt);
        sqlite3_clear_bindings(m_UpsertRollupStmt);

        sqlite3_bind_text(m_UpsertRollupStmt, 1, rollup.device_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(m_UpsertRollupStmt, 2, rollup.hour_start.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(m_UpsertRollupStmt, 3, rollup.productive);
        sqlite3_bind_int64(m_UpsertRollupStmt, 4, rollup.neutral);
        sqlite3_bind_int64(m_UpsertRollupStmt, 5, rollup.frivolity);
        sqlite3_bind_int64(m_UpsertRollupStmt, 6, rollup.idle);
        sqlite3_bind_text(m_UpsertRollupStmt, 7, rollup.updated_at.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(m_UpsertRollupStmt) != SQLITE_DONE) {
            error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("UpsertActivityRollups failed: {}", sqlite3_errmsg(m_Db));
            sqlite3_reset(m_UpsertRollupStmt);
            RollbackTransaction();
            return false;
        }
    }
    sqlite3_reset(m_UpsertRollupStmt);

    if (!CommitTransaction(error)) {
        return false;
    }
    spdlog::debug("Upserted {} activity rollups", rollups.size());
    return true;
}

// ─────────────────────────────────────
std::vector<ActivityRollup> IntervalStore::ListActivityRollupsSince(const std::string &deviceId,
                                                                    const std::string &updatedAfter) {
    const char *sql = R"(
        SELECT device_id, hour_start, productive, neutral, frivolity, idle, updated_at
        FROM activity_rollups
        WHERE device_id = ? AND updated_at >= ?
        ORDER BY hour_start ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in ListActivityRollupsSince: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    sqlite3_bind_text(stmt, 1, deviceId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, updatedAfter.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivityRollup> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back({ColumnTextOrEmpty(stmt, 0), ColumnTextOrEmpty(stmt, 1),
                        sqlite3_column_int64(stmt, 2), sqlite3_column_int64(stmt, 3),
                        sqlite3_column_int64(stmt, 4), sqlite3_column_int64(stmt, 5),
                        ColumnTextOrEmpty(stmt, 6)});
    }

    sqlite3_finalize(stmt);
    return rows;
}

// ─────────────────────────────────────
std::vector<ActivityRollup> IntervalStore::ListActivityRollupsFrom(const std::string &deviceId,
                                                                   const std::string &hourStartFrom) {
    const char *sql = R"(
        SELECT device_id, hour_start, productive, neutral, frivolity, idle, updated_at
        FROM activity_rollups
        WHERE hour_start >= ? AND (? = '' OR device_id = ?)
        ORDER BY hour_start ASC, device_id ASC
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in ListActivityRollupsFrom: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    sqlite3_bind_text(stmt, 1, hourStartFrom.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, deviceId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, deviceId.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivityRollup> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back({ColumnTextOrEmpty(stmt, 0), ColumnTextOrEmpty(stmt, 1),
                        sqlite3_column_int64(stmt, 2), sqlite3_column_int64(stmt, 3),
                        sqlite3_column_int64(stmt, 4), sqlite3_column_int64(stmt, 5),
                        ColumnTextOrEmpty(stmt, 6)});
    }

    sqlite3_finalize(stmt);
    return rows;
}

// ╭─────────────────────────────────────╮
// │         Behavioral patterns         │
// ╰─────────────────────────────────────╯
bool IntervalStore::ReplacePatterns(const std::vector<BehavioralPattern> &patterns,
                                    std::string &error) {
    error.clear();
    if (!m_InsertPatternStmt) {
        error = "InsertPattern stmt not prepared";
        spdlog::error("InsertPattern stmt not prepared");
        return false;
    }

    if (!BeginTransaction(error)) {
        return false;
    }

    if (!Exec("DELETE FROM behavioral_patterns", error)) {
        RollbackTransaction();
        return false;
    }

    for (const BehavioralPattern &pattern : patterns) {
        sqlite3_reset(m_InsertPatternStmt);
        sqlite3_clear_bindings(m_InsertPatternStmt);

        sqlite3_bind_text(m_InsertPatternStmt, 1, pattern.computed_at.c_str(), -1,
                          SQLITE_TRANSIENT);
        BindOptionalText(m_InsertPatternStmt, 2, pattern.from.category);
        BindOptionalText(m_InsertPatternStmt, 3, pattern.from.domain);
        BindOptionalText(m_InsertPatternStmt, 4, pattern.to.category);
        BindOptionalText(m_InsertPatternStmt, 5, pattern.to.domain);
        sqlite3_bind_int(m_InsertPatternStmt, 6, pattern.frequency);
        sqlite3_bind_double(m_InsertPatternStmt, 7, pattern.avg_duration_before_seconds);
        sqlite3_bind_double(m_InsertPatternStmt, 8, pattern.correlation_strength);
        sqlite3_bind_int(m_InsertPatternStmt, 9, pattern.dominant_hour_of_day);

        if (sqlite3_step(m_InsertPatternStmt) != SQLITE_DONE) {
            error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("ReplacePatterns failed: {}", sqlite3_errmsg(m_Db));
            sqlite3_reset(m_InsertPatternStmt);
            RollbackTransaction();
            return false;
        }
    }
    sqlite3_reset(m_InsertPatternStmt);

    return CommitTransaction(error);
}

// ─────────────────────────────────────
std::vector<BehavioralPattern> IntervalStore::FetchTopPatterns(int limit) {
    const char *sql = R"(
        SELECT id, computed_at, from_category, from_domain, to_category, to_domain,
               transition_count, avg_duration_before, correlation_strength, time_of_day_bucket
        FROM behavioral_patterns
        ORDER BY transition_count DESC, id ASC
        LIMIT ?
    )";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchTopPatterns: {}", sqlite3_errmsg(m_Db));
        return {};
    }

    sqlite3_bind_int(stmt, 1, limit);

    std::vector<BehavioralPattern> patterns;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        BehavioralPattern pattern;
        pattern.id = sqlite3_column_int64(stmt, 0);
        pattern.computed_at = ColumnTextOrEmpty(stmt, 1);
        pattern.from.category = ColumnText(stmt, 2);
        pattern.from.domain = ColumnText(stmt, 3);
        pattern.to.category = ColumnText(stmt, 4);
        pattern.to.domain = ColumnText(stmt, 5);
        pattern.frequency = sqlite3_column_int(stmt, 6);
        pattern.avg_duration_before_seconds = sqlite3_column_double(stmt, 7);
        pattern.correlation_strength = sqlite3_column_double(stmt, 8);
        pattern.dominant_hour_of_day = sqlite3_column_int(stmt, 9);
        patterns.push_back(std::move(pattern));
    }

    sqlite3_finalize(stmt);
    return patterns;
}

// ─────────────────────────────────────
std::optional<std::string> IntervalStore::LatestPatternComputedAt() {
    const char *sql = "SELECT MAX(computed_at) FROM behavioral_patterns";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in LatestPatternComputedAt: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }

    std::optional<std::string> latest;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        latest = ColumnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return latest;
}

// ╭─────────────────────────────────────╮
// │               Settings              │
// ╰─────────────────────────────────────╯
std::optional<std::string> IntervalStore::GetSetting(const std::string &key) {
    const char *sql = "SELECT value FROM settings WHERE key = ?";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetSetting: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = ColumnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

// ─────────────────────────────────────
bool IntervalStore::SetSetting(const std::string &key, const std::string &value,
                               std::string &error) {
    error.clear();
    const char *sql = "INSERT INTO settings (key, value) VALUES (?, ?) "
                      "ON CONFLICT(key) DO UPDATE SET value = excluded.value";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in SetSetting: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("SetSetting failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ╭─────────────────────────────────────╮
// │             Transactions            │
// ╰─────────────────────────────────────╯
bool IntervalStore::BeginTransaction(std::string &error) {
    return Exec("BEGIN IMMEDIATE TRANSACTION", error);
}

// ─────────────────────────────────────
bool IntervalStore::CommitTransaction(std::string &error) {
    if (!Exec("COMMIT", error)) {
        RollbackTransaction();
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void IntervalStore::RollbackTransaction() {
    ExecIgnoringErrors("ROLLBACK");
}

// ─────────────────────────────────────
bool IntervalStore::Exec(const std::string &sql, std::string &error) {
    char *errmsg = nullptr;
    const int rc = sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        error = std::string("sqlite exec failed: ") + (errmsg ? errmsg : sqlite3_errmsg(m_Db));
        spdlog::error("sqlite exec error ({}): {}", sql, errmsg ? errmsg : sqlite3_errmsg(m_Db));
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void IntervalStore::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
