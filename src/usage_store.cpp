#include "usage_store.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <unistd.h>

namespace {

// ─────────────────────────────────────
struct SqliteStmt {
    sqlite3_stmt *stmt = nullptr;
    ~SqliteStmt() {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
    sqlite3_stmt **out() { return &stmt; }
    sqlite3_stmt *get() const { return stmt; }
    SqliteStmt(const SqliteStmt &) = delete;
    SqliteStmt &operator=(const SqliteStmt &) = delete;
    SqliteStmt() = default;
};

} // namespace

// ─────────────────────────────────────
UsageStore::UsageStore(const std::filesystem::path &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    std::error_code ec;
    if (m_DbPath.has_parent_path()) {
        std::filesystem::create_directories(m_DbPath.parent_path(), ec);
    }

    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("UsageStore: unable to open database: {}", m_DbPath.string());
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open database " + m_DbPath.string());
    }

    spdlog::debug("UsageStore: database opened: {}", m_DbPath.string());

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
UsageStore::~UsageStore() {
    if (m_InsertSampleStmt) {
        sqlite3_finalize(m_InsertSampleStmt);
        m_InsertSampleStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void UsageStore::Init() {
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS system_usage ("
                       "timestamp INTEGER NOT NULL,"
                       "cpu_percent REAL NOT NULL,"
                       "memory_percent REAL NOT NULL,"
                       "io_percent REAL NOT NULL,"
                       "day_of_week INTEGER NOT NULL,"
                       "hour INTEGER NOT NULL,"
                       "minute INTEGER NOT NULL"
                       ")");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_system_usage_slot "
                       "ON system_usage (day_of_week, hour, minute)");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_system_usage_ts "
                       "ON system_usage (timestamp)");
}

// ─────────────────────────────────────
void UsageStore::PrepareStatements() {
    const char *sql = R"(
        INSERT INTO system_usage
        (timestamp, cpu_percent, memory_percent, io_percent, day_of_week, hour, minute)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertSampleStmt, nullptr) != SQLITE_OK) {
        spdlog::error("UsageStore: prepare failed for InsertSample stmt: {}", sqlite3_errmsg(m_Db));
        m_InsertSampleStmt = nullptr;
    }
}

// ─────────────────────────────────────
void UsageStore::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::debug("UsageStore: '{}' failed: {}", sql, errmsg);
        sqlite3_free(errmsg);
    }
}

// ─────────────────────────────────────
bool UsageStore::InsertSample(const UsageSample &sample, std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_InsertSampleStmt) {
        error = "insert statement unavailable";
        return false;
    }

    sqlite3_reset(m_InsertSampleStmt);
    sqlite3_clear_bindings(m_InsertSampleStmt);
    sqlite3_bind_int64(m_InsertSampleStmt, 1, sample.timestamp);
    sqlite3_bind_double(m_InsertSampleStmt, 2, sample.cpu_percent);
    sqlite3_bind_double(m_InsertSampleStmt, 3, sample.memory_percent);
    sqlite3_bind_double(m_InsertSampleStmt, 4, sample.io_percent);
    sqlite3_bind_int(m_InsertSampleStmt, 5, sample.day_of_week);
    sqlite3_bind_int(m_InsertSampleStmt, 6, sample.hour);
    sqlite3_bind_int(m_InsertSampleStmt, 7, sample.minute);

    int rc = sqlite3_step(m_InsertSampleStmt);
    sqlite3_reset(m_InsertSampleStmt);
    if (rc != SQLITE_DONE) {
        error = std::string("db insert failed: ") + sqlite3_errmsg(m_Db);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::optional<UsageSlot> UsageStore::LowestLoadSlot(int day_of_week) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    SqliteStmt stmt;
    const char *sql = R"(
        SELECT hour, minute,
               (AVG(cpu_percent) + AVG(memory_percent) + AVG(io_percent)) / 3.0 AS load,
               COUNT(*)
        FROM system_usage
        WHERE day_of_week = ?
        GROUP BY hour, minute
        ORDER BY load ASC, hour ASC, minute ASC
        LIMIT 1
    )";
    if (sqlite3_prepare_v2(m_Db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        spdlog::error("UsageStore: prepare failed for LowestLoadSlot: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }
    sqlite3_bind_int(stmt.get(), 1, day_of_week);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    UsageSlot slot;
    slot.hour = sqlite3_column_int(stmt.get(), 0);
    slot.minute = sqlite3_column_int(stmt.get(), 1);
    slot.average_load = sqlite3_column_double(stmt.get(), 2);
    slot.samples = sqlite3_column_int(stmt.get(), 3);
    return slot;
}

// ─────────────────────────────────────
UsageReport UsageStore::HourlyLoadByWeekday() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    UsageReport report;

    SqliteStmt stmt;
    const char *sql = R"(
        SELECT day_of_week, hour,
               AVG((cpu_percent + memory_percent + io_percent) / 3.0) AS load
        FROM system_usage
        GROUP BY day_of_week, hour
        ORDER BY day_of_week, hour
    )";
    if (sqlite3_prepare_v2(m_Db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        spdlog::error("UsageStore: prepare failed for HourlyLoadByWeekday: {}",
                      sqlite3_errmsg(m_Db));
        return report;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        int day = sqlite3_column_int(stmt.get(), 0);
        int hour = sqlite3_column_int(stmt.get(), 1);
        report[day][hour] = sqlite3_column_double(stmt.get(), 2);
    }
    return report;
}

// ─────────────────────────────────────
int UsageStore::PruneOlderThan(std::int64_t cutoff) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    SqliteStmt stmt;
    const char *sql = "DELETE FROM system_usage WHERE timestamp < ?";
    if (sqlite3_prepare_v2(m_Db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        spdlog::error("UsageStore: prepare failed for PruneOlderThan: {}", sqlite3_errmsg(m_Db));
        return 0;
    }
    sqlite3_bind_int64(stmt.get(), 1, cutoff);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("UsageStore: prune failed: {}", sqlite3_errmsg(m_Db));
        return 0;
    }
    return sqlite3_changes(m_Db);
}

// ─────────────────────────────────────
int UsageStore::CountSamples() {
    std::lock_guard<std::mutex> lock(m_Mutex);

    SqliteStmt stmt;
    if (sqlite3_prepare_v2(m_Db, "SELECT COUNT(*) FROM system_usage", -1, stmt.out(), nullptr) !=
        SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

// ─────────────────────────────────────
bool UsageStore::IsAccessible(const std::filesystem::path &db_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(db_path, ec)) {
        return false;
    }
    if (access(db_path.c_str(), R_OK | W_OK) != 0) {
        return false;
    }

    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(db_path.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        return false;
    }
    sqlite3_busy_timeout(db, 2000);

    bool ok = false;
    {
        SqliteStmt stmt;
        if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM system_usage", -1, stmt.out(),
                               nullptr) == SQLITE_OK) {
            ok = sqlite3_step(stmt.get()) == SQLITE_ROW;
        }
    }
    sqlite3_close(db);
    return ok;
}
