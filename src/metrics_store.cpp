#include "metrics_store.hpp"
#include "file_helpers.hpp"
#include "logger.hpp"

#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace filemover {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

MetricsStore::MetricsStore(std::string db_path)
    : db_path_(std::move(db_path)) {
}

MetricsStore::~MetricsStore() {
    close();
}

void MetricsStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_exec(static_cast<sqlite3*>(db_), "PRAGMA wal_checkpoint(TRUNCATE);", nullptr, nullptr, nullptr);
        sqlite3_close(static_cast<sqlite3*>(db_));
        db_ = nullptr;
        Logger::debug("[MetricsStore] Database closed");
    }
}

bool MetricsStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    Logger::info("[MetricsStore] Opening database at: " + db_path_);

    fs::path db_dir = fs::path(db_path_).parent_path();
    if (!db_dir.empty() && !FileHelpers::safe_exists(db_dir)) {
        std::error_code ec;
        fs::create_directories(db_dir, ec);
        if (ec) {
            Logger::error("[MetricsStore] Cannot create " + db_dir.string() + ": " + ec.message());
            return false;
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(db_path_.c_str(), &db);
    if (rc != SQLITE_OK) {
        Logger::error("[MetricsStore] Failed to open database: " +
                      std::string(db ? sqlite3_errmsg(db) : "out of memory"));
        if (db) sqlite3_close(db);
        return false;
    }
    db_ = db;

    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        sqlite3_close(db);
        db_ = nullptr;
        return false;
    }
    return true;
}

bool MetricsStore::create_tables() {
    sqlite3* db = static_cast<sqlite3*>(db_);
    char* err = nullptr;

    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS file_operations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp_ms INTEGER NOT NULL,
            filename TEXT NOT NULL,
            file_size_bytes INTEGER DEFAULT 0,
            duration_seconds REAL DEFAULT 0,
            success INTEGER DEFAULT 0,
            error TEXT
        );

        CREATE TABLE IF NOT EXISTS system_metrics (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp_ms INTEGER NOT NULL,
            cpu_percent REAL,
            memory_percent REAL,
            disk_free_gb REAL,
            concurrent_operations INTEGER,
            concurrency_limit INTEGER
        );

        CREATE INDEX IF NOT EXISTS idx_file_operations_ts ON file_operations(timestamp_ms);
        CREATE INDEX IF NOT EXISTS idx_system_metrics_ts ON system_metrics(timestamp_ms);
    )";

    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        Logger::error("[MetricsStore] Failed to create tables: " + std::string(err ? err : "unknown"));
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool MetricsStore::append(const std::vector<FileOperationMetric>& operations,
                          const std::vector<SystemMetric>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;
    sqlite3* db = static_cast<sqlite3*>(db_);

    if (sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::error("[MetricsStore] BEGIN failed: " + std::string(sqlite3_errmsg(db)));
        return false;
    }

    bool ok = true;
    sqlite3_stmt* stmt = nullptr;

    if (!operations.empty()) {
        const char* sql = "INSERT INTO file_operations "
                          "(timestamp_ms, filename, file_size_bytes, duration_seconds, success, error) "
                          "VALUES (?, ?, ?, ?, ?, ?)";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            Logger::error("[MetricsStore] Prepare failed: " + std::string(sqlite3_errmsg(db)));
            ok = false;
        } else {
            for (const auto& op : operations) {
                sqlite3_bind_int64(stmt, 1, to_millis(op.timestamp));
                sqlite3_bind_text(stmt, 2, op.filename.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(op.file_size_bytes));
                sqlite3_bind_double(stmt, 4, op.duration_seconds);
                sqlite3_bind_int(stmt, 5, op.success ? 1 : 0);
                sqlite3_bind_text(stmt, 6, op.error.c_str(), -1, SQLITE_TRANSIENT);
                if (sqlite3_step(stmt) != SQLITE_DONE) {
                    Logger::error("[MetricsStore] Insert failed: " + std::string(sqlite3_errmsg(db)));
                    ok = false;
                    break;
                }
                sqlite3_reset(stmt);
            }
            sqlite3_finalize(stmt);
        }
    }

    if (ok && !samples.empty()) {
        const char* sql = "INSERT INTO system_metrics "
                          "(timestamp_ms, cpu_percent, memory_percent, disk_free_gb, "
                          "concurrent_operations, concurrency_limit) VALUES (?, ?, ?, ?, ?, ?)";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            Logger::error("[MetricsStore] Prepare failed: " + std::string(sqlite3_errmsg(db)));
            ok = false;
        } else {
            for (const auto& s : samples) {
                sqlite3_bind_int64(stmt, 1, to_millis(s.timestamp));
                sqlite3_bind_double(stmt, 2, s.cpu_percent);
                sqlite3_bind_double(stmt, 3, s.memory_percent);
                sqlite3_bind_double(stmt, 4, s.disk_free_gb);
                sqlite3_bind_int(stmt, 5, s.concurrent_operations);
                sqlite3_bind_int(stmt, 6, s.concurrency_limit);
                if (sqlite3_step(stmt) != SQLITE_DONE) {
                    Logger::error("[MetricsStore] Insert failed: " + std::string(sqlite3_errmsg(db)));
                    ok = false;
                    break;
                }
                sqlite3_reset(stmt);
            }
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_exec(db, ok ? "COMMIT;" : "ROLLBACK;", nullptr, nullptr, nullptr);
    return ok;
}

bool MetricsStore::load_since(std::chrono::system_clock::time_point since,
                              std::vector<FileOperationMetric>& operations,
                              std::vector<SystemMetric>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;
    sqlite3* db = static_cast<sqlite3*>(db_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql_ops = "SELECT timestamp_ms, filename, file_size_bytes, duration_seconds, success, error "
                          "FROM file_operations WHERE timestamp_ms >= ? ORDER BY timestamp_ms";
    if (sqlite3_prepare_v2(db, sql_ops, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[MetricsStore] Query prepare failed: " + std::string(sqlite3_errmsg(db)));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, to_millis(since));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        FileOperationMetric op;
        op.timestamp = from_millis(sqlite3_column_int64(stmt, 0));
        op.filename = column_string(stmt, 1);
        op.file_size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        op.duration_seconds = sqlite3_column_double(stmt, 3);
        op.success = sqlite3_column_int(stmt, 4) != 0;
        op.error = column_string(stmt, 5);
        operations.push_back(std::move(op));
    }
    sqlite3_finalize(stmt);

    const char* sql_sys = "SELECT timestamp_ms, cpu_percent, memory_percent, disk_free_gb, "
                          "concurrent_operations, concurrency_limit "
                          "FROM system_metrics WHERE timestamp_ms >= ? ORDER BY timestamp_ms";
    if (sqlite3_prepare_v2(db, sql_sys, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[MetricsStore] Query prepare failed: " + std::string(sqlite3_errmsg(db)));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, to_millis(since));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SystemMetric s;
        s.timestamp = from_millis(sqlite3_column_int64(stmt, 0));
        s.cpu_percent = sqlite3_column_double(stmt, 1);
        s.memory_percent = sqlite3_column_double(stmt, 2);
        s.disk_free_gb = sqlite3_column_double(stmt, 3);
        s.concurrent_operations = sqlite3_column_int(stmt, 4);
        s.concurrency_limit = sqlite3_column_int(stmt, 5);
        samples.push_back(s);
    }
    sqlite3_finalize(stmt);
    return true;
}

int MetricsStore::prune_older_than(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return -1;
    sqlite3* db = static_cast<sqlite3*>(db_);

    int removed = 0;
    const char* statements[] = {
        "DELETE FROM file_operations WHERE timestamp_ms < ?",
        "DELETE FROM system_metrics WHERE timestamp_ms < ?",
    };
    for (const char* sql : statements) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            Logger::error("[MetricsStore] Prune prepare failed: " + std::string(sqlite3_errmsg(db)));
            return -1;
        }
        sqlite3_bind_int64(stmt, 1, to_millis(cutoff));
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            Logger::error("[MetricsStore] Prune failed: " + std::string(sqlite3_errmsg(db)));
            sqlite3_finalize(stmt);
            return -1;
        }
        removed += sqlite3_changes(db);
        sqlite3_finalize(stmt);
    }
    if (removed > 0) {
        Logger::debug("[MetricsStore] Pruned " + std::to_string(removed) + " old records");
    }
    return removed;
}

} // namespace filemover
