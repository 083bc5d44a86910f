#include "voicecache/kv_store.hpp"
#include "voicecache/log.hpp"
#include "voicecache/types.hpp"

#include <chrono>
#include <sqlite3.h>
#include <stdexcept>
#include <thread>

namespace voicecache {

namespace {

constexpr const char* KV_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS kv_store (
    key TEXT PRIMARY KEY,
    value BLOB NOT NULL,
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

}  // namespace

SqliteKvStore::SqliteKvStore(const std::filesystem::path& db_path) : db_path_(db_path) {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open metadata store: " + msg);
    }

    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, KV_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create kv_store table in " + db_path_.string());
    }

    try {
        stmt_read_ = prepare(db_, "SELECT value FROM kv_store WHERE key = ?1");
        stmt_write_ = prepare(db_,
            "INSERT OR REPLACE INTO kv_store (key, value, updated_at) VALUES (?1, ?2, ?3)");
        stmt_erase_ = prepare(db_, "DELETE FROM kv_store");
    } catch (...) {
        if (stmt_read_) sqlite3_finalize(stmt_read_);
        if (stmt_write_) sqlite3_finalize(stmt_write_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteKvStore::~SqliteKvStore() {
    if (stmt_read_) sqlite3_finalize(stmt_read_);
    if (stmt_write_) sqlite3_finalize(stmt_write_);
    if (stmt_erase_) sqlite3_finalize(stmt_erase_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::optional<std::string> SqliteKvStore::read(const std::string& key) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_read_);
    sqlite3_bind_text(stmt_read_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_read_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        log_error("kv read failed for %s: %s", key.c_str(), sqlite3_errmsg(db_));
        return std::nullopt;
    }

    auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt_read_, 0));
    int len = sqlite3_column_bytes(stmt_read_, 0);
    std::string value;
    if (blob && len > 0) value.assign(blob, static_cast<size_t>(len));
    sqlite3_reset(stmt_read_);
    return value;
}

bool SqliteKvStore::write(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_write_);
    sqlite3_bind_text(stmt_write_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt_write_, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_write_, 3, now_epoch_ms());
    int rc = sql_step_retry(stmt_write_);
    sqlite3_reset(stmt_write_);
    if (rc != SQLITE_DONE) {
        log_error("kv write failed for %s: %s", key.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteKvStore::erase() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_erase_);
    int rc = sql_step_retry(stmt_erase_);
    sqlite3_reset(stmt_erase_);
    if (rc != SQLITE_DONE) {
        log_error("kv erase failed: %s", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

}  // namespace voicecache
