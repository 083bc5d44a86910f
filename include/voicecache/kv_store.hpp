#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace voicecache {

/// Durable whole-document key/value store for cache metadata.
///
/// Values are opaque blobs written and read in full; the cache index keeps
/// its entire table under a single key.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    // Backend name for logging
    virtual std::string type_name() const = 0;

    // Read the blob stored under key. Empty optional if the key is absent
    // or the read failed (failures are logged).
    virtual std::optional<std::string> read(const std::string& key) = 0;

    // Replace the blob under key. Returns false on failure.
    virtual bool write(const std::string& key, const std::string& value) = 0;

    // Remove every key. Returns false on failure.
    virtual bool erase() = 0;
};

/// KeyValueStore backed by a single SQLite table.
///
/// WAL mode, with SQLITE_BUSY retries on every statement. Safe to share
/// across threads; statement use is serialized by an internal mutex.
class SqliteKvStore : public KeyValueStore {
public:
    /// Opens (creating if needed) the database at db_path.
    /// Throws std::runtime_error if the database cannot be opened.
    explicit SqliteKvStore(const std::filesystem::path& db_path);
    ~SqliteKvStore() override;

    SqliteKvStore(const SqliteKvStore&) = delete;
    SqliteKvStore& operator=(const SqliteKvStore&) = delete;

    std::string type_name() const override { return "sqlite"; }

    std::optional<std::string> read(const std::string& key) override;
    bool write(const std::string& key, const std::string& value) override;
    bool erase() override;

    const std::filesystem::path& path() const { return db_path_; }

private:
    std::filesystem::path db_path_;

    std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_read_ = nullptr;
    sqlite3_stmt* stmt_write_ = nullptr;
    sqlite3_stmt* stmt_erase_ = nullptr;
};

}  // namespace voicecache
