#pragma once

#include "voicecache/kv_store.hpp"
#include "voicecache/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace voicecache {

/// Key under which the whole cache table is persisted.
constexpr const char* METADATA_KEY = "cache_metadata";

/// In-memory mirror of the persisted cache table; the single source of
/// truth for "is X cached".
///
/// Every mutation rewrites the whole table through the KeyValueStore
/// (write-through). Not internally synchronized: VoiceCache serializes all
/// access under its state mutex.
class CacheIndex {
public:
    struct LoadReport {
        size_t loaded = 0;            // entries kept after reconciliation
        size_t dropped_missing = 0;   // entry whose file is gone
        size_t dropped_corrupt = 0;   // size or checksum mismatch
        size_t orphans_deleted = 0;   // file with no entry
    };

    CacheIndex(KeyValueStore& store, std::filesystem::path cache_dir, std::string file_extension);

    CacheIndex(const CacheIndex&) = delete;
    CacheIndex& operator=(const CacheIndex&) = delete;

    /// Read the persisted table and reconcile it against the cache directory.
    /// Creates the cache and incoming directories if needed.
    LoadReport load(bool verify_checksums = false);

    bool is_cached(const std::string& id) const;
    std::optional<std::filesystem::path> get_path(const std::string& id) const;
    const CacheEntry* find(const std::string& id) const;

    /// True if the entry's file still exists with the recorded size.
    bool verify(const std::string& id) const;

    /// Update last_accessed_at to now. Returns false for unknown ids.
    bool touch(const std::string& id);

    /// Insert or replace an entry. The file must already be at local_path.
    bool commit(CacheEntry entry);

    /// Delete the backing file, then the entry. No-op for unknown ids.
    bool remove(const std::string& id);

    /// Delete every cached file and erase the store. Returns files removed.
    size_t clear();

    uint64_t total_bytes() const { return total_bytes_; }
    size_t size() const { return entries_.size(); }

    /// Snapshot of all entries (unordered).
    std::vector<CacheEntry> entries() const;

    /// Final location for an id: <cache_dir>/<encoded id><extension>.
    std::filesystem::path path_for(const std::string& id) const;

    /// Staging directory for in-flight transfers, on the cache filesystem so
    /// the final rename is atomic.
    std::filesystem::path incoming_dir() const { return cache_dir_ / ".incoming"; }

    const std::filesystem::path& cache_dir() const { return cache_dir_; }

    /// Percent-encode an opaque id into a safe file name component.
    static std::string encode_file_name(const std::string& id);

    /// JSON document <-> table. parse() returns empty optional on malformed input.
    static std::string serialize(const std::unordered_map<std::string, CacheEntry>& entries);
    static std::optional<std::unordered_map<std::string, CacheEntry>> parse(const std::string& blob);

private:
    bool persist();
    size_t delete_orphans();

    KeyValueStore& store_;
    std::filesystem::path cache_dir_;
    std::string file_extension_;

    std::unordered_map<std::string, CacheEntry> entries_;
    uint64_t total_bytes_ = 0;
};

/// Hex SHA-256 of a file's contents; empty string if the file cannot be read.
std::string sha256_file(const std::filesystem::path& path);

}  // namespace voicecache
