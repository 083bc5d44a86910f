#pragma once

#include "voicecache/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voicecache {

/// Settings for the libcurl-backed network fetcher.
struct FetcherConfig {
    std::chrono::seconds connect_timeout{15};

    // Abort a transfer that stays below 1 byte/s for this long (0 = never).
    std::chrono::seconds low_speed_time{30};

    std::string user_agent = "voice-cache/1.0";
    bool verify_ssl = true;
    std::string ca_cert_path;

    // Refuse bodies larger than this (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the voice cache engine and the voice-cache CLI.
struct CacheConfig {
    // Directory holding one file per cached id
    std::filesystem::path cache_dir;

    // Metadata database location. Default: <cache_dir>/.voicecache/
    std::filesystem::path state_dir;

    // Fixed extension appended to every cached file
    std::string file_extension = ".m4a";

    // Storage quota
    uint64_t max_cache_bytes = 100ULL * 1024 * 1024;  // 100 MB
    size_t max_cached_files = 50;
    double eviction_fraction = 0.2;                    // share of candidates dropped per batch

    // Transfers
    size_t max_concurrent_downloads = 3;
    int max_attempts = 3;
    // Indexed by failed attempt; the 10s entry is only reached with max_attempts > 3
    std::vector<std::chrono::milliseconds> retry_delays{
        std::chrono::seconds(2), std::chrono::seconds(5), std::chrono::seconds(10)};
    std::chrono::milliseconds wait_timeout = std::chrono::minutes(2);  // per-task deadline
    Priority default_priority = Priority::Normal;

    // Re-hash every cached file during load() and drop mismatches
    bool verify_checksums = false;

    FetcherConfig fetcher;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;
    size_t stats_interval_secs = 60;  // 0 disables the stats reporter

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Positional arguments left over after option parsing (CLI command)
    std::vector<std::string> command;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<CacheConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (state_dir) based on cache_dir.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace voicecache
