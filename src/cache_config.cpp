#include "voicecache/cache_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace voicecache {

// --- FetcherConfig ---

std::string FetcherConfig::validate() const {
    if (connect_timeout.count() <= 0) return "connect_timeout must be > 0";
    if (!ca_cert_path.empty() && !std::filesystem::exists(ca_cert_path))
        return "ca certificate does not exist: " + ca_cert_path;
    return {};
}

// --- CacheConfig ---

namespace {

// Parse "2000,5000,10000" into a delay table. Returns false on a bad token.
bool parse_delay_list(const std::string& value, std::vector<std::chrono::milliseconds>& out) {
    std::vector<std::chrono::milliseconds> delays;
    std::stringstream ss(value);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (token.empty()) return false;
        try {
            delays.emplace_back(std::stoll(token));
        } catch (const std::exception&) {
            return false;
        }
    }
    if (delays.empty()) return false;
    out = std::move(delays);
    return true;
}

void print_usage() {
    std::cerr <<
        "Usage: voice-cache --cache-dir <path> [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  get <id> <url> [<id> <url> ...]  Return a local path for each id, downloading as needed\n"
        "  list                             List cached entries (least recently used first)\n"
        "  size                             Print cache size and file count\n"
        "  clear                            Delete every cached file and its metadata\n"
        "\n"
        "Required:\n"
        "  --cache-dir <path>               Directory holding cached audio files\n"
        "\n"
        "Cache options:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               Metadata directory (default: <cache-dir>/.voicecache/)\n"
        "  --extension <ext>                Cached file extension (default: .m4a)\n"
        "  --max-cache-mb <N>               Max cache size in MB (default: 100)\n"
        "  --max-cache-bytes <N>            Max cache size in bytes\n"
        "  --max-files <N>                  Max cached files (default: 50)\n"
        "  --verify-checksums               Re-hash cached files on startup\n"
        "\n"
        "Transfer options:\n"
        "  --concurrency <N>                Max concurrent downloads (default: 3)\n"
        "  --max-attempts <N>               Attempts before a download fails (default: 3)\n"
        "  --retry-delays-ms <a,b,c>        Backoff table in ms (default: 2000,5000,10000)\n"
        "  --wait-timeout <secs>            Caller wait ceiling (default: 120)\n"
        "  --priority <high|normal|low>     Priority for 'get' (default: normal)\n"
        "  --connect-timeout <secs>         Connect timeout (default: 15)\n"
        "  --low-speed-time <secs>          Abort stalled transfers after N secs (default: 30)\n"
        "  --user-agent <string>            HTTP User-Agent\n"
        "  --ca-cert <path>                 CA certificate bundle\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --max-file-bytes <N>             Reject downloads larger than N bytes\n"
        "\n"
        "Logging and metrics:\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --stats-interval <secs>          Stats reporting interval (default: 60, 0 = off)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<CacheConfig> CacheConfig::from_args(int argc, char* argv[]) {
    CacheConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--cache-dir") {
                auto* v = next_arg(i, "--cache-dir");
                if (!v) return std::nullopt;
                config.cache_dir = v;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--extension") {
                auto* v = next_arg(i, "--extension");
                if (!v) return std::nullopt;
                config.file_extension = v;
            } else if (arg == "--max-cache-mb") {
                auto* v = next_arg(i, "--max-cache-mb");
                if (!v) return std::nullopt;
                config.max_cache_bytes = std::stoull(v) * 1024ULL * 1024;
            } else if (arg == "--max-cache-bytes") {
                auto* v = next_arg(i, "--max-cache-bytes");
                if (!v) return std::nullopt;
                config.max_cache_bytes = std::stoull(v);
            } else if (arg == "--max-files") {
                auto* v = next_arg(i, "--max-files");
                if (!v) return std::nullopt;
                config.max_cached_files = std::stoull(v);
            } else if (arg == "--verify-checksums") {
                config.verify_checksums = true;
            } else if (arg == "--concurrency") {
                auto* v = next_arg(i, "--concurrency");
                if (!v) return std::nullopt;
                config.max_concurrent_downloads = std::stoull(v);
            } else if (arg == "--max-attempts") {
                auto* v = next_arg(i, "--max-attempts");
                if (!v) return std::nullopt;
                config.max_attempts = std::stoi(v);
            } else if (arg == "--retry-delays-ms") {
                auto* v = next_arg(i, "--retry-delays-ms");
                if (!v) return std::nullopt;
                if (!parse_delay_list(v, config.retry_delays)) {
                    std::cerr << "Error: invalid --retry-delays-ms: " << v << "\n";
                    return std::nullopt;
                }
            } else if (arg == "--wait-timeout") {
                auto* v = next_arg(i, "--wait-timeout");
                if (!v) return std::nullopt;
                config.wait_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--priority") {
                auto* v = next_arg(i, "--priority");
                if (!v) return std::nullopt;
                auto p = parse_priority(v);
                if (!p) {
                    std::cerr << "Error: unknown priority: " << v << "\n";
                    return std::nullopt;
                }
                config.default_priority = *p;
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.fetcher.connect_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--low-speed-time") {
                auto* v = next_arg(i, "--low-speed-time");
                if (!v) return std::nullopt;
                config.fetcher.low_speed_time = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--user-agent") {
                auto* v = next_arg(i, "--user-agent");
                if (!v) return std::nullopt;
                config.fetcher.user_agent = v;
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.fetcher.ca_cert_path = v;
            } else if (arg == "--no-verify-ssl") {
                config.fetcher.verify_ssl = false;
            } else if (arg == "--max-file-bytes") {
                auto* v = next_arg(i, "--max-file-bytes");
                if (!v) return std::nullopt;
                config.fetcher.max_file_bytes = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else {
                config.command.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool CacheConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("cache_dir")) cache_dir = j["cache_dir"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("file_extension")) file_extension = j["file_extension"].get<std::string>();
        if (j.contains("max_cache_mb"))
            max_cache_bytes = j["max_cache_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("max_cache_bytes")) max_cache_bytes = j["max_cache_bytes"].get<uint64_t>();
        if (j.contains("max_cached_files")) max_cached_files = j["max_cached_files"].get<size_t>();
        if (j.contains("eviction_fraction")) eviction_fraction = j["eviction_fraction"].get<double>();
        if (j.contains("max_concurrent_downloads"))
            max_concurrent_downloads = j["max_concurrent_downloads"].get<size_t>();
        if (j.contains("max_attempts")) max_attempts = j["max_attempts"].get<int>();
        if (j.contains("retry_delays_ms") && j["retry_delays_ms"].is_array()) {
            retry_delays.clear();
            for (auto& d : j["retry_delays_ms"]) {
                retry_delays.emplace_back(d.get<int64_t>());
            }
        }
        if (j.contains("wait_timeout_secs"))
            wait_timeout = std::chrono::seconds(j["wait_timeout_secs"].get<int64_t>());
        if (j.contains("default_priority")) {
            auto p = parse_priority(j["default_priority"].get<std::string>());
            if (!p) {
                std::cerr << "Error: unknown default_priority in " << path << "\n";
                return false;
            }
            default_priority = *p;
        }
        if (j.contains("verify_checksums")) verify_checksums = j["verify_checksums"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("fetcher") && j["fetcher"].is_object()) {
            auto& jf = j["fetcher"];
            if (jf.contains("connect_timeout_secs"))
                fetcher.connect_timeout = std::chrono::seconds(jf["connect_timeout_secs"].get<int64_t>());
            if (jf.contains("low_speed_time_secs"))
                fetcher.low_speed_time = std::chrono::seconds(jf["low_speed_time_secs"].get<int64_t>());
            if (jf.contains("user_agent")) fetcher.user_agent = jf["user_agent"].get<std::string>();
            if (jf.contains("verify_ssl")) fetcher.verify_ssl = jf["verify_ssl"].get<bool>();
            if (jf.contains("ca_cert_path")) fetcher.ca_cert_path = jf["ca_cert_path"].get<std::string>();
            if (jf.contains("max_file_bytes")) fetcher.max_file_bytes = jf["max_file_bytes"].get<uint64_t>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CacheConfig::apply_defaults() {
    if (state_dir.empty() && !cache_dir.empty()) {
        state_dir = cache_dir / ".voicecache";
    }
    if (!file_extension.empty() && file_extension.front() != '.') {
        file_extension.insert(file_extension.begin(), '.');
    }
}

std::string CacheConfig::validate() const {
    if (cache_dir.empty()) return "cache_dir is required (--cache-dir)";
    if (std::filesystem::exists(cache_dir) && !std::filesystem::is_directory(cache_dir))
        return "cache_dir is not a directory: " + cache_dir.string();
    if (state_dir.empty()) return "state_dir is empty (call apply_defaults)";
    // Orphan cleanup deletes every unreferenced top-level file in cache_dir
    if (state_dir.lexically_normal() == cache_dir.lexically_normal())
        return "state_dir must differ from cache_dir";
    if (max_cache_bytes == 0) return "max_cache_bytes must be > 0";
    if (max_cached_files == 0) return "max_cached_files must be > 0";
    if (eviction_fraction <= 0.0 || eviction_fraction > 1.0)
        return "eviction_fraction must be in (0, 1]";
    if (max_concurrent_downloads == 0) return "max_concurrent_downloads must be > 0";
    if (max_attempts < 1) return "max_attempts must be >= 1";
    if (retry_delays.empty()) return "retry_delays must not be empty";
    for (auto& d : retry_delays) {
        if (d.count() < 0) return "retry delays must be >= 0";
    }
    if (wait_timeout.count() <= 0) return "wait_timeout must be > 0";
    auto err = fetcher.validate();
    if (!err.empty()) return "fetcher: " + err;
    return {};
}

}  // namespace voicecache
