#include "voicecache/cache_config.hpp"
#include "voicecache/log.hpp"
#include "voicecache/metrics.hpp"
#include "voicecache/voice_cache.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

int run_get(voicecache::VoiceCache& cache, const std::vector<std::string>& args,
            voicecache::Priority priority, FILE* out) {
    if (args.size() < 3 || (args.size() - 1) % 2 != 0) {
        std::cerr << "Usage: voice-cache get <id> <url> [<id> <url> ...]\n";
        return 1;
    }

    struct Job {
        std::string id;
        std::string url;
        voicecache::FileResult result;
    };
    std::vector<Job> jobs;
    for (size_t i = 1; i + 1 < args.size(); i += 2) {
        jobs.push_back({args[i], args[i + 1], {}});
    }

    std::atomic<size_t> remaining{jobs.size()};
    std::vector<std::thread> threads;
    threads.reserve(jobs.size());
    for (auto& job : jobs) {
        threads.emplace_back([&cache, &job, &remaining, priority] {
            job.result = cache.get_file(job.id, job.url, priority);
            remaining.fetch_sub(1);
        });
    }

    // Wait until all requests resolve or a shutdown signal arrives;
    // close() resolves whatever is still outstanding as cancelled.
    while (remaining.load() > 0 && !g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_shutdown_requested) {
        voicecache::log_warn("Interrupted, cancelling outstanding downloads");
        cache.close();
    }
    for (auto& t : threads) {
        t.join();
    }

    int rc = 0;
    for (auto& job : jobs) {
        if (job.result.success) {
            std::fprintf(out, "%s\t%s\n", job.id.c_str(), job.result.path.c_str());
        } else {
            std::fprintf(out, "%s\tERROR (%s): %s\n", job.id.c_str(),
                         voicecache::status_to_string(job.result.status),
                         job.result.error_message.c_str());
            rc = 1;
        }
    }
    return rc;
}

int run_list(const voicecache::VoiceCache& cache, FILE* out) {
    for (auto& e : cache.list_entries()) {
        std::fprintf(out, "%s\t%lu\t%lld\t%s\n", e.id.c_str(),
                     static_cast<unsigned long>(e.size_bytes),
                     static_cast<long long>(e.last_accessed_at), e.local_path.c_str());
    }
    return 0;
}

int run_size(const voicecache::VoiceCache& cache, FILE* out) {
    auto& config = cache.config();
    std::fprintf(out, "%zu files, %lu bytes (limits: %zu files, %lu bytes)\n",
                 cache.cached_file_count(), static_cast<unsigned long>(cache.cache_size_bytes()),
                 config.max_cached_files, static_cast<unsigned long>(config.max_cache_bytes));
    return 0;
}

int run_clear(voicecache::VoiceCache& cache, FILE* out) {
    auto removed = cache.clear_cache();
    std::fprintf(out, "Removed %zu files\n", removed);
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = voicecache::CacheConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }
    if (config.command.empty()) {
        std::cerr << "Error: no command given (get, list, size, clear)\n";
        return 1;
    }
    const auto& command = config.command.front();
    if (command != "get" && command != "list" && command != "size" && command != "clear") {
        std::cerr << "Error: unknown command: " << command << "\n";
        return 1;
    }

    voicecache::set_verbose(config.verbose);

    // Command results always go to the original stdout
    FILE* out = stdout;

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            int saved = dup(STDOUT_FILENO);
            FILE* saved_out = saved >= 0 ? fdopen(saved, "w") : nullptr;
            if (saved_out) out = saved_out;
            std::fflush(stdout);
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            std::cerr << "Warning: cannot open log file " << config.log_file << "\n";
        }
    }

    voicecache::log_debug("voice-cache %s", command.c_str());
    voicecache::log_debug("  cache-dir: %s", config.cache_dir.c_str());
    voicecache::log_debug("  state-dir: %s", config.state_dir.c_str());
    voicecache::log_debug("  max-cache: %lu bytes / %zu files",
                          static_cast<unsigned long>(config.max_cache_bytes), config.max_cached_files);
    voicecache::log_debug("  concurrency: %zu, attempts: %d", config.max_concurrent_downloads,
                          config.max_attempts);

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    voicecache::VoiceCache cache(config);

    std::unique_ptr<voicecache::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        std::map<std::string, std::string> labels = {
            {"cache_dir", config.cache_dir.string()},
        };
        metrics = std::make_unique<voicecache::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs), labels);
        metrics->set_cache(&cache);
        cache.set_metrics(metrics.get());
    }

    err = cache.open();
    if (!err.empty()) {
        voicecache::log_error("Failed to open cache: %s", err.c_str());
        return 1;
    }
    if (metrics) metrics->start();

    int rc = 0;
    if (command == "get") {
        rc = run_get(cache, config.command, config.default_priority, out);
    } else if (command == "list") {
        rc = run_list(cache, out);
    } else if (command == "size") {
        rc = run_size(cache, out);
    } else {
        rc = run_clear(cache, out);
    }
    std::fflush(out);

    cache.close();
    if (metrics) {
        metrics->stop();
        cache.set_metrics(nullptr);
    }
    return rc;
}
