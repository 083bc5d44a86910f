#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace voicecache {

class VoiceCache;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports voice cache metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointer for gauge snapshots.
    void set_cache(const VoiceCache* cache) { cache_ = cache; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Refresh gauges and write the .prom file now.
    void flush();

    // --- Counter accessors ---
    prometheus::Counter& requests_hit() { return *requests_hit_; }
    prometheus::Counter& requests_miss() { return *requests_miss_; }
    prometheus::Counter& requests_coalesced() { return *requests_coalesced_; }
    prometheus::Counter& transfers_completed() { return *transfers_completed_; }
    prometheus::Counter& transfers_failed() { return *transfers_failed_; }
    prometheus::Counter& transfers_cancelled() { return *transfers_cancelled_; }
    prometheus::Counter& transfer_bytes_total() { return *transfer_bytes_total_; }
    prometheus::Counter& retries_total() { return *retries_total_; }
    prometheus::Counter& evictions_total() { return *evictions_total_; }
    prometheus::Counter& eviction_bytes_total() { return *eviction_bytes_total_; }
    prometheus::Counter& wait_timeouts_total() { return *wait_timeouts_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& transfer_duration() { return *transfer_duration_; }
    prometheus::Histogram& wait_duration() { return *wait_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointer for gauge snapshots (not owned)
    const VoiceCache* cache_ = nullptr;

    // --- Counters ---
    prometheus::Counter* requests_hit_;
    prometheus::Counter* requests_miss_;
    prometheus::Counter* requests_coalesced_;
    prometheus::Counter* transfers_completed_;
    prometheus::Counter* transfers_failed_;
    prometheus::Counter* transfers_cancelled_;
    prometheus::Counter* transfer_bytes_total_;
    prometheus::Counter* retries_total_;
    prometheus::Counter* evictions_total_;
    prometheus::Counter* eviction_bytes_total_;
    prometheus::Counter* wait_timeouts_total_;

    // --- Gauges ---
    prometheus::Gauge* cache_bytes_;
    prometheus::Gauge* cache_max_bytes_;
    prometheus::Gauge* cache_files_;
    prometheus::Gauge* cache_max_files_;
    prometheus::Gauge* queue_pending_;
    prometheus::Gauge* transfers_active_;
    prometheus::Gauge* retries_pending_;

    // --- Histograms ---
    prometheus::Histogram* transfer_duration_;
    prometheus::Histogram* wait_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;

    std::mutex write_mutex_;  // Serializes write_file between flush() and the writer
};

}  // namespace voicecache
