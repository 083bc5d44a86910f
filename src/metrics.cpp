#include "voicecache/metrics.hpp"
#include "voicecache/voice_cache.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace voicecache {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& requests_family = prometheus::BuildCounter()
        .Name("voicecache_requests_total")
        .Help("File requests by how they were served")
        .Labels(labels)
        .Register(*registry_);
    requests_hit_ = &requests_family.Add({{"result", "hit"}});
    requests_miss_ = &requests_family.Add({{"result", "miss"}});
    requests_coalesced_ = &requests_family.Add({{"result", "coalesced"}});

    auto& transfers_family = prometheus::BuildCounter()
        .Name("voicecache_transfers_total")
        .Help("Download tasks that reached a terminal state")
        .Labels(labels)
        .Register(*registry_);
    transfers_completed_ = &transfers_family.Add({{"result", "completed"}});
    transfers_failed_ = &transfers_family.Add({{"result", "failed"}});
    transfers_cancelled_ = &transfers_family.Add({{"result", "cancelled"}});

    transfer_bytes_total_ = &prometheus::BuildCounter()
        .Name("voicecache_transfer_bytes_total")
        .Help("Total bytes committed to the cache from downloads")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    retries_total_ = &prometheus::BuildCounter()
        .Name("voicecache_retries_total")
        .Help("Total retries scheduled after a failed attempt")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    evictions_total_ = &prometheus::BuildCounter()
        .Name("voicecache_evictions_total")
        .Help("Total files evicted")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    eviction_bytes_total_ = &prometheus::BuildCounter()
        .Name("voicecache_eviction_bytes_total")
        .Help("Total bytes evicted")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    wait_timeouts_total_ = &prometheus::BuildCounter()
        .Name("voicecache_wait_timeouts_total")
        .Help("Blocking requests abandoned after the wait timeout")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    cache_bytes_ = &gauge_reg("voicecache_cache_bytes", "Current cache size in bytes");
    cache_max_bytes_ = &gauge_reg("voicecache_cache_max_bytes", "Maximum cache size in bytes");
    cache_files_ = &gauge_reg("voicecache_cache_files", "Files currently cached");
    cache_max_files_ = &gauge_reg("voicecache_cache_max_files", "Maximum number of cached files");
    queue_pending_ = &gauge_reg("voicecache_queue_pending", "Download tasks waiting in the queue");
    transfers_active_ = &gauge_reg("voicecache_transfers_active", "Transfers in flight");
    retries_pending_ = &gauge_reg("voicecache_retries_pending", "Tasks waiting for a retry timer");

    // --- Histograms ---

    transfer_duration_ = &prometheus::BuildHistogram()
        .Name("voicecache_transfer_duration_seconds")
        .Help("Single transfer attempt duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});

    wait_duration_ = &prometheus::BuildHistogram()
        .Name("voicecache_wait_duration_seconds")
        .Help("Time a blocking request waited for its file")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60, 120});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    flush();
}

void MetricsExporter::flush() {
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        flush();
    }
}

void MetricsExporter::update_gauges() {
    if (!cache_) return;

    auto stats = cache_->get_stats();
    cache_bytes_->Set(static_cast<double>(stats.cache_bytes));
    cache_files_->Set(static_cast<double>(stats.cached_files));
    cache_max_bytes_->Set(static_cast<double>(cache_->config().max_cache_bytes));
    cache_max_files_->Set(static_cast<double>(cache_->config().max_cached_files));
    queue_pending_->Set(static_cast<double>(stats.queued_tasks));
    transfers_active_->Set(static_cast<double>(stats.active_transfers));
    retries_pending_->Set(static_cast<double>(stats.pending_retries));
}

void MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace voicecache
