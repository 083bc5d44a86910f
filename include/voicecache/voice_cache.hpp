#pragma once

#include "voicecache/cache_config.hpp"
#include "voicecache/eviction_policy.hpp"
#include "voicecache/fetcher.hpp"
#include "voicecache/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace voicecache {

class CacheIndex;
class DownloadQueue;
class KeyValueStore;
class MetricsExporter;
class RetryScheduler;
class WorkerPool;

/// One entry of a prefetch batch.
struct PrefetchRequest {
    std::string id;
    std::string url;
    Priority priority = Priority::Low;
};

/// Snapshot pushed to progress subscribers. The last event for a task has
/// closed=true and carries its terminal status.
struct ProgressEvent {
    std::string id;
    uint64_t bytes_received = 0;
    uint64_t bytes_total = 0;  // 0 if the server did not announce a length
    double fraction = 0.0;     // 0..1, 1 once completed
    TaskStatus status = TaskStatus::Queued;
    bool closed = false;
};

using ProgressListener = std::function<void(const ProgressEvent&)>;

/// Client-side cache of remote voice recordings.
///
/// Callers ask for an id and get back a local path, either straight from the
/// cache or after a download. Downloads go through a priority queue and a
/// bounded worker pool driven by a single dispatcher thread; concurrent
/// requests for the same id share one transfer. Failed transfers are retried
/// on a fixed backoff table. After every commit the cache is trimmed back
/// under its byte and file quotas by LRU eviction, never touching entries
/// whose transfer is still in flight.
///
/// Cache directory and metadata are only mutated under state_mutex_.
class VoiceCache {
public:
    struct Stats {
        uint64_t cache_bytes = 0;
        uint64_t cached_files = 0;
        uint64_t queued_tasks = 0;
        uint64_t active_transfers = 0;
        uint64_t pending_retries = 0;
        uint64_t cache_hits = 0;
        uint64_t cache_misses = 0;
        uint64_t coalesced_requests = 0;
        uint64_t transfers_started = 0;
        uint64_t transfers_completed = 0;
        uint64_t transfers_failed = 0;
        uint64_t retries_scheduled = 0;
        uint64_t cancellations = 0;
        uint64_t evictions_performed = 0;
        uint64_t bytes_downloaded = 0;
        uint64_t wait_timeouts = 0;
    };

    /// @param fetcher  Network capability; a CurlFetcher built from
    ///                 config.fetcher when null.
    /// @param store    Metadata store; <state_dir>/metadata.db when null.
    explicit VoiceCache(const CacheConfig& config,
                        std::shared_ptr<Fetcher> fetcher = nullptr,
                        std::unique_ptr<KeyValueStore> store = nullptr);
    ~VoiceCache();

    VoiceCache(const VoiceCache&) = delete;
    VoiceCache& operator=(const VoiceCache&) = delete;

    /// Open the metadata store, reconcile the cache directory and start the
    /// dispatcher. Returns error message on failure, empty string on success.
    std::string open();

    /// Cancel in-flight transfers, drop pending work and stop all threads.
    /// Every outstanding request resolves as cancelled.
    void close();

    bool is_open() const { return running_.load(); }

    // --- Requests ---

    /// Return a local path for id, downloading url if needed. Blocks until the
    /// task reaches a terminal state. Every task carries a wait_timeout
    /// deadline from its creation, so a stalled transfer is cancelled and the
    /// call returns a failure no later than that.
    FileResult get_file(const std::string& id, const std::string& url,
                        std::optional<Priority> priority = std::nullopt);

    /// Non-blocking form of get_file(). The future resolves when the task
    /// reaches a terminal state, at the latest when its wait_timeout deadline
    /// cancels it.
    std::shared_future<FileResult> request_file(const std::string& id, const std::string& url,
                                                Priority priority);

    /// Queue many downloads without waiting. Returns the number of new tasks
    /// created (cached and already pending ids are skipped).
    size_t prefetch(const std::vector<PrefetchRequest>& requests);

    /// Import a local file (e.g. a recording just made on this device) as the
    /// cached copy of id. Fails while a transfer for id is pending.
    bool pre_cache_local_file(const std::string& id, const std::filesystem::path& local_file,
                              const std::string& url);

    /// Cancel the pending or in-flight task for id. Returns false if there is
    /// none.
    bool cancel(const std::string& id);

    // --- Cache queries ---

    bool is_cached(const std::string& id) const;
    std::optional<std::filesystem::path> cached_path(const std::string& id) const;
    uint64_t cache_size_bytes() const;
    size_t cached_file_count() const;
    /// Cached entries, least recently used first.
    std::vector<CacheEntry> list_entries() const;

    /// Delete every cached file and all metadata. Transfers in flight are left
    /// running. Returns the number of files removed.
    size_t clear_cache();

    // --- Task state ---

    /// Status of the live task for id, else of its last finished task, else
    /// Completed for cached ids.
    std::optional<TaskStatus> task_status(const std::string& id) const;

    /// Download progress in [0, 1]; 1 for cached ids.
    double progress(const std::string& id) const;

    /// Register a listener for id's progress. Returns a token for
    /// unsubscribe(), or 0 when no task is live, in which case the listener
    /// has already received a single closed event.
    uint64_t subscribe(const std::string& id, ProgressListener listener);
    void unsubscribe(uint64_t token);

    // --- Statistics ---

    Stats get_stats() const;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    const CacheConfig& config() const { return config_; }

private:
    struct TaskRecord {
        DownloadTask task;
        std::shared_ptr<CancelToken> token;
        std::promise<FileResult> promise;
        std::shared_future<FileResult> future;
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> bytes_total{0};
        std::string cancel_reason;  // reported when an in-flight cancel lands
        bool finished = false;
    };
    using TaskPtr = std::shared_ptr<TaskRecord>;

    struct Subscription {
        std::string id;
        ProgressListener listener;
    };

    std::shared_future<FileResult> submit(const std::string& id, const std::string& url,
                                          Priority priority, bool* created);

    void dispatcher_loop();
    void run_transfer(const TaskPtr& rec);
    void requeue(const std::string& id);

    // Cancel rec if it is still the live task for its id. Caller holds lock;
    // it is released before the closed event is published.
    bool cancel_locked(const TaskPtr& rec, std::unique_lock<std::mutex>& lock,
                       const std::string& reason);

    // Deadline timer callback: cancel the task if it is still live.
    void expire(const std::weak_ptr<TaskRecord>& weak);

    // Resolve the task's waiters. Caller holds state_mutex_ and must publish
    // the returned event after releasing it.
    ProgressEvent finish_locked(const TaskPtr& rec, FileResult result);

    // Bring the cache back under quota. Caller holds state_mutex_.
    void enforce_quota_locked();

    std::unordered_set<std::string> active_ids_locked() const;
    static ProgressEvent snapshot(const TaskRecord& rec, TaskStatus status);
    void publish(const ProgressEvent& event);

    void stats_reporter_loop();

    static std::shared_future<FileResult> make_ready(FileResult result);

    // Config
    CacheConfig config_;
    EvictionPolicy eviction_;

    // Collaborators
    std::shared_ptr<Fetcher> fetcher_;
    std::unique_ptr<KeyValueStore> store_;
    std::unique_ptr<CacheIndex> index_;
    std::unique_ptr<DownloadQueue> queue_;
    std::unique_ptr<RetryScheduler> retries_;
    std::unique_ptr<RetryScheduler> deadlines_;  // per-task wait_timeout
    std::unique_ptr<WorkerPool> pool_;
    MetricsExporter* metrics_ = nullptr;

    // Task state, guarded by state_mutex_
    mutable std::mutex state_mutex_;
    std::condition_variable dispatch_cv_;
    std::unordered_map<std::string, TaskPtr> tasks_;  // non-terminal tasks
    std::unordered_map<std::string, std::shared_ptr<CancelToken>> active_;  // Active Transfer Set
    std::unordered_map<std::string, TaskStatus> last_status_;
    Stats stats_;

    // Progress subscribers
    std::mutex subs_mutex_;
    std::unordered_map<uint64_t, Subscription> subscriptions_;
    uint64_t next_subscription_ = 0;

    // Threads
    std::atomic<bool> running_{false};
    std::thread dispatcher_thread_;
    std::thread stats_thread_;
    std::mutex stats_cv_mutex_;
    std::condition_variable stats_cv_;
};

}  // namespace voicecache
