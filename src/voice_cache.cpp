#include "voicecache/voice_cache.hpp"
#include "voicecache/cache_index.hpp"
#include "voicecache/download_queue.hpp"
#include "voicecache/kv_store.hpp"
#include "voicecache/log.hpp"
#include "voicecache/metrics.hpp"
#include "voicecache/retry_scheduler.hpp"
#include "voicecache/worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

namespace voicecache {

namespace {

FileResult failure(TaskStatus status, std::string message) {
    FileResult r;
    r.success = false;
    r.status = status;
    r.error_message = std::move(message);
    return r;
}

}  // namespace

VoiceCache::VoiceCache(const CacheConfig& config,
                       std::shared_ptr<Fetcher> fetcher,
                       std::unique_ptr<KeyValueStore> store)
    : config_(config)
    , eviction_(config.max_cache_bytes, config.max_cached_files, config.eviction_fraction)
    , fetcher_(std::move(fetcher))
    , store_(std::move(store)) {
    config_.apply_defaults();
    if (!fetcher_) {
        fetcher_ = std::make_shared<CurlFetcher>(config_.fetcher);
    }
}

VoiceCache::~VoiceCache() {
    close();
}

// --- Lifecycle ---

std::string VoiceCache::open() {
    if (running_.load()) return "cache is already open";

    auto err = config_.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    std::filesystem::create_directories(config_.state_dir, ec);
    if (ec) {
        return "Cannot create state dir " + config_.state_dir.string() + ": " + ec.message();
    }

    if (!store_) {
        try {
            store_ = std::make_unique<SqliteKvStore>(config_.state_dir / "metadata.db");
        } catch (const std::exception& e) {
            return std::string("Failed to open metadata store: ") + e.what();
        }
    }

    {
        std::lock_guard lock(state_mutex_);
        index_ = std::make_unique<CacheIndex>(*store_, config_.cache_dir, config_.file_extension);
        try {
            index_->load(config_.verify_checksums);
        } catch (const std::exception& e) {
            return std::string("Failed to load cache index: ") + e.what();
        }
        queue_ = std::make_unique<DownloadQueue>(*index_);
        tasks_.clear();
        active_.clear();

        // Quotas may have shrunk since the previous run
        enforce_quota_locked();
    }

    retries_ = std::make_unique<RetryScheduler>(config_.retry_delays);
    retries_->start();
    deadlines_ = std::make_unique<RetryScheduler>(
        std::vector<std::chrono::milliseconds>{config_.wait_timeout});
    deadlines_->start();
    pool_ = std::make_unique<WorkerPool>(config_.max_concurrent_downloads);

    running_ = true;
    dispatcher_thread_ = std::thread(&VoiceCache::dispatcher_loop, this);
    if (config_.stats_interval_secs > 0) {
        stats_thread_ = std::thread(&VoiceCache::stats_reporter_loop, this);
    }

    log_info("Voice cache open: %s (%s fetcher, %s store, %zu workers, max %lu MB / %zu files)",
             config_.cache_dir.c_str(), fetcher_->type_name().c_str(), store_->type_name().c_str(),
             config_.max_concurrent_downloads,
             static_cast<unsigned long>(config_.max_cache_bytes / (1024 * 1024)),
             config_.max_cached_files);
    return {};
}

void VoiceCache::close() {
    if (!running_.exchange(false)) return;

    log_info("Shutting down voice cache...");

    // Wake the dispatcher and the stats reporter
    { std::lock_guard lock(state_mutex_); }
    dispatch_cv_.notify_all();
    { std::lock_guard lock(stats_cv_mutex_); }
    stats_cv_.notify_all();

    if (dispatcher_thread_.joinable()) dispatcher_thread_.join();
    if (stats_thread_.joinable()) stats_thread_.join();

    // Pending retries and deadlines never fire after this
    retries_->shutdown();
    deadlines_->shutdown();

    {
        std::lock_guard lock(state_mutex_);
        for (auto& [id, token] : active_) {
            token->cancel();
        }
    }

    // Workers see the cancelled tokens and resolve their own tasks
    pool_->shutdown();

    std::vector<ProgressEvent> closed;
    {
        std::lock_guard lock(state_mutex_);
        queue_->drain();
        std::vector<TaskPtr> leftover;
        leftover.reserve(tasks_.size());
        for (auto& [id, rec] : tasks_) {
            leftover.push_back(rec);
        }
        for (auto& rec : leftover) {
            closed.push_back(finish_locked(rec, failure(TaskStatus::Cancelled, "cache closed")));
        }
    }
    for (auto& event : closed) {
        publish(event);
    }

    auto s = get_stats();
    log_info("Voice cache closed: %lu files, %lu bytes, %lu transfers completed, %lu failed",
             static_cast<unsigned long>(s.cached_files), static_cast<unsigned long>(s.cache_bytes),
             static_cast<unsigned long>(s.transfers_completed),
             static_cast<unsigned long>(s.transfers_failed));
}

// --- Requests ---

std::shared_future<FileResult> VoiceCache::make_ready(FileResult result) {
    std::promise<FileResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

std::shared_future<FileResult> VoiceCache::submit(const std::string& id, const std::string& url,
                                                  Priority priority, bool* created) {
    if (created) *created = false;
    if (id.empty()) return make_ready(failure(TaskStatus::Failed, "empty id"));

    std::unique_lock lock(state_mutex_);
    if (!running_.load()) return make_ready(failure(TaskStatus::Failed, "cache is not open"));

    if (index_->is_cached(id)) {
        if (index_->verify(id)) {
            index_->touch(id);
            ++stats_.cache_hits;
            if (metrics_) metrics_->requests_hit().Increment();

            FileResult r;
            r.success = true;
            r.status = TaskStatus::Completed;
            r.path = *index_->get_path(id);
            return make_ready(std::move(r));
        }
        log_warn("Cached file for %s is missing or truncated, fetching again", id.c_str());
        index_->remove(id);
    }

    auto it = tasks_.find(id);
    if (it != tasks_.end()) {
        ++stats_.coalesced_requests;
        if (metrics_) metrics_->requests_coalesced().Increment();
        log_debug("Joining pending download of %s", id.c_str());
        return it->second->future;
    }

    if (url.empty()) return make_ready(failure(TaskStatus::Failed, "no source url for " + id));

    ++stats_.cache_misses;
    if (metrics_) metrics_->requests_miss().Increment();

    auto rec = std::make_shared<TaskRecord>();
    rec->task.id = id;
    rec->task.source_url = url;
    rec->task.priority = priority;
    rec->task.status = TaskStatus::Queued;
    rec->future = rec->promise.get_future().share();

    if (!queue_->enqueue(rec->task)) {
        return make_ready(failure(TaskStatus::Failed, "could not queue " + id));
    }
    tasks_[id] = rec;
    last_status_.erase(id);
    if (created) *created = true;

    // Bounds every waiter, blocking or not, on a stalled transfer
    deadlines_->schedule(id, config_.wait_timeout,
                         [this, weak = std::weak_ptr<TaskRecord>(rec)] { expire(weak); });

    log_debug("Queued %s (%s priority)", id.c_str(), priority_to_string(priority));
    lock.unlock();
    dispatch_cv_.notify_one();
    return rec->future;
}

std::shared_future<FileResult> VoiceCache::request_file(const std::string& id,
                                                        const std::string& url,
                                                        Priority priority) {
    return submit(id, url, priority, nullptr);
}

FileResult VoiceCache::get_file(const std::string& id, const std::string& url,
                                std::optional<Priority> priority) {
    auto started = std::chrono::steady_clock::now();
    auto future = submit(id, url, priority.value_or(config_.default_priority), nullptr);

    // The task's own deadline resolves it after wait_timeout at the latest
    future.wait();

    if (metrics_) {
        auto elapsed = std::chrono::steady_clock::now() - started;
        metrics_->wait_duration().Observe(std::chrono::duration<double>(elapsed).count());
    }
    return future.get();
}

size_t VoiceCache::prefetch(const std::vector<PrefetchRequest>& requests) {
    size_t queued = 0;
    for (auto& req : requests) {
        bool created = false;
        submit(req.id, req.url, req.priority, &created);
        if (created) ++queued;
    }
    if (queued > 0) {
        log_info("Prefetch: queued %zu of %zu requests", queued, requests.size());
    }
    return queued;
}

bool VoiceCache::pre_cache_local_file(const std::string& id,
                                      const std::filesystem::path& local_file,
                                      const std::string& url) {
    if (id.empty() || !running_.load()) return false;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(local_file, ec)) {
        log_warn("Cannot import %s: %s is not a regular file", id.c_str(), local_file.c_str());
        return false;
    }
    auto size = std::filesystem::file_size(local_file, ec);
    if (ec || size == 0) {
        log_warn("Cannot import %s: %s is empty or unreadable", id.c_str(), local_file.c_str());
        return false;
    }

    // Stage on the cache filesystem so the final rename is atomic
    auto temp = index_->incoming_dir() / (CacheIndex::encode_file_name(id) + ".import");
    std::filesystem::copy_file(local_file, temp,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        log_warn("Cannot import %s: copy failed: %s", id.c_str(), ec.message().c_str());
        std::filesystem::remove(temp, ec);
        return false;
    }
    auto sha = sha256_file(temp);

    std::lock_guard lock(state_mutex_);
    if (tasks_.count(id)) {
        log_warn("Not importing %s: a download for it is pending", id.c_str());
        std::filesystem::remove(temp, ec);
        return false;
    }

    auto final_path = index_->path_for(id);
    std::filesystem::rename(temp, final_path, ec);
    if (ec) {
        log_warn("Cannot import %s: %s", id.c_str(), ec.message().c_str());
        std::filesystem::remove(temp, ec);
        return false;
    }

    CacheEntry entry;
    entry.id = id;
    entry.source_url = url;
    entry.local_path = final_path;
    entry.size_bytes = size;
    entry.created_at = now_epoch_ms();
    entry.last_accessed_at = entry.created_at;
    entry.sha256 = std::move(sha);
    if (!index_->commit(std::move(entry))) {
        log_warn("Failed to persist metadata for imported %s", id.c_str());
    }
    last_status_[id] = TaskStatus::Completed;

    log_info("Imported %s (%lu bytes)", id.c_str(), static_cast<unsigned long>(size));
    enforce_quota_locked();
    return true;
}

bool VoiceCache::cancel(const std::string& id) {
    std::unique_lock lock(state_mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    return cancel_locked(it->second, lock, "cancelled");
}

bool VoiceCache::cancel_locked(const TaskPtr& rec, std::unique_lock<std::mutex>& lock,
                               const std::string& reason) {
    const std::string id = rec->task.id;
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second != rec) return false;

    switch (rec->task.status) {
    case TaskStatus::Queued:
        queue_->remove(id);
        break;
    case TaskStatus::Retrying:
        retries_->cancel(id);
        break;
    case TaskStatus::Downloading:
        // The worker deletes the partial file and resolves the task
        if (rec->cancel_reason.empty()) rec->cancel_reason = reason;
        rec->token->cancel();
        log_info("Cancelling in-flight download of %s", id.c_str());
        return true;
    default:
        return false;
    }

    log_info("Cancelled %s download of %s", status_to_string(rec->task.status), id.c_str());
    auto event = finish_locked(rec, failure(TaskStatus::Cancelled, reason));
    lock.unlock();
    publish(event);
    return true;
}

void VoiceCache::expire(const std::weak_ptr<TaskRecord>& weak) {
    auto rec = weak.lock();
    if (!rec) return;

    std::unique_lock lock(state_mutex_);
    auto it = tasks_.find(rec->task.id);
    // Finished, or replaced by a newer task for the same id
    if (it == tasks_.end() || it->second != rec) return;
    if (rec->task.status == TaskStatus::Downloading && rec->token->is_cancelled()) return;

    log_warn("Gave up on %s after %lld ms, cancelling", rec->task.id.c_str(),
             static_cast<long long>(config_.wait_timeout.count()));
    ++stats_.wait_timeouts;
    if (metrics_) metrics_->wait_timeouts_total().Increment();
    cancel_locked(rec, lock, "timed out waiting for " + rec->task.id);
}

// --- Dispatch and transfer ---

void VoiceCache::dispatcher_loop() {
    std::unique_lock lock(state_mutex_);
    while (true) {
        dispatch_cv_.wait(lock, [this] {
            return !running_.load() ||
                   (!queue_->empty() && active_.size() < config_.max_concurrent_downloads);
        });
        if (!running_.load()) break;

        auto next = queue_->dequeue_next(active_.size(), config_.max_concurrent_downloads);
        if (!next) continue;

        auto it = tasks_.find(next->id);
        if (it == tasks_.end()) continue;
        auto rec = it->second;

        rec->task.status = TaskStatus::Downloading;
        rec->token = std::make_shared<CancelToken>();
        rec->bytes_received = 0;
        rec->bytes_total = 0;
        active_[rec->task.id] = rec->token;
        ++stats_.transfers_started;

        log_debug("Downloading %s (attempt %d/%d, %zu active)", rec->task.id.c_str(),
                  rec->task.attempts + 1, config_.max_attempts, active_.size());

        ProgressEvent event;
        try {
            pool_->execute([this, rec] { run_transfer(rec); });
            event = snapshot(*rec, TaskStatus::Downloading);
        } catch (const std::exception& e) {
            active_.erase(rec->task.id);
            event = finish_locked(rec, failure(TaskStatus::Failed, e.what()));
        }

        lock.unlock();
        publish(event);
        lock.lock();
    }
}

void VoiceCache::run_transfer(const TaskPtr& rec) {
    // id, url and token are not modified while the task is downloading
    const std::string id = rec->task.id;
    const std::string url = rec->task.source_url;
    auto token = rec->token;
    auto temp = index_->incoming_dir() / (CacheIndex::encode_file_name(id) + ".part");

    FetchResult fr;
    if (token->is_cancelled()) {
        fr.cancelled = true;
    } else {
        std::optional<ScopedTimer> timer;
        if (metrics_) timer.emplace(metrics_->transfer_duration());

        auto on_progress = [this, rec](uint64_t received, uint64_t total) {
            if (received == rec->bytes_received.load() && total == rec->bytes_total.load()) return;
            rec->bytes_received = received;
            rec->bytes_total = total;
            publish(snapshot(*rec, TaskStatus::Downloading));
        };

        try {
            fr = fetcher_->download(url, temp, on_progress, *token);
        } catch (const std::exception& e) {
            fr = FetchResult{};
            fr.error_message = std::string("fetcher error: ") + e.what();
        }
    }

    bool cancelled = fr.cancelled || token->is_cancelled();
    uint64_t size = 0;
    std::string sha;
    if (!cancelled && fr.success) {
        std::error_code ec;
        size = std::filesystem::file_size(temp, ec);
        if (ec) {
            fr.success = false;
            fr.error_message = "downloaded file missing: " + ec.message();
        } else if (size == 0) {
            fr.success = false;
            fr.error_message = "downloaded file is empty";
        } else {
            sha = sha256_file(temp);
        }
    }

    std::error_code ec;
    std::unique_lock lock(state_mutex_);
    ProgressEvent event;

    if (cancelled || token->is_cancelled()) {
        std::filesystem::remove(temp, ec);
        active_.erase(id);
        log_info("Download of %s cancelled", id.c_str());
        event = finish_locked(rec, failure(TaskStatus::Cancelled,
                                           rec->cancel_reason.empty() ? "cancelled"
                                                                      : rec->cancel_reason));
        lock.unlock();
        dispatch_cv_.notify_one();
        publish(event);
        return;
    }

    if (fr.success) {
        auto final_path = index_->path_for(id);
        std::filesystem::rename(temp, final_path, ec);
        if (ec) {
            fr.success = false;
            fr.error_message = "cannot move download into cache: " + ec.message();
        } else {
            CacheEntry entry;
            entry.id = id;
            entry.source_url = url;
            entry.local_path = final_path;
            entry.size_bytes = size;
            entry.created_at = now_epoch_ms();
            entry.last_accessed_at = entry.created_at;
            entry.sha256 = std::move(sha);
            if (!index_->commit(std::move(entry))) {
                log_warn("Failed to persist metadata for %s", id.c_str());
            }
            stats_.bytes_downloaded += size;
            if (metrics_) metrics_->transfer_bytes_total().Increment(static_cast<double>(size));

            // Still in the active set here, so never its own eviction victim
            enforce_quota_locked();
            active_.erase(id);

            rec->bytes_received = size;
            if (rec->bytes_total.load() == 0) rec->bytes_total = size;

            log_info("Downloaded %s (%lu bytes)", id.c_str(), static_cast<unsigned long>(size));

            FileResult r;
            r.success = true;
            r.status = TaskStatus::Completed;
            r.path = final_path;
            event = finish_locked(rec, std::move(r));
            lock.unlock();
            dispatch_cv_.notify_one();
            publish(event);
            return;
        }
    }

    // Failed attempt: the partial file never outlives it
    std::filesystem::remove(temp, ec);
    active_.erase(id);
    rec->task.attempts++;
    rec->bytes_received = 0;
    rec->bytes_total = 0;

    if (!running_.load()) {
        event = finish_locked(rec, failure(TaskStatus::Cancelled, "cache closed"));
    } else if (fr.retryable && rec->task.attempts < config_.max_attempts) {
        auto delay = retries_->delay_for(rec->task.attempts);
        rec->task.status = TaskStatus::Retrying;
        ++stats_.retries_scheduled;
        if (metrics_) metrics_->retries_total().Increment();

        log_warn("Download of %s failed (attempt %d/%d): %s; retrying in %lld ms", id.c_str(),
                 rec->task.attempts, config_.max_attempts, fr.error_message.c_str(),
                 static_cast<long long>(delay.count()));
        retries_->schedule(id, delay, [this, id] { requeue(id); });
        event = snapshot(*rec, TaskStatus::Retrying);
    } else {
        log_error("Download of %s failed after %d attempt(s): %s", id.c_str(), rec->task.attempts,
                  fr.error_message.c_str());
        event = finish_locked(rec, failure(TaskStatus::Failed, fr.error_message));
    }

    lock.unlock();
    dispatch_cv_.notify_one();
    publish(event);
}

void VoiceCache::requeue(const std::string& id) {
    std::unique_lock lock(state_mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second->task.status != TaskStatus::Retrying) return;
    if (!running_.load()) return;
    auto rec = it->second;

    if (!queue_->enqueue(rec->task)) {
        // Imported while waiting for the retry
        ProgressEvent event;
        if (auto path = index_->get_path(id)) {
            FileResult r;
            r.success = true;
            r.status = TaskStatus::Completed;
            r.path = *path;
            event = finish_locked(rec, std::move(r));
        } else {
            event = finish_locked(rec, failure(TaskStatus::Failed, "could not requeue " + id));
        }
        lock.unlock();
        publish(event);
        return;
    }

    rec->task.status = TaskStatus::Queued;
    log_debug("Requeued %s for attempt %d", id.c_str(), rec->task.attempts + 1);
    auto event = snapshot(*rec, TaskStatus::Queued);
    lock.unlock();
    dispatch_cv_.notify_one();
    publish(event);
}

ProgressEvent VoiceCache::finish_locked(const TaskPtr& rec, FileResult result) {
    const std::string& id = rec->task.id;
    if (rec->finished) {
        auto event = snapshot(*rec, rec->task.status);
        event.closed = true;
        return event;
    }
    rec->finished = true;
    rec->task.status = result.status;
    if (deadlines_) deadlines_->cancel(id);

    auto it = tasks_.find(id);
    if (it != tasks_.end() && it->second == rec) {
        tasks_.erase(it);
    }
    last_status_[id] = result.status;

    switch (result.status) {
    case TaskStatus::Completed:
        ++stats_.transfers_completed;
        if (metrics_) metrics_->transfers_completed().Increment();
        break;
    case TaskStatus::Failed:
        ++stats_.transfers_failed;
        if (metrics_) metrics_->transfers_failed().Increment();
        break;
    case TaskStatus::Cancelled:
        ++stats_.cancellations;
        if (metrics_) metrics_->transfers_cancelled().Increment();
        break;
    default:
        break;
    }

    auto event = snapshot(*rec, result.status);
    event.closed = true;
    rec->promise.set_value(std::move(result));
    return event;
}

void VoiceCache::enforce_quota_locked() {
    auto result = eviction_.enforce(*index_, active_ids_locked());
    if (result.evicted_files == 0) return;

    stats_.evictions_performed += result.evicted_files;
    for (auto& id : result.evicted_ids) {
        last_status_.erase(id);
    }
    if (metrics_) {
        metrics_->evictions_total().Increment(static_cast<double>(result.evicted_files));
        metrics_->eviction_bytes_total().Increment(static_cast<double>(result.evicted_bytes));
    }
}

std::unordered_set<std::string> VoiceCache::active_ids_locked() const {
    std::unordered_set<std::string> ids;
    ids.reserve(active_.size());
    for (auto& [id, token] : active_) {
        ids.insert(id);
    }
    return ids;
}

// --- Cache queries ---

bool VoiceCache::is_cached(const std::string& id) const {
    std::lock_guard lock(state_mutex_);
    return index_ && index_->is_cached(id);
}

std::optional<std::filesystem::path> VoiceCache::cached_path(const std::string& id) const {
    std::lock_guard lock(state_mutex_);
    if (!index_ || !index_->verify(id)) return std::nullopt;
    return index_->get_path(id);
}

uint64_t VoiceCache::cache_size_bytes() const {
    std::lock_guard lock(state_mutex_);
    return index_ ? index_->total_bytes() : 0;
}

size_t VoiceCache::cached_file_count() const {
    std::lock_guard lock(state_mutex_);
    return index_ ? index_->size() : 0;
}

std::vector<CacheEntry> VoiceCache::list_entries() const {
    std::lock_guard lock(state_mutex_);
    if (!index_) return {};
    auto entries = index_->entries();
    std::sort(entries.begin(), entries.end(), [](const CacheEntry& a, const CacheEntry& b) {
        if (a.last_accessed_at != b.last_accessed_at) return a.last_accessed_at < b.last_accessed_at;
        return a.id < b.id;
    });
    return entries;
}

size_t VoiceCache::clear_cache() {
    std::lock_guard lock(state_mutex_);
    if (!index_) return 0;

    size_t removed = index_->clear();
    for (auto it = last_status_.begin(); it != last_status_.end();) {
        if (it->second == TaskStatus::Completed) {
            it = last_status_.erase(it);
        } else {
            ++it;
        }
    }
    log_info("Cache cleared: %zu files removed", removed);
    return removed;
}

// --- Task state ---

std::optional<TaskStatus> VoiceCache::task_status(const std::string& id) const {
    std::lock_guard lock(state_mutex_);
    auto it = tasks_.find(id);
    if (it != tasks_.end()) return it->second->task.status;
    auto last = last_status_.find(id);
    if (last != last_status_.end()) return last->second;
    if (index_ && index_->is_cached(id)) return TaskStatus::Completed;
    return std::nullopt;
}

double VoiceCache::progress(const std::string& id) const {
    std::lock_guard lock(state_mutex_);
    auto it = tasks_.find(id);
    if (it != tasks_.end()) return snapshot(*it->second, it->second->task.status).fraction;
    if (index_ && index_->is_cached(id)) return 1.0;
    return 0.0;
}

ProgressEvent VoiceCache::snapshot(const TaskRecord& rec, TaskStatus status) {
    ProgressEvent event;
    event.id = rec.task.id;
    event.bytes_received = rec.bytes_received.load();
    event.bytes_total = rec.bytes_total.load();
    event.status = status;
    if (status == TaskStatus::Completed) {
        event.fraction = 1.0;
    } else if (event.bytes_total > 0) {
        event.fraction = std::min(1.0, static_cast<double>(event.bytes_received) /
                                           static_cast<double>(event.bytes_total));
    }
    return event;
}

uint64_t VoiceCache::subscribe(const std::string& id, ProgressListener listener) {
    if (!listener) return 0;

    ProgressEvent immediate;
    {
        std::lock_guard lock(state_mutex_);
        if (tasks_.count(id)) {
            std::lock_guard subs_lock(subs_mutex_);
            uint64_t token = ++next_subscription_;
            subscriptions_[token] = Subscription{id, std::move(listener)};
            return token;
        }

        // Nothing live: report the last known outcome and close at once
        immediate.id = id;
        immediate.closed = true;
        auto last = last_status_.find(id);
        if (index_ && index_->is_cached(id)) {
            immediate.status = TaskStatus::Completed;
            immediate.fraction = 1.0;
            if (auto* entry = index_->find(id)) {
                immediate.bytes_received = entry->size_bytes;
                immediate.bytes_total = entry->size_bytes;
            }
        } else if (last != last_status_.end()) {
            immediate.status = last->second;
        } else {
            immediate.status = TaskStatus::Failed;
        }
    }
    listener(immediate);
    return 0;
}

void VoiceCache::unsubscribe(uint64_t token) {
    std::lock_guard lock(subs_mutex_);
    subscriptions_.erase(token);
}

void VoiceCache::publish(const ProgressEvent& event) {
    std::vector<ProgressListener> listeners;
    {
        std::lock_guard lock(subs_mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
            if (it->second.id != event.id) {
                ++it;
                continue;
            }
            listeners.push_back(it->second.listener);
            if (event.closed) {
                it = subscriptions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            log_warn("Progress listener for %s threw: %s", event.id.c_str(), e.what());
        }
    }
}

// --- Statistics ---

VoiceCache::Stats VoiceCache::get_stats() const {
    std::lock_guard lock(state_mutex_);
    Stats s = stats_;
    if (index_) {
        s.cache_bytes = index_->total_bytes();
        s.cached_files = index_->size();
    }
    if (queue_) s.queued_tasks = queue_->size();
    s.active_transfers = active_.size();
    if (retries_) s.pending_retries = retries_->pending();
    return s;
}

void VoiceCache::stats_reporter_loop() {
    while (running_.load()) {
        {
            std::unique_lock lock(stats_cv_mutex_);
            stats_cv_.wait_for(lock, std::chrono::seconds(config_.stats_interval_secs),
                               [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        auto s = get_stats();
        log_info("Stats: files=%lu bytes=%lu queued=%lu active=%lu retrying=%lu hits=%lu "
                 "misses=%lu coalesced=%lu completed=%lu failed=%lu cancelled=%lu evicted=%lu",
                 static_cast<unsigned long>(s.cached_files), static_cast<unsigned long>(s.cache_bytes),
                 static_cast<unsigned long>(s.queued_tasks),
                 static_cast<unsigned long>(s.active_transfers),
                 static_cast<unsigned long>(s.pending_retries),
                 static_cast<unsigned long>(s.cache_hits), static_cast<unsigned long>(s.cache_misses),
                 static_cast<unsigned long>(s.coalesced_requests),
                 static_cast<unsigned long>(s.transfers_completed),
                 static_cast<unsigned long>(s.transfers_failed),
                 static_cast<unsigned long>(s.cancellations),
                 static_cast<unsigned long>(s.evictions_performed));
    }
}

}  // namespace voicecache
