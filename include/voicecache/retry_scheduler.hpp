#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace voicecache {

/// Cancellable delayed callback, keyed by task id.
///
/// VoiceCache keeps two: one re-enqueues failed transfers after their backoff
/// delay, the other cancels tasks whose wait_timeout deadline passes.
/// A single timer thread fires each callback once its delay elapses.
/// Cancelling an id discards its pending callback so it never fires.
/// Callbacks run on the timer thread with no scheduler lock held.
class RetryScheduler {
public:
    using Callback = std::function<void()>;

    /// @param delays  Fixed backoff table, selected positionally by attempt.
    explicit RetryScheduler(std::vector<std::chrono::milliseconds> delays);
    ~RetryScheduler();

    RetryScheduler(const RetryScheduler&) = delete;
    RetryScheduler& operator=(const RetryScheduler&) = delete;

    void start();

    /// Stop the timer thread. Pending retries are dropped without firing.
    void shutdown();

    /// Delay before retrying after the given number of failed attempts
    /// (1-based), capped at the last table entry. A task only retries while
    /// attempts < max_attempts, so with the default max_attempts of 3 the
    /// third entry of the default table (10s) is never used; it applies once
    /// max_attempts is raised above 3.
    std::chrono::milliseconds delay_for(int attempts) const;

    /// Schedule fn to run after delay. Replaces any pending retry for id.
    void schedule(const std::string& id, std::chrono::milliseconds delay, Callback fn);

    /// Discard the pending retry for id. Returns true if one was pending.
    bool cancel(const std::string& id);

    bool is_pending(const std::string& id) const;
    size_t pending() const;

private:
    struct Pending {
        std::chrono::steady_clock::time_point deadline;
        Callback fn;
    };

    void timer_loop();

    std::vector<std::chrono::milliseconds> delays_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Pending> pending_;
    bool running_ = false;
    std::thread timer_thread_;
};

}  // namespace voicecache
