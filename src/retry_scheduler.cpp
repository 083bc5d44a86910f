#include "voicecache/retry_scheduler.hpp"
#include "voicecache/log.hpp"

#include <algorithm>

namespace voicecache {

RetryScheduler::RetryScheduler(std::vector<std::chrono::milliseconds> delays)
    : delays_(std::move(delays)) {
    if (delays_.empty()) delays_.emplace_back(0);
}

RetryScheduler::~RetryScheduler() {
    shutdown();
}

void RetryScheduler::start() {
    {
        std::lock_guard lock(mutex_);
        if (running_) return;
        running_ = true;
    }
    timer_thread_ = std::thread(&RetryScheduler::timer_loop, this);
}

void RetryScheduler::shutdown() {
    {
        std::lock_guard lock(mutex_);
        running_ = false;
        pending_.clear();
    }
    cv_.notify_all();
    if (timer_thread_.joinable()) timer_thread_.join();
}

std::chrono::milliseconds RetryScheduler::delay_for(int attempts) const {
    size_t idx = attempts <= 1 ? 0 : static_cast<size_t>(attempts - 1);
    return delays_[std::min(idx, delays_.size() - 1)];
}

void RetryScheduler::schedule(const std::string& id, std::chrono::milliseconds delay, Callback fn) {
    {
        std::lock_guard lock(mutex_);
        pending_[id] = Pending{std::chrono::steady_clock::now() + delay, std::move(fn)};
    }
    cv_.notify_all();
}

bool RetryScheduler::cancel(const std::string& id) {
    std::lock_guard lock(mutex_);
    return pending_.erase(id) > 0;
}

bool RetryScheduler::is_pending(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return pending_.count(id) != 0;
}

size_t RetryScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

void RetryScheduler::timer_loop() {
    std::unique_lock lock(mutex_);
    while (running_) {
        if (pending_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !pending_.empty(); });
            continue;
        }

        auto next = std::min_element(pending_.begin(), pending_.end(), [](const auto& a, const auto& b) {
            return a.second.deadline < b.second.deadline;
        });
        auto deadline = next->second.deadline;

        if (std::chrono::steady_clock::now() < deadline) {
            // Woken early by schedule/cancel/shutdown; re-evaluate afterwards
            cv_.wait_until(lock, deadline);
            continue;
        }

        auto id = next->first;
        auto fn = std::move(next->second.fn);
        pending_.erase(next);

        lock.unlock();
        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            log_error("Timer callback for %s failed: %s", id.c_str(), e.what());
        }
        lock.lock();
    }
}

}  // namespace voicecache
