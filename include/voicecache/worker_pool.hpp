#pragma once

#include "voicecache/log.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace voicecache {

// Fixed set of transfer threads fed by the VoiceCache dispatcher.
// - The dispatcher never hands over more jobs than there are threads, so a
//   job starts as soon as it is handed over
// - shutdown() runs every job already handed over, then joins
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&WorkerPool::worker_loop, this);
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws std::runtime_error once shutdown has begun.
    void execute(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) throw std::runtime_error("worker pool is shutting down");
            jobs_.push(std::move(job));
        }
        cv_.notify_one();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

private:
    void worker_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) return;  // stopping with nothing left

            auto job = std::move(jobs_.front());
            jobs_.pop();

            lock.unlock();
            try {
                job();
            } catch (const std::exception& e) {
                log_error("Transfer job failed: %s", e.what());
            }
            lock.lock();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}  // namespace voicecache
