#include "voicecache/download_queue.hpp"

#include <algorithm>

namespace voicecache {

DownloadQueue::DownloadQueue(const CacheIndex& index) : index_(index) {}

bool DownloadQueue::enqueue(DownloadTask task) {
    if (index_.is_cached(task.id) || contains(task.id)) return false;

    task.status = TaskStatus::Queued;
    ids_.insert(task.id);
    tiers_[static_cast<size_t>(task.priority)].push_back(std::move(task));
    return true;
}

std::optional<DownloadTask> DownloadQueue::dequeue_next(size_t active_count, size_t max_active) {
    if (active_count >= max_active) return std::nullopt;

    for (auto& tier : tiers_) {
        if (tier.empty()) continue;
        DownloadTask task = std::move(tier.front());
        tier.pop_front();
        ids_.erase(task.id);
        return task;
    }
    return std::nullopt;
}

bool DownloadQueue::remove(const std::string& id) {
    if (!contains(id)) return false;
    for (auto& tier : tiers_) {
        auto it = std::find_if(tier.begin(), tier.end(),
                               [&](const DownloadTask& t) { return t.id == id; });
        if (it != tier.end()) {
            tier.erase(it);
            ids_.erase(id);
            return true;
        }
    }
    return false;
}

size_t DownloadQueue::size(Priority priority) const {
    return tiers_[static_cast<size_t>(priority)].size();
}

std::vector<DownloadTask> DownloadQueue::drain() {
    std::vector<DownloadTask> out;
    out.reserve(ids_.size());
    for (auto& tier : tiers_) {
        for (auto& t : tier) out.push_back(std::move(t));
        tier.clear();
    }
    ids_.clear();
    return out;
}

}  // namespace voicecache
