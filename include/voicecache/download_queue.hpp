#pragma once

#include "voicecache/cache_index.hpp"
#include "voicecache/types.hpp"

#include <array>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace voicecache {

/// Pending downloads ordered by priority tier, FIFO within a tier.
///
/// Ids already in the cache index are never queued. Scheduling happens only
/// at dequeue time, so a late high-priority arrival never preempts a
/// dispatched transfer. Not internally synchronized.
class DownloadQueue {
public:
    explicit DownloadQueue(const CacheIndex& index);

    /// Insert behind every task of the same priority. Returns false (no-op)
    /// if the id is cached or already queued.
    bool enqueue(DownloadTask task);

    /// Head task, only if the active transfer set has spare capacity.
    std::optional<DownloadTask> dequeue_next(size_t active_count, size_t max_active);

    /// Remove a queued task. Returns false if the id was not queued.
    bool remove(const std::string& id);

    bool contains(const std::string& id) const { return ids_.count(id) != 0; }
    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }
    size_t size(Priority priority) const;

    /// Remove and return every queued task in dispatch order.
    std::vector<DownloadTask> drain();
    void clear() { drain(); }

private:
    const CacheIndex& index_;
    std::array<std::deque<DownloadTask>, 3> tiers_;  // indexed by Priority
    std::unordered_set<std::string> ids_;
};

}  // namespace voicecache
