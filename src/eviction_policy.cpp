#include "voicecache/eviction_policy.hpp"
#include "voicecache/log.hpp"

#include <algorithm>
#include <cmath>

namespace voicecache {

EvictionPolicy::EvictionPolicy(uint64_t max_bytes, size_t max_files, double fraction)
    : max_bytes_(max_bytes), max_files_(max_files), fraction_(fraction) {}

bool EvictionPolicy::over_limit(uint64_t total_bytes, size_t file_count) const {
    return total_bytes > max_bytes_ || file_count > max_files_;
}

size_t EvictionPolicy::batch_size(size_t candidates) const {
    if (candidates == 0) return 0;
    // The epsilon keeps exact products such as 60 * 0.2 from rounding up to 13
    auto n = static_cast<size_t>(std::ceil(static_cast<double>(candidates) * fraction_ - 1e-9));
    return std::clamp<size_t>(n, 1, candidates);
}

std::vector<std::string> EvictionPolicy::select_victims(
    const std::vector<CacheEntry>& entries,
    const std::unordered_set<std::string>& excluded) const {
    std::vector<const CacheEntry*> candidates;
    candidates.reserve(entries.size());
    for (auto& e : entries) {
        if (excluded.count(e.id) == 0) candidates.push_back(&e);
    }

    // Oldest access first; ties broken by age, then id, for a stable order
    std::sort(candidates.begin(), candidates.end(), [](const CacheEntry* a, const CacheEntry* b) {
        if (a->last_accessed_at != b->last_accessed_at) return a->last_accessed_at < b->last_accessed_at;
        if (a->created_at != b->created_at) return a->created_at < b->created_at;
        return a->id < b->id;
    });

    std::vector<std::string> victims;
    auto n = batch_size(candidates.size());
    victims.reserve(n);
    for (size_t i = 0; i < n; ++i) victims.push_back(candidates[i]->id);
    return victims;
}

EvictionPolicy::Result EvictionPolicy::enforce(CacheIndex& index,
                                               const std::unordered_set<std::string>& excluded) const {
    Result result;
    if (!over_limit(index.total_bytes(), index.size())) return result;

    log_info("Cache limit exceeded (%lu/%lu bytes, %zu/%zu files), evicting",
             static_cast<unsigned long>(index.total_bytes()), static_cast<unsigned long>(max_bytes_),
             index.size(), max_files_);

    // One batch per run; the next commit triggers another if still over
    auto victims = select_victims(index.entries(), excluded);
    if (victims.empty()) {
        log_warn("No evictable entries, cache stays over limit");
        return result;
    }
    for (auto& id : victims) {
        const CacheEntry* e = index.find(id);
        uint64_t size = e ? e->size_bytes : 0;
        if (index.remove(id)) {
            result.evicted_files++;
            result.evicted_bytes += size;
            result.evicted_ids.push_back(id);
            log_debug("Evicted: %s (%lu bytes)", id.c_str(), static_cast<unsigned long>(size));
        }
    }

    log_info("Eviction complete: %zu files, %lu bytes freed, cache=%lu bytes",
             result.evicted_files, static_cast<unsigned long>(result.evicted_bytes),
             static_cast<unsigned long>(index.total_bytes()));
    return result;
}

}  // namespace voicecache
