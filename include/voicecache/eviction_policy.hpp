#pragma once

#include "voicecache/cache_index.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace voicecache {

/// LRU eviction under a byte quota and a file-count quota.
///
/// Once either limit is exceeded, one run removes the oldest
/// ceil(candidates * fraction) entries by last access. A single large commit
/// therefore never empties the cache; later commits trim further if the
/// cache is still over a limit. Ids in the exclusion set (active transfers) are
/// never candidates.
class EvictionPolicy {
public:
    struct Result {
        size_t evicted_files = 0;
        uint64_t evicted_bytes = 0;
        std::vector<std::string> evicted_ids;
    };

    EvictionPolicy(uint64_t max_bytes, size_t max_files, double fraction);

    bool over_limit(uint64_t total_bytes, size_t file_count) const;

    /// Size of one eviction batch for the given candidate count.
    size_t batch_size(size_t candidates) const;

    /// Pick the next batch of victims, oldest access first. Pure: does not
    /// touch the index.
    std::vector<std::string> select_victims(const std::vector<CacheEntry>& entries,
                                            const std::unordered_set<std::string>& excluded) const;

    /// Evict one batch from the index if either limit is exceeded.
    /// Idempotent when the cache is already within limits.
    Result enforce(CacheIndex& index, const std::unordered_set<std::string>& excluded) const;

    uint64_t max_bytes() const { return max_bytes_; }
    size_t max_files() const { return max_files_; }

private:
    uint64_t max_bytes_;
    size_t max_files_;
    double fraction_;
};

}  // namespace voicecache
