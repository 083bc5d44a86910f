#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace voicecache {

/// Scheduling tier for a download. Declared highest first so the numeric
/// value doubles as the queue tier index.
enum class Priority {
    High = 0,
    Normal = 1,
    Low = 2,
};

enum class TaskStatus {
    Queued,
    Downloading,
    Retrying,
    Completed,
    Failed,
    Cancelled,
};

const char* priority_to_string(Priority priority);
std::optional<Priority> parse_priority(const std::string& name);

const char* status_to_string(TaskStatus status);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

/// One locally persisted asset.
struct CacheEntry {
    std::string id;
    std::string source_url;
    std::filesystem::path local_path;
    uint64_t size_bytes = 0;
    int64_t created_at = 0;        // epoch milliseconds
    int64_t last_accessed_at = 0;  // epoch milliseconds
    std::string sha256;            // hex digest, empty if unknown
};

/// One pending or active transfer.
struct DownloadTask {
    std::string id;
    std::string source_url;
    Priority priority = Priority::Normal;
    int attempts = 0;
    TaskStatus status = TaskStatus::Queued;
};

/// Outcome delivered to every caller waiting on an id.
struct FileResult {
    bool success = false;
    std::filesystem::path path;
    TaskStatus status = TaskStatus::Failed;
    std::string error_message;
};

/// Current wall-clock time in epoch milliseconds.
int64_t now_epoch_ms();

}  // namespace voicecache
