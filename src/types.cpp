#include "voicecache/types.hpp"

#include <chrono>

namespace voicecache {

const char* priority_to_string(Priority priority) {
    switch (priority) {
        case Priority::High: return "high";
        case Priority::Normal: return "normal";
        case Priority::Low: return "low";
    }
    return "normal";
}

std::optional<Priority> parse_priority(const std::string& name) {
    if (name == "high") return Priority::High;
    if (name == "normal") return Priority::Normal;
    if (name == "low") return Priority::Low;
    return std::nullopt;
}

const char* status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Downloading: return "downloading";
        case TaskStatus::Retrying: return "retrying";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace voicecache
