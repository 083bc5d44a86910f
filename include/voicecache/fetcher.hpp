#pragma once

#include "voicecache/cache_config.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace voicecache {

/// Cooperative cancellation flag shared between the coordinator and one
/// in-flight transfer.
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Progress callback: bytes received so far and expected total (0 if unknown).
using FetchProgressCallback = std::function<void(uint64_t bytes_received, uint64_t bytes_total)>;

// Result of a download operation
struct FetchResult {
    bool success = false;
    bool cancelled = false;     // aborted through the cancel token
    bool retryable = true;      // false for permanent errors (e.g. HTTP 404)
    long status_code = 0;       // protocol response code, 0 if none
    uint64_t bytes = 0;         // bytes written to dest
    std::string error_message;
};

/// Network fetch capability: stream a URL into a local file.
///
/// Implementations write dest in place and leave partial content behind on
/// failure; the caller owns cleanup of dest.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Fetcher name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual FetchResult download(const std::string& url,
                                 const std::filesystem::path& dest,
                                 const FetchProgressCallback& on_progress,
                                 const CancelToken& cancel_token) = 0;
};

/// libcurl-backed fetcher for http, https and file URLs.
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(const FetcherConfig& config);
    ~CurlFetcher() override;

    CurlFetcher(const CurlFetcher&) = delete;
    CurlFetcher& operator=(const CurlFetcher&) = delete;

    std::string type_name() const override { return "curl"; }

    FetchResult download(const std::string& url,
                         const std::filesystem::path& dest,
                         const FetchProgressCallback& on_progress,
                         const CancelToken& cancel_token) override;

private:
    FetcherConfig config_;
};

bool is_retryable_status(long status);

}  // namespace voicecache
