#include "voicecache/fetcher.hpp"
#include "voicecache/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <mutex>

namespace voicecache {

bool is_retryable_status(long status) {
    // Server errors, timeouts and rate limiting are worth another attempt
    if (status >= 500 && status < 600) return true;
    return status == 408 || status == 429;
}

namespace {

// Context shared with the libcurl callbacks for one transfer
struct TransferContext {
    FILE* file = nullptr;
    uint64_t written = 0;
    uint64_t max_bytes = 0;
    bool size_exceeded = false;
    int write_errno = 0;
    const FetchProgressCallback* on_progress = nullptr;
    const CancelToken* cancel_token = nullptr;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_bytes > 0 && ctx->written + bytes > ctx->max_bytes) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    size_t n = std::fwrite(ptr, 1, bytes, ctx->file);
    if (n != bytes) {
        // Typically ENOSPC; surfaces as CURLE_WRITE_ERROR
        ctx->write_errno = errno;
        return 0;
    }
    ctx->written += n;
    return n;
}

int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<TransferContext*>(clientp);

    // Return non-zero to abort
    if (ctx->cancel_token && ctx->cancel_token->is_cancelled()) {
        return 1;
    }
    if (ctx->on_progress && *ctx->on_progress) {
        (*ctx->on_progress)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    }
    return 0;
}

}  // namespace

CurlFetcher::CurlFetcher(const FetcherConfig& config) : config_(config) {
    // Initialize CURL globally (thread-safe)
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

CurlFetcher::~CurlFetcher() = default;

FetchResult CurlFetcher::download(const std::string& url,
                                  const std::filesystem::path& dest,
                                  const FetchProgressCallback& on_progress,
                                  const CancelToken& cancel_token) {
    FetchResult result;

    if (cancel_token.is_cancelled()) {
        result.cancelled = true;
        result.error_message = "cancelled before start";
        return result;
    }

    FILE* file = std::fopen(dest.c_str(), "wb");
    if (!file) {
        result.error_message = "cannot open " + dest.string() + ": " + std::strerror(errno);
        return result;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(file);
        result.error_message = "curl_easy_init failed";
        return result;
    }

    TransferContext ctx;
    ctx.file = file;
    ctx.max_bytes = config_.max_file_bytes;
    ctx.on_progress = &on_progress;
    ctx.cancel_token = &cancel_token;

    char error_buf[CURL_ERROR_SIZE];
    error_buf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    // Progress doubles as the cancellation poll point
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count() * 1000));
    if (config_.low_speed_time.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.low_speed_time.count()));
    }
    if (config_.max_file_bytes > 0) {
        curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(config_.max_file_bytes));
    }

    if (config_.verify_ssl) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    } else {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!config_.ca_cert_path.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_cert_path.c_str());
    }

    // Follow redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
    curl_easy_cleanup(curl);

    bool closed_ok = std::fclose(file) == 0;
    result.bytes = ctx.written;

    if (res == CURLE_ABORTED_BY_CALLBACK && cancel_token.is_cancelled()) {
        result.cancelled = true;
        result.error_message = "cancelled";
        return result;
    }

    if (res != CURLE_OK) {
        if (ctx.size_exceeded || res == CURLE_FILESIZE_EXCEEDED) {
            result.error_message = "body exceeds max_file_bytes (" +
                                   std::to_string(config_.max_file_bytes) + ")";
            result.retryable = false;
        } else if (res == CURLE_WRITE_ERROR && ctx.write_errno != 0) {
            // Disk full and friends go through the normal retry path
            result.error_message = std::string("local write failed: ") + std::strerror(ctx.write_errno);
        } else {
            result.error_message = error_buf[0] ? error_buf : curl_easy_strerror(res);
            if (res == CURLE_URL_MALFORMAT || res == CURLE_UNSUPPORTED_PROTOCOL) {
                result.retryable = false;
            }
        }
        return result;
    }

    // file:// transfers report 0; only HTTP(S) carries a status to check
    if (result.status_code >= 400) {
        result.error_message = "HTTP " + std::to_string(result.status_code);
        result.retryable = is_retryable_status(result.status_code);
        return result;
    }

    if (!closed_ok) {
        result.error_message = std::string("close failed: ") + std::strerror(errno);
        return result;
    }

    // The last xferinfo call may predate the final write
    if (on_progress) on_progress(result.bytes, result.bytes);

    result.success = true;
    return result;
}

}  // namespace voicecache
