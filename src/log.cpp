#include "voicecache/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace voicecache {

namespace {

std::atomic<bool> g_verbose{false};

// Format the whole line first so concurrent workers never interleave
// fragments of a message.
void write_line(FILE* stream, const char* prefix, const char* fmt, va_list args) {
    char buf[2048];
    int off = std::snprintf(buf, sizeof(buf), "%s", prefix);
    if (off < 0) off = 0;
    int n = std::vsnprintf(buf + off, sizeof(buf) - static_cast<size_t>(off), fmt, args);
    size_t len = static_cast<size_t>(off) + (n > 0 ? static_cast<size_t>(n) : 0);
    if (len > sizeof(buf) - 2) len = sizeof(buf) - 2;
    buf[len++] = '\n';
    std::fwrite(buf, 1, len, stream);
    std::fflush(stream);
}

}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool is_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!is_verbose()) return;
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

}  // namespace voicecache
