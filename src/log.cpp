#include "blobup/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace blobup {

namespace {
std::atomic<bool> g_verbose{false};
}  // namespace

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "WARN: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose.load(std::memory_order_relaxed)) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stdout, "DEBUG: ");
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void set_verbose_logging(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

}  // namespace blobup
