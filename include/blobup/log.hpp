#pragma once

namespace blobup {

/// printf-style logging to stdout (info/debug) and stderr (warn/error).
/// The daemon redirects both streams to its log file after startup.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted when verbose logging is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool enabled);
bool verbose_logging();

}  // namespace blobup
