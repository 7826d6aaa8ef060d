#pragma once

namespace blobmover {

/// Enable or disable log_debug output (process-wide).
void set_log_verbose(bool verbose);
bool log_verbose();

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace blobmover
