#include "blobmover/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace blobmover {

namespace {

std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag = []() {
        const char* env = std::getenv("BLOBMOVER_VERBOSE");
        return env != nullptr && std::string(env) != "0";
    }();
    return flag;
}

// Worker threads log concurrently; keep lines whole.
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

void vlog(FILE* out, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (prefix) fputs(prefix, out);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_log_verbose(bool verbose) {
    verbose_flag().store(verbose);
}

bool log_verbose() {
    return verbose_flag().load();
}

void log_debug(const char* fmt, ...) {
    if (!log_verbose()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARN: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

}  // namespace blobmover
