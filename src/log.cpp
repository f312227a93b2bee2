#include "katafetch/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace katafetch {

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;
std::atomic<bool> g_verbose{false};

void format_timestamp(char* buf, size_t buf_size) {
    time_t now = time(nullptr);
    struct tm tm_val;
    localtime_r(&now, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%d %H:%M:%S", &tm_val);
}

void write_line(FILE* console, const char* level, const char* fmt, va_list args) {
    char ts[32];
    format_timestamp(ts, sizeof(ts));

    char msg[2048];
    vsnprintf(msg, sizeof(msg), fmt, args);

    std::lock_guard lock(g_log_mutex);
    fprintf(console, "[%s] %s%s\n", ts, level, msg);
    fflush(console);
    if (g_log_file) {
        fprintf(g_log_file, "[%s] %s%s\n", ts, level, msg);
        fflush(g_log_file);
    }
}

}  // namespace

bool log_open_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    FILE* f = fopen(path.c_str(), "a");
    if (!f) return false;

    std::lock_guard lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = f;
    return true;
}

void log_close_file() {
    std::lock_guard lock(g_log_mutex);
    if (g_log_file) {
        fclose(g_log_file);
        g_log_file = nullptr;
    }
}

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool log_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!log_verbose()) return;
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

}  // namespace katafetch
