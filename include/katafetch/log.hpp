#pragma once

#include <filesystem>

namespace katafetch {

/// Append every log line to this file in addition to stdout/stderr.
/// Returns false if the file cannot be opened (console logging continues).
bool log_open_file(const std::filesystem::path& path);
void log_close_file();

void set_log_verbose(bool verbose);
bool log_verbose();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted when verbose logging is on.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace katafetch
