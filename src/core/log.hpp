#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { Debug, Info, Warn, Error };

// Route log lines to `path` (appended, rotated at local midnight) in addition
// to stderr. Debug lines are only written when `debug` is true.
void log_init(const std::filesystem::path& path, bool debug);

// Stop writing to the log file; stderr output continues.
void log_shutdown();

bool log_debug_enabled();

void rw_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { rw_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { rw_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { rw_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { rw_log(LogLevel::Error, msg); }

// Path a file gets renamed to when rotated on `date` (YYYY-MM-DD).
std::filesystem::path rotated_log_path(const std::filesystem::path& path,
                                       const std::string& date);
