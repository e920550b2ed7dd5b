#include "log.hpp"
#include "constants.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

struct LogState {
    std::mutex mutex;
    fs::path path;
    bool debug = false;
    std::string file_date;   // local date the current file belongs to
};

LogState& state() {
    static LogState s;
    return s;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string local_date(std::time_t t) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

// Date of the last write to an existing log file, so a restart the next day
// still rotates yesterday's lines out.
std::string file_date_of(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return local_date(std::time(nullptr));
    }
    return local_date(st.st_mtime);
}

void prune_rotated(const fs::path& path) {
    std::error_code ec;
    auto dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    std::string prefix = path.filename().string() + ".";

    std::vector<fs::path> rotated;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
            rotated.push_back(entry.path());
        }
    }
    if (static_cast<int>(rotated.size()) <= LOG_ROTATE_KEEP) return;

    // Date suffixes sort lexicographically
    std::sort(rotated.begin(), rotated.end());
    for (size_t i = 0; i + LOG_ROTATE_KEEP < rotated.size(); ++i) {
        fs::remove(rotated[i], ec);
    }
}

// Caller holds the mutex.
void rotate_if_needed(LogState& s, const std::string& today) {
    if (s.path.empty() || s.file_date == today) return;

    std::error_code ec;
    if (fs::exists(s.path, ec)) {
        fs::rename(s.path, rotated_log_path(s.path, s.file_date), ec);
        if (ec) {
            std::cerr << "log rotation failed: " << ec.message() << "\n";
        }
        prune_rotated(s.path);
    }
    s.file_date = today;
}

} // namespace

fs::path rotated_log_path(const fs::path& path, const std::string& date) {
    return fs::path(path.string() + "." + date);
}

void log_init(const fs::path& path, bool debug) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.path = path;
    s.debug = debug;
    if (!path.empty()) {
        std::error_code ec;
        if (!path.parent_path().empty()) {
            fs::create_directories(path.parent_path(), ec);
        }
        s.file_date = file_date_of(path);
    }
}

void log_shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.path.clear();
}

bool log_debug_enabled() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.debug;
}

void rw_log(LogLevel level, const std::string& msg) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level == LogLevel::Debug && !s.debug) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::string line = fmt::format("{} - {} - {}\n", ts, level_name(level), msg);
    std::cerr << line;

    if (s.path.empty()) return;
    rotate_if_needed(s, local_date(t));

    std::ofstream out(s.path, std::ios::app);
    if (out) out << line;
}
