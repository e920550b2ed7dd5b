#pragma once

#include <atomic>
#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// A fresh, not yet existing path under temp_dir() starting with `prefix`.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Sleep up to `ms` in `slice_ms` steps, returning early (true) once `stop` is set.
bool sleep_unless_stopped(int ms, const std::atomic<bool>& stop, int slice_ms = 100);

} // namespace platform
