#include "platform.hpp"
#include <algorithm>
#include <ctime>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^ static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool sleep_unless_stopped(int ms, const std::atomic<bool>& stop, int slice_ms) {
    int elapsed = 0;
    while (elapsed < ms) {
        if (stop.load()) return true;
        int step = std::min(slice_ms, ms - elapsed);
        sleep_ms(step);
        elapsed += step;
    }
    return stop.load();
}

} // namespace platform
