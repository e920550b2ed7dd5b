#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <core/config.hpp>
#include <monitor/registry_store.hpp>

namespace fs = std::filesystem;

class RentwatchCLI {
public:
    explicit RentwatchCLI(fs::path config_path);

    // Run until `stop` is set. Returns the process exit code.
    int run_monitor(const std::atomic<bool>& stop);

    // Startup plus a single cycle.
    int run_once();

    // Print every active session from the stored registries. No polling.
    int run_status();

private:
    bool load_config();

    fs::path config_path_;
    Config config_;
};

// Human-readable listing of one registry's sessions as of `now`.
std::string render_status(const MachineRegistry& registry, const std::string& now);
