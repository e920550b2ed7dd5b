#pragma once

#include <string>
#include <optional>
#include <vector>
#include <set>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local command execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct NotifyConfig {
    bool on_startup_existing = false;
    bool on_start = true;
    bool on_shutdown = true;
    int error_ping_interval_minutes = 60;
};

struct NotificationTarget {
    std::string name;                            // label, defaults to "<service>-<N>"
    std::string url;
    std::string service;                         // formatter key, defaults to URL scheme
    std::optional<std::string> mention;          // e.g. Discord user ID
    std::vector<std::string> tags;
    bool enabled = true;
    std::optional<std::set<std::string>> events; // allow-list; nullopt = every event
};

struct ReconcileConfig {
    double disk_tolerance_gb = 1.0;
};
