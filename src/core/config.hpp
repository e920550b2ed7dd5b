#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include "types.hpp"

namespace fs = std::filesystem;

// One entry of `apprise.targets` before defaults are applied.
struct RawTarget {
    std::string url;
    std::optional<std::string> name;
    bool enabled = true;
    std::optional<std::string> service;
    std::optional<std::string> mention;
    std::vector<std::string> tags;
    std::vector<std::string> events;
};

class Config {
public:
    // Load from a YAML (or JSON) file. Relative paths inside resolve against
    // the state directory, which defaults to the file's directory.
    static Result<Config> load(const fs::path& path);

    // Parse config text; `base_dir` stands in for the file's directory.
    static Result<Config> parse(const std::string& text, const fs::path& base_dir);

    // Accessors
    const std::string& api_key() const { return api_key_; }
    const std::vector<int64_t>& machine_ids() const { return machine_ids_; }
    const fs::path& log_file() const { return log_file_; }
    int check_frequency() const { return check_frequency_; }
    bool debug() const { return debug_; }
    const fs::path& state_dir() const { return state_dir_; }

    // Poll command with {api_key} substituted.
    std::vector<std::string> poll_command() const;

    const ReconcileConfig& reconcile() const { return reconcile_; }
    const NotifyConfig& notify() const { return notify_; }
    const std::vector<NotificationTarget>& targets() const { return targets_; }
    const std::optional<std::string>& error_mention() const { return error_mention_; }

    Config() = default;

private:
    std::string api_key_;
    std::vector<int64_t> machine_ids_;
    fs::path log_file_;
    int check_frequency_ = 0;
    bool debug_ = false;
    fs::path state_dir_;
    std::vector<std::string> poll_command_;
    ReconcileConfig reconcile_;
    NotifyConfig notify_;
    std::vector<NotificationTarget> targets_;
    std::optional<std::string> error_mention_;
};

fs::path default_config_path();

// Apply defaults to raw targets: drop disabled or URL-less entries, derive
// the service from the URL scheme, name unnamed targets "<service>-<n>",
// de-duplicate names, and turn event lists into allow-lists.
std::vector<NotificationTarget> normalize_targets(const std::vector<RawTarget>& raw);
