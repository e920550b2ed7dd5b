#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <notify/event.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

static const std::vector<std::string> DEFAULT_POLL_COMMAND = {
    "vastai", "show", "machines", "--raw", "--api-key", "{api_key}",
};

fs::path default_config_path() {
    return fs::current_path() / DEFAULT_CONFIG;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ── Targets ─────────────────────────────────────────────────

static std::optional<std::set<std::string>> normalize_events(const std::vector<std::string>& raw,
                                                             const std::string& name) {
    if (raw.empty()) return std::nullopt;
    std::set<std::string> events;
    for (auto ev : raw) {
        trim(ev);
        ev = lower(ev);
        if (ev.empty()) continue;
        if (ev == "*" || ev == "all" || ev == "any") return std::nullopt;
        if (!parse_event_type(ev)) {
            log_warn(fmt::format("Target {} specifies unknown event '{}'; skipping that entry", name, ev));
            continue;
        }
        events.insert(ev);
    }
    if (events.empty()) return std::nullopt;
    return events;
}

std::vector<NotificationTarget> normalize_targets(const std::vector<RawTarget>& raw) {
    std::vector<NotificationTarget> out;
    std::map<std::string, int> service_counts;
    std::set<std::string> names;

    for (const auto& r : raw) {
        if (!r.enabled) continue;
        if (r.url.empty()) {
            log_warn("Skipping notification target without URL");
            continue;
        }

        std::string scheme = "default";
        auto sep = r.url.find("://");
        if (sep != std::string::npos && sep > 0) scheme = r.url.substr(0, sep);
        std::string service = lower(r.service.value_or(scheme));
        if (service.empty()) service = "default";
        int n = ++service_counts[service];

        std::string base = r.name.value_or(fmt::format("{}-{}", service, n));
        std::string name = base;
        for (int suffix = 2; names.count(name); ++suffix) {
            name = fmt::format("{}-{}", base, suffix);
        }
        names.insert(name);

        NotificationTarget t;
        t.name = name;
        t.url = r.url;
        t.service = service;
        t.mention = r.mention;
        t.tags.push_back(name);
        for (const auto& tag : r.tags) {
            if (tag != name) t.tags.push_back(tag);
        }
        t.events = normalize_events(r.events, name);
        out.push_back(std::move(t));
    }
    return out;
}

static std::vector<std::string> as_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& n : node) out.push_back(n.as<std::string>());
    }
    return out;
}

static Result<std::vector<RawTarget>> parse_targets(const YAML::Node& node) {
    using R = Result<std::vector<RawTarget>>;
    std::vector<RawTarget> raw;
    if (!node) return R::Ok(raw);
    if (!node.IsSequence()) return R::Err("apprise.targets must be a list");

    for (const auto& entry : node) {
        RawTarget t;
        if (entry.IsScalar()) {
            t.url = entry.as<std::string>();
        } else if (entry.IsMap()) {
            t.url = entry["url"].as<std::string>("");
            if (entry["name"] && !entry["name"].IsNull()) t.name = entry["name"].as<std::string>();
            t.enabled = entry["enabled"].as<bool>(true);
            if (entry["service"] && !entry["service"].IsNull()) t.service = entry["service"].as<std::string>();
            if (entry["mention"] && !entry["mention"].IsNull()) t.mention = entry["mention"].as<std::string>();
            t.tags = as_string_list(entry["tags"]);
            t.events = as_string_list(entry["events"]);
        } else {
            log_warn("Unsupported notification target entry; skipping");
            continue;
        }
        raw.push_back(std::move(t));
    }
    return R::Ok(raw);
}

// ── Config ──────────────────────────────────────────────────

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot open config file " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    fs::path base = path.has_parent_path() ? path.parent_path() : fs::current_path();
    return parse(ss.str(), fs::absolute(base));
}

Result<Config> Config::parse(const std::string& text, const fs::path& base_dir) {
    Config cfg;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Result<Config>::Err("config root must be a map");
        }

        cfg.api_key_ = root["api_key"].as<std::string>("");
        if (cfg.api_key_.empty()) {
            return Result<Config>::Err("api_key is required");
        }

        if (!root["machine_ids"] || !root["machine_ids"].IsSequence() || root["machine_ids"].size() == 0) {
            return Result<Config>::Err("machine_ids must be a non-empty list");
        }
        for (const auto& id : root["machine_ids"]) {
            cfg.machine_ids_.push_back(id.as<int64_t>());
        }

        std::string log_file = root["log_file"].as<std::string>("");
        if (log_file.size() < 4 || log_file.compare(log_file.size() - 4, 4, ".log") != 0) {
            return Result<Config>::Err("log_file must end in .log");
        }

        if (!root["check_frequency"]) {
            return Result<Config>::Err("check_frequency is required");
        }
        cfg.check_frequency_ = root["check_frequency"].as<int>();
        if (cfg.check_frequency_ < MIN_CHECK_FREQUENCY_SECS) {
            return Result<Config>::Err(fmt::format("check_frequency must be at least {} seconds",
                                                   MIN_CHECK_FREQUENCY_SECS));
        }

        cfg.debug_ = root["debug"].as<bool>(false);

        fs::path state = root["state_dir"].as<std::string>("");
        cfg.state_dir_ = state.empty() ? base_dir : (state.is_absolute() ? state : base_dir / state);
        fs::path log_path = log_file;
        cfg.log_file_ = log_path.is_absolute() ? log_path : cfg.state_dir_ / log_path;

        cfg.poll_command_ = root["poll_command"]
            ? as_string_list(root["poll_command"]) : DEFAULT_POLL_COMMAND;
        if (cfg.poll_command_.empty()) {
            return Result<Config>::Err("poll_command must not be empty");
        }

        if (const auto rec = root["reconcile"]) {
            cfg.reconcile_.disk_tolerance_gb = rec["disk_tolerance_gb"].as<double>(DISK_TOLERANCE_GB);
            if (cfg.reconcile_.disk_tolerance_gb <= 0.0) {
                return Result<Config>::Err("reconcile.disk_tolerance_gb must be positive");
            }
        }

        if (const auto n = root["notify"]) {
            cfg.notify_.on_startup_existing = n["on_startup_existing"].as<bool>(false);
            cfg.notify_.on_start = n["on_start"].as<bool>(true);
            cfg.notify_.on_shutdown = n["on_shutdown"].as<bool>(true);
            cfg.notify_.error_ping_interval_minutes =
                n["error_ping_interval_minutes"].as<int>(DEFAULT_ERROR_PING_MINUTES);
            if (cfg.notify_.error_ping_interval_minutes < 1) {
                return Result<Config>::Err("notify.error_ping_interval_minutes must be at least 1");
            }
        }

        if (const auto a = root["apprise"]) {
            auto raw = parse_targets(a["targets"]);
            if (raw.is_err()) return Result<Config>::Err(raw.error);
            cfg.targets_ = normalize_targets(raw.value);
            if (a["error_mention"] && !a["error_mention"].IsNull()) {
                cfg.error_mention_ = a["error_mention"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("invalid config: ") + e.what());
    }
    return Result<Config>::Ok(cfg);
}

std::vector<std::string> Config::poll_command() const {
    std::vector<std::string> cmd;
    for (const auto& part : poll_command_) {
        cmd.push_back(replace_all(part, "{api_key}", api_key_));
    }
    return cmd;
}
