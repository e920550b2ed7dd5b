#include "rentwatch_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <monitor/machine_poller.hpp>
#include <monitor/monitor.hpp>
#include <notify/dispatcher.hpp>
#include <notify/transport.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iostream>
#include <memory>

RentwatchCLI::RentwatchCLI(fs::path config_path)
    : config_path_(std::move(config_path)) {}

bool RentwatchCLI::load_config() {
    if (!fs::exists(config_path_)) {
        std::cerr << theme::fail("Config file not found: " + config_path_.string());
        return false;
    }
    auto loaded = Config::load(config_path_);
    if (loaded.is_err()) {
        std::cerr << theme::fail("Invalid config: " + loaded.error);
        return false;
    }
    config_ = loaded.value;
    return true;
}

// ── Monitor ─────────────────────────────────────────────────

static std::unique_ptr<NotificationDispatcher> make_notifier(const Config& config) {
    if (config.targets().empty()) {
        log_info("No enabled notification targets; notifications disabled.");
        return nullptr;
    }
    std::vector<std::string> names;
    for (const auto& t : config.targets()) names.push_back(t.name);
    log_info(fmt::format("Notifications enabled for {} target(s): {}",
                         names.size(), fmt::join(names, ", ")));
    return std::make_unique<NotificationDispatcher>(config.targets(),
                                                    std::make_shared<AppriseTransport>(),
                                                    config.error_mention());
}

static void log_paths(const Config& config, const RegistryStore& store) {
    log_info(fmt::format("Loaded config for {} machine(s).", config.machine_ids().size()));
    log_info("State directory: " + store.state_dir().string());
    log_info("Registries: " + (store.state_dir() / REGISTRY_DIR).string());
    log_info("Rental logs: " + store.archive_dir().string());
}

int RentwatchCLI::run_monitor(const std::atomic<bool>& stop) {
    if (!load_config()) return 1;
    log_init(config_.log_file(), config_.debug());

    RegistryStore store(config_.state_dir());
    log_paths(config_, store);

    CommandMachineSource source(config_.poll_command(), config_.machine_ids());
    auto notifier = make_notifier(config_);
    Monitor monitor(config_, source, store, notifier.get());

    int code = 0;
    try {
        monitor.run(stop);
    } catch (const std::exception&) {
        // Monitor::run already logged and announced the crash
        code = 1;
    }

    if (notifier) notifier->close();
    log_info("Exiting.");
    log_shutdown();
    return code;
}

int RentwatchCLI::run_once() {
    if (!load_config()) return 1;
    log_init(config_.log_file(), config_.debug());

    RegistryStore store(config_.state_dir());
    log_paths(config_, store);

    CommandMachineSource source(config_.poll_command(), config_.machine_ids());
    auto notifier = make_notifier(config_);
    Monitor monitor(config_, source, store, notifier.get());

    monitor.startup();
    int processed = monitor.run_cycle();

    if (notifier) notifier->close();
    log_shutdown();
    return processed < 0 ? 1 : 0;
}

// ── Status ──────────────────────────────────────────────────

std::string render_status(const MachineRegistry& registry, const std::string& now) {
    std::string out = theme::section(registry.gpu_name.empty()
        ? fmt::format("Machine {}", registry.machine_id)
        : fmt::format("Machine {}  {}", registry.machine_id, registry.gpu_name));
    out += theme::kv("occupancy", registry.gpu_occupancy.empty() ? "-" : theme::teal(registry.gpu_occupancy));

    if (registry.sessions.empty()) {
        out += theme::step(theme::dim("No tracked sessions"));
        return out;
    }

    double hourly = 0.0;
    double accrued = 0.0;
    for (const auto& [sid, s] : registry.sessions) {
        auto t = s.totals(now);
        hourly += s.hourly_rate();
        accrued += t.total();

        std::string label = theme::bold(sid) + "  " + to_string(s.status);
        out += "\n" + (s.status == SessionStatus::Running ? theme::ok(label) : theme::step(label));
        out += theme::kv("gpus", fmt::format("x{} {} {}", s.gpus.size(), s.gpus, s.rental_type));
        if (const auto* g = s.open_gpu()) {
            out += theme::kv("gpu rate", fmt::format("{:.4f} $/gpu/hr (ceiling {:.4f})", g->rate, s.gpu_contracted_rate));
        }
        if (s.storage_gb > 0.0) {
            const auto* st = s.open_storage();
            out += theme::kv("storage", fmt::format("{:.2f} GB @ {:.4f} $/GB/mo",
                                                    s.storage_gb, st ? st->rate_per_gb_month : 0.0));
        }
        out += theme::kv("age", format_duration(s.start_time, now));
        out += theme::kv("earned", fmt::format("{:.4f}$ gpu + {:.4f}$ disk = {:.4f}$", t.gpu, t.storage, t.total()));
        if (s.client_end_date) {
            out += theme::kv("ends", format_timestamp(*s.client_end_date));
        }
    }

    out += "\n" + theme::kv("hourly", theme::amber(fmt::format("{:.4f}$", hourly)));
    out += theme::kv("accrued", theme::amber(fmt::format("{:.4f}$", accrued)));
    return out;
}

int RentwatchCLI::run_status() {
    if (!load_config()) return 1;

    RegistryStore store(config_.state_dir());
    const std::string now = now_iso();
    int failures = 0;

    std::cout << theme::banner();
    for (int64_t mid : config_.machine_ids()) {
        if (!store.has_registry(mid)) {
            std::cout << theme::section(fmt::format("Machine {}", mid));
            std::cout << theme::step(theme::dim("Not seen yet"));
            continue;
        }
        auto loaded = store.load(mid);
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            failures++;
            continue;
        }
        std::cout << render_status(loaded.value, now);
    }
    std::cout << "\n";
    return failures ? 1 : 0;
}
