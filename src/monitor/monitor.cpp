#include "monitor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

Monitor::Monitor(const Config& config, MachineSource& source, RegistryStore& store,
                 NotificationDispatcher* notifier)
    : clock(now_iso), config_(config), source_(source), store_(store), notifier_(notifier) {}

bool Monitor::ping_due(const std::optional<std::string>& last, const std::string& now) const {
    if (!last) return true;
    auto last_t = parse_iso_utc(*last);
    if (!last_t) return true;
    return seconds_between(*last, now) >= config_.notify().error_ping_interval_minutes * 60.0;
}

void Monitor::log_existing_sessions(const MachineRegistry& registry) const {
    for (const auto& [sid, s] : registry.sessions) {
        if (s.status == SessionStatus::Stored) {
            log_info(fmt::format("Detected stored session at startup (inactive): machine {}, session {}, stored gpus {}",
                                 registry.machine_id, sid, s.gpus));
        } else {
            const auto* g = s.open_gpu();
            log_info(fmt::format("Detected ongoing rental at startup: machine {}, session {}, type {}, rate {}, gpus {}",
                                 registry.machine_id, sid, s.rental_type,
                                 g ? g->rate : s.gpu_contracted_rate, s.gpus));
        }
    }
}

// ── Startup ─────────────────────────────────────────────────

void Monitor::startup() {
    auto dirs = store_.ensure_dirs();
    if (dirs.is_err()) {
        log_error(dirs.error);
        return;
    }

    auto fetched = source_.fetch();
    if (fetched.is_err()) {
        log_error(fetched.error);
        return;
    }

    const std::string now = clock();
    std::vector<MachineSummary> summaries;

    for (const auto& machine : fetched.value) {
        try {
            bool existed = store_.has_registry(machine.machine_id);
            auto loaded = store_.load(machine.machine_id);
            if (loaded.is_err()) {
                log_error(fmt::format("Skipping machine {} at startup: {}", machine.machine_id, loaded.error));
                continue;
            }
            MachineRegistry registry = loaded.value;

            if (existed) log_existing_sessions(registry);

            bool dirty = false;
            if (!existed || needs_seeding(registry, machine)) {
                seed_registry(registry, machine, now);
                dirty = true;
            }

            if (config_.notify().on_startup_existing && notifier_) {
                if (machine.error_description && !machine.error_description->empty() &&
                    ping_due(registry.last_error_notified_at, now)) {
                    log_error(fmt::format("Machine {} error at startup: {}",
                                          machine.machine_id, *machine.error_description));
                    notifier_->send_error(machine.machine_id, *machine.error_description);
                    registry.last_error_notified_at = now;
                    dirty = true;
                }
                MachineSummary sum = summarize_machine(registry, now);
                sum.gpu_name = machine.gpu_name;
                sum.num_gpus = machine.num_gpus;
                sum.gpu_occupancy = machine.gpu_occupancy;
                summaries.push_back(std::move(sum));
            }

            if (dirty) {
                auto saved = store_.save(registry);
                if (saved.is_err()) log_error(saved.error);
            }
        } catch (const std::exception& e) {
            log_error(fmt::format("Startup handling failed for machine {}: {}", machine.machine_id, e.what()));
        }
    }

    if (config_.notify().on_startup_existing && notifier_) {
        notifier_->send_startup_summary(summaries);
    }
}

// ── Cycle ───────────────────────────────────────────────────

int Monitor::run_cycle() {
    auto fetched = source_.fetch();
    if (fetched.is_err()) {
        log_error(fetched.error);
        return -1;
    }

    int ok = 0;
    for (const auto& machine : fetched.value) {
        try {
            if (process_machine(machine)) ok++;
        } catch (const std::exception& e) {
            log_error(fmt::format("Unexpected error processing machine {}: {}", machine.machine_id, e.what()));
        }
    }
    return ok;
}

bool Monitor::process_machine(const MachineState& current) {
    const int64_t mid = current.machine_id;
    const std::string now = clock();

    auto prev = store_.load_snapshot(mid);
    if (prev.is_err()) {
        log_warn(fmt::format("Machine {} snapshot unreadable, starting over: {}", mid, prev.error));
    }

    auto loaded = store_.load(mid);
    if (loaded.is_err()) {
        log_error(fmt::format("Skipping machine {}: {}", mid, loaded.error));
        return false;
    }
    MachineRegistry registry = loaded.value;

    if (prev.is_err() || !prev.value) {
        log_info(fmt::format("Initial snapshot for machine {}, saving.", mid));
        bool seed = !store_.has_registry(mid) || needs_seeding(registry, current);
        if (seed || !registry.has_baseline()) {
            if (seed) seed_registry(registry, current, now);
            else registry.observe(current);
            auto saved = store_.save(registry);
            if (saved.is_err()) {
                log_error(saved.error);
                return false;
            }
        }
        auto snap = store_.save_snapshot(current);
        if (snap.is_err()) log_error(snap.error);
        return snap.is_ok();
    }

    const MachineState& previous = *prev.value;
    auto fields = changed_fields(previous, current);
    if (!fields.empty()) {
        log_info(fmt::format("Machine {} changed: {}", mid, fields));
    }

    if (affects_rentals(fields)) {
        if (!apply_rentals(registry, previous, current, now)) return false;
    }

    if (check_alerts(registry, prev.value, current, now)) {
        auto saved = store_.save(registry);
        if (saved.is_err()) log_error(saved.error);
    }

    auto snap = store_.save_snapshot(current);
    if (snap.is_err()) {
        log_error(snap.error);
        return false;
    }
    return true;
}

bool Monitor::apply_rentals(MachineRegistry& registry, const MachineState& previous,
                            const MachineState& current, const std::string& now) {
    const int64_t mid = current.machine_id;
    ReconcileResult result = reconcile(registry, previous, current, now, config_.reconcile());

    // Archive before the registry forgets the session; on failure the whole
    // pass is retried next cycle against the same previous snapshot.
    for (const auto& s : result.ended) {
        auto archived = store_.archive(mid, s);
        if (archived.is_err()) {
            log_error(fmt::format("Machine {}: cannot archive {}: {}", mid, s.id, archived.error));
            return false;
        }
        log_debug(fmt::format("Archived {} to {}", s.id, archived.value.string()));
    }

    auto saved = store_.save(result.registry);
    if (saved.is_err()) {
        log_error(fmt::format("Machine {}: registry not saved: {}", mid, saved.error));
        return false;
    }
    registry = std::move(result.registry);

    if (notifier_) {
        for (const auto& ev : result.events) {
            notifier_->publish(ev);
        }
    }
    return true;
}

bool Monitor::check_alerts(MachineRegistry& registry, const std::optional<MachineState>& previous,
                           const MachineState& current, const std::string& now) {
    const int64_t mid = current.machine_id;
    bool dirty = false;

    bool has_error = current.error_description && !current.error_description->empty();
    bool had_error = previous && previous->error_description && !previous->error_description->empty();

    if (has_error) {
        if (ping_due(registry.last_error_notified_at, now)) {
            log_error(fmt::format("Machine {} error: {}", mid, *current.error_description));
            if (notifier_) notifier_->send_error(mid, *current.error_description);
            registry.last_error_notified_at = now;
            dirty = true;
        }
    } else if (had_error) {
        log_info(fmt::format("Machine {} recovered from error.", mid));
        if (notifier_) notifier_->send_recovery(mid);
        if (registry.last_error_notified_at) {
            registry.last_error_notified_at.reset();
            dirty = true;
        }
    }

    bool timed_out = current.timeout > 0;
    bool was_timed_out = previous && previous->timeout > 0;

    if (timed_out) {
        if (ping_due(registry.last_timeout_notified_at, now)) {
            log_error(fmt::format("Machine {} timeout: {}s", mid, current.timeout));
            if (notifier_) notifier_->send_error(mid, fmt::format("Timeout: {}s", current.timeout));
            registry.last_timeout_notified_at = now;
            dirty = true;
        }
    } else if (was_timed_out) {
        log_info(fmt::format("Machine {} recovered from timeout.", mid));
        if (notifier_) notifier_->send_recovery(mid);
        if (registry.last_timeout_notified_at) {
            registry.last_timeout_notified_at.reset();
            dirty = true;
        }
    }
    return dirty;
}

// ── Loop ────────────────────────────────────────────────────

void Monitor::run(const std::atomic<bool>& stop) {
    if (config_.notify().on_start && notifier_) {
        notifier_->send_system_message("Monitor Started", {
            "Monitor started at " + format_timestamp(clock()),
            fmt::format("Machines: {}", config_.machine_ids()),
            fmt::format("Check frequency: {}s", config_.check_frequency()),
        });
    }

    try {
        startup();
        while (!stop.load()) {
            int ok = run_cycle();
            log_debug(fmt::format("Cycle done: {} machine(s) processed", ok));
            if (stop.load()) break;
            log_info(fmt::format("Sleeping for {} seconds.", config_.check_frequency()));
            platform::sleep_unless_stopped(config_.check_frequency() * 1000, stop, STOP_POLL_SLICE_MS);
        }
    } catch (const std::exception& e) {
        log_error(fmt::format("Fatal error in monitor loop: {}", e.what()));
        if (config_.notify().on_shutdown && notifier_) {
            notifier_->send_system_message("Monitor Crashed", {
                "Monitor crashed at " + format_timestamp(clock()),
                std::string("Reason: ") + e.what(),
            });
        }
        throw;
    }

    log_info("Received stop signal, shutting down gracefully.");
    if (config_.notify().on_shutdown && notifier_) {
        notifier_->send_system_message("Monitor Stopped", {
            "Monitor stopped at " + format_timestamp(clock()),
        });
    }
}
