#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <notify/dispatcher.hpp>
#include "machine_poller.hpp"
#include "reconciler.hpp"
#include "registry_store.hpp"

// Drives the poll / reconcile / persist / notify cycle for every configured
// machine. One machine failing never stops the others; a pass is never
// interrupted once started.
class Monitor {
public:
    // `notifier` may be null (no targets configured).
    Monitor(const Config& config, MachineSource& source, RegistryStore& store,
            NotificationDispatcher* notifier);

    // Seed registries for machines with untracked occupancy and report what is
    // already running. Sends the startup summary when configured.
    void startup();

    // Fetch once and process every machine. Returns how many were processed
    // without error; -1 when the fetch itself failed.
    int run_cycle();

    // Start message, startup(), then cycles every check_frequency seconds
    // until `stop` is set; stop message on the way out. A crash sends a crash
    // message and rethrows.
    void run(const std::atomic<bool>& stop);

    // Clock used for every timestamp the monitor writes.
    std::function<std::string()> clock;

private:
    bool process_machine(const MachineState& current);
    bool apply_rentals(MachineRegistry& registry, const MachineState& previous,
                       const MachineState& current, const std::string& now);

    // Error / timeout pings and recoveries. True if `registry` changed.
    bool check_alerts(MachineRegistry& registry, const std::optional<MachineState>& previous,
                      const MachineState& current, const std::string& now);

    bool ping_due(const std::optional<std::string>& last, const std::string& now) const;
    void log_existing_sessions(const MachineRegistry& registry) const;

    const Config& config_;
    MachineSource& source_;
    RegistryStore& store_;
    NotificationDispatcher* notifier_;
};
