#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <ledger/session.hpp>
#include "machine_state.hpp"

// Everything remembered about one machine between polls.
struct MachineRegistry {
    int64_t machine_id = 0;
    std::map<int, std::string> slots;           // slot index -> owning session id
    std::map<std::string, Session> sessions;    // active (Running or Stored) sessions
    int next_session_seq = 1;

    RentalCounters counters;                    // counters at the last reconcile
    std::string gpu_occupancy;                  // occupancy at the last reconcile
    std::optional<double> alloc_disk_space;     // disk at the last reconcile; unset in older files
    std::string gpu_name;
    int num_gpus = 0;

    std::optional<std::string> last_error_notified_at;
    std::optional<std::string> last_timeout_notified_at;

    // Record `machine` as the baseline the next reconcile diffs against.
    void observe(const MachineState& machine);

    // True once the registry carries its own occupancy, disk and counters.
    bool has_baseline() const { return alloc_disk_space.has_value(); }

    // Next id in the machine's sequence; advances the counter.
    std::string allocate_session_id();

    Session* find(const std::string& id);
    const Session* find(const std::string& id) const;

    std::vector<std::string> stored_session_ids() const;
    bool has_stored_sessions() const;

    // Point every slot in `gpus` at `id`.
    void assign_slots(const std::vector<int>& gpus, const std::string& id);

    // Drop every slot entry that points at `id`.
    void release_slots_of(const std::string& id);
};

// Broken invariants, one message each; empty when the registry is consistent:
//   - every slot entry points at an existing Running session that lists the slot
//   - no slot is listed by two Running sessions
//   - each session has at most one open segment per dimension, and segments
//     are ordered, non-overlapping and end after they start
//   - session ids in the registry are below the next sequence number
std::vector<std::string> registry_violations(const MachineRegistry& registry);
