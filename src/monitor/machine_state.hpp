#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

namespace YAML { class Node; class Emitter; }

// What the upstream source tells us about one client on the machine. Every
// field is optional; a hint only applies to a session whose GPU set matches.
struct ClientHint {
    std::vector<int> gpus;
    std::optional<double> storage_gb;
    std::optional<std::string> end_date;    // ISO UTC
};

bool operator==(const ClientHint& a, const ClientHint& b);
bool operator!=(const ClientHint& a, const ClientHint& b);

struct RentalCounters {
    int running = 0;
    int running_on_demand = 0;
    int resident = 0;
    int resident_on_demand = 0;
};

// One polled snapshot of a machine. Only current state, no session identity.
struct MachineState {
    int64_t machine_id = 0;
    std::string gpu_name;
    int num_gpus = 0;
    std::string gpu_occupancy;          // space separated codes, e.g. "D D x x"

    // Market rates by occupancy code
    double listed_gpu_cost = 0.0;       // D, $/hr/gpu
    double min_bid_price = 0.0;         // I
    std::optional<double> bid_gpu_cost; // R
    double listed_storage_cost = 0.0;   // $/GB/month

    double alloc_disk_space = 0.0;      // GB
    RentalCounters counters;

    std::optional<std::string> error_description;
    int timeout = 0;
    bool listed = false;
    std::string verification;
    double num_recent_reports = 0.0;
    std::optional<std::string> client_end_date;
    std::vector<ClientHint> clients;

    std::vector<std::string> slot_codes() const;

    // Observed $/hr/gpu for an occupancy code; 0 for free or unknown codes.
    double rate_for_code(const std::string& code) const;
};

// Parse one machine entry from the upstream JSON (or our own YAML snapshot).
// Rejects snapshots that cannot be reconciled safely.
Result<MachineState> parse_machine_state(const YAML::Node& node);

void emit_machine_state(YAML::Emitter& out, const MachineState& m);

// Monitored fields that differ between two snapshots of the same machine.
std::vector<std::string> changed_fields(const MachineState& old_state, const MachineState& new_state);

// True if any of `fields` feeds rental reconciliation.
bool affects_rentals(const std::vector<std::string>& fields);
