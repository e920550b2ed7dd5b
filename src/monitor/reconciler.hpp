#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <notify/event.hpp>
#include "registry.hpp"
#include "machine_state.hpp"

// Outcome of one reconciliation pass over one machine. The caller persists
// `registry` once, archives `ended`, then publishes `events`.
struct ReconcileResult {
    MachineRegistry registry;
    std::vector<LifecycleEvent> events;
    std::vector<Session> ended;             // finalized this pass
    std::vector<std::string> warnings;      // ambiguities and invariant breaks
};

// Infer session transitions from one snapshot pair.
//
// The baseline (occupancy, disk, counters) is the one recorded in `registry`
// by its last reconcile; `previous` only fills in for a registry without one.
// The pass runs in four steps against the same (baseline, current) pair:
//   a. freed slots: shrink, pause or end the sessions that owned them
//   b. claimed slots: continue, resume or start sessions
//   c. a disk drop not explained by (a) ends the closest Stored session
//   d. every active session is repriced for storage (drops only)
//
// `registry` is taken by value; nothing outside the returned result changes.
ReconcileResult reconcile(MachineRegistry registry,
                          const MachineState& previous,
                          const MachineState& current,
                          const std::string& now,
                          const ReconcileConfig& config = {});

// ── Claim matching ──────────────────────────────────────────

enum class ClaimMatch {
    Continuity,     // a Running session already owns exactly these slots
    ResumeExact,    // a Stored session last held exactly these slots
    ResumeByDisk,   // the only Stored session, disk unchanged
    NewSession,
};

struct ClaimCandidate {
    ClaimMatch kind = ClaimMatch::NewSession;
    std::string session_id;                 // empty for NewSession
};

// Pick the session a claimed slot group belongs to. Candidates are tried in
// the order of ClaimMatch; ties inside a rank go to the lowest session id.
ClaimCandidate select_claim_match(const MachineRegistry& registry,
                                  const std::vector<int>& slots,
                                  double disk_delta,
                                  double tolerance);

const char* to_string(ClaimMatch kind);

// ── Startup seeding ─────────────────────────────────────────

// True when occupied slots exist but the registry has nothing that could
// account for them (no slot map and no Stored sessions).
bool needs_seeding(const MachineRegistry& registry, const MachineState& machine);

// Split `indices` into `session_count` contiguous chunks; the first chunk
// takes the surplus, the rest one slot each. Count is clamped to [1, size].
std::vector<std::vector<int>> split_indices(const std::vector<int>& indices, int session_count);

// Create Running sessions for occupied slots the registry does not track yet.
// Returns the ids created.
std::vector<std::string> seed_registry(MachineRegistry& registry,
                                       const MachineState& machine,
                                       const std::string& now);

MachineSummary summarize_machine(const MachineRegistry& registry, const std::string& now);
