#pragma once

#include <string>
#include <vector>
#include <optional>

enum class SessionStatus { Running, Stored, Ended };

const char* to_string(SessionStatus status);
std::optional<SessionStatus> parse_session_status(const std::string& s);

// Pause budgets are tracked separately for on-demand rentals and everything else
enum class DemandClass { OnDemand, Other };

DemandClass demand_class_for(const std::string& rental_type);

struct GpuSegment {
    std::string start;
    std::optional<std::string> end;     // nullopt = open
    double rate = 0.0;                  // $/hr/gpu
    int gpu_count = 0;

    bool is_open() const { return !end.has_value(); }
};

struct StorageSegment {
    std::string start;
    std::optional<std::string> end;
    double rate_per_gb_month = 0.0;     // $/GB/month

    bool is_open() const { return !end.has_value(); }
};

struct SessionTotals {
    double duration_secs = 0.0;
    double gpu = 0.0;
    double storage = 0.0;

    double total() const { return gpu + storage; }
};

// One rental as reconstructed from occupancy snapshots, with its billing ledger.
//
// GPU and storage are billed independently. Each dimension is an ordered list
// of segments; at most one segment per dimension is open, and reopening always
// closes the previous segment at the same instant so the timeline has no gaps.
struct Session {
    std::string id;
    SessionStatus status = SessionStatus::Running;
    std::vector<int> gpus;              // owned slots; last held set while Stored
    std::string rental_type;            // occupancy code: "D", "I" or "R"

    // Contract ceilings, first observed and never raised
    double gpu_contracted_rate = 0.0;       // $/hr/gpu
    double storage_contracted_rate = 0.0;   // $/GB/month

    double storage_gb = 0.0;

    std::vector<GpuSegment> gpu_segments;
    std::vector<StorageSegment> storage_segments;

    std::string start_time;
    std::string last_state_change;
    std::optional<std::string> client_end_date;

    // Frozen by finalize()
    std::optional<std::string> end_time;
    std::optional<double> rental_duration;      // seconds
    std::optional<double> earned_gpu;
    std::optional<double> earned_storage;
    std::optional<double> estimated_earnings;

    // ── Ledger ──────────────────────────────────────────────

    // Close any open GPU segment at `ts` and append a new one.
    void open_gpu_segment(double rate, int gpu_count, const std::string& ts);
    void close_gpu_segment(const std::string& ts);

    // Storage cost never goes up within a session: a rate at or above the open
    // segment's rate is ignored. Returns true when a new segment was opened.
    bool open_storage_segment(double rate_per_gb_month, const std::string& ts);
    void close_storage_segment(const std::string& ts);

    const GpuSegment* open_gpu() const;
    const StorageSegment* open_storage() const;

    // Earnings of every segment, open segments measured up to `as_of`.
    SessionTotals totals(const std::string& as_of) const;

    // Close everything at `ts`, freeze duration and earnings, mark Ended.
    void finalize(const std::string& ts);

    // ── Rates ───────────────────────────────────────────────

    // min(observed, ceiling); an unset (zero) ceiling bills the observed rate.
    double effective_gpu_rate(double observed) const;
    double effective_storage_rate(double observed) const;

    // Current burn rate in $/hr from the open segments.
    double hourly_rate() const;

    DemandClass demand_class() const { return demand_class_for(rental_type); }
    bool is_active() const { return status != SessionStatus::Ended; }
};

// "m<machine>-<seq zero-padded>"
std::string make_session_id(long long machine_id, int seq);
