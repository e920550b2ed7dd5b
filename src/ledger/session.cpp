#include "session.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Running: return "running";
        case SessionStatus::Stored:  return "stored";
        case SessionStatus::Ended:   return "ended";
    }
    return "running";
}

std::optional<SessionStatus> parse_session_status(const std::string& s) {
    if (s == "running") return SessionStatus::Running;
    if (s == "stored") return SessionStatus::Stored;
    if (s == "ended") return SessionStatus::Ended;
    return std::nullopt;
}

DemandClass demand_class_for(const std::string& rental_type) {
    return (rental_type.size() == 1 && rental_type[0] == CODE_ON_DEMAND)
        ? DemandClass::OnDemand : DemandClass::Other;
}

std::string make_session_id(long long machine_id, int seq) {
    return fmt::format("m{}-{:0{}d}", machine_id, seq, SESSION_ID_WIDTH);
}

// ── Ledger ──────────────────────────────────────────────────

void Session::open_gpu_segment(double rate, int gpu_count, const std::string& ts) {
    close_gpu_segment(ts);
    GpuSegment seg;
    seg.start = ts;
    seg.rate = rate;
    seg.gpu_count = gpu_count;
    gpu_segments.push_back(seg);
    last_state_change = ts;
}

void Session::close_gpu_segment(const std::string& ts) {
    if (!gpu_segments.empty() && gpu_segments.back().is_open()) {
        gpu_segments.back().end = ts;
        last_state_change = ts;
    }
}

bool Session::open_storage_segment(double rate_per_gb_month, const std::string& ts) {
    if (!storage_segments.empty() && storage_segments.back().is_open()) {
        auto& cur = storage_segments.back();
        if (rate_per_gb_month >= cur.rate_per_gb_month) {
            return false;
        }
        cur.end = ts;
    }
    StorageSegment seg;
    seg.start = ts;
    seg.rate_per_gb_month = rate_per_gb_month;
    storage_segments.push_back(seg);
    return true;
}

void Session::close_storage_segment(const std::string& ts) {
    if (!storage_segments.empty() && storage_segments.back().is_open()) {
        storage_segments.back().end = ts;
    }
}

const GpuSegment* Session::open_gpu() const {
    if (!gpu_segments.empty() && gpu_segments.back().is_open()) return &gpu_segments.back();
    return nullptr;
}

const StorageSegment* Session::open_storage() const {
    if (!storage_segments.empty() && storage_segments.back().is_open()) return &storage_segments.back();
    return nullptr;
}

SessionTotals Session::totals(const std::string& as_of) const {
    SessionTotals t;
    const std::string& until = end_time ? *end_time : as_of;
    t.duration_secs = std::max(0.0, seconds_between(start_time, until));

    for (const auto& seg : gpu_segments) {
        double hours = hours_between(seg.start, seg.end.value_or(as_of));
        t.gpu += seg.rate * seg.gpu_count * hours;
    }
    for (const auto& seg : storage_segments) {
        double hours = hours_between(seg.start, seg.end.value_or(as_of));
        t.storage += seg.rate_per_gb_month * storage_gb * hours / HOURS_PER_MONTH;
    }
    return t;
}

void Session::finalize(const std::string& ts) {
    close_gpu_segment(ts);
    close_storage_segment(ts);
    end_time = ts;
    last_state_change = ts;
    status = SessionStatus::Ended;

    auto t = totals(ts);
    rental_duration = t.duration_secs;
    earned_gpu = t.gpu;
    earned_storage = t.storage;
    estimated_earnings = t.total();
}

// ── Rates ───────────────────────────────────────────────────

double Session::effective_gpu_rate(double observed) const {
    if (gpu_contracted_rate <= 0.0) return observed;
    return std::min(observed, gpu_contracted_rate);
}

double Session::effective_storage_rate(double observed) const {
    if (storage_contracted_rate <= 0.0) return observed;
    return std::min(observed, storage_contracted_rate);
}

double Session::hourly_rate() const {
    double hourly = 0.0;
    if (const auto* g = open_gpu()) {
        hourly += g->rate * g->gpu_count;
    }
    if (const auto* s = open_storage()) {
        hourly += s->rate_per_gb_month * storage_gb / HOURS_PER_MONTH;
    }
    return hourly;
}
