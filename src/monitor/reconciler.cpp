#include "reconciler.hpp"
#include "occupancy.hpp"
#include "pause_budget.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

static bool same_slots(std::vector<int> a, std::vector<int> b) {
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    return a == b;
}

static const ClientHint* hint_for(const MachineState& m, const std::vector<int>& gpus) {
    for (const auto& c : m.clients) {
        if (!c.gpus.empty() && same_slots(c.gpus, gpus)) return &c;
    }
    return nullptr;
}

const char* to_string(ClaimMatch kind) {
    switch (kind) {
        case ClaimMatch::Continuity:   return "continuity";
        case ClaimMatch::ResumeExact:  return "resume";
        case ClaimMatch::ResumeByDisk: return "resume (disk-continuity)";
        case ClaimMatch::NewSession:   return "new";
    }
    return "new";
}

ClaimCandidate select_claim_match(const MachineRegistry& registry,
                                  const std::vector<int>& slots,
                                  double disk_delta,
                                  double tolerance) {
    // sessions is ordered by id, so the first hit in each rank is the lowest id
    for (const auto& [sid, s] : registry.sessions) {
        if (s.status == SessionStatus::Running && same_slots(s.gpus, slots)) {
            return {ClaimMatch::Continuity, sid};
        }
    }
    for (const auto& [sid, s] : registry.sessions) {
        if (s.status == SessionStatus::Stored && same_slots(s.gpus, slots)) {
            return {ClaimMatch::ResumeExact, sid};
        }
    }
    if (std::fabs(disk_delta) < tolerance) {
        auto stored = registry.stored_session_ids();
        if (stored.size() == 1) {
            return {ClaimMatch::ResumeByDisk, stored.front()};
        }
    }
    return {};
}

MachineSummary summarize_machine(const MachineRegistry& registry, const std::string& now) {
    MachineSummary sum;
    sum.machine_id = registry.machine_id;
    sum.gpu_name = registry.gpu_name;
    sum.num_gpus = registry.num_gpus;
    sum.gpu_occupancy = registry.gpu_occupancy;
    sum.as_of = now;
    for (const auto& [sid, s] : registry.sessions) {
        sum.sessions.push_back(s);
        if (s.status == SessionStatus::Running) sum.running_sessions++;
        if (s.status == SessionStatus::Stored) sum.stored_sessions++;
        sum.hourly_earnings += s.hourly_rate();
        sum.accrued_earnings += s.totals(now).total();
    }
    return sum;
}

// ── Reconcile pass ──────────────────────────────────────────

namespace {

// Mutable context for one pass; the registry inside is the pass's own copy.
struct Pass {
    ReconcileResult result;
    const std::string& now;

    Pass(MachineRegistry reg, const std::string& ts) : now(ts) {
        result.registry = std::move(reg);
    }

    MachineRegistry& reg() { return result.registry; }

    void warn(const std::string& msg) {
        log_warn(msg);
        result.warnings.push_back(msg);
    }

    void emit(EventType type, const Session& s, double rate = 0.0,
              const std::string& code = "", const std::vector<int>& indices = {}) {
        LifecycleEvent ev;
        ev.type = type;
        ev.machine_id = reg().machine_id;
        ev.timestamp = now;
        ev.session = s;
        ev.rate = rate;
        ev.rental_type = code;
        ev.indices = indices;
        result.events.push_back(std::move(ev));
    }

    // Finalize, move out of the registry, queue for archive.
    void end_session(const std::string& sid) {
        auto it = reg().sessions.find(sid);
        if (it == reg().sessions.end()) return;
        Session s = it->second;
        reg().sessions.erase(it);
        reg().release_slots_of(sid);
        s.finalize(now);
        emit(EventType::RentalEnd, s);
        result.ended.push_back(std::move(s));
    }
};

} // namespace

ReconcileResult reconcile(MachineRegistry registry,
                          const MachineState& previous,
                          const MachineState& current,
                          const std::string& now,
                          const ReconcileConfig& config) {
    const double tol = config.disk_tolerance_gb;
    const int64_t mid = current.machine_id;

    // Baseline: what the registry last applied, else the saved snapshot.
    const bool own = registry.has_baseline();
    const double old_disk = own ? *registry.alloc_disk_space : previous.alloc_disk_space;
    const RentalCounters old_counters = own ? registry.counters : previous.counters;
    const double disk_delta = current.alloc_disk_space - old_disk;

    auto old_codes = registry.gpu_occupancy.empty()
        ? previous.slot_codes() : split_ws(registry.gpu_occupancy);
    auto new_codes = current.slot_codes();
    size_t len = std::max(old_codes.size(), new_codes.size());
    old_codes = pad_codes(std::move(old_codes), len);
    new_codes = pad_codes(std::move(new_codes), len);

    OccupancyDiff diff = diff_occupancy(old_codes, new_codes);
    PauseBudget budget = estimate_pause_budget(old_counters, current.counters);

    Pass pass(std::move(registry), now);
    auto& reg = pass.reg();
    reg.machine_id = mid;

    if (!diff.empty()) {
        log_debug(fmt::format("machine {}: occupancy '{}' -> '{}', ended {}, started {}, disk {:+.2f} GB",
                              mid, fmt::join(old_codes, " "), current.gpu_occupancy,
                              diff.ended, diff.started, disk_delta));
    }

    // ── (a) Freed slots ─────────────────────────────────────

    std::map<std::string, std::vector<int>> freed_by_session;
    for (int idx : diff.ended) {
        auto it = reg.slots.find(idx);
        if (it == reg.slots.end()) continue;
        freed_by_session[it->second].push_back(idx);
        reg.slots.erase(it);
    }

    double ended_storage = 0.0;
    std::set<std::string> paused_this_pass;

    for (const auto& [sid, freed] : freed_by_session) {
        Session* s = reg.find(sid);
        if (!s) {
            pass.warn(fmt::format("machine {}: slots {} pointed at unknown session {}", mid, freed, sid));
            continue;
        }

        std::vector<int> remaining;
        for (int g : s->gpus) {
            if (std::find(freed.begin(), freed.end(), g) != freed.end()) continue;
            if (g < 0 || static_cast<size_t>(g) >= new_codes.size()) {
                pass.warn(fmt::format("machine {}: session {} lists slot {} outside the {} reported; dropping it",
                                      mid, sid, g, new_codes.size()));
                reg.slots.erase(g);
                continue;
            }
            remaining.push_back(g);
        }

        if (!remaining.empty()) {
            double observed = current.rate_for_code(new_codes[remaining.front()]);
            s->gpus = remaining;
            s->open_gpu_segment(s->effective_gpu_rate(observed), static_cast<int>(remaining.size()), now);
            log_debug(fmt::format("GPUs {} released: machine {}, session {}, remaining {}",
                                  freed, mid, sid, remaining));
            continue;
        }

        double held = s->storage_gb;
        DemandClass cls = s->demand_class();
        bool pause = budget.available(cls) && std::fabs(disk_delta) < tol;
        bool clean_end = std::fabs(disk_delta + held) < tol;

        if (pause) {
            budget.consume(cls);
            s->close_gpu_segment(now);
            s->status = SessionStatus::Stored;
            paused_this_pass.insert(sid);
            log_info(fmt::format("Session paused: machine {}, session {}, GPUs released {}", mid, sid, s->gpus));
            pass.emit(EventType::RentalPause, *s);
            continue;
        }

        if (!clean_end) {
            pass.warn(fmt::format("machine {}: ambiguous disk change {:.2f} GB for session {} holding {:.2f} GB; treating as ended",
                                  mid, disk_delta, sid, held));
        }
        ended_storage += held;
        log_info(fmt::format("Rental ended: machine {}, session {}", mid, sid));
        pass.end_session(sid);
    }

    // ── (b) Claimed slots ───────────────────────────────────

    std::map<std::pair<std::string, double>, std::vector<int>> claimed;
    for (int idx : diff.started) {
        const auto& code = new_codes[idx];
        claimed[{code, current.rate_for_code(code)}].push_back(idx);
    }

    double unclaimed_growth = std::max(disk_delta, 0.0);

    for (const auto& [key, indices] : claimed) {
        const auto& [code, rate] = key;
        ClaimCandidate match = select_claim_match(reg, indices, disk_delta, tol);

        if (match.kind == ClaimMatch::Continuity) {
            reg.assign_slots(indices, match.session_id);
            log_debug(fmt::format("Continuity detected: machine {}, session {}, gpus {}",
                                  mid, match.session_id, indices));
            continue;
        }

        if (match.kind == ClaimMatch::ResumeExact || match.kind == ClaimMatch::ResumeByDisk) {
            Session* s = reg.find(match.session_id);
            s->gpus = indices;
            s->rental_type = code;
            s->status = SessionStatus::Running;
            s->open_gpu_segment(s->effective_gpu_rate(rate), static_cast<int>(indices.size()), now);
            reg.assign_slots(indices, s->id);
            paused_this_pass.erase(s->id);
            log_info(fmt::format("Session resumed ({}): machine {}, session {}, gpus {}",
                                 to_string(match.kind), mid, s->id, indices));
            pass.emit(EventType::RentalResume, *s, rate, code, indices);
            continue;
        }

        Session s;
        s.id = reg.allocate_session_id();
        s.status = SessionStatus::Running;
        s.gpus = indices;
        s.rental_type = code;
        s.gpu_contracted_rate = rate;
        s.storage_contracted_rate = current.listed_storage_cost;
        s.start_time = now;
        s.last_state_change = now;

        const ClientHint* hint = hint_for(current, indices);
        if (hint && hint->storage_gb) {
            s.storage_gb = *hint->storage_gb;
            unclaimed_growth = std::max(unclaimed_growth - s.storage_gb, 0.0);
        } else {
            s.storage_gb = unclaimed_growth;
            unclaimed_growth = 0.0;
        }
        if (hint && hint->end_date) s.client_end_date = hint->end_date;

        s.open_storage_segment(s.effective_storage_rate(current.listed_storage_cost), now);
        s.open_gpu_segment(s.effective_gpu_rate(rate), static_cast<int>(indices.size()), now);
        reg.assign_slots(indices, s.id);

        log_info(fmt::format("New rental: machine {}, session {}, type {}, rate {}, gpus {}",
                             mid, s.id, code, rate, indices));
        pass.emit(EventType::RentalStart, s, rate, code, indices);
        reg.sessions[s.id] = std::move(s);
    }

    // ── (c) Residual disk-only termination ──────────────────

    double residual = disk_delta + ended_storage;
    if (residual < -DISK_DROP_THRESHOLD_GB) {
        double target = -residual;
        std::string best;
        double best_diff = 0.0;
        for (const auto& [sid, s] : reg.sessions) {
            if (s.status != SessionStatus::Stored || paused_this_pass.count(sid)) continue;
            double d = std::fabs(s.storage_gb - target);
            if (best.empty() || d < best_diff) {
                best = sid;
                best_diff = d;
            }
        }
        if (!best.empty() && best_diff <= tol) {
            log_info(fmt::format("Rental ended (disk-only): machine {}, session {}", mid, best));
            pass.end_session(best);
        } else if (!best.empty()) {
            pass.warn(fmt::format("machine {}: disk-only drop {:.2f} GB did not match a stored session within tolerance",
                                  mid, target));
        }
    }

    // ── (d) Storage repricing ───────────────────────────────

    for (auto& [sid, s] : reg.sessions) {
        double rate = s.effective_storage_rate(current.listed_storage_cost);
        if (s.open_storage_segment(rate, now)) {
            log_debug(fmt::format("Storage repriced: machine {}, session {}, {:.4f} $/GB/month", mid, sid, rate));
        }
        if (const ClientHint* hint = hint_for(current, s.gpus)) {
            if (hint->end_date) s.client_end_date = hint->end_date;
        }
    }

    reg.observe(current);

    MachineSummary summary = summarize_machine(reg, now);
    for (auto& ev : pass.result.events) {
        ev.summary = summary;
    }

    for (const auto& v : registry_violations(reg)) {
        pass.warn(fmt::format("machine {}: registry invariant broken: {}", mid, v));
    }

    return std::move(pass.result);
}

// ── Startup seeding ─────────────────────────────────────────

bool needs_seeding(const MachineRegistry& registry, const MachineState& machine) {
    if (!registry.slots.empty() || registry.has_stored_sessions()) return false;
    auto codes = machine.slot_codes();
    return std::any_of(codes.begin(), codes.end(), is_occupied);
}

std::vector<std::vector<int>> split_indices(const std::vector<int>& indices, int session_count) {
    std::vector<std::vector<int>> chunks;
    if (indices.empty()) return chunks;

    int total = static_cast<int>(indices.size());
    int count = std::max(1, std::min(session_count, total));
    int cursor = 0;
    int remaining = total;
    for (int i = 0; i < count; ++i) {
        int sessions_left = count - i;
        int take = std::max(1, remaining - (sessions_left - 1));
        chunks.emplace_back(indices.begin() + cursor, indices.begin() + cursor + take);
        cursor += take;
        remaining -= take;
    }
    return chunks;
}

std::vector<std::string> seed_registry(MachineRegistry& registry,
                                       const MachineState& machine,
                                       const std::string& now) {
    std::vector<std::string> created;
    registry.machine_id = machine.machine_id;

    std::map<std::pair<std::string, double>, std::vector<int>> groups;
    auto codes = machine.slot_codes();
    for (size_t i = 0; i < codes.size(); ++i) {
        int idx = static_cast<int>(i);
        if (!is_occupied(codes[i]) || registry.slots.count(idx)) continue;
        groups[{codes[i], machine.rate_for_code(codes[i])}].push_back(idx);
    }

    int left_on_demand = machine.counters.running_on_demand;
    int left_other = std::max(machine.counters.running - machine.counters.running_on_demand, 0);

    for (const auto& [key, indices] : groups) {
        const auto& [code, rate] = key;
        int& left = demand_class_for(code) == DemandClass::OnDemand ? left_on_demand : left_other;
        int desired = std::min(static_cast<int>(indices.size()), std::max(left, 0));
        left = std::max(left - desired, 0);

        for (const auto& chunk : split_indices(indices, desired)) {
            Session s;
            s.id = registry.allocate_session_id();
            s.status = SessionStatus::Running;
            s.gpus = chunk;
            s.rental_type = code;
            s.gpu_contracted_rate = rate;
            s.storage_contracted_rate = machine.listed_storage_cost;
            s.start_time = now;
            s.last_state_change = now;
            if (const ClientHint* hint = hint_for(machine, chunk)) {
                if (hint->storage_gb) s.storage_gb = *hint->storage_gb;
                if (hint->end_date) s.client_end_date = hint->end_date;
            }
            s.open_gpu_segment(rate, static_cast<int>(chunk.size()), now);
            s.open_storage_segment(machine.listed_storage_cost, now);
            registry.assign_slots(chunk, s.id);

            log_info(fmt::format("Detected ongoing rental at startup: machine {}, session {}, type {}, rate {}, gpus {}",
                                 machine.machine_id, s.id, code, rate, chunk));
            created.push_back(s.id);
            registry.sessions[s.id] = std::move(s);
        }
    }

    registry.observe(machine);
    return created;
}
