#include "registry.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>

void MachineRegistry::observe(const MachineState& machine) {
    counters = machine.counters;
    gpu_occupancy = machine.gpu_occupancy;
    alloc_disk_space = machine.alloc_disk_space;
    gpu_name = machine.gpu_name;
    num_gpus = machine.num_gpus;
}

std::string MachineRegistry::allocate_session_id() {
    return make_session_id(machine_id, next_session_seq++);
}

Session* MachineRegistry::find(const std::string& id) {
    auto it = sessions.find(id);
    return it == sessions.end() ? nullptr : &it->second;
}

const Session* MachineRegistry::find(const std::string& id) const {
    auto it = sessions.find(id);
    return it == sessions.end() ? nullptr : &it->second;
}

std::vector<std::string> MachineRegistry::stored_session_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, s] : sessions) {
        if (s.status == SessionStatus::Stored) ids.push_back(id);
    }
    return ids;
}

bool MachineRegistry::has_stored_sessions() const {
    return std::any_of(sessions.begin(), sessions.end(), [](const auto& kv) {
        return kv.second.status == SessionStatus::Stored;
    });
}

void MachineRegistry::assign_slots(const std::vector<int>& gpus, const std::string& id) {
    for (int idx : gpus) {
        slots[idx] = id;
    }
}

void MachineRegistry::release_slots_of(const std::string& id) {
    for (auto it = slots.begin(); it != slots.end();) {
        if (it->second == id) {
            it = slots.erase(it);
        } else {
            ++it;
        }
    }
}

// ── Invariant checks ─────────────────────────────────────────

template <typename Segment>
static void check_timeline(const std::string& sid, const char* dim,
                           const std::vector<Segment>& segs, bool gapless,
                           std::vector<std::string>& out) {
    for (size_t i = 0; i < segs.size(); ++i) {
        const auto& seg = segs[i];
        if (seg.is_open() && i + 1 != segs.size()) {
            out.push_back(fmt::format("{}: {} segment {} is open but not last", sid, dim, i));
        }
        if (seg.end && seconds_between(seg.start, *seg.end) < 0) {
            out.push_back(fmt::format("{}: {} segment {} ends before it starts", sid, dim, i));
        }
        if (i + 1 < segs.size() && seg.end) {
            double gap = seconds_between(*seg.end, segs[i + 1].start);
            if (gap < 0) {
                out.push_back(fmt::format("{}: {} segments {} and {} overlap", sid, dim, i, i + 1));
            } else if (gapless && gap > 0) {
                out.push_back(fmt::format("{}: gap between {} segments {} and {}", sid, dim, i, i + 1));
            }
        }
    }
}

std::vector<std::string> registry_violations(const MachineRegistry& registry) {
    std::vector<std::string> out;

    for (const auto& [idx, sid] : registry.slots) {
        const auto* s = registry.find(sid);
        if (!s) {
            out.push_back(fmt::format("slot {} points at unknown session {}", idx, sid));
        } else if (s->status != SessionStatus::Running) {
            out.push_back(fmt::format("slot {} points at {} session {}", idx, to_string(s->status), sid));
        } else if (std::find(s->gpus.begin(), s->gpus.end(), idx) == s->gpus.end()) {
            out.push_back(fmt::format("slot {} points at {} which does not own it", idx, sid));
        }
    }

    std::set<int> owned;
    for (const auto& [sid, s] : registry.sessions) {
        if (s.status == SessionStatus::Ended) {
            out.push_back(fmt::format("{}: ended session still active", sid));
        }
        if (s.status == SessionStatus::Running) {
            for (int idx : s.gpus) {
                if (!owned.insert(idx).second) {
                    out.push_back(fmt::format("slot {} owned by more than one running session", idx));
                }
            }
            if (!s.open_gpu()) {
                out.push_back(fmt::format("{}: running without an open gpu segment", sid));
            }
        }
        if (s.status == SessionStatus::Stored && s.open_gpu()) {
            out.push_back(fmt::format("{}: stored with an open gpu segment", sid));
        }

        check_timeline(sid, "gpu", s.gpu_segments, false, out);
        check_timeline(sid, "storage", s.storage_segments, true, out);

        auto dash = sid.rfind('-');
        int seq = dash == std::string::npos ? -1 : safe_stoi(sid.substr(dash + 1), -1);
        if (seq >= registry.next_session_seq) {
            out.push_back(fmt::format("{}: id not below next sequence {}", sid, registry.next_session_seq));
        }
    }
    return out;
}
