#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <ledger/session.hpp>

enum class EventType {
    System,
    Startup,
    RentalStart,
    RentalEnd,
    RentalPause,
    RentalResume,
    Error,
    Recovery,
};

// Names used in config allow-lists and message titles ("rental_start", ...)
const char* event_name(EventType type);
std::optional<EventType> parse_event_type(const std::string& name);

// Machine-level context attached to every lifecycle event.
struct MachineSummary {
    int64_t machine_id = 0;
    std::string gpu_name;
    int num_gpus = 0;
    std::string gpu_occupancy;
    int running_sessions = 0;
    int stored_sessions = 0;
    double hourly_earnings = 0.0;       // sum of open segment rates, $/hr
    double accrued_earnings = 0.0;      // totals of active sessions so far
    std::string as_of;                  // instant the earnings were measured at
    std::vector<Session> sessions;      // active sessions, id order
};

struct LifecycleEvent {
    EventType type = EventType::RentalStart;
    int64_t machine_id = 0;
    std::string timestamp;
    Session session;                    // state right after the transition
    double rate = 0.0;                  // observed $/hr/gpu (start, resume)
    std::string rental_type;            // occupancy code (start, resume)
    std::vector<int> indices;           // slots claimed (start, resume)
    MachineSummary summary;
};

// Receives lifecycle events once a machine's registry has been persisted.
// Implementations must not block the caller on delivery.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const LifecycleEvent& event) = 0;
};
