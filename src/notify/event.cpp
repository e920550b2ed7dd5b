#include "event.hpp"

const char* event_name(EventType type) {
    switch (type) {
        case EventType::System:       return "system";
        case EventType::Startup:      return "startup";
        case EventType::RentalStart:  return "rental_start";
        case EventType::RentalEnd:    return "rental_end";
        case EventType::RentalPause:  return "rental_pause";
        case EventType::RentalResume: return "rental_resume";
        case EventType::Error:        return "error";
        case EventType::Recovery:     return "recovery";
    }
    return "system";
}

std::optional<EventType> parse_event_type(const std::string& name) {
    for (auto t : {EventType::System, EventType::Startup, EventType::RentalStart,
                   EventType::RentalEnd, EventType::RentalPause, EventType::RentalResume,
                   EventType::Error, EventType::Recovery}) {
        if (name == event_name(t)) return t;
    }
    return std::nullopt;
}
