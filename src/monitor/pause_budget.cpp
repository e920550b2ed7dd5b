#include "pause_budget.hpp"
#include <algorithm>

bool PauseBudget::available(DemandClass cls) const {
    return (cls == DemandClass::OnDemand ? on_demand : other) > 0;
}

bool PauseBudget::consume(DemandClass cls) {
    int& slot = (cls == DemandClass::OnDemand) ? on_demand : other;
    if (slot <= 0) return false;
    --slot;
    return true;
}

int stored_on_demand(const RentalCounters& c) {
    return std::max(c.resident_on_demand - c.running_on_demand, 0);
}

int stored_other(const RentalCounters& c) {
    int resident = std::max(c.resident - c.resident_on_demand, 0);
    int running = std::max(c.running - c.running_on_demand, 0);
    return std::max(resident - running, 0);
}

PauseBudget estimate_pause_budget(const RentalCounters& old_counters,
                                  const RentalCounters& new_counters) {
    PauseBudget budget;
    budget.on_demand = std::max(stored_on_demand(new_counters) - stored_on_demand(old_counters), 0);
    budget.other = std::max(stored_other(new_counters) - stored_other(old_counters), 0);
    return budget;
}
