#pragma once

#include <ledger/session.hpp>
#include "machine_state.hpp"

// How many sessions may enter the Stored state this cycle, per demand class.
// A full GPU release is only a pause when a unit of budget is left for the
// session's class; otherwise it is an end.
struct PauseBudget {
    int on_demand = 0;
    int other = 0;      // interruptible and reserved

    bool available(DemandClass cls) const;

    // Take one unit; false if none left.
    bool consume(DemandClass cls);
};

// resident - running, never negative
int stored_on_demand(const RentalCounters& c);
int stored_other(const RentalCounters& c);

// Growth of the stored population between two polls, per class.
PauseBudget estimate_pause_budget(const RentalCounters& old_counters,
                                  const RentalCounters& new_counters);
