#pragma once

#include <string>
#include <vector>

// Slots that changed hands between two polls. A slot whose code changed from
// one occupied code to another appears in both lists (released and reclaimed).
struct OccupancyDiff {
    std::vector<int> ended;     // occupied before, now free or re-coded
    std::vector<int> started;   // occupied now, free before or re-coded

    bool empty() const { return ended.empty() && started.empty(); }
};

bool is_occupied(const std::string& code);

// Right-pad with the free code up to `len` slots.
std::vector<std::string> pad_codes(std::vector<std::string> codes, size_t len);

// Compare two occupancy arrays slot by slot; the shorter one is padded with free slots.
OccupancyDiff diff_occupancy(std::vector<std::string> old_codes,
                             std::vector<std::string> new_codes);
