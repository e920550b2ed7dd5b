#include "occupancy.hpp"
#include <core/constants.hpp>
#include <algorithm>

bool is_occupied(const std::string& code) {
    return !code.empty() && !(code.size() == 1 && code[0] == CODE_FREE);
}

std::vector<std::string> pad_codes(std::vector<std::string> codes, size_t len) {
    if (codes.size() < len) {
        codes.resize(len, std::string(1, CODE_FREE));
    }
    return codes;
}

OccupancyDiff diff_occupancy(std::vector<std::string> old_codes,
                             std::vector<std::string> new_codes) {
    size_t len = std::max(old_codes.size(), new_codes.size());
    old_codes = pad_codes(std::move(old_codes), len);
    new_codes = pad_codes(std::move(new_codes), len);

    OccupancyDiff diff;
    for (size_t i = 0; i < len; ++i) {
        const auto& o = old_codes[i];
        const auto& n = new_codes[i];
        bool was = is_occupied(o);
        bool now = is_occupied(n);
        bool recoded = was && now && o != n;

        if ((was && !now) || recoded) diff.ended.push_back(static_cast<int>(i));
        if ((!was && now) || recoded) diff.started.push_back(static_cast<int>(i));
    }
    return diff;
}
