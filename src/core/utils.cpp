#include "utils.hpp"
#include <sstream>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}

std::string replace_all(std::string s, const std::string& token, const std::string& value) {
    if (token.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(token, pos)) != std::string::npos) {
        s.replace(pos, token.size(), value);
        pos += value.size();
    }
    return s;
}
