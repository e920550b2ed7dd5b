#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string TEAL      = "\033[38;2;38;166;154m";
    const std::string AMBER     = "\033[38;2;214;150;44m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string teal(const std::string& s)   { return color::TEAL + s + color::RESET; }
inline std::string amber(const std::string& s)  { return color::AMBER + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD + "  rentwatch\n"
        + color::RESET + color::DIM + "  v" + RENTWATCH_VERSION + "  GPU rental ledger"
        + color::RESET + "\n\n" + rule();
}

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

} // namespace theme
