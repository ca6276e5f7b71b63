#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Off when output is not a terminal or NO_COLOR is set; main decides.
inline bool& colors_enabled() {
    static bool enabled = false;
    return enabled;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return colors_enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }
inline std::string green(const std::string& s)   { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)     { return paint(color::RED, s); }
inline std::string yellow(const std::string& s)  { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

// Host heading in status listings
inline std::string section(const std::string& title) {
    return bold(title) + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return green("\xe2\x9c\x93") + " " + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return red("X") + " " + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return yellow("!") + " " + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return "- " + msg + "\n";
}

// Follow-up hint, e.g. the command to run next
inline std::string step(const std::string& msg) {
    return dim("  " + msg) + "\n";
}

// Indented detail line under an account in status output
inline std::string kv(const std::string& key, const std::string& value) {
    return fmt::format("  - {}: {}\n", key, value);
}

} // namespace theme
