#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[34m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Colors only when stdout is a terminal; piped output stays plain.
inline bool use_color() {
    static const bool tty = isatty(STDOUT_FILENO) != 0;
    return tty;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return use_color() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string blue(const std::string& s)   { return paint(color::BLUE, s); }
inline std::string bold(const std::string& s)   { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }
inline std::string green(const std::string& s)  { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)    { return paint(color::RED, s); }
inline std::string yellow(const std::string& s) { return paint(color::YELLOW, s); }

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + bold("  " + title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return green("    + ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return red("    x ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return yellow("    > ") + msg + "\n";
}

// Key-value row for listings
inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<10}", key)) + value + "\n";
}

} // namespace theme
