#pragma once

#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string brown(const std::string& s)  { return color::BROWN + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Usage row: command, its arguments, and a dim description
inline std::string usage_row(const std::string& cmd, const std::string& args,
                             const std::string& help) {
    std::string head = args.empty() ? cmd : cmd + " " + args;
    size_t pad = head.size() < 34 ? 34 - head.size() : 1;
    return color::BLUE + "    " + cmd + color::RESET
         + (args.empty() ? "" : " " + brown(args))
         + std::string(pad, ' ') + dim(help) + "\n";
}

} // namespace theme
