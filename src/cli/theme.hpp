#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// cscope colors (ANSI escape sequences)
// Slate: #4A7A96
// Amber: #C08A2E
namespace color {
    const std::string SLATE     = "\033[38;2;74;122;150m";
    const std::string AMBER     = "\033[38;2;192;138;46m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string slate(const std::string& s)  { return color::SLATE + s + color::RESET; }
inline std::string amber(const std::string& s)  { return color::AMBER + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Section header with a blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Command row for help listings
inline std::string command_row(const std::string& name, const std::string& help) {
    return color::SLATE + fmt::format("    {:<14}", name) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

} // namespace theme
