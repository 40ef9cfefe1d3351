#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string FAINT     = "\033[38;2;80;80;80m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line;
    for (int i = 0; i < width; ++i) line += "\xe2\x94\x80";  // U+2500
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  solo\n" + color::RESET
         + color::DIM + "  one instance at a time" + color::RESET + "\n\n"
         + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status lines ────────────────────────────────────────

inline std::string marked(const std::string& tint, char mark, const std::string& msg) {
    return tint + "    " + mark + " " + color::RESET + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return marked(color::GREEN, '+', msg); }
inline std::string fail(const std::string& msg) { return marked(color::RED, 'x', msg); }
inline std::string info(const std::string& msg) { return marked(color::BLUE, '~', msg); }
inline std::string step(const std::string& msg) { return marked(color::BROWN, '>', msg); }

// Secondary detail, dimmer than regular output
inline std::string note(const std::string& msg) {
    return color::FAINT + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

// Aligned "key   value" row
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

} // namespace theme
