#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// 24-bit accent colors: accent #3E78B2, warm #80633A
namespace color {
    const std::string ACCENT = "\033[38;2;62;120;178m";
    const std::string WARM   = "\033[38;2;128;99;58m";
    const std::string FAINT  = "\033[38;2;80;80;80m";
    const std::string GOOD   = "\033[92m";
    const std::string WARN   = "\033[93m";
    const std::string BAD    = "\033[91m";
    const std::string STRONG = "\033[1m";
    const std::string MUTED  = "\033[2m";
    const std::string RESET  = "\033[0m";
}

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string dim(const std::string& s)    { return paint(color::MUTED, s); }
inline std::string green(const std::string& s)  { return paint(color::GOOD, s); }
inline std::string yellow(const std::string& s) { return paint(color::WARN, s); }

// Indented status line: colored glyph, then plain text
inline std::string marked(const std::string& code, const std::string& glyph,
                          const std::string& msg) {
    return "    " + paint(code, glyph) + " " + msg + "\n";
}

inline std::string ok(const std::string& msg)    { return marked(color::GOOD, "+", msg); }
inline std::string check(const std::string& msg) { return marked(color::GOOD, "\xe2\x9c\x93", msg); }
inline std::string fail(const std::string& msg)  { return marked(color::BAD, "x", msg); }
inline std::string info(const std::string& msg)  { return marked(color::ACCENT, "~", msg); }
inline std::string step(const std::string& msg)  { return marked(color::WARM, ">", msg); }

// Quieter than program output; used for dropped or internal notices
inline std::string log(const std::string& msg) {
    return paint(color::FAINT, "    \xc2\xb7 " + msg) + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<10}", key)) + value + "\n";
}

// ── Layout ──────────────────────────────────────────────

inline std::string section(const std::string& title) {
    return "\n  " + paint(color::WARM + color::STRONG, title) + "\n\n";
}

// Blank line, a horizontal rule, blank line
inline std::string divider(int width = 48) {
    std::string line;
    for (int i = 0; i < width; ++i) line += "\xe2\x94\x80";
    return "\n  " + dim(line) + "\n\n";
}

// Clears the screen first
inline std::string banner() {
    return "\033[2J\033[H\n  " + paint(color::ACCENT + color::STRONG, "agentmux") + "\n"
         + dim("  v0.1.0\n  Coding agents in terminals, answers in chat") + "\n"
         + divider();
}

} // namespace theme
