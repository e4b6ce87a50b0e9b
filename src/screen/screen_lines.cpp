#include "screen_lines.hpp"
#include "vocabulary.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <regex>

std::string strip_box(const std::string& line) {
    std::string t = trimmed(line);
    const std::string border = BOX_VERTICAL;
    if (starts_with(t, border)) t = trimmed(t.substr(border.size()));
    if (t.size() >= border.size() &&
        t.compare(t.size() - border.size(), border.size(), border) == 0) {
        t = trimmed(t.substr(0, t.size() - border.size()));
    }
    return t;
}

bool is_separator(const std::string& line) {
    std::string t = trimmed(line);
    return starts_with(t, RULE_CHAR) || starts_with(t, "╭") || starts_with(t, "╰");
}

bool is_status_bar(const std::string& line) {
    return contains(line, "|") && (contains(line, "%") || contains(line, "$"));
}

bool is_decorative(const std::string& line) {
    std::string t = trimmed(line);
    return t.empty() || is_separator(t) || is_status_bar(t);
}

bool is_empty_prompt(const std::string& line) {
    std::string t = strip_box(line);
    for (const auto& glyph : PROMPT_GLYPHS) {
        if (t == glyph) return true;
    }
    return false;
}

bool is_user_echo(const std::string& line) {
    std::string t = strip_box(line);
    for (const auto& glyph : PROMPT_GLYPHS) {
        std::string prefix = glyph + " ";
        if (starts_with(t, prefix) && t.size() > prefix.size() &&
            !starts_with(t, prefix + RULE_CHAR)) {
            return true;
        }
    }
    return false;
}

bool is_action_line(const std::string& line) {
    return starts_with(trimmed(line), ACTION_MARKER);
}

bool is_result_line(const std::string& line) {
    return starts_with(trimmed(line), RESULT_MARKER);
}

std::string strip_marker(const std::string& line, const std::string& marker) {
    std::string t = trimmed(line);
    if (starts_with(t, marker)) t = t.substr(marker.size());
    return trimmed(t);
}

std::optional<ToolCall> parse_tool_call(const std::string& line) {
    static const std::regex tool_re(std::string("^") + ACTION_MARKER +
                                    R"(\s+(\w+)\(([^)]*)\)\s*$)");
    std::string t = trimmed(line);
    std::smatch m;
    if (!std::regex_search(t, m, tool_re)) return std::nullopt;
    return ToolCall{m[1].str(), m[2].str()};
}

std::vector<std::string> tail_lines(const std::vector<std::string>& lines, size_t count) {
    if (lines.size() <= count) return lines;
    return std::vector<std::string>(lines.end() - static_cast<std::ptrdiff_t>(count), lines.end());
}
