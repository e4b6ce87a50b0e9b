#pragma once

#include <string>
#include <vector>
#include <optional>

// Line-level predicates over a captured terminal screen.
// All of them look at the line with surrounding whitespace removed.

// Trim, then drop one input-box border (│) on either side and trim again.
std::string strip_box(const std::string& line);

// Horizontal rules and box edges: "────", "╭───╮", "╰───╯".
bool is_separator(const std::string& line);

// Footer lines like "model | 42% context | $0.31".
bool is_status_bar(const std::string& line);

// Blank, separator or status bar: skipped when looking for the prompt.
bool is_decorative(const std::string& line);

// The prompt with nothing typed into it.
bool is_empty_prompt(const std::string& line);

// The prompt followed by submitted text: "> fix the bug".
bool is_user_echo(const std::string& line);

bool is_action_line(const std::string& line);   // starts with ⏺
bool is_result_line(const std::string& line);   // starts with ⎿

// Text after the leading marker, trimmed.
std::string strip_marker(const std::string& line, const std::string& marker);

struct ToolCall {
    std::string name;
    std::string args;
};

// "⏺ Name(args)" → {Name, args}; anything else → nullopt.
std::optional<ToolCall> parse_tool_call(const std::string& line);

// The trailing `count` lines of `lines`.
std::vector<std::string> tail_lines(const std::vector<std::string>& lines, size_t count);
