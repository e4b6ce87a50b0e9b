#include "classifier.hpp"
#include "screen_lines.hpp"
#include "vocabulary.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

const char* screen_state_name(ScreenState state) {
    switch (state) {
        case ScreenState::Booting:          return "booting";
        case ScreenState::Busy:             return "busy";
        case ScreenState::AwaitingDecision: return "awaiting-decision";
        case ScreenState::Idle:             return "idle";
    }
    return "unknown";
}

bool has_decision_prompt(const std::vector<std::string>& lines) {
    for (const auto& line : tail_lines(lines, DECISION_WINDOW_LINES)) {
        if (matches_any(to_lower(line), DECISION_PHRASES)) return true;
    }
    return false;
}

bool has_busy_indicator(const std::vector<std::string>& lines) {
    for (const auto& line : tail_lines(lines, BUSY_WINDOW_LINES)) {
        std::string t = trimmed(line);
        if (starts_with_any(t, SPINNER_GLYPHS)) return true;
        if (matches_any(t, BUSY_PHRASES)) return true;
    }
    return false;
}

// The newest ⏺ line is a tool call and no ⎿ result has been drawn after it.
bool has_pending_tool_call(const std::vector<std::string>& lines) {
    auto window = tail_lines(lines, BUSY_WINDOW_LINES);
    for (auto it = window.rbegin(); it != window.rend(); ++it) {
        if (is_result_line(*it)) return false;
        if (is_action_line(*it)) return parse_tool_call(*it).has_value();
    }
    return false;
}

// Decorative lines (blanks, rules, status bars) are skipped without
// counting, so hint lines under the input box do not hide the prompt.
bool has_idle_prompt(const std::vector<std::string>& lines) {
    int scanned = 0;
    for (auto it = lines.rbegin(); it != lines.rend() && scanned < IDLE_WINDOW_LINES; ++it) {
        if (is_decorative(strip_box(*it))) continue;
        if (is_empty_prompt(*it)) return true;
        ++scanned;
    }
    return false;
}

ScreenState classify(const std::string& snapshot, SessionMode mode) {
    auto lines = split_lines(snapshot);

    // A permission prompt always sits under an un-resulted tool call,
    // so it has to win over the busy rules. A question inside a finished
    // answer has the empty prompt under it and is not a decision.
    if (mode != SessionMode::Dangerous && has_decision_prompt(lines) &&
        !has_idle_prompt(lines))
        return ScreenState::AwaitingDecision;

    if (has_busy_indicator(lines) || has_pending_tool_call(lines))
        return ScreenState::Busy;

    if (has_idle_prompt(lines))
        return ScreenState::Idle;

    return ScreenState::Busy;
}

std::string decision_excerpt(const std::string& snapshot) {
    std::vector<std::string> kept;
    for (const auto& line : split_lines(snapshot)) {
        std::string t = strip_box(line);
        if (is_decorative(t)) continue;
        kept.push_back(t);
    }
    kept = tail_lines(kept, DECISION_EXCERPT_LINES);

    std::string out;
    for (const auto& line : kept) {
        if (!out.empty()) out += "\n";
        out += line;
    }
    return out;
}
