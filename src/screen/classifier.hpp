#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

enum class ScreenState {
    Booting,            // agent still starting (readiness wait only)
    Busy,               // working, or not recognizably anything else
    AwaitingDecision,   // permission prompt on screen
    Idle,               // finished, empty prompt showing
};

const char* screen_state_name(ScreenState state);

// Classify one captured screen. Pure: same snapshot and mode, same answer.
ScreenState classify(const std::string& snapshot, SessionMode mode);

// Individual rules, exposed for testing. Each takes the screen split into lines.
bool has_decision_prompt(const std::vector<std::string>& lines);
bool has_busy_indicator(const std::vector<std::string>& lines);
bool has_pending_tool_call(const std::vector<std::string>& lines);
bool has_idle_prompt(const std::vector<std::string>& lines);

// The trailing non-blank lines of a permission prompt, for a notice.
std::string decision_excerpt(const std::string& snapshot);
