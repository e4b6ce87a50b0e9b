#pragma once

#include <string>
#include <vector>

// Word lists the screen classifier and extractor match against.
// Kept as data so each list can be tested and tuned on its own.

// Line prefixes of the agent's animated status line ("✻ Thinking… (3s)").
extern const std::vector<std::string> SPINNER_GLYPHS;

// Substrings that only appear while the agent is working.
extern const std::vector<std::string> BUSY_PHRASES;

// Lowercase substrings of a yes/no permission prompt.
extern const std::vector<std::string> DECISION_PHRASES;

// Startup questions answered with the default option.
extern const std::vector<std::string> FIRST_RUN_PHRASES;

// Banner and notice lines that never belong to an answer.
extern const std::vector<std::string> CHROME_PHRASES;

// Line prefixes of status bullets dropped from answers.
extern const std::vector<std::string> NOISE_PREFIXES;

// Characters the input prompt is drawn with.
extern const std::vector<std::string> PROMPT_GLYPHS;

enum class ToolKind {
    Read,
    Edit,
    Write,
    Shell,
    Search,
    SubAgent,
    Other,
};

ToolKind tool_kind(const std::string& tool_name);

// Short chat label for a tool call: "📖 Reading `src/a.ts`".
std::string tool_label(const std::string& tool_name, const std::string& args);

// Case-sensitive: true if text contains any phrase.
bool matches_any(const std::string& text, const std::vector<std::string>& phrases);

// True if line starts with any prefix.
bool starts_with_any(const std::string& line, const std::vector<std::string>& prefixes);
