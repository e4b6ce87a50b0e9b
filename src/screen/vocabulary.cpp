#include "vocabulary.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <map>

const std::vector<std::string> SPINNER_GLYPHS = {
    "✻", "✽", "✶", "✳", "✢",
};

const std::vector<std::string> BUSY_PHRASES = {
    "Thinking…", "Thinking...",
    "Sussing…", "Sussing...",
    "Running…", "Running...",
    "esc to interrupt",
};

const std::vector<std::string> DECISION_PHRASES = {
    "do you want to",
    "(y/n)",
    "[y/n]",
    "approve",
    "allow this",
    "allow once",
    "allow always",
};

const std::vector<std::string> FIRST_RUN_PHRASES = {
    "Yes, I trust",
    "trust this folder",
    "Use high effort",
    "effort level",
};

const std::vector<std::string> CHROME_PHRASES = {
    "Claude Code v",
    "Opus 4",
    "Share Claude Code",
    "Auto-update failed",
};

const std::vector<std::string> NOISE_PREFIXES = {
    "●", "○", "✻", "✽", "✶", "✳", "✢",
};

const std::vector<std::string> PROMPT_GLYPHS = {
    ">", "❯",
};

ToolKind tool_kind(const std::string& tool_name) {
    static const std::map<std::string, ToolKind> kinds = {
        {"Read",      ToolKind::Read},
        {"Edit",      ToolKind::Edit},
        {"MultiEdit", ToolKind::Edit},
        {"Update",    ToolKind::Edit},
        {"Write",     ToolKind::Write},
        {"Bash",      ToolKind::Shell},
        {"Glob",      ToolKind::Search},
        {"Grep",      ToolKind::Search},
        {"Search",    ToolKind::Search},
        {"Task",      ToolKind::SubAgent},
        {"Agent",     ToolKind::SubAgent},
    };
    auto it = kinds.find(tool_name);
    return it == kinds.end() ? ToolKind::Other : it->second;
}

std::string tool_label(const std::string& tool_name, const std::string& args) {
    switch (tool_kind(tool_name)) {
        case ToolKind::Read:
            return fmt::format("📖 Reading `{}`", args);
        case ToolKind::Edit: {
            // Edit(path, old, new) → only the path is worth showing
            std::string path = args.substr(0, args.find(','));
            return fmt::format("✏️ Editing `{}`", trimmed(path));
        }
        case ToolKind::Write:
            return fmt::format("📝 Writing `{}`", args);
        case ToolKind::Shell:
            return "💻 Running command...";
        case ToolKind::Search:
            return "🔍 Searching...";
        case ToolKind::SubAgent:
            return "🤖 Spawning agent...";
        case ToolKind::Other:
            break;
    }
    return fmt::format("🔧 Running {}...", tool_name);
}

bool matches_any(const std::string& text, const std::vector<std::string>& phrases) {
    for (const auto& p : phrases) {
        if (text.find(p) != std::string::npos) return true;
    }
    return false;
}

bool starts_with_any(const std::string& line, const std::vector<std::string>& prefixes) {
    for (const auto& p : prefixes) {
        if (starts_with(line, p)) return true;
    }
    return false;
}
