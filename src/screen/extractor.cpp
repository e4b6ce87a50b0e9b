#include "extractor.hpp"
#include "screen_lines.hpp"
#include "vocabulary.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

namespace {

bool is_noise(const std::string& t) {
    if (is_decorative(t)) return true;
    if (starts_with_any(t, NOISE_PREFIXES)) return true;
    return matches_any(t, CHROME_PHRASES);
}

// Where the last line of output came from; decides what an
// unmarked line that follows it means.
enum class LastBlock {
    None,
    Narrative,
    ToolCall,
    ToolResult,
};

void append_result(std::vector<std::string>& out, ToolKind section, const std::string& text) {
    if (text.empty()) return;
    size_t chars = utf8_length(text);
    if (section == ToolKind::Shell) {
        if (chars < static_cast<size_t>(SHELL_INLINE_MAX_CHARS)) {
            out.push_back("```");
            out.push_back(text);
            out.push_back("```");
        } else {
            out.push_back(fmt::format("_({} chars of output)_", chars));
        }
    } else if (chars < static_cast<size_t>(RESULT_POINTER_MAX_CHARS)) {
        out.push_back(fmt::format("  ↳ {}", text));
    }
}

} // namespace

std::optional<std::string> extract_response(const std::string& snapshot,
                                            const std::string& previous_emission) {
    auto lines = split_lines(snapshot);

    size_t begin = lines.size();
    for (size_t i = lines.size(); i-- > 0;) {
        if (is_user_echo(lines[i])) { begin = i; break; }
    }
    if (begin == lines.size()) return std::nullopt;

    size_t end = lines.size();
    for (size_t i = begin + 1; i < lines.size(); ++i) {
        if (is_empty_prompt(lines[i])) { end = i; break; }
    }

    std::vector<std::string> out;
    std::optional<ToolKind> section;
    LastBlock last = LastBlock::None;

    for (size_t i = begin + 1; i < end; ++i) {
        std::string t = strip_box(lines[i]);
        if (is_noise(t)) continue;

        if (is_action_line(t)) {
            if (auto call = parse_tool_call(t)) {
                out.push_back(tool_label(call->name, call->args));
                section = tool_kind(call->name);
                last = LastBlock::ToolCall;
                continue;
            }
            std::string text = strip_marker(t, ACTION_MARKER);
            if (!text.empty()) out.push_back(text);
            section.reset();
            last = LastBlock::Narrative;
        } else if (is_result_line(t)) {
            append_result(out, section.value_or(ToolKind::Other), strip_marker(t, RESULT_MARKER));
            section.reset();
            last = LastBlock::ToolResult;
        } else if (last == LastBlock::Narrative) {
            // wrapped paragraph or list item under the previous ⏺ text
            out.push_back(t);
        }
    }

    std::string response;
    for (const auto& line : out) {
        if (!response.empty()) response += "\n";
        response += line;
    }
    trim(response);

    if (response.empty() || response == previous_emission) return std::nullopt;
    return response;
}
