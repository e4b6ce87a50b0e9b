#include "tmux_driver.hpp"
#include <managers/session_log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

TmuxDriver::TmuxDriver(TmuxConfig config) : config_(std::move(config)) {}

std::string TmuxDriver::exact_target(const TerminalHandle& h) {
    return "=" + h.name;
}

CommandResult TmuxDriver::tmux(const std::vector<std::string>& args, const std::string& label) {
    auto result = platform::run_command(config_.path, args);
    std::string joined;
    for (const auto& a : args) {
        if (!joined.empty()) joined += " ";
        joined += a;
    }
    agentmux_log_cmd(label, joined.substr(0, 200), result);
    return result;
}

std::vector<std::string> TmuxDriver::create_args(const TerminalSpec& spec) const {
    std::vector<std::string> args = {
        "new-session", "-d",
        "-s", spec.name,
        "-c", spec.working_dir,
        "-x", std::to_string(config_.width),
        "-y", std::to_string(config_.height),
    };
    for (const auto& [k, v] : spec.env) {
        args.push_back("-e");
        args.push_back(k + "=" + v);
    }
    // tmux runs a multi-word command directly, without a shell in between
    for (const auto& word : spec.command) {
        args.push_back(word);
    }
    return args;
}

std::vector<std::string> TmuxDriver::capture_args(const TerminalHandle& h) const {
    return {"capture-pane", "-p", "-J",
            "-t", exact_target(h) + ":",
            "-S", "-" + std::to_string(config_.scrollback_lines)};
}

Result<void> TmuxDriver::create(const TerminalSpec& spec) {
    if (spec.name.empty()) {
        return Result<void>::Err("terminal name is empty");
    }
    if (spec.command.empty()) {
        return Result<void>::Err("no command to run");
    }

    auto result = tmux(create_args(spec), "tmux:new-session");
    if (result.failed()) {
        return Result<void>::Err(fmt::format(
            "tmux new-session failed for '{}' (exit {})", spec.name, result.exit_code));
    }
    return Result<void>::Ok();
}

Result<void> TmuxDriver::send_literal(const TerminalHandle& h, const std::string& text) {
    auto result = tmux({"send-keys", "-t", exact_target(h) + ":", "-l", "--", text},
                       "tmux:send-literal");
    if (result.failed()) {
        return Result<void>::Err(fmt::format("send-keys -l failed for '{}'", h.name));
    }
    return Result<void>::Ok();
}

Result<void> TmuxDriver::send_key(const TerminalHandle& h, const std::string& key) {
    auto result = tmux({"send-keys", "-t", exact_target(h) + ":", key}, "tmux:send-key");
    if (result.failed()) {
        return Result<void>::Err(fmt::format("send-keys {} failed for '{}'", key, h.name));
    }
    return Result<void>::Ok();
}

std::string TmuxDriver::capture(const TerminalHandle& h) {
    auto result = tmux(capture_args(h), "tmux:capture");
    if (result.failed()) return "";
    return result.stdout_data;
}

void TmuxDriver::destroy(const TerminalHandle& h) {
    tmux({"kill-session", "-t", exact_target(h)}, "tmux:kill-session");
}

bool TmuxDriver::exists(const TerminalHandle& h) {
    auto result = platform::run_command(config_.path, {"has-session", "-t", exact_target(h)});
    return result.success();
}

bool TmuxDriver::available() {
    auto result = platform::run_command(config_.path, {"-V"});
    return result.success();
}
