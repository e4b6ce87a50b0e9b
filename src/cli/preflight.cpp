#include "preflight.hpp"
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <platform/process.hpp>
#include <terminal/tmux_driver.hpp>
#include <filesystem>
#include <fmt/format.h>

std::vector<PreflightIssue> check_global_config() {
    std::vector<PreflightIssue> issues;

    if (!global_config_exists()) {
        issues.push_back({
            "Config not found at " + get_global_config_path().string(),
            "Run 'agentmux setup'"
        });
        return issues;
    }

    auto result = Config::load();
    if (result.is_err()) {
        issues.push_back({"Failed to parse config: " + result.error, "Check YAML syntax"});
    }
    return issues;
}

std::vector<PreflightIssue> check_tools(const Config& config) {
    std::vector<PreflightIssue> issues;

    TmuxDriver tmux(config.tmux());
    if (!tmux.available()) {
        issues.push_back({
            fmt::format("'{}' not found or not runnable", config.tmux().path),
            "Install tmux or set tmux.path in the config"
        });
    }

    auto agent = platform::run_command(config.agent().command, {"--version"}, 15000);
    if (agent.failed()) {
        issues.push_back({
            fmt::format("Agent command '{}' did not run", config.agent().command),
            "Install it or set agent.command in the config"
        });
    }

    if (CredentialManager::instance().get("ANTHROPIC_API_KEY").is_err()) {
        issues.push_back({
            "No ANTHROPIC_API_KEY stored or exported; agents will use their own login",
            "Run 'credentials set ANTHROPIC_API_KEY <key>' to provide one",
            true
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_channels(const Config& config) {
    namespace fs = std::filesystem;
    std::vector<PreflightIssue> issues;

    if (config.channels().empty()) {
        issues.push_back({
            "No channels configured",
            "Add a channels: section mapping names to repository paths",
            true
        });
        return issues;
    }

    for (const auto& [name, ch] : config.channels()) {
        std::error_code ec;
        if (!fs::is_directory(ch.working_dir, ec)) {
            issues.push_back({
                fmt::format("Channel '{}': directory '{}' not found", name, ch.working_dir),
                "Fix the path under channels: in the config"
            });
        }
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks() {
    std::vector<PreflightIssue> all = check_global_config();
    if (!all.empty()) return all;

    auto config = Config::load();
    auto tool_issues = check_tools(config.value);
    all.insert(all.end(), tool_issues.begin(), tool_issues.end());

    auto channel_issues = check_channels(config.value);
    all.insert(all.end(), channel_issues.begin(), channel_issues.end());

    return all;
}
