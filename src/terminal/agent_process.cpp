#include "agent_process.hpp"
#include <screen/classifier.hpp>
#include <screen/screen_lines.hpp>
#include <screen/vocabulary.hpp>
#include <managers/session_log.hpp>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

RetryPolicy RetryPolicy::from_timing(const TimingConfig& timing) {
    RetryPolicy p;
    p.interval_ms = timing.ready_interval_ms > 0 ? timing.ready_interval_ms : 500;
    p.max_attempts = (timing.ready_timeout_secs * 1000) / p.interval_ms;
    if (p.max_attempts < 1) p.max_attempts = 1;
    p.stable_threshold = timing.ready_stable_count;
    return p;
}

const char* spawn_error_name(SpawnError error) {
    switch (error) {
        case SpawnError::None:         return "none";
        case SpawnError::Timeout:      return "timeout";
        case SpawnError::ProcessError: return "process error";
    }
    return "unknown";
}

AgentProcess::AgentProcess(TerminalDriver& driver, AgentConfig agent, TimingConfig timing)
    : driver_(driver), agent_(std::move(agent)), timing_(timing),
      policy_(RetryPolicy::from_timing(timing)) {}

std::vector<std::string> AgentProcess::command_line(bool dangerous) const {
    std::vector<std::string> argv;
    argv.push_back(agent_.command);
    for (const auto& a : agent_.args) argv.push_back(a);
    if (dangerous && !agent_.dangerous_flag.empty()) {
        argv.push_back(agent_.dangerous_flag);
    }
    return argv;
}

SpawnResult AgentProcess::spawn(const std::string& name,
                                const std::string& working_dir,
                                bool dangerous,
                                const std::map<std::string, std::string>& env) {
    SpawnResult result;

    TerminalSpec spec;
    spec.name = name;
    spec.working_dir = working_dir;
    spec.command = command_line(dangerous);
    spec.env = env;

    auto created = driver_.create(spec);
    if (created.is_err()) {
        result.error = SpawnError::ProcessError;
        result.message = created.error;
        agentmux_log(fmt::format("spawn: {} failed to start: {}", name, created.error));
        return result;
    }

    TerminalHandle handle{name};
    SpawnError ready = wait_ready(handle, policy_);
    if (ready != SpawnError::None) {
        driver_.destroy(handle);
        result.error = ready;
        result.message = ready == SpawnError::Timeout
            ? fmt::format("agent in '{}' did not become ready within {} polls",
                          working_dir, policy_.max_attempts)
            : fmt::format("agent in '{}' exited while starting", working_dir);
        agentmux_log(fmt::format("spawn: {} {}", name, result.message));
        return result;
    }

    result.handle = handle;
    agentmux_log(fmt::format("spawn: {} ready in {}{}", name, working_dir,
                             dangerous ? " (permissions bypassed)" : ""));
    append_session_log(name, fmt::format("Session started in {} ({})", working_dir,
                                         dangerous ? "dangerous" : "normal"));
    return result;
}

// Only the trailing window counts; older output may still mention the prompt.
static bool first_run_prompt_showing(const std::string& screen) {
    for (const auto& line : tail_lines(split_lines(screen), DECISION_WINDOW_LINES)) {
        if (matches_any(line, FIRST_RUN_PHRASES)) return true;
    }
    return false;
}

SpawnError AgentProcess::wait_ready(const TerminalHandle& h, const RetryPolicy& policy) {
    int stable = 0;
    for (int attempt = 0; attempt < policy.max_attempts; ++attempt) {
        if (attempt > 0) platform::sleep_ms(policy.interval_ms);

        std::string screen = driver_.capture(h);
        if (screen.empty() && !driver_.exists(h)) {
            return SpawnError::ProcessError;
        }

        if (has_idle_prompt(split_lines(screen))) {
            if (++stable >= policy.stable_threshold) return SpawnError::None;
        } else {
            stable = 0;
        }

        // Trust-folder and effort-level questions on first launch: take option 1
        if (first_run_prompt_showing(screen)) {
            agentmux_log(fmt::format("spawn: {} answering first-run prompt", h.name));
            auto r = driver_.send_key(h, "1");
            if (r.is_ok()) r = driver_.send_key(h, "Enter");
            if (r.is_err()) agentmux_log("spawn: " + r.error);
            stable = 0;
        }
    }
    return SpawnError::Timeout;
}

Result<void> AgentProcess::send_text(const TerminalHandle& h, const std::string& text) {
    auto typed = driver_.send_literal(h, text);
    if (typed.is_err()) return typed;

    // Slow-rendering terminals drop the Enter if it races the typed text
    platform::sleep_ms(timing_.submit_delay_ms);
    return driver_.send_key(h, "Enter");
}

Result<void> AgentProcess::send_key(const TerminalHandle& h, const std::string& key) {
    return driver_.send_key(h, key);
}

std::string AgentProcess::capture(const TerminalHandle& h) {
    return driver_.capture(h);
}

void AgentProcess::kill(const TerminalHandle& h) {
    if (driver_.exists(h)) {
        auto r = driver_.send_literal(h, agent_.exit_directive);
        if (r.is_ok()) r = driver_.send_key(h, "Enter");
        if (r.is_err()) agentmux_log("kill: " + r.error);
        platform::sleep_ms(timing_.kill_grace_ms);
    }
    driver_.destroy(h);
    append_session_log(h.name, "Session killed");
}

bool AgentProcess::exists(const TerminalHandle& h) {
    return driver_.exists(h);
}
