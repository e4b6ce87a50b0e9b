#pragma once

#include <string>
#include <map>
#include <core/types.hpp>
#include "terminal_driver.hpp"

// Readiness polling policy: poll every interval_ms, at most max_attempts
// times, and require stable_threshold consecutive empty-prompt frames.
struct RetryPolicy {
    int max_attempts = 120;
    int interval_ms = 500;
    int stable_threshold = 3;

    static RetryPolicy from_timing(const TimingConfig& timing);
};

enum class SpawnError {
    None,
    Timeout,        // never reached a ready screen
    ProcessError,   // terminal/process could not start or died while booting
};

struct SpawnResult {
    SpawnError error = SpawnError::None;
    TerminalHandle handle;
    std::string message;

    bool ok() const { return error == SpawnError::None; }
};

const char* spawn_error_name(SpawnError error);

// One interactive agent CLI running inside a pseudo-terminal.
// Owns the agent-level protocol (command line, submit, exit directive,
// first-run prompts); the driver only moves bytes.
class AgentProcess {
public:
    AgentProcess(TerminalDriver& driver, AgentConfig agent, TimingConfig timing);

    // Start the agent in working_dir and block until its prompt is ready.
    // A failed spawn leaves no terminal behind.
    SpawnResult spawn(const std::string& name,
                      const std::string& working_dir,
                      bool dangerous,
                      const std::map<std::string, std::string>& env = {});

    // Type text, wait for the terminal to settle, then submit.
    Result<void> send_text(const TerminalHandle& h, const std::string& text);

    Result<void> send_key(const TerminalHandle& h, const std::string& key);

    std::string capture(const TerminalHandle& h);

    // Exit directive, short grace period, then force. Never fails.
    void kill(const TerminalHandle& h);

    bool exists(const TerminalHandle& h);

    // Poll until the prompt is stable. Answers first-run prompts on the way.
    SpawnError wait_ready(const TerminalHandle& h, const RetryPolicy& policy);

    // argv used to start the agent
    std::vector<std::string> command_line(bool dangerous) const;

    const AgentConfig& agent() const { return agent_; }
    void set_retry_policy(const RetryPolicy& policy) { policy_ = policy; }

private:
    TerminalDriver& driver_;
    AgentConfig agent_;
    TimingConfig timing_;
    RetryPolicy policy_;
};
