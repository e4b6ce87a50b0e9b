#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local command execution result (tmux invocations)
struct CommandResult {
    int exit_code;
    std::string stdout_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// How a session answers the agent's permission prompts.
//   Normal    - prompts are surfaced to the chat side
//   Auto      - prompts are accepted automatically
//   Dangerous - the agent was started with prompts disabled
enum class SessionMode {
    Normal,
    Auto,
    Dangerous,
};

const char* mode_name(SessionMode mode);
std::optional<SessionMode> parse_mode(const std::string& name);

// Configuration structures
struct AgentConfig {
    std::string command = "claude";
    std::vector<std::string> args;
    std::string dangerous_flag = "--dangerously-skip-permissions";
    std::string exit_directive = "/exit";
    std::string accept_key = "y";
    std::string reject_key = "n";
};

struct TmuxConfig {
    std::string path = "tmux";
    int scrollback_lines = 500;
    int width = 200;
    int height = 50;
};

struct TimingConfig {
    int poll_interval_ms = 800;
    int reap_interval_secs = 300;
    int session_ttl_minutes = 30;
    int ready_interval_ms = 500;
    int ready_timeout_secs = 60;
    int ready_stable_count = 3;
    int submit_delay_ms = 500;
    int kill_grace_ms = 1000;
};

struct DeliveryConfig {
    int chunk_bytes = 3800;
    bool notify_superseded = false;
};

struct TranscribeConfig {
    std::string command = "claude";
    std::vector<std::string> args = {
        "-p", "Transcribe this audio exactly. Output only the transcription, nothing else.",
        "--file"};
};

// One chat channel bound to one repository checkout.
struct ChannelConfig {
    std::string working_dir;
    std::string prefix;
};
