#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

// Builds a Config from a parsed YAML tree. Every key is optional.
class ConfigBuilder {
public:
    static Config build(const YAML::Node& root);

private:
    static AgentConfig parse_agent(const YAML::Node& node);
    static TmuxConfig parse_tmux(const YAML::Node& node);
    static TimingConfig parse_timing(const YAML::Node& node);
    static DeliveryConfig parse_delivery(const YAML::Node& node);
    static TranscribeConfig parse_transcribe(const YAML::Node& node);
    static std::map<std::string, ChannelConfig> parse_channels(const YAML::Node& node);
};

// Accepts a bare string ("claude --verbose") or a sequence of words.
static std::vector<std::string> parse_words(const YAML::Node& node,
                                            const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    std::vector<std::string> words;
    if (node.IsSequence()) {
        for (const auto& w : node) words.push_back(w.as<std::string>());
    } else if (node.IsScalar()) {
        std::string s = node.as<std::string>();
        size_t pos = 0;
        while (pos < s.size()) {
            auto start = s.find_first_not_of(' ', pos);
            if (start == std::string::npos) break;
            auto end = s.find(' ', start);
            if (end == std::string::npos) end = s.size();
            words.push_back(s.substr(start, end - start));
            pos = end;
        }
    }
    return words;
}

AgentConfig ConfigBuilder::parse_agent(const YAML::Node& node) {
    AgentConfig agent;
    if (!node) return agent;
    agent.command = node["command"].as<std::string>(agent.command);
    agent.args = parse_words(node["args"], agent.args);
    agent.dangerous_flag = node["dangerous_flag"].as<std::string>(agent.dangerous_flag);
    agent.exit_directive = node["exit_directive"].as<std::string>(agent.exit_directive);
    agent.accept_key = node["accept_key"].as<std::string>(agent.accept_key);
    agent.reject_key = node["reject_key"].as<std::string>(agent.reject_key);
    return agent;
}

TmuxConfig ConfigBuilder::parse_tmux(const YAML::Node& node) {
    TmuxConfig tmux;
    if (!node) return tmux;
    tmux.path = node["path"].as<std::string>(tmux.path);
    tmux.scrollback_lines = node["scrollback_lines"].as<int>(tmux.scrollback_lines);
    tmux.width = node["width"].as<int>(tmux.width);
    tmux.height = node["height"].as<int>(tmux.height);
    return tmux;
}

TimingConfig ConfigBuilder::parse_timing(const YAML::Node& node) {
    TimingConfig t;
    if (!node) return t;
    t.poll_interval_ms = node["poll_interval_ms"].as<int>(t.poll_interval_ms);
    t.reap_interval_secs = node["reap_interval_secs"].as<int>(t.reap_interval_secs);
    t.session_ttl_minutes = node["session_ttl_minutes"].as<int>(t.session_ttl_minutes);
    t.ready_interval_ms = node["ready_interval_ms"].as<int>(t.ready_interval_ms);
    t.ready_timeout_secs = node["ready_timeout_secs"].as<int>(t.ready_timeout_secs);
    t.ready_stable_count = node["ready_stable_count"].as<int>(t.ready_stable_count);
    t.submit_delay_ms = node["submit_delay_ms"].as<int>(t.submit_delay_ms);
    t.kill_grace_ms = node["kill_grace_ms"].as<int>(t.kill_grace_ms);

    // Clamp values that would spin or never fire
    if (t.poll_interval_ms < 50) t.poll_interval_ms = 50;
    if (t.reap_interval_secs < 1) t.reap_interval_secs = 1;
    if (t.ready_stable_count < 1) t.ready_stable_count = 1;
    return t;
}

DeliveryConfig ConfigBuilder::parse_delivery(const YAML::Node& node) {
    DeliveryConfig d;
    if (!node) return d;
    d.chunk_bytes = node["chunk_bytes"].as<int>(d.chunk_bytes);
    d.notify_superseded = node["notify_superseded"].as<bool>(d.notify_superseded);
    if (d.chunk_bytes < 16) d.chunk_bytes = 16;
    return d;
}

TranscribeConfig ConfigBuilder::parse_transcribe(const YAML::Node& node) {
    TranscribeConfig tc;
    if (!node) return tc;
    tc.command = node["command"].as<std::string>(tc.command);
    tc.args = parse_words(node["args"], tc.args);
    return tc;
}

std::map<std::string, ChannelConfig> ConfigBuilder::parse_channels(const YAML::Node& node) {
    std::map<std::string, ChannelConfig> channels;
    if (!node || !node.IsMap()) return channels;

    for (const auto& kv : node) {
        std::string name = kv.first.as<std::string>();
        ChannelConfig cc;
        if (kv.second.IsScalar()) {
            // Bare string shorthand: `backend: /srv/backend`
            cc.working_dir = kv.second.as<std::string>("");
        } else if (kv.second.IsMap()) {
            cc.working_dir = kv.second["working_dir"].as<std::string>("");
            cc.prefix = kv.second["prefix"].as<std::string>("");
        }
        if (cc.prefix.empty()) cc.prefix = name;
        channels[name] = cc;
    }
    return channels;
}

Config ConfigBuilder::build(const YAML::Node& root) {
    Config config;
    config.agent_ = parse_agent(root["agent"]);
    config.tmux_ = parse_tmux(root["tmux"]);
    config.timing_ = parse_timing(root["timing"]);
    config.delivery_ = parse_delivery(root["delivery"]);
    config.transcribe_ = parse_transcribe(root["transcribe"]);
    config.workers_ = root["workers"].as<int>(config.workers_);
    if (config.workers_ < 1) config.workers_ = 1;
    config.channels_ = parse_channels(root["channels"]);
    return config;
}

const ChannelConfig* Config::find_channel(const std::string& name) const {
    auto it = channels_.find(name);
    return it == channels_.end() ? nullptr : &it->second;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".agentmux";
}

fs::path get_global_config_path() {
    const char* override_path = std::getenv("AGENTMUX_CONFIG");
    if (override_path && *override_path) return fs::path(override_path);
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Default config content
    const char* default_config = R"(# agentmux configuration
# Each chat channel maps to one repository checkout.

agent:
  command: "claude"
  dangerous_flag: "--dangerously-skip-permissions"
  exit_directive: "/exit"
  accept_key: "y"
  reject_key: "n"

tmux:
  path: "tmux"
  scrollback_lines: 500

timing:
  poll_interval_ms: 800          # Screen capture cadence per busy session
  reap_interval_secs: 300        # How often idle/dead sessions are swept
  session_ttl_minutes: 30        # Idle time before a session is killed
  ready_interval_ms: 500
  ready_timeout_secs: 60
  ready_stable_count: 3
  submit_delay_ms: 500           # Pause between typing and pressing Enter
  kill_grace_ms: 1000

delivery:
  chunk_bytes: 3800              # Max size of one chat message
  notify_superseded: false       # Tell the previous caller when a newer message replaces it

workers: 4

# Optional: audio transcription command (audio file path is appended)
# transcribe:
#   command: "claude"
#   args: ["-p", "Transcribe this audio exactly. Output only the transcription, nothing else.", "--file"]

channels: {}
#  backend:
#    working_dir: "/srv/repos/backend"
#    prefix: "be"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}
