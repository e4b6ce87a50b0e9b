#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load config from ~/.agentmux/config.yaml (or $AGENTMUX_CONFIG)
    static Result<Config> load();

    // Load config from an explicit path
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const AgentConfig& agent() const { return agent_; }
    const TmuxConfig& tmux() const { return tmux_; }
    const TimingConfig& timing() const { return timing_; }
    const DeliveryConfig& delivery() const { return delivery_; }
    const TranscribeConfig& transcribe() const { return transcribe_; }
    int workers() const { return workers_; }

    // Channel name -> repository binding. Loaded once, never mutated.
    const std::map<std::string, ChannelConfig>& channels() const { return channels_; }
    const ChannelConfig* find_channel(const std::string& name) const;

public:
    Config() = default;

private:
    AgentConfig agent_;
    TmuxConfig tmux_;
    TimingConfig timing_;
    DeliveryConfig delivery_;
    TranscribeConfig transcribe_;
    int workers_ = 4;
    std::map<std::string, ChannelConfig> channels_;

    friend class ConfigBuilder;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
