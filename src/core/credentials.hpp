#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "types.hpp"

struct CredentialInfo {
    std::string key;
    bool has_value;
};

// Secrets handed to spawned agents (API keys, tokens).
// Stored as KEY=value lines in ~/.agentmux/credentials (or
// $AGENTMUX_CREDENTIALS); get() falls back to the process environment.
class CredentialManager {
public:
    static CredentialManager& instance();

    Result<std::string> get(const std::string& key);
    Result<void> set(const std::string& key, const std::string& value);
    Result<void> remove(const std::string& key);

    // Stored keys, with whether each has a value
    std::vector<CredentialInfo> list();

    // Every stored key with a non-empty value
    std::map<std::string, std::string> all();

    static std::filesystem::path store_path();

private:
    CredentialManager() = default;

    std::map<std::string, std::string> load();
    Result<void> save(const std::map<std::string, std::string>& entries);
};
