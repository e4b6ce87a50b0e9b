#include "credentials.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <cstdlib>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr;
    return mgr;
}

fs::path CredentialManager::store_path() {
    const char* override_path = std::getenv("AGENTMUX_CREDENTIALS");
    if (override_path && *override_path) return fs::path(override_path);
    return platform::home_dir() / ".agentmux" / "credentials";
}

std::map<std::string, std::string> CredentialManager::load() {
    std::map<std::string, std::string> entries;
    std::ifstream in(store_path());
    if (!in) return entries;

    std::string line;
    while (std::getline(in, line)) {
        std::string t = trimmed(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        entries[trimmed(t.substr(0, eq))] = t.substr(eq + 1);
    }
    return entries;
}

// Writes to a sibling temp file created 0600, then renames it over the
// store, so a crash never leaves a half-written or world-readable file.
Result<void> CredentialManager::save(const std::map<std::string, std::string>& entries) {
    fs::path path = store_path();
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        return Result<void>::Err("Cannot write " + tmp.string());
    }

    std::string body = "# agentmux secrets, exported into every agent session\n";
    for (const auto& [k, v] : entries) {
        body += k + "=" + v + "\n";
    }

    size_t written = 0;
    while (written < body.size()) {
        ssize_t n = ::write(fd, body.data() + written, body.size() - written);
        if (n <= 0) {
            ::close(fd);
            fs::remove(tmp, ec);
            return Result<void>::Err("Failed to write credentials file");
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err("Failed to replace credentials file");
    }
    return Result<void>::Ok();
}

Result<std::string> CredentialManager::get(const std::string& key) {
    auto entries = load();
    auto it = entries.find(key);
    if (it != entries.end() && !it->second.empty()) {
        return Result<std::string>::Ok(it->second);
    }

    const char* env = std::getenv(key.c_str());
    if (env && *env) {
        return Result<std::string>::Ok(env);
    }
    return Result<std::string>::Err("Credential not found: " + key);
}

Result<void> CredentialManager::set(const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos) {
        return Result<void>::Err("Invalid credential name: " + key);
    }
    auto entries = load();
    entries[key] = value;
    return save(entries);
}

Result<void> CredentialManager::remove(const std::string& key) {
    auto entries = load();
    if (entries.erase(key) == 0) {
        return Result<void>::Err("Credential not found: " + key);
    }
    return save(entries);
}

std::vector<CredentialInfo> CredentialManager::list() {
    std::vector<CredentialInfo> infos;
    for (const auto& [k, v] : load()) {
        infos.push_back({k, !v.empty()});
    }
    return infos;
}

std::map<std::string, std::string> CredentialManager::all() {
    std::map<std::string, std::string> out;
    for (const auto& [k, v] : load()) {
        if (!v.empty()) out[k] = v;
    }
    return out;
}
