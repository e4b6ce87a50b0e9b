#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string agentmux_log_path() {
    static std::string path = (platform::temp_dir() / "agentmux_debug.log").string();
    return path;
}

// Serializes appends from the scheduler, reaper and worker threads.
inline std::mutex& agentmux_log_mutex() {
    static std::mutex m;
    return m;
}

// Per-session transcript path: ~/.agentmux/logs/{session}.log
inline std::string session_log_path(const std::string& session_name) {
    return (platform::home_dir() / ".agentmux" / "logs" / (session_name + ".log")).string();
}

// Append a timestamped line to a session's transcript.
inline void append_session_log(const std::string& session_name, const std::string& msg) {
    std::string path = session_log_path(session_name);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::lock_guard<std::mutex> lock(agentmux_log_mutex());
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void agentmux_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(agentmux_log_mutex());
    std::ofstream out(agentmux_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void agentmux_log_cmd(const std::string& label, const std::string& cmd,
                             const CommandResult& r) {
    agentmux_log(fmt::format("{} CMD: {}", label, cmd));
    if (r.failed())
        agentmux_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                                 r.stdout_data.size(), r.stdout_data.substr(0, 500)));
}
