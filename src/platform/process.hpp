#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Owning handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code, or -1 on timeout.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

    int native_handle() const { return pid_; }

    // Read end of the child's stdout pipe, or -1 if stdout was not captured.
    int stdout_fd() const { return stdout_fd_; }

private:
    int pid_ = -1;
    int stdout_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log,
                               bool capture_stdout);
};

// Spawn a child process. stdin is closed.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode),
// otherwise stderr goes to /dev/null.
// capture_stdout: connect the child's stdout to a pipe readable via stdout_fd().
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "",
                    bool capture_stdout = false);

// Run a program to completion and collect its stdout.
// Kills the child and returns exit_code -1 if it outlives timeout_ms.
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms = 10000);

} // namespace platform
