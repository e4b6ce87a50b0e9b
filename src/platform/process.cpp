#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (stdout_fd_ >= 0) close(stdout_fd_);
    // Reap a finished child so it does not linger as a zombie
    if (pid_ > 0 && !reaped_) {
        int status;
        waitpid(pid_, &status, WNOHANG);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (stdout_fd_ >= 0) close(stdout_fd_);
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) {
            reaped_ = true;
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reaped_ = true;
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return exit_code_;
        }
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log,
                    bool capture_stdout) {
    ProcessHandle handle;

    int pipe_fds[2] = {-1, -1};
    if (capture_stdout && pipe(pipe_fds) != 0) {
        return handle;
    }

    // Build argv before forking; only async-signal-safe calls after fork()
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (capture_stdout) {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        }
        return handle;  // fork failed
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);

        if (capture_stdout) {
            dup2(pipe_fds[1], STDOUT_FILENO);
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        } else if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
        }

        int errfd = -1;
        if (!stderr_log.empty()) {
            errfd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        }
        if (errfd >= 0) {
            dup2(errfd, STDERR_FILENO);
            close(errfd);
        } else if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
        }
        if (devnull > STDERR_FILENO) close(devnull);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    if (capture_stdout) {
        close(pipe_fds[1]);
        handle.stdout_fd_ = pipe_fds[0];
    }
    handle.pid_ = pid;
    return handle;
}

// ── run_command ──────────────────────────────────────────────

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms) {
    CommandResult result{-1, ""};

    ProcessHandle proc = spawn(program, args, "", true);
    if (!proc.valid()) return result;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    char buf[4096];
    bool eof = false;

    // Drain stdout until the child closes it; a full pipe would block the child
    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            proc.terminate();
            return result;
        }

        struct pollfd pfd = {proc.stdout_fd(), POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(proc.stdout_fd(), buf, sizeof(buf));
        if (n > 0) {
            result.stdout_data.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            break;
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    int code = proc.wait(remaining > 0 ? static_cast<int>(remaining) : 0);
    if (code < 0) {
        if (proc.running()) {
            proc.terminate();
            return result;
        }
        code = proc.wait(0);
    }
    result.exit_code = code;
    return result;
}

} // namespace platform
