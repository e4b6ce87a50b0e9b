#pragma once

#include "terminal_driver.hpp"
#include <core/types.hpp>

// TerminalDriver backed by detached tmux sessions, one per terminal.
// Every operation is a short-lived tmux client invocation.
class TmuxDriver : public TerminalDriver {
public:
    explicit TmuxDriver(TmuxConfig config);

    Result<void> create(const TerminalSpec& spec) override;
    Result<void> send_literal(const TerminalHandle& h, const std::string& text) override;
    Result<void> send_key(const TerminalHandle& h, const std::string& key) override;
    std::string capture(const TerminalHandle& h) override;
    void destroy(const TerminalHandle& h) override;
    bool exists(const TerminalHandle& h) override;

    // True if the tmux binary can be executed at all.
    bool available();

    // argv (without the tmux binary) for each operation; exposed for tests.
    std::vector<std::string> create_args(const TerminalSpec& spec) const;
    std::vector<std::string> capture_args(const TerminalHandle& h) const;

private:
    TmuxConfig config_;

    CommandResult tmux(const std::vector<std::string>& args, const std::string& label);

    // "=name" makes tmux match the session name exactly instead of by prefix.
    static std::string exact_target(const TerminalHandle& h);
};
