#pragma once

#include <string>
#include <vector>
#include <map>
#include <core/types.hpp>

// Names one pseudo-terminal owned by a driver. Empty name = no terminal.
struct TerminalHandle {
    std::string name;

    bool valid() const { return !name.empty(); }
    bool operator==(const TerminalHandle& other) const { return name == other.name; }
};

struct TerminalSpec {
    std::string name;                          // unique terminal name
    std::string working_dir;                   // cwd of the process
    std::vector<std::string> command;          // argv of the process to run
    std::map<std::string, std::string> env;    // extra environment
};

// Low-level pseudo-terminal operations. One implementation drives tmux;
// tests substitute a scripted screen.
class TerminalDriver {
public:
    virtual ~TerminalDriver() = default;

    // Start a detached terminal running spec.command.
    virtual Result<void> create(const TerminalSpec& spec) = 0;

    // Type text literally (no key-name interpretation, no Enter).
    virtual Result<void> send_literal(const TerminalHandle& h, const std::string& text) = 0;

    // Press a single named key ("Enter", "y", "1").
    virtual Result<void> send_key(const TerminalHandle& h, const std::string& key) = 0;

    // Visible screen plus bounded scroll-back. Empty on failure.
    virtual std::string capture(const TerminalHandle& h) = 0;

    // Tear down the terminal and its process. Best effort.
    virtual void destroy(const TerminalHandle& h) = 0;

    virtual bool exists(const TerminalHandle& h) = 0;
};
