#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_conversation_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);
void register_credentials_commands(BaseCLI& cli);

class AgentmuxCLI : public BaseCLI {
public:
    AgentmuxCLI();

    // Preflight, start the controller, then read commands until quit/EOF.
    void run_repl();
    void run_setup();

private:
    void register_all_commands();

    bool quit_requested_ = false;
};
