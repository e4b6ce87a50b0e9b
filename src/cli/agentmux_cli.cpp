#include "agentmux_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <termios.h>
#include <unistd.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <platform/platform.hpp>
#include <platform/singleton.hpp>
#include <managers/session_log.hpp>
#include <readline/readline.h>
#include <readline/history.h>
#include <fmt/format.h>

// Deliveries are held while readline owns the terminal. readline runs the
// event hook on the REPL thread while it waits for a key, so the queued
// text is written and the prompt redrawn there.
static ConsoleSink* g_repl_sink = nullptr;

static int flush_deliveries_hook() {
    if (g_repl_sink && g_repl_sink->flush_pending()) {
        rl_on_new_line();
        rl_redisplay();
    }
    return 0;
}

AgentmuxCLI::AgentmuxCLI() : BaseCLI() {
    register_all_commands();
}

void AgentmuxCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Stop all agents and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Stop all agents and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_conversation_commands(*this);
    register_session_commands(*this);
    register_credentials_commands(*this);
}

void AgentmuxCLI::run_repl() {
    std::cout << theme::banner();

    // Preflight
    std::cout << theme::section("Preflight");
    auto issues = run_preflight_checks();
    bool fatal = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            fatal = true;
        }
        std::cout << theme::step(issue.fix);
    }
    if (fatal) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::check("Config loaded");
    std::cout << theme::check("tmux and agent found");

    // Reload config (preflight confirmed it's valid)
    auto config_result = Config::load();
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error) << "\n";
        return;
    }
    clear_managers();
    config = config_result.value;

    // Two REPLs would fight over session names and tmux sessions
    SingletonLock lock((platform::temp_dir() / "agentmux.lock").string());
    if (!lock.held()) {
        std::cout << theme::fail("Another agentmux is already running.");
        std::cout << "\n";
        return;
    }

    auto secrets = CredentialManager::instance().all();
    std::cout << theme::kv("Secrets", std::to_string(secrets.size()) + " exported to agents");
    std::cout << theme::kv("Channels", std::to_string(config->channels().size()));
    std::cout << theme::kv("Log", agentmux_log_path());

    init_managers();
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    if (sink) {
        sink->hold_output(true);
        g_repl_sink = sink.get();
        rl_event_hook = flush_deliveries_hook;
        rl_set_keyboard_input_timeout(REPL_EVENT_POLL_US);
    }

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
        if (sink) sink->flush_pending();
    }

    rl_event_hook = nullptr;
    g_repl_sink = nullptr;
    if (sink) sink->hold_output(false);

    // Cleanup
    if (controller) {
        size_t live = controller->registry().size();
        if (live > 0) {
            std::cout << theme::dim(fmt::format("    Stopping {} agent(s)...", live)) << "\n";
        }
        for (const auto& s : controller->sessions()) {
            controller->terminate(s.conversation_id);
        }
    }
    clear_managers();
}

static std::string read_secret(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    struct termios oldt, newt;
    tcgetattr(STDIN_FILENO, &oldt);
    newt = oldt;
    newt.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);

    std::string secret;
    std::getline(std::cin, secret);

    tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    std::cout << "\n";
    return secret;
}

void AgentmuxCLI::run_setup() {
    auto config_result = create_default_global_config();
    if (config_result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + config_result.error);
        return;
    }

    std::cout << theme::banner();
    std::cout << theme::section("Setup");
    std::cout << theme::dim("    Secrets are stored in ~/.agentmux/credentials and exported") << "\n";
    std::cout << theme::dim("    into every agent session. Leave empty to skip.") << "\n\n";

    std::string key = read_secret(
        theme::color::WARM + "    ANTHROPIC_API_KEY: " + theme::color::RESET);
    if (!key.empty()) {
        auto r = CredentialManager::instance().set("ANTHROPIC_API_KEY", key);
        if (r.is_err()) {
            std::cout << "\n" << theme::fail("Failed to store credential: " + r.error);
            return;
        }
    }

    std::cout << theme::divider();
    std::cout << theme::ok("Config file ready at " + get_global_config_path().string());
    std::cout << theme::step("Bind channels to repositories under channels:");
    std::cout << theme::step("Run 'agentmux' to start.");
    std::cout << "\n";
}
