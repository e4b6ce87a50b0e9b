#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <core/credentials.hpp>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    }
}

BaseCLI::~BaseCLI() {
    clear_managers();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Not configured. Run 'agentmux setup' first.");
        return false;
    }
    return true;
}

bool BaseCLI::require_controller() {
    if (!require_config()) {
        return false;
    }
    if (!controller) {
        std::cout << theme::fail("Session controller is not running.");
        return false;
    }
    return true;
}

void BaseCLI::init_managers() {
    if (!config || controller) return;

    driver = std::make_unique<TmuxDriver>(config->tmux());
    sink = std::make_unique<ConsoleSink>(std::cout);
    controller = std::make_unique<SessionController>(
        config.value(), *driver, *sink, CredentialManager::instance().all());
    transcriber = std::make_unique<CommandTranscriber>(config->transcribe());
    router = std::make_unique<MessageRouter>(config.value(), *controller, transcriber.get());
    controller->start();
}

void BaseCLI::clear_managers() {
    router.reset();
    if (controller) controller->stop();
    controller.reset();
    transcriber.reset();
    sink.reset();
    driver.reset();
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Conversations", {"say", "yes", "no", "end"}},
        {"Sessions",      {"sessions", "mode", "channels"}},
        {"Setup",         {"credentials"}},
        {"General",       {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::WARM << theme::color::STRONG
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::ACCENT
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::MUTED
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::next_request_id() {
    return fmt::format("m{}", ++request_counter_);
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::WARM) + "agentmux" + rl_esc(theme::color::RESET);
    if (controller) {
        size_t n = controller->registry().size();
        if (n > 0) {
            prompt += ":" + rl_esc(theme::color::ACCENT) + fmt::format("{} live", n)
                    + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}
