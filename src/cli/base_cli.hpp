#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <terminal/tmux_driver.hpp>
#include <managers/session_controller.hpp>
#include <managers/message_router.hpp>
#include <managers/transcriber.hpp>
#include "console_sink.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_controller();

    void init_managers();
    void clear_managers();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Next id for a message typed at the prompt
    std::string next_request_id();

    // Public state
    std::optional<Config> config;
    std::unique_ptr<TmuxDriver> driver;
    std::unique_ptr<ConsoleSink> sink;
    std::unique_ptr<SessionController> controller;
    std::unique_ptr<CommandTranscriber> transcriber;
    std::unique_ptr<MessageRouter> router;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    uint64_t request_counter_ = 0;
};
