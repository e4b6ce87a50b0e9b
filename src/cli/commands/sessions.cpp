#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static void do_sessions(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_controller()) return;

    auto sessions = cli.controller->sessions();
    std::cout << theme::section("Sessions");
    if (sessions.empty()) {
        std::cout << theme::dim("    No live sessions.") << "\n\n";
        return;
    }

    std::cout << theme::color::MUTED
              << fmt::format("    {:<16}{:<22}{:<11}{:<9}{:<9}{}", "CONVERSATION", "TERMINAL",
                             "MODE", "STARTED", "IDLE", "STATE")
              << theme::color::RESET << "\n";
    for (const auto& s : sessions) {
        std::string state = s.awaiting_reply ? theme::yellow("working") : theme::green("ready");
        std::cout << fmt::format("    {:<16}{:<22}{:<11}{:<9}{:<9}", s.conversation_id, s.terminal,
                                 mode_name(s.mode), format_clock(s.created_at),
                                 format_elapsed(s.idle))
                  << state << "\n";
    }
    std::cout << "\n";
}

// mode <conversation> <normal|auto|dangerous>
static void do_mode(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_controller()) return;

    auto [conversation, name] = split_first_word(arg);
    auto mode = parse_mode(name);
    if (conversation.empty() || !mode) {
        std::cout << theme::fail("Usage: mode <conversation> <normal|auto|dangerous>");
        return;
    }
    if (!cli.controller->set_mode(conversation, *mode)) {
        std::cout << theme::fail("No session for " + conversation);
        return;
    }
    auto rec = cli.controller->registry().find(conversation);
    if (rec && rec->mode != *mode) {
        std::cout << theme::info(fmt::format("{} is {} (permission mode is fixed at start)",
                                             conversation, mode_name(rec->mode)));
    } else {
        std::cout << theme::ok(fmt::format("{} is now {}", conversation, mode_name(*mode)));
    }
}

static void do_channels(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    std::cout << theme::section("Channels");
    if (cli.config->channels().empty()) {
        std::cout << theme::dim("    None configured.") << "\n\n";
        return;
    }
    for (const auto& [name, ch] : cli.config->channels()) {
        std::cout << theme::kv(name, ch.working_dir + theme::dim("  (" + ch.prefix + "-*)"));
    }
    std::cout << "\n";
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("sessions", do_sessions, "List live agent sessions");
    cli.add_command("mode", do_mode, "Change a session's permission mode");
    cli.add_command("channels", do_channels, "Show channel to repository bindings");
}
