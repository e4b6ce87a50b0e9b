#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/utils.hpp>
#include <fmt/format.h>

// say <channel> <conversation> <text...>
static void do_say(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_controller()) return;

    auto [channel, rest] = split_first_word(arg);
    auto [conversation, text] = split_first_word(rest);
    if (channel.empty() || conversation.empty() || text.empty()) {
        std::cout << theme::fail("Usage: say <channel> <conversation> <text>");
        std::cout << theme::step("Flags in the text: --auto, --dangerous (or --yolo)");
        return;
    }

    InboundMessage msg;
    msg.channel = channel;
    msg.conversation_id = conversation;
    msg.text = text;
    msg.target = "console";
    msg.request_id = cli.next_request_id();

    if (!cli.controller->registry().find(conversation)) {
        std::cout << theme::dim(fmt::format("    Starting agent for '{}'...", conversation)) << "\n";
    }

    RouteOutcome outcome = cli.router->route(msg);
    switch (outcome) {
        case RouteOutcome::Submitted:
            std::cout << theme::step(fmt::format("Sent to {} ({})", conversation, msg.request_id));
            break;
        case RouteOutcome::UnknownChannel:
            std::cout << theme::fail(fmt::format("No repository bound to channel '{}'", channel));
            std::cout << theme::step("Add it under channels: in " + get_global_config_path().string());
            break;
        case RouteOutcome::Decided:
            std::cout << theme::ok("Answer sent");
            break;
        case RouteOutcome::NothingToDecide:
            std::cout << theme::info("Nothing is waiting for a decision");
            break;
        case RouteOutcome::Terminated:
            std::cout << theme::ok(fmt::format("Session {} ended", conversation));
            break;
        case RouteOutcome::Ignored:
            std::cout << theme::info("Nothing to send");
            break;
        case RouteOutcome::StartFailed:
            // The failure notice arrives through the sink.
            break;
    }
}

static void decide(BaseCLI& cli, const std::string& arg, bool accept) {
    if (!cli.require_controller()) return;
    std::string conversation = trimmed(arg);
    if (conversation.empty()) {
        std::cout << theme::fail(fmt::format("Usage: {} <conversation>", accept ? "yes" : "no"));
        return;
    }
    if (cli.controller->decide(conversation, accept)) {
        std::cout << theme::ok(accept ? "Allowed" : "Denied");
    } else {
        std::cout << theme::info("Nothing is waiting for a decision in " + conversation);
    }
}

static void do_yes(BaseCLI& cli, const std::string& arg) { decide(cli, arg, true); }
static void do_no(BaseCLI& cli, const std::string& arg) { decide(cli, arg, false); }

static void do_end(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_controller()) return;
    std::string conversation = trimmed(arg);
    if (conversation.empty()) {
        std::cout << theme::fail("Usage: end <conversation>");
        return;
    }
    if (cli.controller->terminate(conversation)) {
        std::cout << theme::ok(fmt::format("Session {} ended", conversation));
    } else {
        std::cout << theme::fail("No session for " + conversation);
    }
}

void register_conversation_commands(BaseCLI& cli) {
    cli.add_command("say", do_say, "Send text to a conversation's agent");
    cli.add_command("yes", do_yes, "Allow the pending permission prompt");
    cli.add_command("no", do_no, "Deny the pending permission prompt");
    cli.add_command("end", do_end, "Kill a conversation's agent");
}
