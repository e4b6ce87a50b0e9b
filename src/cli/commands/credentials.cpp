#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/credentials.hpp>
#include <core/utils.hpp>

// credentials [list] | set <KEY> <value> | remove <KEY>
static void do_credentials(BaseCLI& cli, const std::string& arg) {
    auto& creds = CredentialManager::instance();
    auto [action, rest] = split_first_word(arg);

    if (action.empty() || action == "list") {
        auto entries = creds.list();
        std::cout << theme::section("Credentials");
        if (entries.empty()) {
            std::cout << theme::dim("    None stored.") << "\n\n";
            return;
        }
        for (const auto& e : entries) {
            std::cout << theme::kv(e.key, e.has_value ? "set" : theme::dim("empty"));
        }
        std::cout << "\n";
        return;
    }

    if (action == "set") {
        auto [key, value] = split_first_word(rest);
        if (key.empty() || value.empty()) {
            std::cout << theme::fail("Usage: credentials set <KEY> <value>");
            return;
        }
        auto r = creds.set(key, value);
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
            return;
        }
        std::cout << theme::ok(key + " stored (applies to agents started from now on)");
        return;
    }

    if (action == "remove") {
        auto r = creds.remove(trimmed(rest));
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
            return;
        }
        std::cout << theme::ok(trimmed(rest) + " removed");
        return;
    }

    std::cout << theme::fail("Unknown action: " + action);
    std::cout << theme::step("Usage: credentials [list] | set <KEY> <value> | remove <KEY>");
}

void register_credentials_commands(BaseCLI& cli) {
    cli.add_command("credentials", do_credentials, "List, set or remove agent secrets");
}
