#include <iostream>
#include <vector>
#include <string>
#include "cli/agentmux_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::ACCENT << "    agentmux"
              << theme::color::RESET << theme::color::MUTED
              << "                  Start the controller and enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    agentmux run"
              << theme::color::RESET << theme::color::MUTED
              << "              Same as above" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    agentmux setup"
              << theme::color::RESET << theme::color::MUTED
              << "            Write the default config and store secrets" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::MUTED
              << "    agentmux --version        Show version\n"
              << "    agentmux --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::WARM << theme::color::STRONG << "agentmux"
                          << theme::color::RESET << theme::color::MUTED
                          << " version 0.1.0" << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            }
        }

        AgentmuxCLI cli;

        if (argc == 1) {
            cli.run_repl();
        } else {
            std::string cmd = argv[1];

            if (cmd == "run") {
                cli.run_repl();
            } else if (cmd == "setup") {
                cli.run_setup();
            } else {
                std::cout << theme::fail("Unknown command: " + cmd);
                print_usage();
                return 1;
            }
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
