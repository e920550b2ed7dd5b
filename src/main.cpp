#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include "cli/rentwatch_cli.hpp"
#include "cli/theme.hpp"

static std::atomic<bool> g_stop{false};

static void handle_signal(int) {
    g_stop.store(true);
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    rentwatch"
              << theme::color::RESET << theme::color::DIM
              << "                 Run the monitor loop" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    rentwatch once"
              << theme::color::RESET << theme::color::DIM
              << "            Startup plus a single poll cycle" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    rentwatch status"
              << theme::color::RESET << theme::color::DIM
              << "          Show tracked sessions and earnings" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::AMBER << "    --config <path>"
              << theme::color::RESET << theme::color::DIM
              << "           Config file (default ./" << DEFAULT_CONFIG << ")"
              << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    rentwatch --version       Show version\n"
              << "    rentwatch --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string cmd;
        fs::path config_path = default_config_path();

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "rentwatch"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << RENTWATCH_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("Missing value for --config.");
                    return 1;
                }
                config_path = argv[++i];
            } else if (cmd.empty() && (arg == "once" || arg == "status" || arg == "run")) {
                cmd = arg;
            } else {
                std::cout << theme::fail("Unknown argument: " + arg);
                print_usage();
                return 1;
            }
        }

        RentwatchCLI cli(config_path);

        if (cmd == "status") {
            return cli.run_status();
        }
        if (cmd == "once") {
            return cli.run_once();
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        return cli.run_monitor(g_stop);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
