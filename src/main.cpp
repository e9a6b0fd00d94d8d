#include <iostream>
#include <vector>
#include <string>
#include "cli/hubwarden_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    hubwarden"
              << theme::color::RESET << theme::color::DIM
              << "                 Ensure the backend runs, then stay resident" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hubwarden run "
              << theme::color::RESET << theme::color::BROWN << "[--once]"
              << theme::color::RESET << theme::color::DIM
              << "  Same; --once exits after the outcome" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hubwarden status"
              << theme::color::RESET << theme::color::DIM
              << "          Probe the backend, show lock files" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hubwarden unlock"
              << theme::color::RESET << theme::color::DIM
              << "          Remove lock files left by a crash" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hubwarden init"
              << theme::color::RESET << theme::color::DIM
              << "            Write the default config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>         Use a config file other than ~/.hubwarden/config.yaml\n"
              << "    hubwarden --version     Show version\n"
              << "    hubwarden --help        Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path");
                    return 1;
                }
                config_path = argv[++i];
            } else {
                args.push_back(a);
            }
        }

        std::string cmd = args.empty() ? "run" : args[0];

        if (cmd == "--version") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "hubwarden"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        HubwardenCLI cli(config_path);

        if (cmd == "run") {
            bool once = args.size() >= 2 && args[1] == "--once";
            return cli.run(once);
        } else if (cmd == "--once") {
            return cli.run(true);
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "unlock") {
            return cli.run_unlock();
        } else if (cmd == "init") {
            return cli.run_init();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
