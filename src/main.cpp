#include <iostream>
#include <string>
#include <cstdlib>
#include "cli/recon_cli.hpp"
#include "cli/attach.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    recon"
              << theme::color::RESET << theme::color::DIM
              << "                       Enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    recon connect "
              << theme::color::RESET << theme::color::BROWN << "<user@host>"
              << theme::color::RESET << theme::color::DIM
              << "   Connect, then enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    recon attach "
              << theme::color::RESET << theme::color::BROWN << "<socket>"
              << theme::color::RESET << theme::color::DIM
              << "     Attach a terminal to a session" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    recon --config FILE         Use FILE instead of ~/.recon/config.yaml\n"
              << "    recon --version             Show version\n"
              << "    recon --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        int i = 1;
        if (i < argc && std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                std::cout << theme::fail("--config needs a file path.");
                return 1;
            }
            setenv("RECON_CONFIG", argv[i + 1], 1);
            i += 2;
        }

        std::string cmd = i < argc ? argv[i] : "";

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "recon"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << RECON_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "attach") {
            if (i + 1 >= argc) {
                std::cout << theme::fail("Usage: recon attach <socket>");
                return 1;
            }
            return run_attach(argv[i + 1]);
        }

        std::string target;
        if (cmd == "connect") {
            if (i + 1 >= argc) {
                std::cout << theme::fail("Usage: recon connect <user@host>");
                return 1;
            }
            target = argv[i + 1];
        } else if (!cmd.empty()) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        if (!config_exists()) {
            auto created = create_default_config();
            if (created.is_err()) {
                std::cout << theme::error(created);
            } else {
                std::cout << theme::info("Wrote default config to " + get_config_path().string());
            }
        }

        ReconCLI cli;
        return cli.run_repl(target);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
