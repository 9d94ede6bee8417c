#include "recon_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <fmt/format.h>
#include <core/config.hpp>
#include <readline/readline.h>
#include <readline/history.h>

ReconCLI::ReconCLI() : BaseCLI() {
    register_all_commands();
}

void ReconCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        running_ = false;
    }, "Disconnect and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        running_ = false;
    }, "Disconnect and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_connection_commands(*this);
    register_discovery_commands(*this);
    register_access_commands(*this);
}

void ReconCLI::report_background() {
    if (!service) return;

    if (was_connected_ && service->state() == SessionState::Failed) {
        std::cout << "\n" << theme::divider();
        std::cout << theme::fail(fmt::format("Connection lost: {}",
                                             service->session().failure_reason()));
        std::cout << theme::dim("    The tunnel, scans and spawned terminals were closed.") << "\n";
        std::cout << theme::step("Use 'connect user@host' to reconnect.");
        std::cout << "\n";
    }
    was_connected_ = service->is_connected();

    auto task = service->scanner().current();
    if (task && task != reported_scan_ && task->done()) {
        reported_scan_ = task;
        auto summary = task->wait();
        if (summary.is_err()) {
            std::cout << theme::fail(fmt::format("Scan of {} stopped: {}", task->subnet(),
                                                 summary.describe()));
        } else if (!summary.value.cancelled) {
            std::cout << theme::ok(fmt::format("Scan of {} finished: {} live of {}.",
                                               summary.value.subnet, summary.value.found.size(),
                                               summary.value.total));
        }
    }
}

int ReconCLI::run_repl(const std::string& initial_target) {
    std::cout << theme::banner();

    if (!require_config()) {
        std::cout << "\n";
        return 1;
    }

    std::cout << theme::section("Setup");
    std::cout << theme::kv("Config", config_exists() ? get_config_path().string() : "defaults");
    std::cout << theme::kv("Cache", service->cache().dir().string());

    auto hosts = service->known_hosts();
    if (!hosts.empty()) {
        std::string recent;
        for (size_t i = 0; i < hosts.size() && i < 5; i++) {
            if (i > 0) recent += ", ";
            recent += hosts[i].key();
        }
        std::cout << theme::kv("Known", recent);
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    if (!initial_target.empty()) {
        execute_command("connect", initial_target);
        was_connected_ = service->is_connected();
    }

    std::string line;
    while (running_) {
        // Probe the session between commands so loss is reported promptly
        if (service->is_connected()) service->check_alive();
        report_background();

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
        was_connected_ = was_connected_ || service->is_connected();
    }

    // Cleanup
    std::cout << theme::dim("    Disconnecting...") << "\n";
    service->disconnect();
    return 0;
}
