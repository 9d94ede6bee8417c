#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        set_log_path(config->log_path());
        service = std::make_unique<ReconService>(config.value());
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value() || !service) {
        std::cout << theme::fail("Configuration could not be loaded: " + config_error);
        std::cout << theme::step("Fix " + get_config_path().string() + " and restart.");
        return false;
    }
    return true;
}

bool BaseCLI::require_connection() {
    if (!require_config()) {
        return false;
    }
    if (!service->is_connected()) {
        std::cout << theme::fail("Not connected. Use 'connect user@host'.");
        return false;
    }
    return true;
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
        recon_log(fmt::format("cli: '{}' threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"connect", "disconnect", "status", "hosts", "forget"}},
        {"Discovery",  {"consoles", "networks", "scan", "scan-stop", "nodes"}},
        {"Access",     {"tunnel", "untunnel", "browse", "shell", "console", "sessions", "exec"}},
        {"General",    {"clear", "help", "quit", "exit"}},
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

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

bool BaseCLI::confirm(const std::string& question) {
    std::cout << theme::color::BROWN << "    " << question << " [y/N] " << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

std::string BaseCLI::read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    std::string password;
    {
        platform::RawModeGuard guard(platform::RawModeGuard::kNoEcho);
        std::getline(std::cin, password);
    }
    std::cout << "\n";
    return password;
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "recon" + rl_esc(theme::color::RESET);
    if (service) {
        auto id = service->identity();
        if (id && service->is_connected()) {
            prompt += ":" + rl_esc(theme::color::BLUE) + id->user
                    + rl_esc(theme::color::RESET) + "@"
                    + rl_esc(theme::color::GREEN) + id->host
                    + rl_esc(theme::color::RESET);
            if (service->tunnel().status() == TunnelStatus::Open) {
                prompt += rl_esc(theme::color::DIM) + fmt::format(" [:{}]",
                          service->tunnel().info().local_port) + rl_esc(theme::color::RESET);
            }
        }
    }
    return prompt + "> ";
}
