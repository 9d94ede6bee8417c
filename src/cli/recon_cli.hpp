#pragma once

#include "base_cli.hpp"
#include <memory>
#include <string>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_discovery_commands(BaseCLI& cli);
void register_access_commands(BaseCLI& cli);

class ReconCLI : public BaseCLI {
public:
    ReconCLI();

    // Interactive loop. A non-empty target ("user@host") is connected first.
    int run_repl(const std::string& initial_target = "");

private:
    void register_all_commands();

    // Report events that happened between prompts (lost connection,
    // finished scans).
    void report_background();

    bool running_ = true;
    bool was_connected_ = false;
    std::shared_ptr<ScanTask> reported_scan_;
};
