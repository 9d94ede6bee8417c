#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct SshSettings {
    int port = SSH_DEFAULT_PORT;
    int connect_timeout = SSH_CONNECT_TIMEOUT_SECS;
    int command_timeout = SSH_CMD_TIMEOUT_SECS;
    int keepalive_secs = SSH_KEEPALIVE_SECS;      // 0 disables loss monitoring
    int max_channels = SSH_MAX_CHANNELS;
    bool strict_host_keys = false;
    std::string known_hosts;                      // empty = ~/.ssh/known_hosts
};

struct ScanSettings {
    int workers = SCAN_DEFAULT_WORKERS;
    int probe_timeout = SCAN_PROBE_TIMEOUT_SECS;
};

struct TunnelSettings {
    int remote_port = TUNNEL_REMOTE_PORT;
    int open_timeout = TUNNEL_OPEN_TIMEOUT_SECS;
    std::optional<std::pair<int, int>> port_range; // unset = let the OS pick
    int bind_attempts = TUNNEL_BIND_ATTEMPTS;
    // argv template run on a fresh tunnel; "{url}" is substituted
    std::vector<std::string> browser = {"xdg-open", "{url}"};
};

struct TerminalSettings {
    // argv template; "{title}" and "{attach}" are substituted
    std::vector<std::string> command = {"xterm", "-T", "{title}", "-e", "{attach}"};
    int attach_timeout = ATTACH_TIMEOUT_SECS;
    int serial_baud = SERIAL_DEFAULT_BAUD;
};

class Config {
public:
    // Load from the default location (RECON_CONFIG or ~/.recon/config.yaml).
    // A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit file. A missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml_text);

    const SshSettings& ssh() const { return ssh_; }
    const ScanSettings& scan() const { return scan_; }
    const TunnelSettings& tunnel() const { return tunnel_; }
    const TerminalSettings& terminal() const { return terminal_; }
    const fs::path& cache_dir() const { return cache_dir_; }
    const std::string& log_path() const { return log_path_; }
    const fs::path& source() const { return source_; }

    SshSettings& ssh() { return ssh_; }
    ScanSettings& scan() { return scan_; }
    TunnelSettings& tunnel() { return tunnel_; }
    TerminalSettings& terminal() { return terminal_; }
    void set_cache_dir(const fs::path& dir) { cache_dir_ = dir; }

public:
    Config();

private:
    SshSettings ssh_;
    ScanSettings scan_;
    TunnelSettings tunnel_;
    TerminalSettings terminal_;
    fs::path cache_dir_;
    std::string log_path_;
    fs::path source_;
};

fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Write a commented default config if none exists.
Result<void> create_default_config();
