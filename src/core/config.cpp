#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ── Paths ───────────────────────────────────────────────────

fs::path get_config_dir() {
    return platform::home_dir() / ".recon";
}

fs::path get_config_path() {
    const char* env = std::getenv("RECON_CONFIG");
    if (env && *env) return fs::path(env);
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

static fs::path expand_home(const std::string& p) {
    if (p.size() >= 1 && p[0] == '~') {
        return platform::home_dir() / p.substr(p.size() > 1 && p[1] == '/' ? 2 : 1);
    }
    return fs::path(p);
}

Config::Config() : cache_dir_(get_config_dir() / "hosts") {}

// ── Section parsers ─────────────────────────────────────────

static void parse_ssh(const YAML::Node& node, SshSettings& ssh) {
    ssh.port = node["port"].as<int>(ssh.port);
    ssh.connect_timeout = node["connect_timeout"].as<int>(ssh.connect_timeout);
    ssh.command_timeout = node["command_timeout"].as<int>(ssh.command_timeout);
    ssh.keepalive_secs = node["keepalive_secs"].as<int>(ssh.keepalive_secs);
    ssh.max_channels = node["max_channels"].as<int>(ssh.max_channels);
    ssh.strict_host_keys = node["strict_host_keys"].as<bool>(ssh.strict_host_keys);
    if (node["known_hosts"]) {
        ssh.known_hosts = expand_home(node["known_hosts"].as<std::string>("")).string();
    }
}

static void parse_scan(const YAML::Node& node, ScanSettings& scan) {
    scan.workers = node["workers"].as<int>(scan.workers);
    scan.probe_timeout = node["probe_timeout"].as<int>(scan.probe_timeout);
}

// A command line as a YAML sequence, or a whitespace-separated shorthand string
static void parse_argv(const YAML::Node& node, std::vector<std::string>& argv) {
    if (!node) return;
    if (node.IsSequence()) {
        argv = node.as<std::vector<std::string>>();
    } else if (node.IsScalar()) {
        std::istringstream iss(node.as<std::string>());
        std::vector<std::string> out;
        std::string tok;
        while (iss >> tok) out.push_back(tok);
        argv = out;
    } else if (node.IsNull()) {
        argv.clear();
    }
}

static Result<void> parse_tunnel(const YAML::Node& node, TunnelSettings& tunnel) {
    parse_argv(node["browser"], tunnel.browser);
    tunnel.remote_port = node["remote_port"].as<int>(tunnel.remote_port);
    tunnel.open_timeout = node["open_timeout"].as<int>(tunnel.open_timeout);
    tunnel.bind_attempts = node["bind_attempts"].as<int>(tunnel.bind_attempts);

    auto range = node["port_range"];
    if (range && !range.IsNull()) {
        if (!range.IsSequence() || range.size() != 2) {
            return Result<void>::Err(ErrorKind::Config,
                "tunnel.port_range must be a [low, high] pair");
        }
        int lo = range[0].as<int>();
        int hi = range[1].as<int>();
        if (lo < 1024 || hi > 65535 || lo > hi) {
            return Result<void>::Err(ErrorKind::Config,
                fmt::format("tunnel.port_range [{}, {}] is not a valid unprivileged range", lo, hi));
        }
        tunnel.port_range = std::make_pair(lo, hi);
    }
    return Result<void>::Ok();
}

static void parse_terminal(const YAML::Node& node, TerminalSettings& term) {
    parse_argv(node["command"], term.command);
    term.attach_timeout = node["attach_timeout"].as<int>(term.attach_timeout);
    term.serial_baud = node["serial_baud"].as<int>(term.serial_baud);
}

// ── Loading ─────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Config, "top level must be a mapping");
        }

        if (root["ssh"]) parse_ssh(root["ssh"], config.ssh_);
        if (root["scan"]) parse_scan(root["scan"], config.scan_);
        if (root["tunnel"]) {
            auto r = parse_tunnel(root["tunnel"], config.tunnel_);
            if (r.is_err()) return Result<Config>::Err(r);
        }
        if (root["terminal"]) parse_terminal(root["terminal"], config.terminal_);
        if (root["cache"] && root["cache"]["dir"]) {
            config.cache_dir_ = expand_home(root["cache"]["dir"].as<std::string>());
        }
        if (root["log"] && root["log"]["path"]) {
            config.log_path_ = expand_home(root["log"]["path"].as<std::string>()).string();
        }
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Config, e.what());
    }

    if (config.ssh_.max_channels < 1) {
        return Result<Config>::Err(ErrorKind::Config, "ssh.max_channels must be at least 1");
    }
    if (config.scan_.workers < 1) {
        return Result<Config>::Err(ErrorKind::Config, "scan.workers must be at least 1");
    }
    if (config.terminal_.command.empty()) {
        return Result<Config>::Err(ErrorKind::Config, "terminal.command is empty");
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        Config config;
        config.source_ = path;
        return Result<Config>::Ok(config);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::Config, "Cannot read " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error = fmt::format("{}: {}", path.string(), result.error);
        return result;
    }
    result.value.source_ = path;
    return result;
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# recon configuration

ssh:
  port: 22
  connect_timeout: 3        # seconds, TCP connect through authentication
  command_timeout: 30       # seconds per remote command
  keepalive_secs: 30        # connection loss detection, 0 disables
  max_channels: 10          # concurrent channels on one connection
  strict_host_keys: false   # refuse hosts missing from known_hosts
  # known_hosts: ~/.ssh/known_hosts

scan:
  workers: 4                # concurrent ping probes
  probe_timeout: 1          # seconds per probe

tunnel:
  remote_port: 443
  open_timeout: 10
  # port_range: [51000, 60000]   # unset = any free port
  bind_attempts: 16
  # {url} is substituted; an empty list leaves opening the URL to you
  browser: ["xdg-open", "{url}"]

terminal:
  # {title} and {attach} are substituted when a shell or console is opened
  command: ["xterm", "-T", "{title}", "-e", "{attach}"]
  attach_timeout: 15
  serial_baud: 115200

cache:
  dir: ~/.recon/hosts

# log:
#   path: /tmp/recon_debug.log
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::Io,
                "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::Io,
            "Failed to write config file: " + std::string(e.what()));
    }
}
