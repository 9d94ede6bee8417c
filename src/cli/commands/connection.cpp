#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>

// "user@host" -> identity
static bool parse_target(const std::string& text, HostIdentity& out) {
    auto at = text.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= text.size()) return false;
    out.user = text.substr(0, at);
    out.host = text.substr(at + 1);
    return out.host.find_first_of(" \t@") == std::string::npos;
}

static void do_connect(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    std::string target = arg;
    trim(target);
    HostIdentity id;
    if (!parse_target(target, id)) {
        std::cout << theme::fail("Usage: connect user@host");
        return;
    }

    Credentials creds;
    creds.password = cli.read_password(
        theme::color::BROWN + fmt::format("    Password for {}: ", id.key()) + theme::color::RESET);

    std::cout << theme::section("Connecting");
    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };

    auto result = cli.service->connect(id, creds, callback);
    if (result.is_err()) {
        std::cout << theme::error(result);
        if (result.kind == ErrorKind::Network || result.kind == ErrorKind::Timeout) {
            std::cout << theme::dim("    Check that the host is reachable and sshd is running.") << "\n";
        }
        std::cout << "\n";
        return;
    }

    auto inv = cli.service->session().inventory();
    std::cout << theme::ok("Connected to " + id.key());
    std::cout << theme::kv("Consoles", fmt::format("{} cached", inv.consoles.size()));
    std::cout << theme::kv("Networks", fmt::format("{} cached", inv.networks.size()));
    size_t nodes = 0;
    for (const auto& [subnet, bucket] : inv.nodes) nodes += bucket.size();
    std::cout << theme::kv("Nodes", fmt::format("{} cached", nodes));
    std::cout << theme::dim("    Run 'consoles' or 'networks' to refresh from the host.") << "\n\n";
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (!cli.service || cli.service->state() == SessionState::Idle) {
        std::cout << theme::fail("Not connected.");
        return;
    }
    std::cout << theme::dim("    Disconnecting...") << "\n";
    cli.service->disconnect();
    std::cout << theme::ok("Disconnected.");
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (config_exists()) {
        std::cout << theme::kv("Config", get_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults (" + get_config_path().string() + " not found)");
    }
    std::cout << theme::kv("Log", recon_log_path());
    if (!cli.require_config()) return;

    auto& svc = *cli.service;
    std::cout << theme::kv("Cache", svc.cache().dir().string());

    SessionState state = svc.state();
    std::cout << theme::kv("Session", session_state_name(state));
    if (auto id = svc.identity()) {
        std::cout << theme::kv("Host", id->key());
    }
    if (state == SessionState::Failed) {
        std::cout << theme::kv("Reason", fmt::format("{}: {}",
                               error_kind_name(svc.session().failure_kind()),
                               svc.session().failure_reason()));
    }
    if (state == SessionState::Connected) {
        std::cout << theme::kv("Channels", fmt::format("{} / {}",
                               svc.session().transport().open_channel_count(),
                               svc.session().transport().max_channels()));
    }

    TunnelInfo tunnel = svc.tunnel().info();
    if (tunnel.status == TunnelStatus::Open) {
        std::cout << theme::kv("Tunnel", fmt::format("{} -> {}:{} ({} connection(s))",
                               tunnel.local_url(), tunnel.remote_host, tunnel.remote_port,
                               svc.tunnel().active_connections()));
    } else if (tunnel.status == TunnelStatus::Failed) {
        std::cout << theme::kv("Tunnel", "failed: " + tunnel.error);
    } else {
        std::cout << theme::kv("Tunnel", tunnel_status_name(tunnel.status));
    }

    std::cout << theme::kv("Sessions", std::to_string(svc.spawner().sessions().size()));

    if (auto task = svc.scanner().current()) {
        std::cout << theme::kv("Scan", fmt::format("{} {}/{} probed, {} live{}",
                               task->subnet(), task->probed(), task->total(), task->live(),
                               task->done() ? "" : " (running)"));
    }
    std::cout << "\n";
}

static void do_hosts(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    auto hosts = cli.service->known_hosts();
    std::cout << theme::section("Known hosts");
    if (hosts.empty()) {
        std::cout << theme::dim("    No hosts cached yet.") << "\n\n";
        return;
    }
    auto current = cli.service->identity();
    for (const auto& h : hosts) {
        bool active = current && *current == h && cli.service->is_connected();
        std::cout << "    " << (active ? theme::green(h.key()) : h.key())
                  << (active ? theme::dim("  (connected)") : "") << "\n";
    }
    std::cout << "\n";
}

static void do_forget(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    std::string target = arg;
    trim(target);
    HostIdentity id;
    if (target.empty()) {
        auto current = cli.service->identity();
        if (!current) {
            std::cout << theme::fail("Usage: forget [user@host]");
            return;
        }
        id = *current;
    } else if (!parse_target(target, id)) {
        std::cout << theme::fail("Usage: forget [user@host]");
        return;
    }

    if (!cli.confirm(fmt::format("Drop everything cached for {}?", id.key()))) return;
    auto result = cli.service->cache().forget(id);
    if (result.is_err()) {
        std::cout << theme::error(result);
        return;
    }
    std::cout << theme::ok("Forgot " + id.key());
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Connect to user@host");
    cli.add_command("disconnect", do_disconnect, "Close the session, tunnel and spawned terminals");
    cli.add_command("status", do_status, "Show session, tunnel and scan status");
    cli.add_command("hosts", do_hosts, "List hosts with cached inventory");
    cli.add_command("forget", do_forget, "Drop the cached inventory of a host [user@host]");
}
