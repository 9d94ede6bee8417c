#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/ipv4.hpp>
#include <core/utils.hpp>

// ── Tunnel ────────────────────────────────────────────────────

static void do_tunnel(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    std::string ip = arg;
    trim(ip);
    uint32_t addr = 0;
    if (!parse_ipv4(ip, addr)) {
        std::cout << theme::fail("Usage: tunnel <node-ip>");
        return;
    }

    std::cout << theme::step(fmt::format("Opening tunnel to {}:{}...", ip,
                                         cli.config->tunnel().remote_port));
    auto result = cli.service->tunnel().open(ip);
    if (result.is_err()) {
        std::cout << theme::error(result);
        if (result.kind == ErrorKind::TunnelConflict) {
            std::cout << theme::step("Run 'untunnel' first.");
        }
        return;
    }
    std::string url = result.value.local_url();
    std::cout << theme::ok(fmt::format("{} -> {}:{}", url,
                                       result.value.remote_host, result.value.remote_port));

    if (cli.config->tunnel().browser.empty()) {
        std::cout << theme::dim("    Open the URL in a browser. 'untunnel' closes it.") << "\n";
        return;
    }
    auto opened = cli.service->open_browser(url);
    if (opened.is_err()) {
        std::cout << theme::error(opened);
        std::cout << theme::step("Open the URL by hand. 'untunnel' closes it.");
        return;
    }
    std::cout << theme::dim("    Opened in the browser. 'untunnel' closes it.") << "\n";
}

static void do_browse(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto& tunnel = cli.service->tunnel();
    if (tunnel.status() != TunnelStatus::Open) {
        std::cout << theme::fail("No tunnel is open.");
        std::cout << theme::step("Use 'tunnel <node-ip>' first.");
        return;
    }
    std::string url = tunnel.info().local_url();
    auto opened = cli.service->open_browser(url);
    if (opened.is_err()) {
        std::cout << theme::error(opened);
        return;
    }
    std::cout << theme::ok("Opened " + url);
}

static void do_untunnel(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    auto& tunnel = cli.service->tunnel();
    TunnelStatus before = tunnel.status();
    tunnel.close();
    if (before == TunnelStatus::Open) std::cout << theme::ok("Tunnel closed.");
    else std::cout << theme::dim("    No tunnel was open.") << "\n";
}

// ── Interactive sessions ──────────────────────────────────────

static void do_shell(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    auto result = cli.service->spawner().spawn_shell();
    if (result.is_err()) {
        std::cout << theme::error(result);
        return;
    }
    std::cout << theme::ok(fmt::format("Shell '{}' opened in a new terminal (channel {}).",
                                       result.value->title(), result.value->channel_id()));
}

static void do_console(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    std::string name = arg;
    trim(name);
    if (name.empty()) {
        std::cout << theme::fail("Usage: console <name>");
        return;
    }

    const ConsoleDevice* device = nullptr;
    auto consoles = cli.service->consoles().cached();
    for (const auto& c : consoles) {
        if (c.name == name || c.remote_path == name) device = &c;
    }
    if (!device) {
        std::cout << theme::fail("Unknown console: " + name);
        std::cout << theme::step("Run 'consoles' to discover serial devices.");
        return;
    }

    auto result = cli.service->spawner().spawn_console(*device);
    if (result.is_err()) {
        std::cout << theme::error(result);
        return;
    }
    std::cout << theme::ok(fmt::format("Console {} opened in a new terminal (channel {}).",
                                       device->name, result.value->channel_id()));
}

static void do_sessions(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    auto sessions = cli.service->spawner().sessions();
    std::cout << theme::section("Sessions");
    if (sessions.empty()) {
        std::cout << theme::dim("    No spawned terminals.") << "\n\n";
        return;
    }
    for (const auto& s : sessions) {
        std::cout << fmt::format("    #{:<3} {:<8} ", s->id(),
                                 s->kind() == InteractiveKind::Shell ? "shell" : "console")
                  << s->title()
                  << theme::dim(s->attached() ? "" : "  (waiting for terminal)") << "\n";
    }
    std::cout << "\n";
}

// ── Exec ──────────────────────────────────────────────────────

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }
    auto result = cli.service->exec(arg);
    if (result.is_err()) {
        std::cout << theme::error(result);
        return;
    }
    std::cout << result.value.stdout_data;
    if (!result.value.stderr_data.empty()) {
        std::cerr << result.value.stderr_data;
    }
    if (result.value.failed()) {
        std::cout << theme::dim(fmt::format("    exit {}", result.value.exit_code)) << "\n";
    }
}

void register_access_commands(BaseCLI& cli) {
    cli.add_command("tunnel", do_tunnel, "Forward a local port to <node-ip>:443");
    cli.add_command("untunnel", do_untunnel, "Close the tunnel");
    cli.add_command("browse", do_browse, "Open the tunnel in the browser again");
    cli.add_command("shell", do_shell, "Open a remote shell in a new terminal");
    cli.add_command("console", do_console, "Open a serial console in a new terminal");
    cli.add_command("sessions", do_sessions, "List spawned terminals");
    cli.add_command("exec", do_exec, "Run a command on the remote host");
}
