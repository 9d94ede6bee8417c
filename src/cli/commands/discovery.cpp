#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <mutex>
#include <fmt/format.h>
#include <core/utils.hpp>

static std::mutex g_print_mutex;

// "refresh" -> Replace, anything else -> Union
static MergeMode mode_from(const std::string& arg) {
    return arg == "refresh" ? MergeMode::Replace : MergeMode::Union;
}

// ── Consoles ──────────────────────────────────────────────────

static void print_consoles(const std::vector<ConsoleDevice>& consoles) {
    if (consoles.empty()) {
        std::cout << theme::dim("    No serial consoles.") << "\n\n";
        return;
    }
    for (const auto& c : consoles) {
        std::cout << theme::color::BLUE << fmt::format("    {:<14}", c.name)
                  << theme::color::RESET << theme::dim(c.remote_path) << "\n";
    }
    std::cout << "\n";
}

static void do_consoles(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    auto& consoles = cli.service->consoles();

    if (arg == "cached") {
        std::cout << theme::section("Consoles (cached)");
        print_consoles(consoles.cached());
        return;
    }
    if (arg == "clear") {
        auto r = consoles.clear();
        if (r.is_err()) std::cout << theme::error(r);
        else std::cout << theme::ok("Console cache cleared.");
        return;
    }
    if (!arg.empty() && arg != "refresh") {
        std::cout << theme::fail("Usage: consoles [refresh|cached|clear]");
        return;
    }
    if (!cli.require_connection()) return;

    auto result = consoles.discover(mode_from(arg));
    if (result.is_err()) {
        std::cout << theme::error(result);
        return;
    }
    std::cout << theme::section("Consoles");
    print_consoles(result.value);
}

// ── Networks ──────────────────────────────────────────────────

static void print_networks(const std::vector<NetworkInterface>& networks) {
    if (networks.empty()) {
        std::cout << theme::dim("    No private networks.") << "\n\n";
        return;
    }
    for (const auto& n : networks) {
        std::cout << theme::color::BLUE << fmt::format("    {:<14}", n.name)
                  << theme::color::RESET << fmt::format("{:<20}", n.subnet_cidr)
                  << theme::dim(n.address) << "\n";
    }
    std::cout << "\n";
}

static void do_networks(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    auto& networks = cli.service->networks();

    if (arg == "cached") {
        std::cout << theme::section("Networks (cached)");
        print_networks(networks.cached());
        return;
    }
    if (arg == "clear") {
        auto r = networks.clear();
        if (r.is_err()) std::cout << theme::error(r);
        else std::cout << theme::ok("Network cache cleared.");
        return;
    }
    if (!arg.empty() && arg != "refresh") {
        std::cout << theme::fail("Usage: networks [refresh|cached|clear]");
        return;
    }
    if (!cli.require_connection()) return;

    auto result = networks.discover(mode_from(arg));
    if (result.is_err()) {
        std::cout << theme::error(result);
        return;
    }
    std::cout << theme::section("Networks");
    print_networks(result.value);
}

// ── Scanning ──────────────────────────────────────────────────

static void do_scan(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    auto words = split_ws(arg);
    if (words.empty() || words.size() > 2 || (words.size() == 2 && words[1] != "refresh")) {
        std::cout << theme::fail("Usage: scan <interface> [refresh]");
        return;
    }
    MergeMode mode = words.size() == 2 ? MergeMode::Replace : MergeMode::Union;

    auto& svc = *cli.service;
    auto iface = svc.networks().find(words[0]);
    if (iface.is_err()) {
        std::cout << theme::error(iface);
        return;
    }
    auto count = svc.scanner().count_hosts(iface.value);
    if (count.is_err()) {
        std::cout << theme::error(count);
        return;
    }

    std::cout << theme::info(fmt::format("{} addresses on {} ({}), {} probes at a time.",
                                         count.value, iface.value.subnet_cidr,
                                         iface.value.name, svc.scanner().workers()));
    if (mode == MergeMode::Replace) {
        std::cout << theme::info("Refresh: cached nodes of this subnet are discarded first.");
    }
    if (!cli.confirm("Start the scan?")) {
        std::cout << theme::dim("    Scan not started.") << "\n";
        return;
    }

    auto task = svc.scanner().scan(iface.value, mode, [](const DiscoveredNode& node) {
        std::lock_guard<std::mutex> lock(g_print_mutex);
        std::cout << "\n" << theme::ok(node.ip_address + " is live") << std::flush;
    });
    if (task.is_err()) {
        std::cout << theme::error(task);
        return;
    }
    std::cout << theme::step("Scanning in the background. 'scan-stop' cancels, 'nodes' lists results.");
}

static void do_scan_stop(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    auto task = cli.service->scanner().current();
    if (!task || task->done()) {
        std::cout << theme::fail("No scan is running.");
        return;
    }
    task->cancel();
    std::cout << theme::step("Stopping after the probes in flight...");
    auto summary = task->wait();
    if (summary.is_err()) {
        std::cout << theme::error(summary);
        return;
    }
    std::cout << theme::ok(fmt::format("Stopped: {}/{} probed, {} live.",
                                       summary.value.probed, summary.value.total,
                                       summary.value.found.size()));
}

static void print_bucket(const std::string& subnet, const std::vector<DiscoveredNode>& nodes) {
    std::cout << theme::color::BROWN << "  " << subnet << theme::color::RESET << "\n";
    if (nodes.empty()) {
        std::cout << theme::dim("    (none)") << "\n";
        return;
    }
    for (const auto& n : nodes) {
        std::cout << fmt::format("    {:<18}", n.ip_address)
                  << theme::dim("last seen " + n.last_seen) << "\n";
    }
}

static void do_nodes(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    auto& svc = *cli.service;

    std::cout << theme::section("Nodes");
    if (!arg.empty()) {
        auto iface = svc.networks().find(arg);
        if (iface.is_err()) {
            std::cout << theme::error(iface);
            return;
        }
        print_bucket(iface.value.subnet_cidr, svc.scanner().cached(iface.value.subnet_cidr));
    } else {
        auto inv = svc.session().inventory();
        if (inv.nodes.empty()) std::cout << theme::dim("    No nodes cached.") << "\n";
        for (const auto& entry : inv.nodes) {
            print_bucket(entry.first, svc.scanner().cached(entry.first));
        }
    }

    if (auto task = svc.scanner().current(); task && !task->done()) {
        std::cout << "\n" << theme::info(fmt::format("Scan of {} running: {}/{} probed, {} live",
                                                     task->subnet(), task->probed(),
                                                     task->total(), task->live()));
    }
    std::cout << "\n";
}

void register_discovery_commands(BaseCLI& cli) {
    cli.add_command("consoles", do_consoles, "Discover serial consoles [refresh|cached|clear]");
    cli.add_command("networks", do_networks, "Discover private networks [refresh|cached|clear]");
    cli.add_command("scan", do_scan, "Sweep an interface's subnet for live nodes [refresh]");
    cli.add_command("scan-stop", do_scan_stop, "Cancel the running scan");
    cli.add_command("nodes", do_nodes, "List discovered nodes [interface]");
}
