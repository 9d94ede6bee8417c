#include "discovery.hpp"
#include "discovery_parsers.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

Result<CommandResult> run_discovery_command(SessionManager& session, const std::string& label,
                                            const std::string& command, int timeout_secs) {
    if (!session.is_connected()) {
        return Result<CommandResult>::Err(ErrorKind::Channel, "Not connected");
    }

    auto result = session.transport().execute(command, timeout_secs);
    if (result.is_err()) {
        recon_log(fmt::format("{}: {}", label, result.describe()));
        return result;
    }

    const CommandResult& r = result.value;
    recon_log_cmd(label, command, r);
    if (r.exit_code == EXIT_COMMAND_NOT_FOUND) {
        return Result<CommandResult>::Err(ErrorKind::Capability,
            fmt::format("Remote host cannot run {} discovery: {}", label,
                        r.stderr_data.empty() ? "command not found" : r.stderr_data));
    }
    if (r.failed()) {
        return Result<CommandResult>::Err(ErrorKind::Discovery,
            fmt::format("{} discovery exited with {}: {}", label, r.exit_code, r.get_output()));
    }
    return result;
}

template <typename T>
static std::vector<T> values_of(const std::map<std::string, T>& by_name) {
    std::vector<T> out;
    out.reserve(by_name.size());
    for (const auto& [name, v] : by_name) out.push_back(v);
    return out;
}

// ── ConsoleDiscovery ─────────────────────────────────────────

ConsoleDiscovery::ConsoleDiscovery(SessionManager& session, int command_timeout)
    : session_(session), command_timeout_(command_timeout) {}

Result<std::vector<ConsoleDevice>> ConsoleDiscovery::discover(MergeMode mode) {
    using R = Result<std::vector<ConsoleDevice>>;

    auto id = session_.identity();
    auto out = run_discovery_command(session_, "consoles", CONSOLE_DISCOVERY_CMD, command_timeout_);
    if (out.is_err()) return R::Err(out);
    if (!id) return R::Err(ErrorKind::Channel, "Not connected");

    auto parsed = parse_console_listing(out.value.stdout_data);
    if (parsed.is_err()) {
        recon_log("consoles: " + parsed.error);
        return parsed;
    }

    auto merged = session_.cache().merge_consoles(*id, parsed.value, mode);
    if (merged.is_err()) return R::Err(merged);

    recon_log(fmt::format("consoles: found {}, {} cached", parsed.value.size(),
                          merged.value.consoles.size()));
    return R::Ok(values_of(merged.value.consoles));
}

std::future<Result<std::vector<ConsoleDevice>>> ConsoleDiscovery::discover_async(MergeMode mode) {
    return std::async(std::launch::async, [this, mode] { return discover(mode); });
}

std::vector<ConsoleDevice> ConsoleDiscovery::cached() const {
    return values_of(session_.inventory().consoles);
}

Result<void> ConsoleDiscovery::clear() {
    auto id = session_.identity();
    if (!id) return Result<void>::Err(ErrorKind::Channel, "No host selected");
    return session_.cache().clear(*id, InventorySection::Consoles);
}

// ── NetworkDiscovery ─────────────────────────────────────────

NetworkDiscovery::NetworkDiscovery(SessionManager& session, int command_timeout)
    : session_(session), command_timeout_(command_timeout) {}

Result<std::vector<NetworkInterface>> NetworkDiscovery::discover(MergeMode mode) {
    using R = Result<std::vector<NetworkInterface>>;

    auto id = session_.identity();
    auto out = run_discovery_command(session_, "networks", NETWORK_DISCOVERY_CMD, command_timeout_);
    if (out.is_err()) return R::Err(out);
    if (!id) return R::Err(ErrorKind::Channel, "Not connected");

    auto parsed = parse_network_listing(out.value.stdout_data);
    if (parsed.is_err()) {
        recon_log("networks: " + parsed.error);
        return parsed;
    }

    auto merged = session_.cache().merge_networks(*id, parsed.value, mode);
    if (merged.is_err()) return R::Err(merged);

    recon_log(fmt::format("networks: found {}, {} cached", parsed.value.size(),
                          merged.value.networks.size()));
    return R::Ok(values_of(merged.value.networks));
}

std::future<Result<std::vector<NetworkInterface>>> NetworkDiscovery::discover_async(MergeMode mode) {
    return std::async(std::launch::async, [this, mode] { return discover(mode); });
}

std::vector<NetworkInterface> NetworkDiscovery::cached() const {
    return values_of(session_.inventory().networks);
}

Result<void> NetworkDiscovery::clear() {
    auto id = session_.identity();
    if (!id) return Result<void>::Err(ErrorKind::Channel, "No host selected");
    return session_.cache().clear(*id, InventorySection::Networks);
}

Result<NetworkInterface> NetworkDiscovery::find(const std::string& name) const {
    auto inv = session_.inventory();
    auto it = inv.networks.find(name);
    if (it == inv.networks.end()) {
        return Result<NetworkInterface>::Err(ErrorKind::Discovery,
            fmt::format("Unknown interface '{}' (run 'networks' first)", name));
    }
    return Result<NetworkInterface>::Ok(it->second);
}
