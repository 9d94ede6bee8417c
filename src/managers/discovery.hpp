#pragma once

#include <future>
#include <string>
#include <vector>
#include <core/inventory.hpp>
#include <core/types.hpp>
#include "session_manager.hpp"

// Remote inventory of serial consoles. One command per discover(); the
// result is merged into the cache for the session identity.
class ConsoleDiscovery {
public:
    ConsoleDiscovery(SessionManager& session, int command_timeout);

    // Union adds to the cached set; Replace makes the cache equal to what
    // was found. The returned list is the cached set after the merge.
    Result<std::vector<ConsoleDevice>> discover(MergeMode mode = MergeMode::Union);
    std::future<Result<std::vector<ConsoleDevice>>> discover_async(MergeMode mode = MergeMode::Union);

    // No network traffic.
    std::vector<ConsoleDevice> cached() const;
    Result<void> clear();

private:
    SessionManager& session_;
    int command_timeout_;
};

// Remote private IPv4 networks, one entry per interface.
class NetworkDiscovery {
public:
    NetworkDiscovery(SessionManager& session, int command_timeout);

    Result<std::vector<NetworkInterface>> discover(MergeMode mode = MergeMode::Union);
    std::future<Result<std::vector<NetworkInterface>>> discover_async(MergeMode mode = MergeMode::Union);

    std::vector<NetworkInterface> cached() const;
    Result<void> clear();

    // Cached interface by name
    Result<NetworkInterface> find(const std::string& name) const;

private:
    SessionManager& session_;
    int command_timeout_;
};

// Runs a discovery command on the live session. ChannelError when not
// connected, CapabilityError when the remote lacks the tool (exit 127).
Result<CommandResult> run_discovery_command(SessionManager& session, const std::string& label,
                                            const std::string& command, int timeout_secs);
