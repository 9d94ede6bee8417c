#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/inventory.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <ssh/transport.hpp>
#include "cache_store.hpp"
#include "discovery.hpp"
#include "node_scanner.hpp"
#include "process_spawner.hpp"
#include "session_manager.hpp"
#include "tunnel_manager.hpp"

// Headless engine facade: owns the transport and every manager, wires the
// session teardown to tunnels, spawned sessions and scans. Any frontend
// drives the engine through this.
class ReconService {
public:
    // A null transport means SSH with the configured settings.
    explicit ReconService(const Config& config,
                          std::unique_ptr<Transport> transport = nullptr,
                          ProcessSpawner::Launcher launcher = nullptr);
    ~ReconService();

    ReconService(const ReconService&) = delete;
    ReconService& operator=(const ReconService&) = delete;

    // ── Connection lifecycle ──────────────────────────────────

    Result<void> connect(const HostIdentity& identity, const Credentials& credentials,
                         StatusCallback cb = nullptr);
    void disconnect();

    SessionState state() const { return session_.current_state(); }
    bool is_connected() const { return session_.is_connected(); }
    bool check_alive() { return session_.check_alive(); }
    std::optional<HostIdentity> identity() const { return session_.identity(); }

    // Cached identities, for reconnecting.
    std::vector<HostIdentity> known_hosts() const { return cache_.known_hosts(); }

    // ── Operations ────────────────────────────────────────────

    // Run an arbitrary command on the remote host.
    Result<CommandResult> exec(const std::string& command);

    // Sweep the subnet of a cached interface.
    Result<ScanTaskPtr> scan_interface(const std::string& iface, MergeMode mode,
                                       NodeScanner::NodeCallback on_node = nullptr);

    // Run the configured browser on a URL (a tunnel's local endpoint).
    // Config error when no browser is configured.
    Result<void> open_browser(const std::string& url);

    // ── Managers ──────────────────────────────────────────────

    const Config& config() const { return config_; }
    CacheStore& cache() { return cache_; }
    SessionManager& session() { return session_; }
    ConsoleDiscovery& consoles() { return consoles_; }
    NetworkDiscovery& networks() { return networks_; }
    NodeScanner& scanner() { return scanner_; }
    TunnelManager& tunnel() { return tunnel_; }
    ProcessSpawner& spawner() { return spawner_; }

private:
    Config config_;
    CacheStore cache_;
    std::unique_ptr<Transport> transport_;
    SessionManager session_;
    ConsoleDiscovery consoles_;
    NetworkDiscovery networks_;
    NodeScanner scanner_;
    TunnelManager tunnel_;
    ProcessSpawner spawner_;

    std::mutex browsers_mutex_;
    std::vector<platform::ProcessHandle> browsers_;  // reaped on the next launch
};
