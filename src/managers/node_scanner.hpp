#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/inventory.hpp>
#include <core/types.hpp>
#include "session_manager.hpp"

struct ScanSummary {
    std::string subnet;
    size_t total = 0;                       // addresses in the sweep
    size_t probed = 0;                      // probes completed
    bool cancelled = false;
    std::vector<DiscoveredNode> found;      // in commit order
};

// Handle to one running sweep. cancel() stops dispatch of new probes;
// probes already in flight finish and still commit.
class ScanTask {
public:
    ScanTask(std::string subnet, size_t total);

    const std::string& subnet() const { return subnet_; }
    size_t total() const { return total_; }
    size_t probed() const { return probed_.load(); }
    size_t live() const { return live_.load(); }

    void cancel() { cancel_ = true; }
    bool cancel_requested() const { return cancel_.load(); }

    bool done() const;
    bool wait_for(int timeout_ms) const;

    // Blocks until the sweep ends. Nodes found before a failure stay cached
    // even when the result is an error.
    Result<ScanSummary> wait() const;

private:
    friend class NodeScanner;

    std::string subnet_;
    size_t total_;
    std::atomic<bool> cancel_{false};
    std::atomic<size_t> probed_{0};
    std::atomic<size_t> live_{0};
    std::shared_future<Result<ScanSummary>> result_;
};

using ScanTaskPtr = std::shared_ptr<ScanTask>;

// Sweeps a remote subnet for live hosts by running a ping on the remote
// host for every address, through a fixed-size worker pool. Each responding
// address is merged into the cache as soon as its probe returns.
class NodeScanner {
public:
    using NodeCallback = std::function<void(const DiscoveredNode&)>;

    NodeScanner(SessionManager& session, const ScanSettings& settings);
    ~NodeScanner();

    NodeScanner(const NodeScanner&) = delete;
    NodeScanner& operator=(const NodeScanner&) = delete;

    // Addresses a scan of this interface would probe (for confirmation).
    Result<uint64_t> count_hosts(const NetworkInterface& iface) const;

    // Starts the sweep in the background. Replace empties the subnet's
    // bucket first, so it ends up holding exactly what this sweep finds.
    // on_node runs on a worker thread after the node is committed.
    Result<ScanTaskPtr> scan(const NetworkInterface& iface, MergeMode mode = MergeMode::Union,
                             NodeCallback on_node = nullptr);

    // Running or most recent task, null if none.
    ScanTaskPtr current() const;

    // Cancel the running sweep and wait for its workers.
    void stop();

    // Cached nodes of a subnet, no network traffic.
    std::vector<DiscoveredNode> cached(const std::string& subnet_cidr) const;

    int workers() const { return settings_.workers; }

private:
    SessionManager& session_;
    ScanSettings settings_;

    mutable std::mutex task_mutex_;
    ScanTaskPtr current_;

    Result<CommandResult> run_probe(Transport& transport, const std::string& ip,
                                    int probe_timeout, const std::function<bool()>& stopping);
    Result<ScanSummary> run(ScanTask& task, HostIdentity id, std::vector<std::string> hosts,
                            NodeCallback on_node);
};
