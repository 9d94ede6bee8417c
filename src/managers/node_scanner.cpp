#include "node_scanner.hpp"
#include <core/constants.hpp>
#include <core/ipv4.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <thread>

// Remote ping gets its own -W deadline; this covers channel setup on top.
static constexpr int PROBE_DEADLINE_SLACK_SECS = 5;

// ── ScanTask ─────────────────────────────────────────────────

ScanTask::ScanTask(std::string subnet, size_t total)
    : subnet_(std::move(subnet)), total_(total) {}

bool ScanTask::done() const {
    return wait_for(0);
}

bool ScanTask::wait_for(int timeout_ms) const {
    if (!result_.valid()) return true;
    return result_.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready;
}

Result<ScanSummary> ScanTask::wait() const {
    if (!result_.valid()) {
        return Result<ScanSummary>::Err(ErrorKind::Discovery, "Scan was never started");
    }
    return result_.get();
}

// ── NodeScanner ──────────────────────────────────────────────

NodeScanner::NodeScanner(SessionManager& session, const ScanSettings& settings)
    : session_(session), settings_(settings) {
    if (settings_.workers < 1) settings_.workers = 1;
}

NodeScanner::~NodeScanner() {
    stop();
}

Result<uint64_t> NodeScanner::count_hosts(const NetworkInterface& iface) const {
    auto subnet = parse_cidr(iface.subnet_cidr);
    if (subnet.is_err()) return Result<uint64_t>::Err(subnet);
    return Result<uint64_t>::Ok(subnet.value.host_count());
}

ScanTaskPtr NodeScanner::current() const {
    std::lock_guard<std::mutex> lock(task_mutex_);
    return current_;
}

void NodeScanner::stop() {
    ScanTaskPtr task = current();
    if (!task) return;
    task->cancel();
    if (task->result_.valid()) task->result_.wait();
}

std::vector<DiscoveredNode> NodeScanner::cached(const std::string& subnet_cidr) const {
    std::vector<DiscoveredNode> out;
    auto inv = session_.inventory();
    auto it = inv.nodes.find(subnet_cidr);
    if (it == inv.nodes.end()) return out;
    for (const auto& [ip, node] : it->second) out.push_back(node);
    return out;
}

Result<ScanTaskPtr> NodeScanner::scan(const NetworkInterface& iface, MergeMode mode,
                                      NodeCallback on_node) {
    using R = Result<ScanTaskPtr>;

    if (!session_.is_connected()) return R::Err(ErrorKind::Channel, "Not connected");
    auto id = session_.identity();
    if (!id) return R::Err(ErrorKind::Channel, "Not connected");

    auto subnet = parse_cidr(iface.subnet_cidr);
    if (subnet.is_err()) return R::Err(subnet);
    if (subnet.value.host_count() > static_cast<uint64_t>(SCAN_MAX_HOSTS)) {
        return R::Err(ErrorKind::Discovery,
            fmt::format("{} has {} addresses, refusing to sweep more than {}",
                        subnet.value.to_string(), subnet.value.host_count(), SCAN_MAX_HOSTS));
    }
    std::string key = subnet.value.to_string();

    std::lock_guard<std::mutex> lock(task_mutex_);
    if (current_ && !current_->done()) {
        return R::Err(ErrorKind::Discovery,
            fmt::format("A scan of {} is already running", current_->subnet()));
    }

    if (mode == MergeMode::Replace) {
        auto cleared = session_.cache().merge_nodes(*id, key, {}, MergeMode::Replace);
        if (cleared.is_err()) return R::Err(cleared);
    }

    std::vector<std::string> hosts = subnet.value.hosts();
    auto task = std::make_shared<ScanTask>(key, hosts.size());
    // The task owns its future, so the worker refers to it by reference
    ScanTask& ref = *task;
    task->result_ = std::async(std::launch::async,
        [this, &ref, id = *id, hosts = std::move(hosts), on_node]() mutable {
            return run(ref, id, std::move(hosts), std::move(on_node));
        }).share();

    current_ = task;
    recon_log(fmt::format("scan: {} started ({} addresses, {} workers, {})", key,
                          task->total(), settings_.workers,
                          mode == MergeMode::Replace ? "refresh" : "merge"));
    return R::Ok(task);
}

// ── Sweep ────────────────────────────────────────────────────

// A refused channel never reached the remote host, so the address is still
// undecided: wait for a slot and issue the same probe again.
Result<CommandResult> NodeScanner::run_probe(Transport& transport, const std::string& ip,
                                             int probe_timeout,
                                             const std::function<bool()>& stopping) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (true) {
        auto r = transport.execute(fmt::format(PROBE_CMD, probe_timeout, ip),
                                   probe_timeout + PROBE_DEADLINE_SLACK_SECS);
        if (r.is_ok() || r.kind != ErrorKind::Channel) return r;
        if (!transport.is_connected() || stopping()) return r;
        if (std::chrono::steady_clock::now() >= deadline) return r;
        recon_log(fmt::format("scan: probe {} deferred: {}", ip, r.error));
        std::this_thread::sleep_for(std::chrono::milliseconds(SCAN_SLOT_RETRY_MS));
    }
}

Result<ScanSummary> NodeScanner::run(ScanTask& task, HostIdentity id,
                                     std::vector<std::string> hosts, NodeCallback on_node) {
    ScanSummary summary;
    summary.subnet = task.subnet();
    summary.total = hosts.size();

    std::atomic<size_t> next{0};
    std::atomic<bool> abort{false};
    std::mutex result_mutex;          // summary.found + failure
    Result<void> failure = Result<void>::Ok();

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        std::lock_guard<std::mutex> lock(result_mutex);
        if (failure.is_ok()) failure = Result<void>::Err(kind, msg);
        abort = true;
    };

    Transport& transport = session_.transport();
    int probe_timeout = settings_.probe_timeout;

    auto worker = [&]() {
        while (!abort && !task.cancel_requested()) {
            size_t i = next.fetch_add(1);
            if (i >= hosts.size()) break;
            const std::string& ip = hosts[i];

            if (!session_.is_connected() || !transport.is_connected()) {
                fail(ErrorKind::Channel, "Connection lost during scan");
                break;
            }

            auto r = run_probe(transport, ip, probe_timeout,
                               [&] { return abort.load() || task.cancel_requested(); });

            if (r.is_err() && r.kind == ErrorKind::Channel) {
                if (!transport.is_connected()) {
                    fail(ErrorKind::Channel, "Connection lost during scan: " + r.error);
                } else if (!abort && !task.cancel_requested()) {
                    fail(ErrorKind::Channel,
                         fmt::format("No channel free to probe {}: {}", ip, r.error));
                }
                break;
            }
            task.probed_++;

            if (r.is_err()) {
                // The ping itself timed out: not live
                recon_log(fmt::format("scan: probe {} failed: {}", ip, r.describe()));
                continue;
            }
            if (r.value.exit_code == EXIT_COMMAND_NOT_FOUND) {
                fail(ErrorKind::Capability, "Remote host has no ping");
                break;
            }
            if (r.value.exit_code != 0) continue;

            DiscoveredNode node{ip, now_iso()};
            auto merged = session_.cache().merge_nodes(id, task.subnet(), {node}, MergeMode::Union);
            if (merged.is_err()) {
                fail(merged.kind, merged.error);
                break;
            }
            task.live_++;
            {
                std::lock_guard<std::mutex> lock(result_mutex);
                summary.found.push_back(node);
            }
            recon_log("scan: " + ip + " is live");
            if (on_node) on_node(node);
        }
    };

    size_t pool = std::min<size_t>(static_cast<size_t>(settings_.workers), hosts.size());
    std::vector<std::thread> threads;
    threads.reserve(pool);
    for (size_t i = 0; i < pool; i++) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    summary.probed = task.probed();
    summary.cancelled = task.cancel_requested();
    recon_log(fmt::format("scan: {} finished, {}/{} probed, {} live{}", summary.subnet,
                          summary.probed, summary.total, summary.found.size(),
                          summary.cancelled ? " (cancelled)" : ""));

    if (failure.is_err()) return Result<ScanSummary>::Err(failure);
    return Result<ScanSummary>::Ok(summary);
}
