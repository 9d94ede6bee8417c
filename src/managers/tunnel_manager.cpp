#include "tunnel_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <random>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>

const char* tunnel_status_name(TunnelStatus status) {
    switch (status) {
        case TunnelStatus::Closed:  return "Closed";
        case TunnelStatus::Opening: return "Opening";
        case TunnelStatus::Open:    return "Open";
        case TunnelStatus::Closing: return "Closing";
        case TunnelStatus::Failed:  return "Failed";
    }
    return "Unknown";
}

std::string TunnelInfo::local_url() const {
    return fmt::format("https://localhost:{}", local_port);
}

TunnelManager::TunnelManager(SessionManager& session, const TunnelSettings& settings)
    : session_(session), settings_(settings) {}

TunnelManager::~TunnelManager() {
    close();
}

void TunnelManager::set_status(TunnelStatus status) {
    status_ = status;
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_.status = status;
}

TunnelInfo TunnelManager::info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return info_;
}

int TunnelManager::active_connections() const {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    int n = 0;
    for (const auto& c : conns_) {
        if (!c->done) n++;
    }
    return n;
}

// ── Open ────────────────────────────────────────────────────

Result<platform::Listener> TunnelManager::allocate_listener() {
    using R = Result<platform::Listener>;
    int err = 0;

    if (!settings_.port_range) {
        auto l = platform::listen_loopback(0, err);
        if (!l.valid()) {
            return R::Err(ErrorKind::TunnelAllocation,
                fmt::format("No free local port: {}", std::strerror(err)));
        }
        return R::Ok(l);
    }

    int lo = settings_.port_range->first;
    int hi = settings_.port_range->second;
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(lo, hi);

    for (int attempt = 0; attempt < settings_.bind_attempts; attempt++) {
        int port = pick(rng);
        auto l = platform::listen_loopback(port, err);
        if (l.valid()) return R::Ok(l);
        if (err != EADDRINUSE) {
            return R::Err(ErrorKind::TunnelAllocation,
                fmt::format("Cannot listen on port {}: {}", port, std::strerror(err)));
        }
        recon_log(fmt::format("tunnel: port {} in use, retrying", port));
    }
    return R::Err(ErrorKind::TunnelAllocation,
        fmt::format("No free local port in {}-{} after {} attempts",
                    lo, hi, settings_.bind_attempts));
}

Result<void> TunnelManager::probe_remote(const std::string& host, int port) {
    ChannelSpec spec;
    spec.kind = ChannelKind::Forward;
    spec.host = host;
    spec.port = port;
    spec.timeout_secs = settings_.open_timeout;

    Transport& transport = session_.transport();
    auto ch = transport.open_channel(spec);
    if (ch.is_ok()) {
        ch.value->close();
        return Result<void>::Ok();
    }

    if (ch.kind == ErrorKind::Timeout) return Result<void>::Err(ch);
    if (!transport.is_connected()) {
        return Result<void>::Err(ErrorKind::Channel, "Connection lost: " + ch.error);
    }
    return Result<void>::Err(ErrorKind::TunnelAllocation,
        fmt::format("{}:{} is unreachable: {}", host, port, ch.error));
}

Result<TunnelInfo> TunnelManager::fail_open(const Result<void>& error) {
    release();
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        info_.error = error.describe();
        info_.local_port = 0;
    }
    set_status(TunnelStatus::Failed);
    recon_log("tunnel: open failed: " + error.describe());
    return Result<TunnelInfo>::Err(error);
}

Result<TunnelInfo> TunnelManager::open(const std::string& remote_ip, int remote_port) {
    if (remote_port <= 0) remote_port = settings_.remote_port;

    auto conflict = [this](TunnelStatus s) {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return Result<TunnelInfo>::Err(ErrorKind::TunnelConflict,
            fmt::format("A tunnel to {}:{} is already {}", info_.remote_host,
                        info_.remote_port, s == TunnelStatus::Open ? "open" : "opening"));
    };
    auto busy = [](TunnelStatus s) {
        return s == TunnelStatus::Open || s == TunnelStatus::Opening;
    };

    // Opening is only ever set under op_mutex_, so close() never sees it.
    // While another open() holds op_mutex_ this one fails instead of waiting.
    std::unique_lock<std::mutex> op(op_mutex_, std::try_to_lock);
    if (!op.owns_lock()) {
        TunnelStatus s = status_.load();
        if (busy(s)) return conflict(s);
        op.lock();
    }
    if (busy(status_.load())) return conflict(status_.load());

    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        if (!session_.is_connected()) {
            return Result<TunnelInfo>::Err(ErrorKind::Channel, "Not connected");
        }
        status_ = TunnelStatus::Opening;
        info_ = TunnelInfo{};
        info_.status = TunnelStatus::Opening;
        info_.remote_host = remote_ip;
        info_.remote_port = remote_port;
    }

    auto listener = allocate_listener();
    if (listener.is_err()) return fail_open(Result<void>::Err(listener));
    listener_ = listener.value;

    auto probed = probe_remote(remote_ip, remote_port);
    if (probed.is_err()) return fail_open(probed);

    stop_ = false;
    accept_thread_ = std::thread(&TunnelManager::accept_loop, this, remote_ip, remote_port);

    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        info_.local_port = listener_.port;
    }
    set_status(TunnelStatus::Open);

    TunnelInfo result = info();
    recon_log(fmt::format("tunnel: localhost:{} -> {}:{} open", result.local_port,
                          remote_ip, remote_port));
    return Result<TunnelInfo>::Ok(result);
}

// ── Close ───────────────────────────────────────────────────

void TunnelManager::release() {
    stop_ = true;
    if (accept_thread_.joinable()) accept_thread_.join();

    std::vector<std::unique_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        conns.swap(conns_);
    }
    for (auto& c : conns) {
        if (c->channel) c->channel->close();
        if (c->thread.joinable()) c->thread.join();
    }

    if (listener_.valid()) {
        platform::close_socket(listener_.fd);
        listener_ = platform::Listener{};
    }
}

void TunnelManager::close() {
    std::lock_guard<std::mutex> op(op_mutex_);

    TunnelStatus s = status_.load();
    if (s == TunnelStatus::Closed) return;

    if (s == TunnelStatus::Open) {
        set_status(TunnelStatus::Closing);
        int port = info().local_port;
        release();
        recon_log(fmt::format("tunnel: localhost:{} closed", port));
    }

    std::lock_guard<std::mutex> lock(info_mutex_);
    info_ = TunnelInfo{};
    status_ = TunnelStatus::Closed;
}

// ── Forwarding ──────────────────────────────────────────────

void TunnelManager::reap_finished() {
    std::vector<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto it = conns_.begin(); it != conns_.end();) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = conns_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        if (c->thread.joinable()) c->thread.join();
    }
}

void TunnelManager::accept_loop(std::string host, int port) {
    while (!stop_) {
        int revents = platform::poll_socket(listener_.fd, POLLIN, TUNNEL_ACCEPT_POLL_MS);
        reap_finished();
        if (stop_) break;
        if (!(revents & POLLIN)) continue;

        struct sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        socket_t client = accept(listener_.fd,
                                 reinterpret_cast<struct sockaddr*>(&client_addr), &len);
        if (client < 0) continue;

        ChannelSpec spec;
        spec.kind = ChannelKind::Forward;
        spec.host = host;
        spec.port = port;
        spec.timeout_secs = settings_.open_timeout;

        auto ch = session_.transport().open_channel(spec);
        if (ch.is_err()) {
            recon_log(fmt::format("tunnel: direct-tcpip to {}:{} failed: {}", host, port,
                                  ch.describe()));
            platform::close_socket(client);
            continue;
        }

        auto conn = std::make_unique<Connection>();
        conn->client = client;
        conn->channel = ch.value;
        Connection& ref = *conn;
        {
            std::lock_guard<std::mutex> lock(conns_mutex_);
            conns_.push_back(std::move(conn));
        }
        ref.thread = std::thread(&TunnelManager::forward, this, std::ref(ref));
    }
}

// Shuttle bytes between one local client and its channel until either side
// closes or the tunnel stops.
void TunnelManager::forward(Connection& conn) {
    char buf[RELAY_BUF_SIZE];
    Channel& ch = *conn.channel;

    int wait_ms = RELAY_IDLE_POLL_MS;

    while (!stop_) {
        int revents = platform::poll_socket(conn.client, POLLIN, wait_ms);

        // local -> channel
        if (revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(conn.client, buf, sizeof(buf));
            if (n <= 0) break;          // client closed
            auto w = ch.write(buf, static_cast<size_t>(n));
            if (w.is_err()) break;
        }

        // channel -> local
        DrainResult drained = drain_channel(ch, conn.client, buf, sizeof(buf), RELAY_DRAIN_READS);
        if (drained == DrainResult::Closed) break;
        // No pause while the remote side is streaming
        wait_ms = drained == DrainResult::Moved ? 0 : RELAY_IDLE_POLL_MS;
    }

    ch.close();
    platform::close_socket(conn.client);
    conn.done = true;
}
