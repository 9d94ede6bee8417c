#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include <ssh/transport.hpp>
#include "session_manager.hpp"

enum class TunnelStatus { Closed, Opening, Open, Closing, Failed };

const char* tunnel_status_name(TunnelStatus status);

struct TunnelInfo {
    TunnelStatus status = TunnelStatus::Closed;
    int local_port = 0;
    std::string remote_host;
    int remote_port = 0;
    std::string error;                      // set when Failed

    // "https://localhost:<port>"
    std::string local_url() const;
};

// The one port forward of a session: localhost:<ephemeral> -> node:443.
//
//   Closed -> Opening -> Open -> Closing -> Closed
//   Opening -> Failed -> Closed
//
// Every local connection accepted on the listener gets its own direct-tcpip
// channel and forwarding thread.
class TunnelManager {
public:
    TunnelManager(SessionManager& session, const TunnelSettings& settings);
    ~TunnelManager();

    TunnelManager(const TunnelManager&) = delete;
    TunnelManager& operator=(const TunnelManager&) = delete;

    // remote_port 0 means tunnel.remote_port from the config.
    Result<TunnelInfo> open(const std::string& remote_ip, int remote_port = 0);

    // Idempotent.
    void close();

    TunnelStatus status() const { return status_.load(); }
    TunnelInfo info() const;

    // Local connections currently being forwarded.
    int active_connections() const;

private:
    struct Connection {
        socket_t client = RECON_INVALID_SOCKET;
        ChannelPtr channel;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    SessionManager& session_;
    TunnelSettings settings_;

    std::mutex op_mutex_;                   // serializes open / close
    mutable std::mutex info_mutex_;
    TunnelInfo info_;
    std::atomic<TunnelStatus> status_{TunnelStatus::Closed};

    platform::Listener listener_;
    std::atomic<bool> stop_{false};
    std::thread accept_thread_;

    mutable std::mutex conns_mutex_;
    std::vector<std::unique_ptr<Connection>> conns_;

    void set_status(TunnelStatus status);
    Result<platform::Listener> allocate_listener();
    Result<void> probe_remote(const std::string& host, int port);
    Result<TunnelInfo> fail_open(const Result<void>& error);
    void release();

    void accept_loop(std::string host, int port);
    void forward(Connection& conn);
    void reap_finished();
};
