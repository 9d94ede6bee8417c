#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct HostKeyPolicy {
    std::string known_hosts_path;   // empty = ~/.ssh/known_hosts
    bool strict = false;            // unknown hosts are rejected instead of recorded
};

// One authenticated libssh2 session in non-blocking mode.
// Every libssh2 call is made under io_mutex(), held briefly per call.
class SshSession {
public:
    // alive is shared with the owning transport and every channel
    SshSession(HostKeyPolicy policy, std::shared_ptr<std::atomic<bool>> alive);
    ~SshSession();

    // TCP connect, handshake, host key check, password auth.
    Result<void> establish(const ConnectRequest& request);
    void close();

    bool check_alive();

    LIBSSH2_SESSION* raw_session() { return session_; }
    int socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    HostKeyPolicy policy_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
    std::shared_ptr<std::mutex> io_mutex_;
    std::shared_ptr<std::atomic<bool>> alive_;

    Result<void> open_socket(const ConnectRequest& request, int timeout_ms);
    Result<void> verify_host_key(const ConnectRequest& request);
    Result<void> userauth(const ConnectRequest& request,
                          std::chrono::steady_clock::time_point deadline);
    void teardown(const char* reason);
};
