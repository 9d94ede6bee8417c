#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/inventory.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "cache_store.hpp"

enum class SessionState {
    Idle,
    Connecting,
    Authenticating,
    Connected,
    Disconnected,
    Failed,
};

const char* session_state_name(SessionState state);

// Connection state machine over a Transport. Owns the one live session.
//
//   Idle -> Connecting -> Authenticating -> Connected
//   any  -> Failed(kind, reason)
//   Connected -> Disconnected -> Idle          (explicit disconnect)
//   Connected -> Failed(Network)               (transport loss)
//
// Entering Connected loads the cached inventory for the identity; nothing is
// fetched from the remote. Leaving Connected runs the registered teardown
// hooks (tunnels, spawned sessions, scans), then closes the transport, which
// force-closes any channel still open.
class SessionManager {
public:
    SessionManager(Transport& transport, CacheStore& cache, const SshSettings& settings);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Blocks until Connected or Failed. A live session is disconnected first.
    Result<void> connect(const HostIdentity& identity, const Credentials& credentials,
                         StatusCallback callback = nullptr);

    std::future<Result<void>> connect_async(const HostIdentity& identity,
                                            const Credentials& credentials,
                                            StatusCallback callback = nullptr);

    // Idempotent.
    void disconnect();

    // Lock-free; safe to poll from any thread.
    SessionState current_state() const { return state_.load(); }
    bool is_connected() const { return current_state() == SessionState::Connected; }

    // Probe the transport now; a dead connection moves Connected -> Failed.
    bool check_alive();

    ErrorKind failure_kind() const;
    std::string failure_reason() const;
    std::optional<HostIdentity> identity() const;

    // Cached inventory of the current identity (empty when none).
    HostInventory inventory() const;

    Transport& transport() { return transport_; }
    CacheStore& cache() { return cache_; }

    // Called, in registration order, whenever the session is torn down.
    using TeardownHook = std::function<void()>;
    void add_teardown_hook(TeardownHook hook);

private:
    Transport& transport_;
    CacheStore& cache_;
    SshSettings settings_;

    std::mutex lifecycle_mutex_;            // connect / disconnect / loss
    std::atomic<SessionState> state_{SessionState::Idle};

    mutable std::mutex info_mutex_;
    ErrorKind failure_kind_ = ErrorKind::None;
    std::string failure_reason_;
    std::optional<HostIdentity> identity_;

    std::mutex hooks_mutex_;
    std::vector<TeardownHook> hooks_;

    // Keepalive monitor
    std::thread monitor_;
    std::atomic<bool> monitor_running_{false};
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;

    void set_state(SessionState state);
    void set_failure(ErrorKind kind, const std::string& reason);
    void teardown_locked();
    void handle_loss(const std::string& reason);

    void start_monitor();
    void stop_monitor();
    void monitor_loop();
};
