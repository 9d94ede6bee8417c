#include "session_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:           return "Idle";
        case SessionState::Connecting:     return "Connecting";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Connected:      return "Connected";
        case SessionState::Disconnected:   return "Disconnected";
        case SessionState::Failed:         return "Failed";
    }
    return "Unknown";
}

SessionManager::SessionManager(Transport& transport, CacheStore& cache,
                               const SshSettings& settings)
    : transport_(transport), cache_(cache), settings_(settings) {}

SessionManager::~SessionManager() {
    disconnect();
}

// ── State ─────────────────────────────────────────────────────

void SessionManager::set_state(SessionState state) {
    SessionState prev = state_.exchange(state);
    if (prev != state) {
        recon_log(fmt::format("session: {} -> {}", session_state_name(prev),
                              session_state_name(state)));
    }
}

void SessionManager::set_failure(ErrorKind kind, const std::string& reason) {
    std::lock_guard<std::mutex> lock(info_mutex_);
    failure_kind_ = kind;
    failure_reason_ = reason;
}

ErrorKind SessionManager::failure_kind() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return failure_kind_;
}

std::string SessionManager::failure_reason() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return failure_reason_;
}

std::optional<HostIdentity> SessionManager::identity() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return identity_;
}

HostInventory SessionManager::inventory() const {
    auto id = identity();
    if (!id) return HostInventory{};
    return cache_.load(*id);
}

void SessionManager::add_teardown_hook(TeardownHook hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.push_back(std::move(hook));
}

// ── Connect ───────────────────────────────────────────────────

Result<void> SessionManager::connect(const HostIdentity& identity,
                                     const Credentials& credentials,
                                     StatusCallback callback) {
    if (identity.host.empty() || identity.user.empty()) {
        return Result<void>::Err(ErrorKind::Config, "Expected user@host");
    }

    stop_monitor();
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_.load() == SessionState::Connected) {
        recon_log("session: replacing live session for " + identity.key());
        set_state(SessionState::Disconnected);
        teardown_locked();
    }

    {
        std::lock_guard<std::mutex> info(info_mutex_);
        identity_ = identity;
        failure_kind_ = ErrorKind::None;
        failure_reason_.clear();
    }
    set_state(SessionState::Connecting);

    ConnectRequest request;
    request.identity = identity;
    request.credentials = credentials;
    request.port = settings_.port;
    request.timeout_secs = settings_.connect_timeout;
    request.on_status = callback;
    request.on_authenticating = [this] { set_state(SessionState::Authenticating); };

    transport_.set_max_channels(settings_.max_channels);
    auto result = transport_.connect(request);
    if (result.is_err()) {
        set_failure(result.kind, result.error);
        set_state(SessionState::Failed);
        return result;
    }

    // Warm the cache for this identity; no remote traffic
    HostInventory inv = cache_.load(identity);
    recon_log(fmt::format("session: cache for {} has {} console(s), {} network(s)",
                          identity.key(), inv.consoles.size(), inv.networks.size()));

    set_state(SessionState::Connected);
    start_monitor();
    return Result<void>::Ok();
}

std::future<Result<void>> SessionManager::connect_async(const HostIdentity& identity,
                                                        const Credentials& credentials,
                                                        StatusCallback callback) {
    return std::async(std::launch::async, [this, identity, credentials, callback] {
        return connect(identity, credentials, callback);
    });
}

// ── Disconnect / teardown ─────────────────────────────────────

void SessionManager::teardown_locked() {
    std::vector<TeardownHook> hooks;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        hooks = hooks_;
    }
    for (auto& hook : hooks) hook();

    transport_.disconnect();
}

void SessionManager::disconnect() {
    stop_monitor();
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    SessionState state = state_.load();
    if (state == SessionState::Idle) return;

    if (state == SessionState::Connected) {
        set_state(SessionState::Disconnected);
        teardown_locked();
    }
    set_state(SessionState::Idle);
}

void SessionManager::handle_loss(const std::string& reason) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.load() != SessionState::Connected) return;

    recon_log("session: connection lost: " + reason);
    set_failure(ErrorKind::Network, reason);
    set_state(SessionState::Failed);
    teardown_locked();
}

bool SessionManager::check_alive() {
    if (!is_connected()) return false;
    if (transport_.is_connected() && transport_.check_alive()) return true;
    handle_loss("Connection to remote host lost");
    return false;
}

// ── Keepalive monitor ─────────────────────────────────────────

void SessionManager::start_monitor() {
    if (settings_.keepalive_secs <= 0) return;
    monitor_running_ = true;
    monitor_ = std::thread(&SessionManager::monitor_loop, this);
}

void SessionManager::stop_monitor() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_running_ = false;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id()) {
        monitor_.join();
    }
}

void SessionManager::monitor_loop() {
    // Check transport health often; send a keepalive every keepalive_secs
    auto last_probe = std::chrono::steady_clock::now();
    while (true) {
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_cv_.wait_for(lock, std::chrono::seconds(1),
                                 [this] { return !monitor_running_.load(); });
            if (!monitor_running_) return;
        }

        bool dead = !transport_.is_connected();
        auto now = std::chrono::steady_clock::now();
        if (!dead && now - last_probe >= std::chrono::seconds(settings_.keepalive_secs)) {
            last_probe = now;
            dead = !transport_.check_alive();
        }

        if (dead) {
            handle_loss("Connection to remote host lost");
            monitor_running_ = false;
            return;
        }
    }
}
