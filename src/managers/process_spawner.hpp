#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/inventory.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <platform/socket_util.hpp>
#include <ssh/transport.hpp>
#include "session_manager.hpp"

enum class InteractiveKind { Shell, Console };

// One interactive remote program shown in its own local terminal window.
// Owns its channel: when the terminal goes away, exactly that channel is
// closed; when the channel ends, the terminal is told to exit.
class InteractiveSession {
public:
    ~InteractiveSession();

    InteractiveSession(const InteractiveSession&) = delete;
    InteractiveSession& operator=(const InteractiveSession&) = delete;

    int id() const { return id_; }
    InteractiveKind kind() const { return kind_; }
    const std::string& title() const { return title_; }
    const std::string& socket_path() const { return socket_path_; }
    int channel_id() const { return channel_->id(); }

    bool is_open() const { return open_.load(); }
    bool attached() const { return attached_.load(); }

    // Write to the remote program directly. ChannelError once closed.
    Result<void> send(const std::string& data);

    // Close the channel and the terminal. Idempotent.
    void close();

private:
    friend class ProcessSpawner;

    InteractiveSession(int id, InteractiveKind kind, std::string title,
                       ChannelPtr channel, int attach_timeout);

    int id_;
    InteractiveKind kind_;
    std::string title_;
    ChannelPtr channel_;
    int attach_timeout_;

    platform::Listener listener_;
    std::string socket_path_;
    platform::ProcessHandle terminal_;
    std::mutex terminal_mutex_;

    std::atomic<bool> open_{true};
    std::atomic<bool> attached_{false};
    std::atomic<bool> stop_{false};
    std::thread relay_thread_;

    void start_relay();
    void relay();
    socket_t wait_for_attach();
    void finish(socket_t client);
    bool launcher_failed();
};

using InteractiveSessionPtr = std::shared_ptr<InteractiveSession>;

// Opens PTY channels for a remote login shell or a serial console and wires
// each one to a newly launched local terminal process.
class ProcessSpawner {
public:
    // Starts the local terminal from an expanded argv. Replaceable for tests.
    using Launcher = std::function<Result<platform::ProcessHandle>(
        const std::vector<std::string>& argv)>;

    ProcessSpawner(SessionManager& session, const TerminalSettings& settings,
                   Launcher launcher = nullptr);
    ~ProcessSpawner();

    ProcessSpawner(const ProcessSpawner&) = delete;
    ProcessSpawner& operator=(const ProcessSpawner&) = delete;

    Result<InteractiveSessionPtr> spawn_shell();

    // CapabilityError when the remote host has no serial terminal program.
    Result<InteractiveSessionPtr> spawn_console(const ConsoleDevice& console);

    // Sessions still open.
    std::vector<InteractiveSessionPtr> sessions();

    // Close every session and terminate its terminal.
    void close_all();

    // Expand the terminal.command template for one session.
    std::vector<std::string> terminal_argv(const std::string& title,
                                           const std::string& socket_path) const;

private:
    SessionManager& session_;
    TerminalSettings settings_;
    Launcher launcher_;

    std::mutex sessions_mutex_;
    std::vector<InteractiveSessionPtr> sessions_;
    std::atomic<int> next_id_{1};

    Result<InteractiveSessionPtr> launch(InteractiveKind kind, const std::string& title,
                                         const ChannelSpec& spec);
};
