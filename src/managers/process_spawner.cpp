#include "process_spawner.hpp"
#include <core/attach_protocol.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

// ── InteractiveSession ───────────────────────────────────────

InteractiveSession::InteractiveSession(int id, InteractiveKind kind, std::string title,
                                       ChannelPtr channel, int attach_timeout)
    : id_(id), kind_(kind), title_(std::move(title)), channel_(std::move(channel)),
      attach_timeout_(attach_timeout) {}

InteractiveSession::~InteractiveSession() {
    close();
}

Result<void> InteractiveSession::send(const std::string& data) {
    if (!open_) {
        return Result<void>::Err(ErrorKind::Channel, fmt::format("Session '{}' is closed", title_));
    }
    return channel_->write(data);
}

void InteractiveSession::close() {
    stop_ = true;
    if (relay_thread_.joinable() && relay_thread_.get_id() != std::this_thread::get_id()) {
        relay_thread_.join();
    }
    if (open_) finish(RECON_INVALID_SOCKET);
}

// Launchers such as gnome-terminal hand the window to a server and exit 0
// right away; only a failed launcher ends the wait before the attach timeout.
bool InteractiveSession::launcher_failed() {
    std::lock_guard<std::mutex> lock(terminal_mutex_);
    if (terminal_.running()) return false;
    return terminal_.wait() != 0;
}

void InteractiveSession::start_relay() {
    relay_thread_ = std::thread(&InteractiveSession::relay, this);
}

// Wait for `recon attach` in the spawned terminal to connect.
socket_t InteractiveSession::wait_for_attach() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(attach_timeout_);
    while (!stop_) {
        if (std::chrono::steady_clock::now() > deadline) {
            recon_log(fmt::format("spawn: '{}' not attached after {}s", title_, attach_timeout_));
            return RECON_INVALID_SOCKET;
        }
        if (launcher_failed()) {
            recon_log(fmt::format("spawn: terminal for '{}' failed before attaching", title_));
            return RECON_INVALID_SOCKET;
        }
        int revents = platform::poll_socket(listener_.fd, POLLIN, 100);
        if (revents & POLLIN) {
            socket_t client = accept(listener_.fd, nullptr, nullptr);
            if (client >= 0) return client;
        }
        if (!channel_->is_open()) return RECON_INVALID_SOCKET;
    }
    return RECON_INVALID_SOCKET;
}

void InteractiveSession::relay() {
    socket_t client = wait_for_attach();
    if (client == RECON_INVALID_SOCKET) {
        finish(client);
        return;
    }
    attached_ = true;

    char buf[RELAY_BUF_SIZE];
    AttachDecoder decoder;

    // Hello line first
    std::string pending;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(attach_timeout_);
    size_t nl = std::string::npos;
    while (!stop_ && nl == std::string::npos) {
        if (std::chrono::steady_clock::now() > deadline || pending.size() > 256) break;
        int revents = platform::poll_socket(client, POLLIN, 100);
        if (!(revents & (POLLIN | POLLHUP | POLLERR))) continue;
        ssize_t n = ::read(client, buf, sizeof(buf));
        if (n <= 0) break;
        pending.append(buf, static_cast<size_t>(n));
        nl = pending.find('\n');
    }

    int cols = 0, rows = 0;
    if (nl == std::string::npos || !parse_attach_hello(pending.substr(0, nl), cols, rows)) {
        recon_log(fmt::format("spawn: '{}' bad attach handshake", title_));
        finish(client);
        return;
    }
    decoder.feed(pending.data() + nl + 1, pending.size() - nl - 1);
    auto sized = channel_->resize(cols, rows);
    if (sized.is_err()) recon_log(fmt::format("spawn: '{}' resize: {}", title_, sized.error));
    recon_log(fmt::format("spawn: '{}' attached ({}x{})", title_, cols, rows));

    int wait_ms = RELAY_IDLE_POLL_MS;

    while (!stop_) {
        // terminal -> channel
        AttachFrame frame;
        bool failed = false;
        while (decoder.next(frame)) {
            if (frame.type == AttachFrameType::Resize) {
                auto sized = channel_->resize(frame.cols, frame.rows);
                if (sized.is_err()) failed = true;
            } else if (channel_->write(frame.payload).is_err()) {
                failed = true;
            }
            if (failed) break;
        }
        if (failed || decoder.bad()) break;

        int revents = platform::poll_socket(client, POLLIN, wait_ms);
        if (revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(client, buf, sizeof(buf));
            if (n <= 0) break;              // terminal closed
            decoder.feed(buf, static_cast<size_t>(n));
        }

        // channel -> terminal; Closed also covers the remote program exiting
        DrainResult drained = drain_channel(*channel_, client, buf, sizeof(buf),
                                            RELAY_DRAIN_READS);
        if (drained == DrainResult::Closed) break;
        wait_ms = drained == DrainResult::Moved ? 0 : RELAY_IDLE_POLL_MS;
    }

    finish(client);
}

// Release everything this session owns. Only its own channel is touched.
void InteractiveSession::finish(socket_t client) {
    if (!open_.exchange(false)) return;

    channel_->close();
    if (client != RECON_INVALID_SOCKET) platform::close_socket(client);
    if (listener_.valid()) {
        platform::close_socket(listener_.fd);
        listener_ = platform::Listener{};
    }
    if (!socket_path_.empty()) ::unlink(socket_path_.c_str());

    {
        std::lock_guard<std::mutex> lock(terminal_mutex_);
        // The attach helper exits once its socket closes; give it a moment
        if (terminal_.running() && terminal_.wait(500) < 0) terminal_.terminate();
    }
    recon_log(fmt::format("spawn: '{}' closed (channel {})", title_, channel_->id()));
}

// ── ProcessSpawner ───────────────────────────────────────────

static Result<platform::ProcessHandle> launch_terminal(const std::vector<std::string>& argv) {
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    auto handle = platform::spawn(argv[0], args, recon_log_path());
    if (!handle.valid()) {
        return Result<platform::ProcessHandle>::Err(ErrorKind::Io,
            fmt::format("Cannot launch terminal '{}': {}", argv[0], std::strerror(errno)));
    }
    return Result<platform::ProcessHandle>::Ok(std::move(handle));
}

ProcessSpawner::ProcessSpawner(SessionManager& session, const TerminalSettings& settings,
                               Launcher launcher)
    : session_(session), settings_(settings), launcher_(std::move(launcher)) {
    if (!launcher_) launcher_ = launch_terminal;
}

ProcessSpawner::~ProcessSpawner() {
    close_all();
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::vector<std::string> ProcessSpawner::terminal_argv(const std::string& title,
                                                       const std::string& socket_path) const {
    std::string self = platform::self_executable();
    std::string attach_line = shell_quote(self) + " attach " + shell_quote(socket_path);

    std::vector<std::string> argv;
    for (const auto& part : settings_.command) {
        if (part == "{attach}") {
            argv.push_back(self);
            argv.push_back("attach");
            argv.push_back(socket_path);
            continue;
        }
        std::string arg = part;
        replace_all(arg, "{title}", title);
        replace_all(arg, "{attach}", attach_line);
        argv.push_back(arg);
    }
    return argv;
}

Result<InteractiveSessionPtr> ProcessSpawner::launch(InteractiveKind kind,
                                                     const std::string& title,
                                                     const ChannelSpec& spec) {
    using R = Result<InteractiveSessionPtr>;

    auto ch = session_.transport().open_channel(spec);
    if (ch.is_err()) return R::Err(ch);

    int id = next_id_++;
    InteractiveSessionPtr s(new InteractiveSession(id, kind, title, ch.value,
                                                   settings_.attach_timeout));

    s->socket_path_ = (platform::runtime_dir() /
                       fmt::format("attach-{}-{}.sock", getpid(), id)).string();
    int err = 0;
    s->listener_ = platform::listen_unix(s->socket_path_, err);
    if (!s->listener_.valid()) {
        s->finish(RECON_INVALID_SOCKET);
        return R::Err(ErrorKind::Io,
            fmt::format("Cannot listen on {}: {}", s->socket_path_, std::strerror(err)));
    }

    auto argv = terminal_argv(title, s->socket_path_);
    if (argv.empty()) {
        s->finish(RECON_INVALID_SOCKET);
        return R::Err(ErrorKind::Config, "terminal.command is empty");
    }

    auto proc = launcher_(argv);
    if (proc.is_err()) {
        s->finish(RECON_INVALID_SOCKET);
        return R::Err(proc);
    }
    s->terminal_ = std::move(proc.value);
    s->start_relay();

    recon_log(fmt::format("spawn: '{}' on channel {} ({})", title, s->channel_id(), argv[0]));

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.push_back(s);
    return R::Ok(s);
}

Result<InteractiveSessionPtr> ProcessSpawner::spawn_shell() {
    if (!session_.is_connected()) {
        return Result<InteractiveSessionPtr>::Err(ErrorKind::Channel, "Not connected");
    }
    auto id = session_.identity();
    std::string title = id ? id->key() : "shell";

    ChannelSpec spec;
    spec.kind = ChannelKind::Shell;
    return launch(InteractiveKind::Shell, title, spec);
}

Result<InteractiveSessionPtr> ProcessSpawner::spawn_console(const ConsoleDevice& console) {
    using R = Result<InteractiveSessionPtr>;
    if (!session_.is_connected()) return R::Err(ErrorKind::Channel, "Not connected");

    auto check = session_.transport().execute(SERIAL_CAPABILITY_CMD, SSH_CMD_TIMEOUT_SECS);
    if (check.is_err()) return R::Err(check);
    recon_log_cmd("serial-check", SERIAL_CAPABILITY_CMD, check.value);
    if (check.value.failed()) {
        return R::Err(ErrorKind::Capability, "picocom is not installed on the remote host");
    }

    ChannelSpec spec;
    spec.kind = ChannelKind::Serial;
    spec.command = fmt::format(SERIAL_CMD, settings_.serial_baud, shell_quote(console.remote_path));

    auto id = session_.identity();
    std::string title = fmt::format("{} {}", id ? id->host : "console", console.name);
    return launch(InteractiveKind::Console, title, spec);
}

std::vector<InteractiveSessionPtr> ProcessSpawner::sessions() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<InteractiveSessionPtr> open;
    for (const auto& s : sessions_) {
        if (s->is_open()) open.push_back(s);
    }
    sessions_ = open;
    return open;
}

void ProcessSpawner::close_all() {
    std::vector<InteractiveSessionPtr> all;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        all.swap(sessions_);
    }
    for (auto& s : all) s->close();
}
