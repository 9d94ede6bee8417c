#include "transport.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <chrono>

const char* channel_kind_name(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::Exec:    return "exec";
        case ChannelKind::Shell:   return "shell";
        case ChannelKind::Serial:  return "serial";
        case ChannelKind::Forward: return "forward";
    }
    return "unknown";
}

// ── Lifecycle ──────────────────────────────────────────────────

Transport::Transport(int max_channels) : max_channels_(max_channels) {}

Transport::~Transport() = default;

Result<void> Transport::connect(const ConnectRequest& request) {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    if (is_connected()) {
        return Result<void>::Err(ErrorKind::Network,
            "Transport is already connected; disconnect first");
    }
    {
        std::lock_guard<std::mutex> reg(registry_mutex_);
        channels_.clear();
    }
    return do_connect(request);
}

void Transport::disconnect() {
    disconnecting_.store(true);
    std::lock_guard<std::mutex> lock(channel_mutex_);

    std::vector<ChannelPtr> live;
    {
        std::lock_guard<std::mutex> reg(registry_mutex_);
        for (auto& weak : channels_) {
            if (auto ch = weak.lock()) live.push_back(std::move(ch));
        }
        channels_.clear();
    }

    if (!live.empty()) {
        recon_log(fmt::format("transport: force-closing {} channel(s)", live.size()));
    }
    for (auto& ch : live) ch->close();

    do_disconnect();
    disconnecting_.store(false);
}

// ── Channels ───────────────────────────────────────────────────

int Transport::live_channels_locked() const {
    int n = 0;
    for (const auto& weak : channels_) {
        auto ch = weak.lock();
        if (ch && ch->is_open()) n++;
    }
    return n;
}

int Transport::open_channel_count() const {
    std::lock_guard<std::mutex> reg(registry_mutex_);
    return live_channels_locked();
}

Result<ChannelPtr> Transport::open_channel(const ChannelSpec& spec) {
    std::lock_guard<std::mutex> lock(channel_mutex_);

    if (disconnecting() || !is_connected()) {
        return Result<ChannelPtr>::Err(ErrorKind::Channel, "Not connected");
    }

    int id;
    {
        std::lock_guard<std::mutex> reg(registry_mutex_);
        // Drop handles that were released or closed
        std::vector<std::weak_ptr<Channel>> kept;
        for (auto& weak : channels_) {
            auto ch = weak.lock();
            if (ch && ch->is_open()) kept.push_back(weak);
        }
        channels_.swap(kept);

        if (static_cast<int>(channels_.size()) >= max_channels_) {
            return Result<ChannelPtr>::Err(ErrorKind::Channel,
                fmt::format("Channel limit reached ({} open)", channels_.size()));
        }
        id = next_id_++;
    }

    auto result = do_open_channel(spec, id);
    if (result.is_err()) {
        recon_log(fmt::format("transport: {} channel #{} failed: {}",
                              channel_kind_name(spec.kind), id, result.error));
        return result;
    }

    {
        std::lock_guard<std::mutex> reg(registry_mutex_);
        channels_.push_back(result.value);
    }
    return result;
}

// ── Command execution ──────────────────────────────────────────

Result<CommandResult> Transport::execute(const std::string& command, int timeout_secs) {
    ChannelSpec spec;
    spec.kind = ChannelKind::Exec;
    spec.command = command;
    spec.timeout_secs = timeout_secs;

    auto opened = open_channel(spec);
    if (opened.is_err()) return Result<CommandResult>::Err(opened);
    ChannelPtr ch = opened.value;

    CommandResult out;
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);

    // Read outside channel_mutex_ so other commands run concurrently
    while (true) {
        bool got_data = false;

        auto n = ch->read(buf, sizeof(buf));
        if (n.is_err()) {
            ch->close();
            return Result<CommandResult>::Err(ErrorKind::Channel,
                "Connection lost while running command: " + n.error);
        }
        if (n.value > 0) {
            out.stdout_data.append(buf, n.value);
            got_data = true;
        }

        auto e = ch->read_stderr(buf, sizeof(buf));
        if (e.is_ok() && e.value > 0) {
            out.stderr_data.append(buf, e.value);
            got_data = true;
        }

        if (!got_data && ch->eof()) break;

        if (std::chrono::steady_clock::now() >= deadline) {
            ch->close();
            return Result<CommandResult>::Err(ErrorKind::Timeout,
                fmt::format("Command timed out after {}s", timeout_secs));
        }

        if (!got_data) {
            int fd = ch->poll_fd();
            if (fd >= 0) platform::poll_socket(fd, POLLIN, 10);
            else platform::sleep_ms(5);
        }
    }

    out.exit_code = ch->exit_status();
    ch->close();
    return Result<CommandResult>::Ok(out);
}

// ── Relaying ──────────────────────────────────────────────────

DrainResult drain_channel(Channel& ch, int fd, char* buf, size_t len, int max_reads) {
    DrainResult result = DrainResult::Idle;
    for (int i = 0; i < max_reads; i++) {
        auto r = ch.read(buf, len);
        if (r.is_err()) return DrainResult::Closed;
        if (r.value == 0) return ch.eof() ? DrainResult::Closed : result;
        if (!platform::write_all(fd, buf, r.value)) return DrainResult::Closed;
        result = DrainResult::Moved;
    }
    return result;
}
