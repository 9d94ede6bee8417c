#include "ssh_transport.hpp"
#include "ssh_channel.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>

// ── Lifecycle ──────────────────────────────────────────────────

SshTransport::SshTransport(const SshSettings& settings)
    : Transport(settings.max_channels), settings_(settings) {}

SshTransport::~SshTransport() {
    disconnect();
}

Result<void> SshTransport::do_connect(const ConnectRequest& request) {
    HostKeyPolicy policy;
    policy.known_hosts_path = settings_.known_hosts;
    policy.strict = settings_.strict_host_keys;

    auto session = std::make_unique<SshSession>(policy, alive_);
    auto result = session->establish(request);
    if (result.is_err()) {
        recon_log(fmt::format("ssh: connect to {} failed: {}",
                              request.identity.key(), result.describe()));
        return result;
    }
    session_ = std::move(session);
    return Result<void>::Ok();
}

void SshTransport::do_disconnect() {
    alive_->store(false);
    if (session_) {
        session_->close();
        session_.reset();
    }
}

bool SshTransport::is_connected() const {
    return alive_->load();
}

bool SshTransport::check_alive() {
    return session_ && session_->check_alive();
}

// ── Channel grants ─────────────────────────────────────────────

// Repeat a non-blocking libssh2 request under the io mutex until it
// stops returning EAGAIN or the deadline passes.
template <typename Fn>
static int retry_eagain(std::mutex& io, int sock, std::chrono::steady_clock::time_point deadline,
                        Fn&& fn) {
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(io);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (std::chrono::steady_clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        platform::poll_socket(sock, POLLIN, 10);
    }
}

Result<ChannelPtr> SshTransport::do_open_channel(const ChannelSpec& spec, int id) {
    if (!session_ || !is_connected()) {
        return Result<ChannelPtr>::Err(ErrorKind::Channel, "Not connected");
    }

    auto io_mtx = session_->io_mutex();
    LIBSSH2_SESSION* ssh = session_->raw_session();
    int sock = session_->socket();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(spec.timeout_secs);

    // Open the channel itself
    LIBSSH2_CHANNEL* ch = nullptr;
    int open_errno = 0;
    while (!ch) {
        {
            std::lock_guard<std::mutex> lock(*io_mtx);
            if (spec.kind == ChannelKind::Forward) {
                ch = libssh2_channel_direct_tcpip(ssh, spec.host.c_str(), spec.port);
            } else {
                ch = libssh2_channel_open_session(ssh);
            }
            if (!ch) open_errno = libssh2_session_last_errno(ssh);
        }
        if (ch) break;

        if (open_errno != LIBSSH2_ERROR_EAGAIN) {
            if (open_errno == LIBSSH2_ERROR_SOCKET_SEND || open_errno == LIBSSH2_ERROR_SOCKET_RECV ||
                open_errno == LIBSSH2_ERROR_SOCKET_DISCONNECT) {
                alive_->store(false);
            }
            if (spec.kind == ChannelKind::Forward) {
                return Result<ChannelPtr>::Err(ErrorKind::Channel,
                    fmt::format("Remote refused forwarding to {}:{} ({})",
                                spec.host, spec.port, open_errno));
            }
            return Result<ChannelPtr>::Err(ErrorKind::Channel,
                fmt::format("Failed to open {} channel ({})", channel_kind_name(spec.kind), open_errno));
        }
        if (disconnecting()) {
            return Result<ChannelPtr>::Err(ErrorKind::Channel, "Transport is disconnecting");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<ChannelPtr>::Err(ErrorKind::Timeout,
                fmt::format("Opening {} channel timed out after {}s",
                            channel_kind_name(spec.kind), spec.timeout_secs));
        }
        platform::poll_socket(sock, POLLIN, 10);
    }

    // The wrapper owns ch from here; its destructor closes it on any failure below
    auto channel = std::make_shared<SshChannel>(id, spec.kind, ch, io_mtx, sock,
                                                alive_);

    auto fail = [&](const std::string& what, int rc) {
        channel->close();
        ErrorKind kind = rc == LIBSSH2_ERROR_TIMEOUT ? ErrorKind::Timeout : ErrorKind::Channel;
        return Result<ChannelPtr>::Err(kind, fmt::format("{} ({})", what, rc));
    };

    int rc = 0;
    if (spec.kind == ChannelKind::Shell || spec.kind == ChannelKind::Serial) {
        rc = retry_eagain(*io_mtx, sock, deadline, [&] {
            return libssh2_channel_request_pty_ex(ch, "xterm-256color", 14, nullptr, 0,
                                                  spec.cols, spec.rows, 0, 0);
        });
        if (rc != 0) return fail("PTY request refused", rc);
    }

    switch (spec.kind) {
        case ChannelKind::Exec:
        case ChannelKind::Serial:
            rc = retry_eagain(*io_mtx, sock, deadline, [&] {
                return libssh2_channel_exec(ch, spec.command.c_str());
            });
            if (rc != 0) return fail("Remote exec refused", rc);
            break;
        case ChannelKind::Shell:
            rc = retry_eagain(*io_mtx, sock, deadline, [&] {
                return libssh2_channel_shell(ch);
            });
            if (rc != 0) return fail("Remote shell refused", rc);
            break;
        case ChannelKind::Forward:
            break;
    }

    recon_log(fmt::format("ssh: opened {} channel #{}", channel_kind_name(spec.kind), id));
    return Result<ChannelPtr>::Ok(channel);
}
