#include "ssh_channel.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>

SshChannel::SshChannel(int id, ChannelKind kind, LIBSSH2_CHANNEL* channel,
                       std::shared_ptr<std::mutex> io_mutex, int sock,
                       std::shared_ptr<std::atomic<bool>> session_alive)
    : Channel(id, kind), ch_(channel), io_mutex_(std::move(io_mutex)),
      sock_(sock), session_alive_(std::move(session_alive)) {}

SshChannel::~SshChannel() {
    close();
}

bool SshChannel::is_open() const {
    return open_.load();
}

Result<void> SshChannel::closed_error() const {
    return Result<void>::Err(ErrorKind::Channel,
        fmt::format("{} channel #{} is closed", channel_kind_name(kind()), id()));
}

// A socket-level error means the whole connection is gone
void SshChannel::note_error(int rc) {
    if (rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_SOCKET_SEND ||
        rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT) {
        session_alive_->store(false);
    }
}

// ── I/O ────────────────────────────────────────────────────────

Result<size_t> SshChannel::read_stream(int stream, char* buf, size_t len) {
    ssize_t n;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (!ch_) return Result<size_t>::Err(closed_error());
        n = libssh2_channel_read_ex(ch_, stream, buf, len);
    }
    if (n >= 0) return Result<size_t>::Ok(static_cast<size_t>(n));
    if (n == LIBSSH2_ERROR_EAGAIN) return Result<size_t>::Ok(0);

    note_error(static_cast<int>(n));
    return Result<size_t>::Err(ErrorKind::Channel,
        fmt::format("{} channel #{} read error ({})", channel_kind_name(kind()), id(), n));
}

Result<size_t> SshChannel::read(char* buf, size_t len) {
    return read_stream(0, buf, len);
}

Result<size_t> SshChannel::read_stderr(char* buf, size_t len) {
    return read_stream(SSH_EXTENDED_DATA_STDERR, buf, len);
}

Result<void> SshChannel::write(const char* data, size_t len) {
    size_t sent = 0;
    int stalls = 0;
    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return closed_error();
            w = libssh2_channel_write(ch_, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            // Remote window full; give up after ~10s without progress
            if (++stalls > 1000) {
                return Result<void>::Err(ErrorKind::Timeout, "Channel write stalled");
            }
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) {
            note_error(static_cast<int>(w));
            return Result<void>::Err(ErrorKind::Channel,
                fmt::format("{} channel #{} write error ({})", channel_kind_name(kind()), id(), w));
        }
        stalls = 0;
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> SshChannel::send_eof() {
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return closed_error();
            rc = libssh2_channel_send_eof(ch_);
        }
        if (rc == 0) return Result<void>::Ok();
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(ErrorKind::Channel, "Failed to send EOF");
        }
        platform::sleep_ms(5);
    }
}

bool SshChannel::eof() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return true;
    return libssh2_channel_eof(ch_) != 0;
}

Result<void> SshChannel::resize(int cols, int rows) {
    for (int i = 0; i < 100; i++) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return closed_error();
            rc = libssh2_channel_request_pty_size(ch_, cols, rows);
        }
        if (rc == 0) return Result<void>::Ok();
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(ErrorKind::Channel, "PTY resize refused");
        }
        platform::sleep_ms(5);
    }
    return Result<void>::Err(ErrorKind::Timeout, "PTY resize timed out");
}

int SshChannel::exit_status() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (ch_) exit_status_ = libssh2_channel_get_exit_status(ch_);
    return exit_status_;
}

int SshChannel::poll_fd() const {
    return sock_;
}

// ── Close ──────────────────────────────────────────────────────

void SshChannel::close() {
    if (!open_.exchange(false)) return;

    LIBSSH2_CHANNEL* ch;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        ch = ch_;
        if (!ch) return;
        exit_status_ = libssh2_channel_get_exit_status(ch);
        // Null first so concurrent users fail with ChannelError
        ch_ = nullptr;
        libssh2_channel_close(ch);
    }

    // Non-blocking free may need a few rounds to flush the close message
    for (int i = 0; i < 50; i++) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_free(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!session_alive_->load()) break;
        platform::sleep_ms(10);
    }
    recon_log(fmt::format("ssh: closed {} channel #{}", channel_kind_name(kind()), id()));
}
