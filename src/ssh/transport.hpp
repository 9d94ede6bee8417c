#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/inventory.hpp>
#include <core/types.hpp>

// Transport: one multiplexed connection to a remote host.
//
// The base class owns the rules every implementation shares:
//   - channel negotiation is serialized (one open at a time), while I/O on
//     channels already open proceeds concurrently
//   - at most max_channels() channels are open at once
//   - disconnect() force-closes every channel it handed out; later reads and
//     writes on those handles fail with ChannelError
//
// Implementations provide do_connect / do_disconnect / do_open_channel.

enum class ChannelKind {
    Exec,      // run one command, collect output and exit status
    Shell,     // interactive login shell on a PTY
    Serial,    // interactive serial console program on a PTY
    Forward,   // direct-tcpip to host:port
};

const char* channel_kind_name(ChannelKind kind);

struct ChannelSpec {
    ChannelKind kind = ChannelKind::Exec;
    std::string command;            // Exec, Serial
    std::string host;               // Forward
    int port = 0;                   // Forward
    int cols = 80;                  // Shell, Serial
    int rows = 24;
    int timeout_secs = CHANNEL_OPEN_TIMEOUT_SECS;
};

class Channel {
public:
    virtual ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    int id() const { return id_; }
    ChannelKind kind() const { return kind_; }

    virtual bool is_open() const = 0;

    // Bytes read, or 0 when nothing is available yet. ChannelError once closed.
    virtual Result<size_t> read(char* buf, size_t len) = 0;
    virtual Result<size_t> read_stderr(char* buf, size_t len) = 0;

    // Writes the whole buffer.
    virtual Result<void> write(const char* data, size_t len) = 0;
    Result<void> write(const std::string& data) { return write(data.data(), data.size()); }

    virtual Result<void> send_eof() = 0;

    // Remote side has finished sending.
    virtual bool eof() = 0;

    virtual Result<void> resize(int cols, int rows) = 0;

    // Exit status of an Exec channel once eof() is reached, -1 if unknown.
    virtual int exit_status() = 0;

    // Idempotent.
    virtual void close() = 0;

    // Descriptor that becomes readable when data may be waiting, -1 if none.
    virtual int poll_fd() const { return -1; }

protected:
    Channel(int id, ChannelKind kind) : id_(id), kind_(kind) {}

private:
    int id_;
    ChannelKind kind_;
};

using ChannelPtr = std::shared_ptr<Channel>;

enum class DrainResult { Idle, Moved, Closed };

// Copy buffered channel output to a local descriptor until the channel has
// nothing more, or max_reads reads have been made. Closed once either side is
// gone or the remote end sent EOF.
DrainResult drain_channel(Channel& ch, int fd, char* buf, size_t len, int max_reads);

struct ConnectRequest {
    HostIdentity identity;
    Credentials credentials;
    int port = SSH_DEFAULT_PORT;
    int timeout_secs = SSH_CONNECT_TIMEOUT_SECS;
    StatusCallback on_status;            // progress text
    std::function<void()> on_authenticating;   // TCP + handshake done
};

class Transport {
public:
    explicit Transport(int max_channels = SSH_MAX_CHANNELS);
    virtual ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Fails with Auth, Network or Timeout.
    Result<void> connect(const ConnectRequest& request);

    // Force-closes all channels, then the connection. Idempotent.
    void disconnect();

    virtual bool is_connected() const = 0;

    // Probe the connection (keepalive). False once it is gone.
    virtual bool check_alive() = 0;

    // Run a command on a fresh Exec channel and return its raw output.
    // ChannelError if the connection is lost, TimeoutError past the deadline.
    Result<CommandResult> execute(const std::string& command, int timeout_secs);

    // Open a logical channel. ChannelError when not connected or at the limit.
    Result<ChannelPtr> open_channel(const ChannelSpec& spec);

    int open_channel_count() const;
    int max_channels() const { return max_channels_; }
    void set_max_channels(int n) { max_channels_ = n; }

protected:
    virtual Result<void> do_connect(const ConnectRequest& request) = 0;
    virtual void do_disconnect() = 0;
    virtual Result<ChannelPtr> do_open_channel(const ChannelSpec& spec, int id) = 0;

    // True while disconnect() is tearing down; negotiation loops bail out.
    bool disconnecting() const { return disconnecting_.load(); }

private:
    std::mutex channel_mutex_;          // serializes negotiation + connect/disconnect
    mutable std::mutex registry_mutex_;
    std::vector<std::weak_ptr<Channel>> channels_;
    int next_id_ = 1;
    std::atomic<int> max_channels_;
    std::atomic<bool> disconnecting_{false};

    int live_channels_locked() const;
};
