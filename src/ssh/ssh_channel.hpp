#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include "transport.hpp"

typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Channel backed by a libssh2 channel on a shared non-blocking session.
class SshChannel : public Channel {
public:
    SshChannel(int id, ChannelKind kind, LIBSSH2_CHANNEL* channel,
               std::shared_ptr<std::mutex> io_mutex, int sock,
               std::shared_ptr<std::atomic<bool>> session_alive);
    ~SshChannel() override;

    bool is_open() const override;
    Result<size_t> read(char* buf, size_t len) override;
    Result<size_t> read_stderr(char* buf, size_t len) override;
    Result<void> write(const char* data, size_t len) override;
    Result<void> send_eof() override;
    bool eof() override;
    Result<void> resize(int cols, int rows) override;
    int exit_status() override;
    void close() override;
    int poll_fd() const override;

private:
    LIBSSH2_CHANNEL* ch_;               // guarded by *io_mutex_
    std::shared_ptr<std::mutex> io_mutex_;
    int sock_;
    std::shared_ptr<std::atomic<bool>> session_alive_;
    std::atomic<bool> open_{true};
    int exit_status_ = -1;

    Result<size_t> read_stream(int stream, char* buf, size_t len);
    Result<void> closed_error() const;
    void note_error(int rc);
};
