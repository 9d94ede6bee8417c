#pragma once

#include <atomic>
#include <memory>
#include <core/config.hpp>
#include "session.hpp"
#include "transport.hpp"

// Transport over a single libssh2 session.
//
// Channel grants:
//   Exec     session channel + exec (no PTY)
//   Shell    session channel + PTY + login shell
//   Serial   session channel + PTY + exec of a console program
//   Forward  direct-tcpip channel (port forwarding)
class SshTransport : public Transport {
public:
    explicit SshTransport(const SshSettings& settings);
    ~SshTransport() override;

    bool is_connected() const override;
    bool check_alive() override;

protected:
    Result<void> do_connect(const ConnectRequest& request) override;
    void do_disconnect() override;
    Result<ChannelPtr> do_open_channel(const ChannelSpec& spec, int id) override;

private:
    SshSettings settings_;
    std::unique_ptr<SshSession> session_;      // replaced only under the base channel lock
    const std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(false);
};
