#include <gtest/gtest.h>
#include <managers/tunnel_manager.hpp>
#include <platform/socket_util.hpp>
#include "fake_transport.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

static int connect_local(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

static std::string read_until(int fd, size_t want, int timeout_ms = 3000) {
    std::string out;
    char buf[4096];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
        struct pollfd p = {fd, POLLIN, 0};
        if (poll(&p, 1, 50) <= 0) continue;
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

class TunnelManagerTest : public ::testing::Test {
protected:
    TempDir dir{"tunnel"};
    FakeTransport transport;
    CacheStore cache{dir.path};
    SshSettings ssh;
    TunnelSettings settings;
    HostIdentity id{"bench1", "alice"};

    void SetUp() override {
        ssh.keepalive_secs = 0;
    }
};

TEST_F(TunnelManagerTest, RequiresConnection) {
    SessionManager session(transport, cache, ssh);
    TunnelManager tunnel(session, settings);
    auto r = tunnel.open("192.168.5.2");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Channel);
    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);
}

TEST_F(TunnelManagerTest, ForwardsLocalConnections) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);

    auto r = tunnel.open("192.168.5.2");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, TunnelStatus::Open);
    EXPECT_GT(r.value.local_port, 0);
    EXPECT_EQ(r.value.remote_host, "192.168.5.2");
    EXPECT_EQ(r.value.remote_port, TUNNEL_REMOTE_PORT);
    EXPECT_EQ(r.value.local_url(), "https://localhost:" + std::to_string(r.value.local_port));

    // The reachability check does not hold a channel
    EXPECT_EQ(transport.open_channel_count(), 0);

    int fd = connect_local(r.value.local_port);
    ASSERT_GE(fd, 0);
    const std::string hello = "GET / HTTP/1.1\r\n\r\n";
    ASSERT_TRUE(platform::write_all(fd, hello.data(), hello.size()));

    // The fake channel echoes, so the request comes straight back
    EXPECT_EQ(read_until(fd, hello.size()), hello);
    EXPECT_TRUE(eventually([&] { return tunnel.active_connections() == 1; }));

    auto forward = transport.last_channel(ChannelKind::Forward);
    ASSERT_NE(forward, nullptr);
    EXPECT_EQ(forward->spec().host, "192.168.5.2");
    EXPECT_EQ(forward->spec().port, TUNNEL_REMOTE_PORT);

    close(fd);
    EXPECT_TRUE(eventually([&] { return tunnel.active_connections() == 0; }));
    tunnel.close();
}

TEST_F(TunnelManagerTest, EachConnectionGetsItsOwnChannel) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);
    auto r = tunnel.open("192.168.5.2");
    ASSERT_TRUE(r.is_ok());

    int a = connect_local(r.value.local_port);
    int b = connect_local(r.value.local_port);
    ASSERT_GE(a, 0);
    ASSERT_GE(b, 0);
    ASSERT_TRUE(platform::write_all(a, "aaa", 3));
    ASSERT_TRUE(platform::write_all(b, "bbb", 3));
    EXPECT_EQ(read_until(a, 3), "aaa");
    EXPECT_EQ(read_until(b, 3), "bbb");
    EXPECT_EQ(transport.open_channel_count(), 2);

    close(a);
    close(b);
    tunnel.close();
    EXPECT_EQ(transport.open_channel_count(), 0);
}

TEST_F(TunnelManagerTest, SecondOpenConflicts) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);
    auto first = tunnel.open("192.168.5.2");
    ASSERT_TRUE(first.is_ok());

    auto second = tunnel.open("192.168.5.3");
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::TunnelConflict);

    // The open tunnel is unaffected
    EXPECT_EQ(tunnel.status(), TunnelStatus::Open);
    EXPECT_EQ(tunnel.info().remote_host, "192.168.5.2");
    tunnel.close();
}

TEST_F(TunnelManagerTest, UnreachableTargetFailsThenRecovers) {
    transport.unreachable.insert("192.168.5.9:443");
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);

    auto r = tunnel.open("192.168.5.9");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TunnelAllocation);
    EXPECT_EQ(tunnel.status(), TunnelStatus::Failed);
    EXPECT_FALSE(tunnel.info().error.empty());

    tunnel.close();
    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);

    EXPECT_TRUE(tunnel.open("192.168.5.2").is_ok());
    tunnel.close();
}

TEST_F(TunnelManagerTest, CloseIsIdempotentAndReleasesThePort) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);
    auto r = tunnel.open("192.168.5.2");
    ASSERT_TRUE(r.is_ok());
    int port = r.value.local_port;
    EXPECT_TRUE(platform::is_port_open(port));

    tunnel.close();
    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);
    EXPECT_FALSE(platform::is_port_open(port));
    tunnel.close();
    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);
}

TEST_F(TunnelManagerTest, BusyPortRangeIsAnAllocationError) {
    int err = 0;
    auto blocker = platform::listen_loopback(0, err);
    ASSERT_TRUE(blocker.valid());

    settings.port_range = std::make_pair(blocker.port, blocker.port);
    settings.bind_attempts = 3;
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);

    auto r = tunnel.open("192.168.5.2");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TunnelAllocation);
    platform::close_socket(blocker.fd);
}

TEST_F(TunnelManagerTest, ExplicitRemotePort) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);
    auto r = tunnel.open("192.168.5.2", 8443);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.remote_port, 8443);
    tunnel.close();
}

// Forward channels take a while to negotiate, so open() stays in flight.
class SlowForwardTransport : public FakeTransport {
public:
    int forward_delay_ms = 300;

protected:
    Result<ChannelPtr> do_open_channel(const ChannelSpec& spec, int id) override {
        if (spec.kind == ChannelKind::Forward) {
            std::this_thread::sleep_for(std::chrono::milliseconds(forward_delay_ms));
        }
        return FakeTransport::do_open_channel(spec, id);
    }
};

TEST_F(TunnelManagerTest, CloseDuringOpenEndsClosed) {
    SlowForwardTransport slow;
    SessionManager session(slow, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);

    Result<TunnelInfo> opened = Result<TunnelInfo>::Err(ErrorKind::None, "not run");
    std::thread opener([&] { opened = tunnel.open("192.168.5.2"); });
    ASSERT_TRUE(eventually([&] { return tunnel.status() == TunnelStatus::Opening; }));

    tunnel.close();
    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);
    opener.join();
    EXPECT_TRUE(opened.is_ok()) << opened.error;
    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);
    EXPECT_EQ(tunnel.active_connections(), 0);
}

TEST_F(TunnelManagerTest, SecondOpenWhileOpeningConflicts) {
    SlowForwardTransport slow;
    SessionManager session(slow, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);

    std::thread opener([&] { EXPECT_TRUE(tunnel.open("192.168.5.2").is_ok()); });
    ASSERT_TRUE(eventually([&] { return tunnel.status() == TunnelStatus::Opening; }));

    auto second = tunnel.open("192.168.5.3");
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::TunnelConflict);

    opener.join();
    EXPECT_EQ(tunnel.status(), TunnelStatus::Open);
    EXPECT_EQ(tunnel.info().remote_host, "192.168.5.2");
    tunnel.close();
}

TEST_F(TunnelManagerTest, DisconnectDuringOpenLeavesTunnelClosed) {
    SlowForwardTransport slow;
    SessionManager session(slow, cache, ssh);
    TunnelManager tunnel(session, settings);
    session.add_teardown_hook([&] { tunnel.close(); });
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());

    std::thread opener([&] { tunnel.open("192.168.5.2"); });
    ASSERT_TRUE(eventually([&] { return tunnel.status() == TunnelStatus::Opening; }));
    session.disconnect();
    opener.join();

    EXPECT_EQ(tunnel.status(), TunnelStatus::Closed);
    EXPECT_FALSE(session.is_connected());
}

TEST_F(TunnelManagerTest, LargeResponsesAreNotThrottled) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    TunnelManager tunnel(session, settings);
    auto r = tunnel.open("192.168.5.2");
    ASSERT_TRUE(r.is_ok()) << r.error;

    int fd = connect_local(r.value.local_port);
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(platform::write_all(fd, "GET", 3));
    ASSERT_EQ(read_until(fd, 3), "GET");

    // A 2 MiB download, e.g. firmware from a device's web UI
    const std::string body(2 * 1024 * 1024, 'z');
    auto forward = transport.last_channel(ChannelKind::Forward);
    ASSERT_NE(forward, nullptr);
    forward->push_output(body);
    EXPECT_EQ(read_until(fd, body.size(), 3000).size(), body.size());

    close(fd);
    tunnel.close();
}
