#include <gtest/gtest.h>
#include <managers/process_spawner.hpp>
#include <core/attach_protocol.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include "fake_transport.hpp"
#include <poll.h>
#include <unistd.h>

// The launched "terminal" is a plain sleep; tests play the attach helper
// themselves over the session's socket.
class ProcessSpawnerTest : public ::testing::Test {
protected:
    TempDir dir{"spawner"};
    FakeTransport transport;
    CacheStore cache{dir.path};
    SshSettings ssh;
    TerminalSettings term;
    HostIdentity id{"bench1", "alice"};

    std::mutex argv_mutex;
    std::vector<std::vector<std::string>> launched;
    std::string terminal_program = "sleep";

    void SetUp() override {
        ssh.keepalive_secs = 0;
        term.attach_timeout = 5;
        transport.responder = [](const std::string& cmd) {
            if (cmd == SERIAL_CAPABILITY_CMD) return FakeTransport::reply(0);
            return FakeTransport::reply(127);
        };
    }

    ProcessSpawner::Launcher launcher() {
        return [this](const std::vector<std::string>& argv) {
            {
                std::lock_guard<std::mutex> lock(argv_mutex);
                launched.push_back(argv);
            }
            auto handle = platform::spawn(terminal_program, {"30"});
            if (!handle.valid()) {
                return Result<platform::ProcessHandle>::Err(ErrorKind::Io, "spawn failed");
            }
            return Result<platform::ProcessHandle>::Ok(std::move(handle));
        };
    }

    // Connect like `recon attach` and send the hello line.
    int attach(const InteractiveSession& s, int cols = 100, int rows = 40) {
        socket_t fd = platform::connect_unix(s.socket_path());
        if (fd == RECON_INVALID_SOCKET) return -1;
        std::string hello = build_attach_hello(cols, rows);
        if (!platform::write_all(fd, hello.data(), hello.size())) {
            platform::close_socket(fd);
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

    // True once the peer has closed the socket.
    static bool closed_by_peer(int fd, int timeout_ms = 3000) {
        char buf[256];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            struct pollfd p = {fd, POLLIN, 0};
            if (poll(&p, 1, 50) <= 0) continue;
            if (read(fd, buf, sizeof(buf)) <= 0) return true;
        }
        return false;
    }
};

TEST_F(ProcessSpawnerTest, RequiresConnection) {
    SessionManager session(transport, cache, ssh);
    ProcessSpawner spawner(session, term, launcher());
    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Channel);
    EXPECT_TRUE(launched.empty());
}

TEST_F(ProcessSpawnerTest, TerminalArgvExpansion) {
    SessionManager session(transport, cache, ssh);
    ProcessSpawner spawner(session, term, launcher());
    std::string self = platform::self_executable();

    auto argv = spawner.terminal_argv("alice@bench1", "/run/x.sock");
    EXPECT_EQ(argv, (std::vector<std::string>{"xterm", "-T", "alice@bench1", "-e",
                                              self, "attach", "/run/x.sock"}));

    term.command = {"sh", "-c", "exec {attach}", "{title}{title}"};
    ProcessSpawner shell_style(session, term, launcher());
    argv = shell_style.terminal_argv("t", "/run/x.sock");
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[2], "exec '" + self + "' attach '/run/x.sock'");
    EXPECT_EQ(argv[3], "tt");
}

TEST_F(ProcessSpawnerTest, ShellRelaysThroughAttachSocket) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto s = r.value;
    EXPECT_EQ(s->kind(), InteractiveKind::Shell);
    EXPECT_EQ(s->title(), "alice@bench1");
    ASSERT_EQ(launched.size(), 1u);
    EXPECT_EQ(launched[0].back(), s->socket_path());

    auto channel = transport.last_channel(ChannelKind::Shell);
    ASSERT_NE(channel, nullptr);
    EXPECT_EQ(channel->id(), s->channel_id());

    int fd = attach(*s, 120, 50);
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(eventually([&] { return s->attached(); }));
    EXPECT_TRUE(eventually([&] { return channel->cols_.load() == 120 && channel->rows_.load() == 50; }));

    // Keyboard bytes go to the channel; the fake channel echoes them back
    std::string frames = encode_data_frames("ls\r", 3);
    ASSERT_TRUE(platform::write_all(fd, frames.data(), frames.size()));
    EXPECT_EQ(read_until(fd, 3), "ls\r");
    EXPECT_EQ(channel->written(), "ls\r");

    // Window resizes follow
    std::string resize = encode_resize_frame(80, 24);
    ASSERT_TRUE(platform::write_all(fd, resize.data(), resize.size()));
    EXPECT_TRUE(eventually([&] { return channel->cols_.load() == 80 && channel->rows_.load() == 24; }));

    // Remote output reaches the terminal
    channel->push_output("welcome\r\n");
    EXPECT_EQ(read_until(fd, 9), "welcome\r\n");

    EXPECT_EQ(spawner.sessions().size(), 1u);
    platform::close_socket(fd);
}

TEST_F(ProcessSpawnerTest, ClosingTheTerminalClosesOnlyItsChannel) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto a = spawner.spawn_shell();
    auto b = spawner.spawn_shell();
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value->channel_id(), b.value->channel_id());
    EXPECT_NE(a.value->socket_path(), b.value->socket_path());

    int fa = attach(*a.value);
    int fb = attach(*b.value);
    ASSERT_GE(fa, 0);
    ASSERT_GE(fb, 0);
    EXPECT_TRUE(eventually([&] { return a.value->attached() && b.value->attached(); }));

    platform::close_socket(fa);
    EXPECT_TRUE(eventually([&] { return !a.value->is_open(); }));
    EXPECT_TRUE(b.value->is_open());
    EXPECT_EQ(transport.open_channel_count(), 1);
    EXPECT_FALSE(fs::exists(a.value->socket_path()));

    auto open = spawner.sessions();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0], b.value);
    EXPECT_EQ(a.value->send("x").kind, ErrorKind::Channel);

    platform::close_socket(fb);
}

TEST_F(ProcessSpawnerTest, RemoteExitClosesTheTerminalSide) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_ok());
    int fd = attach(*r.value);
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(eventually([&] { return r.value->attached(); }));

    transport.last_channel(ChannelKind::Shell)->finish_remote();
    EXPECT_TRUE(closed_by_peer(fd));
    EXPECT_TRUE(eventually([&] { return !r.value->is_open(); }));
    platform::close_socket(fd);
}

TEST_F(ProcessSpawnerTest, UnattachedSessionTimesOut) {
    term.attach_timeout = 1;
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(eventually([&] { return !r.value->is_open(); }, 4000));
    EXPECT_FALSE(r.value->attached());
    EXPECT_EQ(transport.open_channel_count(), 0);
}

TEST_F(ProcessSpawnerTest, TerminalThatFailsClosesSession) {
    terminal_program = "false";
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_ok());
    // Well before the attach timeout
    EXPECT_TRUE(eventually([&] { return !r.value->is_open(); }, 2000));
    EXPECT_EQ(transport.open_channel_count(), 0);
}

// gnome-terminal and konsole launchers exit 0 once a server owns the window.
TEST_F(ProcessSpawnerTest, LauncherThatExitsCleanlyStillAttaches) {
    terminal_program = "true";
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ASSERT_TRUE(r.value->is_open());

    int fd = attach(*r.value);
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(eventually([&] { return r.value->attached(); }));
    transport.last_channel(ChannelKind::Shell)->push_output("$ ");
    EXPECT_EQ(read_until(fd, 2), "$ ");
    platform::close_socket(fd);
}

TEST_F(ProcessSpawnerTest, BulkOutputIsNotThrottled) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_ok());
    int fd = attach(*r.value);
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(eventually([&] { return r.value->attached(); }));

    // 2 MiB, e.g. a long log dump on a serial console
    const std::string bulk(2 * 1024 * 1024, 'x');
    transport.last_channel(ChannelKind::Shell)->push_output(bulk);
    EXPECT_EQ(read_until(fd, bulk.size(), 3000).size(), bulk.size());
    platform::close_socket(fd);
}

TEST_F(ProcessSpawnerTest, LauncherFailureReleasesTheChannel) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, [](const std::vector<std::string>&) {
        return Result<platform::ProcessHandle>::Err(ErrorKind::Io, "no display");
    });

    auto r = spawner.spawn_shell();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Io);
    EXPECT_EQ(transport.open_channel_count(), 0);
    EXPECT_TRUE(spawner.sessions().empty());
}

TEST_F(ProcessSpawnerTest, ConsoleRunsPicocomOnTheDevice) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_console({"ttyUSB0", "/dev/ttyUSB0"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value->kind(), InteractiveKind::Console);
    EXPECT_EQ(r.value->title(), "bench1 ttyUSB0");

    auto channel = transport.last_channel(ChannelKind::Serial);
    ASSERT_NE(channel, nullptr);
    EXPECT_EQ(channel->spec().command, "picocom -b 115200 -f x '/dev/ttyUSB0'");
    spawner.close_all();
}

TEST_F(ProcessSpawnerTest, ConsoleWithoutPicocomIsACapabilityError) {
    transport.responder = [](const std::string&) { return FakeTransport::reply(1); };
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto r = spawner.spawn_console({"ttyUSB0", "/dev/ttyUSB0"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Capability);
    EXPECT_TRUE(launched.empty());
}

TEST_F(ProcessSpawnerTest, CloseAllEndsEverySession) {
    SessionManager session(transport, cache, ssh);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ProcessSpawner spawner(session, term, launcher());

    auto a = spawner.spawn_shell();
    auto b = spawner.spawn_console({"ttyUSB0", "/dev/ttyUSB0"});
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    spawner.close_all();
    EXPECT_FALSE(a.value->is_open());
    EXPECT_FALSE(b.value->is_open());
    EXPECT_TRUE(spawner.sessions().empty());
    EXPECT_EQ(transport.open_channel_count(), 0);
}
