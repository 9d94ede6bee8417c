#include <gtest/gtest.h>
#include <managers/recon_service.hpp>
#include "fake_transport.hpp"

class ReconServiceTest : public ::testing::Test {
protected:
    TempDir dir{"service"};
    Config config;
    FakeTransport* transport = nullptr;
    std::unique_ptr<ReconService> service;
    HostIdentity id{"bench1", "alice"};

    void SetUp() override {
        config.set_cache_dir(dir.path / "hosts");
        config.ssh().keepalive_secs = 0;
        config.terminal().attach_timeout = 10;
        config.scan().workers = 1;

        auto fake = std::make_unique<FakeTransport>();
        transport = fake.get();
        transport->responder = [](const std::string& cmd) {
            if (cmd == NETWORK_DISCOVERY_CMD) {
                return FakeTransport::reply(0,
                    "RECON-NETWORKS/1\n2: eth0    inet 10.3.0.1/24 scope global eth0\n");
            }
            if (cmd.rfind("ping", 0) == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return FakeTransport::reply(1);
            }
            if (cmd == "hostname") return FakeTransport::reply(0, "bench1\n");
            return FakeTransport::reply(0);
        };

        service = std::make_unique<ReconService>(config, std::move(fake),
            [](const std::vector<std::string>&) {
                auto handle = platform::spawn("sleep", {"30"});
                return Result<platform::ProcessHandle>::Ok(std::move(handle));
            });
    }

    void TearDown() override {
        service.reset();
    }
};

TEST_F(ReconServiceTest, ExecNeedsConnection) {
    EXPECT_EQ(service->exec("hostname").kind, ErrorKind::Channel);
    ASSERT_TRUE(service->connect(id, {"pw"}).is_ok());
    auto r = service->exec("hostname");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "bench1\n");
}

TEST_F(ReconServiceTest, ScanInterfaceNeedsKnownInterface) {
    ASSERT_TRUE(service->connect(id, {"pw"}).is_ok());
    EXPECT_EQ(service->scan_interface("eth0", MergeMode::Union).kind, ErrorKind::Discovery);

    ASSERT_TRUE(service->networks().discover().is_ok());
    auto task = service->scan_interface("eth0", MergeMode::Union);
    ASSERT_TRUE(task.is_ok()) << task.error;
    EXPECT_EQ(task.value->subnet(), "10.3.0.0/24");
    service->scanner().stop();
}

TEST_F(ReconServiceTest, DisconnectClosesEverythingOnTheSession) {
    ASSERT_TRUE(service->connect(id, {"pw"}).is_ok());
    ASSERT_TRUE(service->networks().discover().is_ok());

    auto tunnel = service->tunnel().open("10.3.0.7");
    ASSERT_TRUE(tunnel.is_ok()) << tunnel.error;
    auto shell = service->spawner().spawn_shell();
    ASSERT_TRUE(shell.is_ok()) << shell.error;
    auto scan = service->scan_interface("eth0", MergeMode::Union);
    ASSERT_TRUE(scan.is_ok());

    service->disconnect();

    EXPECT_EQ(service->state(), SessionState::Idle);
    EXPECT_EQ(service->tunnel().status(), TunnelStatus::Closed);
    EXPECT_FALSE(shell.value->is_open());
    EXPECT_TRUE(scan.value->done());
    EXPECT_FALSE(platform::is_port_open(tunnel.value.local_port));
    EXPECT_EQ(transport->open_channel_count(), 0);

    // Cached inventory outlives the session
    EXPECT_EQ(service->networks().cached().size(), 1u);
    ASSERT_EQ(service->known_hosts().size(), 1u);
    EXPECT_EQ(service->known_hosts()[0], id);
}

TEST_F(ReconServiceTest, LossFailsTheSessionAndClosesEverything) {
    ASSERT_TRUE(service->connect(id, {"pw"}).is_ok());
    auto tunnel = service->tunnel().open("10.3.0.7");
    ASSERT_TRUE(tunnel.is_ok());
    auto shell = service->spawner().spawn_shell();
    ASSERT_TRUE(shell.is_ok());

    transport->drop();
    EXPECT_FALSE(service->check_alive());

    EXPECT_EQ(service->state(), SessionState::Failed);
    EXPECT_EQ(service->session().failure_kind(), ErrorKind::Network);
    EXPECT_EQ(service->tunnel().status(), TunnelStatus::Closed);
    EXPECT_FALSE(shell.value->is_open());

    // Reconnecting starts clean
    ASSERT_TRUE(service->connect(id, {"pw"}).is_ok());
    EXPECT_TRUE(service->tunnel().open("10.3.0.7").is_ok());
}

// The browser command stands in as `touch`, so the "URL" is a file it creates.
TEST_F(ReconServiceTest, OpensTheConfiguredBrowser) {
    Config c = config;
    c.tunnel().browser = {"touch", "{url}"};
    ReconService svc(c, std::make_unique<FakeTransport>());

    fs::path marker = dir.path / "opened";
    ASSERT_TRUE(svc.open_browser(marker.string()).is_ok());
    EXPECT_TRUE(eventually([&] { return fs::exists(marker); }));
}

TEST_F(ReconServiceTest, BrowserWithoutPlaceholderGetsTheUrlAppended) {
    Config c = config;
    c.tunnel().browser = {"touch"};
    ReconService svc(c, std::make_unique<FakeTransport>());

    fs::path first = dir.path / "first";
    fs::path second = dir.path / "second";
    ASSERT_TRUE(svc.open_browser(first.string()).is_ok());
    ASSERT_TRUE(eventually([&] { return fs::exists(first); }));
    ASSERT_TRUE(svc.open_browser(second.string()).is_ok());
    EXPECT_TRUE(eventually([&] { return fs::exists(second); }));
}

TEST_F(ReconServiceTest, NoBrowserConfigured) {
    Config c = config;
    c.tunnel().browser.clear();
    ReconService svc(c, std::make_unique<FakeTransport>());
    auto r = svc.open_browser("http://localhost:51000");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}
