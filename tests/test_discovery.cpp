#include <gtest/gtest.h>
#include <managers/discovery.hpp>
#include "fake_transport.hpp"

class DiscoveryTest : public ::testing::Test {
protected:
    TempDir dir{"discovery"};
    FakeTransport transport;
    CacheStore cache{dir.path};
    SshSettings settings;
    HostIdentity id{"bench1", "alice"};

    std::string consoles_out = "RECON-CONSOLES/1\n/dev/ttyUSB0\n";
    std::string networks_out =
        "RECON-NETWORKS/1\n"
        "2: eth0    inet 192.168.1.10/24 brd 192.168.1.255 scope global eth0\n";
    int exit_code = 0;

    void SetUp() override {
        settings.keepalive_secs = 0;
        transport.responder = [this](const std::string& cmd) {
            if (cmd == CONSOLE_DISCOVERY_CMD) return FakeTransport::reply(exit_code, consoles_out);
            if (cmd == NETWORK_DISCOVERY_CMD) return FakeTransport::reply(exit_code, networks_out);
            return FakeTransport::reply(127, "", "sh: not found");
        };
    }
};

TEST_F(DiscoveryTest, RequiresConnection) {
    SessionManager session(transport, cache, settings);
    ConsoleDiscovery consoles(session, 5);
    auto r = consoles.discover();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Channel);
}

TEST_F(DiscoveryTest, ConsolesAreDiscoveredAndCached) {
    SessionManager session(transport, cache, settings);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ConsoleDiscovery consoles(session, 5);

    auto r = consoles.discover();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].name, "ttyUSB0");
    EXPECT_EQ(consoles.cached(), r.value);
    EXPECT_EQ(cache.load(id).consoles.size(), 1u);
}

TEST_F(DiscoveryTest, UnionKeepsDevicesThatDisappeared) {
    SessionManager session(transport, cache, settings);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ConsoleDiscovery consoles(session, 5);
    ASSERT_TRUE(consoles.discover().is_ok());

    consoles_out = "RECON-CONSOLES/1\n/dev/ttyACM0\n";
    auto r = consoles.discover(MergeMode::Union);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 2u);

    r = consoles.discover(MergeMode::Replace);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].name, "ttyACM0");
}

TEST_F(DiscoveryTest, MalformedOutputLeavesCacheUntouched) {
    SessionManager session(transport, cache, settings);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    ConsoleDiscovery consoles(session, 5);
    ASSERT_TRUE(consoles.discover().is_ok());

    consoles_out = "something else entirely\n";
    auto r = consoles.discover(MergeMode::Replace);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Discovery);
    EXPECT_EQ(consoles.cached().size(), 1u);
}

TEST_F(DiscoveryTest, MissingToolIsACapabilityError) {
    SessionManager session(transport, cache, settings);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    NetworkDiscovery networks(session, 5);

    exit_code = 127;
    auto r = networks.discover();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Capability);

    exit_code = 1;
    EXPECT_EQ(networks.discover().kind, ErrorKind::Discovery);
}

TEST_F(DiscoveryTest, NetworksAreDiscoveredAndFound) {
    SessionManager session(transport, cache, settings);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    NetworkDiscovery networks(session, 5);

    auto missing = networks.find("eth0");
    EXPECT_EQ(missing.kind, ErrorKind::Discovery);

    auto r = networks.discover_async().get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].subnet_cidr, "192.168.1.0/24");

    auto found = networks.find("eth0");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value.address, "192.168.1.10");
}

TEST_F(DiscoveryTest, CachedDataSurvivesDisconnect) {
    SessionManager session(transport, cache, settings);
    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    NetworkDiscovery networks(session, 5);
    ASSERT_TRUE(networks.discover().is_ok());

    session.disconnect();
    EXPECT_EQ(networks.cached().size(), 1u);
    EXPECT_EQ(networks.discover().kind, ErrorKind::Channel);
}

TEST_F(DiscoveryTest, ClearDropsOneSection) {
    SessionManager session(transport, cache, settings);
    ConsoleDiscovery consoles(session, 5);
    EXPECT_EQ(consoles.clear().kind, ErrorKind::Channel);

    ASSERT_TRUE(session.connect(id, {"pw"}).is_ok());
    NetworkDiscovery networks(session, 5);
    ASSERT_TRUE(consoles.discover().is_ok());
    ASSERT_TRUE(networks.discover().is_ok());

    ASSERT_TRUE(consoles.clear().is_ok());
    EXPECT_TRUE(consoles.cached().empty());
    EXPECT_EQ(networks.cached().size(), 1u);
}
