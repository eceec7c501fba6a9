#include "core/Config.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace PeerBeam;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_Path = std::filesystem::temp_directory_path()
            / ("peerbeam_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed())
               + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(m_Path, ec);
    }

    std::string Write(const std::string& content) {
        std::ofstream out(m_Path, std::ios::binary | std::ios::trunc);
        out << content;
        return m_Path.string();
    }

    std::filesystem::path m_Path;
};

TEST_F(ConfigFileTest, PeerConfigReadsKeysAndKeepsDefaults) {
    PeerConfig cfg = PeerConfig::LoadFromFile(Write(R"({
        "signaling_host": "127.0.0.1",
        "signaling_port": 4000,
        "chunk_size": 16384,
        "timeouts": { "peer_join_ms": 1500 }
    })"));
    EXPECT_EQ(cfg.signalingHost, "127.0.0.1");
    EXPECT_EQ(cfg.signalingPort, 4000);
    EXPECT_EQ(cfg.chunkSize, 16384u);
    EXPECT_EQ(cfg.timeouts.peerJoin, Millis(1500));
    EXPECT_EQ(cfg.timeouts.gathering, NegotiationTimeouts{}.gathering);
    EXPECT_EQ(cfg.iceServers, PeerConfig::DefaultIceServers());
}

TEST_F(ConfigFileTest, WrongTypeNamesTheKey) {
    try {
        PeerConfig::LoadFromFile(Write(R"({ "chunk_size": "big" })"));
        FAIL() << "expected a config error";
    }
    catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("chunk_size"), std::string::npos);
    }
}

TEST_F(ConfigFileTest, ChunkSizeAboveLimitIsRejected) {
    EXPECT_THROW(PeerConfig::LoadFromFile(Write(R"({ "chunk_size": 70000 })")), std::runtime_error);
}

TEST_F(ConfigFileTest, BrokerConfigRequiresPingBeforeDeadline) {
    BrokerConfig cfg = BrokerConfig::LoadFromFile(Write(R"({ "port": 9000, "ping_interval_ms": 1000, "read_deadline_ms": 3000 })"));
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.pingInterval, Millis(1000));

    EXPECT_THROW(BrokerConfig::LoadFromFile(Write(R"({ "ping_interval_ms": 5000, "read_deadline_ms": 3000 })")),
        std::runtime_error);
}

TEST_F(ConfigFileTest, OutOfRangePortNamesTheKey) {
    try {
        BrokerConfig::LoadFromFile(Write(R"({ "port": 70000 })"));
        FAIL() << "port 70000 accepted";
    }
    catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("'port'"), std::string::npos);
    }
    try {
        PeerConfig::LoadFromFile(Write(R"({ "signaling_port": -1 })"));
        FAIL() << "signaling port -1 accepted";
    }
    catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("signaling_port"), std::string::npos);
    }
}

TEST_F(ConfigFileTest, MissingFileIsAnError) {
    EXPECT_THROW(PeerConfig::LoadFromFile(m_Path.string()), std::runtime_error);
}

TEST(PeerConfigTest, StunOverrideReplacesDefaultAndAddsScheme) {
    PeerConfig cfg;
    cfg.OverrideStun("stun.example.org:3478");
    ASSERT_FALSE(cfg.iceServers.empty());
    EXPECT_EQ(cfg.iceServers.front(), "stun:stun.example.org:3478");
    EXPECT_EQ(std::count_if(cfg.iceServers.begin(), cfg.iceServers.end(),
        [](const std::string& s) { return s.rfind("stun:", 0) == 0; }), 1);
}

TEST(PeerConfigTest, TurnOverrideReplacesAllTurnEntries) {
    PeerConfig cfg;
    cfg.OverrideTurn("turn:u:p@relay.example.org:3478");
    EXPECT_EQ(std::count_if(cfg.iceServers.begin(), cfg.iceServers.end(),
        [](const std::string& s) { return s.rfind("turn:", 0) == 0; }), 1);
    EXPECT_EQ(cfg.iceServers.back(), "turn:u:p@relay.example.org:3478");
}

TEST(PeerConfigTest, SignalingEndpointForms) {
    PeerConfig cfg;
    cfg.SetSignalingEndpoint("broker.example.org:9000");
    EXPECT_EQ(cfg.signalingHost, "broker.example.org");
    EXPECT_EQ(cfg.signalingPort, 9000);

    cfg.SetSignalingEndpoint("tcp://10.0.0.1:7000/ws");
    EXPECT_EQ(cfg.signalingHost, "10.0.0.1");
    EXPECT_EQ(cfg.signalingPort, 7000);

    cfg.SetSignalingEndpoint("plainhost");
    EXPECT_EQ(cfg.signalingHost, "plainhost");
    EXPECT_EQ(cfg.signalingPort, 7000);

    EXPECT_THROW(cfg.SetSignalingEndpoint("host:notaport"), std::runtime_error);
}
