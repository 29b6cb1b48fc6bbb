#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include "driver/driver.h"
#include "connection/connection_error.h"
#include "tracks/track_handle.h"
#include "mocks/mock_network.h"

using namespace voicelink::voice;
using voicelink::voice::testing::LoopbackVoiceServer;
using voicelink::voice::testing::ScriptedGatewayServer;
using voicelink::voice::testing::cooperative_gateway;
using voicelink::voice::testing::make_scripted_factory;
using voicelink::voice::testing::wait_until;
using namespace std::chrono_literals;

class DriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<ScriptedGatewayServer>();
        voice_server = std::make_unique<LoopbackVoiceServer>("203.0.113.7", 50000);
        server->set_responder(cooperative_gateway(voice_server->port()));

        config.mixer_realtime_priority = false;
        config.handshake_timeout = 2000ms;
        config.reconnect.base_delay = 50ms;
        config.reconnect.max_delay = 200ms;

        info.endpoint = "voice.test";
        info.guild_id = 41771983423143937ULL;
        info.user_id = 104694319306248192ULL;
        info.session_id = "my_session_id";
        info.token = "my_token";
    }

    std::unique_ptr<Driver> make_driver() {
        return std::make_unique<Driver>(config, make_scripted_factory(server),
                                        [this](const ConnectionError& e) {
                                            std::lock_guard<std::mutex> lock(mutex);
                                            disconnect_kind = e.kind();
                                            disconnect_code = e.close_code();
                                            ++disconnects;
                                        });
    }

    std::shared_ptr<ScriptedGatewayServer> server;
    std::unique_ptr<LoopbackVoiceServer> voice_server;
    DriverConfig config;
    ConnectionInfo info;

    std::mutex mutex;
    std::atomic<int> disconnects{0};
    std::optional<ConnectionErrorKind> disconnect_kind;
    std::optional<uint16_t> disconnect_code;
};

TEST_F(DriverTest, ConnectCompletesFuture) {
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(connected.get());
    EXPECT_EQ(server->sent_events(VoiceOpcode::IDENTIFY).size(), 1u);
    EXPECT_EQ(server->sent_events(VoiceOpcode::SELECT_PROTOCOL).size(), 1u);
}

TEST_F(DriverTest, ConnectFailureSurfacesThroughFuture) {
    server->set_fail_open(true);
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    try {
        connected.get();
        FAIL() << "connect unexpectedly succeeded";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.kind(), ConnectionErrorKind::WEBSOCKET);
    }
    // A failed first connect is not retried.
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(server->opened_urls().size(), 0u);
    EXPECT_EQ(disconnects.load(), 0);
}

TEST_F(DriverTest, RemovedFromChannelGivesUp) {
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    connected.get();

    server->push_close(4014);
    ASSERT_TRUE(wait_until([this] { return disconnects.load() == 1; }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(disconnect_kind, ConnectionErrorKind::WEBSOCKET);
        EXPECT_EQ(disconnect_code, std::optional<uint16_t>(4014));
    }
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(server->opened_urls().size(), 1u);
}

TEST_F(DriverTest, ResumableCloseResumesSession) {
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    connected.get();

    server->push_close(4006);
    ASSERT_TRUE(wait_until([this] { return server->sent_events(VoiceOpcode::RESUME).size() == 1; }));

    const auto resume = server->sent_events(VoiceOpcode::RESUME).front().resume;
    EXPECT_EQ(resume.server_id, info.guild_id);
    EXPECT_EQ(resume.session_id, "my_session_id");
    EXPECT_EQ(resume.token, "my_token");
    EXPECT_EQ(server->opened_urls().size(), 2u);
    EXPECT_EQ(server->sent_events(VoiceOpcode::IDENTIFY).size(), 1u);
    EXPECT_EQ(disconnects.load(), 0);
}

TEST_F(DriverTest, CloseWithoutCodeResumesSession) {
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    connected.get();

    server->push_close(std::nullopt);
    ASSERT_TRUE(wait_until([this] { return server->sent_events(VoiceOpcode::RESUME).size() == 1; }));
    EXPECT_EQ(server->sent_events(VoiceOpcode::IDENTIFY).size(), 1u);
    EXPECT_EQ(disconnects.load(), 0);
}

TEST_F(DriverTest, NormalCloseReconnectsFromScratch) {
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    connected.get();

    server->push_close(1000);
    ASSERT_TRUE(wait_until([this] { return server->sent_events(VoiceOpcode::IDENTIFY).size() == 2; }));
    EXPECT_TRUE(server->sent_events(VoiceOpcode::RESUME).empty());
    EXPECT_EQ(server->opened_urls().size(), 2u);
    EXPECT_EQ(disconnects.load(), 0);
}

TEST_F(DriverTest, ExhaustedReconnectsGiveUp) {
    config.reconnect.attempts = 2;
    config.reconnect.base_delay = 10ms;
    config.reconnect.max_delay = 20ms;
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    connected.get();

    server->set_fail_open(true);
    server->push_close(1000);
    ASSERT_TRUE(wait_until([this] { return disconnects.load() == 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(disconnects.load(), 1);
}

TEST_F(DriverTest, LeaveClosesGatewayAndStopsReconnecting) {
    auto driver = make_driver();
    auto connected = driver->connect(info);
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    connected.get();

    driver->leave();
    ASSERT_TRUE(wait_until([this] { return server->close_count() >= 1; }));
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(server->opened_urls().size(), 1u);
    EXPECT_EQ(disconnects.load(), 0);
}

TEST_F(DriverTest, AccessorsReflectLocalState) {
    auto driver = make_driver();
    EXPECT_FALSE(driver->is_mute());
    driver->mute(true);
    EXPECT_TRUE(driver->is_mute());

    DriverConfig updated = config;
    updated.crypto_mode = CryptoMode::LITE;
    updated.default_bitrate = 96000;
    driver->set_config(updated);
    EXPECT_EQ(driver->config().crypto_mode, CryptoMode::LITE);
    EXPECT_EQ(driver->config().default_bitrate, 96000);
}

TEST_F(DriverTest, PlayWithoutConnectionReturnsLiveHandle) {
    auto driver = make_driver();
    auto handle = driver->play_source(voicelink::voice::testing::TestPcmGenerator::input(
        voicelink::voice::testing::TestPcmGenerator::silence(50)));
    EXPECT_EQ(handle.pause(), TrackResult::OK);
    EXPECT_EQ(handle.play(), TrackResult::OK);
    driver->stop();
}

TEST_F(DriverTest, FailedCoreThreadIsReplacedOnNextCall) {
    auto scripted = make_scripted_factory(server);
    auto opens = std::make_shared<std::atomic<int>>(0);
    GatewaySocketFactory crashing_once =
        [scripted, opens](const std::string& url, std::chrono::milliseconds timeout) -> std::unique_ptr<IGatewaySocket> {
        if ((*opens)++ == 0) {
            throw std::runtime_error("socket backend crashed");
        }
        return scripted(url, timeout);
    };
    Driver driver(config, crashing_once);

    auto first = driver.connect(info);
    ASSERT_EQ(first.wait_for(3s), std::future_status::ready);
    EXPECT_THROW(first.get(), std::runtime_error);

    driver.mute(true);
    auto second = driver.connect(info);
    ASSERT_EQ(second.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(second.get());
    EXPECT_TRUE(driver.is_mute());
    EXPECT_EQ(server->sent_events(VoiceOpcode::IDENTIFY).size(), 1u);
}
