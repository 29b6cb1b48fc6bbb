#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include "connection/connection.h"
#include "gateway/close_code.h"
#include "mocks/mock_network.h"

using namespace voicelink::voice;
using voicelink::voice::testing::LoopbackVoiceServer;
using voicelink::voice::testing::ScriptedGatewayServer;
using voicelink::voice::testing::make_scripted_factory;
using namespace std::chrono_literals;

TEST(GenerateUrlTest, StripsDefaultPort) {
    EXPECT_EQ(generate_url("eu-west123.discord.media:80"), "wss://eu-west123.discord.media/?v=4");
    EXPECT_EQ(generate_url("eu-west123.discord.media"), "wss://eu-west123.discord.media/?v=4");
    EXPECT_EQ(generate_url("voice.test:443"), "wss://voice.test:443/?v=4");
}

TEST(GenerateUrlTest, RejectsInvalidEndpoints) {
    for (const std::string endpoint : {"", ":80", "bad host", "voice/path", ".voice"}) {
        try {
            generate_url(endpoint);
            FAIL() << "accepted '" << endpoint << "'";
        } catch (const ConnectionError& e) {
            EXPECT_EQ(e.kind(), ConnectionErrorKind::ENDPOINT_URL);
        }
    }
}

TEST(ConnectionConstructionTest, OnlyConnectBuildsConnections) {
    static_assert(!std::is_constructible<Connection, ConnectionInfo, const DriverConfig&, uint64_t>::value,
                  "connections are built by Connection::connect");
    static_assert(!std::is_copy_constructible<Connection>::value, "connections are unique");
    SUCCEED();
}

TEST(CloseCodeTest, ClosureActionPolicy) {
    EXPECT_EQ(closure_action(4009), ClosureAction::RESUME);
    EXPECT_EQ(closure_action(4015), ClosureAction::RESUME);
    EXPECT_EQ(closure_action(4006), ClosureAction::RESUME);
    EXPECT_EQ(closure_action(1006), ClosureAction::RESUME);
    EXPECT_EQ(closure_action(WS_CLOSE_NORMAL), ClosureAction::RECONNECT);
    EXPECT_EQ(closure_action(4014), ClosureAction::GIVE_UP);
}

TEST(CloseCodeTest, MissingCodeResumes) {
    EXPECT_EQ(closure_action(std::nullopt), ClosureAction::RESUME);
}

TEST(CloseCodeTest, KnownCodes) {
    ASSERT_TRUE(close_code_from_u16(4015).has_value());
    EXPECT_EQ(*close_code_from_u16(4015), CloseCode::VOICE_SERVER_CRASH);
    EXPECT_FALSE(close_code_from_u16(4007).has_value());
    EXPECT_FALSE(close_code_from_u16(1000).has_value());
}

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<ScriptedGatewayServer>();
        factory = make_scripted_factory(server);
        voice_server = std::make_unique<LoopbackVoiceServer>("203.0.113.7", 50000);

        interconnect.core = std::make_shared<CoreQueue>();
        interconnect.events = std::make_shared<EventQueue>();
        interconnect.mixer = std::make_shared<MixerQueue>();

        info.endpoint = "voice.test";
        info.guild_id = 41771983423143937ULL;
        info.user_id = 104694319306248192ULL;
        info.session_id = "my_session_id";
        info.token = "my_token";

        config.crypto_mode = CryptoMode::SUFFIX;
        config.handshake_timeout = 2000ms;

        ready.ssrc = 321;
        ready.ip = "127.0.0.1";
        ready.port = voice_server->port();
        ready.modes = {"xsalsa20_poly1305", "xsalsa20_poly1305_suffix", "xsalsa20_poly1305_lite"};
        description.mode = "xsalsa20_poly1305_suffix";
        description.secret_key.assign(CRYPTO_KEY_SIZE, 9);
    }

    // A well-behaved voice gateway.
    void script_handshake() {
        server->set_responder([this](const GatewayEvent& sent) {
            std::vector<GatewayEvent> replies;
            switch (sent.op) {
                case VoiceOpcode::IDENTIFY:
                    replies.push_back(GatewayEvent::make(Hello{41250.0}));
                    replies.push_back(GatewayEvent::make(ready));
                    break;
                case VoiceOpcode::SELECT_PROTOCOL:
                    replies.push_back(GatewayEvent::make(description));
                    break;
                case VoiceOpcode::RESUME:
                    replies.push_back(GatewayEvent::make_resumed());
                    replies.push_back(GatewayEvent::make(Hello{41250.0}));
                    break;
                default:
                    break;
            }
            return replies;
        });
    }

    ConnectionErrorKind expect_failure() {
        try {
            Connection::connect(info, interconnect, config, factory, 1);
        } catch (const ConnectionError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "handshake unexpectedly succeeded";
        return ConnectionErrorKind::CHANNEL_CLOSED;
    }

    std::shared_ptr<ScriptedGatewayServer> server;
    GatewaySocketFactory factory;
    std::unique_ptr<LoopbackVoiceServer> voice_server;
    Interconnect interconnect;
    ConnectionInfo info;
    DriverConfig config;
    Ready ready;
    SessionDescription description;
};

TEST_F(ConnectionTest, HandshakeHappyPath) {
    script_handshake();
    auto conn = Connection::connect(info, interconnect, config, factory, 17);
    ASSERT_TRUE(conn);
    EXPECT_EQ(conn->ssrc(), 321u);
    EXPECT_EQ(conn->crypto_mode(), CryptoMode::SUFFIX);
    EXPECT_EQ(conn->id(), 17u);

    ASSERT_EQ(server->opened_urls().size(), 1u);
    EXPECT_EQ(server->opened_urls()[0], "wss://voice.test/?v=4");

    auto identify = server->sent_events(VoiceOpcode::IDENTIFY);
    ASSERT_EQ(identify.size(), 1u);
    EXPECT_EQ(identify[0].identify.server_id, info.guild_id);
    EXPECT_EQ(identify[0].identify.session_id, "my_session_id");

    auto select = server->sent_events(VoiceOpcode::SELECT_PROTOCOL);
    ASSERT_EQ(select.size(), 1u);
    EXPECT_EQ(select[0].select_protocol.data.address, "203.0.113.7");
    EXPECT_EQ(select[0].select_protocol.data.port, 50000);
    EXPECT_EQ(select[0].select_protocol.data.mode, "xsalsa20_poly1305_suffix");
    EXPECT_EQ(voice_server->discovery_requests(), 1u);

    MixerMessage msg;
    ASSERT_TRUE(interconnect.mixer->try_pop(msg));
    EXPECT_EQ(msg.type, MixerMessage::Type::WS);
    EXPECT_TRUE(msg.ws);
    ASSERT_TRUE(interconnect.mixer->try_pop(msg));
    ASSERT_EQ(msg.type, MixerMessage::Type::SET_CONN);
    EXPECT_EQ(msg.connection.ssrc, 321u);
    EXPECT_EQ(msg.connection.crypto_mode, CryptoMode::SUFFIX);
    EXPECT_TRUE(msg.connection.cipher);
    EXPECT_TRUE(msg.connection.udp_tx);
}

TEST_F(ConnectionTest, ResumeReplacesGatewaySocket) {
    script_handshake();
    auto conn = Connection::connect(info, interconnect, config, factory, 3);
    conn->resume(factory);

    EXPECT_EQ(server->opened_urls().size(), 2u);
    auto resume = server->sent_events(VoiceOpcode::RESUME);
    ASSERT_EQ(resume.size(), 1u);
    EXPECT_EQ(resume[0].resume.server_id, info.guild_id);
    EXPECT_EQ(resume[0].resume.session_id, "my_session_id");
    EXPECT_EQ(resume[0].resume.token, "my_token");
}

TEST_F(ConnectionTest, UnexpectedFrameDuringReadyFails) {
    server->set_responder([this](const GatewayEvent& sent) {
        std::vector<GatewayEvent> replies;
        if (sent.op == VoiceOpcode::IDENTIFY) {
            replies.push_back(GatewayEvent::make(description));
        }
        return replies;
    });
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::HANDSHAKE_EXPECTED_FRAME);
}

TEST_F(ConnectionTest, MissingCryptoModeFails) {
    ready.modes = {"xsalsa20_poly1305_lite"};
    script_handshake();
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::CRYPTO_MODE_UNAVAILABLE);
    EXPECT_TRUE(server->sent_events(VoiceOpcode::SELECT_PROTOCOL).empty());
}

TEST_F(ConnectionTest, MismatchedSessionModeFails) {
    description.mode = "xsalsa20_poly1305";
    script_handshake();
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::CRYPTO_MODE_INVALID);
}

TEST_F(ConnectionTest, ShortSecretKeyFails) {
    description.secret_key.assign(16, 1);
    script_handshake();
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::CRYPTO_KEY_INVALID);
}

TEST_F(ConnectionTest, SilentGatewayTimesOut) {
    config.handshake_timeout = 100ms;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::HANDSHAKE_TIMEOUT);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(ConnectionTest, UnansweredDiscoveryTimesOut) {
    config.handshake_timeout = 200ms;
    voice_server->set_answer_discovery(false);
    script_handshake();
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::HANDSHAKE_TIMEOUT);
    EXPECT_EQ(voice_server->discovery_requests(), 1u);
}

TEST_F(ConnectionTest, GatewayUnreachableFails) {
    server->set_fail_open(true);
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::WEBSOCKET);
}

TEST_F(ConnectionTest, IdentifySendFailureFails) {
    server->set_fail_send(true);
    EXPECT_EQ(expect_failure(), ConnectionErrorKind::WEBSOCKET);
}
