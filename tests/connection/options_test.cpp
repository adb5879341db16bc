#include <gtest/gtest.h>
#include <peerlink/connection/options.hpp>

#include <algorithm>
#include <cctype>

using namespace std::chrono_literals;

namespace peerlink::connection::test {

TEST(ConnectionOptionsTest, Defaults) {
    auto options = defaultOptions();

    EXPECT_EQ(options.audio.direction, engine::Direction::SendRecv);
    EXPECT_TRUE(options.audio.enabled);
    EXPECT_EQ(options.video.direction, engine::Direction::SendRecv);
    EXPECT_TRUE(options.video.enabled);
    EXPECT_FALSE(options.video.codec.has_value());
    EXPECT_FALSE(options.signaling_key.has_value());

    ASSERT_EQ(options.ice_servers.size(), 1u);
    ASSERT_EQ(options.ice_servers[0].urls.size(), 1u);
    EXPECT_EQ(options.ice_servers[0].urls[0], "stun:stun.l.google.com:19302");

    EXPECT_EQ(options.close_poll_interval, 800ms);
    EXPECT_EQ(options.close_poll_attempts, 10u);
}

TEST(ConnectionOptionsTest, GeneratedClientId) {
    auto id = generateClientId();
    EXPECT_EQ(id.size(), 17u);
    EXPECT_TRUE(std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isalnum(c); }));

    EXPECT_EQ(generateClientId(8).size(), 8u);
    EXPECT_NE(defaultOptions().client_id, defaultOptions().client_id);
}

TEST(ConnectionOptionsTest, FromConfig) {
    auto config = core::Config::fromString(R"({
        "clientId": "client-42",
        "signalingKey": "secret",
        "iceServers": [{"urls": ["turn:turn.example.com:3478"], "username": "u", "credential": "p"}],
        "audio": {"direction": "sendonly"},
        "video": {"enabled": false, "codec": "VP9"},
        "closePollIntervalMs": 100,
        "closePollAttempts": 3
    })");
    ASSERT_TRUE(config.is_ok());

    auto options = optionsFromConfig(config.value());
    ASSERT_TRUE(options.is_ok()) << options.error().what();

    const auto& o = options.value();
    EXPECT_EQ(o.client_id, "client-42");
    EXPECT_EQ(o.signaling_key, "secret");
    ASSERT_EQ(o.ice_servers.size(), 1u);
    EXPECT_EQ(o.ice_servers[0].urls[0], "turn:turn.example.com:3478");
    EXPECT_EQ(o.ice_servers[0].credential, "p");
    EXPECT_EQ(o.audio.direction, engine::Direction::SendOnly);
    EXPECT_TRUE(o.audio.enabled);
    EXPECT_FALSE(o.video.enabled);
    EXPECT_EQ(o.video.codec, engine::VideoCodec::VP9);
    EXPECT_EQ(o.close_poll_interval, 100ms);
    EXPECT_EQ(o.close_poll_attempts, 3u);
}

TEST(ConnectionOptionsTest, EmptyConfigKeepsDefaults) {
    auto options = optionsFromConfig(core::Config());
    ASSERT_TRUE(options.is_ok());
    EXPECT_EQ(options.value().client_id.size(), 17u);
    EXPECT_EQ(options.value().ice_servers.size(), 1u);
}

TEST(ConnectionOptionsTest, InvalidValues) {
    const char* documents[] = {
        R"({"clientId": ""})",
        R"({"clientId": 7})",
        R"({"iceServers": {"urls": "stun:x"}})",
        R"({"iceServers": [{"username": "u"}]})",
        R"({"audio": {"direction": "inactive"}})",
        R"({"video": {"enabled": "yes"}})",
        R"({"video": {"codec": "AV1"}})",
        R"({"closePollIntervalMs": 0})",
        R"({"closePollAttempts": -1})",
    };

    for (const char* document : documents) {
        auto config = core::Config::fromString(document);
        ASSERT_TRUE(config.is_ok()) << document;

        auto options = optionsFromConfig(config.value());
        ASSERT_TRUE(options.is_error()) << document;
        EXPECT_EQ(options.error().code(), core::ErrorCode::InvalidData) << document;
    }
}

} // namespace peerlink::connection::test
