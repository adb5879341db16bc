#include <gtest/gtest.h>
#include <peerlink/signaling/signaling_channel.hpp>

#include "../fakes/fake_transport.hpp"

#include <string>
#include <vector>

namespace peerlink::signaling::test {

using peerlink::test::CloseMode;
using peerlink::test::FakeTransport;

class SignalingChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeTransport>(loop_);
        channel_ = std::make_unique<SignalingChannel>(transport_);
        channel_->setMessageCallback([this](const SignalingMessage& message) {
            received_.push_back(messageType(message));
        });
        channel_->setProtocolErrorCallback([this](const core::Error& error) {
            errors_.push_back(error.code());
        });
    }

    void openChannel() {
        bool opened = false;
        channel_->setOpenCallback([&] { opened = true; });
        channel_->open("wss://signaling.example.com/signaling");
        loop_.processAll();
        ASSERT_TRUE(opened);
    }

    core::EventLoop loop_;
    std::shared_ptr<FakeTransport> transport_;
    std::unique_ptr<SignalingChannel> channel_;
    std::vector<std::string> received_;
    std::vector<core::ErrorCode> errors_;
};

TEST_F(SignalingChannelTest, NullTransportRejected) {
    EXPECT_THROW(SignalingChannel(nullptr), core::Error);
}

TEST_F(SignalingChannelTest, OpenAndSend) {
    openChannel();
    EXPECT_EQ(transport_->url(), "wss://signaling.example.com/signaling");
    EXPECT_EQ(channel_->readyState(), ReadyState::Open);

    ASSERT_TRUE(channel_->send(PingMessage{}).is_ok());
    ASSERT_EQ(transport_->sentText().size(), 1u);
    EXPECT_EQ(transport_->sent()[0]["type"], "ping");
    EXPECT_EQ(channel_->stats().messages_sent, 1u);
}

TEST_F(SignalingChannelTest, SendBeforeOpenFails) {
    channel_->open("wss://signaling.example.com/signaling");
    auto result = channel_->send(PongMessage{});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidState);
    EXPECT_TRUE(transport_->sentText().empty());
}

TEST_F(SignalingChannelTest, TransportSendFailure) {
    openChannel();
    transport_->throw_on_send = true;
    auto result = channel_->send(PongMessage{});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::SignalingTransportError);
}

TEST_F(SignalingChannelTest, MessagesDeliveredInOrder) {
    openChannel();
    transport_->simulateMessage({{"type", "ping"}});
    transport_->simulateMessage({{"type", "offer"}, {"sdp", "v=0"}});
    transport_->simulateMessage({{"type", "close"}});

    EXPECT_EQ(received_, (std::vector<std::string>{"ping", "offer", "close"}));
    EXPECT_EQ(channel_->stats().messages_received, 3u);
}

TEST_F(SignalingChannelTest, MalformedMessageReported) {
    openChannel();
    transport_->simulateText("{broken");

    EXPECT_TRUE(received_.empty());
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], core::ErrorCode::ProtocolError);
    EXPECT_EQ(channel_->stats().protocol_errors, 1u);
}

TEST_F(SignalingChannelTest, BinaryFramesIgnored) {
    openChannel();
    transport_->simulateBinary({1, 2, 3});
    EXPECT_TRUE(received_.empty());
    EXPECT_TRUE(errors_.empty());
}

TEST_F(SignalingChannelTest, ErrorAndCloseCallbacks) {
    std::string error;
    bool closed = false;
    channel_->setErrorCallback([&](const std::string& e) { error = e; });
    channel_->setCloseCallback([&] { closed = true; });

    openChannel();
    transport_->simulateError("reset by peer");
    transport_->simulateRemoteClose();

    EXPECT_EQ(error, "reset by peer");
    EXPECT_TRUE(closed);
    EXPECT_EQ(channel_->readyState(), ReadyState::Closed);
}

TEST_F(SignalingChannelTest, CloseDetachesCallbacksFirst) {
    bool closed = false;
    channel_->setCloseCallback([&] { closed = true; });
    openChannel();

    channel_->close();
    loop_.processAll();

    EXPECT_EQ(transport_->closeCalls(), 1);
    EXPECT_EQ(channel_->readyState(), ReadyState::Closed);
    EXPECT_FALSE(closed);

    transport_->simulateMessage({{"type", "ping"}});
    EXPECT_TRUE(received_.empty());

    auto result = channel_->send(PingMessage{});
    EXPECT_TRUE(result.is_error());
}

TEST_F(SignalingChannelTest, CloseIsIdempotent) {
    openChannel();
    transport_->close_mode = CloseMode::Never;

    channel_->close();
    channel_->close();

    EXPECT_EQ(transport_->closeCalls(), 1);
    EXPECT_EQ(channel_->readyState(), ReadyState::Closing);
}

TEST_F(SignalingChannelTest, DestructionDetachesTransport) {
    openChannel();
    channel_.reset();
    EXPECT_FALSE(static_cast<bool>(transport_->onText));
    EXPECT_NO_THROW(transport_->simulateMessage({{"type", "ping"}}));
}

} // namespace peerlink::signaling::test
