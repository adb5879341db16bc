#include <gtest/gtest.h>
#include <peerlink/connection/data_channel_registry.hpp>

#include "../fakes/fake_engine.hpp"

#include <string>
#include <vector>

namespace peerlink::connection::test {

using engine::DataChannelState;
using peerlink::test::FakeEngine;

class DataChannelRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<FakeEngine>(loop_, engine::EngineConfiguration{});
        registry_.setMessageHandler([this](const std::string& label, const engine::DataPayload& payload) {
            received_.emplace_back(label, payload);
        });
    }

    core::EventLoop loop_;
    std::shared_ptr<FakeEngine> engine_;
    DataChannelRegistry registry_;
    std::vector<std::pair<std::string, engine::DataPayload>> received_;
};

TEST_F(DataChannelRegistryTest, OpenWithoutEngine) {
    auto result = registry_.open(nullptr, "chat");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::EngineNotReady);
    EXPECT_TRUE(registry_.empty());
}

TEST_F(DataChannelRegistryTest, OpenRegistersConnectingChannel) {
    ASSERT_TRUE(registry_.open(engine_.get(), "chat").is_ok());

    EXPECT_TRUE(registry_.contains("chat"));
    EXPECT_EQ(registry_.state("chat"), DataChannelState::Connecting);
    EXPECT_EQ(registry_.labels(), std::vector<std::string>{"chat"});

    auto duplicate = registry_.open(engine_.get(), "chat");
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code(), core::ErrorCode::ChannelAlreadyExists);
    EXPECT_EQ(engine_->channels().size(), 1u);
}

TEST_F(DataChannelRegistryTest, EngineFailureReported) {
    engine_->fail_create_channel = true;
    auto result = registry_.open(engine_.get(), "chat");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidState);
    EXPECT_FALSE(registry_.contains("chat"));
}

TEST_F(DataChannelRegistryTest, SendRequiresOpenChannel) {
    ASSERT_TRUE(registry_.open(engine_.get(), "chat").is_ok());

    auto early = registry_.send("chat", std::string("hello"));
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().code(), core::ErrorCode::ChannelNotOpen);

    auto unknown = registry_.send("other", std::string("hello"));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code(), core::ErrorCode::ChannelNotOpen);

    auto channel = engine_->channel("chat");
    channel->simulateOpen();
    EXPECT_EQ(registry_.state("chat"), DataChannelState::Open);

    ASSERT_TRUE(registry_.send("chat", std::string("hello")).is_ok());
    ASSERT_TRUE(registry_.send("chat", std::vector<std::uint8_t>{1, 2}).is_ok());
    ASSERT_EQ(channel->sent().size(), 2u);
    EXPECT_EQ(std::get<std::string>(channel->sent()[0]), "hello");
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(channel->sent()[1]).size(), 2u);
}

TEST_F(DataChannelRegistryTest, MessagesCarryLabel) {
    ASSERT_TRUE(registry_.open(engine_.get(), "chat").is_ok());
    engine_->channel("chat")->simulateMessage(std::string("hi"));

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].first, "chat");
    EXPECT_EQ(std::get<std::string>(received_[0].second), "hi");
}

TEST_F(DataChannelRegistryTest, CloseAndErrorRemoveEntry) {
    ASSERT_TRUE(registry_.open(engine_.get(), "a").is_ok());
    ASSERT_TRUE(registry_.open(engine_.get(), "b").is_ok());

    engine_->channel("a")->simulateClose();
    engine_->channel("b")->simulateError("sctp failure");

    EXPECT_TRUE(registry_.empty());
}

TEST_F(DataChannelRegistryTest, AdoptReplacesStaleEntry) {
    ASSERT_TRUE(registry_.open(engine_.get(), "chat").is_ok());
    auto stale = engine_->channel("chat");

    auto remote = std::make_shared<peerlink::test::FakeDataChannel>(loop_, "chat");
    registry_.adopt(remote);
    EXPECT_EQ(registry_.size(), 1u);

    // Events of the replaced handle no longer touch the entry
    stale->simulateClose();
    EXPECT_TRUE(registry_.contains("chat"));

    remote->simulateOpen();
    ASSERT_TRUE(registry_.send("chat", std::string("x")).is_ok());
    EXPECT_EQ(remote->sent().size(), 1u);
}

TEST_F(DataChannelRegistryTest, AdoptIgnoresUnlabeledChannel) {
    registry_.adopt(std::make_shared<peerlink::test::FakeDataChannel>(loop_, ""));
    registry_.adopt(nullptr);
    EXPECT_TRUE(registry_.empty());
}

TEST_F(DataChannelRegistryTest, CloseAllEmptiesRegistry) {
    ASSERT_TRUE(registry_.open(engine_.get(), "a").is_ok());
    ASSERT_TRUE(registry_.open(engine_.get(), "b").is_ok());
    engine_->channel("a")->simulateOpen();

    registry_.closeAll();
    loop_.processAll();

    EXPECT_TRUE(registry_.empty());
    EXPECT_EQ(engine_->channel("a")->closeCalls(), 1);
    EXPECT_EQ(engine_->channel("b")->closeCalls(), 1);
    EXPECT_EQ(engine_->channel("a")->state(), DataChannelState::Closed);
}

} // namespace peerlink::connection::test
