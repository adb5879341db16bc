#include <gtest/gtest.h>
#include <peerlink/core/wait.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>

using namespace std::chrono_literals;

namespace peerlink::core::test {

class BoundedWaitTest : public ::testing::Test {
protected:
    WaitPolicy policy_{800ms, 10};
    EventLoop loop_;
    std::optional<WaitOutcome> outcome_;

    BoundedWait::Completion record() {
        return [this](WaitOutcome outcome) { outcome_ = outcome; };
    }
};

TEST_F(BoundedWaitTest, CompletesImmediatelyWhenAlreadyDone) {
    auto wait = BoundedWait::start(loop_, policy_, [] { return WaitStatus::Done; }, record());

    ASSERT_TRUE(outcome_.has_value());
    EXPECT_EQ(*outcome_, WaitOutcome::Completed);
    EXPECT_TRUE(wait->finished());
    EXPECT_EQ(loop_.pendingTimers(), 0u);
}

TEST_F(BoundedWaitTest, PollsAtInterval) {
    bool done = false;
    auto wait = BoundedWait::start(loop_, policy_, [&] {
        return done ? WaitStatus::Done : WaitStatus::Pending;
    }, record());

    loop_.advance(800ms);
    EXPECT_FALSE(outcome_.has_value());

    done = true;
    loop_.advance(400ms);
    EXPECT_FALSE(outcome_.has_value());

    loop_.advance(400ms);
    ASSERT_TRUE(outcome_.has_value());
    EXPECT_EQ(*outcome_, WaitOutcome::Completed);
    EXPECT_EQ(wait->attempts(), 2u);
}

TEST_F(BoundedWaitTest, TimesOutAfterAttemptBudget) {
    int probes = 0;
    auto wait = BoundedWait::start(loop_, policy_, [&] {
        probes++;
        return WaitStatus::Pending;
    }, record());

    for (int i = 0; i < 9; ++i) {
        loop_.advance(800ms);
    }
    EXPECT_FALSE(outcome_.has_value());

    loop_.advance(800ms);
    ASSERT_TRUE(outcome_.has_value());
    EXPECT_EQ(*outcome_, WaitOutcome::TimedOut);
    EXPECT_EQ(probes, 11);
    EXPECT_EQ(loop_.pendingTimers(), 0u);
}

TEST_F(BoundedWaitTest, LostHandleEndsWait) {
    auto wait = BoundedWait::start(loop_, policy_, [] { return WaitStatus::Lost; }, record());
    ASSERT_TRUE(outcome_.has_value());
    EXPECT_EQ(*outcome_, WaitOutcome::Lost);
}

TEST_F(BoundedWaitTest, ThrowingProbeCountsAsLost) {
    auto wait = BoundedWait::start(loop_, policy_, []() -> WaitStatus {
        throw std::runtime_error("handle gone");
    }, record());
    ASSERT_TRUE(outcome_.has_value());
    EXPECT_EQ(*outcome_, WaitOutcome::Lost);
}

TEST_F(BoundedWaitTest, CancelStopsPolling) {
    int probes = 0;
    auto wait = BoundedWait::start(loop_, policy_, [&] {
        probes++;
        return WaitStatus::Pending;
    }, record());

    wait->cancel();
    ASSERT_TRUE(outcome_.has_value());
    EXPECT_EQ(*outcome_, WaitOutcome::Cancelled);

    loop_.advance(800ms);
    EXPECT_EQ(probes, 1);
    EXPECT_EQ(loop_.pendingTimers(), 0u);
}

TEST_F(BoundedWaitTest, DroppedWaitStopsQuietly) {
    int probes = 0;
    {
        auto wait = BoundedWait::start(loop_, policy_, [&] {
            probes++;
            return WaitStatus::Pending;
        }, record());
    }

    loop_.advance(800ms);
    EXPECT_EQ(probes, 1);
    EXPECT_FALSE(outcome_.has_value());
}

TEST(WaitOutcomeTest, Names) {
    EXPECT_STREQ(toString(WaitOutcome::TimedOut), "timed out");
    EXPECT_STREQ(toString(WaitOutcome::Completed), "completed");
}

} // namespace peerlink::core::test
