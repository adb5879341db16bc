#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include <peerlink/core/event.hpp>

namespace peerlink::core {

// What a probe observed on one poll
enum class WaitStatus {
    Pending,
    Done,
    Lost    // the polled handle no longer exists
};

enum class WaitOutcome {
    Completed,
    TimedOut,
    Lost,
    Cancelled
};

const char* toString(WaitOutcome outcome);

struct WaitPolicy {
    std::chrono::milliseconds interval{800};
    std::size_t max_attempts = 10;
};

// Polls a probe on the event loop at a fixed interval until it reports Done
// or Lost, or the attempt budget runs out. The first probe runs inside
// start(); if it already settles the wait, the completion fires before
// start() returns.
class BoundedWait : public std::enable_shared_from_this<BoundedWait> {
public:
    using Probe = std::function<WaitStatus()>;
    using Completion = std::function<void(WaitOutcome)>;

    static std::shared_ptr<BoundedWait> start(EventLoop& loop,
                                              WaitPolicy policy,
                                              Probe probe,
                                              Completion completion);

    BoundedWait(EventLoop& loop, WaitPolicy policy, Probe probe, Completion completion);

    // Stops polling. The completion receives Cancelled.
    void cancel();

    bool finished() const noexcept { return finished_; }
    std::size_t attempts() const noexcept { return attempts_; }

private:
    void poll();
    void schedule();
    void finish(WaitOutcome outcome);

    EventLoop& loop_;
    WaitPolicy policy_;
    Probe probe_;
    Completion completion_;
    TimerId timer_ = 0;
    std::size_t attempts_ = 0;
    bool finished_ = false;
};

} // namespace peerlink::core
