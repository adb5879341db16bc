#include <peerlink/core/wait.hpp>
#include <peerlink/core/logger.hpp>

namespace peerlink::core {

const char* toString(WaitOutcome outcome) {
    switch (outcome) {
        case WaitOutcome::Completed: return "completed";
        case WaitOutcome::TimedOut:  return "timed out";
        case WaitOutcome::Lost:      return "lost";
        case WaitOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::shared_ptr<BoundedWait> BoundedWait::start(EventLoop& loop,
                                                WaitPolicy policy,
                                                Probe probe,
                                                Completion completion) {
    auto wait = std::make_shared<BoundedWait>(loop, policy, std::move(probe), std::move(completion));
    wait->poll();
    return wait;
}

BoundedWait::BoundedWait(EventLoop& loop, WaitPolicy policy, Probe probe, Completion completion)
    : loop_(loop)
    , policy_(policy)
    , probe_(std::move(probe))
    , completion_(std::move(completion)) {}

void BoundedWait::cancel() {
    if (finished_) return;
    if (timer_ != 0) {
        loop_.cancel(timer_);
        timer_ = 0;
    }
    finish(WaitOutcome::Cancelled);
}

void BoundedWait::poll() {
    if (finished_) return;
    timer_ = 0;

    WaitStatus status = WaitStatus::Lost;
    try {
        status = probe_ ? probe_() : WaitStatus::Lost;
    }
    catch (const std::exception& e) {
        Logger::warn("Wait probe failed: {}", e.what());
        status = WaitStatus::Lost;
    }

    switch (status) {
        case WaitStatus::Done:
            finish(WaitOutcome::Completed);
            return;
        case WaitStatus::Lost:
            finish(WaitOutcome::Lost);
            return;
        case WaitStatus::Pending:
            break;
    }

    if (attempts_ >= policy_.max_attempts) {
        finish(WaitOutcome::TimedOut);
        return;
    }
    schedule();
}

void BoundedWait::schedule() {
    ++attempts_;
    std::weak_ptr<BoundedWait> weak = weak_from_this();
    timer_ = loop_.postDelayed(policy_.interval, [weak]() {
        if (auto self = weak.lock()) {
            self->poll();
        }
    });
}

void BoundedWait::finish(WaitOutcome outcome) {
    finished_ = true;
    probe_ = nullptr;
    auto completion = std::move(completion_);
    completion_ = nullptr;
    if (completion) {
        completion(outcome);
    }
}

} // namespace peerlink::core
