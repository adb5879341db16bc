#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <peerlink/core/event.hpp>
#include <peerlink/signaling/signaling_channel.hpp>

namespace peerlink::test {

enum class CloseMode {
    Immediate,  // closed before close() returns
    Deferred,   // closed on the next loop turn
    Never       // stays in Closing
};

// Call a copy so the callback may replace or clear itself
template<typename Callback, typename... Args>
void fire(const Callback& callback, Args&&... args) {
    auto copy = callback;
    if (copy) copy(std::forward<Args>(args)...);
}

// In-memory signaling socket driven by the test
class FakeTransport : public signaling::SignalingTransport,
                      public std::enable_shared_from_this<FakeTransport> {
public:
    explicit FakeTransport(core::EventLoop& loop) : loop_(loop) {}

    void open(const std::string& url) override {
        url_ = url;
        state_ = signaling::ReadyState::Connecting;
        if (auto_open) {
            std::weak_ptr<FakeTransport> weak = weak_from_this();
            loop_.post([weak]() {
                if (auto self = weak.lock()) self->simulateOpen();
            });
        }
    }

    void send(const std::string& text) override {
        if (throw_on_send) {
            throw std::runtime_error("socket write failed");
        }
        sent_.push_back(text);
    }

    void close() override {
        ++close_calls_;
        state_ = signaling::ReadyState::Closing;

        switch (close_mode) {
            case CloseMode::Immediate:
                state_ = signaling::ReadyState::Closed;
                postCloseEvent();
                break;
            case CloseMode::Deferred: {
                std::weak_ptr<FakeTransport> weak = weak_from_this();
                loop_.post([weak]() {
                    if (auto self = weak.lock()) {
                        self->state_ = signaling::ReadyState::Closed;
                        fire(self->onClose);
                    }
                });
                break;
            }
            case CloseMode::Never:
                break;
        }
    }

    signaling::ReadyState readyState() const override { return state_; }

    // Server side
    void simulateOpen() {
        state_ = signaling::ReadyState::Open;
        fire(onOpen);
    }

    void simulateText(const std::string& text) { fire(onText, text); }
    void simulateMessage(const nlohmann::json& message) { simulateText(message.dump()); }
    void simulateBinary(const std::vector<std::uint8_t>& data) { fire(onBinary, data); }
    void simulateError(const std::string& error) { fire(onError, error); }

    void simulateRemoteClose() {
        state_ = signaling::ReadyState::Closed;
        fire(onClose);
    }

    // Inspection
    const std::string& url() const { return url_; }
    const std::vector<std::string>& sentText() const { return sent_; }
    int closeCalls() const { return close_calls_; }

    std::vector<nlohmann::json> sent() const {
        std::vector<nlohmann::json> messages;
        for (const auto& text : sent_) {
            messages.push_back(nlohmann::json::parse(text));
        }
        return messages;
    }

    std::vector<nlohmann::json> sentOfType(const std::string& type) const {
        std::vector<nlohmann::json> messages;
        for (const auto& message : sent()) {
            if (message.value("type", "") == type) messages.push_back(message);
        }
        return messages;
    }

    std::size_t countSent(const std::string& type) const { return sentOfType(type).size(); }

    bool auto_open = true;
    bool throw_on_send = false;
    CloseMode close_mode = CloseMode::Immediate;

private:
    void postCloseEvent() {
        std::weak_ptr<FakeTransport> weak = weak_from_this();
        loop_.post([weak]() {
            if (auto self = weak.lock()) fire(self->onClose);
        });
    }

    core::EventLoop& loop_;
    std::string url_;
    signaling::ReadyState state_ = signaling::ReadyState::Closed;
    std::vector<std::string> sent_;
    int close_calls_ = 0;
};

} // namespace peerlink::test
