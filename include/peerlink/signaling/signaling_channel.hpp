#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/signaling/message.hpp>

namespace peerlink::signaling {

enum class ReadyState {
    Connecting,
    Open,
    Closing,
    Closed
};

const char* toString(ReadyState state);

// Message-oriented socket to the signaling server (a WebSocket in practice).
// Callbacks run on the event loop thread.
class SignalingTransport {
public:
    virtual ~SignalingTransport() = default;

    virtual void open(const std::string& url) = 0;
    virtual void send(const std::string& text) = 0;
    virtual void close() = 0;
    virtual ReadyState readyState() const = 0;

    void detach() {
        onOpen = nullptr;
        onText = nullptr;
        onBinary = nullptr;
        onError = nullptr;
        onClose = nullptr;
    }

    // Events
    std::function<void()> onOpen;
    std::function<void(const std::string&)> onText;
    std::function<void(const std::vector<std::uint8_t>&)> onBinary;
    std::function<void(const std::string&)> onError;
    std::function<void()> onClose;
};

using SignalingTransportFactory = std::function<std::shared_ptr<SignalingTransport>()>;

// Ordered, reliable conduit for SignalingMessage values on top of a
// transport. Inbound text frames are decoded and delivered in arrival order;
// binary frames are not part of the protocol and are dropped.
class SignalingChannel {
public:
    using OpenCallback = std::function<void()>;
    using MessageCallback = std::function<void(const SignalingMessage&)>;
    using ProtocolErrorCallback = std::function<void(const core::Error&)>;
    using ErrorCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void()>;

    explicit SignalingChannel(std::shared_ptr<SignalingTransport> transport);
    ~SignalingChannel();

    SignalingChannel(const SignalingChannel&) = delete;
    SignalingChannel& operator=(const SignalingChannel&) = delete;

    void open(const std::string& url);

    // Fails with InvalidState unless the transport is open.
    core::Result<void> send(const SignalingMessage& message);

    // Drops every callback, then closes the transport. Poll readyState()
    // to learn when the transport has actually closed.
    void close();

    ReadyState readyState() const;

    void setOpenCallback(OpenCallback callback) { open_callback_ = std::move(callback); }
    void setMessageCallback(MessageCallback callback) { message_callback_ = std::move(callback); }
    void setProtocolErrorCallback(ProtocolErrorCallback callback) { protocol_error_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }
    void setCloseCallback(CloseCallback callback) { close_callback_ = std::move(callback); }

    void clearCallbacks();

    // Statistics
    struct Stats {
        uint64_t messages_sent = 0;
        uint64_t messages_received = 0;
        uint64_t protocol_errors = 0;
    };

    const Stats& stats() const { return stats_; }

private:
    void onTransportText(const std::string& text);

    std::shared_ptr<SignalingTransport> transport_;
    bool closed_ = false;

    OpenCallback open_callback_;
    MessageCallback message_callback_;
    ProtocolErrorCallback protocol_error_callback_;
    ErrorCallback error_callback_;
    CloseCallback close_callback_;

    Stats stats_;
};

} // namespace peerlink::signaling
