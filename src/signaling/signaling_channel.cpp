#include "peerlink/signaling/signaling_channel.hpp"
#include "peerlink/core/logger.hpp"

namespace peerlink::signaling {

const char* toString(ReadyState state) {
    switch (state) {
        case ReadyState::Connecting: return "connecting";
        case ReadyState::Open: return "open";
        case ReadyState::Closing: return "closing";
        case ReadyState::Closed: return "closed";
    }
    return "unknown";
}

SignalingChannel::SignalingChannel(std::shared_ptr<SignalingTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        core::throw_error(core::ErrorCode::InvalidArgument, "Signaling transport is null");
    }

    transport_->onOpen = [this]() {
        auto callback = open_callback_;
        if (callback) callback();
    };

    transport_->onText = [this](const std::string& text) {
        onTransportText(text);
    };

    transport_->onBinary = [](const std::vector<std::uint8_t>& data) {
        core::Logger::debug("Ignoring binary signaling frame ({} bytes)", data.size());
    };

    transport_->onError = [this](const std::string& error) {
        core::Logger::warn("Signaling transport error: {}", error);
        auto callback = error_callback_;
        if (callback) callback(error);
    };

    transport_->onClose = [this]() {
        auto callback = close_callback_;
        if (callback) callback();
    };
}

SignalingChannel::~SignalingChannel() {
    transport_->detach();
}

void SignalingChannel::open(const std::string& url) {
    core::Logger::info("Opening signaling channel to {}", url);
    transport_->open(url);
}

core::Result<void> SignalingChannel::send(const SignalingMessage& message) {
    if (closed_ || transport_->readyState() != ReadyState::Open) {
        return {core::ErrorCode::InvalidState,
                "Cannot send '" + messageType(message) + "': signaling channel is not open"};
    }

    try {
        transport_->send(encode(message));
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::SignalingTransportError,
                "Failed to send '" + messageType(message) + "': " + e.what()};
    }

    stats_.messages_sent++;
    return {};
}

void SignalingChannel::close() {
    clearCallbacks();

    if (closed_) return;
    closed_ = true;

    auto state = transport_->readyState();
    if (state == ReadyState::Closing || state == ReadyState::Closed) {
        return;
    }
    transport_->close();
}

ReadyState SignalingChannel::readyState() const {
    return transport_->readyState();
}

void SignalingChannel::clearCallbacks() {
    open_callback_ = nullptr;
    message_callback_ = nullptr;
    protocol_error_callback_ = nullptr;
    error_callback_ = nullptr;
    close_callback_ = nullptr;
}

void SignalingChannel::onTransportText(const std::string& text) {
    auto decoded = decode(text);
    if (!decoded) {
        stats_.protocol_errors++;
        core::Logger::warn("Invalid signaling message: {}", decoded.error().what());
        auto callback = protocol_error_callback_;
        if (callback) callback(decoded.error());
        return;
    }

    stats_.messages_received++;
    auto callback = message_callback_;
    if (callback) callback(decoded.value());
}

} // namespace peerlink::signaling
