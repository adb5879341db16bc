#include <peerlink/engine/types.hpp>

namespace peerlink::engine {

const char* toString(SdpType type) {
    switch (type) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
        case SdpType::PrAnswer: return "pranswer";
        case SdpType::Rollback: return "rollback";
    }
    return "unknown";
}

const char* toString(SignalingState state) {
    switch (state) {
        case SignalingState::Stable: return "stable";
        case SignalingState::HaveLocalOffer: return "have-local-offer";
        case SignalingState::HaveRemoteOffer: return "have-remote-offer";
        case SignalingState::HaveLocalPrAnswer: return "have-local-pranswer";
        case SignalingState::HaveRemotePrAnswer: return "have-remote-pranswer";
        case SignalingState::Closed: return "closed";
    }
    return "unknown";
}

const char* toString(IceConnectionState state) {
    switch (state) {
        case IceConnectionState::New: return "new";
        case IceConnectionState::Checking: return "checking";
        case IceConnectionState::Connected: return "connected";
        case IceConnectionState::Completed: return "completed";
        case IceConnectionState::Failed: return "failed";
        case IceConnectionState::Disconnected: return "disconnected";
        case IceConnectionState::Closed: return "closed";
    }
    return "unknown";
}

const char* toString(DataChannelState state) {
    switch (state) {
        case DataChannelState::Connecting: return "connecting";
        case DataChannelState::Open: return "open";
        case DataChannelState::Closing: return "closing";
        case DataChannelState::Closed: return "closed";
    }
    return "unknown";
}

const char* toString(MediaKind kind) {
    return kind == MediaKind::Audio ? "audio" : "video";
}

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::SendRecv: return "sendrecv";
        case Direction::SendOnly: return "sendonly";
        case Direction::RecvOnly: return "recvonly";
    }
    return "unknown";
}

const char* toString(VideoCodec codec) {
    switch (codec) {
        case VideoCodec::VP8: return "VP8";
        case VideoCodec::VP9: return "VP9";
        case VideoCodec::H264: return "H264";
    }
    return "unknown";
}

std::optional<SdpType> parseSdpType(std::string_view text) {
    if (text == "offer") return SdpType::Offer;
    if (text == "answer") return SdpType::Answer;
    if (text == "pranswer") return SdpType::PrAnswer;
    if (text == "rollback") return SdpType::Rollback;
    return std::nullopt;
}

std::optional<Direction> parseDirection(std::string_view text) {
    if (text == "sendrecv") return Direction::SendRecv;
    if (text == "sendonly") return Direction::SendOnly;
    if (text == "recvonly") return Direction::RecvOnly;
    return std::nullopt;
}

std::optional<VideoCodec> parseVideoCodec(std::string_view text) {
    if (text == "VP8") return VideoCodec::VP8;
    if (text == "VP9") return VideoCodec::VP9;
    if (text == "H264") return VideoCodec::H264;
    return std::nullopt;
}

} // namespace peerlink::engine
