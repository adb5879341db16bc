#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace peerlink::engine {

// SDP session description types
enum class SdpType {
    Offer,
    Answer,
    PrAnswer,  // Provisional answer
    Rollback
};

struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::optional<std::string> sdp_mid;
    std::optional<int> sdp_mline_index;
    std::optional<std::string> username_fragment;
};

struct IceServer {
    std::vector<std::string> urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;
};

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    HaveLocalPrAnswer,
    HaveRemotePrAnswer,
    Closed
};

enum class IceConnectionState {
    New,
    Checking,
    Connected,
    Completed,
    Failed,
    Disconnected,
    Closed
};

enum class DataChannelState {
    Connecting,
    Open,
    Closing,
    Closed
};

enum class MediaKind {
    Audio,
    Video
};

enum class Direction {
    SendRecv,
    SendOnly,
    RecvOnly
};

enum class VideoCodec {
    VP8,
    VP9,
    H264
};

// Data channel payload: text or binary
using DataPayload = std::variant<std::string, std::vector<std::uint8_t>>;

const char* toString(SdpType type);
const char* toString(SignalingState state);
const char* toString(IceConnectionState state);
const char* toString(DataChannelState state);
const char* toString(MediaKind kind);
const char* toString(Direction direction);
const char* toString(VideoCodec codec);

std::optional<SdpType> parseSdpType(std::string_view text);
std::optional<Direction> parseDirection(std::string_view text);
std::optional<VideoCodec> parseVideoCodec(std::string_view text);

} // namespace peerlink::engine
