#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <peerlink/core/error.hpp>
#include <peerlink/engine/types.hpp>

namespace peerlink::signaling {

// Free-form authentication / authorization payload
using Metadata = nlohmann::json;

struct RegisterMessage {
    std::string room_id;
    std::string client_id;
    std::optional<Metadata> authn_metadata;
    std::optional<std::string> key;
};

struct AcceptMessage {
    std::optional<Metadata> authz_metadata;
    std::vector<engine::IceServer> ice_servers;
    bool is_exist_client = false;
};

struct RejectMessage {
    std::optional<std::string> reason;
};

struct PingMessage {};
struct PongMessage {};
struct CloseMessage {};

struct OfferMessage {
    std::string sdp;
};

struct AnswerMessage {
    std::string sdp;
};

struct CandidateMessage {
    // Absent when the peer signals the end of its candidates
    std::optional<engine::IceCandidate> ice;
};

// Well-formed message with a type this client does not know
struct UnknownMessage {
    std::string type;
};

using SignalingMessage = std::variant<
    RegisterMessage,
    AcceptMessage,
    RejectMessage,
    PingMessage,
    PongMessage,
    OfferMessage,
    AnswerMessage,
    CandidateMessage,
    CloseMessage,
    UnknownMessage
>;

// Wire name of the message kind ("register", "offer", ...)
std::string messageType(const SignalingMessage& message);

std::string encode(const SignalingMessage& message);

// Parse one JSON text frame. Fails with ProtocolError on malformed input.
core::Result<SignalingMessage> decode(std::string_view text);

// JSON form of candidates and ICE servers as used on the wire
nlohmann::json candidateToJson(const engine::IceCandidate& candidate);
core::Result<engine::IceCandidate> candidateFromJson(const nlohmann::json& json);
core::Result<engine::IceServer> iceServerFromJson(const nlohmann::json& json);

} // namespace peerlink::signaling
