#include <peerlink/signaling/message.hpp>
#include <peerlink/core/logger.hpp>

#include <type_traits>

namespace peerlink::signaling {

namespace {

using nlohmann::json;

template<typename T>
constexpr const char* typeName() {
    if constexpr (std::is_same_v<T, RegisterMessage>) return "register";
    else if constexpr (std::is_same_v<T, AcceptMessage>) return "accept";
    else if constexpr (std::is_same_v<T, RejectMessage>) return "reject";
    else if constexpr (std::is_same_v<T, PingMessage>) return "ping";
    else if constexpr (std::is_same_v<T, PongMessage>) return "pong";
    else if constexpr (std::is_same_v<T, OfferMessage>) return "offer";
    else if constexpr (std::is_same_v<T, AnswerMessage>) return "answer";
    else if constexpr (std::is_same_v<T, CandidateMessage>) return "candidate";
    else if constexpr (std::is_same_v<T, CloseMessage>) return "close";
    else return "";
}

core::Error protocolError(const std::string& message) {
    return core::Error(core::ErrorCode::ProtocolError, message);
}

// Optional string member; null counts as absent
core::Result<std::optional<std::string>> optionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<std::string>();
    }
    if (!it->is_string()) {
        return protocolError(std::string("Field '") + key + "' must be a string");
    }
    return std::optional<std::string>(it->get<std::string>());
}

core::Result<std::string> requiredString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return protocolError(std::string("Missing string field '") + key + "'");
    }
    return it->get<std::string>();
}

std::optional<Metadata> optionalMetadata(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

core::Result<SignalingMessage> decodeRegister(const json& object) {
    auto room_id = requiredString(object, "roomId");
    if (!room_id) return room_id.error();
    auto client_id = requiredString(object, "clientId");
    if (!client_id) return client_id.error();
    auto key = optionalString(object, "key");
    if (!key) return key.error();

    RegisterMessage message;
    message.room_id = room_id.value();
    message.client_id = client_id.value();
    message.authn_metadata = optionalMetadata(object, "authnMetadata");
    message.key = key.value();
    return SignalingMessage(std::move(message));
}

core::Result<SignalingMessage> decodeAccept(const json& object) {
    AcceptMessage message;
    message.authz_metadata = optionalMetadata(object, "authzMetadata");

    auto servers = object.find("iceServers");
    if (servers != object.end() && !servers->is_null()) {
        if (!servers->is_array()) {
            return protocolError("Field 'iceServers' must be an array");
        }
        for (const auto& entry : *servers) {
            auto server = iceServerFromJson(entry);
            if (!server) return server.error();
            message.ice_servers.push_back(server.value());
        }
    }

    auto exist = object.find("isExistClient");
    if (exist != object.end() && !exist->is_null()) {
        if (!exist->is_boolean()) {
            return protocolError("Field 'isExistClient' must be a boolean");
        }
        message.is_exist_client = exist->get<bool>();
    }
    return SignalingMessage(std::move(message));
}

core::Result<SignalingMessage> decodeCandidate(const json& object) {
    CandidateMessage message;
    auto ice = object.find("ice");
    if (ice != object.end() && !ice->is_null()) {
        // Kandidat rusak tidak membatalkan pesan, ice dibiarkan kosong
        auto candidate = candidateFromJson(*ice);
        if (candidate) {
            message.ice = candidate.value();
        } else {
            core::Logger::debug("invalid ice candidate: {}", candidate.error().what());
        }
    }
    return SignalingMessage(std::move(message));
}

} // namespace

std::string messageType(const SignalingMessage& message) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, UnknownMessage>) {
            return m.type;
        } else {
            return typeName<T>();
        }
    }, message);
}

std::string encode(const SignalingMessage& message) {
    json out = json::object();
    out["type"] = messageType(message);

    std::visit([&out](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RegisterMessage>) {
            out["roomId"] = m.room_id;
            out["clientId"] = m.client_id;
            if (m.authn_metadata) out["authnMetadata"] = *m.authn_metadata;
            if (m.key) out["key"] = *m.key;
        }
        else if constexpr (std::is_same_v<T, AcceptMessage>) {
            if (m.authz_metadata) out["authzMetadata"] = *m.authz_metadata;
            if (!m.ice_servers.empty()) {
                json servers = json::array();
                for (const auto& server : m.ice_servers) {
                    json entry = {{"urls", server.urls}};
                    if (server.username) entry["username"] = *server.username;
                    if (server.credential) entry["credential"] = *server.credential;
                    servers.push_back(std::move(entry));
                }
                out["iceServers"] = std::move(servers);
            }
            out["isExistClient"] = m.is_exist_client;
        }
        else if constexpr (std::is_same_v<T, RejectMessage>) {
            if (m.reason) out["reason"] = *m.reason;
        }
        else if constexpr (std::is_same_v<T, OfferMessage> || std::is_same_v<T, AnswerMessage>) {
            out["sdp"] = m.sdp;
        }
        else if constexpr (std::is_same_v<T, CandidateMessage>) {
            out["ice"] = m.ice ? candidateToJson(*m.ice) : json(nullptr);
        }
    }, message);

    return out.dump();
}

core::Result<SignalingMessage> decode(std::string_view text) {
    json object;
    try {
        object = json::parse(text);
    }
    catch (const json::parse_error& e) {
        return protocolError(std::string("Malformed signaling message: ") + e.what());
    }

    if (!object.is_object()) {
        return protocolError("Signaling message must be a JSON object");
    }

    auto type = requiredString(object, "type");
    if (!type) return type.error();
    const std::string& kind = type.value();

    if (kind == "register") return decodeRegister(object);
    if (kind == "accept") return decodeAccept(object);
    if (kind == "reject") {
        auto reason = optionalString(object, "reason");
        if (!reason) return reason.error();
        return SignalingMessage(RejectMessage{reason.value()});
    }
    if (kind == "ping") return SignalingMessage(PingMessage{});
    if (kind == "pong") return SignalingMessage(PongMessage{});
    if (kind == "close") return SignalingMessage(CloseMessage{});
    if (kind == "offer" || kind == "answer") {
        auto sdp = requiredString(object, "sdp");
        if (!sdp) return sdp.error();
        if (kind == "offer") return SignalingMessage(OfferMessage{sdp.value()});
        return SignalingMessage(AnswerMessage{sdp.value()});
    }
    if (kind == "candidate") return decodeCandidate(object);

    return SignalingMessage(UnknownMessage{kind});
}

nlohmann::json candidateToJson(const engine::IceCandidate& candidate) {
    json out = {{"candidate", candidate.candidate}};
    out["sdpMid"] = candidate.sdp_mid ? json(*candidate.sdp_mid) : json(nullptr);
    out["sdpMLineIndex"] = candidate.sdp_mline_index ? json(*candidate.sdp_mline_index) : json(nullptr);
    if (candidate.username_fragment) {
        out["usernameFragment"] = *candidate.username_fragment;
    }
    return out;
}

core::Result<engine::IceCandidate> candidateFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        return protocolError("Field 'ice' must be an object");
    }

    auto candidate = requiredString(object, "candidate");
    if (!candidate) return candidate.error();
    auto mid = optionalString(object, "sdpMid");
    if (!mid) return mid.error();
    auto ufrag = optionalString(object, "usernameFragment");
    if (!ufrag) return ufrag.error();

    engine::IceCandidate result;
    result.candidate = candidate.value();
    result.sdp_mid = mid.value();
    result.username_fragment = ufrag.value();

    auto index = object.find("sdpMLineIndex");
    if (index != object.end() && !index->is_null()) {
        if (!index->is_number_integer()) {
            return protocolError("Field 'sdpMLineIndex' must be an integer");
        }
        result.sdp_mline_index = index->get<int>();
    }

    if (!result.sdp_mid && !result.sdp_mline_index) {
        return protocolError("ICE candidate needs sdpMid or sdpMLineIndex");
    }
    return result;
}

core::Result<engine::IceServer> iceServerFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        return protocolError("ICE server entry must be an object");
    }

    engine::IceServer server;
    auto urls = object.find("urls");
    if (urls != object.end() && urls->is_string()) {
        server.urls.push_back(urls->get<std::string>());
    } else if (urls != object.end() && urls->is_array()) {
        for (const auto& url : *urls) {
            if (!url.is_string()) {
                return protocolError("ICE server urls must be strings");
            }
            server.urls.push_back(url.get<std::string>());
        }
    }
    if (server.urls.empty()) {
        return protocolError("ICE server entry has no urls");
    }

    auto username = optionalString(object, "username");
    if (!username) return username.error();
    auto credential = optionalString(object, "credential");
    if (!credential) return credential.error();
    server.username = username.value();
    server.credential = credential.value();
    return server;
}

} // namespace peerlink::signaling
