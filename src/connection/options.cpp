#include <peerlink/connection/options.hpp>
#include <peerlink/signaling/message.hpp>

#include <random>

namespace peerlink::connection {

namespace {

constexpr const char* DEFAULT_STUN_SERVER = "stun:stun.l.google.com:19302";

// Optional typed key; absent keys leave the target untouched
template<typename T, typename Apply>
core::Result<void> readKey(const core::Config& config, const std::string& key, Apply apply) {
    if (!config.has(key)) return {};
    auto value = config.get<T>(key);
    if (!value) return value.error();
    return apply(value.value());
}

core::Result<void> readDirection(const core::Config& config, const std::string& key, engine::Direction& target) {
    return readKey<std::string>(config, key, [&](const std::string& text) -> core::Result<void> {
        auto direction = engine::parseDirection(text);
        if (!direction) {
            return {core::ErrorCode::InvalidData, "Unknown direction '" + text + "' for key: " + key};
        }
        target = *direction;
        return {};
    });
}

core::Result<void> readBool(const core::Config& config, const std::string& key, bool& target) {
    return readKey<bool>(config, key, [&](bool value) -> core::Result<void> {
        target = value;
        return {};
    });
}

} // namespace

std::string generateClientId(std::size_t length) {
    static constexpr char ALPHABET[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(ALPHABET) - 2);

    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id.push_back(ALPHABET[dis(gen)]);
    }
    return id;
}

ConnectionOptions defaultOptions() {
    ConnectionOptions options;
    options.client_id = generateClientId();
    options.ice_servers.push_back(engine::IceServer{{DEFAULT_STUN_SERVER}, std::nullopt, std::nullopt});
    return options;
}

core::Result<ConnectionOptions> optionsFromConfig(const core::Config& config) {
    ConnectionOptions options = defaultOptions();

    auto result = readKey<std::string>(config, "clientId", [&](const std::string& id) -> core::Result<void> {
        if (id.empty()) {
            return {core::ErrorCode::InvalidData, "clientId must not be empty"};
        }
        options.client_id = id;
        return {};
    });
    if (!result) return result.error();

    result = readKey<std::string>(config, "signalingKey", [&](const std::string& key) -> core::Result<void> {
        options.signaling_key = key;
        return {};
    });
    if (!result) return result.error();

    result = readKey<nlohmann::json>(config, "iceServers", [&](const nlohmann::json& servers) -> core::Result<void> {
        if (!servers.is_array()) {
            return {core::ErrorCode::InvalidData, "iceServers must be an array"};
        }
        std::vector<engine::IceServer> parsed;
        for (const auto& entry : servers) {
            auto server = signaling::iceServerFromJson(entry);
            if (!server) {
                return {core::ErrorCode::InvalidData, server.error().what()};
            }
            parsed.push_back(server.value());
        }
        options.ice_servers = std::move(parsed);
        return {};
    });
    if (!result) return result.error();

    // Audio
    result = readDirection(config, "audio.direction", options.audio.direction);
    if (!result) return result.error();
    result = readBool(config, "audio.enabled", options.audio.enabled);
    if (!result) return result.error();

    // Video
    result = readDirection(config, "video.direction", options.video.direction);
    if (!result) return result.error();
    result = readBool(config, "video.enabled", options.video.enabled);
    if (!result) return result.error();
    result = readKey<nlohmann::json>(config, "video.codec", [&](const nlohmann::json& codec) -> core::Result<void> {
        if (codec.is_null()) {
            options.video.codec.reset();
            return {};
        }
        auto parsed = codec.is_string() ? engine::parseVideoCodec(codec.get<std::string>()) : std::nullopt;
        if (!parsed) {
            return {core::ErrorCode::InvalidData, "video.codec must be one of VP8, VP9, H264"};
        }
        options.video.codec = parsed;
        return {};
    });
    if (!result) return result.error();

    // Teardown polling
    result = readKey<int64_t>(config, "closePollIntervalMs", [&](int64_t ms) -> core::Result<void> {
        if (ms <= 0) {
            return {core::ErrorCode::InvalidData, "closePollIntervalMs must be positive"};
        }
        options.close_poll_interval = std::chrono::milliseconds(ms);
        return {};
    });
    if (!result) return result.error();
    result = readKey<int64_t>(config, "closePollAttempts", [&](int64_t attempts) -> core::Result<void> {
        if (attempts < 0) {
            return {core::ErrorCode::InvalidData, "closePollAttempts must not be negative"};
        }
        options.close_poll_attempts = static_cast<std::size_t>(attempts);
        return {};
    });
    if (!result) return result.error();

    return options;
}

} // namespace peerlink::connection
