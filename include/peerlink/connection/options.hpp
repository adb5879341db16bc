#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <peerlink/core/config.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/engine/types.hpp>

namespace peerlink::connection {

struct AudioOptions {
    engine::Direction direction = engine::Direction::SendRecv;
    bool enabled = true;
};

struct VideoOptions {
    engine::Direction direction = engine::Direction::SendRecv;
    bool enabled = true;
    std::optional<engine::VideoCodec> codec;
};

// Connection options
struct ConnectionOptions {
    AudioOptions audio;
    VideoOptions video;
    std::string client_id;
    std::vector<engine::IceServer> ice_servers;
    std::optional<std::string> signaling_key;

    // Bounded wait for the engine and the signaling channel to close
    std::chrono::milliseconds close_poll_interval{800};
    std::size_t close_poll_attempts = 10;
};

// Random alphanumeric identifier, 17 characters by default
std::string generateClientId(std::size_t length = 17);

// Send/receive audio and video, Google's public STUN server, random client id
ConnectionOptions defaultOptions();

// Build options from a configuration document. Missing keys keep the values
// of defaultOptions(); keys with the wrong type or unknown enum values fail
// with InvalidData.
core::Result<ConnectionOptions> optionsFromConfig(const core::Config& config);

} // namespace peerlink::connection
