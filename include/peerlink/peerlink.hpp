#pragma once

#include <memory>
#include <string>

#include <peerlink/core/config.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/logger.hpp>
#include <peerlink/core/wait.hpp>
#include <peerlink/engine/media.hpp>
#include <peerlink/engine/session_engine.hpp>
#include <peerlink/engine/types.hpp>
#include <peerlink/signaling/message.hpp>
#include <peerlink/signaling/signaling_channel.hpp>
#include <peerlink/connection/connection.hpp>
#include <peerlink/connection/data_channel_registry.hpp>
#include <peerlink/connection/options.hpp>

namespace peerlink {

// Library version string
const char* version();

// Send/receive audio and video, Google's public STUN server and a random
// 17-character client id
connection::ConnectionOptions defaultOptions();

// Create a connection to signaling_url for room_id. With debug set, the
// connection traces its signaling and engine activity at DEBUG level; the
// trace is visible once the application lowers the Logger level.
std::shared_ptr<connection::Connection> createConnection(core::EventLoop& loop,
                                                         const std::string& signaling_url,
                                                         const std::string& room_id,
                                                         connection::ConnectionBackends backends,
                                                         connection::ConnectionOptions options = defaultOptions(),
                                                         bool debug = false);

} // namespace peerlink
