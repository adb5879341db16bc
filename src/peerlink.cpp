#include <peerlink/peerlink.hpp>

namespace peerlink {

namespace {
constexpr const char* VERSION = "2022.1.0";
}

const char* version() {
    return VERSION;
}

connection::ConnectionOptions defaultOptions() {
    return connection::defaultOptions();
}

std::shared_ptr<connection::Connection> createConnection(core::EventLoop& loop,
                                                         const std::string& signaling_url,
                                                         const std::string& room_id,
                                                         connection::ConnectionBackends backends,
                                                         connection::ConnectionOptions options,
                                                         bool debug) {
    return connection::Connection::create(loop, signaling_url, room_id,
                                          std::move(options), std::move(backends), debug);
}

} // namespace peerlink
