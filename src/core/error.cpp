#include <peerlink/core/error.hpp>
#include <unordered_map>

namespace peerlink::core {

namespace {
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},

        // Usage errors
        {ErrorCode::AlreadyConnected, "Connection already exists"},
        {ErrorCode::EngineNotReady, "Session engine is not ready"},
        {ErrorCode::ChannelAlreadyExists, "Data channel already exists"},
        {ErrorCode::ChannelNotOpen, "Data channel is not open"},

        // Signaling errors
        {ErrorCode::Rejected, "Rejected by signaling server"},
        {ErrorCode::ConnectionClosed, "Connection closed"},
        {ErrorCode::ProtocolError, "Signaling protocol error"},
        {ErrorCode::SignalingTransportError, "Signaling transport error"},

        // Negotiation errors
        {ErrorCode::OfferCreationFailed, "Offer creation failed"},
        {ErrorCode::AnswerCreationFailed, "Answer creation failed"},
        {ErrorCode::RemoteOfferFailed, "Remote offer could not be applied"},
        {ErrorCode::RemoteAnswerFailed, "Remote answer could not be applied"},
        {ErrorCode::TransportFailed, "Transport failed"},

        // Resource errors
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    // Map untuk error conditions
    const std::unordered_map<ErrorCode, std::error_condition> ERROR_CONDITIONS = {
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::AlreadyConnected, std::errc::already_connected},
        {ErrorCode::ChannelNotOpen, std::errc::not_connected},
        {ErrorCode::Rejected, std::errc::connection_refused},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::ProtocolError, std::errc::protocol_error},
        {ErrorCode::SignalingTransportError, std::errc::network_down},
        {ErrorCode::TransportFailed, std::errc::network_unreachable},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? it->second : std::error_condition(ev, *this);
}

} // namespace peerlink::core
