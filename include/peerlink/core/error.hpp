#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <exception>
#include <stdexcept>
#include <memory>
#include <optional>
#include <source_location>

#include <peerlink/core/logger.hpp>

namespace peerlink::core {

// Kode error untuk peerlink
enum class ErrorCode {
    // System errors
    Success = 0,
    Unknown,
    InvalidArgument,
    InvalidState,

    // Usage errors
    AlreadyConnected,
    EngineNotReady,
    ChannelAlreadyExists,
    ChannelNotOpen,

    // Signaling errors
    Rejected,
    ConnectionClosed,
    ProtocolError,
    SignalingTransportError,

    // Negotiation errors
    OfferCreationFailed,
    AnswerCreationFailed,
    RemoteOfferFailed,
    RemoteAnswerFailed,
    TransportFailed,

    // Resource errors
    FileNotFound,
    FileAccessDenied,
    InvalidData
};

// Error category untuk peerlink
class ErrorCategory : public std::error_category {
public:
    static const ErrorCategory& instance() {
        static ErrorCategory instance;
        return instance;
    }

    const char* name() const noexcept override { return "peerlink"; }

    std::string message(int ev) const override;

    std::error_condition default_error_condition(int ev) const noexcept override;

private:
    ErrorCategory() = default;
};

inline std::error_code make_error_code(ErrorCode e) {
    return {static_cast<int>(e), ErrorCategory::instance()};
}

// Base exception class untuk peerlink
class Error : public std::runtime_error {
public:
    Error(ErrorCode code,
          std::string_view message,
          const std::source_location& location = std::source_location::current())
        : std::runtime_error(std::string(message))
        , code_(code)
        , location_(location) {
        Logger::debug("[{}] {} at {}:{}",
            ErrorCategory::instance().message(static_cast<int>(code)),
            message,
            location.file_name(),
            location.line());
    }

    ErrorCode code() const noexcept { return code_; }
    const std::source_location& location() const noexcept { return location_; }
    std::error_code error_code() const noexcept { return make_error_code(code_); }

private:
    ErrorCode code_;
    std::source_location location_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string_view message,
                                     const std::source_location& location = std::source_location::current()) {
    throw Error(code, message, location);
}

// Result type untuk error handling tanpa exceptions
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    Result(ErrorCode code, std::string_view message,
           const std::source_location& location = std::source_location::current())
        : error_(Error(code, message, location)) {}

    Result(Error error) : error_(std::move(error)) {}

    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }

    const T& value() const& {
        if (error_) throw *error_;
        return *value_;
    }

    T&& value() && {
        if (error_) throw *error_;
        return std::move(*value_);
    }

    const Error& error() const {
        if (!error_) throw_error(ErrorCode::InvalidState, "Result contains no error");
        return *error_;
    }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

template<>
class Result<void> {
public:
    Result() = default;

    Result(ErrorCode code, std::string_view message,
           const std::source_location& location = std::source_location::current())
        : error_(Error(code, message, location)) {}

    Result(Error error) : error_(std::move(error)) {}

    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }

    void value() const {
        if (error_) throw *error_;
    }

    const Error& error() const {
        if (!error_) throw_error(ErrorCode::InvalidState, "Result contains no error");
        return *error_;
    }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    std::optional<Error> error_;
};

} // namespace peerlink::core

namespace std {
    template<>
    struct is_error_code_enum<peerlink::core::ErrorCode> : true_type {};
}
