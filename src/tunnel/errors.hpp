#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace sightlink::tunnel {

// ============================================================================
// Tunnel Error Taxonomy
// ============================================================================

enum class TunnelErrorCode : uint8_t {
    VALIDATION = 0,          // envelope or payload fails its schema
    UNKNOWN_MESSAGE_TYPE,    // no handler for (type, direction)
    DUPLICATE_HANDLER,       // second registration for (type, direction)
    CONNECTION,              // transport could not connect / gave up reconnecting
    DEVICE_REGISTRATION,     // register ack failed or never arrived
    MESSAGE_SEND,            // send while disconnected or delivery failed
    STREAM_PARSE,            // one malformed stream line
    SERVICE_UNAVAILABLE,     // no device to proxy to
    TIMEOUT,                 // correlated response never arrived
    INFERENCE,               // inference executor failure
    HANDLER,                 // handler threw while processing
};

constexpr std::string_view tunnel_error_code_name(TunnelErrorCode code) {
    switch (code) {
        case TunnelErrorCode::VALIDATION:           return "ValidationError";
        case TunnelErrorCode::UNKNOWN_MESSAGE_TYPE: return "UnknownMessageType";
        case TunnelErrorCode::DUPLICATE_HANDLER:    return "DuplicateHandler";
        case TunnelErrorCode::CONNECTION:           return "ConnectionError";
        case TunnelErrorCode::DEVICE_REGISTRATION:  return "DeviceRegistrationError";
        case TunnelErrorCode::MESSAGE_SEND:         return "MessageSendError";
        case TunnelErrorCode::STREAM_PARSE:         return "StreamParseError";
        case TunnelErrorCode::SERVICE_UNAVAILABLE:  return "ServiceUnavailable";
        case TunnelErrorCode::TIMEOUT:              return "Timeout";
        case TunnelErrorCode::INFERENCE:            return "InferenceError";
        case TunnelErrorCode::HANDLER:              return "HandlerError";
        default:                                    return "UnknownError";
    }
}

std::string tunnel_error_message(TunnelErrorCode code);

struct TunnelError {
    TunnelErrorCode code = TunnelErrorCode::VALIDATION;
    std::string message;

    // "MessageSendError: not connected"
    std::string to_string() const;

    static TunnelError validation(std::string msg) {
        return {TunnelErrorCode::VALIDATION, std::move(msg)};
    }
    static TunnelError unknown_type(std::string_view type, std::string_view direction);
    static TunnelError duplicate_handler(std::string_view type, std::string_view direction);
    static TunnelError connection(std::string msg) {
        return {TunnelErrorCode::CONNECTION, std::move(msg)};
    }
    static TunnelError registration(std::string msg) {
        return {TunnelErrorCode::DEVICE_REGISTRATION, std::move(msg)};
    }
    static TunnelError send(std::string msg) {
        return {TunnelErrorCode::MESSAGE_SEND, std::move(msg)};
    }
    static TunnelError stream_parse(std::string msg) {
        return {TunnelErrorCode::STREAM_PARSE, std::move(msg)};
    }
    static TunnelError unavailable(std::string msg) {
        return {TunnelErrorCode::SERVICE_UNAVAILABLE, std::move(msg)};
    }
    static TunnelError timeout(std::string msg) {
        return {TunnelErrorCode::TIMEOUT, std::move(msg)};
    }
    static TunnelError inference(std::string msg) {
        return {TunnelErrorCode::INFERENCE, std::move(msg)};
    }
    static TunnelError handler(std::string msg) {
        return {TunnelErrorCode::HANDLER, std::move(msg)};
    }
};

template<typename T>
using Result = std::expected<T, TunnelError>;

using VoidResult = std::expected<void, TunnelError>;

} // namespace sightlink::tunnel
