#include "tunnel/errors.hpp"
#include <spdlog/fmt/fmt.h>

namespace sightlink::tunnel {

std::string tunnel_error_message(TunnelErrorCode code) {
    switch (code) {
        case TunnelErrorCode::VALIDATION: return "Message failed validation";
        case TunnelErrorCode::UNKNOWN_MESSAGE_TYPE: return "No handler registered for message type";
        case TunnelErrorCode::DUPLICATE_HANDLER: return "Handler already registered";
        case TunnelErrorCode::CONNECTION: return "Transport connection failed";
        case TunnelErrorCode::DEVICE_REGISTRATION: return "Device registration failed";
        case TunnelErrorCode::MESSAGE_SEND: return "Failed to send message";
        case TunnelErrorCode::STREAM_PARSE: return "Malformed stream data";
        case TunnelErrorCode::SERVICE_UNAVAILABLE: return "No device available";
        case TunnelErrorCode::TIMEOUT: return "Timed out waiting for response";
        case TunnelErrorCode::INFERENCE: return "Inference request failed";
        case TunnelErrorCode::HANDLER: return "Message handler failed";
        default: return "Unknown tunnel error";
    }
}

std::string TunnelError::to_string() const {
    if (message.empty()) {
        return fmt::format("{}: {}", tunnel_error_code_name(code), tunnel_error_message(code));
    }
    return fmt::format("{}: {}", tunnel_error_code_name(code), message);
}

TunnelError TunnelError::unknown_type(std::string_view type, std::string_view direction) {
    return {TunnelErrorCode::UNKNOWN_MESSAGE_TYPE,
            fmt::format("no {} handler for '{}'", direction, type)};
}

TunnelError TunnelError::duplicate_handler(std::string_view type, std::string_view direction) {
    return {TunnelErrorCode::DUPLICATE_HANDLER,
            fmt::format("{} handler for '{}' registered twice", direction, type)};
}

} // namespace sightlink::tunnel
