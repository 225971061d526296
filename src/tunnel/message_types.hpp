#pragma once

#include <cstdint>
#include <string_view>

namespace sightlink::tunnel {

// ============================================================================
// Dispatch Direction
// ============================================================================
// INCOME: addressed to this peer. OUTCOME: sent by this peer.
enum class Direction : uint8_t {
    INCOME = 0,
    OUTCOME,
};

constexpr std::string_view direction_to_string(Direction direction) {
    switch (direction) {
        case Direction::INCOME:  return "income";
        case Direction::OUTCOME: return "outcome";
        default:                 return "unknown";
    }
}

// ============================================================================
// Message Type Vocabulary
// ============================================================================
namespace msg {

inline constexpr std::string_view PING = "ping";
inline constexpr std::string_view PONG = "pong";
inline constexpr std::string_view CONTEXT_PING = "context-ping";
inline constexpr std::string_view CONTEXT_PONG = "context-pong";

inline constexpr std::string_view DEVICE_REGISTER_REQUEST = "device_register_request";
inline constexpr std::string_view DEVICE_REGISTER_ACK = "device_register_ack";
inline constexpr std::string_view DEVICE_HEARTBEAT_REPORT = "device_heartbeat_report";
inline constexpr std::string_view DEVICE_HEARTBEAT_RESPONSE = "device_heartbeat_response";
inline constexpr std::string_view DEVICE_MODEL_REPORT = "device_model_report";
inline constexpr std::string_view DEVICE_MODEL_REPORT_RESPONSE = "device_model_report_response";

inline constexpr std::string_view CHAT_REQUEST_STREAM = "chat_request_stream";
inline constexpr std::string_view CHAT_REQUEST_NO_STREAM = "chat_request_no_stream";
inline constexpr std::string_view CHAT_RESPONSE_STREAM = "chat_response_stream";
inline constexpr std::string_view CHAT_RESPONSE = "chat_response";

inline constexpr std::string_view COMPLETION_REQUEST_STREAM = "completion_request_stream";
inline constexpr std::string_view COMPLETION_REQUEST_NO_STREAM = "completion_request_no_stream";
inline constexpr std::string_view COMPLETION_RESPONSE_STREAM = "completion_response_stream";
inline constexpr std::string_view COMPLETION_RESPONSE = "completion_response";

inline constexpr std::string_view TASK_REQUEST = "task_request";
inline constexpr std::string_view TASK_RESPONSE = "task_response";
inline constexpr std::string_view TASK_STREAM = "task_stream";

inline constexpr std::string_view PROXY_REQUEST = "proxy_request";
inline constexpr std::string_view PROXY_RESPONSE = "proxy_response";

// task_request inner types
inline constexpr std::string_view GENERATE_REQUEST_STREAM = "generate_request_stream";
inline constexpr std::string_view GENERATE_REQUEST_NO_STREAM = "generate_request_no_stream";

} // namespace msg

} // namespace sightlink::tunnel
