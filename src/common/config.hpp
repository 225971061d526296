#pragma once

#include <boost/json/object.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sightlink {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Transport Type
// ============================================================================

enum class TransportType : uint8_t {
    DUPLEX = 0,   // persistent WebSocket to the gateway
    RELAY,        // hand-off to a local relay daemon
};

constexpr std::string_view transport_type_to_string(TransportType type) {
    switch (type) {
        case TransportType::DUPLEX: return "duplex";
        case TransportType::RELAY:  return "relay";
        default:                    return "unknown";
    }
}

// Accepts "duplex"/"websocket"/"socket" and "relay"/"libp2p"
std::optional<TransportType> parse_transport_type(std::string_view value);

enum class ConfigSource : uint8_t {
    DEFAULT = 0,
    CONFIG_FILE,
    ENV,
    CLI,
};

constexpr std::string_view config_source_to_string(ConfigSource source) {
    switch (source) {
        case ConfigSource::DEFAULT: return "default";
        case ConfigSource::CONFIG_FILE: return "file";
        case ConfigSource::ENV:     return "env";
        case ConfigSource::CLI:     return "cli";
        default:                    return "unknown";
    }
}

// Resolved view the tunnel core reads
struct TransportConfig {
    TransportType type = TransportType::RELAY;
    std::chrono::system_clock::time_point updated_at = std::chrono::system_clock::now();
    bool requires_restart = false;
    ConfigSource source = ConfigSource::DEFAULT;
};

// ============================================================================
// Tunnel Configuration
// ============================================================================

struct TunnelConfig {
    struct Transport {
        std::optional<TransportType> type;   // unset = resolved by priority
        std::string gateway_url;             // ws://host:port or wss://host
        std::string auth_code;
        std::string base_path;               // appended to gateway_url
        std::string relay_host = "127.0.0.1";
        uint16_t relay_port = 4010;
        uint16_t inbox_port = 4011;
        std::chrono::milliseconds restart_delay{3000};
        std::chrono::milliseconds reconnect_base_delay{2000};
        std::chrono::milliseconds reconnect_max_delay{60000};
        uint32_t max_reconnect_attempts = 10;
    } transport;

    struct Device {
        std::string code;
        std::string device_id;
        std::string device_name;
        std::string device_type = "linux";
        std::string gpu_type;
        std::string ip;
        std::string gateway_address;
        std::string reward_address;
        std::string gateway_peer_id = "gateway";
        std::vector<std::string> local_models;
        std::chrono::milliseconds heartbeat_interval{30000};
        std::chrono::milliseconds registration_timeout{30000};
    } device;

    struct Inference {
        std::string base_url = "http://127.0.0.1:11434";
    } inference;

    // Logging
    std::string log_level = "info";
    std::string log_file;
    // logger name -> level, e.g. {"stream": "debug"}
    std::map<std::string, std::string> log_components;

    // Load from JSON file
    static std::expected<TunnelConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<TunnelConfig, ConfigError> parse(const std::string& json_content);

    // SIGHTLINK_GATEWAY_URL / SIGHTLINK_AUTH_CODE / SIGHTLINK_RELAY_PORT
    void apply_env_overrides();

    boost::json::object to_json() const;
};

// CLI > SIGHTLINK_TRANSPORT (COMMUNICATION_TYPE) > file > relay
TransportConfig resolve_transport_config(const std::optional<std::string>& cli_value,
                                         const TunnelConfig& file_config);

// ============================================================================
// Config Store
// ============================================================================
// In-memory holder shared by the node and the transport switcher.
class ConfigStore {
public:
    ConfigStore(TunnelConfig config, TransportConfig transport)
        : config_(std::move(config)), transport_(transport) {}

    const TunnelConfig& config() const { return config_; }
    const TransportConfig& transport() const { return transport_; }

    void update_transport(TransportType type, bool requires_restart);

private:
    TunnelConfig config_;
    TransportConfig transport_;
};

} // namespace sightlink
