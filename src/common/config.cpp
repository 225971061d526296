#include "common/config.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace sightlink {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::CONFIG_LOGGER);
    return instance;
}

std::string lower(std::string_view value) {
    std::string out(value);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::optional<std::chrono::milliseconds> jmillis(const json::object& obj, std::string_view key) {
    if (auto v = jint(obj, key, -1); v > 0) {
        return std::chrono::milliseconds(v);
    }
    return std::nullopt;
}

}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::optional<TransportType> parse_transport_type(std::string_view value) {
    auto v = lower(value);
    if (v == "duplex" || v == "websocket" || v == "socket") return TransportType::DUPLEX;
    if (v == "relay" || v == "libp2p") return TransportType::RELAY;
    return std::nullopt;
}

// ============================================================================
// TunnelConfig
// ============================================================================

std::expected<TunnelConfig, ConfigError> TunnelConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<TunnelConfig, ConfigError> TunnelConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            logger().error("Config root must be an object");
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        TunnelConfig config;

        // transport section
        if (auto* tr = jsection(root, "transport")) {
            if (auto type = jopt_str(*tr, "type")) {
                auto parsed = parse_transport_type(*type);
                if (!parsed) {
                    logger().error("Unknown transport type: {}", *type);
                    return std::unexpected(ConfigError::INVALID_VALUE);
                }
                config.transport.type = parsed;
            }
            config.transport.gateway_url = jstr(*tr, "gateway_url", config.transport.gateway_url);
            config.transport.auth_code = jstr(*tr, "auth_code", config.transport.auth_code);
            config.transport.base_path = jstr(*tr, "base_path", config.transport.base_path);
            config.transport.relay_host = jstr(*tr, "relay_host", config.transport.relay_host);
            config.transport.relay_port = static_cast<uint16_t>(juint(*tr, "relay_port", config.transport.relay_port));
            config.transport.inbox_port = static_cast<uint16_t>(juint(*tr, "inbox_port", config.transport.inbox_port));
            if (auto v = jmillis(*tr, "restart_delay_ms"))
                config.transport.restart_delay = *v;
            if (auto v = jmillis(*tr, "reconnect_base_delay_ms"))
                config.transport.reconnect_base_delay = *v;
            if (auto v = jmillis(*tr, "reconnect_max_delay_ms"))
                config.transport.reconnect_max_delay = *v;
            config.transport.max_reconnect_attempts = static_cast<uint32_t>(
                juint(*tr, "max_reconnect_attempts", config.transport.max_reconnect_attempts));
        }

        // device section
        if (auto* dev = jsection(root, "device")) {
            config.device.code = jstr(*dev, "code");
            config.device.device_id = jstr(*dev, "device_id");
            config.device.device_name = jstr(*dev, "device_name");
            config.device.device_type = jstr(*dev, "device_type", config.device.device_type);
            config.device.gpu_type = jstr(*dev, "gpu_type");
            config.device.ip = jstr(*dev, "ip");
            config.device.gateway_address = jstr(*dev, "gateway_address");
            config.device.reward_address = jstr(*dev, "reward_address");
            config.device.gateway_peer_id = jstr(*dev, "gateway_peer_id", config.device.gateway_peer_id);
            if (auto* models = jarray(*dev, "local_models")) {
                for (const auto& item : *models) {
                    if (item.is_string())
                        config.device.local_models.emplace_back(item.as_string());
                }
            }
            if (auto v = jmillis(*dev, "heartbeat_interval_ms"))
                config.device.heartbeat_interval = *v;
            if (auto v = jmillis(*dev, "registration_timeout_ms"))
                config.device.registration_timeout = *v;
        }

        // inference section
        if (auto* inf = jsection(root, "inference")) {
            config.inference.base_url = jstr(*inf, "base_url", config.inference.base_url);
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            config.log_level = jstr(*log_sec, "level", config.log_level);
            config.log_file = jstr(*log_sec, "file", config.log_file);
            if (auto* components = jsection(*log_sec, "components")) {
                for (const auto& [name, level] : *components) {
                    if (level.is_string()) {
                        config.log_components[std::string(name)] = std::string(level.as_string());
                    }
                }
            }
        }

        return config;

    } catch (const boost::system::system_error& e) {
        logger().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        logger().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

void TunnelConfig::apply_env_overrides() {
    if (const char* url = std::getenv("SIGHTLINK_GATEWAY_URL")) {
        transport.gateway_url = url;
    }
    if (const char* code = std::getenv("SIGHTLINK_AUTH_CODE")) {
        transport.auth_code = code;
    }
    if (const char* port = std::getenv("SIGHTLINK_RELAY_PORT")) {
        try {
            int value = std::stoi(port);
            if (value > 0 && value <= 65535) {
                transport.relay_port = static_cast<uint16_t>(value);
            } else {
                logger().warn("Ignoring out of range SIGHTLINK_RELAY_PORT={}", port);
            }
        } catch (const std::exception&) {
            logger().warn("Ignoring invalid SIGHTLINK_RELAY_PORT={}", port);
        }
    }
}

json::object TunnelConfig::to_json() const {
    json::object tr;
    tr["type"] = transport_type_to_string(transport.type.value_or(TransportType::RELAY));
    tr["gateway_url"] = transport.gateway_url;
    tr["auth_code"] = transport.auth_code;
    tr["base_path"] = transport.base_path;
    tr["relay_host"] = transport.relay_host;
    tr["relay_port"] = transport.relay_port;
    tr["inbox_port"] = transport.inbox_port;
    tr["restart_delay_ms"] = transport.restart_delay.count();
    tr["reconnect_base_delay_ms"] = transport.reconnect_base_delay.count();
    tr["reconnect_max_delay_ms"] = transport.reconnect_max_delay.count();
    tr["max_reconnect_attempts"] = transport.max_reconnect_attempts;

    json::array models;
    for (const auto& m : device.local_models) models.emplace_back(m);

    json::object dev;
    dev["code"] = device.code;
    dev["device_id"] = device.device_id;
    dev["device_name"] = device.device_name;
    dev["device_type"] = device.device_type;
    dev["gpu_type"] = device.gpu_type;
    dev["ip"] = device.ip;
    dev["gateway_address"] = device.gateway_address;
    dev["reward_address"] = device.reward_address;
    dev["gateway_peer_id"] = device.gateway_peer_id;
    dev["local_models"] = std::move(models);
    dev["heartbeat_interval_ms"] = device.heartbeat_interval.count();
    dev["registration_timeout_ms"] = device.registration_timeout.count();

    json::object root;
    root["transport"] = std::move(tr);
    root["device"] = std::move(dev);
    root["inference"] = json::object{{"base_url", inference.base_url}};
    json::object components;
    for (const auto& [name, level] : log_components) {
        components[name] = level;
    }
    root["log"] = json::object{{"level", log_level}, {"file", log_file}, {"components", std::move(components)}};
    return root;
}

// ============================================================================
// Transport resolution
// ============================================================================

TransportConfig resolve_transport_config(const std::optional<std::string>& cli_value,
                                         const TunnelConfig& file_config) {
    TransportConfig result;
    result.updated_at = std::chrono::system_clock::now();

    if (cli_value) {
        if (auto t = parse_transport_type(*cli_value)) {
            result.type = *t;
            result.source = ConfigSource::CLI;
            return result;
        }
        logger().warn("Ignoring unknown --transport value: {}", *cli_value);
    }

    for (const char* name : {"SIGHTLINK_TRANSPORT", "COMMUNICATION_TYPE"}) {
        if (const char* env = std::getenv(name)) {
            if (auto t = parse_transport_type(env)) {
                result.type = *t;
                result.source = ConfigSource::ENV;
                return result;
            }
            logger().warn("Ignoring unknown {}={}", name, env);
        }
    }

    if (file_config.transport.type) {
        result.type = *file_config.transport.type;
        result.source = ConfigSource::CONFIG_FILE;
        return result;
    }

    result.type = TransportType::RELAY;
    result.source = ConfigSource::DEFAULT;
    return result;
}

// ============================================================================
// ConfigStore
// ============================================================================

void ConfigStore::update_transport(TransportType type, bool requires_restart) {
    transport_.type = type;
    transport_.requires_restart = requires_restart;
    transport_.updated_at = std::chrono::system_clock::now();
    config_.transport.type = type;
    logger().info("Transport config updated: {} (restart required: {})",
                  transport_type_to_string(type), requires_restart);
}

} // namespace sightlink
