#include <gtest/gtest.h>
#include "common/config.hpp"
#include "node/node.hpp"

#include <boost/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sightlink;

namespace {

// Clears the variables transport resolution reads, restoring nothing
class EnvGuard {
public:
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }

private:
    static void clear() {
        for (const char* name : {"SIGHTLINK_TRANSPORT", "COMMUNICATION_TYPE", "SIGHTLINK_GATEWAY_URL",
                                 "SIGHTLINK_AUTH_CODE", "SIGHTLINK_RELAY_PORT"}) {
            ::unsetenv(name);
        }
    }
};

} // namespace

TEST(ConfigTest, ParseFullConfig) {
    auto config = TunnelConfig::parse(R"({
        "transport": {
            "type": "websocket",
            "gateway_url": "ws://gw.example:8080",
            "auth_code": "secret",
            "base_path": "/tunnel",
            "relay_port": 5000,
            "reconnect_base_delay_ms": 500,
            "max_reconnect_attempts": 3
        },
        "device": {
            "code": "c-1",
            "device_id": "dev-1",
            "local_models": ["llama3", 7, "qwen"],
            "heartbeat_interval_ms": 1000
        },
        "inference": {"base_url": "http://127.0.0.1:9999"},
        "log": {"level": "debug", "file": "/tmp/node.log", "components": {"stream": "trace", "proxy": 3}}
    })");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->transport.type, TransportType::DUPLEX);
    EXPECT_EQ(config->transport.gateway_url, "ws://gw.example:8080");
    EXPECT_EQ(config->transport.base_path, "/tunnel");
    EXPECT_EQ(config->transport.relay_port, 5000);
    EXPECT_EQ(config->transport.reconnect_base_delay, std::chrono::milliseconds(500));
    EXPECT_EQ(config->transport.max_reconnect_attempts, 3u);
    EXPECT_EQ(config->device.device_id, "dev-1");
    ASSERT_EQ(config->device.local_models.size(), 2u);
    EXPECT_EQ(config->device.local_models[1], "qwen");
    EXPECT_EQ(config->device.heartbeat_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(config->inference.base_url, "http://127.0.0.1:9999");
    EXPECT_EQ(config->log_level, "debug");
    ASSERT_EQ(config->log_components.size(), 1u);
    EXPECT_EQ(config->log_components.at("stream"), "trace");
}

TEST(ConfigTest, DefaultsWhenSectionsMissing) {
    auto config = TunnelConfig::parse("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->transport.type.has_value());
    EXPECT_EQ(config->transport.relay_host, "127.0.0.1");
    EXPECT_EQ(config->transport.relay_port, 4010);
    EXPECT_EQ(config->transport.max_reconnect_attempts, 10u);
    EXPECT_EQ(config->device.gateway_peer_id, "gateway");
    EXPECT_EQ(config->device.heartbeat_interval, std::chrono::milliseconds(30000));
    EXPECT_EQ(config->log_level, "info");
}

TEST(ConfigTest, ParseErrors) {
    auto broken = TunnelConfig::parse("{not json");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error(), ConfigError::PARSE_ERROR);

    auto array = TunnelConfig::parse("[]");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error(), ConfigError::PARSE_ERROR);

    auto bad_type = TunnelConfig::parse(R"({"transport":{"type":"carrier-pigeon"}})");
    ASSERT_FALSE(bad_type.has_value());
    EXPECT_EQ(bad_type.error(), ConfigError::INVALID_VALUE);

    auto missing = TunnelConfig::load("/nonexistent/sightlink/node.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ConfigError::FILE_NOT_FOUND);
}

TEST(ConfigTest, LoadWrittenConfigRoundTrips) {
    TunnelConfig config;
    config.transport.type = TransportType::DUPLEX;
    config.transport.gateway_url = "wss://gw.example";
    config.device.device_id = "dev-7";
    config.device.local_models = {"llama3"};

    auto path = std::filesystem::temp_directory_path() / "sightlink_config_test.json";
    {
        std::ofstream out(path);
        out << boost::json::serialize(config.to_json());
    }

    auto loaded = TunnelConfig::load(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->transport.type, TransportType::DUPLEX);
    EXPECT_EQ(loaded->transport.gateway_url, "wss://gw.example");
    EXPECT_EQ(loaded->device.device_id, "dev-7");
    EXPECT_EQ(loaded->device.local_models, config.device.local_models);
}

TEST(ConfigTest, TransportTypeAliases) {
    EXPECT_EQ(parse_transport_type("duplex"), TransportType::DUPLEX);
    EXPECT_EQ(parse_transport_type("WebSocket"), TransportType::DUPLEX);
    EXPECT_EQ(parse_transport_type("socket"), TransportType::DUPLEX);
    EXPECT_EQ(parse_transport_type("relay"), TransportType::RELAY);
    EXPECT_EQ(parse_transport_type("LIBP2P"), TransportType::RELAY);
    EXPECT_FALSE(parse_transport_type("smoke-signal").has_value());
}

TEST(ConfigTest, TransportPriority) {
    EnvGuard guard;
    TunnelConfig file;

    auto fallback = resolve_transport_config(std::nullopt, file);
    EXPECT_EQ(fallback.type, TransportType::RELAY);
    EXPECT_EQ(fallback.source, ConfigSource::DEFAULT);

    file.transport.type = TransportType::DUPLEX;
    auto from_file = resolve_transport_config(std::nullopt, file);
    EXPECT_EQ(from_file.type, TransportType::DUPLEX);
    EXPECT_EQ(from_file.source, ConfigSource::CONFIG_FILE);

    ::setenv("COMMUNICATION_TYPE", "libp2p", 1);
    auto from_legacy_env = resolve_transport_config(std::nullopt, file);
    EXPECT_EQ(from_legacy_env.type, TransportType::RELAY);
    EXPECT_EQ(from_legacy_env.source, ConfigSource::ENV);

    ::setenv("SIGHTLINK_TRANSPORT", "socket", 1);
    auto from_env = resolve_transport_config(std::nullopt, file);
    EXPECT_EQ(from_env.type, TransportType::DUPLEX);
    EXPECT_EQ(from_env.source, ConfigSource::ENV);

    auto from_cli = resolve_transport_config(std::string("relay"), file);
    EXPECT_EQ(from_cli.type, TransportType::RELAY);
    EXPECT_EQ(from_cli.source, ConfigSource::CLI);

    // An unknown value falls through to the next source
    auto bad_cli = resolve_transport_config(std::string("pigeon"), file);
    EXPECT_EQ(bad_cli.source, ConfigSource::ENV);
}

TEST(ConfigTest, EnvOverrides) {
    EnvGuard guard;
    TunnelConfig config;
    ::setenv("SIGHTLINK_GATEWAY_URL", "ws://override:1", 1);
    ::setenv("SIGHTLINK_AUTH_CODE", "env-code", 1);
    ::setenv("SIGHTLINK_RELAY_PORT", "70000", 1);
    config.apply_env_overrides();

    EXPECT_EQ(config.transport.gateway_url, "ws://override:1");
    EXPECT_EQ(config.transport.auth_code, "env-code");
    EXPECT_EQ(config.transport.relay_port, 4010);

    ::setenv("SIGHTLINK_RELAY_PORT", "4500", 1);
    config.apply_env_overrides();
    EXPECT_EQ(config.transport.relay_port, 4500);
}

TEST(ConfigTest, StoreUpdateMarksRestart) {
    TransportConfig transport;
    transport.type = TransportType::RELAY;
    ConfigStore store(TunnelConfig{}, transport);

    store.update_transport(TransportType::DUPLEX, true);
    EXPECT_EQ(store.transport().type, TransportType::DUPLEX);
    EXPECT_TRUE(store.transport().requires_restart);
    EXPECT_EQ(store.config().transport.type, TransportType::DUPLEX);
}

TEST(RestartArgumentsTest, ReplacesTransportFlag) {
    std::vector<std::string> argv{"sightlink-node", "-c", "/etc/node.json", "-t", "relay", "run"};
    auto args = node::restart_arguments(argv, TransportType::DUPLEX);
    std::vector<std::string> expected{"sightlink-node", "-c", "/etc/node.json", "run",
                                      "--transport", "duplex"};
    EXPECT_EQ(args, expected);

    auto long_form = node::restart_arguments(
        {"sightlink-node", "--transport", "duplex", "--transport", "duplex"}, TransportType::RELAY);
    std::vector<std::string> expected_long{"sightlink-node", "--transport", "relay"};
    EXPECT_EQ(long_form, expected_long);
}
