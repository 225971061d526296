#include "node/node.hpp"
#include "common/config.hpp"
#include "common/log.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace sightlink;

namespace {

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/sightlink/node.json";

void print_usage(const char* program) {
    std::cout << "SightLink Node\n\n"
              << "Usage: " << program << " [options] <command>\n\n"
              << "Commands:\n"
              << "  run                   Connect, register and serve tunnel traffic (default)\n"
              << "  init                  Generate config file\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -t, --transport <t>   Transport: duplex | relay (overrides env and config)\n"
              << "  -u, --url <url>       Gateway URL (overrides config)\n"
              << "  -a, --auth-code <c>   Auth code sent on the duplex upgrade\n"
              << "  -l, --log-level <l>   Log level: trace/debug/info/warn/error\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n\n"
              << "Environment:\n"
              << "  SIGHTLINK_TRANSPORT, SIGHTLINK_GATEWAY_URL, SIGHTLINK_AUTH_CODE,\n"
              << "  SIGHTLINK_RELAY_PORT, SIGHTLINK_LOG_LEVEL, SIGHTLINK_LOG_FILE\n\n"
              << "Signals:\n"
              << "  SIGINT/SIGTERM stop, SIGHUP reloads the config file\n\n"
              << "Examples:\n"
              << "  " << program << " run -c node.json\n"
              << "  " << program << " run -t duplex -u wss://gateway.example.com --auth-code <CODE>\n"
              << "  " << program << " init --output node.json\n"
              << std::endl;
}

// Precedence: -q, -l, SIGHTLINK_LOG_*, config file "log" section
void setup_logging(const std::string& cli_level, const TunnelConfig* config, bool quiet) {
    log::LogConfig log_config;
    if (config) {
        log_config.level = log::parse_level(config->log_level);
        log_config.file_path = config->log_file;
        for (const auto& [name, level] : config->log_components) {
            log_config.component_levels[name] = log::parse_level(level);
        }
    }
    if (const char* level = std::getenv("SIGHTLINK_LOG_LEVEL")) {
        log_config.level = log::parse_level(level);
    }
    if (const char* file = std::getenv("SIGHTLINK_LOG_FILE")) {
        log_config.file_path = file;
    }
    if (!cli_level.empty()) {
        log_config.level = log::parse_level(cli_level);
    }
    if (quiet) {
        log_config.level = log::Level::Off;
        log_config.component_levels.clear();
    }

    // Re-init: config loading already logged through the early setup
    log::shutdown();
    log::init(log_config);
}

int cmd_init(const std::vector<std::string>& args) {
    std::string output = "node.json";
    std::string url;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--output" && i + 1 < args.size()) {
            output = args[i + 1];
        } else if (args[i] == "--url" && i + 1 < args.size()) {
            url = args[i + 1];
        }
    }

    TunnelConfig config;
    config.transport.gateway_url = url.empty() ? "wss://gateway.example.com" : url;
    config.device.device_id = "device-001";
    config.device.device_name = "sightlink-node";

    std::ofstream f(output);
    if (!f) {
        std::cerr << "Error: Cannot write to " << output << "\n";
        return 1;
    }
    f << boost::json::serialize(config.to_json()) << "\n";

    std::cout << "Config created: " << output << "\n";
    if (url.empty()) {
        std::cout << "Update transport.gateway_url and device.device_id before use!\n";
    }
    return 0;
}

int cmd_run(ConfigStore& store, const node::TunnelNode::Options& options) {
    try {
        boost::asio::io_context ioc;
        node::TunnelNode tunnel_node(ioc, store, options);

        bool shutdown_requested = false;
        boost::asio::signal_set stop_signals(ioc, SIGINT, SIGTERM);
        boost::asio::signal_set reload_signals(ioc, SIGHUP);

        stop_signals.async_wait([&](boost::system::error_code ec, int signal_number) {
            if (ec) return;
            LOG_INFO("Received signal {}, shutting down...", signal_number);
            shutdown_requested = true;
            tunnel_node.stop();
            reload_signals.cancel();
        });

        std::function<void()> wait_reload;
        wait_reload = [&]() {
            reload_signals.async_wait([&](boost::system::error_code ec, int) {
                if (ec) return;
                LOG_INFO("Received SIGHUP, reloading configuration");
                tunnel_node.reload();
                wait_reload();
            });
        };
        wait_reload();

        if (auto started = tunnel_node.start(); !started) {
            LOG_ERROR("Failed to start node: {}", started.error().to_string());
            return 1;
        }

        ioc.run();

        LOG_INFO("Node stopped");
        return shutdown_requested ? 0 : 1;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::optional<std::string> transport;
    std::string gateway_url;
    std::string auth_code;
    std::string log_level;
    bool quiet = false;
    std::string command;
    std::vector<std::string> cmd_args;

    // Options can appear before or after the command
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "-t" || arg == "--transport") && i + 1 < argc) {
            transport = argv[++i];
        }
        else if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
            gateway_url = argv[++i];
        }
        else if ((arg == "-a" || arg == "--auth-code") && i + 1 < argc) {
            auth_code = argv[++i];
        }
        else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
        else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        }
        else if (arg == "--output" && i + 1 < argc) {
            cmd_args.push_back(arg);
            cmd_args.push_back(argv[++i]);
        }
        else if (arg[0] != '-') {
            if (arg == "run" || arg == "init") {
                command = arg;
            } else {
                cmd_args.push_back(arg);
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (command == "init") {
        return cmd_init(cmd_args);
    }
    if (!command.empty() && command != "run") {
        print_usage(argv[0]);
        return 1;
    }

    setup_logging(log_level, nullptr, quiet);

    // Load config; an explicit -c must exist, the default path may not
    TunnelConfig config;
    bool explicit_config = !config_file.empty();
    if (!explicit_config) {
        config_file = DEFAULT_CONFIG_PATH;
    }
    auto loaded = TunnelConfig::load(config_file);
    if (loaded) {
        config = std::move(*loaded);
    } else if (explicit_config || loaded.error() != ConfigError::FILE_NOT_FOUND) {
        std::cerr << "Error: " << config_error_message(loaded.error()) << ": " << config_file << "\n";
        return 1;
    } else {
        config_file.clear();
    }
    config.apply_env_overrides();

    if (!gateway_url.empty()) config.transport.gateway_url = gateway_url;
    if (!auth_code.empty()) config.transport.auth_code = auth_code;
    setup_logging(log_level, &config, quiet);

    if (!config_file.empty()) {
        LOG_INFO("Config loaded: {}", config_file);
    }

    auto resolved = resolve_transport_config(transport, config);
    if (resolved.type == TransportType::DUPLEX && config.transport.gateway_url.empty()) {
        std::cerr << "Error: Gateway URL required for duplex transport. Use -u or config file.\n";
        return 1;
    }
    if (config.device.device_id.empty()) {
        LOG_WARN("device.device_id is empty; registration will be refused");
    }

    ConfigStore store(std::move(config), resolved);

    node::TunnelNode::Options options;
    options.config_path = config_file;
    options.argv.assign(argv, argv + argc);

    int rc = cmd_run(store, options);
    log::shutdown();
    return rc;
}
