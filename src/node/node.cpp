#include "node/node.hpp"
#include "tunnel/events.hpp"
#include "tunnel/handlers/default_handlers.hpp"
#include "common/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <unistd.h>

namespace sightlink::node {

using namespace sightlink::tunnel;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::MAIN_LOGGER);
    return instance;
}

} // anonymous namespace

std::vector<std::string> restart_arguments(const std::vector<std::string>& argv, TransportType type) {
    std::vector<std::string> out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (argv[i] == "-t" || argv[i] == "--transport") {
            ++i;
            continue;
        }
        out.push_back(argv[i]);
    }
    out.emplace_back("--transport");
    out.emplace_back(transport_type_to_string(type));
    return out;
}

TunnelNode::TunnelNode(net::io_context& ioc, ConfigStore& store, Options options)
    : ioc_(ioc)
    , store_(store)
    , options_(std::move(options))
{
}

TunnelNode::~TunnelNode() {
    stop();
}

// ============================================================================
// Assembly
// ============================================================================

VoidResult TunnelNode::build() {
    const auto& config = store_.config();
    const auto type = store_.transport().type;

    if (type == TransportType::DUPLEX) {
        WsTransport::Options ws_options;
        ws_options.reconnect.initial_delay = config.transport.reconnect_base_delay;
        ws_options.reconnect.max_delay = config.transport.reconnect_max_delay;
        ws_options.reconnect.max_attempts = config.transport.max_reconnect_attempts;
        ws_ = WsTransport::create(ioc_, ws_options);
        transport_ = ws_;
    } else {
        RelayTransport::Options relay_options;
        relay_options.relay_host = config.transport.relay_host;
        relay_options.relay_port = config.transport.relay_port;
        relay_ = std::make_shared<RelayTransport>(ioc_, relay_options);
        transport_ = relay_;

        RelayInbox::Options inbox_options;
        inbox_options.port = config.transport.inbox_port;
        inbox_ = std::make_unique<RelayInbox>(ioc_, inbox_options,
            [relay = relay_.get()](const Envelope& envelope) { relay->receive_message(envelope); });
    }
    transport_->set_device_id(config.device.device_id);

    router_ = std::make_unique<TunnelRouter>(session_, registry_, *transport_, bus_);
    router_->attach();

    reassembler_ = StreamReassembler::create();
    system_info_ = std::make_unique<ProcSystemInfoCollector>(config.device.gpu_type, config.device.ip);

    HttpInferenceExecutor::Options executor_options;
    executor_options.base_url = config.inference.base_url;
    executor_ = std::make_unique<HttpInferenceExecutor>(ioc_, executor_options);

    lifecycle_ = std::make_unique<DeviceLifecycle>(ioc_, session_, *router_, *system_info_, bus_,
                                                   DeviceOptions::from_config(config));
    proxy_ = std::make_unique<ProxyDispatcher>(ioc_, session_, *router_);

    SwitchOptions switch_options;
    switch_options.restart_delay = config.transport.restart_delay;
    switcher_ = std::make_unique<TransportSwitcher>(ioc_, store_, bus_,
                                                    [this] { return restart_process(); },
                                                    switch_options);

    HandlerContext context{*router_, session_, bus_, *lifecycle_, reassembler_, *executor_};
    return install_default_handlers(registry_, context);
}

void TunnelNode::subscribe_events() {
    subscriptions_.push_back(bus_.subscribe<events::ConnectionEstablished>(
        [this](const events::ConnectionEstablished& e) {
            logger().info("Connected to {}", e.gateway_url);
            ensure_registered();
        }));

    subscriptions_.push_back(bus_.subscribe<events::ConnectionLost>(
        [this](const events::ConnectionLost& e) {
            logger().warn("Connection lost: {}", e.reason);
            // Registration is redone on the next ConnectionEstablished
            lifecycle_->stop();
        }));

    subscriptions_.push_back(bus_.subscribe<events::DeviceRegistered>(
        [](const events::DeviceRegistered& e) {
            logger().info("Device {} registered as {}", e.device_id, e.peer_id);
        }));

    subscriptions_.push_back(bus_.subscribe<events::TransportError>(
        [](const events::TransportError& e) {
            logger().error("Transport error: {}", e.error.to_string());
        }));
}

// ============================================================================
// Lifecycle
// ============================================================================

VoidResult TunnelNode::start() {
    if (running_) {
        return {};
    }

    const auto& config = store_.config();
    logger().info("SightLink node starting (transport: {}, source: {})",
                  transport_type_to_string(store_.transport().type),
                  config_source_to_string(store_.transport().source));

    if (auto r = build(); !r) {
        return r;
    }
    subscribe_events();

    if (inbox_) {
        if (auto r = inbox_->start(); !r) {
            return r;
        }
    }

    running_ = true;
    connect();
    return {};
}

void TunnelNode::connect() {
    const auto& transport = store_.config().transport;
    std::optional<std::string> auth_code;
    if (!transport.auth_code.empty()) auth_code = transport.auth_code;
    std::optional<std::string> base_path;
    if (!transport.base_path.empty()) base_path = transport.base_path;

    transport_->connect(transport.gateway_url, auth_code, base_path, [this](VoidResult result) {
        if (!result) {
            // The duplex transport keeps retrying on its own
            logger().error("Initial connect failed: {}", result.error().to_string());
            return;
        }
        ensure_registered();
    });
}

void TunnelNode::ensure_registered() {
    if (!running_) {
        return;
    }
    auto state = lifecycle_->state();
    if (state == DeviceState::REGISTERING || state == DeviceState::HEARTBEATING) {
        return;
    }

    auto sent = lifecycle_->register_device([](Result<std::string> result) {
        if (!result) {
            logger().error("Registration failed: {}", result.error().to_string());
        }
    });
    if (!sent) {
        logger().error("Cannot register: {}", sent.error().to_string());
    }
}

void TunnelNode::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    logger().info("SightLink node stopping");

    switcher_->cancel_restart();
    lifecycle_->unregister();
    proxy_->cancel_all();
    reassembler_->clear();
    router_->clear();
    if (inbox_) {
        inbox_->stop();
    }
    transport_->disconnect();
    subscriptions_.clear();
}

void TunnelNode::reload() {
    if (options_.config_path.empty()) {
        logger().warn("Reload requested but no configuration file is in use");
        return;
    }

    auto reloaded = TunnelConfig::load(options_.config_path);
    if (!reloaded) {
        logger().error("Reload of {} failed: {}", options_.config_path,
                       config_error_message(reloaded.error()));
        return;
    }
    reloaded->apply_env_overrides();

    auto resolved = resolve_transport_config(std::nullopt, *reloaded);
    logger().info("Reloaded {} (transport: {})", options_.config_path,
                  transport_type_to_string(resolved.type));
    switcher_->switch_transport(resolved.type);
}

VoidResult TunnelNode::restart_process() {
    auto type = store_.transport().type;
    logger().info("Restarting on {} transport", transport_type_to_string(type));

    std::error_code ec;
    auto exe_path = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec) {
        return std::unexpected(TunnelError::connection("cannot resolve executable: " + ec.message()));
    }

    auto args = restart_arguments(
        options_.argv.empty() ? std::vector<std::string>{exe_path.string()} : options_.argv, type);
    std::vector<char*> raw;
    raw.reserve(args.size() + 1);
    for (auto& arg : args) {
        raw.push_back(arg.data());
    }
    raw.push_back(nullptr);

    stop();
    log::flush();

    ::execv(exe_path.c_str(), raw.data());

    // Only reached when execv failed; the node is already torn down
    auto error = TunnelError::connection(std::string("execv failed: ") + std::strerror(errno));
    logger().error("Restart failed: {}", error.to_string());
    ioc_.stop();
    return std::unexpected(error);
}

} // namespace sightlink::node
