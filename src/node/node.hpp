#pragma once

#include "common/config.hpp"
#include "common/event_bus.hpp"
#include "tunnel/device_lifecycle.hpp"
#include "tunnel/handler_registry.hpp"
#include "tunnel/http_inference_executor.hpp"
#include "tunnel/proxy_dispatcher.hpp"
#include "tunnel/relay_inbox.hpp"
#include "tunnel/relay_transport.hpp"
#include "tunnel/session_context.hpp"
#include "tunnel/stream_reassembler.hpp"
#include "tunnel/system_info.hpp"
#include "tunnel/transport_switcher.hpp"
#include "tunnel/tunnel_router.hpp"
#include "tunnel/ws_transport.hpp"

#include <boost/asio.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sightlink::node {

namespace net = boost::asio;

// ============================================================================
// Tunnel Node
// ============================================================================
// Composition root: one transport, router, handler catalogue, reassembler,
// lifecycle, proxy dispatcher and switcher on a single io_context.
class TunnelNode {
public:
    struct Options {
        std::string config_path;
        // Command line of this process, replayed on restart
        std::vector<std::string> argv;
    };

    TunnelNode(net::io_context& ioc, ConfigStore& store, Options options);
    ~TunnelNode();

    TunnelNode(const TunnelNode&) = delete;
    TunnelNode& operator=(const TunnelNode&) = delete;

    // Builds the tunnel, connects and registers
    tunnel::VoidResult start();

    // Graceful teardown; idempotent
    void stop();

    // SIGHUP: re-read the configuration file, switch transport if it changed
    void reload();

    bool running() const { return running_; }
    TransportType transport_type() const { return store_.transport().type; }

    tunnel::TunnelRouter& router() { return *router_; }
    tunnel::TransportSwitcher& switcher() { return *switcher_; }
    tunnel::ProxyDispatcher& proxy() { return *proxy_; }
    tunnel::DeviceLifecycle& lifecycle() { return *lifecycle_; }

private:
    tunnel::VoidResult build();
    void subscribe_events();
    void connect();
    void ensure_registered();
    tunnel::VoidResult restart_process();

    net::io_context& ioc_;
    ConfigStore& store_;
    Options options_;

    EventBus bus_;
    tunnel::SessionContext session_;
    tunnel::HandlerRegistry registry_;

    std::shared_ptr<tunnel::TransportGateway> transport_;
    std::shared_ptr<tunnel::WsTransport> ws_;
    std::shared_ptr<tunnel::RelayTransport> relay_;
    std::unique_ptr<tunnel::RelayInbox> inbox_;

    std::unique_ptr<tunnel::TunnelRouter> router_;
    std::shared_ptr<tunnel::StreamReassembler> reassembler_;
    std::unique_ptr<tunnel::ProcSystemInfoCollector> system_info_;
    std::unique_ptr<tunnel::HttpInferenceExecutor> executor_;
    std::unique_ptr<tunnel::DeviceLifecycle> lifecycle_;
    std::unique_ptr<tunnel::ProxyDispatcher> proxy_;
    std::unique_ptr<tunnel::TransportSwitcher> switcher_;

    std::vector<SubscriptionHandle> subscriptions_;
    bool running_ = false;
};

// argv with every -t/--transport replaced by "--transport <type>"
std::vector<std::string> restart_arguments(const std::vector<std::string>& argv, TransportType type);

} // namespace sightlink::node
