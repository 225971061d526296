#pragma once

#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"
#include "tunnel/inference_executor.hpp"
#include "tunnel/session_context.hpp"
#include "tunnel/tunnel_router.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace sightlink::tunnel {

namespace net = boost::asio;

struct ProxyOptions {
    std::chrono::milliseconds timeout{30000};
};

// Receives proxy_response.data, or SERVICE_UNAVAILABLE / TIMEOUT / CONNECTION
using ProxyHandler = std::function<void(Result<json::value>)>;

// ============================================================================
// Proxy Dispatcher
// ============================================================================
// Sends a proxy_request to the first connected device and correlates the
// proxy_response by taskId through a one-shot router listener.
class ProxyDispatcher {
public:
    ProxyDispatcher(net::io_context& ioc,
                    SessionContext& session,
                    TunnelRouter& router,
                    ProxyOptions options = {});
    ~ProxyDispatcher();

    ProxyDispatcher(const ProxyDispatcher&) = delete;
    ProxyDispatcher& operator=(const ProxyDispatcher&) = delete;

    // Returns the taskId; handler fires exactly once unless this returns an error
    Result<std::string> dispatch(const ProxyRequest& request, ProxyHandler handler);

    size_t pending() const { return pending_.size(); }

    // Teardown: every in-flight request resolves with CONNECTION
    void cancel_all();

private:
    struct Pending {
        ListenerId listener = 0;
        std::unique_ptr<net::steady_timer> timer;
        ProxyHandler handler;
    };

    void on_response(const std::string& task_id, const Envelope& envelope);
    void resolve(const std::string& task_id, Result<json::value> result);

    net::io_context& ioc_;
    SessionContext& session_;
    TunnelRouter& router_;
    ProxyOptions options_;

    std::map<std::string, Pending> pending_;
    uint64_t sequence_ = 0;
};

} // namespace sightlink::tunnel
