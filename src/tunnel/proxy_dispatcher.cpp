#include "tunnel/proxy_dispatcher.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

namespace sightlink::tunnel {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::PROXY_LOGGER);
    return instance;
}

} // anonymous namespace

ProxyDispatcher::ProxyDispatcher(net::io_context& ioc,
                                 SessionContext& session,
                                 TunnelRouter& router,
                                 ProxyOptions options)
    : ioc_(ioc)
    , session_(session)
    , router_(router)
    , options_(options)
{
}

ProxyDispatcher::~ProxyDispatcher() {
    // Handlers may reference objects that are already gone; drop silently
    for (auto& [task_id, entry] : pending_) {
        router_.remove_listener(entry.listener);
        entry.timer->cancel();
    }
    pending_.clear();
}

Result<std::string> ProxyDispatcher::dispatch(const ProxyRequest& request, ProxyHandler handler) {
    const auto& devices = session_.connected_devices();
    if (devices.empty()) {
        logger().warn("ProxyDispatcher: No device connected for {} {}", request.method, request.url);
        return std::unexpected(TunnelError::unavailable("no device connected"));
    }

    // 最简单的负载均衡: 取第一个设备
    const std::string device = devices.front();
    std::string task_id = fmt::format("proxy-{}-{}", device, ++sequence_);

    auto envelope = Envelope::make(msg::PROXY_REQUEST, router_.local_id(), device,
                                   json::object{{"taskId", task_id}, {"data", request.to_json()}});

    auto listener = Listener::one_shot(
        [task_id](const Envelope& env) {
            return env.type == msg::PROXY_RESPONSE && env.task_id() == task_id;
        },
        [this, task_id](const Envelope& env) {
            on_response(task_id, env);
        });

    // Registered before dispatch: a synchronous response must find its entry
    auto& entry = pending_[task_id];
    entry.handler = std::move(handler);
    entry.timer = std::make_unique<net::steady_timer>(ioc_);

    auto appended = router_.dispatch_with_listener(envelope, std::move(listener));
    if (!appended) {
        logger().error("ProxyDispatcher: Failed to dispatch {}: {}", task_id, appended.error().to_string());
        auto it = pending_.find(task_id);
        if (it != pending_.end()) {
            it->second.timer->cancel();
            pending_.erase(it);
        }
        return std::unexpected(appended.error());
    }

    auto it = pending_.find(task_id);
    if (it == pending_.end()) {
        // Already resolved during dispatch
        return task_id;
    }
    it->second.listener = *appended;

    it->second.timer->expires_after(options_.timeout);
    it->second.timer->async_wait([this, task_id](boost::system::error_code ec) {
        if (ec) {
            return;
        }
        auto found = pending_.find(task_id);
        if (found == pending_.end()) {
            return;
        }
        router_.remove_listener(found->second.listener);
        logger().warn("ProxyDispatcher: {} timed out after {}ms", task_id, options_.timeout.count());
        resolve(task_id, std::unexpected(TunnelError::timeout(
            fmt::format("no proxy_response for {} within {}ms", task_id, options_.timeout.count()))));
    });

    logger().debug("ProxyDispatcher: {} {} -> {} ({})", request.method, request.url, device, task_id);
    return task_id;
}

void ProxyDispatcher::on_response(const std::string& task_id, const Envelope& envelope) {
    if (auto error = jopt_str(envelope.payload, "error")) {
        resolve(task_id, std::unexpected(TunnelError::unavailable(*error)));
        return;
    }

    auto it = envelope.payload.find("data");
    resolve(task_id, it != envelope.payload.end() ? it->value() : json::value{});
}

void ProxyDispatcher::resolve(const std::string& task_id, Result<json::value> result) {
    auto it = pending_.find(task_id);
    if (it == pending_.end()) {
        return;
    }

    auto handler = std::move(it->second.handler);
    it->second.timer->cancel();
    pending_.erase(it);

    if (handler) {
        handler(std::move(result));
    }
}

void ProxyDispatcher::cancel_all() {
    if (pending_.empty()) {
        return;
    }
    logger().info("ProxyDispatcher: Cancelling {} pending request(s)", pending_.size());

    auto entries = std::move(pending_);
    pending_.clear();
    for (auto& [task_id, entry] : entries) {
        router_.remove_listener(entry.listener);
        entry.timer->cancel();
        if (entry.handler) {
            entry.handler(std::unexpected(TunnelError::connection("proxy request " + task_id + " cancelled")));
        }
    }
}

} // namespace sightlink::tunnel
