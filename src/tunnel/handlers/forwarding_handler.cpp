#include "tunnel/handlers/forwarding_handler.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

namespace sightlink::tunnel {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::TUNNEL_LOGGER);
    return instance;
}

} // anonymous namespace

VoidResult ForwardingHandler::do_handle(const Envelope& envelope) {
    // Delivery failures are logged and published by the router
    return router_.send_message(envelope);
}

VoidResult LoggingHandler::do_handle(const Envelope& envelope) {
    auto task_id = envelope.task_id();
    if (auto error = jopt_str(envelope.payload, "error")) {
        logger().warn("Received '{}' from {}{}: {}", envelope.type, envelope.from,
                      task_id.empty() ? "" : " (taskId=" + task_id + ")", *error);
        return {};
    }
    logger().info("Received '{}' from {}{}", envelope.type, envelope.from,
                  task_id.empty() ? "" : " (taskId=" + task_id + ")");
    return {};
}

VoidResult send_reply(TunnelRouter& router, const Envelope& request,
                      std::string_view type, json::object payload) {
    return router.dispatch(Envelope::make(type, request.to, request.from, std::move(payload)));
}

} // namespace sightlink::tunnel
