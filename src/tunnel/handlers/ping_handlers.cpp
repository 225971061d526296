#include "tunnel/handlers/ping_handlers.hpp"
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

VoidResult PingHandler::do_handle(const Envelope& envelope) {
    logger().debug("Ping from {}: {}", envelope.from, jstr(envelope.payload, "message"));
    return send_reply(router_, envelope, msg::PONG, json::object{
        {"message", "pong"},
        {"timestamp", envelope.payload.at("timestamp")},
    });
}

VoidResult PongHandler::do_handle(const Envelope& envelope) {
    auto sent = jint(envelope.payload, "timestamp");
    logger().info("Pong from {}: round trip {}ms", envelope.from, now_ms() - sent);
    return {};
}

VoidResult ContextPingHandler::do_handle(const Envelope& envelope) {
    auto request_id = jstr(envelope.payload, "requestId");
    auto message = jstr(envelope.payload, "message");
    logger().debug("Context ping {} from {}: {}", request_id, envelope.from, message);

    return send_reply(router_, envelope, msg::CONTEXT_PONG, json::object{
        {"requestId", request_id},
        {"message", "Context Pong response to: " + message},
        {"timestamp", now_ms()},
    });
}

VoidResult ContextPongHandler::do_handle(const Envelope& envelope) {
    auto sent = jint(envelope.payload, "timestamp");
    logger().info("Context pong {} from {}: round trip {}ms", jstr(envelope.payload, "requestId"),
                  envelope.from, now_ms() - sent);
    return {};
}

} // namespace sightlink::tunnel
