#include "tunnel/handlers/device_handlers.hpp"
#include "tunnel/events.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

namespace sightlink::tunnel {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::DEVICE_LOGGER);
    return instance;
}

} // anonymous namespace

VoidResult RegisterAckHandler::do_handle(const Envelope& envelope) {
    auto ack = RegisterAck::from_payload(envelope.payload);
    logger().info("Register ack from {}: success={} deviceId={}", envelope.from, ack.success, ack.device_id);
    lifecycle_.handle_register_ack(ack);
    return {};
}

VoidResult HeartbeatReportHandler::do_handle(const Envelope& envelope) {
    if (!session_.is_device_connected(envelope.from)) {
        logger().info("Device {} connected (first heartbeat)", envelope.from);
    }
    session_.mark_device_connected(envelope.from);

    logger().debug("Heartbeat from {}: cpu {:.1f}% mem {:.1f}%", envelope.from,
                   jnum(envelope.payload, "cpu_usage"), jnum(envelope.payload, "memory_usage"));

    events::HeartbeatReceived received;
    received.device_id = envelope.from;
    received.payload = envelope.payload;
    bus_.publish(received);
    return {};
}

} // namespace sightlink::tunnel
