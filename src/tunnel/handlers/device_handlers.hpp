#pragma once

#include "common/event_bus.hpp"
#include "tunnel/device_lifecycle.hpp"
#include "tunnel/message_handler.hpp"
#include "tunnel/session_context.hpp"

namespace sightlink::tunnel {

// ============================================================================
// Device Handlers
// ============================================================================

class RegisterAckHandler : public MessageHandler {
public:
    explicit RegisterAckHandler(DeviceLifecycle& lifecycle)
        : MessageHandler(msg::DEVICE_REGISTER_ACK, Direction::INCOME), lifecycle_(lifecycle) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    DeviceLifecycle& lifecycle_;
};

// Marks the sender as a connected device, the set proxy dispatch draws from
class HeartbeatReportHandler : public MessageHandler {
public:
    HeartbeatReportHandler(SessionContext& session, EventBus& bus)
        : MessageHandler(msg::DEVICE_HEARTBEAT_REPORT, Direction::INCOME)
        , session_(session)
        , bus_(bus) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    SessionContext& session_;
    EventBus& bus_;
};

} // namespace sightlink::tunnel
