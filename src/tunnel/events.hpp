#pragma once

#include "common/config.hpp"
#include "common/event_bus.hpp"
#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"

#include <string>

namespace sightlink::tunnel {

// ============================================================================
// Tunnel Events
// ============================================================================

namespace events {

struct ConnectionEstablished : TypedEvent<ConnectionEstablished> {
    std::string device_id;
    std::string gateway_url;
};

struct ConnectionLost : TypedEvent<ConnectionLost> {
    std::string device_id;
    std::string reason;
};

struct DeviceRegistered : TypedEvent<DeviceRegistered> {
    std::string device_id;
    std::string peer_id;
};

struct RegistrationFailed : TypedEvent<RegistrationFailed> {
    std::string device_id;
    TunnelError error;
};

struct MessageReceived : TypedEvent<MessageReceived> {
    Envelope envelope;
};

struct MessageSent : TypedEvent<MessageSent> {
    Envelope envelope;
};

struct MessageFailed : TypedEvent<MessageFailed> {
    Envelope envelope;
    TunnelError error;
};

struct HeartbeatReceived : TypedEvent<HeartbeatReceived> {
    std::string device_id;
    json::object payload;
};

struct TransportSwitched : TypedEvent<TransportSwitched> {
    TransportType from = TransportType::RELAY;
    TransportType to = TransportType::RELAY;
    bool restart_scheduled = false;
};

struct TransportError : TypedEvent<TransportError> {
    TunnelError error;
};

} // namespace events

} // namespace sightlink::tunnel
