#pragma once

#include "tunnel/message_handler.hpp"
#include "tunnel/tunnel_router.hpp"

namespace sightlink::tunnel {

// ============================================================================
// Ping / Pong
// ============================================================================

// ping -> pong {message:"pong", timestamp:<ping timestamp>}
class PingHandler : public MessageHandler {
public:
    explicit PingHandler(TunnelRouter& router)
        : MessageHandler(msg::PING, Direction::INCOME), router_(router) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    TunnelRouter& router_;
};

class PongHandler : public MessageHandler {
public:
    PongHandler() : MessageHandler(msg::PONG, Direction::INCOME) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;
};

// context-ping -> context-pong carrying the same requestId
class ContextPingHandler : public MessageHandler {
public:
    explicit ContextPingHandler(TunnelRouter& router)
        : MessageHandler(msg::CONTEXT_PING, Direction::INCOME), router_(router) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    TunnelRouter& router_;
};

class ContextPongHandler : public MessageHandler {
public:
    ContextPongHandler() : MessageHandler(msg::CONTEXT_PONG, Direction::INCOME) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;
};

} // namespace sightlink::tunnel
