#pragma once

#include "tunnel/message_handler.hpp"
#include "tunnel/tunnel_router.hpp"

#include <string_view>

namespace sightlink::tunnel {

// ============================================================================
// Forwarding Handler (outcome)
// ============================================================================
// Every outbound type ends here: after the type check the envelope is handed
// to the transport unchanged.
class ForwardingHandler : public MessageHandler {
public:
    ForwardingHandler(std::string_view type, TunnelRouter& router)
        : MessageHandler(type, Direction::OUTCOME), router_(router) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    TunnelRouter& router_;
};

// ============================================================================
// Logging Handler (income)
// ============================================================================
// Acknowledgements and responses that need no work; listeners do the
// correlation before this runs.
class LoggingHandler : public MessageHandler {
public:
    explicit LoggingHandler(std::string_view type)
        : MessageHandler(type, Direction::INCOME) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;
};

// Outcome envelope back to the sender of an income one
VoidResult send_reply(TunnelRouter& router, const Envelope& request,
                      std::string_view type, json::object payload);

} // namespace sightlink::tunnel
