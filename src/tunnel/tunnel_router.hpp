#pragma once

#include "common/event_bus.hpp"
#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"
#include "tunnel/handler_registry.hpp"
#include "tunnel/session_context.hpp"
#include "tunnel/transport_gateway.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace sightlink::tunnel {

// ============================================================================
// Listener
// ============================================================================
// Ad hoc correlation hook. After a match the callback runs, then once()
// decides whether the listener is removed.
struct Listener {
    std::function<bool(const Envelope&)> match;
    std::function<void(const Envelope&)> callback;
    std::function<bool(const Envelope&)> once;

    static Listener one_shot(std::function<bool(const Envelope&)> match,
                             std::function<void(const Envelope&)> callback) {
        return Listener{std::move(match), std::move(callback),
                        [](const Envelope&) { return true; }};
    }

    static Listener persistent(std::function<bool(const Envelope&)> match,
                               std::function<void(const Envelope&)> callback) {
        return Listener{std::move(match), std::move(callback), nullptr};
    }
};

using ListenerId = uint64_t;

// ============================================================================
// Tunnel Router
// ============================================================================
// Per envelope: drop self-loops, validate, pick direction from the session
// identity, fire matching listeners, run the handler, then append the
// listener that came with this dispatch. Handler failures stop here.
class TunnelRouter {
public:
    TunnelRouter(SessionContext& session,
                 HandlerRegistry& registry,
                 TransportGateway& transport,
                 EventBus& bus);

    TunnelRouter(const TunnelRouter&) = delete;
    TunnelRouter& operator=(const TunnelRouter&) = delete;

    // Wires the transport's message / connection / error callbacks
    void attach();

    VoidResult dispatch(const Envelope& envelope, std::optional<Listener> listener = std::nullopt);

    // dispatch() that reports the id of the appended listener; a dropped
    // envelope is an error here since nothing was appended
    Result<ListenerId> dispatch_with_listener(const Envelope& envelope, Listener listener);

    // Straight to the transport; MessageSent / MessageFailed are published
    VoidResult send_message(const Envelope& envelope, SendHandler handler = {});

    ListenerId add_listener(Listener listener);
    bool remove_listener(ListenerId id);
    size_t listener_count() const { return listeners_.size(); }

    // Teardown: drops every listener
    void clear();

    SessionContext& session() { return session_; }
    const SessionContext& session() const { return session_; }
    TransportGateway& transport() { return transport_; }
    EventBus& bus() { return bus_; }

    // Identity used for envelopes this peer emits
    std::string local_id() const { return session_.routing_identity(); }

    struct Stats {
        uint64_t dispatched = 0;
        uint64_t dropped = 0;
        uint64_t failed = 0;
        uint64_t sent = 0;
    };
    const Stats& stats() const { return stats_; }

private:
    VoidResult dispatch_impl(const Envelope& envelope, std::optional<Listener>& listener,
                             std::optional<ListenerId>& appended);
    VoidResult route(const Envelope& envelope, Direction direction, std::optional<Listener>& listener,
                     std::optional<ListenerId>& appended);
    void trigger_listeners(const Envelope& envelope);
    void record_failure(const Envelope& envelope, const TunnelError& error);

    SessionContext& session_;
    HandlerRegistry& registry_;
    TransportGateway& transport_;
    EventBus& bus_;

    struct Entry {
        ListenerId id;
        Listener listener;
    };
    std::vector<Entry> listeners_;
    ListenerId next_listener_id_{1};

    Stats stats_;
};

} // namespace sightlink::tunnel
