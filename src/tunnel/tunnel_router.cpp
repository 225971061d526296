#include "tunnel/tunnel_router.hpp"
#include "tunnel/events.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace sightlink::tunnel {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::TUNNEL_LOGGER);
    return instance;
}

} // anonymous namespace

TunnelRouter::TunnelRouter(SessionContext& session,
                           HandlerRegistry& registry,
                           TransportGateway& transport,
                           EventBus& bus)
    : session_(session)
    , registry_(registry)
    , transport_(transport)
    , bus_(bus)
{
}

void TunnelRouter::attach() {
    transport_.on_message([this](const Envelope& envelope) {
        // Result already logged and published inside dispatch
        (void)dispatch(envelope);
    });

    transport_.on_connection_change([this](bool connected, const std::string& reason) {
        auto device = transport_.device_id().value_or(session_.routing_identity());
        if (connected) {
            logger().info("TunnelRouter: Gateway connection established");
            events::ConnectionEstablished event;
            event.device_id = device;
            event.gateway_url = transport_.connection_status().url.value_or("");
            bus_.publish(event);
        } else {
            logger().warn("TunnelRouter: Gateway connection lost: {}", reason);
            events::ConnectionLost event;
            event.device_id = device;
            event.reason = reason;
            bus_.publish(event);
        }
    });

    transport_.on_error([this](const TunnelError& error) {
        logger().error("TunnelRouter: Transport error: {}", error.to_string());
        events::TransportError event;
        event.error = error;
        bus_.publish(event);
    });
}

VoidResult TunnelRouter::dispatch(const Envelope& envelope, std::optional<Listener> listener) {
    std::optional<ListenerId> appended;
    return dispatch_impl(envelope, listener, appended);
}

Result<ListenerId> TunnelRouter::dispatch_with_listener(const Envelope& envelope, Listener listener) {
    std::optional<Listener> pending = std::move(listener);
    std::optional<ListenerId> appended;
    auto result = dispatch_impl(envelope, pending, appended);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!appended) {
        return std::unexpected(TunnelError::validation(
            fmt::format("'{}' {} -> {} was dropped", envelope.type, envelope.from, envelope.to)));
    }
    return *appended;
}

VoidResult TunnelRouter::dispatch_impl(const Envelope& envelope, std::optional<Listener>& listener,
                                       std::optional<ListenerId>& appended) {
    if (envelope.is_self_addressed()) {
        logger().debug("TunnelRouter: Ignoring self-addressed '{}' ({})", envelope.type, envelope.from);
        stats_.dropped++;
        return {};
    }

    auto validated = validate_envelope(envelope);
    if (!validated) {
        logger().warn("TunnelRouter: Dropping '{}' {} -> {}: {}", envelope.type, envelope.from,
                      envelope.to, validated.error().to_string());
        record_failure(envelope, validated.error());
        return std::unexpected(validated.error());
    }
    const Envelope& message = *validated;

    events::MessageReceived received;
    received.envelope = message;
    bus_.publish(received);

    auto local = session_.routing_identity();
    if (!local.empty() && message.to == local) {
        return route(message, Direction::INCOME, listener, appended);
    }
    if (!local.empty() && message.from == local) {
        return route(message, Direction::OUTCOME, listener, appended);
    }

    // 设备 ID 切换期间可能出现
    logger().warn("TunnelRouter: Ignoring '{}' not addressed to this peer (local={}, {} -> {})",
                  message.type, local.empty() ? "<unset>" : local, message.from, message.to);
    stats_.dropped++;
    return {};
}

VoidResult TunnelRouter::route(const Envelope& envelope, Direction direction,
                               std::optional<Listener>& listener,
                               std::optional<ListenerId>& appended) {
    logger().debug("TunnelRouter: {} '{}' {} -> {}", direction_to_string(direction),
                   envelope.type, envelope.from, envelope.to);

    trigger_listeners(envelope);

    VoidResult result;
    try {
        result = registry_.dispatch(envelope, direction);
    } catch (const std::exception& e) {
        result = std::unexpected(TunnelError::handler(e.what()));
    }

    if (!result) {
        logger().error("TunnelRouter: {} '{}' {} -> {} (taskId={}) failed: {}",
                       direction_to_string(direction), envelope.type, envelope.from, envelope.to,
                       envelope.task_id(), result.error().to_string());
        record_failure(envelope, result.error());
        return result;
    }

    stats_.dispatched++;

    // Appended last so the handler's own output cannot trigger it
    if (listener) {
        appended = add_listener(std::move(*listener));
        listener.reset();
    }
    return {};
}

void TunnelRouter::trigger_listeners(const Envelope& envelope) {
    // Snapshot ids first: callbacks may add or remove listeners
    std::vector<ListenerId> ids;
    ids.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        ids.push_back(entry.id);
    }

    for (auto id : ids) {
        auto it = std::find_if(listeners_.begin(), listeners_.end(),
                               [id](const Entry& e) { return e.id == id; });
        if (it == listeners_.end()) {
            continue;
        }

        // Copy: the callback may erase this entry
        Listener listener = it->listener;
        if (!listener.match || !listener.match(envelope)) {
            continue;
        }

        try {
            if (listener.callback) {
                listener.callback(envelope);
            }
        } catch (const std::exception& e) {
            logger().error("TunnelRouter: Listener for '{}' threw: {}", envelope.type, e.what());
        }

        bool remove = listener.once ? listener.once(envelope) : false;
        if (remove) {
            remove_listener(id);
        }
    }
}

VoidResult TunnelRouter::send_message(const Envelope& envelope, SendHandler handler) {
    auto result = transport_.send_message(envelope,
        [this, envelope, handler = std::move(handler)](VoidResult delivered) {
            if (delivered) {
                stats_.sent++;
                events::MessageSent sent;
                sent.envelope = envelope;
                bus_.publish(sent);
            } else {
                logger().error("TunnelRouter: Delivery of '{}' to {} failed: {}", envelope.type,
                               envelope.to, delivered.error().to_string());
                record_failure(envelope, delivered.error());
            }
            if (handler) {
                handler(std::move(delivered));
            }
        });

    if (!result) {
        logger().error("TunnelRouter: Cannot send '{}' to {}: {}", envelope.type, envelope.to,
                       result.error().to_string());
        record_failure(envelope, result.error());
    }
    return result;
}

ListenerId TunnelRouter::add_listener(Listener listener) {
    ListenerId id = next_listener_id_++;
    listeners_.push_back(Entry{id, std::move(listener)});
    return id;
}

bool TunnelRouter::remove_listener(ListenerId id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void TunnelRouter::clear() {
    if (!listeners_.empty()) {
        logger().info("TunnelRouter: Dropping {} listeners", listeners_.size());
    }
    listeners_.clear();
}

void TunnelRouter::record_failure(const Envelope& envelope, const TunnelError& error) {
    stats_.failed++;
    events::MessageFailed failed;
    failed.envelope = envelope;
    failed.error = error;
    bus_.publish(failed);
}

} // namespace sightlink::tunnel
