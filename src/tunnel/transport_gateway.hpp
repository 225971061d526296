#pragma once

#include "common/config.hpp"
#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"

#include <functional>
#include <optional>
#include <string>

namespace sightlink::tunnel {

// ============================================================================
// Connection State
// ============================================================================
enum class ConnectionState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING,
    CONNECTED,
};

constexpr std::string_view connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        default:                            return "UNKNOWN";
    }
}

struct ConnectionStatus {
    bool connected = false;
    std::optional<std::string> device_id;
    std::optional<std::string> url;
};

using ConnectHandler = std::function<void(VoidResult)>;
using SendHandler = std::function<void(VoidResult)>;
using MessageCallback = std::function<void(const Envelope&)>;
using ConnectionChangeCallback = std::function<void(bool connected, const std::string& reason)>;
using ErrorCallback = std::function<void(const TunnelError&)>;

// ============================================================================
// Transport Gateway
// ============================================================================
// Owns the physical link to the gateway. Callbacks are single-slot: a later
// registration replaces the earlier one.
class TransportGateway {
public:
    virtual ~TransportGateway() = default;

    // handler fires once the channel reports connected, or with CONNECTION
    virtual void connect(const std::string& address,
                         const std::optional<std::string>& auth_code,
                         const std::optional<std::string>& base_path,
                         ConnectHandler handler) = 0;

    // Idempotent
    virtual void disconnect() = 0;

    // MESSAGE_SEND is returned synchronously when not connected; otherwise
    // the delivery outcome goes to handler (which may be empty)
    virtual VoidResult send_message(const Envelope& envelope, SendHandler handler) = 0;

    virtual bool is_connected() const = 0;
    virtual ConnectionStatus connection_status() const = 0;
    virtual TransportType transport_type() const = 0;

    void set_device_id(std::string device_id) { device_id_ = std::move(device_id); }
    const std::optional<std::string>& device_id() const { return device_id_; }

    void on_message(MessageCallback cb) { message_cb_ = std::move(cb); }
    void on_connection_change(ConnectionChangeCallback cb) { connection_cb_ = std::move(cb); }
    void on_error(ErrorCallback cb) { error_cb_ = std::move(cb); }

protected:
    void notify_message(const Envelope& envelope) const {
        if (message_cb_) message_cb_(envelope);
    }
    void notify_connection_change(bool connected, const std::string& reason) const {
        if (connection_cb_) connection_cb_(connected, reason);
    }
    void notify_error(const TunnelError& error) const {
        if (error_cb_) error_cb_(error);
    }

    std::optional<std::string> device_id_;

private:
    MessageCallback message_cb_;
    ConnectionChangeCallback connection_cb_;
    ErrorCallback error_cb_;
};

} // namespace sightlink::tunnel
