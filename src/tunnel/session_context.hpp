#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sightlink::tunnel {

// ============================================================================
// Session Context
// ============================================================================
// Holds the peer identity every routing decision reads. Created once at
// startup and shared by reference; only the device lifecycle writes it.
class SessionContext {
public:
    SessionContext() = default;

    // Identity confirmed by a successful registration ack
    const std::optional<std::string>& peer_id() const { return peer_id_; }
    bool has_peer_id() const { return peer_id_.has_value(); }

    void set_peer_id(std::string id);
    void reset_peer_id();

    // Identity announced in an in-flight register request
    void set_pending_peer_id(std::string id) { pending_peer_id_ = std::move(id); }
    void clear_pending_peer_id() { pending_peer_id_.reset(); }
    const std::optional<std::string>& pending_peer_id() const { return pending_peer_id_; }

    // peer_id when set, otherwise the pending registration identity so the
    // register ack addressed to it is routed as income. Empty when neither.
    std::string routing_identity() const;

    // Devices known to be connected, in first-seen order
    void mark_device_connected(const std::string& device_id);
    void mark_device_disconnected(const std::string& device_id);
    void clear_devices() { connected_devices_.clear(); }
    const std::vector<std::string>& connected_devices() const { return connected_devices_; }
    bool is_device_connected(const std::string& device_id) const;

private:
    std::optional<std::string> peer_id_;
    std::optional<std::string> pending_peer_id_;
    std::vector<std::string> connected_devices_;
};

} // namespace sightlink::tunnel
