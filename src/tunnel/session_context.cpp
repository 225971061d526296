#include "tunnel/session_context.hpp"
#include "common/log.hpp"

#include <algorithm>

namespace sightlink::tunnel {

void SessionContext::set_peer_id(std::string id) {
    if (peer_id_ && *peer_id_ != id) {
        LOG_INFO("SessionContext: Peer identity {} -> {}", *peer_id_, id);
    } else if (!peer_id_) {
        LOG_INFO("SessionContext: Peer identity set to {}", id);
    }
    peer_id_ = std::move(id);
    pending_peer_id_.reset();
}

void SessionContext::reset_peer_id() {
    if (peer_id_) {
        LOG_INFO("SessionContext: Peer identity {} cleared", *peer_id_);
    }
    peer_id_.reset();
    pending_peer_id_.reset();
}

std::string SessionContext::routing_identity() const {
    if (peer_id_) return *peer_id_;
    if (pending_peer_id_) return *pending_peer_id_;
    return {};
}

void SessionContext::mark_device_connected(const std::string& device_id) {
    if (device_id.empty() || is_device_connected(device_id)) {
        return;
    }
    connected_devices_.push_back(device_id);
    LOG_DEBUG("SessionContext: Device {} connected ({} total)", device_id, connected_devices_.size());
}

void SessionContext::mark_device_disconnected(const std::string& device_id) {
    auto it = std::find(connected_devices_.begin(), connected_devices_.end(), device_id);
    if (it != connected_devices_.end()) {
        connected_devices_.erase(it);
        LOG_DEBUG("SessionContext: Device {} disconnected", device_id);
    }
}

bool SessionContext::is_device_connected(const std::string& device_id) const {
    return std::find(connected_devices_.begin(), connected_devices_.end(), device_id) !=
           connected_devices_.end();
}

} // namespace sightlink::tunnel
