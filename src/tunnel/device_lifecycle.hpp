#pragma once

#include "common/config.hpp"
#include "common/event_bus.hpp"
#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"
#include "tunnel/session_context.hpp"
#include "tunnel/system_info.hpp"
#include "tunnel/tunnel_router.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sightlink::tunnel {

namespace net = boost::asio;

// ============================================================================
// Device State
// ============================================================================
enum class DeviceState : uint8_t {
    UNREGISTERED = 0,
    REGISTERING,
    REGISTERED,
    HEARTBEATING,
};

constexpr std::string_view device_state_to_string(DeviceState state) {
    switch (state) {
        case DeviceState::UNREGISTERED: return "UNREGISTERED";
        case DeviceState::REGISTERING:  return "REGISTERING";
        case DeviceState::REGISTERED:   return "REGISTERED";
        case DeviceState::HEARTBEATING: return "HEARTBEATING";
        default:                        return "UNKNOWN";
    }
}

struct DeviceOptions {
    std::string code;
    std::string device_id;
    std::string device_name;
    std::string device_type = "linux";
    std::string gpu_type;
    std::string ip;
    std::string gateway_address;
    std::string reward_address;
    std::string gateway_peer_id = "gateway";
    std::vector<std::string> local_models;
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds registration_timeout{30000};

    static DeviceOptions from_config(const TunnelConfig& config);
};

struct RegisterAck {
    bool success = false;
    std::string device_id;
    std::string message;
    std::string error;

    static RegisterAck from_payload(const json::object& payload);
};

// Receives the confirmed peer id, or DEVICE_REGISTRATION
using RegistrationHandler = std::function<void(Result<std::string>)>;

// ============================================================================
// Device Lifecycle
// ============================================================================
// register request -> ack -> peer id set -> heartbeat now, then every
// heartbeat_interval. Heartbeats never start before a successful ack.
class DeviceLifecycle {
public:
    DeviceLifecycle(net::io_context& ioc,
                    SessionContext& session,
                    TunnelRouter& router,
                    SystemInfoCollector& system_info,
                    EventBus& bus,
                    DeviceOptions options);
    ~DeviceLifecycle();

    DeviceLifecycle(const DeviceLifecycle&) = delete;
    DeviceLifecycle& operator=(const DeviceLifecycle&) = delete;

    // Sends device_register_request; handler fires on ack, failure or deadline
    VoidResult register_device(RegistrationHandler handler = {});

    void handle_register_ack(const RegisterAck& ack);

    VoidResult send_heartbeat();

    // Stops timers and forgets the peer identity
    void unregister();

    // Stops timers only
    void stop();

    DeviceState state() const { return state_; }
    const DeviceOptions& options() const { return options_; }
    uint64_t heartbeats_sent() const { return heartbeats_sent_; }

    json::object build_register_payload() const;
    json::object build_heartbeat_payload(const SystemInfo& info) const;

private:
    void fail_registration(const TunnelError& error);
    void send_model_report();
    void schedule_heartbeat();
    void transition_to(DeviceState new_state);

    SessionContext& session_;
    TunnelRouter& router_;
    SystemInfoCollector& system_info_;
    EventBus& bus_;
    DeviceOptions options_;

    DeviceState state_ = DeviceState::UNREGISTERED;
    RegistrationHandler pending_handler_;
    // Ignores stale send completions from an earlier registration cycle
    uint64_t registration_cycle_ = 0;

    net::steady_timer heartbeat_timer_;
    net::steady_timer registration_timer_;
    uint64_t heartbeats_sent_ = 0;
};

} // namespace sightlink::tunnel
