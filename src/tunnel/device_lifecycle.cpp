#include "tunnel/device_lifecycle.hpp"
#include "tunnel/events.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

namespace sightlink::tunnel {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::DEVICE_LOGGER);
    return instance;
}

} // anonymous namespace

DeviceOptions DeviceOptions::from_config(const TunnelConfig& config) {
    const auto& d = config.device;
    DeviceOptions options;
    options.code = d.code;
    options.device_id = d.device_id;
    options.device_name = d.device_name;
    options.device_type = d.device_type;
    options.gpu_type = d.gpu_type;
    options.ip = d.ip;
    options.gateway_address = d.gateway_address;
    options.reward_address = d.reward_address;
    options.gateway_peer_id = d.gateway_peer_id;
    options.local_models = d.local_models;
    options.heartbeat_interval = d.heartbeat_interval;
    options.registration_timeout = d.registration_timeout;
    return options;
}

RegisterAck RegisterAck::from_payload(const json::object& payload) {
    RegisterAck ack;
    ack.success = jbool(payload, "success");
    ack.device_id = jstr(payload, "deviceId");
    ack.message = jstr(payload, "message");
    ack.error = jstr(payload, "error");
    return ack;
}

DeviceLifecycle::DeviceLifecycle(net::io_context& ioc,
                                 SessionContext& session,
                                 TunnelRouter& router,
                                 SystemInfoCollector& system_info,
                                 EventBus& bus,
                                 DeviceOptions options)
    : session_(session)
    , router_(router)
    , system_info_(system_info)
    , bus_(bus)
    , options_(std::move(options))
    , heartbeat_timer_(ioc)
    , registration_timer_(ioc)
{
}

DeviceLifecycle::~DeviceLifecycle() {
    stop();
}

void DeviceLifecycle::transition_to(DeviceState new_state) {
    DeviceState old_state = state_;
    state_ = new_state;
    if (old_state != new_state) {
        logger().info("DeviceLifecycle: State {} -> {}", device_state_to_string(old_state),
                      device_state_to_string(new_state));
    }
}

// ============================================================================
// Registration
// ============================================================================

json::object DeviceLifecycle::build_register_payload() const {
    json::array models;
    for (const auto& model : options_.local_models) {
        models.emplace_back(model);
    }

    return json::object{
        {"code", options_.code},
        {"gateway_address", options_.gateway_address},
        {"reward_address", options_.reward_address},
        {"device_type", options_.device_type},
        {"gpu_type", options_.gpu_type},
        {"ip", options_.ip},
        {"device_id", options_.device_id},
        {"device_name", options_.device_name},
        {"local_models", std::move(models)},
    };
}

VoidResult DeviceLifecycle::register_device(RegistrationHandler handler) {
    if (state_ == DeviceState::REGISTERING) {
        return std::unexpected(TunnelError::registration("registration already in progress"));
    }
    if (options_.device_id.empty()) {
        return std::unexpected(TunnelError::registration("device id is not configured"));
    }

    stop();
    if (session_.has_peer_id()) {
        // New cycle: identity is re-established by the next ack
        session_.reset_peer_id();
    }
    session_.set_pending_peer_id(options_.device_id);

    auto envelope = Envelope::make(msg::DEVICE_REGISTER_REQUEST, options_.device_id,
                                   options_.gateway_peer_id, build_register_payload());

    uint64_t cycle = ++registration_cycle_;
    transition_to(DeviceState::REGISTERING);
    pending_handler_ = std::move(handler);

    // Sent directly: the envelope's "from" is not a confirmed identity yet
    auto sent = router_.send_message(envelope, [this, cycle](VoidResult delivered) {
        if (!delivered && cycle == registration_cycle_ && state_ == DeviceState::REGISTERING) {
            fail_registration(TunnelError::registration(
                "register request not delivered: " + delivered.error().message));
        }
    });
    if (!sent) {
        pending_handler_ = nullptr;
        session_.clear_pending_peer_id();
        transition_to(DeviceState::UNREGISTERED);
        return std::unexpected(TunnelError::registration(sent.error().message));
    }
    if (cycle != registration_cycle_) {
        // Delivery already failed and was reported to the handler
        return {};
    }

    logger().info("DeviceLifecycle: Registering {} with {}", options_.device_id, options_.gateway_peer_id);

    registration_timer_.expires_after(options_.registration_timeout);
    registration_timer_.async_wait([this, cycle](boost::system::error_code ec) {
        if (ec || cycle != registration_cycle_ || state_ != DeviceState::REGISTERING) {
            return;
        }
        fail_registration(TunnelError::registration(
            fmt::format("no register ack within {}ms", options_.registration_timeout.count())));
    });
    return {};
}

void DeviceLifecycle::handle_register_ack(const RegisterAck& ack) {
    if (state_ != DeviceState::REGISTERING) {
        logger().warn("DeviceLifecycle: Register ack received in state {}", device_state_to_string(state_));
    }
    registration_timer_.cancel();

    if (!ack.success) {
        auto reason = !ack.error.empty() ? ack.error
                      : !ack.message.empty() ? ack.message
                      : std::string("rejected by gateway");
        fail_registration(TunnelError::registration(reason));
        return;
    }

    auto peer_id = ack.device_id.empty() ? options_.device_id : ack.device_id;
    session_.set_peer_id(peer_id);
    transition_to(DeviceState::REGISTERED);
    logger().info("DeviceLifecycle: Registered as {}", peer_id);

    events::DeviceRegistered registered;
    registered.device_id = options_.device_id;
    registered.peer_id = peer_id;
    bus_.publish(registered);

    // First heartbeat right away, then on the interval
    if (auto r = send_heartbeat(); !r) {
        logger().warn("DeviceLifecycle: Initial heartbeat failed: {}", r.error().to_string());
    }
    schedule_heartbeat();
    transition_to(DeviceState::HEARTBEATING);

    if (!options_.local_models.empty()) {
        send_model_report();
    }

    if (pending_handler_) {
        auto handler = std::move(pending_handler_);
        pending_handler_ = nullptr;
        handler(peer_id);
    }
}

void DeviceLifecycle::fail_registration(const TunnelError& error) {
    logger().error("DeviceLifecycle: Registration failed: {}", error.to_string());

    ++registration_cycle_;
    heartbeat_timer_.cancel();
    registration_timer_.cancel();
    session_.clear_pending_peer_id();
    session_.reset_peer_id();
    transition_to(DeviceState::UNREGISTERED);

    events::RegistrationFailed failed;
    failed.device_id = options_.device_id;
    failed.error = error;
    bus_.publish(failed);

    if (pending_handler_) {
        auto handler = std::move(pending_handler_);
        pending_handler_ = nullptr;
        handler(std::unexpected(error));
    }
}

// ============================================================================
// Heartbeat
// ============================================================================

json::object DeviceLifecycle::build_heartbeat_payload(const SystemInfo& info) const {
    return json::object{
        {"code", options_.code},
        {"cpu_usage", info.cpu_usage},
        {"memory_usage", info.memory_usage},
        {"gpu_usage", info.gpu_usage},
        {"ip", options_.ip.empty() ? info.ip : options_.ip},
        {"timestamp", now_ms()},
        {"type", "heartbeat"},
        {"model", info.gpu_model},
        {"device_info", json::object{
            {"cpu_cores", info.cpu_cores},
            {"memory_total", info.memory_total_mb},
            {"gpu_memory", 0},
            {"disk_total", 0},
            {"os_info", info.os_info},
        }},
    };
}

VoidResult DeviceLifecycle::send_heartbeat() {
    if (!session_.has_peer_id()) {
        return std::unexpected(TunnelError::registration("heartbeat before registration"));
    }

    // Sampled now, not at registration time
    auto info = system_info_.collect();
    auto envelope = Envelope::make(msg::DEVICE_HEARTBEAT_REPORT, *session_.peer_id(),
                                   options_.gateway_peer_id, build_heartbeat_payload(info));

    auto result = router_.dispatch(envelope);
    if (!result) {
        return result;
    }
    heartbeats_sent_++;
    logger().debug("DeviceLifecycle: Heartbeat #{} (cpu {:.1f}%, mem {:.1f}%)", heartbeats_sent_,
                   info.cpu_usage, info.memory_usage);
    return {};
}

void DeviceLifecycle::schedule_heartbeat() {
    heartbeat_timer_.expires_after(options_.heartbeat_interval);
    heartbeat_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec) {
            return;
        }
        if (auto r = send_heartbeat(); !r) {
            // Keeps ticking; the next interval tries again
            logger().warn("DeviceLifecycle: Heartbeat failed: {}", r.error().to_string());
        }
        if (session_.has_peer_id()) {
            schedule_heartbeat();
        }
    });
}

void DeviceLifecycle::send_model_report() {
    json::array models;
    for (const auto& name : options_.local_models) {
        models.push_back(json::object{
            {"name", name},
            {"size", 0},
            {"details", json::object{{"family", ""}, {"parameter_size", ""}}},
        });
    }

    auto envelope = Envelope::make(msg::DEVICE_MODEL_REPORT, *session_.peer_id(),
                                   options_.gateway_peer_id,
                                   json::object{{"device_id", *session_.peer_id()}, {"models", std::move(models)}});
    if (auto r = router_.dispatch(envelope); !r) {
        logger().warn("DeviceLifecycle: Model report failed: {}", r.error().to_string());
    }
}

// ============================================================================
// Teardown
// ============================================================================

void DeviceLifecycle::unregister() {
    stop();
    session_.reset_peer_id();
    session_.clear_pending_peer_id();
    transition_to(DeviceState::UNREGISTERED);
}

void DeviceLifecycle::stop() {
    ++registration_cycle_;
    heartbeat_timer_.cancel();
    registration_timer_.cancel();
    pending_handler_ = nullptr;
    // Heartbeats seen over the old link say nothing about the next one
    session_.clear_devices();
    if (state_ == DeviceState::HEARTBEATING) {
        transition_to(DeviceState::REGISTERED);
    } else if (state_ == DeviceState::REGISTERING) {
        session_.clear_pending_peer_id();
        transition_to(DeviceState::UNREGISTERED);
    }
}

} // namespace sightlink::tunnel
