#pragma once

#include "common/config.hpp"
#include "common/event_bus.hpp"
#include "tunnel/errors.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>

namespace sightlink::tunnel {

namespace net = boost::asio;

// ============================================================================
// Switch Status
// ============================================================================
enum class SwitchStatus : uint8_t {
    IDLE = 0,
    SWITCHING,
    RESTARTING,
    ERROR,
};

constexpr std::string_view switch_status_to_string(SwitchStatus status) {
    switch (status) {
        case SwitchStatus::IDLE:       return "IDLE";
        case SwitchStatus::SWITCHING:  return "SWITCHING";
        case SwitchStatus::RESTARTING: return "RESTARTING";
        case SwitchStatus::ERROR:      return "ERROR";
        default:                       return "UNKNOWN";
    }
}

struct SwitchOptions {
    std::chrono::milliseconds restart_delay{3000};
    std::chrono::milliseconds error_reset{5000};
};

// Tears the tunnel down and brings it back on the stored transport type
using RestartFn = std::function<VoidResult()>;

// ============================================================================
// Transport Switcher
// ============================================================================
// Records a transport change in the ConfigStore and, optionally, schedules a
// restart that a later cancel_restart() can still call off.
class TransportSwitcher {
public:
    TransportSwitcher(net::io_context& ioc,
                      ConfigStore& store,
                      EventBus& bus,
                      RestartFn restart,
                      SwitchOptions options = {});
    ~TransportSwitcher();

    TransportSwitcher(const TransportSwitcher&) = delete;
    TransportSwitcher& operator=(const TransportSwitcher&) = delete;

    // false when type is already the current transport
    bool switch_transport(TransportType type, bool restart = true);
    bool switch_transport(TransportType type, bool restart, std::chrono::milliseconds delay);

    void cancel_restart();

    SwitchStatus status() const { return status_; }
    bool restart_pending() const { return restart_pending_; }
    TransportType current() const { return store_.transport().type; }

private:
    void schedule_restart(std::chrono::milliseconds delay);
    void run_restart();
    void transition_to(SwitchStatus new_status);

    ConfigStore& store_;
    EventBus& bus_;
    RestartFn restart_;
    SwitchOptions options_;

    SwitchStatus status_ = SwitchStatus::IDLE;
    bool restart_pending_ = false;
    net::steady_timer restart_timer_;
    net::steady_timer reset_timer_;
};

} // namespace sightlink::tunnel
