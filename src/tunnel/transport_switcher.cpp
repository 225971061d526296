#include "tunnel/transport_switcher.hpp"
#include "tunnel/events.hpp"
#include "common/log.hpp"

namespace sightlink::tunnel {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::CONFIG_LOGGER);
    return instance;
}

} // anonymous namespace

TransportSwitcher::TransportSwitcher(net::io_context& ioc,
                                     ConfigStore& store,
                                     EventBus& bus,
                                     RestartFn restart,
                                     SwitchOptions options)
    : store_(store)
    , bus_(bus)
    , restart_(std::move(restart))
    , options_(options)
    , restart_timer_(ioc)
    , reset_timer_(ioc)
{
}

TransportSwitcher::~TransportSwitcher() {
    restart_timer_.cancel();
    reset_timer_.cancel();
}

void TransportSwitcher::transition_to(SwitchStatus new_status) {
    SwitchStatus old_status = status_;
    status_ = new_status;
    if (old_status != new_status) {
        logger().info("TransportSwitcher: State {} -> {}", switch_status_to_string(old_status),
                      switch_status_to_string(new_status));
    }
}

bool TransportSwitcher::switch_transport(TransportType type, bool restart) {
    return switch_transport(type, restart, options_.restart_delay);
}

bool TransportSwitcher::switch_transport(TransportType type, bool restart,
                                         std::chrono::milliseconds delay) {
    TransportType from = store_.transport().type;
    if (from == type) {
        logger().info("TransportSwitcher: Already using {}", transport_type_to_string(type));
        return false;
    }

    transition_to(SwitchStatus::SWITCHING);
    store_.update_transport(type, restart);
    logger().info("TransportSwitcher: Transport {} -> {}", transport_type_to_string(from),
                  transport_type_to_string(type));

    events::TransportSwitched switched;
    switched.from = from;
    switched.to = type;
    switched.restart_scheduled = restart;
    bus_.publish(switched);

    if (restart) {
        schedule_restart(delay);
    } else {
        transition_to(SwitchStatus::IDLE);
    }
    return true;
}

void TransportSwitcher::schedule_restart(std::chrono::milliseconds delay) {
    // A newer switch replaces the pending restart
    restart_timer_.cancel();
    restart_pending_ = true;
    logger().info("TransportSwitcher: Restart in {}ms", delay.count());

    restart_timer_.expires_after(delay);
    restart_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || !restart_pending_) {
            return;
        }
        run_restart();
    });
}

void TransportSwitcher::cancel_restart() {
    if (!restart_pending_) {
        return;
    }
    restart_pending_ = false;
    restart_timer_.cancel();
    logger().info("TransportSwitcher: Restart cancelled");
    transition_to(SwitchStatus::IDLE);
}

void TransportSwitcher::run_restart() {
    restart_pending_ = false;
    transition_to(SwitchStatus::RESTARTING);

    VoidResult result = restart_
        ? restart_()
        : std::unexpected(TunnelError::connection("no restart callback installed"));
    if (result) {
        transition_to(SwitchStatus::IDLE);
        return;
    }

    logger().error("TransportSwitcher: Restart failed: {}", result.error().to_string());
    transition_to(SwitchStatus::ERROR);

    events::TransportError failed;
    failed.error = result.error();
    bus_.publish(failed);

    reset_timer_.expires_after(options_.error_reset);
    reset_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || status_ != SwitchStatus::ERROR) {
            return;
        }
        transition_to(SwitchStatus::IDLE);
    });
}

} // namespace sightlink::tunnel
