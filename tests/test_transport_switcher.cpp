#include <gtest/gtest.h>
#include "tunnel/events.hpp"
#include "tunnel/transport_switcher.hpp"
#include "test_support.hpp"

using namespace sightlink;
using namespace sightlink::tunnel;

class TransportSwitcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        TransportConfig transport;
        transport.type = TransportType::RELAY;
        transport.source = ConfigSource::CONFIG_FILE;
        store = std::make_unique<ConfigStore>(TunnelConfig{}, transport);

        SwitchOptions options;
        options.restart_delay = std::chrono::milliseconds(20);
        options.error_reset = std::chrono::milliseconds(20);
        switcher = std::make_unique<TransportSwitcher>(ioc, *store, bus, [this]() -> VoidResult {
            restarts++;
            if (fail_restart) {
                return std::unexpected(TunnelError::connection("exec failed"));
            }
            return {};
        }, options);
    }

    boost::asio::io_context ioc;
    EventBus bus;
    std::unique_ptr<ConfigStore> store;
    std::unique_ptr<TransportSwitcher> switcher;
    int restarts = 0;
    bool fail_restart = false;
};

TEST_F(TransportSwitcherTest, SameTypeIsNoOp) {
    int switched = 0;
    auto sub = bus.subscribe<events::TransportSwitched>(
        [&switched](const events::TransportSwitched&) { switched++; });

    EXPECT_FALSE(switcher->switch_transport(TransportType::RELAY));
    EXPECT_EQ(switched, 0);
    EXPECT_EQ(switcher->status(), SwitchStatus::IDLE);
    EXPECT_FALSE(switcher->restart_pending());
}

TEST_F(TransportSwitcherTest, SwitchUpdatesStoreAndRestarts) {
    std::vector<events::TransportSwitched> switched;
    auto sub = bus.subscribe<events::TransportSwitched>(
        [&switched](const events::TransportSwitched& e) { switched.push_back(e); });

    ASSERT_TRUE(switcher->switch_transport(TransportType::DUPLEX));
    EXPECT_EQ(switcher->current(), TransportType::DUPLEX);
    EXPECT_TRUE(store->transport().requires_restart);
    EXPECT_EQ(switcher->status(), SwitchStatus::SWITCHING);
    EXPECT_TRUE(switcher->restart_pending());

    ASSERT_EQ(switched.size(), 1u);
    EXPECT_EQ(switched[0].from, TransportType::RELAY);
    EXPECT_EQ(switched[0].to, TransportType::DUPLEX);
    EXPECT_TRUE(switched[0].restart_scheduled);

    // Nothing happens before the delay elapses
    EXPECT_EQ(restarts, 0);
    ASSERT_TRUE(test::run_until(ioc, [this] { return restarts == 1; }));
    EXPECT_EQ(switcher->status(), SwitchStatus::IDLE);
    EXPECT_FALSE(switcher->restart_pending());
}

TEST_F(TransportSwitcherTest, SwitchWithoutRestart) {
    ASSERT_TRUE(switcher->switch_transport(TransportType::DUPLEX, false));
    EXPECT_EQ(switcher->status(), SwitchStatus::IDLE);
    EXPECT_FALSE(switcher->restart_pending());
    EXPECT_FALSE(store->transport().requires_restart);

    ioc.restart();
    ioc.run_for(std::chrono::milliseconds(60));
    EXPECT_EQ(restarts, 0);
}

TEST_F(TransportSwitcherTest, CancelCallsOffPendingRestart) {
    ASSERT_TRUE(switcher->switch_transport(TransportType::DUPLEX, true, std::chrono::milliseconds(40)));
    switcher->cancel_restart();
    EXPECT_FALSE(switcher->restart_pending());
    EXPECT_EQ(switcher->status(), SwitchStatus::IDLE);

    ioc.restart();
    ioc.run_for(std::chrono::milliseconds(100));
    EXPECT_EQ(restarts, 0);
    // The store keeps the new type
    EXPECT_EQ(switcher->current(), TransportType::DUPLEX);
}

TEST_F(TransportSwitcherTest, FailedRestartReportsThenResets) {
    fail_restart = true;
    std::vector<TunnelErrorCode> errors;
    auto sub = bus.subscribe<events::TransportError>(
        [&errors](const events::TransportError& e) { errors.push_back(e.error.code); });

    ASSERT_TRUE(switcher->switch_transport(TransportType::DUPLEX));
    ASSERT_TRUE(test::run_until(ioc, [this] { return switcher->status() == SwitchStatus::ERROR; }));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], TunnelErrorCode::CONNECTION);

    ASSERT_TRUE(test::run_until(ioc, [this] { return switcher->status() == SwitchStatus::IDLE; }));
    EXPECT_EQ(restarts, 1);
}

TEST_F(TransportSwitcherTest, NewerSwitchReplacesPendingRestart) {
    ASSERT_TRUE(switcher->switch_transport(TransportType::DUPLEX));
    ASSERT_TRUE(switcher->switch_transport(TransportType::RELAY));
    EXPECT_EQ(switcher->current(), TransportType::RELAY);

    ASSERT_TRUE(test::run_until(ioc, [this] { return restarts >= 1; }));
    ioc.restart();
    ioc.run_for(std::chrono::milliseconds(60));
    EXPECT_EQ(restarts, 1);
}
