#include <gtest/gtest.h>
#include "tunnel/device_lifecycle.hpp"
#include "tunnel/events.hpp"
#include "tunnel/handlers/device_handlers.hpp"
#include "tunnel/handlers/forwarding_handler.hpp"
#include "test_support.hpp"

using namespace sightlink;
using namespace sightlink::tunnel;

class DeviceLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        router = std::make_unique<TunnelRouter>(session, registry, transport, bus);
        router->attach();
        make_lifecycle();
    }

    void make_lifecycle() {
        DeviceOptions options;
        options.code = "auth-123";
        options.device_id = device_id;
        options.device_name = "edge-box";
        options.gateway_address = "gw-addr";
        options.reward_address = "reward-addr";
        options.gpu_type = "rtx-4090";
        options.local_models = {"llama3"};
        options.heartbeat_interval = std::chrono::milliseconds(20);
        options.registration_timeout = registration_timeout;

        registry.clear();
        lifecycle = std::make_unique<DeviceLifecycle>(ioc, session, *router, system_info, bus, options);
        ASSERT_TRUE(registry.register_handler(std::make_unique<RegisterAckHandler>(*lifecycle)).has_value());
        ASSERT_TRUE(registry.register_handler(
            std::make_unique<ForwardingHandler>(msg::DEVICE_HEARTBEAT_REPORT, *router)).has_value());
        ASSERT_TRUE(registry.register_handler(
            std::make_unique<ForwardingHandler>(msg::DEVICE_MODEL_REPORT, *router)).has_value());
    }

    void ack(bool success, const std::string& id, const std::string& error = "") {
        json::object payload{{"success", success}, {"deviceId", id}};
        if (!error.empty()) {
            payload["error"] = error;
        }
        transport.inject(Envelope::make(msg::DEVICE_REGISTER_ACK, "gateway", device_id, payload));
    }

    boost::asio::io_context ioc;
    EventBus bus;
    SessionContext session;
    HandlerRegistry registry;
    test::FakeTransport transport;
    test::FakeSystemInfo system_info;
    std::unique_ptr<TunnelRouter> router;
    std::unique_ptr<DeviceLifecycle> lifecycle;

    std::string device_id = "dev-1";
    std::chrono::milliseconds registration_timeout{5000};
};

TEST_F(DeviceLifecycleTest, RegisterAckThenHeartbeats) {
    std::optional<Result<std::string>> outcome;
    std::vector<std::string> registered;
    auto sub = bus.subscribe<events::DeviceRegistered>(
        [&registered](const events::DeviceRegistered& e) { registered.push_back(e.peer_id); });

    ASSERT_TRUE(lifecycle->register_device([&outcome](Result<std::string> r) { outcome = r; }).has_value());
    EXPECT_EQ(lifecycle->state(), DeviceState::REGISTERING);
    EXPECT_EQ(session.pending_peer_id(), "dev-1");

    auto requests = transport.sent_of_type(msg::DEVICE_REGISTER_REQUEST);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].from, "dev-1");
    EXPECT_EQ(requests[0].to, "gateway");
    EXPECT_EQ(requests[0].payload.at("code").as_string(), "auth-123");
    EXPECT_EQ(requests[0].payload.at("local_models").as_array().size(), 1u);

    // No heartbeat before the ack
    EXPECT_FALSE(lifecycle->send_heartbeat().has_value());
    EXPECT_TRUE(transport.sent_of_type(msg::DEVICE_HEARTBEAT_REPORT).empty());

    ack(true, "dev-1");
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());
    EXPECT_EQ(**outcome, "dev-1");
    EXPECT_EQ(session.peer_id(), "dev-1");
    EXPECT_EQ(lifecycle->state(), DeviceState::HEARTBEATING);
    ASSERT_EQ(registered.size(), 1u);

    // First heartbeat right away, then the model report
    auto heartbeats = transport.sent_of_type(msg::DEVICE_HEARTBEAT_REPORT);
    ASSERT_EQ(heartbeats.size(), 1u);
    EXPECT_EQ(heartbeats[0].from, "dev-1");
    EXPECT_DOUBLE_EQ(heartbeats[0].payload.at("cpu_usage").as_double(), 12.5);
    EXPECT_EQ(heartbeats[0].payload.at("ip").as_string(), "10.0.0.7");
    EXPECT_EQ(heartbeats[0].payload.at("type").as_string(), "heartbeat");
    EXPECT_EQ(transport.sent_of_type(msg::DEVICE_MODEL_REPORT).size(), 1u);

    // Interval heartbeats sample system info each time
    ASSERT_TRUE(test::run_until(ioc, [this] { return lifecycle->heartbeats_sent() >= 3; }));
    EXPECT_GE(system_info.collect_calls, 3);
}

TEST_F(DeviceLifecycleTest, AckMayAssignAnotherIdentity) {
    ASSERT_TRUE(lifecycle->register_device().has_value());
    ack(true, "dev-assigned");

    EXPECT_EQ(session.peer_id(), "dev-assigned");
    auto heartbeats = transport.sent_of_type(msg::DEVICE_HEARTBEAT_REPORT);
    ASSERT_EQ(heartbeats.size(), 1u);
    EXPECT_EQ(heartbeats[0].from, "dev-assigned");
}

TEST_F(DeviceLifecycleTest, RejectedAckFailsRegistration) {
    std::optional<Result<std::string>> outcome;
    int failures = 0;
    auto sub = bus.subscribe<events::RegistrationFailed>(
        [&failures](const events::RegistrationFailed&) { failures++; });

    ASSERT_TRUE(lifecycle->register_device([&outcome](Result<std::string> r) { outcome = r; }).has_value());
    ack(false, "dev-1", "invalid code");

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, TunnelErrorCode::DEVICE_REGISTRATION);
    EXPECT_EQ(outcome->error().message, "invalid code");
    EXPECT_EQ(lifecycle->state(), DeviceState::UNREGISTERED);
    EXPECT_FALSE(session.has_peer_id());
    EXPECT_FALSE(session.pending_peer_id().has_value());
    EXPECT_EQ(failures, 1);
    EXPECT_TRUE(transport.sent_of_type(msg::DEVICE_HEARTBEAT_REPORT).empty());
}

TEST_F(DeviceLifecycleTest, MissingAckTimesOut) {
    registration_timeout = std::chrono::milliseconds(30);
    make_lifecycle();

    std::optional<Result<std::string>> outcome;
    ASSERT_TRUE(lifecycle->register_device([&outcome](Result<std::string> r) { outcome = r; }).has_value());

    ASSERT_TRUE(test::run_until(ioc, [&outcome] { return outcome.has_value(); }));
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, TunnelErrorCode::DEVICE_REGISTRATION);
    EXPECT_NE(outcome->error().message.find("no register ack"), std::string::npos);
    EXPECT_EQ(lifecycle->state(), DeviceState::UNREGISTERED);
}

TEST_F(DeviceLifecycleTest, SendWhileDisconnectedFailsImmediately) {
    transport.connected = false;
    auto result = lifecycle->register_device();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TunnelErrorCode::DEVICE_REGISTRATION);
    EXPECT_EQ(lifecycle->state(), DeviceState::UNREGISTERED);
    EXPECT_FALSE(session.pending_peer_id().has_value());
}

TEST_F(DeviceLifecycleTest, FailedDeliveryReachesHandler) {
    transport.fail_delivery = true;
    std::optional<Result<std::string>> outcome;
    ASSERT_TRUE(lifecycle->register_device([&outcome](Result<std::string> r) { outcome = r; }).has_value());

    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->has_value());
    EXPECT_EQ(lifecycle->state(), DeviceState::UNREGISTERED);
}

TEST_F(DeviceLifecycleTest, GuardsAgainstBadStarts) {
    ASSERT_TRUE(lifecycle->register_device().has_value());
    auto again = lifecycle->register_device();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, TunnelErrorCode::DEVICE_REGISTRATION);

    lifecycle->unregister();
    device_id = "";
    make_lifecycle();
    EXPECT_FALSE(lifecycle->register_device().has_value());
}

TEST_F(DeviceLifecycleTest, UnregisterStopsHeartbeats) {
    ASSERT_TRUE(lifecycle->register_device().has_value());
    ack(true, "dev-1");
    ASSERT_EQ(lifecycle->heartbeats_sent(), 1u);

    lifecycle->unregister();
    EXPECT_EQ(lifecycle->state(), DeviceState::UNREGISTERED);
    EXPECT_FALSE(session.has_peer_id());

    ioc.restart();
    ioc.run_for(std::chrono::milliseconds(80));
    EXPECT_EQ(lifecycle->heartbeats_sent(), 1u);
}

TEST_F(DeviceLifecycleTest, StopForgetsConnectedDevices) {
    ASSERT_TRUE(lifecycle->register_device().has_value());
    ack(true, "dev-1");
    session.mark_device_connected("dev-7");
    session.mark_device_connected("dev-8");

    // As on ConnectionLost
    transport.set_link(false, "socket closed");
    lifecycle->stop();
    EXPECT_TRUE(session.connected_devices().empty());
    EXPECT_FALSE(session.is_device_connected("dev-7"));

    session.mark_device_connected("dev-9");
    lifecycle->unregister();
    EXPECT_TRUE(session.connected_devices().empty());
}

TEST_F(DeviceLifecycleTest, ReRegistrationResetsIdentity) {
    ASSERT_TRUE(lifecycle->register_device().has_value());
    ack(true, "dev-1");
    ASSERT_TRUE(session.has_peer_id());

    ASSERT_TRUE(lifecycle->register_device().has_value());
    EXPECT_FALSE(session.has_peer_id());
    EXPECT_EQ(session.pending_peer_id(), "dev-1");
    EXPECT_EQ(lifecycle->state(), DeviceState::REGISTERING);
}
