#include <gtest/gtest.h>
#include "tunnel/handlers/forwarding_handler.hpp"
#include "tunnel/proxy_dispatcher.hpp"
#include "test_support.hpp"

using namespace sightlink;
using namespace sightlink::tunnel;

class ProxyDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        session.set_peer_id("gateway");
        router = std::make_unique<TunnelRouter>(session, registry, transport, bus);
        router->attach();
        ASSERT_TRUE(registry.register_handler(
            std::make_unique<ForwardingHandler>(msg::PROXY_REQUEST, *router)).has_value());
        ASSERT_TRUE(registry.register_handler(
            std::make_unique<LoggingHandler>(msg::PROXY_RESPONSE)).has_value());
        make_dispatcher(std::chrono::milliseconds(5000));
    }

    void make_dispatcher(std::chrono::milliseconds timeout) {
        ProxyOptions options;
        options.timeout = timeout;
        proxy = std::make_unique<ProxyDispatcher>(ioc, session, *router, options);
    }

    static ProxyRequest models_request() {
        ProxyRequest request;
        request.method = "GET";
        request.url = "/v1/models";
        request.headers = json::object{{"accept", "application/json"}};
        return request;
    }

    void respond(const std::string& device, const std::string& task_id, json::object extra) {
        extra["taskId"] = task_id;
        transport.inject(Envelope::make(msg::PROXY_RESPONSE, device, "gateway", std::move(extra)));
    }

    boost::asio::io_context ioc;
    EventBus bus;
    SessionContext session;
    HandlerRegistry registry;
    test::FakeTransport transport;
    std::unique_ptr<TunnelRouter> router;
    std::unique_ptr<ProxyDispatcher> proxy;
};

TEST_F(ProxyDispatcherTest, NoDeviceIsUnavailable) {
    bool called = false;
    auto result = proxy->dispatch(models_request(), [&called](Result<json::value>) { called = true; });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TunnelErrorCode::SERVICE_UNAVAILABLE);
    EXPECT_FALSE(called);
    EXPECT_TRUE(transport.sent.empty());
    EXPECT_EQ(proxy->pending(), 0u);
}

TEST_F(ProxyDispatcherTest, DisconnectedDeviceIsNotPicked) {
    session.mark_device_connected("dev-1");
    session.mark_device_disconnected("dev-1");

    auto result = proxy->dispatch(models_request(), [](Result<json::value>) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TunnelErrorCode::SERVICE_UNAVAILABLE);
    EXPECT_TRUE(transport.sent.empty());
}

TEST_F(ProxyDispatcherTest, ResponseResolvesByTaskId) {
    session.mark_device_connected("dev-1");
    session.mark_device_connected("dev-2");

    std::optional<Result<json::value>> outcome;
    auto task_id = proxy->dispatch(models_request(), [&outcome](Result<json::value> r) { outcome = r; });
    ASSERT_TRUE(task_id.has_value());
    EXPECT_EQ(*task_id, "proxy-dev-1-1");
    EXPECT_EQ(proxy->pending(), 1u);
    EXPECT_EQ(router->listener_count(), 1u);

    auto sent = transport.sent_of_type(msg::PROXY_REQUEST);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].from, "gateway");
    EXPECT_EQ(sent[0].to, "dev-1");
    EXPECT_EQ(sent[0].task_id(), *task_id);
    EXPECT_EQ(sent[0].payload.at("data").as_object().at("url").as_string(), "/v1/models");

    // A response for some other task is not ours
    respond("dev-1", "proxy-dev-1-99", json::object{{"data", "nope"}});
    EXPECT_FALSE(outcome.has_value());

    respond("dev-1", *task_id, json::object{{"data", json::object{{"status", 200}, {"body", "[]"}}}});
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());
    EXPECT_EQ((*outcome)->as_object().at("status").as_int64(), 200);
    EXPECT_EQ(proxy->pending(), 0u);
    EXPECT_EQ(router->listener_count(), 0u);

    // Late duplicate is ignored
    respond("dev-1", *task_id, json::object{{"data", "again"}});
    EXPECT_EQ((*outcome)->as_object().at("body").as_string(), "[]");
}

TEST_F(ProxyDispatcherTest, ErrorFieldIsUnavailable) {
    session.mark_device_connected("dev-1");
    std::optional<Result<json::value>> outcome;
    auto task_id = proxy->dispatch(models_request(), [&outcome](Result<json::value> r) { outcome = r; });
    ASSERT_TRUE(task_id.has_value());

    respond("dev-1", *task_id, json::object{{"error", "model runtime down"}});
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, TunnelErrorCode::SERVICE_UNAVAILABLE);
    EXPECT_EQ(outcome->error().message, "model runtime down");
}

TEST_F(ProxyDispatcherTest, MissingResponseTimesOut) {
    make_dispatcher(std::chrono::milliseconds(30));
    session.mark_device_connected("dev-1");

    std::optional<Result<json::value>> outcome;
    ASSERT_TRUE(proxy->dispatch(models_request(), [&outcome](Result<json::value> r) { outcome = r; }).has_value());

    ASSERT_TRUE(test::run_until(ioc, [&outcome] { return outcome.has_value(); }));
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, TunnelErrorCode::TIMEOUT);
    EXPECT_EQ(router->listener_count(), 0u);
    EXPECT_EQ(proxy->pending(), 0u);
}

TEST_F(ProxyDispatcherTest, CancelAllResolvesEveryRequest) {
    session.mark_device_connected("dev-1");
    std::vector<TunnelErrorCode> codes;
    auto handler = [&codes](Result<json::value> r) {
        codes.push_back(r ? TunnelErrorCode::VALIDATION : r.error().code);
    };
    ASSERT_TRUE(proxy->dispatch(models_request(), handler).has_value());
    ASSERT_TRUE(proxy->dispatch(models_request(), handler).has_value());
    EXPECT_EQ(proxy->pending(), 2u);

    proxy->cancel_all();
    ASSERT_EQ(codes.size(), 2u);
    EXPECT_EQ(codes[0], TunnelErrorCode::CONNECTION);
    EXPECT_EQ(codes[1], TunnelErrorCode::CONNECTION);
    EXPECT_EQ(router->listener_count(), 0u);
}

TEST_F(ProxyDispatcherTest, SendFailureLeavesNothingPending) {
    session.mark_device_connected("dev-1");
    transport.connected = false;

    bool called = false;
    auto result = proxy->dispatch(models_request(), [&called](Result<json::value>) { called = true; });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TunnelErrorCode::MESSAGE_SEND);
    EXPECT_FALSE(called);
    EXPECT_EQ(proxy->pending(), 0u);
    EXPECT_EQ(router->listener_count(), 0u);
}
