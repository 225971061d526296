#include <gtest/gtest.h>
#include "tunnel/events.hpp"
#include "tunnel/handlers/default_handlers.hpp"
#include "tunnel/handlers/inference_handlers.hpp"
#include "test_support.hpp"

using namespace sightlink;
using namespace sightlink::tunnel;

class DefaultHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        session.set_peer_id("dev-1");
        router = std::make_unique<TunnelRouter>(session, registry, transport, bus);
        router->attach();

        DeviceOptions options;
        options.device_id = "dev-1";
        lifecycle = std::make_unique<DeviceLifecycle>(ioc, session, *router, system_info, bus, options);

        HandlerContext context{*router, session, bus, *lifecycle, reassembler, executor};
        ASSERT_TRUE(install_default_handlers(registry, context).has_value());
    }

    void inject(std::string_view type, json::object payload) {
        transport.inject(Envelope::make(type, "gateway", "dev-1", std::move(payload)));
    }

    boost::asio::io_context ioc;
    EventBus bus;
    SessionContext session;
    HandlerRegistry registry;
    test::FakeTransport transport;
    test::FakeSystemInfo system_info;
    test::FakeInferenceExecutor executor;
    std::shared_ptr<StreamReassembler> reassembler = StreamReassembler::create();
    std::unique_ptr<TunnelRouter> router;
    std::unique_ptr<DeviceLifecycle> lifecycle;
};

TEST_F(DefaultHandlersTest, EveryOutboundTypeIsForwarded) {
    EXPECT_EQ(outbound_message_types().size(), 20u);
    for (auto type : outbound_message_types()) {
        EXPECT_TRUE(registry.contains(type, Direction::OUTCOME)) << type;
    }
    EXPECT_TRUE(registry.contains(msg::PING, Direction::INCOME));
    EXPECT_TRUE(registry.contains(msg::DEVICE_REGISTER_ACK, Direction::INCOME));
    EXPECT_FALSE(registry.contains(msg::DEVICE_REGISTER_REQUEST, Direction::INCOME));

    // A second catalogue collides on the first entry
    HandlerContext context{*router, session, bus, *lifecycle, reassembler, executor};
    auto again = install_default_handlers(registry, context);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, TunnelErrorCode::DUPLICATE_HANDLER);
}

TEST_F(DefaultHandlersTest, PingIsAnsweredWithPong) {
    inject(msg::PING, json::object{{"message", "hello"}, {"timestamp", 1234}});

    auto pongs = transport.sent_of_type(msg::PONG);
    ASSERT_EQ(pongs.size(), 1u);
    EXPECT_EQ(pongs[0].from, "dev-1");
    EXPECT_EQ(pongs[0].to, "gateway");
    EXPECT_EQ(pongs[0].payload.at("message").as_string(), "pong");
    EXPECT_EQ(pongs[0].payload.at("timestamp").as_int64(), 1234);

    // Pong is only logged
    inject(msg::PONG, json::object{{"message", "pong"}, {"timestamp", 1}});
    EXPECT_EQ(transport.sent.size(), 1u);
}

TEST_F(DefaultHandlersTest, ContextPingKeepsRequestId) {
    inject(msg::CONTEXT_PING, json::object{{"requestId", "r-7"}, {"message", "are you there"}, {"timestamp", 1}});

    auto pongs = transport.sent_of_type(msg::CONTEXT_PONG);
    ASSERT_EQ(pongs.size(), 1u);
    EXPECT_EQ(pongs[0].payload.at("requestId").as_string(), "r-7");
    EXPECT_EQ(pongs[0].payload.at("message").as_string(), "Context Pong response to: are you there");
    EXPECT_TRUE(pongs[0].payload.at("timestamp").is_number());
}

TEST_F(DefaultHandlersTest, StreamingChatFlowsBackAsResponseStream) {
    inject(msg::CHAT_REQUEST_STREAM, test::chat_request_payload("task-1"));

    ASSERT_EQ(executor.calls.size(), 1u);
    auto& call = executor.calls[0];
    EXPECT_EQ(call.kind, "chat");
    EXPECT_EQ(call.path, "/ollama/api/chat");
    EXPECT_TRUE(call.request.at("stream").as_bool());
    EXPECT_EQ(call.request.at("model").as_string(), "llama3");

    call.sink->write(std::string_view(
        "{\"message\":{\"role\":\"assistant\",\"content\":\"Hello there\"},\"done\":false}\n"));
    call.sink->write(std::string_view("{\"message\":{\"role\":\"assistant\",\"content\":\"\"},\"done\":true}\n"));

    auto out = transport.sent_of_type(msg::CHAT_RESPONSE_STREAM);
    ASSERT_EQ(out.size(), 2u);
    for (const auto& e : out) {
        EXPECT_EQ(e.to, "gateway");
        EXPECT_EQ(e.task_id(), "task-1");
        EXPECT_EQ(e.payload.at("path").as_string(), "/ollama/api/chat");
    }
    const auto& first = out[0].payload.at("data").as_object();
    EXPECT_EQ(first.at("message").as_object().at("content").as_string(), "Hello there");
    EXPECT_TRUE(out[1].payload.at("data").as_object().at("done").as_bool());
    EXPECT_EQ(reassembler->active_streams(), 0u);
}

TEST_F(DefaultHandlersTest, StreamFailureSendsErrorChunk) {
    inject(msg::COMPLETION_REQUEST_STREAM, test::completion_request_payload("task-2"));
    ASSERT_EQ(executor.calls.size(), 1u);
    EXPECT_EQ(executor.calls[0].kind, "complete");

    executor.calls[0].sink->fail(TunnelError::inference("connection refused"));
    auto out = transport.sent_of_type(msg::COMPLETION_RESPONSE_STREAM);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].payload.at("error").as_string(), "connection refused");
}

TEST_F(DefaultHandlersTest, NonStreamingRequestAnswersOnce) {
    inject(msg::COMPLETION_REQUEST_NO_STREAM, test::completion_request_payload("task-3"));
    ASSERT_EQ(executor.calls.size(), 1u);
    EXPECT_FALSE(executor.calls[0].request.at("stream").as_bool());

    executor.calls[0].sink->respond(json::object{{"response", "the end"}});
    auto out = transport.sent_of_type(msg::COMPLETION_RESPONSE);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].task_id(), "task-3");
    EXPECT_EQ(out[0].payload.at("data").as_object().at("response").as_string(), "the end");

    auto chat = test::chat_request_payload("task-4");
    chat["path"] = "/openai/v1/chat/completions";
    inject(msg::CHAT_REQUEST_NO_STREAM, chat);
    ASSERT_EQ(executor.calls.size(), 2u);
    executor.calls[1].sink->fail(TunnelError::inference("model not found"));
    auto errors = transport.sent_of_type(msg::CHAT_RESPONSE);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].payload.at("error").as_string(), "model not found");
    EXPECT_FALSE(errors[0].payload.contains("data"));
}

TEST_F(DefaultHandlersTest, TaskRequestIsRedispatched) {
    inject(msg::TASK_REQUEST, json::object{
        {"taskId", "task-5"},
        {"type", "generate_request_stream"},
        {"data", json::object{{"model", "llama3"}, {"prompt", "Once"}}},
    });

    ASSERT_EQ(executor.calls.size(), 1u);
    EXPECT_EQ(executor.calls[0].kind, "complete");
    EXPECT_EQ(executor.calls[0].path, "/openai/v1/completions");
    EXPECT_TRUE(executor.calls[0].request.at("stream").as_bool());
}

TEST_F(DefaultHandlersTest, RejectedTaskRequestAnswersWithTaskResponse) {
    inject(msg::TASK_REQUEST, json::object{
        {"taskId", "task-6"},
        {"type", "chat_request_stream"},
        {"data", json::object{}},
    });

    EXPECT_TRUE(executor.calls.empty());
    auto out = transport.sent_of_type(msg::TASK_RESPONSE);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, "gateway");
    EXPECT_EQ(out[0].task_id(), "task-6");
    EXPECT_FALSE(out[0].payload.at("error").as_string().empty());
    EXPECT_TRUE(out[0].payload.at("data").is_null());
}

TEST_F(DefaultHandlersTest, TaskTypeMapping) {
    EXPECT_EQ(TaskRequestHandler::map_task_type("generate_request_stream"), msg::COMPLETION_REQUEST_STREAM);
    EXPECT_EQ(TaskRequestHandler::map_task_type("generate_request_no_stream"), msg::COMPLETION_REQUEST_NO_STREAM);
    EXPECT_EQ(TaskRequestHandler::map_task_type("chat_request_stream"), msg::CHAT_REQUEST_STREAM);
    EXPECT_EQ(TaskRequestHandler::map_task_type("proxy_request"), msg::PROXY_REQUEST);
    EXPECT_FALSE(TaskRequestHandler::map_task_type("completion_request_stream").has_value());
}

TEST_F(DefaultHandlersTest, ProxyRequestGoesThroughExecutor) {
    inject(msg::PROXY_REQUEST, json::object{
        {"taskId", "proxy-dev-1-1"},
        {"data", json::object{
            {"method", "POST"},
            {"url", "/v1/chat/completions"},
            {"headers", json::object{{"content-type", "application/json"}}},
            {"body", json::object{{"model", "llama3"}}},
        }},
    });

    ASSERT_EQ(executor.forwarded.size(), 1u);
    EXPECT_EQ(executor.forwarded[0].method, "POST");
    EXPECT_EQ(executor.forwarded[0].body, R"({"model":"llama3"})");

    ProxyResponse response;
    response.status = 201;
    response.body = "created";
    executor.proxy_handlers[0](response);

    auto out = transport.sent_of_type(msg::PROXY_RESPONSE);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].task_id(), "proxy-dev-1-1");
    EXPECT_EQ(out[0].payload.at("data").as_object().at("status").to_number<int64_t>(), 201);

    inject(msg::PROXY_REQUEST, json::object{
        {"taskId", "proxy-dev-1-2"},
        {"data", json::object{{"method", "GET"}, {"url", "/"}, {"headers", json::object{}}}},
    });
    executor.proxy_handlers[1](std::unexpected(TunnelError::inference("upstream 502")));
    out = transport.sent_of_type(msg::PROXY_RESPONSE);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].payload.at("error").as_string(), "upstream 502");
}

TEST_F(DefaultHandlersTest, HeartbeatMarksDeviceConnected) {
    std::vector<std::string> seen;
    auto sub = bus.subscribe<events::HeartbeatReceived>(
        [&seen](const events::HeartbeatReceived& e) { seen.push_back(e.device_id); });

    transport.inject(Envelope::make(msg::DEVICE_HEARTBEAT_REPORT, "dev-9", "dev-1", json::object{
        {"code", "c"}, {"cpu_usage", 3.5}, {"memory_usage", 20}, {"gpu_usage", 0},
        {"ip", "10.0.0.9"}, {"timestamp", 1}, {"type", "heartbeat"}, {"model", "m"},
    }));

    EXPECT_TRUE(session.is_device_connected("dev-9"));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "dev-9");
}
