#include "tunnel/handlers/default_handlers.hpp"
#include "tunnel/handlers/device_handlers.hpp"
#include "tunnel/handlers/forwarding_handler.hpp"
#include "tunnel/handlers/inference_handlers.hpp"
#include "tunnel/handlers/ping_handlers.hpp"

namespace sightlink::tunnel {

const std::vector<std::string_view>& outbound_message_types() {
    static const std::vector<std::string_view> types = {
        msg::PING,
        msg::PONG,
        msg::CONTEXT_PING,
        msg::CONTEXT_PONG,
        msg::DEVICE_REGISTER_REQUEST,
        msg::DEVICE_HEARTBEAT_REPORT,
        msg::DEVICE_MODEL_REPORT,
        msg::CHAT_REQUEST_STREAM,
        msg::CHAT_REQUEST_NO_STREAM,
        msg::COMPLETION_REQUEST_STREAM,
        msg::COMPLETION_REQUEST_NO_STREAM,
        msg::CHAT_RESPONSE_STREAM,
        msg::CHAT_RESPONSE,
        msg::COMPLETION_RESPONSE_STREAM,
        msg::COMPLETION_RESPONSE,
        msg::TASK_REQUEST,
        msg::TASK_RESPONSE,
        msg::TASK_STREAM,
        msg::PROXY_REQUEST,
        msg::PROXY_RESPONSE,
    };
    return types;
}

std::vector<std::unique_ptr<MessageHandler>> make_default_handlers(const HandlerContext& context) {
    std::vector<std::unique_ptr<MessageHandler>> handlers;

    // Income
    handlers.push_back(std::make_unique<PingHandler>(context.router));
    handlers.push_back(std::make_unique<PongHandler>());
    handlers.push_back(std::make_unique<ContextPingHandler>(context.router));
    handlers.push_back(std::make_unique<ContextPongHandler>());

    handlers.push_back(std::make_unique<RegisterAckHandler>(context.lifecycle));
    handlers.push_back(std::make_unique<HeartbeatReportHandler>(context.session, context.bus));
    handlers.push_back(std::make_unique<LoggingHandler>(msg::DEVICE_HEARTBEAT_RESPONSE));
    handlers.push_back(std::make_unique<LoggingHandler>(msg::DEVICE_MODEL_REPORT_RESPONSE));

    for (auto kind : {StreamKind::CHAT, StreamKind::COMPLETION}) {
        handlers.push_back(std::make_unique<StreamRequestHandler>(
            kind, context.router, context.reassembler, context.executor));
        handlers.push_back(std::make_unique<NoStreamRequestHandler>(
            kind, context.router, context.reassembler, context.executor));
    }
    handlers.push_back(std::make_unique<TaskRequestHandler>(context.router));
    handlers.push_back(std::make_unique<ProxyRequestHandler>(context.router, context.executor));

    handlers.push_back(std::make_unique<LoggingHandler>(msg::PROXY_RESPONSE));
    handlers.push_back(std::make_unique<LoggingHandler>(msg::TASK_RESPONSE));
    handlers.push_back(std::make_unique<LoggingHandler>(msg::TASK_STREAM));

    // Outcome
    for (auto type : outbound_message_types()) {
        handlers.push_back(std::make_unique<ForwardingHandler>(type, context.router));
    }
    return handlers;
}

VoidResult install_default_handlers(HandlerRegistry& registry, const HandlerContext& context) {
    return registry.register_all(make_default_handlers(context));
}

} // namespace sightlink::tunnel
