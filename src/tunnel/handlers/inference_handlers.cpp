#include "tunnel/handlers/inference_handlers.hpp"
#include "tunnel/handlers/forwarding_handler.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

namespace sightlink::tunnel {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::STREAM_LOGGER);
    return instance;
}

struct InferenceTask {
    std::string task_id;
    std::string path;
    json::object data;
};

// Payload was validated by the router, legacy shapes already reshaped
InferenceTask read_task(const Envelope& envelope, bool stream) {
    InferenceTask task;
    task.task_id = jstr(envelope.payload, "taskId");
    task.path = jstr(envelope.payload, "path", std::string(default_request_path(envelope.type)));
    task.data = envelope.payload.at("data").as_object();
    task.data["stream"] = stream;
    return task;
}

void send_output(TunnelRouter& router, const Envelope& envelope, std::string_view type, json::object payload) {
    if (auto r = send_reply(router, envelope, type, std::move(payload)); !r) {
        logger().error("Failed to send '{}' to {}: {}", type, envelope.from, r.error().to_string());
    }
}

// The gateway waits on task_response for a task it cannot otherwise track
void send_task_error(TunnelRouter& router, const Envelope& envelope, const std::string& task_id,
                     const std::string& error) {
    send_output(router, envelope, msg::TASK_RESPONSE,
                json::object{{"taskId", task_id}, {"error", error}, {"data", nullptr}});
}

} // anonymous namespace

// ============================================================================
// Streaming
// ============================================================================

StreamRequestHandler::StreamRequestHandler(StreamKind kind,
                                           TunnelRouter& router,
                                           std::shared_ptr<StreamReassembler> reassembler,
                                           InferenceExecutor& executor)
    : MessageHandler(kind == StreamKind::CHAT ? msg::CHAT_REQUEST_STREAM : msg::COMPLETION_REQUEST_STREAM,
                     Direction::INCOME)
    , kind_(kind)
    , router_(router)
    , reassembler_(std::move(reassembler))
    , executor_(executor)
{
}

VoidResult StreamRequestHandler::do_handle(const Envelope& envelope) {
    auto task = read_task(envelope, true);
    auto response_type = kind_ == StreamKind::CHAT ? msg::CHAT_RESPONSE_STREAM : msg::COMPLETION_RESPONSE_STREAM;

    logger().info("{} {} from {} -> {}", envelope.type, task.task_id, envelope.from, task.path);

    auto* router = &router_;
    auto sink = reassembler_->open(task.task_id, envelope.from, kind_,
        [router, envelope, response_type, path = task.path](const StreamKey& key, const StreamOutput& output) {
            json::object payload{
                {"taskId", key.task_id},
                {"path", path},
                {"data", output.data},
            };
            if (output.kind == StreamOutput::Kind::ERROR) {
                payload["error"] = output.error;
            }
            send_output(*router, envelope, response_type, std::move(payload));
        });

    if (kind_ == StreamKind::CHAT) {
        executor_.chat(task.data, std::move(sink), task.path);
    } else {
        executor_.complete(task.data, std::move(sink), task.path);
    }
    return {};
}

// ============================================================================
// Single response
// ============================================================================

NoStreamRequestHandler::NoStreamRequestHandler(StreamKind kind,
                                               TunnelRouter& router,
                                               std::shared_ptr<StreamReassembler> reassembler,
                                               InferenceExecutor& executor)
    : MessageHandler(kind == StreamKind::CHAT ? msg::CHAT_REQUEST_NO_STREAM : msg::COMPLETION_REQUEST_NO_STREAM,
                     Direction::INCOME)
    , kind_(kind)
    , router_(router)
    , reassembler_(std::move(reassembler))
    , executor_(executor)
{
}

VoidResult NoStreamRequestHandler::do_handle(const Envelope& envelope) {
    auto task = read_task(envelope, false);
    auto response_type = kind_ == StreamKind::CHAT ? msg::CHAT_RESPONSE : msg::COMPLETION_RESPONSE;

    logger().info("{} {} from {} -> {}", envelope.type, task.task_id, envelope.from, task.path);

    auto* router = &router_;
    auto sink = reassembler_->open(task.task_id, envelope.from, kind_,
        [router, envelope, response_type](const StreamKey& key, const StreamOutput& output) {
            switch (output.kind) {
                case StreamOutput::Kind::RESULT:
                    send_output(*router, envelope, response_type,
                                json::object{{"taskId", key.task_id}, {"data", output.data}});
                    break;
                case StreamOutput::Kind::ERROR:
                    send_output(*router, envelope, response_type,
                                json::object{{"taskId", key.task_id}, {"error", output.error}});
                    break;
                default:
                    logger().warn("Unexpected stream output for non-streaming task {}", key.task_id);
                    break;
            }
        });

    if (kind_ == StreamKind::CHAT) {
        executor_.chat(task.data, std::move(sink), task.path);
    } else {
        executor_.complete(task.data, std::move(sink), task.path);
    }
    return {};
}

// ============================================================================
// task_request
// ============================================================================

std::optional<std::string_view> TaskRequestHandler::map_task_type(std::string_view task_type) {
    if (task_type == msg::CHAT_REQUEST_STREAM) return msg::CHAT_REQUEST_STREAM;
    if (task_type == msg::CHAT_REQUEST_NO_STREAM) return msg::CHAT_REQUEST_NO_STREAM;
    if (task_type == msg::GENERATE_REQUEST_STREAM) return msg::COMPLETION_REQUEST_STREAM;
    if (task_type == msg::GENERATE_REQUEST_NO_STREAM) return msg::COMPLETION_REQUEST_NO_STREAM;
    if (task_type == msg::PROXY_REQUEST) return msg::PROXY_REQUEST;
    return std::nullopt;
}

VoidResult TaskRequestHandler::do_handle(const Envelope& envelope) {
    auto task_id = jstr(envelope.payload, "taskId");
    auto task_type = jstr(envelope.payload, "type");

    auto mapped = map_task_type(task_type);
    if (!mapped) {
        auto error = TunnelError::validation("unsupported task type: " + task_type);
        send_task_error(router_, envelope, task_id, error.message);
        return std::unexpected(error);
    }

    json::object payload{
        {"taskId", task_id},
        {"data", envelope.payload.at("data")},
    };
    if (*mapped != msg::PROXY_REQUEST) {
        payload["path"] = jstr(envelope.payload, "path", std::string(default_request_path(*mapped)));
    }

    logger().debug("task_request {}: {} -> {}", task_id, task_type, *mapped);
    auto dispatched = router_.dispatch(Envelope::make(*mapped, envelope.from, envelope.to, std::move(payload)));
    if (!dispatched) {
        // The inner dispatch already recorded the failure
        logger().warn("task_request {} rejected: {}", task_id, dispatched.error().to_string());
        send_task_error(router_, envelope, task_id, dispatched.error().message);
    }
    return {};
}

// ============================================================================
// proxy_request
// ============================================================================

VoidResult ProxyRequestHandler::do_handle(const Envelope& envelope) {
    auto task_id = jstr(envelope.payload, "taskId");

    auto request = ProxyRequest::from_json(envelope.payload.at("data").as_object());
    if (!request) {
        send_output(router_, envelope, msg::PROXY_RESPONSE,
                    json::object{{"taskId", task_id}, {"error", request.error().message}});
        return {};
    }

    logger().info("proxy_request {} from {}: {} {}", task_id, envelope.from, request->method, request->url);

    auto* router = &router_;
    executor_.forward(*request, [router, envelope, task_id](Result<ProxyResponse> response) {
        json::object payload{{"taskId", task_id}};
        if (response) {
            payload["data"] = response->to_json();
        } else {
            payload["error"] = response.error().message;
        }
        send_output(*router, envelope, msg::PROXY_RESPONSE, std::move(payload));
    });
    return {};
}

} // namespace sightlink::tunnel
