#pragma once

#include "tunnel/inference_executor.hpp"
#include "tunnel/message_handler.hpp"
#include "tunnel/stream_reassembler.hpp"
#include "tunnel/tunnel_router.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace sightlink::tunnel {

// ============================================================================
// Inference Request Handlers
// ============================================================================

// chat_request_stream / completion_request_stream: the executor streams into
// a reassembly sink keyed by (taskId, sender); each batch goes back as
// *_response_stream.
class StreamRequestHandler : public MessageHandler {
public:
    StreamRequestHandler(StreamKind kind,
                         TunnelRouter& router,
                         std::shared_ptr<StreamReassembler> reassembler,
                         InferenceExecutor& executor);

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    StreamKind kind_;
    TunnelRouter& router_;
    std::shared_ptr<StreamReassembler> reassembler_;
    InferenceExecutor& executor_;
};

// chat_request_no_stream / completion_request_no_stream: one chat_response /
// completion_response carrying data or error
class NoStreamRequestHandler : public MessageHandler {
public:
    NoStreamRequestHandler(StreamKind kind,
                           TunnelRouter& router,
                           std::shared_ptr<StreamReassembler> reassembler,
                           InferenceExecutor& executor);

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    StreamKind kind_;
    TunnelRouter& router_;
    std::shared_ptr<StreamReassembler> reassembler_;
    InferenceExecutor& executor_;
};

// task_request: generate_* becomes completion_request_*, then the inner
// request is dispatched again as income
class TaskRequestHandler : public MessageHandler {
public:
    explicit TaskRequestHandler(TunnelRouter& router)
        : MessageHandler(msg::TASK_REQUEST, Direction::INCOME), router_(router) {}

    static std::optional<std::string_view> map_task_type(std::string_view task_type);

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    TunnelRouter& router_;
};

class ProxyRequestHandler : public MessageHandler {
public:
    ProxyRequestHandler(TunnelRouter& router, InferenceExecutor& executor)
        : MessageHandler(msg::PROXY_REQUEST, Direction::INCOME)
        , router_(router)
        , executor_(executor) {}

protected:
    VoidResult do_handle(const Envelope& envelope) override;

private:
    TunnelRouter& router_;
    InferenceExecutor& executor_;
};

} // namespace sightlink::tunnel
