#pragma once

#include "common/event_bus.hpp"
#include "tunnel/device_lifecycle.hpp"
#include "tunnel/handler_registry.hpp"
#include "tunnel/inference_executor.hpp"
#include "tunnel/session_context.hpp"
#include "tunnel/stream_reassembler.hpp"
#include "tunnel/tunnel_router.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace sightlink::tunnel {

// Collaborators the handler catalogue is built from; all outlive the registry
struct HandlerContext {
    TunnelRouter& router;
    SessionContext& session;
    EventBus& bus;
    DeviceLifecycle& lifecycle;
    std::shared_ptr<StreamReassembler> reassembler;
    InferenceExecutor& executor;
};

// Types with an outcome forwarding handler
const std::vector<std::string_view>& outbound_message_types();

std::vector<std::unique_ptr<MessageHandler>> make_default_handlers(const HandlerContext& context);

// Registers the whole catalogue; the first duplicate aborts
VoidResult install_default_handlers(HandlerRegistry& registry, const HandlerContext& context);

} // namespace sightlink::tunnel
