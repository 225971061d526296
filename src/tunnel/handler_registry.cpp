#include "tunnel/handler_registry.hpp"
#include "common/log.hpp"

namespace sightlink::tunnel {

VoidResult HandlerRegistry::register_handler(std::unique_ptr<MessageHandler> handler) {
    if (!handler) {
        return std::unexpected(TunnelError::validation("null handler"));
    }

    auto direction = handler->direction();
    auto& target = table(direction);
    const auto& type = handler->type();

    if (target.contains(type)) {
        LOG_ERROR("HandlerRegistry: Duplicate {} handler for '{}'", direction_to_string(direction), type);
        return std::unexpected(TunnelError::duplicate_handler(type, direction_to_string(direction)));
    }

    LOG_DEBUG("HandlerRegistry: Registered {} handler for '{}'", direction_to_string(direction), type);
    target.emplace(type, std::move(handler));
    return {};
}

VoidResult HandlerRegistry::register_all(std::vector<std::unique_ptr<MessageHandler>> handlers) {
    for (auto& handler : handlers) {
        if (auto result = register_handler(std::move(handler)); !result) {
            return result;
        }
    }
    LOG_INFO("HandlerRegistry: {} income / {} outcome handlers", income_.size(), outcome_.size());
    return {};
}

Result<MessageHandler*> HandlerRegistry::resolve(std::string_view type, Direction direction) const {
    const auto& source = table(direction);
    auto it = source.find(type);
    if (it == source.end()) {
        return std::unexpected(TunnelError::unknown_type(type, direction_to_string(direction)));
    }
    return it->second.get();
}

bool HandlerRegistry::contains(std::string_view type, Direction direction) const {
    const auto& source = table(direction);
    return source.find(type) != source.end();
}

VoidResult HandlerRegistry::dispatch(const Envelope& envelope, Direction direction) const {
    auto handler = resolve(envelope.type, direction);
    if (!handler) {
        return std::unexpected(handler.error());
    }
    return (*handler)->handle(envelope, direction);
}

size_t HandlerRegistry::size(Direction direction) const {
    return table(direction).size();
}

std::vector<std::string> HandlerRegistry::types(Direction direction) const {
    std::vector<std::string> out;
    for (const auto& [type, _] : table(direction)) {
        out.push_back(type);
    }
    return out;
}

void HandlerRegistry::clear() {
    income_.clear();
    outcome_.clear();
}

} // namespace sightlink::tunnel
