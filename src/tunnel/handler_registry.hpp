#pragma once

#include "tunnel/message_handler.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sightlink::tunnel {

// ============================================================================
// Handler Registry
// ============================================================================
// Two lookup tables, income and outcome, keyed by message type. A second
// registration for the same (type, direction) is rejected, never shadowed.
class HandlerRegistry {
public:
    HandlerRegistry() = default;

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    VoidResult register_handler(std::unique_ptr<MessageHandler> handler);

    // Registers all, stopping at the first duplicate
    VoidResult register_all(std::vector<std::unique_ptr<MessageHandler>> handlers);

    // UNKNOWN_MESSAGE_TYPE when absent
    Result<MessageHandler*> resolve(std::string_view type, Direction direction) const;

    bool contains(std::string_view type, Direction direction) const;

    // resolve + handle; handler errors are returned, not thrown
    VoidResult dispatch(const Envelope& envelope, Direction direction) const;

    size_t size(Direction direction) const;
    std::vector<std::string> types(Direction direction) const;

    void clear();

private:
    using Table = std::map<std::string, std::unique_ptr<MessageHandler>, std::less<>>;

    Table& table(Direction direction) {
        return direction == Direction::INCOME ? income_ : outcome_;
    }
    const Table& table(Direction direction) const {
        return direction == Direction::INCOME ? income_ : outcome_;
    }

    Table income_;
    Table outcome_;
};

} // namespace sightlink::tunnel
