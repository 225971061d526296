#pragma once

#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"
#include "tunnel/message_types.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>
#include <string_view>

namespace sightlink::tunnel {

// ============================================================================
// Message Handler
// ============================================================================
// One handler per (type, direction). handle() rejects envelopes whose type
// or direction does not match before any work is done.
class MessageHandler {
public:
    MessageHandler(std::string_view type, Direction direction)
        : type_(type), direction_(direction) {}
    virtual ~MessageHandler() = default;

    MessageHandler(const MessageHandler&) = delete;
    MessageHandler& operator=(const MessageHandler&) = delete;

    const std::string& type() const { return type_; }
    Direction direction() const { return direction_; }

    VoidResult handle(const Envelope& envelope, Direction direction) {
        if (envelope.type != type_) {
            return std::unexpected(TunnelError::validation(
                fmt::format("{} handler for '{}' received '{}'",
                            direction_to_string(direction_), type_, envelope.type)));
        }
        if (direction != direction_) {
            return std::unexpected(TunnelError::validation(
                fmt::format("{} handler for '{}' received an {} envelope",
                            direction_to_string(direction_), type_, direction_to_string(direction))));
        }
        return do_handle(envelope);
    }

protected:
    virtual VoidResult do_handle(const Envelope& envelope) = 0;

private:
    std::string type_;
    Direction direction_;
};

} // namespace sightlink::tunnel
