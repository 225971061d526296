#pragma once

#include "tunnel/errors.hpp"
#include "tunnel/message_types.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sightlink::tunnel {

namespace json = boost::json;

// ============================================================================
// Message Envelope
// ============================================================================
// Wire shape: {type, from, to, payload, timestamp?}
struct Envelope {
    std::string type;
    std::string from;
    std::string to;
    json::object payload;
    std::optional<int64_t> timestamp;

    bool is_self_addressed() const { return from == to; }

    // payload.taskId, empty when absent
    std::string task_id() const;

    json::object to_json() const;
    std::string serialize() const;

    static Envelope make(std::string_view type, std::string from, std::string to,
                         json::object payload);
};

// Milliseconds since the Unix epoch
int64_t now_ms();

// Structural parse only: object with string type/from/to and an object payload
Result<Envelope> parse_envelope(std::string_view raw);
Result<Envelope> envelope_from_json(const json::value& value);

// ============================================================================
// Payload Schemas
// ============================================================================

// Per-type payload check. Types without a schema pass.
VoidResult check_payload(std::string_view type, const json::object& payload);

bool has_payload_schema(std::string_view type);

// Rewrites the legacy {taskId, data, path?} request shape into the canonical
// one. nullopt when the payload is not in a recognizable legacy form.
std::optional<json::object> reshape_legacy_payload(std::string_view type,
                                                   const json::object& payload);

// check_payload, falling back to reshape_legacy_payload + recheck
Result<Envelope> validate_envelope(Envelope envelope);

// Default inference path for request types that arrive without one
std::string_view default_request_path(std::string_view type);

} // namespace sightlink::tunnel
