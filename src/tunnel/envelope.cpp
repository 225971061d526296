#include "tunnel/envelope.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <functional>
#include <unordered_map>

namespace sightlink::tunnel {

using namespace json_util;

// ============================================================================
// Envelope
// ============================================================================

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Envelope::task_id() const {
    return jstr(payload, "taskId");
}

json::object Envelope::to_json() const {
    json::object obj;
    obj["type"] = type;
    obj["from"] = from;
    obj["to"] = to;
    obj["payload"] = payload;
    if (timestamp) {
        obj["timestamp"] = *timestamp;
    }
    return obj;
}

std::string Envelope::serialize() const {
    return json::serialize(to_json());
}

Envelope Envelope::make(std::string_view type, std::string from, std::string to,
                        json::object payload) {
    Envelope env;
    env.type = std::string(type);
    env.from = std::move(from);
    env.to = std::move(to);
    env.payload = std::move(payload);
    env.timestamp = now_ms();
    return env;
}

Result<Envelope> envelope_from_json(const json::value& value) {
    if (!value.is_object()) {
        return std::unexpected(TunnelError::validation("envelope is not a JSON object"));
    }
    const auto& obj = value.as_object();

    for (const char* field : {"type", "from", "to"}) {
        if (!has_string(obj, field)) {
            return std::unexpected(TunnelError::validation(
                fmt::format("envelope field '{}' missing or not a string", field)));
        }
    }

    Envelope env;
    env.type = jstr(obj, "type");
    env.from = jstr(obj, "from");
    env.to = jstr(obj, "to");
    if (env.type.empty()) {
        return std::unexpected(TunnelError::validation("envelope type is empty"));
    }

    auto it = obj.find("payload");
    if (it == obj.end() || !it->value().is_object()) {
        return std::unexpected(TunnelError::validation(
            fmt::format("'{}' envelope payload missing or not an object", env.type)));
    }
    env.payload = it->value().as_object();

    if (auto it = obj.find("timestamp"); it != obj.end()) {
        env.timestamp = to_int64(it->value());
    }
    return env;
}

Result<Envelope> parse_envelope(std::string_view raw) {
    boost::system::error_code ec;
    auto value = json::parse(raw, ec);
    if (ec) {
        return std::unexpected(TunnelError::validation(
            fmt::format("envelope is not valid JSON: {}", ec.message())));
    }
    return envelope_from_json(value);
}

// ============================================================================
// Payload Schemas
// ============================================================================

namespace {

using Check = std::function<VoidResult(const json::object&)>;

VoidResult fail(std::string_view field, std::string_view expectation) {
    return std::unexpected(TunnelError::validation(
        fmt::format("payload.{} {}", field, expectation)));
}

VoidResult require_strings(const json::object& p, std::initializer_list<std::string_view> fields) {
    for (auto f : fields) {
        if (!has_string(p, f)) return fail(f, "must be a string");
    }
    return {};
}

VoidResult require_numbers(const json::object& p, std::initializer_list<std::string_view> fields) {
    for (auto f : fields) {
        if (!has_number(p, f)) return fail(f, "must be a number");
    }
    return {};
}

VoidResult optional_string(const json::object& p, std::string_view field) {
    if (has_key(p, field) && !p.at(field).is_string() && !p.at(field).is_null()) {
        return fail(field, "must be a string when present");
    }
    return {};
}

VoidResult check_message_payload(const json::object& p) {
    if (auto r = require_strings(p, {"message"}); !r) return r;
    return require_numbers(p, {"timestamp"});
}

VoidResult check_context_payload(const json::object& p) {
    if (auto r = require_strings(p, {"requestId", "message"}); !r) return r;
    return require_numbers(p, {"timestamp"});
}

VoidResult check_register_request(const json::object& p) {
    if (auto r = require_strings(p, {"code", "gateway_address", "reward_address", "device_type",
                                     "gpu_type", "ip", "device_id", "device_name"}); !r) {
        return r;
    }
    if (has_key(p, "local_models") && !p.at("local_models").is_array()) {
        return fail("local_models", "must be an array when present");
    }
    return {};
}

VoidResult check_register_ack(const json::object& p) {
    if (!has_bool(p, "success")) return fail("success", "must be a boolean");
    if (auto r = require_strings(p, {"deviceId"}); !r) return r;
    if (auto r = optional_string(p, "message"); !r) return r;
    return optional_string(p, "error");
}

VoidResult check_heartbeat_report(const json::object& p) {
    if (auto r = require_strings(p, {"code", "ip", "type", "model"}); !r) return r;
    if (auto r = require_numbers(p, {"cpu_usage", "memory_usage", "gpu_usage"}); !r) return r;
    if (!has_number(p, "timestamp") && !has_string(p, "timestamp")) {
        return fail("timestamp", "must be a number or a string");
    }
    if (has_key(p, "device_info") && !p.at("device_info").is_object()) {
        return fail("device_info", "must be an object when present");
    }
    return {};
}

VoidResult check_success_response(const json::object& p) {
    if (!has_bool(p, "success")) return fail("success", "must be a boolean");
    return optional_string(p, "message");
}

VoidResult check_model_report(const json::object& p) {
    if (auto r = require_strings(p, {"device_id"}); !r) return r;
    if (!jarray(p, "models")) return fail("models", "must be an array");
    return {};
}

VoidResult check_request_envelope(const json::object& p) {
    if (auto r = require_strings(p, {"taskId", "path"}); !r) return r;
    if (!jsection(p, "data")) return fail("data", "must be an object");
    return {};
}

VoidResult check_chat_request(const json::object& p) {
    if (auto r = check_request_envelope(p); !r) return r;
    auto* messages = jarray(*jsection(p, "data"), "messages");
    if (!messages || messages->empty()) return fail("data.messages", "must be a non-empty array");
    return {};
}

VoidResult check_completion_request(const json::object& p) {
    if (auto r = check_request_envelope(p); !r) return r;
    if (!has_string(*jsection(p, "data"), "prompt")) return fail("data.prompt", "must be a string");
    return {};
}

VoidResult check_stream_response(const json::object& p) {
    if (auto r = require_strings(p, {"taskId"}); !r) return r;
    if (!has_key(p, "data")) return fail("data", "is required");
    if (auto r = optional_string(p, "path"); !r) return r;
    return optional_string(p, "error");
}

VoidResult check_task_result(const json::object& p) {
    if (auto r = require_strings(p, {"taskId"}); !r) return r;
    if (!has_key(p, "data") && !has_string(p, "error")) {
        return fail("data", "or payload.error is required");
    }
    return optional_string(p, "error");
}

VoidResult check_task_request(const json::object& p) {
    if (auto r = require_strings(p, {"taskId", "type"}); !r) return r;
    auto type = jstr(p, "type");
    if (type != msg::CHAT_REQUEST_STREAM && type != msg::CHAT_REQUEST_NO_STREAM &&
        type != msg::GENERATE_REQUEST_STREAM && type != msg::GENERATE_REQUEST_NO_STREAM &&
        type != msg::PROXY_REQUEST) {
        return fail("type", "is not a known task type");
    }
    if (!has_key(p, "data")) return fail("data", "is required");
    return optional_string(p, "path");
}

VoidResult check_task_stream(const json::object& p) {
    if (auto r = require_strings(p, {"taskId"}); !r) return r;
    if (!has_key(p, "chunk")) return fail("chunk", "is required");
    if (has_key(p, "done") && !p.at("done").is_bool()) return fail("done", "must be a boolean");
    return {};
}

VoidResult check_proxy_request(const json::object& p) {
    if (auto r = require_strings(p, {"taskId"}); !r) return r;
    auto* data = jsection(p, "data");
    if (!data) return fail("data", "must be an object");
    if (!has_string(*data, "method")) return fail("data.method", "must be a string");
    if (!has_string(*data, "url")) return fail("data.url", "must be a string");
    if (!jsection(*data, "headers")) return fail("data.headers", "must be an object");
    return {};
}

const std::unordered_map<std::string_view, Check>& schemas() {
    static const std::unordered_map<std::string_view, Check> table = {
        {msg::PING, check_message_payload},
        {msg::PONG, check_message_payload},
        {msg::CONTEXT_PING, check_context_payload},
        {msg::CONTEXT_PONG, check_context_payload},
        {msg::DEVICE_REGISTER_REQUEST, check_register_request},
        {msg::DEVICE_REGISTER_ACK, check_register_ack},
        {msg::DEVICE_HEARTBEAT_REPORT, check_heartbeat_report},
        {msg::DEVICE_HEARTBEAT_RESPONSE, check_success_response},
        {msg::DEVICE_MODEL_REPORT, check_model_report},
        {msg::DEVICE_MODEL_REPORT_RESPONSE, check_success_response},
        {msg::CHAT_REQUEST_STREAM, check_chat_request},
        {msg::CHAT_REQUEST_NO_STREAM, check_chat_request},
        {msg::COMPLETION_REQUEST_STREAM, check_completion_request},
        {msg::COMPLETION_REQUEST_NO_STREAM, check_completion_request},
        {msg::CHAT_RESPONSE_STREAM, check_stream_response},
        {msg::COMPLETION_RESPONSE_STREAM, check_stream_response},
        {msg::CHAT_RESPONSE, check_task_result},
        {msg::COMPLETION_RESPONSE, check_task_result},
        {msg::TASK_RESPONSE, check_task_result},
        {msg::PROXY_RESPONSE, check_task_result},
        {msg::TASK_REQUEST, check_task_request},
        {msg::TASK_STREAM, check_task_stream},
        {msg::PROXY_REQUEST, check_proxy_request},
    };
    return table;
}

bool is_inference_request(std::string_view type) {
    return type == msg::CHAT_REQUEST_STREAM || type == msg::CHAT_REQUEST_NO_STREAM ||
           type == msg::COMPLETION_REQUEST_STREAM || type == msg::COMPLETION_REQUEST_NO_STREAM;
}

} // anonymous namespace

bool has_payload_schema(std::string_view type) {
    return schemas().contains(type);
}

VoidResult check_payload(std::string_view type, const json::object& payload) {
    auto it = schemas().find(type);
    if (it == schemas().end()) {
        return {};
    }
    auto result = it->second(payload);
    if (!result) {
        return std::unexpected(TunnelError::validation(
            fmt::format("'{}': {}", type, result.error().message)));
    }
    return {};
}

std::string_view default_request_path(std::string_view type) {
    if (type == msg::CHAT_REQUEST_STREAM) return "/ollama/api/chat";
    if (type == msg::CHAT_REQUEST_NO_STREAM) return "/openai/v1/chat/completions";
    if (type == msg::COMPLETION_REQUEST_STREAM || type == msg::COMPLETION_REQUEST_NO_STREAM) {
        return "/openai/v1/completions";
    }
    return "";
}

std::optional<json::object> reshape_legacy_payload(std::string_view type,
                                                   const json::object& payload) {
    if (!is_inference_request(type)) {
        return std::nullopt;
    }
    if (!has_string(payload, "taskId")) {
        return std::nullopt;
    }
    auto* data = jsection(payload, "data");
    if (!data) {
        return std::nullopt;
    }

    const json::object* body = data;
    // {taskId, data: {data: {...}}}: unwrap when the outer level has no request body
    bool has_body = has_key(*data, "messages") || has_key(*data, "prompt");
    if (!has_body) {
        if (auto* inner = jsection(*data, "data")) {
            body = inner;
        }
    }

    json::object reshaped;
    reshaped["taskId"] = payload.at("taskId");
    auto path = jstr(payload, "path");
    reshaped["path"] = path.empty() ? std::string(default_request_path(type)) : path;
    reshaped["data"] = *body;
    return reshaped;
}

Result<Envelope> validate_envelope(Envelope envelope) {
    auto strict = check_payload(envelope.type, envelope.payload);
    if (strict) {
        return envelope;
    }

    auto reshaped = reshape_legacy_payload(envelope.type, envelope.payload);
    if (!reshaped) {
        return std::unexpected(strict.error());
    }

    if (auto recheck = check_payload(envelope.type, *reshaped); !recheck) {
        return std::unexpected(recheck.error());
    }

    LOG_DEBUG("Envelope: '{}' payload reshaped from nested data form (taskId={})",
              envelope.type, jstr(*reshaped, "taskId"));
    envelope.payload = std::move(*reshaped);
    return envelope;
}

} // namespace sightlink::tunnel
