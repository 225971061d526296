#include "tunnel/inference_executor.hpp"
#include "common/json_util.hpp"

namespace sightlink::tunnel {

using namespace json_util;

json::object ProxyRequest::to_json() const {
    json::object data;
    data["method"] = method;
    data["url"] = url;
    data["headers"] = headers;
    data["body"] = body;
    if (!user_id.empty()) {
        data["userId"] = user_id;
    }
    return data;
}

Result<ProxyRequest> ProxyRequest::from_json(const json::object& data) {
    if (!has_string(data, "url")) {
        return std::unexpected(TunnelError::validation("proxy request without url"));
    }

    ProxyRequest request;
    request.method = jstr(data, "method", "GET");
    request.url = jstr(data, "url");
    if (auto* headers = jsection(data, "headers")) {
        request.headers = *headers;
    }
    // Bodies arrive as text or as already-parsed JSON
    if (auto it = data.find("body"); it != data.end()) {
        if (it->value().is_string()) {
            request.body = std::string(it->value().as_string());
        } else if (!it->value().is_null()) {
            request.body = json::serialize(it->value());
        }
    }
    request.user_id = jstr(data, "userId");
    return request;
}

json::object ProxyResponse::to_json() const {
    json::object data;
    data["status"] = status;
    data["headers"] = headers;
    data["body"] = body;
    return data;
}

} // namespace sightlink::tunnel
