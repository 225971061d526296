#pragma once

#include "tunnel/errors.hpp"
#include "tunnel/stream_reassembler.hpp"

#include <boost/json.hpp>

#include <functional>
#include <memory>
#include <string>

namespace sightlink::tunnel {

namespace json = boost::json;

// ============================================================================
// Proxy Request / Response
// ============================================================================

struct ProxyRequest {
    std::string method = "GET";
    std::string url;
    json::object headers;
    std::string body;
    std::string user_id;

    json::object to_json() const;
    static Result<ProxyRequest> from_json(const json::object& data);
};

struct ProxyResponse {
    unsigned status = 200;
    json::object headers;
    std::string body;

    json::object to_json() const;
};

using ProxyResponseHandler = std::function<void(Result<ProxyResponse>)>;

// ============================================================================
// Inference Executor
// ============================================================================
// Reaches the local model runtime. Streaming requests ("stream": true) write
// text into the sink and call end(); others call respond(). Failures go to
// sink->fail() with INFERENCE.
class InferenceExecutor {
public:
    virtual ~InferenceExecutor() = default;

    virtual void chat(const json::object& request,
                      std::shared_ptr<StreamSink> sink,
                      const std::string& path) = 0;

    virtual void complete(const json::object& request,
                          std::shared_ptr<StreamSink> sink,
                          const std::string& path) = 0;

    // Plain HTTP call on behalf of a proxy_request
    virtual void forward(const ProxyRequest& request, ProxyResponseHandler handler) = 0;
};

} // namespace sightlink::tunnel
