#include "tunnel/http_inference_executor.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace sightlink::tunnel {

using namespace json_util;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::TUNNEL_LOGGER);
    return instance;
}

std::string describe_failure(const beast::error_code& ec, const HttpResult& result) {
    if (ec) {
        return ec.message();
    }
    auto body = result.body.substr(0, std::min<size_t>(result.body.size(), 200));
    return fmt::format("HTTP {}: {}", result.status, body);
}

} // anonymous namespace

HttpInferenceExecutor::HttpInferenceExecutor(net::io_context& ioc, Options options)
    : ioc_(ioc)
    , client_(ioc)
    , options_(std::move(options))
{
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

std::string HttpInferenceExecutor::runtime_path(const std::string& path) {
    std::string result = path.empty() || path.front() == '/' ? path : "/" + path;
    for (std::string_view prefix : {"/ollama", "/openai"}) {
        if (result.starts_with(prefix) &&
            (result.size() == prefix.size() || result[prefix.size()] == '/')) {
            result.erase(0, prefix.size());
            break;
        }
    }
    return result.empty() ? "/" : result;
}

Result<std::string> HttpInferenceExecutor::resolve_proxy_url(const std::string& base_url,
                                                             const std::string& url) {
    if (url.find("://") == std::string::npos && !url.starts_with("//")) {
        return base_url + (url.starts_with("/") ? "" : "/") + url;
    }

    auto base = HttpUrl::parse(base_url);
    auto target = HttpUrl::parse(url);
    if (!base || !target || target->origin() != base->origin()) {
        return std::unexpected(TunnelError::inference("proxy URL outside the inference runtime: " + url));
    }
    return url;
}

void HttpInferenceExecutor::chat(const json::object& request,
                                 std::shared_ptr<StreamSink> sink,
                                 const std::string& path) {
    run(request, std::move(sink), path.empty() ? "/api/chat" : path);
}

void HttpInferenceExecutor::complete(const json::object& request,
                                     std::shared_ptr<StreamSink> sink,
                                     const std::string& path) {
    run(request, std::move(sink), path.empty() ? "/v1/completions" : path);
}

void HttpInferenceExecutor::run(const json::object& request,
                                std::shared_ptr<StreamSink> sink,
                                const std::string& path) {
    HttpRequestOptions options;
    options.method = http::verb::post;
    options.url = options_.base_url + runtime_path(path);
    options.body = json::serialize(request);

    bool streaming = jbool(request, "stream", false);
    logger().debug("HttpInferenceExecutor: POST {} (stream={})", options.url, streaming);

    if (!streaming) {
        options.timeout = options_.request_timeout;
        client_.request(std::move(options), [sink](beast::error_code ec, HttpResult result) {
            if (ec || !result.ok()) {
                sink->fail(TunnelError::inference(describe_failure(ec, result)));
                return;
            }

            boost::system::error_code parse_ec;
            auto parsed = json::parse(result.body, parse_ec);
            if (parse_ec) {
                sink->fail(TunnelError::inference("runtime returned invalid JSON: " + parse_ec.message()));
                return;
            }
            sink->respond(parsed);
        });
        return;
    }

    options.timeout = options_.stream_idle_timeout;
    client_.stream(std::move(options),
        [sink](std::string_view chunk) {
            sink->write(chunk);
        },
        [sink](beast::error_code ec, HttpResult result) {
            if (ec || !result.ok()) {
                sink->fail(TunnelError::inference(describe_failure(ec, result)));
                return;
            }
            sink->end();
        });
}

void HttpInferenceExecutor::forward(const ProxyRequest& request, ProxyResponseHandler handler) {
    HttpRequestOptions options;
    auto verb = http::string_to_verb(request.method);
    options.method = verb == http::verb::unknown ? http::verb::get : verb;
    auto url = resolve_proxy_url(options_.base_url, request.url);
    if (!url) {
        logger().warn("HttpInferenceExecutor: Refusing proxy {} {}", request.method, request.url);
        net::post(ioc_, [handler = std::move(handler), error = url.error()]() {
            handler(std::unexpected(error));
        });
        return;
    }
    options.url = std::move(*url);
    options.body = request.body;
    options.timeout = options_.request_timeout;
    for (const auto& [name, value] : request.headers) {
        if (value.is_string()) {
            options.headers.emplace_back(std::string(name), std::string(value.as_string()));
        }
    }

    logger().debug("HttpInferenceExecutor: Proxy {} {}", request.method, options.url);

    client_.request(std::move(options),
        [handler = std::move(handler)](beast::error_code ec, HttpResult result) {
            if (ec) {
                handler(std::unexpected(TunnelError::inference(ec.message())));
                return;
            }
            ProxyResponse response;
            response.status = result.status;
            for (const auto& [name, value] : result.headers) {
                response.headers[name] = value;
            }
            response.body = std::move(result.body);
            handler(std::move(response));
        });
}

} // namespace sightlink::tunnel
