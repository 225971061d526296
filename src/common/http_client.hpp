#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sightlink {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// ============================================================================
// URL Components
// ============================================================================
struct HttpUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // path + query
    bool use_ssl = false;

    // http(s):// and ws(s):// URLs; nullopt when malformed or host-less
    static std::optional<HttpUrl> parse(std::string_view url);

    std::string origin() const;
};

// ============================================================================
// HTTP Client
// ============================================================================

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequestOptions {
    http::verb method = http::verb::get;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::string content_type = "application/json";
    // Applies to connect, write and each body read
    std::chrono::milliseconds timeout{30000};
};

struct HttpResult {
    unsigned status = 0;
    HttpHeaders headers;
    std::string body;   // empty for streamed 2xx bodies

    bool ok() const { return status >= 200 && status < 300; }
};

using HttpHandler = std::function<void(beast::error_code, HttpResult)>;
using BodyChunkHandler = std::function<void(std::string_view)>;

// One connection per request; handlers run on the io_context.
class HttpClient {
public:
    explicit HttpClient(net::io_context& ioc);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void request(HttpRequestOptions options, HttpHandler handler);

    // 2xx bodies go to on_chunk as they arrive; other bodies are buffered
    // into the result so the caller can report them
    void stream(HttpRequestOptions options, BodyChunkHandler on_chunk, HttpHandler handler);

    net::io_context& io_context() { return ioc_; }

private:
    net::io_context& ioc_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};
};

} // namespace sightlink
