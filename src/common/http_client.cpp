#include "common/http_client.hpp"
#include "common/log.hpp"

#include <boost/url.hpp>
#include <openssl/err.h>

#include <array>
#include <limits>
#include <memory>

namespace sightlink {

// ============================================================================
// HttpUrl
// ============================================================================

std::optional<HttpUrl> HttpUrl::parse(std::string_view url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        return std::nullopt;
    }

    HttpUrl result;
    result.scheme = std::string(parsed->scheme());
    if (result.scheme != "http" && result.scheme != "https" &&
        result.scheme != "ws" && result.scheme != "wss") {
        return std::nullopt;
    }
    result.host = std::string(parsed->host());
    if (result.host.empty()) {
        return std::nullopt;
    }
    result.use_ssl = (result.scheme == "https" || result.scheme == "wss");
    result.port = parsed->has_port() ? std::string(parsed->port()) : (result.use_ssl ? "443" : "80");

    result.target = parsed->encoded_path().empty() ? "/" : std::string(parsed->encoded_path());
    if (parsed->has_query()) {
        result.target += "?";
        result.target += std::string(parsed->encoded_query());
    }
    return result;
}

std::string HttpUrl::origin() const {
    return scheme + "://" + host + ":" + port;
}

// ============================================================================
// HttpCall (one request / response exchange)
// ============================================================================

namespace {

class HttpCall : public std::enable_shared_from_this<HttpCall> {
public:
    HttpCall(net::io_context& ioc, ssl::context& ssl_ctx, HttpUrl url,
             HttpRequestOptions options, BodyChunkHandler on_chunk, HttpHandler handler)
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , url_(std::move(url))
        , options_(std::move(options))
        , on_chunk_(std::move(on_chunk))
        , handler_(std::move(handler))
        , resolver_(ioc)
    {
        req_.method(options_.method);
        req_.target(url_.target);
        req_.version(11);
        req_.set(http::field::host, url_.host);
        req_.set(http::field::user_agent, "SightLink/1.0");
        for (const auto& [name, value] : options_.headers) {
            req_.set(name, value);
        }
        if (!options_.body.empty()) {
            if (req_.find(http::field::content_type) == req_.end()) {
                req_.set(http::field::content_type, options_.content_type);
            }
            req_.body() = options_.body;
        }
        req_.prepare_payload();

        parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    void start() {
        if (url_.use_ssl) {
            tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx_);
            if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                finish(ec);
                return;
            }
        } else {
            plain_ = std::make_unique<beast::tcp_stream>(ioc_);
        }
        do_resolve();
    }

private:
    beast::tcp_stream& lowest() {
        return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
    }

    template<typename Fn>
    void with_stream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(*plain_);
        }
    }

    void do_resolve() {
        resolver_.async_resolve(url_.host, url_.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    self->finish(ec);
                    return;
                }
                self->do_connect(results);
            });
    }

    void do_connect(const tcp::resolver::results_type& results) {
        lowest().expires_after(options_.timeout);
        lowest().async_connect(results,
            [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    self->finish(ec);
                    return;
                }
                if (self->tls_) {
                    self->do_tls_handshake();
                } else {
                    self->do_write();
                }
            });
    }

    void do_tls_handshake() {
        lowest().expires_after(options_.timeout);
        tls_->async_handshake(ssl::stream_base::client,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    self->finish(ec);
                    return;
                }
                self->do_write();
            });
    }

    void do_write() {
        lowest().expires_after(options_.timeout);
        with_stream([this](auto& stream) {
            http::async_write(stream, req_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->finish(ec);
                        return;
                    }
                    self->do_read_header();
                });
        });
    }

    void do_read_header() {
        lowest().expires_after(options_.timeout);
        with_stream([this](auto& stream) {
            http::async_read_header(stream, buffer_, parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->finish(ec);
                        return;
                    }
                    const auto& header = self->parser_.get();
                    self->result_.status = header.result_int();
                    for (const auto& field : header) {
                        self->result_.headers.emplace_back(std::string(field.name_string()),
                                                           std::string(field.value()));
                    }
                    self->streaming_ = self->on_chunk_ && self->result_.ok();
                    self->do_read_body();
                });
        });
    }

    void do_read_body() {
        if (parser_.is_done()) {
            finish({});
            return;
        }

        parser_.get().body().data = chunk_.data();
        parser_.get().body().size = chunk_.size();
        lowest().expires_after(options_.timeout);

        with_stream([this](auto& stream) {
            http::async_read(stream, buffer_, parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec == http::error::need_buffer) {
                        ec = {};
                    }
                    if (ec) {
                        self->finish(ec);
                        return;
                    }

                    size_t got = self->chunk_.size() - self->parser_.get().body().size;
                    if (got > 0) {
                        std::string_view data(self->chunk_.data(), got);
                        if (self->streaming_) {
                            self->on_chunk_(data);
                        } else {
                            self->result_.body.append(data);
                        }
                    }
                    self->do_read_body();
                });
        });
    }

    void finish(beast::error_code ec) {
        if (done_) {
            return;
        }
        done_ = true;

        beast::error_code ignored;
        if (tls_ || plain_) {
            lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
            lowest().close();
        }

        if (handler_) {
            handler_(ec, std::move(result_));
        }
    }

    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    HttpUrl url_;
    HttpRequestOptions options_;
    BodyChunkHandler on_chunk_;
    HttpHandler handler_;

    tcp::resolver resolver_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;

    http::request<http::string_body> req_;
    http::response_parser<http::buffer_body> parser_;
    beast::flat_buffer buffer_;
    std::array<char, 8192> chunk_{};

    HttpResult result_;
    bool streaming_ = false;
    bool done_ = false;
};

} // anonymous namespace

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(net::io_context& ioc)
    : ioc_(ioc)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void HttpClient::request(HttpRequestOptions options, HttpHandler handler) {
    stream(std::move(options), nullptr, std::move(handler));
}

void HttpClient::stream(HttpRequestOptions options, BodyChunkHandler on_chunk, HttpHandler handler) {
    auto url = HttpUrl::parse(options.url);
    if (!url) {
        LOG_ERROR("HttpClient: Invalid URL: {}", options.url);
        net::post(ioc_, [handler = std::move(handler)]() {
            if (handler) {
                handler(make_error_code(net::error::invalid_argument), HttpResult{});
            }
        });
        return;
    }

    LOG_DEBUG("HttpClient: {} {}{}", std::string(http::to_string(options.method)),
              url->origin(), url->target);

    auto call = std::make_shared<HttpCall>(ioc_, ssl_ctx_, std::move(*url), std::move(options),
                                           std::move(on_chunk), std::move(handler));
    call->start();
}

} // namespace sightlink
