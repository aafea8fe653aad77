#include "BeastTransport.hpp"
#include "Errors.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <utility>

namespace desk_transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

const char* const MULTIPART_BOUNDARY = "desk-client-7MA4YWxkTrZu0gW";
const char* const USER_AGENT = BOOST_BEAST_VERSION_STRING " desk-client";

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return http::verb::get;
        case HttpMethod::Post: return http::verb::post;
        case HttpMethod::Delete: return http::verb::delete_;
    }
    return http::verb::unknown;
}

// Starts one asynchronous operation and runs the context until it completes
// tcp_stream expiry turns a stalled operation into beast::error::timeout
template <class Initiate>
beast::error_code run_operation(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

void throw_on_error(const beast::error_code& ec, const std::string& step, const std::string& url) {
    if (ec) {
        throw desk_types::TransportError(step + " failed for " + url + ": " + ec.message());
    }
}

std::shared_ptr<ssl::context> make_ssl_context(bool verify) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    if (verify) {
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(ssl::verify_peer);
    } else {
        ctx->set_verify_mode(ssl::verify_none);
    }
    return ctx;
}

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

template <class SslStream>
void configure_tls(SslStream& stream, const std::string& host, bool verify) {
    // SNI is only defined for names, not address literals
    if (!is_ip_literal(host) && !SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw desk_types::TransportError("Setting TLS server name failed: " + ec.message());
    }
    if (verify) {
        stream.set_verify_callback(ssl::host_name_verification(host));
    }
}

std::string host_header(const HostPort& endpoint) {
    if (endpoint.port == "443") {
        return endpoint.host;
    }
    return endpoint.host + ":" + endpoint.port;
}

// WebSocket connection owning its own I/O context
class BeastChannel final : public Channel {
public:
    BeastChannel(std::shared_ptr<ssl::context> ssl_ctx,
                 HostPort endpoint,
                 std::string path,
                 std::shared_ptr<desk_types::Logger> logger)
        : ssl_ctx_(std::move(ssl_ctx))
        , ws_(ioc_, *ssl_ctx_)
        , endpoint_(std::move(endpoint))
        , path_(std::move(path))
        , logger_(std::move(logger)) {}

    ~BeastChannel() override {
        close();
    }

    void connect(const std::string& cookie, bool verify_tls, std::chrono::seconds timeout);

    Frame read(Deadline deadline) override;
    void close() override;

    bool is_open() const override { return open_; }
    const std::string& path() const override { return path_; }

private:
    std::shared_ptr<ssl::context> ssl_ctx_;
    net::io_context ioc_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;
    HostPort endpoint_;
    std::string path_;
    std::shared_ptr<desk_types::Logger> logger_;

    bool connected_ = false;  // socket is connected and must be released
    bool open_ = false;       // WebSocket handshake done, reads possible
    bool broken_ = false;     // a read was aborted; no close handshake possible

    std::string url() const { return wss_url(host_header(endpoint_), path_); }
};

void BeastChannel::connect(const std::string& cookie, bool verify_tls, std::chrono::seconds timeout) {
    tcp::resolver resolver(ioc_);
    beast::error_code ec;
    auto results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    throw_on_error(ec, "Resolve", url());

    auto& tcp_layer = beast::get_lowest_layer(ws_);
    tcp_layer.expires_after(timeout);
    ec = run_operation(ioc_, [&](auto handler) {
        tcp_layer.async_connect(results, std::move(handler));
    });
    throw_on_error(ec, "Connect", url());
    connected_ = true;

    configure_tls(ws_.next_layer(), endpoint_.host, verify_tls);
    ec = run_operation(ioc_, [&](auto handler) {
        ws_.next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
    });
    throw_on_error(ec, "TLS handshake", url());

    // The websocket stream applies its own timeouts once the TCP expiry is off
    tcp_layer.expires_never();
    auto options = websocket::stream_base::timeout::suggested(beast::role_type::client);
    options.handshake_timeout = timeout;
    ws_.set_option(options);
    ws_.set_option(websocket::stream_base::decorator([cookie](websocket::request_type& req) {
        req.set(http::field::user_agent, USER_AGENT);
        if (!cookie.empty()) {
            req.set(http::field::authorization, cookie);
        }
    }));

    websocket::response_type response;
    const std::string host = host_header(endpoint_);
    ec = run_operation(ioc_, [&](auto handler) {
        ws_.async_handshake(response, host, path_, std::move(handler));
    });
    if (ec) {
        const unsigned status = response.result_int();
        if (status != 0 && response.result() != http::status::switching_protocols) {
            throw desk_types::RequestFailed(static_cast<int>(status), response.body());
        }
        throw_on_error(ec, "WebSocket handshake", url());
    }

    open_ = true;
    logger_->debug("Transport", "Opened channel " + url());
}

Frame BeastChannel::read(Deadline deadline) {
    if (!open_) {
        return {FrameStatus::Closed, {}};
    }

    buffer_.clear();
    beast::error_code read_ec;
    bool completed = false;
    bool timed_out = false;
    net::steady_timer timer(ioc_);

    ws_.async_read(buffer_, [&](beast::error_code ec, std::size_t) {
        read_ec = ec;
        completed = true;
        timer.cancel();
    });

    if (deadline) {
        timer.expires_at(*deadline);
        timer.async_wait([&](beast::error_code ec) {
            if (ec || completed) return;
            timed_out = true;
            beast::get_lowest_layer(ws_).socket().cancel();
        });
    }

    ioc_.restart();
    ioc_.run();

    if (timed_out) {
        open_ = false;
        broken_ = true;
        return {FrameStatus::TimedOut, {}};
    }

    if (read_ec) {
        open_ = false;
        if (read_ec != websocket::error::closed) {
            broken_ = true;
            logger_->warn("Transport", "Channel " + url() + " dropped: " + read_ec.message());
        }
        return {FrameStatus::Closed, {}};
    }

    return {FrameStatus::Message, beast::buffers_to_string(buffer_.data())};
}

void BeastChannel::close() {
    if (!connected_) return;
    connected_ = false;

    if (open_ && !broken_) {
        auto options = websocket::stream_base::timeout::suggested(beast::role_type::client);
        options.handshake_timeout = std::chrono::seconds(1);
        ws_.set_option(options);

        beast::error_code ec = run_operation(ioc_, [&](auto handler) {
            ws_.async_close(websocket::close_code::normal, std::move(handler));
        });
        if (ec) {
            logger_->debug("Transport", "Close handshake on " + url() + " failed: " + ec.message());
        }
    }
    open_ = false;

    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
    if (ec) {
        logger_->debug("Transport", "Socket close on " + url() + " failed: " + ec.message());
    }
    logger_->debug("Transport", "Closed channel " + url());
}

} // anonymous namespace

struct BeastTransport::Impl {
    net::io_context ioc;
    std::shared_ptr<ssl::context> ssl_ctx;
    HostPort endpoint;
};

BeastTransport::BeastTransport(const TransportConfig& config,
                               std::shared_ptr<desk_types::Logger> logger)
    : Transport(std::move(logger))
    , config_(config)
    , impl_(std::make_unique<Impl>()) {
    impl_->ssl_ctx = make_ssl_context(config_.verify_tls);
    impl_->endpoint = split_host_port(config_.hostname);

    if (!config_.verify_tls) {
        this->logger()->debug("Transport", "TLS certificate verification disabled for " + config_.hostname);
    }
}

BeastTransport::~BeastTransport() = default;

HttpResponse BeastTransport::perform(const HttpRequest& request) {
    auto& ioc = impl_->ioc;
    const std::string url = https_url(config_.hostname, request.path);

    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto results = resolver.resolve(impl_->endpoint.host, impl_->endpoint.port, ec);
    throw_on_error(ec, "Resolve", url);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, *impl_->ssl_ctx);
    auto& tcp_layer = beast::get_lowest_layer(stream);
    tcp_layer.expires_after(request.timeout.value_or(config_.request_timeout));

    ec = run_operation(ioc, [&](auto handler) {
        tcp_layer.async_connect(results, std::move(handler));
    });
    throw_on_error(ec, "Connect", url);

    configure_tls(stream, impl_->endpoint.host, config_.verify_tls);
    ec = run_operation(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    throw_on_error(ec, "TLS handshake", url);

    // Build request
    http::request<http::string_body> req{to_verb(request.method), normalize_path(request.path), 11};
    req.set(http::field::host, host_header(impl_->endpoint));
    req.set(http::field::user_agent, USER_AGENT);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!session_cookie().empty()) {
        req.set(http::field::cookie, "authorization=" + session_cookie());
    }
    if (request.method != HttpMethod::Get) {
        if (request.json) {
            req.set(http::field::content_type, "application/json");
            req.body() = request.json->dump();
        } else if (!request.files.empty()) {
            req.set(http::field::content_type, multipart_content_type(MULTIPART_BOUNDARY));
            req.body() = encode_multipart(request.files, MULTIPART_BOUNDARY);
        }
    }
    req.prepare_payload();

    ec = run_operation(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    throw_on_error(ec, "Write", url);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    ec = run_operation(ioc, [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });
    throw_on_error(ec, "Read", url);

    // Devices commonly drop the connection without a TLS close_notify
    tcp_layer.expires_after(std::chrono::seconds(1));
    ec = run_operation(ioc, [&](auto handler) {
        stream.async_shutdown(std::move(handler));
    });
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        logger()->debug("Transport", "TLS shutdown for " + url + " failed: " + ec.message());
    }

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = res.body();

    logger()->debug("Transport", std::string(method_name(request.method)) + " " + url +
                                 " -> " + std::to_string(response.status));
    return response;
}

std::unique_ptr<Channel> BeastTransport::open_channel(const std::string& path) {
    auto channel = std::make_unique<BeastChannel>(impl_->ssl_ctx, impl_->endpoint,
                                                  normalize_path(path), logger());
    channel->connect(session_cookie(), config_.verify_tls, config_.channel_open_timeout);
    return channel;
}

} // namespace desk_transport
