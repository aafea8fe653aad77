#include <catch2/catch_test_macros.hpp>
#include "BeastTransport.hpp"
#include "Errors.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace desk_transport;

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using ServerStream = beast::ssl_stream<tcp::socket>;

// Throwaway P-256 key and certificate for the loopback server
void use_self_signed_certificate(ssl::context& ctx) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), EVP_PKEY_free);
    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), X509_free);
    if (!key || !cert) {
        throw std::runtime_error("Cannot allocate test key or certificate");
    }

    static const unsigned char common_name[] = "127.0.0.1";
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());
    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, common_name, -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0 ||
        SSL_CTX_use_certificate(ctx.native_handle(), cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(ctx.native_handle(), key.get()) != 1) {
        throw std::runtime_error("Cannot install test certificate");
    }
}

// TLS server on 127.0.0.1 that serves one scripted handler per accepted connection
class LoopbackServer {
public:
    using Handler = std::function<void(ServerStream&)>;

    explicit LoopbackServer(std::vector<Handler> handlers)
        : ctx_(ssl::context::tls_server)
        , acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , handlers_(std::move(handlers)) {
        use_self_signed_certificate(ctx_);
        thread_ = std::thread([this] { run(); });
    }

    ~LoopbackServer() { join(); }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string host() const {
        return "127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
    }

    // Waits until every handler ran; results written by handlers are safe to read afterwards
    void join() {
        if (thread_.joinable()) thread_.join();
    }

    const std::string& error() const { return error_; }

private:
    net::io_context ioc_;
    ssl::context ctx_;
    tcp::acceptor acceptor_;
    std::vector<Handler> handlers_;
    std::string error_;
    std::thread thread_;

    void run() {
        try {
            for (auto& handler : handlers_) {
                ServerStream stream(acceptor_.accept(), ctx_);
                stream.handshake(ssl::stream_base::server);
                handler(stream);
            }
        } catch (const std::exception& e) {
            error_ = e.what();
        }
    }
};

// Reads one request, answers with status and body, and ends the TLS session
LoopbackServer::Handler answer(http::request<http::string_body>& seen, http::status status, std::string body) {
    return [&seen, status, body](ServerStream& stream) {
        beast::flat_buffer buffer;
        http::read(stream, buffer, seen);

        http::response<http::string_body> res{status, 11};
        res.set(http::field::content_type, "application/json");
        res.body() = body;
        res.prepare_payload();
        http::write(stream, res);

        beast::error_code ec;
        stream.shutdown(ec);
    };
}

TransportConfig loopback_config(const LoopbackServer& server) {
    auto cfg = TransportConfig::for_host(server.host());
    cfg.request_timeout = std::chrono::seconds(5);
    cfg.channel_open_timeout = std::chrono::seconds(5);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// HTTP
// ============================================================================

TEST_CASE("BeastTransport sends the session cookie and the JSON body", "[BeastTransport]") {
    http::request<http::string_body> seen;
    LoopbackServer server({answer(seen, http::status::ok, "{\"activeToken\": null}")});

    BeastTransport transport(loopback_config(server));
    transport.set_session_cookie("abc");

    HttpRequest request(HttpMethod::Post, "/admin/api/control-token/fci");
    request.headers["X-Control-Token"] = "s3cret";
    request.json = nlohmann::json{{"token", "s3cret"}};
    HttpResponse response = transport.request(request);
    server.join();

    REQUIRE(server.error().empty());
    REQUIRE(response.status == 200);
    REQUIRE(response.json()["activeToken"].is_null());

    REQUIRE(seen.method() == http::verb::post);
    REQUIRE(std::string(seen.target()) == "/admin/api/control-token/fci");
    REQUIRE(std::string(seen[http::field::cookie]) == "authorization=abc");
    REQUIRE(std::string(seen["X-Control-Token"]) == "s3cret");
    REQUIRE(std::string(seen[http::field::content_type]) == "application/json");
    REQUIRE(nlohmann::json::parse(seen.body()) == nlohmann::json{{"token", "s3cret"}});
}

TEST_CASE("BeastTransport sends brake flags as multipart fields", "[BeastTransport]") {
    http::request<http::string_body> seen;
    LoopbackServer server({answer(seen, http::status::ok, "")});

    BeastTransport transport(loopback_config(server));
    HttpRequest request(HttpMethod::Post, "/desk/api/joints/unlock");
    request.files["force"] = "True";
    transport.request(request);
    server.join();

    REQUIRE(server.error().empty());
    REQUIRE(std::string(seen[http::field::content_type]).rfind("multipart/form-data; boundary=", 0) == 0);
    REQUIRE(seen.body().find("name=\"force\"") != std::string::npos);
    REQUIRE(seen.body().find("\r\n\r\nTrue\r\n") != std::string::npos);
    REQUIRE(seen[http::field::cookie].empty());
}

TEST_CASE("BeastTransport raises RequestFailed with the device's body", "[BeastTransport]") {
    http::request<http::string_body> seen;
    LoopbackServer server({answer(seen, http::status::forbidden, "Token invalid")});

    BeastTransport transport(loopback_config(server));
    try {
        transport.request(HttpRequest(HttpMethod::Post, "/admin/api/reboot"));
        FAIL("Expected RequestFailed");
    } catch (const desk_types::RequestFailed& e) {
        REQUIRE(e.status() == 403);
        REQUIRE(e.body() == "Token invalid");
    }
    server.join();
    REQUIRE(server.error().empty());
}

TEST_CASE("BeastTransport reports unreachable hosts as TransportError", "[BeastTransport]") {
    std::string host;
    {
        // Bind and release a port so nothing listens on it
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        host = "127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
    }

    BeastTransport transport(TransportConfig::for_host(host));
    REQUIRE_THROWS_AS(transport.request(HttpRequest(HttpMethod::Get, "/admin/api/control-token")),
                      desk_types::TransportError);
}

// ============================================================================
// Channels
// ============================================================================

TEST_CASE("BeastChannel presents the session and times out at the deadline", "[BeastTransport]") {
    std::string auth;
    std::string target;
    LoopbackServer server({[&](ServerStream& stream) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(stream, buffer, req);
        auth = std::string(req[http::field::authorization]);
        target = std::string(req.target());

        websocket::stream<ServerStream&> ws(stream);
        ws.accept(req);
        ws.text(true);
        ws.write(net::buffer(std::string("{\"circle\":false}")));

        // Hold the connection until the client releases it
        beast::flat_buffer sink;
        beast::error_code ec;
        ws.read(sink, ec);
    }});

    BeastTransport transport(loopback_config(server));
    transport.set_session_cookie("abc");
    auto channel = transport.open_channel("desk/api/navigation/events");
    REQUIRE(channel->is_open());
    REQUIRE(channel->path() == "/desk/api/navigation/events");

    Frame first = channel->read(std::chrono::steady_clock::now() + std::chrono::seconds(2));
    REQUIRE(first.status == FrameStatus::Message);
    REQUIRE(first.payload == "{\"circle\":false}");

    auto start = std::chrono::steady_clock::now();
    Frame second = channel->read(start + std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(second.status == FrameStatus::TimedOut);
    REQUIRE(elapsed >= std::chrono::milliseconds(150));
    REQUIRE(elapsed < std::chrono::seconds(2));
    REQUIRE_FALSE(channel->is_open());

    REQUIRE(channel->read().status == FrameStatus::Closed);
    channel->close();
    channel->close();
    REQUIRE_FALSE(channel->is_open());

    server.join();
    REQUIRE(server.error().empty());
    REQUIRE(auth == "abc");
    REQUIRE(target == "/desk/api/navigation/events");
}

TEST_CASE("BeastChannel reports a server close as Closed", "[BeastTransport]") {
    LoopbackServer server({[](ServerStream& stream) {
        websocket::stream<ServerStream&> ws(stream);
        ws.accept();
        ws.text(true);
        ws.write(net::buffer(std::string("{\"brakeState\": []}")));
        ws.close(websocket::close_code::normal);
    }});

    BeastTransport transport(loopback_config(server));
    auto channel = transport.open_channel("/admin/api/safety/status");

    REQUIRE(channel->read().status == FrameStatus::Message);
    REQUIRE(channel->read().status == FrameStatus::Closed);
    REQUIRE_FALSE(channel->is_open());
    channel->close();

    server.join();
    REQUIRE(server.error().empty());
}

TEST_CASE("BeastChannel surfaces a rejected handshake as RequestFailed", "[BeastTransport]") {
    http::request<http::string_body> seen;
    LoopbackServer server({answer(seen, http::status::unauthorized, "Unauthorized")});

    BeastTransport transport(loopback_config(server));
    try {
        transport.open_channel("/admin/api/system-status");
        FAIL("Expected RequestFailed");
    } catch (const desk_types::RequestFailed& e) {
        REQUIRE(e.status() == 401);
    }
    server.join();
    REQUIRE(std::string(seen.target()) == "/admin/api/system-status");
}
