#pragma once

#include "Transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace desk_transport {

// Connection configuration for a Desk host
struct TransportConfig {
    // Host name or address, optionally with ":port" (default 443)
    std::string hostname;

    // The Desk presents a self-signed certificate, so certificate and
    // host name verification are off unless explicitly enabled
    bool verify_tls = false;

    // Default per-request timeout (connect + handshake + exchange)
    std::chrono::seconds request_timeout{5};

    // Timeout for the WebSocket opening handshake
    std::chrono::seconds channel_open_timeout{5};

    static TransportConfig for_host(const std::string& hostname) {
        TransportConfig cfg;
        cfg.hostname = hostname;
        return cfg;
    }
};

// Boost.Beast implementation over TLS
// Every HTTP request uses a fresh connection; every channel owns its own
// connection and I/O context, so channels can be consumed from separate threads.
// HTTP requests themselves must be issued from one thread at a time.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(const TransportConfig& config,
                            std::shared_ptr<desk_types::Logger> logger = nullptr);
    ~BeastTransport() override;

    std::unique_ptr<Channel> open_channel(const std::string& path) override;

    const std::string& hostname() const override { return config_.hostname; }
    const TransportConfig& config() const { return config_; }

protected:
    HttpResponse perform(const HttpRequest& request) override;

private:
    struct Impl;

    TransportConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace desk_transport
