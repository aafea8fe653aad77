#pragma once

#include "Channel.hpp"
#include "HttpTypes.hpp"
#include "Logger.hpp"

#include <memory>
#include <string>

namespace desk_transport {

// Authenticated HTTP + WebSocket access to a single Desk host
//
// The session cookie set after login is attached to every HTTP request
// (as the "authorization" cookie) and to every channel handshake
// (as the "authorization" header).
class Transport {
public:
    explicit Transport(std::shared_ptr<desk_types::Logger> logger = nullptr);
    virtual ~Transport() = default;

    // Non-copyable
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Performs the request against https://{host}{path}
    // Throws desk_types::RequestFailed for any non-2xx status, carrying the body
    // Throws desk_types::TransportError when no response was received
    HttpResponse request(const HttpRequest& request);

    // Opens wss://{host}/{path} presenting the session cookie
    // Throws desk_types::TransportError or desk_types::RequestFailed (handshake rejected)
    virtual std::unique_ptr<Channel> open_channel(const std::string& path) = 0;

    virtual const std::string& hostname() const = 0;

    void set_session_cookie(const std::string& value) { session_cookie_ = value; }
    void clear_session_cookie() { session_cookie_.clear(); }
    const std::string& session_cookie() const { return session_cookie_; }

protected:
    // Sends the request and returns whatever the device answered
    virtual HttpResponse perform(const HttpRequest& request) = 0;

    const std::shared_ptr<desk_types::Logger>& logger() const { return logger_; }

private:
    std::shared_ptr<desk_types::Logger> logger_;
    std::string session_cookie_;
};

} // namespace desk_transport
