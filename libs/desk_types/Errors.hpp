#pragma once

#include <stdexcept>
#include <string>

namespace desk_types {

// Base class for every failure raised by the Desk client
class DeskError : public std::runtime_error {
public:
    explicit DeskError(const std::string& what) : std::runtime_error(what) {}
};

// Network-level failure (resolve, connect, TLS handshake, timeout)
class TransportError : public DeskError {
public:
    explicit TransportError(const std::string& what) : DeskError(what) {}
};

// Any HTTP response with a non-2xx status
// body() is the response text, unmodified
class RequestFailed : public DeskError {
public:
    RequestFailed(int status, std::string body);
    RequestFailed(int status, std::string body, const std::string& what);

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

// Login was rejected by the device
class AuthenticationFailed : public RequestFailed {
public:
    AuthenticationFailed(int status, std::string body);
};

// HTTP response body does not have the documented shape
class ResponseFormatError : public DeskError {
public:
    explicit ResponseFormatError(const std::string& what) : DeskError(what) {}
};

// Malformed payload on a status channel; terminates that subscription only
class StreamDecodeError : public DeskError {
public:
    StreamDecodeError(std::string channel_path, const std::string& what);

    const std::string& channel_path() const { return channel_path_; }

private:
    std::string channel_path_;
};

// Status channel ended while a condition wait was still pending
class ChannelClosed : public DeskError {
public:
    explicit ChannelClosed(const std::string& channel_path);
};

// Operation is not available on the configured platform
class UnsupportedOnPlatform : public DeskError {
public:
    UnsupportedOnPlatform(const std::string& operation, const std::string& platform);
};

} // namespace desk_types
