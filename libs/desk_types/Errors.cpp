#include "Errors.hpp"

#include <utility>

namespace desk_types {

RequestFailed::RequestFailed(int status, std::string body)
    : RequestFailed(status, body, "Request failed with status " + std::to_string(status) + ": " + body) {}

RequestFailed::RequestFailed(int status, std::string body, const std::string& what)
    : DeskError(what), status_(status), body_(std::move(body)) {}

AuthenticationFailed::AuthenticationFailed(int status, std::string body)
    : RequestFailed(status, body, "Login rejected with status " + std::to_string(status) + ": " + body) {}

StreamDecodeError::StreamDecodeError(std::string channel_path, const std::string& what)
    : DeskError("Malformed message on " + channel_path + ": " + what)
    , channel_path_(std::move(channel_path)) {}

ChannelClosed::ChannelClosed(const std::string& channel_path)
    : DeskError("Channel " + channel_path + " closed before the condition was met") {}

UnsupportedOnPlatform::UnsupportedOnPlatform(const std::string& operation, const std::string& platform)
    : DeskError(operation + " is not supported on the " + platform + " platform") {}

} // namespace desk_types
