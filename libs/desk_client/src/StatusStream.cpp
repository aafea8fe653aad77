#include "desk_client/StatusStream.hpp"

#include <Errors.hpp>

#include <utility>

namespace pandadesk::client {

StatusStream::StatusStream(std::unique_ptr<desk_transport::Channel> channel)
    : channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("StatusStream: channel is null");
    }
    path_ = channel_->path();
}

StatusStream::~StatusStream() {
    close();
}

StatusStream::StatusStream(StatusStream&& other) noexcept
    : channel_(std::move(other.channel_))
    , path_(std::move(other.path_))
    , closed_(other.closed_) {
    other.closed_ = true;
}

StatusStream& StatusStream::operator=(StatusStream&& other) noexcept {
    if (this != &other) {
        close();
        channel_ = std::move(other.channel_);
        path_ = std::move(other.path_);
        closed_ = other.closed_;
        other.closed_ = true;
    }
    return *this;
}

StreamItem StatusStream::next() {
    return read(std::nullopt);
}

StreamItem StatusStream::next_until(std::chrono::steady_clock::time_point deadline) {
    return read(deadline);
}

StreamItem StatusStream::read(desk_transport::Channel::Deadline deadline) {
    if (closed_ || !channel_) {
        return {};
    }

    desk_transport::Frame frame = channel_->read(deadline);
    switch (frame.status) {
        case desk_transport::FrameStatus::TimedOut:
            return {StreamEvent::TimedOut, {}};
        case desk_transport::FrameStatus::Closed:
            return {};
        case desk_transport::FrameStatus::Message:
            break;
    }

    StreamItem item;
    try {
        item.message = nlohmann::json::parse(frame.payload);
    } catch (const nlohmann::json::parse_error& e) {
        close();
        throw desk_types::StreamDecodeError(path_, e.what());
    }
    item.event = StreamEvent::Message;
    return item;
}

void StatusStream::close() {
    if (closed_ || !channel_) return;
    closed_ = true;
    channel_->close();
}

bool StatusStream::is_open() const {
    return !closed_ && channel_ && channel_->is_open();
}

StatusStream subscribe(desk_transport::Transport& transport, desk_types::DeskChannel channel) {
    return subscribe(transport, desk_types::channel_path(channel));
}

StatusStream subscribe(desk_transport::Transport& transport, const std::string& path) {
    return StatusStream(transport.open_channel(path));
}

} // namespace pandadesk::client
