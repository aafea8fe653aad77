#pragma once

/**
 * @file StatusStream.hpp
 * @brief Decoded JSON message sequence over one Desk status channel
 *
 * Each subscription owns exactly one WebSocket connection. Messages are
 * delivered in the order the device sent them; there is no history, so
 * subscribing again starts from the device's current state.
 */

#include <Channel.hpp>
#include <DeskTypes.hpp>
#include <Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace pandadesk::client {

enum class StreamEvent {
    Message,   // message holds the decoded payload
    TimedOut,  // deadline passed first; the stream cannot be read further
    Ended      // connection closed, dropped, or close() was called
};

struct StreamItem {
    StreamEvent event = StreamEvent::Ended;
    nlohmann::json message;

    bool has_message() const { return event == StreamEvent::Message; }
};

/**
 * @brief Scoped subscription handle
 *
 * The channel is closed exactly once: by close(), by a decode error, or by
 * the destructor, whichever comes first. Breaking out of a read loop early
 * therefore never leaks the connection.
 *
 * Not thread-safe; a stream is consumed by one thread. Independent streams
 * can be consumed concurrently.
 */
class StatusStream {
public:
    explicit StatusStream(std::unique_ptr<desk_transport::Channel> channel);
    ~StatusStream();

    // Non-copyable
    StatusStream(const StatusStream&) = delete;
    StatusStream& operator=(const StatusStream&) = delete;

    // Movable
    StatusStream(StatusStream&& other) noexcept;
    StatusStream& operator=(StatusStream&& other) noexcept;

    /**
     * @brief Block until the next message or the end of the stream
     *
     * Throws desk_types::StreamDecodeError for a payload that is not JSON.
     * The channel is closed before the exception leaves.
     */
    StreamItem next();

    /**
     * @brief Like next(), but gives up at deadline with StreamEvent::TimedOut
     */
    StreamItem next_until(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Release the channel; idempotent
     */
    void close();

    bool is_open() const;
    const std::string& path() const { return path_; }

private:
    std::unique_ptr<desk_transport::Channel> channel_;
    std::string path_;
    bool closed_ = false;

    StreamItem read(desk_transport::Channel::Deadline deadline);
};

// Opens a new independent subscription
StatusStream subscribe(desk_transport::Transport& transport, desk_types::DeskChannel channel);
StatusStream subscribe(desk_transport::Transport& transport, const std::string& path);

} // namespace pandadesk::client
