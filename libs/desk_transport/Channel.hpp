#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace desk_transport {

enum class FrameStatus {
    Message,   // payload holds one received frame
    TimedOut,  // deadline passed before a frame arrived
    Closed     // connection closed or dropped
};

struct Frame {
    FrameStatus status = FrameStatus::Closed;
    std::string payload;
};

// One open WebSocket connection delivering raw frames in receipt order
//
// A read that times out leaves the connection unusable: the next read
// reports Closed and close() only releases the socket.
// Not thread-safe: read() and close() must be called from the owning thread.
class Channel {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    virtual ~Channel() = default;

    // Blocks until a frame arrives, the deadline passes, or the connection ends
    virtual Frame read(Deadline deadline = std::nullopt) = 0;

    // Releases the connection; idempotent
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Host-relative path this channel was opened on
    virtual const std::string& path() const = 0;
};

} // namespace desk_transport
