#include "desk_client/ConditionWait.hpp"

#include <Errors.hpp>

#include <algorithm>

namespace pandadesk::client {

namespace {

// Closes the stream on every exit path, including exceptions from the predicate
class CloseOnExit {
public:
    explicit CloseOnExit(StatusStream& stream) : stream_(stream) {}
    ~CloseOnExit() { stream_.close(); }

    CloseOnExit(const CloseOnExit&) = delete;
    CloseOnExit& operator=(const CloseOnExit&) = delete;

private:
    StatusStream& stream_;
};

bool button_has_value(const nlohmann::json& event, desk_types::Button button, bool value) {
    if (!event.is_object()) return false;
    auto it = event.find(desk_types::button_name(button));
    return it != event.end() && it->is_boolean() && it->get<bool>() == value;
}

} // anonymous namespace

std::optional<nlohmann::json> wait_for(StatusStream& stream,
                                       const Predicate& predicate,
                                       WaitTimeout timeout) {
    CloseOnExit guard(stream);

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = std::chrono::steady_clock::now() + *timeout;
    }

    while (true) {
        StreamItem item = deadline ? stream.next_until(*deadline) : stream.next();
        switch (item.event) {
            case StreamEvent::Message:
                if (predicate(item.message)) {
                    return std::move(item.message);
                }
                break;
            case StreamEvent::TimedOut:
                return std::nullopt;
            case StreamEvent::Ended:
                throw desk_types::ChannelClosed(stream.path());
        }
    }
}

std::optional<nlohmann::json> wait_for(desk_transport::Transport& transport,
                                       desk_types::DeskChannel channel,
                                       const Predicate& predicate,
                                       WaitTimeout timeout) {
    StatusStream stream = subscribe(transport, channel);
    return wait_for(stream, predicate, timeout);
}

bool brakes_all(const nlohmann::json& safety_status, const std::string& state) {
    if (!safety_status.is_object()) return false;
    auto it = safety_status.find("brakeState");
    if (it == safety_status.end() || !it->is_array() || it->size() != desk_types::JOINT_COUNT) {
        return false;
    }
    return std::all_of(it->begin(), it->end(), [&state](const nlohmann::json& brake) {
        return brake.is_string() && brake.get<std::string>() == state;
    });
}

bool brakes_open(const nlohmann::json& safety_status) {
    return brakes_all(safety_status, "Unlocked");
}

bool brakes_closed(const nlohmann::json& safety_status) {
    return brakes_all(safety_status, "Locked");
}

bool button_pressed(const nlohmann::json& event, desk_types::Button button) {
    return button_has_value(event, button, true);
}

bool button_released(const nlohmann::json& event, desk_types::Button button) {
    return button_has_value(event, button, false);
}

std::optional<nlohmann::json> wait_for_brakes_open(desk_transport::Transport& transport,
                                                   WaitTimeout timeout) {
    return wait_for(transport, desk_types::DeskChannel::SafetyStatus, brakes_open, timeout);
}

std::optional<nlohmann::json> wait_for_brakes_closed(desk_transport::Transport& transport,
                                                     WaitTimeout timeout) {
    return wait_for(transport, desk_types::DeskChannel::SafetyStatus, brakes_closed, timeout);
}

std::optional<nlohmann::json> wait_for_press(desk_transport::Transport& transport,
                                             desk_types::Button button,
                                             WaitTimeout timeout) {
    return wait_for(transport, desk_types::DeskChannel::ButtonEvents,
                    [button](const nlohmann::json& event) { return button_pressed(event, button); },
                    timeout);
}

std::optional<nlohmann::json> wait_for_release(desk_transport::Transport& transport,
                                               desk_types::Button button,
                                               WaitTimeout timeout) {
    return wait_for(transport, desk_types::DeskChannel::ButtonEvents,
                    [button](const nlohmann::json& event) { return button_released(event, button); },
                    timeout);
}

} // namespace pandadesk::client
