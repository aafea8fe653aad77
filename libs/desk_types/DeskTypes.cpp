#include "DeskTypes.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace desk_types {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

Platform parse_platform(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "panda" || lower == "fer" ||
        lower == "franka_emika_robot" || lower == "frankaemikarobot") {
        return Platform::Panda;
    }
    if (lower == "fr3" || lower == "frankaresearch3" || lower == "franka_research_3") {
        return Platform::Fr3;
    }
    throw std::invalid_argument("Unknown platform '" + name + "'! Must be either 'panda' or 'fr3'");
}

const char* platform_name(Platform platform) {
    switch (platform) {
        case Platform::Panda: return "panda";
        case Platform::Fr3: return "fr3";
    }
    return "unknown";
}

OperatingMode parse_operating_mode(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "execution") return OperatingMode::Execution;
    if (lower == "programming") return OperatingMode::Programming;
    throw std::invalid_argument("Unknown mode " + name);
}

const char* operating_mode_name(OperatingMode mode) {
    switch (mode) {
        case OperatingMode::Execution: return "execution";
        case OperatingMode::Programming: return "programming";
    }
    return "unknown";
}

const char* button_name(Button button) {
    switch (button) {
        case Button::Circle: return "circle";
        case Button::Check: return "check";
        case Button::Cross: return "cross";
        case Button::Up: return "up";
        case Button::Down: return "down";
        case Button::Left: return "left";
        case Button::Right: return "right";
    }
    return "unknown";
}

Button parse_button(const std::string& name) {
    const std::string lower = to_lower(name);
    for (Button button : ALL_BUTTONS) {
        if (lower == button_name(button)) {
            return button;
        }
    }
    throw std::invalid_argument("Unknown button " + name);
}

const char* channel_path(DeskChannel channel) {
    switch (channel) {
        case DeskChannel::RobotConfiguration: return "/desk/api/robot/configuration";
        case DeskChannel::GeneralSystemStatus: return "/admin/api/system-status";
        case DeskChannel::SafetyStatus: return "/admin/api/safety/status";
        case DeskChannel::SystemStatus: return "/desk/api/system/status";
        case DeskChannel::ButtonEvents: return "/desk/api/navigation/events";
    }
    return "";
}

const char* channel_name(DeskChannel channel) {
    switch (channel) {
        case DeskChannel::RobotConfiguration: return "robot_states";
        case DeskChannel::GeneralSystemStatus: return "general_system_status";
        case DeskChannel::SafetyStatus: return "safety_status";
        case DeskChannel::SystemStatus: return "system_status";
        case DeskChannel::ButtonEvents: return "button_events";
    }
    return "unknown";
}

} // namespace desk_types
