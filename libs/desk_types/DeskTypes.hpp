#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace desk_types {

// Robot platform behind the Desk; selects REST paths
enum class Platform {
    Panda,  // Franka Emika Robot (legacy platform)
    Fr3     // Franka Research 3
};

enum class OperatingMode {
    Execution,
    Programming
};

// Buttons on the robot's Pilot interface
enum class Button {
    Circle,
    Check,
    Cross,
    Up,
    Down,
    Left,
    Right
};

// Status channels streamed over WebSocket
enum class DeskChannel {
    RobotConfiguration,   // cartesian pose, forces, torques, joint angles
    GeneralSystemStatus,  // execution, safety, robot, controlToken, ...
    SafetyStatus,         // brakeState and safety controller state
    SystemStatus,         // EtherCAT / joint firmware status
    ButtonEvents          // sparse {button: pressed} deltas
};

// Number of joints reported in brake state and joint arrays
constexpr size_t JOINT_COUNT = 7;

constexpr std::array<Button, 7> ALL_BUTTONS = {
    Button::Circle, Button::Check, Button::Cross,
    Button::Up, Button::Down, Button::Left, Button::Right
};

// Accepts the usual aliases ("panda", "fer", "fr3", "franka_research_3", ...)
// Throws std::invalid_argument for anything else
Platform parse_platform(const std::string& name);
const char* platform_name(Platform platform);

// Throws std::invalid_argument for an unknown mode name
OperatingMode parse_operating_mode(const std::string& name);
const char* operating_mode_name(OperatingMode mode);

// Key used by the button events channel ("circle", "check", ...)
const char* button_name(Button button);
Button parse_button(const std::string& name);

// Host-relative path of a channel, always with a single leading slash
const char* channel_path(DeskChannel channel);
const char* channel_name(DeskChannel channel);

} // namespace desk_types
