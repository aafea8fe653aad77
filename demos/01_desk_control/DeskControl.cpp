// DeskControl.cpp
// Logs into a Franka Desk, takes control, unlocks the brakes and activates
// FCI, then waits for the check button before handing the robot back.
// With --print, dumps messages from one status channel instead.

#include "desk_client/Desk.hpp"

#include <DeskTypes.hpp>
#include <Errors.hpp>
#include <Logger.hpp>

#include <array>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Config {
    std::string host = "172.16.0.2";
    std::string platform = "fr3";
    bool force = false;
    bool legacy = false;
    bool verbose = false;
    std::string print_channel;       // channel name, empty = control sequence
    int print_count = 5;
    int confirm_timeout = 10;        // seconds to wait for the check button
};

void print_usage() {
    std::cout << "Usage: desk_control [options]\n"
              << "Options:\n"
              << "  --host <addr>       Desk host (default: 172.16.0.2)\n"
              << "  --platform <name>   panda | fr3 (default: fr3)\n"
              << "  --force             Take control from another user (press circle to confirm)\n"
              << "  --legacy            Desk without control tokens\n"
              << "  --timeout <sec>     Wait for the check button (default: 10)\n"
              << "  --print <channel>   Print messages from robot_states, general_system_status,\n"
              << "                      safety_status, system_status or button_events\n"
              << "  --count <n>         Messages to print (default: 5)\n"
              << "  --verbose           Debug logging\n"
              << "Credentials are read from PANDA_USERNAME and PANDA_PASSWORD.\n"
              << std::endl;
}

void parse_args(int argc, char* argv[], Config& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        }
        if (arg == "--host" && i + 1 < argc) config.host = argv[++i];
        else if (arg == "--platform" && i + 1 < argc) config.platform = argv[++i];
        else if (arg == "--force") config.force = true;
        else if (arg == "--legacy") config.legacy = true;
        else if (arg == "--verbose") config.verbose = true;
        else if (arg == "--timeout" && i + 1 < argc) config.confirm_timeout = std::stoi(argv[++i]);
        else if (arg == "--print" && i + 1 < argc) config.print_channel = argv[++i];
        else if (arg == "--count" && i + 1 < argc) config.print_count = std::stoi(argv[++i]);
    }
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

bool find_channel(const std::string& name, desk_types::DeskChannel& channel) {
    constexpr std::array<desk_types::DeskChannel, 5> channels = {
        desk_types::DeskChannel::RobotConfiguration, desk_types::DeskChannel::GeneralSystemStatus,
        desk_types::DeskChannel::SafetyStatus, desk_types::DeskChannel::SystemStatus,
        desk_types::DeskChannel::ButtonEvents};
    for (auto candidate : channels) {
        if (name == desk_types::channel_name(candidate)) {
            channel = candidate;
            return true;
        }
    }
    return false;
}

int print_channel(pandadesk::client::Desk& desk, desk_types::DeskChannel channel, int count) {
    auto stream = desk.subscribe(channel);
    for (int i = 0; i < count; ++i) {
        auto item = stream.next();
        if (!item.has_message()) {
            std::cerr << "[DeskControl] Channel " << stream.path() << " ended" << std::endl;
            return 1;
        }
        std::cout << item.message.dump(4) << std::endl;
    }
    return 0;
}

int control_sequence(pandadesk::client::Desk& desk, const Config& config) {
    if (!desk.take_control(config.force)) {
        std::cerr << "[DeskControl] Control not acquired ("
                  << pandadesk::client::control_outcome_name(desk.last_control_outcome()) << ")"
                  << std::endl;
        return 1;
    }

    if (desk.platform() == desk_types::Platform::Fr3) {
        desk.set_mode(desk_types::OperatingMode::Execution);
    }
    desk.unlock();
    desk.activate_fci();
    std::cout << "FCI active. Press check on the Pilot to release the robot." << std::endl;

    auto pressed = desk.wait_for_press(desk_types::Button::Check,
                                       std::chrono::seconds(config.confirm_timeout));
    if (!pressed) {
        std::cout << "No button press within " << config.confirm_timeout << " s" << std::endl;
    }

    desk.deactivate_fci();
    desk.lock();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Config config;
    parse_args(argc, argv, config);

    const std::string username = env_or_empty("PANDA_USERNAME");
    const std::string password = env_or_empty("PANDA_PASSWORD");
    if (username.empty()) {
        std::cerr << "PANDA_USERNAME is not set. Exiting." << std::endl;
        return 1;
    }

    auto logger = std::make_shared<desk_types::StreamLogger>(
        config.verbose ? desk_types::LogLevel::Debug : desk_types::LogLevel::Info);

    try {
        auto desk_config = pandadesk::client::DeskConfig::for_host(config.host);
        desk_config.platform = desk_types::parse_platform(config.platform);
        desk_config.legacy_desk = config.legacy;

        std::cout << "=== Desk Control ===" << std::endl;
        std::cout << "Host: " << desk_config.hostname << std::endl;
        std::cout << "Platform: " << desk_types::platform_name(desk_config.platform) << std::endl;
        std::cout << std::endl;

        pandadesk::client::Desk desk(desk_config, logger);
        desk.login(username, password);

        int rc = 0;
        if (!config.print_channel.empty()) {
            desk_types::DeskChannel channel;
            if (!find_channel(config.print_channel, channel)) {
                std::cerr << "Unknown channel '" << config.print_channel << "'" << std::endl;
                print_usage();
                return 1;
            }
            rc = print_channel(desk, channel, config.print_count);
        } else {
            rc = control_sequence(desk, config);
        }

        desk.logout();
        return rc;
    } catch (const desk_types::AuthenticationFailed& e) {
        std::cerr << "Login rejected (" << e.status() << "): " << e.body() << std::endl;
    } catch (const desk_types::DeskError& e) {
        std::cerr << "Desk error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
    }
    return 1;
}
