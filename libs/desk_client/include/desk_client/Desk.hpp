#pragma once

/**
 * @file Desk.hpp
 * @brief Session with one Franka Desk host
 *
 * Binds a transport, the token store and the control arbiter to a single
 * host and platform. Privileged calls present the locally held control
 * token; the device rejects them when that token is not the active one.
 *
 * Usage:
 * @code
 *   auto config = pandadesk::client::DeskConfig::for_host("172.16.0.2");
 *   config.platform = desk_types::Platform::Fr3;
 *   pandadesk::client::Desk desk(config, std::make_shared<desk_types::StreamLogger>());
 *   desk.login("admin", password);
 *   if (desk.take_control()) {
 *       desk.unlock();
 *       desk.activate_fci();
 *   }
 * @endcode
 */

#include "desk_client/ConditionWait.hpp"
#include "desk_client/ControlArbiter.hpp"
#include "desk_client/StatusStream.hpp"

#include <BeastTransport.hpp>
#include <DeskTypes.hpp>
#include <Logger.hpp>
#include <Token.hpp>
#include <TokenStore.hpp>
#include <Transport.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace pandadesk::client {

struct DeskConfig {
    // Host name or address of the Desk, optionally with ":port"
    std::string hostname;

    desk_types::Platform platform = desk_types::Platform::Panda;

    // Desk version without control tokens
    bool legacy_desk = false;

    // The Desk ships a self-signed certificate
    bool verify_tls = false;

    std::string token_path = token_store::DEFAULT_TOKEN_PATH;

    std::chrono::seconds request_timeout{5};

    // Brake and operating mode requests
    std::chrono::seconds long_request_timeout{50};

    // Bound for the brake state waits of lock() / unlock(); empty waits forever
    WaitTimeout brake_timeout;

    static DeskConfig for_host(const std::string& hostname) {
        DeskConfig cfg;
        cfg.hostname = hostname;
        return cfg;
    }

    desk_transport::TransportConfig transport_config() const;
};

class Desk {
public:
    // Connects through a BeastTransport and the token file at config.token_path
    explicit Desk(const DeskConfig& config, std::shared_ptr<desk_types::Logger> logger = nullptr);

    // Uses the given transport; the token file still comes from config.token_path
    Desk(const DeskConfig& config,
         std::shared_ptr<desk_transport::Transport> transport,
         std::shared_ptr<desk_types::Logger> logger = nullptr);

    // Non-copyable, non-movable (the arbiter refers to members)
    Desk(const Desk&) = delete;
    Desk& operator=(const Desk&) = delete;

    static std::string encode_password(const std::string& username, const std::string& password);

    // Session

    // Throws desk_types::AuthenticationFailed when the Desk rejects the credentials
    void login(const std::string& username, const std::string& password);
    void logout();
    bool logged_in() const { return logged_in_; }
    const std::string& username() const { return username_; }

    // Control

    bool check_has_control();

    // Requests control for the logged-in user; see ControlArbiter::take_control
    bool take_control(bool force = false);

    const desk_types::Token& token() const { return arbiter_.token(); }
    ControlState control_state() const { return arbiter_.state(); }
    ControlOutcome last_control_outcome() const { return arbiter_.last_outcome(); }

    // Privileged operations

    // Throws desk_types::UnsupportedOnPlatform on Panda
    void set_mode(desk_types::OperatingMode mode);

    // Close / open the joint brakes and block until all of them report it
    // Returns false only when config.brake_timeout elapsed first
    bool lock(bool force = true);
    bool unlock(bool force = true);

    void reboot();

    // No-ops on a legacy Desk
    void activate_fci();
    void deactivate_fci();

    // Status channels, each a new independent subscription

    StatusStream subscribe(desk_types::DeskChannel channel);
    StatusStream robot_states();
    StatusStream general_system_status();
    StatusStream safety_status();
    StatusStream system_status();
    StatusStream button_events();

    // Waits

    std::optional<nlohmann::json> wait_for(desk_types::DeskChannel channel,
                                           const Predicate& predicate,
                                           WaitTimeout timeout = std::nullopt);
    std::optional<nlohmann::json> wait_for_brakes_open(WaitTimeout timeout = std::nullopt);
    std::optional<nlohmann::json> wait_for_brakes_closed(WaitTimeout timeout = std::nullopt);
    std::optional<nlohmann::json> wait_for_press(desk_types::Button button,
                                                 WaitTimeout timeout = std::nullopt);
    std::optional<nlohmann::json> wait_for_release(desk_types::Button button,
                                                   WaitTimeout timeout = std::nullopt);

    const DeskConfig& config() const { return config_; }
    const std::string& hostname() const { return config_.hostname; }
    desk_types::Platform platform() const { return config_.platform; }
    desk_transport::Transport& transport() { return *transport_; }

private:
    DeskConfig config_;
    std::shared_ptr<desk_types::Logger> logger_;
    std::shared_ptr<desk_transport::Transport> transport_;
    token_store::TokenStore store_;
    ControlArbiter arbiter_;

    bool logged_in_ = false;
    std::string username_ = "Not set";

    desk_transport::HttpRequest privileged(desk_transport::HttpMethod method,
                                           const std::string& path) const;
    bool move_brakes(const std::string& path, bool force, bool open);
};

} // namespace pandadesk::client
