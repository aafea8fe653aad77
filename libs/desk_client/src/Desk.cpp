#include "desk_client/Desk.hpp"
#include "desk_client/Credentials.hpp"

#include <Errors.hpp>

#include <stdexcept>
#include <utility>

namespace pandadesk::client {

using desk_transport::HttpMethod;
using desk_transport::HttpRequest;
using desk_types::DeskChannel;
using desk_types::Platform;

namespace {

const char* const COMPONENT = "Desk";

const char* const CONTROL_TOKEN_HEADER = "X-Control-Token";
const char* const FCI_PATH = "/admin/api/control-token/fci";

std::shared_ptr<desk_transport::Transport> require(std::shared_ptr<desk_transport::Transport> transport) {
    if (!transport) {
        throw std::invalid_argument("Desk: transport is null");
    }
    return transport;
}

} // anonymous namespace

desk_transport::TransportConfig DeskConfig::transport_config() const {
    auto cfg = desk_transport::TransportConfig::for_host(hostname);
    cfg.verify_tls = verify_tls;
    cfg.request_timeout = request_timeout;
    return cfg;
}

Desk::Desk(const DeskConfig& config, std::shared_ptr<desk_types::Logger> logger)
    : Desk(config,
           std::make_shared<desk_transport::BeastTransport>(config.transport_config(), logger),
           logger) {}

Desk::Desk(const DeskConfig& config,
           std::shared_ptr<desk_transport::Transport> transport,
           std::shared_ptr<desk_types::Logger> logger)
    : config_(config)
    , logger_(desk_types::logger_or_null(std::move(logger)))
    , transport_(require(std::move(transport)))
    , store_(token_store::TokenStore::expand_user(config.token_path))
    , arbiter_(*transport_, store_, config.hostname, logger_, config.legacy_desk) {}

std::string Desk::encode_password(const std::string& username, const std::string& password) {
    return pandadesk::client::encode_password(username, password);
}

void Desk::login(const std::string& username, const std::string& password) {
    HttpRequest request(HttpMethod::Post, "/admin/api/login");
    request.json = nlohmann::json{
        {"login", username},
        {"password", encode_password(username, password)}};

    desk_transport::HttpResponse response;
    try {
        response = transport_->request(request);
    } catch (const desk_types::RequestFailed& e) {
        throw desk_types::AuthenticationFailed(e.status(), e.body());
    }

    transport_->set_session_cookie(response.body);
    logged_in_ = true;
    username_ = username;
    logger_->info(COMPONENT, "Login successful.");
}

void Desk::logout() {
    transport_->request(HttpRequest(HttpMethod::Post, "/admin/api/logout"));
    transport_->clear_session_cookie();
    logged_in_ = false;
    logger_->info(COMPONENT, "Logout successful.");
}

bool Desk::check_has_control() {
    return arbiter_.check_has_control();
}

bool Desk::take_control(bool force) {
    return arbiter_.take_control(username_, force);
}

HttpRequest Desk::privileged(HttpMethod method, const std::string& path) const {
    HttpRequest request(method, path);
    request.headers[CONTROL_TOKEN_HEADER] = arbiter_.token().token;
    return request;
}

void Desk::set_mode(desk_types::OperatingMode mode) {
    if (config_.platform == Platform::Panda) {
        throw desk_types::UnsupportedOnPlatform("set_mode", desk_types::platform_name(config_.platform));
    }

    HttpRequest request = privileged(HttpMethod::Post,
        std::string("/desk/api/operating-mode/") + desk_types::operating_mode_name(mode));
    request.timeout = config_.long_request_timeout;
    transport_->request(request);

    logger_->info(COMPONENT, std::string("Set mode to ") + desk_types::operating_mode_name(mode) + ".");
}

bool Desk::move_brakes(const std::string& path, bool force, bool open) {
    HttpRequest request = privileged(HttpMethod::Post, path);
    request.files["force"] = force ? "True" : "False";
    request.timeout = config_.long_request_timeout;
    transport_->request(request);

    auto status = open ? wait_for_brakes_open(config_.brake_timeout)
                       : wait_for_brakes_closed(config_.brake_timeout);
    if (!status) {
        logger_->warn(COMPONENT, open ? "Brakes did not open in time." : "Brakes did not close in time.");
        return false;
    }
    return true;
}

bool Desk::lock(bool force) {
    const char* path = config_.platform == Platform::Panda ? "/desk/api/robot/close-brakes"
                                                           : "/desk/api/joints/lock";
    return move_brakes(path, force, false);
}

bool Desk::unlock(bool force) {
    const char* path = config_.platform == Platform::Panda ? "/desk/api/robot/open-brakes"
                                                           : "/desk/api/joints/unlock";
    return move_brakes(path, force, true);
}

void Desk::reboot() {
    transport_->request(privileged(HttpMethod::Post, "/admin/api/reboot"));
}

void Desk::activate_fci() {
    if (config_.legacy_desk) return;
    HttpRequest request(HttpMethod::Post, FCI_PATH);
    request.json = nlohmann::json{{"token", arbiter_.token().token}};
    transport_->request(request);
}

void Desk::deactivate_fci() {
    if (config_.legacy_desk) return;
    HttpRequest request(HttpMethod::Delete, FCI_PATH);
    request.json = nlohmann::json{{"token", arbiter_.token().token}};
    transport_->request(request);
}

StatusStream Desk::subscribe(DeskChannel channel) {
    return pandadesk::client::subscribe(*transport_, channel);
}

StatusStream Desk::robot_states() { return subscribe(DeskChannel::RobotConfiguration); }
StatusStream Desk::general_system_status() { return subscribe(DeskChannel::GeneralSystemStatus); }
StatusStream Desk::safety_status() { return subscribe(DeskChannel::SafetyStatus); }
StatusStream Desk::system_status() { return subscribe(DeskChannel::SystemStatus); }
StatusStream Desk::button_events() { return subscribe(DeskChannel::ButtonEvents); }

std::optional<nlohmann::json> Desk::wait_for(DeskChannel channel,
                                             const Predicate& predicate,
                                             WaitTimeout timeout) {
    return pandadesk::client::wait_for(*transport_, channel, predicate, timeout);
}

std::optional<nlohmann::json> Desk::wait_for_brakes_open(WaitTimeout timeout) {
    return pandadesk::client::wait_for_brakes_open(*transport_, timeout);
}

std::optional<nlohmann::json> Desk::wait_for_brakes_closed(WaitTimeout timeout) {
    return pandadesk::client::wait_for_brakes_closed(*transport_, timeout);
}

std::optional<nlohmann::json> Desk::wait_for_press(desk_types::Button button, WaitTimeout timeout) {
    return pandadesk::client::wait_for_press(*transport_, button, timeout);
}

std::optional<nlohmann::json> Desk::wait_for_release(desk_types::Button button, WaitTimeout timeout) {
    return pandadesk::client::wait_for_release(*transport_, button, timeout);
}

} // namespace pandadesk::client
