#include "desk_client/ControlArbiter.hpp"
#include "desk_client/ConditionWait.hpp"

#include <Errors.hpp>

#include <cmath>
#include <sstream>
#include <utility>

namespace pandadesk::client {

using desk_transport::HttpMethod;
using desk_transport::HttpRequest;
using desk_types::Token;

namespace {

const char* const COMPONENT = "Desk";

const char* const CONTROL_TOKEN_PATH = "/admin/api/control-token";
const char* const TOKEN_REQUEST_PATH = "/admin/api/control-token/request";
const char* const FORCED_TOKEN_REQUEST_PATH = "/admin/api/control-token/request?force";
const char* const SAFETY_PATH = "/admin/api/safety";

// Token ids arrive as JSON numbers; keep them as decimal text
std::string id_text(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.dump();
    if (value.is_string()) return value.get<std::string>();
    throw desk_types::ResponseFormatError("Token id is neither a number nor a string: " + value.dump());
}

} // anonymous namespace

const char* control_state_name(ControlState state) {
    switch (state) {
        case ControlState::NoToken: return "NoToken";
        case ControlState::HeldLocally: return "HeldLocally";
        case ControlState::HeldByOther: return "HeldByOther";
        case ControlState::PendingConfirmation: return "PendingConfirmation";
    }
    return "Unknown";
}

const char* control_outcome_name(ControlOutcome outcome) {
    switch (outcome) {
        case ControlOutcome::None: return "None";
        case ControlOutcome::NotRequired: return "NotRequired";
        case ControlOutcome::Retaken: return "Retaken";
        case ControlOutcome::Acquired: return "Acquired";
        case ControlOutcome::Denied: return "Denied";
        case ControlOutcome::ConfirmationTimedOut: return "ConfirmationTimedOut";
    }
    return "Unknown";
}

ControlArbiter::ControlArbiter(desk_transport::Transport& transport,
                               token_store::TokenStore& store,
                               std::string hostname,
                               std::shared_ptr<desk_types::Logger> logger,
                               bool legacy_desk)
    : transport_(transport)
    , store_(store)
    , hostname_(std::move(hostname))
    , logger_(desk_types::logger_or_null(std::move(logger)))
    , legacy_desk_(legacy_desk)
    , token_(store_.load(hostname_)) {
    if (token_.is_held()) {
        logger_->debug(COMPONENT, "Loaded token " + token_.id + " owned by " + token_.owned_by +
                                  " for " + hostname_);
    }
}

Token ControlArbiter::active_token() {
    Token active;
    if (legacy_desk_) {
        return active;
    }

    nlohmann::json body = transport_.request(HttpRequest(HttpMethod::Get, CONTROL_TOKEN_PATH)).json();
    try {
        const nlohmann::json& token = body.at("activeToken");
        if (!token.is_null()) {
            active.id = id_text(token.at("id"));
            active.owned_by = token.value("ownedBy", "");
        }
    } catch (const nlohmann::json::exception& e) {
        throw desk_types::ResponseFormatError(std::string("Unexpected control-token response: ") + e.what());
    }
    return active;
}

bool ControlArbiter::check_has_control() {
    if (legacy_desk_) {
        state_ = ControlState::HeldLocally;
        return true;
    }

    Token active = active_token();
    if (token_.same_claim(active)) {
        state_ = ControlState::HeldLocally;
        return true;
    }
    state_ = active.is_held() ? ControlState::HeldByOther : ControlState::NoToken;
    return false;
}

bool ControlArbiter::take_control(const std::string& requested_by, bool force) {
    if (legacy_desk_) {
        state_ = ControlState::HeldLocally;
        last_outcome_ = ControlOutcome::NotRequired;
        return true;
    }

    Token active = active_token();

    // Our own claim never needs confirmation, forced or not
    if (active.is_held() && token_.same_claim(active)) {
        logger_->info(COMPONENT, "Retaken control.");
        state_ = ControlState::HeldLocally;
        last_outcome_ = ControlOutcome::Retaken;
        return true;
    }

    if (active.is_held() && !force) {
        logger_->warn(COMPONENT, "Cannot take control. User " + active.owned_by + " is in control.");
        state_ = ControlState::HeldByOther;
        last_outcome_ = ControlOutcome::Denied;
        return false;
    }

    const ControlState previous = active.is_held() ? ControlState::HeldByOther : ControlState::NoToken;

    HttpRequest request(HttpMethod::Post, force ? FORCED_TOKEN_REQUEST_PATH : TOKEN_REQUEST_PATH);
    request.json = nlohmann::json{{"requestedBy", requested_by}};
    nlohmann::json body = transport_.request(request).json();

    Token issued;
    issued.owned_by = requested_by;
    try {
        issued.id = id_text(body.at("id"));
        issued.token = body.at("token").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw desk_types::ResponseFormatError(std::string("Unexpected token request response: ") + e.what());
    }
    if (issued.id.empty() || issued.token.empty()) {
        throw desk_types::ResponseFormatError("Token request response has an empty id or token");
    }

    if (force) {
        const std::chrono::milliseconds timeout = force_timeout();
        std::ostringstream msg;
        msg << "You have " << std::chrono::duration_cast<std::chrono::seconds>(timeout).count()
            << " seconds to confirm control by pressing circle button on robot.";
        logger_->warn(COMPONENT, msg.str());

        state_ = ControlState::PendingConfirmation;
        std::optional<nlohmann::json> confirmation;
        try {
            confirmation = wait_for_press(transport_, desk_types::Button::Circle, timeout);
        } catch (const std::exception&) {
            state_ = previous;
            throw;
        }

        if (!confirmation) {
            logger_->warn(COMPONENT, "Control not confirmed. Giving up.");
            state_ = previous;
            last_outcome_ = ControlOutcome::ConfirmationTimedOut;
            return false;
        }
    }

    persist(issued);
    logger_->info(COMPONENT, "Taken control.");
    state_ = ControlState::HeldLocally;
    last_outcome_ = ControlOutcome::Acquired;
    return true;
}

std::chrono::milliseconds ControlArbiter::force_timeout() {
    nlohmann::json body = transport_.request(HttpRequest(HttpMethod::Get, SAFETY_PATH)).json();
    try {
        double seconds = body.at("tokenForceTimeout").get<double>();
        if (!std::isfinite(seconds) || seconds < 0.0) {
            throw desk_types::ResponseFormatError("tokenForceTimeout is not a valid duration");
        }
        return std::chrono::milliseconds(std::llround(seconds * 1000.0));
    } catch (const nlohmann::json::exception& e) {
        throw desk_types::ResponseFormatError(std::string("Unexpected safety response: ") + e.what());
    }
}

void ControlArbiter::persist(const Token& token) {
    store_.save(hostname_, token);
    token_ = token;
}

} // namespace pandadesk::client
