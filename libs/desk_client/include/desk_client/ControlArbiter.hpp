#pragma once

/**
 * @file ControlArbiter.hpp
 * @brief Acquisition and persistence of the Desk control token
 *
 * Only one identity controls a Desk at a time. The controlling identity holds
 * a token issued by the device; the arbiter keeps the local copy, persists it
 * per host, and reuses it to retake control after reconnecting.
 *
 * Control can be taken without confirmation only when nobody holds it.
 * Forcefully taking it from another holder requires pressing the circle
 * button on the robot's Pilot within the device's tokenForceTimeout window.
 */

#include <Logger.hpp>
#include <Token.hpp>
#include <TokenStore.hpp>
#include <Transport.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace pandadesk::client {

enum class ControlState {
    NoToken,              // nobody holds control, or not checked yet
    HeldLocally,          // the device's active token is ours
    HeldByOther,          // another identity holds control
    PendingConfirmation   // forced takeover waiting for the circle button
};

// Result of the last take_control() call
enum class ControlOutcome {
    None,                  // take_control() not called yet
    NotRequired,           // Desk without token support; nothing to do
    Retaken,               // our stored token is the active one
    Acquired,              // new token issued and persisted
    Denied,                // another identity holds control and force was off
    ConfirmationTimedOut   // forced takeover not confirmed in time
};

const char* control_state_name(ControlState state);
const char* control_outcome_name(ControlOutcome outcome);

class ControlArbiter {
public:
    /**
     * @param transport Desk connection (must outlive the arbiter)
     * @param store Token persistence (must outlive the arbiter)
     * @param hostname Key of this Desk in the store
     * @param logger Logging collaborator (may be null)
     * @param legacy_desk Desk without control tokens; every check trivially succeeds
     */
    ControlArbiter(desk_transport::Transport& transport,
                   token_store::TokenStore& store,
                   std::string hostname,
                   std::shared_ptr<desk_types::Logger> logger = nullptr,
                   bool legacy_desk = false);

    /**
     * @brief Token currently active on the device (id and owner only)
     *
     * Empty sentinel when nobody holds control or on a legacy Desk.
     */
    desk_types::Token active_token();

    /**
     * @brief Whether the device's active token is the locally held one
     *
     * Both ids must be non-empty: holding no token while nobody holds
     * control is not having control.
     */
    bool check_has_control();

    /**
     * @brief Take control, requesting a new token if needed
     *
     * @param requested_by Identity recorded as the owner of a new token
     * @param force Evict the current holder (requires physical confirmation)
     * @return true when control is held afterwards
     *
     * Denial and an unconfirmed takeover return false; see last_outcome().
     * HTTP failures propagate as desk_types::RequestFailed.
     */
    bool take_control(const std::string& requested_by, bool force = false);

    // Locally held token (empty sentinel if none)
    const desk_types::Token& token() const { return token_; }

    ControlState state() const { return state_; }
    ControlOutcome last_outcome() const { return last_outcome_; }
    bool legacy_desk() const { return legacy_desk_; }

private:
    desk_transport::Transport& transport_;
    token_store::TokenStore& store_;
    std::string hostname_;
    std::shared_ptr<desk_types::Logger> logger_;
    bool legacy_desk_;

    desk_types::Token token_;
    ControlState state_ = ControlState::NoToken;
    ControlOutcome last_outcome_ = ControlOutcome::None;

    // Window for confirming a forced takeover (tokenForceTimeout, in seconds on the wire)
    std::chrono::milliseconds force_timeout();

    void persist(const desk_types::Token& token);
};

} // namespace pandadesk::client
