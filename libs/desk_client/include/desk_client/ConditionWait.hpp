#pragma once

/**
 * @file ConditionWait.hpp
 * @brief Block until a status channel reports a condition
 *
 * Every wait opens its own subscription, evaluates the predicate against each
 * message in arrival order, and closes the subscription before returning,
 * on a match, on timeout, and on error alike.
 *
 * A timeout is an expected outcome, reported as std::nullopt rather than an
 * exception. A connection that ends before the condition is met raises
 * desk_types::ChannelClosed.
 */

#include "desk_client/StatusStream.hpp"

#include <DeskTypes.hpp>
#include <Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>

namespace pandadesk::client {

using Predicate = std::function<bool(const nlohmann::json&)>;

// Empty means wait without bound
using WaitTimeout = std::optional<std::chrono::milliseconds>;

/**
 * @brief Consume stream until predicate matches or the timeout elapses
 *
 * @return The first matching message, or std::nullopt on timeout
 *
 * The stream is closed when this returns or throws.
 */
std::optional<nlohmann::json> wait_for(StatusStream& stream,
                                       const Predicate& predicate,
                                       WaitTimeout timeout = std::nullopt);

/**
 * @brief Subscribe to channel and wait for predicate on a fresh connection
 */
std::optional<nlohmann::json> wait_for(desk_transport::Transport& transport,
                                       desk_types::DeskChannel channel,
                                       const Predicate& predicate,
                                       WaitTimeout timeout = std::nullopt);

// Predicates

// All seven brakeState entries equal state ("Locked" / "Unlocked")
bool brakes_all(const nlohmann::json& safety_status, const std::string& state);
bool brakes_open(const nlohmann::json& safety_status);
bool brakes_closed(const nlohmann::json& safety_status);

// Button event contains button with value true / false
bool button_pressed(const nlohmann::json& event, desk_types::Button button);
bool button_released(const nlohmann::json& event, desk_types::Button button);

// Concrete waits

std::optional<nlohmann::json> wait_for_brakes_open(desk_transport::Transport& transport,
                                                   WaitTimeout timeout = std::nullopt);
std::optional<nlohmann::json> wait_for_brakes_closed(desk_transport::Transport& transport,
                                                     WaitTimeout timeout = std::nullopt);
std::optional<nlohmann::json> wait_for_press(desk_transport::Transport& transport,
                                             desk_types::Button button,
                                             WaitTimeout timeout = std::nullopt);
std::optional<nlohmann::json> wait_for_release(desk_transport::Transport& transport,
                                               desk_types::Button button,
                                               WaitTimeout timeout = std::nullopt);

} // namespace pandadesk::client
