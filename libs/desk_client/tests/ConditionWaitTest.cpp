#include <catch2/catch_test_macros.hpp>
#include "FakeDesk.hpp"
#include "desk_client/ConditionWait.hpp"

#include <Errors.hpp>

#include <chrono>

using namespace pandadesk::client;
using namespace fake_desk;
using desk_types::Button;

namespace {

const char* const SAFETY = "/admin/api/safety/status";
const char* const EVENTS = "/desk/api/navigation/events";

std::string mixed_brakes() {
    return "{\"brakeState\": [\"Unlocked\", \"Unlocked\", \"Locked\", \"Unlocked\", "
           "\"Unlocked\", \"Unlocked\", \"Unlocked\"]}";
}

} // anonymous namespace

// ============================================================================
// Predicates
// ============================================================================

TEST_CASE("Brake predicates require all seven joints", "[ConditionWait]") {
    REQUIRE(brakes_open(nlohmann::json::parse(brakes("Unlocked"))));
    REQUIRE_FALSE(brakes_closed(nlohmann::json::parse(brakes("Unlocked"))));
    REQUIRE(brakes_closed(nlohmann::json::parse(brakes("Locked"))));
    REQUIRE_FALSE(brakes_open(nlohmann::json::parse(mixed_brakes())));
    REQUIRE_FALSE(brakes_closed(nlohmann::json::parse(mixed_brakes())));

    SECTION("malformed brake state never matches") {
        REQUIRE_FALSE(brakes_open(nlohmann::json::parse("{}")));
        REQUIRE_FALSE(brakes_open(nlohmann::json::parse("[]")));
        REQUIRE_FALSE(brakes_open(nlohmann::json::parse("{\"brakeState\": \"Unlocked\"}")));
        REQUIRE_FALSE(brakes_open(nlohmann::json::parse("{\"brakeState\": [\"Unlocked\"]}")));
        REQUIRE_FALSE(brakes_open(nlohmann::json::parse("{\"brakeState\": [1, 2, 3, 4, 5, 6, 7]}")));
    }
}

TEST_CASE("Button predicates look at one key", "[ConditionWait]") {
    auto event = nlohmann::json::parse("{\"circle\": true, \"check\": false}");
    REQUIRE(button_pressed(event, Button::Circle));
    REQUIRE_FALSE(button_released(event, Button::Circle));
    REQUIRE(button_released(event, Button::Check));
    REQUIRE_FALSE(button_pressed(event, Button::Up));
    REQUIRE_FALSE(button_released(event, Button::Up));
    REQUIRE_FALSE(button_pressed(nlohmann::json::parse("{\"circle\": 1}"), Button::Circle));
}

// ============================================================================
// Scripted waits
// ============================================================================

TEST_CASE("Brakes open resolves on the first fully unlocked message", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {brakes("Locked"), mixed_brakes(), brakes("Unlocked"),
                                      "{\"brakeState\": \"after\"}"});

    auto status = wait_for_brakes_open(transport, std::chrono::milliseconds(500));
    REQUIRE(status.has_value());
    REQUIRE(brakes_open(*status));
    REQUIRE(transport.opened.size() == 1);
    REQUIRE(transport.opened[0]->reads == 3);
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Brakes closed skips partially locked messages", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {mixed_brakes(), brakes("Locked")});

    REQUIRE(wait_for_brakes_closed(transport).has_value());
    REQUIRE(transport.opened[0]->reads == 2);
}

TEST_CASE("Button press ignores other buttons and releases", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(EVENTS, {button("check", true), button("circle", false), button("circle", true)});

    auto event = wait_for_press(transport, Button::Circle, std::chrono::milliseconds(500));
    REQUIRE(event.has_value());
    REQUIRE((*event)["circle"] == true);
    REQUIRE(transport.opened[0]->reads == 3);
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Button release waits for false", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(EVENTS, {button("down", true), button("down", false)});

    auto event = wait_for_release(transport, Button::Down);
    REQUIRE(event.has_value());
    REQUIRE((*event)["down"] == false);
}

TEST_CASE("Timeout is reported as an empty result", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(EVENTS, {button("check", true)});

    auto event = wait_for_press(transport, Button::Circle, std::chrono::milliseconds(20));
    REQUIRE_FALSE(event.has_value());
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Channel ending before a match raises ChannelClosed", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {brakes("Locked")}, false);

    REQUIRE_THROWS_AS(wait_for_brakes_open(transport), desk_types::ChannelClosed);
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Predicate exceptions still close the channel", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {"{}"});

    auto throwing = [](const nlohmann::json&) -> bool { throw std::runtime_error("boom"); };
    REQUIRE_THROWS_AS(wait_for(transport, desk_types::DeskChannel::SafetyStatus, throwing),
                      std::runtime_error);
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Decode errors propagate and close the channel", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {brakes("Locked"), "{broken"});

    REQUIRE_THROWS_AS(wait_for_brakes_open(transport), desk_types::StreamDecodeError);
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Every wait opens its own subscription", "[ConditionWait]") {
    FakeTransport transport;
    transport.script_channel(EVENTS, {button("up", true)});

    REQUIRE(wait_for_press(transport, Button::Up).has_value());
    REQUIRE(wait_for_press(transport, Button::Up).has_value());
    REQUIRE(transport.opened.size() == 2);
    REQUIRE(transport.total_close_calls() == 2);
}
