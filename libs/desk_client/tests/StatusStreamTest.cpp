#include <catch2/catch_test_macros.hpp>
#include "FakeDesk.hpp"
#include "desk_client/StatusStream.hpp"

#include <Errors.hpp>

#include <chrono>
#include <memory>

using namespace pandadesk::client;
using namespace fake_desk;

namespace {

const char* const SAFETY = "/admin/api/safety/status";

} // anonymous namespace

TEST_CASE("Messages arrive decoded and in order", "[StatusStream]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {"{\"n\": 1}", "{\"n\": 2}", "[3]"}, false);

    StatusStream stream = subscribe(transport, desk_types::DeskChannel::SafetyStatus);
    REQUIRE(stream.path() == SAFETY);
    REQUIRE(stream.is_open());

    StreamItem first = stream.next();
    REQUIRE(first.has_message());
    REQUIRE(first.message["n"] == 1);

    StreamItem second = stream.next();
    REQUIRE(second.message["n"] == 2);

    StreamItem third = stream.next();
    REQUIRE(third.message.is_array());

    REQUIRE(stream.next().event == StreamEvent::Ended);
}

TEST_CASE("Channel is closed exactly once", "[StatusStream]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {"{}", "{}", "{}"});

    SECTION("explicit close mid-iteration") {
        StatusStream stream = subscribe(transport, SAFETY);
        REQUIRE(stream.next().has_message());
        stream.close();
        REQUIRE(transport.opened[0]->close_calls == 1);

        stream.close();
        REQUIRE(stream.next().event == StreamEvent::Ended);
        REQUIRE_FALSE(stream.is_open());
        REQUIRE(transport.opened[0]->close_calls == 1);
    }

    SECTION("early break from a read loop") {
        {
            StatusStream stream = subscribe(transport, SAFETY);
            while (true) {
                StreamItem item = stream.next();
                if (item.has_message()) break;
            }
            REQUIRE(transport.opened[0]->close_calls == 0);
        }
        REQUIRE(transport.opened[0]->close_calls == 1);
    }

    SECTION("close followed by destruction") {
        {
            StatusStream stream = subscribe(transport, SAFETY);
            stream.close();
        }
        REQUIRE(transport.opened[0]->close_calls == 1);
    }

    SECTION("moved-from stream does not close") {
        {
            StatusStream first = subscribe(transport, SAFETY);
            StatusStream moved = std::move(first);
            REQUIRE(moved.next().has_message());
        }
        REQUIRE(transport.opened[0]->close_calls == 1);
    }

    SECTION("end of stream followed by destruction") {
        transport.script_channel("/other", {}, false);
        {
            StatusStream stream = subscribe(transport, "/other");
            REQUIRE(stream.next().event == StreamEvent::Ended);
        }
        REQUIRE(transport.opened[0]->close_calls == 1);
    }
}

TEST_CASE("Malformed payload ends the subscription", "[StatusStream]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {"{\"ok\": true}", "not json", "{}"});

    StatusStream stream = subscribe(transport, SAFETY);
    REQUIRE(stream.next().has_message());

    try {
        stream.next();
        FAIL("Expected StreamDecodeError");
    } catch (const desk_types::StreamDecodeError& e) {
        REQUIRE(e.channel_path() == SAFETY);
    }

    REQUIRE(transport.opened[0]->close_calls == 1);
    REQUIRE(stream.next().event == StreamEvent::Ended);
    stream.close();
    REQUIRE(transport.opened[0]->close_calls == 1);
}

TEST_CASE("Deadline reports a timeout", "[StatusStream]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {"{}"});

    StatusStream stream = subscribe(transport, SAFETY);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(10);
    REQUIRE(stream.next_until(deadline).has_message());
    REQUIRE(stream.next_until(deadline).event == StreamEvent::TimedOut);
}

TEST_CASE("Subscriptions are independent", "[StatusStream]") {
    FakeTransport transport;
    transport.script_channel(SAFETY, {"{\"n\": 1}", "{\"n\": 2}"}, false);

    StatusStream a = subscribe(transport, SAFETY);
    StatusStream b = subscribe(transport, SAFETY);
    REQUIRE(transport.opened.size() == 2);

    REQUIRE(a.next().message["n"] == 1);
    REQUIRE(b.next().message["n"] == 1);
    a.close();
    REQUIRE(b.next().message["n"] == 2);
    REQUIRE(transport.opened[1]->close_calls == 0);
}

TEST_CASE("Null channel is rejected", "[StatusStream]") {
    REQUIRE_THROWS_AS(StatusStream(nullptr), std::invalid_argument);
}
