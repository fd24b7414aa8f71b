// tests/event_bus_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/objectives/EventBus.h"
#include "test_support/TestClock.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace eldritch;

TEST_CASE("event bus: handlers receive events of their type only")
{
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe("objective_completed", [&seen](const BusEvent& e) { seen.push_back(e.data["id"].get<std::string>()); });

    bus.emit("objective_completed", {{"id", "a"}}, test::Epoch());
    bus.emit("objective_failed", {{"id", "b"}}, test::Epoch());

    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == "a");
    CHECK(bus.listenerCount("objective_completed") == 1);
    CHECK(bus.listenerCount("objective_failed") == 0);
}

TEST_CASE("event bus: unsubscribe removes exactly one handler")
{
    EventBus bus;
    int a = 0;
    int b = 0;
    const int first = bus.subscribe("tick", [&a](const BusEvent&) { ++a; });
    bus.subscribe("tick", [&b](const BusEvent&) { ++b; });

    CHECK(bus.unsubscribe(first));
    CHECK_FALSE(bus.unsubscribe(first));
    bus.emit("tick", json::object(), test::Epoch());

    CHECK(a == 0);
    CHECK(b == 1);
}

TEST_CASE("event bus: a throwing handler does not stop the others")
{
    EventBus bus;
    int calls = 0;
    bus.subscribe("tick", [](const BusEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe("tick", [&calls](const BusEvent&) { ++calls; });

    CHECK_NOTHROW(bus.emit("tick", json::object(), test::Epoch()));
    CHECK(calls == 1);
}

TEST_CASE("event bus: the recent log keeps the newest events")
{
    EventBus bus(3);
    for (int i = 0; i < 5; ++i)
        bus.emit("tick", {{"n", i}}, test::Epoch() + Seconds(i));

    REQUIRE(bus.recent().size() == 3);
    CHECK(bus.recent().front().data["n"] == 2);
    CHECK(bus.recent().back().data["n"] == 4);

    const json j = ToJson(bus.recent().back());
    CHECK(j["type"] == "tick");
    CHECK(j["timestamp"] == "2024-01-01T00:00:04.000000Z");

    bus.clearRecent();
    CHECK(bus.recent().empty());
}
