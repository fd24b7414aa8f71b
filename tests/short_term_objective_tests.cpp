// tests/short_term_objective_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/objectives/ObjectiveFactories.h"
#include "eldritch/objectives/ShortTermObjective.h"
#include "test_support/TestClock.h"

#include <stdexcept>
#include <vector>

using namespace eldritch;

namespace {

std::unique_ptr<ShortTermObjective> Scene(TimePoint now, std::vector<std::string> discoveries, int milestones)
{
    ShortTermObjective::Params p;
    p.requiredDiscoveries = std::move(discoveries);
    p.milestoneCount = milestones;
    return std::make_unique<ShortTermObjective>(ObjectiveDef::Builder("scene").title("Scene").build(), p, now);
}

} // namespace

TEST_CASE("short-term: discoveries weigh 0.6 and milestones 0.4")
{
    const TimePoint t0 = test::Epoch();
    auto o = Scene(t0, {"a", "b", "c"}, 2);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    o->update(state, {{"discovery", "a"}}, t0 + Seconds(1));
    o->update(state, {{"discovery", "b"}, {"milestone_completed", true}}, t0 + Seconds(2));

    CHECK(o->discoveriesMade().size() == 2);
    CHECK(o->milestonesCompleted() == 1);
    CHECK(o->progress() == doctest::Approx(0.6));
    CHECK(o->isActive());
}

TEST_CASE("short-term: a single present term takes the full weight")
{
    const TimePoint t0 = test::Epoch();
    GameState state = json::object();

    SUBCASE("milestones only")
    {
        auto o = Scene(t0, {}, 4);
        REQUIRE(o->activate(state, t0));
        o->update(state, {{"milestone_completed", true}}, t0);
        CHECK(o->progress() == doctest::Approx(0.25));
    }

    SUBCASE("discoveries only")
    {
        auto o = Scene(t0, {"a", "b"}, 0);
        REQUIRE(o->activate(state, t0));
        o->update(state, {{"discovery", "a"}}, t0);
        CHECK(o->progress() == doctest::Approx(0.5));
    }
}

TEST_CASE("short-term: completes when everything is found")
{
    const TimePoint t0 = test::Epoch();
    auto o = Scene(t0, {"a"}, 1);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    o->update(state, {{"discovery", "a"}}, t0);
    CHECK(o->isActive());
    o->update(state, {{"milestone_completed", true}}, t0 + Seconds(1));
    CHECK(o->isCompleted());
}

TEST_CASE("short-term: unknown and repeated discoveries are ignored")
{
    const TimePoint t0 = test::Epoch();
    auto o = Scene(t0, {"a", "b"}, 0);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    CHECK(o->update(state, {{"discovery", "a"}}, t0));
    CHECK_FALSE(o->update(state, {{"discovery", "a"}}, t0));
    CHECK_FALSE(o->update(state, {{"discovery", "zz"}}, t0));
    CHECK(o->discoveriesMade().size() == 1);
}

TEST_CASE("short-term: milestones never exceed the count")
{
    const TimePoint t0 = test::Epoch();
    auto o = Scene(t0, {"a"}, 2);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    for (int i = 0; i < 5; ++i)
        o->update(state, {{"milestone_completed", true}}, t0);
    CHECK(o->milestonesCompleted() == 2);
    CHECK(o->progress() == doctest::Approx(0.4));

    o->setMilestoneCount(1);
    CHECK(o->milestonesCompleted() == 1);
    CHECK(o->progress() == doctest::Approx(0.4));
}

TEST_CASE("short-term: tension ramps with progress and notifies listeners")
{
    const TimePoint t0 = test::Epoch();
    auto o = factories::Survival("survive", "Survive the night", "the thing in the walls", t0, 10,
                                 {{"required_discoveries", {"barricade", "light"}}, {"milestone_count", 0}});
    CHECK(o->tension() == doctest::Approx(2.0));

    std::vector<double> seen;
    o->addTensionCallback([&seen](double tension, double) { seen.push_back(tension); });
    o->addTensionCallback([](double, double) { throw std::runtime_error("listener broke"); });

    GameState state = json::object();
    REQUIRE(o->activate(state, t0));
    o->update(state, {{"discovery", "barricade"}}, t0);

    // 2 + 0.5 * (5 - 2)
    CHECK(o->tension() == doctest::Approx(3.5));
    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == doctest::Approx(3.5));
}

TEST_CASE("short-term: exploration factory derives discoveries from areas")
{
    auto o = factories::Exploration("explore", "Map the manor", {"attic", "cellar"}, test::Epoch());
    CHECK(o->requiredDiscoveries().count("explored_attic") == 1);
    CHECK(o->requiredDiscoveries().count("explored_cellar") == 1);
    CHECK(o->milestoneCount() == 2);
    CHECK(o->timeLimit()->count() == Minutes(20).count());
}

TEST_CASE("short-term: investigation factory gates on location")
{
    const TimePoint t0 = test::Epoch();
    auto o = factories::Investigation("inv", "Search the study", "study", {"diary"}, t0);

    GameState hall = {{"current_location", "hall"}};
    CHECK_FALSE(o->canActivate(hall));
    GameState study = {{"current_location", "study"}};
    CHECK(o->canActivate(study));
    CHECK(o->timeLimit()->count() == Minutes(15).count());
}
