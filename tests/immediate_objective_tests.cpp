// tests/immediate_objective_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/objectives/ImmediateObjective.h"
#include "eldritch/objectives/ObjectiveFactories.h"
#include "test_support/TestClock.h"

using namespace eldritch;

namespace {

std::unique_ptr<ImmediateObjective> Interview(TimePoint now, bool autoComplete = true)
{
    ImmediateObjective::Params p;
    p.requiredActions = {"ask_about_events", "probe_for_details", "conclude_interview"};
    p.autoCompleteOnAction = autoComplete;
    return std::make_unique<ImmediateObjective>(
        ObjectiveDef::Builder("interview").title("Interview").type(ObjectiveType::Social).build(), p, now);
}

} // namespace

TEST_CASE("immediate: defaults to a five minute limit")
{
    auto o = Interview(test::Epoch());
    CHECK(o->scope() == ObjectiveScope::Immediate);
    REQUIRE(o->timeLimit().has_value());
    CHECK(o->timeLimit()->count() == Minutes(5).count());
}

TEST_CASE("immediate: progress is the share of required actions done")
{
    const TimePoint t0 = test::Epoch();
    auto o = Interview(t0);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    CHECK(o->update(state, {{"action_type", "ask_about_events"}}, t0 + Seconds(10)));
    CHECK(o->progress() == doctest::Approx(1.0 / 3.0));

    // Repeats and unrelated actions change nothing.
    CHECK_FALSE(o->update(state, {{"action_type", "ask_about_events"}}, t0 + Seconds(20)));
    CHECK_FALSE(o->update(state, {{"action_type", "dance"}}, t0 + Seconds(30)));
    CHECK(o->progress() == doctest::Approx(1.0 / 3.0));
    CHECK(o->remainingActions().size() == 2);

    CHECK(o->update(state, {{"action_type", "probe_for_details"}}, t0 + Seconds(40)));
    CHECK(o->update(state, {{"action_type", "conclude_interview"}}, t0 + Seconds(50)));
    CHECK(o->isCompleted());
    CHECK(o->remainingActions().empty());
}

TEST_CASE("immediate: feedback events list what remains")
{
    const TimePoint t0 = test::Epoch();
    auto o = Interview(t0, false);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));
    o->update(state, {{"action_type", "probe_for_details"}}, t0);

    const auto& e = o->events().back();
    CHECK(e.type == "action_completed");
    CHECK(e.data["action"] == "probe_for_details");
    CHECK(e.data["remaining"].size() == 2);
}

TEST_CASE("immediate: modifier compulsions extend the required set")
{
    const TimePoint t0 = test::Epoch();
    auto o = Interview(t0, false);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    o->applyModifier({"madness", 0, 0.0, 1.0, {"count_the_doors"}});
    CHECK(o->requiredActions().size() == 4);

    o->update(state, {{"action_type", "count_the_doors"}}, t0);
    CHECK(o->progress() == doctest::Approx(0.25));

    o->removeModifiers("madness");
    CHECK(o->requiredActions().size() == 3);
}

TEST_CASE("immediate: without required actions the simple completion decides")
{
    const TimePoint t0 = test::Epoch();
    ImmediateObjective o(ObjectiveDef::Builder("hide").title("Hide").build(), {}, t0);
    o.setSimpleCompletion([](const GameState& s) { return GetOr(s, "hidden", false); });

    GameState state = json::object();
    REQUIRE(o.activate(state, t0));
    o.update(state, json::object(), t0);
    CHECK(o.isActive());
    CHECK(o.progress() == doctest::Approx(0.0));

    state["hidden"] = true;
    o.update(state, json::object(), t0 + Seconds(5));
    CHECK(o.isCompleted());
}

TEST_CASE("immediate: social factory uses default conversation goals")
{
    auto o = factories::Social("talk", "Talk to Armitage", "Armitage", {}, test::Epoch());
    const auto required = o->requiredActions();
    CHECK(required.count("initiate_conversation") == 1);
    CHECK(required.count("ask_questions") == 1);
    CHECK(required.count("conclude_conversation") == 1);
    CHECK(o->type() == ObjectiveType::Social);
}
