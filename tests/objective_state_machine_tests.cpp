// tests/objective_state_machine_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/objectives/ImmediateObjective.h"
#include "test_support/TestClock.h"

#include <stdexcept>

using namespace eldritch;

namespace {

std::unique_ptr<ImmediateObjective> MakeObjective(TimePoint now, std::optional<Seconds> limit = Minutes(5))
{
    ObjectiveDef::Builder b("test_obj");
    b.title("Test").description("A test objective");
    if (limit)
        b.timeLimit(*limit);
    else
        b.noTimeLimit();

    ImmediateObjective::Params p;
    p.requiredActions = {"search", "read"};
    p.autoCompleteOnAction = false;
    return std::make_unique<ImmediateObjective>(b.build(), p, now);
}

} // namespace

TEST_CASE("objective: starts inactive and activates once")
{
    const TimePoint t0 = test::Epoch();
    auto o = MakeObjective(t0);
    GameState state = json::object();

    CHECK(o->status() == ObjectiveStatus::Inactive);
    CHECK(o->activate(state, t0));
    CHECK(o->status() == ObjectiveStatus::Active);
    CHECK(o->attemptCount() == 1);
    REQUIRE(o->activatedAt().has_value());
    CHECK(*o->activatedAt() == t0);

    // Second activation is refused.
    CHECK_FALSE(o->activate(state, t0));
    CHECK(o->attemptCount() == 1);
}

TEST_CASE("objective: activation conditions gate activation")
{
    const TimePoint t0 = test::Epoch();
    auto def = ObjectiveDef::Builder("gated").title("Gated")
                    .activation(Condition::location("library"))
                    .build();
    ImmediateObjective o(std::move(def), {}, t0);

    GameState elsewhere = {{"current_location", "docks"}};
    CHECK_FALSE(o.activate(elsewhere, t0));
    CHECK(o.status() == ObjectiveStatus::Inactive);

    GameState inLibrary = {{"current_location", "library"}};
    CHECK(o.activate(inLibrary, t0));
}

TEST_CASE("objective: suspend and resume only from the right states")
{
    const TimePoint t0 = test::Epoch();
    auto o = MakeObjective(t0);
    GameState state = json::object();

    CHECK_FALSE(o->suspend(t0));
    CHECK_FALSE(o->resume(t0));

    REQUIRE(o->activate(state, t0));
    CHECK(o->startProgress(t0));
    CHECK(o->status() == ObjectiveStatus::InProgress);

    CHECK(o->suspend(t0));
    CHECK(o->status() == ObjectiveStatus::Suspended);
    CHECK_FALSE(o->isActive());

    CHECK(o->resume(t0));
    CHECK(o->status() == ObjectiveStatus::Active);
}

TEST_CASE("objective: expires exactly at activation plus limit")
{
    const TimePoint t0 = test::Epoch();
    auto o = MakeObjective(t0, Minutes(5));
    o->setConsequenceHandler([](const Consequence&, GameState& s) { s["hit"] = true; });
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    const TimePoint justBefore = t0 + Minutes(5) - Seconds(1);
    CHECK_FALSE(o->isExpired(justBefore));
    CHECK(o->update(state, json::object(), justBefore) == false);
    CHECK(o->status() == ObjectiveStatus::Active);
    REQUIRE(o->timeRemaining(justBefore).has_value());
    CHECK(o->timeRemaining(justBefore)->count() == 1);

    const TimePoint deadline = t0 + Minutes(5);
    CHECK(o->isExpired(deadline));
    CHECK(o->update(state, json::object(), deadline));
    CHECK(o->status() == ObjectiveStatus::Expired);
    CHECK(o->isFailed());
    CHECK(o->timeRemaining(deadline + Minutes(1))->count() == 0);
}

TEST_CASE("objective: terminal states are final")
{
    const TimePoint t0 = test::Epoch();
    GameState state = json::object();

    SUBCASE("completed")
    {
        auto o = MakeObjective(t0);
        REQUIRE(o->activate(state, t0));
        REQUIRE(o->complete(state, t0));
        CHECK(o->progress() == doctest::Approx(1.0));

        CHECK_FALSE(o->fail(state, "late", t0));
        CHECK_FALSE(o->abandon(t0));
        CHECK_FALSE(o->suspend(t0));
        CHECK_FALSE(o->complete(state, t0));
        CHECK_FALSE(o->update(state, {{"action_type", "search"}}, t0 + Hours(1)));
        CHECK(o->status() == ObjectiveStatus::Completed);
    }

    SUBCASE("failed")
    {
        auto o = MakeObjective(t0);
        REQUIRE(o->activate(state, t0));
        REQUIRE(o->fail(state, "the cultists escaped", t0));
        CHECK_FALSE(o->complete(state, t0));
        CHECK_FALSE(o->resume(t0));
        CHECK(o->status() == ObjectiveStatus::Failed);
        CHECK(o->events().back().type == "failed");
        CHECK(o->events().back().data["reason"] == "the cultists escaped");
    }

    SUBCASE("abandoned before activation")
    {
        auto o = MakeObjective(t0);
        CHECK(o->abandon(t0));
        CHECK_FALSE(o->activate(state, t0));
        CHECK(o->status() == ObjectiveStatus::Abandoned);
    }
}

TEST_CASE("objective: complete applies rewards through the handler")
{
    const TimePoint t0 = test::Epoch();
    auto def = ObjectiveDef::Builder("rewarded").title("Rewarded")
                    .reward(rewards::Knowledge())
                    .reward(rewards::SanityMinor())
                    .build();
    ImmediateObjective o(std::move(def), {}, t0);

    int applied = 0;
    o.setRewardHandler([&applied](const Reward& r, GameState& s) {
        ++applied;
        if (r.type == RewardType::SanityRestoration)
            throw std::runtime_error("no sanity bookkeeping");
        s["knowledge"] = true;
    });

    GameState state = json::object();
    REQUIRE(o.activate(state, t0));
    REQUIRE(o.complete(state, t0));

    CHECK(applied == 2);
    CHECK(state["knowledge"] == true);
    // The throwing handler is logged and left out of the applied list.
    const json& data = o.events().back().data;
    REQUIRE(data["rewards_applied"].size() == 1);
    CHECK(data["rewards_applied"][0] == "knowledge: Gain insight into the mythos");
}

TEST_CASE("objective: modifiers adjust priority and time limit")
{
    const TimePoint t0 = test::Epoch();
    auto o = MakeObjective(t0, Minutes(10));
    CHECK(o->priority() == ObjectivePriority::Normal);

    o->applyModifier({"madness", 2, 2.0, 1.0, {}});
    CHECK(o->priority() == ObjectivePriority::Critical);
    CHECK(o->timeLimit()->count() == Minutes(8).count());

    // Same source replaces.
    o->applyModifier({"madness", 5, 0.0, 0.5, {}});
    CHECK(o->modifiers().size() == 1);
    CHECK(o->priority() == ObjectivePriority::Cosmic);
    CHECK(o->timeLimit()->count() == Minutes(5).count());

    // Never below one minute.
    o->applyModifier({"pressure", 0, 60.0, 1.0, {}});
    CHECK(o->timeLimit()->count() == Minutes(1).count());

    CHECK(o->removeModifiers("madness") == 1);
    CHECK(o->removeModifiers("madness") == 0);
    CHECK(o->hasModifier("pressure"));
    CHECK(o->basePriority() == ObjectivePriority::Normal);
}

TEST_CASE("objective: terminal objectives keep their modifier stack")
{
    const TimePoint t0 = test::Epoch();
    auto o = MakeObjective(t0, Minutes(10));
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));
    REQUIRE(o->applyModifier({"urgency", 1, 0.0, 1.0, {}}));
    REQUIRE(o->complete(state, t0 + Minutes(1)));

    const json before = o->toDict();
    CHECK_FALSE(o->applyModifier({"madness", 2, 0.0, 0.5, {}}));
    CHECK(o->removeModifiers("urgency") == 0);

    CHECK(o->priority() == ObjectivePriority::High);
    CHECK(o->timeLimit()->count() == Minutes(10).count());
    CHECK(o->toDict()["priority"] == before["priority"]);
    CHECK(o->toDict()["time_limit"] == before["time_limit"]);
    CHECK(o->toDict()["modifiers"] == before["modifiers"]);

    auto failed = MakeObjective(t0);
    REQUIRE(failed->activate(state, t0));
    REQUIRE(failed->fail(state, "lost", t0));
    CHECK_FALSE(failed->applyModifier({"madness", 2, 0.0, 1.0, {}}));
    CHECK(failed->priority() == ObjectivePriority::Normal);
}

TEST_CASE("objective: event log is bounded")
{
    const TimePoint t0 = test::Epoch();
    auto o = MakeObjective(t0, std::nullopt);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    for (int i = 0; i < 40; ++i)
    {
        REQUIRE(o->suspend(t0));
        REQUIRE(o->resume(t0));
    }
    CHECK(o->events().size() == ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY);
    CHECK(o->events().back().type == "resumed");
}

TEST_CASE("objective: completion conditions override progress")
{
    const TimePoint t0 = test::Epoch();
    auto def = ObjectiveDef::Builder("escape").title("Escape the house")
                    .completion(Condition::location("street"))
                    .build();
    ImmediateObjective o(std::move(def), {}, t0);

    GameState state = {{"current_location", "cellar"}};
    REQUIRE(o.activate(state, t0));
    CHECK_FALSE(o.update(state, json::object(), t0 + Seconds(10)));
    CHECK(o.isActive());

    state["current_location"] = "street";
    CHECK(o.update(state, json::object(), t0 + Seconds(20)));
    CHECK(o.isCompleted());
    REQUIRE(o.completedAt().has_value());
    CHECK(*o.completedAt() == t0 + Seconds(20));
}
