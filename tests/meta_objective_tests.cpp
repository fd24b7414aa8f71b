// tests/meta_objective_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/objectives/MetaObjective.h"
#include "eldritch/objectives/ObjectiveFactories.h"
#include "test_support/TestClock.h"

using namespace eldritch;

TEST_CASE("meta: never carries a time limit")
{
    const json params = {{"title", "Veteran"}, {"time_limit", 600}};
    auto o = MetaObjective::FromParams("veteran", params, test::Epoch());
    CHECK(o->scope() == ObjectiveScope::Meta);
    CHECK_FALSE(o->timeLimit().has_value());
}

TEST_CASE("meta: campaigns and characters come from the game state")
{
    const TimePoint t0 = test::Epoch();
    auto o = MetaObjective::FromParams("veteran", {{"title", "Veteran"}}, t0);
    GameState state = {{"campaign_id", "masks_of_nyarlathotep"}, {"character_id", "harvey_walters"}};
    REQUIRE(o->activate(state, t0));

    CHECK(o->update(state, json::object(), t0));
    CHECK(o->campaignsParticipated().count("masks_of_nyarlathotep") == 1);
    CHECK(o->charactersUsed().count("harvey_walters") == 1);

    // Already recorded: nothing new.
    CHECK_FALSE(o->update(state, json::object(), t0));

    // 1 campaign * 0.3 + 1 character * 0.2
    CHECK(o->progress() == doctest::Approx(0.5));
}

TEST_CASE("meta: content unlocks once when every criterion holds")
{
    const TimePoint t0 = test::Epoch();
    const json criteria = {{"min_playtime", 10},
                           {"required_patterns", json::array({"deep_one_hybrids"})},
                           {"mastery_level", {{"category", "occult"}, {"skill", "rituals"}, {"level", 2}}}};
    auto o = factories::Mastery("mastery", "Occult mastery", "occult", criteria, t0);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    o->update(state, {{"session_duration", 12.0}}, t0);
    o->update(state, {{"pattern_learned", "deep_one_hybrids"}}, t0);
    CHECK(o->unlockedContent().empty());

    o->update(state, {{"mastery_advancement", {{"category", "occult"}, {"skill", "rituals"}, {"advancement", 2}}}}, t0);
    CHECK(o->unlockedContent().count("occult_mastery") == 1);
    CHECK(o->isCompleted());

    std::size_t unlockEvents = 0;
    for (const auto& e : o->events())
        unlockEvents += e.type == "content_unlocked" ? 1 : 0;
    CHECK(unlockEvents == 1);
}

TEST_CASE("meta: progress is the unlocked share of criteria")
{
    const TimePoint t0 = test::Epoch();
    auto o = MetaObjective::FromParams("paths", {{"title", "Paths"},
                                                 {"unlock_criteria", {{"a", {{"min_playtime", 1}}},
                                                                      {"b", {{"min_campaigns", 3}}}}}},
                                       t0);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    o->update(state, {{"session_duration", 2.0}}, t0);
    CHECK(o->unlockedContent().count("a") == 1);
    CHECK(o->progress() == doctest::Approx(0.5));

    const json summary = o->displayInfo(t0);
    CHECK(summary["unlock_progress"]["b"] == false);
}

TEST_CASE("meta: failed strategies are not counted")
{
    const TimePoint t0 = test::Epoch();
    auto o = MetaObjective::FromParams("s", {{"title", "Survivor"}}, t0);
    GameState state = json::object();
    REQUIRE(o->activate(state, t0));

    CHECK_FALSE(o->update(state, {{"survival_strategy", "run"}, {"strategy_success", false}}, t0));
    CHECK(o->update(state, {{"survival_strategy", "run"}}, t0));
    CHECK(o->displayInfo(t0)["survival_strategies"]["run"] == 1);
}

TEST_CASE("meta: mastery summary reports the best skill per category")
{
    const TimePoint t0 = test::Epoch();
    auto o = MetaObjective::FromParams("m", {{"title", "Scholar"},
                                             {"mastery_categories", {{"lore", {{"tomes", 3}, {"glyphs", 1}}}}}},
                                       t0);
    const json summary = o->masterySummary();
    CHECK(summary["lore"]["total_skills"] == 2);
    CHECK(summary["lore"]["max_level"] == 3);
}
