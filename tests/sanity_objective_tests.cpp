// tests/sanity_objective_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/core/Errors.h"
#include "eldritch/objectives/ObjectiveFactories.h"
#include "eldritch/objectives/ObjectiveRegistry.h"
#include "eldritch/objectives/SanityVariants.h"
#include "test_support/TestClock.h"

#include <cstddef>
#include <string>

using namespace eldritch;

namespace {

SanityState StateAt(int san)
{
    return DeriveSanityState({{"sanity", san}});
}

std::unique_ptr<SanityDependentObjective> Dependent(TimePoint now, json extra = json::object())
{
    const json configs = {
        {"stressed", {{"title_suffix", "shaken"}, {"priority_modifier", 1}}},
        {"disturbed", {{"description_override", "The walls breathe"}, {"completion_san_bonus", 4}}},
        {"unhinged", {{"san_loss_multiplier", 1.0}}},
    };
    extra["seed"] = 42u;
    return factories::SanityDependentInvestigation("house", "Search the house", "Witch House", configs, now, extra);
}

} // namespace

TEST_CASE("sanity: state bands follow the SAN thresholds")
{
    CHECK(StateAt(99) == SanityState::Stable);
    CHECK(StateAt(70) == SanityState::Stable);
    CHECK(StateAt(69) == SanityState::Stressed);
    CHECK(StateAt(50) == SanityState::Stressed);
    CHECK(StateAt(49) == SanityState::Disturbed);
    CHECK(StateAt(30) == SanityState::Disturbed);
    CHECK(StateAt(29) == SanityState::Unhinged);
    CHECK(StateAt(10) == SanityState::Unhinged);
    CHECK(StateAt(9) == SanityState::Mad);
    CHECK(StateAt(0) == SanityState::Mad);

    CHECK(DeriveSanityState({{"sanity", 90}, {"temporary_insanity", true}}) == SanityState::TemporarilyInsane);
    CHECK(DeriveSanityState({{"san", 5}}) == SanityState::Mad);
    // Missing SAN reads as 50.
    CHECK(DeriveSanityState(json::object()) == SanityState::Stressed);

    SanityThresholds strict;
    strict.stableMin = 90;
    CHECK(DeriveSanityState({{"sanity", 80}}, strict) == SanityState::Stressed);
}

TEST_CASE("sanity: state and madness names parse back")
{
    CHECK(ParseSanityState("temporarily_insane") == SanityState::TemporarilyInsane);
    CHECK_FALSE(ParseSanityState("calm").has_value());
    CHECK(ParseMadnessType("cosmic_awareness") == MadnessType::CosmicAwareness);
    CHECK(std::string(ToString(MadnessType::Paranoia)) == "paranoia");
}

TEST_CASE("sanity: risk combines base level, state and protection")
{
    const TimePoint t0 = test::Epoch();
    auto o = Dependent(t0);
    CHECK(o->sanRiskLevel() == 2);

    CHECK(o->calculateSanRisk({{"sanity", 80}}) == 2);
    CHECK(o->calculateSanRisk({{"sanity", 40}}) == 4);
    CHECK(o->calculateSanRisk({{"sanity", 5}}) == 7);

    o->setSanRiskLevel(50);
    CHECK(o->sanRiskLevel() == 10);
    CHECK(o->calculateSanRisk({{"sanity", 5}}) == 10);

    auto guarded = Dependent(t0, {{"madness_protection", true}});
    CHECK(guarded->calculateSanRisk({{"sanity", 80}}) == 1);
}

TEST_CASE("sanity: SAN loss is audited and may trigger madness once")
{
    const TimePoint t0 = test::Epoch();
    const json effects = json::array({json{{"madness_type", "paranoia"},
                                           {"severity", 1},
                                           {"behavioral_changes", {{"trusts_npcs", false}}},
                                           {"priority_change", 1},
                                           {"compulsions", json::array({"check_locks"})}}});
    auto o = Dependent(t0, {{"madness_effects", effects}});

    GameState state = {{"sanity", 12}};
    o->applySanLoss(state, 5, "saw the thing", t0);

    CHECK(state["sanity"] == 7);
    CHECK(o->cumulativeSanLoss() == 5);
    REQUIRE(o->sanityEvents().size() == 1);
    CHECK(o->sanityEvents()[0]["sanity_before"] == 12);
    CHECK(o->sanityEvents()[0]["sanity_after"] == 7);

    CHECK(ArrayContains(state["active_madness"], "paranoia"));
    CHECK(state["trusts_npcs"] == false);
    CHECK(o->hasModifier("madness:paranoia"));

    o->applySanLoss(state, 2, "again", t0);
    CHECK(state["active_madness"].size() == 1);
    CHECK(o->cumulativeSanLoss() == 7);
}

TEST_CASE("sanity: SAN loss never drops below zero and gain is capped")
{
    const TimePoint t0 = test::Epoch();
    auto o = Dependent(t0);

    GameState state = {{"sanity", 3}};
    o->applySanLoss(state, 10, "void", t0);
    CHECK(state["sanity"] == 0);

    GameState healthy = {{"sanity", 97}, {"max_sanity", 99}};
    o->applySanGain(healthy, 5, "rest", t0);
    CHECK(healthy["sanity"] == 99);

    // Already at the cap: nothing is recorded.
    const auto before = o->sanityEvents().size();
    o->applySanGain(healthy, 5, "rest", t0);
    CHECK(o->sanityEvents().size() == before);
}

TEST_CASE("sanity-dependent: presentation follows the current state")
{
    const TimePoint t0 = test::Epoch();
    auto o = Dependent(t0);
    GameState state = {{"sanity", 60}};
    REQUIRE(o->activate(state, t0));

    o->update(state, {{"action_type", "search"}}, t0);
    CHECK(o->configuredState() == SanityState::Stressed);
    CHECK(o->title() == "Search the house (shaken)");
    CHECK(o->priority() == ObjectivePriority::High);
    CHECK(o->progress() == doctest::Approx(0.1));

    state["sanity"] = 40;
    o->update(state, {{"action_type", "search"}}, t0);
    CHECK(o->configuredState() == SanityState::Disturbed);
    CHECK(o->title() == "Search the house");
    CHECK(o->description() == "The walls breathe");
    CHECK_FALSE(o->hasModifier("sanity_state"));
    CHECK(o->progress() == doctest::Approx(0.15));
}

TEST_CASE("sanity-dependent: unhinged progress needs desperate actions")
{
    const TimePoint t0 = test::Epoch();
    auto o = Dependent(t0);
    GameState state = {{"sanity", 20}};
    REQUIRE(o->activate(state, t0));

    CHECK_FALSE(o->update(state, {{"action_type", "search"}}, t0));
    CHECK(o->progress() == doctest::Approx(0.0));

    CHECK(o->update(state, {{"action_type", "desperate_search"}}, t0));
    CHECK(o->progress() == doctest::Approx(0.2));
    // Risk 2 + 3 = 5 > 3 costs one SAN, then the 1.0 multiplier costs risk again.
    CHECK(o->cumulativeSanLoss() == 1 + 5);
    CHECK(state["sanity"] == 14);
}

TEST_CASE("sanity-dependent: a fixed seed replays the same rolls")
{
    const TimePoint t0 = test::Epoch();
    auto a = Dependent(t0);
    auto b = Dependent(t0);
    GameState sa = {{"sanity", 5}};
    GameState sb = {{"sanity", 5}};
    REQUIRE(a->activate(sa, t0));
    REQUIRE(b->activate(sb, t0));

    for (int i = 0; i < 50; ++i)
    {
        a->update(sa, {{"action_type", "random_action"}}, t0);
        b->update(sb, {{"action_type", "random_action"}}, t0);
    }
    CHECK(a->progress() == doctest::Approx(b->progress()));

    // The seed is part of the definition, so a reload keeps the sequence.
    CHECK(a->definition()["seed"] == 42u);
}

TEST_CASE("sanity-dependent: unknown state keys are rejected")
{
    const json configs = {{"serene", json::object()}};
    CHECK_THROWS_AS(factories::SanityDependentInvestigation("x", "X", "nowhere", configs, test::Epoch()),
                    ObjectiveManagerError);
}

TEST_CASE("cosmic insight: SAN penalty scales with fragility")
{
    auto o = factories::ForbiddenKnowledge("truth", "The truth", "the outer gods", json::array(), test::Epoch());
    // 0.5 * 3 * 10 = 15
    CHECK(o->insightSanPenalty(0.5, 80) == 15);
    CHECK(o->insightSanPenalty(0.5, 45) == 18);
    CHECK(o->insightSanPenalty(0.5, 20) == 22);
    CHECK(o->insightSanPenalty(0.5, 8) == 1);
}

TEST_CASE("cosmic insight: one insight level per revelation")
{
    const TimePoint t0 = test::Epoch();
    const json levels = json::array({
        json{{"cosmic_knowledge_unlock", json::array({"the_gate"})}},
        json{{"sanity_threshold_change", -10}, {"special_ability_unlock", "sight"}},
    });
    auto o = factories::ForbiddenKnowledge("truth", "The truth", "the outer gods", levels, t0);
    CHECK(o->scope() == ObjectiveScope::MidTerm);

    GameState state = {{"sanity", 80}, {"max_sanity", 99}};
    REQUIRE(o->activate(state, t0));

    o->update(state, {{"cosmic_revelation", "the_gate"}, {"insight_value", 0.5}}, t0);
    CHECK(o->currentInsightLevel() == 1);
    CHECK(state["sanity"] == 65);
    CHECK(ArrayContains(state["cosmic_knowledge"], "the_gate"));

    o->update(state, {{"cosmic_revelation", "the_key"}, {"insight_value", 0.5}}, t0);
    CHECK(o->currentInsightLevel() == 2);
    CHECK(state["max_sanity"] == 89);
    CHECK(ArrayContains(state["special_abilities"], "sight"));
    CHECK(o->isCompleted());
}

TEST_CASE("madness objective: needs the required madness and rewards SAN")
{
    const TimePoint t0 = test::Epoch();
    auto o = factories::MadnessDriven("ritual", "Count every door", {MadnessType::Paranoia}, t0);
    CHECK(o->priority() == ObjectivePriority::High);

    GameState calm = {{"sanity", 20}, {"madness_severity", 2}};
    CHECK_FALSE(o->canActivate(calm));

    GameState state = {{"sanity", 20}, {"madness_severity", 2}, {"active_madness", json::array({"paranoia"})}};
    REQUIRE(o->activate(state, t0));

    CHECK_FALSE(o->update(state, {{"action_type", "walk"}}, t0));
    CHECK(o->update(state, {{"action_type", "paranoid_check"}}, t0));
    CHECK(o->progress() == doctest::Approx(0.2));

    // Cured: progress slips back.
    GameState cured = {{"sanity", 20}};
    CHECK(o->update(cured, {{"action_type", "paranoid_check"}}, t0));
    CHECK(o->progress() == doctest::Approx(0.1));

    for (int i = 0; i < 5; ++i)
        o->update(state, {{"action_type", "paranoid_check"}}, t0);
    CHECK(o->isCompleted());
    CHECK(state["sanity"] == 23);
}

TEST_CASE("madness objective: priority is raised to at least high")
{
    auto o = MadnessObjective::FromParams("m", {{"title", "M"}, {"priority", 1}}, test::Epoch());
    CHECK(o->priority() == ObjectivePriority::High);

    auto cosmic = MadnessObjective::FromParams("c", {{"title", "C"}, {"priority", 6}}, test::Epoch());
    CHECK(cosmic->priority() == ObjectivePriority::Cosmic);
}

TEST_CASE("sanity variants: registry round trip keeps insight level")
{
    const TimePoint t0 = test::Epoch();
    const auto registry = ObjectiveRegistry::WithDefaults();
    auto o = factories::ForbiddenKnowledge("truth", "The truth", "the outer gods",
                                           json::array({json::object(), json::object()}), t0);
    GameState state = {{"sanity", 80}};
    REQUIRE(o->activate(state, t0));
    o->update(state, {{"cosmic_revelation", "x"}, {"insight_value", 0.3}}, t0);

    auto copy = registry.fromDict(o->toDict());
    const auto* restored = dynamic_cast<const CosmicInsightObjective*>(copy.get());
    REQUIRE(restored != nullptr);
    CHECK(restored->currentInsightLevel() == 1);
    CHECK(restored->cumulativeSanLoss() == o->cumulativeSanLoss());
    CHECK(restored->scope() == ObjectiveScope::MidTerm);
}

TEST_CASE("sanity: SAN changes fall back to the san key")
{
    const TimePoint t0 = test::Epoch();
    auto o = Dependent(t0);

    GameState state = {{"san", 20}};
    o->applySanLoss(state, 5, "whispers", t0);
    CHECK(state["sanity"] == 15);
    REQUIRE(o->sanityEvents().size() == 1);
    CHECK(o->sanityEvents()[0]["sanity_before"] == 20);

    GameState resting = {{"san", 40}, {"max_sanity", 99}};
    o->applySanGain(resting, 3, "tea", t0);
    CHECK(resting["sanity"] == 43);
}

TEST_CASE("sanity: the SAN audit trail keeps only the newest entries")
{
    const TimePoint t0 = test::Epoch();
    auto o = Dependent(t0);

    GameState state = {{"sanity", 99}};
    const std::size_t total = ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY + 7;
    for (std::size_t i = 0; i < total; ++i)
    {
        state["sanity"] = 99;
        o->applySanLoss(state, 1, "drip " + std::to_string(i), t0);
    }

    REQUIRE(o->sanityEvents().size() == ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY);
    CHECK(o->sanityEvents().back()["reason"] == "drip " + std::to_string(total - 1));
    CHECK(o->sanityEvents().front()["reason"] == "drip 7");
    CHECK(o->cumulativeSanLoss() == static_cast<int>(total));
}

TEST_CASE("sanity variants: configured thresholds and SAN bounds reach registry-built objectives")
{
    const TimePoint t0 = test::Epoch();
    SanityConfig cfg;
    cfg.stableMin = 90;
    cfg.defaultSanity = 40;
    cfg.maxSanity = 80;
    const auto registry = ObjectiveRegistry::WithDefaults(cfg);

    auto created = registry.create(SanityDependentObjective::kVariant, "ward", {{"title", "Keep the ward"}}, t0);
    auto* o = dynamic_cast<SanityObjective*>(created.get());
    REQUIRE(o != nullptr);

    // Stable under the built-in thresholds, stressed under the configured ones.
    CHECK(StateAt(85) == SanityState::Stable);
    CHECK(o->currentSanityState({{"sanity", 85}}) == SanityState::Stressed);
    CHECK(o->currentSanityState(json::object()) == SanityState::Disturbed);

    GameState state = {{"sanity", 75}};
    o->applySanGain(state, 10, "dawn", t0);
    CHECK(state["sanity"] == 80);

    // The configured values travel with the definition.
    auto copy = ObjectiveRegistry::WithDefaults().fromDict(o->toDict());
    const auto* restored = dynamic_cast<const SanityObjective*>(copy.get());
    REQUIRE(restored != nullptr);
    CHECK(restored->currentSanityState({{"sanity", 85}}) == SanityState::Stressed);
    CHECK(restored->sanityParams().maxSanity == 80);
}

TEST_CASE("cosmic insight: a list of unlocked abilities is appended item by item")
{
    const TimePoint t0 = test::Epoch();
    const json levels = json::array({
        json::object(),
        json{{"special_ability_unlock", json::array({"sight", "whisper"})}},
    });
    auto o = factories::ForbiddenKnowledge("truth", "The truth", "the outer gods", levels, t0);

    GameState state = {{"sanity", 80}, {"special_abilities", json::array({"luck"})}};
    REQUIRE(o->activate(state, t0));
    o->update(state, {{"cosmic_revelation", "a"}, {"insight_value", 0.5}}, t0);
    o->update(state, {{"cosmic_revelation", "b"}, {"insight_value", 0.5}}, t0);

    REQUIRE(o->currentInsightLevel() == 2);
    const json expected = json::array({"luck", "sight", "whisper"});
    CHECK(state["special_abilities"] == expected);
}
