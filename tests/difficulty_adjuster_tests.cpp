// tests/difficulty_adjuster_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/ai/DifficultyAdjuster.h"
#include "eldritch/objectives/ObjectiveFactories.h"
#include "eldritch/objectives/ShortTermObjective.h"
#include "test_support/TestClock.h"

#include <cstdlib>

using namespace eldritch;
using eldritch::ai::DifficultyAdjuster;
using eldritch::ai::PerformanceSummary;

namespace {

json History(std::initializer_list<bool> outcomes)
{
    json out = json::array();
    for (bool done : outcomes)
        out.push_back(json{{"completed", done}, {"difficulty_level", 3}});
    return out;
}

std::unique_ptr<ShortTermObjective> Scene(int milestones)
{
    ShortTermObjective::Params p;
    p.milestoneCount = milestones;
    return std::make_unique<ShortTermObjective>(ObjectiveDef::Builder("scene").title("Scene").build(), p,
                                                test::Epoch());
}

} // namespace

TEST_CASE("difficulty: performance uses the most recent window")
{
    DifficultyAdjuster adjuster;

    const auto none = adjuster.analyzePerformance(json::array());
    CHECK(none.sampleSize == 0);
    CHECK(none.successRate == doctest::Approx(0.5));

    // Five old failures fall outside the ten-record window.
    const auto p = adjuster.analyzePerformance(History({false, false, false, false, false, true, true, true, true,
                                                        true, true, true, true, true, true}));
    CHECK(p.sampleSize == 10);
    CHECK(p.successRate == doctest::Approx(1.0));
    CHECK(p.averageDifficulty == doctest::Approx(3.0));
    CHECK(p.trend == doctest::Approx(0.0));
}

TEST_CASE("difficulty: trend compares the two halves")
{
    DifficultyAdjuster adjuster;

    const auto brief = adjuster.analyzePerformance(History({false, false, true, true}));
    CHECK(brief.trend == doctest::Approx(0.0));

    const auto improving = adjuster.analyzePerformance(History({false, false, true, true, true, true}));
    // 3/3 - 1/3
    CHECK(improving.trend == doctest::Approx(2.0 / 3.0));
}

TEST_CASE("difficulty: adjustment formula")
{
    DifficultyAdjuster adjuster;

    PerformanceSummary strong;
    strong.successRate = 0.9;
    // -(0.9 - 0.7) * 0.1 * 2
    CHECK(adjuster.calculateAdjustment(strong) == doctest::Approx(-0.04));

    strong.trend = 0.2;
    CHECK(adjuster.calculateAdjustment(strong) == doctest::Approx(-0.06));

    PerformanceSummary weak;
    weak.successRate = 0.0;
    CHECK(adjuster.calculateAdjustment(weak) == doctest::Approx(0.14));

    DifficultyConfig touchy;
    touchy.adjustmentSensitivity = 10.0;
    DifficultyAdjuster extreme(touchy);
    CHECK(extreme.calculateAdjustment(weak) == doctest::Approx(1.0));
    CHECK(extreme.calculateAdjustment(strong) == doctest::Approx(-1.0));
}

TEST_CASE("difficulty: easier objectives get more time and fewer milestones")
{
    DifficultyAdjuster adjuster;
    auto o = Scene(10);
    REQUIRE(o->timeLimit().has_value());
    CHECK(o->timeLimit()->count() == Minutes(20).count());

    adjuster.applyTo(*o, 0.5);
    CHECK(o->timeLimit()->count() == 1500);
    CHECK(o->milestoneCount() == 8);
    CHECK(o->priority() == ObjectivePriority::Normal);
    CHECK(o->hasModifier(DifficultyAdjuster::kModifierSource));
}

TEST_CASE("difficulty: harder objectives get less time and a priority bump")
{
    DifficultyAdjuster adjuster;
    auto o = Scene(10);

    adjuster.applyTo(*o, -1.0);
    // 1200 * 0.7
    CHECK(std::abs(o->timeLimit()->count() - 840) <= 1);
    CHECK(o->milestoneCount() == 12);
    CHECK(o->priority() == ObjectivePriority::High);

    // A second application replaces the first modifier.
    adjuster.applyTo(*o, 0.5);
    CHECK(o->modifiers().size() == 1);
    CHECK(o->priority() == ObjectivePriority::Normal);
}

TEST_CASE("difficulty: zero restores the base values")
{
    DifficultyAdjuster adjuster;
    auto o = Scene(10);

    adjuster.applyTo(*o, 0.5);
    CHECK(o->milestoneCount() == 8);
    adjuster.applyTo(*o, 0.0);
    CHECK_FALSE(o->hasModifier(DifficultyAdjuster::kModifierSource));
    CHECK(o->timeLimit()->count() == Minutes(20).count());
    CHECK(o->milestoneCount() == 10);
    CHECK(o->baseMilestoneCount() == 10);
}

TEST_CASE("difficulty: repeated adjustments do not compound")
{
    DifficultyAdjuster adjuster;
    auto o = Scene(10);

    adjuster.applyTo(*o, -1.0);
    adjuster.applyTo(*o, -1.0);
    CHECK(o->milestoneCount() == 12);
    CHECK(std::abs(o->timeLimit()->count() - 840) <= 1);
    CHECK(o->priority() == ObjectivePriority::High);

    adjuster.applyTo(*o, 0.0);
    CHECK(o->milestoneCount() == 10);
    CHECK(o->timeLimit()->count() == Minutes(20).count());
    CHECK(o->priority() == ObjectivePriority::Normal);
    CHECK(o->definition()["milestone_count"] == 10);
}

TEST_CASE("difficulty: terminal objectives are left alone")
{
    DifficultyAdjuster adjuster;
    auto o = Scene(10);
    GameState state = json::object();
    REQUIRE(o->activate(state, test::Epoch()));
    REQUIRE(o->complete(state, test::Epoch()));

    adjuster.applyTo(*o, -1.0);
    CHECK_FALSE(o->hasModifier(DifficultyAdjuster::kModifierSource));
    CHECK(o->milestoneCount() == 10);
    CHECK(o->priority() == ObjectivePriority::Normal);
}

TEST_CASE("difficulty: SAN risk follows the adjustment")
{
    DifficultyAdjuster adjuster;
    auto o = factories::SanityDependentInvestigation("house", "Search the house", "Witch House", json::object(),
                                                     test::Epoch());
    o->setSanRiskLevel(4);

    SUBCASE("easier")
    {
        adjuster.applyTo(*o, 0.5);
        CHECK(o->sanRiskLevel() == 3);
    }

    SUBCASE("harder is capped at five")
    {
        adjuster.applyTo(*o, -1.0);
        CHECK(o->sanRiskLevel() == 5);
    }

    SUBCASE("repeated and then cleared")
    {
        adjuster.applyTo(*o, 0.5);
        adjuster.applyTo(*o, 0.5);
        CHECK(o->sanRiskLevel() == 3);
        adjuster.applyTo(*o, 0.0);
        CHECK(o->sanRiskLevel() == 4);
        CHECK(o->baseSanRiskLevel() == 4);
    }
}
