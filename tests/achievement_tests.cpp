// tests/achievement_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/achievements/AchievementManager.h"
#include "test_support/TestClock.h"

#include <initializer_list>
#include <string>
#include <vector>

using namespace eldritch;

namespace {

AchievementCriteria StatAtLeast(const char* stat, int value)
{
    AchievementCriteria c;
    c.trigger = AchievementTrigger::StatThreshold;
    c.target = value;
    c.op = "gte";
    c.conditions = {{"stat_name", stat}};
    return c;
}

json Events(std::initializer_list<const char*> types)
{
    json out = json::array();
    for (const char* t : types)
        out.push_back(json{{"type", t}});
    return out;
}

} // namespace

TEST_CASE("achievements: comparison operators")
{
    CHECK(CompareValues(5, 5, "eq"));
    CHECK_FALSE(CompareValues(5, "5", "eq"));
    CHECK(CompareValues(6, 5, "gt"));
    CHECK(CompareValues(5, 5, "gte"));
    CHECK(CompareValues(4.5, 5, "lt"));
    CHECK(CompareValues(5, 5, "lte"));
    CHECK(CompareValues("ghoul", json::array({"ghoul", "byakhee"}), "in"));
    CHECK(CompareValues(json::array({"ghoul"}), "ghoul", "contains"));
    CHECK(CompareValues("the black goat", "goat", "contains"));

    CHECK_FALSE(CompareValues("ten", 5, "gt"));
    CHECK_FALSE(CompareValues(5, 5, "approximately"));
}

TEST_CASE("achievements: the built-in catalogue")
{
    test::TestClock clock;
    AchievementManager manager(true, clock.source());
    CHECK(manager.size() == 11);
    REQUIRE(manager.get("fourth_wall") != nullptr);
    CHECK(manager.get("fourth_wall")->hidden());
    CHECK(manager.get("forbidden_scholar")->reward().unlockContent == std::vector<std::string>{"advanced_lore"});

    AchievementManager empty(false, clock.source());
    CHECK(empty.size() == 0);
}

TEST_CASE("achievements: unlocking is idempotent and recorded")
{
    test::TestClock clock;
    AchievementManager manager(true, clock.source());
    const json gameData = {{"events", Events({"supernatural_encounter_survived"})}};

    const auto first = manager.checkAll(gameData, json::object());
    REQUIRE(first.size() == 1);
    CHECK(first[0]->id() == "first_survival");
    CHECK(first[0]->unlockedAt() == clock.now());
    CHECK(first[0]->unlockContext() == gameData);

    clock.advance(Seconds(30));
    CHECK(manager.checkAll(gameData, json::object()).empty());
    CHECK(manager.unlockHistory().size() == 1);
    CHECK(manager.unlockHistory()[0]["category"] == "survival");
    CHECK(manager.unlockedIds().count("first_survival") == 1);
}

TEST_CASE("achievements: each trigger reads its part of the snapshot")
{
    test::TestClock clock;
    AchievementManager manager(true, clock.source());

    const json gameData = {{"completed_objectives", json::array({json{{"type", "investigation"}},
                                                                 json{{"type", "survival"}}})}};
    const json stats = {{"cosmic_knowledge_count", 1}, {"sanity", 4}};

    const auto unlocked = manager.checkAll(gameData, stats);
    std::vector<std::string> ids;
    for (const auto* a : unlocked)
        ids.push_back(a->id());

    // Registration order.
    CHECK(ids == std::vector<std::string>{"first_truth", "first_mystery", "madness_embrace"});
    CHECK_FALSE(manager.get("master_detective")->unlocked());
}

TEST_CASE("achievements: prerequisites come from unlocks or the snapshot")
{
    test::TestClock clock;
    AchievementManager manager(false, clock.source());

    manager.addAchievement(Achievement("elder", "Elder", "Needs the novice", AchievementCategory::Mastery,
                                       AchievementRarity::Rare, {StatAtLeast("rituals", 1)}))
        .setPrerequisites({"novice"});
    manager.addAchievement(Achievement("novice", "Novice", "First ritual", AchievementCategory::Mastery,
                                       AchievementRarity::Common, {StatAtLeast("rituals", 1)}));

    const json stats = {{"rituals", 3}};

    SUBCASE("unlocked by this manager")
    {
        auto pass = manager.checkAll(json::object(), stats);
        REQUIRE(pass.size() == 1);
        CHECK(pass[0]->id() == "novice");

        pass = manager.checkAll(json::object(), stats);
        REQUIRE(pass.size() == 1);
        CHECK(pass[0]->id() == "elder");
    }

    SUBCASE("listed in the snapshot")
    {
        const auto pass = manager.checkAll({{"unlocked_achievements", json::array({"novice"})}}, stats);
        CHECK(pass.size() == 2);
    }
}

TEST_CASE("achievements: hidden entries stay out of category views")
{
    AchievementManager manager(true, test::TestClock().source());
    CHECK(manager.byCategory(AchievementCategory::Secret).empty());
    CHECK(manager.byCategory(AchievementCategory::Secret, true).size() == 1);
    CHECK(manager.byCategory(AchievementCategory::Investigation).size() == 2);

    const json stats = manager.statistics();
    CHECK(stats["category_breakdown"]["secret"]["total"] == 0);
    CHECK(stats["total_achievements"] == 11);
    CHECK(stats["rarest_unlocked"].is_null());
}

TEST_CASE("achievements: progress reports the next unmet criterion")
{
    test::TestClock clock;
    AchievementManager manager(false, clock.source());
    manager.addAchievement(Achievement("lore", "Lore", "Read and survive", AchievementCategory::Knowledge,
                                       AchievementRarity::Uncommon,
                                       {StatAtLeast("tomes_read", 2), StatAtLeast("known_entities_count", 5)}));

    const auto info = manager.progress("lore", json::object(), {{"tomes_read", 2}});
    REQUIRE(info.has_value());
    CHECK((*info)["progress"].get<double>() == doctest::Approx(0.5));
    CHECK((*info)["met_criteria"] == 1);
    CHECK((*info)["next_criterion"]["description"] == "Reach 5 known_entities_count");

    CHECK_FALSE(manager.progress("missing", json::object(), json::object()).has_value());
}

TEST_CASE("achievements: statistics weight rarity")
{
    test::TestClock clock;
    AchievementManager manager(true, clock.source());
    manager.checkAll({{"events", Events({"meta_realization"})}}, json::object());

    const json stats = manager.statistics();
    CHECK(stats["unlocked_count"] == 1);
    CHECK(stats["rarest_unlocked"]["achievement_id"] == "fourth_wall");
    // Cosmic weight 6 out of 33.
    CHECK(manager.completionPercentage() == doctest::Approx(100.0 * 6 / 33));
    CHECK(stats["rarity_breakdown"]["6"]["unlock_rate"].get<double>() == doctest::Approx(1.0));
}

TEST_CASE("achievements: saved progress restores unlocks")
{
    test::TestClock clock;
    AchievementManager manager(true, clock.source());
    manager.checkAll({{"events", Events({"supernatural_encounter_survived"})}}, {{"session_min_sanity", 80}});
    const json saved = manager.toJson();
    CHECK(saved["unlocked_achievements"].size() == 2);

    AchievementManager restored(true, clock.source());
    REQUIRE(restored.loadFromJson(saved));
    CHECK(restored.get("first_survival")->unlocked());
    CHECK(restored.get("sanity_keeper")->unlocked());
    CHECK(restored.get("first_survival")->unlockedAt() == clock.now());
    CHECK(restored.unlockHistory().size() == 2);

    // Restored unlocks do not fire again.
    CHECK(restored.checkAll({{"events", Events({"supernatural_encounter_survived"})}}, json::object()).empty());
}

TEST_CASE("achievements: redefining an unlocked achievement keeps the unlock")
{
    test::TestClock clock;
    AchievementManager manager(false, clock.source());
    manager.addAchievement(Achievement("novice", "Novice", "First ritual", AchievementCategory::Mastery,
                                       AchievementRarity::Common, {StatAtLeast("rituals", 1)}));

    REQUIRE(manager.checkAll(json::object(), {{"rituals", 1}}).size() == 1);
    const auto unlockedAt = manager.get("novice")->unlockedAt();
    REQUIRE(unlockedAt.has_value());

    clock.advance(Minutes(30));
    manager.addAchievement(Achievement("novice", "Initiate", "First ritual, renamed", AchievementCategory::Knowledge,
                                       AchievementRarity::Uncommon, {StatAtLeast("rituals", 2)}));

    const Achievement* redefined = manager.get("novice");
    REQUIRE(redefined != nullptr);
    CHECK(redefined->title() == "Initiate");
    CHECK(redefined->unlocked());
    CHECK(redefined->unlockedAt() == unlockedAt);
    CHECK(manager.unlockedAchievements().size() == 1);
    CHECK(manager.byCategory(AchievementCategory::Knowledge).size() == 1);
    CHECK(manager.byCategory(AchievementCategory::Mastery).empty());

    // Already unlocked: nothing fires again.
    CHECK(manager.checkAll(json::object(), {{"rituals", 5}}).empty());
}
