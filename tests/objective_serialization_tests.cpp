// tests/objective_serialization_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/core/Errors.h"
#include "eldritch/objectives/MidTermObjective.h"
#include "eldritch/objectives/ObjectiveManager.h"
#include "eldritch/objectives/ObjectiveRegistry.h"
#include "eldritch/objectives/ShortTermObjective.h"
#include "test_support/TestClock.h"

#include <chrono>
#include <filesystem>

using namespace eldritch;

TEST_CASE("serialization: toDict carries the contract fields")
{
    const TimePoint t0 = test::Epoch();
    const auto registry = ObjectiveRegistry::WithDefaults();
    auto o = registry.createFromTemplate("library_investigation", "lib", json::object(), t0);

    const json d = o->toDict();
    CHECK(d["objective_id"] == "lib");
    CHECK(d["variant"] == "ShortTermObjective");
    CHECK(d["objective_type"] == "investigation");
    CHECK(d["scope"] == "short_term");
    CHECK(d["priority"] == 3);
    CHECK(d["status"] == "inactive");
    CHECK(d["created_at"] == "2024-01-01T00:00:00.000000Z");
    CHECK(d["activated_at"].is_null());
    CHECK(d["time_limit"] == Minutes(20).count());
    CHECK(d["parent_objective"].is_null());
    CHECK(d["definition"]["required_discoveries"].size() == 3);
}

TEST_CASE("serialization: short-term objective survives a round trip")
{
    const TimePoint t0 = test::Epoch();
    const auto registry = ObjectiveRegistry::WithDefaults();
    auto o = registry.createFromTemplate("library_investigation", "lib", json::object(), t0);

    GameState state = json::object();
    REQUIRE(o->activate(state, t0));
    o->update(state, {{"discovery", "ancient_book"}, {"milestone_completed", true}}, t0 + Minutes(1));
    o->applyModifier({"madness", 1, 0.0, 1.0, {}});

    const json d = o->toDict();
    auto restored = registry.fromDict(d);

    REQUIRE(restored);
    CHECK(restored->id() == "lib");
    CHECK(restored->uuid() == o->uuid());
    CHECK(restored->status() == ObjectiveStatus::Active);
    CHECK(restored->progress() == doctest::Approx(o->progress()));
    CHECK(restored->activatedAt() == o->activatedAt());
    CHECK(restored->priority() == ObjectivePriority::High);
    CHECK(restored->hasModifier("madness"));
    CHECK(restored->attemptCount() == 1);

    const auto* st = dynamic_cast<const ShortTermObjective*>(restored.get());
    REQUIRE(st != nullptr);
    CHECK(st->discoveriesMade().count("ancient_book") == 1);
    CHECK(st->milestonesCompleted() == 1);

    // Writing the restored objective reproduces the same document.
    CHECK(restored->toDict() == d);
}

TEST_CASE("serialization: mid-term runtime state is restored")
{
    const TimePoint t0 = test::Epoch();
    const auto registry = ObjectiveRegistry::WithDefaults();
    auto o = registry.createFromTemplate("cult_investigation", "cult", json::object(), t0);

    GameState state = json::object();
    REQUIRE(o->activate(state, t0));
    o->update(state, {{"investigation_branch", "ritual_discovery"}, {"advancement", 0.5}}, t0 + Minutes(1));
    o->update(state, {{"san_loss", 12}}, t0 + Minutes(2));
    o->update(state, {{"revelation", "cult_purpose"}}, t0 + Minutes(3));

    auto restored = registry.fromDict(o->toDict());
    const auto* mid = dynamic_cast<const MidTermObjective*>(restored.get());
    REQUIRE(mid != nullptr);
    CHECK(mid->investigationBranches().at("ritual_discovery") == doctest::Approx(0.5));
    CHECK(mid->investigationBranches().at("member_identification") == doctest::Approx(0.0));
    CHECK(mid->accumulatedSanLoss() == doctest::Approx(12.0));
    CHECK(mid->sanLossThreshold() == doctest::Approx(15.0));
    CHECK(mid->revelationsUnlocked().count("cult_purpose") == 1);
}

TEST_CASE("serialization: only the trailing events are written")
{
    const TimePoint t0 = test::Epoch();
    const auto registry = ObjectiveRegistry::WithDefaults();
    auto o = registry.createFromTemplate("npc_interview", "npc", json::object(), t0);

    GameState state = json::object();
    REQUIRE(o->activate(state, t0));
    for (int i = 0; i < 15; ++i)
    {
        REQUIRE(o->suspend(t0));
        REQUIRE(o->resume(t0));
    }

    const json d = o->toDict();
    CHECK(d["events"].size() == ELDRITCH_OBJECTIVE_SERIALIZED_EVENTS);
    CHECK(d["events"].back()["event_type"] == "resumed");
    CHECK(d["events"].back()["objective_id"] == "npc");
}

TEST_CASE("serialization: fromDict rejects bad documents")
{
    const auto registry = ObjectiveRegistry::WithDefaults();
    CHECK_THROWS_AS(registry.fromDict(json::object()), ObjectiveManagerError);
    CHECK_THROWS_AS(registry.fromDict({{"objective_id", "x"}, {"variant", "NoSuchObjective"}}),
                    ObjectiveManagerError);
}

TEST_CASE("serialization: manager save and load through a file")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    manager.createFromTemplate("library_investigation", "lib");
    manager.createFromTemplate("npc_interview", "npc", {{"parent_objective", "lib"}});

    GameState state = json::object();
    manager.updateAll(state, {{"action_type", "ask_about_events"}}, clock.now());

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / ("eldritch_manager_" + std::to_string(stamp) + ".json");

    std::string err;
    REQUIRE(manager.saveToFile(path, &err));

    ObjectiveManager loaded({}, ObjectiveRegistry::WithDefaults(), clock.source());
    REQUIRE(loaded.loadFromFile(path, &err));
    CHECK(loaded.size() == 2);
    CHECK(loaded.activeCount() == 2);
    CHECK(loaded.counters().objectivesCreated == 2);
    CHECK(loaded.updateCount() == 1);
    REQUIRE(loaded.parentOf("npc") != nullptr);
    CHECK(loaded.parentOf("npc")->id() == "lib");
    CHECK(loaded.get("npc")->progress() == doctest::Approx(1.0 / 3.0));

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_CASE("serialization: a failed load leaves the manager untouched")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    manager.createFromTemplate("library_investigation", "lib");

    const json bad = {{"objectives", json::array({json{{"objective_id", "a"}, {"variant", "Bogus"}}})}};
    std::string err;
    CHECK_FALSE(manager.loadFromJson(bad, &err));
    CHECK_FALSE(err.empty());
    CHECK(manager.size() == 1);
    CHECK(manager.contains("lib"));

    CHECK_FALSE(manager.loadFromFile("/nonexistent/dir/objectives.json", &err));
}
