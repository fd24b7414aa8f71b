// tests/ai_coordinator_tests.cpp
#include <doctest/doctest.h>

#include "eldritch/ai/AiCoordinator.h"
#include "eldritch/objectives/ObjectiveManager.h"
#include "test_support/TestClock.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace eldritch;
using namespace eldritch::ai;

namespace {

// Hands out futures that are never fulfilled.
class SilentGenerator : public TextGenerator
{
public:
    std::future<std::string> generate(const std::string&, std::shared_ptr<std::atomic<bool>> cancel) override
    {
        lastCancel = cancel;
        promises_.emplace_back();
        return promises_.back().get_future();
    }

    std::shared_ptr<std::atomic<bool>> lastCancel;

private:
    std::vector<std::promise<std::string>> promises_;
};

// Runs on std::async and ignores the cancel flag.
class SleepyAsyncGenerator : public TextGenerator
{
public:
    explicit SleepyAsyncGenerator(std::chrono::milliseconds delay) : delay_(delay) {}

    std::future<std::string> generate(const std::string&, std::shared_ptr<std::atomic<bool>>) override
    {
        const auto delay = delay_;
        return std::async(std::launch::async, [delay] {
            std::this_thread::sleep_for(delay);
            return std::string(R"({"primary_pattern": "explorer"})");
        });
    }

private:
    std::chrono::milliseconds delay_;
};

class CannedGenerator : public TextGenerator
{
public:
    explicit CannedGenerator(std::string reply) : reply_(std::move(reply)) {}

    std::future<std::string> generate(const std::string& prompt, std::shared_ptr<std::atomic<bool>>) override
    {
        lastPrompt = prompt;
        std::promise<std::string> p;
        p.set_value(reply_);
        return p.get_future();
    }

    std::string lastPrompt;

private:
    std::string reply_;
};

json LibraryState()
{
    return {{"tension_level", 3}, {"story_phase", "investigation"}, {"current_location", "library"}};
}

json Session()
{
    return json::array({json{{"duration_hours", 2.0},
                             {"actions", json::array({json{{"type", "investigate"}, {"risk_level", 0.2}},
                                                      json{{"type", "investigate"}, {"risk_level", 0.4}},
                                                      json{{"type", "talk"}}})}}});
}

} // namespace

TEST_CASE("ai: primary pattern ties resolve in declaration order")
{
    CHECK(ObjectiveSuggester::PrimaryPattern({}, 0.5, 0.0) == PlayerBehaviorPattern::Cautious);
    CHECK(ObjectiveSuggester::PrimaryPattern({}, 0.8, 0.0) == PlayerBehaviorPattern::Aggressive);
    CHECK(ObjectiveSuggester::PrimaryPattern({{"investigate", 3}, {"talk", 1}}, 0.5, 0.0)
          == PlayerBehaviorPattern::Investigative);
    CHECK(ObjectiveSuggester::PrimaryPattern({}, 0.5, 0.9) == PlayerBehaviorPattern::Explorer);
    CHECK(ObjectiveSuggester::PrimaryPattern({{"flee", 2}, {"hide", 2}}, 0.5, 0.0) == PlayerBehaviorPattern::Survival);
}

TEST_CASE("ai: player analysis from session and objective history")
{
    ObjectiveSuggester suggester;
    const json objectives = json::array({json{{"completed", true}, {"difficulty", "hard"}},
                                         json{{"completed", true}, {"difficulty", "hard"}},
                                         json{{"completed", false}, {"difficulty", "easy"}},
                                         json{{"completed", true}, {"difficulty", "unheard_of"}}});

    const auto a = suggester.analyzePlayerBehavior(Session(), objectives);

    CHECK(a.riskTolerance == doctest::Approx(0.3));
    CHECK(a.explorationPreference == doctest::Approx(2.0 / 3.0));
    CHECK(a.socialEngagement == doctest::Approx(1.0 / 3.0));
    CHECK(a.completionRate == doctest::Approx(0.75));
    CHECK(a.averageSessionHours == doctest::Approx(2.0));
    CHECK(a.preferredDifficulty == DifficultyLevel::Hard);
    // Cautious 0.7 beats investigative and explorer at 2/3.
    CHECK(a.primaryPattern == PlayerBehaviorPattern::Cautious);
    CHECK(a.secondaryPatterns.size() == 2);
    CHECK(a.adaptiveNeeds == std::vector<std::string>{"social_prompts", "exploration_encouragement"});
    REQUIRE(suggester.playerAnalysis().has_value());
}

TEST_CASE("ai: suggestions respect the confidence floor and the cap")
{
    ObjectiveSuggester suggester;
    const auto context = GameContextAnalysis::FromGameState(LibraryState());

    const auto top = suggester.suggest(LibraryState(), {}, context);
    REQUIRE(top.size() == 3);
    CHECK(top[0].title == "Ensure Safety");
    CHECK(top[1].title == "Examine library");
    CHECK(top[2].title == "Examine library");

    AiConfig picky;
    picky.minConfidence = 0.85;
    ObjectiveSuggester strict(picky);
    const auto few = strict.suggest(LibraryState(), {}, context);
    REQUIRE(few.size() == 1);
    CHECK(few[0].confidence == doctest::Approx(0.9));
}

TEST_CASE("ai: low tension and present NPCs shape the suggestions")
{
    AiConfig wide;
    wide.maxSuggestions = 10;
    ObjectiveSuggester suggester(wide);
    const json state = {{"tension_level", 1}, {"story_phase", "action"}, {"npcs_present", json::array({"Armitage"})}};
    const auto context = GameContextAnalysis::FromGameState(state);

    const auto all = suggester.suggest(state, {}, context);
    bool tension = false;
    bool social = false;
    for (const auto& s : all)
    {
        tension = tension || s.title == "Investigate Disturbing Sounds";
        social = social || s.title == "Speak with Armitage";
    }
    CHECK(tension);
    CHECK(social);
}

TEST_CASE("ai: implemented suggestions get sequential ids")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    AiCoordinator coordinator(manager);

    const auto suggestions = coordinator.suggestObjectives(LibraryState());
    REQUIRE(suggestions.size() == 3);

    Objective* first = coordinator.implementSuggestion(suggestions[0], LibraryState());
    REQUIRE(first != nullptr);
    CHECK(first->id() == "ai_generated_0");
    CHECK(first->title() == "Ensure Safety");
    CHECK(first->priority() == ObjectivePriority::High);

    manager.createObjective("ImmediateObjective", "ai_generated_1", {{"title", "Taken"}});
    Objective* second = coordinator.implementSuggestion(suggestions[1], LibraryState());
    REQUIRE(second != nullptr);
    CHECK(second->id() == "ai_generated_2");

    const json stats = coordinator.statistics();
    CHECK(stats["total_suggestions"] == 3);
    CHECK(stats["implemented_suggestions"] == 2);
    CHECK(stats["implementation_rate"].get<double>() == doctest::Approx(2.0 / 3.0));
    CHECK(stats["mode"] == "adaptive");
    CHECK(coordinator.suggestionHistory()[0]["objective_id"] == "ai_generated_0");
}

TEST_CASE("ai: a suggestion for an unknown variant is not implemented")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    AiCoordinator coordinator(manager);

    ObjectiveSuggestion bogus;
    bogus.variant = "PuzzleObjective";
    bogus.title = "Solve the puzzle box";
    CHECK(coordinator.implementSuggestion(bogus, json::object()) == nullptr);
    CHECK(manager.size() == 0);
}

TEST_CASE("ai: objective history scales estimated durations")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    AiCoordinator coordinator(manager);

    json state = LibraryState();
    json failures = json::array();
    for (int i = 0; i < 10; ++i)
        failures.push_back(json{{"completed", false}});
    state["objective_history"] = failures;

    const auto suggestions = coordinator.suggestObjectives(state, 1);
    REQUIRE(suggestions.size() == 1);
    // Adjustment 0.14 stretches 8 minutes by 1.042.
    CHECK(suggestions[0].estimatedDuration.count() == 500);
}

TEST_CASE("ai: adjusting a managed objective")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    AiCoordinator coordinator(manager);
    manager.createFromTemplate("library_investigation", "lib");

    json failures = json::array();
    for (int i = 0; i < 10; ++i)
        failures.push_back(json{{"completed", false}});

    const auto a = coordinator.adjustObjective("lib", failures);
    REQUIRE(a.has_value());
    CHECK(*a == doctest::Approx(0.14));
    CHECK(manager.get("lib")->hasModifier(DifficultyAdjuster::kModifierSource));

    CHECK_FALSE(coordinator.adjustObjective("missing", failures).has_value());
}

TEST_CASE("ai: analysis is due after the configured interval")
{
    test::TestClock clock;
    ObjectiveManager manager({}, ObjectiveRegistry::WithDefaults(), clock.source());
    AiCoordinator coordinator(manager);

    CHECK_FALSE(coordinator.analysisDue());
    clock.advance(Minutes(5));
    CHECK(coordinator.analysisDue());

    coordinator.updatePlayerAnalysis(Session(), json::array());
    CHECK_FALSE(coordinator.analysisDue());
    CHECK(coordinator.playerAnalysis().has_value());
}

TEST_CASE("ai: a text generator may refine the primary pattern")
{
    auto generator = std::make_shared<CannedGenerator>(R"({"primary_pattern": "horror_seeker", "reasoning": "x"})");
    ObjectiveSuggester suggester(AiConfig{}, generator);

    const auto a = suggester.analyzePlayerBehavior(Session(), json::array());
    CHECK(a.primaryPattern == PlayerBehaviorPattern::HorrorSeeker);
    CHECK(generator->lastPrompt.find("Risk Tolerance: 0.30") != std::string::npos);
}

TEST_CASE("ai: an unusable reply keeps the heuristic pattern")
{
    auto generator = std::make_shared<CannedGenerator>("the stars are not right");
    ObjectiveSuggester suggester(AiConfig{}, generator);
    CHECK(suggester.analyzePlayerBehavior(Session(), json::array()).primaryPattern == PlayerBehaviorPattern::Cautious);
}

TEST_CASE("ai: a slow text generator times out and is cancelled")
{
    AiConfig config;
    config.analysisTimeoutMs = 10;
    auto generator = std::make_shared<SilentGenerator>();
    ObjectiveSuggester suggester(config, generator);

    const auto a = suggester.analyzePlayerBehavior(Session(), json::array());
    CHECK(a.primaryPattern == PlayerBehaviorPattern::Cautious);
    REQUIRE(generator->lastCancel != nullptr);
    CHECK(generator->lastCancel->load());
}

TEST_CASE("ai: a timed-out async generator does not hold up the analysis")
{
    AiConfig config;
    config.analysisTimeoutMs = 10;
    ObjectiveSuggester suggester(config, std::make_shared<SleepyAsyncGenerator>(std::chrono::milliseconds(600)));

    const auto start = std::chrono::steady_clock::now();
    const auto a = suggester.analyzePlayerBehavior(Session(), json::array());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(a.primaryPattern == PlayerBehaviorPattern::Cautious);
    CHECK(elapsed < std::chrono::milliseconds(400));
    CHECK(suggester.pendingGeneratorCalls() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    CHECK(suggester.pendingGeneratorCalls() == 0);
}
