// include/eldritch/ai/AiTypes.h
#pragma once
/*
    AiTypes.h - value types shared by the suggestion and difficulty code
    --------------------------------------------------------------------
      - AIObjectiveMode / DifficultyLevel / PlayerBehaviorPattern
      - ObjectiveSuggestion, PlayerAnalysis, GameContextAnalysis
      - TextGenerator: optional external text model, asynchronous
*/

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"
#include "eldritch/objectives/ObjectiveTypes.h"
#include "eldritch/objectives/SanityObjective.h"

namespace eldritch::ai {

enum class AIObjectiveMode
{
    Reactive,
    Proactive,
    Adaptive,
    Narrative,
    Dynamic
};

enum class DifficultyLevel : int
{
    Trivial    = 1,
    Easy       = 2,
    Normal     = 3,
    Hard       = 4,
    Extreme    = 5,
    Impossible = 6
};

enum class PlayerBehaviorPattern
{
    Cautious,
    Aggressive,
    Investigative,
    Social,
    Survival,
    Explorer,
    PuzzleSolver,
    HorrorSeeker
};

[[nodiscard]] const char* ToString(AIObjectiveMode m) noexcept;
[[nodiscard]] const char* ToString(DifficultyLevel d) noexcept;
[[nodiscard]] const char* ToString(PlayerBehaviorPattern p) noexcept;
[[nodiscard]] std::optional<DifficultyLevel> ParseDifficultyLevel(std::string_view s) noexcept;
[[nodiscard]] std::optional<PlayerBehaviorPattern> ParsePlayerBehaviorPattern(std::string_view s) noexcept;

struct ObjectiveSuggestion
{
    std::string              variant;  // registry key, e.g. "ShortTermObjective"
    std::string              title;
    std::string              description;
    ObjectivePriority        priority = ObjectivePriority::Normal;
    ObjectiveScope           scope = ObjectiveScope::ShortTerm;
    Seconds                  estimatedDuration{0};
    double                   confidence = 0.0; // 0..1
    std::string              reasoning;
    std::vector<std::string> contextFactors;
    json                     parameters = json::object(); // factory parameters

    json toJson() const;
};

struct PlayerAnalysis
{
    PlayerBehaviorPattern              primaryPattern = PlayerBehaviorPattern::Investigative;
    std::vector<PlayerBehaviorPattern> secondaryPatterns;
    double                             riskTolerance = 0.5;
    double                             explorationPreference = 0.0;
    double                             socialEngagement = 0.0;
    double                             horrorTolerance = 0.5;
    double                             completionRate = 0.5;
    double                             averageSessionHours = 1.0;
    DifficultyLevel                    preferredDifficulty = DifficultyLevel::Normal;
    std::vector<std::string>           adaptiveNeeds;

    json toJson() const;
};

struct GameContextAnalysis
{
    int                      tensionLevel = 2; // 1..5
    std::string              storyPhase = "investigation";
    std::string              locationType = "unknown";
    std::vector<std::string> npcsPresent;
    std::vector<std::string> recentEvents;
    std::vector<std::string> availableResources;
    bool                     timePressure = false;
    SanityState              sanityState = SanityState::Stable;
    int                      cosmicExposure = 0;
    int                      threatLevel = 1;

    // Reads tension_level, story_phase, current_location, npcs_present,
    // recent_events, inventory, time_pressure, sanity_state, cosmic_exposure
    // and threat_level, keeping the defaults above for anything missing.
    static GameContextAnalysis FromGameState(const GameState& state);
};

// External text model. generate() must not block; the caller waits on the
// future for a bounded time and raises `cancel` when it gives up.
// Implementations should hand out promise-backed futures: a future from
// std::async would block in its destructor after a timeout.
class TextGenerator
{
public:
    virtual ~TextGenerator() = default;

    virtual std::future<std::string> generate(const std::string& prompt,
                                              std::shared_ptr<std::atomic<bool>> cancel) = 0;
};

} // namespace eldritch::ai
