// include/eldritch/ai/ObjectiveSuggester.h
#pragma once

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "eldritch/ai/AiTypes.h"
#include "eldritch/core/Config.h"
#include "eldritch/objectives/Objective.h"

namespace eldritch::ai {

// Heuristic player analysis and objective suggestions.
//
// Suggestions come from three sources, in this order: narrative pacing
// (tension, story phase, NPCs present), player needs (from the last
// analysis) and essential objective types with no active objective.
// Candidates below the confidence floor are dropped; the rest are sorted by
// confidence (stable) and truncated.
class ObjectiveSuggester
{
public:
    explicit ObjectiveSuggester(AiConfig config = {}, std::shared_ptr<TextGenerator> generator = nullptr);

    // game_history: [{actions:[{type, risk_level}], events:[{type, completed}], duration_hours}]
    // objective_history: [{completed, difficulty}]
    // The text generator, when set, may refine the primary pattern. Its
    // failure or timeout leaves the heuristic result in place. A timed-out
    // future is parked rather than destroyed, so a std::async future never
    // blocks the call; parked futures are dropped once they become ready.
    PlayerAnalysis analyzePlayerBehavior(const json& gameHistory, const json& objectiveHistory);

    std::vector<ObjectiveSuggestion> suggest(const GameState& state,
                                             const std::vector<const Objective*>& current,
                                             const GameContextAnalysis& context) const;

    void setPlayerAnalysis(std::optional<PlayerAnalysis> analysis) { analysis_ = std::move(analysis); }
    const std::optional<PlayerAnalysis>& playerAnalysis() const noexcept { return analysis_; }

    void setTextGenerator(std::shared_ptr<TextGenerator> generator) { generator_ = std::move(generator); }
    bool hasTextGenerator() const noexcept { return generator_ != nullptr; }

    // Timed-out generator calls still running.
    std::size_t pendingGeneratorCalls();

    void setMode(AIObjectiveMode mode) noexcept { mode_ = mode; }
    AIObjectiveMode mode() const noexcept { return mode_; }

    const AiConfig& config() const noexcept { return config_; }

    // Ties resolve in the order cautious, aggressive, investigative, social,
    // explorer, survival.
    static PlayerBehaviorPattern PrimaryPattern(const std::map<std::string, int>& actionCounts, double riskTolerance,
                                                double explorationPreference);

private:
    std::optional<PlayerBehaviorPattern> refinePattern(const std::map<std::string, int>& actionCounts, double riskTolerance,
                                                       double explorationPreference, double socialEngagement);

    std::optional<ObjectiveSuggestion> storySuggestion(const std::string& need, const GameContextAnalysis& c) const;
    std::optional<ObjectiveSuggestion> playerSuggestion(const std::string& need, const GameContextAnalysis& c) const;
    std::optional<ObjectiveSuggestion> typeSuggestion(ObjectiveType type, const GameContextAnalysis& c) const;

    AiConfig                        config_;
    std::shared_ptr<TextGenerator>  generator_;
    std::optional<PlayerAnalysis>   analysis_;
    AIObjectiveMode                 mode_ = AIObjectiveMode::Adaptive;

    std::vector<std::future<std::string>> abandoned_;
};

// Canned suggestions, one per objective kind.
[[nodiscard]] ObjectiveSuggestion TensionSuggestion(const GameContextAnalysis& c);
[[nodiscard]] ObjectiveSuggestion InvestigationSuggestion(const GameContextAnalysis& c);
// nullopt when no NPC is present.
[[nodiscard]] std::optional<ObjectiveSuggestion> SocialSuggestion(const GameContextAnalysis& c);
[[nodiscard]] ObjectiveSuggestion ExplorationSuggestion(const GameContextAnalysis& c);
[[nodiscard]] ObjectiveSuggestion SurvivalSuggestion(const GameContextAnalysis& c);
[[nodiscard]] ObjectiveSuggestion KnowledgeSuggestion(const GameContextAnalysis& c);

} // namespace eldritch::ai
