// include/eldritch/ai/AiCoordinator.h
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "eldritch/ai/AiTypes.h"
#include "eldritch/ai/DifficultyAdjuster.h"
#include "eldritch/ai/ObjectiveSuggester.h"
#include "eldritch/core/Config.h"
#include "eldritch/objectives/ObjectiveManager.h"

namespace eldritch::ai {

// Ties suggestion and difficulty adjustment to one ObjectiveManager.
// The manager must outlive the coordinator.
class AiCoordinator
{
public:
    AiCoordinator(ObjectiveManager& manager,
                  AiConfig aiConfig = {},
                  DifficultyConfig difficultyConfig = {},
                  std::shared_ptr<TextGenerator> generator = nullptr);

    void setTextGenerator(std::shared_ptr<TextGenerator> generator);

    void updatePlayerAnalysis(const json& gameHistory, const json& objectiveHistory);
    const std::optional<PlayerAnalysis>& playerAnalysis() const noexcept { return suggester_.playerAnalysis(); }
    // True once analysis_interval_minutes have passed since the last analysis.
    bool analysisDue() const;

    // Suggestions against the manager's current objectives. When the state
    // carries an objective_history, estimated durations are scaled by the
    // difficulty adjustment.
    std::vector<ObjectiveSuggestion> suggestObjectives(const GameState& state, std::size_t limit = 5);

    // Creates "ai_generated_<n>" through the manager. A creation error is
    // logged and yields nullptr.
    Objective* implementSuggestion(const ObjectiveSuggestion& suggestion, const GameState& state);

    // Analyzes objective_history and applies the result to a managed
    // objective. Returns the adjustment, or nullopt for an unknown id.
    std::optional<double> adjustObjective(const std::string& objectiveId, const json& objectiveHistory);

    // {total_suggestions, implemented_suggestions, implementation_rate,
    //  player_analysis, last_analysis_time, mode}
    json statistics() const;
    const json& suggestionHistory() const noexcept { return history_; }

    ObjectiveSuggester& suggester() noexcept { return suggester_; }
    DifficultyAdjuster& difficulty() noexcept { return difficulty_; }

private:
    ObjectiveManager&  manager_;
    ObjectiveSuggester suggester_;
    DifficultyAdjuster difficulty_;
    Seconds            analysisInterval_;
    TimePoint          lastAnalysis_;
    std::size_t        implemented_ = 0;
    json               history_ = json::array(); // {timestamp, suggestion, implemented[, objective_id]}
};

} // namespace eldritch::ai
