// src/ai/AiCoordinator.cpp
#include "eldritch/ai/AiCoordinator.h"

#include "eldritch/logging/Log.h"

#include <algorithm>
#include <chrono>
#include <exception>

namespace eldritch::ai {

AiCoordinator::AiCoordinator(ObjectiveManager& manager,
                             AiConfig aiConfig,
                             DifficultyConfig difficultyConfig,
                             std::shared_ptr<TextGenerator> generator)
    : manager_(manager)
    , suggester_(aiConfig, std::move(generator))
    , difficulty_(difficultyConfig)
    , analysisInterval_(Minutes(std::max(0, aiConfig.analysisIntervalMinutes)))
    , lastAnalysis_(manager.now())
{
}

void AiCoordinator::setTextGenerator(std::shared_ptr<TextGenerator> generator)
{
    suggester_.setTextGenerator(std::move(generator));
    logsys::get()->info("Text generator {}", suggester_.hasTextGenerator() ? "attached" : "detached");
}

void AiCoordinator::updatePlayerAnalysis(const json& gameHistory, const json& objectiveHistory)
{
    const PlayerAnalysis analysis = suggester_.analyzePlayerBehavior(gameHistory, objectiveHistory);
    lastAnalysis_ = manager_.now();
    logsys::get()->info("Player analysis updated: primary pattern = {}", ToString(analysis.primaryPattern));
}

bool AiCoordinator::analysisDue() const
{
    return manager_.now() - lastAnalysis_ >= analysisInterval_;
}

std::vector<ObjectiveSuggestion> AiCoordinator::suggestObjectives(const GameState& state, std::size_t limit)
{
    std::vector<const Objective*> current;
    for (const Objective* o : manager_.all())
        current.push_back(o);

    const auto context = GameContextAnalysis::FromGameState(state);
    std::vector<ObjectiveSuggestion> suggestions = suggester_.suggest(state, current, context);

    if (const json* history = Find(state, "objective_history"); history && history->is_array())
    {
        const double a = difficulty_.calculateAdjustment(difficulty_.analyzePerformance(*history));
        const double scale = a > 0.0 ? 1.0 + a * 0.3 : 1.0 + a * 0.2;
        for (auto& s : suggestions)
        {
            const auto scaled = std::chrono::duration<double>(s.estimatedDuration) * scale;
            s.estimatedDuration = std::chrono::duration_cast<Seconds>(scaled);
        }
    }

    const std::string stamp = FormatIso8601(manager_.now());
    for (const auto& s : suggestions)
        history_.push_back(json{{"timestamp", stamp}, {"suggestion", s.toJson()}, {"implemented", false}});

    if (suggestions.size() > limit)
        suggestions.resize(limit);
    return suggestions;
}

Objective* AiCoordinator::implementSuggestion(const ObjectiveSuggestion& suggestion, const GameState& state)
{
    (void)state;

    json params = suggestion.parameters.is_object() ? suggestion.parameters : json::object();
    params["title"] = suggestion.title;
    params["description"] = suggestion.description;
    params["priority"] = ToInt(suggestion.priority);
    params["scope"] = ToString(suggestion.scope);
    if (!params.contains("objective_type"))
        params["objective_type"] = "investigation";

    std::size_t n = implemented_;
    while (manager_.contains("ai_generated_" + std::to_string(n)))
        ++n;
    const std::string id = "ai_generated_" + std::to_string(n);

    Objective* created = nullptr;
    try
    {
        created = &manager_.createObjective(suggestion.variant, id, params);
    }
    catch (const std::exception& e)
    {
        logsys::get()->error("Failed to implement AI suggestion '{}': {}", suggestion.title, e.what());
        return nullptr;
    }

    ++implemented_;
    const json key = suggestion.toJson();
    for (auto& record : history_)
    {
        if (!record.value("implemented", false) && record["suggestion"] == key)
        {
            record["implemented"] = true;
            record["objective_id"] = id;
            break;
        }
    }

    logsys::get()->info("Implemented AI suggestion: {}", suggestion.title);
    return created;
}

std::optional<double> AiCoordinator::adjustObjective(const std::string& objectiveId, const json& objectiveHistory)
{
    Objective* objective = manager_.get(objectiveId);
    if (!objective)
        return std::nullopt;

    const double a = difficulty_.calculateAdjustment(difficulty_.analyzePerformance(objectiveHistory));
    difficulty_.applyTo(*objective, a);
    return a;
}

json AiCoordinator::statistics() const
{
    const std::size_t total = history_.size();
    const std::size_t implemented = static_cast<std::size_t>(
        std::count_if(history_.begin(), history_.end(),
                      [](const json& r) { return r.value("implemented", false); }));

    const auto& analysis = suggester_.playerAnalysis();
    return {{"total_suggestions", total},
            {"implemented_suggestions", implemented},
            {"implementation_rate", static_cast<double>(implemented) / static_cast<double>(std::max<std::size_t>(total, 1))},
            {"player_analysis", analysis ? analysis->toJson() : json(nullptr)},
            {"last_analysis_time", FormatIso8601(lastAnalysis_)},
            {"mode", ToString(suggester_.mode())}};
}

} // namespace eldritch::ai
