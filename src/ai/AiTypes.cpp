// src/ai/AiTypes.cpp
#include "eldritch/ai/AiTypes.h"

namespace eldritch::ai {

namespace {

struct ModeName { AIObjectiveMode value; const char* name; };
constexpr ModeName kModeNames[] = {
    {AIObjectiveMode::Reactive, "reactive"},
    {AIObjectiveMode::Proactive, "proactive"},
    {AIObjectiveMode::Adaptive, "adaptive"},
    {AIObjectiveMode::Narrative, "narrative"},
    {AIObjectiveMode::Dynamic, "dynamic"},
};

struct DifficultyName { DifficultyLevel value; const char* name; };
constexpr DifficultyName kDifficultyNames[] = {
    {DifficultyLevel::Trivial, "trivial"},
    {DifficultyLevel::Easy, "easy"},
    {DifficultyLevel::Normal, "normal"},
    {DifficultyLevel::Hard, "hard"},
    {DifficultyLevel::Extreme, "extreme"},
    {DifficultyLevel::Impossible, "impossible"},
};

struct PatternName { PlayerBehaviorPattern value; const char* name; };
constexpr PatternName kPatternNames[] = {
    {PlayerBehaviorPattern::Cautious, "cautious"},
    {PlayerBehaviorPattern::Aggressive, "aggressive"},
    {PlayerBehaviorPattern::Investigative, "investigative"},
    {PlayerBehaviorPattern::Social, "social"},
    {PlayerBehaviorPattern::Survival, "survival"},
    {PlayerBehaviorPattern::Explorer, "explorer"},
    {PlayerBehaviorPattern::PuzzleSolver, "puzzle_solver"},
    {PlayerBehaviorPattern::HorrorSeeker, "horror_seeker"},
};

// Array entries as strings; empty when the key is missing or not an array.
std::vector<std::string> StringList(const json& state, const char* key)
{
    std::vector<std::string> out;
    const json* v = Find(state, key);
    if (!v || !v->is_array())
        return out;
    for (const auto& e : *v)
        out.push_back(AsString(e));
    return out;
}

} // namespace

const char* ToString(AIObjectiveMode m) noexcept
{
    for (const auto& e : kModeNames)
        if (e.value == m)
            return e.name;
    return "adaptive";
}

const char* ToString(DifficultyLevel d) noexcept
{
    for (const auto& e : kDifficultyNames)
        if (e.value == d)
            return e.name;
    return "normal";
}

const char* ToString(PlayerBehaviorPattern p) noexcept
{
    for (const auto& e : kPatternNames)
        if (e.value == p)
            return e.name;
    return "investigative";
}

std::optional<DifficultyLevel> ParseDifficultyLevel(std::string_view s) noexcept
{
    for (const auto& e : kDifficultyNames)
        if (s == e.name)
            return e.value;
    return std::nullopt;
}

std::optional<PlayerBehaviorPattern> ParsePlayerBehaviorPattern(std::string_view s) noexcept
{
    for (const auto& e : kPatternNames)
        if (s == e.name)
            return e.value;
    return std::nullopt;
}

json ObjectiveSuggestion::toJson() const
{
    return {{"objective_type", variant},
            {"title", title},
            {"description", description},
            {"priority", ToInt(priority)},
            {"scope", ToString(scope)},
            {"estimated_duration", estimatedDuration.count()},
            {"confidence", confidence},
            {"reasoning", reasoning},
            {"context_factors", contextFactors},
            {"parameters", parameters}};
}

json PlayerAnalysis::toJson() const
{
    json secondary = json::array();
    for (auto p : secondaryPatterns)
        secondary.push_back(ToString(p));

    return {{"primary_pattern", ToString(primaryPattern)},
            {"secondary_patterns", secondary},
            {"risk_tolerance", riskTolerance},
            {"exploration_preference", explorationPreference},
            {"social_engagement", socialEngagement},
            {"horror_tolerance", horrorTolerance},
            {"completion_rate", completionRate},
            {"average_session_time", averageSessionHours},
            {"preferred_difficulty", static_cast<int>(preferredDifficulty)},
            {"adaptive_needs", adaptiveNeeds}};
}

GameContextAnalysis GameContextAnalysis::FromGameState(const GameState& state)
{
    GameContextAnalysis c;
    c.tensionLevel       = GetOr(state, "tension_level", c.tensionLevel);
    c.storyPhase         = GetOr(state, "story_phase", c.storyPhase);
    c.locationType       = GetOr(state, "current_location", c.locationType);
    c.npcsPresent        = StringList(state, "npcs_present");
    c.recentEvents       = StringList(state, "recent_events");
    c.availableResources = StringList(state, "inventory");
    c.timePressure       = GetOr(state, "time_pressure", c.timePressure);
    c.cosmicExposure     = GetOr(state, "cosmic_exposure", c.cosmicExposure);
    c.threatLevel        = GetOr(state, "threat_level", c.threatLevel);

    if (const auto s = ParseSanityState(GetOr<std::string>(state, "sanity_state", "stable")))
        c.sanityState = *s;
    return c;
}

} // namespace eldritch::ai
