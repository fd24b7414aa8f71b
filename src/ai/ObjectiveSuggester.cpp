// src/ai/ObjectiveSuggester.cpp
#include "eldritch/ai/ObjectiveSuggester.h"

#include "eldritch/logging/Log.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <exception>
#include <numeric>
#include <sstream>
#include <utility>

namespace eldritch::ai {

namespace {

using PatternScore = std::pair<PlayerBehaviorPattern, double>;

bool HasSubstring(const std::string& s, const char* needle)
{
    return s.find(needle) != std::string::npos;
}

int CountOf(const std::map<std::string, int>& counts, const char* key)
{
    auto it = counts.find(key);
    return it == counts.end() ? 0 : it->second;
}

// Declaration order is the tie-break order.
std::array<PatternScore, 6> ScorePatterns(const std::map<std::string, int>& counts, double risk, double exploration)
{
    int total = 0;
    for (const auto& [type, n] : counts)
        total += n;
    const double denom = std::max(total, 1);
    auto share = [&](const char* key) { return CountOf(counts, key) / denom; };

    return {{{PlayerBehaviorPattern::Cautious, share("careful_action") + (1.0 - risk)},
             {PlayerBehaviorPattern::Aggressive, share("bold_action") + risk},
             {PlayerBehaviorPattern::Investigative, share("investigate") + share("analyze")},
             {PlayerBehaviorPattern::Social, share("talk")},
             {PlayerBehaviorPattern::Explorer, exploration},
             {PlayerBehaviorPattern::Survival, share("flee") + share("hide")}}};
}

std::string DescribeCounts(const std::map<std::string, int>& counts)
{
    json j = json::object();
    for (const auto& [type, n] : counts)
        j[type] = n;
    return j.dump();
}

} // namespace

ObjectiveSuggestion TensionSuggestion(const GameContextAnalysis& c)
{
    ObjectiveSuggestion s;
    s.variant = "ShortTermObjective";
    s.title = "Investigate Disturbing Sounds";
    s.description = "Strange noises coming from nearby demand investigation";
    s.priority = ObjectivePriority::Normal;
    s.scope = ObjectiveScope::ShortTerm;
    s.estimatedDuration = Minutes(10);
    s.confidence = 0.8;
    s.reasoning = "Story needs tension increase";
    s.contextFactors = {"low_tension", "story_pacing"};
    s.parameters = {{"objective_type", "investigation"},
                    {"tension_ramp_enabled", true},
                    {"initial_tension", c.tensionLevel + 1}};
    return s;
}

ObjectiveSuggestion InvestigationSuggestion(const GameContextAnalysis& c)
{
    ObjectiveSuggestion s;
    s.variant = "ShortTermObjective";
    s.title = "Examine " + c.locationType;
    s.description = "Carefully investigate the " + c.locationType + " for clues";
    s.priority = ObjectivePriority::Normal;
    s.scope = ObjectiveScope::ShortTerm;
    s.estimatedDuration = Minutes(15);
    s.confidence = 0.7;
    s.reasoning = "Investigation needed for story progression";
    s.contextFactors = {"location_type", "story_phase"};
    s.parameters = {{"objective_type", "investigation"},
                    {"required_discoveries", {"examine_" + c.locationType, "find_clue"}},
                    {"milestone_count", 2}};
    return s;
}

std::optional<ObjectiveSuggestion> SocialSuggestion(const GameContextAnalysis& c)
{
    if (c.npcsPresent.empty())
        return std::nullopt;
    const std::string& npc = c.npcsPresent.front();

    ObjectiveSuggestion s;
    s.variant = "ImmediateObjective";
    s.title = "Speak with " + npc;
    s.description = "Engage " + npc + " in conversation to gather information";
    s.priority = ObjectivePriority::Normal;
    s.scope = ObjectiveScope::Immediate;
    s.estimatedDuration = Minutes(5);
    s.confidence = 0.8;
    s.reasoning = "NPC available for interaction";
    s.contextFactors = {"npcs_present", "social_opportunity"};
    s.parameters = {{"objective_type", "social"},
                    {"required_actions", {"initiate_conversation", "ask_questions", "conclude_conversation"}},
                    {"metadata", {{"npc_name", npc}}}};
    return s;
}

ObjectiveSuggestion ExplorationSuggestion(const GameContextAnalysis&)
{
    ObjectiveSuggestion s;
    s.variant = "ShortTermObjective";
    s.title = "Explore Nearby Areas";
    s.description = "Survey the surrounding area for points of interest";
    s.priority = ObjectivePriority::Low;
    s.scope = ObjectiveScope::ShortTerm;
    s.estimatedDuration = Minutes(12);
    s.confidence = 0.6;
    s.reasoning = "Exploration provides context and opportunities";
    s.contextFactors = {"location_context", "exploration_opportunities"};
    s.parameters = {{"objective_type", "exploration"},
                    {"required_discoveries", {"survey_area", "identify_landmarks", "note_features"}},
                    {"milestone_count", 3}};
    return s;
}

ObjectiveSuggestion SurvivalSuggestion(const GameContextAnalysis& c)
{
    ObjectiveSuggestion s;
    s.variant = "ShortTermObjective";
    s.title = "Ensure Safety";
    s.description = "Take measures to ensure your continued safety";
    s.priority = ObjectivePriority::High;
    s.scope = ObjectiveScope::ShortTerm;
    s.estimatedDuration = Minutes(8);
    s.confidence = 0.9;
    s.reasoning = "Survival is always a priority in cosmic horror";
    s.contextFactors = {"threat_level", "safety_concerns"};
    s.parameters = {{"objective_type", "survival"},
                    {"tension_ramp_enabled", true},
                    {"initial_tension", std::max(1, c.threatLevel)},
                    {"max_tension", 5}};
    return s;
}

ObjectiveSuggestion KnowledgeSuggestion(const GameContextAnalysis&)
{
    ObjectiveSuggestion s;
    s.variant = "MidTermObjective";
    s.title = "Uncover Hidden Knowledge";
    s.description = "Seek out forbidden knowledge related to current events";
    s.priority = ObjectivePriority::Normal;
    s.scope = ObjectiveScope::MidTerm;
    s.estimatedDuration = Minutes(30);
    s.confidence = 0.7;
    s.reasoning = "Knowledge objectives satisfy investigative players";
    s.contextFactors = {"cosmic_exposure", "knowledge_opportunities"};
    s.parameters = {{"objective_type", "knowledge"},
                    {"horror_revelations", {"initial_truth", "deeper_understanding"}},
                    {"san_risk_level", 3}};
    return s;
}

ObjectiveSuggester::ObjectiveSuggester(AiConfig config, std::shared_ptr<TextGenerator> generator)
    : config_(config)
    , generator_(std::move(generator))
{
}

PlayerBehaviorPattern ObjectiveSuggester::PrimaryPattern(const std::map<std::string, int>& actionCounts,
                                                         double riskTolerance, double explorationPreference)
{
    const auto scores = ScorePatterns(actionCounts, riskTolerance, explorationPreference);
    // max_element keeps the first of equal maxima.
    return std::max_element(scores.begin(), scores.end(),
                            [](const PatternScore& a, const PatternScore& b) { return a.second < b.second; })
        ->first;
}

PlayerAnalysis ObjectiveSuggester::analyzePlayerBehavior(const json& gameHistory, const json& objectiveHistory)
{
    std::map<std::string, int> counts;
    std::vector<double> risks;
    int exploration = 0, social = 0;
    int horrorEncounters = 0, horrorCompleted = 0;
    double sessionHours = 0.0;
    std::size_t sessions = 0;

    if (gameHistory.is_array())
    {
        for (const auto& session : gameHistory)
        {
            ++sessions;
            sessionHours += GetOr(session, "duration_hours", 1.0);

            const json* actions = Find(session, "actions");
            if (actions && actions->is_array())
            {
                for (const auto& action : *actions)
                {
                    const std::string type = GetOr<std::string>(action, "type", "unknown");
                    ++counts[type];
                    if (const json* risk = Find(action, "risk_level"); risk && Truthy(*risk) && risk->is_number())
                        risks.push_back(risk->get<double>());
                    if (HasSubstring(type, "explore") || HasSubstring(type, "investigate"))
                        ++exploration;
                    if (HasSubstring(type, "talk") || HasSubstring(type, "social"))
                        ++social;
                }
            }

            const json* events = Find(session, "events");
            if (events && events->is_array())
            {
                for (const auto& event : *events)
                {
                    if (GetOr<std::string>(event, "type", "") != "horror_encounter")
                        continue;
                    ++horrorEncounters;
                    if (GetOr(event, "completed", false))
                        ++horrorCompleted;
                }
            }
        }
    }

    int completed = 0, recorded = 0;
    std::map<DifficultyLevel, std::pair<int, int>> byDifficulty; // total, completed
    if (objectiveHistory.is_array())
    {
        for (const auto& record : objectiveHistory)
        {
            const bool done = GetOr(record, "completed", false);
            ++recorded;
            if (done)
                ++completed;

            const auto level = ParseDifficultyLevel(GetOr<std::string>(record, "difficulty", "normal"));
            if (!level)
                continue;
            auto& slot = byDifficulty[*level];
            ++slot.first;
            if (done)
                ++slot.second;
        }
    }

    int totalActions = 0;
    for (const auto& [type, n] : counts)
        totalActions += n;
    const double denom = std::max(totalActions, 1);

    PlayerAnalysis a;
    a.riskTolerance = risks.empty() ? 0.5 : std::accumulate(risks.begin(), risks.end(), 0.0) / risks.size();
    a.explorationPreference = exploration / denom;
    a.socialEngagement = social / denom;
    a.completionRate = recorded ? static_cast<double>(completed) / recorded : 0.5;
    a.horrorTolerance = horrorEncounters ? static_cast<double>(horrorCompleted) / horrorEncounters : 0.5;
    a.averageSessionHours = sessions ? sessionHours / sessions : 1.0;

    auto scores = ScorePatterns(counts, a.riskTolerance, a.explorationPreference);
    a.primaryPattern = PrimaryPattern(counts, a.riskTolerance, a.explorationPreference);
    std::stable_sort(scores.begin(), scores.end(),
                     [](const PatternScore& x, const PatternScore& y) { return x.second > y.second; });
    for (const auto& [pattern, score] : scores)
    {
        if (pattern != a.primaryPattern && a.secondaryPatterns.size() < 2)
            a.secondaryPatterns.push_back(pattern);
    }

    // Highest level weighted by its completion rate.
    double bestScore = 0.0;
    for (const auto& [level, tally] : byDifficulty)
    {
        const double score = static_cast<double>(tally.second) / tally.first * static_cast<int>(level);
        if (score > bestScore)
        {
            bestScore = score;
            a.preferredDifficulty = level;
        }
    }

    if (a.completionRate < 0.3)
        a.adaptiveNeeds.push_back("easier_objectives");
    else if (a.completionRate > 0.9)
        a.adaptiveNeeds.push_back("harder_objectives");
    if (CountOf(counts, "social") / denom < 0.1)
        a.adaptiveNeeds.push_back("social_prompts");
    if (CountOf(counts, "explore") / denom < 0.2)
        a.adaptiveNeeds.push_back("exploration_encouragement");

    if (generator_)
    {
        if (auto refined = refinePattern(counts, a.riskTolerance, a.explorationPreference, a.socialEngagement))
            a.primaryPattern = *refined;
    }

    analysis_ = a;
    return a;
}

std::optional<PlayerBehaviorPattern> ObjectiveSuggester::refinePattern(const std::map<std::string, int>& actionCounts,
                                                                       double riskTolerance,
                                                                       double explorationPreference,
                                                                       double socialEngagement)
{
    std::ostringstream prompt;
    prompt.precision(2);
    prompt << std::fixed
           << "Analyze this player's behavior pattern in a Cthulhu TRPG:\n"
           << "Action Distribution: " << DescribeCounts(actionCounts) << "\n"
           << "Risk Tolerance: " << riskTolerance << " (0=cautious, 1=reckless)\n"
           << "Exploration Preference: " << explorationPreference << "\n"
           << "Social Engagement: " << socialEngagement << "\n"
           << "Determine the primary behavior pattern from: cautious, aggressive, investigative, social, "
              "explorer, survival, puzzle_solver, horror_seeker\n"
           << "Provide analysis in JSON format with 'primary_pattern' and 'reasoning' fields.";

    pendingGeneratorCalls();

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    std::string reply;
    try
    {
        std::future<std::string> pending = generator_->generate(prompt.str(), cancel);
        if (!pending.valid())
            return std::nullopt;
        if (pending.wait_for(std::chrono::milliseconds(std::max(0, config_.analysisTimeoutMs)))
            != std::future_status::ready)
        {
            cancel->store(true);
            abandoned_.push_back(std::move(pending));
            logsys::get()->warn("Player analysis timed out after {} ms; using heuristics", config_.analysisTimeoutMs);
            return std::nullopt;
        }
        reply = pending.get();
    }
    catch (const std::exception& e)
    {
        logsys::get()->error("Error in AI-enhanced player analysis: {}", e.what());
        return std::nullopt;
    }

    const json parsed = json::parse(reply, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded())
    {
        logsys::get()->warn("AI analysis response was not valid JSON");
        return std::nullopt;
    }

    const auto pattern = ParsePlayerBehaviorPattern(GetOr<std::string>(parsed, "primary_pattern", ""));
    if (!pattern)
        logsys::get()->warn("AI analysis named no known behavior pattern");
    return pattern;
}

std::size_t ObjectiveSuggester::pendingGeneratorCalls()
{
    abandoned_.erase(std::remove_if(abandoned_.begin(), abandoned_.end(),
                                    [](const std::future<std::string>& f) {
                                        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                    }),
                     abandoned_.end());
    return abandoned_.size();
}

std::optional<ObjectiveSuggestion> ObjectiveSuggester::storySuggestion(const std::string& need,
                                                                       const GameContextAnalysis& c) const
{
    if (need == "increase_tension")
        return TensionSuggestion(c);
    if (need == "information_gathering")
        return InvestigationSuggestion(c);
    if (need == "character_development")
        return SocialSuggestion(c);
    return std::nullopt;
}

std::optional<ObjectiveSuggestion> ObjectiveSuggester::playerSuggestion(const std::string& need,
                                                                        const GameContextAnalysis& c) const
{
    if (need == "social_engagement")
        return SocialSuggestion(c);
    if (need == "knowledge_seeking")
        return KnowledgeSuggestion(c);
    return std::nullopt;
}

std::optional<ObjectiveSuggestion> ObjectiveSuggester::typeSuggestion(ObjectiveType type,
                                                                      const GameContextAnalysis& c) const
{
    switch (type)
    {
    case ObjectiveType::Exploration:   return ExplorationSuggestion(c);
    case ObjectiveType::Social:        return SocialSuggestion(c);
    case ObjectiveType::Investigation: return InvestigationSuggestion(c);
    case ObjectiveType::Survival:      return SurvivalSuggestion(c);
    default:                           return std::nullopt;
    }
}

std::vector<ObjectiveSuggestion> ObjectiveSuggester::suggest(const GameState& state,
                                                             const std::vector<const Objective*>& current,
                                                             const GameContextAnalysis& context) const
{
    (void)state;
    std::vector<ObjectiveSuggestion> out;
    auto keep = [&](std::optional<ObjectiveSuggestion> s) {
        if (s && s->confidence >= config_.minConfidence)
            out.push_back(std::move(*s));
    };

    // ---- narrative pacing ----
    std::vector<std::string> storyNeeds;
    if (context.tensionLevel < 2)
        storyNeeds.push_back("increase_tension");
    else if (context.tensionLevel > 4)
        storyNeeds.push_back("reduce_tension");
    if (context.storyPhase == "investigation" || context.storyPhase == "discovery")
        storyNeeds.push_back("information_gathering");
    if (!context.npcsPresent.empty() && context.storyPhase != "action")
        storyNeeds.push_back("character_development");
    for (const auto& need : storyNeeds)
        keep(storySuggestion(need, context));

    // ---- player needs ----
    if (analysis_)
    {
        std::vector<std::string> playerNeeds;
        for (const auto& need : analysis_->adaptiveNeeds)
        {
            if (need == "easier_objectives")
                playerNeeds.push_back("easier_challenge");
            else if (need == "social_prompts")
                playerNeeds.push_back("social_engagement");
        }
        const bool hasKnowledge = std::any_of(current.begin(), current.end(), [](const Objective* o) {
            return o->type() == ObjectiveType::Knowledge;
        });
        if (analysis_->primaryPattern == PlayerBehaviorPattern::Investigative && !hasKnowledge)
            playerNeeds.push_back("knowledge_seeking");
        for (const auto& need : playerNeeds)
            keep(playerSuggestion(need, context));
    }

    // ---- missing essential types ----
    constexpr ObjectiveType kEssential[] = {ObjectiveType::Investigation, ObjectiveType::Exploration,
                                            ObjectiveType::Social, ObjectiveType::Survival};
    for (ObjectiveType type : kEssential)
    {
        const bool covered = std::any_of(current.begin(), current.end(), [&](const Objective* o) {
            return o->isActive() && o->type() == type;
        });
        if (!covered)
            keep(typeSuggestion(type, context));
    }

    std::stable_sort(out.begin(), out.end(), [](const ObjectiveSuggestion& a, const ObjectiveSuggestion& b) {
        return a.confidence > b.confidence;
    });
    if (out.size() > static_cast<std::size_t>(std::max(0, config_.maxSuggestions)))
        out.resize(static_cast<std::size_t>(std::max(0, config_.maxSuggestions)));
    return out;
}

} // namespace eldritch::ai
