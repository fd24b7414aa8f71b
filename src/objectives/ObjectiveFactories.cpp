// src/objectives/ObjectiveFactories.cpp
#include "eldritch/objectives/ObjectiveFactories.h"

namespace eldritch::factories {

namespace {

json Merge(json params, const json& extra)
{
    if (extra.is_object())
        for (auto it = extra.begin(); it != extra.end(); ++it)
            params[it.key()] = it.value();
    return params;
}

std::string Join(const std::vector<std::string>& items, const char* sep)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i)
            out += sep;
        out += items[i];
    }
    return out;
}

json RewardOf(RewardType type, int value, std::string description)
{
    return Reward{type, value, std::move(description), json::object()};
}

json ConsequenceOf(FailureConsequence type, int severity, std::string description)
{
    return Consequence{type, severity, std::move(description), json::object()};
}

} // namespace

std::unique_ptr<ShortTermObjective> Investigation(const std::string& id, const std::string& title,
                                                  const std::string& location,
                                                  const std::vector<std::string>& requiredDiscoveries,
                                                  TimePoint now, int timeLimitMinutes, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Thoroughly investigate " + location + " to uncover its secrets"},
        {"objective_type", "investigation"},
        {"priority", ToInt(ObjectivePriority::Normal)},
        {"time_limit", Minutes(timeLimitMinutes).count()},
        {"activation_conditions", json::array({Condition::location(location)})},
        {"required_discoveries", requiredDiscoveries},
        {"scene_context", {{"location", location}}},
        {"rewards", json::array({rewards::Knowledge()})},
        {"failure_consequences", json::array({consequences::SanLossMinor()})},
    };
    return ShortTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<ShortTermObjective> Survival(const std::string& id, const std::string& title,
                                             const std::string& threatDescription, TimePoint now,
                                             int durationMinutes, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Survive " + threatDescription},
        {"objective_type", "survival"},
        {"priority", ToInt(ObjectivePriority::High)},
        {"time_limit", Minutes(durationMinutes).count()},
        {"tension_ramp_enabled", true},
        {"initial_tension", 2},
        {"max_tension", 5},
        {"rewards", json::array({rewards::Survival(), rewards::SanityMinor()})},
        {"failure_consequences", json::array({consequences::SanLossMajor()})},
    };
    return ShortTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<ImmediateObjective> Social(const std::string& id, const std::string& title,
                                           const std::string& npcName,
                                           const std::vector<std::string>& conversationGoals, TimePoint now,
                                           const json& extra)
{
    const std::vector<std::string> goals = conversationGoals.empty()
        ? std::vector<std::string>{"initiate_conversation", "ask_questions", "conclude_conversation"}
        : conversationGoals;

    json params = {
        {"title", title},
        {"description", "Engage with " + npcName + " to gather information"},
        {"objective_type", "social"},
        {"priority", ToInt(ObjectivePriority::Normal)},
        {"required_actions", goals},
        {"rewards", json::array({rewards::Knowledge()})},
        {"metadata", {{"npc_name", npcName}, {"conversation_goals", goals}}},
    };
    return ImmediateObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<ShortTermObjective> Exploration(const std::string& id, const std::string& title,
                                                const std::vector<std::string>& areas, TimePoint now,
                                                const json& extra)
{
    std::vector<std::string> discoveries;
    for (const auto& area : areas)
        discoveries.push_back("explored_" + area);

    json params = {
        {"title", title},
        {"description", "Explore and map out the following areas: " + Join(areas, ", ")},
        {"objective_type", "exploration"},
        {"priority", ToInt(ObjectivePriority::Normal)},
        {"required_discoveries", discoveries},
        {"milestone_count", static_cast<int>(areas.size())},
        {"rewards", json::array({rewards::Knowledge()})},
        {"failure_consequences", json::array({consequences::SanLossMinor()})},
    };
    return ShortTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<MidTermObjective> Knowledge(const std::string& id, const std::string& title,
                                            const std::string& mythosEntity, TimePoint now,
                                            int knowledgeLevel, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Learn about " + mythosEntity + " and its connection to current events"},
        {"objective_type", "knowledge"},
        {"priority", ToInt(ObjectivePriority::Normal)},
        {"horror_revelations", {mythosEntity + "_basic", mythosEntity + "_advanced"}},
        {"rewards", json::array({rewards::Knowledge()})},
        {"failure_consequences", json::array({consequences::SanLossMajor(), consequences::CosmicAttention()})},
        {"metadata", {{"mythos_entity", mythosEntity}, {"target_knowledge_level", knowledgeLevel}}},
    };
    return MidTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<MidTermObjective> Protection(const std::string& id, const std::string& title,
                                             const std::string& protectedEntity, TimePoint now,
                                             int threatLevel, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Keep " + protectedEntity + " safe from harm"},
        {"objective_type", "protection"},
        {"priority", ToInt(ObjectivePriority::High)},
        {"story_beats", json::array({
            {{"name", "identify_threat"}, {"description", "Identify the nature of the threat"}},
            {{"name", "establish_protection"}, {"description", "Set up protective measures"}},
            {{"name", "monitor_situation"}, {"description", "Watch for signs of danger"}},
            {{"name", "respond_to_crisis"}, {"description", "Handle direct threats"}},
        })},
        {"rewards", json::array({rewards::Survival(),
                                 RewardOf(RewardType::Alliance, 1, "Gain trust of " + protectedEntity)})},
        {"failure_consequences", json::array({
            ConsequenceOf(FailureConsequence::NpcDeath, 5, protectedEntity + " is harmed or killed"),
            consequences::SanLossMajor()})},
        {"metadata", {{"protected_entity", protectedEntity}, {"threat_level", threatLevel}}},
    };
    return MidTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<ShortTermObjective> Escape(const std::string& id, const std::string& title,
                                           const std::string& location, TimePoint now,
                                           int urgencyLevel, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Escape from " + location + " before it's too late"},
        {"objective_type", "escape"},
        {"priority", ToInt(ObjectivePriority::Critical)},
        {"time_limit", Minutes(10).count()},
        {"required_discoveries", {"exit_route", "clear_obstacles", "avoid_dangers"}},
        {"tension_ramp_enabled", true},
        {"initial_tension", urgencyLevel},
        {"max_tension", 5},
        {"rewards", json::array({rewards::Survival()})},
        {"failure_consequences", json::array({
            ConsequenceOf(FailureConsequence::HpLoss, urgencyLevel, "Physical harm from failed escape"),
            ConsequenceOf(FailureConsequence::SanLoss, urgencyLevel, "Terror from being trapped")})},
        {"metadata", {{"escape_location", location}, {"urgency_level", urgencyLevel}}},
    };
    return ShortTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<LongTermObjective> Campaign(const std::string& id, const std::string& title,
                                            const std::string& campaignName, const json& phases,
                                            TimePoint now, const std::vector<std::string>& themes,
                                            const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Complete the " + campaignName + " campaign and uncover its mysteries"},
        {"objective_type", "revelation"},
        {"priority", ToInt(ObjectivePriority::High)},
        {"campaign_phases", phases.is_array() ? phases : json::array()},
        {"recurring_themes", themes},
        {"character_growth_goals", {{"mythos_entities", 5}, {"successful_investigations", 3}, {"survival_encounters", 10}}},
        {"rewards", json::array({RewardOf(RewardType::CosmicInsight, 1, "Gain deep understanding of cosmic truth"),
                                 RewardOf(RewardType::Knowledge, 5, "Extensive mythos knowledge")})},
        {"failure_consequences", json::array({consequences::CosmicAttention()})},
        {"metadata", {{"campaign_name", campaignName}}},
    };
    return LongTermObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<MetaObjective> Mastery(const std::string& id, const std::string& title,
                                       const std::string& masteryType, const json& unlockCriteria,
                                       TimePoint now, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Achieve mastery in " + masteryType + " across multiple campaigns"},
        {"objective_type", "knowledge"},
        {"priority", ToInt(ObjectivePriority::Low)},
        {"unlock_criteria", {{masteryType + "_mastery", unlockCriteria}}},
        {"mastery_categories", {{masteryType, json::object()}}},
        {"rewards", json::array({RewardOf(RewardType::CosmicInsight, 1,
                                          "Master-level understanding of " + masteryType)})},
        {"metadata", {{"mastery_type", masteryType}}},
    };
    return MetaObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<CosmicInsightObjective> ForbiddenKnowledge(const std::string& id, const std::string& title,
                                                           const std::string& knowledgeType,
                                                           const json& insightLevels, TimePoint now,
                                                           const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Learn the terrible truth about " + knowledgeType},
        {"objective_type", "knowledge"},
        {"scope", "mid_term"},
        {"priority", ToInt(ObjectivePriority::High)},
        {"san_risk_level", 4},
        {"insight_levels", insightLevels.is_array() ? insightLevels : json::array()},
        {"sanity_cost_per_insight", 3},
        {"rewards", json::array({RewardOf(RewardType::CosmicInsight, 1, "Deep understanding of " + knowledgeType),
                                 RewardOf(RewardType::Knowledge, 3, "Forbidden knowledge gained")})},
        {"failure_consequences", json::array({
            ConsequenceOf(FailureConsequence::SanLoss, 5, "Failed to comprehend cosmic truth"),
            ConsequenceOf(FailureConsequence::CosmicAttention, 3, "Noticed by cosmic entities")})},
    };
    return CosmicInsightObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<SanityDependentObjective> SanityDependentInvestigation(const std::string& id,
                                                                       const std::string& title,
                                                                       const std::string& location,
                                                                       const json& stateConfigurations,
                                                                       TimePoint now, const json& extra)
{
    json params = {
        {"title", title},
        {"description", "Investigate " + location + " - methods depend on mental state"},
        {"objective_type", "investigation"},
        {"scope", "short_term"},
        {"priority", ToInt(ObjectivePriority::Normal)},
        {"state_configurations", stateConfigurations.is_object() ? stateConfigurations : json::object()},
        {"san_risk_level", 2},
        {"rewards", json::array({RewardOf(RewardType::Knowledge, 1, "Information gathered")})},
        {"failure_consequences", json::array({ConsequenceOf(FailureConsequence::SanLoss, 2, "Disturbing findings")})},
    };
    return SanityDependentObjective::FromParams(id, Merge(std::move(params), extra), now);
}

std::unique_ptr<MadnessObjective> MadnessDriven(const std::string& id, const std::string& title,
                                                const std::vector<MadnessType>& requiredMadness, TimePoint now,
                                                const json& extra)
{
    json types = json::array();
    for (auto t : requiredMadness)
        types.push_back(ToString(t));

    json params = {
        {"title", title},
        {"description", "An action that only makes sense to a disturbed mind"},
        {"objective_type", "ritual"},
        {"scope", "short_term"},
        {"priority", ToInt(ObjectivePriority::High)},
        {"required_madness_types", types},
        {"madness_progress_multiplier", 2.0},
        {"sanity_recovery_on_completion", 3},
        {"rewards", json::array({RewardOf(RewardType::SanityRestoration, 3, "Confronting madness provides clarity"),
                                 RewardOf(RewardType::Revelation, 1, "Madness reveals hidden truth")})},
    };
    return MadnessObjective::FromParams(id, Merge(std::move(params), extra), now);
}

} // namespace eldritch::factories
