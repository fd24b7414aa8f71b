// src/achievements/Achievement.cpp
#include "eldritch/achievements/Achievement.h"

#include "eldritch/logging/Log.h"

#include <algorithm>
#include <utility>

namespace eldritch {

namespace {

struct CategoryName { AchievementCategory value; const char* name; };
constexpr CategoryName kCategoryNames[] = {
    {AchievementCategory::Survival, "survival"},
    {AchievementCategory::Knowledge, "knowledge"},
    {AchievementCategory::Investigation, "investigation"},
    {AchievementCategory::Social, "social"},
    {AchievementCategory::Exploration, "exploration"},
    {AchievementCategory::Horror, "horror"},
    {AchievementCategory::Mastery, "mastery"},
    {AchievementCategory::Narrative, "narrative"},
    {AchievementCategory::Meta, "meta"},
    {AchievementCategory::Secret, "secret"},
};

struct TriggerName { AchievementTrigger value; const char* name; };
constexpr TriggerName kTriggerNames[] = {
    {AchievementTrigger::ObjectiveCompletion, "objective_completion"},
    {AchievementTrigger::StatThreshold, "stat_threshold"},
    {AchievementTrigger::EventOccurrence, "event_occurrence"},
    {AchievementTrigger::ConditionMet, "condition_met"},
    {AchievementTrigger::TimeBased, "time_based"},
    {AchievementTrigger::SequenceCompletion, "sequence_completion"},
};

double TargetNumber(const json& target, double fallback = 0.0)
{
    if (target.is_number())
        return target.get<double>();
    if (target.is_boolean())
        return target.get<bool>() ? 1.0 : 0.0;
    return fallback;
}

std::size_t CountByType(const json& entries, const std::string& type)
{
    if (!entries.is_array())
        return 0;
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [&](const json& e) {
        const json* t = Find(e, "type");
        return t && t->is_string() && t->get_ref<const std::string&>() == type;
    }));
}

// `needle` in `haystack`: element of an array, key of an object, substring of a string.
bool Contains(const json& haystack, const json& needle)
{
    if (haystack.is_array())
        return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
    if (haystack.is_object())
        return needle.is_string() && haystack.contains(needle.get<std::string>());
    if (haystack.is_string() && needle.is_string())
        return haystack.get_ref<const std::string&>().find(needle.get_ref<const std::string&>()) != std::string::npos;
    return false;
}

bool Ordered(const json& a, const json& b) noexcept
{
    return (a.is_number() && b.is_number()) || (a.is_string() && b.is_string());
}

bool CheckStatThreshold(const AchievementCriteria& c, const json& playerStats)
{
    const std::string stat = GetOr<std::string>(c.conditions, "stat_name", "");
    if (stat.empty())
        return false;
    const json* current = Find(playerStats, stat.c_str());
    return current && CompareValues(*current, c.target, c.op);
}

bool CheckObjectiveCompletion(const AchievementCriteria& c, const json& gameData)
{
    const json* completed = Find(gameData, "completed_objectives");
    const json  empty = json::array();
    const json& list = (completed && completed->is_array()) ? *completed : empty;

    if (c.op == "count")
        return static_cast<double>(list.size()) >= TargetNumber(c.target);
    if (c.op == "type_count")
    {
        const std::string type = GetOr<std::string>(c.conditions, "objective_type", "");
        return static_cast<double>(CountByType(list, type)) >= TargetNumber(c.target);
    }
    return false;
}

bool CheckEventOccurrence(const AchievementCriteria& c, const json& gameData)
{
    const json* events = Find(gameData, "events");
    const std::string type = GetOr<std::string>(c.conditions, "event_type", "");
    const std::size_t n = events ? CountByType(*events, type) : 0;

    if (c.op == "count")
        return static_cast<double>(n) >= TargetNumber(c.target);
    // "occurred", or any other operator with a flag-like target.
    return n > 0;
}

bool CheckConditionMet(const AchievementCriteria& c, const json& playerStats)
{
    const std::string condition = GetOr<std::string>(c.conditions, "condition_type", "");
    if (condition == "sanity_state")
    {
        const double sanity = GetOr<double>(playerStats, "sanity", 50.0);
        const std::string required = c.target.is_string() ? c.target.get<std::string>() : std::string{};
        if (required == "mad")
            return sanity <= 9.0;
        if (required == "stable")
            return sanity >= 70.0;
        return false;
    }
    if (condition == "cosmic_exposure")
        return GetOr<double>(playerStats, "cosmic_exposure", 0.0) >= TargetNumber(c.target);
    return false;
}

bool CheckSequenceCompletion(const AchievementCriteria& c, const json& gameData)
{
    const std::string name = GetOr<std::string>(c.conditions, "sequence_name", "");
    const json* sequences = Find(gameData, "completed_sequences");
    return !name.empty() && sequences && ArrayContains(*sequences, name);
}

} // namespace

const char* ToString(AchievementCategory c) noexcept
{
    for (const auto& e : kCategoryNames)
        if (e.value == c)
            return e.name;
    return "survival";
}

const char* ToString(AchievementTrigger t) noexcept
{
    for (const auto& e : kTriggerNames)
        if (e.value == t)
            return e.name;
    return "stat_threshold";
}

std::optional<AchievementCategory> ParseAchievementCategory(std::string_view s) noexcept
{
    for (const auto& e : kCategoryNames)
        if (s == e.name)
            return e.value;
    return std::nullopt;
}

std::optional<AchievementTrigger> ParseAchievementTrigger(std::string_view s) noexcept
{
    for (const auto& e : kTriggerNames)
        if (s == e.name)
            return e.value;
    return std::nullopt;
}

void to_json(json& j, const AchievementReward& r)
{
    j = json{{"title", r.title},
             {"description", r.description},
             {"unlock_content", r.unlockContent},
             {"statistical_bonus", r.statisticalBonus},
             {"cosmetic_unlocks", r.cosmeticUnlocks},
             {"lore_entries", r.loreEntries}};
}

void to_json(json& j, const AchievementCriteria& c)
{
    j = json{{"trigger_type", ToString(c.trigger)},
             {"target_value", c.target},
             {"comparison_operator", c.op},
             {"additional_conditions", c.conditions},
             {"context_requirements", c.context}};
}

bool CompareValues(const json& current, const json& target, std::string_view op)
{
    if (op == "eq")
        return current == target;
    if (op == "in")
        return Contains(target, current);
    if (op == "contains")
        return Contains(current, target);

    if (!Ordered(current, target))
        return false;
    if (op == "gt")
        return current > target;
    if (op == "gte")
        return current >= target;
    if (op == "lt")
        return current < target;
    if (op == "lte")
        return current <= target;
    return false;
}

Achievement::Achievement(std::string id,
                         std::string title,
                         std::string description,
                         AchievementCategory category,
                         AchievementRarity rarity,
                         std::vector<AchievementCriteria> criteria,
                         AchievementReward reward)
    : id_(std::move(id))
    , title_(std::move(title))
    , description_(std::move(description))
    , category_(category)
    , rarity_(rarity)
    , criteria_(std::move(criteria))
    , reward_(std::move(reward))
{
}

bool Achievement::checkUnlockConditions(const json& gameData, const json& playerStats,
                                        const std::set<std::string>& unlockedIds) const
{
    if (unlocked_)
        return false;

    for (const auto& prereq : prerequisites_)
        if (unlockedIds.count(prereq) == 0)
            return false;

    return std::all_of(criteria_.begin(), criteria_.end(),
                       [&](const AchievementCriteria& c) { return checkCriterion(c, gameData, playerStats); });
}

bool Achievement::checkCriterion(const AchievementCriteria& c, const json& gameData, const json& playerStats) const
{
    switch (c.trigger)
    {
    case AchievementTrigger::StatThreshold:       return CheckStatThreshold(c, playerStats);
    case AchievementTrigger::ObjectiveCompletion: return CheckObjectiveCompletion(c, gameData);
    case AchievementTrigger::EventOccurrence:     return CheckEventOccurrence(c, gameData);
    case AchievementTrigger::ConditionMet:        return CheckConditionMet(c, playerStats);
    case AchievementTrigger::SequenceCompletion:  return CheckSequenceCompletion(c, gameData);
    case AchievementTrigger::TimeBased:           break; // no snapshot evaluator
    }
    return false;
}

bool Achievement::unlock(TimePoint now, json context)
{
    if (unlocked_)
        return false;

    unlocked_ = true;
    unlockedAt_ = now;
    unlockContext_ = context.is_null() ? json::object() : std::move(context);

    logsys::get()->info("Achievement unlocked: {}", title_);
    return true;
}

void Achievement::restoreUnlock(std::optional<TimePoint> at, json context)
{
    unlocked_ = true;
    unlockedAt_ = at;
    unlockContext_ = std::move(context);
}

json Achievement::progressInfo(const json& gameData, const json& playerStats) const
{
    if (unlocked_)
    {
        return {{"unlocked", true},
                {"unlock_timestamp", unlockedAt_ ? json(FormatIso8601(*unlockedAt_)) : json(nullptr)},
                {"progress", 1.0}};
    }

    std::size_t met = 0;
    const AchievementCriteria* next = nullptr;
    for (const auto& c : criteria_)
    {
        if (checkCriterion(c, gameData, playerStats))
            ++met;
        else if (!next)
            next = &c;
    }

    const std::size_t total = criteria_.size();
    const double progress = total > 0 ? static_cast<double>(met) / static_cast<double>(total) : 0.0;

    json nextInfo = nullptr;
    if (progress < 1.0 && next)
    {
        nextInfo = {{"type", ToString(next->trigger)},
                    {"description", DescribeCriterion(*next)},
                    {"target_value", next->target}};
    }

    return {{"unlocked", false},
            {"progress", progress},
            {"met_criteria", met},
            {"total_criteria", total},
            {"next_criterion", nextInfo}};
}

std::string Achievement::DescribeCriterion(const AchievementCriteria& c)
{
    switch (c.trigger)
    {
    case AchievementTrigger::StatThreshold:
        return "Reach " + AsString(c.target) + " " + GetOr<std::string>(c.conditions, "stat_name", "unknown");
    case AchievementTrigger::ObjectiveCompletion:
        return "Complete " + AsString(c.target) + " objectives";
    case AchievementTrigger::EventOccurrence:
        return "Experience " + GetOr<std::string>(c.conditions, "event_type", "event");
    default:
        return "Meet special condition";
    }
}

json Achievement::toDict() const
{
    return {{"achievement_id", id_},
            {"title", title_},
            {"description", description_},
            {"category", ToString(category_)},
            {"rarity", static_cast<int>(rarity_)},
            {"unlocked", unlocked_},
            {"unlock_timestamp", unlockedAt_ ? json(FormatIso8601(*unlockedAt_)) : json(nullptr)},
            {"hidden", hidden_},
            {"prerequisite_achievements", prerequisites_},
            {"cosmic_significance", cosmicSignificance_ ? json(*cosmicSignificance_) : json(nullptr)},
            {"flavor_text", flavorText_ ? json(*flavorText_) : json(nullptr)}};
}

} // namespace eldritch
