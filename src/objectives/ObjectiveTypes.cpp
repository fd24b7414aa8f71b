// src/objectives/ObjectiveTypes.cpp
#include "eldritch/objectives/ObjectiveTypes.h"

#include "eldritch/core/Errors.h"
#include "eldritch/logging/Log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <utility>

namespace eldritch {

namespace {

template <typename E, std::size_t N>
struct NameTable
{
    std::array<std::pair<E, const char*>, N> entries;

    const char* name(E v) const noexcept
    {
        for (const auto& e : entries)
            if (e.first == v)
                return e.second;
        return "unknown";
    }

    std::optional<E> parse(std::string_view s) const noexcept
    {
        for (const auto& e : entries)
            if (s == e.second)
                return e.first;
        return std::nullopt;
    }
};

constexpr NameTable<ObjectiveStatus, 8> kStatusNames{{{
    {ObjectiveStatus::Inactive,   "inactive"},
    {ObjectiveStatus::Active,     "active"},
    {ObjectiveStatus::InProgress, "in_progress"},
    {ObjectiveStatus::Completed,  "completed"},
    {ObjectiveStatus::Failed,     "failed"},
    {ObjectiveStatus::Expired,    "expired"},
    {ObjectiveStatus::Suspended,  "suspended"},
    {ObjectiveStatus::Abandoned,  "abandoned"},
}}};

constexpr NameTable<ObjectiveType, 10> kTypeNames{{{
    {ObjectiveType::Exploration,   "exploration"},
    {ObjectiveType::Investigation, "investigation"},
    {ObjectiveType::Social,        "social"},
    {ObjectiveType::Survival,      "survival"},
    {ObjectiveType::Knowledge,     "knowledge"},
    {ObjectiveType::Ritual,        "ritual"},
    {ObjectiveType::Escape,        "escape"},
    {ObjectiveType::Confrontation, "confrontation"},
    {ObjectiveType::Protection,    "protection"},
    {ObjectiveType::Revelation,    "revelation"},
}}};

constexpr NameTable<ObjectiveScope, 5> kScopeNames{{{
    {ObjectiveScope::Immediate, "immediate"},
    {ObjectiveScope::ShortTerm, "short_term"},
    {ObjectiveScope::MidTerm,   "mid_term"},
    {ObjectiveScope::LongTerm,  "long_term"},
    {ObjectiveScope::Meta,      "meta"},
}}};

constexpr NameTable<RewardType, 10> kRewardNames{{{
    {RewardType::None,              "none"},
    {RewardType::Knowledge,         "knowledge"},
    {RewardType::SkillImprovement,  "skill_improvement"},
    {RewardType::Item,              "item"},
    {RewardType::Alliance,          "alliance"},
    {RewardType::Safety,            "safety"},
    {RewardType::SanityRestoration, "sanity_restoration"},
    {RewardType::Revelation,        "revelation"},
    {RewardType::Survival,          "survival"},
    {RewardType::CosmicInsight,     "cosmic_insight"},
}}};

constexpr NameTable<FailureConsequence, 10> kConsequenceNames{{{
    {FailureConsequence::None,            "none"},
    {FailureConsequence::SanLoss,         "san_loss"},
    {FailureConsequence::HpLoss,          "hp_loss"},
    {FailureConsequence::ResourceLoss,    "resource_loss"},
    {FailureConsequence::TimePressure,    "time_pressure"},
    {FailureConsequence::NewThreat,       "new_threat"},
    {FailureConsequence::RevelationLost,  "revelation_lost"},
    {FailureConsequence::NpcDeath,        "npc_death"},
    {FailureConsequence::Escalation,      "escalation"},
    {FailureConsequence::CosmicAttention, "cosmic_attention"},
}}};

std::optional<ObjectivePriority> ParsePriorityName(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trivial")  return ObjectivePriority::Trivial;
    if (s == "low")      return ObjectivePriority::Low;
    if (s == "normal")   return ObjectivePriority::Normal;
    if (s == "high")     return ObjectivePriority::High;
    if (s == "critical") return ObjectivePriority::Critical;
    if (s == "cosmic")   return ObjectivePriority::Cosmic;
    return std::nullopt;
}

template <typename T>
std::vector<T> ReadArray(const json& params, const char* key)
{
    std::vector<T> out;
    const json* arr = Find(params, key);
    if (!arr || !arr->is_array())
        return out;
    for (const auto& item : *arr)
        out.push_back(item.get<T>());
    return out;
}

std::vector<Condition> ReadConditions(const json& params, const char* key)
{
    std::vector<Condition> out;
    const json* arr = Find(params, key);
    if (!arr || !arr->is_array())
        return out;
    for (const auto& item : *arr)
        out.push_back(ConditionFromJson(item));
    return out;
}

} // namespace

const char* ToString(ObjectiveStatus s) noexcept    { return kStatusNames.name(s); }
const char* ToString(ObjectiveType t) noexcept      { return kTypeNames.name(t); }
const char* ToString(ObjectiveScope s) noexcept     { return kScopeNames.name(s); }
const char* ToString(RewardType t) noexcept         { return kRewardNames.name(t); }
const char* ToString(FailureConsequence c) noexcept { return kConsequenceNames.name(c); }

std::optional<ObjectiveStatus> ParseObjectiveStatus(std::string_view s) noexcept { return kStatusNames.parse(s); }
std::optional<ObjectiveType> ParseObjectiveType(std::string_view s) noexcept { return kTypeNames.parse(s); }
std::optional<ObjectiveScope> ParseObjectiveScope(std::string_view s) noexcept { return kScopeNames.parse(s); }
std::optional<RewardType> ParseRewardType(std::string_view s) noexcept { return kRewardNames.parse(s); }
std::optional<FailureConsequence> ParseFailureConsequence(std::string_view s) noexcept { return kConsequenceNames.parse(s); }

ObjectivePriority ClampPriority(int value) noexcept
{
    return static_cast<ObjectivePriority>(std::clamp(value, 1, 6));
}

bool IsTerminal(ObjectiveStatus s) noexcept
{
    switch (s)
    {
    case ObjectiveStatus::Completed:
    case ObjectiveStatus::Failed:
    case ObjectiveStatus::Expired:
    case ObjectiveStatus::Abandoned:
        return true;
    default:
        return false;
    }
}

// ========================= Rewards & consequences ============================

std::string Reward::toString() const
{
    if (!description.empty())
        return std::string(ToString(type)) + ": " + description;
    return std::string(ToString(type)) + " (" + std::to_string(value) + ")";
}

std::string Consequence::toString() const
{
    if (!description.empty())
        return std::string(ToString(type)) + ": " + description;
    return std::string(ToString(type)) + " (severity " + std::to_string(severity) + ")";
}

void to_json(json& j, const Reward& r)
{
    j = json{{"type", ToString(r.type)}, {"value", r.value},
             {"description", r.description}, {"metadata", r.metadata}};
}

void from_json(const json& j, Reward& r)
{
    const auto typeName = GetOr<std::string>(j, "type", "none");
    const auto type = ParseRewardType(typeName);
    if (!type)
        throw ObjectiveManagerError("Unknown reward type: " + typeName);
    r.type        = *type;
    r.value       = GetOr(j, "value", 0);
    r.description = GetOr<std::string>(j, "description", "");
    r.metadata    = GetOr(j, "metadata", json::object());
}

void to_json(json& j, const Consequence& c)
{
    j = json{{"type", ToString(c.type)}, {"severity", c.severity},
             {"description", c.description}, {"metadata", c.metadata}};
}

void from_json(const json& j, Consequence& c)
{
    const auto typeName = GetOr<std::string>(j, "type", "none");
    const auto type = ParseFailureConsequence(typeName);
    if (!type)
        throw ObjectiveManagerError("Unknown consequence type: " + typeName);
    c.type        = *type;
    c.severity    = std::clamp(GetOr(j, "severity", 1), 1, 5);
    c.description = GetOr<std::string>(j, "description", "");
    c.metadata    = GetOr(j, "metadata", json::object());
}

namespace rewards {
Reward Knowledge()   { return {RewardType::Knowledge, 1, "Gain insight into the mythos", json::object()}; }
Reward Survival()    { return {RewardType::Survival, 1, "Successfully survive the encounter", json::object()}; }
Reward SanityMinor() { return {RewardType::SanityRestoration, 1, "Restore 1d3 SAN", json::object()}; }
Reward SanityMajor() { return {RewardType::SanityRestoration, 2, "Restore 1d6 SAN", json::object()}; }
} // namespace rewards

namespace consequences {
Consequence SanLossMinor()    { return {FailureConsequence::SanLoss, 1, "Lose 1d3 SAN", json::object()}; }
Consequence SanLossMajor()    { return {FailureConsequence::SanLoss, 3, "Lose 1d6 SAN", json::object()}; }
Consequence EscalationMinor() { return {FailureConsequence::Escalation, 1, "Situation becomes more dangerous", json::object()}; }
Consequence CosmicAttention() { return {FailureConsequence::CosmicAttention, 5, "Something vast and terrible notices you", json::object()}; }
} // namespace consequences

// ================================ Conditions =================================

bool Condition::evaluate(const GameState& state) const
{
    if (check)
    {
        try
        {
            return check(state, requiredValue, metadata);
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Error evaluating condition {}: {}", id, e.what());
            return false;
        }
        catch (...)
        {
            logsys::get()->error("Error evaluating condition {}: unknown exception", id);
            return false;
        }
    }

    const json* v = Find(state, id.c_str());
    return v && *v == requiredValue;
}

Condition Condition::basic(std::string conditionId, std::string desc, json required)
{
    Condition c;
    c.id = std::move(conditionId);
    c.description = std::move(desc);
    c.requiredValue = std::move(required);
    c.kind = "equals";
    return c;
}

Condition Condition::location(const std::string& locationName)
{
    return basic("current_location", "Must be at " + locationName, locationName);
}

Condition Condition::item(const std::string& itemName)
{
    Condition c;
    c.id = "has_item";
    c.description = "Must have " + itemName;
    c.requiredValue = itemName;
    c.kind = "item";
    c.check = [](const GameState& state, const json& required, const json&) {
        const json* inv = Find(state, "inventory");
        return inv && required.is_string() && ArrayContains(*inv, required.get<std::string>());
    };
    return c;
}

Condition Condition::sanityAtLeast(int minSan)
{
    Condition c;
    c.id = "sanity_check";
    c.description = "Must have at least " + std::to_string(minSan) + " SAN";
    c.requiredValue = minSan;
    c.kind = "sanity_at_least";
    c.check = [](const GameState& state, const json& required, const json&) {
        return GetOr(state, "sanity", 0) >= required.get<int>();
    };
    return c;
}

Condition Condition::custom(std::string conditionId, std::string desc, CheckFn fn, json required)
{
    Condition c;
    c.id = std::move(conditionId);
    c.description = std::move(desc);
    c.requiredValue = std::move(required);
    c.kind = "custom";
    c.check = std::move(fn);
    return c;
}

void to_json(json& j, const Condition& c)
{
    j = json{{"id", c.id}, {"description", c.description}, {"required_value", c.requiredValue},
             {"kind", c.kind}, {"metadata", c.metadata}};
}

Condition ConditionFromJson(const json& j)
{
    const auto kind = GetOr<std::string>(j, "kind", "equals");
    const auto id = GetOr<std::string>(j, "id", "");
    const json required = j.is_object() && j.contains("required_value") ? j.at("required_value") : json(nullptr);

    Condition c;
    if (kind == "item" && required.is_string())
        c = Condition::item(required.get<std::string>());
    else if (kind == "sanity_at_least" && required.is_number())
        c = Condition::sanityAtLeast(required.get<int>());
    else if (kind == "custom")
        c = Condition::custom(id, "", [](const GameState&, const json&, const json&) { return false; }, required);
    else
        c = Condition::basic(id, "", required);

    if (!id.empty())
        c.id = id;
    const auto desc = GetOr<std::string>(j, "description", "");
    if (!desc.empty())
        c.description = desc;
    c.metadata = GetOr(j, "metadata", json::object());
    return c;
}

// ================================= Modifiers =================================

void to_json(json& j, const ObjectiveModifier& m)
{
    j = json{{"source", m.source},
             {"priority_delta", m.priorityDelta},
             {"time_pressure_minutes", m.timePressureMinutes},
             {"time_limit_scale", m.timeLimitScale},
             {"added_required_actions", m.addedRequiredActions},
             {"milestone_scale", m.milestoneScale},
             {"san_risk_scale", m.sanRiskScale}};
}

void from_json(const json& j, ObjectiveModifier& m)
{
    m.source               = GetOr<std::string>(j, "source", "");
    m.priorityDelta        = GetOr(j, "priority_delta", 0);
    m.timePressureMinutes  = GetOr(j, "time_pressure_minutes", 0.0);
    m.timeLimitScale       = GetOr(j, "time_limit_scale", 1.0);
    m.addedRequiredActions = GetOr(j, "added_required_actions", std::vector<std::string>{});
    m.milestoneScale       = GetOr(j, "milestone_scale", 1.0);
    m.sanRiskScale         = GetOr(j, "san_risk_scale", 1.0);
}

// ================================= Definition =================================

ObjectiveDef DefFromParams(const std::string& id, const json& params, ObjectiveScope scope)
{
    ObjectiveDef def;
    def.id = id;
    def.scope = scope;
    def.title = GetOr<std::string>(params, "title", id);
    def.description = GetOr<std::string>(params, "description", "");

    if (const json* t = Find(params, "objective_type"); t && t->is_string())
    {
        const auto type = ParseObjectiveType(t->get<std::string>());
        if (!type)
            throw ObjectiveManagerError("Unknown objective type: " + t->get<std::string>());
        def.type = *type;
    }

    if (const json* p = Find(params, "priority"))
    {
        if (p->is_number())
            def.priority = ClampPriority(p->get<int>());
        else if (p->is_string())
        {
            const auto prio = ParsePriorityName(p->get<std::string>());
            if (!prio)
                throw ObjectiveManagerError("Unknown priority: " + p->get<std::string>());
            def.priority = *prio;
        }
    }

    if (const json* tl = Find(params, "time_limit"))
    {
        def.timeLimitSet = true;
        if (tl->is_number())
            def.timeLimit = Seconds(static_cast<long long>(tl->get<double>()));
    }

    def.activationConditions = ReadConditions(params, "activation_conditions");
    def.completionConditions = ReadConditions(params, "completion_conditions");
    def.rewards = ReadArray<Reward>(params, "rewards");
    def.consequences = ReadArray<Consequence>(params, "failure_consequences");
    def.parent = GetOr<std::string>(params, "parent_objective", "");
    def.children = GetOr(params, "child_objectives", std::vector<std::string>{});
    def.metadata = GetOr(params, "metadata", json::object());
    return def;
}

json DefToParams(const ObjectiveDef& def)
{
    json j{
        {"title", def.title},
        {"description", def.description},
        {"objective_type", ToString(def.type)},
        {"priority", ToInt(def.priority)},
        {"time_limit", def.timeLimit ? json(def.timeLimit->count()) : json(nullptr)},
        {"activation_conditions", def.activationConditions},
        {"completion_conditions", def.completionConditions},
        {"rewards", def.rewards},
        {"failure_consequences", def.consequences},
        {"child_objectives", def.children},
        {"metadata", def.metadata},
    };
    j["parent_objective"] = def.parent.empty() ? json(nullptr) : json(def.parent);
    return j;
}

ObjectiveDef WithScopeDefaults(ObjectiveDef def, ObjectiveScope scope,
                                std::optional<Seconds> defaultLimit)
{
    def.scope = scope;
    if (!def.timeLimitSet)
    {
        def.timeLimit = defaultLimit;
        def.timeLimitSet = true;
    }
    return def;
}

} // namespace eldritch
