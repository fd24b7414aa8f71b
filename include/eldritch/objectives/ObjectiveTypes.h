// include/eldritch/objectives/ObjectiveTypes.h
#pragma once
/*
    ObjectiveTypes.h - Objective data model
    ---------------------------------------
    Value types shared by every objective variant and by the manager:
      - Status / Priority / Type / Scope enums (+ wire strings)
      - Reward / Consequence (+ predefined values)
      - Condition (+ factories)
      - ObjectiveEvent, ObjectiveModifier
      - ObjectiveDef (+ Builder)

    The state machine lives in Objective.h; concrete variants in the
    *Objective.h headers next to it.
*/

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"

// =========================== Compile-time configuration =======================

#ifndef ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY
  // Per-objective event log; older entries are dropped.
  #define ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY 50
#endif

#ifndef ELDRITCH_OBJECTIVE_SERIALIZED_EVENTS
  // Number of trailing events written by toDict().
  #define ELDRITCH_OBJECTIVE_SERIALIZED_EVENTS 10
#endif

#ifndef ELDRITCH_RECENT_EVENT_CAPACITY
  #define ELDRITCH_RECENT_EVENT_CAPACITY 100
#endif

namespace eldritch {

// ================================ Core enums =================================

enum class ObjectiveStatus
{
    Inactive,
    Active,
    InProgress,
    Completed,
    Failed,
    Expired,
    Suspended,
    Abandoned
};

enum class ObjectivePriority : int
{
    Trivial  = 1,
    Low      = 2,
    Normal   = 3,
    High     = 4,
    Critical = 5,
    Cosmic   = 6
};

enum class ObjectiveType
{
    Exploration,
    Investigation,
    Social,
    Survival,
    Knowledge,
    Ritual,
    Escape,
    Confrontation,
    Protection,
    Revelation
};

enum class ObjectiveScope
{
    Immediate,
    ShortTerm,
    MidTerm,
    LongTerm,
    Meta
};

enum class RewardType
{
    None,
    Knowledge,
    SkillImprovement,
    Item,
    Alliance,
    Safety,
    SanityRestoration,
    Revelation,
    Survival,
    CosmicInsight
};

enum class FailureConsequence
{
    None,
    SanLoss,
    HpLoss,
    ResourceLoss,
    TimePressure,
    NewThreat,
    RevelationLost,
    NpcDeath,
    Escalation,
    CosmicAttention
};

[[nodiscard]] const char* ToString(ObjectiveStatus s) noexcept;
[[nodiscard]] const char* ToString(ObjectiveType t) noexcept;
[[nodiscard]] const char* ToString(ObjectiveScope s) noexcept;
[[nodiscard]] const char* ToString(RewardType t) noexcept;
[[nodiscard]] const char* ToString(FailureConsequence c) noexcept;

[[nodiscard]] std::optional<ObjectiveStatus>    ParseObjectiveStatus(std::string_view s) noexcept;
[[nodiscard]] std::optional<ObjectiveType>      ParseObjectiveType(std::string_view s) noexcept;
[[nodiscard]] std::optional<ObjectiveScope>     ParseObjectiveScope(std::string_view s) noexcept;
[[nodiscard]] std::optional<RewardType>         ParseRewardType(std::string_view s) noexcept;
[[nodiscard]] std::optional<FailureConsequence> ParseFailureConsequence(std::string_view s) noexcept;

[[nodiscard]] ObjectivePriority ClampPriority(int value) noexcept;
[[nodiscard]] inline int ToInt(ObjectivePriority p) noexcept { return static_cast<int>(p); }

[[nodiscard]] bool IsTerminal(ObjectiveStatus s) noexcept;

// ========================= Rewards & consequences ============================

struct Reward
{
    RewardType  type = RewardType::None;
    int         value = 0;
    std::string description;
    json        metadata = json::object();

    // "knowledge: Gain insight into the mythos" or "knowledge (1)".
    [[nodiscard]] std::string toString() const;
};

struct Consequence
{
    FailureConsequence type = FailureConsequence::None;
    int                severity = 1; // 1..5
    std::string        description;
    json               metadata = json::object();

    [[nodiscard]] std::string toString() const;
};

void to_json(json& j, const Reward& r);
void from_json(const json& j, Reward& r);
void to_json(json& j, const Consequence& c);
void from_json(const json& j, Consequence& c);

namespace rewards {
[[nodiscard]] Reward Knowledge();
[[nodiscard]] Reward Survival();
[[nodiscard]] Reward SanityMinor();
[[nodiscard]] Reward SanityMajor();
} // namespace rewards

namespace consequences {
[[nodiscard]] Consequence SanLossMinor();
[[nodiscard]] Consequence SanLossMajor();
[[nodiscard]] Consequence EscalationMinor();
[[nodiscard]] Consequence CosmicAttention();
} // namespace consequences

// ================================ Conditions =================================

struct Condition
{
    using CheckFn = std::function<bool(const GameState&, const json& required, const json& metadata)>;

    std::string id;
    std::string description;
    json        requiredValue;
    // Serializable tag so a condition survives a save/load round trip:
    // "equals" | "item" | "sanity_at_least" | "custom".
    std::string kind = "equals";
    CheckFn     check;
    json        metadata = json::object();

    // A check that throws counts as not satisfied.
    [[nodiscard]] bool evaluate(const GameState& state) const;

    // ---- Factories ----
    static Condition basic(std::string conditionId, std::string desc, json required);
    static Condition location(const std::string& locationName);
    static Condition item(const std::string& itemName);
    static Condition sanityAtLeast(int minSan);
    static Condition custom(std::string conditionId, std::string desc, CheckFn fn,
                            json required = nullptr);
};

// Custom conditions serialize with kind "custom" and come back as a check
// that is never satisfied.
void to_json(json& j, const Condition& c);
[[nodiscard]] Condition ConditionFromJson(const json& j);

// ============================ Events & modifiers =============================

struct ObjectiveEvent
{
    TimePoint       timestamp{};
    std::string     type;
    ObjectiveStatus status = ObjectiveStatus::Inactive;
    double          progress = 0.0;
    json            data = json::object();
};

// Read-time adjustment layered over an objective's base definition.
// Pushed by madness effects, difficulty adjustment and dynamic priorities;
// removed by source.
struct ObjectiveModifier
{
    std::string              source;
    int                      priorityDelta = 0;
    double                   timePressureMinutes = 0.0;
    double                   timeLimitScale = 1.0;
    std::vector<std::string> addedRequiredActions;
    // Read by the variants that carry milestones or a SAN risk level.
    double                   milestoneScale = 1.0;
    double                   sanRiskScale = 1.0;
};

void to_json(json& j, const ObjectiveModifier& m);
void from_json(const json& j, ObjectiveModifier& m);

// ================================= Definition =================================

// Everything the base Objective needs at construction.
struct ObjectiveDef
{
    std::string              id;
    std::string              title;
    std::string              description;
    ObjectiveType            type = ObjectiveType::Investigation;
    ObjectiveScope           scope = ObjectiveScope::Immediate;
    ObjectivePriority        priority = ObjectivePriority::Normal;
    std::optional<Seconds>   timeLimit;
    bool                     timeLimitSet = false; // true when the caller chose, even "none"
    std::vector<Condition>   activationConditions;
    std::vector<Condition>   completionConditions;
    std::vector<Reward>      rewards;
    std::vector<Consequence> consequences;
    std::string              parent;
    std::vector<std::string> children;
    json                     metadata = json::object();

    struct Builder;
};

struct ObjectiveDef::Builder
{
    ObjectiveDef def_;

    explicit Builder(std::string id) { def_.id = std::move(id); }
    Builder& title(std::string t) { def_.title = std::move(t); return *this; }
    Builder& description(std::string d) { def_.description = std::move(d); return *this; }
    Builder& type(ObjectiveType t) { def_.type = t; return *this; }
    Builder& scope(ObjectiveScope s) { def_.scope = s; return *this; }
    Builder& priority(ObjectivePriority p) { def_.priority = p; return *this; }
    Builder& timeLimit(Seconds s) { def_.timeLimit = s; def_.timeLimitSet = true; return *this; }
    Builder& noTimeLimit() { def_.timeLimit.reset(); def_.timeLimitSet = true; return *this; }
    Builder& activation(Condition c) { def_.activationConditions.push_back(std::move(c)); return *this; }
    Builder& completion(Condition c) { def_.completionConditions.push_back(std::move(c)); return *this; }
    Builder& reward(Reward r) { def_.rewards.push_back(std::move(r)); return *this; }
    Builder& consequence(Consequence c) { def_.consequences.push_back(std::move(c)); return *this; }
    Builder& parent(std::string p) { def_.parent = std::move(p); return *this; }
    Builder& child(std::string c) { def_.children.push_back(std::move(c)); return *this; }
    Builder& metadata(json m) { def_.metadata = std::move(m); return *this; }

    ObjectiveDef build() { return std::move(def_); }
};

// Reads the common objective parameters (title, description, objective_type,
// priority, time_limit seconds, conditions, rewards, consequences,
// parent_objective, child_objectives, metadata) from a parameter document.
// Unknown enum strings throw ObjectiveManagerError.
[[nodiscard]] ObjectiveDef DefFromParams(const std::string& id, const json& params, ObjectiveScope scope);
[[nodiscard]] json DefToParams(const ObjectiveDef& def);

// Forces `scope` and fills in `defaultLimit` unless the caller chose a limit.
[[nodiscard]] ObjectiveDef WithScopeDefaults(ObjectiveDef def, ObjectiveScope scope,
                                              std::optional<Seconds> defaultLimit);

} // namespace eldritch
