// include/eldritch/objectives/Objective.h
#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"
#include "eldritch/objectives/ObjectiveTypes.h"

namespace eldritch {

// Abstract objective state machine.
//
//   Inactive -> Active -> InProgress -> {Completed, Failed, Expired, Abandoned}
//   Active <-> Suspended
//
// Concrete variants implement updateProgress(). Once a terminal status is
// reached, only the event log may still change.
class Objective
{
public:
    using RewardHandler      = std::function<void(const Reward&, GameState&)>;
    using ConsequenceHandler = std::function<void(const Consequence&, GameState&)>;

    Objective(ObjectiveDef def, TimePoint createdAt);
    virtual ~Objective() = default;

    Objective(const Objective&) = delete;
    Objective& operator=(const Objective&) = delete;

    // Registry key of the concrete class ("ImmediateObjective", ...).
    [[nodiscard]] virtual const char* variantName() const noexcept = 0;

    // ----- identity / definition -----
    const std::string& id() const noexcept { return def_.id; }
    const std::string& uuid() const noexcept { return uuid_; }
    std::string title() const;
    std::string description() const;
    ObjectiveType type() const noexcept { return def_.type; }
    ObjectiveScope scope() const noexcept { return def_.scope; }
    const ObjectiveDef& def() const noexcept { return def_; }

    ObjectivePriority basePriority() const noexcept { return def_.priority; }
    // Base priority with every modifier delta applied, clamped to 1..6.
    ObjectivePriority priority() const noexcept;

    std::optional<Seconds> baseTimeLimit() const noexcept { return def_.timeLimit; }
    // Base limit scaled and shortened by modifiers, never below one minute.
    std::optional<Seconds> timeLimit() const;

    const std::string& parent() const noexcept { return def_.parent; }
    const std::vector<std::string>& children() const noexcept { return def_.children; }
    void setParent(std::string parentId) { def_.parent = std::move(parentId); }
    void addChild(const std::string& childId);
    void removeChild(const std::string& childId);

    json& metadata() noexcept { return def_.metadata; }
    const json& metadata() const noexcept { return def_.metadata; }

    // ----- runtime state -----
    ObjectiveStatus status() const noexcept { return status_; }
    double progress() const noexcept { return progress_; }
    TimePoint createdAt() const noexcept { return createdAt_; }
    std::optional<TimePoint> activatedAt() const noexcept { return activatedAt_; }
    std::optional<TimePoint> completedAt() const noexcept { return completedAt_; }
    TimePoint lastUpdate() const noexcept { return lastUpdate_; }
    int attemptCount() const noexcept { return attemptCount_; }
    const std::deque<ObjectiveEvent>& events() const noexcept { return events_; }

    bool isActive() const noexcept;
    bool isCompleted() const noexcept { return status_ == ObjectiveStatus::Completed; }
    bool isFailed() const noexcept;
    bool isTerminal() const noexcept { return IsTerminal(status_); }
    bool isExpired(TimePoint now) const;
    // nullopt without a limit or before activation; clamped at zero.
    std::optional<Seconds> timeRemaining(TimePoint now) const;

    // ----- transitions -----
    virtual bool canActivate(const GameState& state) const;
    bool activate(const GameState& state, TimePoint now);
    bool startProgress(TimePoint now);
    virtual bool complete(GameState& state, TimePoint now);
    bool fail(GameState& state, const std::string& reason, TimePoint now);
    bool abandon(TimePoint now);
    bool suspend(TimePoint now);
    bool resume(TimePoint now);

    // Per-turn entry point: expiry, then progress, then completion.
    // Returns true when anything observable changed.
    bool update(GameState& state, const ActionData& action, TimePoint now);

    // All completion conditions hold, or progress >= 1 when none are defined.
    virtual bool checkCompletion(const GameState& state) const;

    // ----- modifiers -----
    // Replaces any modifier already registered under the same source.
    // Terminal objectives keep their modifiers as they are: both calls are
    // no-ops and report false / 0.
    bool applyModifier(ObjectiveModifier modifier);
    std::size_t removeModifiers(const std::string& source);
    bool hasModifier(const std::string& source) const;
    const std::vector<ObjectiveModifier>& modifiers() const noexcept { return modifiers_; }

    void setRewardHandler(RewardHandler handler) { rewardHandler_ = std::move(handler); }
    void setConsequenceHandler(ConsequenceHandler handler) { consequenceHandler_ = std::move(handler); }

    // ----- views / persistence -----
    virtual json displayInfo(TimePoint now) const;

    // Contract fields plus "variant", "definition", "state" and "modifiers".
    json toDict() const;
    // Parameter document accepted by this variant's registry factory.
    json definition() const;
    // Re-applies runtime state written by toDict(). The definition must
    // already match (objects are rebuilt through the registry first).
    void restore(const json& dict);

    std::string toString() const;

protected:
    virtual bool updateProgress(GameState& state, const ActionData& action, TimePoint now) = 0;

    // Variant hooks for toDict()/restore() and the definition document.
    virtual void writeDefinition(json& params) const { (void)params; }
    virtual void saveState(json& state) const { (void)state; }
    virtual void restoreState(const json& state) { (void)state; }

    // Clamped to [0,1]; ignored once terminal.
    void setProgress(double value) noexcept;
    void logEvent(const std::string& type, json data = json::object());

    std::vector<std::string> applyRewards(GameState& state);
    std::vector<std::string> applyConsequences(GameState& state);

    void setTitleSuffix(std::string suffix) { titleSuffix_ = std::move(suffix); }
    void setDescriptionOverride(std::string text) { descriptionOverride_ = std::move(text); }

    TimePoint currentTime() const noexcept { return lastUpdate_; }

    // Products of the matching factor over the modifier stack.
    double milestoneScale() const;
    double sanRiskScale() const;

    // Called after the modifier stack changes.
    virtual void onModifiersChanged() {}

private:
    json captureRelevantState(const GameState& state) const;

    ObjectiveDef def_;
    std::string   uuid_;

    ObjectiveStatus          status_ = ObjectiveStatus::Inactive;
    double                   progress_ = 0.0;
    TimePoint                createdAt_{};
    std::optional<TimePoint> activatedAt_;
    std::optional<TimePoint> completedAt_;
    TimePoint                lastUpdate_{};
    int                      attemptCount_ = 0;

    std::deque<ObjectiveEvent>     events_;
    std::vector<ObjectiveModifier> modifiers_;

    std::string titleSuffix_;
    std::string descriptionOverride_;

    RewardHandler      rewardHandler_;
    ConsequenceHandler consequenceHandler_;
};

[[nodiscard]] json EventToJson(const ObjectiveEvent& e, const std::string& objectiveId);
[[nodiscard]] ObjectiveEvent EventFromJson(const json& j);

} // namespace eldritch
