// include/eldritch/objectives/ShortTermObjective.h
#pragma once

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "eldritch/objectives/Objective.h"

namespace eldritch {

// A single scene: required discoveries plus a milestone counter.
//   progress = 0.6 * discoveries + 0.4 * milestones
// with the present term taking the full weight when the other has no
// denominator. Progress ramps a narrative tension value for listeners.
class ShortTermObjective : public Objective
{
public:
    static constexpr const char* kVariant = "ShortTermObjective";

    struct Params
    {
        int                      milestoneCount = 3;
        std::vector<std::string> requiredDiscoveries;
        std::vector<std::string> subObjectives;
        json                     sceneContext = json::object();
        bool                     tensionRampEnabled = true;
        double                   initialTension = 1.0;
        double                   maxTension = 3.0;
    };

    using TensionCallback = std::function<void(double tension, double progress)>;

    ShortTermObjective(ObjectiveDef def, Params params, TimePoint createdAt);

    static std::unique_ptr<ShortTermObjective> FromParams(const std::string& id, const json& params, TimePoint now);

    const char* variantName() const noexcept override { return kVariant; }

    // Base count scaled by the modifier stack: a shrinking scale keeps at
    // least one milestone.
    int milestoneCount() const;
    int baseMilestoneCount() const noexcept { return milestoneCount_; }
    int milestonesCompleted() const;
    void setMilestoneCount(int count);
    bool addMilestone();

    const std::set<std::string>& requiredDiscoveries() const noexcept { return requiredDiscoveries_; }
    const std::set<std::string>& discoveriesMade() const noexcept { return discoveriesMade_; }
    void addDiscovery(const std::string& discovery);

    double tension() const noexcept { return tension_; }
    void addTensionCallback(TensionCallback cb) { tensionCallbacks_.push_back(std::move(cb)); }

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;
    void onModifiersChanged() override;

private:
    double computeProgress() const;
    void updateTension();

    int milestoneCount_;
    int milestonesCompleted_ = 0;
    std::set<std::string> requiredDiscoveries_;
    std::set<std::string> discoveriesMade_;
    std::vector<std::string> subObjectives_;
    json sceneContext_;

    bool   tensionRampEnabled_;
    double initialTension_;
    double maxTension_;
    double tension_;
    std::vector<TensionCallback> tensionCallbacks_;
};

} // namespace eldritch
