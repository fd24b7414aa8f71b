// include/eldritch/objectives/MidTermObjective.h
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "eldritch/objectives/Objective.h"

namespace eldritch {

// A whole scenario. Progress blends investigation branches (0.4), story
// beats (0.3), horror revelations (0.2) and skill challenges (0.1),
// renormalized over the terms that have source data.
class MidTermObjective : public Objective
{
public:
    static constexpr const char* kVariant = "MidTermObjective";

    struct CompletionPath
    {
        std::string name;
        // min_investigation_progress (number), required_revelations (array),
        // min_story_beat (integer).
        json requirements = json::object();
    };

    struct Params
    {
        std::map<std::string, double> investigationBranches;
        json                          storyBeats = json::array();
        std::map<std::string, int>    skillChallenges;
        double                        sanLossThreshold = 10.0;
        std::vector<std::string>      horrorRevelations;
        std::vector<CompletionPath>   completionPaths; // checked in order
    };

    using HorrorCallback = std::function<void(double accumulatedSanLoss, const GameState&)>;

    MidTermObjective(ObjectiveDef def, Params params, TimePoint createdAt);

    static std::unique_ptr<MidTermObjective> FromParams(const std::string& id, const json& params, TimePoint now);

    const char* variantName() const noexcept override { return kVariant; }

    const std::map<std::string, double>& investigationBranches() const noexcept { return branches_; }
    std::size_t currentBeatIndex() const noexcept { return currentBeat_; }
    std::optional<json> currentStoryBeat() const;
    double accumulatedSanLoss() const noexcept { return accumulatedSanLoss_; }
    double sanLossThreshold() const noexcept { return sanLossThreshold_; }
    const std::set<std::string>& revelationsUnlocked() const noexcept { return revelationsUnlocked_; }
    // Empty until a path's requirements are met; never changes afterwards.
    const std::string& activePath() const noexcept { return activePath_; }

    void addHorrorCallback(HorrorCallback cb) { horrorCallbacks_.push_back(std::move(cb)); }

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    double computeProgress() const;
    double averageBranchProgress() const;
    void triggerHorrorEscalation(const GameState& state);
    void checkCompletionPaths();
    bool pathRequirementsMet(const json& requirements) const;

    std::map<std::string, double> branches_;
    json                          storyBeats_;
    std::size_t                   currentBeat_ = 0;
    std::map<std::string, int>    skillChallenges_;
    std::map<std::string, int>    skillsTested_;

    double                   baseSanLossThreshold_;
    double                   sanLossThreshold_;
    double                   accumulatedSanLoss_ = 0.0;
    std::vector<std::string> horrorRevelations_;
    std::set<std::string>    revelationsUnlocked_;

    std::vector<CompletionPath> completionPaths_;
    std::string                 activePath_;

    std::vector<HorrorCallback> horrorCallbacks_;
};

} // namespace eldritch
