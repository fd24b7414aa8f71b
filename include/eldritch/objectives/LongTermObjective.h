// include/eldritch/objectives/LongTermObjective.h
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "eldritch/objectives/Objective.h"

namespace eldritch {

// Campaign arc spanning sessions; no time limit by default.
//   phases 0.5, character growth 0.3, recurring themes 0.2
// renormalized over what is defined. Finishing the current phase fires its
// completion effects once and advances to the next phase.
class LongTermObjective : public Objective
{
public:
    static constexpr const char* kVariant = "LongTermObjective";

    struct Params
    {
        json campaignPhases = json::array();        // [{name, completion_effects}, ...]
        json characterGrowthGoals = json::object(); // {"mythos_entities": N}
        std::map<std::string, int> mythosKnowledgeLevels;
        std::vector<std::string>   recurringThemes;
        json persistentElements = json::object();
    };

    LongTermObjective(ObjectiveDef def, Params params, TimePoint createdAt);

    static std::unique_ptr<LongTermObjective> FromParams(const std::string& id, const json& params, TimePoint now);

    const char* variantName() const noexcept override { return kVariant; }

    int currentPhase() const noexcept { return currentPhase_; }
    std::size_t phaseCount() const noexcept { return phases_.size(); }
    double phaseProgress(int phase) const;
    std::optional<json> currentPhaseInfo() const;
    // Advances the current phase; phase completion is left to the next update.
    bool advancePhaseProgress(double advancement);

    const std::map<std::string, int>& mythosKnowledge() const noexcept { return mythosKnowledge_; }
    const json& worldStateChanges() const noexcept { return worldStateChanges_; }
    const std::map<std::string, int>& npcRelationships() const noexcept { return npcRelationships_; }

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    double computeProgress() const;
    void completeCurrentPhase(TimePoint now);
    void applyPhaseEffects(const json& effects, TimePoint now);

    json phases_;
    int  currentPhase_ = 0;
    std::map<int, double> phaseProgress_;

    json growthGoals_;
    std::map<std::string, int> mythosKnowledge_;

    std::vector<std::string>   themes_;
    std::map<std::string, int> themeEncounters_;

    json worldStateChanges_ = json::array();
    std::map<std::string, int> npcRelationships_;
    json persistentElements_;
};

} // namespace eldritch
