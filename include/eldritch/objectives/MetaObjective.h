// include/eldritch/objectives/MetaObjective.h
#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "eldritch/objectives/Objective.h"

namespace eldritch {

// Cross-campaign progression; never has a time limit.
//
// unlock_criteria maps a content name to sub-predicates (min_campaigns,
// min_characters, min_playtime, required_patterns, mastery_level). A name
// is unlocked the first time all of them hold and is not re-checked.
class MetaObjective : public Objective
{
public:
    static constexpr const char* kVariant = "MetaObjective";

    struct Params
    {
        std::vector<std::string> campaignsParticipated;
        std::vector<std::string> charactersUsed;
        double                   totalPlaytimeHours = 0.0;
        std::map<std::string, std::map<std::string, int>> masteryCategories;
        std::vector<std::string> learnedPatterns;
        std::map<std::string, int> survivalStrategies;
        json                     unlockCriteria = json::object();
        std::vector<std::string> unlockedContent;
    };

    MetaObjective(ObjectiveDef def, Params params, TimePoint createdAt);

    static std::unique_ptr<MetaObjective> FromParams(const std::string& id, const json& params, TimePoint now);

    const char* variantName() const noexcept override { return kVariant; }

    const std::set<std::string>& campaignsParticipated() const noexcept { return campaigns_; }
    const std::set<std::string>& charactersUsed() const noexcept { return characters_; }
    double totalPlaytimeHours() const noexcept { return playtimeHours_; }
    const std::set<std::string>& learnedPatterns() const noexcept { return patterns_; }
    const std::set<std::string>& unlockedContent() const noexcept { return unlocked_; }

    void addUnlockCriteria(const std::string& name, json criteria);
    json masterySummary() const;

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    void checkContentUnlocks(TimePoint now);
    bool criteriaMet(const json& criteria) const;
    double computeProgress() const;

    std::set<std::string> campaigns_;
    std::set<std::string> characters_;
    double                playtimeHours_;
    std::map<std::string, std::map<std::string, int>> mastery_;
    std::set<std::string> patterns_;
    std::map<std::string, int> strategies_;
    json                  unlockCriteria_;
    std::set<std::string> unlocked_;
    json                  unlockHistory_ = json::array();
};

} // namespace eldritch
