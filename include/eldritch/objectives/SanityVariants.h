// include/eldritch/objectives/SanityVariants.h
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "eldritch/core/Rng.h"
#include "eldritch/objectives/SanityObjective.h"

namespace eldritch {

// Presentation and progression change with the investigator's sanity state.
class SanityDependentObjective : public SanityObjective
{
public:
    static constexpr const char* kVariant = "SanityDependentObjective";

    struct StateConfiguration
    {
        std::optional<std::string> titleSuffix;
        std::optional<std::string> descriptionOverride;
        std::optional<int>         priorityModifier;
        std::optional<double>      sanLossMultiplier;
        std::optional<int>         completionSanBonus;
    };

    struct Params
    {
        std::map<SanityState, StateConfiguration> stateConfigurations;
        std::optional<rng::Seed>                  seed; // entropy when unset
    };

    SanityDependentObjective(ObjectiveDef def, SanityParams sanity, Params params, TimePoint createdAt);

    static std::unique_ptr<SanityDependentObjective> FromParams(const std::string& id, const json& params, TimePoint now,
                                                        const SanityConfig& sanity = {});

    const char* variantName() const noexcept override { return kVariant; }

    std::optional<SanityState> configuredState() const noexcept { return configuredState_; }

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    void updateForSanityState(SanityState current);
    void applyPresentation(const StateConfiguration& cfg);
    bool progressForState(SanityState current, GameState& state, const std::string& actionType, TimePoint now);
    void applySanityEffects(SanityState current, GameState& state, TimePoint now);

    std::map<SanityState, StateConfiguration> configs_;
    std::optional<SanityState>                configuredState_;
    rng::Seed                                 seed_;
    rng::Pcg32                                rng_;
};

// Progress through cosmic revelations, paid for in SAN. Crossing a
// revelation threshold unlocks the matching insight level.
class CosmicInsightObjective : public SanityObjective
{
public:
    static constexpr const char* kVariant = "CosmicInsightObjective";

    struct Params
    {
        // Each entry may carry cosmic_knowledge_unlock, sanity_threshold_change
        // and special_ability_unlock.
        json                insightLevels = json::array();
        std::vector<double> revelationThresholds{0.25, 0.5, 0.75, 1.0};
        int                 sanityCostPerInsight = 3;
        int                 insightProtectionThreshold = 30;
    };

    CosmicInsightObjective(ObjectiveDef def, SanityParams sanity, Params params, TimePoint createdAt);

    static std::unique_ptr<CosmicInsightObjective> FromParams(const std::string& id, const json& params, TimePoint now,
                                                        const SanityConfig& sanity = {});

    const char* variantName() const noexcept override { return kVariant; }

    int currentInsightLevel() const noexcept { return insightLevel_; }
    // SAN cost of gaining `insightGain` at the given current SAN.
    int insightSanPenalty(double insightGain, int currentSan) const;

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    void checkInsightLevels(GameState& state);
    void triggerInsightLevel(std::size_t index, GameState& state);

    Params params_;
    int    insightLevel_ = 0;
};

// Progresses only while the investigator suffers specific madness, and
// faster when acting on it.
class MadnessObjective : public SanityObjective
{
public:
    static constexpr const char* kVariant = "MadnessObjective";

    struct Params
    {
        std::vector<MadnessType> requiredMadnessTypes;
        int                      minMadnessSeverity = 1;
        double                   madnessProgressMultiplier = 2.0;
        int                      sanityRecoveryOnCompletion = 5;
    };

    MadnessObjective(ObjectiveDef def, SanityParams sanity, Params params, TimePoint createdAt);

    static std::unique_ptr<MadnessObjective> FromParams(const std::string& id, const json& params, TimePoint now,
                                                        const SanityConfig& sanity = {});

    const char* variantName() const noexcept override { return kVariant; }

    bool canActivate(const GameState& state) const override;
    bool complete(GameState& state, TimePoint now) override;

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;

private:
    bool hasRequiredMadness(const GameState& state) const;
    bool madnessStateAppropriate(const GameState& state) const;

    Params params_;
};

} // namespace eldritch
