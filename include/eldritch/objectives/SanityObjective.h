// include/eldritch/objectives/SanityObjective.h
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "eldritch/core/Config.h"
#include "eldritch/objectives/Objective.h"

namespace eldritch {

// Derived every evaluation from the snapshot's SAN value; never cached.
enum class SanityState
{
    Stable,
    Stressed,
    Disturbed,
    Unhinged,
    Mad,
    TemporarilyInsane
};

enum class MadnessType
{
    Paranoia,
    Obsession,
    Phobia,
    Delusion,
    Compulsion,
    Amnesia,
    CosmicAwareness
};

[[nodiscard]] const char* ToString(SanityState s) noexcept;
[[nodiscard]] const char* ToString(MadnessType m) noexcept;
[[nodiscard]] std::optional<SanityState> ParseSanityState(std::string_view s) noexcept;
[[nodiscard]] std::optional<MadnessType> ParseMadnessType(std::string_view s) noexcept;

struct SanityThresholds
{
    int stableMin    = 70;
    int stressedMin  = 50;
    int disturbedMin = 30;
    int unhingedMin  = 10;

    static SanityThresholds FromConfig(const SanityConfig& cfg);
};

// "sanity", falling back to "san", then to `fallback`.
[[nodiscard]] int ReadSanity(const GameState& state, int fallback = 50);

// temporary_insanity overrides the SAN bands. A snapshot without SAN reads
// as `defaultSanity`.
[[nodiscard]] SanityState DeriveSanityState(const GameState& state, const SanityThresholds& t = {},
                                            int defaultSanity = 50);

struct MadnessEffect
{
    MadnessType              type = MadnessType::Paranoia;
    int                      severity = 1; // 1..5
    std::optional<double>    durationHours;
    std::vector<std::string> triggers;
    json                     behavioralChanges = json::object(); // written into the snapshot

    // Objective-side effect, pushed as modifier "madness:<type>".
    int                      priorityChange = 0;
    double                   timePressureMinutes = 0.0;
    std::vector<std::string> compulsions;
};

void to_json(json& j, const MadnessEffect& e);
void from_json(const json& j, MadnessEffect& e);

// Base for objectives coupled to the SAN system: SAN-state gated
// activation, risk calculation, audited SAN loss/gain and madness effects.
class SanityObjective : public Objective
{
public:
    struct SanityParams
    {
        SanityThresholds           thresholds;
        int                        defaultSanity = 50;
        int                        maxSanity = 99;
        std::optional<SanityState> requiredSanityState;
        int                        sanRiskLevel = 1; // 1..5
        int                        cosmicInsightRequired = 0;
        std::vector<MadnessEffect> madnessEffects;
        bool                       madnessProtection = false;
        int                        potentialSanGain = 0;
    };

    SanityObjective(ObjectiveDef def, SanityParams params, TimePoint createdAt);

    // Thresholds and SAN bounds start from `defaults`; "san_requirements"
    // overrides the thresholds.
    static SanityParams ReadSanityParams(const json& params, const SanityConfig& defaults = {});
    // "scope" from a parameter document, short_term when absent.
    static ObjectiveScope ReadScope(const json& params);

    bool canActivate(const GameState& state) const override;

    SanityState currentSanityState(const GameState& state) const;

    // base risk + state modifier, minus 2 under madness protection, in [1,10].
    int calculateSanRisk(const GameState& state) const;

    void applySanLoss(GameState& state, int loss, const std::string& reason, TimePoint now);
    void applySanGain(GameState& state, int gain, const std::string& reason, TimePoint now);

    int cumulativeSanLoss() const noexcept { return cumulativeSanLoss_; }
    const json& sanityEvents() const noexcept { return sanityEvents_; }
    // Base level scaled by the modifier stack: at least 1 when scaled down,
    // at most 5 when scaled up.
    int sanRiskLevel() const;
    int baseSanRiskLevel() const noexcept { return sanRiskLevel_; }
    void setSanRiskLevel(int level) noexcept;
    const SanityParams& sanityParams() const noexcept { return params_; }

    json displayInfo(TimePoint now) const override;

protected:
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    static constexpr std::size_t kSanityEventCapacity = ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY;

    // Oldest entries drop past kSanityEventCapacity.
    void recordSanityEvent(const json& event);
    void checkMadnessThreshold(GameState& state);
    bool shouldTriggerMadness(const MadnessEffect& effect, SanityState current, const GameState& state) const;
    void applyMadnessEffect(const MadnessEffect& effect, GameState& state);

    SanityParams params_;
    int          sanRiskLevel_;
    int          cumulativeSanLoss_ = 0;
    json         sanityEvents_ = json::array();
};

} // namespace eldritch
