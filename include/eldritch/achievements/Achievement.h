// include/eldritch/achievements/Achievement.h
#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"

namespace eldritch {

enum class AchievementCategory
{
    Survival,
    Knowledge,
    Investigation,
    Social,
    Exploration,
    Horror,
    Mastery,
    Narrative,
    Meta,
    Secret
};

enum class AchievementRarity : int
{
    Common    = 1,
    Uncommon  = 2,
    Rare      = 3,
    Epic      = 4,
    Legendary = 5,
    Cosmic    = 6
};

enum class AchievementTrigger
{
    ObjectiveCompletion,
    StatThreshold,
    EventOccurrence,
    ConditionMet,
    TimeBased,
    SequenceCompletion
};

inline constexpr AchievementCategory kAllAchievementCategories[] = {
    AchievementCategory::Survival,  AchievementCategory::Knowledge, AchievementCategory::Investigation,
    AchievementCategory::Social,    AchievementCategory::Exploration, AchievementCategory::Horror,
    AchievementCategory::Mastery,   AchievementCategory::Narrative, AchievementCategory::Meta,
    AchievementCategory::Secret};

[[nodiscard]] const char* ToString(AchievementCategory c) noexcept;
[[nodiscard]] const char* ToString(AchievementTrigger t) noexcept;
[[nodiscard]] std::optional<AchievementCategory> ParseAchievementCategory(std::string_view s) noexcept;
[[nodiscard]] std::optional<AchievementTrigger> ParseAchievementTrigger(std::string_view s) noexcept;

struct AchievementReward
{
    std::string              title = "Recognition";
    std::string              description = "Achievement unlocked";
    std::vector<std::string> unlockContent;
    json                     statisticalBonus = json::object(); // name -> float
    std::vector<std::string> cosmeticUnlocks;
    std::vector<std::string> loreEntries;
};

void to_json(json& j, const AchievementReward& r);

// One AND-combined unlock rule. `op` is a comparison operator
// (eq/gt/gte/lt/lte/in/contains) for stat thresholds, or a trigger-specific
// mode: count/type_count for objective completion, occurred/count for events.
struct AchievementCriteria
{
    AchievementTrigger trigger = AchievementTrigger::StatThreshold;
    json               target;
    std::string        op = "eq";
    json               conditions = json::object(); // stat_name, event_type, condition_type...
    json               context = json::object();
};

void to_json(json& j, const AchievementCriteria& c);

// Compares `current` against `target` with one of eq/gt/gte/lt/lte/in/contains.
// Unknown operators and incomparable values are false.
[[nodiscard]] bool CompareValues(const json& current, const json& target, std::string_view op);

class Achievement
{
public:
    Achievement(std::string id,
                std::string title,
                std::string description,
                AchievementCategory category,
                AchievementRarity rarity,
                std::vector<AchievementCriteria> criteria,
                AchievementReward reward = {});

    // Optional attributes, set while building the catalogue.
    Achievement& setHidden(bool hidden) { hidden_ = hidden; return *this; }
    Achievement& setPrerequisites(std::vector<std::string> ids) { prerequisites_ = std::move(ids); return *this; }
    Achievement& setCosmicSignificance(std::string text) { cosmicSignificance_ = std::move(text); return *this; }
    Achievement& setFlavorText(std::string text) { flavorText_ = std::move(text); return *this; }

    const std::string& id() const noexcept { return id_; }
    const std::string& title() const noexcept { return title_; }
    const std::string& description() const noexcept { return description_; }
    AchievementCategory category() const noexcept { return category_; }
    AchievementRarity rarity() const noexcept { return rarity_; }
    const std::vector<AchievementCriteria>& criteria() const noexcept { return criteria_; }
    const AchievementReward& reward() const noexcept { return reward_; }
    bool hidden() const noexcept { return hidden_; }
    const std::vector<std::string>& prerequisites() const noexcept { return prerequisites_; }
    const std::optional<std::string>& cosmicSignificance() const noexcept { return cosmicSignificance_; }
    const std::optional<std::string>& flavorText() const noexcept { return flavorText_; }

    bool unlocked() const noexcept { return unlocked_; }
    const std::optional<TimePoint>& unlockedAt() const noexcept { return unlockedAt_; }
    const json& unlockContext() const noexcept { return unlockContext_; }

    // False once unlocked. Otherwise every prerequisite must be in `unlockedIds`
    // and every criterion must hold.
    bool checkUnlockConditions(const json& gameData, const json& playerStats,
                               const std::set<std::string>& unlockedIds) const;

    bool checkCriterion(const AchievementCriteria& c, const json& gameData, const json& playerStats) const;

    // No-op when already unlocked; returns whether this call unlocked it.
    bool unlock(TimePoint now, json context = json::object());

    // Restores a persisted unlock without re-stamping or logging.
    void restoreUnlock(std::optional<TimePoint> at, json context = json::object());

    // {unlocked, progress, met_criteria, total_criteria, next_criterion}.
    json progressInfo(const json& gameData, const json& playerStats) const;

    static std::string DescribeCriterion(const AchievementCriteria& c);

    json toDict() const;

private:
    std::string                      id_;
    std::string                      title_;
    std::string                      description_;
    AchievementCategory              category_;
    AchievementRarity                rarity_;
    std::vector<AchievementCriteria> criteria_;
    AchievementReward                reward_;
    bool                             hidden_ = false;
    std::vector<std::string>         prerequisites_;
    std::optional<std::string>       cosmicSignificance_;
    std::optional<std::string>       flavorText_;

    bool                     unlocked_ = false;
    std::optional<TimePoint> unlockedAt_;
    json                     unlockContext_ = json::object();
};

} // namespace eldritch
