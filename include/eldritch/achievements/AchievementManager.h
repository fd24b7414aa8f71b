// include/eldritch/achievements/AchievementManager.h
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "eldritch/achievements/Achievement.h"
#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"

namespace eldritch {

// Catalogue of achievements evaluated against read-only snapshots:
//
//   game_data    : completed_objectives [{type,...}], events [{type,...}],
//                  completed_sequences [...], unlocked_achievements [...]
//   player_stats : flat numeric stats (sanity, cosmic_exposure, ...)
//
// Unlocking is idempotent and recorded in an append-only history.
class AchievementManager
{
public:
    // With `withDefaults`, the built-in catalogue is registered.
    explicit AchievementManager(bool withDefaults = true, Clock clock = SystemClockSource());

    AchievementManager(const AchievementManager&) = delete;
    AchievementManager& operator=(const AchievementManager&) = delete;

    // Replaces the definition of an achievement with the same id. An unlock
    // already earned under that id is kept.
    Achievement& addAchievement(Achievement achievement);

    const Achievement* get(const std::string& id) const;
    std::size_t size() const noexcept { return achievements_.size(); }

    // Newly unlocked achievements, in registration order.
    std::vector<const Achievement*> checkAll(const json& gameData, const json& playerStats);
    std::vector<const Achievement*> checkAll(const json& gameData, const json& playerStats, TimePoint now);

    // nullopt for an unknown id.
    std::optional<json> progress(const std::string& id, const json& gameData, const json& playerStats) const;

    std::vector<const Achievement*> byCategory(AchievementCategory category, bool includeHidden = false) const;
    std::vector<const Achievement*> unlockedAchievements() const;
    const std::set<std::string>& unlockedIds() const noexcept { return unlockedIds_; }
    const json& unlockHistory() const noexcept { return unlockHistory_; }

    json statistics() const;
    // Rarity-weighted share of the catalogue unlocked, in percent.
    double completionPercentage() const;
    // {achievement_id, title, rarity} or null.
    json rarestUnlocked() const;

    json toJson() const;
    bool loadFromJson(const json& doc, std::string* outError = nullptr);
    bool saveToFile(const std::filesystem::path& path, std::string* outError = nullptr) const;
    bool loadFromFile(const std::filesystem::path& path, std::string* outError = nullptr);

private:
    Achievement* find(const std::string& id);

    Clock                                                     clock_;
    std::vector<std::unique_ptr<Achievement>>                 achievements_; // registration order
    std::map<AchievementCategory, std::vector<std::string>>   byCategory_;
    std::set<std::string>                                     unlockedIds_;
    json                                                      unlockHistory_ = json::array();
};

// Registers the built-in Cthulhu catalogue (eleven achievements).
void RegisterDefaultAchievements(AchievementManager& manager);

} // namespace eldritch
