// src/achievements/AchievementManager.cpp
#include "eldritch/achievements/AchievementManager.h"

#include "eldritch/io/AtomicFile.h"
#include "eldritch/logging/Log.h"

#include <algorithm>
#include <exception>

namespace eldritch {

namespace {

constexpr std::size_t kRecentUnlocks = 5;

json Breakdown(std::size_t total, std::size_t unlocked)
{
    return {{"total", total},
            {"unlocked", unlocked},
            {"unlock_rate", total ? static_cast<double>(unlocked) / static_cast<double>(total) : 0.0}};
}

} // namespace

AchievementManager::AchievementManager(bool withDefaults, Clock clock)
    : clock_(clock ? std::move(clock) : SystemClockSource())
{
    if (withDefaults)
        RegisterDefaultAchievements(*this);
    logsys::get()->debug("AchievementManager ready with {} achievements", achievements_.size());
}

Achievement& AchievementManager::addAchievement(Achievement achievement)
{
    const std::string id = achievement.id();
    if (Achievement* existing = find(id))
    {
        if (existing->unlocked() && !achievement.unlocked())
        {
            achievement.restoreUnlock(existing->unlockedAt(), existing->unlockContext());
            logsys::get()->debug("Achievement {} redefined; unlock kept", id);
        }

        auto& ids = byCategory_[existing->category()];
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        *existing = std::move(achievement);
        byCategory_[existing->category()].push_back(id);
        if (existing->unlocked())
            unlockedIds_.insert(id);
        else
            unlockedIds_.erase(id);
        return *existing;
    }

    achievements_.push_back(std::make_unique<Achievement>(std::move(achievement)));
    Achievement& added = *achievements_.back();
    byCategory_[added.category()].push_back(id);
    if (added.unlocked())
        unlockedIds_.insert(id);
    logsys::get()->debug("Added achievement: {}", added.title());
    return added;
}

Achievement* AchievementManager::find(const std::string& id)
{
    for (auto& a : achievements_)
        if (a->id() == id)
            return a.get();
    return nullptr;
}

const Achievement* AchievementManager::get(const std::string& id) const
{
    for (const auto& a : achievements_)
        if (a->id() == id)
            return a.get();
    return nullptr;
}

std::vector<const Achievement*> AchievementManager::checkAll(const json& gameData, const json& playerStats)
{
    return checkAll(gameData, playerStats, clock_());
}

std::vector<const Achievement*> AchievementManager::checkAll(const json& gameData, const json& playerStats,
                                                             TimePoint now)
{
    // Prerequisites may come from our own record or from the snapshot.
    std::set<std::string> known = unlockedIds_;
    if (const json* listed = Find(gameData, "unlocked_achievements"); listed && listed->is_array())
        for (const auto& v : *listed)
            if (v.is_string())
                known.insert(v.get<std::string>());

    std::vector<const Achievement*> newlyUnlocked;
    for (auto& a : achievements_)
    {
        if (!a->checkUnlockConditions(gameData, playerStats, known))
            continue;
        if (!a->unlock(now, gameData))
            continue;

        unlockedIds_.insert(a->id());
        known.insert(a->id());
        newlyUnlocked.push_back(a.get());

        unlockHistory_.push_back(json{{"achievement_id", a->id()},
                                  {"title", a->title()},
                                  {"timestamp", FormatIso8601(now)},
                                  {"rarity", static_cast<int>(a->rarity())},
                                  {"category", ToString(a->category())}});
    }
    return newlyUnlocked;
}

std::optional<json> AchievementManager::progress(const std::string& id, const json& gameData,
                                                 const json& playerStats) const
{
    const Achievement* a = get(id);
    if (!a)
        return std::nullopt;
    return a->progressInfo(gameData, playerStats);
}

std::vector<const Achievement*> AchievementManager::byCategory(AchievementCategory category, bool includeHidden) const
{
    std::vector<const Achievement*> out;
    auto it = byCategory_.find(category);
    if (it == byCategory_.end())
        return out;
    for (const auto& id : it->second)
    {
        const Achievement* a = get(id);
        if (a && (includeHidden || !a->hidden()))
            out.push_back(a);
    }
    return out;
}

std::vector<const Achievement*> AchievementManager::unlockedAchievements() const
{
    std::vector<const Achievement*> out;
    for (const auto& a : achievements_)
        if (a->unlocked())
            out.push_back(a.get());
    return out;
}

double AchievementManager::completionPercentage() const
{
    int total = 0, unlocked = 0;
    for (const auto& a : achievements_)
    {
        const int w = static_cast<int>(a->rarity());
        total += w;
        if (a->unlocked())
            unlocked += w;
    }
    return total > 0 ? 100.0 * unlocked / total : 0.0;
}

json AchievementManager::rarestUnlocked() const
{
    const Achievement* rarest = nullptr;
    for (const auto& a : achievements_)
        if (a->unlocked() && (!rarest || a->rarity() > rarest->rarity()))
            rarest = a.get();
    if (!rarest)
        return nullptr;
    return {{"achievement_id", rarest->id()},
            {"title", rarest->title()},
            {"rarity", static_cast<int>(rarest->rarity())}};
}

json AchievementManager::statistics() const
{
    json categories = json::object();
    for (AchievementCategory c : kAllAchievementCategories)
    {
        const auto visible = byCategory(c);
        const auto n = static_cast<std::size_t>(
            std::count_if(visible.begin(), visible.end(), [](const Achievement* a) { return a->unlocked(); }));
        categories[ToString(c)] = Breakdown(visible.size(), n);
    }

    json rarities = json::object();
    for (int r = static_cast<int>(AchievementRarity::Common); r <= static_cast<int>(AchievementRarity::Cosmic); ++r)
    {
        std::size_t total = 0, n = 0;
        for (const auto& a : achievements_)
        {
            if (static_cast<int>(a->rarity()) != r)
                continue;
            ++total;
            if (a->unlocked())
                ++n;
        }
        rarities[std::to_string(r)] = Breakdown(total, n);
    }

    json recent = json::array();
    const std::size_t from = unlockHistory_.size() > kRecentUnlocks ? unlockHistory_.size() - kRecentUnlocks : 0;
    for (std::size_t i = from; i < unlockHistory_.size(); ++i)
        recent.push_back(unlockHistory_[i]);

    const std::size_t unlockedCount = unlockedAchievements().size();
    return {{"total_achievements", achievements_.size()},
            {"unlocked_count", unlockedCount},
            {"overall_unlock_rate",
             achievements_.empty() ? 0.0 : static_cast<double>(unlockedCount) / achievements_.size()},
            {"category_breakdown", categories},
            {"rarity_breakdown", rarities},
            {"recent_unlocks", recent},
            {"rarest_unlocked", rarestUnlocked()},
            {"latest_unlock", unlockHistory_.empty() ? json(nullptr) : unlockHistory_.back()},
            {"completion_percentage", completionPercentage()}};
}

json AchievementManager::toJson() const
{
    json data = json::object();
    for (const auto& a : achievements_)
        if (a->unlocked())
            data[a->id()] = a->toDict();

    return {{"unlocked_achievements", json(unlockedIds_)},
            {"unlock_history", unlockHistory_},
            {"achievement_data", data},
            {"statistics", statistics()},
            {"save_timestamp", FormatIso8601(clock_())}};
}

bool AchievementManager::loadFromJson(const json& doc, std::string* outError)
{
    try
    {
        std::set<std::string> ids;
        if (const json* listed = Find(doc, "unlocked_achievements"); listed && listed->is_array())
            for (const auto& v : *listed)
                ids.insert(v.get<std::string>());

        json history = GetOr<json>(doc, "unlock_history", json::array());
        if (!history.is_array())
            history = json::array();

        const json* data = Find(doc, "achievement_data");
        if (data && data->is_object())
        {
            for (const auto& [id, entry] : data->items())
            {
                Achievement* a = find(id);
                if (!a)
                    continue;
                std::optional<TimePoint> at;
                if (const json* ts = Find(entry, "unlock_timestamp"); ts && ts->is_string())
                    at = ParseIso8601(ts->get<std::string>());
                a->restoreUnlock(at);
                ids.insert(id);
            }
        }

        for (const auto& id : ids)
            if (Achievement* a = find(id); a && !a->unlocked())
                a->restoreUnlock(std::nullopt);

        unlockedIds_ = std::move(ids);
        unlockHistory_ = std::move(history);
        return true;
    }
    catch (const std::exception& e)
    {
        logsys::get()->error("Failed to load achievement progress: {}", e.what());
        if (outError)
            *outError = e.what();
        return false;
    }
}

bool AchievementManager::saveToFile(const std::filesystem::path& path, std::string* outError) const
{
    std::string err;
    if (!io::write_atomic(path, toJson().dump(2), &err))
    {
        logsys::get()->error("Failed to save achievement progress: {}", err);
        if (outError)
            *outError = err;
        return false;
    }
    logsys::get()->info("Achievement progress saved to {}", path.string());
    return true;
}

bool AchievementManager::loadFromFile(const std::filesystem::path& path, std::string* outError)
{
    std::string bytes, err;
    if (!io::read_all(path, bytes, &err))
    {
        logsys::get()->error("Failed to load achievement progress: {}", err);
        if (outError)
            *outError = err;
        return false;
    }

    const json doc = json::parse(bytes, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        const std::string msg = "Invalid JSON in " + path.string();
        logsys::get()->error("Failed to load achievement progress: {}", msg);
        if (outError)
            *outError = msg;
        return false;
    }

    if (!loadFromJson(doc, outError))
        return false;
    logsys::get()->info("Achievement progress loaded from {}", path.string());
    return true;
}

} // namespace eldritch
