// src/objectives/MetaObjective.cpp
#include "eldritch/objectives/MetaObjective.h"

#include <algorithm>

namespace eldritch {

namespace {

std::vector<std::string> ToVector(const std::set<std::string>& s)
{
    return {s.begin(), s.end()};
}

ObjectiveDef WithoutTimeLimit(ObjectiveDef def)
{
    def.timeLimit.reset();
    def.timeLimitSet = true;
    return def;
}

} // namespace

MetaObjective::MetaObjective(ObjectiveDef def, Params params, TimePoint createdAt)
    : Objective(WithScopeDefaults(WithoutTimeLimit(std::move(def)), ObjectiveScope::Meta, std::nullopt), createdAt)
    , campaigns_(params.campaignsParticipated.begin(), params.campaignsParticipated.end())
    , characters_(params.charactersUsed.begin(), params.charactersUsed.end())
    , playtimeHours_(params.totalPlaytimeHours)
    , mastery_(std::move(params.masteryCategories))
    , patterns_(params.learnedPatterns.begin(), params.learnedPatterns.end())
    , strategies_(std::move(params.survivalStrategies))
    , unlockCriteria_(params.unlockCriteria.is_object() ? std::move(params.unlockCriteria) : json::object())
    , unlocked_(params.unlockedContent.begin(), params.unlockedContent.end())
{
}

std::unique_ptr<MetaObjective> MetaObjective::FromParams(const std::string& id, const json& params, TimePoint now)
{
    Params p;
    p.campaignsParticipated = GetOr(params, "campaigns_participated", p.campaignsParticipated);
    p.charactersUsed        = GetOr(params, "characters_used", p.charactersUsed);
    p.totalPlaytimeHours    = GetOr(params, "total_playtime_hours", p.totalPlaytimeHours);
    p.masteryCategories     = GetOr(params, "mastery_categories", p.masteryCategories);
    p.learnedPatterns       = GetOr(params, "learned_patterns", p.learnedPatterns);
    p.survivalStrategies    = GetOr(params, "survival_strategies", p.survivalStrategies);
    p.unlockCriteria        = GetOr(params, "unlock_criteria", json::object());
    p.unlockedContent       = GetOr(params, "unlocked_content", p.unlockedContent);
    return std::make_unique<MetaObjective>(DefFromParams(id, params, ObjectiveScope::Meta), std::move(p), now);
}

void MetaObjective::addUnlockCriteria(const std::string& name, json criteria)
{
    unlockCriteria_[name] = std::move(criteria);
}

bool MetaObjective::updateProgress(GameState& state, const ActionData& action, TimePoint now)
{
    bool progressMade = false;

    if (const json* campaign = Find(state, "campaign_id"); campaign && Truthy(*campaign))
    {
        const auto name = AsString(*campaign);
        if (campaigns_.insert(name).second)
        {
            progressMade = true;
            logEvent("new_campaign_participated", {{"campaign", name}});
        }
    }

    if (const json* character = Find(state, "character_id"); character && Truthy(*character))
    {
        if (characters_.insert(AsString(*character)).second)
            progressMade = true;
    }

    if (const json* duration = Find(action, "session_duration"); duration && duration->is_number())
    {
        playtimeHours_ += duration->get<double>();
        progressMade = true;
    }

    if (const json* m = Find(action, "mastery_advancement"); m && m->is_object())
    {
        const auto category = GetOr<std::string>(*m, "category", "");
        const auto skill = GetOr<std::string>(*m, "skill", "");
        if (!category.empty() && !skill.empty())
        {
            mastery_[category][skill] += GetOr(*m, "advancement", 1);
            progressMade = true;
        }
    }

    if (const json* pattern = Find(action, "pattern_learned"); pattern && pattern->is_string())
    {
        const auto name = pattern->get<std::string>();
        if (patterns_.insert(name).second)
        {
            progressMade = true;
            logEvent("pattern_learned", {{"pattern", name}});
        }
    }

    if (const json* strategy = Find(action, "survival_strategy"); strategy && strategy->is_string())
    {
        if (GetOr(action, "strategy_success", true))
        {
            ++strategies_[strategy->get<std::string>()];
            progressMade = true;
        }
    }

    checkContentUnlocks(now);

    setProgress(computeProgress());
    return progressMade;
}

void MetaObjective::checkContentUnlocks(TimePoint now)
{
    for (auto it = unlockCriteria_.begin(); it != unlockCriteria_.end(); ++it)
    {
        if (unlocked_.count(it.key()) || !criteriaMet(it.value()))
            continue;

        unlocked_.insert(it.key());
        unlockHistory_.push_back(json{{"unlock", it.key()},
                                  {"timestamp", FormatIso8601(now)},
                                  {"criteria_met", it.value()}});
        logEvent("content_unlocked", {{"unlock", it.key()}});
    }
}

bool MetaObjective::criteriaMet(const json& criteria) const
{
    if (!criteria.is_object())
        return false;

    if (const json* v = Find(criteria, "min_campaigns"); v && v->is_number())
        if (static_cast<double>(campaigns_.size()) < v->get<double>())
            return false;

    if (const json* v = Find(criteria, "min_characters"); v && v->is_number())
        if (static_cast<double>(characters_.size()) < v->get<double>())
            return false;

    if (const json* v = Find(criteria, "min_playtime"); v && v->is_number())
        if (playtimeHours_ < v->get<double>())
            return false;

    if (const json* v = Find(criteria, "required_patterns"); v && v->is_array())
        for (const auto& p : *v)
            if (!p.is_string() || !patterns_.count(p.get<std::string>()))
                return false;

    if (const json* v = Find(criteria, "mastery_level"); v && v->is_object())
    {
        const auto category = GetOr<std::string>(*v, "category", "");
        const auto skill = GetOr<std::string>(*v, "skill", "");
        const int level = GetOr(*v, "level", 0);

        auto cat = mastery_.find(category);
        if (cat == mastery_.end())
            return false;
        auto sk = cat->second.find(skill);
        if ((sk == cat->second.end() ? 0 : sk->second) < level)
            return false;
    }

    return true;
}

double MetaObjective::computeProgress() const
{
    if (unlockCriteria_.empty())
    {
        return std::min(1.0, static_cast<double>(campaigns_.size()) * 0.3
                           + static_cast<double>(characters_.size()) * 0.2
                           + static_cast<double>(patterns_.size()) * 0.1
                           + std::min(playtimeHours_ / 100.0, 1.0) * 0.4);
    }
    return static_cast<double>(unlocked_.size()) / static_cast<double>(unlockCriteria_.size());
}

json MetaObjective::masterySummary() const
{
    json summary = json::object();
    for (const auto& [category, skills] : mastery_)
    {
        int maxLevel = 0;
        for (const auto& kv : skills)
            maxLevel = std::max(maxLevel, kv.second);
        summary[category] = {{"total_skills", skills.size()}, {"max_level", maxLevel}, {"skills", skills}};
    }
    return summary;
}

json MetaObjective::displayInfo(TimePoint now) const
{
    json info = Objective::displayInfo(now);

    json recent = json::array();
    const std::size_t skip = unlockHistory_.size() > 5 ? unlockHistory_.size() - 5 : 0;
    for (std::size_t i = skip; i < unlockHistory_.size(); ++i)
        recent.push_back(unlockHistory_.at(i));

    json pending = json::object();
    for (auto it = unlockCriteria_.begin(); it != unlockCriteria_.end(); ++it)
        if (!unlocked_.count(it.key()))
            pending[it.key()] = criteriaMet(it.value());

    info["campaigns_participated"] = campaigns_.size();
    info["characters_used"]        = characters_.size();
    info["total_playtime_hours"]   = playtimeHours_;
    info["mastery_summary"]        = masterySummary();
    info["patterns_learned"]       = patterns_.size();
    info["survival_strategies"]    = strategies_;
    info["unlocked_content"]       = ToVector(unlocked_);
    info["recent_achievements"]    = recent;
    info["unlock_progress"]        = pending;
    return info;
}

void MetaObjective::writeDefinition(json& params) const
{
    params["unlock_criteria"] = unlockCriteria_;
}

void MetaObjective::saveState(json& state) const
{
    state["campaigns_participated"] = ToVector(campaigns_);
    state["characters_used"]        = ToVector(characters_);
    state["total_playtime_hours"]   = playtimeHours_;
    state["mastery_categories"]     = mastery_;
    state["learned_patterns"]       = ToVector(patterns_);
    state["survival_strategies"]    = strategies_;
    state["unlocked_content"]       = ToVector(unlocked_);
    state["unlock_history"]         = unlockHistory_;
}

void MetaObjective::restoreState(const json& state)
{
    auto readSet = [&](const char* key) {
        const auto v = GetOr(state, key, std::vector<std::string>{});
        return std::set<std::string>(v.begin(), v.end());
    };

    campaigns_     = readSet("campaigns_participated");
    characters_    = readSet("characters_used");
    playtimeHours_ = GetOr(state, "total_playtime_hours", 0.0);
    mastery_       = GetOr(state, "mastery_categories", decltype(mastery_){});
    patterns_      = readSet("learned_patterns");
    strategies_    = GetOr(state, "survival_strategies", std::map<std::string, int>{});
    unlocked_      = readSet("unlocked_content");
    unlockHistory_ = GetOr(state, "unlock_history", json::array());
}

} // namespace eldritch
