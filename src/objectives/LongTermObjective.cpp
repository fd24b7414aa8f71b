// src/objectives/LongTermObjective.cpp
#include "eldritch/objectives/LongTermObjective.h"

#include <algorithm>
#include <stdexcept>

namespace eldritch {

LongTermObjective::LongTermObjective(ObjectiveDef def, Params params, TimePoint createdAt)
    : Objective(WithScopeDefaults(std::move(def), ObjectiveScope::LongTerm, std::nullopt), createdAt)
    , phases_(params.campaignPhases.is_array() ? std::move(params.campaignPhases) : json::array())
    , growthGoals_(params.characterGrowthGoals.is_object() ? std::move(params.characterGrowthGoals) : json::object())
    , mythosKnowledge_(std::move(params.mythosKnowledgeLevels))
    , themes_(std::move(params.recurringThemes))
    , persistentElements_(std::move(params.persistentElements))
{
}

std::unique_ptr<LongTermObjective> LongTermObjective::FromParams(const std::string& id, const json& params, TimePoint now)
{
    Params p;
    p.campaignPhases        = GetOr(params, "campaign_phases", json::array());
    p.characterGrowthGoals  = GetOr(params, "character_growth_goals", json::object());
    p.mythosKnowledgeLevels = GetOr(params, "mythos_knowledge_levels", p.mythosKnowledgeLevels);
    p.recurringThemes       = GetOr(params, "recurring_themes", p.recurringThemes);
    p.persistentElements    = GetOr(params, "persistent_elements", json::object());
    return std::make_unique<LongTermObjective>(DefFromParams(id, params, ObjectiveScope::LongTerm), std::move(p), now);
}

double LongTermObjective::phaseProgress(int phase) const
{
    auto it = phaseProgress_.find(phase);
    return it == phaseProgress_.end() ? 0.0 : it->second;
}

std::optional<json> LongTermObjective::currentPhaseInfo() const
{
    if (currentPhase_ < 0 || static_cast<std::size_t>(currentPhase_) >= phases_.size())
        return std::nullopt;
    json phase = phases_.at(static_cast<std::size_t>(currentPhase_));
    if (!phase.is_object())
        phase = json{{"value", phase}};
    phase["progress"] = phaseProgress(currentPhase_);
    return phase;
}

bool LongTermObjective::advancePhaseProgress(double advancement)
{
    if (static_cast<std::size_t>(currentPhase_) >= phases_.size())
        return false;
    auto& p = phaseProgress_[currentPhase_];
    p = std::min(1.0, p + advancement);
    return true;
}

bool LongTermObjective::updateProgress(GameState& state, const ActionData& action, TimePoint now)
{
    bool progressMade = false;

    if (const json* adv = Find(action, "phase_advancement"); adv && adv->is_number())
    {
        const int phase = GetOr(action, "phase_index", currentPhase_);
        auto& p = phaseProgress_[phase];
        p = std::min(1.0, p + adv->get<double>());

        if (p >= 1.0 && phase == currentPhase_)
            completeCurrentPhase(now);
        progressMade = true;
    }

    if (const json* mk = Find(action, "mythos_knowledge"); mk && mk->is_object())
    {
        const auto entity = GetOr<std::string>(*mk, "entity", "");
        if (!entity.empty())
        {
            const int gain = GetOr(*mk, "level_gain", 1);
            mythosKnowledge_[entity] += gain;
            progressMade = true;
            logEvent("mythos_knowledge_gained", {{"entity", entity},
                                                 {"new_level", mythosKnowledge_[entity]},
                                                 {"gain", gain}});
        }
    }

    if (const json* theme = Find(action, "theme_encounter"); theme && theme->is_string())
    {
        const auto name = theme->get<std::string>();
        if (std::find(themes_.begin(), themes_.end(), name) != themes_.end())
        {
            ++themeEncounters_[name];
            progressMade = true;
        }
    }

    if (const json* change = Find(action, "world_change"))
    {
        worldStateChanges_.push_back(json{{"timestamp", FormatIso8601(now)},
                                      {"change", *change},
                                      {"session", GetOr<json>(state, "current_session", "unknown")}});
        progressMade = true;
    }

    if (const json* rel = Find(action, "npc_relationship"); rel && rel->is_object())
    {
        const auto npc = GetOr<std::string>(*rel, "npc", "");
        if (!npc.empty())
        {
            npcRelationships_[npc] += GetOr(*rel, "change", 0);
            progressMade = true;
        }
    }

    setProgress(computeProgress());
    return progressMade;
}

void LongTermObjective::completeCurrentPhase(TimePoint now)
{
    if (static_cast<std::size_t>(currentPhase_) >= phases_.size())
        return;

    const json& phase = phases_.at(static_cast<std::size_t>(currentPhase_));
    logEvent("campaign_phase_completed",
             {{"phase", currentPhase_},
              {"phase_name", GetOr<std::string>(phase, "name", "Phase " + std::to_string(currentPhase_))},
              {"completion_time", FormatIso8601(now)}});

    ++currentPhase_;

    if (const json* effects = Find(phase, "completion_effects"); effects && effects->is_object())
        applyPhaseEffects(*effects, now);
}

void LongTermObjective::applyPhaseEffects(const json& effects, TimePoint now)
{
    if (const json* unlock = Find(effects, "unlock_knowledge"); unlock && unlock->is_object())
    {
        for (auto it = unlock->begin(); it != unlock->end(); ++it)
        {
            if (!it.value().is_number())
                continue;
            auto& level = mythosKnowledge_[it.key()];
            level = std::max(level, it.value().get<int>());
        }
    }

    if (const json* world = Find(effects, "world_state"))
    {
        worldStateChanges_.push_back(json{{"timestamp", FormatIso8601(now)},
                                      {"change", *world},
                                      {"source", "phase_completion"}});
    }
}

double LongTermObjective::computeProgress() const
{
    double total = 0.0, sum = 0.0;
    auto add = [&](double value, double weight) { sum += value * weight; total += weight; };

    if (!phases_.empty())
    {
        const int n = static_cast<int>(phases_.size());
        int completed = 0;
        for (int i = 0; i < n; ++i)
            if (phaseProgress(i) >= 1.0)
                ++completed;
        add((completed + phaseProgress(currentPhase_)) / static_cast<double>(n), 0.5);
    }

    if (!growthGoals_.empty())
    {
        int achieved = 0;
        for (auto it = growthGoals_.begin(); it != growthGoals_.end(); ++it)
        {
            if (it.key() != "mythos_entities" || !it.value().is_number())
                continue;
            const auto known = std::count_if(mythosKnowledge_.begin(), mythosKnowledge_.end(),
                                             [](const auto& kv) { return kv.second > 0; });
            if (static_cast<double>(known) >= it.value().get<double>())
                ++achieved;
        }
        add(static_cast<double>(achieved) / static_cast<double>(growthGoals_.size()), 0.3);
    }

    if (!themes_.empty())
    {
        const auto explored = std::count_if(themes_.begin(), themes_.end(), [&](const std::string& t) {
            auto it = themeEncounters_.find(t);
            return it != themeEncounters_.end() && it->second > 0;
        });
        add(static_cast<double>(explored) / static_cast<double>(themes_.size()), 0.2);
    }

    return total > 0.0 ? sum / total : 0.0;
}

json LongTermObjective::displayInfo(TimePoint now) const
{
    json info = Objective::displayInfo(now);
    const auto phase = currentPhaseInfo();

    json phaseProgressOut = json::object();
    for (const auto& kv : phaseProgress_)
        phaseProgressOut[std::to_string(kv.first)] = kv.second;

    info["campaign_progression"] = {{"current_phase", currentPhase_},
                                    {"total_phases", phases_.size()},
                                    {"current_phase_info", phase ? *phase : json(nullptr)},
                                    {"phase_progress", phaseProgressOut}};
    info["mythos_knowledge"]  = mythosKnowledge_;
    info["character_growth"]  = growthGoals_;
    info["theme_encounters"]  = themeEncounters_;
    info["world_changes"]     = worldStateChanges_.size();
    info["npc_relationships"] = npcRelationships_;
    return info;
}

void LongTermObjective::writeDefinition(json& params) const
{
    params["campaign_phases"]        = phases_;
    params["character_growth_goals"] = growthGoals_;
    params["recurring_themes"]       = themes_;
    params["persistent_elements"]    = persistentElements_;
}

void LongTermObjective::saveState(json& state) const
{
    json phaseProgressOut = json::object();
    for (const auto& kv : phaseProgress_)
        phaseProgressOut[std::to_string(kv.first)] = kv.second;

    state["current_phase"]           = currentPhase_;
    state["phase_progress"]          = phaseProgressOut;
    state["mythos_knowledge_levels"] = mythosKnowledge_;
    state["theme_encounters"]        = themeEncounters_;
    state["world_state_changes"]     = worldStateChanges_;
    state["npc_relationships"]       = npcRelationships_;
}

void LongTermObjective::restoreState(const json& state)
{
    currentPhase_ = GetOr(state, "current_phase", 0);

    phaseProgress_.clear();
    if (const json* pp = Find(state, "phase_progress"); pp && pp->is_object())
    {
        for (auto it = pp->begin(); it != pp->end(); ++it)
        {
            if (!it.value().is_number())
                continue;
            try
            {
                phaseProgress_[std::stoi(it.key())] = std::clamp(it.value().get<double>(), 0.0, 1.0);
            }
            catch (const std::logic_error&)
            {
                // non-numeric phase key, skip
            }
        }
    }

    mythosKnowledge_   = GetOr(state, "mythos_knowledge_levels", mythosKnowledge_);
    themeEncounters_   = GetOr(state, "theme_encounters", std::map<std::string, int>{});
    worldStateChanges_ = GetOr(state, "world_state_changes", json::array());
    npcRelationships_  = GetOr(state, "npc_relationships", std::map<std::string, int>{});
}

} // namespace eldritch
