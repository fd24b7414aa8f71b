// src/objectives/SanityVariants.cpp
#include "eldritch/objectives/SanityVariants.h"

#include "eldritch/core/Errors.h"
#include "eldritch/logging/Log.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace eldritch {

namespace {

bool Contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

json StateConfigToJson(const SanityDependentObjective::StateConfiguration& c)
{
    json j = json::object();
    if (c.titleSuffix)         j["title_suffix"] = *c.titleSuffix;
    if (c.descriptionOverride) j["description_override"] = *c.descriptionOverride;
    if (c.priorityModifier)    j["priority_modifier"] = *c.priorityModifier;
    if (c.sanLossMultiplier)   j["san_loss_multiplier"] = *c.sanLossMultiplier;
    if (c.completionSanBonus)  j["completion_san_bonus"] = *c.completionSanBonus;
    return j;
}

SanityDependentObjective::StateConfiguration StateConfigFromJson(const json& j)
{
    SanityDependentObjective::StateConfiguration c;
    if (const json* v = Find(j, "title_suffix"); v && v->is_string())         c.titleSuffix = v->get<std::string>();
    if (const json* v = Find(j, "description_override"); v && v->is_string()) c.descriptionOverride = v->get<std::string>();
    if (const json* v = Find(j, "priority_modifier"); v && v->is_number())    c.priorityModifier = v->get<int>();
    if (const json* v = Find(j, "san_loss_multiplier"); v && v->is_number())  c.sanLossMultiplier = v->get<double>();
    if (const json* v = Find(j, "completion_san_bonus"); v && v->is_number()) c.completionSanBonus = v->get<int>();
    return c;
}

SanityState ParseStateKey(const std::string& key)
{
    if (key == "temp_insane")
        return SanityState::TemporarilyInsane;
    const auto s = ParseSanityState(key);
    if (!s)
        throw ObjectiveManagerError("Unknown sanity state: " + key);
    return *s;
}

ObjectiveDef AtLeastHighPriority(ObjectiveDef def)
{
    if (ToInt(def.priority) < ToInt(ObjectivePriority::High))
        def.priority = ObjectivePriority::High;
    return def;
}

} // namespace

// ============================ SanityDependentObjective ========================

SanityDependentObjective::SanityDependentObjective(ObjectiveDef def, SanityParams sanity, Params params,
                                                   TimePoint createdAt)
    : SanityObjective(std::move(def), std::move(sanity), createdAt)
    , configs_(std::move(params.stateConfigurations))
    , seed_(params.seed ? *params.seed : rng::entropySeed())
    , rng_(seed_)
{
}

std::unique_ptr<SanityDependentObjective> SanityDependentObjective::FromParams(const std::string& id,
                                                                               const json& params, TimePoint now,
                                                                               const SanityConfig& sanity)
{
    Params p;
    if (const json* configs = Find(params, "state_configurations"); configs && configs->is_object())
        for (auto it = configs->begin(); it != configs->end(); ++it)
            p.stateConfigurations[ParseStateKey(it.key())] = StateConfigFromJson(it.value());

    if (const json* s = Find(params, "seed"); s && s->is_number_unsigned())
        p.seed = s->get<rng::Seed>();

    return std::make_unique<SanityDependentObjective>(DefFromParams(id, params, ReadScope(params)),
                                                      ReadSanityParams(params, sanity), std::move(p), now);
}

bool SanityDependentObjective::updateProgress(GameState& state, const ActionData& action, TimePoint now)
{
    const SanityState current = currentSanityState(state);
    updateForSanityState(current);

    const auto actionType = GetOr<std::string>(action, "action_type", "");
    if (actionType.empty())
        return false;

    const bool progressMade = progressForState(current, state, actionType, now);
    if (progressMade)
        applySanityEffects(current, state, now);
    return progressMade;
}

void SanityDependentObjective::updateForSanityState(SanityState current)
{
    auto it = configs_.find(current);
    if (it == configs_.end() || configuredState_ == current)
        return;

    configuredState_ = current;
    const StateConfiguration& cfg = it->second;
    applyPresentation(cfg);

    removeModifiers("sanity_state");
    if (cfg.priorityModifier && *cfg.priorityModifier != 0)
    {
        ObjectiveModifier m;
        m.source = "sanity_state";
        m.priorityDelta = *cfg.priorityModifier;
        applyModifier(std::move(m));
    }

    logEvent("configuration_updated", {{"sanity_state", ToString(current)}, {"new_config", StateConfigToJson(cfg)}});
}

void SanityDependentObjective::applyPresentation(const StateConfiguration& cfg)
{
    setTitleSuffix(cfg.titleSuffix ? " (" + *cfg.titleSuffix + ")" : std::string());
    setDescriptionOverride(cfg.descriptionOverride.value_or(std::string()));
}

bool SanityDependentObjective::progressForState(SanityState current, GameState& state,
                                                const std::string& actionType, TimePoint now)
{
    switch (current)
    {
    case SanityState::Mad:
        if (actionType == "mad_insight")
        {
            setProgress(progress() + 0.3);
            return true;
        }
        if (actionType == "random_action" || actionType == "compulsive_behavior")
        {
            if (rng_.chance(0.1))
            {
                setProgress(progress() + 0.1);
                return true;
            }
        }
        return false;

    case SanityState::Unhinged:
        if (Contains(actionType, "desperate") || Contains(actionType, "reckless"))
        {
            setProgress(progress() + 0.2);
            if (calculateSanRisk(state) > 3)
                applySanLoss(state, 1, "Reckless action while unhinged", now);
            return true;
        }
        return false;

    case SanityState::Disturbed:
        setProgress(progress() + 0.05);
        return true;

    default:
        setProgress(progress() + 0.1);
        return true;
    }
}

void SanityDependentObjective::applySanityEffects(SanityState current, GameState& state, TimePoint now)
{
    auto it = configs_.find(current);
    if (it == configs_.end())
        return;
    const StateConfiguration& cfg = it->second;

    if (cfg.sanLossMultiplier)
    {
        const int adjusted = static_cast<int>(calculateSanRisk(state) * *cfg.sanLossMultiplier);
        if (adjusted > 0)
            applySanLoss(state, adjusted, std::string("Action while ") + ToString(current), now);
    }

    const bool strained = current == SanityState::Disturbed || current == SanityState::Unhinged;
    if (progress() >= 1.0 && strained && cfg.completionSanBonus)
        applySanGain(state, *cfg.completionSanBonus, "Overcame adversity while mentally strained", now);
}

json SanityDependentObjective::displayInfo(TimePoint now) const
{
    json info = SanityObjective::displayInfo(now);
    info["configured_sanity_state"] = configuredState_ ? json(ToString(*configuredState_)) : json(nullptr);
    return info;
}

void SanityDependentObjective::writeDefinition(json& params) const
{
    SanityObjective::writeDefinition(params);
    json configs = json::object();
    for (const auto& kv : configs_)
        configs[ToString(kv.first)] = StateConfigToJson(kv.second);
    params["state_configurations"] = configs;
    params["seed"] = seed_;
}

void SanityDependentObjective::saveState(json& state) const
{
    SanityObjective::saveState(state);
    state["configured_state"] = configuredState_ ? json(ToString(*configuredState_)) : json(nullptr);
}

void SanityDependentObjective::restoreState(const json& state)
{
    SanityObjective::restoreState(state);
    configuredState_.reset();
    if (const json* s = Find(state, "configured_state"); s && s->is_string())
    {
        // The "sanity_state" modifier comes back with the other modifiers.
        const auto parsed = ParseSanityState(s->get<std::string>());
        auto it = parsed ? configs_.find(*parsed) : configs_.end();
        if (it != configs_.end())
        {
            configuredState_ = parsed;
            applyPresentation(it->second);
        }
    }
}

// ============================= CosmicInsightObjective ========================

CosmicInsightObjective::CosmicInsightObjective(ObjectiveDef def, SanityParams sanity, Params params,
                                               TimePoint createdAt)
    : SanityObjective(std::move(def), std::move(sanity), createdAt)
    , params_(std::move(params))
{
    if (!params_.insightLevels.is_array())
        params_.insightLevels = json::array();
}

std::unique_ptr<CosmicInsightObjective> CosmicInsightObjective::FromParams(const std::string& id,
                                                                           const json& params, TimePoint now,
                                                                           const SanityConfig& sanity)
{
    Params p;
    p.insightLevels              = GetOr(params, "insight_levels", json::array());
    p.revelationThresholds       = GetOr(params, "revelation_thresholds", p.revelationThresholds);
    p.sanityCostPerInsight       = GetOr(params, "sanity_cost_per_insight", p.sanityCostPerInsight);
    p.insightProtectionThreshold = GetOr(params, "insight_protection_threshold", p.insightProtectionThreshold);
    return std::make_unique<CosmicInsightObjective>(DefFromParams(id, params, ReadScope(params)),
                                                    ReadSanityParams(params, sanity), std::move(p), now);
}

int CosmicInsightObjective::insightSanPenalty(double insightGain, int currentSan) const
{
    const int baseLoss = static_cast<int>(insightGain * params_.sanityCostPerInsight * 10);

    double multiplier = 1.0;
    if (currentSan < params_.insightProtectionThreshold)
        multiplier = 1.5;
    else if (currentSan < 50)
        multiplier = 1.2;

    int total = static_cast<int>(baseLoss * multiplier);
    // Little left to lose.
    if (currentSan <= 10)
        total = std::min(total, 1);
    return total;
}

bool CosmicInsightObjective::updateProgress(GameState& state, const ActionData& action, TimePoint now)
{
    bool progressMade = false;

    if (const json* rev = Find(action, "cosmic_revelation"))
    {
        const std::string revelationType = AsString(*rev);
        const double gain = GetOr(action, "insight_value", 0.1);
        setProgress(progress() + gain);
        progressMade = true;

        const int penalty = insightSanPenalty(gain, ReadSanity(state, sanityParams().defaultSanity));
        if (penalty > 0)
            applySanLoss(state, penalty, "Cosmic insight: " + revelationType, now);

        logEvent("cosmic_revelation", {{"revelation_type", revelationType},
                                       {"insight_gain", gain},
                                       {"total_progress", progress()}});
    }

    if (progressMade)
        checkInsightLevels(state);
    return progressMade;
}

void CosmicInsightObjective::checkInsightLevels(GameState& state)
{
    const auto& thresholds = params_.revelationThresholds;
    for (std::size_t i = 0; i < thresholds.size(); ++i)
    {
        if (progress() >= thresholds[i] && insightLevel_ <= static_cast<int>(i))
        {
            // One level per revelation.
            if (i < params_.insightLevels.size())
            {
                insightLevel_ = static_cast<int>(i) + 1;
                triggerInsightLevel(i, state);
            }
            break;
        }
    }
}

void CosmicInsightObjective::triggerInsightLevel(std::size_t index, GameState& state)
{
    const json& level = params_.insightLevels.at(index);

    if (state.is_object())
    {
        if (const json* k = Find(level, "cosmic_knowledge_unlock"); k && k->is_array())
        {
            json& known = state["cosmic_knowledge"];
            if (!known.is_array())
                known = json::array();
            for (const auto& item : *k)
                known.push_back(item);
        }

        if (const json* c = Find(level, "sanity_threshold_change"); c && c->is_number())
        {
            const int maxSan = GetOr(state, "max_sanity", sanityParams().maxSanity);
            state["max_sanity"] = std::max(50, maxSan + c->get<int>());
        }

        if (const json* a = Find(level, "special_ability_unlock"); a && !a->is_null())
        {
            json& abilities = state["special_abilities"];
            if (!abilities.is_array())
                abilities = json::array();
            if (a->is_array())
                abilities.insert(abilities.end(), a->begin(), a->end());
            else
                abilities.push_back(*a);
        }
    }

    logEvent("insight_level_reached", {{"level", insightLevel_}, {"level_data", level}});
    logsys::get()->info("Cosmic insight level {} reached in {}", insightLevel_, id());
}

json CosmicInsightObjective::displayInfo(TimePoint now) const
{
    json info = SanityObjective::displayInfo(now);
    info["insight_level"] = insightLevel_;
    info["total_levels"] = params_.insightLevels.size();
    info["revelation_thresholds"] = params_.revelationThresholds;
    return info;
}

void CosmicInsightObjective::writeDefinition(json& params) const
{
    SanityObjective::writeDefinition(params);
    params["insight_levels"] = params_.insightLevels;
    params["revelation_thresholds"] = params_.revelationThresholds;
    params["sanity_cost_per_insight"] = params_.sanityCostPerInsight;
    params["insight_protection_threshold"] = params_.insightProtectionThreshold;
}

void CosmicInsightObjective::saveState(json& state) const
{
    SanityObjective::saveState(state);
    state["current_insight_level"] = insightLevel_;
}

void CosmicInsightObjective::restoreState(const json& state)
{
    SanityObjective::restoreState(state);
    insightLevel_ = GetOr(state, "current_insight_level", 0);
}

// ================================ MadnessObjective ===========================

MadnessObjective::MadnessObjective(ObjectiveDef def, SanityParams sanity, Params params, TimePoint createdAt)
    : SanityObjective(AtLeastHighPriority(std::move(def)), std::move(sanity), createdAt)
    , params_(std::move(params))
{
}

std::unique_ptr<MadnessObjective> MadnessObjective::FromParams(const std::string& id, const json& params,
                                                               TimePoint now, const SanityConfig& sanity)
{
    Params p;
    for (const auto& name : GetOr(params, "required_madness_types", std::vector<std::string>{}))
    {
        const auto type = ParseMadnessType(name);
        if (!type)
            throw ObjectiveManagerError("Unknown madness type: " + name);
        p.requiredMadnessTypes.push_back(*type);
    }
    p.minMadnessSeverity         = GetOr(params, "min_madness_severity", p.minMadnessSeverity);
    p.madnessProgressMultiplier  = GetOr(params, "madness_progress_multiplier", p.madnessProgressMultiplier);
    p.sanityRecoveryOnCompletion = GetOr(params, "sanity_recovery_on_completion", p.sanityRecoveryOnCompletion);
    return std::make_unique<MadnessObjective>(DefFromParams(id, params, ReadScope(params)),
                                              ReadSanityParams(params, sanity), std::move(p), now);
}

bool MadnessObjective::hasRequiredMadness(const GameState& state) const
{
    const json* active = Find(state, "active_madness");
    if (!active)
        return false;
    return std::any_of(params_.requiredMadnessTypes.begin(), params_.requiredMadnessTypes.end(),
                       [&](MadnessType t) { return ArrayContains(*active, ToString(t)); });
}

bool MadnessObjective::canActivate(const GameState& state) const
{
    if (!SanityObjective::canActivate(state))
        return false;

    if (!params_.requiredMadnessTypes.empty() && !hasRequiredMadness(state))
        return false;

    return GetOr(state, "madness_severity", 0) >= params_.minMadnessSeverity;
}

bool MadnessObjective::madnessStateAppropriate(const GameState& state) const
{
    if (!params_.requiredMadnessTypes.empty())
        return hasRequiredMadness(state);

    const json* active = Find(state, "active_madness");
    return (active && Truthy(*active)) || GetOr(state, "madness_severity", 0) >= params_.minMadnessSeverity;
}

bool MadnessObjective::updateProgress(GameState& state, const ActionData& action, TimePoint)
{
    if (!madnessStateAppropriate(state))
    {
        if (progress() > 0.0)
        {
            setProgress(progress() - 0.1);
            logEvent("madness_progress_lost", {{"reason", "Madness state no longer appropriate"}});
            return true;
        }
        return false;
    }

    const auto actionType = GetOr<std::string>(action, "action_type", "");
    if (actionType.empty())
        return false;

    static const char* const kKeywords[] = {"compulsive", "obsessive", "paranoid", "delusional"};
    const bool madAction = std::any_of(std::begin(kKeywords), std::end(kKeywords),
                                       [&](const char* k) { return Contains(actionType, k); });
    if (!madAction)
        return false;

    const double gain = 0.1 * params_.madnessProgressMultiplier;
    setProgress(progress() + gain);
    logEvent("madness_enhanced_progress", {{"action_type", actionType},
                                           {"advancement", gain},
                                           {"multiplier", params_.madnessProgressMultiplier}});
    return true;
}

bool MadnessObjective::complete(GameState& state, TimePoint now)
{
    if (!SanityObjective::complete(state, now))
        return false;

    if (params_.sanityRecoveryOnCompletion > 0)
        applySanGain(state, params_.sanityRecoveryOnCompletion, "Madness-driven objective completed", now);
    return true;
}

json MadnessObjective::displayInfo(TimePoint now) const
{
    json info = SanityObjective::displayInfo(now);
    json types = json::array();
    for (auto t : params_.requiredMadnessTypes)
        types.push_back(ToString(t));
    info["required_madness_types"] = types;
    info["madness_progress_multiplier"] = params_.madnessProgressMultiplier;
    return info;
}

void MadnessObjective::writeDefinition(json& params) const
{
    SanityObjective::writeDefinition(params);
    json types = json::array();
    for (auto t : params_.requiredMadnessTypes)
        types.push_back(ToString(t));
    params["required_madness_types"] = types;
    params["min_madness_severity"] = params_.minMadnessSeverity;
    params["madness_progress_multiplier"] = params_.madnessProgressMultiplier;
    params["sanity_recovery_on_completion"] = params_.sanityRecoveryOnCompletion;
}

} // namespace eldritch
