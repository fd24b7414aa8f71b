// src/objectives/SanityObjective.cpp
#include "eldritch/objectives/SanityObjective.h"

#include "eldritch/core/Errors.h"
#include "eldritch/logging/Log.h"

#include <algorithm>

namespace eldritch {

namespace {

struct SanityStateName { SanityState state; const char* name; };
struct MadnessTypeName { MadnessType type; const char* name; };

constexpr SanityStateName kSanityStateNames[] = {
    {SanityState::Stable,            "stable"},
    {SanityState::Stressed,          "stressed"},
    {SanityState::Disturbed,         "disturbed"},
    {SanityState::Unhinged,          "unhinged"},
    {SanityState::Mad,               "mad"},
    {SanityState::TemporarilyInsane, "temporarily_insane"},
};

constexpr MadnessTypeName kMadnessTypeNames[] = {
    {MadnessType::Paranoia,        "paranoia"},
    {MadnessType::Obsession,       "obsession"},
    {MadnessType::Phobia,          "phobia"},
    {MadnessType::Delusion,        "delusion"},
    {MadnessType::Compulsion,      "compulsion"},
    {MadnessType::Amnesia,         "amnesia"},
    {MadnessType::CosmicAwareness, "cosmic_awareness"},
};

int StateRiskModifier(SanityState s) noexcept
{
    switch (s)
    {
    case SanityState::Stable:            return 0;
    case SanityState::Stressed:          return 1;
    case SanityState::Disturbed:         return 2;
    case SanityState::Unhinged:          return 3;
    case SanityState::Mad:               return 5;
    case SanityState::TemporarilyInsane: return 3;
    }
    return 0;
}

json ThresholdsToJson(const SanityThresholds& t)
{
    return {{"stable_min", t.stableMin}, {"stressed_min", t.stressedMin},
            {"disturbed_min", t.disturbedMin}, {"unhinged_min", t.unhingedMin}};
}

} // namespace

const char* ToString(SanityState s) noexcept
{
    for (const auto& e : kSanityStateNames)
        if (e.state == s)
            return e.name;
    return "unknown";
}

const char* ToString(MadnessType m) noexcept
{
    for (const auto& e : kMadnessTypeNames)
        if (e.type == m)
            return e.name;
    return "unknown";
}

std::optional<SanityState> ParseSanityState(std::string_view s) noexcept
{
    for (const auto& e : kSanityStateNames)
        if (s == e.name)
            return e.state;
    return std::nullopt;
}

std::optional<MadnessType> ParseMadnessType(std::string_view s) noexcept
{
    for (const auto& e : kMadnessTypeNames)
        if (s == e.name)
            return e.type;
    return std::nullopt;
}

SanityThresholds SanityThresholds::FromConfig(const SanityConfig& cfg)
{
    return {cfg.stableMin, cfg.stressedMin, cfg.disturbedMin, cfg.unhingedMin};
}

int ReadSanity(const GameState& state, int fallback)
{
    if (const json* v = Find(state, "sanity"); v && v->is_number())
        return v->get<int>();
    if (const json* v = Find(state, "san"); v && v->is_number())
        return v->get<int>();
    return fallback;
}

SanityState DeriveSanityState(const GameState& state, const SanityThresholds& t, int defaultSanity)
{
    if (const json* ti = Find(state, "temporary_insanity"); ti && Truthy(*ti))
        return SanityState::TemporarilyInsane;

    const int san = ReadSanity(state, defaultSanity);
    if (san >= t.stableMin)    return SanityState::Stable;
    if (san >= t.stressedMin)  return SanityState::Stressed;
    if (san >= t.disturbedMin) return SanityState::Disturbed;
    if (san >= t.unhingedMin)  return SanityState::Unhinged;
    return SanityState::Mad;
}

void to_json(json& j, const MadnessEffect& e)
{
    j = json{{"madness_type", ToString(e.type)},
             {"severity", e.severity},
             {"duration_hours", e.durationHours ? json(*e.durationHours) : json(nullptr)},
             {"triggers", e.triggers},
             {"behavioral_changes", e.behavioralChanges},
             {"priority_change", e.priorityChange},
             {"time_pressure_minutes", e.timePressureMinutes},
             {"compulsions", e.compulsions}};
}

void from_json(const json& j, MadnessEffect& e)
{
    const auto typeName = GetOr<std::string>(j, "madness_type", "");
    const auto type = ParseMadnessType(typeName);
    if (!type)
        throw ObjectiveManagerError("Unknown madness type: " + typeName);

    e.type = *type;
    e.severity = std::clamp(GetOr(j, "severity", 1), 1, 5);
    if (const json* d = Find(j, "duration_hours"); d && d->is_number())
        e.durationHours = d->get<double>();
    else
        e.durationHours.reset();
    e.triggers            = GetOr(j, "triggers", std::vector<std::string>{});
    e.behavioralChanges   = GetOr(j, "behavioral_changes", json::object());
    e.priorityChange      = GetOr(j, "priority_change", 0);
    e.timePressureMinutes = GetOr(j, "time_pressure_minutes", 0.0);
    e.compulsions         = GetOr(j, "compulsions", std::vector<std::string>{});
}

// ----------------------------------------------------------------------------

SanityObjective::SanityObjective(ObjectiveDef def, SanityParams params, TimePoint createdAt)
    : Objective(std::move(def), createdAt)
    , params_(std::move(params))
    , sanRiskLevel_(params_.sanRiskLevel)
{
}

SanityObjective::SanityParams SanityObjective::ReadSanityParams(const json& params, const SanityConfig& defaults)
{
    SanityParams p;
    p.thresholds    = SanityThresholds::FromConfig(defaults);
    p.defaultSanity = GetOr(params, "default_sanity", defaults.defaultSanity);
    p.maxSanity     = GetOr(params, "max_sanity", defaults.maxSanity);

    if (const json* t = Find(params, "san_requirements"); t && t->is_object())
    {
        p.thresholds.stableMin    = GetOr(*t, "stable_min", p.thresholds.stableMin);
        p.thresholds.stressedMin  = GetOr(*t, "stressed_min", p.thresholds.stressedMin);
        p.thresholds.disturbedMin = GetOr(*t, "disturbed_min", p.thresholds.disturbedMin);
        p.thresholds.unhingedMin  = GetOr(*t, "unhinged_min", p.thresholds.unhingedMin);
    }

    if (const json* s = Find(params, "required_sanity_state"); s && s->is_string())
    {
        const auto state = ParseSanityState(s->get<std::string>());
        if (!state)
            throw ObjectiveManagerError("Unknown sanity state: " + s->get<std::string>());
        p.requiredSanityState = state;
    }

    p.sanRiskLevel          = GetOr(params, "san_risk_level", p.sanRiskLevel);
    p.cosmicInsightRequired = GetOr(params, "cosmic_insight_required", p.cosmicInsightRequired);
    p.madnessProtection     = GetOr(params, "madness_protection", p.madnessProtection);
    p.potentialSanGain      = GetOr(params, "potential_san_gain", p.potentialSanGain);

    if (const json* effects = Find(params, "madness_effects"); effects && effects->is_array())
        for (const auto& e : *effects)
            p.madnessEffects.push_back(e.get<MadnessEffect>());

    return p;
}

ObjectiveScope SanityObjective::ReadScope(const json& params)
{
    const auto name = GetOr<std::string>(params, "scope", "short_term");
    const auto scope = ParseObjectiveScope(name);
    if (!scope)
        throw ObjectiveManagerError("Unknown objective scope: " + name);
    return *scope;
}

SanityState SanityObjective::currentSanityState(const GameState& state) const
{
    return DeriveSanityState(state, params_.thresholds, params_.defaultSanity);
}

bool SanityObjective::canActivate(const GameState& state) const
{
    if (!Objective::canActivate(state))
        return false;

    if (params_.requiredSanityState && currentSanityState(state) != *params_.requiredSanityState)
        return false;

    return GetOr(state, "cosmic_insight", 0) >= params_.cosmicInsightRequired;
}

int SanityObjective::sanRiskLevel() const
{
    const double scale = sanRiskScale();
    if (scale < 1.0)
        return std::max(1, static_cast<int>(sanRiskLevel_ * scale));
    if (scale > 1.0)
        return std::min(5, static_cast<int>(sanRiskLevel_ * scale));
    return sanRiskLevel_;
}

void SanityObjective::setSanRiskLevel(int level) noexcept
{
    sanRiskLevel_ = std::clamp(level, 1, 10);
}

int SanityObjective::calculateSanRisk(const GameState& state) const
{
    int risk = sanRiskLevel() + StateRiskModifier(currentSanityState(state));
    if (params_.madnessProtection)
        risk -= 2;
    return std::clamp(risk, 1, 10);
}

void SanityObjective::applySanLoss(GameState& state, int loss, const std::string& reason, TimePoint now)
{
    cumulativeSanLoss_ += loss;

    const int before = ReadSanity(state, params_.defaultSanity);
    const int after = std::max(0, before - loss);

    json event = {{"timestamp", FormatIso8601(now)},
                  {"san_loss", loss},
                  {"reason", reason},
                  {"cumulative_loss", cumulativeSanLoss_},
                  {"sanity_before", before},
                  {"sanity_after", after}};
    recordSanityEvent(event);

    if (state.is_object() || state.is_null())
        state["sanity"] = after;

    logEvent("san_loss_applied", std::move(event));
    logsys::get()->warn("SAN loss applied: {} points - {}", loss, reason);

    checkMadnessThreshold(state);
}

void SanityObjective::applySanGain(GameState& state, int gain, const std::string& reason, TimePoint now)
{
    const int maxSan = GetOr(state, "max_sanity", params_.maxSanity);
    const int current = ReadSanity(state, params_.defaultSanity);
    const int actual = std::min(gain, maxSan - current);
    if (actual <= 0)
        return;

    json event = {{"timestamp", FormatIso8601(now)},
                  {"san_gain", actual},
                  {"reason", reason},
                  {"sanity_before", current},
                  {"sanity_after", current + actual}};
    recordSanityEvent(event);

    if (state.is_object() || state.is_null())
        state["sanity"] = current + actual;

    logEvent("san_gain_applied", std::move(event));
    logsys::get()->info("SAN restored: {} points - {}", actual, reason);
}

void SanityObjective::recordSanityEvent(const json& event)
{
    sanityEvents_.push_back(event);
    while (sanityEvents_.size() > kSanityEventCapacity)
        sanityEvents_.erase(sanityEvents_.begin());
}

void SanityObjective::checkMadnessThreshold(GameState& state)
{
    const SanityState current = currentSanityState(state);
    for (const auto& effect : params_.madnessEffects)
        if (shouldTriggerMadness(effect, current, state))
            applyMadnessEffect(effect, state);
}

bool SanityObjective::shouldTriggerMadness(const MadnessEffect& effect, SanityState current,
                                           const GameState& state) const
{
    if (const json* active = Find(state, "active_madness"); active && ArrayContains(*active, ToString(effect.type)))
        return false;

    switch (current)
    {
    case SanityState::Disturbed:         return effect.severity >= 3;
    case SanityState::Unhinged:          return effect.severity >= 2;
    case SanityState::Mad:               return true;
    case SanityState::TemporarilyInsane: return true;
    default:                             return false;
    }
}

void SanityObjective::applyMadnessEffect(const MadnessEffect& effect, GameState& state)
{
    if (!state.is_object())
        return;

    json& active = state["active_madness"];
    if (!active.is_array())
        active = json::array();
    active.push_back(ToString(effect.type));

    if (effect.behavioralChanges.is_object())
        for (auto it = effect.behavioralChanges.begin(); it != effect.behavioralChanges.end(); ++it)
            state[it.key()] = it.value();

    if (effect.priorityChange != 0 || effect.timePressureMinutes > 0.0 || !effect.compulsions.empty())
    {
        ObjectiveModifier m;
        m.source = std::string("madness:") + ToString(effect.type);
        m.priorityDelta = effect.priorityChange;
        m.timePressureMinutes = effect.timePressureMinutes;
        m.addedRequiredActions = effect.compulsions;
        applyModifier(std::move(m));
    }

    logEvent("madness_effect_applied", {{"madness_type", ToString(effect.type)},
                                        {"severity", effect.severity},
                                        {"duration", effect.durationHours ? json(*effect.durationHours) : json(nullptr)}});
    logsys::get()->warn("Madness effect applied: {} (severity {})", ToString(effect.type), effect.severity);
}

json SanityObjective::displayInfo(TimePoint now) const
{
    json info = Objective::displayInfo(now);
    info["san_risk_level"] = sanRiskLevel();
    info["cumulative_san_loss"] = cumulativeSanLoss_;
    info["madness_protection"] = params_.madnessProtection;
    info["required_sanity_state"] = params_.requiredSanityState ? json(ToString(*params_.requiredSanityState)) : json(nullptr);
    return info;
}

void SanityObjective::writeDefinition(json& params) const
{
    params["scope"] = ToString(scope());
    params["san_requirements"] = ThresholdsToJson(params_.thresholds);
    params["default_sanity"] = params_.defaultSanity;
    params["max_sanity"] = params_.maxSanity;
    params["required_sanity_state"] = params_.requiredSanityState ? json(ToString(*params_.requiredSanityState)) : json(nullptr);
    params["san_risk_level"] = params_.sanRiskLevel;
    params["cosmic_insight_required"] = params_.cosmicInsightRequired;
    params["madness_effects"] = params_.madnessEffects;
    params["madness_protection"] = params_.madnessProtection;
    params["potential_san_gain"] = params_.potentialSanGain;
}

void SanityObjective::saveState(json& state) const
{
    state["san_risk_level"] = sanRiskLevel_;
    state["cumulative_san_loss"] = cumulativeSanLoss_;
    state["sanity_events"] = sanityEvents_;
}

void SanityObjective::restoreState(const json& state)
{
    sanRiskLevel_ = GetOr(state, "san_risk_level", sanRiskLevel_);
    cumulativeSanLoss_ = GetOr(state, "cumulative_san_loss", 0);
    sanityEvents_ = json::array();
    for (const auto& e : GetOr(state, "sanity_events", json::array()))
        recordSanityEvent(e);
}

} // namespace eldritch
