// src/objectives/ShortTermObjective.cpp
#include "eldritch/objectives/ShortTermObjective.h"

#include "eldritch/logging/Log.h"

#include <algorithm>
#include <exception>

namespace eldritch {

namespace {

std::vector<std::string> ToVector(const std::set<std::string>& s)
{
    return {s.begin(), s.end()};
}

} // namespace

ShortTermObjective::ShortTermObjective(ObjectiveDef def, Params params, TimePoint createdAt)
    : Objective(WithScopeDefaults(std::move(def), ObjectiveScope::ShortTerm, Minutes(20)), createdAt)
    , milestoneCount_(std::max(0, params.milestoneCount))
    , requiredDiscoveries_(params.requiredDiscoveries.begin(), params.requiredDiscoveries.end())
    , subObjectives_(std::move(params.subObjectives))
    , sceneContext_(std::move(params.sceneContext))
    , tensionRampEnabled_(params.tensionRampEnabled)
    , initialTension_(params.initialTension)
    , maxTension_(params.maxTension)
    , tension_(params.initialTension)
{
}

std::unique_ptr<ShortTermObjective> ShortTermObjective::FromParams(const std::string& id, const json& params, TimePoint now)
{
    Params p;
    p.milestoneCount      = GetOr(params, "milestone_count", p.milestoneCount);
    p.requiredDiscoveries = GetOr(params, "required_discoveries", p.requiredDiscoveries);
    p.subObjectives       = GetOr(params, "sub_objectives", p.subObjectives);
    p.sceneContext        = GetOr(params, "scene_context", p.sceneContext);
    p.tensionRampEnabled  = GetOr(params, "tension_ramp_enabled", p.tensionRampEnabled);
    p.initialTension      = GetOr(params, "initial_tension", p.initialTension);
    p.maxTension          = GetOr(params, "max_tension", p.maxTension);
    return std::make_unique<ShortTermObjective>(DefFromParams(id, params, ObjectiveScope::ShortTerm), std::move(p), now);
}

int ShortTermObjective::milestoneCount() const
{
    const double scale = milestoneScale();
    if (scale < 1.0)
        return std::max(1, static_cast<int>(milestoneCount_ * scale));
    if (scale > 1.0)
        return static_cast<int>(milestoneCount_ * scale);
    return milestoneCount_;
}

int ShortTermObjective::milestonesCompleted() const
{
    return std::min(milestonesCompleted_, milestoneCount());
}

void ShortTermObjective::setMilestoneCount(int count)
{
    milestoneCount_ = std::max(0, count);
    milestonesCompleted_ = std::min(milestonesCompleted_, milestoneCount_);
    setProgress(computeProgress());
}

void ShortTermObjective::onModifiersChanged()
{
    setProgress(computeProgress());
}

bool ShortTermObjective::addMilestone()
{
    if (milestonesCompleted_ >= milestoneCount())
        return false;
    ++milestonesCompleted_;
    return true;
}

void ShortTermObjective::addDiscovery(const std::string& discovery)
{
    requiredDiscoveries_.insert(discovery);
}

double ShortTermObjective::computeProgress() const
{
    const bool hasDiscoveries = !requiredDiscoveries_.empty();
    const int milestones      = milestoneCount();
    const bool hasMilestones  = milestones > 0;

    const double d = hasDiscoveries
        ? static_cast<double>(discoveriesMade_.size()) / static_cast<double>(requiredDiscoveries_.size())
        : 0.0;
    const double m = hasMilestones
        ? static_cast<double>(std::min(milestonesCompleted_, milestones)) / static_cast<double>(milestones)
        : 0.0;

    if (hasDiscoveries && hasMilestones)
        return d * 0.6 + m * 0.4;
    if (hasDiscoveries)
        return d;
    if (hasMilestones)
        return m;
    return 0.0;
}

bool ShortTermObjective::updateProgress(GameState&, const ActionData& action, TimePoint)
{
    bool progressMade = false;

    if (const json* disc = Find(action, "discovery"); disc && disc->is_string())
    {
        const auto discovery = disc->get<std::string>();
        if (requiredDiscoveries_.count(discovery) && !discoveriesMade_.count(discovery))
        {
            discoveriesMade_.insert(discovery);
            progressMade = true;
            logEvent("discovery_made", {{"discovery", discovery}});
        }
    }

    if (const json* ms = Find(action, "milestone_completed"); ms && Truthy(*ms))
    {
        const int total = milestoneCount();
        milestonesCompleted_ = std::min(milestonesCompleted_ + 1, total);
        progressMade = true;
        logEvent("milestone_completed", {{"milestone", milestonesCompleted_}, {"total", total}});
    }

    setProgress(computeProgress());

    if (tensionRampEnabled_ && progressMade)
        updateTension();

    return progressMade;
}

void ShortTermObjective::updateTension()
{
    tension_ = initialTension_ + progress() * (maxTension_ - initialTension_);
    logEvent("tension_updated", {{"tension_level", tension_}, {"progress", progress()}});

    for (const auto& cb : tensionCallbacks_)
    {
        try
        {
            cb(tension_, progress());
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Error in tension callback for {}: {}", id(), e.what());
        }
    }
}

json ShortTermObjective::displayInfo(TimePoint now) const
{
    json info = Objective::displayInfo(now);
    std::vector<std::string> remaining;
    for (const auto& d : requiredDiscoveries_)
        if (!discoveriesMade_.count(d))
            remaining.push_back(d);

    info["milestones"]  = {{"completed", milestonesCompleted()}, {"total", milestoneCount()}};
    info["discoveries"] = {{"required", ToVector(requiredDiscoveries_)},
                           {"made", ToVector(discoveriesMade_)},
                           {"remaining", remaining}};
    info["scene_context"] = sceneContext_;
    info["tension_level"] = tension_;
    return info;
}

void ShortTermObjective::writeDefinition(json& params) const
{
    params["milestone_count"]      = milestoneCount_;
    params["required_discoveries"] = ToVector(requiredDiscoveries_);
    params["sub_objectives"]       = subObjectives_;
    params["scene_context"]        = sceneContext_;
    params["tension_ramp_enabled"] = tensionRampEnabled_;
    params["initial_tension"]      = initialTension_;
    params["max_tension"]          = maxTension_;
}

void ShortTermObjective::saveState(json& state) const
{
    state["milestones_completed"] = milestonesCompleted_;
    state["discoveries_made"]     = ToVector(discoveriesMade_);
    state["tension_level"]        = tension_;
}

void ShortTermObjective::restoreState(const json& state)
{
    milestonesCompleted_ = std::clamp(GetOr(state, "milestones_completed", 0), 0, milestoneCount());
    const auto made = GetOr(state, "discoveries_made", std::vector<std::string>{});
    discoveriesMade_ = std::set<std::string>(made.begin(), made.end());
    tension_ = GetOr(state, "tension_level", initialTension_);
}

} // namespace eldritch
