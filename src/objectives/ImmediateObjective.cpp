// src/objectives/ImmediateObjective.cpp
#include "eldritch/objectives/ImmediateObjective.h"

namespace eldritch {

ImmediateObjective::ImmediateObjective(ObjectiveDef def, Params params, TimePoint createdAt)
    : Objective(WithScopeDefaults(std::move(def), ObjectiveScope::Immediate, Minutes(5)), createdAt)
    , required_(params.requiredActions.begin(), params.requiredActions.end())
    , autoCompleteOnAction_(params.autoCompleteOnAction)
    , provideImmediateFeedback_(params.provideImmediateFeedback)
{
}

std::unique_ptr<ImmediateObjective> ImmediateObjective::FromParams(const std::string& id, const json& params, TimePoint now)
{
    Params p;
    p.requiredActions          = GetOr(params, "required_actions", p.requiredActions);
    p.autoCompleteOnAction     = GetOr(params, "auto_complete_on_action", p.autoCompleteOnAction);
    p.provideImmediateFeedback = GetOr(params, "provide_immediate_feedback", p.provideImmediateFeedback);
    return std::make_unique<ImmediateObjective>(DefFromParams(id, params, ObjectiveScope::Immediate), std::move(p), now);
}

std::set<std::string> ImmediateObjective::requiredActions() const
{
    std::set<std::string> out = required_;
    for (const auto& m : modifiers())
        out.insert(m.addedRequiredActions.begin(), m.addedRequiredActions.end());
    return out;
}

std::set<std::string> ImmediateObjective::remainingActions() const
{
    std::set<std::string> out;
    for (const auto& a : requiredActions())
        if (!completed_.count(a))
            out.insert(a);
    return out;
}

void ImmediateObjective::addRequiredAction(const std::string& action)
{
    required_.insert(action);
    setProgress(coverage());
}

double ImmediateObjective::coverage() const
{
    const auto required = requiredActions();
    if (required.empty())
        return 0.0;
    std::size_t done = 0;
    for (const auto& a : required)
        done += completed_.count(a);
    return static_cast<double>(done) / static_cast<double>(required.size());
}

bool ImmediateObjective::updateProgress(GameState& state, const ActionData& action, TimePoint now)
{
    bool progressMade = false;
    const auto required = requiredActions();

    const auto actionType = GetOr<std::string>(action, "action_type", "");
    if (!actionType.empty() && required.count(actionType) && !completed_.count(actionType))
    {
        completed_.insert(actionType);
        progressMade = true;

        if (provideImmediateFeedback_)
        {
            const auto remaining = remainingActions();
            logEvent("action_completed", {{"action", actionType},
                                          {"remaining", std::vector<std::string>(remaining.begin(), remaining.end())}});
        }
    }

    if (!required.empty())
        setProgress(coverage());
    else
        setProgress(simpleCompletion_ && simpleCompletion_(state) ? 1.0 : 0.0);

    if (autoCompleteOnAction_ && progress() >= 1.0)
        complete(state, now);

    return progressMade;
}

json ImmediateObjective::displayInfo(TimePoint now) const
{
    json info = Objective::displayInfo(now);
    const auto required = requiredActions();
    const auto remaining = remainingActions();
    info["required_actions"]   = std::vector<std::string>(required.begin(), required.end());
    info["completed_actions"]  = std::vector<std::string>(completed_.begin(), completed_.end());
    info["remaining_actions"]  = std::vector<std::string>(remaining.begin(), remaining.end());
    info["immediate_feedback"] = provideImmediateFeedback_;
    return info;
}

void ImmediateObjective::writeDefinition(json& params) const
{
    params["required_actions"]           = std::vector<std::string>(required_.begin(), required_.end());
    params["auto_complete_on_action"]    = autoCompleteOnAction_;
    params["provide_immediate_feedback"] = provideImmediateFeedback_;
}

void ImmediateObjective::saveState(json& state) const
{
    state["completed_actions"] = std::vector<std::string>(completed_.begin(), completed_.end());
}

void ImmediateObjective::restoreState(const json& state)
{
    const auto done = GetOr(state, "completed_actions", std::vector<std::string>{});
    completed_ = std::set<std::string>(done.begin(), done.end());
}

} // namespace eldritch
