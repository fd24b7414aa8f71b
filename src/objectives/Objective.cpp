// src/objectives/Objective.cpp
#include "eldritch/objectives/Objective.h"

#include "eldritch/core/Rng.h"
#include "eldritch/logging/Log.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>

namespace eldritch {

namespace {

constexpr std::size_t kEventCapacity = ELDRITCH_OBJECTIVE_EVENT_LOG_CAPACITY;
constexpr std::size_t kSerializedEvents = ELDRITCH_OBJECTIVE_SERIALIZED_EVENTS;

json TimeOrNull(const std::optional<TimePoint>& t)
{
    return t ? json(FormatIso8601(*t)) : json(nullptr);
}

std::optional<TimePoint> ReadTime(const json& dict, const char* key)
{
    const json* v = Find(dict, key);
    if (!v || !v->is_string())
        return std::nullopt;
    return ParseIso8601(v->get<std::string>());
}

} // namespace

Objective::Objective(ObjectiveDef def, TimePoint createdAt)
    : def_(std::move(def))
    , uuid_(rng::uuid4())
    , createdAt_(createdAt)
    , lastUpdate_(createdAt)
{
    if (!def_.metadata.is_object())
        def_.metadata = json::object();
    logsys::get()->debug("Created objective: {} ({})", def_.id, def_.title);
}

std::string Objective::title() const
{
    return titleSuffix_.empty() ? def_.title : def_.title + titleSuffix_;
}

std::string Objective::description() const
{
    return descriptionOverride_.empty() ? def_.description : descriptionOverride_;
}

ObjectivePriority Objective::priority() const noexcept
{
    int value = ToInt(def_.priority);
    for (const auto& m : modifiers_)
        value += m.priorityDelta;
    return ClampPriority(value);
}

std::optional<Seconds> Objective::timeLimit() const
{
    if (!def_.timeLimit)
        return std::nullopt;

    double secs = static_cast<double>(def_.timeLimit->count());
    for (const auto& m : modifiers_)
        secs *= m.timeLimitScale;
    for (const auto& m : modifiers_)
        secs -= m.timePressureMinutes * 60.0;

    const double floor = static_cast<double>(Minutes(1).count());
    return Seconds(static_cast<long long>(std::max(secs, floor)));
}

void Objective::addChild(const std::string& childId)
{
    auto& c = def_.children;
    if (std::find(c.begin(), c.end(), childId) == c.end())
        c.push_back(childId);
}

void Objective::removeChild(const std::string& childId)
{
    auto& c = def_.children;
    c.erase(std::remove(c.begin(), c.end(), childId), c.end());
}

bool Objective::isActive() const noexcept
{
    return status_ == ObjectiveStatus::Active || status_ == ObjectiveStatus::InProgress;
}

bool Objective::isFailed() const noexcept
{
    return status_ == ObjectiveStatus::Failed
        || status_ == ObjectiveStatus::Expired
        || status_ == ObjectiveStatus::Abandoned;
}

bool Objective::isExpired(TimePoint now) const
{
    const auto limit = timeLimit();
    if (!limit || !activatedAt_ || !isActive())
        return false;
    return now >= *activatedAt_ + *limit;
}

std::optional<Seconds> Objective::timeRemaining(TimePoint now) const
{
    const auto limit = timeLimit();
    if (!limit || !activatedAt_)
        return std::nullopt;
    const auto remaining = std::chrono::duration_cast<Seconds>(*activatedAt_ + *limit - now);
    return remaining.count() > 0 ? remaining : Seconds(0);
}

// ----------------------------------------------------------------------------
// Transitions
// ----------------------------------------------------------------------------

bool Objective::canActivate(const GameState& state) const
{
    if (status_ != ObjectiveStatus::Inactive)
        return false;
    return std::all_of(def_.activationConditions.begin(), def_.activationConditions.end(),
                       [&](const Condition& c) { return c.evaluate(state); });
}

bool Objective::activate(const GameState& state, TimePoint now)
{
    if (!canActivate(state))
        return false;

    status_ = ObjectiveStatus::Active;
    activatedAt_ = now;
    lastUpdate_ = now;
    ++attemptCount_;

    logEvent("activated", {{"game_state_snapshot", captureRelevantState(state)}});
    logsys::get()->info("Objective activated: {}", title());
    return true;
}

bool Objective::startProgress(TimePoint now)
{
    if (status_ != ObjectiveStatus::Active)
        return false;

    status_ = ObjectiveStatus::InProgress;
    lastUpdate_ = now;
    logEvent("progress_started");
    logsys::get()->info("Objective progress started: {}", title());
    return true;
}

bool Objective::complete(GameState& state, TimePoint now)
{
    if (!isActive())
        return false;

    status_ = ObjectiveStatus::Completed;
    progress_ = 1.0;
    completedAt_ = now;
    lastUpdate_ = now;

    const auto applied = applyRewards(state);
    logEvent("completed", {{"completion_time", FormatIso8601(now)},
                           {"final_progress", progress_},
                           {"rewards_applied", applied}});
    logsys::get()->info("Objective completed: {}", title());
    return true;
}

bool Objective::fail(GameState& state, const std::string& reason, TimePoint now)
{
    if (isTerminal())
        return false;

    status_ = ObjectiveStatus::Failed;
    lastUpdate_ = now;

    const auto applied = applyConsequences(state);
    logEvent("failed", {{"reason", reason},
                        {"final_progress", progress_},
                        {"consequences_applied", applied}});
    logsys::get()->warn("Objective failed: {} - {}", title(), reason);
    return true;
}

bool Objective::abandon(TimePoint now)
{
    if (isTerminal())
        return false;

    status_ = ObjectiveStatus::Abandoned;
    lastUpdate_ = now;
    logEvent("abandoned");
    logsys::get()->info("Objective abandoned: {}", title());
    return true;
}

bool Objective::suspend(TimePoint now)
{
    if (!isActive())
        return false;

    status_ = ObjectiveStatus::Suspended;
    lastUpdate_ = now;
    logEvent("suspended");
    logsys::get()->info("Objective suspended: {}", title());
    return true;
}

bool Objective::resume(TimePoint now)
{
    if (status_ != ObjectiveStatus::Suspended)
        return false;

    status_ = ObjectiveStatus::Active;
    lastUpdate_ = now;
    logEvent("resumed");
    logsys::get()->info("Objective resumed: {}", title());
    return true;
}

bool Objective::update(GameState& state, const ActionData& action, TimePoint now)
{
    if (isTerminal())
        return false;

    lastUpdate_ = now;

    if (isExpired(now))
    {
        status_ = ObjectiveStatus::Expired;
        const auto applied = applyConsequences(state);
        logEvent("expired", {{"consequences_applied", applied}});
        logsys::get()->warn("Objective expired: {}", title());
        return true;
    }

    if (!isActive())
        return false;

    const bool changed = updateProgress(state, action, now);

    if (isActive() && checkCompletion(state))
    {
        complete(state, now);
        return true;
    }
    return changed;
}

bool Objective::checkCompletion(const GameState& state) const
{
    if (!isActive())
        return false;

    const auto& conds = def_.completionConditions;
    if (!conds.empty())
        return std::all_of(conds.begin(), conds.end(),
                           [&](const Condition& c) { return c.evaluate(state); });

    return progress_ >= 1.0;
}

// ----------------------------------------------------------------------------
// Modifiers
// ----------------------------------------------------------------------------

bool Objective::applyModifier(ObjectiveModifier modifier)
{
    if (isTerminal())
    {
        logsys::get()->debug("Modifier {} ignored: {} is {}", modifier.source, def_.id, ToString(status_));
        return false;
    }

    modifiers_.erase(std::remove_if(modifiers_.begin(), modifiers_.end(),
                                    [&](const ObjectiveModifier& m) { return m.source == modifier.source; }),
                     modifiers_.end());
    modifiers_.push_back(std::move(modifier));
    onModifiersChanged();
    return true;
}

std::size_t Objective::removeModifiers(const std::string& source)
{
    if (isTerminal())
        return 0;

    const auto before = modifiers_.size();
    modifiers_.erase(std::remove_if(modifiers_.begin(), modifiers_.end(),
                                    [&](const ObjectiveModifier& m) { return m.source == source; }),
                     modifiers_.end());
    const std::size_t removed = before - modifiers_.size();
    if (removed > 0)
        onModifiersChanged();
    return removed;
}

double Objective::milestoneScale() const
{
    double scale = 1.0;
    for (const auto& m : modifiers_)
        scale *= m.milestoneScale;
    return scale;
}

double Objective::sanRiskScale() const
{
    double scale = 1.0;
    for (const auto& m : modifiers_)
        scale *= m.sanRiskScale;
    return scale;
}

bool Objective::hasModifier(const std::string& source) const
{
    return std::any_of(modifiers_.begin(), modifiers_.end(),
                       [&](const ObjectiveModifier& m) { return m.source == source; });
}

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

void Objective::setProgress(double value) noexcept
{
    if (isTerminal())
        return;
    progress_ = std::clamp(value, 0.0, 1.0);
}

void Objective::logEvent(const std::string& type, json data)
{
    ObjectiveEvent e;
    e.timestamp = lastUpdate_;
    e.type = type;
    e.status = status_;
    e.progress = progress_;
    e.data = std::move(data);
    events_.push_back(std::move(e));

    while (events_.size() > kEventCapacity)
        events_.pop_front();
}

std::vector<std::string> Objective::applyRewards(GameState& state)
{
    std::vector<std::string> applied;
    for (const auto& reward : def_.rewards)
    {
        try
        {
            if (rewardHandler_)
                rewardHandler_(reward, state);
            applied.push_back(reward.toString());
            logsys::get()->info("Applied reward: {}", reward.toString());
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Failed to apply reward {}: {}", reward.toString(), e.what());
        }
    }
    return applied;
}

std::vector<std::string> Objective::applyConsequences(GameState& state)
{
    std::vector<std::string> applied;
    for (const auto& consequence : def_.consequences)
    {
        try
        {
            if (consequenceHandler_)
                consequenceHandler_(consequence, state);
            applied.push_back(consequence.toString());
            logsys::get()->warn("Applied consequence: {}", consequence.toString());
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Failed to apply consequence {}: {}", consequence.toString(), e.what());
        }
    }
    return applied;
}

json Objective::captureRelevantState(const GameState& state) const
{
    static const char* kKeys[] = {"location", "sanity", "hp", "time", "npcs_met", "items_found"};
    json out = json::object();
    for (const char* key : kKeys)
        if (const json* v = Find(state, key))
            out[key] = *v;
    return out;
}

// ----------------------------------------------------------------------------
// Views / persistence
// ----------------------------------------------------------------------------

json Objective::displayInfo(TimePoint now) const
{
    json timeInfo = nullptr;
    if (const auto remaining = timeRemaining(now))
        timeInfo = {{"remaining", FormatDurationHMS(*remaining)}, {"expired", isExpired(now)}};

    json rewardsOut = json::array();
    for (const auto& r : def_.rewards)
        rewardsOut.push_back(r.toString());
    json consequencesOut = json::array();
    for (const auto& c : def_.consequences)
        consequencesOut.push_back(c.toString());

    return {
        {"id", def_.id},
        {"title", title()},
        {"description", description()},
        {"type", ToString(def_.type)},
        {"scope", ToString(def_.scope)},
        {"priority", ToInt(priority())},
        {"status", ToString(status_)},
        {"progress", progress_},
        {"time_info", timeInfo},
        {"rewards", rewardsOut},
        {"consequences", consequencesOut},
    };
}

json Objective::definition() const
{
    json params = DefToParams(def_);
    writeDefinition(params);
    return params;
}

json Objective::toDict() const
{
    const auto limit = timeLimit();

    json events = json::array();
    const std::size_t skip = events_.size() > kSerializedEvents ? events_.size() - kSerializedEvents : 0;
    for (std::size_t i = skip; i < events_.size(); ++i)
        events.push_back(EventToJson(events_[i], def_.id));

    json mods = json::array();
    for (const auto& m : modifiers_)
        mods.push_back(m);

    json state = json::object();
    saveState(state);

    return {
        {"objective_id", def_.id},
        {"uuid", uuid_},
        {"title", title()},
        {"description", description()},
        {"objective_type", ToString(def_.type)},
        {"scope", ToString(def_.scope)},
        {"priority", ToInt(priority())},
        {"status", ToString(status_)},
        {"progress", progress_},
        {"created_at", FormatIso8601(createdAt_)},
        {"activated_at", TimeOrNull(activatedAt_)},
        {"completed_at", TimeOrNull(completedAt_)},
        {"last_update", FormatIso8601(lastUpdate_)},
        {"time_limit", limit ? json(limit->count()) : json(nullptr)},
        {"parent_objective", def_.parent.empty() ? json(nullptr) : json(def_.parent)},
        {"child_objectives", def_.children},
        {"metadata", def_.metadata},
        {"attempt_count", attemptCount_},
        {"events", events},
        {"variant", variantName()},
        {"definition", definition()},
        {"state", state},
        {"modifiers", mods},
    };
}

void Objective::restore(const json& dict)
{
    uuid_ = GetOr<std::string>(dict, "uuid", uuid_);

    const auto statusName = GetOr<std::string>(dict, "status", ToString(status_));
    if (const auto s = ParseObjectiveStatus(statusName))
        status_ = *s;

    progress_ = std::clamp(GetOr(dict, "progress", progress_), 0.0, 1.0);
    if (const auto t = ReadTime(dict, "created_at"))
        createdAt_ = *t;
    activatedAt_ = ReadTime(dict, "activated_at");
    completedAt_ = ReadTime(dict, "completed_at");
    lastUpdate_ = ReadTime(dict, "last_update").value_or(activatedAt_.value_or(createdAt_));
    attemptCount_ = GetOr(dict, "attempt_count", attemptCount_);

    def_.parent = GetOr<std::string>(dict, "parent_objective", def_.parent);
    def_.children = GetOr(dict, "child_objectives", def_.children);
    def_.metadata = GetOr(dict, "metadata", def_.metadata);

    modifiers_.clear();
    if (const json* mods = Find(dict, "modifiers"); mods && mods->is_array())
        for (const auto& m : *mods)
            modifiers_.push_back(m.get<ObjectiveModifier>());

    events_.clear();
    if (const json* evs = Find(dict, "events"); evs && evs->is_array())
        for (const auto& e : *evs)
            events_.push_back(EventFromJson(e));

    if (const json* st = Find(dict, "state"); st && st->is_object())
        restoreState(*st);
}

std::string Objective::toString() const
{
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%.1f%%", progress_ * 100.0);
    return title() + " (" + ToString(status_) + ", " + pct + ")";
}

json EventToJson(const ObjectiveEvent& e, const std::string& objectiveId)
{
    return {
        {"timestamp", FormatIso8601(e.timestamp)},
        {"event_type", e.type},
        {"objective_id", objectiveId},
        {"status", ToString(e.status)},
        {"progress", e.progress},
        {"data", e.data},
    };
}

ObjectiveEvent EventFromJson(const json& j)
{
    ObjectiveEvent e;
    if (const json* ts = Find(j, "timestamp"); ts && ts->is_string())
        e.timestamp = ParseIso8601(ts->get<std::string>()).value_or(TimePoint{});
    e.type = GetOr<std::string>(j, "event_type", "");
    e.status = ParseObjectiveStatus(GetOr<std::string>(j, "status", "inactive")).value_or(ObjectiveStatus::Inactive);
    e.progress = GetOr(j, "progress", 0.0);
    e.data = GetOr(j, "data", json::object());
    return e;
}

} // namespace eldritch
