// src/objectives/ObjectiveManager.cpp
#include "eldritch/objectives/ObjectiveManager.h"

#include "eldritch/core/Errors.h"
#include "eldritch/io/AtomicFile.h"
#include "eldritch/logging/Log.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <map>

namespace eldritch {

namespace {

constexpr const char* kUrgencySource = "urgency";

bool HoldsActiveSlot(ObjectiveStatus s) noexcept
{
    return s == ObjectiveStatus::Active || s == ObjectiveStatus::InProgress || s == ObjectiveStatus::Suspended;
}

bool IsFailure(ObjectiveStatus s) noexcept
{
    return s == ObjectiveStatus::Failed || s == ObjectiveStatus::Expired || s == ObjectiveStatus::Abandoned;
}

json IdList(const std::vector<Objective*>& objectives)
{
    json ids = json::array();
    for (const auto* o : objectives)
        ids.push_back(o->id());
    return ids;
}

} // namespace

json UpdateReport::toJson() const
{
    return {{"activated", activated},
            {"updated", updated},
            {"completed", completed},
            {"failed", failed},
            {"expired", expired}};
}

ObjectiveManager::ObjectiveManager(ManagerConfig config, ObjectiveRegistry registry, Clock clock)
    : config_(config)
    , registry_(std::move(registry))
    , clock_(clock ? std::move(clock) : SystemClockSource())
    , bus_(static_cast<std::size_t>(std::max(1, config.recentEventCapacity)))
    , lastUpdate_(clock_())
{
    // Const views need their pools to exist.
    arena_.storage<ecs::ObjectiveSlot>();
    arena_.storage<ecs::HierarchyNode>();
    arena_.storage<ecs::ActiveTag>();
    arena_.storage<ecs::CompletedTag>();
    arena_.storage<ecs::FailedTag>();

    logsys::get()->info("ObjectiveManager initialized");
}

// ---------------------------------------------------------------------------
// Arena plumbing
// ---------------------------------------------------------------------------

entt::entity ObjectiveManager::entityOf(const std::string& id) const
{
    auto it = byId_.find(id);
    return it == byId_.end() ? static_cast<entt::entity>(entt::null) : it->second;
}

Objective& ObjectiveManager::objectiveOf(entt::entity e) const
{
    return *arena_.get<ecs::ObjectiveSlot>(e).objective;
}

void ObjectiveManager::link(entt::entity parent, entt::entity child)
{
    if (parent == child)
        return;

    auto& childNode = arena_.get<ecs::HierarchyNode>(child);
    if (childNode.parent == parent)
        return;
    if (childNode.parent != entt::null)
    {
        auto& oldSiblings = arena_.get<ecs::HierarchyNode>(childNode.parent).children;
        oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), child), oldSiblings.end());
    }

    childNode.parent = parent;
    arena_.get<ecs::HierarchyNode>(parent).children.push_back(child);
}

void ObjectiveManager::unlinkAll(entt::entity e)
{
    auto& node = arena_.get<ecs::HierarchyNode>(e);

    if (node.parent != entt::null)
    {
        auto& siblings = arena_.get<ecs::HierarchyNode>(node.parent).children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), e), siblings.end());
        node.parent = entt::null;
    }

    for (auto child : node.children)
        arena_.get<ecs::HierarchyNode>(child).parent = entt::null;
    node.children.clear();
}

void ObjectiveManager::insert(std::unique_ptr<Objective> objective, std::uint64_t sequence)
{
    const std::string id = objective->id();
    const entt::entity e = arena_.create();

    arena_.emplace<ecs::ObjectiveSlot>(e, std::move(objective), sequence);
    arena_.emplace<ecs::HierarchyNode>(e);
    byId_.emplace(id, e);

    const Objective& added = objectiveOf(e);

    // Links may be declared on either side, and either side may arrive first.
    if (const entt::entity p = entityOf(added.parent()); p != entt::null)
        link(p, e);
    for (const auto& childId : added.children())
        if (const entt::entity c = entityOf(childId); c != entt::null)
            link(e, c);

    for (auto other : arena_.view<ecs::ObjectiveSlot>())
    {
        if (other == e)
            continue;
        const Objective& o = objectiveOf(other);
        if (o.parent() == id)
            link(e, other);
        else if (std::find(o.children().begin(), o.children().end(), id) != o.children().end())
            link(other, e);
    }
}

template <typename Pred>
std::vector<Objective*> ObjectiveManager::collect(Pred pred) const
{
    std::vector<std::pair<std::uint64_t, Objective*>> hits;
    for (auto [e, slot] : arena_.view<const ecs::ObjectiveSlot>().each())
    {
        (void)e;
        if (pred(*slot.objective))
            hits.emplace_back(slot.sequence, slot.objective.get());
    }
    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Objective*> out;
    out.reserve(hits.size());
    for (auto& h : hits)
        out.push_back(h.second);
    return out;
}

void ObjectiveManager::syncTags()
{
    for (auto [e, slot] : arena_.view<ecs::ObjectiveSlot>().each())
    {
        const ObjectiveStatus s = slot.objective->status();
        const bool wantActive = HoldsActiveSlot(s);
        const bool wantCompleted = s == ObjectiveStatus::Completed;
        const bool wantFailed = IsFailure(s);

        if (wantActive != arena_.all_of<ecs::ActiveTag>(e))
        {
            if (wantActive) arena_.emplace<ecs::ActiveTag>(e);
            else            arena_.remove<ecs::ActiveTag>(e);
        }
        if (wantCompleted != arena_.all_of<ecs::CompletedTag>(e))
        {
            if (wantCompleted) arena_.emplace<ecs::CompletedTag>(e);
            else               arena_.remove<ecs::CompletedTag>(e);
        }
        if (wantFailed != arena_.all_of<ecs::FailedTag>(e))
        {
            if (wantFailed) arena_.emplace<ecs::FailedTag>(e);
            else            arena_.remove<ecs::FailedTag>(e);
        }
    }
}

void ObjectiveManager::emit(const std::string& type, json data, TimePoint now)
{
    bus_.emit(type, std::move(data), now);
}

// ---------------------------------------------------------------------------
// Creation / removal
// ---------------------------------------------------------------------------

Objective& ObjectiveManager::addObjective(std::unique_ptr<Objective> objective)
{
    if (!objective)
        throw ObjectiveManagerError("Cannot add a null objective");
    if (contains(objective->id()))
        throw ObjectiveManagerError("Objective with ID '" + objective->id() + "' already exists");

    const std::string id = objective->id();
    insert(std::move(objective), nextSequence_++);
    syncTags();

    Objective& added = *get(id);
    ++stats_.objectivesCreated;
    emit("objective_created", {{"objective_id", id}}, clock_());
    logsys::get()->info("Added objective: {}", added.title());
    return added;
}

Objective& ObjectiveManager::createObjective(const std::string& variant, const std::string& id, const json& params)
{
    if (contains(id))
        throw ObjectiveManagerError("Objective with ID '" + id + "' already exists");
    return addObjective(registry_.create(variant, id, params, clock_()));
}

Objective& ObjectiveManager::createFromTemplate(const std::string& templateName, const std::string& id,
                                                const json& overrides)
{
    if (contains(id))
        throw ObjectiveManagerError("Objective with ID '" + id + "' already exists");
    return addObjective(registry_.createFromTemplate(templateName, id, overrides, clock_()));
}

bool ObjectiveManager::removeObjective(const std::string& id)
{
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return false;

    const std::string title = objectiveOf(e).title();
    unlinkAll(e);
    arena_.destroy(e);
    byId_.erase(id);

    emit("objective_removed", {{"objective_id", id}}, clock_());
    logsys::get()->info("Removed objective: {}", title);
    return true;
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

Objective* ObjectiveManager::get(const std::string& id)
{
    const entt::entity e = entityOf(id);
    return e == entt::null ? nullptr : &objectiveOf(e);
}

const Objective* ObjectiveManager::get(const std::string& id) const
{
    const entt::entity e = entityOf(id);
    return e == entt::null ? nullptr : &objectiveOf(e);
}

std::vector<Objective*> ObjectiveManager::all() const
{
    return collect([](const Objective&) { return true; });
}

std::vector<Objective*> ObjectiveManager::byStatus(ObjectiveStatus status) const
{
    return collect([status](const Objective& o) { return o.status() == status; });
}

std::vector<Objective*> ObjectiveManager::byType(ObjectiveType type) const
{
    return collect([type](const Objective& o) { return o.type() == type; });
}

std::vector<Objective*> ObjectiveManager::byScope(ObjectiveScope scope) const
{
    return collect([scope](const Objective& o) { return o.scope() == scope; });
}

std::vector<Objective*> ObjectiveManager::byPriority(ObjectivePriority priority) const
{
    return collect([priority](const Objective& o) { return o.priority() == priority; });
}

std::vector<Objective*> ObjectiveManager::active() const
{
    return collect([](const Objective& o) { return HoldsActiveSlot(o.status()); });
}

std::vector<Objective*> ObjectiveManager::completed() const
{
    return collect([](const Objective& o) { return o.isCompleted(); });
}

std::vector<Objective*> ObjectiveManager::failed() const
{
    return collect([](const Objective& o) { return IsFailure(o.status()); });
}

std::vector<Objective*> ObjectiveManager::available(const GameState& state) const
{
    return collect([&state](const Objective& o) { return o.canActivate(state); });
}

std::vector<Objective*> ObjectiveManager::priorityObjectives() const
{
    auto out = active();
    std::stable_sort(out.begin(), out.end(), [](const Objective* a, const Objective* b) {
        return ToInt(a->priority()) > ToInt(b->priority());
    });
    return out;
}

std::vector<Objective*> ObjectiveManager::childrenOf(const std::string& id) const
{
    std::vector<Objective*> out;
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return out;
    for (auto child : arena_.get<ecs::HierarchyNode>(e).children)
        out.push_back(&objectiveOf(child));
    return out;
}

Objective* ObjectiveManager::parentOf(const std::string& id) const
{
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return nullptr;
    const entt::entity p = arena_.get<ecs::HierarchyNode>(e).parent;
    return p == entt::null ? nullptr : &objectiveOf(p);
}

std::size_t ObjectiveManager::activeCount() const
{
    std::size_t n = 0;
    for (auto e : arena_.view<const ecs::ActiveTag>())
    {
        (void)e;
        ++n;
    }
    return n;
}

std::size_t ObjectiveManager::activeCount(ObjectiveScope scope) const
{
    std::size_t n = 0;
    for (auto [e, slot] : arena_.view<const ecs::ObjectiveSlot, const ecs::ActiveTag>().each())
    {
        (void)e;
        if (slot.objective->scope() == scope)
            ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// Per-turn update
// ---------------------------------------------------------------------------

UpdateReport ObjectiveManager::updateAll(GameState& state, const ActionData& action)
{
    return updateAll(state, action, clock_());
}

UpdateReport ObjectiveManager::updateAll(GameState& state, const ActionData& action, TimePoint now)
{
    UpdateReport report;

    syncTags();
    admitCandidates(state, report, now);

    // Snapshot first: filing terminal objectives changes the ActiveTag pool.
    std::vector<entt::entity> toUpdate;
    for (auto e : arena_.view<ecs::ActiveTag>())
        toUpdate.push_back(e);
    std::sort(toUpdate.begin(), toUpdate.end(), [this](entt::entity a, entt::entity b) {
        return arena_.get<ecs::ObjectiveSlot>(a).sequence < arena_.get<ecs::ObjectiveSlot>(b).sequence;
    });

    for (auto e : toUpdate)
    {
        Objective& objective = objectiveOf(e);
        try
        {
            if (objective.update(state, action, now))
            {
                report.updated.push_back(objective.id());
                ++stats_.totalProgressUpdates;
            }
        }
        catch (const std::exception& ex)
        {
            logsys::get()->error("Error updating objective {}: {}", objective.id(), ex.what());
            objective.fail(state, std::string("Update error: ") + ex.what(), now);
        }
        catch (...)
        {
            logsys::get()->error("Error updating objective {}: unknown exception", objective.id());
            objective.fail(state, "Update error: unknown exception", now);
        }

        if (objective.isTerminal())
            fileTerminal(e, &report, now);
    }

    sweepRetention(now);
    refreshUrgency(now);

    lastUpdate_ = now;
    ++updateCount_;
    logsys::get()->debug("Objective update #{}: {} activated, {} updated, {} completed, {} failed, {} expired",
                         updateCount_, report.activated.size(), report.updated.size(), report.completed.size(),
                         report.failed.size(), report.expired.size());
    return report;
}

void ObjectiveManager::admitCandidates(const GameState& state, UpdateReport& report, TimePoint now)
{
    std::vector<std::pair<std::uint64_t, entt::entity>> candidates;
    for (auto [e, slot] : arena_.view<ecs::ObjectiveSlot>().each())
        if (slot.objective->canActivate(state))
            candidates.emplace_back(slot.sequence, e);

    std::sort(candidates.begin(), candidates.end(), [this](const auto& a, const auto& b) {
        const int pa = ToInt(objectiveOf(a.second).priority());
        const int pb = ToInt(objectiveOf(b.second).priority());
        return pa != pb ? pa > pb : a.first < b.first;
    });

    const auto maxActive = static_cast<std::size_t>(std::max(0, config_.maxActiveObjectives));
    for (const auto& c : candidates)
    {
        if (activeCount() >= maxActive)
            break;

        Objective& objective = objectiveOf(c.second);
        const ObjectiveScope scope = objective.scope();
        if (scope == ObjectiveScope::Immediate
            && activeCount(scope) >= static_cast<std::size_t>(std::max(0, config_.maxImmediateObjectives)))
            continue;
        if (scope == ObjectiveScope::ShortTerm
            && activeCount(scope) >= static_cast<std::size_t>(std::max(0, config_.maxShortTermObjectives)))
            continue;

        if (objective.activate(state, now))
        {
            arena_.emplace_or_replace<ecs::ActiveTag>(c.second);
            report.activated.push_back(objective.id());
            emit("objective_activated", {{"objective_id", objective.id()}}, now);
        }
    }
}

void ObjectiveManager::fileTerminal(entt::entity e, UpdateReport* report, TimePoint now)
{
    Objective& objective = objectiveOf(e);
    arena_.remove<ecs::ActiveTag>(e);

    if (objective.isCompleted())
    {
        arena_.emplace_or_replace<ecs::CompletedTag>(e);
        ++stats_.objectivesCompleted;
        if (report)
            report->completed.push_back(objective.id());
        emit("objective_completed", {{"objective_id", objective.id()}}, now);
        return;
    }

    arena_.emplace_or_replace<ecs::FailedTag>(e);
    ++stats_.objectivesFailed;
    if (objective.status() == ObjectiveStatus::Expired)
    {
        if (report)
            report->expired.push_back(objective.id());
        emit("objective_expired", {{"objective_id", objective.id()}}, now);
    }
    else
    {
        if (report)
            report->failed.push_back(objective.id());
        emit("objective_failed", {{"objective_id", objective.id()}, {"status", ToString(objective.status())}}, now);
    }
}

void ObjectiveManager::sweepRetention(TimePoint now)
{
    if (!config_.autoCleanupCompleted)
        return;

    const auto window = std::chrono::duration_cast<SystemClock::duration>(
        std::chrono::duration<double, std::ratio<3600>>(config_.autoCleanupAfterHours));
    const TimePoint cutoff = now - window;

    std::vector<std::string> expiredIds;
    for (auto [e, slot] : arena_.view<ecs::ObjectiveSlot, ecs::CompletedTag>().each())
    {
        (void)e;
        const auto doneAt = slot.objective->completedAt();
        if (doneAt && *doneAt < cutoff)
            expiredIds.push_back(slot.objective->id());
    }
    for (auto [e, slot] : arena_.view<ecs::ObjectiveSlot, ecs::FailedTag>().each())
    {
        (void)e;
        if (slot.objective->lastUpdate() < cutoff)
            expiredIds.push_back(slot.objective->id());
    }

    for (const auto& id : expiredIds)
        removeObjective(id);
}

void ObjectiveManager::refreshUrgency(TimePoint now)
{
    if (!config_.enableDynamicPriorities)
        return;

    for (auto [e, slot] : arena_.view<ecs::ObjectiveSlot, ecs::ActiveTag>().each())
    {
        (void)e;
        Objective& objective = *slot.objective;
        const auto limit = objective.timeLimit();
        const auto remaining = objective.timeRemaining(now);

        bool urgent = false;
        if (limit && remaining && limit->count() > 0)
            urgent = static_cast<double>(remaining->count()) < 0.25 * static_cast<double>(limit->count());

        const bool flagged = objective.hasModifier(kUrgencySource);
        if (urgent && !flagged)
        {
            ObjectiveModifier m;
            m.source = kUrgencySource;
            m.priorityDelta = 1;
            objective.applyModifier(std::move(m));
            logsys::get()->debug("Objective {} is running out of time", objective.id());
        }
        else if (!urgent && flagged)
        {
            objective.removeModifiers(kUrgencySource);
        }
    }
}

// ---------------------------------------------------------------------------
// Explicit transitions
// ---------------------------------------------------------------------------

bool ObjectiveManager::activate(const std::string& id, const GameState& state)
{
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return false;

    const TimePoint now = clock_();
    if (!objectiveOf(e).activate(state, now))
        return false;

    arena_.emplace_or_replace<ecs::ActiveTag>(e);
    emit("objective_activated", {{"objective_id", id}}, now);
    return true;
}

bool ObjectiveManager::complete(const std::string& id, GameState& state)
{
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return false;

    const TimePoint now = clock_();
    if (!objectiveOf(e).complete(state, now))
        return false;
    fileTerminal(e, nullptr, now);
    return true;
}

bool ObjectiveManager::fail(const std::string& id, GameState& state, const std::string& reason)
{
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return false;

    const TimePoint now = clock_();
    if (!objectiveOf(e).fail(state, reason, now))
        return false;
    fileTerminal(e, nullptr, now);
    return true;
}

bool ObjectiveManager::abandon(const std::string& id)
{
    const entt::entity e = entityOf(id);
    if (e == entt::null)
        return false;

    const TimePoint now = clock_();
    if (!objectiveOf(e).abandon(now))
        return false;
    fileTerminal(e, nullptr, now);
    return true;
}

bool ObjectiveManager::suspend(const std::string& id)
{
    Objective* o = get(id);
    if (!o || !o->suspend(clock_()))
        return false;
    emit("objective_suspended", {{"objective_id", id}}, clock_());
    return true;
}

bool ObjectiveManager::resume(const std::string& id)
{
    Objective* o = get(id);
    if (!o || !o->resume(clock_()))
        return false;
    emit("objective_resumed", {{"objective_id", id}}, clock_());
    return true;
}

// ---------------------------------------------------------------------------
// Events / suggestions
// ---------------------------------------------------------------------------

int ObjectiveManager::registerEventListener(const std::string& type, Listener listener)
{
    const int id = bus_.subscribe(type, std::move(listener));
    logsys::get()->debug("Registered event listener for: {}", type);
    return id;
}

void ObjectiveManager::registerSuggestionCallback(SuggestionCallback cb)
{
    suggestionCallbacks_.push_back(std::move(cb));
}

std::vector<json> ObjectiveManager::suggestNewObjectives(const GameState& state) const
{
    std::vector<json> suggestions;
    if (!config_.enableAiSuggestions)
        return suggestions;

    std::vector<const Objective*> activeNow;
    for (auto* o : active())
        activeNow.push_back(o);

    for (const auto& cb : suggestionCallbacks_)
    {
        try
        {
            auto batch = cb(state, activeNow);
            suggestions.insert(suggestions.end(), std::make_move_iterator(batch.begin()),
                               std::make_move_iterator(batch.end()));
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Error getting AI suggestions: {}", e.what());
        }
    }
    return suggestions;
}

// ---------------------------------------------------------------------------
// Views
// ---------------------------------------------------------------------------

json ObjectiveManager::displaySummary() const
{
    const TimePoint now = clock_();

    std::map<int, json, std::greater<int>> byPriority;
    for (auto* o : active())
    {
        json& bucket = byPriority[ToInt(o->priority())];
        if (bucket.is_null())
            bucket = json::array();
        bucket.push_back(o->displayInfo(now));
    }

    json activeByPriority = json::object();
    for (auto& kv : byPriority)
        activeByPriority[std::to_string(kv.first)] = std::move(kv.second);

    return {{"total_objectives", size()},
            {"active_count", active().size()},
            {"completed_count", completed().size()},
            {"failed_count", failed().size()},
            {"active_by_priority", activeByPriority},
            {"statistics", {{"objectives_created", stats_.objectivesCreated},
                            {"objectives_completed", stats_.objectivesCompleted},
                            {"objectives_failed", stats_.objectivesFailed},
                            {"total_progress_updates", stats_.totalProgressUpdates}}},
            {"last_update", FormatIso8601(lastUpdate_)}};
}

json ObjectiveManager::statistics() const
{
    json byTypeJ = json::object();
    json byScopeJ = json::object();
    json byPriorityJ = json::object();
    for (auto* o : all())
    {
        byTypeJ[ToString(o->type())] = GetOr(byTypeJ, ToString(o->type()), 0) + 1;
        byScopeJ[ToString(o->scope())] = GetOr(byScopeJ, ToString(o->scope()), 0) + 1;
        const std::string p = std::to_string(ToInt(o->priority()));
        byPriorityJ[p] = GetOr(byPriorityJ, p.c_str(), 0) + 1;
    }

    return {{"basic_stats", {{"objectives_created", stats_.objectivesCreated},
                             {"objectives_completed", stats_.objectivesCompleted},
                             {"objectives_failed", stats_.objectivesFailed},
                             {"total_progress_updates", stats_.totalProgressUpdates}}},
            {"counts", {{"total", size()},
                        {"active", active().size()},
                        {"completed", completed().size()},
                        {"failed", failed().size()}}},
            {"by_type", byTypeJ},
            {"by_scope", byScopeJ},
            {"by_priority", byPriorityJ},
            {"update_info", {{"last_update", FormatIso8601(lastUpdate_)}, {"update_count", updateCount_}}}};
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

json ObjectiveManager::toJson() const
{
    json objectives = json::array();
    for (auto* o : all())
        objectives.push_back(o->toDict());

    return {{"objectives", objectives},
            {"active_objectives", IdList(active())},
            {"completed_objectives", IdList(completed())},
            {"failed_objectives", IdList(failed())},
            {"statistics", {{"objectives_created", stats_.objectivesCreated},
                            {"objectives_completed", stats_.objectivesCompleted},
                            {"objectives_failed", stats_.objectivesFailed},
                            {"total_progress_updates", stats_.totalProgressUpdates}}},
            {"last_update", FormatIso8601(lastUpdate_)},
            {"update_count", updateCount_}};
}

bool ObjectiveManager::loadFromJson(const json& doc, std::string* outError)
{
    std::vector<std::unique_ptr<Objective>> loaded;
    try
    {
        const json* objectives = Find(doc, "objectives");
        if (!objectives || !objectives->is_array())
            throw ObjectiveManagerError("document has no 'objectives' array");

        for (const auto& dict : *objectives)
        {
            auto objective = registry_.fromDict(dict);
            for (const auto& prior : loaded)
                if (prior->id() == objective->id())
                    throw ObjectiveManagerError("duplicate objective id '" + objective->id() + "'");
            loaded.push_back(std::move(objective));
        }
    }
    catch (const std::exception& e)
    {
        logsys::get()->error("Failed to load objectives: {}", e.what());
        if (outError)
            *outError = e.what();
        return false;
    }

    arena_.clear();
    byId_.clear();
    nextSequence_ = 0;
    for (auto& objective : loaded)
        insert(std::move(objective), nextSequence_++);
    syncTags();

    const json stats = GetOr(doc, "statistics", json::object());
    stats_.objectivesCreated    = GetOr<std::uint64_t>(stats, "objectives_created", 0);
    stats_.objectivesCompleted  = GetOr<std::uint64_t>(stats, "objectives_completed", 0);
    stats_.objectivesFailed     = GetOr<std::uint64_t>(stats, "objectives_failed", 0);
    stats_.totalProgressUpdates = GetOr<std::uint64_t>(stats, "total_progress_updates", 0);
    updateCount_ = GetOr<std::uint64_t>(doc, "update_count", 0);
    lastUpdate_ = ParseIso8601(GetOr<std::string>(doc, "last_update", "")).value_or(clock_());

    logsys::get()->info("Loaded {} objectives", size());
    return true;
}

bool ObjectiveManager::saveToFile(const std::filesystem::path& path, std::string* outError) const
{
    std::string err;
    if (!io::write_atomic(path, toJson().dump(2), &err))
    {
        logsys::get()->error("Failed to save objectives: {}", err);
        if (outError)
            *outError = err;
        return false;
    }
    logsys::get()->info("Saved objectives to {}", path.string());
    return true;
}

bool ObjectiveManager::loadFromFile(const std::filesystem::path& path, std::string* outError)
{
    std::string bytes, err;
    if (!io::read_all(path, bytes, &err))
    {
        logsys::get()->error("Failed to load objectives: {}", err);
        if (outError)
            *outError = err;
        return false;
    }

    const json doc = json::parse(bytes, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        const std::string msg = "Invalid JSON in " + path.string();
        logsys::get()->error("Failed to load objectives: {}", msg);
        if (outError)
            *outError = msg;
        return false;
    }

    if (!loadFromJson(doc, outError))
        return false;
    logsys::get()->info("Loaded objectives from {}", path.string());
    return true;
}

void ObjectiveManager::reset()
{
    arena_.clear();
    byId_.clear();
    nextSequence_ = 0;
    bus_.clearRecent();
    stats_ = {};
    lastUpdate_ = clock_();
    updateCount_ = 0;
    logsys::get()->info("ObjectiveManager reset");
}

} // namespace eldritch
