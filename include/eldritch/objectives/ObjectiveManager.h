// include/eldritch/objectives/ObjectiveManager.h
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "eldritch/core/Config.h"
#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"
#include "eldritch/objectives/EventBus.h"
#include "eldritch/objectives/Objective.h"
#include "eldritch/objectives/ObjectiveComponents.h"
#include "eldritch/objectives/ObjectiveRegistry.h"

namespace eldritch {

// Ids touched by one updateAll() call.
struct UpdateReport
{
    std::vector<std::string> activated;
    std::vector<std::string> updated;
    std::vector<std::string> completed;
    std::vector<std::string> failed;
    std::vector<std::string> expired;

    json toJson() const;
};

struct ManagerStatistics
{
    std::uint64_t objectivesCreated = 0;
    std::uint64_t objectivesCompleted = 0;
    std::uint64_t objectivesFailed = 0;
    std::uint64_t totalProgressUpdates = 0;
};

// Owns every objective of a session and runs the per-turn schedule:
//
//   1. activate eligible objectives, highest effective priority first,
//      within the global and per-scope caps
//   2. update every active objective (an exception force-fails only that one)
//   3. file terminal objectives and emit objective_completed/_failed/_expired
//   4. evict terminal objectives older than the retention window
//   5. refresh urgency modifiers
//
// Single writer: listeners and suggestion callbacks run inline and must not
// call back into the mutating API.
class ObjectiveManager
{
public:
    using Listener = EventBus::Handler;
    using SuggestionCallback =
        std::function<std::vector<json>(const GameState&, const std::vector<const Objective*>& active)>;

    explicit ObjectiveManager(ManagerConfig config = {},
                              ObjectiveRegistry registry = ObjectiveRegistry::WithDefaults(),
                              Clock clock = SystemClockSource());

    ObjectiveManager(const ObjectiveManager&) = delete;
    ObjectiveManager& operator=(const ObjectiveManager&) = delete;

    // ---- creation / removal (duplicate ids throw ObjectiveManagerError) ----
    Objective& addObjective(std::unique_ptr<Objective> objective);
    Objective& createObjective(const std::string& variant, const std::string& id, const json& params = json::object());
    Objective& createFromTemplate(const std::string& templateName, const std::string& id,
                                  const json& overrides = json::object());
    bool removeObjective(const std::string& id);

    // ---- lookup ----
    Objective* get(const std::string& id);
    const Objective* get(const std::string& id) const;
    bool contains(const std::string& id) const { return byId_.count(id) != 0; }
    std::size_t size() const noexcept { return byId_.size(); }

    // All lists are in insertion order unless stated otherwise.
    std::vector<Objective*> all() const;
    std::vector<Objective*> byStatus(ObjectiveStatus status) const;
    std::vector<Objective*> byType(ObjectiveType type) const;
    std::vector<Objective*> byScope(ObjectiveScope scope) const;
    std::vector<Objective*> byPriority(ObjectivePriority priority) const;
    std::vector<Objective*> active() const;
    std::vector<Objective*> completed() const;
    std::vector<Objective*> failed() const;
    std::vector<Objective*> available(const GameState& state) const;
    // Active objectives, highest effective priority first.
    std::vector<Objective*> priorityObjectives() const;

    std::vector<Objective*> childrenOf(const std::string& id) const;
    Objective* parentOf(const std::string& id) const;

    // Objectives holding an active slot (active, in progress or suspended).
    std::size_t activeCount() const;
    std::size_t activeCount(ObjectiveScope scope) const;

    // ---- per-turn update ----
    UpdateReport updateAll(GameState& state, const ActionData& action = json::object());
    UpdateReport updateAll(GameState& state, const ActionData& action, TimePoint now);

    // ---- explicit transitions (keep collections and events in step) ----
    bool activate(const std::string& id, const GameState& state);
    bool complete(const std::string& id, GameState& state);
    bool fail(const std::string& id, GameState& state, const std::string& reason);
    bool abandon(const std::string& id);
    bool suspend(const std::string& id);
    bool resume(const std::string& id);

    // ---- events / suggestions ----
    int registerEventListener(const std::string& type, Listener listener);
    bool unregisterEventListener(int subscriptionId) { return bus_.unsubscribe(subscriptionId); }
    void registerSuggestionCallback(SuggestionCallback cb);
    std::vector<json> suggestNewObjectives(const GameState& state) const;
    const std::deque<BusEvent>& recentEvents() const noexcept { return bus_.recent(); }

    // ---- views ----
    json displaySummary() const;
    json statistics() const;
    const ManagerStatistics& counters() const noexcept { return stats_; }
    std::uint64_t updateCount() const noexcept { return updateCount_; }

    // ---- persistence ----
    json toJson() const;
    // Replaces the current contents only when the whole document loads.
    bool loadFromJson(const json& doc, std::string* outError = nullptr);
    bool saveToFile(const std::filesystem::path& path, std::string* outError = nullptr) const;
    bool loadFromFile(const std::filesystem::path& path, std::string* outError = nullptr);

    void reset();

    const ManagerConfig& config() const noexcept { return config_; }
    void setConfig(const ManagerConfig& config) { config_ = config; }
    ObjectiveRegistry& registry() noexcept { return registry_; }
    const ObjectiveRegistry& registry() const noexcept { return registry_; }
    TimePoint now() const { return clock_(); }

private:
    entt::entity entityOf(const std::string& id) const;
    Objective& objectiveOf(entt::entity e) const;
    void insert(std::unique_ptr<Objective> objective, std::uint64_t sequence);
    void link(entt::entity parent, entt::entity child);
    void unlinkAll(entt::entity e);

    template <typename Pred>
    std::vector<Objective*> collect(Pred pred) const;

    void syncTags();
    void fileTerminal(entt::entity e, UpdateReport* report, TimePoint now);
    void admitCandidates(const GameState& state, UpdateReport& report, TimePoint now);
    void sweepRetention(TimePoint now);
    void refreshUrgency(TimePoint now);
    void emit(const std::string& type, json data, TimePoint now);

    ManagerConfig     config_;
    ObjectiveRegistry registry_;
    Clock             clock_;

    entt::registry                                arena_;
    std::unordered_map<std::string, entt::entity> byId_;
    std::uint64_t                                 nextSequence_ = 0;

    EventBus                        bus_;
    std::vector<SuggestionCallback> suggestionCallbacks_;

    ManagerStatistics stats_;
    TimePoint         lastUpdate_{};
    std::uint64_t     updateCount_ = 0;
};

} // namespace eldritch
