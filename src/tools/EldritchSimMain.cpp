// src/tools/EldritchSimMain.cpp
//
// eldritch_sim: scripted investigation session
// --------------------------------------------
// Usage: eldritch_sim [config.json]
//
// - Builds a manager from the default templates plus a few factory objectives
// - Plays a short, fixed sequence of turns through updateAll()
// - Feeds the results to the achievement engine and the AI coordinator
// - Prints the display summary and statistics as JSON

#include "eldritch/achievements/AchievementManager.h"
#include "eldritch/ai/AiCoordinator.h"
#include "eldritch/core/Config.h"
#include "eldritch/logging/Log.h"
#include "eldritch/objectives/ObjectiveFactories.h"
#include "eldritch/objectives/ObjectiveManager.h"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace
{
    using namespace eldritch;

    GameState InitialState()
    {
        return {{"current_location", "library"},
                {"sanity", 65},
                {"hp", 12},
                {"cosmic_insight", 0},
                {"inventory", json::array({"lantern", "notebook"})},
                {"npcs_present", json::array({"Librarian Armitage"})},
                {"tension_level", 1},
                {"story_phase", "investigation"},
                {"active_madness", json::array()}};
    }

    std::vector<ActionData> ScriptedTurns()
    {
        return {
            {{"action_type", "search"}, {"discovery", "ancient_book"}},
            {{"action_type", "ask_about_events"}},
            {{"action_type", "read"}, {"discovery", "hidden_note"}, {"milestone_completed", true}},
            {{"action_type", "probe_for_details"}, {"san_loss", 4}},
            {{"action_type", "conclude_interview"}},
            {{"action_type", "examine"}, {"discovery", "strange_symbol"}, {"milestone_completed", true}},
            {{"action_type", "search"}, {"milestone_completed", true}},
        };
    }

    // Snapshot the achievement engine reads.
    json AchievementData(const ObjectiveManager& manager, const json& sessionEvents)
    {
        json completed = json::array();
        for (const Objective* o : manager.completed())
            completed.push_back(json{{"objective_id", o->id()}, {"type", ToString(o->type())}});
        return {{"completed_objectives", completed}, {"events", sessionEvents}};
    }

    int Run(const std::filesystem::path& configPath)
    {
        const OrchestratorConfig cfg = LoadConfigFromFile(configPath);
        logsys::init({cfg.logging.level, cfg.logging.directory});
        logsys::get()->info("eldritch_sim starting (config: {})", configPath.string());

        ObjectiveManager manager(cfg.manager, ObjectiveRegistry::WithDefaults(cfg.sanity));
        const TimePoint start = manager.now();

        manager.createFromTemplate("library_investigation", "library");
        manager.createFromTemplate("npc_interview", "interview",
                                   {{"metadata", {{"npc_name", "Librarian Armitage"}}}});
        manager.addObjective(factories::Knowledge("necronomicon_lore", "Study the Necronomicon", "yog_sothoth",
                                                  start));

        // Completed objectives are forwarded as session events.
        json sessionEvents = json::array();
        manager.registerEventListener("objective_completed", [&sessionEvents](const BusEvent& e) {
            sessionEvents.push_back(json{{"type", "objective_completed"}, {"data", e.data}});
        });

        GameState state = InitialState();
        int turn = 0;
        for (const ActionData& action : ScriptedTurns())
        {
            const UpdateReport report = manager.updateAll(state, action, start + Minutes(++turn));
            std::cout << "turn " << turn << ": " << report.toJson().dump() << "\n";
        }
        sessionEvents.push_back(json{{"type", "supernatural_encounter_survived"}});

        AchievementManager achievements;
        const json playerStats = {{"sanity", GetOr(state, "sanity", 50)},
                                  {"session_min_sanity", GetOr(state, "sanity", 50)},
                                  {"cosmic_knowledge_count", 1}};
        for (const Achievement* a : achievements.checkAll(AchievementData(manager, sessionEvents), playerStats))
            std::cout << "achievement: " << a->title() << "\n";

        ai::AiCoordinator coordinator(manager, cfg.ai, cfg.difficulty);
        manager.registerSuggestionCallback(
            [&coordinator](const GameState& s, const std::vector<const Objective*>&) {
                std::vector<json> out;
                for (const auto& suggestion : coordinator.suggestObjectives(s))
                    out.push_back(suggestion.toJson());
                return out;
            });

        state["objective_history"] = json::array({json{{"completed", true}}, json{{"completed", true}}, json{{"completed", false}}});
        for (const json& suggestion : manager.suggestNewObjectives(state))
            std::cout << "suggestion: " << suggestion.dump() << "\n";

        std::cout << manager.displaySummary().dump(2) << "\n";
        std::cout << achievements.statistics().dump(2) << "\n";
        std::cout << coordinator.statistics().dump(2) << "\n";

        logsys::shutdown();
        return 0;
    }
}

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? argv[1] : "config/eldritch.json";
    try
    {
        return Run(configPath);
    }
    catch (const std::exception& e)
    {
        std::cerr << "eldritch_sim: " << e.what() << "\n";
        return 1;
    }
}
