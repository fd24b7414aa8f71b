// include/eldritch/objectives/ObjectiveFactories.h
#pragma once
//
// Ready-made objectives for the common scenario beats. Each builds a
// parameter document and goes through the variant's FromParams, so the
// result serializes and reloads like any registry-built objective.
// `extra` keys are merged over the defaults.

#include <memory>
#include <string>
#include <vector>

#include "eldritch/objectives/ImmediateObjective.h"
#include "eldritch/objectives/LongTermObjective.h"
#include "eldritch/objectives/MetaObjective.h"
#include "eldritch/objectives/MidTermObjective.h"
#include "eldritch/objectives/SanityVariants.h"
#include "eldritch/objectives/ShortTermObjective.h"

namespace eldritch::factories {

std::unique_ptr<ShortTermObjective> Investigation(const std::string& id, const std::string& title,
                                                  const std::string& location,
                                                  const std::vector<std::string>& requiredDiscoveries,
                                                  TimePoint now, int timeLimitMinutes = 15,
                                                  const json& extra = json::object());

std::unique_ptr<ShortTermObjective> Survival(const std::string& id, const std::string& title,
                                             const std::string& threatDescription, TimePoint now,
                                             int durationMinutes = 10, const json& extra = json::object());

// Default goals: initiate_conversation, ask_questions, conclude_conversation.
std::unique_ptr<ImmediateObjective> Social(const std::string& id, const std::string& title,
                                           const std::string& npcName,
                                           const std::vector<std::string>& conversationGoals, TimePoint now,
                                           const json& extra = json::object());

std::unique_ptr<ShortTermObjective> Exploration(const std::string& id, const std::string& title,
                                                const std::vector<std::string>& areas, TimePoint now,
                                                const json& extra = json::object());

std::unique_ptr<MidTermObjective> Knowledge(const std::string& id, const std::string& title,
                                            const std::string& mythosEntity, TimePoint now,
                                            int knowledgeLevel = 1, const json& extra = json::object());

std::unique_ptr<MidTermObjective> Protection(const std::string& id, const std::string& title,
                                             const std::string& protectedEntity, TimePoint now,
                                             int threatLevel = 3, const json& extra = json::object());

std::unique_ptr<ShortTermObjective> Escape(const std::string& id, const std::string& title,
                                           const std::string& location, TimePoint now,
                                           int urgencyLevel = 3, const json& extra = json::object());

std::unique_ptr<LongTermObjective> Campaign(const std::string& id, const std::string& title,
                                            const std::string& campaignName, const json& phases,
                                            TimePoint now, const std::vector<std::string>& themes = {},
                                            const json& extra = json::object());

std::unique_ptr<MetaObjective> Mastery(const std::string& id, const std::string& title,
                                       const std::string& masteryType, const json& unlockCriteria,
                                       TimePoint now, const json& extra = json::object());

std::unique_ptr<CosmicInsightObjective> ForbiddenKnowledge(const std::string& id, const std::string& title,
                                                           const std::string& knowledgeType,
                                                           const json& insightLevels, TimePoint now,
                                                           const json& extra = json::object());

// `stateConfigurations` is keyed by sanity state name.
std::unique_ptr<SanityDependentObjective> SanityDependentInvestigation(const std::string& id,
                                                                       const std::string& title,
                                                                       const std::string& location,
                                                                       const json& stateConfigurations,
                                                                       TimePoint now,
                                                                       const json& extra = json::object());

std::unique_ptr<MadnessObjective> MadnessDriven(const std::string& id, const std::string& title,
                                                const std::vector<MadnessType>& requiredMadness, TimePoint now,
                                                const json& extra = json::object());

} // namespace eldritch::factories
