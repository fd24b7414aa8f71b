// src/achievements/DefaultAchievements.cpp
//
// Built-in achievement catalogue.

#include "eldritch/achievements/AchievementManager.h"

#include "eldritch/objectives/ObjectiveTypes.h"

namespace eldritch {

namespace {

AchievementCriteria Stat(const char* stat, json target, const char* op = "gte")
{
    AchievementCriteria c;
    c.trigger = AchievementTrigger::StatThreshold;
    c.target = std::move(target);
    c.op = op;
    c.conditions = {{"stat_name", stat}};
    return c;
}

AchievementCriteria Event(const char* eventType)
{
    AchievementCriteria c;
    c.trigger = AchievementTrigger::EventOccurrence;
    c.target = true;
    c.op = "occurred";
    c.conditions = {{"event_type", eventType}};
    return c;
}

AchievementCriteria CompletedOfType(ObjectiveType type, int count)
{
    AchievementCriteria c;
    c.trigger = AchievementTrigger::ObjectiveCompletion;
    c.target = count;
    c.op = "type_count";
    c.conditions = {{"objective_type", ToString(type)}};
    return c;
}

AchievementCriteria SanityCondition(const char* state)
{
    AchievementCriteria c;
    c.trigger = AchievementTrigger::ConditionMet;
    c.target = state;
    c.conditions = {{"condition_type", "sanity_state"}};
    return c;
}

AchievementReward UnlockReward(const char* title, const char* description)
{
    AchievementReward r;
    r.title = title;
    r.description = description;
    return r;
}

} // namespace

void RegisterDefaultAchievements(AchievementManager& manager)
{
    using C = AchievementCategory;
    using R = AchievementRarity;

    // ---- survival ----
    manager.addAchievement(Achievement("first_survival", "The Living",
                                       "Survive your first supernatural encounter", C::Survival, R::Common,
                                       {Event("supernatural_encounter_survived")},
                                       UnlockReward("Survivor's Instinct", "You've learned to recognize danger")))
        .setFlavorText("The first brush with the impossible leaves its mark.");

    {
        auto reward = UnlockReward("Mental Fortitude", "Resistance to madness");
        reward.statisticalBonus = {{"sanity_resistance", 0.1}};
        manager.addAchievement(Achievement("sanity_keeper", "Keeper of Reason",
                                           "Maintain sanity above 70 for an entire session", C::Survival,
                                           R::Uncommon, {Stat("session_min_sanity", 70)}, reward))
            .setFlavorText("A clear mind in a world gone mad.");
    }

    // ---- knowledge ----
    {
        auto reward = UnlockReward("Awakened Mind", "Understanding begins");
        reward.loreEntries = {"cosmic_awareness_intro"};
        manager.addAchievement(Achievement("first_truth", "Glimpse of Truth",
                                           "Gain your first piece of cosmic knowledge", C::Knowledge, R::Common,
                                           {Stat("cosmic_knowledge_count", 1)}, reward))
            .setFlavorText("The first step into a larger, more terrible universe.");
    }
    {
        auto reward = UnlockReward("Deep Understanding", "Profound cosmic insights");
        reward.unlockContent = {"advanced_lore"};
        reward.statisticalBonus = {{"investigation_bonus", 0.15}};
        manager.addAchievement(Achievement("forbidden_scholar", "Scholar of the Forbidden",
                                           "Acquire knowledge of 5 different mythos entities", C::Knowledge,
                                           R::Rare, {Stat("known_entities_count", 5)}, reward))
            .setCosmicSignificance("Understanding multiple cosmic entities fundamentally changes one's worldview")
            .setFlavorText("To know them is to invite their attention.");
    }

    // ---- investigation ----
    manager.addAchievement(Achievement("first_mystery", "First Case",
                                       "Complete your first investigation objective", C::Investigation, R::Common,
                                       {CompletedOfType(ObjectiveType::Investigation, 1)},
                                       UnlockReward("Detective's Eye", "Enhanced observation skills")))
        .setFlavorText("Every great investigator starts with a single case.");
    {
        auto reward = UnlockReward("Investigative Mastery", "Superior deductive abilities");
        reward.statisticalBonus = {{"investigation_success_rate", 0.2}};
        manager.addAchievement(Achievement("master_detective", "Master Detective",
                                           "Complete 25 investigation objectives", C::Investigation, R::Epic,
                                           {CompletedOfType(ObjectiveType::Investigation, 25)}, reward))
            .setFlavorText("The threads of mystery bend to your will.");
    }

    // ---- horror ----
    {
        auto reward = UnlockReward("Mad Insight", "Wisdom through madness");
        reward.unlockContent = {"madness_mechanics"};
        reward.statisticalBonus = {{"mad_action_success", 0.3}};
        manager.addAchievement(Achievement("madness_embrace", "Embrace of Madness",
                                           "Continue playing while completely mad (0 SAN)", C::Horror, R::Rare,
                                           {SanityCondition("mad")}, reward))
            .setCosmicSignificance("Madness can be a doorway to impossible truths")
            .setFlavorText("In madness, sometimes clarity is found.");
    }
    {
        auto reward = UnlockReward("Cosmic Awareness", "Understanding of the infinite");
        reward.unlockContent = {"cosmic_entities_compendium"};
        reward.statisticalBonus = {{"cosmic_resistance", 0.25}};
        manager.addAchievement(Achievement("cosmic_witness", "Witness to the Cosmos",
                                           "Encounter 3 different cosmic entities", C::Horror, R::Legendary,
                                           {Stat("cosmic_encounters", 3)}, reward))
            .setCosmicSignificance(
                "To witness the cosmic entities is to understand humanity's place in the universe")
            .setFlavorText("You have looked upon the face of eternity.");
    }

    // ---- meta ----
    {
        auto reward = UnlockReward("Veteran Status", "Recognition of dedication");
        reward.cosmeticUnlocks = {"veteran_title", "experience_badge"};
        manager.addAchievement(Achievement("dedicated_investigator", "Dedicated Investigator",
                                           "Play for a total of 50 hours", C::Meta, R::Uncommon,
                                           {Stat("total_playtime_hours", 50)}, reward))
            .setFlavorText("Dedication to the truth requires time and sacrifice.");
    }
    {
        auto reward = UnlockReward("Master Survivor", "Legendary status among investigators");
        reward.unlockContent = {"master_difficulty", "legendary_scenarios"};
        reward.statisticalBonus = {{"all_skills", 0.1}};
        manager.addAchievement(Achievement("ultimate_survivor", "Ultimate Survivor",
                                           "Complete 10 different campaigns", C::Meta, R::Legendary,
                                           {Stat("completed_campaigns", 10)}, reward))
            .setCosmicSignificance("To survive so many encounters with the unknown marks you as extraordinary")
            .setFlavorText("You have walked through hell and emerged scarred but whole.");
    }

    // ---- secret ----
    {
        auto reward = UnlockReward("True Sight", "See beyond the veil of reality");
        reward.unlockContent = {"meta_content", "reality_mechanics"};
        manager.addAchievement(Achievement("fourth_wall", "Beyond the Fourth Wall",
                                           "Discover the true nature of your reality", C::Secret, R::Cosmic,
                                           {Event("meta_realization")}, reward))
            .setHidden(true)
            .setCosmicSignificance("Some truths transcend even cosmic horror")
            .setFlavorText(
                "The greatest horror is realizing you are just a character in someone else's story.");
    }
}

} // namespace eldritch
