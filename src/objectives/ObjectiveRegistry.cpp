// src/objectives/ObjectiveRegistry.cpp
#include "eldritch/objectives/ObjectiveRegistry.h"

#include "eldritch/core/Errors.h"
#include "eldritch/logging/Log.h"
#include "eldritch/objectives/ImmediateObjective.h"
#include "eldritch/objectives/LongTermObjective.h"
#include "eldritch/objectives/MetaObjective.h"
#include "eldritch/objectives/MidTermObjective.h"
#include "eldritch/objectives/SanityVariants.h"
#include "eldritch/objectives/ShortTermObjective.h"

#include <exception>

namespace eldritch {

namespace {

template <typename T>
ObjectiveRegistry::Factory MakeFactory()
{
    return [](const std::string& id, const json& params, TimePoint now) -> std::unique_ptr<Objective> {
        return T::FromParams(id, params, now);
    };
}

template <typename T>
ObjectiveRegistry::Factory MakeSanityFactory(const SanityConfig& sanity)
{
    return [sanity](const std::string& id, const json& params, TimePoint now) -> std::unique_ptr<Objective> {
        return T::FromParams(id, params, now, sanity);
    };
}

} // namespace

ObjectiveRegistry ObjectiveRegistry::WithDefaults(const SanityConfig& sanity)
{
    ObjectiveRegistry registry;
    RegisterDefaultVariants(registry, sanity);
    RegisterDefaultTemplates(registry);
    return registry;
}

void ObjectiveRegistry::registerVariant(const std::string& name, Factory factory)
{
    factories_[name] = std::move(factory);
    logsys::get()->debug("Registered objective variant: {}", name);
}

void ObjectiveRegistry::registerTemplate(const std::string& name, json params)
{
    const auto variant = GetOr<std::string>(params, "variant", "");
    if (variant.empty())
        throw ObjectiveManagerError("Template '" + name + "' does not name a variant");
    if (!hasVariant(variant))
        throw ObjectiveManagerError("Template '" + name + "' uses unknown objective type: " + variant);

    templates_[name] = std::move(params);
    logsys::get()->debug("Registered objective template: {}", name);
}

std::vector<std::string> ObjectiveRegistry::variantNames() const
{
    std::vector<std::string> out;
    for (const auto& kv : factories_)
        out.push_back(kv.first);
    return out;
}

std::vector<std::string> ObjectiveRegistry::templateNames() const
{
    std::vector<std::string> out;
    for (const auto& kv : templates_)
        out.push_back(kv.first);
    return out;
}

const json* ObjectiveRegistry::templateParams(const std::string& name) const
{
    auto it = templates_.find(name);
    return it == templates_.end() ? nullptr : &it->second;
}

std::unique_ptr<Objective> ObjectiveRegistry::create(const std::string& variant, const std::string& id,
                                                     const json& params, TimePoint now) const
{
    auto it = factories_.find(variant);
    if (it == factories_.end())
        throw ObjectiveManagerError("Unknown objective type: " + variant);

    std::unique_ptr<Objective> objective;
    try
    {
        objective = it->second(id, params, now);
    }
    catch (const ObjectiveManagerError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ObjectiveManagerError("Failed to create " + variant + " '" + id + "': " + e.what());
    }

    if (!objective)
        throw ObjectiveManagerError("Factory for " + variant + " returned no objective for '" + id + "'");
    return objective;
}

std::unique_ptr<Objective> ObjectiveRegistry::createFromTemplate(const std::string& templateName,
                                                                 const std::string& id,
                                                                 const json& overrides, TimePoint now) const
{
    const json* tmpl = templateParams(templateName);
    if (!tmpl)
        throw ObjectiveManagerError("Unknown objective template: " + templateName);

    json params = *tmpl;
    if (overrides.is_object())
        for (auto it = overrides.begin(); it != overrides.end(); ++it)
            params[it.key()] = it.value();

    const auto variant = GetOr<std::string>(params, "variant", "");
    params.erase("variant");
    return create(variant, id, params, now);
}

std::unique_ptr<Objective> ObjectiveRegistry::fromDict(const json& dict) const
{
    const auto id = GetOr<std::string>(dict, "objective_id", "");
    if (id.empty())
        throw ObjectiveManagerError("Serialized objective has no objective_id");

    const auto variant = GetOr<std::string>(dict, "variant", "");
    const auto createdAt = ParseIso8601(GetOr<std::string>(dict, "created_at", "")).value_or(TimePoint{});

    auto objective = create(variant, id, GetOr(dict, "definition", json::object()), createdAt);
    objective->restore(dict);
    return objective;
}

// ----------------------------------------------------------------------------

void RegisterDefaultVariants(ObjectiveRegistry& registry, const SanityConfig& sanity)
{
    registry.registerVariant(ImmediateObjective::kVariant, MakeFactory<ImmediateObjective>());
    registry.registerVariant(ShortTermObjective::kVariant, MakeFactory<ShortTermObjective>());
    registry.registerVariant(MidTermObjective::kVariant, MakeFactory<MidTermObjective>());
    registry.registerVariant(LongTermObjective::kVariant, MakeFactory<LongTermObjective>());
    registry.registerVariant(MetaObjective::kVariant, MakeFactory<MetaObjective>());
    registry.registerVariant(SanityDependentObjective::kVariant, MakeSanityFactory<SanityDependentObjective>(sanity));
    registry.registerVariant(CosmicInsightObjective::kVariant, MakeSanityFactory<CosmicInsightObjective>(sanity));
    registry.registerVariant(MadnessObjective::kVariant, MakeSanityFactory<MadnessObjective>(sanity));
}

void RegisterDefaultTemplates(ObjectiveRegistry& registry)
{
    registry.registerTemplate("library_investigation", {
        {"variant", ShortTermObjective::kVariant},
        {"title", "Investigate the Library"},
        {"description", "Search the library for clues and forbidden knowledge"},
        {"objective_type", "investigation"},
        {"required_discoveries", {"ancient_book", "hidden_note", "strange_symbol"}},
        {"rewards", {rewards::Knowledge()}},
        {"failure_consequences", {consequences::SanLossMinor()}},
    });

    registry.registerTemplate("basement_exploration", {
        {"variant", ShortTermObjective::kVariant},
        {"title", "Explore the Basement"},
        {"description", "Investigate the basement despite the feeling of dread"},
        {"objective_type", "exploration"},
        {"tension_ramp_enabled", true},
        {"initial_tension", 2},
        {"max_tension", 4},
        {"rewards", {rewards::Knowledge()}},
        {"failure_consequences", {consequences::SanLossMajor()}},
    });

    registry.registerTemplate("npc_interview", {
        {"variant", ImmediateObjective::kVariant},
        {"title", "Interview NPC"},
        {"description", "Conduct a thorough interview to gather information"},
        {"objective_type", "social"},
        {"required_actions", {"ask_about_events", "probe_for_details", "conclude_interview"}},
        {"rewards", {rewards::Knowledge()}},
    });

    registry.registerTemplate("cult_investigation", {
        {"variant", MidTermObjective::kVariant},
        {"title", "Investigate the Cult"},
        {"description", "Uncover the cult's plans and membership"},
        {"objective_type", "investigation"},
        {"investigation_branches", {{"member_identification", 0.0}, {"ritual_discovery", 0.0}, {"location_mapping", 0.0}}},
        {"horror_revelations", {"cult_purpose", "ritual_details", "cosmic_connection"}},
        {"rewards", {rewards::Knowledge()}},
        {"failure_consequences", {consequences::SanLossMajor(), consequences::CosmicAttention()}},
    });

    registry.registerTemplate("survival_horror", {
        {"variant", ShortTermObjective::kVariant},
        {"title", "Survive the Encounter"},
        {"description", "Survive a terrifying supernatural encounter"},
        {"objective_type", "survival"},
        {"priority", ToInt(ObjectivePriority::Critical)},
        {"tension_ramp_enabled", true},
        {"initial_tension", 3},
        {"max_tension", 5},
        {"time_limit", Minutes(8).count()},
        {"rewards", {rewards::Survival(), rewards::SanityMinor()}},
        {"failure_consequences", {consequences::SanLossMajor()}},
    });

    logsys::get()->debug("Registered default objective templates");
}

} // namespace eldritch
