// include/eldritch/objectives/ObjectiveRegistry.h
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "eldritch/core/Config.h"
#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"
#include "eldritch/objectives/Objective.h"

namespace eldritch {

// Variant name -> factory, template name -> parameter document.
// A template's "variant" key names the factory that builds it.
class ObjectiveRegistry
{
public:
    using Factory = std::function<std::unique_ptr<Objective>(const std::string& id, const json& params, TimePoint now)>;

    // Every built-in variant plus the default templates. Sanity variants take
    // their thresholds and SAN bounds from `sanity`.
    static ObjectiveRegistry WithDefaults(const SanityConfig& sanity = {});

    void registerVariant(const std::string& name, Factory factory);
    // Throws ObjectiveManagerError when "variant" is missing or unknown.
    void registerTemplate(const std::string& name, json params);

    bool hasVariant(const std::string& name) const { return factories_.count(name) != 0; }
    bool hasTemplate(const std::string& name) const { return templates_.count(name) != 0; }
    std::vector<std::string> variantNames() const;
    std::vector<std::string> templateNames() const;
    const json* templateParams(const std::string& name) const;

    // Unknown variants and factory failures throw ObjectiveManagerError.
    std::unique_ptr<Objective> create(const std::string& variant, const std::string& id,
                                      const json& params, TimePoint now) const;

    // Overrides are merged over the template (top-level keys replace).
    std::unique_ptr<Objective> createFromTemplate(const std::string& templateName, const std::string& id,
                                                  const json& overrides, TimePoint now) const;

    // Rebuilds an objective from Objective::toDict(): the variant factory is
    // fed the "definition" document, then runtime state is restored.
    std::unique_ptr<Objective> fromDict(const json& dict) const;

private:
    std::map<std::string, Factory> factories_;
    std::map<std::string, json>    templates_;
};

void RegisterDefaultVariants(ObjectiveRegistry& registry, const SanityConfig& sanity = {});
void RegisterDefaultTemplates(ObjectiveRegistry& registry);

} // namespace eldritch
