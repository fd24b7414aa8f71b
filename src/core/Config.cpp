// src/core/Config.cpp
#include "eldritch/core/Config.h"
#include "eldritch/io/AtomicFile.h"

#include "eldritch/logging/Log.h"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace eldritch {

namespace {

const json& Section(const json& root, const char* name)
{
    static const json kEmpty = json::object();
    const json* s = Find(root, name);
    return (s && s->is_object()) ? *s : kEmpty;
}

} // namespace

json ConfigToJson(const OrchestratorConfig& cfg)
{
    const auto& m = cfg.manager;
    const auto& s = cfg.sanity;
    const auto& d = cfg.difficulty;
    const auto& a = cfg.ai;

    return json{
        {"manager", {
            {"max_active_objectives",     m.maxActiveObjectives},
            {"max_immediate_objectives",  m.maxImmediateObjectives},
            {"max_short_term_objectives", m.maxShortTermObjectives},
            {"auto_cleanup_completed",    m.autoCleanupCompleted},
            {"auto_cleanup_after_hours",  m.autoCleanupAfterHours},
            {"enable_dynamic_priorities", m.enableDynamicPriorities},
            {"enable_ai_suggestions",     m.enableAiSuggestions},
            {"recent_event_capacity",     m.recentEventCapacity},
        }},
        {"sanity", {
            {"stable_min",     s.stableMin},
            {"stressed_min",   s.stressedMin},
            {"disturbed_min",  s.disturbedMin},
            {"unhinged_min",   s.unhingedMin},
            {"default_sanity", s.defaultSanity},
            {"max_sanity",     s.maxSanity},
        }},
        {"difficulty", {
            {"target_success_rate",    d.targetSuccessRate},
            {"adjustment_sensitivity", d.adjustmentSensitivity},
            {"performance_window",     d.performanceWindow},
        }},
        {"ai", {
            {"min_confidence",            a.minConfidence},
            {"max_suggestions",           a.maxSuggestions},
            {"analysis_timeout_ms",       a.analysisTimeoutMs},
            {"analysis_interval_minutes", a.analysisIntervalMinutes},
        }},
        {"logging", {
            {"level",     cfg.logging.level},
            {"directory", cfg.logging.directory},
        }},
    };
}

OrchestratorConfig ConfigFromJson(const json& j, const OrchestratorConfig& base)
{
    OrchestratorConfig cfg = base;

    const json& m = Section(j, "manager");
    cfg.manager.maxActiveObjectives     = GetOr(m, "max_active_objectives", cfg.manager.maxActiveObjectives);
    cfg.manager.maxImmediateObjectives  = GetOr(m, "max_immediate_objectives", cfg.manager.maxImmediateObjectives);
    cfg.manager.maxShortTermObjectives  = GetOr(m, "max_short_term_objectives", cfg.manager.maxShortTermObjectives);
    cfg.manager.autoCleanupCompleted    = GetOr(m, "auto_cleanup_completed", cfg.manager.autoCleanupCompleted);
    cfg.manager.autoCleanupAfterHours   = GetOr(m, "auto_cleanup_after_hours", cfg.manager.autoCleanupAfterHours);
    cfg.manager.enableDynamicPriorities = GetOr(m, "enable_dynamic_priorities", cfg.manager.enableDynamicPriorities);
    cfg.manager.enableAiSuggestions     = GetOr(m, "enable_ai_suggestions", cfg.manager.enableAiSuggestions);
    cfg.manager.recentEventCapacity     = GetOr(m, "recent_event_capacity", cfg.manager.recentEventCapacity);

    const json& s = Section(j, "sanity");
    cfg.sanity.stableMin     = GetOr(s, "stable_min", cfg.sanity.stableMin);
    cfg.sanity.stressedMin   = GetOr(s, "stressed_min", cfg.sanity.stressedMin);
    cfg.sanity.disturbedMin  = GetOr(s, "disturbed_min", cfg.sanity.disturbedMin);
    cfg.sanity.unhingedMin   = GetOr(s, "unhinged_min", cfg.sanity.unhingedMin);
    cfg.sanity.defaultSanity = GetOr(s, "default_sanity", cfg.sanity.defaultSanity);
    cfg.sanity.maxSanity     = GetOr(s, "max_sanity", cfg.sanity.maxSanity);

    const json& d = Section(j, "difficulty");
    cfg.difficulty.targetSuccessRate     = GetOr(d, "target_success_rate", cfg.difficulty.targetSuccessRate);
    cfg.difficulty.adjustmentSensitivity = GetOr(d, "adjustment_sensitivity", cfg.difficulty.adjustmentSensitivity);
    cfg.difficulty.performanceWindow     = GetOr(d, "performance_window", cfg.difficulty.performanceWindow);

    const json& a = Section(j, "ai");
    cfg.ai.minConfidence           = GetOr(a, "min_confidence", cfg.ai.minConfidence);
    cfg.ai.maxSuggestions          = GetOr(a, "max_suggestions", cfg.ai.maxSuggestions);
    cfg.ai.analysisTimeoutMs       = GetOr(a, "analysis_timeout_ms", cfg.ai.analysisTimeoutMs);
    cfg.ai.analysisIntervalMinutes = GetOr(a, "analysis_interval_minutes", cfg.ai.analysisIntervalMinutes);

    const json& l = Section(j, "logging");
    cfg.logging.level     = GetOr(l, "level", cfg.logging.level);
    cfg.logging.directory = GetOr(l, "directory", cfg.logging.directory);

    return cfg;
}

OrchestratorConfig LoadConfigFromFile(const std::filesystem::path& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        logsys::get()->debug("Config '{}' not found, using defaults", path.string());
        return {};
    }

    const json j = json::parse(f, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        logsys::get()->warn("Config '{}' is not a JSON object, using defaults", path.string());
        return {};
    }
    return ConfigFromJson(j);
}

OrchestratorConfig LoadConfigFromFileStrict(const std::filesystem::path& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Could not open " + path.string());

    const json j = json::parse(f, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        throw std::runtime_error("Invalid JSON in " + path.string());
    return ConfigFromJson(j);
}

bool SaveConfigToFile(const OrchestratorConfig& cfg,
                      const std::filesystem::path& path,
                      std::string* outError)
{
    std::string err;
    if (!io::write_atomic(path, ConfigToJson(cfg).dump(2) + "\n", &err))
    {
        logsys::get()->error("SaveConfigToFile: {}", err);
        if (outError) *outError = err;
        return false;
    }
    return true;
}

} // namespace eldritch
