// include/eldritch/core/Config.h
#pragma once

#include <filesystem>
#include <string>

#include "eldritch/core/Json.h"

namespace eldritch {

struct ManagerConfig
{
    int    maxActiveObjectives     = 20;
    int    maxImmediateObjectives  = 5;
    int    maxShortTermObjectives  = 10;
    bool   autoCleanupCompleted    = true;
    double autoCleanupAfterHours   = 24.0;
    bool   enableDynamicPriorities = true;
    bool   enableAiSuggestions     = true;
    int    recentEventCapacity     = 100;
};

struct SanityConfig
{
    int stableMin    = 70;
    int stressedMin  = 50;
    int disturbedMin = 30;
    int unhingedMin  = 10;
    int defaultSanity = 50;
    int maxSanity     = 99;
};

struct DifficultyConfig
{
    double targetSuccessRate     = 0.7;
    double adjustmentSensitivity = 0.1;
    int    performanceWindow     = 10;
};

struct AiConfig
{
    double minConfidence           = 0.6;
    int    maxSuggestions          = 3;
    int    analysisTimeoutMs       = 2000;
    int    analysisIntervalMinutes = 5;
};

struct LoggingConfig
{
    std::string level = "info";
    std::string directory;
};

struct OrchestratorConfig
{
    ManagerConfig    manager;
    SanityConfig     sanity;
    DifficultyConfig difficulty;
    AiConfig         ai;
    LoggingConfig    logging;
};

[[nodiscard]] json ConfigToJson(const OrchestratorConfig& cfg);

// Missing or mistyped keys keep the value already in `base`.
[[nodiscard]] OrchestratorConfig ConfigFromJson(const json& j, const OrchestratorConfig& base = {});

// Lenient: returns defaults when the file is missing or not valid JSON.
[[nodiscard]] OrchestratorConfig LoadConfigFromFile(const std::filesystem::path& path);

// Throws std::runtime_error when the file cannot be opened or parsed.
[[nodiscard]] OrchestratorConfig LoadConfigFromFileStrict(const std::filesystem::path& path);

bool SaveConfigToFile(const OrchestratorConfig& cfg,
                      const std::filesystem::path& path,
                      std::string* outError = nullptr);

} // namespace eldritch
