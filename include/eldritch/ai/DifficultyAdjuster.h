// include/eldritch/ai/DifficultyAdjuster.h
#pragma once

#include <cstddef>

#include "eldritch/core/Config.h"
#include "eldritch/core/Json.h"
#include "eldritch/objectives/Objective.h"

namespace eldritch::ai {

struct PerformanceSummary
{
    double      successRate = 0.5;
    double      averageDifficulty = 3.0;
    double      trend = 0.0; // second-half minus first-half success rate
    std::size_t sampleSize = 0;

    json toJson() const;
};

// Rolling-window performance tracking and difficulty scaling.
// A positive adjustment makes objectives easier, a negative one harder.
class DifficultyAdjuster
{
public:
    static constexpr const char* kModifierSource = "difficulty";

    explicit DifficultyAdjuster(DifficultyConfig config = {}) : config_(config) {}

    // Last `performance_window` records of [{completed, difficulty_level}].
    // The trend needs at least five records.
    PerformanceSummary analyzePerformance(const json& objectiveHistory) const;

    // clamp(-(success - target) * s * 2 - trend * s, -1, 1)
    double calculateAdjustment(const PerformanceSummary& performance) const;

    // Everything goes through one "difficulty" modifier that replaces any
    // earlier one: time limit, priority, milestone count (short-term) and SAN
    // risk (sanity variants). Zero drops it. Terminal objectives are left alone.
    void applyTo(Objective& objective, double adjustment) const;

    const DifficultyConfig& config() const noexcept { return config_; }
    void setConfig(const DifficultyConfig& config) noexcept { config_ = config; }

private:
    DifficultyConfig config_;
};

} // namespace eldritch::ai
