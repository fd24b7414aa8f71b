// src/ai/DifficultyAdjuster.cpp
#include "eldritch/ai/DifficultyAdjuster.h"

#include "eldritch/logging/Log.h"

#include <algorithm>
#include <utility>

namespace eldritch::ai {

namespace {

double SuccessRate(const json& history, std::size_t from, std::size_t to)
{
    if (to <= from)
        return 0.0;
    std::size_t successes = 0;
    for (std::size_t i = from; i < to; ++i)
        if (GetOr(history[i], "completed", false))
            ++successes;
    return static_cast<double>(successes) / static_cast<double>(to - from);
}

} // namespace

json PerformanceSummary::toJson() const
{
    return {{"success_rate", successRate},
            {"average_difficulty", averageDifficulty},
            {"trend", trend},
            {"sample_size", sampleSize}};
}

PerformanceSummary DifficultyAdjuster::analyzePerformance(const json& objectiveHistory) const
{
    PerformanceSummary out;
    if (!objectiveHistory.is_array() || objectiveHistory.empty())
        return out;

    const std::size_t window = static_cast<std::size_t>(std::max(1, config_.performanceWindow));
    const std::size_t n = std::min(window, objectiveHistory.size());
    const std::size_t begin = objectiveHistory.size() - n;

    json recent = json::array();
    for (std::size_t i = begin; i < objectiveHistory.size(); ++i)
        recent.push_back(objectiveHistory[i]);

    out.sampleSize = n;
    out.successRate = SuccessRate(recent, 0, n);

    double difficulty = 0.0;
    for (const auto& r : recent)
        difficulty += GetOr(r, "difficulty_level", 3.0);
    out.averageDifficulty = difficulty / static_cast<double>(n);

    if (n >= 5)
        out.trend = SuccessRate(recent, n / 2, n) - SuccessRate(recent, 0, n / 2);
    return out;
}

double DifficultyAdjuster::calculateAdjustment(const PerformanceSummary& performance) const
{
    const double s = config_.adjustmentSensitivity;
    const double base = -(performance.successRate - config_.targetSuccessRate) * s * 2.0;
    const double trend = -performance.trend * s;
    return std::clamp(base + trend, -1.0, 1.0);
}

void DifficultyAdjuster::applyTo(Objective& objective, double adjustment) const
{
    if (objective.isTerminal())
        return;

    const double a = std::clamp(adjustment, -1.0, 1.0);
    if (a == 0.0)
    {
        objective.removeModifiers(kModifierSource);
        return;
    }
    const bool easier = a > 0.0;

    ObjectiveModifier mod;
    mod.source = kModifierSource;
    mod.timeLimitScale = easier ? 1.0 + a * 0.5 : 1.0 + a * 0.3;
    mod.milestoneScale = easier ? 1.0 - a * 0.3 : 1.0 - a * 0.2;
    mod.sanRiskScale   = easier ? 1.0 - a * 0.4 : 1.0 - a * 0.3;
    if (a < -0.5)
        mod.priorityDelta = 1;
    else if (a > 0.5)
        mod.priorityDelta = -1;
    objective.applyModifier(std::move(mod));

    logsys::get()->debug("Difficulty adjustment {:.3f} applied to {}", a, objective.id());
}

} // namespace eldritch::ai
