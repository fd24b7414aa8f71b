// include/eldritch/objectives/ImmediateObjective.h
#pragma once

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "eldritch/objectives/Objective.h"

namespace eldritch {

// One to a few actions; five-minute default limit.
// Progress is |completed ∩ required| / |required|, where `required` also
// includes compulsions added by modifiers.
class ImmediateObjective : public Objective
{
public:
    static constexpr const char* kVariant = "ImmediateObjective";

    struct Params
    {
        std::vector<std::string> requiredActions;
        bool autoCompleteOnAction     = true;
        bool provideImmediateFeedback = true;
    };

    // Used when there is no required action set.
    using SimpleCompletionFn = std::function<bool(const GameState&)>;

    ImmediateObjective(ObjectiveDef def, Params params, TimePoint createdAt);

    static std::unique_ptr<ImmediateObjective> FromParams(const std::string& id, const json& params, TimePoint now);

    const char* variantName() const noexcept override { return kVariant; }

    std::set<std::string> requiredActions() const;
    const std::set<std::string>& completedActions() const noexcept { return completed_; }
    std::set<std::string> remainingActions() const;

    void addRequiredAction(const std::string& action);
    void setSimpleCompletion(SimpleCompletionFn fn) { simpleCompletion_ = std::move(fn); }

    json displayInfo(TimePoint now) const override;

protected:
    bool updateProgress(GameState& state, const ActionData& action, TimePoint now) override;
    void writeDefinition(json& params) const override;
    void saveState(json& state) const override;
    void restoreState(const json& state) override;

private:
    double coverage() const;

    std::set<std::string> required_;
    std::set<std::string> completed_;
    bool autoCompleteOnAction_;
    bool provideImmediateFeedback_;
    SimpleCompletionFn simpleCompletion_;
};

} // namespace eldritch
