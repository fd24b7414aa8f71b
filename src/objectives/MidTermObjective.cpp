// src/objectives/MidTermObjective.cpp
#include "eldritch/objectives/MidTermObjective.h"

#include "eldritch/logging/Log.h"

#include <algorithm>
#include <exception>

namespace eldritch {

namespace {

struct Term
{
    double value;
    double weight;
};

double Blend(const std::vector<Term>& terms)
{
    double total = 0.0, sum = 0.0;
    for (const auto& t : terms)
    {
        total += t.weight;
        sum += t.value * t.weight;
    }
    return total > 0.0 ? sum / total : 0.0;
}

// Accepts [{"name":..., "requirements":{...}}, ...] or {"name": {"requirements": {...}}}.
std::vector<MidTermObjective::CompletionPath> ReadPaths(const json& params)
{
    std::vector<MidTermObjective::CompletionPath> out;
    const json* paths = Find(params, "completion_paths");
    if (!paths)
        return out;

    if (paths->is_array())
    {
        for (const auto& p : *paths)
            out.push_back({GetOr<std::string>(p, "name", ""), GetOr(p, "requirements", json::object())});
    }
    else if (paths->is_object())
    {
        for (auto it = paths->begin(); it != paths->end(); ++it)
            out.push_back({it.key(), GetOr(it.value(), "requirements", json::object())});
    }
    return out;
}

} // namespace

MidTermObjective::MidTermObjective(ObjectiveDef def, Params params, TimePoint createdAt)
    : Objective(WithScopeDefaults(std::move(def), ObjectiveScope::MidTerm, Hours(2)), createdAt)
    , branches_(std::move(params.investigationBranches))
    , storyBeats_(params.storyBeats.is_array() ? std::move(params.storyBeats) : json::array())
    , skillChallenges_(std::move(params.skillChallenges))
    , baseSanLossThreshold_(params.sanLossThreshold)
    , sanLossThreshold_(params.sanLossThreshold)
    , horrorRevelations_(std::move(params.horrorRevelations))
    , completionPaths_(std::move(params.completionPaths))
{
}

std::unique_ptr<MidTermObjective> MidTermObjective::FromParams(const std::string& id, const json& params, TimePoint now)
{
    Params p;
    p.investigationBranches = GetOr(params, "investigation_branches", p.investigationBranches);
    p.storyBeats            = GetOr(params, "story_beats", json::array());
    p.skillChallenges       = GetOr(params, "skill_challenges", p.skillChallenges);
    p.sanLossThreshold      = GetOr(params, "san_loss_threshold", p.sanLossThreshold);
    p.horrorRevelations     = GetOr(params, "horror_revelations", p.horrorRevelations);
    p.completionPaths       = ReadPaths(params);
    return std::make_unique<MidTermObjective>(DefFromParams(id, params, ObjectiveScope::MidTerm), std::move(p), now);
}

std::optional<json> MidTermObjective::currentStoryBeat() const
{
    if (currentBeat_ < storyBeats_.size())
        return storyBeats_.at(currentBeat_);
    return std::nullopt;
}

bool MidTermObjective::updateProgress(GameState& state, const ActionData& action, TimePoint)
{
    bool progressMade = false;

    if (const json* b = Find(action, "investigation_branch"); b && b->is_string())
    {
        const auto branch = b->get<std::string>();
        auto it = branches_.find(branch);
        if (it != branches_.end())
        {
            const double advancement = GetOr(action, "advancement", 0.1);
            it->second = std::min(1.0, it->second + advancement);
            progressMade = true;
            logEvent("investigation_advanced", {{"branch", branch},
                                                {"progress", it->second},
                                                {"advancement", advancement}});
        }
    }

    if (const json* beat = Find(action, "story_beat_completed"); beat && Truthy(*beat))
    {
        if (currentBeat_ < storyBeats_.size())
        {
            ++currentBeat_;
            progressMade = true;
            logEvent("story_beat_completed", {{"beat_index", currentBeat_ - 1},
                                              {"total_beats", storyBeats_.size()}});
        }
    }

    if (const json* s = Find(action, "skill_used"); s && s->is_string())
    {
        const auto skill = s->get<std::string>();
        if (skillChallenges_.count(skill))
        {
            ++skillsTested_[skill];
            progressMade = true;
        }
    }

    if (const json* loss = Find(action, "san_loss"); loss && loss->is_number())
    {
        accumulatedSanLoss_ += loss->get<double>();
        if (accumulatedSanLoss_ >= sanLossThreshold_)
            triggerHorrorEscalation(state);
    }

    if (const json* r = Find(action, "revelation"); r && r->is_string())
    {
        const auto revelation = r->get<std::string>();
        const bool known = std::find(horrorRevelations_.begin(), horrorRevelations_.end(), revelation)
                           != horrorRevelations_.end();
        if (known && !revelationsUnlocked_.count(revelation))
        {
            revelationsUnlocked_.insert(revelation);
            progressMade = true;
            logEvent("horror_revelation", {{"revelation", revelation}});
        }
    }

    setProgress(computeProgress());
    checkCompletionPaths();
    return progressMade;
}

double MidTermObjective::averageBranchProgress() const
{
    if (branches_.empty())
        return 0.0;
    double sum = 0.0;
    for (const auto& kv : branches_)
        sum += kv.second;
    return sum / static_cast<double>(branches_.size());
}

double MidTermObjective::computeProgress() const
{
    std::vector<Term> terms;

    if (!branches_.empty())
        terms.push_back({averageBranchProgress(), 0.4});

    if (!storyBeats_.empty())
        terms.push_back({static_cast<double>(currentBeat_) / static_cast<double>(storyBeats_.size()), 0.3});

    if (!horrorRevelations_.empty())
        terms.push_back({static_cast<double>(revelationsUnlocked_.size())
                             / static_cast<double>(horrorRevelations_.size()), 0.2});

    if (!skillChallenges_.empty())
    {
        std::size_t met = 0;
        for (const auto& kv : skillChallenges_)
        {
            auto it = skillsTested_.find(kv.first);
            if (it != skillsTested_.end() && it->second >= kv.second)
                ++met;
        }
        terms.push_back({static_cast<double>(met) / static_cast<double>(skillChallenges_.size()), 0.1});
    }

    return Blend(terms);
}

void MidTermObjective::triggerHorrorEscalation(const GameState& state)
{
    logEvent("horror_escalation", {{"san_loss", accumulatedSanLoss_}, {"threshold", sanLossThreshold_}});
    logsys::get()->warn("Horror escalation in {} (SAN loss {} >= {})", id(), accumulatedSanLoss_, sanLossThreshold_);

    sanLossThreshold_ *= 1.5;

    for (const auto& cb : horrorCallbacks_)
    {
        try
        {
            cb(accumulatedSanLoss_, state);
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Error in horror escalation callback for {}: {}", id(), e.what());
        }
    }
}

void MidTermObjective::checkCompletionPaths()
{
    if (!activePath_.empty())
        return;

    for (const auto& path : completionPaths_)
    {
        if (pathRequirementsMet(path.requirements))
        {
            activePath_ = path.name;
            logEvent("completion_path_activated", {{"path", path.name}});
            break;
        }
    }
}

bool MidTermObjective::pathRequirementsMet(const json& requirements) const
{
    if (!requirements.is_object())
        return true;

    if (const json* minInv = Find(requirements, "min_investigation_progress"); minInv && minInv->is_number())
        if (averageBranchProgress() < minInv->get<double>())
            return false;

    if (const json* revs = Find(requirements, "required_revelations"); revs && revs->is_array())
        for (const auto& r : *revs)
            if (!r.is_string() || !revelationsUnlocked_.count(r.get<std::string>()))
                return false;

    if (const json* minBeat = Find(requirements, "min_story_beat"); minBeat && minBeat->is_number())
        if (static_cast<double>(currentBeat_) < minBeat->get<double>())
            return false;

    return true;
}

json MidTermObjective::displayInfo(TimePoint now) const
{
    json info = Objective::displayInfo(now);
    const auto beat = currentStoryBeat();

    info["investigation_branches"] = branches_;
    info["story_progress"] = {{"current_beat", currentBeat_},
                              {"total_beats", storyBeats_.size()},
                              {"current_beat_data", beat ? *beat : json(nullptr)}};
    info["horror_progression"] = {{"san_loss", accumulatedSanLoss_},
                                  {"threshold", sanLossThreshold_},
                                  {"revelations_unlocked", std::vector<std::string>(revelationsUnlocked_.begin(), revelationsUnlocked_.end())},
                                  {"total_revelations", horrorRevelations_.size()}};
    info["skill_challenges"] = skillChallenges_;
    info["skills_tested"] = skillsTested_;
    info["active_completion_path"] = activePath_.empty() ? json(nullptr) : json(activePath_);
    return info;
}

void MidTermObjective::writeDefinition(json& params) const
{
    json paths = json::array();
    for (const auto& p : completionPaths_)
        paths.push_back(json{{"name", p.name}, {"requirements", p.requirements}});

    params["san_loss_threshold"] = baseSanLossThreshold_;
    params["story_beats"]        = storyBeats_;
    params["skill_challenges"]   = skillChallenges_;
    params["horror_revelations"] = horrorRevelations_;
    params["completion_paths"]   = paths;

    // Branch keys belong to the definition; their values are runtime state.
    json branches = json::object();
    for (const auto& kv : branches_)
        branches[kv.first] = 0.0;
    params["investigation_branches"] = branches;
}

void MidTermObjective::saveState(json& state) const
{
    state["investigation_branches"] = branches_;
    state["current_beat_index"]     = currentBeat_;
    state["skills_tested"]          = skillsTested_;
    state["accumulated_san_loss"]   = accumulatedSanLoss_;
    state["san_loss_threshold"]     = sanLossThreshold_;
    state["revelations_unlocked"]   = std::vector<std::string>(revelationsUnlocked_.begin(), revelationsUnlocked_.end());
    state["active_path"]            = activePath_;
}

void MidTermObjective::restoreState(const json& state)
{
    const auto branches = GetOr(state, "investigation_branches", std::map<std::string, double>{});
    for (const auto& kv : branches)
        branches_[kv.first] = std::clamp(kv.second, 0.0, 1.0);

    currentBeat_ = std::min<std::size_t>(GetOr<std::size_t>(state, "current_beat_index", 0), storyBeats_.size());
    skillsTested_ = GetOr(state, "skills_tested", std::map<std::string, int>{});
    accumulatedSanLoss_ = GetOr(state, "accumulated_san_loss", 0.0);
    sanLossThreshold_ = GetOr(state, "san_loss_threshold", sanLossThreshold_);
    const auto revs = GetOr(state, "revelations_unlocked", std::vector<std::string>{});
    revelationsUnlocked_ = std::set<std::string>(revs.begin(), revs.end());
    activePath_ = GetOr<std::string>(state, "active_path", "");
}

} // namespace eldritch
