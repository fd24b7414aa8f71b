// include/eldritch/objectives/ObjectiveComponents.h
#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "eldritch/objectives/Objective.h"

namespace eldritch::ecs {

// Owning slot; one per managed objective.
struct ObjectiveSlot {
  std::unique_ptr<Objective> objective;
  std::uint64_t sequence = 0; // insertion order, breaks priority ties
};

// Arena-side hierarchy. Links are entity handles, so removing an objective
// only has to touch its own node and its direct neighbours.
struct HierarchyNode {
  entt::entity parent = entt::null;
  std::vector<entt::entity> children;
};

// Collection tags. Exactly one of them (or none, for objectives that were
// never activated) is present on an entity at a time.
struct ActiveTag {};    // active, in progress or suspended
struct CompletedTag {};
struct FailedTag {};    // failed, expired or abandoned

} // namespace eldritch::ecs
