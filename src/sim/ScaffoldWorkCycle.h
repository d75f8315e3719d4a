#pragma once

#include "sim/SimulationContext.h"
#include <entt/entt.hpp>
#include <string>

// Walk-to-random-point then hammer loop for entities assigned to a building.
// The entity alternates between ScaffoldWalking and ScaffoldWorking for as long
// as it carries a BuildingAssignment.
class ScaffoldWorkCycle {
public:
    // Place an assigned entity on its scaffold and start requesting destinations.
    // Does nothing for entities that are already in a scaffold state.
    static void begin(SimulationContext& ctx, entt::entity entity);

    // Step an entity in ScaffoldWalking or ScaffoldWorking
    static void update(SimulationContext& ctx, entt::entity entity, float deltaTime);

    // Put a scaffold entity back on the ground as Idle and forget its nav point.
    // The BuildingAssignment component itself is left to the caller.
    static void release(SimulationContext& ctx, entt::entity entity);

    // Map a world position onto the scaffold graph of a building
    static ElevatedNavPoint snapToSurface(SimulationContext& ctx, const glm::vec3& position,
                                          const std::string& buildingId);

private:
    static void requestPath(SimulationContext& ctx, entt::entity entity, float deltaTime);
    static void followPath(SimulationContext& ctx, entt::entity entity, float deltaTime);
    static void startWork(SimulationContext& ctx, entt::entity entity);
    static void updateWorking(SimulationContext& ctx, entt::entity entity, float deltaTime);
};
